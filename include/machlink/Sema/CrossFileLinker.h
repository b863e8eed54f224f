//===--- CrossFileLinker.h - 跨文件引用链接 ----------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//
///
/// \file
/// \brief 解析边中的节点引用：先本地，后 import
///
//===----------------------------------------------------------------------===//

#ifndef MACHLINK_SEMA_CROSSFILELINKER_H
#define MACHLINK_SEMA_CROSSFILELINKER_H

#include "machlink/AST/AST.h"
#include "machlink/Module/ModuleId.h"
#include "llvm/ADT/StringRef.h"
#include <cstddef>

namespace machlink {

class DiagnosticEngine;
class Module;
class WorkspaceManager;

/// 一次引用解析的结果
struct LinkResult {
    const NodeDecl* Target = nullptr;       ///< 解析到的定义
    const Module* TargetModule = nullptr;   ///< 定义所在的模块
    const ImportedSymbol* Via = nullptr;    ///< 经由的导入符号；本地解析时为空

    bool isResolved() const { return Target != nullptr; }
    bool isImported() const { return Via != nullptr; }
};

/// 工作区链接统计
struct LinkSummary {
    bool Success = false;       ///< 工作区无环且所有引用都已解析
    size_t LocalRefs = 0;
    size_t ImportedRefs = 0;
    size_t UnresolvedRefs = 0;
};

/// 跨文件链接器
///
/// 先尝试本地解析；失败时查找有效名称等于该引用的导入符号，在其来源
/// 模块（按拓扑顺序保证已加载）中找到定义。没有导入声明该名称时，原本的
/// 本地失败原样返回，不会凭空成功。
class CrossFileLinker {
public:
    explicit CrossFileLinker(const WorkspaceManager& workspace);

    /// 解析模块中的一个节点引用
    LinkResult resolveReference(const Module& module, llvm::StringRef name) const;

    /// 按依赖顺序链接工作区中每个模块的每条边的端点
    ///
    /// 存在依赖环时拒绝链接，为每个环报告 CircularDependencyError；
    /// 无法解析的引用报告为 err_unresolved_reference。
    LinkSummary linkWorkspace(DiagnosticEngine& diag) const;

private:
    const WorkspaceManager& Workspace;

    LinkResult resolveLocal(const Module& module, llvm::StringRef name) const;
    LinkResult resolveImported(const Module& module, llvm::StringRef name) const;
};

} // namespace machlink

#endif // MACHLINK_SEMA_CROSSFILELINKER_H

//===--- ImportValidator.h - import 语句检查 ---------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//
///
/// \file
/// \brief 检查模块 import 语句的诊断遍
///
//===----------------------------------------------------------------------===//

#ifndef MACHLINK_SEMA_IMPORTVALIDATOR_H
#define MACHLINK_SEMA_IMPORTVALIDATOR_H

#include <cstddef>

namespace machlink {

class DiagnosticEngine;
class ImportDecl;
class ImportedSymbol;
class MachineDecl;
class Module;
class WorkspaceManager;

/// import 检查器
///
/// 所有问题都通过诊断引擎报告（附带 AST 节点与属性名），一遍检查报告
/// 全部问题：
/// - 空路径、空符号列表、空符号名、空别名
/// - 导入名称与本地节点冲突、两个导入产生同一名称
/// - http:// 与裸绝对路径（警告）
/// - 模块处于依赖环中（每个模块报告一次）
/// - 给定工作区时：无法解析的模块、来源模块中缺失（或有歧义）的符号
class ImportValidator {
public:
    /// \param diag 诊断引擎
    /// \param workspace 可选的工作区；为空时跳过解析相关的检查
    explicit ImportValidator(DiagnosticEngine& diag,
                             const WorkspaceManager* workspace = nullptr);

    /// 检查模块的全部 import
    /// \return 没有报告错误时返回 true（警告不影响结果）
    bool checkImports(const Module& module);

private:
    DiagnosticEngine& Diag;
    const WorkspaceManager* Workspace;

    void checkImportStatement(const Module& module, const ImportDecl* import,
                              size_t importIndex);
    void checkImportedSymbol(const MachineDecl& machine, const ImportedSymbol* symbol);
    void checkPathWarnings(const ImportDecl* import);
    void checkResolution(const Module& module, const ImportDecl* import, size_t importIndex);
    void checkCircularDependencies(const Module& module);
    void checkSymbolCollisions(const Module& module);
};

} // namespace machlink

#endif // MACHLINK_SEMA_IMPORTVALIDATOR_H

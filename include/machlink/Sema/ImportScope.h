//===--- ImportScope.h - 导入作用域 ------------------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//
///
/// \file
/// \brief 计算一个模块通过 import 可见的外部符号
///
//===----------------------------------------------------------------------===//

#ifndef MACHLINK_SEMA_IMPORTSCOPE_H
#define MACHLINK_SEMA_IMPORTSCOPE_H

#include "machlink/Module/ImportError.h"
#include "machlink/Sema/Symbol.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include <vector>

namespace machlink {

class DiagnosticEngine;
class Module;
class WorkspaceManager;

/// 导入作用域
///
/// 对模块的每个 (import, 符号) 对：找到来源模块，定位定义，以有效名称
/// 登记。本地定义总是优先，导入只填补空缺；与本地同名的导入、两个导入
/// 产生同一名称、缺失的定义都记录为错误，处理继续进行，因此一次构建
/// 就能得到全部问题。
class ImportScope {
public:
    /// 构建作用域
    /// \param workspace 模块已加载且 import 已解析的工作区
    /// \param module 要计算作用域的模块
    ImportScope(const WorkspaceManager& workspace, const Module& module);

    const Module& getModule() const { return Mod; }

    /// 只查找本地定义（名称或限定名）
    const NodeDecl* lookupLocal(llvm::StringRef name) const;

    /// 只查找导入符号
    const ImportedSymbolEntry* lookupImported(llvm::StringRef name) const;

    /// 先本地，后导入
    const NodeDecl* lookup(llvm::StringRef name) const;

    /// 登记的导入符号（import 顺序）
    const std::vector<ImportedSymbolEntry>& getImportedSymbols() const { return Symbols; }

    const std::vector<ImportError>& getErrors() const { return Errors; }
    bool hasErrors() const { return !Errors.empty(); }

    /// 通过诊断引擎报告全部错误
    void report(DiagnosticEngine& diag) const;

private:
    const WorkspaceManager& Workspace;
    const Module& Mod;

    std::vector<ImportedSymbolEntry> Symbols;
    llvm::StringMap<size_t> SymbolIndex;    ///< 有效名称 -> Symbols 下标
    std::vector<ImportError> Errors;

    void build();
};

} // namespace machlink

#endif // MACHLINK_SEMA_IMPORTSCOPE_H

//===--- Symbol.h - 导入符号定义 ---------------------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//
///
/// \file
/// \brief 导入符号表项，以及在模块中按导入名称查找节点
///
//===----------------------------------------------------------------------===//

#ifndef MACHLINK_SEMA_SYMBOL_H
#define MACHLINK_SEMA_SYMBOL_H

#include "machlink/AST/AST.h"
#include "machlink/Module/ModuleId.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace machlink {

/// 导入符号
/// 一个模块通过 import 看到的外部定义。Node 指向来源模块 AST 中的
/// 原始节点（由来源模块拥有）。
struct ImportedSymbolEntry {
    std::string EffectiveName;              ///< 本地可见的名称（别名或短名称）
    ModuleId OriginModule;                  ///< 定义所在的模块
    std::string OriginalName;               ///< import 中写出的名称
    const NodeDecl* Node = nullptr;         ///< 来源模块中的定义
    const ImportDecl* Import = nullptr;     ///< 引入它的 import 语句
    const ImportedSymbol* Symbol = nullptr; ///< 引入它的符号
};

/// 按导入名称查找节点的结果
struct NodeLookupResult {
    const NodeDecl* Node = nullptr;

    /// 短名称匹配到多个定义时的全部候选（限定名）
    std::vector<std::string> Candidates;

    bool isFound() const { return Node != nullptr; }
    bool isAmbiguous() const { return Node == nullptr && Candidates.size() > 1; }
};

/// 在模块中查找导入的定义
///
/// 先按名称或限定名完全匹配（声明顺序中的第一个）；对于限定名再按最后
/// 一段匹配，此时匹配必须唯一，否则结果有歧义且不绑定任何节点。
NodeLookupResult findImportedNode(const MachineDecl& machine, llvm::StringRef name);

/// 查找与导入名称冲突的本地节点（名称、限定名或短名称相同）
/// \return 第一个冲突的节点，没有时返回 nullptr
const NodeDecl* findCollidingLocal(const MachineDecl& machine, llvm::StringRef name);

/// 与导入名称冲突的全部本地节点
std::vector<const NodeDecl*> findCollidingLocals(const MachineDecl& machine,
                                                 llvm::StringRef name);

} // namespace machlink

#endif // MACHLINK_SEMA_SYMBOL_H

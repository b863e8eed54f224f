/// \file ModuleMerger.h
/// \brief 模块合并 - 把入口模块及其传递导入展开为一个机器

#ifndef MACHLINK_MERGE_MODULEMERGER_H
#define MACHLINK_MERGE_MODULEMERGER_H

#include "machlink/AST/AST.h"
#include "machlink/Module/ImportError.h"
#include "machlink/Module/ModuleId.h"
#include "llvm/ADT/MapVector.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace machlink {

class DiagnosticEngine;
class Module;
class WorkspaceManager;

/// \brief 合并结果中一个名称的来源
struct SourceInfo {
    std::string SourceFile;                     ///< 来源模块的规范标识
    std::optional<std::string> OriginalName;    ///< 与合并后名称不同时的原名称
};

/// \brief 合并后的机器
///
/// Machine 拥有全部节点的克隆，原始节点仍属于各自的模块。
struct MergedMachine {
    std::unique_ptr<MachineDecl> Machine;

    /// 有效名称 -> 来源（记录顺序）
    llvm::MapVector<std::string, SourceInfo, std::map<std::string, unsigned>> SourceMap;

    /// 参与合并的模块（入口在前）
    std::vector<std::string> SourceFiles;

    const std::string& getEntryPoint() const { return SourceFiles.front(); }
};

/// \brief 合并结果
struct MergeResult {
    std::unique_ptr<MergedMachine> Merged;  ///< 失败时为空
    std::vector<ImportError> Errors;
    bool EntryNotLoaded = false;
    std::string EntryPoint;                 ///< 调用方给出的入口

    bool succeeded() const { return Merged != nullptr; }

    /// \brief 通过诊断引擎报告失败原因
    void report(DiagnosticEngine& diag) const;
};

/// \brief 模块合并器
///
/// 从入口模块开始：先克隆入口自身的节点与边（来源记为入口），再按 import
/// 深拷贝被引用的定义并按别名重命名，递归处理被导入模块自己的 import。
/// 已访问模块集合保证菱形导入中的每个符号只贡献一次；有效名称已存在于
/// 合并结果中的导入节点不会重复加入。
///
/// 工作区存在依赖环、入口未加载、或导入的符号缺失时合并失败，不产生
/// 部分结果。
class ModuleMerger {
public:
    explicit ModuleMerger(const WorkspaceManager& workspace);

    /// \param entryPoint 规范 ModuleId 字符串、文件路径或虚拟路径
    MergeResult mergeMachines(const std::string& entryPoint) const;

    /// \brief 按 ModuleId 合并
    MergeResult mergeMachines(const ModuleId& entry) const;

    /// \brief 将入口字符串对应到已加载的模块
    std::optional<ModuleId> findEntry(const std::string& entryPoint) const;

private:
    const WorkspaceManager& Workspace;

    void mergeImports(const Module& module, MergedMachine& merged,
                      std::set<std::string>& visited,
                      std::vector<ImportError>& errors) const;

    static void recordSources(const NodeDecl& node, const std::string& sourceFile,
                              MergedMachine& merged);
};

} // namespace machlink

#endif // MACHLINK_MERGE_MODULEMERGER_H

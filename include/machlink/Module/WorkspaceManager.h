/// \file WorkspaceManager.h
/// \brief 工作区管理器 - 持有已加载模块及其依赖图

#ifndef MACHLINK_MODULE_WORKSPACEMANAGER_H
#define MACHLINK_MODULE_WORKSPACEMANAGER_H

#include "machlink/Module/DependencyGraph.h"
#include "machlink/Module/ImportError.h"
#include "machlink/Module/Module.h"
#include "machlink/Module/ModuleResolver.h"
#include "llvm/ADT/MapVector.h"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace machlink {

class SourceManager;

/// \brief 工作区中的模块信息
struct ModuleInfo {
    std::unique_ptr<Module> Mod;

    /// 直接依赖（已解析的导入目标，去重，按 import 顺序）
    std::vector<ModuleId> Dependencies;

    /// 每条 import 语句解析到的模块；未解析时为空
    std::vector<std::optional<ModuleId>> ResolvedImports;

    const ModuleId& getId() const { return Mod->getId(); }
};

/// \brief 工作区管理器
///
/// 负责：
/// - 通过解析器把每条 import 解析为 ModuleId 并登记依赖边
/// - 增量地添加、更新、移除单个文件
/// - 提供安全的处理顺序（依赖在前），存在环时拒绝给出顺序
/// - 从入口递归加载整个依赖闭包
///
/// 工作区是依赖图与模块表的唯一拥有者；调用方需串行化修改操作。
/// 解析过程中发现的问题（找不到模块、语法错误、URL 获取失败）收集在
/// 错误列表中，由调用方通过诊断引擎报告。
class WorkspaceManager {
public:
    /// \brief 内容加载函数；无法加载时返回 std::nullopt
    using LoadFunction = std::function<std::optional<std::string>(const ModuleId&)>;

    /// \brief 使用默认解析器（文件系统 [+ URL] [+ 虚拟文件系统]）
    WorkspaceManager(SourceManager& sm, const ResolverOptions& options = ResolverOptions());

    /// \brief 使用注入的解析器
    ///
    /// URL 解析器的错误处理函数需由调用方设置，例如
    /// `urlResolver->setErrorHandler(workspace.getErrorHandler())`。
    WorkspaceManager(SourceManager& sm, std::shared_ptr<CompositeModuleResolver> resolver);

    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    // =========================================================================
    // 文档操作
    // =========================================================================

    /// \brief 语法分析内容并加入工作区
    ///
    /// 已存在同名模块时先移除。每条 import 相对于本模块解析；无人能解析的
    /// import 记录为 ModuleNotFoundError 且不产生依赖边。
    /// \return 语法分析失败（模块未加入）时返回 false
    bool addDocument(const ModuleId& id, const std::string& content);

    /// \brief 移除 + 添加
    bool updateDocument(const ModuleId& id, const std::string& content);

    /// \brief 移除模块以及引用它的所有边（两个方向）
    /// \return 模块是否存在
    bool removeDocument(const ModuleId& id);

    /// \brief 按依赖顺序返回已加载的模块
    /// \return 存在环时返回 std::nullopt，此时不得链接或合并
    std::optional<std::vector<const Module*>> getDocumentsInOrder() const;

    /// \brief 从入口递归加载依赖闭包
    ///
    /// 通过已访问集合容忍加载期的环。解析 import 时已获取的内容直接使用，
    /// 其余模块（包括入口）通过 \p loadFn 获取。延迟执行：在 get() 时运行。
    /// \return 入口是否已加载
    std::future<bool> loadDocumentWithDependencies(const ModuleId& entry,
                                                   LoadFunction loadFn);

    /// \brief 读取文件模块与（给定时）虚拟模块的默认加载函数
    static LoadFunction makeDefaultLoader(std::shared_ptr<VirtualFileSystem> vfs = nullptr);

    // =========================================================================
    // 查询
    // =========================================================================

    const ModuleInfo* getModuleInfo(const ModuleId& id) const;
    const Module* getModule(const ModuleId& id) const;

    /// \brief 所有模块（加入顺序）
    std::vector<const ModuleInfo*> getAllModules() const;

    bool hasModule(const ModuleId& id) const { return Modules.count(id.str()) > 0; }

    bool hasCircularDependencies() const;
    std::vector<std::vector<ModuleId>> getCircularDependencies() const;

    /// \brief 传递依赖（首次访问顺序，不含自身）
    std::vector<ModuleId> getAllDependencies(const ModuleId& id) const;

    /// \brief 第 \p importIndex 条 import 解析到的模块
    std::optional<ModuleId> getResolvedImport(const ModuleId& id, size_t importIndex) const;

    const DependencyGraph& getDependencyGraph() const { return Graph; }
    SourceManager& getSourceManager() const { return SM; }
    const std::shared_ptr<CompositeModuleResolver>& getResolver() const { return Resolver; }

    void clear();
    size_t size() const { return Modules.size(); }

    // =========================================================================
    // 错误
    // =========================================================================

    /// \brief 解析与加载过程中收集到的错误（按发生顺序）
    std::vector<ImportError> getErrors() const;
    void clearErrors();

    /// \brief 把错误记录到本工作区的处理函数（线程安全）
    ImportErrorHandler getErrorHandler();

private:
    SourceManager& SM;
    std::shared_ptr<CompositeModuleResolver> Resolver;
    DependencyGraph Graph;
    llvm::MapVector<std::string, std::unique_ptr<ModuleInfo>,
                    std::map<std::string, unsigned>> Modules;

    /// 解析 import 时获取到、尚未加载的内容。本地内容只在一次加载内有效
    std::unordered_map<std::string, std::string> FetchedContent;
    unsigned LoadDepth = 0;

    mutable std::mutex ErrorMutex;
    std::vector<ImportError> Errors;

    void recordError(ImportError error);

    /// 重新连接仍然导入 \p id 的已加载模块
    void restoreIncomingEdges(const ModuleId& id);

    /// 丢弃文件与虚拟文件系统的暂存内容，保留 URL 内容
    void dropLocalFetchedContent();

    bool loadRecursive(const ModuleId& id, const std::optional<ModuleId>& from,
                       const LoadFunction& loadFn, std::set<std::string>& visited);
};

} // namespace machlink

#endif // MACHLINK_MODULE_WORKSPACEMANAGER_H

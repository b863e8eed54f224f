/// \file WorkspaceManager.cpp
/// \brief 工作区管理器实现

#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Basic/SourceManager.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace machlink {

WorkspaceManager::WorkspaceManager(SourceManager& sm, const ResolverOptions& options)
    : SM(sm) {
    Resolver = createDefaultResolver(options, [this](const ImportError& error) {
        recordError(error);
    });
}

WorkspaceManager::WorkspaceManager(SourceManager& sm,
                                   std::shared_ptr<CompositeModuleResolver> resolver)
    : SM(sm), Resolver(std::move(resolver)) {}

// ============================================================================
// 文档操作
// ============================================================================

bool WorkspaceManager::addDocument(const ModuleId& id, const std::string& content) {
    if (hasModule(id)) {
        removeDocument(id);
    }
    FetchedContent.erase(id.str());

    ModuleParseResult parsed = parseModule(id, content, SM);
    if (!parsed.Mod) {
        recordError(std::move(*parsed.Error));
        return false;
    }

    auto info = std::make_unique<ModuleInfo>();
    info->Mod = std::move(parsed.Mod);
    const auto& imports = info->Mod->getImports();

    // 先发起全部解析，再按顺序收集结果（解析在 get() 中依次执行）
    std::vector<std::future<ResolveResult>> pending(imports.size());
    for (size_t i = 0; i < imports.size(); ++i) {
        const std::string& path = imports[i]->getPath();
        if (!path.empty()) {
            pending[i] = Resolver->resolve(path, id);
        }
    }

    for (size_t i = 0; i < imports.size(); ++i) {
        const ImportDecl* import = imports[i].get();
        std::optional<ModuleId> target;

        // 空路径由 ImportValidator 报告
        if (pending[i].valid()) {
            ResolveResult resolved = pending[i].get();
            if (resolved) {
                target = resolved->Id;
                // 文件与虚拟文件系统内容只在本次加载内复用，之后必须重新读取
                if (resolved->Content && resolved->Id != id && !hasModule(resolved->Id) &&
                    (LoadDepth > 0 || resolved->Id.isURL())) {
                    FetchedContent[resolved->Id.str()] = std::move(*resolved->Content);
                }
            } else {
                ImportError error = ImportError::moduleNotFound(import->getPath(), id);
                error.setLocation(import->getPathRange().getBegin());
                error.setNode(import, "path");
                recordError(std::move(error));
            }
        }

        info->ResolvedImports.push_back(target);
        if (target && std::find(info->Dependencies.begin(), info->Dependencies.end(),
                                *target) == info->Dependencies.end()) {
            info->Dependencies.push_back(*target);
        }
    }

    Graph.addModule(id);
    for (const ModuleId& dep : info->Dependencies) {
        Graph.addDependency(id, dep);
    }
    Modules.insert(std::make_pair(id.str(), std::move(info)));

    restoreIncomingEdges(id);
    return true;
}

bool WorkspaceManager::updateDocument(const ModuleId& id, const std::string& content) {
    removeDocument(id);
    return addDocument(id, content);
}

bool WorkspaceManager::removeDocument(const ModuleId& id) {
    auto it = Modules.find(id.str());
    if (it == Modules.end()) {
        return false;
    }

    std::vector<ModuleId> dependencies = it->second->Dependencies;
    Modules.erase(id.str());
    Graph.removeModule(id);

    // 只因本模块而存在的未加载叶子节点一并移除
    for (const ModuleId& dep : dependencies) {
        if (!hasModule(dep) && Graph.hasModule(dep) && Graph.getDependents(dep).empty()) {
            Graph.removeModule(dep);
        }
    }
    return true;
}

void WorkspaceManager::restoreIncomingEdges(const ModuleId& id) {
    for (const auto& entry : Modules) {
        const ModuleInfo& info = *entry.second;
        if (info.getId() == id) {
            continue;
        }
        if (std::find(info.Dependencies.begin(), info.Dependencies.end(), id) !=
            info.Dependencies.end()) {
            Graph.addDependency(info.getId(), id);
        }
    }
}

std::optional<std::vector<const Module*>> WorkspaceManager::getDocumentsInOrder() const {
    std::optional<std::vector<ModuleId>> sorted = Graph.topologicalSort();
    if (!sorted) {
        return std::nullopt;
    }

    std::vector<const Module*> result;
    for (const ModuleId& id : *sorted) {
        if (const Module* mod = getModule(id)) {
            result.push_back(mod);
        }
    }
    return result;
}

// ============================================================================
// 递归加载
// ============================================================================

std::future<bool> WorkspaceManager::loadDocumentWithDependencies(const ModuleId& entry,
                                                                 LoadFunction loadFn) {
    return std::async(std::launch::deferred, [this, entry, loadFn = std::move(loadFn)]() {
        dropLocalFetchedContent();
        ++LoadDepth;
        std::set<std::string> visited;
        loadRecursive(entry, std::nullopt, loadFn, visited);
        --LoadDepth;
        if (LoadDepth == 0) {
            dropLocalFetchedContent();
        }
        return hasModule(entry);
    });
}

bool WorkspaceManager::loadRecursive(const ModuleId& id, const std::optional<ModuleId>& from,
                                     const LoadFunction& loadFn,
                                     std::set<std::string>& visited) {
    if (!visited.insert(id.str()).second) {
        return hasModule(id);
    }

    if (!hasModule(id)) {
        std::optional<std::string> content;
        auto fetched = FetchedContent.find(id.str());
        if (fetched != FetchedContent.end()) {
            content = std::move(fetched->second);
            FetchedContent.erase(fetched);
        } else if (loadFn) {
            content = loadFn(id);
        }

        if (!content) {
            recordError(ImportError::moduleNotFound(id.getLocation(), from));
            return false;
        }
        if (!addDocument(id, *content)) {
            return false;
        }
    }

    // 递归会修改模块表，先复制依赖列表
    std::vector<ModuleId> dependencies = getModuleInfo(id)->Dependencies;
    for (const ModuleId& dep : dependencies) {
        loadRecursive(dep, id, loadFn, visited);
    }
    return true;
}

void WorkspaceManager::dropLocalFetchedContent() {
    for (auto it = FetchedContent.begin(); it != FetchedContent.end();) {
        std::optional<ModuleId> id = ModuleId::fromString(it->first);
        if (id && id->isURL()) {
            ++it;
        } else {
            it = FetchedContent.erase(it);
        }
    }
}

WorkspaceManager::LoadFunction
WorkspaceManager::makeDefaultLoader(std::shared_ptr<VirtualFileSystem> vfs) {
    return [vfs](const ModuleId& id) -> std::optional<std::string> {
        if (id.isFile()) {
            std::ifstream file(id.getLocation(), std::ios::binary);
            if (!file) {
                return std::nullopt;
            }
            std::ostringstream ss;
            ss << file.rdbuf();
            return ss.str();
        }
        if (id.isVirtual() && vfs) {
            return vfs->getFile(id.getLocation());
        }
        // 远程模块只能通过 URLResolver 获取
        return std::nullopt;
    };
}

// ============================================================================
// 查询
// ============================================================================

const ModuleInfo* WorkspaceManager::getModuleInfo(const ModuleId& id) const {
    auto it = Modules.find(id.str());
    return it == Modules.end() ? nullptr : it->second.get();
}

const Module* WorkspaceManager::getModule(const ModuleId& id) const {
    const ModuleInfo* info = getModuleInfo(id);
    return info ? info->Mod.get() : nullptr;
}

std::vector<const ModuleInfo*> WorkspaceManager::getAllModules() const {
    std::vector<const ModuleInfo*> result;
    result.reserve(Modules.size());
    for (const auto& entry : Modules) {
        result.push_back(entry.second.get());
    }
    return result;
}

bool WorkspaceManager::hasCircularDependencies() const {
    return !Graph.detectCycles().empty();
}

std::vector<std::vector<ModuleId>> WorkspaceManager::getCircularDependencies() const {
    return Graph.detectCycles();
}

std::vector<ModuleId> WorkspaceManager::getAllDependencies(const ModuleId& id) const {
    std::vector<ModuleId> result;
    std::set<std::string> visited = {id.str()};

    // 深度优先，保持首次访问顺序
    std::function<void(const ModuleId&)> visit = [&](const ModuleId& current) {
        for (const ModuleId& dep : Graph.getDependencies(current)) {
            if (visited.insert(dep.str()).second) {
                result.push_back(dep);
                visit(dep);
            }
        }
    };
    visit(id);
    return result;
}

std::optional<ModuleId> WorkspaceManager::getResolvedImport(const ModuleId& id,
                                                            size_t importIndex) const {
    const ModuleInfo* info = getModuleInfo(id);
    if (!info || importIndex >= info->ResolvedImports.size()) {
        return std::nullopt;
    }
    return info->ResolvedImports[importIndex];
}

void WorkspaceManager::clear() {
    Modules.clear();
    Graph.clear();
    FetchedContent.clear();
    clearErrors();
}

// ============================================================================
// 错误
// ============================================================================

void WorkspaceManager::recordError(ImportError error) {
    std::lock_guard<std::mutex> lock(ErrorMutex);
    Errors.push_back(std::move(error));
}

std::vector<ImportError> WorkspaceManager::getErrors() const {
    std::lock_guard<std::mutex> lock(ErrorMutex);
    return Errors;
}

void WorkspaceManager::clearErrors() {
    std::lock_guard<std::mutex> lock(ErrorMutex);
    Errors.clear();
}

ImportErrorHandler WorkspaceManager::getErrorHandler() {
    return [this](const ImportError& error) { recordError(error); };
}

} // namespace machlink

/// \file ModuleResolver.cpp
/// \brief 模块解析器实现

#include "machlink/Module/ModuleResolver.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace machlink {

namespace {

std::future<ResolveResult> makeReadyFuture(ResolveResult result) {
    std::promise<ResolveResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

bool readFileContent(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

bool hasExtension(const std::string& importPath) {
    return !std::filesystem::path(importPath).extension().empty();
}

} // anonymous namespace

const std::vector<std::string>& getDefaultExtensions() {
    static const std::vector<std::string> extensions = {".dygram", ".mach"};
    return extensions;
}

// ============================================================================
// FileSystemResolver
// ============================================================================

FileSystemResolver::FileSystemResolver(std::vector<std::string> extensions)
    : Extensions(std::move(extensions)) {}

bool FileSystemResolver::canResolve(const std::string& importPath,
                                    const ModuleId& from) const {
    if (from.isValid() && !from.isFile()) {
        return false;
    }
    return isRelativeImportPath(importPath) || isAbsoluteImportPath(importPath);
}

std::future<ResolveResult> FileSystemResolver::resolve(const std::string& importPath,
                                                       const ModuleId& from) const {
    return makeReadyFuture(resolveNow(importPath, from));
}

ResolveResult FileSystemResolver::resolveNow(const std::string& importPath,
                                             const ModuleId& from) const {
    std::filesystem::path candidate;
    if (isAbsoluteImportPath(importPath)) {
        candidate = importPath;
    } else {
        std::filesystem::path fromDir;
        if (from.isFile()) {
            fromDir = std::filesystem::path(from.getLocation()).parent_path();
        } else {
            std::error_code ec;
            fromDir = std::filesystem::current_path(ec);
        }
        candidate = fromDir / importPath;
    }
    candidate = candidate.lexically_normal();

    std::vector<std::filesystem::path> attempts = {candidate};
    if (!hasExtension(importPath)) {
        for (const auto& ext : Extensions) {
            attempts.emplace_back(candidate.string() + ext);
        }
    }

    for (const auto& path : attempts) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            continue;
        }

        std::string content;
        if (!readFileContent(path, content)) {
            return std::nullopt;
        }

        ResolvedModule module;
        module.Id = ModuleId::forFile(path.string());
        module.ImportPath = importPath;
        module.ResolvedLocation = module.Id.getLocation();
        module.Content = std::move(content);
        return module;
    }

    return std::nullopt;
}

// ============================================================================
// URLModuleCache
// ============================================================================

std::optional<ResolvedModule> URLModuleCache::get(const std::string& url) const {
    std::lock_guard<std::mutex> lock(Mutex);
    auto it = Entries.find(url);
    if (it == Entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void URLModuleCache::put(const std::string& url, ResolvedModule module) {
    std::lock_guard<std::mutex> lock(Mutex);
    Entries[url] = std::move(module);
}

bool URLModuleCache::evict(const std::string& url) {
    std::lock_guard<std::mutex> lock(Mutex);
    return Entries.erase(url) > 0;
}

void URLModuleCache::clear() {
    std::lock_guard<std::mutex> lock(Mutex);
    Entries.clear();
}

size_t URLModuleCache::size() const {
    std::lock_guard<std::mutex> lock(Mutex);
    return Entries.size();
}

// ============================================================================
// URLResolver
// ============================================================================

URLResolver::URLResolver(HTTPTransport transport, std::shared_ptr<URLModuleCache> cache)
    : Transport(std::move(transport)), Cache(std::move(cache)) {
    if (!Cache) {
        Cache = std::make_shared<URLModuleCache>();
    }
}

bool URLResolver::canResolve(const std::string& importPath, const ModuleId& from) const {
    if (isURLImportPath(importPath)) {
        return true;
    }
    return from.isURL() &&
           (isRelativeImportPath(importPath) || isAbsoluteImportPath(importPath));
}

std::string URLResolver::resolveURL(const std::string& importPath, const ModuleId& from) {
    if (isURLImportPath(importPath)) {
        return importPath;
    }
    if (!from.isURL()) {
        return std::string();
    }

    const std::string& base = from.getLocation();
    size_t schemeEnd = base.find("://");
    size_t hostEnd = base.find('/', schemeEnd + 3);
    std::string origin = hostEnd == std::string::npos ? base : base.substr(0, hostEnd);
    std::string basePath = hostEnd == std::string::npos ? "/" : base.substr(hostEnd);
    size_t queryPos = basePath.find_first_of("?#");
    if (queryPos != std::string::npos) {
        basePath.erase(queryPos);
    }

    std::string path;
    if (isAbsoluteImportPath(importPath)) {
        path = importPath;
    } else {
        path = basePath.substr(0, basePath.rfind('/') + 1) + importPath;
    }
    return origin + std::filesystem::path(path).lexically_normal().generic_string();
}

std::future<ResolveResult> URLResolver::resolve(const std::string& importPath,
                                                const ModuleId& from) const {
    std::string url = resolveURL(importPath, from);
    if (url.empty() || !Transport) {
        return makeReadyFuture(std::nullopt);
    }

    if (auto cached = Cache->get(url)) {
        cached->ImportPath = importPath;
        return makeReadyFuture(std::move(cached));
    }

    HTTPTransport transport = Transport;
    std::shared_ptr<URLModuleCache> cache = Cache;
    ImportErrorHandler handler = ErrorHandler;
    std::optional<ModuleId> origin;
    if (from.isValid()) {
        origin = from;
    }

    return std::async(std::launch::async,
                      [transport, cache, handler, url, importPath, origin]() -> ResolveResult {
        HTTPResponse response = transport(url);
        if (!response.isSuccess()) {
            if (handler) {
                std::optional<long> status;
                if (response.TransportOk) {
                    status = response.Status;
                }
                handler(ImportError::urlImport(url, status, response.Error, origin));
            }
            return std::nullopt;
        }

        ResolvedModule module;
        module.Id = ModuleId::forURL(url);
        module.ImportPath = importPath;
        module.ResolvedLocation = url;
        module.Content = std::move(response.Body);
        if (!module.Id.isValid()) {
            return std::nullopt;
        }
        cache->put(url, module);
        return module;
    });
}

void URLResolver::clearCache(const std::optional<std::string>& url) {
    if (url) {
        Cache->evict(*url);
    } else {
        Cache->clear();
    }
}

// ============================================================================
// VirtualFileSystem
// ============================================================================

std::string VirtualFileSystem::normalize(const std::string& path) {
    return ModuleId::forVirtual(path).getLocation();
}

void VirtualFileSystem::setFile(const std::string& path, std::string content) {
    Files[normalize(path)] = std::move(content);
}

bool VirtualFileSystem::removeFile(const std::string& path) {
    return Files.erase(normalize(path));
}

bool VirtualFileSystem::hasFile(const std::string& path) const {
    return Files.count(normalize(path)) > 0;
}

std::optional<std::string> VirtualFileSystem::getFile(const std::string& path) const {
    auto it = Files.find(normalize(path));
    if (it == Files.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> VirtualFileSystem::getPaths() const {
    std::vector<std::string> paths;
    paths.reserve(Files.size());
    for (const auto& entry : Files) {
        paths.push_back(entry.getKey().str());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// ============================================================================
// VirtualFSResolver
// ============================================================================

VirtualFSResolver::VirtualFSResolver(std::shared_ptr<VirtualFileSystem> vfs,
                                     std::vector<std::string> extensions)
    : VFS(std::move(vfs)), Extensions(std::move(extensions)) {}

bool VirtualFSResolver::canResolve(const std::string& importPath,
                                   const ModuleId& from) const {
    if (!VFS || (from.isValid() && !from.isVirtual())) {
        return false;
    }
    return isRelativeImportPath(importPath) || isAbsoluteImportPath(importPath);
}

std::future<ResolveResult> VirtualFSResolver::resolve(const std::string& importPath,
                                                      const ModuleId& from) const {
    return makeReadyFuture(resolveNow(importPath, from));
}

ResolveResult VirtualFSResolver::resolveNow(const std::string& importPath,
                                            const ModuleId& from) const {
    if (!VFS) {
        return std::nullopt;
    }

    std::string candidate;
    if (isAbsoluteImportPath(importPath)) {
        candidate = importPath;
    } else {
        std::string fromDir = "/";
        if (from.isVirtual()) {
            const std::string& location = from.getLocation();
            fromDir = location.substr(0, location.rfind('/') + 1);
        }
        candidate = fromDir + importPath;
    }
    candidate = VirtualFileSystem::normalize(candidate);

    std::vector<std::string> attempts = {candidate};
    if (!hasExtension(importPath)) {
        for (const auto& ext : Extensions) {
            attempts.push_back(candidate + ext);
        }
    }

    for (const auto& path : attempts) {
        std::optional<std::string> content = VFS->getFile(path);
        if (!content) {
            continue;
        }

        ResolvedModule module;
        module.Id = ModuleId::forVirtual(path);
        module.ImportPath = importPath;
        module.ResolvedLocation = path;
        module.Content = std::move(content);
        return module;
    }

    return std::nullopt;
}

// ============================================================================
// CompositeModuleResolver
// ============================================================================

CompositeModuleResolver::CompositeModuleResolver(std::vector<ResolverHandle> resolvers)
    : Resolvers(std::move(resolvers)) {}

void CompositeModuleResolver::addResolver(ResolverHandle resolver) {
    Resolvers.push_back(std::move(resolver));
}

bool CompositeModuleResolver::canResolve(const std::string& importPath,
                                         const ModuleId& from) const {
    return std::any_of(Resolvers.begin(), Resolvers.end(),
                       [&](const ResolverHandle& handle) {
        return std::visit([&](const auto& resolver) {
            return resolver && resolver->canResolve(importPath, from);
        }, handle);
    });
}

std::future<ResolveResult> CompositeModuleResolver::resolve(const std::string& importPath,
                                                            const ModuleId& from) const {
    std::vector<ResolverHandle> resolvers = Resolvers;
    return std::async(std::launch::deferred,
                      [resolvers, importPath, from]() -> ResolveResult {
        for (const auto& handle : resolvers) {
            ResolveResult result = std::visit([&](const auto& resolver) -> ResolveResult {
                if (!resolver || !resolver->canResolve(importPath, from)) {
                    return std::nullopt;
                }
                return resolver->resolve(importPath, from).get();
            }, handle);
            if (result) {
                return result;
            }
        }
        return std::nullopt;
    });
}

std::shared_ptr<CompositeModuleResolver>
createDefaultResolver(const ResolverOptions& options, ImportErrorHandler urlErrors) {
    auto composite = std::make_shared<CompositeModuleResolver>();
    composite->addResolver(std::make_shared<FileSystemResolver>(options.Extensions));
    if (options.AllowRemote) {
        auto urlResolver =
            std::make_shared<URLResolver>(makeCurlTransport(options.URLTimeoutMs));
        urlResolver->setErrorHandler(std::move(urlErrors));
        composite->addResolver(std::move(urlResolver));
    }
    if (options.VirtualFS) {
        composite->addResolver(
            std::make_shared<VirtualFSResolver>(options.VirtualFS, options.Extensions));
    }
    return composite;
}

} // namespace machlink

/// \file ModuleResolver.h
/// \brief 模块解析器 - 将导入路径解析为模块内容
///
/// 提供三种后端（本地文件系统、远程 URL、内存虚拟文件系统）以及按顺序
/// 尝试它们的组合解析器。所有后端的 resolve() 都返回 std::future，
/// 即使后端本身是同步的；普通的"找不到"与网络失败都不会抛出异常。

#ifndef MACHLINK_MODULE_MODULERESOLVER_H
#define MACHLINK_MODULE_MODULERESOLVER_H

#include "machlink/Module/HTTPTransport.h"
#include "machlink/Module/ImportError.h"
#include "machlink/Module/ModuleId.h"
#include "llvm/ADT/StringMap.h"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace machlink {

/// \brief 解析结果（临时对象，折叠进 Module 后不再保留）
struct ResolvedModule {
    ModuleId Id;                        ///< 规范标识
    std::string ImportPath;             ///< import 语句中的原始路径
    std::string ResolvedLocation;       ///< 解析得到的绝对路径或 URL
    std::optional<std::string> Content; ///< 已读取的内容
};

using ResolveResult = std::optional<ResolvedModule>;

/// \brief 侧信道错误处理函数
using ImportErrorHandler = std::function<void(const ImportError&)>;

/// \brief 默认扩展名：.dygram、.mach
const std::vector<std::string>& getDefaultExtensions();

// ============================================================================
// 文件系统
// ============================================================================

/// \brief 本地文件系统解析器
///
/// 处理 ./x、../x（相对于导入方文件所在目录）以及裸绝对路径 /x。
/// 先按原样查找，若路径没有扩展名，再依次尝试配置的扩展名。
class FileSystemResolver {
public:
    explicit FileSystemResolver(std::vector<std::string> extensions = getDefaultExtensions());

    /// \brief 导入方为文件模块（或未知）且路径为相对/绝对路径
    bool canResolve(const std::string& importPath, const ModuleId& from) const;

    std::future<ResolveResult> resolve(const std::string& importPath,
                                       const ModuleId& from) const;

    const std::vector<std::string>& getExtensions() const { return Extensions; }

private:
    std::vector<std::string> Extensions;

    ResolveResult resolveNow(const std::string& importPath, const ModuleId& from) const;
};

// ============================================================================
// 远程 URL
// ============================================================================

/// \brief URL 模块缓存
///
/// 以 URL 为键缓存成功的获取结果，不会自动失效。内部加锁，
/// 因为获取在工作线程中完成。
class URLModuleCache {
public:
    std::optional<ResolvedModule> get(const std::string& url) const;
    void put(const std::string& url, ResolvedModule module);

    /// \brief 删除一项，返回是否存在
    bool evict(const std::string& url);

    void clear();
    size_t size() const;

private:
    mutable std::mutex Mutex;
    std::unordered_map<std::string, ResolvedModule> Entries;
};

/// \brief 远程 URL 解析器
///
/// 处理 http:// 与 https:// 导入，以及远程模块内部的相对导入（相对于
/// 该模块的 URL）。成功结果写入缓存；失败不会自动重试，而是返回
/// "找不到"并通过错误处理函数报告 URLImportError。
class URLResolver {
public:
    explicit URLResolver(HTTPTransport transport = makeCurlTransport(),
                         std::shared_ptr<URLModuleCache> cache =
                             std::make_shared<URLModuleCache>());

    bool canResolve(const std::string& importPath, const ModuleId& from) const;

    /// \brief 缓存命中时返回就绪的 future，否则在工作线程中获取
    std::future<ResolveResult> resolve(const std::string& importPath,
                                       const ModuleId& from) const;

    /// \brief 清除某个 URL 的缓存，或在未指定时清除全部
    void clearCache(const std::optional<std::string>& url = std::nullopt);

    /// \brief 设置错误处理函数（可能在工作线程中调用）
    void setErrorHandler(ImportErrorHandler handler) { ErrorHandler = std::move(handler); }

    const std::shared_ptr<URLModuleCache>& getCache() const { return Cache; }

    /// \brief 计算要获取的 URL；无法计算时返回空字符串
    static std::string resolveURL(const std::string& importPath, const ModuleId& from);

private:
    HTTPTransport Transport;
    std::shared_ptr<URLModuleCache> Cache;
    ImportErrorHandler ErrorHandler;
};

// ============================================================================
// 虚拟文件系统
// ============================================================================

/// \brief 内存中的 路径 -> 内容 映射
///
/// 路径按绝对 posix 路径规范化存储，"lib.dygram" 与 "/lib.dygram" 相同。
class VirtualFileSystem {
public:
    void setFile(const std::string& path, std::string content);

    /// \brief 删除文件，返回是否存在
    bool removeFile(const std::string& path);

    bool hasFile(const std::string& path) const;
    std::optional<std::string> getFile(const std::string& path) const;

    /// \brief 所有文件路径（排序）
    std::vector<std::string> getPaths() const;

    size_t size() const { return Files.size(); }
    void clear() { Files.clear(); }

    static std::string normalize(const std::string& path);

private:
    llvm::StringMap<std::string> Files;
};

/// \brief 虚拟文件系统解析器
class VirtualFSResolver {
public:
    explicit VirtualFSResolver(std::shared_ptr<VirtualFileSystem> vfs,
                               std::vector<std::string> extensions = getDefaultExtensions());

    /// \brief 导入方为虚拟模块（或未知）且路径为相对/绝对路径
    bool canResolve(const std::string& importPath, const ModuleId& from) const;

    std::future<ResolveResult> resolve(const std::string& importPath,
                                       const ModuleId& from) const;

    const std::shared_ptr<VirtualFileSystem>& getFileSystem() const { return VFS; }

private:
    std::shared_ptr<VirtualFileSystem> VFS;
    std::vector<std::string> Extensions;

    ResolveResult resolveNow(const std::string& importPath, const ModuleId& from) const;
};

// ============================================================================
// 组合
// ============================================================================

/// \brief 组合中的一个解析器
using ResolverHandle = std::variant<std::shared_ptr<FileSystemResolver>,
                                    std::shared_ptr<URLResolver>,
                                    std::shared_ptr<VirtualFSResolver>>;

/// \brief 按顺序尝试多个解析器
///
/// 第一个 canResolve 匹配且 resolve 返回模块的解析器胜出；匹配但返回
/// "找不到"的解析器会交给下一个。
class CompositeModuleResolver {
public:
    CompositeModuleResolver() = default;
    explicit CompositeModuleResolver(std::vector<ResolverHandle> resolvers);

    void addResolver(ResolverHandle resolver);

    bool canResolve(const std::string& importPath, const ModuleId& from) const;

    /// \brief 延迟求值：在调用 get() 时依次尝试各解析器
    std::future<ResolveResult> resolve(const std::string& importPath,
                                       const ModuleId& from) const;

    const std::vector<ResolverHandle>& getResolvers() const { return Resolvers; }

private:
    std::vector<ResolverHandle> Resolvers;
};

/// \brief 默认解析器配置
struct ResolverOptions {
    std::vector<std::string> Extensions = getDefaultExtensions();
    bool AllowRemote = true;
    long URLTimeoutMs = 0;
    std::shared_ptr<VirtualFileSystem> VirtualFS;   ///< 非空时加入虚拟文件系统解析器
};

/// \brief 创建 文件系统 [+ URL] [+ 虚拟文件系统] 组合解析器
std::shared_ptr<CompositeModuleResolver>
createDefaultResolver(const ResolverOptions& options, ImportErrorHandler urlErrors = {});

} // namespace machlink

#endif // MACHLINK_MODULE_MODULERESOLVER_H

/// \file ModuleId.cpp
/// \brief 模块标识实现

#include "machlink/Module/ModuleId.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace machlink {

namespace {

constexpr const char* FileScheme = "file://";
constexpr const char* VirtualScheme = "vfs://";

bool startsWith(const std::string& str, const char* prefix) {
    return str.rfind(prefix, 0) == 0;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

/// 去掉末尾的 '/'（根目录除外）
std::string stripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // anonymous namespace

ModuleId ModuleId::forFile(const std::string& path) {
    if (path.empty()) {
        return ModuleId();
    }

    std::filesystem::path p(path);
    if (p.is_relative()) {
        std::error_code ec;
        std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (!ec) {
            p = cwd / p;
        }
    }

    std::string normalized = stripTrailingSlash(p.lexically_normal().generic_string());
    return ModuleId(Kind::File, normalized, FileScheme + normalized);
}

ModuleId ModuleId::forURL(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return ModuleId();
    }

    std::string scheme = toLower(url.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") {
        return ModuleId();
    }

    size_t hostBegin = schemeEnd + 3;
    size_t hostEnd = url.find_first_of("/?#", hostBegin);
    if (hostEnd == std::string::npos) {
        hostEnd = url.size();
    }
    if (hostEnd == hostBegin) {
        return ModuleId();
    }

    std::string canonical = scheme + "://" +
                            toLower(url.substr(hostBegin, hostEnd - hostBegin)) +
                            url.substr(hostEnd);
    return ModuleId(Kind::URL, canonical, canonical);
}

ModuleId ModuleId::forVirtual(const std::string& path) {
    std::string absolute = (!path.empty() && path.front() == '/') ? path : "/" + path;
    std::string normalized =
        stripTrailingSlash(std::filesystem::path(absolute).lexically_normal().generic_string());
    return ModuleId(Kind::Virtual, normalized, VirtualScheme + normalized);
}

std::optional<ModuleId> ModuleId::fromString(const std::string& str) {
    if (startsWith(str, FileScheme)) {
        ModuleId id = forFile(str.substr(std::char_traits<char>::length(FileScheme)));
        return id.isValid() ? std::optional<ModuleId>(id) : std::nullopt;
    }
    if (startsWith(str, VirtualScheme)) {
        return forVirtual(str.substr(std::char_traits<char>::length(VirtualScheme)));
    }
    if (isURLImportPath(str)) {
        ModuleId id = forURL(str);
        return id.isValid() ? std::optional<ModuleId>(id) : std::nullopt;
    }
    return std::nullopt;
}

std::string ModuleId::getFileName() const {
    std::string path = Location;
    if (isURL()) {
        size_t end = path.find_first_of("?#");
        if (end != std::string::npos) {
            path.erase(end);
        }
    }
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos || pos + 1 >= path.size()) {
        return path;
    }
    return path.substr(pos + 1);
}

bool isURLImportPath(const std::string& importPath) {
    std::string lower = toLower(importPath.substr(0, 8));
    return startsWith(lower, "http://") || startsWith(lower, "https://");
}

bool isRelativeImportPath(const std::string& importPath) {
    return startsWith(importPath, "./") || startsWith(importPath, "../");
}

bool isAbsoluteImportPath(const std::string& importPath) {
    return startsWith(importPath, "/") && !startsWith(importPath, "//");
}

} // namespace machlink

#include "machlink/Tooling/ProjectConfig.h"
#include "machlink/Driver/Options.h"
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace machlink {

namespace {

/// 无符号 JSON 数值能否无截断地转换为 \p T
template <typename T>
bool fitsIn(const nlohmann::json& node) {
    return node.get<std::uint64_t>() <=
           static_cast<std::uint64_t>(std::numeric_limits<T>::max());
}

void readStringArray(const nlohmann::json& node, std::vector<std::string>& out) {
    if (!node.is_array()) {
        return;
    }
    out.clear();
    for (const auto& entry : node) {
        if (entry.is_string()) {
            out.push_back(entry.get<std::string>());
        }
    }
}

bool readConfig(const nlohmann::json& root, ProjectConfig& outConfig, std::string& outError) {
    if (!root.is_object()) {
        outError = "项目配置必须是 JSON 对象";
        return false;
    }

    if (root.contains("version") && root["version"].is_number_unsigned()) {
        outConfig.Version = root["version"].get<unsigned>();
    }

    if (root.contains("resolve") && root["resolve"].is_object()) {
        const auto& resolve = root["resolve"];
        auto& out = outConfig.Resolve;
        if (resolve.contains("extensions") && resolve["extensions"].is_array()) {
            out.HasExtensions = true;
            readStringArray(resolve["extensions"], out.Extensions);
        }
        if (resolve.contains("allowRemote") && resolve["allowRemote"].is_boolean()) {
            out.HasAllowRemote = true;
            out.AllowRemote = resolve["allowRemote"].get<bool>();
        }
        if (resolve.contains("urlTimeoutMs") && resolve["urlTimeoutMs"].is_number_unsigned() &&
            fitsIn<long>(resolve["urlTimeoutMs"])) {
            out.HasURLTimeout = true;
            out.URLTimeoutMs = resolve["urlTimeoutMs"].get<long>();
        }
        if (resolve.contains("virtualRoot") && resolve["virtualRoot"].is_string()) {
            out.HasVirtualRoot = true;
            out.VirtualRoot = resolve["virtualRoot"].get<std::string>();
        }
    }

    if (root.contains("diagnostics") && root["diagnostics"].is_object()) {
        const auto& diagnostics = root["diagnostics"];
        auto& out = outConfig.Diagnostics;
        if (diagnostics.contains("warningsAsErrors") &&
            diagnostics["warningsAsErrors"].is_boolean()) {
            out.HasWarningsAsErrors = true;
            out.WarningsAsErrors = diagnostics["warningsAsErrors"].get<bool>();
        }
        if (diagnostics.contains("errorLimit") && diagnostics["errorLimit"].is_number_unsigned() &&
            fitsIn<unsigned>(diagnostics["errorLimit"])) {
            out.HasErrorLimit = true;
            out.ErrorLimit = diagnostics["errorLimit"].get<unsigned>();
        }
        if (diagnostics.contains("color") && diagnostics["color"].is_boolean()) {
            out.HasColor = true;
            out.Color = diagnostics["color"].get<bool>();
        }
    }
    return true;
}

} // namespace

std::string ProjectConfigLoader::discover(const std::string& startPath) {
    std::filesystem::path base = startPath.empty()
        ? std::filesystem::current_path()
        : std::filesystem::path(startPath);

    if (std::filesystem::is_regular_file(base)) {
        base = base.parent_path();
    }

    std::error_code ec;
    std::filesystem::path current = std::filesystem::absolute(base, ec);
    if (ec) {
        current = base;
    }

    while (!current.empty()) {
        std::filesystem::path candidate = current / FileName;
        if (std::filesystem::exists(candidate)) {
            return candidate.string();
        }
        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }

    return "";
}

bool ProjectConfigLoader::loadFromFile(const std::string& path,
                                       ProjectConfig& outConfig,
                                       std::string& outError) {
    std::ifstream in(path);
    if (!in.good()) {
        outError = "无法读取项目配置文件: " + path;
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (!loadFromString(ss.str(), outConfig, outError)) {
        outError = path + ": " + outError;
        return false;
    }
    return true;
}

bool ProjectConfigLoader::loadFromString(const std::string& text,
                                         ProjectConfig& outConfig,
                                         std::string& outError) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        outError = "项目配置 JSON 解析失败: " + std::string(ex.what());
        return false;
    }
    return readConfig(root, outConfig, outError);
}

void applyProjectConfig(ProjectConfig const& config,
                        DriverOptions& options,
                        ProjectConfigOverrides const& overrides) {
    const auto& resolve = config.Resolve;
    if (resolve.HasExtensions && !overrides.Extensions) {
        options.Extensions = resolve.Extensions;
    }
    if (resolve.HasAllowRemote && !overrides.AllowRemote) {
        options.AllowRemote = resolve.AllowRemote;
    }
    if (resolve.HasURLTimeout && !overrides.URLTimeout) {
        options.URLTimeoutMs = resolve.URLTimeoutMs;
    }
    if (resolve.HasVirtualRoot && !overrides.VirtualRoot) {
        options.VirtualRoot = resolve.VirtualRoot;
    }

    const auto& diagnostics = config.Diagnostics;
    if (diagnostics.HasWarningsAsErrors && !overrides.WarningsAsErrors) {
        options.WarningsAsErrors = diagnostics.WarningsAsErrors;
    }
    if (diagnostics.HasErrorLimit && !overrides.ErrorLimit) {
        options.ErrorLimit = diagnostics.ErrorLimit;
    }
    if (diagnostics.HasColor && !overrides.Color) {
        options.UseColors = diagnostics.Color;
    }
}

} // namespace machlink

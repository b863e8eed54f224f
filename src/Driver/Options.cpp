#include "machlink/Driver/Options.h"
#include "machlink/Module/ModuleId.h"
#include "machlink/Module/ModuleResolver.h"
#include "machlink/Tooling/ProjectConfig.h"
#include <filesystem>
#include <limits>

namespace machlink {

namespace {

bool consumeValueArg(int argc,
                     char* argv[],
                     int& i,
                     std::string& value,
                     const char* optionName,
                     std::string& errorMsg) {
    if (i + 1 >= argc) {
        errorMsg = std::string("错误：") + optionName + " 选项需要参数";
        return false;
    }
    value = argv[++i];
    return true;
}

/// 解析不超过 \p maxValue 的十进制无符号整数
bool parseUnsigned(const std::string& text, unsigned long& value, unsigned long maxValue) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        value = std::stoul(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return value <= maxValue;
}

struct ParseState {
    bool SeenAction = false;
    ProjectConfigOverrides CliSet;
};

bool setSingleAction(DriverOptions& options,
                     DriverAction action,
                     ParseState& state,
                     std::string& errorMsg) {
    if (state.SeenAction && options.Action != action) {
        errorMsg = "错误：--check/--order/--merge 互斥，只能指定一个动作";
        return false;
    }
    options.Action = action;
    state.SeenAction = true;
    return true;
}

bool loadAndMergeProjectConfig(DriverOptions& options,
                               const ParseState& state,
                               std::string& errorMsg) {
    std::string projectFile = options.ProjectFile;
    if (projectFile.empty()) {
        // 只有本地入口才向上查找项目文件
        std::string start = std::filesystem::current_path().string();
        if (!options.InputFiles.empty() &&
            !isURLImportPath(options.InputFiles.front()) &&
            options.InputFiles.front().rfind("vfs://", 0) != 0) {
            start = options.InputFiles.front();
        }
        projectFile = ProjectConfigLoader::discover(start);
    }

    if (projectFile.empty()) {
        return true;
    }

    ProjectConfig config;
    if (!ProjectConfigLoader::loadFromFile(projectFile, config, errorMsg)) {
        return false;
    }

    // 相对的虚拟根目录以项目文件所在目录为基准
    if (config.Resolve.HasVirtualRoot &&
        std::filesystem::path(config.Resolve.VirtualRoot).is_relative()) {
        config.Resolve.VirtualRoot =
            (std::filesystem::path(projectFile).parent_path() / config.Resolve.VirtualRoot)
                .lexically_normal()
                .string();
    }

    options.ProjectFile = projectFile;
    applyProjectConfig(config, options, state.CliSet);
    return true;
}

} // namespace

const char* DriverOptions::getActionString() const {
    switch (Action) {
        case DriverAction::Check: return "check";
        case DriverAction::Order: return "order";
        case DriverAction::Merge: return "merge";
    }
    return "check";
}

std::vector<std::string> DriverOptions::getEffectiveExtensions() const {
    return Extensions.empty() ? getDefaultExtensions() : Extensions;
}

bool DriverOptions::validate(std::string& errorMsg) const {
    if (InputFiles.empty() && !ShowHelp && !ShowVersion) {
        errorMsg = "错误：未指定入口文件";
        return false;
    }

    if (InputFiles.size() > 1) {
        errorMsg = "错误：只能指定一个入口文件";
        return false;
    }

    for (const auto& file : InputFiles) {
        if (isURLImportPath(file)) {
            if (!AllowRemote) {
                errorMsg = "错误：已禁用远程导入，无法使用 URL 入口: " + file;
                return false;
            }
            continue;
        }
        if (file.rfind("vfs://", 0) == 0) {
            if (VirtualRoot.empty()) {
                errorMsg = "错误：vfs:// 入口需要指定 --vfs-root: " + file;
                return false;
            }
            continue;
        }
        if (!std::filesystem::exists(file)) {
            errorMsg = "错误：入口文件不存在: " + file;
            return false;
        }
    }

    for (const auto& ext : Extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            errorMsg = "错误：扩展名必须以 '.' 开头: " + ext;
            return false;
        }
    }

    if (!VirtualRoot.empty() && !std::filesystem::is_directory(VirtualRoot)) {
        errorMsg = "错误：虚拟根目录不存在: " + VirtualRoot;
        return false;
    }

    if (!OutputFile.empty()) {
        std::filesystem::path outputPath(OutputFile);
        auto parentPath = outputPath.parent_path();
        if (!parentPath.empty() && !std::filesystem::exists(parentPath)) {
            errorMsg = "错误：输出目录不存在: " + parentPath.string();
            return false;
        }
    }

    return true;
}

bool parseDriverOptions(int argc,
                        char* argv[],
                        DriverOptions& options,
                        std::string& errorMsg) {
    ParseState state;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (++i; i < argc; ++i) {
                options.InputFiles.push_back(argv[i]);
            }
            break;
        }

        if (arg == "-h" || arg == "--help") {
            options.ShowHelp = true;
            return true;
        }
        if (arg == "--version") {
            options.ShowVersion = true;
            return true;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.Verbose = true;
            continue;
        }

        if (arg == "--check") {
            if (!setSingleAction(options, DriverAction::Check, state, errorMsg)) {
                return false;
            }
            continue;
        }
        if (arg == "--order") {
            if (!setSingleAction(options, DriverAction::Order, state, errorMsg)) {
                return false;
            }
            continue;
        }
        if (arg == "--merge") {
            if (!setSingleAction(options, DriverAction::Merge, state, errorMsg)) {
                return false;
            }
            continue;
        }
        if (arg == "-o") {
            if (!consumeValueArg(argc, argv, i, options.OutputFile, "-o", errorMsg)) {
                return false;
            }
            if (!setSingleAction(options, DriverAction::Merge, state, errorMsg)) {
                return false;
            }
            continue;
        }

        if (arg == "--ext") {
            std::string value;
            if (!consumeValueArg(argc, argv, i, value, "--ext", errorMsg)) {
                return false;
            }
            if (!state.CliSet.Extensions) {
                options.Extensions.clear();
            }
            options.Extensions.push_back(value);
            state.CliSet.Extensions = true;
            continue;
        }
        if (arg == "--no-remote") {
            options.AllowRemote = false;
            state.CliSet.AllowRemote = true;
            continue;
        }
        if (arg == "--url-timeout") {
            std::string value;
            unsigned long timeout = 0;
            if (!consumeValueArg(argc, argv, i, value, "--url-timeout", errorMsg)) {
                return false;
            }
            if (!parseUnsigned(value, timeout, std::numeric_limits<long>::max())) {
                errorMsg = "错误：无效的超时值 '" + value + "'";
                return false;
            }
            options.URLTimeoutMs = static_cast<long>(timeout);
            state.CliSet.URLTimeout = true;
            continue;
        }
        if (arg == "--vfs-root") {
            if (!consumeValueArg(argc, argv, i, options.VirtualRoot, "--vfs-root", errorMsg)) {
                return false;
            }
            state.CliSet.VirtualRoot = true;
            continue;
        }
        if (arg == "--project") {
            if (!consumeValueArg(argc, argv, i, options.ProjectFile, "--project", errorMsg)) {
                return false;
            }
            continue;
        }
        if (arg == "-Werror") {
            options.WarningsAsErrors = true;
            state.CliSet.WarningsAsErrors = true;
            continue;
        }
        if (arg == "--error-limit") {
            std::string value;
            unsigned long limit = 0;
            if (!consumeValueArg(argc, argv, i, value, "--error-limit", errorMsg)) {
                return false;
            }
            if (!parseUnsigned(value, limit, std::numeric_limits<unsigned>::max())) {
                errorMsg = "错误：无效的错误上限 '" + value + "'";
                return false;
            }
            options.ErrorLimit = static_cast<unsigned>(limit);
            state.CliSet.ErrorLimit = true;
            continue;
        }
        if (arg == "--no-color") {
            options.UseColors = false;
            state.CliSet.Color = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            errorMsg = "错误：未知选项 '" + arg + "'";
            return false;
        }

        options.InputFiles.push_back(arg);
    }

    return loadAndMergeProjectConfig(options, state, errorMsg);
}

} // namespace machlink

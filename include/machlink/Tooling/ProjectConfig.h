#ifndef MACHLINK_TOOLING_PROJECTCONFIG_H
#define MACHLINK_TOOLING_PROJECTCONFIG_H

#include <string>
#include <vector>

namespace machlink {

class DriverOptions;

struct ProjectResolveConfig {
    bool HasExtensions = false;
    std::vector<std::string> Extensions;

    bool HasAllowRemote = false;
    bool AllowRemote = true;

    bool HasURLTimeout = false;
    long URLTimeoutMs = 0;

    bool HasVirtualRoot = false;
    std::string VirtualRoot;
};

struct ProjectDiagnosticsConfig {
    bool HasWarningsAsErrors = false;
    bool WarningsAsErrors = false;

    bool HasErrorLimit = false;
    unsigned ErrorLimit = 0;

    bool HasColor = false;
    bool Color = true;
};

struct ProjectConfig {
    unsigned Version = 1;
    ProjectResolveConfig Resolve;
    ProjectDiagnosticsConfig Diagnostics;
};

/// 命令行中显式给出的选项；这些值不会被项目配置覆盖
struct ProjectConfigOverrides {
    bool Extensions = false;
    bool AllowRemote = false;
    bool URLTimeout = false;
    bool VirtualRoot = false;
    bool WarningsAsErrors = false;
    bool ErrorLimit = false;
    bool Color = false;
};

class ProjectConfigLoader {
public:
    static constexpr const char* FileName = "machlink-project.json";

    static std::string discover(const std::string& startPath);
    static bool loadFromFile(const std::string& path,
                             ProjectConfig& outConfig,
                             std::string& outError);
    static bool loadFromString(const std::string& text,
                               ProjectConfig& outConfig,
                               std::string& outError);
};

void applyProjectConfig(ProjectConfig const& config,
                        DriverOptions& options,
                        ProjectConfigOverrides const& overrides = ProjectConfigOverrides());

} // namespace machlink

#endif // MACHLINK_TOOLING_PROJECTCONFIG_H

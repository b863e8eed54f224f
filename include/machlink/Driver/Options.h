/// \file
/// \brief 命令行选项定义
///
/// 定义 machlink 工具的选项：入口文件、执行动作、解析与诊断设置。

#ifndef MACHLINK_DRIVER_OPTIONS_H
#define MACHLINK_DRIVER_OPTIONS_H

#include <string>
#include <vector>

namespace machlink {

/// 驱动执行动作
enum class DriverAction {
    Check,  ///< --check：加载、检查 import、链接（默认）
    Order,  ///< --order：按依赖顺序输出模块
    Merge   ///< --merge / -o：输出合并后的机器 JSON
};

/// 工具选项
class DriverOptions {
public:
    DriverOptions() = default;

    /// 入口文件（文件路径、vfs:// 或 http(s):// 标识）
    std::vector<std::string> InputFiles;

    /// 合并结果的输出文件，为空时写到标准输出
    std::string OutputFile;

    DriverAction Action = DriverAction::Check;

    bool ShowHelp = false;
    bool ShowVersion = false;
    bool Verbose = false;

    /// 扩展名推断列表，为空时使用默认值
    std::vector<std::string> Extensions;

    /// 是否允许 http(s) 导入
    bool AllowRemote = true;

    /// URL 传输超时（毫秒），0 表示不设置
    long URLTimeoutMs = 0;

    /// 挂载为虚拟文件系统的目录
    std::string VirtualRoot;

    /// 项目配置文件（可选，默认向上查找）
    std::string ProjectFile;

    bool WarningsAsErrors = false;
    unsigned ErrorLimit = 0;
    bool UseColors = true;

    /// 获取动作字符串
    const char* getActionString() const;

    /// 实际使用的扩展名列表
    std::vector<std::string> getEffectiveExtensions() const;

    /// 验证选项的有效性
    bool validate(std::string& errorMsg) const;
};

/// 解析命令行并合并项目配置（命令行中显式给出的值优先）
/// \return 失败时返回 false，错误信息写入 errorMsg
bool parseDriverOptions(int argc, char* argv[], DriverOptions& options,
                        std::string& errorMsg);

} // namespace machlink

#endif // MACHLINK_DRIVER_OPTIONS_H

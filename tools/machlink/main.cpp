/// \file
/// \brief machlink 主程序。

#include "machlink/Basic/Version.h"
#include "machlink/Driver/Driver.h"
#include "machlink/Driver/Options.h"
#include <iostream>
#include <string>

using namespace machlink;

namespace {

void printHelp(const char* programName) {
    std::cout << "machlink v" << VersionInfo::getVersionString() << "\n\n";
    std::cout << "用法: " << programName << " [选项] <入口文件>\n\n";
    std::cout << "入口可以是文件路径、vfs://<路径>（需要 --vfs-root）或 http(s):// URL。\n\n";
    std::cout << "动作:\n";
    std::cout << "  --check                 检查 import 并链接跨文件引用（默认）\n";
    std::cout << "  --order                 按依赖顺序输出模块\n";
    std::cout << "  --merge                 输出合并后的机器（JSON）\n";
    std::cout << "  -o <文件>               将合并结果写入文件（隐含 --merge）\n\n";
    std::cout << "解析选项:\n";
    std::cout << "  --ext <.扩展名>         无扩展名导入时尝试的扩展名（可重复）\n";
    std::cout << "  --no-remote             禁用 http(s) 导入\n";
    std::cout << "  --url-timeout <毫秒>    URL 获取超时\n";
    std::cout << "  --vfs-root <目录>       将目录挂载为虚拟文件系统\n";
    std::cout << "  --project <文件>        指定项目配置文件（默认向上查找 "
              << "machlink-project.json）\n\n";
    std::cout << "通用选项:\n";
    std::cout << "  -h, --help              显示此帮助信息\n";
    std::cout << "  --version               显示版本信息\n";
    std::cout << "  -v, --verbose           启用详细输出\n";
    std::cout << "  -Werror                 将警告视为错误\n";
    std::cout << "  --error-limit <n>       最多显示 n 个错误（0 表示不限）\n";
    std::cout << "  --no-color              禁用彩色诊断输出\n";
}

} // namespace

int main(int argc, char* argv[]) {
    DriverOptions options;
    std::string errorMsg;
    if (!parseDriverOptions(argc, argv, options, errorMsg)) {
        std::cerr << errorMsg << "\n";
        std::cerr << "使用 '" << argv[0] << " --help' 查看帮助信息\n";
        return 1;
    }

    if (options.ShowHelp) {
        printHelp(argv[0]);
        return 0;
    }
    if (options.ShowVersion) {
        VersionInfo::printVersion(std::cout);
        return 0;
    }

    if (!options.validate(errorMsg)) {
        std::cerr << errorMsg << "\n";
        std::cerr << "使用 '" << argv[0] << " --help' 查看帮助信息\n";
        return 1;
    }

    try {
        Driver driver(options, std::cout, std::cerr);
        DriverResult result = driver.run();
        switch (result) {
            case DriverResult::Success:
                return 0;
            case DriverResult::LoadError:
            case DriverResult::LinkError:
                return 1;
            case DriverResult::IOError:
                return 3;
            case DriverResult::InternalError:
                return 4;
        }
    } catch (const std::exception& e) {
        std::cerr << "内部错误: " << e.what() << "\n";
        return 4;
    }

    return 0;
}

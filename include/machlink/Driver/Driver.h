/// \file
/// \brief 工具驱动器
///
/// 加载入口模块的依赖闭包，按选项执行检查、排序或合并。

#ifndef MACHLINK_DRIVER_DRIVER_H
#define MACHLINK_DRIVER_DRIVER_H

#include "machlink/Driver/Options.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Basic/SourceManager.h"
#include "machlink/Module/ModuleId.h"
#include <iosfwd>
#include <memory>
#include <string>

namespace machlink {

class VirtualFileSystem;
class WorkspaceManager;

/// 执行结果
enum class DriverResult {
    Success,        ///< 成功
    LoadError,      ///< 入口无法加载（语法错误、找不到模块）
    LinkError,      ///< import 检查、链接或合并报告了错误
    IOError,        ///< 虚拟根目录或输出文件 I/O 错误
    InternalError   ///< 内部错误
};

/// 获取执行结果的字符串描述
const char* getDriverResultString(DriverResult result);

/// 工具驱动器
class Driver {
public:
    /// \param out 正常输出（顺序、JSON）
    /// \param err 诊断与 verbose 进度
    Driver(const DriverOptions& options, std::ostream& out, std::ostream& err);

    ~Driver();

    /// 运行
    DriverResult run();

    /// 获取诊断引擎
    DiagnosticEngine& getDiagnostics() { return *Diagnostics; }

    /// 获取源码管理器
    SourceManager& getSourceManager() { return *SourceMgr; }

    /// 获取工作区（run() 之后有效）
    const WorkspaceManager* getWorkspace() const { return Workspace.get(); }

    const DriverOptions& getOptions() const { return Options; }

    /// 把命令行入口转换为模块标识
    static ModuleId computeEntryId(const std::string& input);

private:
    DriverOptions Options;
    std::ostream& Out;
    std::ostream& Err;

    std::unique_ptr<SourceManager> SourceMgr;
    std::unique_ptr<DiagnosticEngine> Diagnostics;
    std::shared_ptr<VirtualFileSystem> VirtualFS;
    std::unique_ptr<WorkspaceManager> Workspace;
    ModuleId Entry;

    /// 初始化诊断系统
    void initializeDiagnostics();

    /// 将虚拟根目录下的文件载入虚拟文件系统
    DriverResult mountVirtualRoot();

    /// 创建工作区并加载入口的依赖闭包
    DriverResult loadWorkspace();

    /// 报告工作区收集的错误
    /// \param skipValidatorErrors 跳过 ImportValidator 会再次报告的错误
    void reportWorkspaceErrors(bool skipValidatorErrors);

    DriverResult runCheck();
    DriverResult runOrder();
    DriverResult runMerge();

    /// 打印统计信息
    void printStatistics() const;
};

} // namespace machlink

#endif // MACHLINK_DRIVER_DRIVER_H

#include "machlink/Driver/Driver.h"
#include "machlink/Basic/TextDiagnosticPrinter.h"
#include "machlink/Merge/MergedMachineJSON.h"
#include "machlink/Merge/ModuleMerger.h"
#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Sema/CrossFileLinker.h"
#include "machlink/Sema/ImportScope.h"
#include "machlink/Sema/ImportValidator.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace machlink {

namespace {

bool hasExtension(const std::filesystem::path& path,
                  const std::vector<std::string>& extensions) {
    std::string ext = path.extension().string();
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

} // namespace

const char* getDriverResultString(DriverResult result) {
    switch (result) {
        case DriverResult::Success: return "成功";
        case DriverResult::LoadError: return "加载错误";
        case DriverResult::LinkError: return "链接错误";
        case DriverResult::IOError: return "I/O 错误";
        case DriverResult::InternalError: return "内部错误";
    }
    return "未知错误";
}

Driver::Driver(const DriverOptions& options, std::ostream& out, std::ostream& err)
    : Options(options),
      Out(out),
      Err(err),
      SourceMgr(std::make_unique<SourceManager>()),
      Diagnostics(std::make_unique<DiagnosticEngine>(*SourceMgr)) {
    initializeDiagnostics();
}

Driver::~Driver() = default;

void Driver::initializeDiagnostics() {
    Diagnostics->setConsumer(
        std::make_unique<TextDiagnosticPrinter>(Err, *SourceMgr, Options.UseColors));
    Diagnostics->setWarningsAsErrors(Options.WarningsAsErrors);
    Diagnostics->setErrorLimit(Options.ErrorLimit);
}

ModuleId Driver::computeEntryId(const std::string& input) {
    if (auto id = ModuleId::fromString(input)) {
        return *id;
    }
    return ModuleId::forFile(input);
}

DriverResult Driver::run() {
    auto startTime = std::chrono::high_resolution_clock::now();

    if (Options.InputFiles.empty()) {
        Err << "错误：未指定入口文件\n";
        return DriverResult::IOError;
    }

    DriverResult result = mountVirtualRoot();
    if (result != DriverResult::Success) {
        return result;
    }

    result = loadWorkspace();
    if (result != DriverResult::Success) {
        return result;
    }

    switch (Options.Action) {
        case DriverAction::Check:
            result = runCheck();
            break;
        case DriverAction::Order:
            result = runOrder();
            break;
        case DriverAction::Merge:
            result = runMerge();
            break;
    }

    if (Options.Verbose) {
        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
        printStatistics();
        Err << "[machlink] " << Options.getActionString() << " 完成: "
            << getDriverResultString(result) << "（" << duration.count() << " ms）\n";
    }
    return result;
}

DriverResult Driver::mountVirtualRoot() {
    if (Options.VirtualRoot.empty()) {
        return DriverResult::Success;
    }

    std::filesystem::path root(Options.VirtualRoot);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        Err << "错误：虚拟根目录不存在: " << Options.VirtualRoot << "\n";
        return DriverResult::IOError;
    }

    VirtualFS = std::make_shared<VirtualFileSystem>();
    std::vector<std::string> extensions = Options.getEffectiveExtensions();

    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        Err << "错误：无法遍历虚拟根目录: " << Options.VirtualRoot << ": "
            << ec.message() << "\n";
        return DriverResult::IOError;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || !hasExtension(entry.path(), extensions)) {
            continue;
        }

        std::ifstream file(entry.path(), std::ios::binary);
        if (!file) {
            Err << "错误：无法读取文件: " << entry.path().string() << "\n";
            return DriverResult::IOError;
        }
        std::ostringstream ss;
        ss << file.rdbuf();

        std::string virtualPath =
            "/" + entry.path().lexically_relative(root).generic_string();
        VirtualFS->setFile(virtualPath, ss.str());
        if (Options.Verbose) {
            Err << "[machlink] 挂载 vfs://" << VirtualFileSystem::normalize(virtualPath)
                << "\n";
        }
    }
    return DriverResult::Success;
}

DriverResult Driver::loadWorkspace() {
    ResolverOptions resolverOptions;
    resolverOptions.Extensions = Options.getEffectiveExtensions();
    resolverOptions.AllowRemote = Options.AllowRemote;
    resolverOptions.URLTimeoutMs = Options.URLTimeoutMs;
    resolverOptions.VirtualFS = VirtualFS;

    Workspace = std::make_unique<WorkspaceManager>(*SourceMgr, resolverOptions);
    Entry = computeEntryId(Options.InputFiles.front());
    if (!Entry.isValid()) {
        Err << "错误：无效的入口: " << Options.InputFiles.front() << "\n";
        return DriverResult::IOError;
    }

    if (Options.Verbose) {
        Err << "[machlink] 入口: " << Entry << "\n";
    }

    WorkspaceManager::LoadFunction fileLoader =
        WorkspaceManager::makeDefaultLoader(VirtualFS);
    std::shared_ptr<CompositeModuleResolver> resolver = Workspace->getResolver();

    // 远程入口没有导入方，只能直接交给解析器获取
    auto loader = [fileLoader, resolver](const ModuleId& id) -> std::optional<std::string> {
        if (!id.isURL()) {
            return fileLoader(id);
        }
        ResolveResult resolved = resolver->resolve(id.str(), ModuleId()).get();
        if (resolved && resolved->Content) {
            return resolved->Content;
        }
        return std::nullopt;
    };

    bool loaded = Workspace->loadDocumentWithDependencies(Entry, loader).get();
    if (!loaded) {
        reportWorkspaceErrors(false);
        // 入口本身读取失败属于 I/O 错误，解析失败属于加载错误
        for (const ImportError& error : Workspace->getErrors()) {
            if (error.getKind() == ImportError::Kind::ModuleNotFound &&
                !error.getFromModule() && error.getImportPath() == Entry.getLocation()) {
                return DriverResult::IOError;
            }
        }
        return DriverResult::LoadError;
    }

    if (Options.Verbose) {
        for (const ModuleInfo* info : Workspace->getAllModules()) {
            Err << "[machlink] 已加载 " << info->getId() << "（"
                << info->Dependencies.size() << " 个依赖）\n";
        }
    }
    return DriverResult::Success;
}

void Driver::reportWorkspaceErrors(bool skipValidatorErrors) {
    for (const ImportError& error : Workspace->getErrors()) {
        // 带有 import 节点的"找不到模块"会由 import 检查重新报告
        if (skipValidatorErrors && error.getKind() == ImportError::Kind::ModuleNotFound &&
            error.getNode() != nullptr) {
            continue;
        }
        error.report(*Diagnostics);
    }
}

DriverResult Driver::runCheck() {
    reportWorkspaceErrors(true);

    ImportValidator validator(*Diagnostics, Workspace.get());
    for (const ModuleInfo* info : Workspace->getAllModules()) {
        validator.checkImports(*info->Mod);

        if (Options.Verbose) {
            ImportScope scope(*Workspace, *info->Mod);
            Err << "[machlink] " << info->getId() << ": "
                << scope.getImportedSymbols().size() << " 个导入符号\n";
        }
    }

    // 依赖环已由 import 检查报告
    if (!Workspace->hasCircularDependencies()) {
        CrossFileLinker linker(*Workspace);
        LinkSummary summary = linker.linkWorkspace(*Diagnostics);
        if (Options.Verbose) {
            Err << "[machlink] 链接: " << summary.LocalRefs << " 个本地引用, "
                << summary.ImportedRefs << " 个跨文件引用, " << summary.UnresolvedRefs
                << " 个未解析\n";
        }
    }

    return Diagnostics->hasErrors() ? DriverResult::LinkError : DriverResult::Success;
}

DriverResult Driver::runOrder() {
    reportWorkspaceErrors(false);

    auto ordered = Workspace->getDocumentsInOrder();
    if (!ordered) {
        for (const auto& cycle : Workspace->getCircularDependencies()) {
            ImportError::circularDependency(cycle).report(*Diagnostics);
        }
        return DriverResult::LinkError;
    }

    for (const Module* module : *ordered) {
        Out << module->getId() << "\n";
    }
    return Diagnostics->hasErrors() ? DriverResult::LinkError : DriverResult::Success;
}

DriverResult Driver::runMerge() {
    reportWorkspaceErrors(true);

    ModuleMerger merger(*Workspace);
    MergeResult result = merger.mergeMachines(Entry);
    if (!result.succeeded()) {
        result.report(*Diagnostics);
        return DriverResult::LinkError;
    }

    std::string json = toJSONString(*result.Merged);
    if (Options.OutputFile.empty()) {
        Out << json << "\n";
    } else {
        std::ofstream output(Options.OutputFile, std::ios::binary);
        if (!output) {
            Err << "错误：无法创建输出文件: " << Options.OutputFile << "\n";
            return DriverResult::IOError;
        }
        output << json << "\n";
        if (!output) {
            Err << "错误：写入输出文件失败: " << Options.OutputFile << "\n";
            return DriverResult::IOError;
        }
        if (Options.Verbose) {
            Err << "[machlink] 合并结果已写入 " << Options.OutputFile << "\n";
        }
    }

    return Diagnostics->hasErrors() ? DriverResult::LinkError : DriverResult::Success;
}

void Driver::printStatistics() const {
    Err << "[machlink] 模块: " << Workspace->size()
        << ", 错误: " << Diagnostics->getErrorCount()
        << ", 警告: " << Diagnostics->getWarningCount() << "\n";
}

} // namespace machlink

/// \file DriverTest.cpp
/// \brief 工具驱动器端到端测试
///
/// 在临时目录中写入模块，运行驱动器并检查输出流与返回结果。

#include "machlink/Driver/Driver.h"
#include "machlink/Module/WorkspaceManager.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;

namespace machlink {
namespace {

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        Root = fs::temp_directory_path() /
               (std::string("machlink_driver_") + info->name());
        fs::remove_all(Root);
        fs::create_directories(Root);
        Options.UseColors = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(Root, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = Root / name;
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::string fileId(const std::string& name) const {
        return ModuleId::forFile((Root / name).string()).str();
    }

    DriverResult run(const std::string& entry) {
        Options.InputFiles = {entry};
        Out.str("");
        Err.str("");
        Current = std::make_unique<Driver>(Options, Out, Err);
        return Current->run();
    }

    fs::path Root;
    DriverOptions Options;
    std::ostringstream Out;
    std::ostringstream Err;
    std::unique_ptr<Driver> Current;
};

// ============================================================================
// 检查
// ============================================================================

TEST_F(DriverTest, CheckCleanWorkspace) {
    writeFile("lib.dygram", "state Start\nstate End\n");
    std::string app = writeFile("app.dygram",
                                "import { Start, End as Finish } from \"./lib.dygram\"\n"
                                "state Middle\n"
                                "Start --> Middle --> Finish\n");

    EXPECT_EQ(run(app), DriverResult::Success);
    EXPECT_EQ(Err.str(), "");
    EXPECT_EQ(Out.str(), "");
    ASSERT_NE(Current->getWorkspace(), nullptr);
    EXPECT_EQ(Current->getWorkspace()->size(), 2u);
}

TEST_F(DriverTest, CheckResolvesImportWithoutExtension) {
    writeFile("lib.dygram", "Start\n");
    std::string app = writeFile("app.dygram",
                                "import { Start } from \"./lib\"\nMiddle\nStart --> Middle\n");
    EXPECT_EQ(run(app), DriverResult::Success);
}

TEST_F(DriverTest, CheckReportsUnresolvedReference) {
    std::string app = writeFile("app.dygram", "Start\nStart --> Nowhere\n");

    EXPECT_EQ(run(app), DriverResult::LinkError);
    std::string err = Err.str();
    EXPECT_NE(err.find("app.dygram:2:11: error[E"), std::string::npos) << err;
    EXPECT_NE(err.find("Could not resolve reference to node named 'Nowhere'"),
              std::string::npos);
    EXPECT_EQ(err.find("\033["), std::string::npos);
}

TEST_F(DriverTest, CheckReportsMissingModuleOnce) {
    std::string app = writeFile("app.dygram", "import { X } from \"./missing.dygram\"\n");

    EXPECT_EQ(run(app), DriverResult::LinkError);
    std::string err = Err.str();
    size_t first = err.find("Cannot resolve module: \"./missing.dygram\"");
    ASSERT_NE(first, std::string::npos) << err;
    EXPECT_EQ(err.find("Cannot resolve module", first + 1), std::string::npos);
}

TEST_F(DriverTest, CheckReportsCycle) {
    writeFile("b.dygram", "import { A1 } from \"./a.dygram\"\nB1\n");
    std::string a = writeFile("a.dygram", "import { B1 } from \"./b.dygram\"\nA1\n");

    EXPECT_EQ(run(a), DriverResult::LinkError);
    EXPECT_NE(Err.str().find("Circular dependency detected"), std::string::npos);
}

TEST_F(DriverTest, WarningsAsErrors) {
    std::string lib = writeFile("lib.dygram", "Start\n");
    std::string app = writeFile("app.dygram",
                                "import { Start } from \"" + lib + "\"\n");

    EXPECT_EQ(run(app), DriverResult::Success);
    EXPECT_NE(Err.str().find("warning[W"), std::string::npos);

    Options.WarningsAsErrors = true;
    EXPECT_EQ(run(app), DriverResult::LinkError);
}

// ============================================================================
// 加载失败
// ============================================================================

TEST_F(DriverTest, MissingEntryIsIOError) {
    EXPECT_EQ(run((Root / "absent.dygram").string()), DriverResult::IOError);
    EXPECT_NE(Err.str().find("Cannot resolve module"), std::string::npos);
}

TEST_F(DriverTest, SyntaxErrorInEntryIsLoadError) {
    std::string app = writeFile("app.dygram", "Start $\n");
    EXPECT_EQ(run(app), DriverResult::LoadError);
    EXPECT_NE(Err.str().find("Failed to parse module"), std::string::npos);
}

TEST_F(DriverTest, NoInputIsIOError) {
    Driver driver(Options, Out, Err);
    EXPECT_EQ(driver.run(), DriverResult::IOError);
}

// ============================================================================
// 排序与合并
// ============================================================================

TEST_F(DriverTest, OrderListsDependenciesFirst) {
    writeFile("base.dygram", "Core\n");
    writeFile("lib.dygram", "import { Core } from \"./base.dygram\"\nWrapper\n");
    std::string app = writeFile("app.dygram", "import { Wrapper } from \"./lib.dygram\"\n");

    Options.Action = DriverAction::Order;
    EXPECT_EQ(run(app), DriverResult::Success);
    EXPECT_EQ(Out.str(), fileId("base.dygram") + "\n" + fileId("lib.dygram") + "\n" +
                             fileId("app.dygram") + "\n");
}

TEST_F(DriverTest, OrderFailsOnCycle) {
    writeFile("b.dygram", "import { A1 } from \"./a.dygram\"\nB1\n");
    std::string a = writeFile("a.dygram", "import { B1 } from \"./b.dygram\"\nA1\n");

    Options.Action = DriverAction::Order;
    EXPECT_EQ(run(a), DriverResult::LinkError);
    EXPECT_EQ(Out.str(), "");
}

TEST_F(DriverTest, MergeWritesJSONToStdout) {
    writeFile("lib.dygram", "state Start\n");
    std::string app = writeFile("app.dygram",
                                "machine \"Demo\"\n"
                                "import { Start as Begin } from \"./lib.dygram\"\n"
                                "Work\n"
                                "Begin --> Work\n");

    Options.Action = DriverAction::Merge;
    ASSERT_EQ(run(app), DriverResult::Success) << Err.str();

    nlohmann::json json = nlohmann::json::parse(Out.str());
    EXPECT_EQ(json["title"], "Demo");
    EXPECT_EQ(json["nodes"].size(), 2u);
    EXPECT_EQ(json["sourceMap"]["Begin"]["originalName"], "Start");
    EXPECT_EQ(json["_metadata"]["entryPoint"], fileId("app.dygram"));
}

TEST_F(DriverTest, MergeWritesOutputFile) {
    std::string app = writeFile("app.dygram", "Start\n");
    fs::path output = Root / "merged.json";

    Options.Action = DriverAction::Merge;
    Options.OutputFile = output.string();
    ASSERT_EQ(run(app), DriverResult::Success);
    EXPECT_EQ(Out.str(), "");

    std::ifstream in(output);
    ASSERT_TRUE(in.good());
    nlohmann::json json = nlohmann::json::parse(in);
    EXPECT_EQ(json["nodes"][0]["name"], "Start");
}

TEST_F(DriverTest, MergeFailsOnMissingSymbol) {
    writeFile("lib.dygram", "Start\n");
    std::string app = writeFile("app.dygram", "import { Gone } from \"./lib.dygram\"\n");

    Options.Action = DriverAction::Merge;
    EXPECT_EQ(run(app), DriverResult::LinkError);
    EXPECT_EQ(Out.str(), "");
    EXPECT_NE(Err.str().find("Symbol \"Gone\" not found"), std::string::npos);
}

// ============================================================================
// 虚拟根目录
// ============================================================================

TEST_F(DriverTest, VirtualRootServesVfsEntries) {
    writeFile("vroot/lib.dygram", "Start\n");
    writeFile("vroot/app.dygram", "import { Start } from \"./lib.dygram\"\n");
    writeFile("vroot/notes.txt", "ignored\n");

    Options.VirtualRoot = (Root / "vroot").string();
    Options.Action = DriverAction::Order;
    EXPECT_EQ(run("vfs:///app.dygram"), DriverResult::Success) << Err.str();
    EXPECT_EQ(Out.str(), "vfs:///lib.dygram\nvfs:///app.dygram\n");
}

TEST_F(DriverTest, MissingVirtualRootIsIOError) {
    Options.VirtualRoot = (Root / "nope").string();
    EXPECT_EQ(run("vfs:///app.dygram"), DriverResult::IOError);
}

TEST_F(DriverTest, VerboseReportsProgress) {
    std::string app = writeFile("app.dygram", "Start\n");
    Options.Verbose = true;
    EXPECT_EQ(run(app), DriverResult::Success);
    EXPECT_NE(Err.str().find("[machlink]"), std::string::npos);
}

TEST_F(DriverTest, ComputeEntryId) {
    EXPECT_TRUE(Driver::computeEntryId("vfs:///app.dygram").isVirtual());
    EXPECT_TRUE(Driver::computeEntryId("https://example.com/app.dygram").isURL());

    ModuleId file = Driver::computeEntryId("app.dygram");
    EXPECT_TRUE(file.isFile());
    EXPECT_TRUE(fs::path(file.getLocation()).is_absolute());
}

TEST(DriverResultTest, EveryResultHasDescription) {
    for (DriverResult result : {DriverResult::Success, DriverResult::LoadError,
                                DriverResult::LinkError, DriverResult::IOError,
                                DriverResult::InternalError}) {
        EXPECT_STRNE(getDriverResultString(result), "");
    }
}

} // namespace
} // namespace machlink

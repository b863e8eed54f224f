/// \file WorkspaceManagerTest.cpp
/// \brief 工作区管理器单元测试
///
/// 所有模块都放在虚拟文件系统中，解析器不访问磁盘与网络。

#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Basic/SourceManager.h"
#include <gtest/gtest.h>

namespace machlink {
namespace {

class WorkspaceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        VFS = std::make_shared<VirtualFileSystem>();
        ResolverOptions options;
        options.AllowRemote = false;
        options.VirtualFS = VFS;
        Workspace = std::make_unique<WorkspaceManager>(SM, options);
    }

    static ModuleId vid(const std::string& path) { return ModuleId::forVirtual(path); }

    /// 写入虚拟文件并加入工作区
    bool add(const std::string& path, const std::string& content) {
        VFS->setFile(path, content);
        return Workspace->addDocument(vid(path), content);
    }

    std::vector<ModuleId> orderIds() const {
        std::vector<ModuleId> ids;
        auto order = Workspace->getDocumentsInOrder();
        if (order) {
            for (const Module* mod : *order) {
                ids.push_back(mod->getId());
            }
        }
        return ids;
    }

    size_t countErrors(ImportError::Kind kind) const {
        size_t count = 0;
        for (const ImportError& error : Workspace->getErrors()) {
            if (error.getKind() == kind) {
                ++count;
            }
        }
        return count;
    }

    SourceManager SM;
    std::shared_ptr<VirtualFileSystem> VFS;
    std::unique_ptr<WorkspaceManager> Workspace;
};

// ============================================================================
// 添加文档
// ============================================================================

TEST_F(WorkspaceManagerTest, DependencyOrderPutsImportedModuleFirst) {
    ASSERT_TRUE(add("/A.dygram", "Start\n"));
    ASSERT_TRUE(add("/B.dygram", "import { Start } from \"./A.dygram\"\nStart --> Done\n"));

    EXPECT_FALSE(Workspace->hasCircularDependencies());
    EXPECT_EQ(orderIds(), (std::vector<ModuleId>{vid("/A.dygram"), vid("/B.dygram")}));
    EXPECT_TRUE(Workspace->getErrors().empty());
}

TEST_F(WorkspaceManagerTest, OrderIsIndependentOfAddOrder) {
    VFS->setFile("/A.dygram", "Start\n");
    ASSERT_TRUE(add("/B.dygram", "import { Start } from \"./A\"\n"));
    ASSERT_TRUE(Workspace->addDocument(vid("/A.dygram"), "Start\n"));

    EXPECT_EQ(orderIds(), (std::vector<ModuleId>{vid("/A.dygram"), vid("/B.dygram")}));
}

TEST_F(WorkspaceManagerTest, MutualImportIsACycle) {
    ASSERT_TRUE(add("/A.dygram", "import { B1 } from \"./B.dygram\"\nA1\n"));
    ASSERT_TRUE(add("/B.dygram", "import { A1 } from \"./A.dygram\"\nB1\n"));

    EXPECT_TRUE(Workspace->hasCircularDependencies());
    auto cycles = Workspace->getCircularDependencies();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].size(), 3u);
    EXPECT_FALSE(Workspace->getDocumentsInOrder().has_value());
}

TEST_F(WorkspaceManagerTest, ResolvedImportsAndDependencies) {
    VFS->setFile("/lib/base.dygram", "Base\n");
    ASSERT_TRUE(add("/app.dygram",
                    "import { Base } from \"./lib/base\"\n"
                    "import { Base as Again } from \"./lib/base.dygram\"\n"));

    const ModuleInfo* info = Workspace->getModuleInfo(vid("/app.dygram"));
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->Dependencies, std::vector<ModuleId>{vid("/lib/base.dygram")});
    ASSERT_EQ(info->ResolvedImports.size(), 2u);
    EXPECT_EQ(Workspace->getResolvedImport(vid("/app.dygram"), 1),
              std::optional<ModuleId>(vid("/lib/base.dygram")));
    EXPECT_FALSE(Workspace->getResolvedImport(vid("/app.dygram"), 2).has_value());

    // 未加载的依赖也出现在依赖图中
    EXPECT_TRUE(Workspace->getDependencyGraph().hasModule(vid("/lib/base.dygram")));
    EXPECT_FALSE(Workspace->hasModule(vid("/lib/base.dygram")));
}

TEST_F(WorkspaceManagerTest, UnresolvableImportIsRecorded) {
    ASSERT_TRUE(add("/app.dygram", "import { X } from \"./nope.dygram\"\nStart\n"));

    auto errors = Workspace->getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].getKind(), ImportError::Kind::ModuleNotFound);
    EXPECT_EQ(errors[0].getImportPath(), "./nope.dygram");
    EXPECT_EQ(errors[0].getProperty(), "path");
    ASSERT_NE(errors[0].getNode(), nullptr);
    EXPECT_EQ(errors[0].getNode(),
              Workspace->getModule(vid("/app.dygram"))->getImports()[0].get());

    auto [line, column] = SM.getLineAndColumn(errors[0].getLocation());
    EXPECT_EQ(line, 1u);
    EXPECT_EQ(column, 19u);

    EXPECT_TRUE(Workspace->getModuleInfo(vid("/app.dygram"))->Dependencies.empty());
    EXPECT_FALSE(Workspace->getResolvedImport(vid("/app.dygram"), 0).has_value());
}

TEST_F(WorkspaceManagerTest, EmptyImportPathIsLeftToValidation) {
    ASSERT_TRUE(add("/app.dygram", "import { X } from \"\"\n"));
    EXPECT_TRUE(Workspace->getErrors().empty());
}

TEST_F(WorkspaceManagerTest, SyntaxErrorRejectsDocument) {
    EXPECT_FALSE(add("/bad.dygram", "Start $\n"));
    EXPECT_FALSE(Workspace->hasModule(vid("/bad.dygram")));

    auto errors = Workspace->getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].getKind(), ImportError::Kind::ModuleParse);
    EXPECT_EQ(errors[0].getDetail(), "1:7: invalid character '$'");
}

TEST_F(WorkspaceManagerTest, AddingExistingModuleReplacesIt) {
    ASSERT_TRUE(add("/A.dygram", "One\n"));
    ASSERT_TRUE(add("/A.dygram", "Two\n"));
    EXPECT_EQ(Workspace->size(), 1u);
    EXPECT_EQ(Workspace->getModule(vid("/A.dygram"))->getMachine()->getNodes()[0]->getName(),
              "Two");
}

// ============================================================================
// 更新与移除
// ============================================================================

TEST_F(WorkspaceManagerTest, UpdateKeepsIncomingEdges) {
    ASSERT_TRUE(add("/A.dygram", "Start\n"));
    ASSERT_TRUE(add("/B.dygram", "import { Start } from \"./A.dygram\"\n"));

    ASSERT_TRUE(Workspace->updateDocument(vid("/A.dygram"), "Start\nEnd\n"));

    EXPECT_TRUE(Workspace->getDependencyGraph().hasDependency(vid("/B.dygram"),
                                                              vid("/A.dygram")));
    EXPECT_EQ(orderIds(), (std::vector<ModuleId>{vid("/A.dygram"), vid("/B.dygram")}));
    EXPECT_EQ(Workspace->getModule(vid("/A.dygram"))->getMachine()->getNodes().size(), 2u);
}

TEST_F(WorkspaceManagerTest, UpdateReplacesOutgoingEdges) {
    VFS->setFile("/X.dygram", "X\n");
    VFS->setFile("/Y.dygram", "Y\n");
    ASSERT_TRUE(add("/app.dygram", "import { X } from \"./X.dygram\"\n"));

    ASSERT_TRUE(Workspace->updateDocument(vid("/app.dygram"),
                                          "import { Y } from \"./Y.dygram\"\n"));

    const DependencyGraph& graph = Workspace->getDependencyGraph();
    EXPECT_FALSE(graph.hasDependency(vid("/app.dygram"), vid("/X.dygram")));
    EXPECT_TRUE(graph.hasDependency(vid("/app.dygram"), vid("/Y.dygram")));
    EXPECT_FALSE(graph.hasModule(vid("/X.dygram")));
}

TEST_F(WorkspaceManagerTest, RemoveDropsEdgesBothWays) {
    ASSERT_TRUE(add("/A.dygram", "Start\n"));
    ASSERT_TRUE(add("/B.dygram", "import { Start } from \"./A.dygram\"\n"));

    EXPECT_TRUE(Workspace->removeDocument(vid("/A.dygram")));
    EXPECT_FALSE(Workspace->hasModule(vid("/A.dygram")));
    EXPECT_FALSE(Workspace->getDependencyGraph().hasModule(vid("/A.dygram")));
    EXPECT_TRUE(Workspace->getDependencyGraph().getDependencies(vid("/B.dygram")).empty());
    EXPECT_FALSE(Workspace->removeDocument(vid("/A.dygram")));

    // 重新加入后边恢复
    ASSERT_TRUE(add("/A.dygram", "Start\n"));
    EXPECT_TRUE(Workspace->getDependencyGraph().hasDependency(vid("/B.dygram"),
                                                              vid("/A.dygram")));
}

TEST_F(WorkspaceManagerTest, RemoveOfUnknownModuleIsFalse) {
    EXPECT_FALSE(Workspace->removeDocument(vid("/ghost.dygram")));
}

TEST_F(WorkspaceManagerTest, ClearResetsEverything) {
    ASSERT_TRUE(add("/A.dygram", "import { X } from \"./missing\"\n"));
    Workspace->clear();
    EXPECT_EQ(Workspace->size(), 0u);
    EXPECT_TRUE(Workspace->getDependencyGraph().empty());
    EXPECT_TRUE(Workspace->getErrors().empty());
}

// ============================================================================
// 递归加载
// ============================================================================

TEST_F(WorkspaceManagerTest, LoadWithDependencies) {
    VFS->setFile("/app.dygram", "import { Lib } from \"./lib/lib\"\nApp\n");
    VFS->setFile("/lib/lib.dygram", "import { Base } from \"./base\"\nLib\n");
    VFS->setFile("/lib/base.dygram", "Base\n");

    int loaderCalls = 0;
    auto defaultLoader = WorkspaceManager::makeDefaultLoader(VFS);
    auto loader = [&](const ModuleId& id) {
        ++loaderCalls;
        return defaultLoader(id);
    };

    bool loaded = Workspace->loadDocumentWithDependencies(vid("/app.dygram"), loader).get();
    EXPECT_TRUE(loaded);
    EXPECT_EQ(Workspace->size(), 3u);
    // 依赖的内容在解析 import 时已经取得，只有入口需要加载函数
    EXPECT_EQ(loaderCalls, 1);

    EXPECT_EQ(Workspace->getAllDependencies(vid("/app.dygram")),
              (std::vector<ModuleId>{vid("/lib/lib.dygram"), vid("/lib/base.dygram")}));
    EXPECT_EQ(orderIds(), (std::vector<ModuleId>{vid("/lib/base.dygram"),
                                                 vid("/lib/lib.dygram"),
                                                 vid("/app.dygram")}));
}

TEST_F(WorkspaceManagerTest, LoadToleratesCycles) {
    VFS->setFile("/A.dygram", "import { B1 } from \"./B\"\nA1\n");
    VFS->setFile("/B.dygram", "import { A1 } from \"./A\"\nB1\n");

    bool loaded = Workspace
                      ->loadDocumentWithDependencies(vid("/A.dygram"),
                                                     WorkspaceManager::makeDefaultLoader(VFS))
                      .get();
    EXPECT_TRUE(loaded);
    EXPECT_EQ(Workspace->size(), 2u);
    EXPECT_TRUE(Workspace->hasCircularDependencies());
}

TEST_F(WorkspaceManagerTest, LoadMissingEntryFails) {
    bool loaded = Workspace
                      ->loadDocumentWithDependencies(vid("/missing.dygram"),
                                                     WorkspaceManager::makeDefaultLoader(VFS))
                      .get();
    EXPECT_FALSE(loaded);
    EXPECT_EQ(countErrors(ImportError::Kind::ModuleNotFound), 1u);
}

TEST_F(WorkspaceManagerTest, LoadIsDeferredUntilGet) {
    VFS->setFile("/app.dygram", "App\n");
    auto future = Workspace->loadDocumentWithDependencies(
        vid("/app.dygram"), WorkspaceManager::makeDefaultLoader(VFS));
    EXPECT_EQ(Workspace->size(), 0u);
    EXPECT_TRUE(future.get());
    EXPECT_EQ(Workspace->size(), 1u);
}

TEST_F(WorkspaceManagerTest, LoadContinuesPastBrokenDependency) {
    VFS->setFile("/app.dygram",
                 "import { Bad } from \"./bad\"\nimport { Good } from \"./good\"\nApp\n");
    VFS->setFile("/bad.dygram", "Bad $\n");
    VFS->setFile("/good.dygram", "Good\n");

    bool loaded = Workspace
                      ->loadDocumentWithDependencies(vid("/app.dygram"),
                                                     WorkspaceManager::makeDefaultLoader(VFS))
                      .get();
    EXPECT_TRUE(loaded);
    EXPECT_TRUE(Workspace->hasModule(vid("/good.dygram")));
    EXPECT_FALSE(Workspace->hasModule(vid("/bad.dygram")));
    EXPECT_EQ(countErrors(ImportError::Kind::ModuleParse), 1u);
}

TEST_F(WorkspaceManagerTest, LoadRereadsDependencyEditedAfterAdd) {
    VFS->setFile("/lib.dygram", "Start\n");
    ASSERT_TRUE(add("/app.dygram", "import { Start } from \"./lib\"\nApp\n"));
    EXPECT_FALSE(Workspace->hasModule(vid("/lib.dygram")));

    // 加入入口之后才编辑依赖，加载时必须读到最新内容
    VFS->setFile("/lib.dygram", "Start\nAddedLater\n");
    bool loaded = Workspace
                      ->loadDocumentWithDependencies(vid("/app.dygram"),
                                                     WorkspaceManager::makeDefaultLoader(VFS))
                      .get();
    ASSERT_TRUE(loaded);

    const Module* lib = Workspace->getModule(vid("/lib.dygram"));
    ASSERT_NE(lib, nullptr);
    EXPECT_EQ(lib->getRawContent(), "Start\nAddedLater\n");
    EXPECT_NE(lib->getMachine()->findNode("AddedLater"), nullptr);
}

// ============================================================================
// 文件系统加载
// ============================================================================

TEST(WorkspaceManagerLoaderTest, DefaultLoaderIgnoresRemoteModules) {
    auto loader = WorkspaceManager::makeDefaultLoader();
    EXPECT_FALSE(loader(ModuleId::forURL("https://example.com/a.dygram")).has_value());
    EXPECT_FALSE(loader(ModuleId::forVirtual("/a.dygram")).has_value());
    EXPECT_FALSE(loader(ModuleId::forFile("/nonexistent/machlink/a.dygram")).has_value());
}

} // namespace
} // namespace machlink

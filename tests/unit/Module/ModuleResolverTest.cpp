/// \file ModuleResolverTest.cpp
/// \brief 模块解析器单元测试
///
/// 文件系统解析器使用临时目录；URL 解析器注入假的传输函数，
/// 不访问网络。

#include "machlink/Module/ModuleResolver.h"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>

namespace machlink {
namespace {

namespace fs = std::filesystem;

// ============================================================================
// FileSystemResolver
// ============================================================================

class FileSystemResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Root = fs::temp_directory_path() /
               (std::string("machlink_fsresolver_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(Root);
        fs::create_directories(Root / "lib");
        writeFile("app.dygram", "import { A } from \"./lib/base\"\n");
        writeFile("lib/base.dygram", "A\n");
        writeFile("lib/other.mach", "B\n");
        writeFile("lib/plain", "C\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(Root, ec);
    }

    void writeFile(const std::string& relative, const std::string& content) {
        std::ofstream out(Root / relative);
        out << content;
    }

    ModuleId appId() const { return ModuleId::forFile((Root / "app.dygram").string()); }

    fs::path Root;
    FileSystemResolver Resolver;
};

TEST_F(FileSystemResolverTest, CanResolveRelativeAndAbsolute) {
    EXPECT_TRUE(Resolver.canResolve("./lib/base.dygram", appId()));
    EXPECT_TRUE(Resolver.canResolve("../x.dygram", appId()));
    EXPECT_TRUE(Resolver.canResolve("/abs/x.dygram", ModuleId()));
    EXPECT_FALSE(Resolver.canResolve("lib/base.dygram", appId()));
    EXPECT_FALSE(Resolver.canResolve("https://example.com/a.dygram", appId()));
}

TEST_F(FileSystemResolverTest, RejectsNonFileImporters) {
    EXPECT_FALSE(Resolver.canResolve("./a.dygram", ModuleId::forVirtual("/app.dygram")));
    EXPECT_FALSE(Resolver.canResolve("./a.dygram",
                                     ModuleId::forURL("https://example.com/app.dygram")));
}

TEST_F(FileSystemResolverTest, ResolvesRelativeToImporter) {
    ResolveResult result = Resolver.resolve("./lib/base.dygram", appId()).get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->Id, ModuleId::forFile((Root / "lib/base.dygram").string()));
    EXPECT_EQ(result->ImportPath, "./lib/base.dygram");
    ASSERT_TRUE(result->Content.has_value());
    EXPECT_EQ(*result->Content, "A\n");
}

TEST_F(FileSystemResolverTest, TriesExtensionsInOrder) {
    ResolveResult base = Resolver.resolve("./lib/base", appId()).get();
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(base->Id.getFileName(), "base.dygram");

    ResolveResult other = Resolver.resolve("./lib/other", appId()).get();
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->Id.getFileName(), "other.mach");
}

TEST_F(FileSystemResolverTest, ExactPathWinsOverExtensions) {
    ResolveResult plain = Resolver.resolve("./lib/plain", appId()).get();
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain->Content, "C\n");
}

TEST_F(FileSystemResolverTest, ExplicitExtensionIsNotExtended) {
    EXPECT_FALSE(Resolver.resolve("./lib/base.txt", appId()).get().has_value());
}

TEST_F(FileSystemResolverTest, ParentDirectoryImport) {
    ModuleId baseId = ModuleId::forFile((Root / "lib/base.dygram").string());
    ResolveResult result = Resolver.resolve("../app.dygram", baseId).get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->Id, appId());
}

TEST_F(FileSystemResolverTest, AbsoluteImport) {
    std::string absolute = (Root / "lib/base.dygram").generic_string();
    ResolveResult result = Resolver.resolve(absolute, appId()).get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->ResolvedLocation, ModuleId::forFile(absolute).getLocation());
}

TEST_F(FileSystemResolverTest, MissingFileIsNotFound) {
    EXPECT_FALSE(Resolver.resolve("./nope", appId()).get().has_value());
}

TEST_F(FileSystemResolverTest, DirectoryIsNotAModule) {
    EXPECT_FALSE(Resolver.resolve("./lib", appId()).get().has_value());
}

TEST_F(FileSystemResolverTest, CustomExtensions) {
    FileSystemResolver machOnly({".mach"});
    EXPECT_FALSE(machOnly.resolve("./lib/base", appId()).get().has_value());
    EXPECT_TRUE(machOnly.resolve("./lib/other", appId()).get().has_value());
}

// ============================================================================
// VirtualFileSystem / VirtualFSResolver
// ============================================================================

TEST(VirtualFileSystemTest, PathsAreNormalized) {
    VirtualFileSystem vfs;
    vfs.setFile("lib/base.dygram", "A");

    EXPECT_TRUE(vfs.hasFile("/lib/base.dygram"));
    EXPECT_TRUE(vfs.hasFile("/lib/./x/../base.dygram"));
    EXPECT_EQ(*vfs.getFile("/lib/base.dygram"), "A");
    EXPECT_EQ(vfs.getPaths(), std::vector<std::string>{"/lib/base.dygram"});
}

TEST(VirtualFileSystemTest, OverwriteAndRemove) {
    VirtualFileSystem vfs;
    vfs.setFile("/a.dygram", "one");
    vfs.setFile("/a.dygram", "two");
    EXPECT_EQ(vfs.size(), 1u);
    EXPECT_EQ(*vfs.getFile("/a.dygram"), "two");

    EXPECT_TRUE(vfs.removeFile("a.dygram"));
    EXPECT_FALSE(vfs.removeFile("a.dygram"));
    EXPECT_FALSE(vfs.getFile("/a.dygram").has_value());
}

TEST(VirtualFileSystemTest, PathsAreSorted) {
    VirtualFileSystem vfs;
    vfs.setFile("/c.dygram", "");
    vfs.setFile("/a.dygram", "");
    vfs.setFile("/b/x.dygram", "");
    EXPECT_EQ(vfs.getPaths(),
              (std::vector<std::string>{"/a.dygram", "/b/x.dygram", "/c.dygram"}));
}

class VirtualFSResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        VFS = std::make_shared<VirtualFileSystem>();
        VFS->setFile("/app.dygram", "import { A } from \"./lib/base\"");
        VFS->setFile("/lib/base.dygram", "A");
        VFS->setFile("/lib/util.mach", "U");
        Resolver = std::make_unique<VirtualFSResolver>(VFS);
    }

    std::shared_ptr<VirtualFileSystem> VFS;
    std::unique_ptr<VirtualFSResolver> Resolver;
};

TEST_F(VirtualFSResolverTest, ResolvesRelativeToImporter) {
    ModuleId from = ModuleId::forVirtual("/lib/base.dygram");
    ResolveResult result = Resolver->resolve("./util", from).get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->Id.str(), "vfs:///lib/util.mach");
    EXPECT_EQ(*result->Content, "U");
}

TEST_F(VirtualFSResolverTest, UnknownImporterResolvesFromRoot) {
    ResolveResult result = Resolver->resolve("./lib/base", ModuleId()).get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->Id, ModuleId::forVirtual("/lib/base.dygram"));
}

TEST_F(VirtualFSResolverTest, ParentAndAbsoluteImports) {
    ModuleId from = ModuleId::forVirtual("/lib/base.dygram");
    EXPECT_EQ(Resolver->resolve("../app.dygram", from).get()->Id,
              ModuleId::forVirtual("/app.dygram"));
    EXPECT_EQ(Resolver->resolve("/lib/base.dygram", from).get()->Id,
              ModuleId::forVirtual("/lib/base.dygram"));
}

TEST_F(VirtualFSResolverTest, OnlyAcceptsVirtualImporters) {
    EXPECT_TRUE(Resolver->canResolve("./x", ModuleId::forVirtual("/app.dygram")));
    EXPECT_TRUE(Resolver->canResolve("./x", ModuleId()));
    EXPECT_FALSE(Resolver->canResolve("./x", ModuleId::forFile("/app.dygram")));
    EXPECT_FALSE(Resolver->canResolve("https://example.com/x", ModuleId()));
}

TEST_F(VirtualFSResolverTest, MissingIsNotFound) {
    EXPECT_FALSE(Resolver->resolve("./missing", ModuleId()).get().has_value());
}

TEST_F(VirtualFSResolverTest, SeesLaterWrites) {
    VFS->setFile("/late.dygram", "L");
    EXPECT_TRUE(Resolver->resolve("./late", ModuleId()).get().has_value());
}

// ============================================================================
// URLResolver
// ============================================================================

/// 记录请求次数的假传输
class FakeTransport {
public:
    void setResponse(const std::string& url, long status, const std::string& body) {
        HTTPResponse response;
        response.TransportOk = true;
        response.Status = status;
        response.Body = body;
        Responses[url] = response;
    }

    HTTPTransport get() {
        return [this](const std::string& url) {
            ++Requests;
            auto it = Responses.find(url);
            if (it == Responses.end()) {
                HTTPResponse failure;
                failure.Error = "could not connect";
                return failure;
            }
            return it->second;
        };
    }

    std::atomic<int> Requests{0};

private:
    std::map<std::string, HTTPResponse> Responses;
};

TEST(URLResolverTest, ResolveURL) {
    ModuleId from = ModuleId::forURL("https://example.com/lib/base.dygram");
    EXPECT_EQ(URLResolver::resolveURL("https://x.org/a.dygram", ModuleId()),
              "https://x.org/a.dygram");
    EXPECT_EQ(URLResolver::resolveURL("./other.dygram", from),
              "https://example.com/lib/other.dygram");
    EXPECT_EQ(URLResolver::resolveURL("../top.dygram", from),
              "https://example.com/top.dygram");
    EXPECT_EQ(URLResolver::resolveURL("/abs.dygram", from),
              "https://example.com/abs.dygram");
    EXPECT_EQ(URLResolver::resolveURL("./other.dygram", ModuleId::forVirtual("/a")), "");
}

TEST(URLResolverTest, CanResolve) {
    FakeTransport fake;
    URLResolver resolver(fake.get());
    ModuleId remote = ModuleId::forURL("https://example.com/lib/base.dygram");

    EXPECT_TRUE(resolver.canResolve("https://example.com/a.dygram", ModuleId()));
    EXPECT_TRUE(resolver.canResolve("./other.dygram", remote));
    EXPECT_FALSE(resolver.canResolve("./other.dygram", ModuleId::forFile("/a.dygram")));
}

TEST(URLResolverTest, FetchesAndCaches) {
    FakeTransport fake;
    fake.setResponse("https://example.com/lib.dygram", 200, "Start\n");
    URLResolver resolver(fake.get());

    ResolveResult first = resolver.resolve("https://example.com/lib.dygram", ModuleId()).get();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->Id.isURL());
    EXPECT_EQ(*first->Content, "Start\n");
    EXPECT_EQ(resolver.getCache()->size(), 1u);

    ResolveResult second = resolver.resolve("https://example.com/lib.dygram", ModuleId()).get();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(fake.Requests.load(), 1);
}

TEST(URLResolverTest, ClearCacheRefetches) {
    FakeTransport fake;
    fake.setResponse("https://example.com/lib.dygram", 200, "Start\n");
    URLResolver resolver(fake.get());

    resolver.resolve("https://example.com/lib.dygram", ModuleId()).get();
    resolver.clearCache(std::string("https://example.com/lib.dygram"));
    EXPECT_EQ(resolver.getCache()->size(), 0u);
    resolver.resolve("https://example.com/lib.dygram", ModuleId()).get();
    EXPECT_EQ(fake.Requests.load(), 2);

    resolver.clearCache();
    EXPECT_EQ(resolver.getCache()->size(), 0u);
}

TEST(URLResolverTest, HTTPErrorReportsToHandler) {
    FakeTransport fake;
    fake.setResponse("https://example.com/gone.dygram", 404, "");
    URLResolver resolver(fake.get());

    std::vector<ImportError> errors;
    std::mutex errorsMutex;
    resolver.setErrorHandler([&](const ImportError& error) {
        std::lock_guard<std::mutex> lock(errorsMutex);
        errors.push_back(error);
    });

    ModuleId app = ModuleId::forURL("https://example.com/app.dygram");
    ResolveResult result = resolver.resolve("./gone.dygram", app).get();
    EXPECT_FALSE(result.has_value());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].getKind(), ImportError::Kind::URLImport);
    EXPECT_EQ(errors[0].getImportPath(), "https://example.com/gone.dygram");
    ASSERT_TRUE(errors[0].getFromModule().has_value());
    EXPECT_EQ(*errors[0].getFromModule(), app);
    ASSERT_TRUE(errors[0].getHTTPStatus().has_value());
    EXPECT_EQ(*errors[0].getHTTPStatus(), 404);
    EXPECT_EQ(resolver.getCache()->size(), 0u);
}

TEST(URLResolverTest, TransportFailureHasNoStatus) {
    FakeTransport fake;
    URLResolver resolver(fake.get());

    std::vector<ImportError> errors;
    resolver.setErrorHandler([&](const ImportError& error) { errors.push_back(error); });

    EXPECT_FALSE(resolver.resolve("https://down.example.com/a.dygram", ModuleId())
                     .get().has_value());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_FALSE(errors[0].getHTTPStatus().has_value());
    EXPECT_EQ(errors[0].getDetail(), "could not connect");
    EXPECT_FALSE(errors[0].getFromModule().has_value());
}

TEST(URLResolverTest, FailuresAreNotRetriedAutomatically) {
    FakeTransport fake;
    URLResolver resolver(fake.get());
    resolver.resolve("https://down.example.com/a.dygram", ModuleId()).get();
    EXPECT_EQ(fake.Requests.load(), 1);
}

TEST(URLResolverTest, SharedCacheAcrossResolvers) {
    FakeTransport fake;
    fake.setResponse("https://example.com/lib.dygram", 200, "A");
    auto cache = std::make_shared<URLModuleCache>();
    URLResolver first(fake.get(), cache);
    URLResolver second(fake.get(), cache);

    first.resolve("https://example.com/lib.dygram", ModuleId()).get();
    second.resolve("https://example.com/lib.dygram", ModuleId()).get();
    EXPECT_EQ(fake.Requests.load(), 1);
}

// ============================================================================
// CompositeModuleResolver
// ============================================================================

TEST(CompositeModuleResolverTest, FirstMatchingResolverWins) {
    auto vfsA = std::make_shared<VirtualFileSystem>();
    auto vfsB = std::make_shared<VirtualFileSystem>();
    vfsA->setFile("/a.dygram", "from A");
    vfsB->setFile("/a.dygram", "from B");
    vfsB->setFile("/b.dygram", "only B");

    CompositeModuleResolver composite;
    composite.addResolver(std::make_shared<VirtualFSResolver>(vfsA));
    composite.addResolver(std::make_shared<VirtualFSResolver>(vfsB));

    EXPECT_EQ(*composite.resolve("./a.dygram", ModuleId()).get()->Content, "from A");
    // A 能处理但找不到，交给 B
    EXPECT_EQ(*composite.resolve("./b.dygram", ModuleId()).get()->Content, "only B");
    EXPECT_FALSE(composite.resolve("./c.dygram", ModuleId()).get().has_value());
}

TEST(CompositeModuleResolverTest, DispatchesByImporterKind) {
    FakeTransport fake;
    fake.setResponse("https://example.com/lib/other.dygram", 200, "remote");
    auto vfs = std::make_shared<VirtualFileSystem>();
    vfs->setFile("/lib/other.dygram", "virtual");

    CompositeModuleResolver composite;
    composite.addResolver(std::make_shared<FileSystemResolver>());
    composite.addResolver(std::make_shared<URLResolver>(fake.get()));
    composite.addResolver(std::make_shared<VirtualFSResolver>(vfs));

    ModuleId remote = ModuleId::forURL("https://example.com/lib/base.dygram");
    ModuleId virt = ModuleId::forVirtual("/lib/base.dygram");

    EXPECT_EQ(*composite.resolve("./other.dygram", remote).get()->Content, "remote");
    EXPECT_EQ(*composite.resolve("./other.dygram", virt).get()->Content, "virtual");
    EXPECT_TRUE(composite.canResolve("https://example.com/x", virt));
    EXPECT_FALSE(composite.canResolve("bare/path", virt));
}

TEST(CompositeModuleResolverTest, EmptyCompositeResolvesNothing) {
    CompositeModuleResolver composite;
    EXPECT_FALSE(composite.canResolve("./a.dygram", ModuleId()));
    EXPECT_FALSE(composite.resolve("./a.dygram", ModuleId()).get().has_value());
}

TEST(CompositeModuleResolverTest, DefaultResolverComposition) {
    ResolverOptions options;
    options.AllowRemote = false;
    EXPECT_EQ(createDefaultResolver(options)->getResolvers().size(), 1u);

    options.AllowRemote = true;
    options.VirtualFS = std::make_shared<VirtualFileSystem>();
    auto composite = createDefaultResolver(options);
    ASSERT_EQ(composite->getResolvers().size(), 3u);
    EXPECT_TRUE(std::holds_alternative<std::shared_ptr<FileSystemResolver>>(
        composite->getResolvers()[0]));
    EXPECT_TRUE(std::holds_alternative<std::shared_ptr<URLResolver>>(
        composite->getResolvers()[1]));
    EXPECT_TRUE(std::holds_alternative<std::shared_ptr<VirtualFSResolver>>(
        composite->getResolvers()[2]));
}

TEST(CompositeModuleResolverTest, DefaultExtensions) {
    EXPECT_EQ(getDefaultExtensions(), (std::vector<std::string>{".dygram", ".mach"}));
}

} // namespace
} // namespace machlink

/// \file VersionTest.cpp
/// \brief Unit tests for version information.

#include "machlink/Basic/Version.h"
#include <gtest/gtest.h>
#include <sstream>

namespace machlink {
namespace {

TEST(VersionTest, VersionStringMatchesComponents) {
    std::string expected = std::to_string(VersionInfo::getMajor()) + "." +
                           std::to_string(VersionInfo::getMinor()) + "." +
                           std::to_string(VersionInfo::getPatch());
    EXPECT_EQ(VersionInfo::getVersionString(), expected);
}

TEST(VersionTest, FullVersionStringNamesTool) {
    std::string full = VersionInfo::getFullVersionString();
    EXPECT_EQ(full.rfind("machlink version ", 0), 0u);
    EXPECT_NE(full.find(VersionInfo::getVersionString()), std::string::npos);
}

TEST(VersionTest, PrintVersion) {
    std::ostringstream oss;
    VersionInfo::printVersion(oss);

    std::string output = oss.str();
    EXPECT_NE(output.find("machlink version"), std::string::npos);
    EXPECT_NE(output.find("Build time"), std::string::npos);
    EXPECT_NE(output.find("LLVM version"), std::string::npos);
}

TEST(VersionTest, TransportVersionIsReported) {
    EXPECT_FALSE(VersionInfo::getCurlVersion().empty());
}

} // namespace
} // namespace machlink

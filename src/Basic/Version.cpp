/// \file Version.cpp
/// \brief Implementation of version information utilities.

#include "machlink/Basic/Version.h"
#include "machlink/Basic/Version.gen.h"
#include <curl/curl.h>

namespace machlink {

std::string VersionInfo::getVersionString() {
    return MACHLINK_VERSION_STRING;
}

unsigned VersionInfo::getMajor() {
    return MACHLINK_VERSION_MAJOR;
}

unsigned VersionInfo::getMinor() {
    return MACHLINK_VERSION_MINOR;
}

unsigned VersionInfo::getPatch() {
    return MACHLINK_VERSION_PATCH;
}

std::string VersionInfo::getGitHash() {
    return MACHLINK_GIT_HASH;
}

std::string VersionInfo::getBuildTime() {
    return MACHLINK_BUILD_TIME;
}

std::string VersionInfo::getLLVMVersion() {
    return MACHLINK_LLVM_VERSION;
}

std::string VersionInfo::getCurlVersion() {
    const char* version = curl_version();
    return version ? version : "unknown";
}

std::string VersionInfo::getFullVersionString() {
    std::string result = "machlink version ";
    result += getVersionString();

    std::string gitHash = getGitHash();
    if (!gitHash.empty() && gitHash != "unknown") {
        result += " (";
        result += gitHash;
        result += ")";
    }

    return result;
}

void VersionInfo::printVersion(std::ostream& os) {
    os << getFullVersionString() << "\n";
    os << "  Build time: " << getBuildTime() << "\n";
    os << "  LLVM version: " << getLLVMVersion() << "\n";
    os << "  Transport: " << getCurlVersion() << "\n";
}

} // namespace machlink

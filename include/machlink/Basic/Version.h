/// \file Version.h
/// \brief machlink version information.
///
/// This file provides access to version information about the machlink
/// tool, including version numbers, Git commit hash, build time, and the
/// LLVM and libcurl versions it was built against.

#ifndef MACHLINK_BASIC_VERSION_H
#define MACHLINK_BASIC_VERSION_H

#include <ostream>
#include <string>

namespace machlink {

/// \brief Provides version information about the machlink build.
class VersionInfo {
public:
    /// \brief Get the version string (e.g., "0.3.0").
    static std::string getVersionString();

    static unsigned getMajor();
    static unsigned getMinor();
    static unsigned getPatch();

    /// \brief Get the Git commit hash (short form).
    /// \return The short Git hash, or "unknown" if not available.
    static std::string getGitHash();

    /// \brief Get the build timestamp.
    /// \return The build time in "YYYY-MM-DD HH:MM:SS UTC" format.
    static std::string getBuildTime();

    /// \brief Get the LLVM version the support library was taken from.
    static std::string getLLVMVersion();

    /// \brief Get the libcurl version used by the URL transport.
    static std::string getCurlVersion();

    /// \brief Get the full version string with Git hash.
    /// \return A string like "machlink version 0.3.0 (abc1234)".
    static std::string getFullVersionString();

    /// \brief Print version information to an output stream.
    static void printVersion(std::ostream& os);
};

} // namespace machlink

#endif // MACHLINK_BASIC_VERSION_H

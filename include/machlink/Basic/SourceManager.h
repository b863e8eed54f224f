/// \file SourceManager.h
/// \brief Ownership of module source buffers.

#ifndef MACHLINK_BASIC_SOURCEMANAGER_H
#define MACHLINK_BASIC_SOURCEMANAGER_H

#include "machlink/Basic/SourceLocation.h"
#include <string>
#include <utility>
#include <vector>

namespace machlink {

/// \brief Manages source buffers and provides location services.
///
/// Every module loaded into a workspace gets its own buffer, named after the
/// module location. Buffers are never released: replacing a module creates a
/// new buffer so locations held by old diagnostics stay printable.
class SourceManager {
public:
    /// \brief File identifier type.
    using FileID = uint32_t;

    /// \brief Invalid file ID constant.
    static constexpr FileID InvalidFileID = 0;

    SourceManager() = default;

    /// \brief Load a source file from disk.
    /// \return The FileID for the loaded file, or InvalidFileID on error.
    FileID loadFile(const std::string& path);

    /// \brief Create a buffer from a string.
    /// \param content The content of the buffer.
    /// \param name The name to associate with the buffer (module location).
    FileID createBuffer(const std::string& content,
                        const std::string& name = "<buffer>");

    /// \brief Get the content of a buffer, or an empty string if invalid.
    const std::string& getBufferData(FileID fid) const;

    /// \brief Get the name of a buffer, or an empty string if invalid.
    const std::string& getFilename(FileID fid) const;

    /// \brief Convert a source location to 1-based (line, column).
    std::pair<unsigned, unsigned> getLineAndColumn(SourceLocation loc) const;

    /// \brief Get the text of the line containing \p loc, without newline.
    std::string getLineContent(SourceLocation loc) const;

    /// \brief Get the FileID for a source location.
    FileID getFileID(SourceLocation loc) const;

    /// \brief Create a SourceLocation for a position in a buffer.
    SourceLocation getLocation(FileID fid, uint32_t offset) const;

    /// \brief Number of buffers created so far.
    size_t getNumBuffers() const { return Files.size(); }

private:
    struct FileInfo {
        std::string Filename;
        std::string Content;
        std::vector<uint32_t> LineOffsets;  // Offset of each line start after the first
        uint32_t StartOffset = 0;           // Global offset where this buffer starts
    };

    std::vector<FileInfo> Files;
    uint32_t NextOffset = 1;  // 0 is reserved for invalid location

    static const std::string EmptyString;

    const FileInfo* getInfo(FileID fid) const;
    unsigned getLineIndex(const FileInfo& info, uint32_t localOffset) const;
    void computeLineOffsets(FileInfo& info);
};

} // namespace machlink

#endif // MACHLINK_BASIC_SOURCEMANAGER_H

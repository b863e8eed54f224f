/// \file SourceManager.cpp
/// \brief Implementation of source buffer management.

#include "machlink/Basic/SourceManager.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace machlink {

const std::string SourceManager::EmptyString;

SourceManager::FileID SourceManager::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return InvalidFileID;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return createBuffer(oss.str(), path);
}

SourceManager::FileID SourceManager::createBuffer(const std::string& content,
                                                  const std::string& name) {
    FileInfo info;
    info.Filename = name;
    info.Content = content;
    info.StartOffset = NextOffset;
    computeLineOffsets(info);

    // +1 leaves room for the EOF position of this buffer.
    NextOffset += static_cast<uint32_t>(content.size()) + 1;

    Files.push_back(std::move(info));
    return static_cast<FileID>(Files.size());
}

const SourceManager::FileInfo* SourceManager::getInfo(FileID fid) const {
    if (fid == InvalidFileID || fid > Files.size()) {
        return nullptr;
    }
    return &Files[fid - 1];
}

const std::string& SourceManager::getBufferData(FileID fid) const {
    const FileInfo* info = getInfo(fid);
    return info ? info->Content : EmptyString;
}

const std::string& SourceManager::getFilename(FileID fid) const {
    const FileInfo* info = getInfo(fid);
    return info ? info->Filename : EmptyString;
}

unsigned SourceManager::getLineIndex(const FileInfo& info, uint32_t localOffset) const {
    // LineOffsets[i] is the start of line i + 2.
    auto it = std::upper_bound(info.LineOffsets.begin(), info.LineOffsets.end(),
                               localOffset);
    return static_cast<unsigned>(it - info.LineOffsets.begin());
}

std::pair<unsigned, unsigned> SourceManager::getLineAndColumn(SourceLocation loc) const {
    const FileInfo* info = getInfo(getFileID(loc));
    if (!info) {
        return {0, 0};
    }

    uint32_t localOffset = loc.getOffset() - info->StartOffset;
    unsigned lineIndex = getLineIndex(*info, localOffset);
    uint32_t lineStart = lineIndex == 0 ? 0 : info->LineOffsets[lineIndex - 1];
    return {lineIndex + 1, localOffset - lineStart + 1};
}

std::string SourceManager::getLineContent(SourceLocation loc) const {
    const FileInfo* info = getInfo(getFileID(loc));
    if (!info) {
        return "";
    }

    uint32_t localOffset = loc.getOffset() - info->StartOffset;
    unsigned lineIndex = getLineIndex(*info, localOffset);
    uint32_t lineStart = lineIndex == 0 ? 0 : info->LineOffsets[lineIndex - 1];
    uint32_t lineEnd = lineIndex < info->LineOffsets.size()
        ? info->LineOffsets[lineIndex]
        : static_cast<uint32_t>(info->Content.size());

    std::string line = info->Content.substr(lineStart, lineEnd - lineStart);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

SourceManager::FileID SourceManager::getFileID(SourceLocation loc) const {
    if (loc.isInvalid() || Files.empty()) {
        return InvalidFileID;
    }

    // Buffers are laid out in increasing StartOffset order.
    uint32_t offset = loc.getOffset();
    auto it = std::upper_bound(Files.begin(), Files.end(), offset,
                               [](uint32_t value, const FileInfo& info) {
                                   return value < info.StartOffset;
                               });
    if (it == Files.begin()) {
        return InvalidFileID;
    }
    --it;

    uint32_t fileEnd = it->StartOffset + static_cast<uint32_t>(it->Content.size());
    if (offset > fileEnd) {
        return InvalidFileID;
    }
    return static_cast<FileID>(it - Files.begin()) + 1;
}

SourceLocation SourceManager::getLocation(FileID fid, uint32_t offset) const {
    const FileInfo* info = getInfo(fid);
    if (!info || offset > info->Content.size()) {
        return SourceLocation();
    }
    return SourceLocation(info->StartOffset + offset);
}

void SourceManager::computeLineOffsets(FileInfo& info) {
    info.LineOffsets.clear();

    const std::string& content = info.Content;
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            info.LineOffsets.push_back(static_cast<uint32_t>(i + 1));
        } else if (content[i] == '\r') {
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            info.LineOffsets.push_back(static_cast<uint32_t>(i + 1));
        }
    }
}

} // namespace machlink

/// \file TextDiagnosticPrinter.cpp
/// \brief Implementation of text-based diagnostic printer.

#include "machlink/Basic/TextDiagnosticPrinter.h"
#include "machlink/Basic/SourceManager.h"
#include <algorithm>
#include <iomanip>

namespace machlink {

// ANSI color codes
namespace colors {
    const char* Reset = "\033[0m";
    const char* Bold = "\033[1m";
    const char* BoldRed = "\033[1;31m";
    const char* BoldGreen = "\033[1;32m";
    const char* BoldYellow = "\033[1;33m";
    const char* BoldCyan = "\033[1;36m";
}

TextDiagnosticPrinter::TextDiagnosticPrinter(std::ostream& os, SourceManager& sm,
                                             bool useColors)
    : OS(os), SM(sm), UseColors(useColors) {}

void TextDiagnosticPrinter::handleDiagnostic(const Diagnostic& diag) {
    printLocation(diag.getLocation());
    printLevel(diag.getLevel());

    if (ShowErrorCodes) {
        setColor(colors::Bold);
        OS << "[" << diag.getCode() << "]";
        resetColor();
    }
    OS << ": ";

    setColor(colors::Bold);
    OS << diag.getMessage();
    resetColor();
    OS << "\n";

    if (ShowSourceLine && diag.getLocation().isValid()) {
        printSourceLine(diag.getLocation(), diag.getRanges());
    }
}

void TextDiagnosticPrinter::printLocation(SourceLocation loc) {
    auto fileID = loc.isValid() ? SM.getFileID(loc) : SourceManager::InvalidFileID;
    setColor(colors::Bold);
    if (fileID == SourceManager::InvalidFileID) {
        OS << "machlink: ";
    } else {
        auto [line, column] = SM.getLineAndColumn(loc);
        OS << SM.getFilename(fileID) << ":" << line << ":" << column << ": ";
    }
    resetColor();
}

void TextDiagnosticPrinter::printLevel(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Note:
            setColor(colors::BoldCyan);
            OS << "note";
            break;
        case DiagnosticLevel::Warning:
            setColor(colors::BoldYellow);
            OS << "warning";
            break;
        case DiagnosticLevel::Error:
            setColor(colors::BoldRed);
            OS << "error";
            break;
        case DiagnosticLevel::Fatal:
            setColor(colors::BoldRed);
            OS << "fatal error";
            break;
    }
    resetColor();
}

void TextDiagnosticPrinter::printSourceLine(SourceLocation loc,
                                            const std::vector<SourceRange>& ranges) {
    std::string line = SM.getLineContent(loc);
    if (line.empty()) {
        return;
    }

    auto [lineNum, column] = SM.getLineAndColumn(loc);
    std::string expandedLine = expandTabs(line);
    OS << std::setw(5) << lineNum << " | " << expandedLine << "\n";

    unsigned caretCol = toDisplayColumn(line, column);
    unsigned rangeBegin = caretCol;
    unsigned rangeEnd = caretCol + 1;

    // Only single-line ranges on the caret line are underlined.
    for (const auto& range : ranges) {
        if (!range.isValid()) {
            continue;
        }
        auto [beginLine, beginCol] = SM.getLineAndColumn(range.getBegin());
        auto [endLine, endCol] = SM.getLineAndColumn(range.getEnd());
        if (beginLine != lineNum || endLine != lineNum) {
            continue;
        }
        unsigned maxDisplay = static_cast<unsigned>(expandedLine.size());
        rangeBegin = std::min(toDisplayColumn(line, beginCol), maxDisplay);
        rangeEnd = std::min(toDisplayColumn(line, endCol), maxDisplay);
        if (rangeEnd <= rangeBegin) {
            rangeEnd = rangeBegin + 1;
        }
        if (caretCol < rangeBegin || caretCol >= rangeEnd) {
            caretCol = rangeBegin;
        }
        break;
    }

    OS << "      | ";
    setColor(colors::BoldGreen);
    OS << std::string(rangeBegin, ' ');
    for (unsigned i = rangeBegin; i < rangeEnd; ++i) {
        OS << (i == caretCol ? '^' : '~');
    }
    resetColor();
    OS << "\n";
}

void TextDiagnosticPrinter::setColor(const char* color) {
    if (UseColors) {
        OS << color;
    }
}

void TextDiagnosticPrinter::resetColor() {
    if (UseColors) {
        OS << colors::Reset;
    }
}

std::string TextDiagnosticPrinter::expandTabs(const std::string& str) const {
    std::string result;
    unsigned col = 0;

    for (char c : str) {
        if (c == '\t') {
            unsigned spaces = 4 - (col % 4);
            result.append(spaces, ' ');
            col += spaces;
        } else {
            result += c;
            ++col;
        }
    }

    return result;
}

unsigned TextDiagnosticPrinter::toDisplayColumn(const std::string& line,
                                                unsigned column) const {
    unsigned display = 0;
    for (unsigned i = 0; i + 1 < column && i < line.size(); ++i) {
        if (line[i] == '\t') {
            display = ((display / 4) + 1) * 4;
        } else {
            ++display;
        }
    }
    return display;
}

} // namespace machlink

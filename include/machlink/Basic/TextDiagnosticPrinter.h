/// \file TextDiagnosticPrinter.h
/// \brief Text-based diagnostic printer with Clang-style output.

#ifndef MACHLINK_BASIC_TEXTDIAGNOSTICPRINTER_H
#define MACHLINK_BASIC_TEXTDIAGNOSTICPRINTER_H

#include "machlink/Basic/Diagnostic.h"
#include <ostream>

namespace machlink {

class SourceManager;

/// \brief Text-based diagnostic printer (Clang-style output).
///
/// Example output:
/// \code
/// /work/app.dygram:1:10: error[E3008]: Symbol "Start" is imported from both "./a.dygram" and "./b.dygram"
///     1 | import { Start } from "./b.dygram"
///       |          ^~~~~
/// \endcode
///
/// Diagnostics without a location (resolution failures of a module that was
/// never loaded, for instance) print as "machlink: ".
class TextDiagnosticPrinter : public DiagnosticConsumer {
public:
    TextDiagnosticPrinter(std::ostream& os, SourceManager& sm,
                          bool useColors = true);

    void handleDiagnostic(const Diagnostic& diag) override;

    void setUseColors(bool value) { UseColors = value; }
    bool getUseColors() const { return UseColors; }

    void setShowErrorCodes(bool value) { ShowErrorCodes = value; }
    bool getShowErrorCodes() const { return ShowErrorCodes; }

    void setShowSourceLine(bool value) { ShowSourceLine = value; }
    bool getShowSourceLine() const { return ShowSourceLine; }

private:
    std::ostream& OS;
    SourceManager& SM;
    bool UseColors;
    bool ShowErrorCodes = true;
    bool ShowSourceLine = true;

    void printLocation(SourceLocation loc);
    void printLevel(DiagnosticLevel level);
    void printSourceLine(SourceLocation loc, const std::vector<SourceRange>& ranges);

    void setColor(const char* color);
    void resetColor();

    /// \brief Expand tabs to 4-column stops.
    std::string expandTabs(const std::string& str) const;

    /// \brief Display column (0-based) of 1-based \p column in \p line.
    unsigned toDisplayColumn(const std::string& line, unsigned column) const;
};

} // namespace machlink

#endif // MACHLINK_BASIC_TEXTDIAGNOSTICPRINTER_H

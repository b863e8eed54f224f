/// \file SourceLocation.h
/// \brief Source code location tracking.
///
/// Locations are global offsets handed out by the SourceManager; every loaded
/// module buffer occupies its own offset window.

#ifndef MACHLINK_BASIC_SOURCELOCATION_H
#define MACHLINK_BASIC_SOURCELOCATION_H

#include <cstdint>

namespace machlink {

/// \brief A position inside one of the buffers owned by the SourceManager.
///
/// Offset 0 is reserved as the invalid location, so default-constructed
/// locations can be used for diagnostics that have no position (for example
/// a module that could not be resolved at all).
class SourceLocation {
public:
    SourceLocation() = default;

    explicit SourceLocation(uint32_t offset) : Offset(offset) {}

    bool isValid() const { return Offset != 0; }
    bool isInvalid() const { return Offset == 0; }

    uint32_t getOffset() const { return Offset; }

    /// \brief Return the location \p delta characters further on.
    SourceLocation getLocWithOffset(uint32_t delta) const {
        return isValid() ? SourceLocation(Offset + delta) : SourceLocation();
    }

    bool operator==(const SourceLocation& other) const { return Offset == other.Offset; }
    bool operator!=(const SourceLocation& other) const { return Offset != other.Offset; }
    bool operator<(const SourceLocation& other) const { return Offset < other.Offset; }

private:
    uint32_t Offset = 0;
};

/// \brief A half-open range [Begin, End) of source text.
class SourceRange {
public:
    SourceRange() = default;

    SourceRange(SourceLocation begin, SourceLocation end)
        : Begin(begin), End(end) {}

    explicit SourceRange(SourceLocation loc) : Begin(loc), End(loc) {}

    SourceLocation getBegin() const { return Begin; }
    SourceLocation getEnd() const { return End; }

    void setEnd(SourceLocation end) { End = end; }

    bool isValid() const { return Begin.isValid() && End.isValid(); }

    bool operator==(const SourceRange& other) const {
        return Begin == other.Begin && End == other.End;
    }
    bool operator!=(const SourceRange& other) const { return !(*this == other); }

private:
    SourceLocation Begin;
    SourceLocation End;
};

} // namespace machlink

#endif // MACHLINK_BASIC_SOURCELOCATION_H

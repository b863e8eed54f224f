/// \file DiagnosticIDs.h
/// \brief Diagnostic ID definitions for machlink.
///
/// This file defines all diagnostic IDs used by the front end and the
/// import/linking engine, organized by category.

#ifndef MACHLINK_BASIC_DIAGNOSTICIDS_H
#define MACHLINK_BASIC_DIAGNOSTICIDS_H

#include <cstdint>
#include <string>

namespace machlink {

/// \brief Diagnostic severity levels.
enum class DiagnosticLevel {
    Note,       ///< Informational note
    Warning,    ///< Warning (processing continues)
    Error,      ///< Error (processing continues, result is rejected)
    Fatal       ///< Fatal error (processing stops immediately)
};

/// \brief Diagnostic message IDs.
///
/// The ID ranges are organized as follows:
/// - 1xxx: Lexer errors
/// - 2xxx: Parser errors
/// - 3xxx: Import, linking and merge errors
/// - 4xxx: Warnings
/// - 5xxx: Notes
enum class DiagID : uint16_t {
    // =========================================================================
    // Lexer errors (1xxx)
    // =========================================================================

    /// Invalid character encountered in source
    err_invalid_character = 1001,

    /// Unterminated string literal
    err_unterminated_string = 1002,

    /// Invalid escape sequence in string literal
    err_invalid_escape_sequence = 1003,

    /// Unterminated block comment
    err_unterminated_block_comment = 1004,

    // =========================================================================
    // Parser errors (2xxx)
    // =========================================================================

    /// Expected a specific token
    err_expected_token = 2001,

    /// Expected an identifier
    err_expected_identifier = 2002,

    /// Expected a string literal
    err_expected_string = 2003,

    /// Unexpected token at top level
    err_unexpected_token = 2004,

    /// Unbalanced braces in a node body
    err_expected_rbrace = 2005,

    /// More than one machine title
    err_duplicate_machine_title = 2006,

    /// Import statement after the first definition
    err_import_after_definition = 2007,

    // =========================================================================
    // Import / link errors (3xxx)
    // =========================================================================

    /// Import path is empty
    err_empty_import_path = 3001,

    /// Import without any symbols
    err_empty_import_symbols = 3002,

    /// Imported symbol name is empty
    err_empty_symbol_name = 3003,

    /// Alias given but empty
    err_empty_alias = 3004,

    /// No resolver could locate the module
    err_module_not_found = 3005,

    /// Dependency cycle between modules
    err_circular_dependency = 3006,

    /// Module resolved but symbol missing
    err_symbol_not_found = 3007,

    /// Same effective name imported twice
    err_symbol_collision = 3008,

    /// Imported effective name shadows a local definition
    err_import_collides_with_local = 3009,

    /// Resolved content could not be parsed
    err_module_parse = 3010,

    /// Network fetch failed
    err_url_import = 3011,

    /// Short name matches several definitions
    err_ambiguous_import = 3012,

    /// Reference neither local nor imported
    err_unresolved_reference = 3013,

    /// Merge entry point is not loaded
    err_entry_not_loaded = 3014,

    /// Content loader failed
    err_cannot_load_module = 3015,

    // =========================================================================
    // Warnings (4xxx)
    // =========================================================================

    /// Plain http:// import
    warn_insecure_http_import = 4001,

    /// Bare absolute path import
    warn_absolute_import_path = 4002,

    // =========================================================================
    // Notes (5xxx)
    // =========================================================================

    /// Note: imported here
    note_imported_here = 5001,

    /// Note: previous import here
    note_previous_import = 5002,

    /// Note: local definition here
    note_local_definition = 5003,
};

/// \brief Get the diagnostic level for a given diagnostic ID.
DiagnosticLevel getDiagnosticLevel(DiagID id);

/// \brief Get the format string for a diagnostic ID.
/// \return The format string with placeholders like {0}, {1}, etc.
const char* getDiagnosticFormatString(DiagID id);

/// \brief Get the code string for a diagnostic ID (e.g., "E3005").
std::string getDiagnosticCode(DiagID id);

/// \brief Check if a diagnostic ID represents an error.
inline bool isError(DiagID id) {
    auto level = getDiagnosticLevel(id);
    return level == DiagnosticLevel::Error || level == DiagnosticLevel::Fatal;
}

/// \brief Check if a diagnostic ID represents a warning.
inline bool isWarning(DiagID id) {
    return getDiagnosticLevel(id) == DiagnosticLevel::Warning;
}

/// \brief Check if a diagnostic ID represents a note.
inline bool isNote(DiagID id) {
    return getDiagnosticLevel(id) == DiagnosticLevel::Note;
}

} // namespace machlink

#endif // MACHLINK_BASIC_DIAGNOSTICIDS_H

/// \file DiagnosticIDs.cpp
/// \brief Implementation of diagnostic ID utilities.

#include "machlink/Basic/DiagnosticIDs.h"
#include <iomanip>
#include <sstream>

namespace machlink {

DiagnosticLevel getDiagnosticLevel(DiagID id) {
    uint16_t code = static_cast<uint16_t>(id);

    if (code >= 1000 && code < 4000) {
        return DiagnosticLevel::Error;
    } else if (code >= 4000 && code < 5000) {
        return DiagnosticLevel::Warning;
    } else if (code >= 5000 && code < 6000) {
        return DiagnosticLevel::Note;
    }

    return DiagnosticLevel::Error;
}

const char* getDiagnosticFormatString(DiagID id) {
    switch (id) {
        // Lexer errors
        case DiagID::err_invalid_character:
            return "invalid character '{0}'";
        case DiagID::err_unterminated_string:
            return "unterminated string literal";
        case DiagID::err_invalid_escape_sequence:
            return "invalid escape sequence '\\{0}'";
        case DiagID::err_unterminated_block_comment:
            return "unterminated block comment";

        // Parser errors
        case DiagID::err_expected_token:
            return "expected '{0}', found '{1}'";
        case DiagID::err_expected_identifier:
            return "expected identifier, found '{0}'";
        case DiagID::err_expected_string:
            return "expected string literal, found '{0}'";
        case DiagID::err_unexpected_token:
            return "unexpected token '{0}'";
        case DiagID::err_expected_rbrace:
            return "expected '}' to close body of '{0}'";
        case DiagID::err_duplicate_machine_title:
            return "machine title already declared as \"{0}\"";
        case DiagID::err_import_after_definition:
            return "import statements must precede all definitions";

        // Import / link errors
        case DiagID::err_empty_import_path:
            return "Import path cannot be empty";
        case DiagID::err_empty_import_symbols:
            return "Import must specify at least one symbol";
        case DiagID::err_empty_symbol_name:
            return "Symbol name cannot be empty";
        case DiagID::err_empty_alias:
            return "Alias cannot be empty";
        case DiagID::err_module_not_found:
            return "Cannot resolve module: \"{0}\"";
        case DiagID::err_circular_dependency:
            return "Circular dependency detected: {0}";
        case DiagID::err_symbol_not_found:
            return "Symbol \"{0}\" not found in module \"{1}\"";
        case DiagID::err_symbol_collision:
            return "Symbol \"{0}\" is imported from both \"{1}\" and \"{2}\"";
        case DiagID::err_import_collides_with_local:
            return "Imported symbol \"{0}\" collides with local node \"{1}\"";
        case DiagID::err_module_parse:
            return "Failed to parse module \"{0}\": {1}";
        case DiagID::err_url_import:
            return "Failed to fetch module from URL \"{0}\"{1}";
        case DiagID::err_ambiguous_import:
            return "Symbol \"{0}\" is ambiguous in module \"{1}\" (candidates: {2})";
        case DiagID::err_unresolved_reference:
            return "Could not resolve reference to node named '{0}'";
        case DiagID::err_entry_not_loaded:
            return "Entry point not found: {0}";
        case DiagID::err_cannot_load_module:
            return "cannot load module '{0}': {1}";

        // Warnings
        case DiagID::warn_insecure_http_import:
            return "HTTP imports are insecure. Consider using HTTPS.";
        case DiagID::warn_absolute_import_path:
            return "Absolute paths may not be portable. Consider using relative paths.";

        // Notes
        case DiagID::note_imported_here:
            return "\"{0}\" imported here";
        case DiagID::note_previous_import:
            return "previous import of \"{0}\" is here";
        case DiagID::note_local_definition:
            return "local definition \"{0}\" is here";
    }

    return "unknown diagnostic";
}

std::string getDiagnosticCode(DiagID id) {
    std::ostringstream oss;

    switch (getDiagnosticLevel(id)) {
        case DiagnosticLevel::Error:
        case DiagnosticLevel::Fatal:
            oss << "E";
            break;
        case DiagnosticLevel::Warning:
            oss << "W";
            break;
        case DiagnosticLevel::Note:
            oss << "N";
            break;
    }

    oss << std::setfill('0') << std::setw(4) << static_cast<uint16_t>(id);
    return oss.str();
}

} // namespace machlink

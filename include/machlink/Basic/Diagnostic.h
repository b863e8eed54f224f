/// \file Diagnostic.h
/// \brief Diagnostic system for import, linking and parse messages.
///
/// This file defines the diagnostic infrastructure for reporting errors,
/// warnings, and notes. The design follows Clang's diagnostic system; on top
/// of a source location every diagnostic may name the AST node and the node
/// property it is about, which is what validation consumers key on.

#ifndef MACHLINK_BASIC_DIAGNOSTIC_H
#define MACHLINK_BASIC_DIAGNOSTIC_H

#include "machlink/Basic/DiagnosticIDs.h"
#include "machlink/Basic/SourceLocation.h"
#include <memory>
#include <string>
#include <vector>

namespace machlink {

class SourceManager;
class ASTNode;
class DiagnosticEngine;

/// \brief The AST node (and which of its properties) a diagnostic is about.
struct DiagnosticTarget {
    const ASTNode* Node = nullptr;
    std::string Property;   ///< e.g. "path", "symbols", "alias", "name", "imports"

    bool isValid() const { return Node != nullptr; }
};

/// \brief A single diagnostic message.
class Diagnostic {
public:
    Diagnostic(DiagID id, DiagnosticLevel level, SourceLocation loc);

    DiagID getID() const { return ID; }
    DiagnosticLevel getLevel() const { return Level; }
    SourceLocation getLocation() const { return Loc; }

    /// \brief Add a string argument to the diagnostic.
    Diagnostic& operator<<(const std::string& arg);

    /// \brief Add a C-string argument to the diagnostic.
    Diagnostic& operator<<(const char* arg);

    /// \brief Add an unsigned integer argument to the diagnostic.
    Diagnostic& operator<<(unsigned arg);

    /// \brief Add a size_t argument to the diagnostic.
    Diagnostic& operator<<(size_t arg);

    /// \brief Add a source range for highlighting.
    Diagnostic& operator<<(SourceRange range);

    /// \brief Attach the AST node and property this diagnostic is about.
    void setTarget(DiagnosticTarget target) { Target = std::move(target); }

    const DiagnosticTarget& getTarget() const { return Target; }

    /// \brief Get the formatted message with arguments substituted.
    std::string getMessage() const;

    const std::vector<std::string>& getArgs() const { return Args; }
    const std::vector<SourceRange>& getRanges() const { return Ranges; }

    /// \brief Get the error code string (e.g., "E3005").
    std::string getCode() const { return getDiagnosticCode(ID); }

private:
    DiagID ID;
    DiagnosticLevel Level;
    SourceLocation Loc;
    std::vector<std::string> Args;
    std::vector<SourceRange> Ranges;
    DiagnosticTarget Target;
};

/// \brief A builder for constructing diagnostics with arguments.
///
/// The diagnostic is emitted when the builder is destroyed.
class DiagnosticBuilder {
public:
    DiagnosticBuilder(DiagnosticEngine& engine, DiagID id, SourceLocation loc,
                      DiagnosticLevel level);

    /// \brief Destructor - emits the diagnostic.
    ~DiagnosticBuilder();

    DiagnosticBuilder(DiagnosticBuilder&& other) noexcept;
    DiagnosticBuilder& operator=(DiagnosticBuilder&& other) noexcept;

    DiagnosticBuilder(const DiagnosticBuilder&) = delete;
    DiagnosticBuilder& operator=(const DiagnosticBuilder&) = delete;

    DiagnosticBuilder& operator<<(const std::string& arg);
    DiagnosticBuilder& operator<<(const char* arg);
    DiagnosticBuilder& operator<<(unsigned arg);
    DiagnosticBuilder& operator<<(size_t arg);
    DiagnosticBuilder& operator<<(SourceRange range);

    /// \brief Attach the node/property target.
    DiagnosticBuilder& setTarget(const ASTNode* node, const std::string& property);

    /// \brief Emit the diagnostic immediately.
    void emit();

private:
    DiagnosticEngine* Engine;
    Diagnostic Diag;
    bool Emitted = false;
};

/// \brief Abstract receiver of diagnostics.
class DiagnosticConsumer {
public:
    virtual ~DiagnosticConsumer() = default;

    /// \brief Handle a diagnostic message.
    virtual void handleDiagnostic(const Diagnostic& diag) = 0;

    /// \brief Called when all diagnostics have been emitted.
    virtual void finish() {}
};

/// \brief The main diagnostic engine.
///
/// DiagnosticEngine is the central hub for reporting diagnostics. It manages
/// the diagnostic consumer and tracks error/warning counts.
class DiagnosticEngine {
public:
    explicit DiagnosticEngine(SourceManager& sm);

    /// \brief Report a diagnostic at its default level.
    DiagnosticBuilder report(DiagID id, SourceLocation loc);

    /// \brief Report a diagnostic with an explicit level.
    DiagnosticBuilder report(DiagID id, SourceLocation loc, DiagnosticLevel level);

    /// \brief Report a diagnostic with a source range for highlighting.
    DiagnosticBuilder report(DiagID id, SourceRange range);

    unsigned getErrorCount() const { return ErrorCount; }
    unsigned getWarningCount() const { return WarningCount; }
    bool hasErrors() const { return ErrorCount > 0; }

    void setConsumer(std::unique_ptr<DiagnosticConsumer> consumer);
    DiagnosticConsumer* getConsumer() const { return Consumer.get(); }

    SourceManager& getSourceManager() { return SM; }
    const SourceManager& getSourceManager() const { return SM; }

    /// \brief Reset error and warning counts.
    void reset();

    void setWarningsAsErrors(bool value) { WarningsAsErrors = value; }
    bool getWarningsAsErrors() const { return WarningsAsErrors; }

    /// \brief Set the maximum number of errors forwarded to the consumer.
    void setErrorLimit(unsigned limit) { ErrorLimit = limit; }

    bool hasReachedErrorLimit() const {
        return ErrorLimit > 0 && ErrorCount >= ErrorLimit;
    }

private:
    friend class DiagnosticBuilder;

    SourceManager& SM;
    std::unique_ptr<DiagnosticConsumer> Consumer;
    unsigned ErrorCount = 0;
    unsigned WarningCount = 0;
    bool WarningsAsErrors = false;
    unsigned ErrorLimit = 0;

    DiagnosticLevel adjustLevel(DiagnosticLevel level) const;
    void emitDiagnostic(const Diagnostic& diag);
};

/// \brief A diagnostic consumer that stores diagnostics for later processing.
class StoredDiagnosticConsumer : public DiagnosticConsumer {
public:
    void handleDiagnostic(const Diagnostic& diag) override;

    const std::vector<Diagnostic>& getDiagnostics() const { return Diagnostics; }

    /// \brief Count stored diagnostics with the given ID.
    size_t count(DiagID id) const;

    void clear() { Diagnostics.clear(); }

private:
    std::vector<Diagnostic> Diagnostics;
};

/// \brief A diagnostic consumer that ignores all diagnostics.
class IgnoringDiagnosticConsumer : public DiagnosticConsumer {
public:
    void handleDiagnostic(const Diagnostic& /*diag*/) override {}
};

/// \brief A diagnostic consumer that forwards to multiple consumers.
class MultiplexDiagnosticConsumer : public DiagnosticConsumer {
public:
    void addConsumer(std::unique_ptr<DiagnosticConsumer> consumer);

    void handleDiagnostic(const Diagnostic& diag) override;
    void finish() override;

private:
    std::vector<std::unique_ptr<DiagnosticConsumer>> Consumers;
};

} // namespace machlink

#endif // MACHLINK_BASIC_DIAGNOSTIC_H

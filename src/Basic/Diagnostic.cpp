/// \file Diagnostic.cpp
/// \brief Implementation of the diagnostic system.

#include "machlink/Basic/Diagnostic.h"
#include "machlink/Basic/SourceManager.h"
#include <algorithm>
#include <regex>

namespace machlink {

// ============================================================================
// Diagnostic Implementation
// ============================================================================

Diagnostic::Diagnostic(DiagID id, DiagnosticLevel level, SourceLocation loc)
    : ID(id), Level(level), Loc(loc) {}

Diagnostic& Diagnostic::operator<<(const std::string& arg) {
    Args.push_back(arg);
    return *this;
}

Diagnostic& Diagnostic::operator<<(const char* arg) {
    Args.push_back(arg ? arg : "(null)");
    return *this;
}

Diagnostic& Diagnostic::operator<<(unsigned arg) {
    Args.push_back(std::to_string(arg));
    return *this;
}

Diagnostic& Diagnostic::operator<<(size_t arg) {
    Args.push_back(std::to_string(arg));
    return *this;
}

Diagnostic& Diagnostic::operator<<(SourceRange range) {
    Ranges.push_back(range);
    return *this;
}

std::string Diagnostic::getMessage() const {
    std::string result = getDiagnosticFormatString(ID);

    for (size_t i = 0; i < Args.size(); ++i) {
        std::string placeholder = "{" + std::to_string(i) + "}";
        size_t pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.length(), Args[i]);
            pos += Args[i].length();
        }
    }

    // Missing arguments must not leak "{0}" into user output.
    static const std::regex placeholderPattern("\\{\\d+\\}");
    return std::regex_replace(result, placeholderPattern, "?");
}

// ============================================================================
// DiagnosticBuilder Implementation
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticEngine& engine, DiagID id,
                                     SourceLocation loc, DiagnosticLevel level)
    : Engine(&engine), Diag(id, level, loc) {}

DiagnosticBuilder::~DiagnosticBuilder() {
    if (!Emitted && Engine) {
        emit();
    }
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder&& other) noexcept
    : Engine(other.Engine), Diag(std::move(other.Diag)), Emitted(other.Emitted) {
    other.Engine = nullptr;
    other.Emitted = true;
}

DiagnosticBuilder& DiagnosticBuilder::operator=(DiagnosticBuilder&& other) noexcept {
    if (this != &other) {
        if (!Emitted && Engine) {
            emit();
        }

        Engine = other.Engine;
        Diag = std::move(other.Diag);
        Emitted = other.Emitted;

        other.Engine = nullptr;
        other.Emitted = true;
    }
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::operator<<(const std::string& arg) {
    Diag << arg;
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::operator<<(const char* arg) {
    Diag << arg;
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::operator<<(unsigned arg) {
    Diag << arg;
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::operator<<(size_t arg) {
    Diag << arg;
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::operator<<(SourceRange range) {
    Diag << range;
    return *this;
}

DiagnosticBuilder& DiagnosticBuilder::setTarget(const ASTNode* node,
                                                const std::string& property) {
    Diag.setTarget(DiagnosticTarget{node, property});
    return *this;
}

void DiagnosticBuilder::emit() {
    if (Emitted || !Engine) {
        return;
    }

    Engine->emitDiagnostic(Diag);
    Emitted = true;
}

// ============================================================================
// DiagnosticEngine Implementation
// ============================================================================

DiagnosticEngine::DiagnosticEngine(SourceManager& sm) : SM(sm) {}

DiagnosticLevel DiagnosticEngine::adjustLevel(DiagnosticLevel level) const {
    if (WarningsAsErrors && level == DiagnosticLevel::Warning) {
        return DiagnosticLevel::Error;
    }
    return level;
}

DiagnosticBuilder DiagnosticEngine::report(DiagID id, SourceLocation loc) {
    return report(id, loc, getDiagnosticLevel(id));
}

DiagnosticBuilder DiagnosticEngine::report(DiagID id, SourceLocation loc,
                                           DiagnosticLevel level) {
    level = adjustLevel(level);

    switch (level) {
        case DiagnosticLevel::Error:
        case DiagnosticLevel::Fatal:
            ++ErrorCount;
            break;
        case DiagnosticLevel::Warning:
            ++WarningCount;
            break;
        case DiagnosticLevel::Note:
            break;
    }

    return DiagnosticBuilder(*this, id, loc, level);
}

DiagnosticBuilder DiagnosticEngine::report(DiagID id, SourceRange range) {
    DiagnosticBuilder builder = report(id, range.getBegin());
    builder << range;
    return builder;
}

void DiagnosticEngine::setConsumer(std::unique_ptr<DiagnosticConsumer> consumer) {
    Consumer = std::move(consumer);
}

void DiagnosticEngine::reset() {
    ErrorCount = 0;
    WarningCount = 0;
}

void DiagnosticEngine::emitDiagnostic(const Diagnostic& diag) {
    if (!Consumer) {
        return;
    }
    bool isErrorLevel = diag.getLevel() == DiagnosticLevel::Error ||
                        diag.getLevel() == DiagnosticLevel::Fatal;
    if (isErrorLevel && ErrorLimit > 0 && ErrorCount > ErrorLimit) {
        return;
    }
    Consumer->handleDiagnostic(diag);
}

// ============================================================================
// StoredDiagnosticConsumer Implementation
// ============================================================================

void StoredDiagnosticConsumer::handleDiagnostic(const Diagnostic& diag) {
    Diagnostics.push_back(diag);
}

size_t StoredDiagnosticConsumer::count(DiagID id) const {
    return static_cast<size_t>(std::count_if(
        Diagnostics.begin(), Diagnostics.end(),
        [id](const Diagnostic& diag) { return diag.getID() == id; }));
}

// ============================================================================
// MultiplexDiagnosticConsumer Implementation
// ============================================================================

void MultiplexDiagnosticConsumer::addConsumer(
    std::unique_ptr<DiagnosticConsumer> consumer) {
    Consumers.push_back(std::move(consumer));
}

void MultiplexDiagnosticConsumer::handleDiagnostic(const Diagnostic& diag) {
    for (auto& consumer : Consumers) {
        consumer->handleDiagnostic(diag);
    }
}

void MultiplexDiagnosticConsumer::finish() {
    for (auto& consumer : Consumers) {
        consumer->finish();
    }
}

} // namespace machlink

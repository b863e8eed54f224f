/// \file ImportError.cpp
/// \brief 导入错误实现

#include "machlink/Module/ImportError.h"
#include "machlink/AST/AST.h"
#include "machlink/Basic/Diagnostic.h"

namespace machlink {

ImportError ImportError::moduleNotFound(const std::string& importPath,
                                        std::optional<ModuleId> fromModule) {
    ImportError error(Kind::ModuleNotFound, DiagID::err_module_not_found);
    error.ImportPath = importPath;
    error.FromModule = std::move(fromModule);
    error.Property = "path";
    error.Args = {importPath};
    return error;
}

ImportError ImportError::circularDependency(std::vector<ModuleId> cycle) {
    ImportError error(Kind::CircularDependency, DiagID::err_circular_dependency);
    if (!cycle.empty()) {
        error.FromModule = cycle.front();
        error.ImportPath = cycle.front().getLocation();
    }
    error.Args = {formatCycle(cycle)};
    error.Cycle = std::move(cycle);
    error.Property = "imports";
    return error;
}

ImportError ImportError::symbolNotFound(const std::string& symbolName,
                                        const std::string& importPath,
                                        std::optional<ModuleId> fromModule) {
    ImportError error(Kind::SymbolNotFound, DiagID::err_symbol_not_found);
    error.SymbolName = symbolName;
    error.ImportPath = importPath;
    error.FromModule = std::move(fromModule);
    error.Property = "name";
    error.Args = {symbolName, importPath};
    return error;
}

ImportError ImportError::ambiguousSymbol(const std::string& symbolName,
                                         const std::string& importPath,
                                         const std::vector<std::string>& candidates,
                                         std::optional<ModuleId> fromModule) {
    ImportError error(Kind::SymbolNotFound, DiagID::err_ambiguous_import);
    error.SymbolName = symbolName;
    error.ImportPath = importPath;
    error.FromModule = std::move(fromModule);
    error.Property = "name";

    std::string joined;
    for (const auto& candidate : candidates) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += candidate;
    }
    error.Detail = joined;
    error.Args = {symbolName, importPath, joined};
    return error;
}

ImportError ImportError::symbolCollision(const std::string& effectiveName,
                                         const std::string& firstImportPath,
                                         const std::string& secondImportPath,
                                         std::optional<ModuleId> fromModule) {
    ImportError error(Kind::SymbolCollision, DiagID::err_symbol_collision);
    error.SymbolName = effectiveName;
    error.ImportPath = secondImportPath;
    error.ConflictingName = firstImportPath;
    error.FromModule = std::move(fromModule);
    error.Property = "alias";
    error.Args = {effectiveName, firstImportPath, secondImportPath};
    return error;
}

ImportError ImportError::collidesWithLocal(const std::string& effectiveName,
                                           const std::string& localName,
                                           const std::string& importPath,
                                           std::optional<ModuleId> fromModule) {
    ImportError error(Kind::SymbolCollision, DiagID::err_import_collides_with_local);
    error.SymbolName = effectiveName;
    error.ImportPath = importPath;
    error.ConflictingName = localName;
    error.FromModule = std::move(fromModule);
    error.Property = "alias";
    error.Args = {effectiveName, localName};
    return error;
}

ImportError ImportError::moduleParse(const std::string& importPath,
                                     const std::string& detail,
                                     std::optional<ModuleId> fromModule) {
    ImportError error(Kind::ModuleParse, DiagID::err_module_parse);
    error.ImportPath = importPath;
    error.Detail = detail;
    error.FromModule = std::move(fromModule);
    error.Property = "path";
    error.Args = {importPath, detail};
    return error;
}

ImportError ImportError::urlImport(const std::string& url, std::optional<long> status,
                                   const std::string& detail,
                                   std::optional<ModuleId> fromModule) {
    ImportError error(Kind::URLImport, DiagID::err_url_import);
    error.ImportPath = url;
    error.FromModule = std::move(fromModule);
    error.HTTPStatus = status;
    error.Detail = detail;
    error.Property = "path";

    std::string suffix;
    if (status) {
        suffix = " (HTTP " + std::to_string(*status) + ")";
    } else if (!detail.empty()) {
        suffix = ": " + detail;
    }
    error.Args = {url, suffix};
    return error;
}

ImportError& ImportError::setNode(const ASTNode* node, const std::string& property) {
    Node = node;
    Property = property;
    if (node && Loc.isInvalid()) {
        Loc = node->getBeginLoc();
    }
    return *this;
}

std::string ImportError::getMessage() const {
    Diagnostic diag(ID, getDiagnosticLevel(ID), Loc);
    for (const auto& arg : Args) {
        diag << arg;
    }
    return diag.getMessage();
}

void ImportError::report(DiagnosticEngine& diag) const {
    DiagnosticBuilder builder = diag.report(ID, Loc);
    for (const auto& arg : Args) {
        builder << arg;
    }
    if (Node) {
        builder.setTarget(Node, Property);
    }
}

std::string ImportError::formatCycle(const std::vector<ModuleId>& cycle) {
    std::string result;
    for (const auto& id : cycle) {
        if (!result.empty()) {
            result += " → ";
        }
        result += id.getFileName();
    }
    return result;
}

const char* getImportErrorKindName(ImportError::Kind kind) {
    switch (kind) {
        case ImportError::Kind::ModuleNotFound: return "ModuleNotFoundError";
        case ImportError::Kind::CircularDependency: return "CircularDependencyError";
        case ImportError::Kind::SymbolNotFound: return "SymbolNotFoundError";
        case ImportError::Kind::SymbolCollision: return "SymbolCollisionError";
        case ImportError::Kind::ModuleParse: return "ModuleParseError";
        case ImportError::Kind::URLImport: return "URLImportError";
    }
    return "ImportError";
}

} // namespace machlink

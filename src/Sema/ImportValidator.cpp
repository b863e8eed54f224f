//===--- ImportValidator.cpp - import 语句检查实现 ---------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//

#include "machlink/Sema/ImportValidator.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Sema/Symbol.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include <algorithm>

namespace machlink {

namespace {

bool isBlank(const std::string& text) {
    return llvm::StringRef(text).trim().empty();
}

const char* getNameProperty(const ImportedSymbol* symbol) {
    return symbol->hasAlias() ? "alias" : "name";
}

} // anonymous namespace

ImportValidator::ImportValidator(DiagnosticEngine& diag, const WorkspaceManager* workspace)
    : Diag(diag), Workspace(workspace) {}

bool ImportValidator::checkImports(const Module& module) {
    unsigned errorsBefore = Diag.getErrorCount();
    const auto& imports = module.getImports();
    if (imports.empty()) {
        return true;
    }

    for (size_t i = 0; i < imports.size(); ++i) {
        checkImportStatement(module, imports[i].get(), i);
    }

    checkCircularDependencies(module);
    checkSymbolCollisions(module);

    return Diag.getErrorCount() == errorsBefore;
}

void ImportValidator::checkImportStatement(const Module& module, const ImportDecl* import,
                                           size_t importIndex) {
    if (isBlank(import->getPath())) {
        Diag.report(DiagID::err_empty_import_path, import->getPathRange())
            .setTarget(import, "path");
        return;
    }

    if (import->getSymbols().empty()) {
        Diag.report(DiagID::err_empty_import_symbols, import->getRange())
            .setTarget(import, "symbols");
        return;
    }

    for (const auto& symbol : import->getSymbols()) {
        checkImportedSymbol(*module.getMachine(), symbol.get());
    }

    checkPathWarnings(import);

    if (Workspace) {
        checkResolution(module, import, importIndex);
    }
}

void ImportValidator::checkImportedSymbol(const MachineDecl& machine,
                                          const ImportedSymbol* symbol) {
    if (isBlank(symbol->getName())) {
        Diag.report(DiagID::err_empty_symbol_name, symbol->getRange())
            .setTarget(symbol, "name");
        return;
    }

    if (symbol->hasAlias() && isBlank(*symbol->getAlias())) {
        Diag.report(DiagID::err_empty_alias, symbol->getRange())
            .setTarget(symbol, "alias");
        return;
    }

    std::string effective = symbol->getEffectiveName();
    for (const NodeDecl* local : findCollidingLocals(machine, effective)) {
        DiagnosticBuilder builder =
            Diag.report(DiagID::err_import_collides_with_local, symbol->getRange());
        builder << effective << local->getName();
        builder.setTarget(symbol, getNameProperty(symbol));
        builder.emit();

        Diag.report(DiagID::note_local_definition, local->getNameRange())
            << local->getName();
    }
}

void ImportValidator::checkPathWarnings(const ImportDecl* import) {
    llvm::StringRef path = import->getPath();

    if (path.take_front(7).equals_insensitive("http://")) {
        Diag.report(DiagID::warn_insecure_http_import, import->getPathRange())
            .setTarget(import, "path");
    }

    if (isAbsoluteImportPath(path.str())) {
        Diag.report(DiagID::warn_absolute_import_path, import->getPathRange())
            .setTarget(import, "path");
    }
}

void ImportValidator::checkResolution(const Module& module, const ImportDecl* import,
                                      size_t importIndex) {
    std::optional<ModuleId> target = Workspace->getResolvedImport(module.getId(), importIndex);
    if (!target) {
        ImportError error = ImportError::moduleNotFound(import->getPath(), module.getId());
        error.setLocation(import->getPathRange().getBegin());
        error.setNode(import, "path");
        error.report(Diag);
        return;
    }

    // 已解析但尚未加载的模块无法检查符号
    const Module* targetModule = Workspace->getModule(*target);
    if (!targetModule) {
        return;
    }

    for (const auto& symbol : import->getSymbols()) {
        if (isBlank(symbol->getName())) {
            continue;
        }

        NodeLookupResult found =
            findImportedNode(*targetModule->getMachine(), symbol->getName());
        if (found.isFound()) {
            continue;
        }

        ImportError error =
            found.isAmbiguous()
                ? ImportError::ambiguousSymbol(symbol->getName(), import->getPath(),
                                               found.Candidates, module.getId())
                : ImportError::symbolNotFound(symbol->getName(), import->getPath(),
                                              module.getId());
        error.setNode(symbol.get(), "name");
        error.report(Diag);
    }
}

void ImportValidator::checkCircularDependencies(const Module& module) {
    if (!Workspace) {
        return;
    }

    for (const auto& cycle : Workspace->getCircularDependencies()) {
        if (std::find(cycle.begin(), cycle.end(), module.getId()) == cycle.end()) {
            continue;
        }

        ImportError error = ImportError::circularDependency(cycle);
        error.setNode(module.getMachine(), "imports");
        if (!module.getImports().empty()) {
            error.setLocation(module.getImports().front()->getBeginLoc());
        }
        error.report(Diag);
        // 每个模块只报告一个环
        break;
    }
}

void ImportValidator::checkSymbolCollisions(const Module& module) {
    llvm::StringMap<const ImportDecl*> firstSource;

    for (const auto& import : module.getImports()) {
        for (const auto& symbol : import->getSymbols()) {
            std::string effective = symbol->getEffectiveName();
            if (effective.empty()) {
                continue;
            }

            auto it = firstSource.find(effective);
            if (it == firstSource.end()) {
                firstSource[effective] = import.get();
                continue;
            }

            ImportError error = ImportError::symbolCollision(
                effective, it->second->getPath(), import->getPath(), module.getId());
            error.setNode(symbol.get(), getNameProperty(symbol.get()));
            error.report(Diag);

            Diag.report(DiagID::note_previous_import, it->second->getBeginLoc())
                << effective;
        }
    }
}

} // namespace machlink

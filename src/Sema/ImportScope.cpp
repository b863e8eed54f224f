//===--- ImportScope.cpp - 导入作用域实现 ------------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//

#include "machlink/Sema/ImportScope.h"
#include "machlink/Module/WorkspaceManager.h"

namespace machlink {

ImportScope::ImportScope(const WorkspaceManager& workspace, const Module& module)
    : Workspace(workspace), Mod(module) {
    build();
}

void ImportScope::build() {
    const MachineDecl& machine = *Mod.getMachine();
    const ModuleId& id = Mod.getId();

    // 有效名称 -> 首次声明它的 import 路径（无论是否解析成功）
    llvm::StringMap<std::string> claims;

    const auto& imports = Mod.getImports();
    for (size_t i = 0; i < imports.size(); ++i) {
        const ImportDecl* import = imports[i].get();
        std::optional<ModuleId> origin = Workspace.getResolvedImport(id, i);
        const Module* originModule = origin ? Workspace.getModule(*origin) : nullptr;

        for (const auto& symbol : import->getSymbols()) {
            if (symbol->getName().empty()) {
                continue;
            }
            std::string effective = symbol->getEffectiveName();
            if (effective.empty()) {
                continue;
            }
            const char* property = symbol->hasAlias() ? "alias" : "name";

            // 本地定义优先
            if (const NodeDecl* local = findCollidingLocal(machine, effective)) {
                ImportError error = ImportError::collidesWithLocal(
                    effective, local->getName(), import->getPath(), id);
                error.setNode(symbol.get(), property);
                Errors.push_back(std::move(error));
                continue;
            }

            auto claim = claims.find(effective);
            if (claim != claims.end()) {
                ImportError error = ImportError::symbolCollision(
                    effective, claim->second, import->getPath(), id);
                error.setNode(symbol.get(), property);
                Errors.push_back(std::move(error));
                continue;
            }
            claims[effective] = import->getPath();

            // 未解析或未加载的模块由工作区报告
            if (!originModule) {
                continue;
            }

            NodeLookupResult found = findImportedNode(*originModule->getMachine(),
                                                      symbol->getName());
            if (found.isAmbiguous()) {
                ImportError error = ImportError::ambiguousSymbol(
                    symbol->getName(), import->getPath(), found.Candidates, id);
                error.setNode(symbol.get(), "name");
                Errors.push_back(std::move(error));
                continue;
            }
            if (!found.isFound()) {
                ImportError error = ImportError::symbolNotFound(
                    symbol->getName(), import->getPath(), id);
                error.setNode(symbol.get(), "name");
                Errors.push_back(std::move(error));
                continue;
            }

            ImportedSymbolEntry entry;
            entry.EffectiveName = effective;
            entry.OriginModule = *origin;
            entry.OriginalName = symbol->getName();
            entry.Node = found.Node;
            entry.Import = import;
            entry.Symbol = symbol.get();

            SymbolIndex[effective] = Symbols.size();
            Symbols.push_back(std::move(entry));
        }
    }
}

const NodeDecl* ImportScope::lookupLocal(llvm::StringRef name) const {
    return Mod.getMachine()->findNode(name.str());
}

const ImportedSymbolEntry* ImportScope::lookupImported(llvm::StringRef name) const {
    auto it = SymbolIndex.find(name);
    if (it == SymbolIndex.end()) {
        return nullptr;
    }
    return &Symbols[it->second];
}

const NodeDecl* ImportScope::lookup(llvm::StringRef name) const {
    if (const NodeDecl* local = lookupLocal(name)) {
        return local;
    }
    const ImportedSymbolEntry* imported = lookupImported(name);
    return imported ? imported->Node : nullptr;
}

void ImportScope::report(DiagnosticEngine& diag) const {
    for (const ImportError& error : Errors) {
        error.report(diag);
    }
}

} // namespace machlink

//===--- CrossFileLinker.cpp - 跨文件引用链接实现 ----------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//

#include "machlink/Sema/CrossFileLinker.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Sema/Symbol.h"

namespace machlink {

CrossFileLinker::CrossFileLinker(const WorkspaceManager& workspace)
    : Workspace(workspace) {}

LinkResult CrossFileLinker::resolveReference(const Module& module,
                                             llvm::StringRef name) const {
    LinkResult local = resolveLocal(module, name);
    if (local.isResolved()) {
        return local;
    }

    LinkResult imported = resolveImported(module, name);
    if (imported.isResolved()) {
        return imported;
    }

    return local;
}

LinkResult CrossFileLinker::resolveLocal(const Module& module, llvm::StringRef name) const {
    LinkResult result;
    result.Target = module.getMachine()->findNode(name.str());
    if (result.Target) {
        result.TargetModule = &module;
    }
    return result;
}

LinkResult CrossFileLinker::resolveImported(const Module& module,
                                            llvm::StringRef name) const {
    const auto& imports = module.getImports();
    for (size_t i = 0; i < imports.size(); ++i) {
        const ImportDecl* import = imports[i].get();

        const ImportedSymbol* claimed = nullptr;
        for (const auto& symbol : import->getSymbols()) {
            if (symbol->getEffectiveName() == name) {
                claimed = symbol.get();
                break;
            }
        }
        if (!claimed) {
            continue;
        }

        std::optional<ModuleId> origin = Workspace.getResolvedImport(module.getId(), i);
        const Module* originModule = origin ? Workspace.getModule(*origin) : nullptr;
        if (!originModule) {
            continue;
        }

        NodeLookupResult found = findImportedNode(*originModule->getMachine(),
                                                  claimed->getName());
        if (found.isFound()) {
            LinkResult result;
            result.Target = found.Node;
            result.TargetModule = originModule;
            result.Via = claimed;
            return result;
        }
    }
    return LinkResult();
}

LinkSummary CrossFileLinker::linkWorkspace(DiagnosticEngine& diag) const {
    LinkSummary summary;

    auto ordered = Workspace.getDocumentsInOrder();
    if (!ordered) {
        for (const auto& cycle : Workspace.getCircularDependencies()) {
            ImportError::circularDependency(cycle).report(diag);
        }
        return summary;
    }

    for (const Module* module : *ordered) {
        for (const EdgeDecl* edge : module->getMachine()->getAllEdges()) {
            for (const NodeRef& ref : edge->getAllRefs()) {
                LinkResult result = resolveReference(*module, ref.Name);
                if (!result.isResolved()) {
                    ++summary.UnresolvedRefs;
                    diag.report(DiagID::err_unresolved_reference, ref.Range)
                        << ref.Name;
                } else if (result.isImported()) {
                    ++summary.ImportedRefs;
                } else {
                    ++summary.LocalRefs;
                }
            }
        }
    }

    summary.Success = summary.UnresolvedRefs == 0;
    return summary;
}

} // namespace machlink

/// \file ModuleMerger.cpp
/// \brief 模块合并实现

#include "machlink/Merge/ModuleMerger.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Module/WorkspaceManager.h"
#include "machlink/Sema/Symbol.h"
#include <algorithm>

namespace machlink {

void MergeResult::report(DiagnosticEngine& diag) const {
    if (EntryNotLoaded) {
        diag.report(DiagID::err_entry_not_loaded, SourceLocation()) << EntryPoint;
    }
    for (const ImportError& error : Errors) {
        error.report(diag);
    }
}

ModuleMerger::ModuleMerger(const WorkspaceManager& workspace) : Workspace(workspace) {}

std::optional<ModuleId> ModuleMerger::findEntry(const std::string& entryPoint) const {
    std::vector<ModuleId> candidates;
    if (auto parsed = ModuleId::fromString(entryPoint)) {
        candidates.push_back(*parsed);
    }
    if (!entryPoint.empty()) {
        candidates.push_back(ModuleId::forFile(entryPoint));
        candidates.push_back(ModuleId::forVirtual(entryPoint));
    }

    for (const ModuleId& candidate : candidates) {
        if (candidate.isValid() && Workspace.hasModule(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

MergeResult ModuleMerger::mergeMachines(const std::string& entryPoint) const {
    std::optional<ModuleId> entry = findEntry(entryPoint);
    if (!entry) {
        MergeResult result;
        result.EntryPoint = entryPoint;
        // 存在环时优先报告环
        if (Workspace.hasCircularDependencies()) {
            for (const auto& cycle : Workspace.getCircularDependencies()) {
                result.Errors.push_back(ImportError::circularDependency(cycle));
            }
        } else {
            result.EntryNotLoaded = true;
        }
        return result;
    }
    return mergeMachines(*entry);
}

MergeResult ModuleMerger::mergeMachines(const ModuleId& entry) const {
    MergeResult result;
    result.EntryPoint = entry.str();

    // 合并必须在无环的工作区上进行
    if (!Workspace.getDocumentsInOrder()) {
        for (const auto& cycle : Workspace.getCircularDependencies()) {
            result.Errors.push_back(ImportError::circularDependency(cycle));
        }
        return result;
    }

    const Module* entryModule = Workspace.getModule(entry);
    if (!entryModule) {
        result.EntryNotLoaded = true;
        return result;
    }

    const MachineDecl& entryMachine = *entryModule->getMachine();
    auto merged = std::make_unique<MergedMachine>();
    merged->Machine = std::make_unique<MachineDecl>(entryMachine.getRange());
    if (entryMachine.getTitle()) {
        merged->Machine->setTitle(*entryMachine.getTitle());
    }
    for (const Attribute& attr : entryMachine.getAttributes()) {
        merged->Machine->addAttribute(attr);
    }

    merged->SourceFiles.push_back(entry.str());
    for (const auto& node : entryMachine.getNodes()) {
        recordSources(*node, entry.str(), *merged);
        merged->Machine->addNode(node->clone());
    }
    for (const auto& edge : entryMachine.getEdges()) {
        merged->Machine->addEdge(edge->clone());
    }

    std::set<std::string> visited;
    mergeImports(*entryModule, *merged, visited, result.Errors);

    if (result.Errors.empty()) {
        result.Merged = std::move(merged);
    }
    return result;
}

void ModuleMerger::mergeImports(const Module& module, MergedMachine& merged,
                                std::set<std::string>& visited,
                                std::vector<ImportError>& errors) const {
    if (!visited.insert(module.getId().str()).second) {
        return;
    }

    const auto& imports = module.getImports();
    for (size_t i = 0; i < imports.size(); ++i) {
        const ImportDecl* import = imports[i].get();
        std::optional<ModuleId> origin = Workspace.getResolvedImport(module.getId(), i);
        const Module* originModule = origin ? Workspace.getModule(*origin) : nullptr;
        if (!originModule) {
            ImportError error = ImportError::moduleNotFound(import->getPath(), module.getId());
            error.setLocation(import->getPathRange().getBegin());
            error.setNode(import, "path");
            errors.push_back(std::move(error));
            continue;
        }

        const std::string sourceFile = origin->str();
        if (std::find(merged.SourceFiles.begin(), merged.SourceFiles.end(), sourceFile) ==
            merged.SourceFiles.end()) {
            merged.SourceFiles.push_back(sourceFile);
        }

        for (const auto& symbol : import->getSymbols()) {
            const std::string& name = symbol->getName();
            if (name.empty()) {
                continue;
            }

            NodeLookupResult found = findImportedNode(*originModule->getMachine(), name);
            if (!found.isFound()) {
                ImportError error =
                    found.isAmbiguous()
                        ? ImportError::ambiguousSymbol(name, import->getPath(),
                                                       found.Candidates, module.getId())
                        : ImportError::symbolNotFound(name, import->getPath(),
                                                      module.getId());
                error.setNode(symbol.get(), "name");
                errors.push_back(std::move(error));
                continue;
            }

            std::string effective = symbol->getEffectiveName();
            if (effective.empty() || merged.SourceMap.count(effective)) {
                continue;
            }

            std::unique_ptr<NodeDecl> copy = found.Node->clone();
            copy->setName(effective);

            SourceInfo info;
            info.SourceFile = sourceFile;
            if (name != effective) {
                info.OriginalName = name;
            }
            merged.SourceMap.insert(std::make_pair(effective, info));
            for (const auto& child : copy->getChildren()) {
                recordSources(*child, sourceFile, merged);
            }

            merged.Machine->addNode(std::move(copy));
        }

        mergeImports(*originModule, merged, visited, errors);
    }
}

void ModuleMerger::recordSources(const NodeDecl& node, const std::string& sourceFile,
                                 MergedMachine& merged) {
    SourceInfo info;
    info.SourceFile = sourceFile;
    merged.SourceMap.insert(std::make_pair(node.getName(), info));

    for (const auto& child : node.getChildren()) {
        recordSources(*child, sourceFile, merged);
    }
}

} // namespace machlink

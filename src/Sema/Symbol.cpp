//===--- Symbol.cpp - 导入符号查找 -------------------------------------===//
//
// machlink
//
//===----------------------------------------------------------------------===//

#include "machlink/Sema/Symbol.h"

namespace machlink {

NodeLookupResult findImportedNode(const MachineDecl& machine, llvm::StringRef name) {
    NodeLookupResult result;
    std::vector<const NodeDecl*> allNodes = machine.getAllNodes();

    // 完全匹配优先
    for (const NodeDecl* node : allNodes) {
        if (name == node->getName() || name == node->getQualifiedName()) {
            result.Node = node;
            return result;
        }
    }

    // 限定名退回到短名称匹配
    std::string shortName = getShortName(name.str());
    if (shortName == name) {
        return result;
    }

    std::vector<const NodeDecl*> matches;
    for (const NodeDecl* node : allNodes) {
        if (getShortName(node->getName()) == shortName) {
            matches.push_back(node);
            result.Candidates.push_back(node->getQualifiedName());
        }
    }

    if (matches.size() == 1) {
        result.Node = matches.front();
    }
    return result;
}

std::vector<const NodeDecl*> findCollidingLocals(const MachineDecl& machine,
                                                 llvm::StringRef name) {
    std::vector<const NodeDecl*> result;
    for (const NodeDecl* node : machine.getAllNodes()) {
        const std::string& nodeName = node->getName();
        if (name == nodeName || name == getShortName(nodeName) ||
            name == node->getQualifiedName()) {
            result.push_back(node);
        }
    }
    return result;
}

const NodeDecl* findCollidingLocal(const MachineDecl& machine, llvm::StringRef name) {
    std::vector<const NodeDecl*> locals = findCollidingLocals(machine, name);
    return locals.empty() ? nullptr : locals.front();
}

} // namespace machlink

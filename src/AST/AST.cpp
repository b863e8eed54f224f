/// \file AST.cpp
/// \brief AST 节点实现。

#include "machlink/AST/AST.h"
#include <functional>

namespace machlink {

const char* ASTNode::getKindName(Kind kind) {
    switch (kind) {
        case Kind::MachineDecl: return "MachineDecl";
        case Kind::NodeDecl: return "NodeDecl";
        case Kind::EdgeDecl: return "EdgeDecl";
        case Kind::ImportDecl: return "ImportDecl";
        case Kind::ImportedSymbol: return "ImportedSymbol";
    }
    return "Unknown";
}

std::string getShortName(const std::string& qualifiedName) {
    size_t pos = qualifiedName.rfind('.');
    if (pos == std::string::npos) {
        return qualifiedName;
    }
    return qualifiedName.substr(pos + 1);
}

// ============================================================================
// ImportedSymbol / ImportDecl
// ============================================================================

ImportedSymbol::ImportedSymbol(SourceRange range, std::string name,
                               std::optional<std::string> alias)
    : ASTNode(Kind::ImportedSymbol, range),
      Name(std::move(name)), Alias(std::move(alias)) {}

std::string ImportedSymbol::getEffectiveName() const {
    if (Alias) {
        return *Alias;
    }
    return getShortName(Name);
}

ImportDecl::ImportDecl(SourceRange range, std::string path)
    : ASTNode(Kind::ImportDecl, range), Path(std::move(path)) {}

ImportedSymbol* ImportDecl::addSymbol(std::unique_ptr<ImportedSymbol> symbol) {
    symbol->setParent(this);
    Symbols.push_back(std::move(symbol));
    return Symbols.back().get();
}

// ============================================================================
// EdgeDecl
// ============================================================================

EdgeDecl::EdgeDecl(SourceRange range) : ASTNode(Kind::EdgeDecl, range) {}

std::vector<NodeRef> EdgeDecl::getAllRefs() const {
    std::vector<NodeRef> refs;
    for (const auto& group : Groups) {
        refs.insert(refs.end(), group.begin(), group.end());
    }
    return refs;
}

std::unique_ptr<EdgeDecl> EdgeDecl::clone() const {
    auto copy = std::make_unique<EdgeDecl>(Range);
    copy->Groups = Groups;
    copy->Arrows = Arrows;
    return copy;
}

// ============================================================================
// NodeDecl
// ============================================================================

NodeDecl::NodeDecl(SourceRange range, std::string type, std::string name)
    : ASTNode(Kind::NodeDecl, range), Type(std::move(type)), Name(std::move(name)) {}

NodeDecl* NodeDecl::addChild(std::unique_ptr<NodeDecl> child) {
    child->setParent(this);
    Children.push_back(std::move(child));
    return Children.back().get();
}

EdgeDecl* NodeDecl::addEdge(std::unique_ptr<EdgeDecl> edge) {
    edge->setParent(this);
    Edges.push_back(std::move(edge));
    return Edges.back().get();
}

std::string NodeDecl::getQualifiedName() const {
    std::string result = Name;
    for (const ASTNode* p = Parent; p; p = p->getParent()) {
        if (const auto* node = dynamic_cast<const NodeDecl*>(p)) {
            result = node->getName() + "." + result;
        }
    }
    return result;
}

std::unique_ptr<NodeDecl> NodeDecl::clone() const {
    auto copy = std::make_unique<NodeDecl>(Range, Type, Name);
    copy->NameRange = NameRange;
    copy->Title = Title;
    copy->Annotations = Annotations;
    copy->Attributes = Attributes;
    for (const auto& child : Children) {
        copy->addChild(child->clone());
    }
    for (const auto& edge : Edges) {
        copy->addEdge(edge->clone());
    }
    return copy;
}

// ============================================================================
// MachineDecl
// ============================================================================

MachineDecl::MachineDecl(SourceRange range) : ASTNode(Kind::MachineDecl, range) {}

ImportDecl* MachineDecl::addImport(std::unique_ptr<ImportDecl> import) {
    import->setParent(this);
    Imports.push_back(std::move(import));
    return Imports.back().get();
}

NodeDecl* MachineDecl::addNode(std::unique_ptr<NodeDecl> node) {
    node->setParent(this);
    Nodes.push_back(std::move(node));
    return Nodes.back().get();
}

EdgeDecl* MachineDecl::addEdge(std::unique_ptr<EdgeDecl> edge) {
    edge->setParent(this);
    Edges.push_back(std::move(edge));
    return Edges.back().get();
}

std::vector<const NodeDecl*> MachineDecl::getAllNodes() const {
    std::vector<const NodeDecl*> result;
    std::function<void(const NodeDecl*)> collect = [&](const NodeDecl* node) {
        result.push_back(node);
        for (const auto& child : node->getChildren()) {
            collect(child.get());
        }
    };
    for (const auto& node : Nodes) {
        collect(node.get());
    }
    return result;
}

std::vector<const EdgeDecl*> MachineDecl::getAllEdges() const {
    std::vector<const EdgeDecl*> result;
    for (const auto& edge : Edges) {
        result.push_back(edge.get());
    }
    for (const NodeDecl* node : getAllNodes()) {
        for (const auto& edge : node->getEdges()) {
            result.push_back(edge.get());
        }
    }
    return result;
}

const NodeDecl* MachineDecl::findNode(const std::string& name) const {
    for (const NodeDecl* node : getAllNodes()) {
        if (node->getName() == name || node->getQualifiedName() == name) {
            return node;
        }
    }
    return nullptr;
}

} // namespace machlink

/// \file AST.h
/// \brief 机器定义文件的 AST 节点。
///
/// 本文件定义了结构化前端产生的全部 AST 节点：机器 (MachineDecl)、
/// 节点定义 (NodeDecl)、边 (EdgeDecl) 以及导入语句 (ImportDecl)。
/// 父节点通过 std::unique_ptr 拥有子节点；子节点的 Parent 是非拥有的回指针。

#ifndef MACHLINK_AST_AST_H
#define MACHLINK_AST_AST_H

#include "machlink/Basic/SourceLocation.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace machlink {

/// \brief AST 节点基类
///
/// 每个节点都有一个 Kind 枚举值用于 RTTI，一个 SourceRange 表示其在
/// 源码中的位置，以及指向所属容器的非拥有指针。
class ASTNode {
public:
    /// \brief AST 节点类型枚举
    enum class Kind {
        MachineDecl,        ///< 整个文件
        NodeDecl,           ///< 节点定义（state、task 等）
        EdgeDecl,           ///< 边链
        ImportDecl,         ///< import 语句
        ImportedSymbol,     ///< import 中的单个符号
    };

    explicit ASTNode(Kind kind, SourceRange range)
        : NodeKind(kind), Range(range) {}

    virtual ~ASTNode() = default;

    ASTNode(const ASTNode&) = delete;
    ASTNode& operator=(const ASTNode&) = delete;

    Kind getKind() const { return NodeKind; }

    SourceRange getRange() const { return Range; }
    void setRange(SourceRange range) { Range = range; }

    SourceLocation getBeginLoc() const { return Range.getBegin(); }
    SourceLocation getEndLoc() const { return Range.getEnd(); }

    /// \brief 获取所属容器（非拥有）
    ASTNode* getParent() const { return Parent; }
    void setParent(ASTNode* parent) { Parent = parent; }

    /// \brief 获取节点类型的字符串表示
    static const char* getKindName(Kind kind);

protected:
    Kind NodeKind;
    SourceRange Range;
    ASTNode* Parent = nullptr;
};

/// \brief 边中对节点的名称引用
struct NodeRef {
    std::string Name;   ///< 可能是限定名，例如 Group.Child
    SourceRange Range;

    NodeRef() = default;
    NodeRef(std::string name, SourceRange range)
        : Name(std::move(name)), Range(range) {}
};

/// \brief 节点属性 `name: value`
///
/// 值保留为源码文本（字符串字面量已解码），结构化前端不解释属性。
struct Attribute {
    std::string Name;
    std::string Value;
    SourceRange Range;
};

/// \brief import 语句中的单个符号 `Name [as Alias]`
class ImportedSymbol : public ASTNode {
public:
    ImportedSymbol(SourceRange range, std::string name,
                   std::optional<std::string> alias = std::nullopt);

    const std::string& getName() const { return Name; }

    bool hasAlias() const { return Alias.has_value(); }
    const std::optional<std::string>& getAlias() const { return Alias; }

    /// \brief 有效本地名称：别名优先，否则为限定名的最后一段
    std::string getEffectiveName() const;

    static bool classof(const ASTNode* node) {
        return node->getKind() == Kind::ImportedSymbol;
    }

private:
    std::string Name;
    std::optional<std::string> Alias;
};

/// \brief import 语句 `import { A, B as C } from "path"`
class ImportDecl : public ASTNode {
public:
    ImportDecl(SourceRange range, std::string path);

    const std::string& getPath() const { return Path; }

    /// \brief 路径字符串字面量的位置
    SourceRange getPathRange() const { return PathRange; }
    void setPathRange(SourceRange range) { PathRange = range; }

    const std::vector<std::unique_ptr<ImportedSymbol>>& getSymbols() const {
        return Symbols;
    }

    ImportedSymbol* addSymbol(std::unique_ptr<ImportedSymbol> symbol);

    static bool classof(const ASTNode* node) {
        return node->getKind() == Kind::ImportDecl;
    }

private:
    std::string Path;
    SourceRange PathRange;
    std::vector<std::unique_ptr<ImportedSymbol>> Symbols;
};

/// \brief 边链 `A --> B, C -> D`
///
/// Groups 保存每一段的节点引用（逗号分隔的多个端点属于同一段），
/// Arrows[i] 连接 Groups[i] 与 Groups[i + 1]。
class EdgeDecl : public ASTNode {
public:
    explicit EdgeDecl(SourceRange range);

    const std::vector<std::vector<NodeRef>>& getGroups() const { return Groups; }
    const std::vector<std::string>& getArrows() const { return Arrows; }

    void addGroup(std::vector<NodeRef> refs) { Groups.push_back(std::move(refs)); }
    void addArrow(std::string arrow) { Arrows.push_back(std::move(arrow)); }

    /// \brief 按出现顺序列出所有端点引用
    std::vector<NodeRef> getAllRefs() const;

    /// \brief 深拷贝（不含 Parent）
    std::unique_ptr<EdgeDecl> clone() const;

    static bool classof(const ASTNode* node) {
        return node->getKind() == Kind::EdgeDecl;
    }

private:
    std::vector<std::vector<NodeRef>> Groups;
    std::vector<std::string> Arrows;
};

/// \brief 节点定义 `type Name "Title" { ... }`
class NodeDecl : public ASTNode {
public:
    NodeDecl(SourceRange range, std::string type, std::string name);

    /// \brief 节点类型关键字（state、task 等），未写出时为空
    const std::string& getType() const { return Type; }

    const std::string& getName() const { return Name; }
    void setName(std::string name) { Name = std::move(name); }

    /// \brief 名称的位置
    SourceRange getNameRange() const { return NameRange; }
    void setNameRange(SourceRange range) { NameRange = range; }

    const std::optional<std::string>& getTitle() const { return Title; }
    void setTitle(std::string title) { Title = std::move(title); }

    const std::vector<std::string>& getAnnotations() const { return Annotations; }
    void addAnnotation(std::string annotation) {
        Annotations.push_back(std::move(annotation));
    }

    const std::vector<Attribute>& getAttributes() const { return Attributes; }
    void addAttribute(Attribute attr) { Attributes.push_back(std::move(attr)); }

    const std::vector<std::unique_ptr<NodeDecl>>& getChildren() const {
        return Children;
    }
    const std::vector<std::unique_ptr<EdgeDecl>>& getEdges() const { return Edges; }

    /// \brief 添加子节点并设置其 Parent
    NodeDecl* addChild(std::unique_ptr<NodeDecl> child);

    /// \brief 添加边并设置其 Parent
    EdgeDecl* addEdge(std::unique_ptr<EdgeDecl> edge);

    /// \brief 限定名：祖先节点名称与自身名称以 '.' 连接
    std::string getQualifiedName() const;

    /// \brief 深拷贝整棵子树；拷贝的 Parent 留给新的拥有者设置
    std::unique_ptr<NodeDecl> clone() const;

    static bool classof(const ASTNode* node) {
        return node->getKind() == Kind::NodeDecl;
    }

private:
    std::string Type;
    std::string Name;
    SourceRange NameRange;
    std::optional<std::string> Title;
    std::vector<std::string> Annotations;
    std::vector<Attribute> Attributes;
    std::vector<std::unique_ptr<NodeDecl>> Children;
    std::vector<std::unique_ptr<EdgeDecl>> Edges;
};

/// \brief 一个文件的根节点
class MachineDecl : public ASTNode {
public:
    explicit MachineDecl(SourceRange range);

    const std::optional<std::string>& getTitle() const { return Title; }
    void setTitle(std::string title) { Title = std::move(title); }

    const std::vector<std::unique_ptr<ImportDecl>>& getImports() const {
        return Imports;
    }
    const std::vector<std::unique_ptr<NodeDecl>>& getNodes() const { return Nodes; }
    const std::vector<std::unique_ptr<EdgeDecl>>& getEdges() const { return Edges; }
    const std::vector<Attribute>& getAttributes() const { return Attributes; }

    ImportDecl* addImport(std::unique_ptr<ImportDecl> import);
    NodeDecl* addNode(std::unique_ptr<NodeDecl> node);
    EdgeDecl* addEdge(std::unique_ptr<EdgeDecl> edge);
    void addAttribute(Attribute attr) { Attributes.push_back(std::move(attr)); }

    /// \brief 前序收集所有节点（包括嵌套节点）
    std::vector<const NodeDecl*> getAllNodes() const;

    /// \brief 收集所有边（包括节点体内的边）
    std::vector<const EdgeDecl*> getAllEdges() const;

    /// \brief 按名称查找节点：名称或限定名完全匹配，声明顺序中的第一个
    const NodeDecl* findNode(const std::string& name) const;

    static bool classof(const ASTNode* node) {
        return node->getKind() == Kind::MachineDecl;
    }

private:
    std::optional<std::string> Title;
    std::vector<std::unique_ptr<ImportDecl>> Imports;
    std::vector<std::unique_ptr<NodeDecl>> Nodes;
    std::vector<std::unique_ptr<EdgeDecl>> Edges;
    std::vector<Attribute> Attributes;
};

/// \brief 限定名的最后一段，例如 "Group.Child" -> "Child"
std::string getShortName(const std::string& qualifiedName);

} // namespace machlink

#endif // MACHLINK_AST_AST_H

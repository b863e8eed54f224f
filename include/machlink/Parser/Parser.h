/// \file Parser.h
/// \brief 机器定义文件的结构化语法分析器。
///
/// Parser 只识别链接引擎需要的结构：机器标题、import 语句、（嵌套的）
/// 命名节点定义、节点属性以及边链。节点体内无法识别的内容按 Token 跳过。

#ifndef MACHLINK_PARSER_PARSER_H
#define MACHLINK_PARSER_PARSER_H

#include "machlink/AST/AST.h"
#include "machlink/Basic/DiagnosticIDs.h"
#include "machlink/Lexer/Token.h"
#include <memory>
#include <string>
#include <vector>

namespace machlink {

class Lexer;
class DiagnosticEngine;

/// \brief 结构化语法分析器
///
/// 使用示例：
/// \code
/// Lexer lexer(sm, diag, fileID);
/// Parser parser(lexer, diag);
/// std::unique_ptr<MachineDecl> machine = parser.parseMachine();
/// if (parser.hasErrors()) { ... }
/// \endcode
class Parser {
public:
    /// \brief 构造语法分析器
    /// \param lexer 词法分析器
    /// \param diag 诊断引擎
    Parser(Lexer& lexer, DiagnosticEngine& diag);

    /// \brief 解析整个文件
    /// \return 根节点；出错时仍返回已恢复出的部分 AST
    std::unique_ptr<MachineDecl> parseMachine();

    /// \brief 解析过程中（含词法分析）是否报告过错误
    bool hasErrors() const;

    // =========================================================================
    // Token 操作方法
    // =========================================================================

    const Token& peek() const { return CurTok; }
    Token peekAhead(unsigned n = 1);
    Token consume();
    bool check(TokenKind kind) const { return CurTok.is(kind); }
    bool match(TokenKind kind);

    /// \brief 期望当前 Token 为指定类型，否则报告错误
    bool expect(TokenKind kind);

private:
    Lexer& Lex;
    DiagnosticEngine& Diag;
    Token CurTok;
    Token PrevTok;
    unsigned InitialErrorCount;

    /// 收集到的、尚未附加到节点上的注解
    std::vector<std::string> PendingAnnotations;

    // =========================================================================
    // 语法规则
    // =========================================================================

    /// import := 'import' '{' [symbol {',' symbol} [',']] '}' 'from' STRING [';']
    std::unique_ptr<ImportDecl> parseImport();

    /// symbol := qualifiedName ['as' IDENT]
    std::unique_ptr<ImportedSymbol> parseImportedSymbol();

    /// 解析一条语句（节点定义、边或属性）并加入容器
    /// \return 成功返回 true
    bool parseStatement(MachineDecl* machine, NodeDecl* parent);

    /// 节点定义的剩余部分：[STRING] ['{' body '}'] [';']
    std::unique_ptr<NodeDecl> parseNodeRest(const std::string& type,
                                            const NodeRef& name,
                                            SourceLocation startLoc);

    /// 节点体，直到匹配的 '}'
    void parseNodeBody(NodeDecl* node);

    /// 边链的剩余部分：(arrow group)+ [';']
    std::unique_ptr<EdgeDecl> parseEdgeRest(std::vector<NodeRef> firstGroup);

    /// 属性的剩余部分：[':'] value [';']
    Attribute parseAttributeRest(const NodeRef& name);

    /// annotation := '@' IDENT ['(' ... ')']
    void parseAnnotation();

    /// qualifiedName := IDENT {'.' IDENT}
    bool parseQualifiedName(NodeRef& out);

    // =========================================================================
    // 错误恢复
    // =========================================================================

    void reportExpected(TokenKind expected);
    void reportExpectedIdentifier();

    /// 跳过当前行剩余的 Token（遇到 '}' 停止）
    void skipToNextLine();

    /// 跳过一个平衡的括号块（当前 Token 为开括号）
    void skipBalanced();

    /// 截取 [begin, end) 之间的源码文本
    std::string getSourceText(SourceLocation begin, SourceLocation end) const;

    bool onSameLine(const Token& a, const Token& b) const;
};

} // namespace machlink

#endif // MACHLINK_PARSER_PARSER_H

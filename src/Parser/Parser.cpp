/// \file Parser.cpp
/// \brief 结构化语法分析器实现。

#include "machlink/Parser/Parser.h"
#include "machlink/Basic/Diagnostic.h"
#include "machlink/Basic/SourceManager.h"
#include "machlink/Lexer/Lexer.h"

namespace machlink {

namespace {

/// 错误信息中 Token 的显示文本
std::string describe(const Token& tok) {
    if (tok.isEOF()) {
        return "end of file";
    }
    return tok.getText().empty() ? tok.getSpelling() : tok.getText();
}

TokenKind getClosingKind(TokenKind open) {
    switch (open) {
        case TokenKind::LBrace: return TokenKind::RBrace;
        case TokenKind::LBracket: return TokenKind::RBracket;
        case TokenKind::LParen: return TokenKind::RParen;
        default: return open;
    }
}

bool isOpenBracket(const Token& tok) {
    return tok.isOneOf(TokenKind::LBrace, TokenKind::LBracket, TokenKind::LParen);
}

} // anonymous namespace

Parser::Parser(Lexer& lexer, DiagnosticEngine& diag)
    : Lex(lexer), Diag(diag), InitialErrorCount(diag.getErrorCount()) {
    // 读取第一个 Token
    CurTok = Lex.lex();
}

bool Parser::hasErrors() const {
    return Diag.getErrorCount() > InitialErrorCount;
}

// ============================================================================
// Token 操作
// ============================================================================

Token Parser::peekAhead(unsigned n) {
    if (n == 0) {
        return CurTok;
    }
    return Lex.peek(n - 1);
}

Token Parser::consume() {
    PrevTok = CurTok;
    CurTok = Lex.lex();
    return PrevTok;
}

bool Parser::match(TokenKind kind) {
    if (!check(kind)) {
        return false;
    }
    consume();
    return true;
}

bool Parser::expect(TokenKind kind) {
    if (match(kind)) {
        return true;
    }
    reportExpected(kind);
    return false;
}

// ============================================================================
// 顶层
// ============================================================================

std::unique_ptr<MachineDecl> Parser::parseMachine() {
    SourceLocation startLoc = CurTok.getLocation();
    auto machine = std::make_unique<MachineDecl>(SourceRange(startLoc));
    bool seenDefinition = false;

    while (!CurTok.isEOF()) {
        if (check(TokenKind::KW_import)) {
            Token importTok = CurTok;
            auto import = parseImport();
            if (seenDefinition) {
                Diag.report(DiagID::err_import_after_definition, importTok.getRange());
            }
            if (import) {
                machine->addImport(std::move(import));
            }
            continue;
        }

        if (check(TokenKind::KW_machine)) {
            consume();
            if (!check(TokenKind::StringLiteral)) {
                Diag.report(DiagID::err_expected_string, CurTok.getRange())
                    << describe(CurTok);
                skipToNextLine();
                continue;
            }
            Token titleTok = consume();
            if (machine->getTitle()) {
                Diag.report(DiagID::err_duplicate_machine_title, titleTok.getRange())
                    << *machine->getTitle();
            } else {
                machine->setTitle(Lexer::getStringValue(titleTok.getText()));
            }
            match(TokenKind::Semicolon);
            continue;
        }

        if (check(TokenKind::At)) {
            parseAnnotation();
            continue;
        }

        if (match(TokenKind::Semicolon)) {
            continue;
        }

        if (check(TokenKind::Identifier)) {
            seenDefinition = true;
            if (!parseStatement(machine.get(), nullptr)) {
                skipToNextLine();
            }
            continue;
        }

        Diag.report(DiagID::err_unexpected_token, CurTok.getRange()) << describe(CurTok);
        if (isOpenBracket(CurTok)) {
            skipBalanced();
        } else {
            consume();
        }
    }

    machine->setRange(SourceRange(startLoc, CurTok.getLocation()));
    return machine;
}

// ============================================================================
// import
// ============================================================================

std::unique_ptr<ImportDecl> Parser::parseImport() {
    SourceLocation startLoc = consume().getLocation();  // 'import'

    if (!expect(TokenKind::LBrace)) {
        skipToNextLine();
        return nullptr;
    }

    std::vector<std::unique_ptr<ImportedSymbol>> symbols;
    while (!check(TokenKind::RBrace) && !CurTok.isEOF()) {
        auto symbol = parseImportedSymbol();
        if (!symbol) {
            while (!check(TokenKind::RBrace) && !check(TokenKind::KW_from) &&
                   !CurTok.isEOF()) {
                consume();
            }
            break;
        }
        symbols.push_back(std::move(symbol));
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    if (!expect(TokenKind::RBrace) || !expect(TokenKind::KW_from)) {
        skipToNextLine();
        return nullptr;
    }

    if (!check(TokenKind::StringLiteral)) {
        Diag.report(DiagID::err_expected_string, CurTok.getRange()) << describe(CurTok);
        skipToNextLine();
        return nullptr;
    }

    Token pathTok = consume();
    auto import = std::make_unique<ImportDecl>(
        SourceRange(startLoc, pathTok.getRange().getEnd()),
        Lexer::getStringValue(pathTok.getText()));
    import->setPathRange(pathTok.getRange());
    for (auto& symbol : symbols) {
        import->addSymbol(std::move(symbol));
    }

    match(TokenKind::Semicolon);
    return import;
}

std::unique_ptr<ImportedSymbol> Parser::parseImportedSymbol() {
    NodeRef name;
    if (!parseQualifiedName(name)) {
        return nullptr;
    }

    SourceLocation endLoc = name.Range.getEnd();
    std::optional<std::string> alias;
    if (match(TokenKind::KW_as)) {
        if (!check(TokenKind::Identifier)) {
            reportExpectedIdentifier();
            return nullptr;
        }
        Token aliasTok = consume();
        alias = aliasTok.getText();
        endLoc = aliasTok.getRange().getEnd();
    }

    return std::make_unique<ImportedSymbol>(
        SourceRange(name.Range.getBegin(), endLoc), name.Name, std::move(alias));
}

// ============================================================================
// 语句
// ============================================================================

bool Parser::parseStatement(MachineDecl* machine, NodeDecl* parent) {
    SourceLocation startLoc = CurTok.getLocation();

    NodeRef first;
    if (!parseQualifiedName(first)) {
        return false;
    }

    // 边：A --> B 或 A, B --> C
    if (CurTok.isArrow() || check(TokenKind::Comma)) {
        std::vector<NodeRef> group{first};
        while (match(TokenKind::Comma)) {
            NodeRef ref;
            if (!parseQualifiedName(ref)) {
                return false;
            }
            group.push_back(std::move(ref));
        }

        auto edge = parseEdgeRest(std::move(group));
        if (!edge) {
            return false;
        }
        PendingAnnotations.clear();
        if (parent) {
            parent->addEdge(std::move(edge));
        } else {
            machine->addEdge(std::move(edge));
        }
        return true;
    }

    bool isSimpleName = first.Name.find('.') == std::string::npos;

    // 属性：name: value 或 name<type>: value
    if (isSimpleName && (check(TokenKind::Colon) || check(TokenKind::Less))) {
        Attribute attr = parseAttributeRest(first);
        PendingAnnotations.clear();
        if (parent) {
            parent->addAttribute(std::move(attr));
        } else {
            machine->addAttribute(std::move(attr));
        }
        return true;
    }

    // 节点：type Name 或仅 Name
    std::string type;
    NodeRef name = first;
    if (isSimpleName && check(TokenKind::Identifier) && onSameLine(PrevTok, CurTok)) {
        type = first.Name;
        if (!parseQualifiedName(name)) {
            return false;
        }
    }

    auto node = parseNodeRest(type, name, startLoc);
    if (parent) {
        parent->addChild(std::move(node));
    } else {
        machine->addNode(std::move(node));
    }
    return true;
}

std::unique_ptr<NodeDecl> Parser::parseNodeRest(const std::string& type,
                                                const NodeRef& name,
                                                SourceLocation startLoc) {
    auto node = std::make_unique<NodeDecl>(SourceRange(startLoc, name.Range.getEnd()),
                                           type, name.Name);
    node->setNameRange(name.Range);

    if (check(TokenKind::StringLiteral)) {
        node->setTitle(Lexer::getStringValue(consume().getText()));
    }

    // 写在名称之后同一行的注解
    while (check(TokenKind::At) && onSameLine(PrevTok, CurTok)) {
        parseAnnotation();
    }
    for (auto& annotation : PendingAnnotations) {
        node->addAnnotation(std::move(annotation));
    }
    PendingAnnotations.clear();

    if (match(TokenKind::LBrace)) {
        parseNodeBody(node.get());
    }
    match(TokenKind::Semicolon);

    node->setRange(SourceRange(startLoc, PrevTok.getRange().getEnd()));
    return node;
}

void Parser::parseNodeBody(NodeDecl* node) {
    Token openTok = PrevTok;

    while (!check(TokenKind::RBrace) && !CurTok.isEOF()) {
        if (check(TokenKind::At)) {
            parseAnnotation();
            continue;
        }
        if (match(TokenKind::Semicolon)) {
            continue;
        }
        if (check(TokenKind::Identifier)) {
            if (!parseStatement(nullptr, node)) {
                skipToNextLine();
            }
            continue;
        }

        // 其余内容按 Token 跳过
        if (isOpenBracket(CurTok)) {
            skipBalanced();
        } else {
            consume();
        }
    }

    if (!match(TokenKind::RBrace)) {
        Diag.report(DiagID::err_expected_rbrace, openTok.getRange()) << node->getName();
    }
}

std::unique_ptr<EdgeDecl> Parser::parseEdgeRest(std::vector<NodeRef> firstGroup) {
    SourceLocation beginLoc = firstGroup.front().Range.getBegin();
    auto edge = std::make_unique<EdgeDecl>(SourceRange(beginLoc));
    edge->addGroup(std::move(firstGroup));

    if (!CurTok.isArrow()) {
        reportExpected(TokenKind::LongArrow);
        return nullptr;
    }

    while (CurTok.isArrow()) {
        edge->addArrow(consume().getText());

        std::vector<NodeRef> group;
        do {
            NodeRef ref;
            if (!parseQualifiedName(ref)) {
                return nullptr;
            }
            group.push_back(std::move(ref));
        } while (match(TokenKind::Comma));
        edge->addGroup(std::move(group));
    }

    // 边上的属性块不属于结构信息
    if (check(TokenKind::LBrace) && onSameLine(PrevTok, CurTok)) {
        skipBalanced();
    }
    match(TokenKind::Semicolon);

    edge->setRange(SourceRange(beginLoc, PrevTok.getRange().getEnd()));
    return edge;
}

Attribute Parser::parseAttributeRest(const NodeRef& name) {
    Attribute attr;
    attr.Name = name.Name;
    attr.Range = name.Range;

    // 类型标注 name<type>
    if (match(TokenKind::Less)) {
        while (!check(TokenKind::Greater) && !CurTok.isEOF() &&
               onSameLine(PrevTok, CurTok)) {
            consume();
        }
        if (!expect(TokenKind::Greater)) {
            return attr;
        }
    }

    if (!expect(TokenKind::Colon)) {
        return attr;
    }

    Token firstValue = CurTok;
    SourceLocation valueEnd;
    unsigned numTokens = 0;
    while (!CurTok.isEOF() && !check(TokenKind::Semicolon) &&
           !check(TokenKind::RBrace) && onSameLine(PrevTok, CurTok)) {
        if (isOpenBracket(CurTok)) {
            skipBalanced();
        } else {
            consume();
        }
        ++numTokens;
        valueEnd = PrevTok.getRange().getEnd();
    }

    if (numTokens == 1 && firstValue.is(TokenKind::StringLiteral)) {
        attr.Value = Lexer::getStringValue(firstValue.getText());
    } else if (numTokens > 0) {
        attr.Value = getSourceText(firstValue.getLocation(), valueEnd);
    }

    match(TokenKind::Semicolon);
    attr.Range = SourceRange(name.Range.getBegin(), PrevTok.getRange().getEnd());
    return attr;
}

void Parser::parseAnnotation() {
    Token atTok = consume();  // '@'
    if (!check(TokenKind::Identifier)) {
        reportExpectedIdentifier();
        return;
    }
    consume();
    if (check(TokenKind::LParen) && onSameLine(PrevTok, CurTok)) {
        skipBalanced();
    }
    PendingAnnotations.push_back(
        getSourceText(atTok.getLocation(), PrevTok.getRange().getEnd()));
}

bool Parser::parseQualifiedName(NodeRef& out) {
    if (!check(TokenKind::Identifier)) {
        reportExpectedIdentifier();
        return false;
    }

    Token firstTok = consume();
    out.Name = firstTok.getText();
    SourceLocation endLoc = firstTok.getRange().getEnd();

    while (check(TokenKind::Dot) && peekAhead().is(TokenKind::Identifier)) {
        consume();
        Token part = consume();
        out.Name += ".";
        out.Name += part.getText();
        endLoc = part.getRange().getEnd();
    }

    out.Range = SourceRange(firstTok.getLocation(), endLoc);
    return true;
}

// ============================================================================
// 错误恢复
// ============================================================================

void Parser::reportExpected(TokenKind expected) {
    Diag.report(DiagID::err_expected_token, CurTok.getRange())
        << getSpelling(expected) << describe(CurTok);
}

void Parser::reportExpectedIdentifier() {
    Diag.report(DiagID::err_expected_identifier, CurTok.getRange()) << describe(CurTok);
}

void Parser::skipToNextLine() {
    while (!CurTok.isEOF() && !check(TokenKind::RBrace) && onSameLine(PrevTok, CurTok)) {
        if (isOpenBracket(CurTok)) {
            skipBalanced();
        } else {
            consume();
        }
    }
}

void Parser::skipBalanced() {
    TokenKind open = CurTok.getKind();
    TokenKind close = getClosingKind(open);
    unsigned depth = 0;

    do {
        if (check(open)) {
            ++depth;
        } else if (check(close)) {
            --depth;
        }
        consume();
    } while (depth > 0 && !CurTok.isEOF());
}

std::string Parser::getSourceText(SourceLocation begin, SourceLocation end) const {
    const SourceManager& sm = Diag.getSourceManager();
    auto fid = sm.getFileID(begin);
    if (fid == SourceManager::InvalidFileID || end.getOffset() < begin.getOffset()) {
        return std::string();
    }

    const std::string& buffer = sm.getBufferData(fid);
    size_t from = begin.getOffset() - sm.getLocation(fid, 0).getOffset();
    if (from > buffer.size()) {
        return std::string();
    }
    return buffer.substr(from, end.getOffset() - begin.getOffset());
}

bool Parser::onSameLine(const Token& a, const Token& b) const {
    return !Lex.isNewLineBetween(a.getLocation(), b.getLocation());
}

} // namespace machlink

/// \file Lexer.cpp
/// \brief Implementation of lexical analyzer.

#include "machlink/Lexer/Lexer.h"
#include "machlink/Basic/Diagnostic.h"
#include <unordered_map>

namespace machlink {

/// \brief 关键字查找表
static const std::unordered_map<std::string, TokenKind> KeywordMap = {
    {"machine", TokenKind::KW_machine},
    {"import", TokenKind::KW_import},
    {"from", TokenKind::KW_from},
    {"as", TokenKind::KW_as},
};

Lexer::Lexer(SourceManager& sm, DiagnosticEngine& diag,
             SourceManager::FileID fileID)
    : SM(sm), Diag(diag), FileID(fileID) {
    const std::string& content = SM.getBufferData(fileID);
    BufferStart = content.data();
    BufferEnd = BufferStart + content.size();
    CurPtr = BufferStart;
}

Token Lexer::lex() {
    // 如果有缓存的 lookahead tokens，返回第一个
    if (!LookaheadTokens.empty()) {
        Token token = LookaheadTokens.front();
        LookaheadTokens.pop_front();
        return token;
    }

    return lexImpl();
}

Token Lexer::peek() {
    return peek(0);
}

Token Lexer::peek(unsigned n) {
    while (LookaheadTokens.size() <= n) {
        LookaheadTokens.push_back(lexImpl());
    }

    return LookaheadTokens[n];
}

bool Lexer::isNewLineBetween(SourceLocation left, SourceLocation right) const {
    if (left.isInvalid() || right.isInvalid()) {
        return false;
    }
    auto leftPos = SM.getLineAndColumn(left);
    auto rightPos = SM.getLineAndColumn(right);
    return leftPos.first != rightPos.first;
}

bool Lexer::isAtEnd() const {
    return CurPtr >= BufferEnd;
}

Token Lexer::lexImpl() {
    while (true) {
        skipWhitespace();

        if (isAtEnd()) {
            return Token(TokenKind::EndOfFile, getLocation(), "");
        }

        char c = peekChar();

        if (isIdentifierStart(c)) {
            return lexIdentifier();
        }

        if (isDigit(c)) {
            return lexNumber();
        }

        if (c == '"' || c == '\'') {
            Token token = lexString();
            if (token.isValid()) {
                return token;
            }
            // 未闭合的字符串已报告，继续分析下一个 token
            continue;
        }

        Token token = lexOperator();
        if (token.isValid()) {
            return token;
        }
        // 无效字符已报告并跳过
    }
}

void Lexer::skipWhitespace() {
    while (!isAtEnd()) {
        char c = peekChar();

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            consumeChar();
            continue;
        }

        // 行注释 (// ...)
        if (c == '/' && peekChar(1) == '/') {
            skipLineComment();
            continue;
        }

        // 块注释 (/* ... */)
        if (c == '/' && peekChar(1) == '*') {
            skipBlockComment();
            continue;
        }

        break;
    }
}

void Lexer::skipLineComment() {
    while (!isAtEnd() && peekChar() != '\n') {
        consumeChar();
    }
}

void Lexer::skipBlockComment() {
    SourceLocation startLoc = getLocation();

    // 跳过 "/*"
    consumeChar();
    consumeChar();

    while (!isAtEnd()) {
        if (peekChar() == '*' && peekChar(1) == '/') {
            consumeChar();
            consumeChar();
            return;
        }
        consumeChar();
    }

    // 到达文件末尾但没有找到结束标记
    Diag.report(DiagID::err_unterminated_block_comment,
                SourceRange(startLoc, getLocation()));
}

bool Lexer::isIdentifierStart(char c) const {
    // 非 ASCII 字节按标识符处理，允许 UTF-8 名称
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::isIdentifierContinue(char c) const {
    return isIdentifierStart(c) || isDigit(c);
}

bool Lexer::isDigit(char c) const {
    return c >= '0' && c <= '9';
}

char Lexer::peekChar() const {
    return isAtEnd() ? '\0' : *CurPtr;
}

char Lexer::peekChar(unsigned n) const {
    return (CurPtr + n < BufferEnd) ? CurPtr[n] : '\0';
}

char Lexer::consumeChar() {
    if (isAtEnd()) {
        return '\0';
    }
    return *CurPtr++;
}

SourceLocation Lexer::getLocation() const {
    return SM.getLocation(FileID, static_cast<uint32_t>(CurPtr - BufferStart));
}

Token Lexer::lexIdentifier() {
    SourceLocation startLoc = getLocation();
    const char* start = CurPtr;

    while (!isAtEnd() && isIdentifierContinue(peekChar())) {
        consumeChar();
    }

    std::string text(start, CurPtr - start);
    auto it = KeywordMap.find(text);
    if (it != KeywordMap.end()) {
        return Token(it->second, startLoc, text);
    }
    return Token(TokenKind::Identifier, startLoc, text);
}

Token Lexer::lexNumber() {
    SourceLocation startLoc = getLocation();
    const char* start = CurPtr;

    while (isDigit(peekChar())) {
        consumeChar();
    }

    // 小数部分：必须是 '.' 后跟数字，否则 '.' 属于下一个 token
    if (peekChar() == '.' && isDigit(peekChar(1))) {
        consumeChar();
        while (isDigit(peekChar())) {
            consumeChar();
        }
    }

    // 单位后缀，例如 30s、500ms
    while (isIdentifierContinue(peekChar())) {
        consumeChar();
    }

    return Token(TokenKind::NumberLiteral, startLoc, std::string(start, CurPtr - start));
}

Token Lexer::lexString() {
    SourceLocation startLoc = getLocation();
    const char* start = CurPtr;
    char quote = consumeChar();

    while (!isAtEnd()) {
        char c = peekChar();

        if (c == quote) {
            consumeChar();
            return Token(TokenKind::StringLiteral, startLoc,
                         std::string(start, CurPtr - start));
        }

        if (c == '\\') {
            consumeChar();
            if (isAtEnd()) {
                break;
            }
            char escapeChar = consumeChar();
            processEscapeSequence(startLoc, escapeChar);
            continue;
        }

        // 普通字符串不能包含未转义的换行符
        if (c == '\n' || c == '\r') {
            Diag.report(DiagID::err_unterminated_string,
                        SourceRange(startLoc, getLocation()));
            return Token();
        }

        consumeChar();
    }

    Diag.report(DiagID::err_unterminated_string,
                SourceRange(startLoc, getLocation()));
    return Token();
}

void Lexer::processEscapeSequence(SourceLocation startLoc, char escapeChar) {
    switch (escapeChar) {
        case 'n': case 't': case 'r': case '\\': case '\'': case '"': case '0':
            return;
        default:
            Diag.report(DiagID::err_invalid_escape_sequence, startLoc)
                << std::string(1, escapeChar);
            return;
    }
}

Token Lexer::lexOperator() {
    SourceLocation startLoc = getLocation();
    char c = consumeChar();

    auto make = [&](TokenKind kind, unsigned extra) {
        const char* start = CurPtr - 1;
        for (unsigned i = 0; i < extra; ++i) {
            consumeChar();
        }
        return Token(kind, startLoc, std::string(start, CurPtr - start));
    };

    switch (c) {
        case '-':
            if (peekChar() == '-' && peekChar(1) == '>') {
                return make(TokenKind::LongArrow, 2);
            }
            if (peekChar() == '>') {
                return make(TokenKind::Arrow, 1);
            }
            return make(TokenKind::Minus, 0);
        case '<':
            if (peekChar() == '-' && peekChar(1) == '-' && peekChar(2) == '>') {
                return make(TokenKind::BiArrow, 3);
            }
            if (peekChar() == '-') {
                return make(TokenKind::LeftArrow, 1);
            }
            return make(TokenKind::Less, 0);
        case '=':
            if (peekChar() == '>') {
                return make(TokenKind::FatArrow, 1);
            }
            return make(TokenKind::Equal, 0);
        case '+': return make(TokenKind::Plus, 0);
        case '*': return make(TokenKind::Star, 0);
        case '/': return make(TokenKind::Slash, 0);
        case '>': return make(TokenKind::Greater, 0);
        case '?': return make(TokenKind::Question, 0);
        case '!': return make(TokenKind::Exclaim, 0);
        case '|': return make(TokenKind::Pipe, 0);
        case '&': return make(TokenKind::Amp, 0);
        case '#': return make(TokenKind::Hash, 0);
        case '(': return make(TokenKind::LParen, 0);
        case ')': return make(TokenKind::RParen, 0);
        case '[': return make(TokenKind::LBracket, 0);
        case ']': return make(TokenKind::RBracket, 0);
        case '{': return make(TokenKind::LBrace, 0);
        case '}': return make(TokenKind::RBrace, 0);
        case ',': return make(TokenKind::Comma, 0);
        case ':': return make(TokenKind::Colon, 0);
        case ';': return make(TokenKind::Semicolon, 0);
        case '.': return make(TokenKind::Dot, 0);
        case '@': return make(TokenKind::At, 0);
        default:
            break;
    }

    Diag.report(DiagID::err_invalid_character, startLoc) << std::string(1, c);
    return Token();
}

std::string Lexer::getStringValue(const std::string& literal) {
    if (literal.size() < 2) {
        return std::string();
    }

    std::string result;
    result.reserve(literal.size() - 2);
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        char c = literal[i];
        if (c != '\\' || i + 2 >= literal.size()) {
            result += c;
            continue;
        }
        char next = literal[++i];
        switch (next) {
            case 'n': result += '\n'; break;
            case 't': result += '\t'; break;
            case 'r': result += '\r'; break;
            case '0': result += '\0'; break;
            case '\\': case '\'': case '"': result += next; break;
            default:
                result += '\\';
                result += next;
                break;
        }
    }
    return result;
}

} // namespace machlink

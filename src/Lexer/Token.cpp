#include "machlink/Lexer/Token.h"

namespace machlink {

Token::Token(TokenKind kind, SourceLocation loc, const std::string& text)
    : Kind(kind), Loc(loc), Text(text) {
}

SourceRange Token::getRange() const {
    // SourceLocation 的偏移量是全局字节偏移
    uint32_t endOffset = Loc.getOffset() + static_cast<uint32_t>(Text.length());
    return SourceRange(Loc, SourceLocation(endOffset));
}

bool Token::isKeyword() const {
    switch (Kind) {
        case TokenKind::KW_machine:
        case TokenKind::KW_import:
        case TokenKind::KW_from:
        case TokenKind::KW_as:
            return true;
        default:
            return false;
    }
}

} // namespace machlink

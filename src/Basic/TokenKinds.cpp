#include "machlink/Basic/TokenKinds.h"

namespace machlink {

const char* getTokenName(TokenKind kind) {
    switch (kind) {
        case TokenKind::EndOfFile: return "EndOfFile";
        case TokenKind::Invalid: return "Invalid";

        // 标识符和字面量
        case TokenKind::Identifier: return "Identifier";
        case TokenKind::NumberLiteral: return "NumberLiteral";
        case TokenKind::StringLiteral: return "StringLiteral";

        // 关键字
        case TokenKind::KW_machine: return "machine";
        case TokenKind::KW_import: return "import";
        case TokenKind::KW_from: return "from";
        case TokenKind::KW_as: return "as";

        // 边箭头
        case TokenKind::Arrow: return "Arrow";
        case TokenKind::LongArrow: return "LongArrow";
        case TokenKind::FatArrow: return "FatArrow";
        case TokenKind::BiArrow: return "BiArrow";
        case TokenKind::LeftArrow: return "LeftArrow";

        default:
            return getSpelling(kind);
    }
}

const char* getSpelling(TokenKind kind) {
    switch (kind) {
        case TokenKind::EndOfFile: return "<eof>";
        case TokenKind::Invalid: return "<invalid>";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::NumberLiteral: return "number";
        case TokenKind::StringLiteral: return "string";

        case TokenKind::KW_machine: return "machine";
        case TokenKind::KW_import: return "import";
        case TokenKind::KW_from: return "from";
        case TokenKind::KW_as: return "as";

        case TokenKind::Arrow: return "->";
        case TokenKind::LongArrow: return "-->";
        case TokenKind::FatArrow: return "=>";
        case TokenKind::BiArrow: return "<-->";
        case TokenKind::LeftArrow: return "<-";

        case TokenKind::Minus: return "-";
        case TokenKind::Plus: return "+";
        case TokenKind::Star: return "*";
        case TokenKind::Slash: return "/";
        case TokenKind::Less: return "<";
        case TokenKind::Greater: return ">";
        case TokenKind::Equal: return "=";
        case TokenKind::Question: return "?";
        case TokenKind::Exclaim: return "!";
        case TokenKind::Pipe: return "|";
        case TokenKind::Amp: return "&";
        case TokenKind::Hash: return "#";

        case TokenKind::LParen: return "(";
        case TokenKind::RParen: return ")";
        case TokenKind::LBracket: return "[";
        case TokenKind::RBracket: return "]";
        case TokenKind::LBrace: return "{";
        case TokenKind::RBrace: return "}";
        case TokenKind::Comma: return ",";
        case TokenKind::Colon: return ":";
        case TokenKind::Semicolon: return ";";
        case TokenKind::Dot: return ".";
        case TokenKind::At: return "@";

        case TokenKind::NUM_TOKENS: break;
    }
    return "<unknown>";
}

} // namespace machlink

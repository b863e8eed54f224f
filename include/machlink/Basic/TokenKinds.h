#ifndef MACHLINK_BASIC_TOKENKINDS_H
#define MACHLINK_BASIC_TOKENKINDS_H

#include <cstdint>

namespace machlink {

/// Token 类型枚举
enum class TokenKind : uint16_t {
    // 特殊 Token
    EndOfFile,
    Invalid,

    // 标识符和字面量
    Identifier,
    NumberLiteral,
    StringLiteral,

    // 关键字
    KW_machine,
    KW_import,
    KW_from,
    KW_as,

    // 边箭头
    Arrow,          // ->
    LongArrow,      // -->
    FatArrow,       // =>
    BiArrow,        // <-->
    LeftArrow,      // <-

    // 运算符
    Minus,          // -
    Plus,           // +
    Star,           // *
    Slash,          // /
    Less,           // <
    Greater,        // >
    Equal,          // =
    Question,       // ?
    Exclaim,        // !
    Pipe,           // |
    Amp,            // &
    Hash,           // #

    // 标点符号
    LParen,         // (
    RParen,         // )
    LBracket,       // [
    RBracket,       // ]
    LBrace,         // {
    RBrace,         // }
    Comma,          // ,
    Colon,          // :
    Semicolon,      // ;
    Dot,            // .
    At,             // @

    NUM_TOKENS
};

/// 获取 Token 类型的名称（用于调试）
const char* getTokenName(TokenKind kind);

/// 获取 Token 类型的拼写（源码中的字符串表示）
const char* getSpelling(TokenKind kind);

/// 是否为边箭头
inline bool isEdgeArrow(TokenKind kind) {
    return kind >= TokenKind::Arrow && kind <= TokenKind::LeftArrow;
}

} // namespace machlink

#endif // MACHLINK_BASIC_TOKENKINDS_H

#ifndef MACHLINK_LEXER_TOKEN_H
#define MACHLINK_LEXER_TOKEN_H

#include "machlink/Basic/TokenKinds.h"
#include "machlink/Basic/SourceLocation.h"
#include <string>

namespace machlink {

/// Token 结构 - 表示词法分析产生的单个 Token
class Token {
public:
    /// 默认构造函数，创建无效 Token
    Token() = default;

    /// 构造函数
    /// \param kind Token 类型
    /// \param loc Token 在源码中的位置
    /// \param text Token 的源码文本（字符串字面量包含引号）
    Token(TokenKind kind, SourceLocation loc, const std::string& text);

    TokenKind getKind() const { return Kind; }
    SourceLocation getLocation() const { return Loc; }

    /// 获取 Token 范围
    SourceRange getRange() const;

    const std::string& getText() const { return Text; }

    bool is(TokenKind k) const { return Kind == k; }
    bool isNot(TokenKind k) const { return Kind != k; }

    bool isOneOf(TokenKind k1, TokenKind k2) const {
        return is(k1) || is(k2);
    }

    template<typename... Ts>
    bool isOneOf(TokenKind k1, TokenKind k2, Ts... ks) const {
        return is(k1) || isOneOf(k2, ks...);
    }

    /// 检查是否为关键字
    bool isKeyword() const;

    /// 检查是否为边箭头
    bool isArrow() const { return isEdgeArrow(Kind); }

    /// 关键字也可以作为名称使用（例如节点类型 `import` 之外的位置）
    bool isNameLike() const { return is(TokenKind::Identifier) || isKeyword(); }

    bool isValid() const { return Kind != TokenKind::Invalid; }
    bool isEOF() const { return Kind == TokenKind::EndOfFile; }

    /// 获取 Token 类型的字符串表示（用于调试）
    const char* getKindName() const { return getTokenName(Kind); }

    /// 获取 Token 类型的拼写
    const char* getSpelling() const { return machlink::getSpelling(Kind); }

private:
    TokenKind Kind = TokenKind::Invalid;
    SourceLocation Loc;
    std::string Text;
};

} // namespace machlink

#endif // MACHLINK_LEXER_TOKEN_H

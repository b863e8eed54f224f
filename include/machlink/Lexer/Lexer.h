/// \file Lexer.h
/// \brief Lexical analyzer interface.

#ifndef MACHLINK_LEXER_LEXER_H
#define MACHLINK_LEXER_LEXER_H

#include "machlink/Lexer/Token.h"
#include "machlink/Basic/SourceLocation.h"
#include "machlink/Basic/SourceManager.h"
#include "machlink/Basic/DiagnosticIDs.h"
#include <deque>

namespace machlink {

class DiagnosticEngine;

/// \brief Lexical analyzer for machine definition files.
///
/// The Lexer tokenizes one source buffer into a stream of tokens. It
/// supports lookahead through the peek() methods and maintains accurate
/// source location information for each token. Dotted names are not joined
/// here: `Group.Child` arrives as identifier, dot, identifier.
class Lexer {
public:
    /// \brief Construct a lexer for a specific buffer.
    /// \param sm Source manager for location services.
    /// \param diag Diagnostic engine for error reporting.
    /// \param fileID The buffer to tokenize.
    Lexer(SourceManager& sm, DiagnosticEngine& diag,
          SourceManager::FileID fileID);

    /// \brief Get the next token from the input stream.
    Token lex();

    /// \brief Look at the next token without consuming it.
    Token peek();

    /// \brief Look at the nth token ahead without consuming any tokens.
    /// \param n The number of tokens to look ahead (0 = next).
    Token peek(unsigned n);

    /// \brief Check if two locations are on different lines.
    bool isNewLineBetween(SourceLocation left, SourceLocation right) const;

    /// \brief Check if we've reached the end of the buffer.
    bool isAtEnd() const;

    SourceManager::FileID getFileID() const { return FileID; }

    /// \brief Decode the value of a string literal token.
    ///
    /// Strips the surrounding quotes and resolves escape sequences. Invalid
    /// escapes have already been reported while lexing and are kept verbatim.
    static std::string getStringValue(const std::string& literal);

private:
    SourceManager& SM;
    DiagnosticEngine& Diag;
    SourceManager::FileID FileID;

    const char* BufferStart;    ///< Start of the input buffer
    const char* BufferEnd;      ///< End of the input buffer
    const char* CurPtr;         ///< Current position in the buffer

    /// \brief Lookahead token cache for peek() operations.
    std::deque<Token> LookaheadTokens;

    Token lexImpl();
    Token lexIdentifier();
    Token lexNumber();
    Token lexString();

    /// \brief Lex an operator, arrow or punctuation.
    Token lexOperator();

    void skipWhitespace();
    void skipLineComment();
    void skipBlockComment();

    bool isIdentifierStart(char c) const;
    bool isIdentifierContinue(char c) const;
    bool isDigit(char c) const;

    char peekChar() const;
    char peekChar(unsigned n) const;
    char consumeChar();

    /// \brief Get the current source location.
    SourceLocation getLocation() const;

    /// \brief Validate the escape sequence following a backslash.
    void processEscapeSequence(SourceLocation startLoc, char escapeChar);
};

} // namespace machlink

#endif // MACHLINK_LEXER_LEXER_H

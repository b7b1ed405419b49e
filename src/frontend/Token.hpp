//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Token.hpp
// Purpose: Declares token kinds and the token record produced by the lexer.
// Key invariants: Tokens are immutable once produced; the stream always
//                 ends with exactly one Eof token.
// Ownership/Lifetime: Value type; string payloads are owned copies.
// Links: frontend/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string>

namespace pgs::frontend
{

/// @brief All token kinds recognized by the lexer.
enum class TokenKind
{
    // Markers
    Eof,   ///< End of input
    Error, ///< Lexical error; the lexer records the diagnostic

    // Literals
    IntLiteral,    ///< Decimal integer literal
    FloatLiteral,  ///< Decimal literal with one decimal point
    StringLiteral, ///< Double-quoted string, escapes decoded

    Identifier,

    // Keywords (keep alphabetical: the keyword table is searched by bisection)
    KwBreak,
    KwCont,
    KwContinue,
    KwElse,
    KwFalse,
    KwFn,
    KwFor,
    KwIf,
    KwImpl,
    KwImport,
    KwIn,
    KwLoop,
    KwMod,
    KwReturn,
    KwTrue,
    KwVar,
    KwWhile,

    // Operators
    Plus,         ///< +
    Minus,        ///< -
    Star,         ///< *
    Slash,        ///< /
    PlusEqual,    ///< +=
    MinusEqual,   ///< -=
    StarEqual,    ///< *=
    SlashEqual,   ///< /=
    EqualEqual,   ///< ==
    BangEqual,    ///< !=
    Less,         ///< <
    LessEqual,    ///< <=
    Greater,      ///< >
    GreaterEqual, ///< >=
    Equal,        ///< =
    ColonColon,   ///< ::
    Colon,        ///< :
    Tilde,        ///< ~
    Bang,         ///< !

    // Punctuation
    LBrace,
    RBrace,
    LParen,
    RParen,
    Comma,
    Semicolon,
    Dot,
};

/// @brief Human-readable spelling of a token kind for diagnostics.
const char *tokenKindToString(TokenKind kind);

/// @brief A single lexical token.
struct Token
{
    /// @brief Classification of this token.
    TokenKind kind{TokenKind::Eof};

    /// @brief Original spelling (decoded contents for string literals).
    std::string text;

    /// @brief Parsed value for IntLiteral tokens.
    int64_t intValue{0};

    /// @brief Parsed value for FloatLiteral tokens.
    double floatValue{0.0};

    /// @brief Source location where the token begins.
    support::SourceLoc loc;

    /// @brief Check the token kind.
    bool is(TokenKind k) const
    {
        return kind == k;
    }
};

} // namespace pgs::frontend

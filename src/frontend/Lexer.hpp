//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Lexer.hpp
// Purpose: Declares the lexer turning script text into tokens.
// Key invariants: Line/column are 1-based; the lexer stops producing tokens
//                 after the first error and keeps returning Error.
// Ownership/Lifetime: Lexer owns a copy of the source buffer.
// Links: frontend/Token.hpp, frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pgs::frontend
{

/// @brief Tokenizes script source text.
/// @details Call next() until Eof or Error is returned.  On Error the
///          diagnostic is available through error().
class Lexer
{
  public:
    /// @brief Create a lexer over @p source tagged with @p fileId.
    Lexer(std::string source, uint32_t fileId);

    /// @brief Produce the next token.
    Token next();

    /// @brief Diagnostic describing the first lexical error, if any.
    const std::optional<support::Diag> &error() const
    {
        return error_;
    }

  private:
    char peekChar(size_t offset = 0) const;

    char getChar();

    bool eof() const;

    /// @brief Skip blanks, newlines and all three comment forms.
    /// @return False when an unterminated block comment was found.
    bool skipWhitespaceAndComments();

    support::SourceLoc currentLoc() const;

    Token lexNumber();

    Token lexIdentifierOrKeyword();

    Token lexString();

    Token lexOperator();

    Token fail(support::ErrorKind kind, support::SourceLoc loc, std::string message);

    std::string src_;
    uint32_t fileId_;
    size_t pos_{0};
    uint32_t line_{1};
    uint32_t column_{1};
    std::optional<support::Diag> error_;
};

/// @brief Tokenize @p source completely.
/// @return Tokens ending with Eof, or the first LexError.
support::Expected<std::vector<Token>> tokenize(const std::string &source, uint32_t fileId = 1);

} // namespace pgs::frontend

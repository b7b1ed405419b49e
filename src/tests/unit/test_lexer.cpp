//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_lexer.cpp
// Purpose: Verify token classification, literal decoding and lexical errors.
// Key invariants: Every token stream ends with Eof; errors carry line/column.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"

#include <clocale>
#include <string>
#include <vector>

using namespace pgs::frontend;
using pgs::support::ErrorKind;

namespace
{
std::vector<TokenKind> kinds(const std::string &src)
{
    auto tokens = tokenize(src);
    EXPECT_TRUE(tokens.hasValue());
    std::vector<TokenKind> out;
    if (tokens)
    {
        for (const auto &tok : tokens.value())
            out.push_back(tok.kind);
    }
    return out;
}

ErrorKind lexError(const std::string &src)
{
    auto tokens = tokenize(src);
    EXPECT_FALSE(tokens.hasValue()) << src;
    return tokens ? ErrorKind::Interrupted : tokens.error().kind;
}
} // namespace

TEST(Lexer, KeywordsAndIdentifiers)
{
    auto got = kinds("mod fn cont impl import var return if else while loop for in break "
                     "continue true false name _x9");
    std::vector<TokenKind> expected = {
        TokenKind::KwMod,      TokenKind::KwFn,      TokenKind::KwCont,   TokenKind::KwImpl,
        TokenKind::KwImport,   TokenKind::KwVar,     TokenKind::KwReturn, TokenKind::KwIf,
        TokenKind::KwElse,     TokenKind::KwWhile,   TokenKind::KwLoop,   TokenKind::KwFor,
        TokenKind::KwIn,       TokenKind::KwBreak,   TokenKind::KwContinue,
        TokenKind::KwTrue,     TokenKind::KwFalse,   TokenKind::Identifier,
        TokenKind::Identifier, TokenKind::Eof,
    };
    EXPECT_EQ(got, expected);
}

TEST(Lexer, OperatorsAndPunctuation)
{
    auto got = kinds("+ - * / += -= *= /= == != < <= > >= = :: : ~ ! { } ( ) , ; .");
    std::vector<TokenKind> expected = {
        TokenKind::Plus,      TokenKind::Minus,        TokenKind::Star,       TokenKind::Slash,
        TokenKind::PlusEqual, TokenKind::MinusEqual,   TokenKind::StarEqual,  TokenKind::SlashEqual,
        TokenKind::EqualEqual, TokenKind::BangEqual,   TokenKind::Less,       TokenKind::LessEqual,
        TokenKind::Greater,   TokenKind::GreaterEqual, TokenKind::Equal,      TokenKind::ColonColon,
        TokenKind::Colon,     TokenKind::Tilde,        TokenKind::Bang,       TokenKind::LBrace,
        TokenKind::RBrace,    TokenKind::LParen,       TokenKind::RParen,     TokenKind::Comma,
        TokenKind::Semicolon, TokenKind::Dot,          TokenKind::Eof,
    };
    EXPECT_EQ(got, expected);
}

TEST(Lexer, EmptyInputIsJustEof)
{
    auto got = kinds("");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], TokenKind::Eof);
}

TEST(Lexer, NumberLiterals)
{
    auto tokens = tokenize("42 3.25 9223372036854775807");
    ASSERT_TRUE(tokens.hasValue());
    const auto &t = tokens.value();
    ASSERT_EQ(t.size(), 4u);
    EXPECT_EQ(t[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(t[0].intValue, 42);
    EXPECT_EQ(t[1].kind, TokenKind::FloatLiteral);
    EXPECT_DOUBLE_EQ(t[1].floatValue, 3.25);
    EXPECT_EQ(t[2].intValue, INT64_MAX);
}

TEST(Lexer, StringEscapesAreDecoded)
{
    auto tokens = tokenize(R"("a\nb\t\\\"")");
    ASSERT_TRUE(tokens.hasValue());
    EXPECT_EQ(tokens.value()[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens.value()[0].text, "a\nb\t\\\"");
}

TEST(Lexer, CommentsAreDiscarded)
{
    auto got = kinds("a // line\n# hash\n/* block\n comment */ b");
    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof};
    EXPECT_EQ(got, expected);
}

TEST(Lexer, PositionsAreOneBased)
{
    auto tokens = tokenize("fn\n  main", 7);
    ASSERT_TRUE(tokens.hasValue());
    const auto &main = tokens.value()[1];
    EXPECT_EQ(main.loc.file_id, 7u);
    EXPECT_EQ(main.loc.line, 2u);
    EXPECT_EQ(main.loc.column, 3u);
}

TEST(Lexer, MalformedNumbers)
{
    EXPECT_EQ(lexError("1.2.3"), ErrorKind::MalformedNumber);
    EXPECT_EQ(lexError("12abc"), ErrorKind::MalformedNumber);
    EXPECT_EQ(lexError("99999999999999999999"), ErrorKind::MalformedNumber);
}

TEST(Lexer, StringErrors)
{
    EXPECT_EQ(lexError("\"open"), ErrorKind::UnterminatedString);
    EXPECT_EQ(lexError("\"line\nbreak\""), ErrorKind::UnterminatedString);
    EXPECT_EQ(lexError(R"("bad \q escape")"), ErrorKind::InvalidEscape);
}

TEST(Lexer, IllegalCharacterCarriesPosition)
{
    auto tokens = tokenize("var x\n  @");
    ASSERT_FALSE(tokens.hasValue());
    EXPECT_EQ(tokens.error().kind, ErrorKind::IllegalCharacter);
    EXPECT_EQ(tokens.error().loc.line, 2u);
    EXPECT_EQ(tokens.error().loc.column, 3u);
}

TEST(Lexer, UnterminatedBlockComment)
{
    EXPECT_EQ(lexError("a /* never closed"), ErrorKind::UnterminatedComment);
}

TEST(Lexer, FloatLiteralsIgnoreHostLocale)
{
    const char *previous = std::setlocale(LC_NUMERIC, nullptr);
    const std::string saved = previous ? previous : "C";

    const char *comma = nullptr;
    for (const char *name : {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"})
    {
        if ((comma = std::setlocale(LC_NUMERIC, name)) != nullptr)
            break;
    }
    if (!comma)
        GTEST_SKIP() << "no locale with a decimal comma is installed";

    auto tokens = tokenize("3.5 0.25");
    std::setlocale(LC_NUMERIC, saved.c_str());

    ASSERT_TRUE(tokens.hasValue());
    EXPECT_DOUBLE_EQ(tokens.value()[0].floatValue, 3.5);
    EXPECT_DOUBLE_EQ(tokens.value()[1].floatValue, 0.25);
}

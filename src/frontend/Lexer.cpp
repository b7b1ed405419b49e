//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the script lexer.  The lexer walks the source buffer one
// character at a time, tracking line and column so that every token and every
// diagnostic points at the exact spot in the script.  Keywords are looked up
// in a sorted table by bisection.  The first malformed construct stops the
// lexer: it records a single diagnostic and yields Error from then on.
//
//===----------------------------------------------------------------------===//

#include "frontend/Lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace pgs::frontend
{

using support::ErrorKind;
using support::SourceLoc;

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by key for std::lower_bound.
constexpr std::array<KeywordEntry, 17> kKeywordTable = {{
    {"break", TokenKind::KwBreak},
    {"cont", TokenKind::KwCont},
    {"continue", TokenKind::KwContinue},
    {"else", TokenKind::KwElse},
    {"false", TokenKind::KwFalse},
    {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"impl", TokenKind::KwImpl},
    {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},
    {"loop", TokenKind::KwLoop},
    {"mod", TokenKind::KwMod},
    {"return", TokenKind::KwReturn},
    {"true", TokenKind::KwTrue},
    {"var", TokenKind::KwVar},
    {"while", TokenKind::KwWhile},
}};

std::optional<TokenKind> lookupKeyword(std::string_view text)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               text,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == text)
        return it->kind;
    return std::nullopt;
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return isIdentStart(c) || isDigit(c);
}

} // namespace

Lexer::Lexer(std::string source, uint32_t fileId) : src_(std::move(source)), fileId_(fileId) {}

char Lexer::peekChar(size_t offset) const
{
    size_t idx = pos_ + offset;
    return idx < src_.size() ? src_[idx] : '\0';
}

char Lexer::getChar()
{
    if (eof())
        return '\0';
    char c = src_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= src_.size();
}

SourceLoc Lexer::currentLoc() const
{
    return SourceLoc{fileId_, line_, column_, static_cast<uint32_t>(pos_)};
}

Token Lexer::fail(ErrorKind kind, SourceLoc loc, std::string message)
{
    if (!error_)
        error_ = support::makeError(kind, loc, std::move(message));
    Token tok;
    tok.kind = TokenKind::Error;
    tok.loc = loc;
    return tok;
}

bool Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            getChar();
        }
        else if (c == '#' || (c == '/' && peekChar(1) == '/'))
        {
            while (!eof() && peekChar() != '\n')
                getChar();
        }
        else if (c == '/' && peekChar(1) == '*')
        {
            SourceLoc start = currentLoc();
            getChar();
            getChar();
            bool closed = false;
            while (!eof())
            {
                if (peekChar() == '*' && peekChar(1) == '/')
                {
                    getChar();
                    getChar();
                    closed = true;
                    break;
                }
                getChar();
            }
            if (!closed)
            {
                fail(ErrorKind::UnterminatedComment, start, "unterminated block comment");
                return false;
            }
        }
        else
        {
            break;
        }
    }
    return true;
}

Token Lexer::next()
{
    if (error_)
        return fail(error_->kind, error_->loc, error_->message);

    if (!skipWhitespaceAndComments())
        return fail(error_->kind, error_->loc, error_->message);

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    char c = peekChar();
    if (isDigit(c))
        return lexNumber();
    if (isIdentStart(c))
        return lexIdentifierOrKeyword();
    if (c == '"')
        return lexString();
    return lexOperator();
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::IntLiteral;

    while (isDigit(peekChar()))
        tok.text.push_back(getChar());

    // A '.' followed by a digit starts the fractional part; "1." stays an
    // integer followed by a member access dot.
    if (peekChar() == '.' && isDigit(peekChar(1)))
    {
        tok.kind = TokenKind::FloatLiteral;
        tok.text.push_back(getChar());
        while (isDigit(peekChar()))
            tok.text.push_back(getChar());
        if (peekChar() == '.' && isDigit(peekChar(1)))
        {
            return fail(ErrorKind::MalformedNumber,
                        tok.loc,
                        "malformed number '" + tok.text + ".': more than one decimal point");
        }
    }

    if (isIdentChar(peekChar()))
    {
        std::string tail;
        while (isIdentChar(peekChar()))
            tail.push_back(getChar());
        return fail(ErrorKind::MalformedNumber, tok.loc, "malformed number '" + tok.text + tail + "'");
    }

    if (tok.kind == TokenKind::IntLiteral)
    {
        const char *first = tok.text.data();
        const char *last = first + tok.text.size();
        auto [ptr, ec] = std::from_chars(first, last, tok.intValue);
        if (ec != std::errc() || ptr != last)
        {
            return fail(ErrorKind::MalformedNumber,
                        tok.loc,
                        "integer literal '" + tok.text + "' is out of range");
        }
    }
    else
    {
        // Independent of LC_NUMERIC.
        const char *first = tok.text.data();
        const char *last = first + tok.text.size();
        auto [ptr, ec] = std::from_chars(first, last, tok.floatValue);
        if (ec != std::errc() || ptr != last)
        {
            return fail(ErrorKind::MalformedNumber,
                        tok.loc,
                        "float literal '" + tok.text + "' is out of range");
        }
    }
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    while (isIdentChar(peekChar()))
        tok.text.push_back(getChar());

    if (auto kw = lookupKeyword(tok.text))
        tok.kind = *kw;
    else
        tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::StringLiteral;
    getChar(); // opening quote

    while (true)
    {
        if (eof() || peekChar() == '\n')
            return fail(ErrorKind::UnterminatedString, tok.loc, "unterminated string literal");

        char c = getChar();
        if (c == '"')
            break;
        if (c != '\\')
        {
            tok.text.push_back(c);
            continue;
        }

        SourceLoc escLoc = currentLoc();
        if (eof())
            return fail(ErrorKind::UnterminatedString, tok.loc, "unterminated string literal");
        char esc = getChar();
        switch (esc)
        {
            case 'n':
                tok.text.push_back('\n');
                break;
            case 't':
                tok.text.push_back('\t');
                break;
            case 'r':
                tok.text.push_back('\r');
                break;
            case '0':
                tok.text.push_back('\0');
                break;
            case '\\':
                tok.text.push_back('\\');
                break;
            case '"':
                tok.text.push_back('"');
                break;
            default:
                return fail(ErrorKind::InvalidEscape,
                            escLoc,
                            std::string("invalid escape sequence '\\") + esc + "'");
        }
    }
    return tok;
}

Token Lexer::lexOperator()
{
    Token tok;
    tok.loc = currentLoc();
    char c = getChar();
    char n = peekChar();
    tok.text.push_back(c);

    auto two = [&](TokenKind kind)
    {
        tok.text.push_back(getChar());
        tok.kind = kind;
        return tok;
    };

    switch (c)
    {
        case '+':
            if (n == '=')
                return two(TokenKind::PlusEqual);
            tok.kind = TokenKind::Plus;
            return tok;
        case '-':
            if (n == '=')
                return two(TokenKind::MinusEqual);
            tok.kind = TokenKind::Minus;
            return tok;
        case '*':
            if (n == '=')
                return two(TokenKind::StarEqual);
            tok.kind = TokenKind::Star;
            return tok;
        case '/':
            if (n == '=')
                return two(TokenKind::SlashEqual);
            tok.kind = TokenKind::Slash;
            return tok;
        case '=':
            if (n == '=')
                return two(TokenKind::EqualEqual);
            tok.kind = TokenKind::Equal;
            return tok;
        case '!':
            if (n == '=')
                return two(TokenKind::BangEqual);
            tok.kind = TokenKind::Bang;
            return tok;
        case '<':
            if (n == '=')
                return two(TokenKind::LessEqual);
            tok.kind = TokenKind::Less;
            return tok;
        case '>':
            if (n == '=')
                return two(TokenKind::GreaterEqual);
            tok.kind = TokenKind::Greater;
            return tok;
        case ':':
            if (n == ':')
                return two(TokenKind::ColonColon);
            tok.kind = TokenKind::Colon;
            return tok;
        case '~':
            tok.kind = TokenKind::Tilde;
            return tok;
        case '{':
            tok.kind = TokenKind::LBrace;
            return tok;
        case '}':
            tok.kind = TokenKind::RBrace;
            return tok;
        case '(':
            tok.kind = TokenKind::LParen;
            return tok;
        case ')':
            tok.kind = TokenKind::RParen;
            return tok;
        case ',':
            tok.kind = TokenKind::Comma;
            return tok;
        case ';':
            tok.kind = TokenKind::Semicolon;
            return tok;
        case '.':
            tok.kind = TokenKind::Dot;
            return tok;
        default:
            break;
    }

    std::string shown(1, c);
    if (!std::isprint(static_cast<unsigned char>(c)))
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned char>(c));
        shown = buf;
    }
    return fail(ErrorKind::IllegalCharacter, tok.loc, "illegal character '" + shown + "'");
}

support::Expected<std::vector<Token>> tokenize(const std::string &source, uint32_t fileId)
{
    Lexer lexer(source, fileId);
    std::vector<Token> tokens;
    while (true)
    {
        Token tok = lexer.next();
        if (tok.kind == TokenKind::Error)
            return *lexer.error();
        bool done = tok.kind == TokenKind::Eof;
        tokens.push_back(std::move(tok));
        if (done)
            break;
    }
    return tokens;
}

} // namespace pgs::frontend

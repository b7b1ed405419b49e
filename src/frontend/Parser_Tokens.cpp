//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token cursor and error handling for the parser.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pgs::frontend
{

using support::ErrorKind;

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens))
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof)
    {
        Token eof;
        eof.kind = TokenKind::Eof;
        if (!tokens_.empty())
            eof.loc = tokens_.back().loc;
        tokens_.push_back(eof);
    }
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset) const
{
    size_t idx = pos_ + offset;
    if (idx >= tokens_.size())
        return tokens_.back();
    return tokens_[idx];
}

Token Parser::advance()
{
    Token cur = peek();
    if (pos_ + 1 < tokens_.size())
        ++pos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset) const
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }

    ErrorKind errKind = ErrorKind::UnexpectedToken;
    if (kind == TokenKind::Semicolon)
        errKind = ErrorKind::MissingTerminator;
    else if (kind == TokenKind::RBrace || kind == TokenKind::RParen)
        errKind = ErrorKind::UnbalancedDelimiter;

    error(errKind, std::string("expected ") + what + ", found " + describe(peek()));
    return false;
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(ErrorKind kind, const std::string &message)
{
    errorAt(kind, peek().loc, message);
}

void Parser::errorAt(ErrorKind kind, SourceLoc loc, const std::string &message)
{
    if (error_)
        return;
    error_ = support::makeError(kind, loc, message);
}

bool Parser::deepenExpr(unsigned &taken)
{
    ++taken;
    if (++exprDepth_ > kMaxExprDepth)
    {
        error(ErrorKind::UnexpectedToken,
              "expression nesting too deep (limit: " + std::to_string(kMaxExprDepth) + ")");
        return false;
    }
    return true;
}

bool Parser::enterNesting()
{
    if (++nestDepth_ > kMaxNestingDepth)
    {
        --nestDepth_;
        error(ErrorKind::UnexpectedToken,
              "statement nesting too deep (limit: " + std::to_string(kMaxNestingDepth) + ")");
        return false;
    }
    return true;
}

std::string Parser::describe(const Token &tok) const
{
    switch (tok.kind)
    {
        case TokenKind::Identifier:
            return "identifier '" + tok.text + "'";
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
            return std::string(tokenKindToString(tok.kind)) + " '" + tok.text + "'";
        default:
            return tokenKindToString(tok.kind);
    }
}

support::Expected<Program> parse(std::vector<Token> tokens)
{
    Parser parser(std::move(tokens));
    return parser.parseProgram();
}

} // namespace pgs::frontend

//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pgs::frontend
{

using support::ErrorKind;

/// @brief Parse a statement, dispatching on the leading token.
StmtPtr Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::LBrace:
            return parseBlock();
        case TokenKind::KwVar:
            return parseVarDecl();
        case TokenKind::KwReturn:
            return parseReturnStmt();
        case TokenKind::KwIf:
            return parseIfStmt();
        case TokenKind::KwWhile:
            return parseWhileStmt();
        case TokenKind::KwLoop:
            return parseLoopStmt();
        case TokenKind::KwFor:
            return parseForStmt();
        case TokenKind::KwBreak:
        {
            Token kw = advance();
            if (!expect(TokenKind::Semicolon, "';' after 'break'"))
                return nullptr;
            return std::make_unique<BreakStmt>(kw.loc);
        }
        case TokenKind::KwContinue:
        {
            Token kw = advance();
            if (!expect(TokenKind::Semicolon, "';' after 'continue'"))
                return nullptr;
            return std::make_unique<ContinueStmt>(kw.loc);
        }
        default:
            break;
    }

    SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr || !expect(TokenKind::Semicolon, "';' after expression"))
        return nullptr;
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

/// @brief Parse `{ statement* }`; every nested body passes through here.
BlockPtr Parser::parseBlock()
{
    Token open;
    if (!expect(TokenKind::LBrace, "'{'", &open) || !enterNesting())
        return nullptr;
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard()
        {
            --d;
        }
    } nestGuard{nestDepth_};

    auto block = std::make_unique<BlockStmt>(open.loc);
    while (!check(TokenKind::RBrace))
    {
        if (check(TokenKind::Eof))
        {
            errorAt(ErrorKind::UnbalancedDelimiter,
                    peek().loc,
                    "expected '}' to close block opened at " + open.loc.str() +
                        ", found end of input");
            return nullptr;
        }
        StmtPtr stmt = parseStatement();
        if (!stmt)
            return nullptr;
        block->stmts.push_back(std::move(stmt));
    }
    block->endLoc = advance().loc;
    return block;
}

StmtPtr Parser::parseVarDecl()
{
    Token kw = advance();
    Token name;
    if (!expect(TokenKind::Identifier, "variable name", &name) ||
        !expect(TokenKind::Colon, "':' after variable name"))
        return nullptr;
    TypePtr type = parseType();
    if (!type || !expect(TokenKind::Equal, "'=' in variable declaration"))
        return nullptr;
    ExprPtr init = parseExpression();
    if (!init || !expect(TokenKind::Semicolon, "';' after variable declaration"))
        return nullptr;
    return std::make_unique<VarDeclStmt>(kw.loc, name.text, std::move(type), std::move(init));
}

StmtPtr Parser::parseReturnStmt()
{
    Token kw = advance();
    ExprPtr value;
    if (!check(TokenKind::Semicolon))
    {
        value = parseExpression();
        if (!value)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "';' after return"))
        return nullptr;
    return std::make_unique<ReturnStmt>(kw.loc, std::move(value));
}

ExprPtr Parser::parseHeadExpression()
{
    bool saved = noStructLiteral_;
    noStructLiteral_ = true;
    ExprPtr expr = parseExpression();
    noStructLiteral_ = saved;
    return expr;
}

/// @brief Parse `if cond { } (else { } | else if ...)?`.
/// @details An `else if` chain becomes an else block holding a single nested
///          IfStmt, so later stages only ever see two-armed conditionals.
StmtPtr Parser::parseIfStmt()
{
    Token kw = advance();
    ExprPtr cond = parseHeadExpression();
    if (!cond)
        return nullptr;
    BlockPtr thenBlock = parseBlock();
    if (!thenBlock)
        return nullptr;

    BlockPtr elseBlock;
    if (match(TokenKind::KwElse))
    {
        if (check(TokenKind::KwIf))
        {
            SourceLoc nestedLoc = peek().loc;
            if (!enterNesting())
                return nullptr;
            StmtPtr nested = parseIfStmt();
            --nestDepth_;
            if (!nested)
                return nullptr;
            elseBlock = std::make_unique<BlockStmt>(nestedLoc);
            elseBlock->endLoc = nestedLoc;
            elseBlock->stmts.push_back(std::move(nested));
        }
        else
        {
            elseBlock = parseBlock();
            if (!elseBlock)
                return nullptr;
        }
    }
    return std::make_unique<IfStmt>(kw.loc, std::move(cond), std::move(thenBlock), std::move(elseBlock));
}

StmtPtr Parser::parseWhileStmt()
{
    Token kw = advance();
    ExprPtr cond = parseHeadExpression();
    if (!cond)
        return nullptr;
    BlockPtr body = parseBlock();
    if (!body)
        return nullptr;
    return std::make_unique<WhileStmt>(kw.loc, std::move(cond), std::move(body));
}

StmtPtr Parser::parseLoopStmt()
{
    Token kw = advance();
    BlockPtr body = parseBlock();
    if (!body)
        return nullptr;
    return std::make_unique<LoopStmt>(kw.loc, std::move(body));
}

StmtPtr Parser::parseForStmt()
{
    Token kw = advance();
    Token var;
    if (!expect(TokenKind::Identifier, "loop variable", &var) ||
        !expect(TokenKind::KwIn, "'in' after loop variable"))
        return nullptr;
    ExprPtr iterable = parseHeadExpression();
    if (!iterable)
        return nullptr;
    BlockPtr body = parseBlock();
    if (!body)
        return nullptr;
    return std::make_unique<ForStmt>(kw.loc, var.text, var.loc, std::move(iterable), std::move(body));
}

} // namespace pgs::frontend

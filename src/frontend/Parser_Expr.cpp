//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing.
///
/// @details Binary expressions use precedence climbing, one method per level:
///
/// ```
/// parseAssignment -> parseEquality -> parseComparison -> parseAdditive
///                 -> parseMultiplicative -> parseUnary -> parsePostfix
///                 -> parsePrimary
/// ```
///
/// Every binary level loops, so operators at the same level associate to the
/// left.  Assignment recurses into itself and associates to the right.
/// Compound assignment (`+=` and friends) is rewritten here into a plain
/// AssignExpr over a BinaryExpr; later stages never see it.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pgs::frontend
{

using support::ErrorKind;

namespace
{

bool compoundOp(TokenKind kind, BinaryOp &op)
{
    switch (kind)
    {
        case TokenKind::PlusEqual:
            op = BinaryOp::Add;
            return true;
        case TokenKind::MinusEqual:
            op = BinaryOp::Sub;
            return true;
        case TokenKind::StarEqual:
            op = BinaryOp::Mul;
            return true;
        case TokenKind::SlashEqual:
            op = BinaryOp::Div;
            return true;
        default:
            return false;
    }
}

bool isAssignable(const Expr &e)
{
    if (e.kind == ExprKind::Ident)
        return static_cast<const IdentExpr &>(e).path.size() == 1;
    return e.kind == ExprKind::Field;
}

/// Gives back the expression depth a left-associative chain consumed.
struct ChainGuard
{
    unsigned &depth;
    unsigned taken = 0;

    ~ChainGuard()
    {
        depth -= taken;
    }
};

} // namespace

/// @brief Parse a full expression, the entry point for every expression context.
/// @return The expression, or null once a diagnostic has been recorded.
ExprPtr Parser::parseExpression()
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        error(ErrorKind::UnexpectedToken, "expression nesting too deep");
        return nullptr;
    }
    ExprPtr e = parseAssignment();
    --exprDepth_;
    return e;
}

/// @brief Parse `target = value` and the compound forms, right-associative.
/// @details Compound assignment is rewritten to `target = target op value`.
ExprPtr Parser::parseAssignment()
{
    ExprPtr lhs = parseEquality();
    if (!lhs)
        return nullptr;

    BinaryOp op{};
    bool plain = check(TokenKind::Equal);
    if (!plain && !compoundOp(peek().kind, op))
        return lhs;

    Token opTok = advance();
    if (!isAssignable(*lhs))
    {
        errorAt(ErrorKind::UnexpectedToken, opTok.loc, "invalid assignment target");
        return nullptr;
    }

    ChainGuard guard{exprDepth_};
    if (!deepenExpr(guard.taken))
        return nullptr;
    ExprPtr rhs = parseAssignment();
    if (!rhs)
        return nullptr;

    if (!plain)
    {
        ExprPtr current = cloneTarget(*lhs);
        if (!current)
            return nullptr;
        rhs = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(current), std::move(rhs));
    }
    SourceLoc loc = lhs->loc;
    return std::make_unique<AssignExpr>(loc, std::move(lhs), std::move(rhs));
}

/// @brief Parse a left-associative chain of `==` and `!=`.
ExprPtr Parser::parseEquality()
{
    ChainGuard guard{exprDepth_};
    ExprPtr lhs = parseComparison();
    while (lhs)
    {
        BinaryOp op;
        if (check(TokenKind::EqualEqual))
            op = BinaryOp::Eq;
        else if (check(TokenKind::BangEqual))
            op = BinaryOp::Ne;
        else
            break;
        Token opTok = advance();
        if (!deepenExpr(guard.taken))
            return nullptr;
        ExprPtr rhs = parseComparison();
        if (!rhs)
            return nullptr;
        lhs = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

/// @brief Parse a left-associative chain of `<`, `<=`, `>` and `>=`.
ExprPtr Parser::parseComparison()
{
    ChainGuard guard{exprDepth_};
    ExprPtr lhs = parseAdditive();
    while (lhs)
    {
        BinaryOp op;
        switch (peek().kind)
        {
            case TokenKind::Less:
                op = BinaryOp::Lt;
                break;
            case TokenKind::LessEqual:
                op = BinaryOp::Le;
                break;
            case TokenKind::Greater:
                op = BinaryOp::Gt;
                break;
            case TokenKind::GreaterEqual:
                op = BinaryOp::Ge;
                break;
            default:
                return lhs;
        }
        Token opTok = advance();
        if (!deepenExpr(guard.taken))
            return nullptr;
        ExprPtr rhs = parseAdditive();
        if (!rhs)
            return nullptr;
        lhs = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

/// @brief Parse a left-associative chain of `+` and `-`.
ExprPtr Parser::parseAdditive()
{
    ChainGuard guard{exprDepth_};
    ExprPtr lhs = parseMultiplicative();
    while (lhs)
    {
        BinaryOp op;
        if (check(TokenKind::Plus))
            op = BinaryOp::Add;
        else if (check(TokenKind::Minus))
            op = BinaryOp::Sub;
        else
            break;
        Token opTok = advance();
        if (!deepenExpr(guard.taken))
            return nullptr;
        ExprPtr rhs = parseMultiplicative();
        if (!rhs)
            return nullptr;
        lhs = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

/// @brief Parse a left-associative chain of `*` and `/`.
ExprPtr Parser::parseMultiplicative()
{
    ChainGuard guard{exprDepth_};
    ExprPtr lhs = parseUnary();
    while (lhs)
    {
        BinaryOp op;
        if (check(TokenKind::Star))
            op = BinaryOp::Mul;
        else if (check(TokenKind::Slash))
            op = BinaryOp::Div;
        else
            break;
        Token opTok = advance();
        if (!deepenExpr(guard.taken))
            return nullptr;
        ExprPtr rhs = parseUnary();
        if (!rhs)
            return nullptr;
        lhs = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(lhs), std::move(rhs));
    }
    return lhs;
}

/// @brief Parse prefix `-` and `!`, which may repeat.
ExprPtr Parser::parseUnary()
{
    UnaryOp op;
    if (check(TokenKind::Minus))
        op = UnaryOp::Neg;
    else if (check(TokenKind::Bang))
        op = UnaryOp::Not;
    else
        return parsePostfix();

    Token opTok = advance();
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        error(ErrorKind::UnexpectedToken, "expression nesting too deep");
        return nullptr;
    }
    ExprPtr operand = parseUnary();
    --exprDepth_;
    if (!operand)
        return nullptr;
    return std::make_unique<UnaryExpr>(opTok.loc, op, std::move(operand));
}

/// @brief Parse calls, field accesses and method calls after a primary.
ExprPtr Parser::parsePostfix()
{
    ChainGuard guard{exprDepth_};
    ExprPtr expr = parsePrimary();
    while (expr)
    {
        if ((check(TokenKind::LParen) || check(TokenKind::Dot)) && !deepenExpr(guard.taken))
            return nullptr;
        if (check(TokenKind::LParen))
        {
            Token open = advance();
            if (expr->kind != ExprKind::Ident)
            {
                errorAt(ErrorKind::UnexpectedToken, open.loc, "only named functions can be called");
                return nullptr;
            }
            std::vector<ExprPtr> args;
            if (!parseCallArgs(args))
                return nullptr;
            SourceLoc loc = expr->loc;
            expr = std::make_unique<CallExpr>(loc, std::move(expr), std::move(args));
        }
        else if (check(TokenKind::Dot))
        {
            advance();
            Token name;
            if (!expect(TokenKind::Identifier, "field or method name after '.'", &name))
                return nullptr;
            if (match(TokenKind::LParen))
            {
                std::vector<ExprPtr> args;
                if (!parseCallArgs(args))
                    return nullptr;
                expr = std::make_unique<MethodCallExpr>(
                    name.loc, std::move(expr), name.text, std::move(args));
            }
            else
            {
                expr = std::make_unique<FieldExpr>(name.loc, std::move(expr), name.text);
            }
        }
        else
        {
            break;
        }
    }
    return expr;
}

/// @brief Parse a literal, a (qualified) name, a struct literal or a
///        parenthesized expression.
/// @return The primary expression, or null with UnexpectedToken or
///         UnbalancedDelimiter recorded.
ExprPtr Parser::parsePrimary()
{
    const Token &tok = peek();
    switch (tok.kind)
    {
        case TokenKind::IntLiteral:
        {
            Token t = advance();
            return std::make_unique<IntLiteralExpr>(t.loc, t.intValue);
        }
        case TokenKind::FloatLiteral:
        {
            Token t = advance();
            return std::make_unique<FloatLiteralExpr>(t.loc, t.floatValue);
        }
        case TokenKind::StringLiteral:
        {
            Token t = advance();
            return std::make_unique<StringLiteralExpr>(t.loc, t.text);
        }
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        {
            Token t = advance();
            return std::make_unique<BoolLiteralExpr>(t.loc, t.kind == TokenKind::KwTrue);
        }
        case TokenKind::Identifier:
        {
            Token first = advance();
            std::vector<std::string> path{first.text};
            while (match(TokenKind::ColonColon))
            {
                Token seg;
                if (!expect(TokenKind::Identifier, "name after '::'", &seg))
                    return nullptr;
                path.push_back(seg.text);
            }
            auto ident = std::make_unique<IdentExpr>(first.loc, std::move(path));
            if (check(TokenKind::LBrace) && !noStructLiteral_)
                return parseStructLiteral(std::move(ident));
            return ident;
        }
        case TokenKind::LParen:
        {
            advance();
            bool saved = noStructLiteral_;
            noStructLiteral_ = false;
            ExprPtr inner = parseExpression();
            noStructLiteral_ = saved;
            if (!inner || !expect(TokenKind::RParen, "')'"))
                return nullptr;
            return inner;
        }
        case TokenKind::RBrace:
        case TokenKind::RParen:
            error(ErrorKind::UnbalancedDelimiter, "unexpected " + describe(tok));
            return nullptr;
        case TokenKind::Semicolon:
            error(ErrorKind::UnexpectedToken, "expected expression, found ';'");
            return nullptr;
        default:
            error(ErrorKind::UnexpectedToken, "expected expression, found " + describe(tok));
            return nullptr;
    }
}

/// @brief Parse `{ name: expr, ... }` after a type path.
ExprPtr Parser::parseStructLiteral(std::unique_ptr<IdentExpr> name)
{
    advance(); // '{'
    std::vector<FieldInit> fields;
    while (!check(TokenKind::RBrace))
    {
        Token field;
        if (!expect(TokenKind::Identifier, "field name in struct literal", &field) ||
            !expect(TokenKind::Colon, "':' after field name"))
            return nullptr;
        ExprPtr value = parseExpression();
        if (!value)
            return nullptr;
        fields.push_back(FieldInit{field.loc, field.text, std::move(value)});
        if (!match(TokenKind::Comma))
            break;
    }
    if (!expect(TokenKind::RBrace, "'}' to close struct literal"))
        return nullptr;

    SourceLoc loc = name->loc;
    auto type = std::make_unique<TypeNode>(loc, std::move(name->path));
    return std::make_unique<StructLiteralExpr>(loc, std::move(type), std::move(fields));
}

/// @brief Parse a comma-separated argument list after the opening '('.
/// @param[out] out Receives the parsed arguments.
/// @return False if an argument or the closing ')' failed to parse.
bool Parser::parseCallArgs(std::vector<ExprPtr> &out)
{
    if (match(TokenKind::RParen))
        return true;

    bool saved = noStructLiteral_;
    noStructLiteral_ = false;
    do
    {
        ExprPtr arg = parseExpression();
        if (!arg)
        {
            noStructLiteral_ = saved;
            return false;
        }
        out.push_back(std::move(arg));
    } while (match(TokenKind::Comma));
    noStructLiteral_ = saved;

    return expect(TokenKind::RParen, "')' after arguments");
}

/// @brief Duplicate a variable or field path for compound assignment.
/// @param target The left-hand side already validated by isAssignable.
ExprPtr Parser::cloneTarget(const Expr &target)
{
    if (target.kind == ExprKind::Ident)
    {
        const auto &id = static_cast<const IdentExpr &>(target);
        return std::make_unique<IdentExpr>(id.loc, id.path);
    }
    if (target.kind == ExprKind::Field)
    {
        const auto &fe = static_cast<const FieldExpr &>(target);
        if (fe.base->kind != ExprKind::Ident && fe.base->kind != ExprKind::Field)
        {
            errorAt(ErrorKind::UnexpectedToken,
                    fe.loc,
                    "compound assignment target must be a variable or field path");
            return nullptr;
        }
        ExprPtr base = cloneTarget(*fe.base);
        if (!base)
            return nullptr;
        return std::make_unique<FieldExpr>(fe.loc, std::move(base), fe.field);
    }
    errorAt(ErrorKind::UnexpectedToken, target.loc, "invalid assignment target");
    return nullptr;
}

} // namespace pgs::frontend

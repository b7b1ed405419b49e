//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes.
///
/// @details Expressions compute values.  Each node stores its kind for
/// switch-based dispatch in the resolver and compiler, plus the location of
/// its leading token.  The resolver does not modify these nodes; it records
/// types and bindings in ResolvedProgram side tables keyed by node address.
///
/// Ownership/Lifetime: Owned by their parent via ExprPtr.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pgs::frontend
{

/// @brief Enumerates expression node kinds.
enum class ExprKind
{
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,
    Ident,
    Binary,
    Unary,
    Call,
    Field,
    MethodCall,
    Assign,
    StructLiteral,
};

/// @brief Binary operators in precedence groups.
enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

/// @brief Unary operators.
enum class UnaryOp
{
    Neg,
    Not,
};

/// @brief Source spelling of a binary operator.
const char *binaryOpSpelling(BinaryOp op);

/// @brief Base class for every expression.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

struct IntLiteralExpr : Expr
{
    int64_t value;

    IntLiteralExpr(SourceLoc l, int64_t v) : Expr(ExprKind::IntLiteral, l), value(v) {}
};

struct FloatLiteralExpr : Expr
{
    double value;

    FloatLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::FloatLiteral, l), value(v) {}
};

struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief Name reference: `x`, `fib`, `other::ten`.
struct IdentExpr : Expr
{
    /// @brief Path segments; a plain identifier has exactly one.
    std::vector<std::string> path;

    IdentExpr(SourceLoc l, std::vector<std::string> p) : Expr(ExprKind::Ident, l), path(std::move(p))
    {
    }

    /// @brief Segments joined with "::".
    std::string spelling() const;
};

struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e) : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Free function call.  The callee is always an IdentExpr.
struct CallExpr : Expr
{
    ExprPtr callee;
    std::vector<ExprPtr> args;

    CallExpr(SourceLoc l, ExprPtr c, std::vector<ExprPtr> a)
        : Expr(ExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief Field read: `p.x`.
struct FieldExpr : Expr
{
    ExprPtr base;
    std::string field;

    FieldExpr(SourceLoc l, ExprPtr b, std::string f)
        : Expr(ExprKind::Field, l), base(std::move(b)), field(std::move(f))
    {
    }
};

/// @brief Method call on a container value: `v.length()`.
struct MethodCallExpr : Expr
{
    ExprPtr receiver;
    std::string method;
    std::vector<ExprPtr> args;

    MethodCallExpr(SourceLoc l, ExprPtr r, std::string m, std::vector<ExprPtr> a)
        : Expr(ExprKind::MethodCall, l), receiver(std::move(r)), method(std::move(m)),
          args(std::move(a))
    {
    }
};

/// @brief Assignment to a local or a field; evaluates to the stored value.
/// @details Compound forms (`+=` ...) are desugared by the parser.
struct AssignExpr : Expr
{
    ExprPtr target;
    ExprPtr value;

    AssignExpr(SourceLoc l, ExprPtr t, ExprPtr v)
        : Expr(ExprKind::Assign, l), target(std::move(t)), value(std::move(v))
    {
    }
};

/// @brief One `field: expr` entry of a struct literal.
struct FieldInit
{
    SourceLoc loc;
    std::string name;
    ExprPtr value;
};

/// @brief Container construction: `Vec { x: 3.0, y: 4.0 }`.
struct StructLiteralExpr : Expr
{
    TypePtr type;
    std::vector<FieldInit> fields;

    StructLiteralExpr(SourceLoc l, TypePtr t, std::vector<FieldInit> f)
        : Expr(ExprKind::StructLiteral, l), type(std::move(t)), fields(std::move(f))
    {
    }
};

} // namespace pgs::frontend

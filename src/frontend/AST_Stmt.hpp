//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes.
///
/// @details Bodies of functions, loops and conditionals are BlockStmt nodes.
/// `else if` has no node of its own: the parser wraps the nested IfStmt in a
/// synthesized else block.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Expr.hpp"

#include <string>
#include <vector>

namespace pgs::frontend
{

enum class StmtKind
{
    Block,
    VarDecl,
    Return,
    If,
    While,
    Loop,
    For,
    Break,
    Continue,
    Expr,
};

struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct BlockStmt : Stmt
{
    std::vector<StmtPtr> stmts;

    /// @brief Location of the closing brace.
    SourceLoc endLoc;

    explicit BlockStmt(SourceLoc l) : Stmt(StmtKind::Block, l) {}
};

/// @brief `var name: Type = init;`
struct VarDeclStmt : Stmt
{
    std::string name;
    TypePtr type;
    ExprPtr init;

    VarDeclStmt(SourceLoc l, std::string n, TypePtr t, ExprPtr i)
        : Stmt(StmtKind::VarDecl, l), name(std::move(n)), type(std::move(t)), init(std::move(i))
    {
    }
};

/// @brief `return expr?;`
struct ReturnStmt : Stmt
{
    ExprPtr value; ///< Null for a bare return.

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

struct IfStmt : Stmt
{
    ExprPtr condition;
    BlockPtr thenBlock;
    BlockPtr elseBlock; ///< Null when there is no else.

    IfStmt(SourceLoc l, ExprPtr c, BlockPtr t, BlockPtr e)
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenBlock(std::move(t)),
          elseBlock(std::move(e))
    {
    }
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    BlockPtr body;

    WhileStmt(SourceLoc l, ExprPtr c, BlockPtr b)
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b))
    {
    }
};

/// @brief Unconditional loop left only through break or return.
struct LoopStmt : Stmt
{
    BlockPtr body;

    LoopStmt(SourceLoc l, BlockPtr b) : Stmt(StmtKind::Loop, l), body(std::move(b)) {}
};

/// @brief `for name in iterable { ... }`
struct ForStmt : Stmt
{
    std::string var;
    SourceLoc varLoc;
    ExprPtr iterable;
    BlockPtr body;

    ForStmt(SourceLoc l, std::string v, SourceLoc vl, ExprPtr it, BlockPtr b)
        : Stmt(StmtKind::For, l), var(std::move(v)), varLoc(vl), iterable(std::move(it)),
          body(std::move(b))
    {
    }
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

} // namespace pgs::frontend

//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and shared aliases for AST nodes.
///
/// @details Expressions, statements, type annotations and declarations refer
/// to each other through owning pointers; declaring them here lets each
/// AST_*.hpp header name the others without include cycles.
///
/// @invariant All pointer aliases use std::unique_ptr. AST nodes form a tree.
///
/// Ownership/Lifetime: The Program root owns every node. The resolver keeps
/// the Program alive inside ResolvedProgram and refers to nodes by address.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>

namespace pgs::frontend
{

struct Expr;
struct Stmt;
struct TypeNode;
struct Decl;
struct BlockStmt;
struct FunctionDecl;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using TypePtr = std::unique_ptr<TypeNode>;
using DeclPtr = std::unique_ptr<Decl>;
using BlockPtr = std::unique_ptr<BlockStmt>;

/// @brief Source location carried by every node.
using SourceLoc = support::SourceLoc;

} // namespace pgs::frontend

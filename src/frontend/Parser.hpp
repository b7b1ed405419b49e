//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser producing the script AST.
///
/// @details The parser consumes the complete token vector produced by
/// tokenize() and builds a Program.  Declarations and statements are parsed
/// by recursive descent; expressions by precedence climbing, one method per
/// precedence level.  Parsing stops at the first structural mismatch: the
/// failing helper records a diagnostic, returns null, and every caller
/// propagates the null upward without attempting recovery.
///
/// ## Grammar Overview
///
/// ```
/// Program   := Item*
/// Item      := Module | Container | Impl | Function | Import
/// Module    := "mod" ":" ident "{" Item* "}"
/// Container := "cont" ":" ident "{" (ident ":" Type ";")* "}"
/// Impl      := "impl" ":" ident "{" Function* "}"
/// Function  := "fn" ":" ident "(" Params? ")" ("~" Type)? (Block | ";")
/// Import    := "import" ident ("::" ident)* ("=" ident)? ";"
/// ```
///
/// @see Parser_Decl.cpp, Parser_Stmt.cpp, Parser_Expr.cpp
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/Token.hpp"
#include "support/diag_expected.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgs::frontend
{

class Parser
{
  public:
    /// @brief Maximum nesting of expressions before parsing is aborted.
    static constexpr unsigned kMaxExprDepth = 512;

    /// @brief Maximum nesting of blocks, `else if` arms and modules.
    static constexpr unsigned kMaxNestingDepth = 256;

    /// @brief Create a parser over @p tokens; the vector must end with Eof.
    explicit Parser(std::vector<Token> tokens);

    /// @brief Parse the whole token stream as a Program.
    support::Expected<Program> parseProgram();

    /// @brief Parse a single expression (used by tests).
    support::Expected<ExprPtr> parseStandaloneExpression();

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    const Token &peek(size_t offset = 0) const;

    Token advance();

    bool check(TokenKind kind, size_t offset = 0) const;

    bool match(TokenKind kind, Token *out = nullptr);

    /// @brief Consume @p kind or record "expected <what>, found ..." and fail.
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    void error(support::ErrorKind kind, const std::string &message);

    void errorAt(support::ErrorKind kind, SourceLoc loc, const std::string &message);

    bool failed() const
    {
        return error_.has_value();
    }

    /// @brief Count one more level of expression depth, failing past the limit.
    /// @param taken Incremented with exprDepth_ so the caller can undo it.
    bool deepenExpr(unsigned &taken);

    /// @brief Enter one level of statement or module nesting.
    bool enterNesting();

    /// @brief Describe the current token for messages.
    std::string describe(const Token &tok) const;

    /// @}
    //=========================================================================
    /// @name Declarations
    /// @{
    //=========================================================================

    DeclPtr parseItem();

    DeclPtr parseModuleDecl();

    DeclPtr parseContainerDecl();

    DeclPtr parseImplDecl();

    std::unique_ptr<FunctionDecl> parseFunctionDecl();

    DeclPtr parseImportDecl();

    bool parseParameters(std::vector<Param> &out);

    TypePtr parseType();

    /// @}
    //=========================================================================
    /// @name Statements
    /// @{
    //=========================================================================

    StmtPtr parseStatement();

    BlockPtr parseBlock();

    StmtPtr parseVarDecl();

    StmtPtr parseReturnStmt();

    StmtPtr parseIfStmt();

    StmtPtr parseWhileStmt();

    StmtPtr parseLoopStmt();

    StmtPtr parseForStmt();

    /// @brief Parse a loop/if head expression where `Name {` opens a block.
    ExprPtr parseHeadExpression();

    /// @}
    //=========================================================================
    /// @name Expressions (loosest to tightest)
    /// @{
    //=========================================================================

    ExprPtr parseExpression();

    ExprPtr parseAssignment();

    ExprPtr parseEquality();

    ExprPtr parseComparison();

    ExprPtr parseAdditive();

    ExprPtr parseMultiplicative();

    ExprPtr parseUnary();

    ExprPtr parsePostfix();

    ExprPtr parsePrimary();

    ExprPtr parseStructLiteral(std::unique_ptr<IdentExpr> name);

    bool parseCallArgs(std::vector<ExprPtr> &out);

    /// @brief Duplicate an assignment target for compound assignment.
    ExprPtr cloneTarget(const Expr &target);

    /// @}

    std::vector<Token> tokens_;
    size_t pos_{0};
    std::optional<support::Diag> error_;
    bool noStructLiteral_{false};
    unsigned exprDepth_{0};
    unsigned nestDepth_{0};
};

/// @brief Parse a complete token stream.
support::Expected<Program> parse(std::vector<Token> tokens);

} // namespace pgs::frontend

//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver.hpp
/// @brief Module/symbol resolution and static type checking.
///
/// @details The resolver turns a parsed Program into a ResolvedProgram.  It
/// runs four passes, each over the whole program, so declarations may be
/// referenced before they appear, within and across modules:
///
/// **Pass 1: Collect** (Resolver.cpp)
/// - Builds the module tree rooted at `root`
/// - Registers functions, containers, modules and import aliases
/// - Any duplicate name in one module namespace is a DuplicateDefinition
///
/// **Pass 2: Imports** (Resolver.cpp)
/// - Resolves each alias to a module, function or container
/// - Follows alias chains; revisiting an alias is an ImportCycle
///
/// **Pass 3: Signatures** (Resolver_Decl.cpp)
/// - Resolves field, parameter and return types
/// - Rejects containers that contain themselves
/// - Attaches impl methods to their container
///
/// **Pass 4: Bodies** (Resolver_Stmt.cpp, Resolver_Expr.cpp)
/// - Allocates local slots and binds identifiers
/// - Type checks statements and expressions
///
/// ## Identifier Lookup
///
/// A bare identifier inside a body resolves, in order, to:
/// 1. Locals, innermost block first
/// 2. Fields of the receiver, inside methods
/// 3. Module items, from the enclosing module outward to `root`
///
/// The first failure aborts resolution and is returned as the diagnostic.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/ResolvedProgram.hpp"
#include "support/diag_expected.hpp"

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgs::frontend
{

class Resolver
{
  public:
    explicit Resolver(ResolvedProgram &out) : out_(out) {}

    /// @brief Run every pass over out_.program.
    support::Expected<void> run();

  private:
    using Ex = support::Expected<void>;

    /// @brief Pending `impl:` block; attached during the signature pass.
    struct PendingImpl
    {
        const ImplDecl *decl;
        uint32_t module;
    };

    /// @brief Per-function state for the body pass.
    struct BodyScope
    {
        uint32_t function;
        std::vector<std::unordered_map<std::string, uint32_t>> blocks;
        std::vector<TypeDesc> slotTypes; ///< Indexed by slot.
    };

    //=========================================================================
    /// @name Collect and import passes (Resolver.cpp)
    /// @{
    //=========================================================================

    Ex collectItems(const std::vector<DeclPtr> &items, uint32_t module);

    Ex declare(uint32_t module, const std::string &name, Symbol sym);

    Ex resolveImports();

    /// @brief Resolve import @p index to its final target.
    support::Expected<Symbol> resolveAlias(uint32_t index, std::set<uint32_t> &visiting);

    /// @brief Look up @p path starting from @p module's scope chain.
    /// @param skipImport Import whose own alias must not satisfy the first
    ///        segment; used while resolving that import.
    support::Expected<Symbol> lookupPath(uint32_t module,
                                         const std::vector<std::string> &path,
                                         SourceLoc loc,
                                         std::set<uint32_t> &visiting,
                                         std::optional<uint32_t> skipImport = std::nullopt);

    support::Expected<Symbol> lookupPath(uint32_t module,
                                         const std::vector<std::string> &path,
                                         SourceLoc loc);

    /// @}
    //=========================================================================
    /// @name Signature pass (Resolver_Decl.cpp)
    /// @{
    //=========================================================================

    Ex resolveSignatures();

    support::Expected<TypeDesc> resolveType(uint32_t module, const TypeNode &node);

    Ex resolveFunctionSignature(FunctionInfo &fn);

    Ex checkContainerCycles();

    Ex attachImpl(const PendingImpl &impl);

    /// @}
    //=========================================================================
    /// @name Body pass (Resolver_Stmt.cpp)
    /// @{
    //=========================================================================

    Ex resolveBody(uint32_t function);

    Ex resolveBlock(const BlockStmt &block);

    Ex resolveStmt(const Stmt &stmt);

    /// @brief Bind @p name to a fresh slot in the innermost block.
    uint32_t declareLocal(const std::string &name, TypeDesc type);

    /// @brief Allocate a slot that no identifier can name.
    uint32_t allocateHidden(TypeDesc type);

    std::optional<uint32_t> findLocal(const std::string &name) const;

    /// @}
    //=========================================================================
    /// @name Expressions (Resolver_Expr.cpp)
    /// @{
    //=========================================================================

    /// @brief Type check @p expr as a value and record its type.
    support::Expected<TypeDesc> resolveExpr(const Expr &expr);

    support::Expected<TypeDesc> resolveIdent(const IdentExpr &expr);

    support::Expected<TypeDesc> resolveBinary(const BinaryExpr &expr);

    support::Expected<TypeDesc> resolveUnary(const UnaryExpr &expr);

    support::Expected<TypeDesc> resolveCall(const CallExpr &expr);

    support::Expected<TypeDesc> resolveField(const FieldExpr &expr);

    support::Expected<TypeDesc> resolveMethodCall(const MethodCallExpr &expr);

    support::Expected<TypeDesc> resolveAssign(const AssignExpr &expr);

    support::Expected<TypeDesc> resolveStructLiteral(const StructLiteralExpr &expr);

    /// @brief Check call arguments against @p callee's parameters.
    Ex checkArguments(const FunctionInfo &callee,
                      const std::vector<ExprPtr> &args,
                      SourceLoc loc);

    /// @}

    const FunctionInfo &currentFunction() const
    {
        return out_.functions[body_->function];
    }

    ResolvedProgram &out_;
    std::vector<PendingImpl> impls_;
    BodyScope *body_{nullptr};
};

/// @brief Resolve and type check @p program.
support::Expected<ResolvedProgram> resolve(Program program);

} // namespace pgs::frontend

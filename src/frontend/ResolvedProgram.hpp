//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/ResolvedProgram.hpp
// Purpose: Output of the resolver: the module tree, per-function and
//          per-container semantic records, and side tables that attach
//          bindings and types to AST nodes.
// Key invariants: Every id is an index into the owning vector of this
//                 ResolvedProgram.  Side tables are keyed by the address of a
//                 node owned by `program`; nodes are heap allocated so the
//                 keys survive moves of the ResolvedProgram.  The AST itself
//                 is never mutated after parsing.
// Ownership/Lifetime: ResolvedProgram owns the Program and everything else
//                     by value.  Decl pointers stored in the records borrow
//                     from `program`.
// Links: frontend/Resolver.hpp, bytecode/BytecodeCompiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/Types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgs::frontend
{

enum class SymbolKind : uint8_t
{
    Module,
    Function,
    Container,
    ImportAlias,
};

const char *symbolKindName(SymbolKind kind);

/// @brief Entry of a module namespace; `id` indexes the vector matching
///        `kind` (modules, functions, containers or imports).
struct Symbol
{
    SymbolKind kind;
    uint32_t id;
    SourceLoc loc;
};

struct ModuleScope
{
    std::string name;
    std::string qualifiedName;
    std::optional<uint32_t> parent;
    std::vector<uint32_t> children;

    /// Ordered so that iteration, and therefore output, is deterministic.
    std::map<std::string, Symbol> symbols;
};

struct ImportInfo
{
    const ImportDecl *decl;
    uint32_t module;
    /// @brief Final non-alias target once the import pass has run.
    std::optional<Symbol> target;
};

struct FunctionInfo
{
    std::string name;
    std::string qualifiedName;
    uint32_t module;
    const FunctionDecl *decl;

    /// @brief Container id for methods; the receiver occupies slot 0.
    std::optional<uint32_t> receiver;

    std::vector<TypeDesc> params;
    TypeDesc ret;

    /// @brief Total local slots including parameters and hidden slots.
    uint32_t numLocals{0};

    bool isNative() const
    {
        return decl->isPrototype();
    }

    uint32_t paramSlots() const
    {
        return static_cast<uint32_t>(params.size()) + (receiver ? 1u : 0u);
    }
};

struct FieldInfo
{
    std::string name;
    TypeDesc type;
    SourceLoc loc;
};

struct ContainerInfo
{
    std::string name;
    std::string qualifiedName;
    uint32_t module;
    const ContainerDecl *decl;
    std::vector<FieldInfo> fields;

    /// @brief Method name -> function id, filled from every impl block.
    std::map<std::string, uint32_t> methods;

    std::optional<uint32_t> findField(const std::string &field) const;
};

/// @brief What a value-position identifier refers to.
struct IdentRef
{
    enum class Kind : uint8_t
    {
        Local,
        ReceiverField,
    };

    Kind kind;
    uint32_t slot;  ///< Local slot (Local) or receiver slot (ReceiverField).
    uint32_t field; ///< Field index for ReceiverField.
};

struct StructLiteralInfo
{
    uint32_t container;
    /// @brief For each field in declaration order, the index of its
    ///        initializer in StructLiteralExpr::fields.
    std::vector<uint32_t> initOrder;
};

struct ForInfo
{
    uint32_t varSlot;
    uint32_t seqSlot;
    uint32_t indexSlot;
    bool overString;
};

class ResolvedProgram
{
  public:
    Program program;

    std::vector<ModuleScope> modules; ///< modules[0] is `root`.
    std::vector<FunctionInfo> functions;
    std::vector<ContainerInfo> containers;
    std::vector<ImportInfo> imports;

    std::unordered_map<const Expr *, TypeDesc> exprTypes;
    std::unordered_map<const IdentExpr *, IdentRef> identRefs;
    /// @brief Callee function id for CallExpr and MethodCallExpr nodes.
    std::unordered_map<const Expr *, uint32_t> callTargets;
    std::unordered_map<const FieldExpr *, uint32_t> fieldIndices;
    std::unordered_map<const StructLiteralExpr *, StructLiteralInfo> structLiterals;
    std::unordered_map<const VarDeclStmt *, uint32_t> varSlots;
    std::unordered_map<const ForStmt *, ForInfo> forLoops;

    /// @brief Type recorded for @p expr; Unit when unknown.
    TypeDesc typeOf(const Expr &expr) const;

    /// @brief Find a function by qualified name (`root::main`).
    std::optional<uint32_t> findFunction(const std::string &qualifiedName) const;

    /// @brief Human readable type spelling for diagnostics.
    std::string typeName(TypeDesc type) const;
};

} // namespace pgs::frontend

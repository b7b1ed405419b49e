//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Decl.hpp
/// @brief Declaration nodes and the Program root.
///
/// @details Items may appear at top level or inside `mod:` blocks:
/// modules, containers (`cont:`), impl blocks (`impl:`), functions (`fn:`)
/// and imports.  A function without a body is a prototype; prototypes
/// declare native functions supplied by the embedder.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Stmt.hpp"

#include <string>
#include <vector>

namespace pgs::frontend
{

enum class DeclKind
{
    Module,
    Container,
    Impl,
    Function,
    Import,
};

struct Decl
{
    DeclKind kind;
    SourceLoc loc;
    std::string name;

    Decl(DeclKind k, SourceLoc l, std::string n) : kind(k), loc(l), name(std::move(n)) {}

    virtual ~Decl() = default;
};

/// @brief `mod: name { items }`
struct ModuleDecl : Decl
{
    std::vector<DeclPtr> items;

    ModuleDecl(SourceLoc l, std::string n) : Decl(DeclKind::Module, l, std::move(n)) {}
};

/// @brief Typed container field.
struct FieldDecl
{
    SourceLoc loc;
    std::string name;
    TypePtr type;
};

/// @brief `cont: name { field: Type; ... }`
struct ContainerDecl : Decl
{
    std::vector<FieldDecl> fields;

    ContainerDecl(SourceLoc l, std::string n) : Decl(DeclKind::Container, l, std::move(n)) {}
};

/// @brief Typed function parameter.
struct Param
{
    SourceLoc loc;
    std::string name;
    TypePtr type;
};

/// @brief `fn: name(params) ~ Type { body }` or a body-less prototype.
struct FunctionDecl : Decl
{
    std::vector<Param> params;
    TypePtr returnType; ///< Null means unit.
    BlockPtr body;      ///< Null for prototypes.

    FunctionDecl(SourceLoc l, std::string n) : Decl(DeclKind::Function, l, std::move(n)) {}

    bool isPrototype() const
    {
        return body == nullptr;
    }
};

/// @brief `impl: Container { fn ... }`; @ref name holds the container name.
struct ImplDecl : Decl
{
    std::vector<std::unique_ptr<FunctionDecl>> methods;

    ImplDecl(SourceLoc l, std::string n) : Decl(DeclKind::Impl, l, std::move(n)) {}
};

/// @brief `import a::b = alias;`; @ref name holds the alias.
struct ImportDecl : Decl
{
    std::vector<std::string> path;

    /// @brief False when the alias defaulted to the last path segment.
    bool explicitAlias{true};

    ImportDecl(SourceLoc l, std::string alias, std::vector<std::string> p)
        : Decl(DeclKind::Import, l, std::move(alias)), path(std::move(p))
    {
    }

    /// @brief Path segments joined with "::".
    std::string target() const;
};

/// @brief Parsed script: the implicit root module's items.
struct Program
{
    uint32_t fileId{0};
    std::vector<DeclPtr> items;
};

} // namespace pgs::frontend

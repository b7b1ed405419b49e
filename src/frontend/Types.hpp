//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Types.hpp
/// @brief Semantic type descriptors produced by the resolver.
///
/// @details TypeNode (AST_Types.hpp) records how a type was spelled in
/// source.  TypeDesc is what that spelling means after name resolution:
/// one of the five primitive kinds, a container identified by its index in
/// ResolvedProgram::containers, or a native function identified by its
/// function index.  Descriptors are small values compared by kind and id.
///
/// Source spellings map as follows:
/// - `int`    -> Int (64-bit signed)
/// - `float`  -> Float (IEEE-754 double)
/// - `string` -> String
/// - `bool`   -> Bool
/// - `unit`   -> Unit
/// - any other path names a container and resolves to Named.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pgs::frontend
{

enum class TypeKind : uint8_t
{
    Int,
    Float,
    String,
    Bool,
    Unit,
    /// @brief A container; `id` indexes ResolvedProgram::containers.
    Named,
    /// @brief A native function; `id` indexes ResolvedProgram::functions.
    NativeFunction,
};

struct TypeDesc
{
    TypeKind kind{TypeKind::Unit};
    uint32_t id{0};

    static TypeDesc integer()
    {
        return {TypeKind::Int, 0};
    }

    static TypeDesc floating()
    {
        return {TypeKind::Float, 0};
    }

    static TypeDesc string()
    {
        return {TypeKind::String, 0};
    }

    static TypeDesc boolean()
    {
        return {TypeKind::Bool, 0};
    }

    static TypeDesc unit()
    {
        return {TypeKind::Unit, 0};
    }

    static TypeDesc named(uint32_t container)
    {
        return {TypeKind::Named, container};
    }

    static TypeDesc nativeFunction(uint32_t function)
    {
        return {TypeKind::NativeFunction, function};
    }

    bool isNumeric() const
    {
        return kind == TypeKind::Int || kind == TypeKind::Float;
    }

    bool isContainer() const
    {
        return kind == TypeKind::Named;
    }

    bool operator==(const TypeDesc &other) const
    {
        return kind == other.kind && id == other.id;
    }

    bool operator!=(const TypeDesc &other) const
    {
        return !(*this == other);
    }
};

/// @brief Map a builtin type spelling to its descriptor.
/// @return The descriptor, or nullopt when @p name is not a builtin.
std::optional<TypeDesc> builtinType(const std::string &name);

/// @brief Spelling of a primitive kind ("int", "float", ...).
const char *typeKindName(TypeKind kind);

} // namespace pgs::frontend

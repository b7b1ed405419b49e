//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontend/Types.hpp"

namespace pgs::frontend
{

std::optional<TypeDesc> builtinType(const std::string &name)
{
    if (name == "int")
        return TypeDesc::integer();
    if (name == "float")
        return TypeDesc::floating();
    if (name == "string")
        return TypeDesc::string();
    if (name == "bool")
        return TypeDesc::boolean();
    if (name == "unit")
        return TypeDesc::unit();
    return std::nullopt;
}

const char *typeKindName(TypeKind kind)
{
    switch (kind)
    {
        case TypeKind::Int:
            return "int";
        case TypeKind::Float:
            return "float";
        case TypeKind::String:
            return "string";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Unit:
            return "unit";
        case TypeKind::Named:
            return "container";
        case TypeKind::NativeFunction:
            return "native function";
    }
    return "?";
}

} // namespace pgs::frontend

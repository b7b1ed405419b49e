//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/runtime/Value.cpp
// Purpose: Formatting and equality for runtime values.
// Key invariants: Formatting is locale independent.
// Links: include/pgs/Value.hpp
//
//===----------------------------------------------------------------------===//

#include "pgs/Value.hpp"

#include <charconv>
#include <cmath>
#include <string_view>

namespace pgs
{

const char *toString(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Int:
            return "int";
        case ValueKind::Float:
            return "float";
        case ValueKind::Str:
            return "string";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Unit:
            return "unit";
        case ValueKind::Struct:
            return "struct";
        case ValueKind::NativeHandle:
            return "native handle";
    }
    return "?";
}

namespace
{

std::string formatFloat(double v)
{
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v < 0 ? "-inf" : "inf";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc())
        return "?";
    std::string out(buf, end);
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}

} // namespace

std::string Value::toString() const
{
    switch (kind())
    {
        case ValueKind::Int:
            return std::to_string(asInt());
        case ValueKind::Float:
            return formatFloat(asFloat());
        case ValueKind::Str:
            return asString();
        case ValueKind::Bool:
            return asBool() ? "true" : "false";
        case ValueKind::Unit:
            return "()";
        case ValueKind::Struct:
        {
            const auto &inst = asStruct();
            if (!inst)
                return "<null struct>";
            std::string out = inst->typeName + "{";
            for (size_t i = 0; i < inst->fields.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += inst->fields[i].toString();
            }
            return out + "}";
        }
        case ValueKind::NativeHandle:
            return "<" + asHandle().tag + ">";
    }
    return "?";
}

bool Value::operator==(const Value &other) const
{
    if (kind() != other.kind())
        return false;
    switch (kind())
    {
        case ValueKind::Int:
            return asInt() == other.asInt();
        case ValueKind::Float:
            return asFloat() == other.asFloat();
        case ValueKind::Str:
            return asString() == other.asString();
        case ValueKind::Bool:
            return asBool() == other.asBool();
        case ValueKind::Unit:
            return true;
        case ValueKind::Struct:
            return asStruct() == other.asStruct();
        case ValueKind::NativeHandle:
            return asHandle().ptr == other.asHandle().ptr;
    }
    return false;
}

} // namespace pgs

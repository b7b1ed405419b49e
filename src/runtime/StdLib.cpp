//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/runtime/StdLib.cpp
// Purpose: Host implementations of the `std` native module.
// Key invariants: Handlers trust the VM's signature checks and read their
//                 arguments without re-validating kinds.
// Links: include/pgs/StdLib.hpp
//
//===----------------------------------------------------------------------===//

#include "pgs/StdLib.hpp"

#include <cmath>
#include <string>

namespace pgs
{

namespace
{

struct StdEntry
{
    const char *name;
    NativeSignature signature;
    NativeHandler handler;
};

} // namespace

support::Expected<void> registerStdLib(NativeRegistry &registry, std::ostream &out)
{
    std::ostream *os = &out;

    const StdEntry entries[] = {
        {"print",
         {{ValueKind::Str}, ValueKind::Int},
         [os](const Value *args, uint32_t, Value *result)
         {
             *os << args[0].asString();
             *result = Value::integer(0);
         }},
        {"println",
         {{ValueKind::Str}, ValueKind::Int},
         [os](const Value *args, uint32_t, Value *result)
         {
             *os << args[0].asString() << '\n';
             *result = Value::integer(0);
         }},
        {"printi",
         {{ValueKind::Int}, ValueKind::Int},
         [os](const Value *args, uint32_t, Value *result)
         {
             *os << args[0].asInt();
             *result = Value::integer(0);
         }},
        {"printf",
         {{ValueKind::Float}, ValueKind::Int},
         [os](const Value *args, uint32_t, Value *result)
         {
             *os << args[0].toString();
             *result = Value::integer(0);
         }},
        {"sqrt",
         {{ValueKind::Float}, ValueKind::Float},
         [](const Value *args, uint32_t, Value *result)
         { *result = Value::floating(std::sqrt(args[0].asFloat())); }},
        {"itos",
         {{ValueKind::Int}, ValueKind::Str},
         [](const Value *args, uint32_t, Value *result)
         { *result = Value::string(std::to_string(args[0].asInt())); }},
    };

    for (const auto &entry : entries)
    {
        if (auto r = registry.registerFunction("std", entry.name, entry.signature, entry.handler);
            !r)
            return r;
    }
    return {};
}

} // namespace pgs

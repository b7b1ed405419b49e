//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeModule.hpp
// Purpose: Data structures for compiled bytecode modules and functions.
// Key invariants: Constant pool entries are deduplicated (same value -> same index).
//                 Function indices are stable after insertion.
// Ownership: BytecodeModule owns all contained functions, pools, and metadata.
// Lifetime: Created by BytecodeCompiler; shared read-only by any number of
//           BytecodeVM instances.
// Links: Bytecode.hpp, BytecodeCompiler.hpp, BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"

#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgs::bytecode
{

namespace detail
{
/// @brief Linear-scan pool insertion; returns the index of an equal entry if present.
template <typename T, typename Eq>
inline uint32_t findOrAddToPool(std::vector<T> &pool, const T &value, Eq eq)
{
    for (size_t i = 0; i < pool.size(); ++i)
    {
        if (eq(pool[i], value))
            return static_cast<uint32_t>(i);
    }
    uint32_t idx = static_cast<uint32_t>(pool.size());
    pool.push_back(value);
    return idx;
}
} // namespace detail

/// @brief Field layout of a container, referenced by NEW_STRUCT.
struct StructLayout
{
    std::string name;                    ///< Container name without "root::".
    std::vector<std::string> fieldNames; ///< In declaration order.

    bool operator==(const StructLayout &other) const
    {
        return name == other.name && fieldNames == other.fieldNames;
    }
};

struct BytecodeFunction
{
    std::string name;       ///< Fully qualified function name ("root::main").
    uint32_t numParams = 0; ///< Parameter slots, including `self` for methods.
    uint32_t numLocals = 0; ///< Total local slots (parameters first).
    uint32_t maxStack = 0;  ///< Maximum operand stack depth during execution.
    bool hasReturn = false; ///< True unless the function returns unit.

    std::vector<uint32_t> code;      ///< Instruction stream (32-bit words).
    std::vector<uint32_t> lineTable; ///< Source line per instruction word.

    bool operator==(const BytecodeFunction &other) const
    {
        return name == other.name && numParams == other.numParams &&
               numLocals == other.numLocals && maxStack == other.maxStack &&
               hasReturn == other.hasReturn && code == other.code &&
               lineTable == other.lineTable;
    }
};

struct NativeFuncRef
{
    std::string name;    ///< Qualified name without "root::" (e.g. "std::println").
    uint32_t paramCount; ///< Number of parameters the function expects.
    bool hasReturn;      ///< True if the declared return type is not unit.

    bool operator==(const NativeFuncRef &other) const
    {
        return name == other.name && paramCount == other.paramCount &&
               hasReturn == other.hasReturn;
    }
};

struct BytecodeModule
{
    // Constant pools
    std::vector<int64_t> i64Pool;
    std::vector<double> f64Pool;
    std::vector<std::string> stringPool;
    std::vector<StructLayout> layouts;

    // Functions
    std::vector<BytecodeFunction> functions;
    std::unordered_map<std::string, uint32_t> functionIndex;

    // Native function references
    std::vector<NativeFuncRef> nativeFuncs;
    std::unordered_map<std::string, uint32_t> nativeFuncIndex;

    std::string sourcePath; ///< Used when rendering runtime diagnostics.

    /// @brief Find a compiled function by its fully qualified name.
    const BytecodeFunction *findFunction(const std::string &name) const
    {
        auto it = functionIndex.find(name);
        if (it != functionIndex.end())
            return &functions[it->second];
        return nullptr;
    }

    uint32_t addFunction(BytecodeFunction fn)
    {
        uint32_t idx = static_cast<uint32_t>(functions.size());
        functionIndex[fn.name] = idx;
        functions.push_back(std::move(fn));
        return idx;
    }

    uint32_t addI64(int64_t value)
    {
        return detail::findOrAddToPool(i64Pool, value, std::equal_to<int64_t>{});
    }

    /// @brief Add a float constant, deduplicating by bit pattern.
    /// @details +0.0 and -0.0 stay distinct.
    uint32_t addF64(double value)
    {
        auto bitwiseEq = [](double a, double b)
        {
            uint64_t ba = 0;
            uint64_t bb = 0;
            std::memcpy(&ba, &a, sizeof(ba));
            std::memcpy(&bb, &b, sizeof(bb));
            return ba == bb;
        };
        return detail::findOrAddToPool(f64Pool, value, bitwiseEq);
    }

    uint32_t addString(const std::string &value)
    {
        return detail::findOrAddToPool(stringPool, value, std::equal_to<std::string>{});
    }

    uint32_t addLayout(const StructLayout &layout)
    {
        return detail::findOrAddToPool(layouts, layout, std::equal_to<StructLayout>{});
    }

    /// @brief Add a native function reference, deduplicating by name.
    uint32_t addNativeFunc(const std::string &name, uint32_t paramCount, bool hasReturn)
    {
        auto it = nativeFuncIndex.find(name);
        if (it != nativeFuncIndex.end())
            return it->second;
        uint32_t idx = static_cast<uint32_t>(nativeFuncs.size());
        nativeFuncIndex[name] = idx;
        nativeFuncs.push_back({name, paramCount, hasReturn});
        return idx;
    }

    /// @brief Structural equality; the name indices follow from the vectors.
    bool operator==(const BytecodeModule &other) const
    {
        auto sameBits = [](const std::vector<double> &a, const std::vector<double> &b)
        {
            return a.size() == b.size() &&
                   (a.empty() || std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0);
        };
        return i64Pool == other.i64Pool && sameBits(f64Pool, other.f64Pool) &&
               stringPool == other.stringPool && layouts == other.layouts &&
               functions == other.functions && nativeFuncs == other.nativeFuncs;
    }
};

/// @brief Render a textual listing of @p module.
std::string disassemble(const BytecodeModule &module);

} // namespace pgs::bytecode

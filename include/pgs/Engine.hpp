//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pgs/Engine.hpp
// Purpose: Embedding API: compile source to a program and run its functions.
// Key invariants: A CompiledProgram is immutable; any number of runs may
//                 share it, each on its own VM.
// Ownership/Lifetime: CompiledProgram shares its bytecode module through
//                     std::shared_ptr<const>.  The registry passed to run()
//                     is borrowed for the duration of the call.
// Links: include/pgs/NativeRegistry.hpp, src/engine/Engine.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pgs/NativeRegistry.hpp"
#include "pgs/Value.hpp"
#include "support/diag_expected.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pgs
{

namespace bytecode
{
struct BytecodeModule;
class BytecodeVM;
} // namespace bytecode

using vm::TraceConfig;

/// @brief Front-end and compiler settings.
struct CompileOptions
{
    uint32_t fileId = 1; ///< Stamped into every SourceLoc.
    std::string path;    ///< Recorded in the module for diagnostics.
    TraceConfig trace;   ///< Stage records (token, item and function counts).
    bool dumpBytecode = false; ///< Write the disassembly to the trace stream.
};

/// @brief Execution limits and host hooks for one run.
struct RunConfig
{
    TraceConfig trace;        ///< Tracing configuration.
    uint64_t maxSteps = 0;    ///< Step limit; zero disables the limit.

    // Periodic host polling --------------------------------------------------
    /// @brief Invoke pollCallback every N instructions (0 disables).
    uint32_t interruptEveryN = 0;
    /// @brief Host callback; return false to interrupt the run.
    std::function<bool(bytecode::BytecodeVM &)> pollCallback;

    uint32_t maxCallDepth = 1024;   ///< Frames before StackOverflow.
    uint32_t maxStackSlots = 65536; ///< Locals plus operands across all frames.
};

/// @brief Result of a successful compile.
class CompiledProgram
{
  public:
    explicit CompiledProgram(std::shared_ptr<const bytecode::BytecodeModule> module)
        : module_(std::move(module))
    {
    }

    const bytecode::BytecodeModule &module() const
    {
        return *module_;
    }

    const std::shared_ptr<const bytecode::BytecodeModule> &shared() const
    {
        return module_;
    }

    /// @brief Check for a compiled function; accepts "main" or "root::main".
    bool hasFunction(const std::string &name) const;

  private:
    std::shared_ptr<const bytecode::BytecodeModule> module_;
};

/// @brief Lex, parse, resolve and compile @p source.
support::Expected<CompiledProgram> compile(std::string_view source,
                                           const CompileOptions &options = {});

/// @brief Compile @p source with every native of @p registry in scope.
/// @details Each binding is declared as a prototype inside a top-level module
///          of the same name, unless the script already declares that
///          prototype itself.
support::Expected<CompiledProgram> compile(std::string_view source,
                                           const NativeRegistry &registry,
                                           const CompileOptions &options = {});

/// @brief Execute @p entry ("main" or "root::main") with @p args.
support::Expected<Value> run(const CompiledProgram &program,
                             const std::string &entry,
                             const NativeRegistry &registry,
                             const std::vector<Value> &args = {},
                             const RunConfig &config = {});

/// @brief Textual listing of the compiled module.
std::string disassemble(const CompiledProgram &program);

} // namespace pgs

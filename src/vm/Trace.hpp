//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and the sink for pipeline stages and
//          VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented; every
//                 record starts with "[pgs]".
// Ownership/Lifetime: The sink holds its configuration by value and borrows
//                     the output stream, which must outlive it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace pgs::vm
{

/// @brief Configuration for compiler and interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,    ///< Tracing disabled
        Stages, ///< One record per pipeline stage
        Instr   ///< Stage records plus one record per executed instruction
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record completion of pipeline stage @p stage.
    /// @param detail Free-form summary such as "tokens=42".
    void onStage(std::string_view stage, std::string_view detail);

    /// @brief Record execution of one instruction.
    /// @param function Qualified name of the executing function.
    /// @param pc Index of the instruction word within the function.
    /// @param opcode Mnemonic of the instruction.
    /// @param depth Operand stack depth before the instruction runs.
    void onStep(std::string_view function, uint32_t pc, std::string_view opcode, size_t depth);

    bool tracesInstructions() const
    {
        return cfg.mode == TraceConfig::Instr;
    }

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace pgs::vm

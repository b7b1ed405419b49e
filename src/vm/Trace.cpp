//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Implement deterministic tracing for pipeline stages and VM steps.
// Key invariants: Each event produces exactly one flushed line and trace
//                 emission honours @ref TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the pgs tracing facilities.
/// @details Records are rendered under the classic locale so that numbers
///          never pick up host separators, which keeps traces comparable
///          across machines.

#include "vm/Trace.hpp"

#include <iostream>
#include <locale>
#include <string>

namespace pgs::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

namespace
{
/// @brief RAII helper that renders one record under the classic locale.
/// @details Only the stream is imbued; the process-wide C locale is left
///          alone because other threads may be running scripts.
class LocaleGuard
{
    std::ostream &os;
    std::locale oldLoc;

  public:
    explicit LocaleGuard(std::ostream &s) : os(s), oldLoc(s.imbue(std::locale::classic())) {}

    ~LocaleGuard()
    {
        os.imbue(oldLoc);
    }
};
} // namespace

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onStage(std::string_view stage, std::string_view detail)
{
    if (!cfg.enabled())
        return;
    std::ostream &os = stream();
    LocaleGuard guard(os);
    os << "[pgs] stage=" << stage;
    if (!detail.empty())
        os << ' ' << detail;
    os << std::endl;
}

/// @details Format: `[pgs] fn=root::main pc=3 op=ADD_I64 depth=2`.
void TraceSink::onStep(std::string_view function,
                       uint32_t pc,
                       std::string_view opcode,
                       size_t depth)
{
    if (cfg.mode != TraceConfig::Instr)
        return;
    std::ostream &os = stream();
    LocaleGuard guard(os);
    os << "[pgs] fn=" << function << " pc=" << pc << " op=" << opcode << " depth=" << depth
       << std::endl;
}

} // namespace pgs::vm

//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeVM.hpp
// Purpose: Stack-based interpreter for compiled bytecode modules.
// Key invariants: The value stack is sized once per exec() and never
//                 reallocated while running, so frame pointers into it stay
//                 valid.  Every opcode checks its operand kinds before use.
//                 A trap stops execution immediately.
// Ownership: Shares the module read-only; borrows the native registry.
// Lifetime: One VM per thread of execution; a VM may exec() repeatedly.
// Links: Bytecode.hpp, BytecodeModule.hpp, include/pgs/Engine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "pgs/Engine.hpp"
#include "pgs/NativeRegistry.hpp"
#include "pgs/Value.hpp"
#include "support/diag_expected.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pgs::bytecode
{

enum class VMState
{
    Ready,   ///< Module loaded, ready to execute.
    Running, ///< Currently executing bytecode.
    Halted,  ///< Execution completed normally.
    Trapped  ///< Execution halted due to a trap.
};

/// @brief Activation record for one executing function.
struct BCFrame
{
    const BytecodeFunction *func; ///< Function being executed in this frame.
    uint32_t pc;                  ///< Index of the next instruction word.
    Value *locals;                ///< First local slot; parameters come first.
    Value *stackBase;             ///< Operand stack base for this frame.
};

class BytecodeVM
{
  public:
    BytecodeVM(std::shared_ptr<const BytecodeModule> module,
               const NativeRegistry &registry,
               RunConfig config = {});

    /// @brief Run @p funcName ("main" or "root::main") with @p args.
    /// @return The function's result, or the RuntimeError that stopped it.
    support::Expected<Value> exec(const std::string &funcName,
                                  const std::vector<Value> &args = {});

    VMState state() const
    {
        return state_;
    }

    support::ErrorKind trapKind() const
    {
        return trapKind_;
    }

    const std::string &trapMessage() const
    {
        return trapMessage_;
    }

    /// @brief Instructions executed by the most recent exec().
    uint64_t instrCount() const
    {
        return instrCount_;
    }

    size_t callDepth() const
    {
        return callStack_.size();
    }

    const BytecodeFunction *currentFunction() const
    {
        return fp_ ? fp_->func : nullptr;
    }

    uint32_t currentSourceLine() const;

    static uint32_t getSourceLine(const BytecodeFunction *func, uint32_t pc);

  private:
    std::shared_ptr<const BytecodeModule> module_;
    const NativeRegistry &registry_;
    RunConfig config_;
    vm::TraceSink trace_;

    // Execution state
    VMState state_{VMState::Ready};
    support::ErrorKind trapKind_{support::ErrorKind::Interrupted};
    std::string trapMessage_;
    uint32_t trapLine_{0};

    std::vector<Value> valueStack_;
    std::vector<BCFrame> callStack_;
    Value *sp_{nullptr};
    BCFrame *fp_{nullptr};

    uint64_t instrCount_{0};

    void run();

    /// @brief Push a frame for @p func; its arguments are already on the stack.
    void call(const BytecodeFunction *func);

    /// @brief Pop the current frame and release its slots.
    /// @return False when the popped frame was the entry frame.
    bool popFrame();

    void callNative(uint32_t instr);

    void trap(support::ErrorKind kind, std::string message);

    /// @brief Trap with a RuntimeTypeMismatch unless @p v has kind @p kind.
    bool expect(const Value &v, ValueKind kind, BCOpcode op);

    /// @brief Check the step budget and host poll before the next instruction.
    bool checkInterrupt();

    Value pop()
    {
        Value v = std::move(*--sp_);
        *sp_ = Value();
        return v;
    }

    void push(Value v)
    {
        *sp_++ = std::move(v);
    }
};

} // namespace pgs::bytecode

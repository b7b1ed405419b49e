//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeCompiler.hpp
// Purpose: Lowers a resolved program into compact bytecode for BytecodeVM.
// Key invariants: Output depends only on the input program, so compiling the
//                 same source twice yields equal modules.
//                 All jump offsets are resolved before a function is finalized.
//                 Every statement leaves the operand stack as it found it.
// Ownership: Borrows the ResolvedProgram; produces a BytecodeModule by value.
// Lifetime: Compiler state is transient per compile() call.
// Links: Bytecode.hpp, BytecodeModule.hpp, frontend/ResolvedProgram.hpp
//
//===----------------------------------------------------------------------===//
//
// The compiler performs:
// - Function and native table construction
// - Constant pool building
// - Statement and expression lowering
// - Forward jump backpatching for `if`, loop exits, `break` and `continue`
// - Reachability tracking for unreachable statements and missing returns
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "frontend/ResolvedProgram.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace pgs::bytecode
{

class BytecodeCompiler
{
  public:
    /// @brief Compile every function of @p program.
    /// @return The module, or the first CompileError.
    support::Expected<BytecodeModule> compile(const frontend::ResolvedProgram &program);

  private:
    using Ex = support::Expected<void>;
    using SourceLoc = support::SourceLoc;

    /// @brief Jump bookkeeping for the innermost enclosing loop.
    struct LoopContext
    {
        /// Target of `continue`; unknown until the step code of a `for`
        /// has been emitted.
        std::optional<uint32_t> continueTarget;
        std::vector<uint32_t> continueFixups;
        std::vector<uint32_t> breakFixups;
        bool hasBreak{false};
    };

    //=========================================================================
    /// @name Driver (BytecodeCompiler.cpp)
    /// @{
    //=========================================================================

    Ex declareFunctions();

    Ex compileFunction(uint32_t resolvedId);

    /// @}
    //=========================================================================
    /// @name Statements (BytecodeCompiler_Stmt.cpp)
    /// @{
    //=========================================================================

    Ex compileBlock(const frontend::BlockStmt &block);

    Ex compileStmt(const frontend::Stmt &stmt);

    Ex compileIf(const frontend::IfStmt &stmt);

    Ex compileWhile(const frontend::WhileStmt &stmt);

    Ex compileLoop(const frontend::LoopStmt &stmt);

    Ex compileFor(const frontend::ForStmt &stmt);

    Ex compileBreakContinue(const frontend::Stmt &stmt);

    /// @brief Compile a loop body with @p ctx as the innermost loop.
    Ex compileLoopBody(const frontend::BlockStmt &body, LoopContext &ctx);

    /// @}
    //=========================================================================
    /// @name Expressions (BytecodeCompiler_Expr.cpp)
    /// @{
    //=========================================================================

    /// @brief Emit code leaving exactly one value on the stack.
    Ex compileExpr(const frontend::Expr &expr);

    Ex compileIdent(const frontend::IdentExpr &expr);

    Ex compileBinary(const frontend::BinaryExpr &expr);

    Ex compileUnary(const frontend::UnaryExpr &expr);

    Ex compileCall(const frontend::Expr &call,
                   const frontend::Expr *receiver,
                   const std::vector<frontend::ExprPtr> &args);

    Ex compileAssign(const frontend::AssignExpr &expr);

    Ex compileStructLiteral(const frontend::StructLiteralExpr &expr);

    Ex emitInt(int64_t value, SourceLoc loc);

    /// @}
    //=========================================================================
    /// @name Emission (BytecodeCompiler.cpp)
    /// @{
    //=========================================================================

    void emit(uint32_t instr);

    void emit(BCOpcode op);

    void emit16(BCOpcode op, uint16_t arg);

    void emitI16(BCOpcode op, int16_t arg);

    void emit88(BCOpcode op, uint8_t arg0, uint8_t arg1);

    /// @brief Emit a jump with a placeholder offset.
    /// @return Position of the jump word, for patchJump.
    uint32_t emitJump(BCOpcode op);

    /// @brief Emit a backward jump to @p target.
    Ex emitJumpTo(BCOpcode op, uint32_t target, SourceLoc loc);

    /// @brief Point the jump at @p pos to @p target.
    Ex patchJump(uint32_t pos, uint32_t target, SourceLoc loc);

    /// @brief Point every jump in @p fixups at the current position.
    Ex patchAll(const std::vector<uint32_t> &fixups, SourceLoc loc);

    support::Expected<uint32_t> nativeIndex(uint32_t id, SourceLoc loc);

    /// @brief Check that @p index fits a 16-bit operand.
    support::Expected<uint16_t> index16(uint32_t index, const char *what, SourceLoc loc) const;

    uint32_t here() const
    {
        return static_cast<uint32_t>(currentFunc_->code.size());
    }

    void pushStack(int32_t count = 1);

    void popStack(int32_t count = 1);

    /// @}

    const frontend::ResolvedProgram *program_ = nullptr;
    BytecodeModule module_;

    static constexpr uint32_t kNoIndex = 0xFFFFFFFFu;

    /// Resolved function id to bytecode function index, or native index for
    /// prototypes (kNoIndex until first called).
    std::vector<uint32_t> targetIndex_;

    BytecodeFunction *currentFunc_{nullptr};
    uint32_t currentLine_{0};
    bool reachable_{true};
    std::vector<LoopContext *> loops_;

    int32_t currentStackDepth_{0};
    int32_t maxStackDepth_{0};
};

} // namespace pgs::bytecode

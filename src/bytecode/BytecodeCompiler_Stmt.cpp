//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file BytecodeCompiler_Stmt.cpp
/// @brief Statement lowering and control flow.
///
/// @details Loop shapes:
///
///     while:  top:  <cond>  JUMP_IF_FALSE exit  <body>  JUMP top  exit:
///     loop:   top:  <body>  JUMP top  exit:
///     for:    <iterable> STORE seq   0 STORE index
///             top:  index < SEQ_LEN(seq)  JUMP_IF_FALSE exit
///                   SEQ_AT(seq, index) STORE var  <body>
///             step: index + 1 STORE index  JUMP top  exit:
///
/// `break` always jumps forward to `exit` and is backpatched.  `continue`
/// jumps to `top` (known) or `step` (backpatched once the step is emitted).
///
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeCompiler.hpp"

namespace pgs::bytecode
{

using namespace frontend;
using support::ErrorKind;
using support::makeError;

support::Expected<void> BytecodeCompiler::compileBlock(const BlockStmt &block)
{
    for (const auto &stmt : block.stmts)
    {
        if (!reachable_)
        {
            return makeError(
                ErrorKind::UnreachableCode, stmt->loc, "statement can never be executed");
        }
        if (auto r = compileStmt(*stmt); !r)
            return r;
    }
    return {};
}

support::Expected<void> BytecodeCompiler::compileStmt(const Stmt &stmt)
{
    currentLine_ = stmt.loc.line;

    switch (stmt.kind)
    {
        case StmtKind::Block:
            return compileBlock(static_cast<const BlockStmt &>(stmt));

        case StmtKind::VarDecl:
        {
            const auto &var = static_cast<const VarDeclStmt &>(stmt);
            if (auto r = compileExpr(*var.init); !r)
                return r;
            currentLine_ = stmt.loc.line;
            emit16(BCOpcode::STORE_LOCAL, static_cast<uint16_t>(program_->varSlots.at(&var)));
            popStack();
            return {};
        }

        case StmtKind::Return:
        {
            const auto &ret = static_cast<const ReturnStmt &>(stmt);
            if (ret.value)
            {
                if (auto r = compileExpr(*ret.value); !r)
                    return r;
            }
            else
            {
                emit(BCOpcode::LOAD_UNIT);
                pushStack();
            }
            currentLine_ = stmt.loc.line;
            emit(BCOpcode::RETURN);
            popStack();
            reachable_ = false;
            return {};
        }

        case StmtKind::If:
            return compileIf(static_cast<const IfStmt &>(stmt));
        case StmtKind::While:
            return compileWhile(static_cast<const WhileStmt &>(stmt));
        case StmtKind::Loop:
            return compileLoop(static_cast<const LoopStmt &>(stmt));
        case StmtKind::For:
            return compileFor(static_cast<const ForStmt &>(stmt));

        case StmtKind::Break:
        case StmtKind::Continue:
            return compileBreakContinue(stmt);

        case StmtKind::Expr:
        {
            if (auto r = compileExpr(*static_cast<const ExprStmt &>(stmt).expr); !r)
                return r;
            emit(BCOpcode::POP);
            popStack();
            return {};
        }
    }
    return {};
}

support::Expected<void> BytecodeCompiler::compileIf(const IfStmt &stmt)
{
    if (auto r = compileExpr(*stmt.condition); !r)
        return r;
    currentLine_ = stmt.loc.line;
    uint32_t toElse = emitJump(BCOpcode::JUMP_IF_FALSE);
    popStack();

    if (auto r = compileBlock(*stmt.thenBlock); !r)
        return r;
    const bool thenFallsThrough = reachable_;

    if (!stmt.elseBlock)
    {
        reachable_ = true;
        return patchJump(toElse, here(), stmt.loc);
    }

    std::optional<uint32_t> toEnd;
    if (thenFallsThrough)
    {
        currentLine_ = stmt.thenBlock->endLoc.line;
        toEnd = emitJump(BCOpcode::JUMP);
    }
    if (auto r = patchJump(toElse, here(), stmt.loc); !r)
        return r;

    reachable_ = true;
    if (auto r = compileBlock(*stmt.elseBlock); !r)
        return r;
    reachable_ = reachable_ || thenFallsThrough;

    if (toEnd)
        return patchJump(*toEnd, here(), stmt.loc);
    return {};
}

support::Expected<void> BytecodeCompiler::compileLoopBody(const BlockStmt &body, LoopContext &ctx)
{
    loops_.push_back(&ctx);
    auto r = compileBlock(body);
    loops_.pop_back();
    return r;
}

support::Expected<void> BytecodeCompiler::compileWhile(const WhileStmt &stmt)
{
    const uint32_t top = here();
    if (auto r = compileExpr(*stmt.condition); !r)
        return r;
    currentLine_ = stmt.loc.line;
    uint32_t toExit = emitJump(BCOpcode::JUMP_IF_FALSE);
    popStack();

    LoopContext ctx;
    ctx.continueTarget = top;
    if (auto r = compileLoopBody(*stmt.body, ctx); !r)
        return r;

    currentLine_ = stmt.body->endLoc.line;
    if (reachable_)
    {
        if (auto r = emitJumpTo(BCOpcode::JUMP, top, stmt.loc); !r)
            return r;
    }
    if (auto r = patchJump(toExit, here(), stmt.loc); !r)
        return r;

    // The condition may be false on entry, so the exit is always reachable.
    reachable_ = true;
    return patchAll(ctx.breakFixups, stmt.loc);
}

support::Expected<void> BytecodeCompiler::compileLoop(const LoopStmt &stmt)
{
    const uint32_t top = here();

    LoopContext ctx;
    ctx.continueTarget = top;
    if (auto r = compileLoopBody(*stmt.body, ctx); !r)
        return r;

    currentLine_ = stmt.body->endLoc.line;
    if (reachable_)
    {
        if (auto r = emitJumpTo(BCOpcode::JUMP, top, stmt.loc); !r)
            return r;
    }

    reachable_ = ctx.hasBreak;
    return patchAll(ctx.breakFixups, stmt.loc);
}

support::Expected<void> BytecodeCompiler::compileFor(const ForStmt &stmt)
{
    const ForInfo &info = program_->forLoops.at(&stmt);
    const auto seq = static_cast<uint16_t>(info.seqSlot);
    const auto index = static_cast<uint16_t>(info.indexSlot);

    if (auto r = compileExpr(*stmt.iterable); !r)
        return r;
    currentLine_ = stmt.loc.line;
    emit16(BCOpcode::STORE_LOCAL, seq);
    popStack();
    emitI16(BCOpcode::LOAD_I16, 0);
    pushStack();
    emit16(BCOpcode::STORE_LOCAL, index);
    popStack();

    const uint32_t top = here();
    emit16(BCOpcode::LOAD_LOCAL, index);
    pushStack();
    emit16(BCOpcode::LOAD_LOCAL, seq);
    pushStack();
    emit(BCOpcode::SEQ_LEN);
    emit(BCOpcode::CMP_LT_I64);
    popStack();
    uint32_t toExit = emitJump(BCOpcode::JUMP_IF_FALSE);
    popStack();

    emit16(BCOpcode::LOAD_LOCAL, seq);
    pushStack();
    emit16(BCOpcode::LOAD_LOCAL, index);
    pushStack();
    emit(BCOpcode::SEQ_AT);
    popStack();
    emit16(BCOpcode::STORE_LOCAL, static_cast<uint16_t>(info.varSlot));
    popStack();

    LoopContext ctx;
    if (auto r = compileLoopBody(*stmt.body, ctx); !r)
        return r;

    if (reachable_ || !ctx.continueFixups.empty())
    {
        currentLine_ = stmt.loc.line;
        if (auto r = patchAll(ctx.continueFixups, stmt.loc); !r)
            return r;
        emit16(BCOpcode::LOAD_LOCAL, index);
        pushStack();
        emitI16(BCOpcode::LOAD_I16, 1);
        pushStack();
        emit(BCOpcode::ADD_I64);
        popStack();
        emit16(BCOpcode::STORE_LOCAL, index);
        popStack();
        if (auto r = emitJumpTo(BCOpcode::JUMP, top, stmt.loc); !r)
            return r;
    }

    if (auto r = patchJump(toExit, here(), stmt.loc); !r)
        return r;
    reachable_ = true;
    return patchAll(ctx.breakFixups, stmt.loc);
}

support::Expected<void> BytecodeCompiler::compileBreakContinue(const Stmt &stmt)
{
    const bool isBreak = stmt.kind == StmtKind::Break;
    if (loops_.empty())
    {
        return makeError(ErrorKind::InvalidControlFlow,
                         stmt.loc,
                         std::string("'") + (isBreak ? "break" : "continue") +
                             "' outside of a loop");
    }

    LoopContext &ctx = *loops_.back();
    if (isBreak)
    {
        ctx.hasBreak = true;
        ctx.breakFixups.push_back(emitJump(BCOpcode::JUMP));
    }
    else if (ctx.continueTarget)
    {
        if (auto r = emitJumpTo(BCOpcode::JUMP, *ctx.continueTarget, stmt.loc); !r)
            return r;
    }
    else
    {
        ctx.continueFixups.push_back(emitJump(BCOpcode::JUMP));
    }

    reachable_ = false;
    return {};
}

} // namespace pgs::bytecode

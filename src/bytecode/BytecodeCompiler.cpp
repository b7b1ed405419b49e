// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/BytecodeCompiler.hpp"

#include <string>
#include <string_view>

namespace pgs::bytecode
{

using support::ErrorKind;
using support::makeError;

namespace
{

/// @brief Natives are addressed by their path below `root`.
std::string nativeName(const std::string &qualifiedName)
{
    constexpr std::string_view kRoot = "root::";
    if (qualifiedName.compare(0, kRoot.size(), kRoot) == 0)
        return qualifiedName.substr(kRoot.size());
    return qualifiedName;
}

} // namespace

support::Expected<BytecodeModule> BytecodeCompiler::compile(const frontend::ResolvedProgram &program)
{
    program_ = &program;
    module_ = BytecodeModule();

    // Every function gets its index up front so calls may precede definitions.
    if (auto r = declareFunctions(); !r)
        return r.error();

    for (uint32_t id = 0; id < program_->functions.size(); ++id)
    {
        if (program_->functions[id].isNative())
            continue;
        if (auto r = compileFunction(id); !r)
            return r.error();
    }

    return std::move(module_);
}

support::Expected<void> BytecodeCompiler::declareFunctions()
{
    targetIndex_.assign(program_->functions.size(), 0);

    for (uint32_t id = 0; id < program_->functions.size(); ++id)
    {
        const frontend::FunctionInfo &fn = program_->functions[id];
        const bool hasReturn = fn.ret.kind != frontend::TypeKind::Unit;

        // Natives take a table slot only once a call needs one.
        if (fn.isNative())
        {
            targetIndex_[id] = kNoIndex;
            continue;
        }

        if (module_.functions.size() >= kMax16BitIndex)
        {
            return makeError(ErrorKind::LimitExceeded,
                             fn.decl->loc,
                             "too many functions (limit " + std::to_string(kMax16BitIndex) + ")");
        }
        if (fn.numLocals > kMax16BitIndex)
        {
            return makeError(ErrorKind::LimitExceeded,
                             fn.decl->loc,
                             "function '" + fn.name + "' needs " + std::to_string(fn.numLocals) +
                                 " locals (limit " + std::to_string(kMax16BitIndex) + ")");
        }

        BytecodeFunction bcFunc;
        bcFunc.name = fn.qualifiedName;
        bcFunc.numParams = fn.paramSlots();
        bcFunc.numLocals = fn.numLocals;
        bcFunc.hasReturn = hasReturn;
        targetIndex_[id] = module_.addFunction(std::move(bcFunc));
    }
    return {};
}

/// @brief Native table index for prototype @p id, appended on first use.
support::Expected<uint32_t> BytecodeCompiler::nativeIndex(uint32_t id, SourceLoc loc)
{
    if (targetIndex_[id] != kNoIndex)
        return targetIndex_[id];

    const frontend::FunctionInfo &fn = program_->functions[id];
    if (module_.nativeFuncs.size() >= kMaxNatives)
    {
        return makeError(ErrorKind::LimitExceeded,
                         loc,
                         "too many native functions called (limit " +
                             std::to_string(kMaxNatives) + ")");
    }
    if (fn.params.size() > kMaxNativeArgs)
    {
        return makeError(ErrorKind::LimitExceeded,
                         loc,
                         "native '" + fn.name + "' has more than " +
                             std::to_string(kMaxNativeArgs) + " parameters");
    }
    targetIndex_[id] = module_.addNativeFunc(nativeName(fn.qualifiedName),
                                             static_cast<uint32_t>(fn.params.size()),
                                             fn.ret.kind != frontend::TypeKind::Unit);
    return targetIndex_[id];
}

support::Expected<void> BytecodeCompiler::compileFunction(uint32_t resolvedId)
{
    const frontend::FunctionInfo &fn = program_->functions[resolvedId];

    currentFunc_ = &module_.functions[targetIndex_[resolvedId]];
    currentLine_ = fn.decl->loc.line;
    currentStackDepth_ = 0;
    maxStackDepth_ = 0;
    reachable_ = true;
    loops_.clear();

    const frontend::BlockStmt &body = *fn.decl->body;
    if (auto r = compileBlock(body); !r)
        return r;

    if (reachable_)
    {
        if (fn.ret.kind != frontend::TypeKind::Unit)
        {
            return makeError(ErrorKind::MissingReturn,
                             body.endLoc,
                             "function '" + fn.name + "' can reach its end without returning '" +
                                 program_->typeName(fn.ret) + "'");
        }
        currentLine_ = body.endLoc.line;
        emit(BCOpcode::LOAD_UNIT);
        pushStack();
        emit(BCOpcode::RETURN);
        popStack();
    }

    currentFunc_->maxStack = static_cast<uint32_t>(maxStackDepth_);
    currentFunc_ = nullptr;
    return {};
}

void BytecodeCompiler::emit(uint32_t instr)
{
    currentFunc_->code.push_back(instr);
    currentFunc_->lineTable.push_back(currentLine_);
}

void BytecodeCompiler::emit(BCOpcode op)
{
    emit(encodeOp(op));
}

void BytecodeCompiler::emit16(BCOpcode op, uint16_t arg)
{
    emit(encodeOp16(op, arg));
}

void BytecodeCompiler::emitI16(BCOpcode op, int16_t arg)
{
    emit(encodeOpI16(op, arg));
}

void BytecodeCompiler::emit88(BCOpcode op, uint8_t arg0, uint8_t arg1)
{
    emit(encodeOp88(op, arg0, arg1));
}

uint32_t BytecodeCompiler::emitJump(BCOpcode op)
{
    uint32_t pos = here();
    emit(encodeOpI24(op, 0)); // Placeholder offset
    return pos;
}

support::Expected<void> BytecodeCompiler::emitJumpTo(BCOpcode op, uint32_t target, SourceLoc loc)
{
    uint32_t pos = emitJump(op);
    return patchJump(pos, target, loc);
}

support::Expected<void> BytecodeCompiler::patchJump(uint32_t pos, uint32_t target, SourceLoc loc)
{
    int64_t offset = static_cast<int64_t>(target) - static_cast<int64_t>(pos) - 1;
    if (offset < kMinJumpOffset || offset > kMaxJumpOffset)
    {
        return makeError(
            ErrorKind::LimitExceeded, loc, "jump distance exceeds the 24-bit offset range");
    }
    uint32_t &word = currentFunc_->code[pos];
    word = encodeOpI24(decodeOpcode(word), static_cast<int32_t>(offset));
    return {};
}

support::Expected<void> BytecodeCompiler::patchAll(const std::vector<uint32_t> &fixups,
                                                   SourceLoc loc)
{
    const uint32_t target = here();
    for (uint32_t pos : fixups)
    {
        if (auto r = patchJump(pos, target, loc); !r)
            return r;
    }
    return {};
}

support::Expected<uint16_t> BytecodeCompiler::index16(uint32_t index,
                                                      const char *what,
                                                      SourceLoc loc) const
{
    if (index >= kMax16BitIndex)
    {
        return makeError(ErrorKind::LimitExceeded,
                         loc,
                         std::string("too many ") + what + " (limit " +
                             std::to_string(kMax16BitIndex) + ")");
    }
    return static_cast<uint16_t>(index);
}

void BytecodeCompiler::pushStack(int32_t count)
{
    currentStackDepth_ += count;
    if (currentStackDepth_ > maxStackDepth_)
        maxStackDepth_ = currentStackDepth_;
}

void BytecodeCompiler::popStack(int32_t count)
{
    currentStackDepth_ -= count;
}

} // namespace pgs::bytecode

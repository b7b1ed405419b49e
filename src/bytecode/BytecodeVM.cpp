// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/BytecodeVM.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

namespace pgs::bytecode
{

using support::ErrorKind;

namespace
{

// Integer arithmetic wraps (two's complement) instead of overflowing.
int64_t wrapAdd(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

int64_t wrapSub(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

int64_t wrapMul(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

int64_t wrapNeg(int64_t a)
{
    return static_cast<int64_t>(0 - static_cast<uint64_t>(a));
}

} // namespace

BytecodeVM::BytecodeVM(std::shared_ptr<const BytecodeModule> module,
                       const NativeRegistry &registry,
                       RunConfig config)
    : module_(std::move(module)), registry_(registry), config_(std::move(config)),
      trace_(config_.trace)
{
}

support::Expected<Value> BytecodeVM::exec(const std::string &funcName,
                                          const std::vector<Value> &args)
{
    const BytecodeFunction *func = module_->findFunction(funcName);
    if (!func && funcName.rfind("root::", 0) != 0)
        func = module_->findFunction("root::" + funcName);
    if (!func)
    {
        return support::makeError(
            ErrorKind::UnknownFunction, {}, "no function named '" + funcName + "'");
    }
    if (args.size() != func->numParams)
    {
        return support::makeError(ErrorKind::RuntimeTypeMismatch,
                                  {},
                                  "'" + func->name + "' expects " +
                                      std::to_string(func->numParams) + " argument(s), got " +
                                      std::to_string(args.size()));
    }

    // Reset state
    state_ = VMState::Ready;
    trapMessage_.clear();
    trapLine_ = 0;
    instrCount_ = 0;
    callStack_.clear();
    callStack_.reserve(std::min<uint32_t>(config_.maxCallDepth, 256));
    fp_ = nullptr;
    valueStack_.assign(config_.maxStackSlots, Value());
    sp_ = valueStack_.data();

    if (args.size() > valueStack_.size())
    {
        trap(ErrorKind::StackOverflow, "value stack exhausted");
    }
    else
    {
        // Push arguments onto stack as initial locals
        for (const auto &arg : args)
            push(arg);
        call(func);
    }

    if (state_ != VMState::Trapped)
        run();

    support::Expected<Value> result = Value();
    if (state_ == VMState::Trapped)
    {
        support::SourceLoc loc;
        loc.line = trapLine_;
        result = support::makeError(trapKind_, loc, trapMessage_);
    }
    else
    {
        result = std::move(valueStack_.front());
    }

    // Drop every reference the run still holds.
    callStack_.clear();
    fp_ = nullptr;
    valueStack_.clear();
    sp_ = nullptr;
    return result;
}

void BytecodeVM::run()
{
    state_ = VMState::Running;

    while (state_ == VMState::Running)
    {
        if (!checkInterrupt())
            return;

        // Fetch instruction
        const uint32_t pc = fp_->pc;
        uint32_t instr = fp_->func->code[fp_->pc++];
        BCOpcode op = decodeOpcode(instr);

        ++instrCount_;
        if (trace_.tracesInstructions())
        {
            trace_.onStep(fp_->func->name,
                          pc,
                          opcodeName(op),
                          static_cast<size_t>(sp_ - fp_->stackBase));
        }

        switch (op)
        {
            //==================================================================
            // Stack Operations
            //==================================================================
            case BCOpcode::NOP:
                break;

            case BCOpcode::DUP:
                *sp_ = *(sp_ - 1);
                sp_++;
                break;

            case BCOpcode::POP:
                pop();
                break;

            //==================================================================
            // Local Variable Operations
            //==================================================================
            case BCOpcode::LOAD_LOCAL:
                push(fp_->locals[decodeArg16(instr)]);
                break;

            case BCOpcode::STORE_LOCAL:
                fp_->locals[decodeArg16(instr)] = pop();
                break;

            //==================================================================
            // Constant Loading
            //==================================================================
            case BCOpcode::LOAD_I16:
                push(Value::integer(decodeArgI16(instr)));
                break;

            case BCOpcode::LOAD_I64:
                push(Value::integer(module_->i64Pool[decodeArg16(instr)]));
                break;

            case BCOpcode::LOAD_F64:
                push(Value::floating(module_->f64Pool[decodeArg16(instr)]));
                break;

            case BCOpcode::LOAD_STR:
                push(Value::string(module_->stringPool[decodeArg16(instr)]));
                break;

            case BCOpcode::LOAD_TRUE:
                push(Value::boolean(true));
                break;

            case BCOpcode::LOAD_FALSE:
                push(Value::boolean(false));
                break;

            case BCOpcode::LOAD_UNIT:
                push(Value::unit());
                break;

            //==================================================================
            // Integer Arithmetic
            //==================================================================
            case BCOpcode::ADD_I64:
            case BCOpcode::SUB_I64:
            case BCOpcode::MUL_I64:
            case BCOpcode::SDIV_I64_CHK:
            {
                if (!expect(sp_[-2], ValueKind::Int, op) || !expect(sp_[-1], ValueKind::Int, op))
                    break;
                int64_t b = pop().asInt();
                int64_t a = sp_[-1].asInt();
                int64_t r = 0;
                if (op == BCOpcode::ADD_I64)
                    r = wrapAdd(a, b);
                else if (op == BCOpcode::SUB_I64)
                    r = wrapSub(a, b);
                else if (op == BCOpcode::MUL_I64)
                    r = wrapMul(a, b);
                else if (b == 0)
                {
                    trap(ErrorKind::DivisionByZero, "integer division by zero");
                    break;
                }
                else if (a == std::numeric_limits<int64_t>::min() && b == -1)
                    r = a;
                else
                    r = a / b;
                sp_[-1] = Value::integer(r);
                break;
            }

            case BCOpcode::NEG_I64:
                if (expect(sp_[-1], ValueKind::Int, op))
                    sp_[-1] = Value::integer(wrapNeg(sp_[-1].asInt()));
                break;

            //==================================================================
            // Float Arithmetic
            //==================================================================
            case BCOpcode::ADD_F64:
            case BCOpcode::SUB_F64:
            case BCOpcode::MUL_F64:
            case BCOpcode::DIV_F64:
            {
                if (!expect(sp_[-2], ValueKind::Float, op) ||
                    !expect(sp_[-1], ValueKind::Float, op))
                    break;
                double b = pop().asFloat();
                double a = sp_[-1].asFloat();
                double r = 0.0;
                if (op == BCOpcode::ADD_F64)
                    r = a + b;
                else if (op == BCOpcode::SUB_F64)
                    r = a - b;
                else if (op == BCOpcode::MUL_F64)
                    r = a * b;
                else
                    r = a / b;
                sp_[-1] = Value::floating(r);
                break;
            }

            case BCOpcode::NEG_F64:
                if (expect(sp_[-1], ValueKind::Float, op))
                    sp_[-1] = Value::floating(-sp_[-1].asFloat());
                break;

            //==================================================================
            // Comparisons
            //==================================================================
            case BCOpcode::CMP_LT_I64:
            case BCOpcode::CMP_LE_I64:
            case BCOpcode::CMP_GT_I64:
            case BCOpcode::CMP_GE_I64:
            {
                if (!expect(sp_[-2], ValueKind::Int, op) || !expect(sp_[-1], ValueKind::Int, op))
                    break;
                int64_t b = pop().asInt();
                int64_t a = sp_[-1].asInt();
                bool r = op == BCOpcode::CMP_LT_I64   ? a < b
                         : op == BCOpcode::CMP_LE_I64 ? a <= b
                         : op == BCOpcode::CMP_GT_I64 ? a > b
                                                      : a >= b;
                sp_[-1] = Value::boolean(r);
                break;
            }

            case BCOpcode::CMP_LT_F64:
            case BCOpcode::CMP_LE_F64:
            case BCOpcode::CMP_GT_F64:
            case BCOpcode::CMP_GE_F64:
            {
                if (!expect(sp_[-2], ValueKind::Float, op) ||
                    !expect(sp_[-1], ValueKind::Float, op))
                    break;
                double b = pop().asFloat();
                double a = sp_[-1].asFloat();
                bool r = op == BCOpcode::CMP_LT_F64   ? a < b
                         : op == BCOpcode::CMP_LE_F64 ? a <= b
                         : op == BCOpcode::CMP_GT_F64 ? a > b
                                                      : a >= b;
                sp_[-1] = Value::boolean(r);
                break;
            }

            case BCOpcode::CMP_EQ:
            case BCOpcode::CMP_NE:
            {
                if (!expect(sp_[-1], sp_[-2].kind(), op))
                    break;
                Value b = pop();
                bool eq = sp_[-1] == b;
                sp_[-1] = Value::boolean(op == BCOpcode::CMP_EQ ? eq : !eq);
                break;
            }

            case BCOpcode::NOT_BOOL:
                if (expect(sp_[-1], ValueKind::Bool, op))
                    sp_[-1] = Value::boolean(!sp_[-1].asBool());
                break;

            //==================================================================
            // Structs and Sequences
            //==================================================================
            case BCOpcode::NEW_STRUCT:
            {
                const StructLayout &layout = module_->layouts[decodeArg16(instr)];
                const size_t n = layout.fieldNames.size();
                auto inst = std::make_shared<StructInstance>();
                inst->typeName = layout.name;
                inst->fields.reserve(n);
                for (Value *v = sp_ - n; v != sp_; ++v)
                {
                    inst->fields.push_back(std::move(*v));
                    *v = Value();
                }
                sp_ -= n;
                push(Value::structure(std::move(inst)));
                break;
            }

            case BCOpcode::LOAD_FIELD:
            case BCOpcode::STORE_FIELD:
            {
                const uint16_t idx = decodeArg16(instr);
                Value *target = op == BCOpcode::LOAD_FIELD ? sp_ - 1 : sp_ - 2;
                if (!expect(*target, ValueKind::Struct, op))
                    break;
                std::shared_ptr<StructInstance> inst = target->asStruct();
                if (!inst || idx >= inst->fields.size())
                {
                    trap(ErrorKind::UndefinedField,
                         "struct '" + (inst ? inst->typeName : std::string("?")) +
                             "' has no field #" + std::to_string(idx));
                    break;
                }
                if (op == BCOpcode::LOAD_FIELD)
                {
                    sp_[-1] = inst->fields[idx];
                }
                else
                {
                    Value value = pop();
                    inst->fields[idx] = value;
                    sp_[-1] = std::move(value);
                }
                break;
            }

            case BCOpcode::SEQ_LEN:
            {
                const Value &seq = sp_[-1];
                if (seq.is(ValueKind::Int))
                    sp_[-1] = Value::integer(seq.asInt());
                else if (seq.is(ValueKind::Str))
                    sp_[-1] = Value::integer(static_cast<int64_t>(seq.asString().size()));
                else
                    expect(seq, ValueKind::Str, op);
                break;
            }

            case BCOpcode::SEQ_AT:
            {
                if (!expect(sp_[-1], ValueKind::Int, op))
                    break;
                const Value &seq = sp_[-2];
                if (!seq.is(ValueKind::Int) && !expect(seq, ValueKind::Str, op))
                    break;
                int64_t index = pop().asInt();
                if (seq.is(ValueKind::Int))
                {
                    sp_[-1] = Value::integer(index);
                    break;
                }
                const std::string &s = seq.asString();
                if (index < 0 || static_cast<uint64_t>(index) >= s.size())
                {
                    trap(ErrorKind::UndefinedField,
                         "index " + std::to_string(index) + " out of range for string of length " +
                             std::to_string(s.size()));
                    break;
                }
                sp_[-1] = Value::string(std::string(1, s[static_cast<size_t>(index)]));
                break;
            }

            //==================================================================
            // Control Flow
            //==================================================================
            case BCOpcode::JUMP:
                fp_->pc = static_cast<uint32_t>(static_cast<int64_t>(fp_->pc) + decodeArgI24(instr));
                break;

            case BCOpcode::JUMP_IF_FALSE:
                if (!expect(sp_[-1], ValueKind::Bool, op))
                    break;
                if (!pop().asBool())
                    fp_->pc =
                        static_cast<uint32_t>(static_cast<int64_t>(fp_->pc) + decodeArgI24(instr));
                break;

            case BCOpcode::CALL:
            {
                uint16_t funcIdx = decodeArg16(instr);
                if (funcIdx < module_->functions.size())
                    call(&module_->functions[funcIdx]);
                else
                    trap(ErrorKind::UnknownFunction,
                         "invalid function index " + std::to_string(funcIdx));
                break;
            }

            case BCOpcode::CALL_NATIVE:
                callNative(instr);
                break;

            case BCOpcode::RETURN:
            {
                Value result = pop();
                const bool more = popFrame();
                push(std::move(result));
                if (!more)
                {
                    // Return from the entry function
                    state_ = VMState::Halted;
                    return;
                }
                break;
            }

            default:
                trap(ErrorKind::RuntimeTypeMismatch,
                     "invalid opcode " + std::to_string(static_cast<unsigned>(op)));
                break;
        }
    }
}

/// @details The callee's locals begin at its first argument.  Non-parameter
///          locals start out as unit.
void BytecodeVM::call(const BytecodeFunction *func)
{
    if (callStack_.size() >= config_.maxCallDepth)
    {
        trap(ErrorKind::StackOverflow,
             "call depth exceeded " + std::to_string(config_.maxCallDepth) + " frames in '" +
                 func->name + "'");
        return;
    }

    // Arguments are already on stack - they become first N locals
    Value *localsStart = sp_ - func->numParams;
    const size_t used = static_cast<size_t>(localsStart - valueStack_.data());
    if (used + func->numLocals + func->maxStack > valueStack_.size())
    {
        trap(ErrorKind::StackOverflow,
             "value stack exhausted (" + std::to_string(valueStack_.size()) +
                 " slots) calling '" + func->name + "'");
        return;
    }

    callStack_.push_back({func, 0, localsStart, localsStart + func->numLocals});
    std::fill(localsStart + func->numParams, localsStart + func->numLocals, Value());
    sp_ = localsStart + func->numLocals;
    fp_ = &callStack_.back();
}

bool BytecodeVM::popFrame()
{
    // Release the callee's locals and operands; this drops struct references.
    Value *base = fp_->locals;
    std::fill(base, sp_, Value());
    sp_ = base;

    callStack_.pop_back();
    if (callStack_.empty())
    {
        fp_ = nullptr;
        return false;
    }
    fp_ = &callStack_.back();
    return true;
}

/// @details Arity, then argument kinds, then the declared return are checked
///          before the handler runs; a mismatch traps without invoking it.
void BytecodeVM::callNative(uint32_t instr)
{
    const uint8_t nativeIdx = decodeArg8_0(instr);
    const uint8_t argCount = decodeArg8_1(instr);

    if (nativeIdx >= module_->nativeFuncs.size())
    {
        trap(ErrorKind::UnknownFunction, "invalid native index " + std::to_string(nativeIdx));
        return;
    }

    const NativeFuncRef &ref = module_->nativeFuncs[nativeIdx];
    const NativeBinding *binding = registry_.find(ref.name);
    if (!binding)
    {
        trap(ErrorKind::UnknownFunction, "native '" + ref.name + "' is not registered");
        return;
    }

    const NativeSignature &sig = binding->signature;
    if (sig.params.size() != argCount)
    {
        trap(ErrorKind::NativeArityMismatch,
             "native '" + ref.name + "' expects " + std::to_string(sig.params.size()) +
                 " argument(s), got " + std::to_string(argCount));
        return;
    }

    Value *args = sp_ - argCount;
    for (uint32_t i = 0; i < argCount; ++i)
    {
        if (args[i].kind() != sig.params[i])
        {
            trap(ErrorKind::RuntimeTypeMismatch,
                 "argument " + std::to_string(i + 1) + " of native '" + ref.name + "' must be " +
                     toString(sig.params[i]) + ", found " + toString(args[i].kind()));
            return;
        }
    }
    if (ref.hasReturn != (sig.ret != ValueKind::Unit))
    {
        trap(ErrorKind::RuntimeTypeMismatch,
             "native '" + ref.name + "' is registered as returning " + toString(sig.ret) +
                 ", which does not match its declaration");
        return;
    }

    Value result;
    binding->handler(args, argCount, &result);
    if (result.kind() != sig.ret)
    {
        trap(ErrorKind::RuntimeTypeMismatch,
             "native '" + ref.name + "' returned " + toString(result.kind()) + ", declared " +
                 toString(sig.ret));
        return;
    }

    std::fill(args, sp_, Value());
    sp_ = args;
    push(std::move(result));
}

bool BytecodeVM::checkInterrupt()
{
    if (config_.maxSteps != 0 && instrCount_ >= config_.maxSteps)
    {
        trap(ErrorKind::Interrupted,
             "step limit of " + std::to_string(config_.maxSteps) + " instructions reached");
        return false;
    }
    if (config_.interruptEveryN != 0 && config_.pollCallback && instrCount_ != 0 &&
        instrCount_ % config_.interruptEveryN == 0)
    {
        if (!config_.pollCallback(*this))
        {
            trap(ErrorKind::Interrupted,
                 "interrupted by host after " + std::to_string(instrCount_) + " instructions");
            return false;
        }
    }
    return true;
}

bool BytecodeVM::expect(const Value &v, ValueKind kind, BCOpcode op)
{
    if (v.kind() == kind)
        return true;
    trap(ErrorKind::RuntimeTypeMismatch,
         std::string(opcodeName(op)) + " expects " + toString(kind) + ", found " +
             toString(v.kind()));
    return false;
}

void BytecodeVM::trap(ErrorKind kind, std::string message)
{
    trapKind_ = kind;
    trapMessage_ = std::move(message);
    // The faulting instruction is the one before pc.
    trapLine_ = fp_ && fp_->pc > 0 ? getSourceLine(fp_->func, fp_->pc - 1) : 0;
    state_ = VMState::Trapped;
}

uint32_t BytecodeVM::currentSourceLine() const
{
    if (!fp_ || !fp_->func)
        return 0;
    return getSourceLine(fp_->func, fp_->pc);
}

uint32_t BytecodeVM::getSourceLine(const BytecodeFunction *func, uint32_t pc)
{
    if (!func || func->lineTable.empty())
        return 0;
    if (pc >= func->lineTable.size())
        return 0;
    return func->lineTable[pc];
}

} // namespace pgs::bytecode

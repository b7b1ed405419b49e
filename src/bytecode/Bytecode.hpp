//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bytecode.hpp
// Purpose: Bytecode instruction format and opcode definitions.
// Key invariants: All instructions are 32-bit fixed-width words.
//                 Opcodes are grouped by functional category in hex ranges.
// Ownership: Part of the bytecode subsystem; no external dependencies.
// Lifetime: Constants and inline helpers are header-only; opcodeName() is
//           defined in the corresponding .cpp translation unit.
// Links: BytecodeCompiler.hpp, BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding:
// - [opcode:8][args:24]
// - Local, pool, layout and function indices are 16-bit
// - Jump offsets are signed 24-bit, relative to the word after the jump
// - CALL_NATIVE packs the native index and argument count as two 8-bit args
//
// Stack Model:
// - Stack-based evaluation with local variable slots
// - Parameters (after `self` for methods) map to the first locals
// - The operand stack grows upward from the frame's locals
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace pgs::bytecode
{

/// @brief Largest index addressable by a 16-bit operand, plus one.
constexpr uint32_t kMax16BitIndex = 0x10000;

/// @brief Maximum number of distinct natives a module may reference.
constexpr uint32_t kMaxNatives = 0x100;

/// @brief Maximum argument count encodable in CALL_NATIVE.
constexpr uint32_t kMaxNativeArgs = 0xFF;

/// @brief Bytecode opcodes.
/// @details Encoding categories:
///          - 0x00-0x0F  Stack operations
///          - 0x10-0x1F  Local variable operations
///          - 0x20-0x2F  Constant loading
///          - 0x30-0x4F  Integer arithmetic
///          - 0x50-0x5F  Float arithmetic
///          - 0x70-0x7F  Integer comparisons
///          - 0x80-0x8F  Float comparisons
///          - 0x90-0x9F  Generic comparisons and logic
///          - 0xA0-0xAF  Struct and sequence operations
///          - 0xB0-0xBF  Control flow
enum class BCOpcode : uint8_t
{
    // Stack Operations (0x00-0x0F)
    NOP = 0x00,
    DUP = 0x01, ///< Duplicate top of stack
    POP = 0x02, ///< Discard top of stack

    // Local Variable Operations (0x10-0x1F)
    LOAD_LOCAL = 0x10,  ///< Push local[arg16]
    STORE_LOCAL = 0x11, ///< Pop into local[arg16]

    // Constant Loading (0x20-0x2F)
    LOAD_I16 = 0x20,   ///< Push sign-extended 16-bit immediate
    LOAD_I64 = 0x21,   ///< Push i64Pool[arg16]
    LOAD_F64 = 0x22,   ///< Push f64Pool[arg16]
    LOAD_STR = 0x23,   ///< Push stringPool[arg16]
    LOAD_TRUE = 0x24,  ///< Push true
    LOAD_FALSE = 0x25, ///< Push false
    LOAD_UNIT = 0x26,  ///< Push unit

    // Integer Arithmetic (0x30-0x4F); wraps on overflow
    ADD_I64 = 0x30,
    SUB_I64 = 0x31,
    MUL_I64 = 0x32,
    SDIV_I64_CHK = 0x33, ///< Traps on division by zero
    NEG_I64 = 0x34,

    // Float Arithmetic (0x50-0x5F); IEEE-754
    ADD_F64 = 0x50,
    SUB_F64 = 0x51,
    MUL_F64 = 0x52,
    DIV_F64 = 0x53,
    NEG_F64 = 0x54,

    // Integer Comparisons (0x70-0x7F)
    CMP_LT_I64 = 0x70,
    CMP_LE_I64 = 0x71,
    CMP_GT_I64 = 0x72,
    CMP_GE_I64 = 0x73,

    // Float Comparisons (0x80-0x8F)
    CMP_LT_F64 = 0x80,
    CMP_LE_F64 = 0x81,
    CMP_GT_F64 = 0x82,
    CMP_GE_F64 = 0x83,

    // Generic Comparisons and Logic (0x90-0x9F)
    CMP_EQ = 0x90,   ///< Kinds must match; structs compare by identity
    CMP_NE = 0x91,
    NOT_BOOL = 0x92,

    // Structs and Sequences (0xA0-0xAF)
    NEW_STRUCT = 0xA0,  ///< Pop layout field count values; push instance of layouts[arg16]
    LOAD_FIELD = 0xA1,  ///< Pop struct; push field[arg16]
    STORE_FIELD = 0xA2, ///< Pop value and struct; store; push value
    SEQ_LEN = 0xA8,     ///< Pop int or string; push element count
    SEQ_AT = 0xA9,      ///< Pop index and sequence; push element

    // Control Flow (0xB0-0xBF)
    JUMP = 0xB0,          ///< pc += argI24
    JUMP_IF_FALSE = 0xB2, ///< Pop bool; pc += argI24 when false
    CALL = 0xB5,          ///< Call functions[arg16]
    CALL_NATIVE = 0xB6,   ///< Call nativeFuncs[arg8_0] with arg8_1 arguments
    RETURN = 0xB8,        ///< Pop result; return to caller
};

/// @brief Mnemonic for @p op, or "UNKNOWN".
const char *opcodeName(BCOpcode op);

/// @brief Check whether an opcode never falls through to the next word.
inline constexpr bool isTerminator(BCOpcode op)
{
    return op == BCOpcode::JUMP || op == BCOpcode::RETURN;
}

/// @brief Check whether an opcode can raise a runtime trap.
/// @details Every opcode checks its operand tags; this lists those that can
///          trap on well-typed input.
inline constexpr bool canTrap(BCOpcode op)
{
    switch (op)
    {
        case BCOpcode::SDIV_I64_CHK:
        case BCOpcode::LOAD_FIELD:
        case BCOpcode::STORE_FIELD:
        case BCOpcode::SEQ_AT:
        case BCOpcode::CALL:
        case BCOpcode::CALL_NATIVE:
            return true;
        default:
            return false;
    }
}

//==============================================================================
// Instruction Encoding Helpers
//==============================================================================

/// @brief Encode [opcode:8][0:24].
inline constexpr uint32_t encodeOp(BCOpcode op)
{
    return static_cast<uint32_t>(op);
}

/// @brief Encode [opcode:8][arg0:8][arg1:8][0:8].
inline constexpr uint32_t encodeOp88(BCOpcode op, uint8_t arg0, uint8_t arg1)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(arg0) << 8) |
           (static_cast<uint32_t>(arg1) << 16);
}

/// @brief Encode [opcode:8][arg0:16][0:8].
inline constexpr uint32_t encodeOp16(BCOpcode op, uint16_t arg0)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(arg0) << 8);
}

/// @brief Encode [opcode:8][arg0:16] with a signed argument.
inline constexpr uint32_t encodeOpI16(BCOpcode op, int16_t arg0)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(static_cast<uint16_t>(arg0)) << 8);
}

/// @brief Encode [opcode:8][arg0:24] with a signed argument.
/// @details The value is masked to 24 bits; decodeArgI24 sign-extends.
inline constexpr uint32_t encodeOpI24(BCOpcode op, int32_t arg0)
{
    return static_cast<uint32_t>(op) | ((static_cast<uint32_t>(arg0) & 0xFFFFFF) << 8);
}

//==============================================================================
// Instruction Decoding Helpers
//==============================================================================

inline constexpr BCOpcode decodeOpcode(uint32_t instr)
{
    return static_cast<BCOpcode>(instr & 0xFF);
}

inline constexpr uint8_t decodeArg8_0(uint32_t instr)
{
    return static_cast<uint8_t>((instr >> 8) & 0xFF);
}

inline constexpr uint8_t decodeArg8_1(uint32_t instr)
{
    return static_cast<uint8_t>((instr >> 16) & 0xFF);
}

inline constexpr uint16_t decodeArg16(uint32_t instr)
{
    return static_cast<uint16_t>((instr >> 8) & 0xFFFF);
}

inline constexpr int16_t decodeArgI16(uint32_t instr)
{
    return static_cast<int16_t>((instr >> 8) & 0xFFFF);
}

inline constexpr int32_t decodeArgI24(uint32_t instr)
{
    uint32_t raw = (instr >> 8) & 0xFFFFFF;
    // Sign extend from 24-bit
    if (raw & 0x800000)
        return static_cast<int32_t>(raw | 0xFF000000);
    return static_cast<int32_t>(raw);
}

/// @brief Smallest and largest offsets representable by encodeOpI24.
constexpr int32_t kMinJumpOffset = -0x800000;
constexpr int32_t kMaxJumpOffset = 0x7FFFFF;

/// @brief Render one instruction word as text, e.g. "LOAD_LOCAL 2".
std::string formatInstr(uint32_t instr);

} // namespace pgs::bytecode

// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Bytecode.hpp"

namespace pgs::bytecode
{

const char *opcodeName(BCOpcode op)
{
    switch (op)
    {
        // Stack Operations
        case BCOpcode::NOP:
            return "NOP";
        case BCOpcode::DUP:
            return "DUP";
        case BCOpcode::POP:
            return "POP";

        // Local Variable Operations
        case BCOpcode::LOAD_LOCAL:
            return "LOAD_LOCAL";
        case BCOpcode::STORE_LOCAL:
            return "STORE_LOCAL";

        // Constant Loading
        case BCOpcode::LOAD_I16:
            return "LOAD_I16";
        case BCOpcode::LOAD_I64:
            return "LOAD_I64";
        case BCOpcode::LOAD_F64:
            return "LOAD_F64";
        case BCOpcode::LOAD_STR:
            return "LOAD_STR";
        case BCOpcode::LOAD_TRUE:
            return "LOAD_TRUE";
        case BCOpcode::LOAD_FALSE:
            return "LOAD_FALSE";
        case BCOpcode::LOAD_UNIT:
            return "LOAD_UNIT";

        // Integer Arithmetic
        case BCOpcode::ADD_I64:
            return "ADD_I64";
        case BCOpcode::SUB_I64:
            return "SUB_I64";
        case BCOpcode::MUL_I64:
            return "MUL_I64";
        case BCOpcode::SDIV_I64_CHK:
            return "SDIV_I64_CHK";
        case BCOpcode::NEG_I64:
            return "NEG_I64";

        // Float Arithmetic
        case BCOpcode::ADD_F64:
            return "ADD_F64";
        case BCOpcode::SUB_F64:
            return "SUB_F64";
        case BCOpcode::MUL_F64:
            return "MUL_F64";
        case BCOpcode::DIV_F64:
            return "DIV_F64";
        case BCOpcode::NEG_F64:
            return "NEG_F64";

        // Integer Comparisons
        case BCOpcode::CMP_LT_I64:
            return "CMP_LT_I64";
        case BCOpcode::CMP_LE_I64:
            return "CMP_LE_I64";
        case BCOpcode::CMP_GT_I64:
            return "CMP_GT_I64";
        case BCOpcode::CMP_GE_I64:
            return "CMP_GE_I64";

        // Float Comparisons
        case BCOpcode::CMP_LT_F64:
            return "CMP_LT_F64";
        case BCOpcode::CMP_LE_F64:
            return "CMP_LE_F64";
        case BCOpcode::CMP_GT_F64:
            return "CMP_GT_F64";
        case BCOpcode::CMP_GE_F64:
            return "CMP_GE_F64";

        // Generic Comparisons and Logic
        case BCOpcode::CMP_EQ:
            return "CMP_EQ";
        case BCOpcode::CMP_NE:
            return "CMP_NE";
        case BCOpcode::NOT_BOOL:
            return "NOT_BOOL";

        // Structs and Sequences
        case BCOpcode::NEW_STRUCT:
            return "NEW_STRUCT";
        case BCOpcode::LOAD_FIELD:
            return "LOAD_FIELD";
        case BCOpcode::STORE_FIELD:
            return "STORE_FIELD";
        case BCOpcode::SEQ_LEN:
            return "SEQ_LEN";
        case BCOpcode::SEQ_AT:
            return "SEQ_AT";

        // Control Flow
        case BCOpcode::JUMP:
            return "JUMP";
        case BCOpcode::JUMP_IF_FALSE:
            return "JUMP_IF_FALSE";
        case BCOpcode::CALL:
            return "CALL";
        case BCOpcode::CALL_NATIVE:
            return "CALL_NATIVE";
        case BCOpcode::RETURN:
            return "RETURN";
    }
    return "UNKNOWN";
}

std::string formatInstr(uint32_t instr)
{
    const BCOpcode op = decodeOpcode(instr);
    std::string out = opcodeName(op);
    switch (op)
    {
        case BCOpcode::LOAD_LOCAL:
        case BCOpcode::STORE_LOCAL:
        case BCOpcode::LOAD_I64:
        case BCOpcode::LOAD_F64:
        case BCOpcode::LOAD_STR:
        case BCOpcode::NEW_STRUCT:
        case BCOpcode::LOAD_FIELD:
        case BCOpcode::STORE_FIELD:
        case BCOpcode::CALL:
            out += ' ' + std::to_string(decodeArg16(instr));
            break;
        case BCOpcode::LOAD_I16:
            out += ' ' + std::to_string(decodeArgI16(instr));
            break;
        case BCOpcode::JUMP:
        case BCOpcode::JUMP_IF_FALSE:
        {
            int32_t offset = decodeArgI24(instr);
            out += offset >= 0 ? " +" : " ";
            out += std::to_string(offset);
            break;
        }
        case BCOpcode::CALL_NATIVE:
            out += ' ' + std::to_string(decodeArg8_0(instr)) + ' ' +
                   std::to_string(decodeArg8_1(instr));
            break;
        default:
            break;
    }
    return out;
}

} // namespace pgs::bytecode

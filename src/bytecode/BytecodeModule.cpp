//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeModule.cpp
// Purpose: Textual listing of compiled modules.
// Key invariants: Output depends only on module contents, so identical
//                 modules produce identical listings.
// Links: BytecodeModule.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeModule.hpp"

#include "pgs/Value.hpp"

#include <iomanip>
#include <sstream>

namespace pgs::bytecode
{

namespace
{

void listPools(std::ostringstream &os, const BytecodeModule &module)
{
    for (size_t i = 0; i < module.i64Pool.size(); ++i)
        os << "  i64[" << i << "] = " << module.i64Pool[i] << '\n';
    for (size_t i = 0; i < module.f64Pool.size(); ++i)
        os << "  f64[" << i << "] = " << Value::floating(module.f64Pool[i]).toString() << '\n';
    for (size_t i = 0; i < module.stringPool.size(); ++i)
        os << "  str[" << i << "] = " << std::quoted(module.stringPool[i]) << '\n';
    for (size_t i = 0; i < module.layouts.size(); ++i)
    {
        const StructLayout &layout = module.layouts[i];
        os << "  layout[" << i << "] = " << layout.name << " {";
        for (size_t f = 0; f < layout.fieldNames.size(); ++f)
            os << (f ? ", " : " ") << layout.fieldNames[f];
        os << " }\n";
    }
    for (size_t i = 0; i < module.nativeFuncs.size(); ++i)
    {
        const NativeFuncRef &ref = module.nativeFuncs[i];
        os << "  native[" << i << "] = " << ref.name << '/' << ref.paramCount
           << (ref.hasReturn ? "" : " (unit)") << '\n';
    }
}

} // namespace

std::string disassemble(const BytecodeModule &module)
{
    std::ostringstream os;
    os << "module";
    if (!module.sourcePath.empty())
        os << ' ' << module.sourcePath;
    os << '\n';
    listPools(os, module);

    for (size_t idx = 0; idx < module.functions.size(); ++idx)
    {
        const BytecodeFunction &fn = module.functions[idx];
        os << "\nfn #" << idx << ' ' << fn.name << " params=" << fn.numParams
           << " locals=" << fn.numLocals << " stack=" << fn.maxStack << '\n';
        for (size_t pc = 0; pc < fn.code.size(); ++pc)
        {
            os << "  " << std::setw(4) << std::setfill('0') << pc << std::setfill(' ');
            if (pc < fn.lineTable.size())
                os << "  L" << std::left << std::setw(4) << fn.lineTable[pc] << std::right;
            os << "  " << formatInstr(fn.code[pc]) << '\n';
        }
    }
    return os.str();
}

} // namespace pgs::bytecode

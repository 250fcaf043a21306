//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Instr.cpp
// Purpose: Disassembly formatting for decoded instructions.
// Key invariants: Output is a single line without a trailing newline.
// Ownership/Lifetime: Stateless.
// Links: wasm/Instr.hpp
//
//===----------------------------------------------------------------------===//

#include "wasm/Instr.hpp"

#include <sstream>

namespace wasmdbg::wasm
{

std::string formatInstr(const Instr &instr)
{
    std::ostringstream os;
    os << opcodeName(instr.op);
    switch (immediateKind(instr.op))
    {
        case ImmediateKind::None:
        case ImmediateKind::MemoryIndex:
            break;
        case ImmediateKind::BlockType:
            if (instr.blockResult)
                os << " (result " << toString(*instr.blockResult) << ")";
            break;
        case ImmediateKind::Label:
        case ImmediateKind::Index:
            os << ' ' << instr.index;
            break;
        case ImmediateKind::LabelTable:
            for (uint32_t target : instr.targets)
                os << ' ' << target;
            break;
        case ImmediateKind::CallIndirect:
            os << " (type " << instr.index << ")";
            break;
        case ImmediateKind::MemArg:
            if (instr.offset != 0)
                os << " offset=" << instr.offset;
            os << " align=" << (1U << instr.align);
            break;
        case ImmediateKind::ConstI32:
            os << ' ' << *instr.constant.as<int32_t>();
            break;
        case ImmediateKind::ConstI64:
            os << ' ' << *instr.constant.as<int64_t>();
            break;
        case ImmediateKind::ConstF32:
            os << ' ' << *instr.constant.as<float>();
            break;
        case ImmediateKind::ConstF64:
            os << ' ' << *instr.constant.as<double>();
            break;
    }
    return os.str();
}

} // namespace wasmdbg::wasm

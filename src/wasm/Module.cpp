//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Module.cpp
// Purpose: Lookup helpers and control-flow resolution for decoded modules.
// Key invariants: resolveControlFlow either resolves every structured
//                 instruction or leaves an error; callers discard the body on
//                 error.
// Ownership/Lifetime: Operates on caller-owned modules and bodies.
// Links: wasm/Module.hpp
//
//===----------------------------------------------------------------------===//

#include "wasm/Module.hpp"

namespace wasmdbg::wasm
{

const FuncType *Module::funcType(uint32_t funcIndex) const
{
    if (funcIndex >= functions.size())
        return nullptr;
    const uint32_t typeIndex = functions[funcIndex].typeIndex;
    if (typeIndex >= types.size())
        return nullptr;
    return &types[typeIndex];
}

const Export *Module::findExport(std::string_view name, ExternalKind kind) const
{
    for (const auto &exp : exports)
    {
        if (exp.kind == kind && exp.name == name)
            return &exp;
    }
    return nullptr;
}

const CustomSection *Module::findCustomSection(std::string_view name) const
{
    for (const auto &section : customSections)
    {
        if (section.name == name)
            return &section;
    }
    return nullptr;
}

std::optional<uint32_t> Module::entryPoint() const
{
    if (start)
        return start;
    for (const char *name : {"_start", "main"})
    {
        if (const Export *exp = findExport(name, ExternalKind::Function))
            return exp->index;
    }
    return std::nullopt;
}

bool Module::hasInstruction(uint32_t funcIndex, uint32_t instrIndex) const
{
    if (funcIndex >= functions.size())
        return false;
    const Function &fn = functions[funcIndex];
    return !fn.isImport() && instrIndex < fn.code.size();
}

support::Expected<void, std::string> resolveControlFlow(std::vector<Instr> &code)
{
    if (code.empty() || code.back().op != Opcode::End)
        return std::string("function body does not end with 'end'");

    std::vector<uint32_t> open;
    const auto last = static_cast<uint32_t>(code.size() - 1);
    for (uint32_t pc = 0; pc < last; ++pc)
    {
        Instr &instr = code[pc];
        switch (instr.op)
        {
            case Opcode::Block:
            case Opcode::Loop:
            case Opcode::If:
                open.push_back(pc);
                break;
            case Opcode::Else:
            {
                if (open.empty() || code[open.back()].op != Opcode::If)
                    return "'else' without matching 'if' at #" + std::to_string(pc);
                Instr &opener = code[open.back()];
                if (opener.elsePc != kNoTarget)
                    return "duplicate 'else' at #" + std::to_string(pc);
                opener.elsePc = pc;
                break;
            }
            case Opcode::End:
            {
                if (open.empty())
                    return "unexpected 'end' at #" + std::to_string(pc);
                Instr &opener = code[open.back()];
                open.pop_back();
                opener.endPc = pc;
                if (opener.elsePc != kNoTarget)
                    code[opener.elsePc].endPc = pc;
                break;
            }
            default:
                break;
        }
    }
    if (!open.empty())
        return "unterminated block opened at #" + std::to_string(open.back());
    return {};
}

} // namespace wasmdbg::wasm

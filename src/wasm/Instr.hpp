//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Instr.hpp
// Purpose: Decoded instruction record stored in function bodies.
// Key invariants: Structured control instructions carry resolved targets once
//                 resolveControlFlow has run: block/loop/if know their end,
//                 if knows its else, else knows its end.
// Ownership/Lifetime: Plain value type owned by Function::code.
// Links: wasm/Opcode.hpp, wasm/Module.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Opcode.hpp"
#include "wasm/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wasmdbg::wasm
{

/// @brief Sentinel for an unresolved instruction index.
inline constexpr uint32_t kNoTarget = 0xFFFFFFFFU;

/// @brief One decoded instruction with its immediates.
/// @details Only the fields relevant to @ref op are meaningful; the others keep
///          their defaults. @ref index holds the function, local, global or
///          type index, or the relative depth of br/br_if.
struct Instr
{
    Opcode op = Opcode::Nop;
    uint32_t index = 0;
    uint32_t offset = 0; ///< Static memarg offset.
    uint32_t align = 0;  ///< Memarg alignment exponent.
    Value constant;      ///< Payload of the *.const instructions.

    /// @brief Result type of block, loop and if; empty for no result.
    std::optional<ValueType> blockResult;

    /// @brief Instruction index of the matching end (block, loop, if, else).
    uint32_t endPc = kNoTarget;

    /// @brief Instruction index of the matching else (if only).
    uint32_t elsePc = kNoTarget;

    /// @brief br_table depths; the last entry is the default.
    std::vector<uint32_t> targets;

    static Instr make(Opcode op)
    {
        Instr instr;
        instr.op = op;
        return instr;
    }

    static Instr withIndex(Opcode op, uint32_t index)
    {
        Instr instr;
        instr.op = op;
        instr.index = index;
        return instr;
    }
};

/// @brief Render @p instr in a text-format like syntax for disassembly.
std::string formatInstr(const Instr &instr);

} // namespace wasmdbg::wasm

//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.hpp
// Purpose: Classification of the outcomes that stop VM dispatch.
// Key invariants: A trap is a report, never an unwind: VM state is left
//                 exactly as at the pausing or faulting instruction.
//                 BreakpointReached and WatchpointReached carry a registry
//                 index; UnsupportedImportCall carries a function index.
// Ownership/Lifetime: Plain value type.
// Links: vm/VM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wasmdbg::vm
{

/// @brief Reasons dispatch stops.
enum class TrapKind : uint8_t
{
    ExecutionFinished,        ///< The entry frame returned.
    BreakpointReached,        ///< A code breakpoint matched the ip.
    WatchpointReached,        ///< A global or memory watchpoint fired.
    DivisionByZero,           ///< Integer division or remainder by zero.
    SignedIntegerOverflow,    ///< Signed division of the minimum by -1.
    MemoryOutOfBounds,        ///< Effective address outside linear memory.
    UnsupportedImportCall,    ///< The import bridge could not fulfil a call.
    NoMemory,                 ///< Memory instruction in a module without memory.
    Unreachable,              ///< `unreachable` executed.
    InvalidConversionToInt,   ///< Float-to-int truncation of NaN or out-of-range input.
    UndefinedTableElement,    ///< call_indirect through an empty or missing slot.
    IndirectCallTypeMismatch, ///< call_indirect target has another signature.
    CallStackExhausted,       ///< Call depth exceeded the configured limit.
    ValueStackExhausted,      ///< Value stack exceeded the configured limit.
    TypeMismatch,             ///< Operand kinds disagree with the instruction.
};

/// @brief Trap kind with its optional payload.
struct Trap
{
    TrapKind kind = TrapKind::ExecutionFinished;
    uint32_t payload = 0; ///< Breakpoint index or function index, per kind.

    static Trap finished() noexcept
    {
        return Trap{TrapKind::ExecutionFinished, 0};
    }

    static Trap breakpoint(uint32_t index) noexcept
    {
        return Trap{TrapKind::BreakpointReached, index};
    }

    static Trap watchpoint(uint32_t index) noexcept
    {
        return Trap{TrapKind::WatchpointReached, index};
    }

    static Trap unsupportedImport(uint32_t funcIndex) noexcept
    {
        return Trap{TrapKind::UnsupportedImportCall, funcIndex};
    }

    static Trap of(TrapKind kind) noexcept
    {
        return Trap{kind, 0};
    }

    /// @brief True for faults, false for pauses and normal completion.
    bool isFault() const noexcept
    {
        return kind != TrapKind::ExecutionFinished && kind != TrapKind::BreakpointReached &&
               kind != TrapKind::WatchpointReached;
    }

    friend bool operator==(const Trap &lhs, const Trap &rhs) noexcept
    {
        return lhs.kind == rhs.kind && lhs.payload == rhs.payload;
    }
};

/// @brief Stable name of @p kind, e.g. "DivisionByZero".
std::string_view toString(TrapKind kind) noexcept;

/// @brief Human readable description, e.g. "Reached breakpoint 0".
std::string toString(const Trap &trap);

} // namespace wasmdbg::vm

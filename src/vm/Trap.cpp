//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.cpp
// Purpose: Formatting for trap kinds and trap records.
// Key invariants: Kind names are stable identifiers used by scripts and tests.
// Ownership/Lifetime: Stateless.
// Links: vm/Trap.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

namespace wasmdbg::vm
{

std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::ExecutionFinished:
            return "ExecutionFinished";
        case TrapKind::BreakpointReached:
            return "BreakpointReached";
        case TrapKind::WatchpointReached:
            return "WatchpointReached";
        case TrapKind::DivisionByZero:
            return "DivisionByZero";
        case TrapKind::SignedIntegerOverflow:
            return "SignedIntegerOverflow";
        case TrapKind::MemoryOutOfBounds:
            return "MemoryOutOfBounds";
        case TrapKind::UnsupportedImportCall:
            return "UnsupportedImportCall";
        case TrapKind::NoMemory:
            return "NoMemory";
        case TrapKind::Unreachable:
            return "Unreachable";
        case TrapKind::InvalidConversionToInt:
            return "InvalidConversionToInt";
        case TrapKind::UndefinedTableElement:
            return "UndefinedTableElement";
        case TrapKind::IndirectCallTypeMismatch:
            return "IndirectCallTypeMismatch";
        case TrapKind::CallStackExhausted:
            return "CallStackExhausted";
        case TrapKind::ValueStackExhausted:
            return "ValueStackExhausted";
        case TrapKind::TypeMismatch:
            return "TypeMismatch";
    }
    return "Unknown";
}

std::string toString(const Trap &trap)
{
    switch (trap.kind)
    {
        case TrapKind::ExecutionFinished:
            return "Execution finished";
        case TrapKind::BreakpointReached:
            return "Reached breakpoint " + std::to_string(trap.payload);
        case TrapKind::WatchpointReached:
            return "Reached watchpoint " + std::to_string(trap.payload);
        case TrapKind::DivisionByZero:
            return "Division by zero";
        case TrapKind::SignedIntegerOverflow:
            return "Signed integer overflow";
        case TrapKind::MemoryOutOfBounds:
            return "Out of bounds memory access";
        case TrapKind::UnsupportedImportCall:
            return "Unsupported call to imported function " + std::to_string(trap.payload);
        case TrapKind::NoMemory:
            return "No memory present";
        case TrapKind::Unreachable:
            return "Reached unreachable instruction";
        case TrapKind::InvalidConversionToInt:
            return "Invalid conversion to integer";
        case TrapKind::UndefinedTableElement:
            return "Undefined table element";
        case TrapKind::IndirectCallTypeMismatch:
            return "Indirect call type mismatch";
        case TrapKind::CallStackExhausted:
            return "Call stack exhausted";
        case TrapKind::ValueStackExhausted:
            return "Value stack exhausted";
        case TrapKind::TypeMismatch:
            return "Operand type mismatch";
    }
    return std::string(toString(trap.kind));
}

} // namespace wasmdbg::vm

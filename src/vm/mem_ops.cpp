//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/mem_ops.cpp
// Purpose: Linear memory loads, stores, memory.size and memory.grow.
// Key invariants: The effective address is the i32 operand plus the static
//                 offset, computed in 64 bits so it cannot wrap. An access
//                 whose whole width is not inside memory faults before any
//                 byte is touched. Memory watchpoints fire after the access
//                 has been committed.
// Ownership/Lifetime: Member functions of VM.
// Links: vm/Memory.hpp, vm/Breakpoints.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "vm/OpHelpers.hpp"

#include <type_traits>

namespace wasmdbg::vm
{

using wasm::F32;
using wasm::F64;
using wasm::Opcode;

/// @brief Load a @p Stored from memory and push it widened to @p Pushed.
template <typename Stored, typename Pushed> std::optional<Trap> VM::loadOp(const wasm::Instr &in)
{
    if (memories_.empty())
        return Trap::of(TrapKind::NoMemory);
    const auto address = stack_.peekAs<uint32_t>(0);
    if (!address)
        return ops::typeMismatch();
    const uint64_t effective = static_cast<uint64_t>(*address) + in.offset;
    const auto loaded = memories_.front().load<Stored>(effective);
    if (!loaded)
        return Trap::of(TrapKind::MemoryOutOfBounds);

    if constexpr (std::is_same_v<Stored, Pushed>)
        stack_.replace(1, wasm::Value(*loaded));
    else
        stack_.replace(1, wasm::Value(static_cast<Pushed>(*loaded)));

    if (watch_)
    {
        if (auto index = watch_->findMemory(effective, sizeof(Stored), WatchTrigger::Read))
            return Trap::watchpoint(*index);
    }
    return std::nullopt;
}

/// @brief Pop an @p Operand and its address, store it narrowed to @p Stored.
template <typename Operand, typename Stored> std::optional<Trap> VM::storeOp(const wasm::Instr &in)
{
    if (memories_.empty())
        return Trap::of(TrapKind::NoMemory);
    const auto value = stack_.peekAs<Operand>(0);
    const auto address = stack_.peekAs<uint32_t>(1);
    if (!value || !address)
        return ops::typeMismatch();
    const uint64_t effective = static_cast<uint64_t>(*address) + in.offset;

    bool stored = false;
    if constexpr (std::is_same_v<Operand, Stored>)
        stored = memories_.front().store<Stored>(effective, *value);
    else
        stored = memories_.front().store<Stored>(effective, static_cast<Stored>(*value));
    if (!stored)
        return Trap::of(TrapKind::MemoryOutOfBounds);
    stack_.pop(2);

    if (watch_)
    {
        if (auto index = watch_->findMemory(effective, sizeof(Stored), WatchTrigger::Write))
            return Trap::watchpoint(*index);
    }
    return std::nullopt;
}

std::optional<Trap> VM::execMemory(const wasm::Instr &in)
{
    switch (in.op)
    {
        case Opcode::I32Load:
            return loadOp<uint32_t, uint32_t>(in);
        case Opcode::I64Load:
            return loadOp<uint64_t, uint64_t>(in);
        case Opcode::F32Load:
            return loadOp<F32, F32>(in);
        case Opcode::F64Load:
            return loadOp<F64, F64>(in);
        case Opcode::I32Load8S:
            return loadOp<int8_t, int32_t>(in);
        case Opcode::I32Load8U:
            return loadOp<uint8_t, uint32_t>(in);
        case Opcode::I32Load16S:
            return loadOp<int16_t, int32_t>(in);
        case Opcode::I32Load16U:
            return loadOp<uint16_t, uint32_t>(in);
        case Opcode::I64Load8S:
            return loadOp<int8_t, int64_t>(in);
        case Opcode::I64Load8U:
            return loadOp<uint8_t, uint64_t>(in);
        case Opcode::I64Load16S:
            return loadOp<int16_t, int64_t>(in);
        case Opcode::I64Load16U:
            return loadOp<uint16_t, uint64_t>(in);
        case Opcode::I64Load32S:
            return loadOp<int32_t, int64_t>(in);
        case Opcode::I64Load32U:
            return loadOp<uint32_t, uint64_t>(in);

        case Opcode::I32Store:
            return storeOp<uint32_t, uint32_t>(in);
        case Opcode::I64Store:
            return storeOp<uint64_t, uint64_t>(in);
        case Opcode::F32Store:
            return storeOp<F32, F32>(in);
        case Opcode::F64Store:
            return storeOp<F64, F64>(in);
        case Opcode::I32Store8:
            return storeOp<uint32_t, uint8_t>(in);
        case Opcode::I32Store16:
            return storeOp<uint32_t, uint16_t>(in);
        case Opcode::I64Store8:
            return storeOp<uint64_t, uint8_t>(in);
        case Opcode::I64Store16:
            return storeOp<uint64_t, uint16_t>(in);
        case Opcode::I64Store32:
            return storeOp<uint64_t, uint32_t>(in);

        case Opcode::MemorySize:
            if (memories_.empty())
                return Trap::of(TrapKind::NoMemory);
            return push(wasm::Value(memories_.front().pages()));
        case Opcode::MemoryGrow:
        {
            if (memories_.empty())
                return Trap::of(TrapKind::NoMemory);
            const auto delta = stack_.peekAs<uint32_t>(0);
            if (!delta)
                return ops::typeMismatch();
            const auto previous = memories_.front().grow(*delta);
            stack_.replace(1, wasm::Value(previous ? *previous : static_cast<uint32_t>(-1)));
            return std::nullopt;
        }
        default:
            return ops::typeMismatch();
    }
}

} // namespace wasmdbg::vm

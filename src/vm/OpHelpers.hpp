//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHelpers.hpp
// Purpose: Operand plumbing shared by the numeric opcode handlers.
// Key invariants: Operands are peeked, never popped, until the result is
//                 known; on a fault the stack is left untouched.
// Ownership/Lifetime: Header-only helpers operating on a caller's stack.
// Links: vm/int_ops.cpp, vm/fp_ops.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Trap.hpp"
#include "vm/ValueStack.hpp"
#include "wasm/Numeric.hpp"

#include <optional>

namespace wasmdbg::vm::ops
{

inline Trap typeMismatch() noexcept
{
    return Trap::of(TrapKind::TypeMismatch);
}

/// @brief Map a numeric failure to the trap it raises.
inline Trap toTrap(wasm::ArithError error) noexcept
{
    switch (error)
    {
        case wasm::ArithError::DivisionByZero:
            return Trap::of(TrapKind::DivisionByZero);
        case wasm::ArithError::SignedOverflow:
            return Trap::of(TrapKind::SignedIntegerOverflow);
        case wasm::ArithError::InvalidConversion:
            return Trap::of(TrapKind::InvalidConversionToInt);
    }
    return typeMismatch();
}

/// @brief Comparison results are i32 0 or 1.
inline int32_t flag(bool value) noexcept
{
    return value ? 1 : 0;
}

/// @brief Replace the top operand, read as @p T, with fn(operand).
template <typename T, typename Fn> std::optional<Trap> unary(ValueStack &stack, Fn fn)
{
    const auto operand = stack.peekAs<T>(0);
    if (!operand)
        return typeMismatch();
    stack.replace(1, wasm::Value(fn(*operand)));
    return std::nullopt;
}

/// @brief Replace the top two operands, read as @p T, with fn(lhs, rhs).
template <typename T, typename Fn> std::optional<Trap> binary(ValueStack &stack, Fn fn)
{
    const auto rhs = stack.peekAs<T>(0);
    const auto lhs = stack.peekAs<T>(1);
    if (!lhs || !rhs)
        return typeMismatch();
    stack.replace(2, wasm::Value(fn(*lhs, *rhs)));
    return std::nullopt;
}

/// @brief unary() for operations returning numeric::Checked.
template <typename T, typename Fn> std::optional<Trap> checkedUnary(ValueStack &stack, Fn fn)
{
    const auto operand = stack.peekAs<T>(0);
    if (!operand)
        return typeMismatch();
    auto result = fn(*operand);
    if (!result)
        return toTrap(result.error());
    stack.replace(1, wasm::Value(result.value()));
    return std::nullopt;
}

/// @brief binary() for operations returning numeric::Checked.
template <typename T, typename Fn> std::optional<Trap> checkedBinary(ValueStack &stack, Fn fn)
{
    const auto rhs = stack.peekAs<T>(0);
    const auto lhs = stack.peekAs<T>(1);
    if (!lhs || !rhs)
        return typeMismatch();
    auto result = fn(*lhs, *rhs);
    if (!result)
        return toTrap(result.error());
    stack.replace(2, wasm::Value(result.value()));
    return std::nullopt;
}

} // namespace wasmdbg::vm::ops

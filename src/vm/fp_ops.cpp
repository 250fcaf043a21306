//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/fp_ops.cpp
// Purpose: Handlers for f32/f64 arithmetic and comparisons and for every
//          conversion between value kinds.
// Key invariants: abs, neg and copysign operate on the bit pattern and never
//                 touch NaN payloads. Float-to-int truncation faults with
//                 InvalidConversionToInt on NaN or out-of-range input.
// Ownership/Lifetime: Member functions of VM.
// Links: wasm/Numeric.hpp, vm/OpHelpers.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "vm/OpHelpers.hpp"

#include <cmath>

namespace wasmdbg::vm
{
namespace
{

namespace num = wasm::numeric;
using ops::flag;
using wasm::F32;
using wasm::F64;

/// @brief Arithmetic shared by f32 and f64, keyed on the opcode's offset
///        from the width's Abs opcode.
template <typename T, typename Bits>
std::optional<Trap> floatArith(uint8_t offset, ValueStack &stack)
{
    switch (offset)
    {
        case 0: // abs
            return ops::unary<Bits>(stack, num::fabs<Bits>);
        case 1: // neg
            return ops::unary<Bits>(stack, num::fneg<Bits>);
        case 2:
            return ops::unary<T>(stack, [](T v) { return std::ceil(v); });
        case 3:
            return ops::unary<T>(stack, [](T v) { return std::floor(v); });
        case 4:
            return ops::unary<T>(stack, [](T v) { return std::trunc(v); });
        case 5:
            return ops::unary<T>(stack, num::nearest<T>);
        case 6:
            return ops::unary<T>(stack, [](T v) { return std::sqrt(v); });
        case 7:
            return ops::binary<T>(stack, [](T a, T b) { return a + b; });
        case 8:
            return ops::binary<T>(stack, [](T a, T b) { return a - b; });
        case 9:
            return ops::binary<T>(stack, [](T a, T b) { return a * b; });
        case 10:
            return ops::binary<T>(stack, [](T a, T b) { return a / b; });
        case 11:
            return ops::binary<T>(stack, num::fmin<T>);
        case 12:
            return ops::binary<T>(stack, num::fmax<T>);
        case 13: // copysign
            return ops::binary<Bits>(stack, num::copysign<Bits>);
        default:
            return ops::typeMismatch();
    }
}

/// @brief eq, ne, lt, gt, le, ge keyed on the offset from the width's Eq.
template <typename T> std::optional<Trap> floatCompare(uint8_t offset, ValueStack &stack)
{
    switch (offset)
    {
        case 0:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a == b); });
        case 1:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a != b); });
        case 2:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a < b); });
        case 3:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a > b); });
        case 4:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a <= b); });
        case 5:
            return ops::binary<T>(stack, [](T a, T b) { return flag(a >= b); });
        default:
            return ops::typeMismatch();
    }
}

uint8_t offsetFrom(wasm::Opcode op, wasm::Opcode base)
{
    return static_cast<uint8_t>(static_cast<uint8_t>(op) - static_cast<uint8_t>(base));
}

} // namespace

std::optional<Trap> VM::execFloatOp(const wasm::Instr &in)
{
    using wasm::Opcode;
    const auto byte = static_cast<uint8_t>(in.op);
    if (byte >= static_cast<uint8_t>(Opcode::F32Eq) && byte <= static_cast<uint8_t>(Opcode::F32Ge))
        return floatCompare<float>(offsetFrom(in.op, Opcode::F32Eq), stack_);
    if (byte >= static_cast<uint8_t>(Opcode::F64Eq) && byte <= static_cast<uint8_t>(Opcode::F64Ge))
        return floatCompare<double>(offsetFrom(in.op, Opcode::F64Eq), stack_);
    if (byte >= static_cast<uint8_t>(Opcode::F32Abs) && byte <= static_cast<uint8_t>(Opcode::F32Copysign))
        return floatArith<float, F32>(offsetFrom(in.op, Opcode::F32Abs), stack_);
    if (byte >= static_cast<uint8_t>(Opcode::F64Abs) && byte <= static_cast<uint8_t>(Opcode::F64Copysign))
        return floatArith<double, F64>(offsetFrom(in.op, Opcode::F64Abs), stack_);
    return ops::typeMismatch();
}

std::optional<Trap> VM::execConversion(const wasm::Instr &in)
{
    using wasm::Opcode;
    switch (in.op)
    {
        case Opcode::I32WrapI64:
            return ops::unary<uint64_t>(stack_, num::wrapTo<uint32_t, uint64_t>);
        case Opcode::I32TruncF32S:
            return ops::checkedUnary<float>(stack_, num::truncChecked<int32_t, float>);
        case Opcode::I32TruncF32U:
            return ops::checkedUnary<float>(stack_, num::truncChecked<uint32_t, float>);
        case Opcode::I32TruncF64S:
            return ops::checkedUnary<double>(stack_, num::truncChecked<int32_t, double>);
        case Opcode::I32TruncF64U:
            return ops::checkedUnary<double>(stack_, num::truncChecked<uint32_t, double>);
        case Opcode::I64ExtendI32S:
            return ops::unary<int32_t>(stack_, num::extendTo<int64_t, int32_t>);
        case Opcode::I64ExtendI32U:
            return ops::unary<uint32_t>(stack_, num::extendTo<uint64_t, uint32_t>);
        case Opcode::I64TruncF32S:
            return ops::checkedUnary<float>(stack_, num::truncChecked<int64_t, float>);
        case Opcode::I64TruncF32U:
            return ops::checkedUnary<float>(stack_, num::truncChecked<uint64_t, float>);
        case Opcode::I64TruncF64S:
            return ops::checkedUnary<double>(stack_, num::truncChecked<int64_t, double>);
        case Opcode::I64TruncF64U:
            return ops::checkedUnary<double>(stack_, num::truncChecked<uint64_t, double>);

        case Opcode::F32ConvertI32S:
            return ops::unary<int32_t>(stack_, [](int32_t v) { return static_cast<float>(v); });
        case Opcode::F32ConvertI32U:
            return ops::unary<uint32_t>(stack_, [](uint32_t v) { return static_cast<float>(v); });
        case Opcode::F32ConvertI64S:
            return ops::unary<int64_t>(stack_, [](int64_t v) { return static_cast<float>(v); });
        case Opcode::F32ConvertI64U:
            return ops::unary<uint64_t>(stack_, [](uint64_t v) { return static_cast<float>(v); });
        case Opcode::F32DemoteF64:
            return ops::unary<double>(stack_, [](double v) { return static_cast<float>(v); });
        case Opcode::F64ConvertI32S:
            return ops::unary<int32_t>(stack_, [](int32_t v) { return static_cast<double>(v); });
        case Opcode::F64ConvertI32U:
            return ops::unary<uint32_t>(stack_, [](uint32_t v) { return static_cast<double>(v); });
        case Opcode::F64ConvertI64S:
            return ops::unary<int64_t>(stack_, [](int64_t v) { return static_cast<double>(v); });
        case Opcode::F64ConvertI64U:
            return ops::unary<uint64_t>(stack_, [](uint64_t v) { return static_cast<double>(v); });
        case Opcode::F64PromoteF32:
            return ops::unary<float>(stack_, [](float v) { return static_cast<double>(v); });

        case Opcode::I32ReinterpretF32:
            return ops::unary<F32>(stack_, [](F32 v) { return v.bits; });
        case Opcode::I64ReinterpretF64:
            return ops::unary<F64>(stack_, [](F64 v) { return v.bits; });
        case Opcode::F32ReinterpretI32:
            return ops::unary<uint32_t>(stack_, [](uint32_t v) { return F32::fromBits(v); });
        case Opcode::F64ReinterpretI64:
            return ops::unary<uint64_t>(stack_, [](uint64_t v) { return F64::fromBits(v); });

        case Opcode::I32Extend8S:
            return ops::unary<uint32_t>(stack_, num::signExtendLow<uint32_t, 8>);
        case Opcode::I32Extend16S:
            return ops::unary<uint32_t>(stack_, num::signExtendLow<uint32_t, 16>);
        case Opcode::I64Extend8S:
            return ops::unary<uint64_t>(stack_, num::signExtendLow<uint64_t, 8>);
        case Opcode::I64Extend16S:
            return ops::unary<uint64_t>(stack_, num::signExtendLow<uint64_t, 16>);
        case Opcode::I64Extend32S:
            return ops::unary<uint64_t>(stack_, num::signExtendLow<uint64_t, 32>);
        default:
            return ops::typeMismatch();
    }
}

} // namespace wasmdbg::vm

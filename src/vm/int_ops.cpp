//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/int_ops.cpp
// Purpose: Handlers for i32/i64 comparisons, arithmetic, bitwise logic,
//          shifts and rotations.
// Key invariants: Arithmetic wraps modulo the operand width; only division
//                 and remainder can fault. Comparisons produce i32 0 or 1.
// Ownership/Lifetime: Member functions of VM.
// Links: wasm/Numeric.hpp, vm/OpHelpers.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "vm/OpHelpers.hpp"

namespace wasmdbg::vm
{
namespace
{

namespace num = wasm::numeric;
using ops::flag;

} // namespace

std::optional<Trap> VM::execIntOp(const wasm::Instr &in)
{
    using wasm::Opcode;
    switch (in.op)
    {
        // i32 comparisons
        case Opcode::I32Eqz:
            return ops::unary<uint32_t>(stack_, [](uint32_t v) { return flag(v == 0); });
        case Opcode::I32Eq:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a == b); });
        case Opcode::I32Ne:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a != b); });
        case Opcode::I32LtS:
            return ops::binary<int32_t>(stack_, [](int32_t a, int32_t b) { return flag(a < b); });
        case Opcode::I32LtU:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a < b); });
        case Opcode::I32GtS:
            return ops::binary<int32_t>(stack_, [](int32_t a, int32_t b) { return flag(a > b); });
        case Opcode::I32GtU:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a > b); });
        case Opcode::I32LeS:
            return ops::binary<int32_t>(stack_, [](int32_t a, int32_t b) { return flag(a <= b); });
        case Opcode::I32LeU:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a <= b); });
        case Opcode::I32GeS:
            return ops::binary<int32_t>(stack_, [](int32_t a, int32_t b) { return flag(a >= b); });
        case Opcode::I32GeU:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return flag(a >= b); });

        // i64 comparisons
        case Opcode::I64Eqz:
            return ops::unary<uint64_t>(stack_, [](uint64_t v) { return flag(v == 0); });
        case Opcode::I64Eq:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a == b); });
        case Opcode::I64Ne:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a != b); });
        case Opcode::I64LtS:
            return ops::binary<int64_t>(stack_, [](int64_t a, int64_t b) { return flag(a < b); });
        case Opcode::I64LtU:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a < b); });
        case Opcode::I64GtS:
            return ops::binary<int64_t>(stack_, [](int64_t a, int64_t b) { return flag(a > b); });
        case Opcode::I64GtU:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a > b); });
        case Opcode::I64LeS:
            return ops::binary<int64_t>(stack_, [](int64_t a, int64_t b) { return flag(a <= b); });
        case Opcode::I64LeU:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a <= b); });
        case Opcode::I64GeS:
            return ops::binary<int64_t>(stack_, [](int64_t a, int64_t b) { return flag(a >= b); });
        case Opcode::I64GeU:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return flag(a >= b); });

        // i32 arithmetic
        case Opcode::I32Clz:
            return ops::unary<uint32_t>(stack_, num::clz<uint32_t>);
        case Opcode::I32Ctz:
            return ops::unary<uint32_t>(stack_, num::ctz<uint32_t>);
        case Opcode::I32Popcnt:
            return ops::unary<uint32_t>(stack_, num::popcnt<uint32_t>);
        case Opcode::I32Add:
            return ops::binary<uint32_t>(stack_, num::wrappingAdd<uint32_t>);
        case Opcode::I32Sub:
            return ops::binary<uint32_t>(stack_, num::wrappingSub<uint32_t>);
        case Opcode::I32Mul:
            return ops::binary<uint32_t>(stack_, num::wrappingMul<uint32_t>);
        case Opcode::I32DivS:
            return ops::checkedBinary<int32_t>(stack_, num::div<int32_t>);
        case Opcode::I32DivU:
            return ops::checkedBinary<uint32_t>(stack_, num::div<uint32_t>);
        case Opcode::I32RemS:
            return ops::checkedBinary<int32_t>(stack_, num::rem<int32_t>);
        case Opcode::I32RemU:
            return ops::checkedBinary<uint32_t>(stack_, num::rem<uint32_t>);
        case Opcode::I32And:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return a & b; });
        case Opcode::I32Or:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return a | b; });
        case Opcode::I32Xor:
            return ops::binary<uint32_t>(stack_, [](uint32_t a, uint32_t b) { return a ^ b; });
        case Opcode::I32Shl:
            return ops::binary<uint32_t>(stack_, num::shl<uint32_t>);
        case Opcode::I32ShrS:
            return ops::binary<uint32_t>(stack_, num::shrS<uint32_t>);
        case Opcode::I32ShrU:
            return ops::binary<uint32_t>(stack_, num::shrU<uint32_t>);
        case Opcode::I32Rotl:
            return ops::binary<uint32_t>(stack_, num::rotl<uint32_t>);
        case Opcode::I32Rotr:
            return ops::binary<uint32_t>(stack_, num::rotr<uint32_t>);

        // i64 arithmetic
        case Opcode::I64Clz:
            return ops::unary<uint64_t>(stack_, num::clz<uint64_t>);
        case Opcode::I64Ctz:
            return ops::unary<uint64_t>(stack_, num::ctz<uint64_t>);
        case Opcode::I64Popcnt:
            return ops::unary<uint64_t>(stack_, num::popcnt<uint64_t>);
        case Opcode::I64Add:
            return ops::binary<uint64_t>(stack_, num::wrappingAdd<uint64_t>);
        case Opcode::I64Sub:
            return ops::binary<uint64_t>(stack_, num::wrappingSub<uint64_t>);
        case Opcode::I64Mul:
            return ops::binary<uint64_t>(stack_, num::wrappingMul<uint64_t>);
        case Opcode::I64DivS:
            return ops::checkedBinary<int64_t>(stack_, num::div<int64_t>);
        case Opcode::I64DivU:
            return ops::checkedBinary<uint64_t>(stack_, num::div<uint64_t>);
        case Opcode::I64RemS:
            return ops::checkedBinary<int64_t>(stack_, num::rem<int64_t>);
        case Opcode::I64RemU:
            return ops::checkedBinary<uint64_t>(stack_, num::rem<uint64_t>);
        case Opcode::I64And:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return a & b; });
        case Opcode::I64Or:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return a | b; });
        case Opcode::I64Xor:
            return ops::binary<uint64_t>(stack_, [](uint64_t a, uint64_t b) { return a ^ b; });
        case Opcode::I64Shl:
            return ops::binary<uint64_t>(stack_, num::shl<uint64_t>);
        case Opcode::I64ShrS:
            return ops::binary<uint64_t>(stack_, num::shrS<uint64_t>);
        case Opcode::I64ShrU:
            return ops::binary<uint64_t>(stack_, num::shrU<uint64_t>);
        case Opcode::I64Rotl:
            return ops::binary<uint64_t>(stack_, num::rotl<uint64_t>);
        case Opcode::I64Rotr:
            return ops::binary<uint64_t>(stack_, num::rotr<uint64_t>);

        default:
            return ops::typeMismatch();
    }
}

} // namespace wasmdbg::vm

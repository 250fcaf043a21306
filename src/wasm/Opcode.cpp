//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Opcode.cpp
// Purpose: Mnemonics, decoding and immediate classification for opcodes.
// Key invariants: Every Opcode enumerator has a name and a known immediate
//                 layout; decodeOpcode accepts exactly the enumerated bytes.
// Ownership/Lifetime: Stateless; returned names have static storage.
// Links: wasm/Opcode.hpp
//
//===----------------------------------------------------------------------===//

#include "wasm/Opcode.hpp"

namespace wasmdbg::wasm
{

std::optional<Opcode> decodeOpcode(uint8_t byte) noexcept
{
    const auto op = static_cast<Opcode>(byte);
    switch (op)
    {
        case Opcode::Unreachable:
        case Opcode::Nop:
        case Opcode::Block:
        case Opcode::Loop:
        case Opcode::If:
        case Opcode::Else:
        case Opcode::End:
        case Opcode::Br:
        case Opcode::BrIf:
        case Opcode::BrTable:
        case Opcode::Return:
        case Opcode::Call:
        case Opcode::CallIndirect:
        case Opcode::Drop:
        case Opcode::Select:
        case Opcode::LocalGet:
        case Opcode::LocalSet:
        case Opcode::LocalTee:
        case Opcode::GlobalGet:
        case Opcode::GlobalSet:
        case Opcode::I32Load:
        case Opcode::I64Load:
        case Opcode::F32Load:
        case Opcode::F64Load:
        case Opcode::I32Load8S:
        case Opcode::I32Load8U:
        case Opcode::I32Load16S:
        case Opcode::I32Load16U:
        case Opcode::I64Load8S:
        case Opcode::I64Load8U:
        case Opcode::I64Load16S:
        case Opcode::I64Load16U:
        case Opcode::I64Load32S:
        case Opcode::I64Load32U:
        case Opcode::I32Store:
        case Opcode::I64Store:
        case Opcode::F32Store:
        case Opcode::F64Store:
        case Opcode::I32Store8:
        case Opcode::I32Store16:
        case Opcode::I64Store8:
        case Opcode::I64Store16:
        case Opcode::I64Store32:
        case Opcode::MemorySize:
        case Opcode::MemoryGrow:
        case Opcode::I32Const:
        case Opcode::I64Const:
        case Opcode::F32Const:
        case Opcode::F64Const:
        case Opcode::I32Eqz:
        case Opcode::I32Eq:
        case Opcode::I32Ne:
        case Opcode::I32LtS:
        case Opcode::I32LtU:
        case Opcode::I32GtS:
        case Opcode::I32GtU:
        case Opcode::I32LeS:
        case Opcode::I32LeU:
        case Opcode::I32GeS:
        case Opcode::I32GeU:
        case Opcode::I64Eqz:
        case Opcode::I64Eq:
        case Opcode::I64Ne:
        case Opcode::I64LtS:
        case Opcode::I64LtU:
        case Opcode::I64GtS:
        case Opcode::I64GtU:
        case Opcode::I64LeS:
        case Opcode::I64LeU:
        case Opcode::I64GeS:
        case Opcode::I64GeU:
        case Opcode::F32Eq:
        case Opcode::F32Ne:
        case Opcode::F32Lt:
        case Opcode::F32Gt:
        case Opcode::F32Le:
        case Opcode::F32Ge:
        case Opcode::F64Eq:
        case Opcode::F64Ne:
        case Opcode::F64Lt:
        case Opcode::F64Gt:
        case Opcode::F64Le:
        case Opcode::F64Ge:
        case Opcode::I32Clz:
        case Opcode::I32Ctz:
        case Opcode::I32Popcnt:
        case Opcode::I32Add:
        case Opcode::I32Sub:
        case Opcode::I32Mul:
        case Opcode::I32DivS:
        case Opcode::I32DivU:
        case Opcode::I32RemS:
        case Opcode::I32RemU:
        case Opcode::I32And:
        case Opcode::I32Or:
        case Opcode::I32Xor:
        case Opcode::I32Shl:
        case Opcode::I32ShrS:
        case Opcode::I32ShrU:
        case Opcode::I32Rotl:
        case Opcode::I32Rotr:
        case Opcode::I64Clz:
        case Opcode::I64Ctz:
        case Opcode::I64Popcnt:
        case Opcode::I64Add:
        case Opcode::I64Sub:
        case Opcode::I64Mul:
        case Opcode::I64DivS:
        case Opcode::I64DivU:
        case Opcode::I64RemS:
        case Opcode::I64RemU:
        case Opcode::I64And:
        case Opcode::I64Or:
        case Opcode::I64Xor:
        case Opcode::I64Shl:
        case Opcode::I64ShrS:
        case Opcode::I64ShrU:
        case Opcode::I64Rotl:
        case Opcode::I64Rotr:
        case Opcode::F32Abs:
        case Opcode::F32Neg:
        case Opcode::F32Ceil:
        case Opcode::F32Floor:
        case Opcode::F32Trunc:
        case Opcode::F32Nearest:
        case Opcode::F32Sqrt:
        case Opcode::F32Add:
        case Opcode::F32Sub:
        case Opcode::F32Mul:
        case Opcode::F32Div:
        case Opcode::F32Min:
        case Opcode::F32Max:
        case Opcode::F32Copysign:
        case Opcode::F64Abs:
        case Opcode::F64Neg:
        case Opcode::F64Ceil:
        case Opcode::F64Floor:
        case Opcode::F64Trunc:
        case Opcode::F64Nearest:
        case Opcode::F64Sqrt:
        case Opcode::F64Add:
        case Opcode::F64Sub:
        case Opcode::F64Mul:
        case Opcode::F64Div:
        case Opcode::F64Min:
        case Opcode::F64Max:
        case Opcode::F64Copysign:
        case Opcode::I32WrapI64:
        case Opcode::I32TruncF32S:
        case Opcode::I32TruncF32U:
        case Opcode::I32TruncF64S:
        case Opcode::I32TruncF64U:
        case Opcode::I64ExtendI32S:
        case Opcode::I64ExtendI32U:
        case Opcode::I64TruncF32S:
        case Opcode::I64TruncF32U:
        case Opcode::I64TruncF64S:
        case Opcode::I64TruncF64U:
        case Opcode::F32ConvertI32S:
        case Opcode::F32ConvertI32U:
        case Opcode::F32ConvertI64S:
        case Opcode::F32ConvertI64U:
        case Opcode::F32DemoteF64:
        case Opcode::F64ConvertI32S:
        case Opcode::F64ConvertI32U:
        case Opcode::F64ConvertI64S:
        case Opcode::F64ConvertI64U:
        case Opcode::F64PromoteF32:
        case Opcode::I32ReinterpretF32:
        case Opcode::I64ReinterpretF64:
        case Opcode::F32ReinterpretI32:
        case Opcode::F64ReinterpretI64:
        case Opcode::I32Extend8S:
        case Opcode::I32Extend16S:
        case Opcode::I64Extend8S:
        case Opcode::I64Extend16S:
        case Opcode::I64Extend32S:
            return op;
    }
    return std::nullopt;
}

const char *opcodeName(Opcode op) noexcept
{
    switch (op)
    {
        case Opcode::Unreachable:
            return "unreachable";
        case Opcode::Nop:
            return "nop";
        case Opcode::Block:
            return "block";
        case Opcode::Loop:
            return "loop";
        case Opcode::If:
            return "if";
        case Opcode::Else:
            return "else";
        case Opcode::End:
            return "end";
        case Opcode::Br:
            return "br";
        case Opcode::BrIf:
            return "br_if";
        case Opcode::BrTable:
            return "br_table";
        case Opcode::Return:
            return "return";
        case Opcode::Call:
            return "call";
        case Opcode::CallIndirect:
            return "call_indirect";
        case Opcode::Drop:
            return "drop";
        case Opcode::Select:
            return "select";
        case Opcode::LocalGet:
            return "local.get";
        case Opcode::LocalSet:
            return "local.set";
        case Opcode::LocalTee:
            return "local.tee";
        case Opcode::GlobalGet:
            return "global.get";
        case Opcode::GlobalSet:
            return "global.set";
        case Opcode::I32Load:
            return "i32.load";
        case Opcode::I64Load:
            return "i64.load";
        case Opcode::F32Load:
            return "f32.load";
        case Opcode::F64Load:
            return "f64.load";
        case Opcode::I32Load8S:
            return "i32.load8_s";
        case Opcode::I32Load8U:
            return "i32.load8_u";
        case Opcode::I32Load16S:
            return "i32.load16_s";
        case Opcode::I32Load16U:
            return "i32.load16_u";
        case Opcode::I64Load8S:
            return "i64.load8_s";
        case Opcode::I64Load8U:
            return "i64.load8_u";
        case Opcode::I64Load16S:
            return "i64.load16_s";
        case Opcode::I64Load16U:
            return "i64.load16_u";
        case Opcode::I64Load32S:
            return "i64.load32_s";
        case Opcode::I64Load32U:
            return "i64.load32_u";
        case Opcode::I32Store:
            return "i32.store";
        case Opcode::I64Store:
            return "i64.store";
        case Opcode::F32Store:
            return "f32.store";
        case Opcode::F64Store:
            return "f64.store";
        case Opcode::I32Store8:
            return "i32.store8";
        case Opcode::I32Store16:
            return "i32.store16";
        case Opcode::I64Store8:
            return "i64.store8";
        case Opcode::I64Store16:
            return "i64.store16";
        case Opcode::I64Store32:
            return "i64.store32";
        case Opcode::MemorySize:
            return "memory.size";
        case Opcode::MemoryGrow:
            return "memory.grow";
        case Opcode::I32Const:
            return "i32.const";
        case Opcode::I64Const:
            return "i64.const";
        case Opcode::F32Const:
            return "f32.const";
        case Opcode::F64Const:
            return "f64.const";
        case Opcode::I32Eqz:
            return "i32.eqz";
        case Opcode::I32Eq:
            return "i32.eq";
        case Opcode::I32Ne:
            return "i32.ne";
        case Opcode::I32LtS:
            return "i32.lt_s";
        case Opcode::I32LtU:
            return "i32.lt_u";
        case Opcode::I32GtS:
            return "i32.gt_s";
        case Opcode::I32GtU:
            return "i32.gt_u";
        case Opcode::I32LeS:
            return "i32.le_s";
        case Opcode::I32LeU:
            return "i32.le_u";
        case Opcode::I32GeS:
            return "i32.ge_s";
        case Opcode::I32GeU:
            return "i32.ge_u";
        case Opcode::I64Eqz:
            return "i64.eqz";
        case Opcode::I64Eq:
            return "i64.eq";
        case Opcode::I64Ne:
            return "i64.ne";
        case Opcode::I64LtS:
            return "i64.lt_s";
        case Opcode::I64LtU:
            return "i64.lt_u";
        case Opcode::I64GtS:
            return "i64.gt_s";
        case Opcode::I64GtU:
            return "i64.gt_u";
        case Opcode::I64LeS:
            return "i64.le_s";
        case Opcode::I64LeU:
            return "i64.le_u";
        case Opcode::I64GeS:
            return "i64.ge_s";
        case Opcode::I64GeU:
            return "i64.ge_u";
        case Opcode::F32Eq:
            return "f32.eq";
        case Opcode::F32Ne:
            return "f32.ne";
        case Opcode::F32Lt:
            return "f32.lt";
        case Opcode::F32Gt:
            return "f32.gt";
        case Opcode::F32Le:
            return "f32.le";
        case Opcode::F32Ge:
            return "f32.ge";
        case Opcode::F64Eq:
            return "f64.eq";
        case Opcode::F64Ne:
            return "f64.ne";
        case Opcode::F64Lt:
            return "f64.lt";
        case Opcode::F64Gt:
            return "f64.gt";
        case Opcode::F64Le:
            return "f64.le";
        case Opcode::F64Ge:
            return "f64.ge";
        case Opcode::I32Clz:
            return "i32.clz";
        case Opcode::I32Ctz:
            return "i32.ctz";
        case Opcode::I32Popcnt:
            return "i32.popcnt";
        case Opcode::I32Add:
            return "i32.add";
        case Opcode::I32Sub:
            return "i32.sub";
        case Opcode::I32Mul:
            return "i32.mul";
        case Opcode::I32DivS:
            return "i32.div_s";
        case Opcode::I32DivU:
            return "i32.div_u";
        case Opcode::I32RemS:
            return "i32.rem_s";
        case Opcode::I32RemU:
            return "i32.rem_u";
        case Opcode::I32And:
            return "i32.and";
        case Opcode::I32Or:
            return "i32.or";
        case Opcode::I32Xor:
            return "i32.xor";
        case Opcode::I32Shl:
            return "i32.shl";
        case Opcode::I32ShrS:
            return "i32.shr_s";
        case Opcode::I32ShrU:
            return "i32.shr_u";
        case Opcode::I32Rotl:
            return "i32.rotl";
        case Opcode::I32Rotr:
            return "i32.rotr";
        case Opcode::I64Clz:
            return "i64.clz";
        case Opcode::I64Ctz:
            return "i64.ctz";
        case Opcode::I64Popcnt:
            return "i64.popcnt";
        case Opcode::I64Add:
            return "i64.add";
        case Opcode::I64Sub:
            return "i64.sub";
        case Opcode::I64Mul:
            return "i64.mul";
        case Opcode::I64DivS:
            return "i64.div_s";
        case Opcode::I64DivU:
            return "i64.div_u";
        case Opcode::I64RemS:
            return "i64.rem_s";
        case Opcode::I64RemU:
            return "i64.rem_u";
        case Opcode::I64And:
            return "i64.and";
        case Opcode::I64Or:
            return "i64.or";
        case Opcode::I64Xor:
            return "i64.xor";
        case Opcode::I64Shl:
            return "i64.shl";
        case Opcode::I64ShrS:
            return "i64.shr_s";
        case Opcode::I64ShrU:
            return "i64.shr_u";
        case Opcode::I64Rotl:
            return "i64.rotl";
        case Opcode::I64Rotr:
            return "i64.rotr";
        case Opcode::F32Abs:
            return "f32.abs";
        case Opcode::F32Neg:
            return "f32.neg";
        case Opcode::F32Ceil:
            return "f32.ceil";
        case Opcode::F32Floor:
            return "f32.floor";
        case Opcode::F32Trunc:
            return "f32.trunc";
        case Opcode::F32Nearest:
            return "f32.nearest";
        case Opcode::F32Sqrt:
            return "f32.sqrt";
        case Opcode::F32Add:
            return "f32.add";
        case Opcode::F32Sub:
            return "f32.sub";
        case Opcode::F32Mul:
            return "f32.mul";
        case Opcode::F32Div:
            return "f32.div";
        case Opcode::F32Min:
            return "f32.min";
        case Opcode::F32Max:
            return "f32.max";
        case Opcode::F32Copysign:
            return "f32.copysign";
        case Opcode::F64Abs:
            return "f64.abs";
        case Opcode::F64Neg:
            return "f64.neg";
        case Opcode::F64Ceil:
            return "f64.ceil";
        case Opcode::F64Floor:
            return "f64.floor";
        case Opcode::F64Trunc:
            return "f64.trunc";
        case Opcode::F64Nearest:
            return "f64.nearest";
        case Opcode::F64Sqrt:
            return "f64.sqrt";
        case Opcode::F64Add:
            return "f64.add";
        case Opcode::F64Sub:
            return "f64.sub";
        case Opcode::F64Mul:
            return "f64.mul";
        case Opcode::F64Div:
            return "f64.div";
        case Opcode::F64Min:
            return "f64.min";
        case Opcode::F64Max:
            return "f64.max";
        case Opcode::F64Copysign:
            return "f64.copysign";
        case Opcode::I32WrapI64:
            return "i32.wrap_i64";
        case Opcode::I32TruncF32S:
            return "i32.trunc_f32_s";
        case Opcode::I32TruncF32U:
            return "i32.trunc_f32_u";
        case Opcode::I32TruncF64S:
            return "i32.trunc_f64_s";
        case Opcode::I32TruncF64U:
            return "i32.trunc_f64_u";
        case Opcode::I64ExtendI32S:
            return "i64.extend_i32_s";
        case Opcode::I64ExtendI32U:
            return "i64.extend_i32_u";
        case Opcode::I64TruncF32S:
            return "i64.trunc_f32_s";
        case Opcode::I64TruncF32U:
            return "i64.trunc_f32_u";
        case Opcode::I64TruncF64S:
            return "i64.trunc_f64_s";
        case Opcode::I64TruncF64U:
            return "i64.trunc_f64_u";
        case Opcode::F32ConvertI32S:
            return "f32.convert_i32_s";
        case Opcode::F32ConvertI32U:
            return "f32.convert_i32_u";
        case Opcode::F32ConvertI64S:
            return "f32.convert_i64_s";
        case Opcode::F32ConvertI64U:
            return "f32.convert_i64_u";
        case Opcode::F32DemoteF64:
            return "f32.demote_f64";
        case Opcode::F64ConvertI32S:
            return "f64.convert_i32_s";
        case Opcode::F64ConvertI32U:
            return "f64.convert_i32_u";
        case Opcode::F64ConvertI64S:
            return "f64.convert_i64_s";
        case Opcode::F64ConvertI64U:
            return "f64.convert_i64_u";
        case Opcode::F64PromoteF32:
            return "f64.promote_f32";
        case Opcode::I32ReinterpretF32:
            return "i32.reinterpret_f32";
        case Opcode::I64ReinterpretF64:
            return "i64.reinterpret_f64";
        case Opcode::F32ReinterpretI32:
            return "f32.reinterpret_i32";
        case Opcode::F64ReinterpretI64:
            return "f64.reinterpret_i64";
        case Opcode::I32Extend8S:
            return "i32.extend8_s";
        case Opcode::I32Extend16S:
            return "i32.extend16_s";
        case Opcode::I64Extend8S:
            return "i64.extend8_s";
        case Opcode::I64Extend16S:
            return "i64.extend16_s";
        case Opcode::I64Extend32S:
            return "i64.extend32_s";
    }
    return "<invalid>";
}

ImmediateKind immediateKind(Opcode op) noexcept
{
    switch (op)
    {
        case Opcode::Block:
        case Opcode::Loop:
        case Opcode::If:
            return ImmediateKind::BlockType;
        case Opcode::Br:
        case Opcode::BrIf:
            return ImmediateKind::Label;
        case Opcode::BrTable:
            return ImmediateKind::LabelTable;
        case Opcode::Call:
        case Opcode::LocalGet:
        case Opcode::LocalSet:
        case Opcode::LocalTee:
        case Opcode::GlobalGet:
        case Opcode::GlobalSet:
            return ImmediateKind::Index;
        case Opcode::CallIndirect:
            return ImmediateKind::CallIndirect;
        case Opcode::MemorySize:
        case Opcode::MemoryGrow:
            return ImmediateKind::MemoryIndex;
        case Opcode::I32Const:
            return ImmediateKind::ConstI32;
        case Opcode::I64Const:
            return ImmediateKind::ConstI64;
        case Opcode::F32Const:
            return ImmediateKind::ConstF32;
        case Opcode::F64Const:
            return ImmediateKind::ConstF64;
        default:
            break;
    }
    const auto byte = static_cast<uint8_t>(op);
    if (byte >= static_cast<uint8_t>(Opcode::I32Load) && byte <= static_cast<uint8_t>(Opcode::I64Store32))
        return ImmediateKind::MemArg;
    return ImmediateKind::None;
}

} // namespace wasmdbg::wasm

//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm_dispatch.cpp
// Purpose: Execute builder-made modules and check instruction semantics and
//          fault reporting.
// Key invariants: A fault leaves the ip on the faulting instruction with its
//                 operands still on the value stack.
// Ownership/Lifetime: Each test owns its VM through std::unique_ptr.
// Links: src/vm/VM.cpp, src/vm/Dispatch.cpp, src/vm/int_ops.cpp,
//        src/vm/fp_ops.cpp, src/vm/mem_ops.cpp
//
//===----------------------------------------------------------------------===//
#include "tests/TestHarness.hpp"
#include "vm/VM.hpp"
#include "wasm/ModuleBuilder.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace wasmdbg;
using namespace wasmdbg::wasm;
using vm::CodePosition;
using vm::Trap;
using vm::TrapKind;
using vm::VM;

namespace
{

const FuncType kToI32{{}, {ValueType::I32}};
const FuncType kI32ToI32{{ValueType::I32}, {ValueType::I32}};

std::unique_ptr<VM> instantiate(std::shared_ptr<const Module> module, vm::VMConfig config = {})
{
    auto created = VM::create(std::move(module), nullptr, nullptr, config);
    if (!created)
        throw std::runtime_error(created.error().message);
    return std::move(created).value();
}

/// @brief Module holding one function, optionally with a memory.
std::unique_ptr<VM> single(const FuncType &type,
                           std::vector<Instr> body,
                           std::optional<uint32_t> memoryPages = std::nullopt,
                           std::vector<ValueType> locals = {})
{
    ModuleBuilder b;
    if (memoryPages)
        b.addMemory(*memoryPages);
    b.addFunction(type, std::move(locals), std::move(body));
    return instantiate(b.finish());
}

Trap call(VM &machine, uint32_t func, std::vector<Value> args = {})
{
    auto trap = machine.runFunc(func, args);
    if (!trap)
        throw std::runtime_error("runFunc rejected the call");
    return trap.value();
}

CodePosition at(uint32_t func, uint32_t instr)
{
    return CodePosition{func, instr};
}

Value top(const VM &machine)
{
    return machine.valueStack().back();
}

} // namespace

TEST(VMDispatch, IntegerArithmetic)
{
    auto m = single({{ValueType::I32, ValueType::I32}, {ValueType::I32}},
                    {build::localGet(0), build::localGet(1), build::op(Opcode::I32Add)});
    EXPECT_EQ(call(*m, 0, {Value(int32_t{40}), Value(int32_t{2})}), Trap::finished());
    ASSERT_EQ(m->valueStack().size(), 1U);
    EXPECT_EQ(top(*m), Value(int32_t{42}));
    EXPECT_TRUE(m->state() == vm::VMState::Finished);
    EXPECT_TRUE(m->functionStack().empty());

    auto wide = single({{}, {ValueType::I64}},
                       {build::i64(-6), build::i64(7), build::op(Opcode::I64Mul)});
    EXPECT_EQ(call(*wide, 0), Trap::finished());
    EXPECT_EQ(top(*wide), Value(int64_t{-42}));
}

TEST(VMDispatch, DivisionByZeroKeepsOperandsAndIp)
{
    auto m = single(kToI32, {build::i32(7), build::i32(0), build::op(Opcode::I32DivU)});
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::DivisionByZero));
    EXPECT_EQ(m->ip(), at(0, 2));
    ASSERT_EQ(m->valueStack().size(), 2U);
    EXPECT_EQ(m->valueStack()[0], Value(int32_t{7}));
    EXPECT_EQ(m->valueStack()[1], Value(int32_t{0}));
    EXPECT_TRUE(m->state() == vm::VMState::Faulted);

    // Resuming re-executes the faulting instruction.
    EXPECT_EQ(m->continueExecution(), Trap::of(TrapKind::DivisionByZero));
    EXPECT_EQ(m->ip(), at(0, 2));
}

TEST(VMDispatch, SignedOverflowAndRemainder)
{
    auto m = single(kToI32,
                    {build::i32(std::numeric_limits<int32_t>::min()), build::i32(-1),
                     build::op(Opcode::I32DivS)});
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::SignedIntegerOverflow));

    auto r = single(kToI32,
                    {build::i32(std::numeric_limits<int32_t>::min()), build::i32(-1),
                     build::op(Opcode::I32RemS)});
    EXPECT_EQ(call(*r, 0), Trap::finished());
    EXPECT_EQ(top(*r), Value(int32_t{0}));
}

TEST(VMDispatch, NarrowStoresAndSignExtendingLoads)
{
    auto m = single(kToI32,
                    {build::i32(8), build::i32(254), build::memOp(Opcode::I32Store8),
                     build::i32(8), build::memOp(Opcode::I32Load8S)},
                    1);
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{-2}));
    ASSERT_NE(m->defaultMemory(), nullptr);
    EXPECT_EQ(m->defaultMemory()->bytes()[8], 0xFE);
    EXPECT_EQ(m->defaultMemory()->bytes()[9], 0x00);
}

TEST(VMDispatch, StaticOffsetsAreLittleEndian)
{
    auto m = single(kToI32,
                    {build::i32(0), build::i64(0x0102030405060708LL),
                     build::memOp(Opcode::I64Store, 16), build::i32(16),
                     build::memOp(Opcode::I32Load16U)},
                    1);
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{0x0708}));
    EXPECT_EQ(m->defaultMemory()->load<uint64_t>(16), 0x0102030405060708ULL);
}

TEST(VMDispatch, OutOfBoundsAccessFaultsBeforeTouchingMemory)
{
    auto m = single(kToI32, {build::i32(65534), build::memOp(Opcode::I32Load)}, 1);
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::MemoryOutOfBounds));
    EXPECT_EQ(m->ip(), at(0, 1));
    ASSERT_EQ(m->valueStack().size(), 1U);
    EXPECT_EQ(top(*m), Value(int32_t{65534}));

    // address + offset is computed without 32-bit wrap-around.
    auto wrap = single({{}, {}},
                       {build::i32(-1), build::i32(5), build::memOp(Opcode::I32Store8, 1)}, 1);
    EXPECT_EQ(call(*wrap, 0), Trap::of(TrapKind::MemoryOutOfBounds));
    EXPECT_EQ(wrap->defaultMemory()->bytes()[0], 0x00);
    EXPECT_EQ(wrap->valueStack().size(), 2U);
}

TEST(VMDispatch, MemoryInstructionWithoutMemory)
{
    auto m = single(kToI32, {build::i32(0), build::memOp(Opcode::I32Load)});
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::NoMemory));
    EXPECT_EQ(m->defaultMemory(), nullptr);
}

TEST(VMDispatch, MemoryGrowRespectsMaximum)
{
    ModuleBuilder b;
    b.addMemory(1, 2);
    const uint32_t first = b.addGlobal(ValueType::I32, true, Value(int32_t{0}));
    const uint32_t second = b.addGlobal(ValueType::I32, true, Value(int32_t{0}));
    const uint32_t size = b.addGlobal(ValueType::I32, true, Value(int32_t{0}));
    b.addFunction({{}, {}}, {},
                  {build::i32(1), build::op(Opcode::MemoryGrow), build::globalSet(first),
                   build::i32(1), build::op(Opcode::MemoryGrow), build::globalSet(second),
                   build::op(Opcode::MemorySize), build::globalSet(size)});
    auto m = instantiate(b.finish());
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(m->globals()[first], Value(int32_t{1}));
    EXPECT_EQ(m->globals()[second], Value(int32_t{-1}));
    EXPECT_EQ(m->globals()[size], Value(int32_t{2}));
    EXPECT_EQ(m->defaultMemory()->size(), 2U * kPageSize);
}

TEST(VMDispatch, MemoryGrowBeyondHostLimitReturnsMinusOne)
{
    ModuleBuilder b;
    b.addMemory(1);
    b.addFunction(kToI32, {}, {build::i32(60000), build::op(Opcode::MemoryGrow)});
    vm::VMConfig config;
    config.maxMemoryPages = 2;
    auto m = instantiate(b.finish(), config);
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{-1}));
    EXPECT_EQ(m->defaultMemory()->pages(), 1U);
    EXPECT_EQ(m->defaultMemory()->size(), std::size_t{kPageSize});
}

TEST(VMDispatch, OversizedMemoryFailsInstantiation)
{
    ModuleBuilder b;
    b.addMemory(3);
    b.addFunction({{}, {}}, {}, {});
    vm::VMConfig config;
    config.maxMemoryPages = 2;
    auto created = VM::create(b.finish(), nullptr, nullptr, config);
    ASSERT_FALSE(created.hasValue());
    EXPECT_EQ(created.error().message, std::string("memory too large"));
}

TEST(VMDispatch, LoopWithConditionalBranch)
{
    // acc = 0; while (n != 0) { acc += n; --n; } return acc;
    auto m = single(kI32ToI32,
                    {build::block(),
                     build::loop(),
                     build::localGet(0),
                     build::op(Opcode::I32Eqz),
                     build::brIf(1),
                     build::localGet(1),
                     build::localGet(0),
                     build::op(Opcode::I32Add),
                     build::localSet(1),
                     build::localGet(0),
                     build::i32(1),
                     build::op(Opcode::I32Sub),
                     build::localSet(0),
                     build::br(0),
                     build::op(Opcode::End),
                     build::op(Opcode::End),
                     build::localGet(1)},
                    std::nullopt,
                    {ValueType::I32});
    EXPECT_EQ(call(*m, 0, {Value(int32_t{5})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{15}));
    EXPECT_EQ(m->valueStack().size(), 1U);
}

TEST(VMDispatch, IfElseWithResult)
{
    auto m = single(kI32ToI32,
                    {build::localGet(0), build::ifOp(ValueType::I32), build::i32(10),
                     build::op(Opcode::Else), build::i32(20), build::op(Opcode::End)});
    EXPECT_EQ(call(*m, 0, {Value(int32_t{1})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{10}));
    EXPECT_EQ(call(*m, 0, {Value(int32_t{0})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{20}));
    EXPECT_EQ(m->valueStack().size(), 1U);
}

TEST(VMDispatch, BranchTableUsesDefaultForLargeSelectors)
{
    auto m = single(kI32ToI32,
                    {build::block(), build::block(), build::block(), build::localGet(0),
                     build::brTable({0, 1, 2}), build::op(Opcode::End), build::i32(100),
                     build::op(Opcode::Return), build::op(Opcode::End), build::i32(200),
                     build::op(Opcode::Return), build::op(Opcode::End), build::i32(300)});
    EXPECT_EQ(call(*m, 0, {Value(int32_t{0})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{100}));
    EXPECT_EQ(call(*m, 0, {Value(int32_t{1})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{200}));
    EXPECT_EQ(call(*m, 0, {Value(int32_t{9})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{300}));
}

TEST(VMDispatch, CallIndirectChecksTableAndSignature)
{
    ModuleBuilder b;
    const uint32_t unary = b.addType(kI32ToI32);
    const uint32_t inc = b.addFunction(kI32ToI32, {},
                                       {build::localGet(0), build::i32(1), build::op(Opcode::I32Add)});
    const uint32_t five = b.addFunction(kToI32, {}, {build::i32(5)});
    const uint32_t dispatch = b.addFunction(
        kI32ToI32, {}, {build::i32(41), build::localGet(0), build::callIndirect(unary)});
    b.addTable(3);
    b.addElements(0, {inc, five});
    auto m = instantiate(b.finish());

    ASSERT_NE(m->defaultTable(), nullptr);
    EXPECT_EQ(m->defaultTable()->size(), 3U);

    EXPECT_EQ(call(*m, dispatch, {Value(int32_t{0})}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{42}));

    EXPECT_EQ(call(*m, dispatch, {Value(int32_t{1})}), Trap::of(TrapKind::IndirectCallTypeMismatch));
    EXPECT_EQ(m->ip(), at(dispatch, 2));
    EXPECT_EQ(call(*m, dispatch, {Value(int32_t{2})}), Trap::of(TrapKind::UndefinedTableElement));
    EXPECT_EQ(call(*m, dispatch, {Value(int32_t{7})}), Trap::of(TrapKind::UndefinedTableElement));
    EXPECT_EQ(m->valueStack().size(), 2U);
}

TEST(VMDispatch, UnreachableTraps)
{
    auto m = single({{}, {}}, {build::op(Opcode::Nop), build::op(Opcode::Unreachable)});
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::Unreachable));
    EXPECT_EQ(m->ip(), at(0, 1));
}

TEST(VMDispatch, CheckedTruncation)
{
    auto m = single({{ValueType::F64}, {ValueType::I32}},
                    {build::localGet(0), build::op(Opcode::I32TruncF64S)});
    EXPECT_EQ(call(*m, 0, {Value(-3.7)}), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{-3}));
    EXPECT_EQ(call(*m, 0, {Value(std::numeric_limits<double>::quiet_NaN())}),
              Trap::of(TrapKind::InvalidConversionToInt));
    EXPECT_EQ(call(*m, 0, {Value(3e10)}), Trap::of(TrapKind::InvalidConversionToInt));
    EXPECT_EQ(m->ip(), at(0, 1));
}

TEST(VMDispatch, ReinterpretAndExtend)
{
    auto bits = single({{}, {ValueType::F32}},
                       {build::i32(0x3F800000), build::op(Opcode::F32ReinterpretI32)});
    EXPECT_EQ(call(*bits, 0), Trap::finished());
    EXPECT_EQ(top(*bits), Value(1.0f));

    auto widen = single({{}, {ValueType::I64}},
                        {build::i32(-1), build::op(Opcode::I64ExtendI32U)});
    EXPECT_EQ(call(*widen, 0), Trap::finished());
    EXPECT_EQ(top(*widen), Value(int64_t{0xFFFFFFFF}));

    auto sext = single(kToI32, {build::i32(0x80), build::op(Opcode::I32Extend8S)});
    EXPECT_EQ(call(*sext, 0), Trap::finished());
    EXPECT_EQ(top(*sext), Value(int32_t{-128}));

    auto convert = single({{}, {ValueType::F64}},
                          {build::i32(-1), build::op(Opcode::F64ConvertI32U)});
    EXPECT_EQ(call(*convert, 0), Trap::finished());
    EXPECT_EQ(top(*convert), Value(4294967295.0));
}

TEST(VMDispatch, FloatArithmetic)
{
    auto sum = single({{}, {ValueType::F32}},
                      {build::f32(1.5f), build::f32(-0.5f), build::op(Opcode::F32Add)});
    EXPECT_EQ(call(*sum, 0), Trap::finished());
    EXPECT_EQ(top(*sum), Value(1.0f));

    auto root = single({{}, {ValueType::F64}}, {build::f64(9.0), build::op(Opcode::F64Sqrt)});
    EXPECT_EQ(call(*root, 0), Trap::finished());
    EXPECT_EQ(top(*root), Value(3.0));

    auto low = single({{}, {ValueType::F32}},
                      {build::f32(0.0f), build::f32(-0.0f), build::op(Opcode::F32Min)});
    EXPECT_EQ(call(*low, 0), Trap::finished());
    EXPECT_EQ(top(*low), Value(-0.0f));

    auto cmp = single(kToI32, {build::f64(1.0), build::f64(2.0), build::op(Opcode::F64Lt)});
    EXPECT_EQ(call(*cmp, 0), Trap::finished());
    EXPECT_EQ(top(*cmp), Value(int32_t{1}));
}

TEST(VMDispatch, Select)
{
    auto m = single(kToI32,
                    {build::i32(1), build::i32(2), build::i32(0), build::op(Opcode::Select)});
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{2}));
}

TEST(VMDispatch, OperandKindMismatch)
{
    auto m = single(kToI32, {build::i64(1), build::i32(1), build::op(Opcode::I32Add)});
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::TypeMismatch));
    EXPECT_EQ(m->ip(), at(0, 2));
}

TEST(VMDispatch, CallDepthLimit)
{
    ModuleBuilder b;
    b.addFunction({{}, {}}, {}, {build::call(0)});
    vm::VMConfig config;
    config.maxCallDepth = 8;
    auto m = instantiate(b.finish(), config);
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::CallStackExhausted));
    EXPECT_EQ(m->functionStack().size(), 8U);
}

TEST(VMDispatch, ValueStackLimit)
{
    ModuleBuilder b;
    b.addFunction({{}, {}}, {},
                  {build::i32(1), build::i32(2), build::i32(3), build::i32(4), build::i32(5)});
    vm::VMConfig config;
    config.maxValueStack = 4;
    auto m = instantiate(b.finish(), config);
    EXPECT_EQ(call(*m, 0), Trap::of(TrapKind::ValueStackExhausted));
    EXPECT_EQ(m->ip(), at(0, 4));
    EXPECT_EQ(m->valueStack().size(), 4U);
}

TEST(VMDispatch, GlobalsPersistAcrossCalls)
{
    ModuleBuilder b;
    const uint32_t counter = b.addGlobal(ValueType::I32, true, Value(int32_t{5}));
    b.addFunction(kToI32, {},
                  {build::globalGet(counter), build::i32(1), build::op(Opcode::I32Add),
                   build::globalSet(counter), build::globalGet(counter)});
    auto m = instantiate(b.finish());
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{6}));
    EXPECT_EQ(call(*m, 0), Trap::finished());
    EXPECT_EQ(m->globals()[counter], Value(int32_t{7}));
}

TEST(VMDispatch, StartZeroFillsEntryParameters)
{
    ModuleBuilder b;
    const uint32_t entry = b.addFunction(kI32ToI32, {}, {build::localGet(0)});
    b.exportFunction("main", entry);
    auto m = instantiate(b.finish());
    auto trap = m->start();
    ASSERT_TRUE(trap.has_value());
    EXPECT_EQ(*trap, Trap::finished());
    EXPECT_EQ(top(*m), Value(int32_t{0}));

    auto idle = single({{}, {}}, {});
    EXPECT_FALSE(idle->start().has_value());
    EXPECT_TRUE(idle->state() == vm::VMState::Uninitialized);
}

TEST(VMDispatch, DataSegmentsInitialiseMemory)
{
    ModuleBuilder b;
    b.addMemory(1);
    b.addData(4, {1, 2, 3});
    b.addFunction({{}, {}}, {}, {});
    auto m = instantiate(b.finish());
    ASSERT_NE(m->defaultMemory(), nullptr);
    EXPECT_EQ(m->defaultMemory()->bytes()[5], 2);
    EXPECT_EQ(m->defaultMemory()->pages(), 1U);

    ModuleBuilder tooLarge;
    tooLarge.addMemory(1);
    tooLarge.addData(kPageSize - 1, {1, 2});
    auto created = VM::create(tooLarge.finish(), nullptr, nullptr);
    ASSERT_FALSE(created.hasValue());
    EXPECT_TRUE(created.error().message.find("does not fit") != std::string::npos);
}

TEST(VMDispatch, RunFuncRejectsBadCalls)
{
    auto m = single(kI32ToI32, {build::localGet(0)});
    auto wrongType = m->runFunc(0, {Value(int64_t{1})});
    ASSERT_FALSE(wrongType.hasValue());
    EXPECT_TRUE(wrongType.error() == vm::CallError::InvalidArguments);

    auto wrongArity = m->runFunc(0, {});
    ASSERT_FALSE(wrongArity.hasValue());
    EXPECT_TRUE(wrongArity.error() == vm::CallError::InvalidArguments);

    auto missing = m->runFunc(3, {});
    ASSERT_FALSE(missing.hasValue());
    EXPECT_TRUE(missing.error() == vm::CallError::InvalidFunctionIndex);
}

int main(int argc, char **argv)
{
    wasmdbg_test::init(&argc, argv);
    return wasmdbg_test::run_all_tests();
}

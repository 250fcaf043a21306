//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_debugger_session.cpp
// Purpose: Session-level behaviour of Debugger and DebugService over a real
//          binary on disk.
// Key invariants: Operations that need a file or a VM report the matching
//                 DebuggerErrorKind instead of acting.
// Ownership/Lifetime: Each test writes its own temporary binary.
// Links: src/debugger/Debugger.cpp, src/debugger/DebugService.cpp
//
//===----------------------------------------------------------------------===//
#include "tests/TestHarness.hpp"
#include "tests/unit/WasmBytes.hpp"
#include "wasmdbg/debugger/DebugService.hpp"
#include "wasmdbg/debugger/Debugger.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace wasmdbg;
using debugger::DebuggerErrorKind;
using vm::CodePosition;
using vm::Trap;
using wasm::Value;
using wasmdbg_test::TempWasmFile;

namespace
{

constexpr uint32_t kAdd = 0;
constexpr uint32_t kMain = 1;
constexpr uint32_t kStore = 2;
constexpr uint32_t kBoom = 3;

vm::Breakpoint codeAt(uint32_t func, uint32_t instr)
{
    return vm::CodeBreakpoint{CodePosition{func, instr}};
}

/// f0 _start(): i32.const 1; drop; end
wasmdbg_test::Bytes threeInstructionEntry()
{
    using namespace wasmdbg_test;
    return concat({header(),
                   section(1, vec({{0x60, 0x00, 0x00}})),
                   section(3, vec({{0x00}})),
                   section(7, vec({concat({name("_start"), {0x00, 0x00}})})),
                   section(10, vec({body({0x41, 0x01, 0x1A, 0x0B})}))});
}

/// f0 _start: nop; call 1; end
/// f1:        nop; nop; call 2; end
/// f2:        nop; nop; end
wasmdbg_test::Bytes threeDeepCalls()
{
    using namespace wasmdbg_test;
    return concat({header(),
                   section(1, vec({{0x60, 0x00, 0x00}})),
                   section(3, vec({{0x00}, {0x00}, {0x00}})),
                   section(7, vec({concat({name("_start"), {0x00, 0x00}})})),
                   section(10,
                           vec({body({0x01, 0x10, 0x01, 0x0B}),
                                body({0x01, 0x01, 0x10, 0x02, 0x0B}),
                                body({0x01, 0x01, 0x0B})}))});
}

template <typename T> bool failsWith(const debugger::Result<T> &result, DebuggerErrorKind kind)
{
    return !result.hasValue() && result.error().kind == kind;
}

} // namespace

TEST(Debugger, RequiresLoadedFile)
{
    debugger::Debugger dbg;
    EXPECT_TRUE(dbg.file() == nullptr);
    EXPECT_TRUE(failsWith(dbg.start(), DebuggerErrorKind::NoFileLoaded));
    EXPECT_TRUE(failsWith(dbg.run(), DebuggerErrorKind::NoFileLoaded));
    EXPECT_TRUE(failsWith(dbg.call(kAdd, {}), DebuggerErrorKind::NoFileLoaded));
    EXPECT_TRUE(failsWith(dbg.addBreakpoint(codeAt(0, 0)), DebuggerErrorKind::NoFileLoaded));
    EXPECT_TRUE(failsWith(dbg.breakpoints(), DebuggerErrorKind::NoFileLoaded));
    EXPECT_TRUE(failsWith(dbg.executeStep(), DebuggerErrorKind::NoRunningInstance));
    EXPECT_TRUE(failsWith(dbg.continueExecution(), DebuggerErrorKind::NoRunningInstance));
    EXPECT_TRUE(failsWith(dbg.backtrace(), DebuggerErrorKind::NoRunningInstance));
    EXPECT_TRUE(failsWith(dbg.locals(-1), DebuggerErrorKind::NoRunningInstance));
}

TEST(Debugger, LoadFailureKeepsPreviousFile)
{
    TempWasmFile good(wasmdbg_test::sessionModule());
    TempWasmFile bad(wasmdbg_test::Bytes{0x00, 0x61, 0x73, 0x6E});

    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(good.path()));
    ASSERT_TRUE(dbg.addBreakpoint(codeAt(kAdd, 2)).hasValue());

    auto failed = dbg.load(bad.path());
    ASSERT_FALSE(failed.hasValue());
    EXPECT_EQ(failed.error().message, std::string("magic header not detected"));
    ASSERT_TRUE(dbg.file() != nullptr);
    EXPECT_EQ(dbg.file()->path(), good.path());
    EXPECT_EQ(dbg.breakpoints().value().size(), 1U);

    auto missing = dbg.load(good.path() + ".missing");
    ASSERT_FALSE(missing.hasValue());
    EXPECT_TRUE(missing.error().message.find("cannot open") != std::string::npos);
}

TEST(Debugger, ReloadDiscardsBreakpointsAndVm)
{
    TempWasmFile first(wasmdbg_test::sessionModule());
    TempWasmFile second(wasmdbg_test::sessionModule());

    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(first.path()));
    ASSERT_TRUE(dbg.addBreakpoint(codeAt(kAdd, 2)).hasValue());
    ASSERT_TRUE(dbg.start().hasValue());
    ASSERT_TRUE(dbg.vm() != nullptr);

    ASSERT_OK(dbg.load(second.path()));
    EXPECT_TRUE(dbg.vm() == nullptr);
    EXPECT_EQ(dbg.breakpoints().value().size(), 0U);
    EXPECT_EQ(dbg.file()->path(), second.path());
}

TEST(Debugger, StartRunsEntryToCompletion)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));

    auto started = dbg.start();
    ASSERT_TRUE(started.hasValue());
    ASSERT_TRUE(started.value().has_value());
    EXPECT_EQ(*started.value(), Trap::finished());
    EXPECT_EQ(dbg.globals().value().at(0), Value(int32_t{5}));

    auto step = dbg.executeStep();
    ASSERT_TRUE(step.hasValue());
    EXPECT_EQ(*step.value(), Trap::finished());

    auto ran = dbg.run();
    ASSERT_TRUE(ran.hasValue());
    EXPECT_EQ(ran.value(), Trap::finished());
}

TEST(Debugger, BreakpointStopsInsideCallee)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));
    auto index = dbg.addBreakpoint(codeAt(kAdd, 2));
    ASSERT_TRUE(index.hasValue());
    EXPECT_EQ(index.value(), 0U);

    auto started = dbg.start();
    ASSERT_TRUE(started.hasValue());
    EXPECT_EQ(*started.value(), Trap::breakpoint(0));

    auto trace = dbg.backtrace();
    ASSERT_TRUE(trace.hasValue());
    ASSERT_EQ(trace.value().size(), 2U);
    EXPECT_EQ(trace.value()[0], (CodePosition{kAdd, 2}));
    EXPECT_EQ(trace.value()[1], (CodePosition{kMain, 3}));

    auto inner = dbg.locals(-1);
    ASSERT_TRUE(inner.hasValue());
    ASSERT_EQ(inner.value().size(), 2U);
    EXPECT_EQ(inner.value()[0], Value(int32_t{2}));
    EXPECT_EQ(inner.value()[1], Value(int32_t{3}));
    EXPECT_EQ(dbg.locals(0).value().size(), 0U);
    EXPECT_EQ(dbg.locals(1).value().size(), 2U);
    EXPECT_TRUE(failsWith(dbg.locals(2), DebuggerErrorKind::InvalidFrameDepth));
    EXPECT_TRUE(failsWith(dbg.locals(-3), DebuggerErrorKind::InvalidFrameDepth));

    auto stack = dbg.valueStack();
    ASSERT_TRUE(stack.hasValue());
    EXPECT_EQ(stack.value().size(), 2U);

    auto resumed = dbg.continueExecution();
    ASSERT_TRUE(resumed.hasValue());
    EXPECT_EQ(resumed.value(), Trap::finished());
    EXPECT_EQ(dbg.globals().value().at(0), Value(int32_t{5}));
    EXPECT_TRUE(failsWith(dbg.locals(-1), DebuggerErrorKind::InvalidFrameDepth));
}

TEST(Debugger, BreakpointInEntryFunction)
{
    TempWasmFile file(threeInstructionEntry());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));
    ASSERT_EQ(dbg.addBreakpoint(codeAt(0, 1)).value(), 0U);

    auto started = dbg.start();
    ASSERT_OK(started);
    EXPECT_EQ(started.value(), std::optional<Trap>(Trap::breakpoint(0)));

    auto trace = dbg.backtrace();
    ASSERT_OK(trace);
    ASSERT_EQ(trace.value().size(), 1U);
    EXPECT_EQ(trace.value()[0], (CodePosition{0, 1}));
    EXPECT_FALSE(dbg.functionName(0).has_value());
}

TEST(Debugger, BacktraceFollowsReturnAddresses)
{
    TempWasmFile file(threeDeepCalls());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));
    ASSERT_EQ(dbg.addBreakpoint(codeAt(2, 1)).value(), 0U);

    auto started = dbg.start();
    ASSERT_OK(started);
    EXPECT_EQ(started.value(), std::optional<Trap>(Trap::breakpoint(0)));

    auto trace = dbg.backtrace();
    ASSERT_OK(trace);
    ASSERT_EQ(trace.value().size(), 3U);
    EXPECT_EQ(trace.value()[0], (CodePosition{2, 1}));
    EXPECT_EQ(trace.value()[1], (CodePosition{1, 3}));
    EXPECT_EQ(trace.value()[2], (CodePosition{0, 2}));

    const auto &frames = dbg.vm()->functionStack();
    ASSERT_EQ(frames.size(), 3U);
    EXPECT_EQ(trace.value()[1], frames[2].returnAddress);
    EXPECT_EQ(trace.value()[2], frames[1].returnAddress);

    auto out = dbg.executeStepOut();
    ASSERT_OK(out);
    EXPECT_FALSE(out.value().has_value());
    auto outer = dbg.backtrace();
    ASSERT_OK(outer);
    ASSERT_EQ(outer.value().size(), 2U);
    EXPECT_EQ(outer.value()[0], (CodePosition{1, 3}));
    EXPECT_EQ(outer.value()[1], (CodePosition{0, 2}));
    EXPECT_EQ(dbg.vm()->functionStack().size(), 2U);
}

TEST(Debugger, CallValidatesBeforeInstantiating)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));

    EXPECT_TRUE(failsWith(dbg.call(42, {}), DebuggerErrorKind::InvalidFunctionIndex));
    EXPECT_TRUE(failsWith(dbg.call(kAdd, {Value(int32_t{1})}), DebuggerErrorKind::InvalidArguments));
    const std::vector<Value> wrongTypes{Value(int32_t{1}), Value(int64_t{2})};
    EXPECT_TRUE(failsWith(dbg.call(kAdd, wrongTypes), DebuggerErrorKind::InvalidArguments));
    EXPECT_TRUE(dbg.vm() == nullptr);

    const std::vector<Value> args{Value(int32_t{2}), Value(int32_t{3})};
    auto called = dbg.call(kAdd, args);
    ASSERT_TRUE(called.hasValue());
    EXPECT_EQ(called.value(), Trap::finished());
    EXPECT_EQ(dbg.valueStack().value().back(), Value(int32_t{5}));
}

TEST(Debugger, FaultIsReportedAsTrap)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));

    auto called = dbg.call(kBoom, {});
    ASSERT_TRUE(called.hasValue());
    EXPECT_EQ(called.value(), Trap::of(vm::TrapKind::DivisionByZero));
    EXPECT_EQ(dbg.backtrace().value().at(0), (CodePosition{kBoom, 2}));

    ASSERT_TRUE(dbg.resetVm().hasValue());
    EXPECT_TRUE(dbg.vm() == nullptr);
    EXPECT_TRUE(failsWith(dbg.continueExecution(), DebuggerErrorKind::NoRunningInstance));
}

TEST(Debugger, BreakpointValidation)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));

    EXPECT_TRUE(failsWith(dbg.addBreakpoint(codeAt(kAdd, 4)), DebuggerErrorKind::InvalidBreakpointPosition));
    EXPECT_TRUE(failsWith(dbg.addBreakpoint(codeAt(9, 0)), DebuggerErrorKind::InvalidBreakpointPosition));
    const vm::Breakpoint badGlobal = vm::GlobalWatchpoint{vm::WatchTrigger::Write, 1};
    EXPECT_TRUE(failsWith(dbg.addBreakpoint(badGlobal), DebuggerErrorKind::InvalidWatchpointGlobal));

    const vm::Breakpoint farMemory = vm::MemoryWatchpoint{vm::WatchTrigger::Read, 0xFFFFFF00, 16};
    auto memory = dbg.addBreakpoint(farMemory);
    ASSERT_TRUE(memory.hasValue());
    EXPECT_EQ(memory.value(), 0U);
    EXPECT_EQ(dbg.addBreakpoint(codeAt(kMain, 4)).value(), 1U);

    EXPECT_TRUE(dbg.deleteBreakpoint(0).value());
    EXPECT_FALSE(dbg.deleteBreakpoint(0).value());
    ASSERT_TRUE(dbg.clearBreakpoints().hasValue());
    EXPECT_EQ(dbg.breakpoints().value().size(), 0U);
}

TEST(Debugger, NamesComeFromNameSection)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::Debugger dbg;
    ASSERT_OK(dbg.load(file.path()));
    EXPECT_EQ(dbg.functionName(kStore).value_or(""), std::string("store"));
    EXPECT_EQ(dbg.localName(kAdd, 1).value_or(""), std::string("b"));
    EXPECT_FALSE(dbg.localName(kMain, 0).has_value());
    EXPECT_FALSE(dbg.functionName(7).has_value());
}

TEST(DebugService, MemoryWatchCommitsStore)
{
    TempWasmFile file(wasmdbg_test::sessionModule());
    debugger::DebugService service;
    ASSERT_OK(service.load(file.path()));
    EXPECT_TRUE(failsWith(service.readMemory(0, 4), DebuggerErrorKind::NoRunningInstance));

    const vm::Breakpoint watch = vm::MemoryWatchpoint{vm::WatchTrigger::Write, 16, 4};
    ASSERT_EQ(service.addBreakpoint(watch).value(), 0U);

    auto called = service.call(kStore, {});
    ASSERT_TRUE(called.hasValue());
    EXPECT_EQ(called.value(), Trap::watchpoint(0));

    auto bytes = service.readMemory(16, 4);
    ASSERT_TRUE(bytes.hasValue());
    const std::vector<uint8_t> expected{42, 0, 0, 0};
    EXPECT_TRUE(bytes.value() == expected);
    EXPECT_EQ(service.memoryPages().value(), 1U);

    auto tail = service.readMemory(wasm::kPageSize - 2, 8);
    ASSERT_TRUE(tail.hasValue());
    EXPECT_EQ(tail.value().size(), 2U);

    auto resumed = service.continueExecution();
    ASSERT_TRUE(resumed.hasValue());
    EXPECT_EQ(resumed.value(), Trap::finished());

    const bool ended = service.inspect([](const debugger::Debugger &dbg)
                                       { return dbg.vm()->functionStack().empty(); });
    EXPECT_TRUE(ended);
}

int main(int argc, char **argv)
{
    wasmdbg_test::init(&argc, argv);
    return wasmdbg_test::run_all_tests();
}

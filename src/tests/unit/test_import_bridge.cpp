//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_import_bridge.cpp
// Purpose: Imported calls through the default, host and timed bridges.
// Key invariants: A failed import leaves the ip, the operands, the globals and
//                 memory exactly as before the call.
// Ownership/Lifetime: Bridges are shared with the VM under test.
// Links: src/vm/ImportBridge.cpp, src/vm/Dispatch.cpp
//
//===----------------------------------------------------------------------===//
#include "tests/TestHarness.hpp"
#include "vm/ImportBridge.hpp"
#include "vm/VM.hpp"
#include "wasm/ModuleBuilder.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using namespace wasmdbg;
using namespace wasmdbg::wasm;
using vm::BridgeError;
using vm::CodePosition;
using vm::ImportCall;
using vm::ImportResult;
using vm::Trap;
using vm::VM;

namespace
{

using Outcome = support::Expected<ImportResult, BridgeError>;

constexpr uint32_t kImport = 0;
constexpr uint32_t kCaller = 1;

/// f0 import env.twice(i32) -> i32
/// f1 caller() -> i32 = twice(21)
/// One page of memory and one mutable i32 global.
std::shared_ptr<const Module> importingModule()
{
    ModuleBuilder b;
    b.importFunction("env", "twice", {{ValueType::I32}, {ValueType::I32}});
    b.addMemory(1);
    b.addGlobal(ValueType::I32, true, Value(int32_t{0}));
    b.addFunction({{}, {ValueType::I32}}, {}, {build::i32(21), build::call(kImport)});
    return b.finish();
}

std::unique_ptr<VM> instantiate(std::shared_ptr<vm::ImportBridge> bridge)
{
    auto created = VM::create(importingModule(), nullptr, std::move(bridge));
    if (!created)
        throw std::runtime_error(created.error().message);
    return std::move(created).value();
}

Trap callCaller(VM &machine)
{
    auto trap = machine.runFunc(kCaller, {});
    if (!trap)
        throw std::runtime_error("runFunc rejected the call");
    return trap.value();
}

/// Doubles its argument, sets global 0 to 5 and writes 0xAA at address 0.
Outcome doubling(const ImportCall &call)
{
    ImportResult result;
    result.returnValue = Value(*call.args.at(0).as<int32_t>() * 2);
    result.globals = call.globals;
    result.globals.at(0) = Value(int32_t{5});
    result.memory = call.memory;
    result.memory.at(0) = 0xAA;
    return result;
}

} // namespace

TEST(ImportBridge, DefaultBridgeRejectsAndPreservesState)
{
    auto m = instantiate(std::make_shared<vm::DefaultImportBridge>());
    EXPECT_EQ(callCaller(*m), Trap::unsupportedImport(kImport));
    EXPECT_EQ(m->ip(), (CodePosition{kCaller, 1}));
    ASSERT_EQ(m->valueStack().size(), 1U);
    EXPECT_EQ(m->valueStack().back(), Value(int32_t{21}));
    EXPECT_TRUE(m->state() == vm::VMState::Faulted);
    EXPECT_EQ(toString(Trap::unsupportedImport(kImport)),
              std::string("Unsupported call to imported function 0"));
}

TEST(ImportBridge, HostHandlerWritesBackResultGlobalsAndMemory)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    std::size_t seenMemory = 0;
    host->registerHandler("env", "twice",
                          [&seenMemory](const ImportCall &call) -> Outcome
                          {
                              seenMemory = call.memory.size();
                              return doubling(call);
                          });
    auto m = instantiate(host);
    EXPECT_EQ(callCaller(*m), Trap::finished());
    EXPECT_EQ(m->valueStack().back(), Value(int32_t{42}));
    EXPECT_EQ(m->globals()[0], Value(int32_t{5}));
    EXPECT_EQ(m->defaultMemory()->bytes()[0], 0xAA);
    EXPECT_EQ(seenMemory, static_cast<std::size_t>(kPageSize));
}

TEST(ImportBridge, IndexHandlerWinsOverName)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler("env", "twice",
                          [](const ImportCall &) -> Outcome { return BridgeError{"by name"}; });
    host->registerHandler(kImport, doubling);
    auto m = instantiate(host);
    EXPECT_EQ(callCaller(*m), Trap::finished());
    EXPECT_EQ(m->valueStack().back(), Value(int32_t{42}));
}

TEST(ImportBridge, MismatchedResultIsRejected)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport,
                          [](const ImportCall &call) -> Outcome
                          {
                              auto result = doubling(call);
                              if (result)
                                  result.value().returnValue = Value(int64_t{1});
                              return result;
                          });
    auto m = instantiate(host);
    EXPECT_EQ(callCaller(*m), Trap::unsupportedImport(kImport));
    EXPECT_EQ(m->globals()[0], Value(int32_t{0}));
    EXPECT_EQ(m->defaultMemory()->bytes()[0], 0x00);
    EXPECT_EQ(m->valueStack().size(), 1U);
}

TEST(ImportBridge, MissingGlobalsAreRejected)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport,
                          [](const ImportCall &call) -> Outcome
                          {
                              ImportResult result;
                              result.returnValue = call.args.at(0);
                              return result;
                          });
    auto m = instantiate(host);
    EXPECT_EQ(callCaller(*m), Trap::unsupportedImport(kImport));
}

TEST(ImportBridge, ImportAsDirectCallTarget)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport, doubling);
    auto m = instantiate(host);
    auto trap = m->runFunc(kImport, {Value(int32_t{4})});
    ASSERT_TRUE(trap.hasValue());
    EXPECT_EQ(trap.value(), Trap::finished());
    EXPECT_EQ(m->valueStack().back(), Value(int32_t{8}));
}

TEST(TimedImportBridge, PassesThroughFastCalls)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport, doubling);
    vm::TimedImportBridge timed(host, std::chrono::milliseconds(5000));

    ImportCall call;
    call.funcIndex = kImport;
    call.args = {Value(int32_t{3})};
    call.globals = {Value(int32_t{0})};
    call.memory.resize(4);
    auto outcome = timed.fulfill(call);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().returnValue, Value(int32_t{6}));
}

TEST(TimedImportBridge, SlowCallTimesOut)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport,
                          [](const ImportCall &call) -> Outcome
                          {
                              std::this_thread::sleep_for(std::chrono::milliseconds(300));
                              return doubling(call);
                          });
    auto timed = std::make_shared<vm::TimedImportBridge>(host, std::chrono::milliseconds(20));
    auto m = instantiate(timed);
    EXPECT_EQ(callCaller(*m), Trap::unsupportedImport(kImport));
    EXPECT_EQ(m->globals()[0], Value(int32_t{0}));

    ImportCall call;
    call.args = {Value(int32_t{1})};
    call.globals = {Value(int32_t{0})};
    call.memory.resize(1);
    auto outcome = timed->fulfill(call);
    ASSERT_FALSE(outcome.hasValue());
    EXPECT_TRUE(outcome.error().message.find("timed out") != std::string::npos);
}

TEST(TimedImportBridge, HandlerExceptionsBecomeErrors)
{
    auto host = std::make_shared<vm::HostImportBridge>();
    host->registerHandler(kImport,
                          [](const ImportCall &) -> Outcome
                          { throw std::runtime_error("host failure"); });
    vm::TimedImportBridge timed(host, std::chrono::milliseconds(5000));
    ImportCall call;
    call.funcIndex = kImport;
    auto outcome = timed.fulfill(call);
    ASSERT_FALSE(outcome.hasValue());
    EXPECT_TRUE(outcome.error().message.find("host failure") != std::string::npos);
}

int main(int argc, char **argv)
{
    wasmdbg_test::init(&argc, argv);
    return wasmdbg_test::run_all_tests();
}

//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_breakpoints.cpp
// Purpose: Registry bookkeeping and lookup rules for breakpoints and watchpoints.
// Key invariants: Indices are never reused; lookups report the lowest index.
// Ownership/Lifetime: Registries are local to each test.
// Links: src/vm/Breakpoints.cpp
//
//===----------------------------------------------------------------------===//
#include "tests/TestHarness.hpp"
#include "vm/Breakpoints.hpp"

#include <string>
#include <variant>

using namespace wasmdbg::vm;

namespace
{

Breakpoint codeAt(uint32_t func, uint32_t instr)
{
    return CodeBreakpoint{CodePosition{func, instr}};
}

Breakpoint memoryWatch(WatchTrigger trigger, uint32_t address, uint32_t length)
{
    return MemoryWatchpoint{trigger, address, length};
}

Breakpoint globalWatch(WatchTrigger trigger, uint32_t index)
{
    return GlobalWatchpoint{trigger, index};
}

} // namespace

TEST(Breakpoints, IndicesAreMonotonicAndNeverReused)
{
    Breakpoints registry;
    EXPECT_EQ(registry.add(codeAt(0, 1)), 0U);
    EXPECT_EQ(registry.add(codeAt(0, 2)), 1U);
    EXPECT_TRUE(registry.remove(0));
    EXPECT_FALSE(registry.remove(0));
    EXPECT_FALSE(registry.remove(42));
    EXPECT_EQ(registry.add(codeAt(0, 3)), 2U);

    registry.clear();
    EXPECT_EQ(registry.size(), 0U);
    EXPECT_EQ(registry.add(codeAt(1, 0)), 3U);
}

TEST(Breakpoints, ListIsOrderedByIndex)
{
    Breakpoints registry;
    registry.add(globalWatch(WatchTrigger::Write, 0));
    registry.add(codeAt(2, 0));
    registry.add(memoryWatch(WatchTrigger::Read, 0x10, 4));
    registry.remove(1);

    const auto entries = registry.list();
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].first, 0U);
    EXPECT_EQ(entries[1].first, 2U);
    EXPECT_TRUE(std::holds_alternative<MemoryWatchpoint>(entries[1].second));

    EXPECT_TRUE(registry.get(2).has_value());
    EXPECT_FALSE(registry.get(1).has_value());
}

TEST(Breakpoints, CodeLookupReportsLowestIndex)
{
    Breakpoints registry;
    registry.add(codeAt(0, 5));
    registry.add(codeAt(1, 2));
    registry.add(codeAt(1, 2));

    const auto view = registry.acquire();
    EXPECT_EQ(view.findCode(CodePosition{1, 2}), 1U);
    EXPECT_EQ(view.findCode(CodePosition{0, 5}), 0U);
    EXPECT_FALSE(view.findCode(CodePosition{0, 4}).has_value());
}

TEST(Breakpoints, GlobalWatchRespectsTrigger)
{
    Breakpoints registry;
    registry.add(globalWatch(WatchTrigger::Read, 0));
    registry.add(globalWatch(WatchTrigger::ReadWrite, 1));

    const auto view = registry.acquire();
    EXPECT_EQ(view.findGlobal(0, WatchTrigger::Read), 0U);
    EXPECT_FALSE(view.findGlobal(0, WatchTrigger::Write).has_value());
    EXPECT_EQ(view.findGlobal(1, WatchTrigger::Write), 1U);
    EXPECT_EQ(view.findGlobal(1, WatchTrigger::Read), 1U);
    EXPECT_FALSE(view.findGlobal(2, WatchTrigger::Read).has_value());
}

TEST(Breakpoints, MemoryWatchUsesHalfOpenOverlap)
{
    Breakpoints registry;
    registry.add(memoryWatch(WatchTrigger::Write, 0x10, 4));

    const auto view = registry.acquire();
    EXPECT_EQ(view.findMemory(0x10, 1, WatchTrigger::Write), 0U);
    EXPECT_EQ(view.findMemory(0x13, 4, WatchTrigger::Write), 0U);
    EXPECT_EQ(view.findMemory(0x0D, 4, WatchTrigger::Write), 0U);
    EXPECT_FALSE(view.findMemory(0x14, 4, WatchTrigger::Write).has_value());
    EXPECT_FALSE(view.findMemory(0x0C, 4, WatchTrigger::Write).has_value());
    EXPECT_FALSE(view.findMemory(0x10, 4, WatchTrigger::Read).has_value());
}

TEST(Breakpoints, TriggerMatching)
{
    EXPECT_TRUE(matches(WatchTrigger::ReadWrite, WatchTrigger::Read));
    EXPECT_TRUE(matches(WatchTrigger::Write, WatchTrigger::Write));
    EXPECT_FALSE(matches(WatchTrigger::Read, WatchTrigger::Write));
}

TEST(Breakpoints, Formatting)
{
    EXPECT_EQ(toString(CodePosition{3, 7}), std::string("f3:#7"));
    EXPECT_EQ(toString(codeAt(0, 1)), std::string("code at f0:#1"));
    EXPECT_EQ(toString(memoryWatch(WatchTrigger::Write, 0x10, 4)),
              std::string("watch write memory [0x10, +4)"));
    EXPECT_EQ(toString(globalWatch(WatchTrigger::Read, 0)), std::string("watch read global 0"));
    EXPECT_EQ(toString(WatchTrigger::ReadWrite), std::string("read/write"));
}

int main(int argc, char **argv)
{
    wasmdbg_test::init(&argc, argv);
    return wasmdbg_test::run_all_tests();
}

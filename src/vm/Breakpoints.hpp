//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Breakpoints.hpp
// Purpose: Registry of code breakpoints and global/memory watchpoints shared
//          between a debugger session and its VM.
// Key invariants: Indices are allocated monotonically from zero and never
//                 reused, even after remove() or clear(). Entries iterate in
//                 index order. All access is serialised by the registry's
//                 mutex; the VM holds a View for a whole dispatch operation.
// Ownership/Lifetime: Shared through SharedBreakpoints by the debugger's File
//                     and the live VM. A View must not outlive its registry.
// Links: vm/VM.hpp, include/wasmdbg/debugger/Debugger.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace wasmdbg::vm
{

/// @brief Function index and instruction index within its body.
struct CodePosition
{
    uint32_t func = 0;
    uint32_t instr = 0;

    friend bool operator==(const CodePosition &lhs, const CodePosition &rhs) = default;

    friend bool operator<(const CodePosition &lhs, const CodePosition &rhs) noexcept
    {
        return lhs.func < rhs.func || (lhs.func == rhs.func && lhs.instr < rhs.instr);
    }
};

/// @brief Access kinds a watchpoint reacts to; usable as a bit set.
enum class WatchTrigger : uint8_t
{
    Read = 1,
    Write = 2,
    ReadWrite = 3,
};

/// @brief True when @p trigger reacts to @p access.
constexpr bool matches(WatchTrigger trigger, WatchTrigger access) noexcept
{
    return (static_cast<uint8_t>(trigger) & static_cast<uint8_t>(access)) != 0;
}

struct CodeBreakpoint
{
    CodePosition position;
};

/// @brief Watch on the byte range [address, address + length).
struct MemoryWatchpoint
{
    WatchTrigger trigger = WatchTrigger::Write;
    uint32_t address = 0;
    uint32_t length = 0;
};

struct GlobalWatchpoint
{
    WatchTrigger trigger = WatchTrigger::Write;
    uint32_t globalIndex = 0;
};

using Breakpoint = std::variant<CodeBreakpoint, MemoryWatchpoint, GlobalWatchpoint>;

std::string toString(const CodePosition &pos);
std::string toString(WatchTrigger trigger);
std::string toString(const Breakpoint &bp);

class Breakpoints
{
  public:
    /// @brief Lookup handle holding the registry lock.
    /// @details Created by acquire(); lookups through a View do not lock again.
    class View
    {
      public:
        /// @brief Lowest-index code breakpoint at @p pos.
        std::optional<uint32_t> findCode(const CodePosition &pos) const;

        /// @brief Lowest-index global watchpoint for @p globalIndex reacting to @p access.
        std::optional<uint32_t> findGlobal(uint32_t globalIndex, WatchTrigger access) const;

        /// @brief Lowest-index memory watchpoint overlapping the accessed range.
        std::optional<uint32_t> findMemory(uint64_t address, uint64_t length, WatchTrigger access) const;

      private:
        friend class Breakpoints;

        View(const Breakpoints &owner, std::unique_lock<std::mutex> lock)
            : owner_(owner), lock_(std::move(lock))
        {
        }

        const Breakpoints &owner_;
        std::unique_lock<std::mutex> lock_;
    };

    /// @brief Register @p bp and return its index.
    uint32_t add(Breakpoint bp);

    /// @brief Remove entry @p index; false when unknown or already removed.
    bool remove(uint32_t index);

    /// @brief Remove every entry; the index counter keeps counting.
    void clear();

    /// @brief Snapshot of all entries in index order.
    std::vector<std::pair<uint32_t, Breakpoint>> list() const;

    std::optional<Breakpoint> get(uint32_t index) const;

    std::size_t size() const;

    /// @brief Lock the registry for a sequence of lookups.
    View acquire() const;

  private:
    mutable std::mutex mutex_;
    std::map<uint32_t, Breakpoint> entries_;
    uint32_t nextIndex_ = 0;
};

using SharedBreakpoints = std::shared_ptr<Breakpoints>;

} // namespace wasmdbg::vm

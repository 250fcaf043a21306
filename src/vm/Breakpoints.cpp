//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Breakpoints.cpp
// Purpose: Breakpoint registry bookkeeping and lookups.
// Key invariants: See Breakpoints.hpp.
// Ownership/Lifetime: See Breakpoints.hpp.
// Links: vm/Breakpoints.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Breakpoints.hpp"

#include <sstream>

namespace wasmdbg::vm
{

std::string toString(const CodePosition &pos)
{
    return "f" + std::to_string(pos.func) + ":#" + std::to_string(pos.instr);
}

std::string toString(WatchTrigger trigger)
{
    switch (trigger)
    {
        case WatchTrigger::Read:
            return "read";
        case WatchTrigger::Write:
            return "write";
        case WatchTrigger::ReadWrite:
            return "read/write";
    }
    return "?";
}

std::string toString(const Breakpoint &bp)
{
    std::ostringstream os;
    if (const auto *code = std::get_if<CodeBreakpoint>(&bp))
    {
        os << "code at " << toString(code->position);
    }
    else if (const auto *mem = std::get_if<MemoryWatchpoint>(&bp))
    {
        os << "watch " << toString(mem->trigger) << " memory [0x" << std::hex << mem->address
           << ", +" << std::dec << mem->length << ")";
    }
    else if (const auto *global = std::get_if<GlobalWatchpoint>(&bp))
    {
        os << "watch " << toString(global->trigger) << " global " << global->globalIndex;
    }
    return os.str();
}

std::optional<uint32_t> Breakpoints::View::findCode(const CodePosition &pos) const
{
    for (const auto &[index, bp] : owner_.entries_)
    {
        if (const auto *code = std::get_if<CodeBreakpoint>(&bp); code && code->position == pos)
            return index;
    }
    return std::nullopt;
}

std::optional<uint32_t> Breakpoints::View::findGlobal(uint32_t globalIndex, WatchTrigger access) const
{
    for (const auto &[index, bp] : owner_.entries_)
    {
        const auto *global = std::get_if<GlobalWatchpoint>(&bp);
        if (global && global->globalIndex == globalIndex && matches(global->trigger, access))
            return index;
    }
    return std::nullopt;
}

std::optional<uint32_t> Breakpoints::View::findMemory(uint64_t address,
                                                      uint64_t length,
                                                      WatchTrigger access) const
{
    for (const auto &[index, bp] : owner_.entries_)
    {
        const auto *mem = std::get_if<MemoryWatchpoint>(&bp);
        if (!mem || !matches(mem->trigger, access))
            continue;
        const uint64_t start = mem->address;
        const uint64_t end = start + mem->length;
        if (start < address + length && address < end)
            return index;
    }
    return std::nullopt;
}

uint32_t Breakpoints::add(Breakpoint bp)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t index = nextIndex_++;
    entries_.emplace(index, std::move(bp));
    return index;
}

bool Breakpoints::remove(uint32_t index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(index) != 0;
}

void Breakpoints::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::vector<std::pair<uint32_t, Breakpoint>> Breakpoints::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::optional<Breakpoint> Breakpoints::get(uint32_t index) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(index);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::size_t Breakpoints::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

Breakpoints::View Breakpoints::acquire() const
{
    return View(*this, std::unique_lock<std::mutex>(mutex_));
}

} // namespace wasmdbg::vm

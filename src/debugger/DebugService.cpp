//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/DebugService.cpp
// Purpose: Lock-and-forward implementation of DebugService.
// Key invariants: One lock_guard per method; nothing is forwarded unlocked.
// Ownership/Lifetime: See DebugService.hpp.
// Links: include/wasmdbg/debugger/DebugService.hpp
//
//===----------------------------------------------------------------------===//

#include "wasmdbg/debugger/DebugService.hpp"

#include <algorithm>

namespace wasmdbg::debugger
{

support::Expected<void, wasm::LoadError> DebugService::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.load(path);
}

Result<std::optional<vm::Trap>> DebugService::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.start();
}

Result<vm::Trap> DebugService::run()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.run();
}

Result<vm::Trap> DebugService::call(uint32_t funcIndex, const std::vector<wasm::Value> &args)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.call(funcIndex, args);
}

Result<void> DebugService::resetVm()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.resetVm();
}

Result<vm::Trap> DebugService::continueExecution()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.continueExecution();
}

Result<std::optional<vm::Trap>> DebugService::executeStep()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.executeStep();
}

Result<std::optional<vm::Trap>> DebugService::executeStepOver()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.executeStepOver();
}

Result<std::optional<vm::Trap>> DebugService::executeStepOut()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.executeStepOut();
}

Result<std::vector<vm::CodePosition>> DebugService::backtrace() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.backtrace();
}

Result<std::vector<wasm::Value>> DebugService::globals() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.globals();
}

Result<std::vector<wasm::Value>> DebugService::valueStack() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.valueStack();
}

Result<std::vector<wasm::Value>> DebugService::locals(int64_t depth) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.locals(depth);
}

Result<std::vector<uint8_t>> DebugService::readMemory(uint64_t address, uint64_t length) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto memory = debugger_.memory();
    if (!memory)
        return memory.error();
    const auto bytes = memory.value()->bytes();
    const uint64_t begin = std::min<uint64_t>(address, bytes.size());
    const uint64_t end = begin + std::min<uint64_t>(length, bytes.size() - begin);
    return std::vector<uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(begin),
                                bytes.begin() + static_cast<std::ptrdiff_t>(end));
}

Result<uint32_t> DebugService::memoryPages() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto memory = debugger_.memory();
    if (!memory)
        return memory.error();
    return memory.value()->pages();
}

Result<uint32_t> DebugService::addBreakpoint(const vm::Breakpoint &bp)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.addBreakpoint(bp);
}

Result<bool> DebugService::deleteBreakpoint(uint32_t index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.deleteBreakpoint(index);
}

Result<void> DebugService::clearBreakpoints()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.clearBreakpoints();
}

Result<std::vector<std::pair<uint32_t, vm::Breakpoint>>> DebugService::breakpoints() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.breakpoints();
}

std::optional<std::string> DebugService::functionName(uint32_t funcIndex) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.functionName(funcIndex);
}

std::optional<std::string> DebugService::localName(uint32_t funcIndex, uint32_t localIndex) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debugger_.localName(funcIndex, localIndex);
}

} // namespace wasmdbg::debugger

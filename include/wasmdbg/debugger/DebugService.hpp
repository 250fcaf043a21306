//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/wasmdbg/debugger/DebugService.hpp
// Purpose: Thread-safe front door to one debug session for shells and
//          transports.
// Invariants: Every method holds the session mutex for its whole duration,
//             including while guest code runs and while an import call
//             blocks, so callers never observe a half-finished operation.
//             Results are returned by value; no reference into the session
//             escapes the lock.
// Ownership: Owns its Debugger.
// Links: include/wasmdbg/debugger/Debugger.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasmdbg/debugger/Debugger.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wasmdbg::debugger
{

class DebugService
{
  public:
    explicit DebugService(DebuggerConfig config = {}) : debugger_(std::move(config)) {}

    DebugService(const DebugService &) = delete;
    DebugService &operator=(const DebugService &) = delete;

    support::Expected<void, wasm::LoadError> load(const std::string &path);

    Result<std::optional<vm::Trap>> start();
    Result<vm::Trap> run();
    Result<vm::Trap> call(uint32_t funcIndex, const std::vector<wasm::Value> &args);
    Result<void> resetVm();
    Result<vm::Trap> continueExecution();
    Result<std::optional<vm::Trap>> executeStep();
    Result<std::optional<vm::Trap>> executeStepOver();
    Result<std::optional<vm::Trap>> executeStepOut();

    Result<std::vector<vm::CodePosition>> backtrace() const;
    Result<std::vector<wasm::Value>> globals() const;
    Result<std::vector<wasm::Value>> valueStack() const;
    Result<std::vector<wasm::Value>> locals(int64_t depth) const;

    /// @brief Copy of @p length bytes of the default memory at @p address.
    /// @details The range is clipped to the memory size.
    Result<std::vector<uint8_t>> readMemory(uint64_t address, uint64_t length) const;

    /// @brief Current size of the default memory in pages.
    Result<uint32_t> memoryPages() const;

    Result<uint32_t> addBreakpoint(const vm::Breakpoint &bp);
    Result<bool> deleteBreakpoint(uint32_t index);
    Result<void> clearBreakpoints();
    Result<std::vector<std::pair<uint32_t, vm::Breakpoint>>> breakpoints() const;

    std::optional<std::string> functionName(uint32_t funcIndex) const;
    std::optional<std::string> localName(uint32_t funcIndex, uint32_t localIndex) const;

    /// @brief Run @p fn on the session with the lock held.
    /// @details For read-only queries not covered above (module layout,
    ///          VM state). @p fn must not retain references past its return.
    template <typename Fn> auto inspect(Fn &&fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const Debugger &>(debugger_));
    }

  private:
    mutable std::mutex mutex_;
    Debugger debugger_;
};

} // namespace wasmdbg::debugger

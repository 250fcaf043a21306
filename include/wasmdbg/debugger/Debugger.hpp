//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/wasmdbg/debugger/Debugger.hpp
// Purpose: Declare the debug session: one loaded file, at most one live VM
//          and the debug symbols of the file.
// Invariants: A failed operation leaves file, VM and symbols as they were.
//             Breakpoint administration goes to the current file's registry,
//             which every VM built from that file shares.
// Ownership: The Debugger owns its File, VM and DebugInfo. It is not
//            thread-safe; use DebugService to share a session.
// Links: include/wasmdbg/debugger/DebugService.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debugger/DebuggerConfig.hpp"
#include "debugger/DebuggerError.hpp"
#include "debugger/File.hpp"
#include "vm/Breakpoints.hpp"
#include "vm/Memory.hpp"
#include "vm/Trap.hpp"
#include "vm/VM.hpp"
#include "wasm/BinaryReader.hpp"
#include "wasm/DebugInfo.hpp"
#include "wasm/Value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wasmdbg::debugger
{

class Debugger
{
  public:
    explicit Debugger(DebuggerConfig config = {});

    // Files ----------------------------------------------------------------

    /// @brief Load @p path, replacing the current file and discarding the VM.
    /// @details On failure nothing changes, including the breakpoints of the
    ///          previously loaded file.
    support::Expected<void, wasm::LoadError> load(const std::string &path);

    /// @brief Currently loaded file, or nullptr.
    const File *file() const noexcept
    {
        return file_.get();
    }

    // Execution ------------------------------------------------------------

    /// @brief Build a fresh VM and run the entry point until a trap.
    /// @return std::nullopt when the module has no entry point; the idle VM
    ///         is kept for call().
    Result<std::optional<vm::Trap>> start();

    /// @brief Like start(), but a module without entry point is an InitError.
    Result<vm::Trap> run();

    /// @brief Call @p funcIndex with @p args on the current VM, building one
    ///        when none exists.
    Result<vm::Trap> call(uint32_t funcIndex, const std::vector<wasm::Value> &args);

    /// @brief Drop the VM; the next start() or call() instantiates afresh.
    Result<void> resetVm();

    Result<vm::Trap> continueExecution();
    Result<std::optional<vm::Trap>> executeStep();
    Result<std::optional<vm::Trap>> executeStepOver();
    Result<std::optional<vm::Trap>> executeStepOut();

    /// @brief Current VM, or nullptr.
    const vm::VM *vm() const noexcept
    {
        return vm_.get();
    }

    // Inspection -----------------------------------------------------------

    /// @brief Positions innermost first: the ip, then each caller's resume
    ///        position. One entry per frame.
    Result<std::vector<vm::CodePosition>> backtrace() const;

    Result<std::vector<wasm::Value>> globals() const;
    Result<std::vector<wasm::Value>> valueStack() const;

    /// @brief Default memory of the VM.
    Result<const vm::LinearMemory *> memory() const;

    /// @brief Locals of one frame.
    /// @param depth Non-negative counts from the outermost frame; negative
    ///              counts from the innermost, so -1 is the current frame.
    Result<std::vector<wasm::Value>> locals(int64_t depth) const;

    std::optional<std::string> functionName(uint32_t funcIndex) const;
    std::optional<std::string> localName(uint32_t funcIndex, uint32_t localIndex) const;

    // Breakpoints ----------------------------------------------------------

    /// @brief Validate @p bp against the module and register it.
    /// @details Code positions must name an existing instruction and global
    ///          watchpoints an existing global. Memory watchpoints are always
    ///          accepted. A rejected breakpoint does not consume an index.
    Result<uint32_t> addBreakpoint(const vm::Breakpoint &bp);

    /// @brief Remove breakpoint @p index; false when there was none.
    Result<bool> deleteBreakpoint(uint32_t index);

    Result<void> clearBreakpoints();

    Result<std::vector<std::pair<uint32_t, vm::Breakpoint>>> breakpoints() const;

    const DebuggerConfig &config() const noexcept
    {
        return config_;
    }

  private:
    Result<vm::VM *> createVm();
    Result<vm::VM *> ensureVm();
    Result<vm::VM *> liveVm();
    Result<const vm::VM *> liveVm() const;

    DebuggerConfig config_;
    std::unique_ptr<File> file_;
    std::unique_ptr<vm::VM> vm_;
    wasm::DebugInfo info_;
};

} // namespace wasmdbg::debugger

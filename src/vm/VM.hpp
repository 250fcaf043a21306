//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
/**
 * @file
 * @brief Interpreter for decoded WebAssembly modules with debugger stepping.
 *
 * The VM instantiates a module (globals, memory, tables, active segments) and
 * executes it one instruction at a time.  Every execution entry point runs the
 * dispatch loop until a Trap stops it: normal completion, a breakpoint or
 * watchpoint, or a fault.
 *
 * @section invariants Key invariants
 * - A trap never unwinds.  Faults leave the ip on the faulting instruction
 *   with its operands still on the value stack; watchpoints commit the
 *   triggering access and leave the ip on the following instruction.
 * - Each frame's value-stack base is the stack height at entry, after the
 *   arguments were moved into its locals.
 * - The breakpoint registry is locked for the whole of one stepping
 *   operation and released between operations.
 *
 * @section concurrency Concurrency model
 * A VM is single-threaded.  The only blocking point is the import bridge.
 *
 * @section ownership Ownership
 * The VM shares the module, the breakpoint registry and the import bridge;
 * it exclusively owns all mutable execution state.
 */

#pragma once

#include "support/expected.hpp"
#include "vm/Breakpoints.hpp"
#include "vm/ImportBridge.hpp"
#include "vm/Memory.hpp"
#include "vm/Trace.hpp"
#include "vm/Trap.hpp"
#include "vm/VMConfig.hpp"
#include "vm/ValueStack.hpp"
#include "wasm/Module.hpp"
#include "wasm/Value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wasmdbg::vm
{

/// @brief Structured-control label active within a frame.
struct Label
{
    uint32_t continuation = 0; ///< Matching end for blocks, the loop itself for loops.
    uint32_t arity = 0;        ///< Values carried by a branch to this label.
    std::size_t height = 0;    ///< Value stack height when the label was entered.
    bool isLoop = false;
};

/// @brief Activation record for one function call.
struct Frame
{
    uint32_t funcIndex = 0;
    std::vector<wasm::Value> locals; ///< Parameters followed by declared locals.
    CodePosition returnAddress;      ///< Resume position in the caller.
    std::size_t stackBase = 0;
    std::vector<Label> labels;
};

enum class VMState : uint8_t
{
    Uninitialized, ///< Instantiated; no function entered yet.
    Running,
    Paused,   ///< Stopped at a breakpoint, watchpoint or after a step.
    Finished, ///< The entry frame returned.
    Faulted,  ///< Stopped by a fault; resuming re-executes the faulting instruction.
};

/// @brief Instantiation failure.
struct InitError
{
    std::string message;
};

/// @brief Rejection of a direct function call.
enum class CallError : uint8_t
{
    InvalidFunctionIndex,
    InvalidArguments,
};

class VM
{
    /// @brief Restricts construction to create().
    struct CreateKey
    {
        explicit CreateKey() = default;
    };

  public:
    VM(CreateKey,
       std::shared_ptr<const wasm::Module> module,
       SharedBreakpoints breakpoints,
       std::shared_ptr<ImportBridge> bridge,
       VMConfig config);

    /// @brief Instantiate @p module.
    /// @details Evaluates global initializers, allocates memories and tables
    ///          and applies active data and element segments. Imported
    ///          globals, memories and tables start zeroed.
    static support::Expected<std::unique_ptr<VM>, InitError> create(
        std::shared_ptr<const wasm::Module> module,
        SharedBreakpoints breakpoints,
        std::shared_ptr<ImportBridge> bridge,
        VMConfig config = {});

    /// @brief Enter the entry point and run until a trap.
    /// @details Parameters of the entry function are zero-filled. The code
    ///          breakpoint check applies from the first instruction.
    /// @return std::nullopt when the module has no entry point.
    std::optional<Trap> start();

    /// @brief Same as start().
    std::optional<Trap> run();

    /// @brief Discard in-progress execution and call @p funcIndex with @p args.
    /// @details Globals, memory and tables are kept. Non-parameter locals are
    ///          zero-filled; arguments must match the signature exactly.
    support::Expected<Trap, CallError> runFunc(uint32_t funcIndex, const std::vector<wasm::Value> &args);

    /// @brief Dispatch until any trap.
    Trap continueExecution();

    /// @brief Dispatch exactly one instruction.
    /// @return The trap it raised, or std::nullopt.
    std::optional<Trap> executeStep();

    /// @brief Dispatch until the call depth returns to the current one.
    std::optional<Trap> executeStepOver();

    /// @brief Dispatch until the current frame returns to its caller.
    std::optional<Trap> executeStepOut();

    // Inspection -----------------------------------------------------------

    /// @brief Position of the next instruction to dispatch.
    CodePosition ip() const noexcept
    {
        return ip_;
    }

    const std::vector<wasm::Value> &valueStack() const noexcept
    {
        return stack_.values();
    }

    const std::vector<Frame> &functionStack() const noexcept
    {
        return frames_;
    }

    const std::vector<wasm::Value> &globals() const noexcept
    {
        return globals_;
    }

    /// @brief Memory 0, or nullptr when the module declares none.
    const LinearMemory *defaultMemory() const noexcept
    {
        return memories_.empty() ? nullptr : &memories_.front();
    }

    /// @brief Function references of table 0; empty slots are std::nullopt.
    const std::vector<std::optional<uint32_t>> *defaultTable() const noexcept
    {
        return tables_.empty() ? nullptr : &tables_.front();
    }

    VMState state() const noexcept
    {
        return state_;
    }

    const wasm::Module &module() const noexcept
    {
        return *module_;
    }

  private:
    support::Expected<void, InitError> instantiate();
    support::Expected<wasm::Value, InitError> evalInit(const wasm::InitExpr &expr) const;

    void resetExecution();
    std::optional<Trap> enterEntry(uint32_t funcIndex, std::vector<wasm::Value> args);
    Trap runLoop(bool checkFirst);
    Trap settle(Trap trap);

    /// @brief Dispatch the instruction at the ip.
    /// @param checkBreakpoint Whether a code breakpoint at the ip stops first.
    std::optional<Trap> dispatchOne(bool checkBreakpoint);
    std::optional<Trap> execute(const wasm::Instr &in);

    // Control (Dispatch.cpp)
    std::optional<Trap> execControl(const wasm::Instr &in);
    std::optional<Trap> branch(uint32_t depth);
    std::optional<Trap> returnFromFunction();
    std::optional<Trap> callFunction(uint32_t funcIndex);
    std::optional<Trap> callImport(uint32_t funcIndex);
    std::optional<Trap> callIndirect(const wasm::Instr &in);
    void jumpTo(uint32_t instr);

    // Variables (Dispatch.cpp)
    std::optional<Trap> execVariable(const wasm::Instr &in);

    // Numeric (int_ops.cpp, fp_ops.cpp)
    std::optional<Trap> execIntOp(const wasm::Instr &in);
    std::optional<Trap> execFloatOp(const wasm::Instr &in);
    std::optional<Trap> execConversion(const wasm::Instr &in);

    // Memory (mem_ops.cpp)
    std::optional<Trap> execMemory(const wasm::Instr &in);
    template <typename Stored, typename Pushed> std::optional<Trap> loadOp(const wasm::Instr &in);
    template <typename Operand, typename Stored> std::optional<Trap> storeOp(const wasm::Instr &in);

    std::optional<Trap> push(wasm::Value value);
    Frame &currentFrame()
    {
        return frames_.back();
    }

    std::shared_ptr<const wasm::Module> module_;
    SharedBreakpoints breakpoints_;
    std::shared_ptr<ImportBridge> bridge_;
    VMConfig config_;
    TraceSink tracer_;

    CodePosition ip_;
    ValueStack stack_;
    std::vector<Frame> frames_;
    std::vector<wasm::Value> globals_;
    std::vector<LinearMemory> memories_;
    std::vector<std::vector<std::optional<uint32_t>>> tables_;
    VMState state_ = VMState::Uninitialized;

    /// Registry view held for the duration of one stepping operation.
    const Breakpoints::View *watch_ = nullptr;

    /// Set by instructions that move the ip themselves.
    bool jumped_ = false;
};

} // namespace wasmdbg::vm

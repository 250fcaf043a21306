//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/Debugger.cpp
// Purpose: Debug session operations over the VM and the loaded file.
// Key invariants: Every fallible step runs before the first mutation, so an
//                 error return leaves the session unchanged.
// Ownership/Lifetime: See Debugger.hpp.
// Links: include/wasmdbg/debugger/Debugger.hpp
//
//===----------------------------------------------------------------------===//

#include "wasmdbg/debugger/Debugger.hpp"

#include "wasm/ModuleLoader.hpp"

#include <variant>

namespace wasmdbg::debugger
{

Debugger::Debugger(DebuggerConfig config) : config_(std::move(config)) {}

support::Expected<void, wasm::LoadError> Debugger::load(const std::string &path)
{
    auto loaded = wasm::loadModuleFile(path);
    if (!loaded)
        return loaded.error();

    auto module = std::make_shared<const wasm::Module>(std::move(loaded).value());
    info_ = wasm::DebugInfo::fromModule(*module);
    file_ = std::make_unique<File>(path, std::move(module));
    vm_.reset();
    return {};
}

Result<vm::VM *> Debugger::createVm()
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    auto created = vm::VM::create(
        file_->sharedModule(), file_->sharedBreakpoints(), config_.makeBridge(), config_.vm);
    if (!created)
        return DebuggerError::initError(created.error().message);
    vm_ = std::move(created).value();
    return vm_.get();
}

Result<vm::VM *> Debugger::ensureVm()
{
    if (vm_)
        return vm_.get();
    return createVm();
}

Result<vm::VM *> Debugger::liveVm()
{
    if (!vm_)
        return DebuggerError::of(DebuggerErrorKind::NoRunningInstance);
    return vm_.get();
}

Result<const vm::VM *> Debugger::liveVm() const
{
    if (!vm_)
        return DebuggerError::of(DebuggerErrorKind::NoRunningInstance);
    return static_cast<const vm::VM *>(vm_.get());
}

Result<std::optional<vm::Trap>> Debugger::start()
{
    auto machine = createVm();
    if (!machine)
        return machine.error();
    return machine.value()->start();
}

Result<vm::Trap> Debugger::run()
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    if (!file_->module().entryPoint())
        return DebuggerError::initError("module has no entry point");
    auto machine = createVm();
    if (!machine)
        return machine.error();
    auto trap = machine.value()->run();
    if (!trap)
        return DebuggerError::initError("module has no entry point");
    return *trap;
}

Result<vm::Trap> Debugger::call(uint32_t funcIndex, const std::vector<wasm::Value> &args)
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    // Validate before instantiating so a bad call leaves no fresh VM behind.
    const wasm::FuncType *type = file_->module().funcType(funcIndex);
    if (!type)
        return DebuggerError::of(DebuggerErrorKind::InvalidFunctionIndex);
    if (args.size() != type->params.size())
        return DebuggerError::of(DebuggerErrorKind::InvalidArguments);
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type() != type->params[i])
            return DebuggerError::of(DebuggerErrorKind::InvalidArguments);
    }

    auto machine = ensureVm();
    if (!machine)
        return machine.error();
    auto trap = machine.value()->runFunc(funcIndex, args);
    if (!trap)
    {
        return DebuggerError::of(trap.error() == vm::CallError::InvalidFunctionIndex
                                     ? DebuggerErrorKind::InvalidFunctionIndex
                                     : DebuggerErrorKind::InvalidArguments);
    }
    return trap.value();
}

Result<void> Debugger::resetVm()
{
    vm_.reset();
    return {};
}

Result<vm::Trap> Debugger::continueExecution()
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->continueExecution();
}

Result<std::optional<vm::Trap>> Debugger::executeStep()
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->executeStep();
}

Result<std::optional<vm::Trap>> Debugger::executeStepOver()
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->executeStepOver();
}

Result<std::optional<vm::Trap>> Debugger::executeStepOut()
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->executeStepOut();
}

Result<std::vector<vm::CodePosition>> Debugger::backtrace() const
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    const vm::VM &current = *machine.value();
    std::vector<vm::CodePosition> positions{current.ip()};
    const auto &frames = current.functionStack();
    for (std::size_t i = frames.size(); i > 1; --i)
        positions.push_back(frames[i - 1].returnAddress);
    return positions;
}

Result<std::vector<wasm::Value>> Debugger::globals() const
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->globals();
}

Result<std::vector<wasm::Value>> Debugger::valueStack() const
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    return machine.value()->valueStack();
}

Result<const vm::LinearMemory *> Debugger::memory() const
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    const vm::LinearMemory *memory = machine.value()->defaultMemory();
    if (!memory)
        return DebuggerError::of(DebuggerErrorKind::NoMemory);
    return memory;
}

Result<std::vector<wasm::Value>> Debugger::locals(int64_t depth) const
{
    auto machine = liveVm();
    if (!machine)
        return machine.error();
    const auto &frames = machine.value()->functionStack();
    const auto count = static_cast<int64_t>(frames.size());
    const int64_t index = depth < 0 ? count + depth : depth;
    if (index < 0 || index >= count)
        return DebuggerError::of(DebuggerErrorKind::InvalidFrameDepth);
    return frames[static_cast<std::size_t>(index)].locals;
}

std::optional<std::string> Debugger::functionName(uint32_t funcIndex) const
{
    return info_.functionName(funcIndex);
}

std::optional<std::string> Debugger::localName(uint32_t funcIndex, uint32_t localIndex) const
{
    return info_.localName(funcIndex, localIndex);
}

Result<uint32_t> Debugger::addBreakpoint(const vm::Breakpoint &bp)
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    const wasm::Module &module = file_->module();
    if (const auto *code = std::get_if<vm::CodeBreakpoint>(&bp))
    {
        if (!module.hasInstruction(code->position.func, code->position.instr))
            return DebuggerError::of(DebuggerErrorKind::InvalidBreakpointPosition);
    }
    else if (const auto *global = std::get_if<vm::GlobalWatchpoint>(&bp))
    {
        if (global->globalIndex >= module.globals.size())
            return DebuggerError::of(DebuggerErrorKind::InvalidWatchpointGlobal);
    }
    return file_->breakpoints().add(bp);
}

Result<bool> Debugger::deleteBreakpoint(uint32_t index)
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    return file_->breakpoints().remove(index);
}

Result<void> Debugger::clearBreakpoints()
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    file_->breakpoints().clear();
    return {};
}

Result<std::vector<std::pair<uint32_t, vm::Breakpoint>>> Debugger::breakpoints() const
{
    if (!file_)
        return DebuggerError::of(DebuggerErrorKind::NoFileLoaded);
    return file_->breakpoints().list();
}

} // namespace wasmdbg::debugger

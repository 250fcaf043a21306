//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.cpp
// Purpose: VM instantiation, execution entry points and the stepping
//          controller.
// Key invariants: Every public execution entry point holds a view of the
//                 breakpoint registry for its whole duration. The first
//                 instruction dispatched by a resume operation (continue or a
//                 step variant) skips the code breakpoint check because the
//                 ip is the position execution stopped at.
// Ownership/Lifetime: See VM.hpp.
// Links: vm/Dispatch.cpp, vm/int_ops.cpp, vm/fp_ops.cpp, vm/mem_ops.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Core VM lifecycle and stepping.
/// @details The stepping controller is a set of thin loops over dispatchOne():
///          step stops after one instruction, step-over once the call depth
///          is back at or above the starting depth, step-out once it drops
///          below it, and continue only on a trap.

#include "vm/VM.hpp"

#include <new>
#include <utility>

namespace wasmdbg::vm
{
namespace
{

/// @brief Publishes a registry view to the VM for one operation.
class WatchScope
{
  public:
    WatchScope(const Breakpoints::View *&slot, const Breakpoints::View &view) : slot_(slot)
    {
        slot_ = &view;
    }

    ~WatchScope()
    {
        slot_ = nullptr;
    }

    WatchScope(const WatchScope &) = delete;
    WatchScope &operator=(const WatchScope &) = delete;

  private:
    const Breakpoints::View *&slot_;
};

} // namespace

VM::VM(CreateKey,
       std::shared_ptr<const wasm::Module> module,
       SharedBreakpoints breakpoints,
       std::shared_ptr<ImportBridge> bridge,
       VMConfig config)
    : module_(std::move(module)), breakpoints_(std::move(breakpoints)), bridge_(std::move(bridge)),
      config_(config), tracer_(config.trace), stack_(config.maxValueStack)
{
}

support::Expected<std::unique_ptr<VM>, InitError> VM::create(std::shared_ptr<const wasm::Module> module,
                                                             SharedBreakpoints breakpoints,
                                                             std::shared_ptr<ImportBridge> bridge,
                                                             VMConfig config)
{
    if (!module)
        return InitError{"no module"};
    if (!breakpoints)
        breakpoints = std::make_shared<Breakpoints>();
    if (!bridge)
        bridge = std::make_shared<DefaultImportBridge>();
    auto vm = std::make_unique<VM>(
        CreateKey{}, std::move(module), std::move(breakpoints), std::move(bridge), config);
    auto ready = vm->instantiate();
    if (!ready)
        return ready.error();
    return vm;
}

support::Expected<wasm::Value, InitError> VM::evalInit(const wasm::InitExpr &expr) const
{
    if (expr.op != wasm::Opcode::GlobalGet)
        return expr.value;
    if (expr.globalIndex >= globals_.size())
        return InitError{"unknown global " + std::to_string(expr.globalIndex) + " in initializer"};
    return globals_[expr.globalIndex];
}

support::Expected<void, InitError> VM::instantiate()
{
    const wasm::Module &m = *module_;

    for (std::size_t i = 0; i < m.globals.size(); ++i)
    {
        const wasm::Global &global = m.globals[i];
        if (global.import)
        {
            globals_.push_back(wasm::Value::defaultFor(global.type));
            continue;
        }
        auto value = evalInit(global.init);
        if (!value)
            return value.error();
        if (value.value().type() != global.type)
            return InitError{"initializer of global " + std::to_string(i) + " has the wrong type"};
        globals_.push_back(value.value());
    }

    for (const auto &memory : m.memories)
    {
        if (memory.limits.min > config_.maxMemoryPages)
            return InitError{"memory too large"};
        try
        {
            memories_.emplace_back(memory.limits, config_.maxMemoryPages);
        }
        catch (const std::bad_alloc &)
        {
            return InitError{"memory too large"};
        }
    }
    for (const auto &table : m.tables)
        tables_.emplace_back(table.limits.min, std::nullopt);

    for (std::size_t i = 0; i < m.data.size(); ++i)
    {
        const wasm::DataSegment &segment = m.data[i];
        if (segment.memoryIndex >= memories_.size())
            return InitError{"data segment " + std::to_string(i) + " refers to a missing memory"};
        auto offset = evalInit(segment.offset);
        if (!offset)
            return offset.error();
        const auto base = offset.value().as<uint32_t>();
        if (!base)
            return InitError{"data segment " + std::to_string(i) + " offset is not i32"};
        if (!memories_[segment.memoryIndex].write(*base, segment.bytes))
            return InitError{"data segment " + std::to_string(i) + " does not fit in memory"};
    }

    for (std::size_t i = 0; i < m.elements.size(); ++i)
    {
        const wasm::ElementSegment &segment = m.elements[i];
        if (segment.tableIndex >= tables_.size())
            return InitError{"element segment " + std::to_string(i) + " refers to a missing table"};
        auto offset = evalInit(segment.offset);
        if (!offset)
            return offset.error();
        const auto base = offset.value().as<uint32_t>();
        if (!base)
            return InitError{"element segment " + std::to_string(i) + " offset is not i32"};
        auto &table = tables_[segment.tableIndex];
        if (*base > table.size() || segment.funcIndices.size() > table.size() - *base)
            return InitError{"element segment " + std::to_string(i) + " does not fit in table"};
        for (std::size_t j = 0; j < segment.funcIndices.size(); ++j)
            table[*base + j] = segment.funcIndices[j];
    }
    return {};
}

void VM::resetExecution()
{
    stack_.clear();
    frames_.clear();
    ip_ = CodePosition{};
    state_ = VMState::Uninitialized;
}

std::optional<Trap> VM::push(wasm::Value value)
{
    if (!stack_.push(value))
        return Trap::of(TrapKind::ValueStackExhausted);
    return std::nullopt;
}

std::optional<Trap> VM::enterEntry(uint32_t funcIndex, std::vector<wasm::Value> args)
{
    ip_ = CodePosition{funcIndex, 0};
    for (const auto &arg : args)
    {
        if (auto trap = push(arg))
            return trap;
    }
    if (module_->functions[funcIndex].isImport())
    {
        if (auto trap = callImport(funcIndex))
            return trap;
        return Trap::finished();
    }
    if (auto trap = callFunction(funcIndex))
        return trap;
    frames_.front().returnAddress = CodePosition{};
    return std::nullopt;
}

Trap VM::settle(Trap trap)
{
    switch (trap.kind)
    {
        case TrapKind::ExecutionFinished:
            state_ = VMState::Finished;
            break;
        case TrapKind::BreakpointReached:
        case TrapKind::WatchpointReached:
            state_ = VMState::Paused;
            break;
        default:
            state_ = VMState::Faulted;
            break;
    }
    return trap;
}

std::optional<Trap> VM::dispatchOne(bool checkBreakpoint)
{
    if (frames_.empty())
        return Trap::finished();
    if (checkBreakpoint && watch_)
    {
        if (auto index = watch_->findCode(ip_))
            return Trap::breakpoint(*index);
    }

    const wasm::Function &fn = module_->functions[ip_.func];
    if (ip_.instr >= fn.code.size())
        return Trap::of(TrapKind::TypeMismatch);
    const wasm::Instr &in = fn.code[ip_.instr];
    tracer_.onStep(ip_.func, ip_.instr, in);

    jumped_ = false;
    auto trap = execute(in);
    if (trap && trap->isFault())
        return trap;
    if (!jumped_)
        ++ip_.instr;
    return trap;
}

std::optional<Trap> VM::execute(const wasm::Instr &in)
{
    using wasm::Opcode;
    const auto byte = static_cast<uint8_t>(in.op);
    if (byte <= static_cast<uint8_t>(Opcode::CallIndirect))
        return execControl(in);
    if (byte <= static_cast<uint8_t>(Opcode::GlobalSet))
        return execVariable(in);
    if (byte <= static_cast<uint8_t>(Opcode::MemoryGrow))
        return execMemory(in);
    if (byte <= static_cast<uint8_t>(Opcode::F64Const))
        return push(in.constant);
    if (byte <= static_cast<uint8_t>(Opcode::I64GeU))
        return execIntOp(in);
    if (byte <= static_cast<uint8_t>(Opcode::F64Ge))
        return execFloatOp(in);
    if (byte <= static_cast<uint8_t>(Opcode::I64Rotr))
        return execIntOp(in);
    if (byte <= static_cast<uint8_t>(Opcode::F64Copysign))
        return execFloatOp(in);
    return execConversion(in);
}

Trap VM::runLoop(bool checkFirst)
{
    state_ = VMState::Running;
    bool check = checkFirst;
    for (;;)
    {
        auto trap = dispatchOne(check);
        check = true;
        if (trap)
            return settle(*trap);
    }
}

std::optional<Trap> VM::start()
{
    const auto entry = module_->entryPoint();
    if (!entry)
        return std::nullopt;
    resetExecution();

    const wasm::FuncType *type = module_->funcType(*entry);
    std::vector<wasm::Value> args;
    if (type)
    {
        for (auto param : type->params)
            args.push_back(wasm::Value::defaultFor(param));
    }

    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    if (auto trap = enterEntry(*entry, std::move(args)))
        return settle(*trap);
    return runLoop(true);
}

std::optional<Trap> VM::run()
{
    return start();
}

support::Expected<Trap, CallError> VM::runFunc(uint32_t funcIndex, const std::vector<wasm::Value> &args)
{
    const wasm::FuncType *type = module_->funcType(funcIndex);
    if (!type)
        return CallError::InvalidFunctionIndex;
    if (args.size() != type->params.size())
        return CallError::InvalidArguments;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type() != type->params[i])
            return CallError::InvalidArguments;
    }

    resetExecution();
    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    if (auto trap = enterEntry(funcIndex, args))
        return settle(*trap);
    return runLoop(true);
}

Trap VM::continueExecution()
{
    if (frames_.empty())
        return settle(Trap::finished());
    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    return runLoop(false);
}

std::optional<Trap> VM::executeStep()
{
    if (frames_.empty())
        return settle(Trap::finished());
    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    state_ = VMState::Running;
    if (auto trap = dispatchOne(false))
        return settle(*trap);
    state_ = VMState::Paused;
    return std::nullopt;
}

std::optional<Trap> VM::executeStepOver()
{
    if (frames_.empty())
        return settle(Trap::finished());
    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    state_ = VMState::Running;
    const std::size_t depth = frames_.size();
    bool check = false;
    for (;;)
    {
        if (auto trap = dispatchOne(check))
            return settle(*trap);
        check = true;
        if (frames_.size() <= depth)
            break;
    }
    state_ = VMState::Paused;
    return std::nullopt;
}

std::optional<Trap> VM::executeStepOut()
{
    if (frames_.empty())
        return settle(Trap::finished());
    auto view = breakpoints_->acquire();
    WatchScope scope(watch_, view);
    state_ = VMState::Running;
    const std::size_t depth = frames_.size();
    bool check = false;
    for (;;)
    {
        if (auto trap = dispatchOne(check))
            return settle(*trap);
        check = true;
        if (frames_.size() < depth)
            break;
    }
    state_ = VMState::Paused;
    return std::nullopt;
}

} // namespace wasmdbg::vm

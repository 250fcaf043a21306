//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Dispatch.cpp
// Purpose: Structured control flow, calls and variable access.
// Key invariants: Branches carry the label's arity of values, drop everything
//                 above the label's entry height and pop the labels they leave.
//                 A branch to a block resumes after its end; a branch to a
//                 loop re-executes the loop instruction. Instructions that
//                 move the ip set jumped_.
// Ownership/Lifetime: Member functions of VM.
// Links: vm/VM.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "vm/OpHelpers.hpp"

#include <iostream>

namespace wasmdbg::vm
{

using wasm::Opcode;
using wasm::Value;

void VM::jumpTo(uint32_t instr)
{
    ip_.instr = instr;
    jumped_ = true;
}

std::optional<Trap> VM::execControl(const wasm::Instr &in)
{
    switch (in.op)
    {
        case Opcode::Unreachable:
            return Trap::of(TrapKind::Unreachable);
        case Opcode::Nop:
            return std::nullopt;
        case Opcode::Block:
        case Opcode::Loop:
        {
            Label label;
            label.isLoop = in.op == Opcode::Loop;
            label.continuation = label.isLoop ? ip_.instr : in.endPc;
            label.arity = (!label.isLoop && in.blockResult) ? 1 : 0;
            label.height = stack_.size();
            currentFrame().labels.push_back(label);
            return std::nullopt;
        }
        case Opcode::If:
        {
            const auto cond = stack_.peekAs<int32_t>(0);
            if (!cond)
                return ops::typeMismatch();
            stack_.pop(1);
            Label label;
            label.continuation = in.endPc;
            label.arity = in.blockResult ? 1 : 0;
            label.height = stack_.size();
            currentFrame().labels.push_back(label);
            if (*cond == 0)
                jumpTo(in.elsePc != wasm::kNoTarget ? in.elsePc + 1 : in.endPc);
            return std::nullopt;
        }
        case Opcode::Else:
            // Reached at the end of the then-arm; the end pops the label.
            jumpTo(in.endPc);
            return std::nullopt;
        case Opcode::End:
        {
            Frame &frame = currentFrame();
            if (frame.labels.empty())
                return returnFromFunction();
            frame.labels.pop_back();
            return std::nullopt;
        }
        case Opcode::Br:
            return branch(in.index);
        case Opcode::BrIf:
        {
            const auto cond = stack_.peekAs<int32_t>(0);
            if (!cond)
                return ops::typeMismatch();
            stack_.pop(1);
            if (*cond == 0)
                return std::nullopt;
            auto trap = branch(in.index);
            if (trap && trap->isFault())
                stack_.restore(Value(*cond));
            return trap;
        }
        case Opcode::BrTable:
        {
            const auto selector = stack_.peekAs<uint32_t>(0);
            if (!selector || in.targets.empty())
                return ops::typeMismatch();
            const std::size_t last = in.targets.size() - 1;
            const uint32_t depth = *selector < last ? in.targets[*selector] : in.targets[last];
            stack_.pop(1);
            auto trap = branch(depth);
            if (trap && trap->isFault())
                stack_.restore(Value(*selector));
            return trap;
        }
        case Opcode::Return:
            return returnFromFunction();
        case Opcode::Call:
            return callFunction(in.index);
        case Opcode::CallIndirect:
            return callIndirect(in);
        default:
            return ops::typeMismatch();
    }
}

std::optional<Trap> VM::branch(uint32_t depth)
{
    Frame &frame = currentFrame();
    if (depth == frame.labels.size())
        return returnFromFunction();
    if (depth > frame.labels.size())
        return ops::typeMismatch();

    const Label label = frame.labels[frame.labels.size() - 1 - depth];
    if (stack_.size() < label.height + label.arity)
        return ops::typeMismatch();

    const auto &values = stack_.values();
    std::vector<Value> carried(values.end() - static_cast<std::ptrdiff_t>(label.arity), values.end());
    stack_.truncate(label.height);
    for (const auto &value : carried)
        stack_.restore(value);
    frame.labels.resize(frame.labels.size() - 1 - depth);
    jumpTo(label.isLoop ? label.continuation : label.continuation + 1);
    return std::nullopt;
}

std::optional<Trap> VM::returnFromFunction()
{
    Frame &frame = currentFrame();
    const wasm::FuncType *type = module_->funcType(frame.funcIndex);
    if (!type)
        return ops::typeMismatch();
    const std::size_t arity = type->results.size();
    if (stack_.available() < arity)
        return ops::typeMismatch();
    for (std::size_t i = 0; i < arity; ++i)
    {
        const auto value = stack_.peek(arity - 1 - i);
        if (!value || value->type() != type->results[i])
            return ops::typeMismatch();
    }

    const auto &values = stack_.values();
    std::vector<Value> results(values.end() - static_cast<std::ptrdiff_t>(arity), values.end());
    stack_.truncate(frame.stackBase);
    for (const auto &value : results)
        stack_.restore(value);

    const CodePosition resume = frame.returnAddress;
    frames_.pop_back();
    jumped_ = true;
    if (frames_.empty())
    {
        stack_.setFloor(0);
        return Trap::finished();
    }
    stack_.setFloor(frames_.back().stackBase);
    ip_ = resume;
    return std::nullopt;
}

std::optional<Trap> VM::callFunction(uint32_t funcIndex)
{
    const wasm::FuncType *type = module_->funcType(funcIndex);
    if (!type)
        return ops::typeMismatch();
    const wasm::Function &fn = module_->functions[funcIndex];
    if (fn.isImport())
        return callImport(funcIndex);
    if (frames_.size() >= config_.maxCallDepth)
        return Trap::of(TrapKind::CallStackExhausted);

    const std::size_t argc = type->params.size();
    if (stack_.available() < argc)
        return ops::typeMismatch();
    for (std::size_t i = 0; i < argc; ++i)
    {
        const auto value = stack_.peek(argc - 1 - i);
        if (!value || value->type() != type->params[i])
            return ops::typeMismatch();
    }

    Frame frame;
    frame.funcIndex = funcIndex;
    const auto &values = stack_.values();
    frame.locals.assign(values.end() - static_cast<std::ptrdiff_t>(argc), values.end());
    for (auto local : fn.locals)
        frame.locals.push_back(Value::defaultFor(local));
    stack_.pop(argc);
    frame.stackBase = stack_.size();
    frame.returnAddress = CodePosition{ip_.func, ip_.instr + 1};

    frames_.push_back(std::move(frame));
    stack_.setFloor(frames_.back().stackBase);
    ip_ = CodePosition{funcIndex, 0};
    jumped_ = true;
    return std::nullopt;
}

std::optional<Trap> VM::callImport(uint32_t funcIndex)
{
    const wasm::Function &fn = module_->functions[funcIndex];
    const wasm::FuncType *type = module_->funcType(funcIndex);
    if (!type || !fn.import)
        return ops::typeMismatch();

    const std::size_t argc = type->params.size();
    if (stack_.available() < argc)
        return ops::typeMismatch();
    ImportCall call;
    call.funcIndex = funcIndex;
    call.module = fn.import->module;
    call.field = fn.import->field;
    for (std::size_t i = 0; i < argc; ++i)
    {
        const auto value = stack_.peek(argc - 1 - i);
        if (!value || value->type() != type->params[i])
            return ops::typeMismatch();
        call.args.push_back(*value);
    }
    call.globals = globals_;
    if (const LinearMemory *memory = defaultMemory())
        call.memory.assign(memory->bytes().begin(), memory->bytes().end());

    const auto reject = [&](const std::string &why)
    {
        std::cerr << "[IMPORT] " << call.module << "." << call.field << " (function " << funcIndex
                  << "): " << why << "\n";
        return Trap::unsupportedImport(funcIndex);
    };

    auto outcome = bridge_->fulfill(call);
    if (!outcome)
        return reject(outcome.error().message);
    ImportResult &result = outcome.value();

    if (type->results.size() > 1)
        return reject("multi-value results are not supported");
    if (type->results.empty() != !result.returnValue.has_value())
        return reject("return value does not match the import's signature");
    if (result.returnValue && result.returnValue->type() != type->results.front())
        return reject("return value has the wrong type");
    if (result.globals.size() != globals_.size())
        return reject("returned globals do not match the module's globals");
    for (std::size_t i = 0; i < globals_.size(); ++i)
    {
        if (result.globals[i].type() != globals_[i].type())
            return reject("returned global " + std::to_string(i) + " has the wrong type");
    }

    stack_.pop(argc);
    if (result.returnValue && !stack_.push(*result.returnValue))
    {
        for (const auto &arg : call.args)
            stack_.restore(arg);
        return Trap::of(TrapKind::ValueStackExhausted);
    }
    globals_ = std::move(result.globals);
    if (!memories_.empty())
        memories_.front().assignPrefix(result.memory);
    return std::nullopt;
}

std::optional<Trap> VM::callIndirect(const wasm::Instr &in)
{
    const auto element = stack_.peekAs<uint32_t>(0);
    if (!element)
        return ops::typeMismatch();
    if (tables_.empty() || *element >= tables_.front().size() || !tables_.front()[*element])
        return Trap::of(TrapKind::UndefinedTableElement);
    if (in.index >= module_->types.size())
        return ops::typeMismatch();

    const uint32_t target = *tables_.front()[*element];
    const wasm::FuncType *actual = module_->funcType(target);
    if (!actual || !(*actual == module_->types[in.index]))
        return Trap::of(TrapKind::IndirectCallTypeMismatch);

    stack_.pop(1);
    auto trap = callFunction(target);
    if (trap && trap->isFault())
        stack_.restore(Value(*element));
    return trap;
}

std::optional<Trap> VM::execVariable(const wasm::Instr &in)
{
    switch (in.op)
    {
        case Opcode::Drop:
            if (stack_.available() < 1)
                return ops::typeMismatch();
            stack_.pop(1);
            return std::nullopt;
        case Opcode::Select:
        {
            const auto cond = stack_.peekAs<int32_t>(0);
            const auto second = stack_.peek(1);
            const auto first = stack_.peek(2);
            if (!cond || !first || !second || first->type() != second->type())
                return ops::typeMismatch();
            stack_.replace(3, *cond != 0 ? *first : *second);
            return std::nullopt;
        }
        case Opcode::LocalGet:
        {
            Frame &frame = currentFrame();
            if (in.index >= frame.locals.size())
                return ops::typeMismatch();
            return push(frame.locals[in.index]);
        }
        case Opcode::LocalSet:
        case Opcode::LocalTee:
        {
            Frame &frame = currentFrame();
            const auto value = stack_.peek(0);
            if (!value || in.index >= frame.locals.size() ||
                value->type() != frame.locals[in.index].type())
                return ops::typeMismatch();
            frame.locals[in.index] = *value;
            if (in.op == Opcode::LocalSet)
                stack_.pop(1);
            return std::nullopt;
        }
        case Opcode::GlobalGet:
        {
            if (in.index >= globals_.size())
                return ops::typeMismatch();
            if (auto trap = push(globals_[in.index]))
                return trap;
            if (watch_)
            {
                if (auto index = watch_->findGlobal(in.index, WatchTrigger::Read))
                    return Trap::watchpoint(*index);
            }
            return std::nullopt;
        }
        case Opcode::GlobalSet:
        {
            const auto value = stack_.peek(0);
            if (!value || in.index >= globals_.size() || value->type() != globals_[in.index].type() ||
                !module_->globals[in.index].isMutable)
                return ops::typeMismatch();
            globals_[in.index] = *value;
            stack_.pop(1);
            if (watch_)
            {
                if (auto index = watch_->findGlobal(in.index, WatchTrigger::Write))
                    return Trap::watchpoint(*index);
            }
            return std::nullopt;
        }
        default:
            return ops::typeMismatch();
    }
}

} // namespace wasmdbg::vm

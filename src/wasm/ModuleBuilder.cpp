//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ModuleBuilder.cpp
// Purpose: Implements ModuleBuilder and the instruction factories.
// Key invariants: Misuse of the builder is a programming error and throws
//                 std::logic_error.
// Ownership/Lifetime: See ModuleBuilder.hpp.
// Links: wasm/ModuleBuilder.hpp
//
//===----------------------------------------------------------------------===//

#include "wasm/ModuleBuilder.hpp"

#include <stdexcept>

namespace wasmdbg::wasm
{

uint32_t ModuleBuilder::addType(const FuncType &type)
{
    for (uint32_t i = 0; i < module_.types.size(); ++i)
    {
        if (module_.types[i] == type)
            return i;
    }
    module_.types.push_back(type);
    return static_cast<uint32_t>(module_.types.size() - 1);
}

uint32_t ModuleBuilder::importFunction(std::string module, std::string field, const FuncType &type)
{
    if (sawDefinedFunction_)
        throw std::logic_error("imports must be declared before defined functions");
    Function fn;
    fn.typeIndex = addType(type);
    fn.import = ImportName{std::move(module), std::move(field)};
    module_.functions.push_back(std::move(fn));
    return static_cast<uint32_t>(module_.functions.size() - 1);
}

uint32_t ModuleBuilder::addFunction(const FuncType &type,
                                    std::vector<ValueType> locals,
                                    std::vector<Instr> body)
{
    Function fn;
    fn.typeIndex = addType(type);
    fn.locals = std::move(locals);
    fn.code = std::move(body);
    fn.code.push_back(Instr::make(Opcode::End));
    auto resolved = resolveControlFlow(fn.code);
    if (!resolved)
        throw std::logic_error("malformed function body: " + resolved.error());
    sawDefinedFunction_ = true;
    module_.functions.push_back(std::move(fn));
    return static_cast<uint32_t>(module_.functions.size() - 1);
}

uint32_t ModuleBuilder::addGlobal(ValueType type, bool isMutable, Value init)
{
    if (init.type() != type)
        throw std::logic_error("global initializer type mismatch");
    Global global;
    global.type = type;
    global.isMutable = isMutable;
    global.init = InitExpr::constant(init);
    module_.globals.push_back(std::move(global));
    return static_cast<uint32_t>(module_.globals.size() - 1);
}

uint32_t ModuleBuilder::addMemory(uint32_t minPages, std::optional<uint32_t> maxPages)
{
    if (!module_.memories.empty())
        throw std::logic_error("a module has at most one memory");
    module_.memories.push_back(Memory{Limits{minPages, maxPages}, std::nullopt});
    return 0;
}

uint32_t ModuleBuilder::addTable(uint32_t minSize, std::optional<uint32_t> maxSize)
{
    module_.tables.push_back(Table{Limits{minSize, maxSize}, std::nullopt});
    return static_cast<uint32_t>(module_.tables.size() - 1);
}

void ModuleBuilder::addData(uint32_t offset, std::vector<uint8_t> bytes)
{
    module_.data.push_back(
        DataSegment{0, InitExpr::constant(Value(offset)), std::move(bytes)});
}

void ModuleBuilder::addElements(uint32_t offset, std::vector<uint32_t> funcIndices)
{
    module_.elements.push_back(
        ElementSegment{0, InitExpr::constant(Value(offset)), std::move(funcIndices)});
}

void ModuleBuilder::exportFunction(std::string name, uint32_t funcIndex)
{
    module_.exports.push_back(Export{std::move(name), ExternalKind::Function, funcIndex});
}

void ModuleBuilder::exportGlobal(std::string name, uint32_t globalIndex)
{
    module_.exports.push_back(Export{std::move(name), ExternalKind::Global, globalIndex});
}

void ModuleBuilder::setStart(uint32_t funcIndex)
{
    module_.start = funcIndex;
}

void ModuleBuilder::addCustomSection(std::string name, std::vector<uint8_t> payload)
{
    module_.customSections.push_back(CustomSection{std::move(name), std::move(payload)});
}

std::shared_ptr<const Module> ModuleBuilder::finish()
{
    return std::make_shared<const Module>(std::move(module_));
}

namespace build
{

Instr op(Opcode opcode)
{
    return Instr::make(opcode);
}

Instr i32(int32_t value)
{
    Instr instr = Instr::make(Opcode::I32Const);
    instr.constant = Value(value);
    return instr;
}

Instr i64(int64_t value)
{
    Instr instr = Instr::make(Opcode::I64Const);
    instr.constant = Value(value);
    return instr;
}

Instr f32(float value)
{
    Instr instr = Instr::make(Opcode::F32Const);
    instr.constant = Value(value);
    return instr;
}

Instr f64(double value)
{
    Instr instr = Instr::make(Opcode::F64Const);
    instr.constant = Value(value);
    return instr;
}

Instr localGet(uint32_t index)
{
    return Instr::withIndex(Opcode::LocalGet, index);
}

Instr localSet(uint32_t index)
{
    return Instr::withIndex(Opcode::LocalSet, index);
}

Instr localTee(uint32_t index)
{
    return Instr::withIndex(Opcode::LocalTee, index);
}

Instr globalGet(uint32_t index)
{
    return Instr::withIndex(Opcode::GlobalGet, index);
}

Instr globalSet(uint32_t index)
{
    return Instr::withIndex(Opcode::GlobalSet, index);
}

Instr call(uint32_t funcIndex)
{
    return Instr::withIndex(Opcode::Call, funcIndex);
}

Instr callIndirect(uint32_t typeIndex)
{
    return Instr::withIndex(Opcode::CallIndirect, typeIndex);
}

Instr br(uint32_t depth)
{
    return Instr::withIndex(Opcode::Br, depth);
}

Instr brIf(uint32_t depth)
{
    return Instr::withIndex(Opcode::BrIf, depth);
}

Instr brTable(std::vector<uint32_t> depths)
{
    Instr instr = Instr::make(Opcode::BrTable);
    instr.targets = std::move(depths);
    return instr;
}

Instr block(std::optional<ValueType> result)
{
    Instr instr = Instr::make(Opcode::Block);
    instr.blockResult = result;
    return instr;
}

Instr loop(std::optional<ValueType> result)
{
    Instr instr = Instr::make(Opcode::Loop);
    instr.blockResult = result;
    return instr;
}

Instr ifOp(std::optional<ValueType> result)
{
    Instr instr = Instr::make(Opcode::If);
    instr.blockResult = result;
    return instr;
}

Instr memOp(Opcode opcode, uint32_t offset)
{
    Instr instr = Instr::make(opcode);
    instr.offset = offset;
    switch (opcode)
    {
        case Opcode::I64Load:
        case Opcode::F64Load:
        case Opcode::I64Store:
        case Opcode::F64Store:
            instr.align = 3;
            break;
        case Opcode::I32Load:
        case Opcode::F32Load:
        case Opcode::I64Load32S:
        case Opcode::I64Load32U:
        case Opcode::I32Store:
        case Opcode::F32Store:
        case Opcode::I64Store32:
            instr.align = 2;
            break;
        case Opcode::I32Load16S:
        case Opcode::I32Load16U:
        case Opcode::I64Load16S:
        case Opcode::I64Load16U:
        case Opcode::I32Store16:
        case Opcode::I64Store16:
            instr.align = 1;
            break;
        default:
            instr.align = 0;
            break;
    }
    return instr;
}

} // namespace build

} // namespace wasmdbg::wasm

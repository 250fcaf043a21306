//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ModuleBuilder.hpp
// Purpose: Programmatic construction of wasm::Module values.
// Key invariants: Imported functions precede defined ones in the index space;
//                 every defined body ends with the function-level `end` and
//                 has resolved control targets.
// Ownership/Lifetime: The builder owns the module until finish() hands it out.
// Links: wasm/Module.hpp
//
//===----------------------------------------------------------------------===//
//
// Typical usage:
//
//   ModuleBuilder b;
//   b.addMemory(1);
//   uint32_t add = b.addFunction({{ValueType::I32, ValueType::I32}, {ValueType::I32}}, {},
//                                {build::localGet(0), build::localGet(1),
//                                 build::op(Opcode::I32Add)});
//   b.exportFunction("main", add);
//   std::shared_ptr<const Module> m = b.finish();
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Module.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wasmdbg::wasm
{

/// @brief Helper to assemble modules without going through the binary format.
class ModuleBuilder
{
  public:
    /// @brief Intern a signature and return its type index.
    uint32_t addType(const FuncType &type);

    /// @brief Declare an imported function.
    /// @throws std::logic_error when called after addFunction().
    uint32_t importFunction(std::string module, std::string field, const FuncType &type);

    /// @brief Define a function.
    /// @param type Signature.
    /// @param locals Declared locals following the parameters.
    /// @param body Instructions without the function-level `end`, which is
    ///             appended here.
    /// @throws std::logic_error if the body's structured control is unbalanced.
    uint32_t addFunction(const FuncType &type, std::vector<ValueType> locals, std::vector<Instr> body);

    uint32_t addGlobal(ValueType type, bool isMutable, Value init);

    uint32_t addMemory(uint32_t minPages, std::optional<uint32_t> maxPages = std::nullopt);

    uint32_t addTable(uint32_t minSize, std::optional<uint32_t> maxSize = std::nullopt);

    void addData(uint32_t offset, std::vector<uint8_t> bytes);

    void addElements(uint32_t offset, std::vector<uint32_t> funcIndices);

    void exportFunction(std::string name, uint32_t funcIndex);

    void exportGlobal(std::string name, uint32_t globalIndex);

    void setStart(uint32_t funcIndex);

    void addCustomSection(std::string name, std::vector<uint8_t> payload);

    /// @brief Access the module under construction.
    Module &module() noexcept
    {
        return module_;
    }

    /// @brief Hand out the finished module for sharing.
    std::shared_ptr<const Module> finish();

  private:
    Module module_;
    bool sawDefinedFunction_ = false;
};

/// @brief Instruction factories for builder bodies.
namespace build
{

Instr op(Opcode opcode);
Instr i32(int32_t value);
Instr i64(int64_t value);
Instr f32(float value);
Instr f64(double value);
Instr localGet(uint32_t index);
Instr localSet(uint32_t index);
Instr localTee(uint32_t index);
Instr globalGet(uint32_t index);
Instr globalSet(uint32_t index);
Instr call(uint32_t funcIndex);
Instr callIndirect(uint32_t typeIndex);
Instr br(uint32_t depth);
Instr brIf(uint32_t depth);

/// @brief br_table with @p depths; the last entry is the default target.
Instr brTable(std::vector<uint32_t> depths);

Instr block(std::optional<ValueType> result = std::nullopt);
Instr loop(std::optional<ValueType> result = std::nullopt);
Instr ifOp(std::optional<ValueType> result = std::nullopt);

/// @brief Load or store with a static @p offset and natural alignment.
Instr memOp(Opcode opcode, uint32_t offset = 0);

} // namespace build

} // namespace wasmdbg::wasm

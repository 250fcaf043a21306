//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Module.hpp
// Purpose: In-memory representation of a decoded WebAssembly module.
// Key invariants: Function indices cover imported functions first, followed
//                 by defined ones, matching the binary index space. Imported
//                 functions have an empty body. Defined bodies end with the
//                 function-level `end` and have resolved control targets.
// Ownership/Lifetime: A Module is built once (by the loader or a
//                     ModuleBuilder) and then shared read-only through
//                     std::shared_ptr<const Module>.
// Links: wasm/ModuleLoader.hpp, wasm/ModuleBuilder.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"
#include "wasm/Instr.hpp"
#include "wasm/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wasmdbg::wasm
{

/// @brief Bytes per linear memory page.
inline constexpr uint32_t kPageSize = 65536;

/// @brief Upper bound on memory pages addressable with 32-bit offsets.
inline constexpr uint32_t kMaxPages = 65536;

/// @brief Function signature.
struct FuncType
{
    std::vector<ValueType> params;
    std::vector<ValueType> results;

    friend bool operator==(const FuncType &lhs, const FuncType &rhs) = default;
};

/// @brief Two-level import name.
struct ImportName
{
    std::string module;
    std::string field;
};

/// @brief Function entry in the module's function index space.
struct Function
{
    uint32_t typeIndex = 0;

    /// @brief Declared locals following the parameters.
    std::vector<ValueType> locals;

    /// @brief Decoded body; empty for imports.
    std::vector<Instr> code;

    /// @brief Import name when the function is provided by the host.
    std::optional<ImportName> import;

    [[nodiscard]] bool isImport() const noexcept
    {
        return import.has_value();
    }
};

/// @brief Size limits for memories and tables.
struct Limits
{
    uint32_t min = 0;
    std::optional<uint32_t> max;
};

/// @brief Constant initializer expression used by globals and segments.
/// @details Either a literal (op is one of the *.const opcodes) or a read of an
///          earlier global (op is GlobalGet and @ref globalIndex is set).
struct InitExpr
{
    Opcode op = Opcode::I32Const;
    Value value;
    uint32_t globalIndex = 0;

    static InitExpr constant(Value v)
    {
        InitExpr expr;
        switch (v.type())
        {
            case ValueType::I32:
                expr.op = Opcode::I32Const;
                break;
            case ValueType::I64:
                expr.op = Opcode::I64Const;
                break;
            case ValueType::F32:
                expr.op = Opcode::F32Const;
                break;
            case ValueType::F64:
                expr.op = Opcode::F64Const;
                break;
        }
        expr.value = v;
        return expr;
    }

    static InitExpr globalGet(uint32_t index)
    {
        InitExpr expr;
        expr.op = Opcode::GlobalGet;
        expr.globalIndex = index;
        return expr;
    }
};

struct Global
{
    ValueType type = ValueType::I32;
    bool isMutable = false;
    InitExpr init;
    std::optional<ImportName> import;
};

struct Memory
{
    Limits limits;
    std::optional<ImportName> import;
};

/// @brief Function reference table (the MVP only knows funcref).
struct Table
{
    Limits limits;
    std::optional<ImportName> import;
};

enum class ExternalKind : uint8_t
{
    Function = 0,
    Table = 1,
    Memory = 2,
    Global = 3,
};

struct Export
{
    std::string name;
    ExternalKind kind = ExternalKind::Function;
    uint32_t index = 0;
};

/// @brief Active element segment initialising a table range.
struct ElementSegment
{
    uint32_t tableIndex = 0;
    InitExpr offset;
    std::vector<uint32_t> funcIndices;
};

/// @brief Active data segment initialising a memory range.
struct DataSegment
{
    uint32_t memoryIndex = 0;
    InitExpr offset;
    std::vector<uint8_t> bytes;
};

/// @brief Custom section kept verbatim.
struct CustomSection
{
    std::string name;
    std::vector<uint8_t> payload;
};

/// @brief Complete decoded module.
struct Module
{
    std::vector<FuncType> types;
    std::vector<Function> functions;
    std::vector<Table> tables;
    std::vector<Memory> memories;
    std::vector<Global> globals;
    std::vector<Export> exports;
    std::vector<ElementSegment> elements;
    std::vector<DataSegment> data;
    std::vector<CustomSection> customSections;
    std::optional<uint32_t> start;

    /// @brief Signature of function @p funcIndex, or nullptr when out of range.
    const FuncType *funcType(uint32_t funcIndex) const;

    /// @brief Find an export by name and kind.
    const Export *findExport(std::string_view name, ExternalKind kind) const;

    /// @brief First custom section called @p name, if any.
    const CustomSection *findCustomSection(std::string_view name) const;

    /// @brief Function executed by `start`/`run`.
    /// @details The start section wins; otherwise the function exported as
    ///          "_start", then the one exported as "main".
    std::optional<uint32_t> entryPoint() const;

    /// @brief True when @p funcIndex is a defined function whose body has an
    ///        instruction at @p instrIndex.
    bool hasInstruction(uint32_t funcIndex, uint32_t instrIndex) const;
};

/// @brief Match block/loop/if with else/end and record their targets.
/// @details The final instruction must be the function-level `end`. Returns a
///          message naming the offending instruction index on imbalance.
support::Expected<void, std::string> resolveControlFlow(std::vector<Instr> &code);

} // namespace wasmdbg::wasm

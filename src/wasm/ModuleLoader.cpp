//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ModuleLoader.cpp
// Purpose: Section-by-section decoder for the WebAssembly binary format.
// Key invariants: Non-custom sections appear at most once and in ascending id
//                 order; each section and function body is consumed exactly.
// Ownership/Lifetime: The decoder owns the Module under construction and
//                     moves it out on success.
// Links: https://webassembly.github.io/spec/core/binary/modules.html
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Binary module decoding.
/// @details Decoding is a single forward pass over the byte buffer.  The
///          BinaryReader records the first failure together with its offset;
///          section decoders check it at every loop iteration so malformed
///          counts never drive long loops.  Index validation that needs
///          information from later sections (exports, start, elements) runs
///          after the pass.

#include "wasm/ModuleLoader.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

namespace wasmdbg::wasm
{
namespace
{

constexpr uint8_t kMagic[4] = {0x00, 0x61, 0x73, 0x6D};
constexpr uint32_t kVersion = 1;
constexpr uint8_t kFuncTypeForm = 0x60;
constexpr uint8_t kFuncRef = 0x70;
constexpr uint8_t kEmptyBlockType = 0x40;
constexpr uint32_t kMaxLocals = 50000;

enum SectionId : uint8_t
{
    kCustomSection = 0,
    kTypeSection = 1,
    kImportSection = 2,
    kFunctionSection = 3,
    kTableSection = 4,
    kMemorySection = 5,
    kGlobalSection = 6,
    kExportSection = 7,
    kStartSection = 8,
    kElementSection = 9,
    kCodeSection = 10,
    kDataSection = 11,
};

class Decoder
{
  public:
    explicit Decoder(std::span<const uint8_t> bytes) : reader_(bytes) {}

    support::Expected<Module, LoadError> decode()
    {
        readHeader();
        uint8_t lastId = 0;
        while (reader_.ok() && !reader_.atLimit())
        {
            const uint8_t id = reader_.readByte();
            const uint32_t size = reader_.readVarU32();
            if (!reader_.ok())
                break;
            if (id != kCustomSection)
            {
                if (id > kDataSection)
                {
                    reader_.fail("unknown section id " + std::to_string(id));
                    break;
                }
                if (id <= lastId)
                {
                    reader_.fail("section out of order or duplicated");
                    break;
                }
                lastId = id;
            }
            const std::size_t outer = reader_.pushLimit(size);
            if (!reader_.ok())
                break;
            readSection(id);
            if (reader_.ok() && !reader_.atLimit())
                reader_.fail("section size mismatch");
            reader_.restoreLimit(outer);
        }
        if (reader_.ok() && definedFunctions_ != bodiesRead_)
            reader_.fail("function and code section have inconsistent lengths");
        if (reader_.ok())
            validateIndices();
        if (!reader_.ok())
            return *reader_.error();
        return std::move(module_);
    }

  private:
    void readHeader()
    {
        auto magic = reader_.readBytes(4);
        if (!reader_.ok() || !std::equal(magic.begin(), magic.end(), std::begin(kMagic)))
        {
            reader_.fail("magic header not detected");
            return;
        }
        if (reader_.readFixedU32() != kVersion && reader_.ok())
            reader_.fail("unknown binary version");
    }

    void readSection(uint8_t id)
    {
        switch (id)
        {
            case kCustomSection:
                readCustom();
                break;
            case kTypeSection:
                readTypes();
                break;
            case kImportSection:
                readImports();
                break;
            case kFunctionSection:
                readFunctions();
                break;
            case kTableSection:
                readTables();
                break;
            case kMemorySection:
                readMemories();
                break;
            case kGlobalSection:
                readGlobals();
                break;
            case kExportSection:
                readExports();
                break;
            case kStartSection:
                module_.start = reader_.readVarU32();
                break;
            case kElementSection:
                readElements();
                break;
            case kCodeSection:
                readCode();
                break;
            case kDataSection:
                readData();
                break;
            default:
                break;
        }
    }

    ValueType readValueType()
    {
        const uint8_t byte = reader_.readByte();
        switch (byte)
        {
            case static_cast<uint8_t>(ValueType::I32):
            case static_cast<uint8_t>(ValueType::I64):
            case static_cast<uint8_t>(ValueType::F32):
            case static_cast<uint8_t>(ValueType::F64):
                return static_cast<ValueType>(byte);
            default:
                reader_.fail("invalid value type");
                return ValueType::I32;
        }
    }

    Limits readLimits()
    {
        Limits limits;
        const uint8_t flags = reader_.readByte();
        if (flags > 1)
        {
            reader_.fail("invalid limits flags");
            return limits;
        }
        limits.min = reader_.readVarU32();
        if (flags == 1)
        {
            limits.max = reader_.readVarU32();
            if (reader_.ok() && *limits.max < limits.min)
                reader_.fail("size minimum must not be greater than maximum");
        }
        return limits;
    }

    Limits readMemoryLimits()
    {
        Limits limits = readLimits();
        if (reader_.ok() && (limits.min > kMaxPages || (limits.max && *limits.max > kMaxPages)))
            reader_.fail("memory size must be at most 65536 pages (4GiB)");
        return limits;
    }

    Limits readTableType()
    {
        if (reader_.readByte() != kFuncRef && reader_.ok())
            reader_.fail("only funcref tables are supported");
        return readLimits();
    }

    bool readMutability()
    {
        const uint8_t flag = reader_.readByte();
        if (flag > 1)
            reader_.fail("invalid mutability");
        return flag == 1;
    }

    InitExpr readInitExpr()
    {
        InitExpr expr;
        const uint8_t byte = reader_.readByte();
        switch (byte)
        {
            case static_cast<uint8_t>(Opcode::I32Const):
                expr = InitExpr::constant(Value(reader_.readVarS32()));
                break;
            case static_cast<uint8_t>(Opcode::I64Const):
                expr = InitExpr::constant(Value(reader_.readVarS64()));
                break;
            case static_cast<uint8_t>(Opcode::F32Const):
                expr = InitExpr::constant(Value(F32::fromBits(reader_.readFixedU32())));
                break;
            case static_cast<uint8_t>(Opcode::F64Const):
                expr = InitExpr::constant(Value(F64::fromBits(reader_.readFixedU64())));
                break;
            case static_cast<uint8_t>(Opcode::GlobalGet):
                expr = InitExpr::globalGet(reader_.readVarU32());
                break;
            default:
                reader_.fail("constant expression required");
                return expr;
        }
        if (reader_.readByte() != static_cast<uint8_t>(Opcode::End) && reader_.ok())
            reader_.fail("constant expression must end with 'end'");
        return expr;
    }

    void readCustom()
    {
        CustomSection section;
        section.name = reader_.readName();
        auto payload = reader_.readBytes(reader_.remaining());
        section.payload.assign(payload.begin(), payload.end());
        if (reader_.ok())
            module_.customSections.push_back(std::move(section));
    }

    void readTypes()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            if (reader_.readByte() != kFuncTypeForm)
            {
                reader_.fail("malformed function type");
                return;
            }
            FuncType type;
            const uint32_t params = reader_.readCount();
            for (uint32_t p = 0; p < params && reader_.ok(); ++p)
                type.params.push_back(readValueType());
            const uint32_t results = reader_.readCount();
            for (uint32_t r = 0; r < results && reader_.ok(); ++r)
                type.results.push_back(readValueType());
            module_.types.push_back(std::move(type));
        }
    }

    void readImports()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            ImportName name;
            name.module = reader_.readName();
            name.field = reader_.readName();
            const uint8_t kind = reader_.readByte();
            switch (kind)
            {
                case static_cast<uint8_t>(ExternalKind::Function):
                {
                    Function fn;
                    fn.typeIndex = reader_.readVarU32();
                    if (reader_.ok() && fn.typeIndex >= module_.types.size())
                        reader_.fail("unknown type " + std::to_string(fn.typeIndex));
                    fn.import = std::move(name);
                    module_.functions.push_back(std::move(fn));
                    break;
                }
                case static_cast<uint8_t>(ExternalKind::Table):
                    module_.tables.push_back(Table{readTableType(), std::move(name)});
                    break;
                case static_cast<uint8_t>(ExternalKind::Memory):
                    module_.memories.push_back(Memory{readMemoryLimits(), std::move(name)});
                    break;
                case static_cast<uint8_t>(ExternalKind::Global):
                {
                    Global global;
                    global.type = readValueType();
                    global.isMutable = readMutability();
                    global.init = InitExpr::constant(Value::defaultFor(global.type));
                    global.import = std::move(name);
                    module_.globals.push_back(std::move(global));
                    break;
                }
                default:
                    reader_.fail("malformed import kind");
                    return;
            }
        }
    }

    void readFunctions()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            Function fn;
            fn.typeIndex = reader_.readVarU32();
            if (reader_.ok() && fn.typeIndex >= module_.types.size())
                reader_.fail("unknown type " + std::to_string(fn.typeIndex));
            module_.functions.push_back(std::move(fn));
            ++definedFunctions_;
        }
    }

    void readTables()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
            module_.tables.push_back(Table{readTableType(), std::nullopt});
    }

    void readMemories()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
            module_.memories.push_back(Memory{readMemoryLimits(), std::nullopt});
        if (reader_.ok() && module_.memories.size() > 1)
            reader_.fail("multiple memories");
    }

    void readGlobals()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            Global global;
            global.type = readValueType();
            global.isMutable = readMutability();
            global.init = readInitExpr();
            module_.globals.push_back(std::move(global));
        }
    }

    void readExports()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            Export exp;
            exp.name = reader_.readName();
            const uint8_t kind = reader_.readByte();
            if (kind > static_cast<uint8_t>(ExternalKind::Global))
            {
                reader_.fail("malformed export kind");
                return;
            }
            exp.kind = static_cast<ExternalKind>(kind);
            exp.index = reader_.readVarU32();
            module_.exports.push_back(std::move(exp));
        }
    }

    void readElements()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            ElementSegment segment;
            segment.tableIndex = reader_.readVarU32();
            if (reader_.ok() && segment.tableIndex != 0)
            {
                reader_.fail("only active element segments for table 0 are supported");
                return;
            }
            segment.offset = readInitExpr();
            const uint32_t funcs = reader_.readCount();
            for (uint32_t f = 0; f < funcs && reader_.ok(); ++f)
                segment.funcIndices.push_back(reader_.readVarU32());
            module_.elements.push_back(std::move(segment));
        }
    }

    void readData()
    {
        const uint32_t count = reader_.readCount();
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            DataSegment segment;
            segment.memoryIndex = reader_.readVarU32();
            if (reader_.ok() && segment.memoryIndex != 0)
            {
                reader_.fail("only active data segments for memory 0 are supported");
                return;
            }
            segment.offset = readInitExpr();
            const uint32_t size = reader_.readCount();
            auto bytes = reader_.readBytes(size);
            segment.bytes.assign(bytes.begin(), bytes.end());
            module_.data.push_back(std::move(segment));
        }
    }

    void readCode()
    {
        const uint32_t count = reader_.readCount();
        if (reader_.ok() && count != definedFunctions_)
        {
            reader_.fail("function and code section have inconsistent lengths");
            return;
        }
        const std::size_t firstDefined = module_.functions.size() - definedFunctions_;
        for (uint32_t i = 0; i < count && reader_.ok(); ++i)
        {
            const uint32_t size = reader_.readVarU32();
            const std::size_t outer = reader_.pushLimit(size);
            if (!reader_.ok())
                return;
            readBody(module_.functions[firstDefined + i]);
            reader_.restoreLimit(outer);
            ++bodiesRead_;
        }
    }

    void readBody(Function &fn)
    {
        const uint32_t groups = reader_.readCount();
        uint64_t total = 0;
        for (uint32_t g = 0; g < groups && reader_.ok(); ++g)
        {
            const uint32_t n = reader_.readVarU32();
            total += n;
            if (total > kMaxLocals)
            {
                reader_.fail("too many locals");
                return;
            }
            const ValueType type = readValueType();
            fn.locals.insert(fn.locals.end(), n, type);
        }

        while (reader_.ok() && !reader_.atLimit())
            fn.code.push_back(readInstr());
        if (!reader_.ok())
            return;
        if (fn.code.empty() || fn.code.back().op != Opcode::End)
        {
            reader_.fail("function body must end with 'end'");
            return;
        }
        auto resolved = resolveControlFlow(fn.code);
        if (!resolved)
            reader_.fail(resolved.error());
    }

    std::optional<ValueType> readBlockType()
    {
        const uint8_t byte = reader_.readByte();
        if (byte == kEmptyBlockType)
            return std::nullopt;
        switch (byte)
        {
            case static_cast<uint8_t>(ValueType::I32):
            case static_cast<uint8_t>(ValueType::I64):
            case static_cast<uint8_t>(ValueType::F32):
            case static_cast<uint8_t>(ValueType::F64):
                return static_cast<ValueType>(byte);
            default:
                if (reader_.ok())
                    reader_.fail("multi-value block types are not supported");
                return std::nullopt;
        }
    }

    void readReservedZero()
    {
        if (reader_.readByte() != 0 && reader_.ok())
            reader_.fail("zero byte expected");
    }

    Instr readInstr()
    {
        const uint8_t byte = reader_.readByte();
        Instr instr;
        if (!reader_.ok())
            return instr;
        const auto op = decodeOpcode(byte);
        if (!op)
        {
            reader_.fail("illegal opcode " + std::to_string(byte));
            return instr;
        }
        instr.op = *op;
        switch (immediateKind(instr.op))
        {
            case ImmediateKind::None:
                break;
            case ImmediateKind::BlockType:
                instr.blockResult = readBlockType();
                break;
            case ImmediateKind::Label:
            case ImmediateKind::Index:
                instr.index = reader_.readVarU32();
                break;
            case ImmediateKind::LabelTable:
            {
                const uint32_t count = reader_.readCount();
                for (uint32_t i = 0; i < count && reader_.ok(); ++i)
                    instr.targets.push_back(reader_.readVarU32());
                instr.targets.push_back(reader_.readVarU32());
                break;
            }
            case ImmediateKind::CallIndirect:
                instr.index = reader_.readVarU32();
                readReservedZero();
                break;
            case ImmediateKind::MemArg:
                instr.align = reader_.readVarU32();
                instr.offset = reader_.readVarU32();
                break;
            case ImmediateKind::MemoryIndex:
                readReservedZero();
                break;
            case ImmediateKind::ConstI32:
                instr.constant = Value(reader_.readVarS32());
                break;
            case ImmediateKind::ConstI64:
                instr.constant = Value(reader_.readVarS64());
                break;
            case ImmediateKind::ConstF32:
                instr.constant = Value(F32::fromBits(reader_.readFixedU32()));
                break;
            case ImmediateKind::ConstF64:
                instr.constant = Value(F64::fromBits(reader_.readFixedU64()));
                break;
        }
        return instr;
    }

    void validateIndices()
    {
        const auto funcCount = module_.functions.size();
        for (const auto &exp : module_.exports)
        {
            std::size_t limit = 0;
            switch (exp.kind)
            {
                case ExternalKind::Function:
                    limit = funcCount;
                    break;
                case ExternalKind::Table:
                    limit = module_.tables.size();
                    break;
                case ExternalKind::Memory:
                    limit = module_.memories.size();
                    break;
                case ExternalKind::Global:
                    limit = module_.globals.size();
                    break;
            }
            if (exp.index >= limit)
            {
                reader_.fail("export '" + exp.name + "' refers to an unknown index");
                return;
            }
        }
        if (module_.start && *module_.start >= funcCount)
        {
            reader_.fail("unknown start function");
            return;
        }
        if (!module_.elements.empty() && module_.tables.empty())
        {
            reader_.fail("element segment without a table");
            return;
        }
        for (const auto &segment : module_.elements)
        {
            for (uint32_t index : segment.funcIndices)
            {
                if (index >= funcCount)
                {
                    reader_.fail("element segment refers to unknown function");
                    return;
                }
            }
        }
        if (!module_.data.empty() && module_.memories.empty())
            reader_.fail("data segment without a memory");
    }

    BinaryReader reader_;
    Module module_;
    uint32_t definedFunctions_ = 0;
    uint32_t bodiesRead_ = 0;
};

} // namespace

support::Expected<Module, LoadError> loadModule(std::span<const uint8_t> bytes)
{
    Decoder decoder(bytes);
    return decoder.decode();
}

support::Expected<Module, LoadError> loadModuleFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return LoadError{"cannot open '" + path + "'", 0};
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return LoadError{"error reading '" + path + "'", 0};
    return loadModule(bytes);
}

} // namespace wasmdbg::wasm

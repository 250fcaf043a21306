//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/DebugInfo.cpp
// Purpose: Parse module, function and local names from the name section.
// Key invariants: Unknown subsections are skipped; any decoding failure
//                 discards everything parsed so far.
// Ownership/Lifetime: See DebugInfo.hpp.
// Links: wasm/DebugInfo.hpp
//
//===----------------------------------------------------------------------===//

#include "wasm/DebugInfo.hpp"

#include "wasm/BinaryReader.hpp"

#include <iostream>

namespace wasmdbg::wasm
{
namespace
{

constexpr uint8_t kModuleNameSubsection = 0;
constexpr uint8_t kFunctionNamesSubsection = 1;
constexpr uint8_t kLocalNamesSubsection = 2;

} // namespace

DebugInfo DebugInfo::fromModule(const Module &module)
{
    DebugInfo info;
    const CustomSection *section = module.findCustomSection("name");
    if (!section)
        return info;

    BinaryReader reader(section->payload);
    while (reader.ok() && !reader.atLimit())
    {
        const uint8_t id = reader.readByte();
        const uint32_t size = reader.readVarU32();
        const std::size_t outer = reader.pushLimit(size);
        if (!reader.ok())
            break;
        switch (id)
        {
            case kModuleNameSubsection:
                info.moduleName_ = reader.readName();
                break;
            case kFunctionNamesSubsection:
            {
                const uint32_t count = reader.readCount();
                for (uint32_t i = 0; i < count && reader.ok(); ++i)
                {
                    const uint32_t index = reader.readVarU32();
                    info.functionNames_[index] = reader.readName();
                }
                break;
            }
            case kLocalNamesSubsection:
            {
                const uint32_t funcs = reader.readCount();
                for (uint32_t i = 0; i < funcs && reader.ok(); ++i)
                {
                    const uint32_t func = reader.readVarU32();
                    const uint32_t locals = reader.readCount();
                    for (uint32_t l = 0; l < locals && reader.ok(); ++l)
                    {
                        const uint32_t local = reader.readVarU32();
                        info.localNames_[{func, local}] = reader.readName();
                    }
                }
                break;
            }
            default:
                reader.readBytes(reader.remaining());
                break;
        }
        if (reader.ok() && !reader.atLimit())
            reader.fail("name subsection size mismatch");
        reader.restoreLimit(outer);
    }

    if (!reader.ok())
    {
        std::cerr << "[DEBUG] ignoring malformed name section: " << toString(*reader.error())
                  << "\n";
        return DebugInfo();
    }
    return info;
}

std::optional<std::string> DebugInfo::functionName(uint32_t funcIndex) const
{
    auto it = functionNames_.find(funcIndex);
    if (it == functionNames_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> DebugInfo::localName(uint32_t funcIndex, uint32_t localIndex) const
{
    auto it = localNames_.find({funcIndex, localIndex});
    if (it == localNames_.end())
        return std::nullopt;
    return it->second;
}

} // namespace wasmdbg::wasm

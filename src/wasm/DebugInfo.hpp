//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/DebugInfo.hpp
// Purpose: Symbol names recovered from the "name" custom section.
// Key invariants: Purely informational; execution never consults it. A
//                 malformed name section yields an empty table.
// Ownership/Lifetime: Value type owned by the debugger session.
// Links: https://webassembly.github.io/spec/core/appendix/custom.html
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Module.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace wasmdbg::wasm
{

class DebugInfo
{
  public:
    DebugInfo() = default;

    /// @brief Build the table from @p module's name section, if present.
    static DebugInfo fromModule(const Module &module);

    std::optional<std::string> functionName(uint32_t funcIndex) const;

    std::optional<std::string> localName(uint32_t funcIndex, uint32_t localIndex) const;

    /// @brief Name of the module itself (subsection 0), if recorded.
    const std::optional<std::string> &moduleName() const noexcept
    {
        return moduleName_;
    }

    bool empty() const noexcept
    {
        return functionNames_.empty() && localNames_.empty() && !moduleName_;
    }

  private:
    std::optional<std::string> moduleName_;
    std::unordered_map<uint32_t, std::string> functionNames_;
    std::map<std::pair<uint32_t, uint32_t>, std::string> localNames_;
};

} // namespace wasmdbg::wasm

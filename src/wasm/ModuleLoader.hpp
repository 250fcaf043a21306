//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ModuleLoader.hpp
// Purpose: Decode WebAssembly binaries into wasm::Module.
// Key invariants: A successful load yields resolved control flow for every
//                 defined function and in-range type, function, table,
//                 memory and global indices in every section. Instruction
//                 operand types are not validated; the VM traps on mismatch.
// Ownership/Lifetime: Returned modules are owned by the caller.
// Links: wasm/Module.hpp, wasm/BinaryReader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"
#include "wasm/BinaryReader.hpp"
#include "wasm/Module.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace wasmdbg::wasm
{

/// @brief Decode an in-memory binary.
support::Expected<Module, LoadError> loadModule(std::span<const uint8_t> bytes);

/// @brief Read @p path and decode it.
/// @details An unreadable file is reported as a LoadError at offset 0.
support::Expected<Module, LoadError> loadModuleFile(const std::string &path);

} // namespace wasmdbg::wasm

//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/DebuggerConfig.hpp
// Purpose: Session-level configuration: VM limits, the host import bridge
//          and the import call timeout.
// Key invariants: A zero timeout disables the timed bridge wrapper.
// Ownership/Lifetime: Copied into each Debugger; the bridge is shared.
// Links: vm/VMConfig.hpp, vm/ImportBridge.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/ImportBridge.hpp"
#include "vm/VMConfig.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace wasmdbg::debugger
{

inline constexpr std::chrono::milliseconds kDefaultImportTimeout{30000};

/// @brief Largest accepted import timeout, in milliseconds.
inline constexpr uint64_t kMaxImportTimeoutMs = UINT32_MAX;

/// @brief Parse a decimal millisecond count; 0 disables the timeout.
/// @return std::nullopt for signs, trailing text or values above kMaxImportTimeoutMs.
std::optional<std::chrono::milliseconds> parseImportTimeout(std::string_view text);

struct DebuggerConfig
{
    vm::VMConfig vm;                                      ///< Limits and tracing for every VM.
    std::chrono::milliseconds importTimeout = kDefaultImportTimeout;
    std::shared_ptr<vm::ImportBridge> bridge;             ///< Host bridge; null fails every import.

    /// @brief Apply vm.applyEnvironment() and WASMDBG_IMPORT_TIMEOUT_MS.
    void applyEnvironment();

    /// @brief Bridge handed to new VMs: bridge wrapped by the timeout.
    /// @details A missing or default bridge fails every call at once and is
    ///          never wrapped.
    std::shared_ptr<vm::ImportBridge> makeBridge() const;
};

} // namespace wasmdbg::debugger

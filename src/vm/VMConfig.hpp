//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/VMConfig.hpp
// Purpose: Runtime limits and tracing options for a VM instance.
// Key invariants: Limits are positive; a zero override from the environment
//                 is ignored.
// Ownership/Lifetime: Plain value type copied into each VM.
// Links: vm/VM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Trace.hpp"
#include "wasm/Module.hpp"

#include <cstddef>
#include <cstdint>

namespace wasmdbg::vm
{

/// @brief Default bound on nested calls before CallStackExhausted.
inline constexpr uint32_t kDefaultMaxCallDepth = 1024;

/// @brief Default bound on value stack entries before ValueStackExhausted.
inline constexpr std::size_t kDefaultMaxValueStack = std::size_t{1} << 20;

struct VMConfig
{
    TraceConfig trace;                                 ///< Instruction tracing.
    uint32_t maxCallDepth = kDefaultMaxCallDepth;      ///< Frame limit.
    std::size_t maxValueStack = kDefaultMaxValueStack; ///< Value stack limit.
    uint32_t maxMemoryPages = wasm::kMaxPages;         ///< Host cap on linear memory.

    /// @brief Apply WASMDBG_TRACE and WASMDBG_MAX_CALL_DEPTH overrides.
    /// @details WASMDBG_TRACE accepts 1/true/on and 0/false/off; other values
    ///          keep the current setting. WASMDBG_MAX_CALL_DEPTH must be a
    ///          positive decimal integer.
    void applyEnvironment();
};

} // namespace wasmdbg::vm

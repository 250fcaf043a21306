//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/DebuggerError.hpp
// Purpose: Administrative failures reported by debugger session operations.
// Key invariants: An operation that returns a DebuggerError has not mutated
//                 the session.
// Ownership/Lifetime: Plain value type.
// Links: include/wasmdbg/debugger/Debugger.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace wasmdbg::debugger
{

enum class DebuggerErrorKind : uint8_t
{
    InitError,
    NoFileLoaded,
    NoRunningInstance,
    NoMemory,
    InvalidBreakpointPosition,
    InvalidWatchpointGlobal,
    Unimplemented,
    InvalidFunctionIndex,
    InvalidArguments,
    InvalidFrameDepth,
};

struct DebuggerError
{
    DebuggerErrorKind kind = DebuggerErrorKind::Unimplemented;
    std::string detail; ///< Extra context; only InitError carries one today.

    static DebuggerError of(DebuggerErrorKind kind)
    {
        return DebuggerError{kind, {}};
    }

    static DebuggerError initError(std::string why)
    {
        return DebuggerError{DebuggerErrorKind::InitError, std::move(why)};
    }
};

/// @brief Stable enumerator name, e.g. "NoFileLoaded".
std::string_view toString(DebuggerErrorKind kind) noexcept;

/// @brief User-facing message, e.g. "No binary file loaded".
std::string toString(const DebuggerError &error);

/// @brief Result type of every session operation.
template <typename T> using Result = support::Expected<T, DebuggerError>;

} // namespace wasmdbg::debugger

//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/DebuggerError.cpp
// Purpose: Formatting for debugger session errors.
// Key invariants: Messages are stable; the shell and tests match on them.
// Ownership/Lifetime: Stateless helpers.
// Links: debugger/DebuggerError.hpp
//
//===----------------------------------------------------------------------===//

#include "debugger/DebuggerError.hpp"

namespace wasmdbg::debugger
{

std::string_view toString(DebuggerErrorKind kind) noexcept
{
    switch (kind)
    {
        case DebuggerErrorKind::InitError:
            return "InitError";
        case DebuggerErrorKind::NoFileLoaded:
            return "NoFileLoaded";
        case DebuggerErrorKind::NoRunningInstance:
            return "NoRunningInstance";
        case DebuggerErrorKind::NoMemory:
            return "NoMemory";
        case DebuggerErrorKind::InvalidBreakpointPosition:
            return "InvalidBreakpointPosition";
        case DebuggerErrorKind::InvalidWatchpointGlobal:
            return "InvalidWatchpointGlobal";
        case DebuggerErrorKind::Unimplemented:
            return "Unimplemented";
        case DebuggerErrorKind::InvalidFunctionIndex:
            return "InvalidFunctionIndex";
        case DebuggerErrorKind::InvalidArguments:
            return "InvalidArguments";
        case DebuggerErrorKind::InvalidFrameDepth:
            return "InvalidFrameDepth";
    }
    return "Unknown";
}

std::string toString(const DebuggerError &error)
{
    switch (error.kind)
    {
        case DebuggerErrorKind::InitError:
            return "Failed to initialize wasm instance: " + error.detail;
        case DebuggerErrorKind::NoFileLoaded:
            return "No binary file loaded";
        case DebuggerErrorKind::NoRunningInstance:
            return "The binary is not being run";
        case DebuggerErrorKind::NoMemory:
            return "No memory present";
        case DebuggerErrorKind::InvalidBreakpointPosition:
            return "Invalid breakpoint position";
        case DebuggerErrorKind::InvalidWatchpointGlobal:
            return "Invalid global for watchpoint";
        case DebuggerErrorKind::Unimplemented:
            return "This feature is still unimplemented";
        case DebuggerErrorKind::InvalidFunctionIndex:
            return "Invalid function index";
        case DebuggerErrorKind::InvalidArguments:
            return "Invalid arguments";
        case DebuggerErrorKind::InvalidFrameDepth:
            return "Invalid frame depth";
    }
    return "Unknown debugger error";
}

} // namespace wasmdbg::debugger

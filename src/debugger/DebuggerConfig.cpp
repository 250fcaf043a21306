//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/DebuggerConfig.cpp
// Purpose: Environment overrides and bridge assembly for DebuggerConfig.
// Key invariants: Malformed environment values leave the setting unchanged.
// Ownership/Lifetime: See DebuggerConfig.hpp.
// Links: debugger/DebuggerConfig.hpp
//
//===----------------------------------------------------------------------===//

#include "debugger/DebuggerConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace wasmdbg::debugger
{

std::optional<std::chrono::milliseconds> parseImportTimeout(std::string_view text)
{
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
        return std::nullopt;
    const std::string digits(text);
    char *end = nullptr;
    const unsigned long long n = std::strtoull(digits.c_str(), &end, 10);
    if (!end || *end != '\0' || n > kMaxImportTimeoutMs)
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<int64_t>(n));
}

void DebuggerConfig::applyEnvironment()
{
    vm.applyEnvironment();
    if (const char *envTimeout = std::getenv("WASMDBG_IMPORT_TIMEOUT_MS"))
    {
        if (const auto timeout = parseImportTimeout(envTimeout))
            importTimeout = *timeout;
    }
}

std::shared_ptr<vm::ImportBridge> DebuggerConfig::makeBridge() const
{
    if (!bridge)
        return std::make_shared<vm::DefaultImportBridge>();
    if (importTimeout.count() <= 0 || std::dynamic_pointer_cast<vm::DefaultImportBridge>(bridge))
        return bridge;
    return std::make_shared<vm::TimedImportBridge>(bridge, importTimeout);
}

} // namespace wasmdbg::debugger

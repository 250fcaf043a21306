//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/VMConfig.cpp
// Purpose: Environment overrides for VM configuration.
// Key invariants: Malformed values leave the configuration unchanged.
// Ownership/Lifetime: Stateless.
// Links: vm/VMConfig.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/VMConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace wasmdbg::vm
{

void VMConfig::applyEnvironment()
{
    if (const char *envTrace = std::getenv("WASMDBG_TRACE"))
    {
        std::string v{envTrace};
        std::transform(v.begin(),
                       v.end(),
                       v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "0" || v == "false" || v == "off")
            trace.mode = TraceConfig::Off;
        else if (v == "1" || v == "true" || v == "on")
            trace.mode = TraceConfig::Instructions;
    }
    if (const char *envDepth = std::getenv("WASMDBG_MAX_CALL_DEPTH"))
    {
        char *end = nullptr;
        unsigned long n = std::strtoul(envDepth, &end, 10);
        if (end && *end == '\0' && n > 0 && n <= UINT32_MAX)
            maxCallDepth = static_cast<uint32_t>(n);
    }
}

} // namespace wasmdbg::vm

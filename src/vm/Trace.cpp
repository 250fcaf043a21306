// File: src/vm/Trace.cpp
// Purpose: Implements tracing sink for VM instruction steps.
// Key invariants: Each call to onStep writes at most one complete line.
// Ownership/Lifetime: See Trace.hpp.
// Links: vm/Trace.hpp

#include "vm/Trace.hpp"

#include "wasm/Instr.hpp"

#include <iostream>

namespace wasmdbg::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

void TraceSink::onStep(uint32_t func, uint32_t instr, const wasm::Instr &in)
{
    if (!cfg.enabled())
        return;
    std::ostream &os = cfg.out ? *cfg.out : std::cerr;
    os << "[TRACE] f" << func << ":#" << instr << ' ' << wasm::formatInstr(in) << '\n';
}

} // namespace wasmdbg::vm

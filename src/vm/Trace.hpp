// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented, one line per
//                 dispatched instruction.
// Ownership/Lifetime: Sink holds configuration by value; the output stream is
//                     borrowed and must outlive the sink.
// Links: vm/VMConfig.hpp
#pragma once

#include <cstdint>
#include <iosfwd>

namespace wasmdbg::wasm
{
struct Instr;
} // namespace wasmdbg::wasm

namespace wasmdbg::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,         ///< Tracing disabled
        Instructions ///< Trace every dispatched instruction
    } mode{Off};

    /// @brief Destination stream; nullptr selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record dispatch of @p in at function @p func, index @p instr.
    /// @details Emits "[TRACE] f<func>:#<instr> <disassembly>" when enabled.
    void onStep(uint32_t func, uint32_t instr, const wasm::Instr &in);

  private:
    TraceConfig cfg; ///< Active configuration
};

} // namespace wasmdbg::vm

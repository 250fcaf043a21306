//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ImportBridge.hpp
// Purpose: Contract through which the VM delegates calls to imported
//          functions, plus the stock implementations.
// Key invariants: fulfill() is synchronous; the VM is blocked until it
//                 returns. On success the VM writes back the returned globals
//                 and memory image; on failure it leaves all state untouched
//                 and traps with UnsupportedImportCall.
// Ownership/Lifetime: Bridges are shared with the VM by std::shared_ptr.
//                     TimedImportBridge keeps the wrapped bridge alive until
//                     every worker it started has finished.
// Links: vm/VM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"
#include "wasm/Value.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wasmdbg::vm
{

/// @brief Snapshot handed to a bridge for one imported call.
struct ImportCall
{
    uint32_t funcIndex = 0;
    std::string module;
    std::string field;
    std::vector<wasm::Value> args;
    std::vector<wasm::Value> globals;
    std::vector<uint8_t> memory; ///< Default memory image; empty without memory.
};

/// @brief State the bridge hands back after a successful call.
struct ImportResult
{
    std::optional<wasm::Value> returnValue;
    std::vector<wasm::Value> globals;
    std::vector<uint8_t> memory;
};

struct BridgeError
{
    std::string message;
};

/// @brief Abstract fulfiller of imported function calls.
class ImportBridge
{
  public:
    virtual ~ImportBridge() = default;

    /// @brief Perform @p call and return the updated state.
    virtual support::Expected<ImportResult, BridgeError> fulfill(const ImportCall &call) = 0;
};

/// @brief Bridge that rejects every call.
class DefaultImportBridge final : public ImportBridge
{
  public:
    support::Expected<ImportResult, BridgeError> fulfill(const ImportCall &call) override;
};

/// @brief Bridge dispatching to host callbacks.
/// @details A handler registered for the function index wins over one
///          registered for the "module.field" name.
class HostImportBridge final : public ImportBridge
{
  public:
    using Handler = std::function<support::Expected<ImportResult, BridgeError>(const ImportCall &)>;

    void registerHandler(std::string module, std::string field, Handler handler);

    void registerHandler(uint32_t funcIndex, Handler handler);

    support::Expected<ImportResult, BridgeError> fulfill(const ImportCall &call) override;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> byName_;
    std::unordered_map<uint32_t, Handler> byIndex_;
};

/// @brief Decorator bounding the time a wrapped bridge may take.
/// @details The wrapped call runs on a detached worker thread. When the
///          timeout expires the call fails; the worker keeps running to
///          completion and its result is discarded.
class TimedImportBridge final : public ImportBridge
{
  public:
    TimedImportBridge(std::shared_ptr<ImportBridge> inner, std::chrono::milliseconds timeout);

    support::Expected<ImportResult, BridgeError> fulfill(const ImportCall &call) override;

    std::chrono::milliseconds timeout() const noexcept
    {
        return timeout_;
    }

  private:
    std::shared_ptr<ImportBridge> inner_;
    std::chrono::milliseconds timeout_;
};

} // namespace wasmdbg::vm

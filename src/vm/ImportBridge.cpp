//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ImportBridge.cpp
// Purpose: Stock import bridges: failing default, host callbacks and the
//          timeout decorator.
// Key invariants: No bridge mutates the ImportCall it is given.
// Ownership/Lifetime: See ImportBridge.hpp.
// Links: vm/ImportBridge.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/ImportBridge.hpp"

#include <exception>
#include <future>
#include <system_error>
#include <thread>

namespace wasmdbg::vm
{

support::Expected<ImportResult, BridgeError> DefaultImportBridge::fulfill(const ImportCall &call)
{
    return BridgeError{"no host handler for import '" + call.module + "." + call.field + "'"};
}

void HostImportBridge::registerHandler(std::string module, std::string field, Handler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    byName_[module + "." + field] = std::move(handler);
}

void HostImportBridge::registerHandler(uint32_t funcIndex, Handler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    byIndex_[funcIndex] = std::move(handler);
}

support::Expected<ImportResult, BridgeError> HostImportBridge::fulfill(const ImportCall &call)
{
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = byIndex_.find(call.funcIndex); it != byIndex_.end())
            handler = it->second;
        else if (auto named = byName_.find(call.module + "." + call.field); named != byName_.end())
            handler = named->second;
    }
    if (!handler)
        return BridgeError{"no host handler for import '" + call.module + "." + call.field + "'"};
    return handler(call);
}

TimedImportBridge::TimedImportBridge(std::shared_ptr<ImportBridge> inner,
                                     std::chrono::milliseconds timeout)
    : inner_(inner ? std::move(inner)
                   : std::shared_ptr<ImportBridge>(std::make_shared<DefaultImportBridge>())),
      timeout_(timeout)
{
}

support::Expected<ImportResult, BridgeError> TimedImportBridge::fulfill(const ImportCall &call)
{
    using Outcome = support::Expected<ImportResult, BridgeError>;

    // The worker owns copies of everything it touches so an abandoned call
    // cannot reference this frame or a destroyed bridge.
    std::packaged_task<Outcome()> task(
        [inner = inner_, request = call]() -> Outcome
        {
            try
            {
                return inner->fulfill(request);
            }
            catch (const std::exception &ex)
            {
                return BridgeError{std::string("import handler threw: ") + ex.what()};
            }
        });
    std::future<Outcome> result = task.get_future();
    try
    {
        std::thread(std::move(task)).detach();
    }
    catch (const std::system_error &ex)
    {
        return BridgeError{std::string("cannot start import worker: ") + ex.what()};
    }

    if (result.wait_for(timeout_) != std::future_status::ready)
        return BridgeError{"import call timed out after " + std::to_string(timeout_.count()) + " ms"};
    return result.get();
}

} // namespace wasmdbg::vm

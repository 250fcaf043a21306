// File: src/tools/wasmdbg/cli.hpp
// Purpose: Command-line options and the interactive command shell of wasmdbg.
// Key invariants: The shell talks to the session only through DebugService.
// Ownership/Lifetime: The Shell borrows the service and both streams.
// Links: include/wasmdbg/debugger/DebugService.hpp

#pragma once

#include "wasmdbg/debugger/DebugService.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace wasmdbg::tools
{

/// @brief Options accepted on the wasmdbg command line.
struct CliOptions
{
    /// @brief Session configuration after environment and flag overrides.
    debugger::DebuggerConfig config{};

    /// @brief Read commands from this file instead of standard input.
    std::string scriptPath{};

    /// @brief Binary to load before the first command.
    std::string filePath{};

    bool showHelp = false;
    bool showVersion = false;
};

/// @brief Result of parsing the command line.
enum class OptionParseResult
{
    Parsed, ///< All arguments consumed.
    Error   ///< A malformed or unknown option; a message was written.
};

/// @brief Parse @p argv (without the program name) into @p opts.
OptionParseResult parseOptions(int argc, char **argv, CliOptions &opts, std::ostream &err);

/// @brief Print command-line usage.
void usage(std::ostream &os);

/// @brief Line-oriented command interpreter over a debug session.
/// @details Session errors print `error: <message>`; traps print
///          `stopped: <trap>` with the position execution stopped at.
class Shell
{
  public:
    Shell(debugger::DebugService &service, std::ostream &out, std::ostream &err);

    /// @brief Execute one command line.
    /// @return False once `quit` was executed.
    bool execute(const std::string &line);

    /// @brief Execute every line of @p in until end of input or `quit`.
    /// @param prompt Print a prompt before reading each line.
    void run(std::istream &in, bool prompt);

    /// @brief Number of commands that reported an error so far.
    std::size_t errorCount() const noexcept
    {
        return errors_;
    }

  private:
    using Args = std::vector<std::string>;

    void cmdLoad(const Args &args);
    void cmdStart(const Args &args);
    void cmdRun(const Args &args);
    void cmdStep(const Args &args);
    void cmdNext(const Args &args);
    void cmdFinish(const Args &args);
    void cmdContinue(const Args &args);
    void cmdCall(const Args &args);
    void cmdReset(const Args &args);
    void cmdBacktrace(const Args &args);
    void cmdLocals(const Args &args);
    void cmdGlobals(const Args &args);
    void cmdStack(const Args &args);
    void cmdMemory(const Args &args);
    void cmdBreak(const Args &args);
    void cmdWatch(const Args &args);
    void cmdDelete(const Args &args);
    void cmdClear(const Args &args);
    void cmdInfo(const Args &args);
    void cmdDisas(const Args &args);
    void cmdHelp(const Args &args);

    void fail(const std::string &message);
    void fail(const debugger::DebuggerError &error);
    void reportTrap(const vm::Trap &trap);
    void reportStepped(const std::optional<vm::Trap> &trap);
    std::string describePosition(const vm::CodePosition &pos) const;
    std::optional<uint32_t> resolveFunction(const std::string &token) const;

    debugger::DebugService &service_;
    std::ostream &out_;
    std::ostream &err_;
    std::size_t errors_ = 0;
};

} // namespace wasmdbg::tools

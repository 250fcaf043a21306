//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing and the command shell of the wasmdbg tool. Each
// command is a thin translation between text and one DebugService call; all
// session semantics live in the debugger library.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command shell for wasmdbg.
/// @details Commands are looked up in a static table so `help` and dispatch
///          share one source of names, aliases and summaries.

#include "tools/wasmdbg/cli.hpp"

#include "debugger/DebuggerConfig.hpp"
#include "wasm/Instr.hpp"
#include "wasm/Value.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <type_traits>
#include <variant>

namespace wasmdbg::tools
{
namespace
{

using debugger::Debugger;
using debugger::DebuggerError;
using debugger::DebuggerErrorKind;

constexpr uint64_t kDefaultDumpLength = 64;
constexpr std::size_t kDumpRow = 16;

std::vector<std::string> tokenize(const std::string &line)
{
    std::vector<std::string> tokens;
    std::istringstream is(line);
    std::string token;
    while (is >> token)
        tokens.push_back(token);
    return tokens;
}

/// @brief Parse a non-negative integer in decimal, 0x hex or 0 octal.
std::optional<uint64_t> parseUnsigned(const std::string &text)
{
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
        return std::nullopt;
    char *end = nullptr;
    const unsigned long long n = std::strtoull(text.c_str(), &end, 0);
    if (!end || *end != '\0')
        return std::nullopt;
    return static_cast<uint64_t>(n);
}

std::optional<uint32_t> parseU32(const std::string &text)
{
    const auto n = parseUnsigned(text);
    if (!n || *n > UINT32_MAX)
        return std::nullopt;
    return static_cast<uint32_t>(*n);
}

std::optional<int64_t> parseSigned(const std::string &text)
{
    if (text.empty())
        return std::nullopt;
    char *end = nullptr;
    const long long n = std::strtoll(text.c_str(), &end, 0);
    if (!end || *end != '\0')
        return std::nullopt;
    return static_cast<int64_t>(n);
}

std::optional<vm::WatchTrigger> parseTrigger(const std::string &text)
{
    if (text == "r")
        return vm::WatchTrigger::Read;
    if (text == "w")
        return vm::WatchTrigger::Write;
    if (text == "rw")
        return vm::WatchTrigger::ReadWrite;
    return std::nullopt;
}

std::string formatSignature(const wasm::FuncType &type)
{
    std::ostringstream os;
    os << "(";
    for (std::size_t i = 0; i < type.params.size(); ++i)
        os << (i ? ", " : "") << wasm::toString(type.params[i]);
    os << ") -> ";
    if (type.results.empty())
        os << "()";
    for (std::size_t i = 0; i < type.results.size(); ++i)
        os << (i ? ", " : "") << wasm::toString(type.results[i]);
    return os.str();
}

using Handler = void (Shell::*)(const std::vector<std::string> &);

struct Command
{
    const char *name;
    const char *alias;
    const char *synopsis;
    const char *summary;
};

constexpr Command kCommands[] = {
    {"load", nullptr, "load PATH", "load a WebAssembly binary"},
    {"start", nullptr, "start", "instantiate and run the entry point"},
    {"run", nullptr, "run", "like start, but require an entry point"},
    {"step", "s", "step", "execute one instruction"},
    {"next", "n", "next", "step over calls"},
    {"finish", nullptr, "finish", "run until the current function returns"},
    {"continue", "c", "continue", "run until the next trap"},
    {"call", nullptr, "call FUNC [ARGS...]", "call a function by index or name"},
    {"reset", nullptr, "reset", "discard the running instance"},
    {"bt", "backtrace", "bt", "print the call stack"},
    {"locals", nullptr, "locals [DEPTH]", "print locals of a frame (-1 = current)"},
    {"globals", nullptr, "globals", "print all globals"},
    {"stack", nullptr, "stack", "print the value stack"},
    {"memory", "x", "memory ADDR [LEN]", "dump linear memory"},
    {"break", "b", "break FUNC INSTR", "set a code breakpoint"},
    {"watch", nullptr, "watch global IDX [r|w|rw] | watch mem ADDR LEN [r|w|rw]",
     "set a watchpoint"},
    {"delete", "d", "delete IDX", "delete a breakpoint"},
    {"clear", nullptr, "clear", "delete all breakpoints"},
    {"info", nullptr, "info breakpoints|functions", "list breakpoints or functions"},
    {"disas", nullptr, "disas [FUNC]", "disassemble a function"},
    {"help", "h", "help", "show this list"},
    {"quit", "q", "quit", "leave wasmdbg"},
};

} // namespace

//===----------------------------------------------------------------------===//
// Options
//===----------------------------------------------------------------------===//

void usage(std::ostream &os)
{
    os << "usage: wasmdbg [options] [file.wasm]\n"
       << "\n"
       << "options:\n"
       << "  --trace                  print every dispatched instruction\n"
       << "  --max-call-depth N       limit the call stack to N frames\n"
       << "  --import-timeout-ms N    fail import calls after N ms (0 = no limit)\n"
       << "  --script FILE            read commands from FILE\n"
       << "  -h, --help               show this help\n"
       << "  --version                print the version\n"
       << "\n"
       << "environment: WASMDBG_TRACE, WASMDBG_MAX_CALL_DEPTH, WASMDBG_IMPORT_TIMEOUT_MS\n";
}

OptionParseResult parseOptions(int argc, char **argv, CliOptions &opts, std::ostream &err)
{
    for (int i = 0; i < argc; ++i)
    {
        const std::string arg = argv[i];
        const auto value = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= argc)
            {
                err << "missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
        }
        else if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "--trace")
        {
            opts.config.vm.trace.mode = vm::TraceConfig::Instructions;
        }
        else if (arg == "--max-call-depth")
        {
            const auto text = value();
            if (!text)
                return OptionParseResult::Error;
            const auto n = parseU32(*text);
            if (!n || *n == 0)
            {
                err << "invalid call depth: " << *text << "\n";
                return OptionParseResult::Error;
            }
            opts.config.vm.maxCallDepth = *n;
        }
        else if (arg == "--import-timeout-ms")
        {
            const auto text = value();
            if (!text)
                return OptionParseResult::Error;
            const auto timeout = debugger::parseImportTimeout(*text);
            if (!timeout)
            {
                err << "invalid timeout: " << *text << "\n";
                return OptionParseResult::Error;
            }
            opts.config.importTimeout = *timeout;
        }
        else if (arg == "--script")
        {
            const auto text = value();
            if (!text)
                return OptionParseResult::Error;
            opts.scriptPath = *text;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            err << "unknown option: " << arg << "\n";
            return OptionParseResult::Error;
        }
        else if (opts.filePath.empty())
        {
            opts.filePath = arg;
        }
        else
        {
            err << "unexpected argument: " << arg << "\n";
            return OptionParseResult::Error;
        }
    }
    return OptionParseResult::Parsed;
}

//===----------------------------------------------------------------------===//
// Shell plumbing
//===----------------------------------------------------------------------===//

Shell::Shell(debugger::DebugService &service, std::ostream &out, std::ostream &err)
    : service_(service), out_(out), err_(err)
{
}

bool Shell::execute(const std::string &line)
{
    const Args tokens = tokenize(line);
    if (tokens.empty() || tokens.front().front() == '#')
        return true;
    const std::string &name = tokens.front();
    const Args args(tokens.begin() + 1, tokens.end());

    // Parallel to kCommands; a null handler ends the session.
    static constexpr Handler handlers[] = {
        &Shell::cmdLoad,     &Shell::cmdStart,     &Shell::cmdRun,      &Shell::cmdStep,
        &Shell::cmdNext,     &Shell::cmdFinish,    &Shell::cmdContinue, &Shell::cmdCall,
        &Shell::cmdReset,    &Shell::cmdBacktrace, &Shell::cmdLocals,   &Shell::cmdGlobals,
        &Shell::cmdStack,    &Shell::cmdMemory,    &Shell::cmdBreak,    &Shell::cmdWatch,
        &Shell::cmdDelete,   &Shell::cmdClear,     &Shell::cmdInfo,     &Shell::cmdDisas,
        &Shell::cmdHelp,     nullptr,
    };
    static_assert(std::size(kCommands) == std::size(handlers), "command table mismatch");

    for (std::size_t i = 0; i < std::size(kCommands); ++i)
    {
        const Command &cmd = kCommands[i];
        if (name != cmd.name && !(cmd.alias && name == cmd.alias))
            continue;
        if (!handlers[i])
            return false;
        (this->*handlers[i])(args);
        return true;
    }
    if (name == "exit")
        return false;
    fail("unknown command '" + name + "'; try 'help'");
    return true;
}

void Shell::run(std::istream &in, bool prompt)
{
    std::string line;
    for (;;)
    {
        if (prompt)
            out_ << "(wasmdbg) " << std::flush;
        if (!std::getline(in, line))
            break;
        if (!execute(line))
            break;
    }
}

void Shell::fail(const std::string &message)
{
    ++errors_;
    out_ << "error: " << message << "\n";
}

void Shell::fail(const DebuggerError &error)
{
    fail(debugger::toString(error));
}

std::string Shell::describePosition(const vm::CodePosition &pos) const
{
    std::string text = vm::toString(pos);
    if (auto name = service_.functionName(pos.func))
        text += " <" + *name + ">";
    return text;
}

void Shell::reportTrap(const vm::Trap &trap)
{
    const auto where = service_.inspect(
        [](const Debugger &d) -> std::optional<vm::CodePosition>
        {
            if (!d.vm() || d.vm()->functionStack().empty())
                return std::nullopt;
            return d.vm()->ip();
        });

    out_ << "stopped: " << vm::toString(trap);
    if (where)
        out_ << " at " << describePosition(*where);
    out_ << "\n";

    if (trap.kind == vm::TrapKind::BreakpointReached)
    {
        err_ << "[BREAK] breakpoint " << trap.payload;
        if (where)
            err_ << " at " << vm::toString(*where);
        err_ << "\n";
    }
    else if (trap.kind == vm::TrapKind::WatchpointReached)
    {
        err_ << "[WATCH] watchpoint " << trap.payload;
        if (where)
            err_ << " before " << vm::toString(*where);
        err_ << "\n";
    }
    else if (trap.kind == vm::TrapKind::ExecutionFinished)
    {
        auto results = service_.valueStack();
        if (results)
        {
            for (const auto &value : results.value())
                out_ << "result: " << wasm::toString(value) << "\n";
        }
    }
}

void Shell::reportStepped(const std::optional<vm::Trap> &trap)
{
    if (trap)
    {
        reportTrap(*trap);
        return;
    }
    const auto current = service_.inspect(
        [](const Debugger &d) -> std::optional<std::pair<vm::CodePosition, std::string>>
        {
            if (!d.vm() || d.vm()->functionStack().empty())
                return std::nullopt;
            const vm::CodePosition ip = d.vm()->ip();
            const auto &code = d.vm()->module().functions[ip.func].code;
            if (ip.instr >= code.size())
                return std::nullopt;
            return std::make_pair(ip, wasm::formatInstr(code[ip.instr]));
        });
    if (current)
        out_ << "at " << describePosition(current->first) << ": " << current->second << "\n";
}

std::optional<uint32_t> Shell::resolveFunction(const std::string &token) const
{
    if (auto index = parseU32(token))
        return index;
    return service_.inspect(
        [&token](const Debugger &d) -> std::optional<uint32_t>
        {
            if (!d.file())
                return std::nullopt;
            const wasm::Module &module = d.file()->module();
            for (uint32_t i = 0; i < module.functions.size(); ++i)
            {
                if (d.functionName(i) == token)
                    return i;
            }
            if (const wasm::Export *exp = module.findExport(token, wasm::ExternalKind::Function))
                return exp->index;
            return std::nullopt;
        });
}

//===----------------------------------------------------------------------===//
// Commands
//===----------------------------------------------------------------------===//

void Shell::cmdLoad(const Args &args)
{
    if (args.empty())
        return fail("usage: load PATH");
    std::string path = args[0];
    for (std::size_t i = 1; i < args.size(); ++i)
        path += " " + args[i];
    auto loaded = service_.load(path);
    if (!loaded)
        return fail(wasm::toString(loaded.error()));
    out_ << "loaded " << path << "\n";
}

void Shell::cmdStart(const Args &)
{
    auto started = service_.start();
    if (!started)
        return fail(started.error());
    if (!started.value())
    {
        out_ << "no entry point; use 'call' to run a function\n";
        return;
    }
    reportTrap(*started.value());
}

void Shell::cmdRun(const Args &)
{
    auto trap = service_.run();
    if (!trap)
        return fail(trap.error());
    reportTrap(trap.value());
}

void Shell::cmdStep(const Args &)
{
    auto trap = service_.executeStep();
    if (!trap)
        return fail(trap.error());
    reportStepped(trap.value());
}

void Shell::cmdNext(const Args &)
{
    auto trap = service_.executeStepOver();
    if (!trap)
        return fail(trap.error());
    reportStepped(trap.value());
}

void Shell::cmdFinish(const Args &)
{
    auto trap = service_.executeStepOut();
    if (!trap)
        return fail(trap.error());
    reportStepped(trap.value());
}

void Shell::cmdContinue(const Args &)
{
    auto trap = service_.continueExecution();
    if (!trap)
        return fail(trap.error());
    reportTrap(trap.value());
}

void Shell::cmdCall(const Args &args)
{
    if (args.empty())
        return fail("usage: call FUNC [ARGS...]");
    const auto func = resolveFunction(args[0]);
    if (!func)
        return fail("unknown function '" + args[0] + "'");

    const auto type = service_.inspect(
        [&func](const Debugger &d) -> std::optional<wasm::FuncType>
        {
            if (!d.file())
                return std::nullopt;
            if (const wasm::FuncType *t = d.file()->module().funcType(*func))
                return *t;
            return std::nullopt;
        });
    if (!type)
    {
        // Let the session pick the right error (no file or bad index).
        auto trap = service_.call(*func, {});
        if (!trap)
            return fail(trap.error());
        return reportTrap(trap.value());
    }
    if (args.size() - 1 != type->params.size())
        return fail(DebuggerError::of(DebuggerErrorKind::InvalidArguments));

    std::vector<wasm::Value> values;
    for (std::size_t i = 0; i < type->params.size(); ++i)
    {
        auto value = wasm::Value::parse(args[i + 1], type->params[i]);
        if (!value)
        {
            return fail("cannot parse '" + args[i + 1] + "' as " +
                        std::string(wasm::toString(type->params[i])));
        }
        values.push_back(*value);
    }
    auto trap = service_.call(*func, values);
    if (!trap)
        return fail(trap.error());
    reportTrap(trap.value());
}

void Shell::cmdReset(const Args &)
{
    auto reset = service_.resetVm();
    if (!reset)
        return fail(reset.error());
    out_ << "instance discarded\n";
}

void Shell::cmdBacktrace(const Args &)
{
    auto trace = service_.backtrace();
    if (!trace)
        return fail(trace.error());
    const auto &positions = trace.value();
    for (std::size_t i = 0; i < positions.size(); ++i)
        out_ << "#" << i << "  " << describePosition(positions[i]) << "\n";
}

void Shell::cmdLocals(const Args &args)
{
    int64_t depth = -1;
    if (!args.empty())
    {
        const auto parsed = parseSigned(args[0]);
        if (!parsed)
            return fail("invalid frame depth '" + args[0] + "'");
        depth = *parsed;
    }
    auto values = service_.locals(depth);
    if (!values)
        return fail(values.error());

    const auto func = service_.inspect(
        [depth](const Debugger &d) -> uint32_t
        {
            if (!d.vm())
                return 0;
            const auto &frames = d.vm()->functionStack();
            const auto count = static_cast<int64_t>(frames.size());
            const int64_t index = depth < 0 ? count + depth : depth;
            if (index < 0 || index >= count)
                return 0;
            return frames[static_cast<std::size_t>(index)].funcIndex;
        });
    const auto &locals = values.value();
    for (uint32_t i = 0; i < locals.size(); ++i)
    {
        out_ << "local[" << i << "]";
        if (auto name = service_.localName(func, i))
            out_ << " " << *name;
        out_ << " = " << wasm::toString(locals[i]) << "\n";
    }
}

void Shell::cmdGlobals(const Args &)
{
    auto globals = service_.globals();
    if (!globals)
        return fail(globals.error());
    const auto &values = globals.value();
    for (std::size_t i = 0; i < values.size(); ++i)
        out_ << "global[" << i << "] = " << wasm::toString(values[i]) << "\n";
}

void Shell::cmdStack(const Args &)
{
    auto stack = service_.valueStack();
    if (!stack)
        return fail(stack.error());
    const auto &values = stack.value();
    if (values.empty())
        out_ << "<empty>\n";
    for (std::size_t i = values.size(); i > 0; --i)
        out_ << "[" << (values.size() - i) << "] " << wasm::toString(values[i - 1]) << "\n";
}

void Shell::cmdMemory(const Args &args)
{
    if (args.empty() || args.size() > 2)
        return fail("usage: memory ADDR [LEN]");
    const auto address = parseUnsigned(args[0]);
    const auto length = args.size() == 2 ? parseUnsigned(args[1]) : std::optional<uint64_t>(kDefaultDumpLength);
    if (!address || !length)
        return fail("usage: memory ADDR [LEN]");
    auto bytes = service_.readMemory(*address, *length);
    if (!bytes)
        return fail(bytes.error());

    const auto &data = bytes.value();
    if (data.empty())
    {
        out_ << "<no bytes in range>\n";
        return;
    }
    for (std::size_t row = 0; row < data.size(); row += kDumpRow)
    {
        std::ostringstream line;
        line << "0x" << std::hex << std::setw(8) << std::setfill('0') << (*address + row) << ":";
        std::string ascii;
        for (std::size_t i = row; i < row + kDumpRow; ++i)
        {
            if (i < data.size())
            {
                line << " " << std::setw(2) << static_cast<unsigned>(data[i]);
                ascii += std::isprint(data[i]) ? static_cast<char>(data[i]) : '.';
            }
            else
            {
                line << "   ";
            }
        }
        out_ << line.str() << "  " << ascii << "\n";
    }
}

void Shell::cmdBreak(const Args &args)
{
    if (args.size() != 2)
        return fail("usage: break FUNC INSTR");
    const auto func = resolveFunction(args[0]);
    const auto instr = parseU32(args[1]);
    if (!func || !instr)
        return fail(DebuggerError::of(DebuggerErrorKind::InvalidBreakpointPosition));
    const vm::CodePosition pos{*func, *instr};
    auto index = service_.addBreakpoint(vm::CodeBreakpoint{pos});
    if (!index)
        return fail(index.error());
    out_ << "breakpoint " << index.value() << " at " << describePosition(pos) << "\n";
}

void Shell::cmdWatch(const Args &args)
{
    const char *const synopsis = "usage: watch global IDX [r|w|rw] | watch mem ADDR LEN [r|w|rw]";
    if (args.empty())
        return fail(synopsis);

    vm::Breakpoint bp;
    std::size_t triggerArg = 0;
    if (args[0] == "global" && (args.size() == 2 || args.size() == 3))
    {
        const auto global = parseU32(args[1]);
        if (!global)
            return fail(DebuggerError::of(DebuggerErrorKind::InvalidWatchpointGlobal));
        bp = vm::GlobalWatchpoint{vm::WatchTrigger::Write, *global};
        triggerArg = 2;
    }
    else if (args[0] == "mem" && (args.size() == 3 || args.size() == 4))
    {
        const auto address = parseU32(args[1]);
        const auto length = parseU32(args[2]);
        if (!address || !length)
            return fail(synopsis);
        bp = vm::MemoryWatchpoint{vm::WatchTrigger::Write, *address, *length};
        triggerArg = 3;
    }
    else
    {
        return fail(synopsis);
    }

    if (args.size() > triggerArg)
    {
        const auto trigger = parseTrigger(args[triggerArg]);
        if (!trigger)
            return fail("invalid trigger '" + args[triggerArg] + "'; use r, w or rw");
        std::visit(
            [&trigger](auto &watch)
            {
                if constexpr (!std::is_same_v<std::decay_t<decltype(watch)>, vm::CodeBreakpoint>)
                    watch.trigger = *trigger;
            },
            bp);
    }

    auto index = service_.addBreakpoint(bp);
    if (!index)
        return fail(index.error());
    out_ << "watchpoint " << index.value() << ": " << vm::toString(bp) << "\n";
}

void Shell::cmdDelete(const Args &args)
{
    const auto index = args.size() == 1 ? parseU32(args[0]) : std::nullopt;
    if (!index)
        return fail("usage: delete IDX");
    auto removed = service_.deleteBreakpoint(*index);
    if (!removed)
        return fail(removed.error());
    if (removed.value())
        out_ << "deleted " << *index << "\n";
    else
        out_ << "no breakpoint " << *index << "\n";
}

void Shell::cmdClear(const Args &)
{
    auto cleared = service_.clearBreakpoints();
    if (!cleared)
        return fail(cleared.error());
    out_ << "all breakpoints deleted\n";
}

void Shell::cmdInfo(const Args &args)
{
    if (args.size() != 1)
        return fail("usage: info breakpoints|functions");
    if (args[0] == "breakpoints" || args[0] == "b")
    {
        auto list = service_.breakpoints();
        if (!list)
            return fail(list.error());
        if (list.value().empty())
            out_ << "no breakpoints\n";
        for (const auto &[index, bp] : list.value())
            out_ << index << ": " << vm::toString(bp) << "\n";
        return;
    }
    if (args[0] == "functions" || args[0] == "f")
    {
        const auto lines = service_.inspect(
            [](const Debugger &d) -> std::optional<std::vector<std::string>>
            {
                if (!d.file())
                    return std::nullopt;
                const wasm::Module &module = d.file()->module();
                std::vector<std::string> rows;
                for (uint32_t i = 0; i < module.functions.size(); ++i)
                {
                    std::ostringstream os;
                    os << "f" << i;
                    if (auto name = d.functionName(i))
                        os << " <" << *name << ">";
                    if (const wasm::FuncType *type = module.funcType(i))
                        os << " " << formatSignature(*type);
                    const wasm::Function &fn = module.functions[i];
                    if (fn.import)
                        os << " import " << fn.import->module << "." << fn.import->field;
                    else
                        os << " [" << fn.code.size() << " instructions]";
                    rows.push_back(os.str());
                }
                return rows;
            });
        if (!lines)
            return fail(DebuggerError::of(DebuggerErrorKind::NoFileLoaded));
        for (const auto &line : *lines)
            out_ << line << "\n";
        return;
    }
    fail("usage: info breakpoints|functions");
}

void Shell::cmdDisas(const Args &args)
{
    std::optional<uint32_t> func;
    if (!args.empty())
    {
        func = resolveFunction(args[0]);
        if (!func)
            return fail("unknown function '" + args[0] + "'");
    }

    struct Listing
    {
        std::string header;
        std::vector<std::string> lines;
        std::optional<std::string> error;
    };
    const Listing listing = service_.inspect(
        [func](const Debugger &d) -> Listing
        {
            Listing out;
            if (!d.file())
            {
                out.error = debugger::toString(DebuggerError::of(DebuggerErrorKind::NoFileLoaded));
                return out;
            }
            const wasm::Module &module = d.file()->module();
            const bool live = d.vm() && !d.vm()->functionStack().empty();
            const uint32_t index = func ? *func : (live ? d.vm()->ip().func : 0);
            if (index >= module.functions.size())
            {
                out.error = debugger::toString(DebuggerError::of(DebuggerErrorKind::InvalidFunctionIndex));
                return out;
            }
            const wasm::Function &fn = module.functions[index];
            std::ostringstream header;
            header << "function " << index;
            if (auto name = d.functionName(index))
                header << " <" << *name << ">";
            if (const wasm::FuncType *type = module.funcType(index))
                header << " " << formatSignature(*type);
            if (fn.import)
                header << " imported from " << fn.import->module << "." << fn.import->field;
            out.header = header.str();
            for (uint32_t i = 0; i < fn.code.size(); ++i)
            {
                const bool here = live && d.vm()->ip() == vm::CodePosition{index, i};
                std::ostringstream line;
                line << (here ? "=> " : "   ") << std::setw(4) << i << "  " << wasm::formatInstr(fn.code[i]);
                out.lines.push_back(line.str());
            }
            return out;
        });

    if (listing.error)
        return fail(*listing.error);
    out_ << listing.header << "\n";
    for (const auto &line : listing.lines)
        out_ << line << "\n";
}

void Shell::cmdHelp(const Args &)
{
    for (const Command &cmd : kCommands)
    {
        out_ << "  " << std::left << std::setw(28) << cmd.synopsis << std::right << cmd.summary;
        if (cmd.alias)
            out_ << " (alias: " << cmd.alias << ")";
        out_ << "\n";
    }
}

} // namespace wasmdbg::tools

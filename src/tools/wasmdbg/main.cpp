//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the wasmdbg command-line debugger.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for wasmdbg.
/// @details Configuration is layered: built-in defaults, then the WASMDBG_*
///          environment variables, then command-line flags.

#include "tools/wasmdbg/cli.hpp"
#include "wasmdbg/version.hpp"

#include <fstream>
#include <iostream>

#include <unistd.h>

int main(int argc, char **argv)
{
    using namespace wasmdbg;

    tools::CliOptions opts;
    opts.config.applyEnvironment();
    if (tools::parseOptions(argc - 1, argv + 1, opts, std::cerr) != tools::OptionParseResult::Parsed)
    {
        tools::usage(std::cerr);
        return 1;
    }
    if (opts.showHelp)
    {
        tools::usage(std::cout);
        return 0;
    }
    if (opts.showVersion)
    {
        std::cout << WASMDBG_VERSION_FULL << "\n";
        return 0;
    }

    debugger::DebugService service(opts.config);
    tools::Shell shell(service, std::cout, std::cerr);

    if (!opts.filePath.empty() && !shell.execute("load " + opts.filePath))
        return 0;

    if (!opts.scriptPath.empty())
    {
        std::ifstream script(opts.scriptPath);
        if (!script)
        {
            std::cerr << "[DEBUG] unable to open " << opts.scriptPath << "\n";
            return 1;
        }
        shell.run(script, false);
        return shell.errorCount() == 0 ? 0 : 1;
    }

    shell.run(std::cin, isatty(STDIN_FILENO) != 0);
    return 0;
}

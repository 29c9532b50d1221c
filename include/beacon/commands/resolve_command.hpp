#pragma once

#include <iosfwd>

#include "beacon/cli/command_line_parser.hpp"

namespace beacon::commands {

// Loads the configuration, runs a resolver against the configured inventory
// and prints membership events as JSON lines until SIGINT/SIGTERM.
class ResolveCommand {
public:
    ResolveCommand(cli::CommandLineOptions options, std::ostream& out);

    // Returns the process exit code
    int run();

private:
    cli::CommandLineOptions m_options;
    std::ostream& m_out;
};

}  // namespace beacon::commands

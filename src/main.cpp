#include <iostream>

#include "beacon/cli/command_line_parser.hpp"
#include "beacon/commands/resolve_command.hpp"
#include "beacon/version.hpp"

int main(int argc, char* argv[]) {
    try {
        auto options = beacon::cli::CommandLineParser::parse(argc, argv);
        if (options.show_version) {
            std::cout << "beacon " << BEACON_VERSION_STRING << std::endl;
            return 0;
        }
        if (options.show_help) {
            std::cout << options.help_text << std::endl;
            return options.parse_error ? 1 : 0;
        }
        beacon::commands::ResolveCommand command(std::move(options),
                                                 std::cout);
        return command.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

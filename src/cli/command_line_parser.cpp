#include "beacon/cli/command_line_parser.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>

#include "beacon/config/config.hpp"

namespace po = boost::program_options;

namespace beacon::cli {

CommandLineOptions CommandLineParser::parse(int argc,
                                            const char* const argv[]) {
    CommandLineOptions options;

    po::options_description desc("beacon options");
    desc.add_options()("help,h", "Show help")("version,v", "Show version")(
        "config,c",
        po::value<std::string>()->default_value(
            config::ConfigPaths::DEFAULT_CONFIG_FILE),
        "Configuration file (yaml, json or ini)")(
        "log-level,l", po::value<std::string>(),
        "Override log.global_level (trace, debug, info, warn, error)")(
        "once", "Stop after the first reconciliation");

    std::ostringstream help;
    help << "beacon - keeps a live set of backends from an inventory\n\n"
         << desc;
    options.help_text = help.str();

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            options.show_help = true;
            return options;
        }
        if (vm.count("version")) {
            options.show_version = true;
            return options;
        }

        options.config_file = vm["config"].as<std::string>();
        if (vm.count("log-level")) {
            options.log_level = vm["log-level"].as<std::string>();
        }
        options.once = vm.count("once") > 0;
    } catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        options.show_help = true;
        options.parse_error = true;
    }

    return options;
}

}  // namespace beacon::cli

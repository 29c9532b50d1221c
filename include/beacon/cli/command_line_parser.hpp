#pragma once
#include <optional>
#include <string>

namespace beacon::cli {

struct CommandLineOptions {
    bool show_version = false;
    bool show_help = false;
    bool parse_error = false;
    std::string config_file;
    std::optional<std::string> log_level;
    // Stop after the first reconciliation
    bool once = false;
    std::string help_text;
};

class CommandLineParser {
public:
    static CommandLineOptions parse(int argc, const char* const argv[]);
};

}  // namespace beacon::cli

#include "beacon/log/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace beacon::log {

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level_str = get_optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level_str);
    }

    if (auto console_pt = pt.get_child_optional("console")) {
        console.enabled = get_value(*console_pt, "enabled", console.enabled);
        console.pattern = get_value(*console_pt, "pattern", console.pattern);
    }

    if (auto file_pt = pt.get_child_optional("file")) {
        file.enabled = get_value(*file_pt, "enabled", file.enabled);
        file.log_file = get_value(*file_pt, "log_file", file.log_file);
        file.max_file_size =
            get_value(*file_pt, "max_file_size", file.max_file_size);
        file.max_files = get_value(*file_pt, "max_files", file.max_files);
        file.pattern = get_value(*file_pt, "pattern", file.pattern);
    }
}

void LogConfig::validate() const {
    if (file.enabled) {
        if (file.log_file.empty()) {
            throw std::invalid_argument(
                "Log file path cannot be empty when file logging is enabled");
        }

        if (file.max_file_size <= 0) {
            throw std::invalid_argument(
                "Log file max_file_size must be greater than 0");
        }

        if (file.max_files <= 0) {
            throw std::invalid_argument(
                "Log file max_files must be greater than 0");
        }
    }
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& level_str) {
    std::string lower_level = level_str;
    std::transform(lower_level.begin(), lower_level.end(), lower_level.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });

    if (lower_level == "trace") return LogLevel::TRACE;
    if (lower_level == "debug") return LogLevel::DEBUG;
    if (lower_level == "info") return LogLevel::INFO;
    if (lower_level == "warn" || lower_level == "warning")
        return LogLevel::WARN;
    if (lower_level == "error") return LogLevel::ERROR;
    if (lower_level == "fatal" || lower_level == "critical")
        return LogLevel::FATAL;

    throw std::invalid_argument("Invalid log level: " + level_str);
}

std::string LogConfig::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "trace";
        case LogLevel::DEBUG:
            return "debug";
        case LogLevel::INFO:
            return "info";
        case LogLevel::WARN:
            return "warn";
        case LogLevel::ERROR:
            return "error";
        case LogLevel::FATAL:
            return "fatal";
        default:
            return "unknown";
    }
}

}  // namespace beacon::log

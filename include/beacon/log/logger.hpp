#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "beacon/log/log_config.hpp"

namespace beacon::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
    static LogConfig::LogLevel level() { return config_.global_level; }

private:
    static LogConfig config_;
};

boost::log::trivial::severity_level to_boost_level(LogConfig::LogLevel level);

// Translates spdlog-style short placeholders to Boost.Log named ones.
std::string normalize_formatter_pattern(std::string pattern);

}  // namespace beacon::log

#define BEACON_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define BEACON_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define BEACON_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define BEACON_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define BEACON_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define BEACON_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

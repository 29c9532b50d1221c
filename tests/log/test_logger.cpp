// tests/log/test_logger.cpp
#define BOOST_TEST_MODULE LoggerTests
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/smart_ptr/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

#include "beacon/log/log_config.hpp"
#include "beacon/log/logger.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

using beacon::log::LogConfig;
using beacon::log::Logger;

// Sink backend writing into a stringstream
class StringStreamBackend : public sinks::text_ostream_backend {
public:
    explicit StringStreamBackend(std::ostream& os) {
        add_stream(boost::shared_ptr<std::ostream>(&os, boost::null_deleter()));
    }
};

std::stringstream g_log_stream;
boost::shared_ptr<sinks::synchronous_sink<StringStreamBackend>> g_test_sink;

void attach_test_sink() {
    g_log_stream.str("");
    g_log_stream.clear();

    g_test_sink = boost::make_shared<sinks::synchronous_sink<StringStreamBackend>>(
        boost::make_shared<StringStreamBackend>(g_log_stream));
    g_test_sink->set_formatter(
        expr::stream << expr::attr<logging::trivial::severity_level>("Severity")
                     << ": " << expr::smessage);
    logging::core::get()->add_sink(g_test_sink);
}

struct LogFixture {
    LogFixture() {
        logging::core::get()->remove_all_sinks();
        attach_test_sink();
        logging::core::get()->set_filter(
            expr::attr<logging::trivial::severity_level>("Severity") >=
            logging::trivial::trace);
        logging::add_common_attributes();
    }

    ~LogFixture() {
        logging::core::get()->remove_sink(g_test_sink);
        g_test_sink.reset();
    }
};

BOOST_GLOBAL_FIXTURE(LogFixture);

BOOST_AUTO_TEST_SUITE(LoggerTestSuite)

BOOST_AUTO_TEST_CASE(test_log_info_message) {
    BEACON_LOG_INFO << "This is an info message.";
    BOOST_CHECK(g_log_stream.str().find("info: This is an info message.") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_log_warn_maps_to_warning) {
    BEACON_LOG_WARN << "Collapsed 1 duplicate endpoint(s)";
    BOOST_CHECK(g_log_stream.str().find(
                    "warning: Collapsed 1 duplicate endpoint(s)") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_set_level_filters) {
    g_log_stream.str("");
    g_log_stream.clear();

    Logger::set_level(LogConfig::LogLevel::WARN);
    BOOST_CHECK(Logger::level() == LogConfig::LogLevel::WARN);

    BEACON_LOG_INFO << "This info message should not appear.";
    BEACON_LOG_WARN << "This warning message should appear.";
    BEACON_LOG_ERROR << "This error message should also appear.";

    BOOST_CHECK(g_log_stream.str().find("should not appear") ==
                std::string::npos);
    BOOST_CHECK(g_log_stream.str().find(
                    "warning: This warning message should appear.") !=
                std::string::npos);
    BOOST_CHECK(g_log_stream.str().find(
                    "error: This error message should also appear.") !=
                std::string::npos);

    Logger::set_level(LogConfig::LogLevel::TRACE);
}

BOOST_AUTO_TEST_CASE(test_init_replaces_sinks_and_applies_level) {
    LogConfig config;
    config.global_level = LogConfig::LogLevel::ERROR;
    config.console.enabled = false;

    Logger::init(config);
    // init() drops every existing sink, including ours
    attach_test_sink();

    BEACON_LOG_WARN << "filtered out";
    BEACON_LOG_ERROR << "kept";
    BOOST_CHECK(g_log_stream.str().find("filtered out") == std::string::npos);
    BOOST_CHECK(g_log_stream.str().find("error: kept") != std::string::npos);

    Logger::set_level(LogConfig::LogLevel::TRACE);
}

BOOST_AUTO_TEST_CASE(test_level_from_string) {
    BOOST_CHECK(Logger::level_from_string("debug") ==
                LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(Logger::level_from_string("WARNING") ==
                LogConfig::LogLevel::WARN);
    BOOST_CHECK(Logger::level_from_string("critical") ==
                LogConfig::LogLevel::FATAL);
    BOOST_CHECK_THROW(Logger::level_from_string("verbose"),
                      std::invalid_argument);
    // Bytes outside ASCII are rejected, not folded
    BOOST_CHECK_THROW(Logger::level_from_string("\xC3\x89RROR"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Logger::level_from_string("\xFF"),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(LogConfig::level_to_string(LogConfig::LogLevel::WARN),
                      "warn");
}

BOOST_AUTO_TEST_CASE(test_normalize_spdlog_pattern) {
    BOOST_CHECK_EQUAL(beacon::log::normalize_formatter_pattern(
                          "[%Y-%m-%d %H:%M:%S.%f] [%t] [%l] %v"),
                      "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%");
    BOOST_CHECK_EQUAL(
        beacon::log::normalize_formatter_pattern("%Severity%: %Message%"),
        "%Severity%: %Message%");
}

BOOST_AUTO_TEST_CASE(test_log_config_from_ptree) {
    boost::property_tree::ptree pt;
    pt.put("global_level", "debug");
    pt.put("console.enabled", false);
    pt.put("file.enabled", true);
    pt.put("file.log_file", "logs/test.log");
    pt.put("file.max_files", 3);

    LogConfig config;
    config.from_ptree(pt);
    BOOST_CHECK(config.global_level == LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(!config.console.enabled);
    BOOST_CHECK(config.file.enabled);
    BOOST_CHECK_EQUAL(config.file.log_file, "logs/test.log");
    BOOST_CHECK_EQUAL(config.file.max_files, 3);
    BOOST_CHECK_NO_THROW(config.validate());

    config.file.max_files = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

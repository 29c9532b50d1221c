#include "beacon/commands/resolve_command.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>

#include "beacon/config/config.hpp"
#include "beacon/discovery/endpoint_provider.hpp"
#include "beacon/discovery/resolver_config.hpp"
#include "beacon/log/logger.hpp"
#include "beacon/resolver/resolver.hpp"
#include "nlohmann/json.hpp"

namespace beacon::commands {

using beacon::resolver::ResolverState;

ResolveCommand::ResolveCommand(cli::CommandLineOptions options,
                               std::ostream& out)
    : m_options(std::move(options)), m_out(out) {}

int ResolveCommand::run() {
    auto& config_manager = config::ConfigManager::instance();
    auto log_config = std::make_shared<log::LogConfig>();
    auto resolver_config = std::make_shared<discovery::ResolverConfig>();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(resolver_config);

    try {
        config_manager.load_config(
            m_options.config_file,
            config::format_from_path(m_options.config_file));
        if (m_options.log_level) {
            log_config->global_level =
                log::LogConfig::level_from_string(*m_options.log_level);
        }
        // The section is mandatory; a missing one leaves the defaults behind
        resolver_config->validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    log::Logger::init(*log_config);

    boost::asio::io_context io_context;
    std::unique_ptr<resolver::Resolver> resolver;
    try {
        auto provider = discovery::make_endpoint_provider(io_context,
                                                          resolver_config->url);
        resolver = std::make_unique<resolver::Resolver>(
            io_context, *resolver_config, std::move(provider));
    } catch (const std::exception& e) {
        BEACON_LOG_FATAL << "Failed to create resolver: " << e.what();
        log::Logger::shutdown();
        return 1;
    }

    resolver->events().on_added(
        [this](const std::string& key, const discovery::Backend& backend) {
            nlohmann::json line = {
                {"event", "added"}, {"key", key}, {"backend", backend}};
            m_out << line.dump() << std::endl;
        });
    resolver->events().on_removed([this](const std::string& key) {
        nlohmann::json line = {{"event", "removed"}, {"key", key}};
        m_out << line.dump() << std::endl;
    });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        BEACON_LOG_INFO << "Signal " << signo << " received, stopping";
        if (resolver->is_in_state(ResolverState::RUNNING) ||
            resolver->is_in_state(ResolverState::FAILED)) {
            resolver->stop();
        }
        io_context.stop();
    });

    resolver->start();

    int exit_code = 0;
    if (m_options.once) {
        while (resolver->is_in_state(ResolverState::STARTING) &&
               io_context.run_one() > 0) {
        }
        if (resolver->is_in_state(ResolverState::FAILED)) {
            const auto& error = resolver->last_error();
            BEACON_LOG_ERROR << "Initial fetch failed: "
                             << (error ? error->message : "unknown error");
            exit_code = 2;
        }
        if (!resolver->is_in_state(ResolverState::STOPPED)) {
            resolver->stop();
        }
    } else {
        BEACON_LOG_INFO << "Resolver running. Press Ctrl+C to exit.";
        io_context.run();
    }

    BEACON_LOG_INFO << "Resolver finished with " << resolver->count()
                    << " advertised backend(s)";
    log::Logger::shutdown();
    return exit_code;
}

}  // namespace beacon::commands

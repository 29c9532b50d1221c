// beacon/include/beacon/resolver/resolver.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "beacon/discovery/backend.hpp"
#include "beacon/discovery/backend_diff.hpp"
#include "beacon/discovery/endpoint_provider.hpp"
#include "beacon/discovery/resolver_config.hpp"
#include "beacon/resolver/event_source.hpp"
#include "beacon/resolver/poll_loop.hpp"
#include "beacon/resolver/state_machine.hpp"

namespace beacon::resolver {

/// @brief Polls an endpoint provider and advertises the matching endpoints
/// as keyed backends, emitting `added` and `removed` events as membership
/// changes.
///
/// Lifecycle: stopped -> starting -> running | failed -> stopping -> stopped.
/// A failed initial fetch moves to `failed`, which keeps retrying on the poll
/// interval and moves to `running` on the first success. A failed poll while
/// `running` is recorded in last_error() and otherwise ignored. stop()
/// retracts every advertised backend.
///
/// Single-threaded: every member must be called on the thread running the
/// io_context passed to the constructor.
class Resolver {
public:
    using BackendSetPtr = std::shared_ptr<const discovery::BackendSet>;

    /// @throws std::invalid_argument / std::runtime_error if `config` does
    /// not validate or `provider` is null.
    Resolver(boost::asio::io_context& io_context,
             const discovery::ResolverConfig& config,
             std::shared_ptr<discovery::IEndpointProvider> provider,
             discovery::KeyGenerator key_generator =
                 discovery::generate_backend_key);
    ~Resolver();

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    /// @brief Valid only while stopped.
    /// @throws InvalidTransition otherwise, or when called from a listener.
    void start();

    /// @brief Valid only while running or failed. Emits `removed` for every
    /// advertised backend and returns in the stopped state.
    /// @throws InvalidTransition otherwise, or when called from a listener.
    void stop();

    /// @brief Snapshot of the advertised Backend Set. The resolver never
    /// mutates a published set; a later reconciliation publishes a new one.
    BackendSetPtr list() const { return m_backends; }

    std::size_t count() const { return m_backends->size(); }

    /// @brief Most recent fetch error, if any fetch has failed.
    const std::optional<discovery::ProviderError>& last_error() const {
        return m_last_error;
    }

    ResolverState state() const { return m_machine.state(); }
    bool is_in_state(ResolverState state) const {
        return m_machine.is_in_state(state);
    }

    EventSource& events() { return m_events; }

    // Debugging aids

    /// @brief Keys added by the most recent reconciliation.
    const std::vector<std::string>& last_added() const { return m_last_added; }
    /// @brief Keys removed by the most recent reconciliation or stop.
    const std::vector<std::string>& last_removed() const {
        return m_last_removed;
    }
    /// @brief The set that was advertised before the last membership change.
    BackendSetPtr previous_backends() const { return m_previous_backends; }
    /// @brief Endpoints reported by the most recent successful fetch.
    const std::vector<discovery::Endpoint>& discovered() const {
        return m_discovered;
    }
    std::optional<std::chrono::system_clock::time_point> last_poll_started()
        const {
        return m_poll.last_poll_started();
    }
    /// @brief Recently removed keys that will not be minted again.
    const discovery::RetiredKeys& retired_keys() const {
        return m_retired_keys;
    }
    const PollLoop& poll_loop() const { return m_poll; }

private:
    void dispatch(ResolverEvent event);
    void perform(const Transition& transition);
    void on_fetch_complete(std::optional<discovery::ProviderError> error,
                           std::vector<discovery::Endpoint> endpoints);
    void apply_reconciliation();
    void drain();
    void ensure_not_dispatching(const char* operation) const;

    discovery::ResolverConfig m_config;
    discovery::KeyGenerator m_key_generator;
    StateMachine m_machine;
    EventSource m_events;
    PollLoop m_poll;

    BackendSetPtr m_backends;
    BackendSetPtr m_previous_backends;
    std::vector<discovery::Endpoint> m_discovered;
    std::vector<std::string> m_last_added;
    std::vector<std::string> m_last_removed;
    std::optional<discovery::ReconcileResult> m_pending;
    discovery::RetiredKeys m_retired_keys;
    std::optional<discovery::ProviderError> m_last_error;
};

}  // namespace beacon::resolver

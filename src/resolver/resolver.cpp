// beacon/src/resolver/resolver.cpp
#include "beacon/resolver/resolver.hpp"

#include <sstream>
#include <stdexcept>

#include "beacon/log/logger.hpp"

namespace beacon::resolver {

namespace {

const discovery::ResolverConfig& validated(
    const discovery::ResolverConfig& config) {
    config.validate();
    return config;
}

std::string join_keys(const std::vector<std::string>& keys) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < keys.size(); ++i) {
        oss << (i ? ", " : "") << keys[i];
    }
    oss << "]";
    return oss.str();
}

std::string join_endpoints(const std::vector<discovery::Endpoint>& endpoints) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        oss << (i ? ", " : "") << endpoints[i].name << "@"
            << endpoints[i].address;
    }
    oss << "]";
    return oss.str();
}

}  // namespace

Resolver::Resolver(boost::asio::io_context& io_context,
                   const discovery::ResolverConfig& config,
                   std::shared_ptr<discovery::IEndpointProvider> provider,
                   discovery::KeyGenerator key_generator)
    : m_config(validated(config)),
      m_key_generator(std::move(key_generator)),
      m_poll(io_context, std::move(provider),
             discovery::SelectionFilter::from_config(m_config),
             m_config.poll_interval_duration()),
      m_backends(std::make_shared<const discovery::BackendSet>()),
      m_previous_backends(m_backends) {
    if (!m_key_generator) {
        throw std::invalid_argument("Resolver requires a key generator");
    }
    m_poll.on_complete([this](std::optional<discovery::ProviderError> error,
                              std::vector<discovery::Endpoint> endpoints) {
        on_fetch_complete(std::move(error), std::move(endpoints));
    });
    BEACON_LOG_DEBUG << "Resolver created for " << m_config.url
                     << ", poll interval " << m_config.poll_interval << "ms";
}

Resolver::~Resolver() { m_poll.cancel(); }

void Resolver::start() {
    ensure_not_dispatching("start()");
    if (!m_machine.accepts(ResolverEvent::START_ASSERTED)) {
        throw InvalidTransition(m_machine.state(),
                                "start() is only valid while stopped");
    }
    dispatch(ResolverEvent::START_ASSERTED);
}

void Resolver::stop() {
    ensure_not_dispatching("stop()");
    if (!m_machine.accepts(ResolverEvent::STOP_ASSERTED)) {
        throw InvalidTransition(
            m_machine.state(), "stop() is only valid while running or failed");
    }
    dispatch(ResolverEvent::STOP_ASSERTED);
}

void Resolver::ensure_not_dispatching(const char* operation) const {
    if (m_events.dispatching()) {
        throw InvalidTransition(
            m_machine.state(),
            std::string(operation) + " must not be called from a listener");
    }
}

void Resolver::dispatch(ResolverEvent event) {
    auto from = m_machine.state();
    const Transition& transition = m_machine.fire(event);
    if (transition.from != transition.to) {
        BEACON_LOG_INFO << "Resolver " << from << " -> " << transition.to
                        << " on " << event;
    }
    perform(transition);
}

void Resolver::perform(const Transition& transition) {
    switch (transition.action) {
        case TransitionAction::NONE:
            break;
        case TransitionAction::BEGIN_INITIAL_FETCH:
            m_poll.fetch_now();
            break;
        case TransitionAction::ENTER_RUNNING:
            // Restart polling with a fresh cadence from this reconciliation
            m_poll.stop_timer();
            apply_reconciliation();
            m_poll.start();
            break;
        case TransitionAction::ENTER_FAILED:
            m_poll.start();
            break;
        case TransitionAction::RECONCILE:
            apply_reconciliation();
            break;
        case TransitionAction::KEEP_POLLING:
            break;
        case TransitionAction::DRAIN:
            m_poll.cancel();
            drain();
            dispatch(ResolverEvent::DRAINED);
            break;
    }
}

void Resolver::on_fetch_complete(std::optional<discovery::ProviderError> error,
                                 std::vector<discovery::Endpoint> endpoints) {
    // Results of fetches issued before a stop never reach this point, but a
    // provider completing in an unexpected state must not move the machine.
    if (!m_machine.accepts(ResolverEvent::FETCH_SUCCEEDED)) {
        BEACON_LOG_WARN << "Ignoring fetch result in state "
                        << m_machine.state();
        return;
    }

    if (error) {
        BEACON_LOG_ERROR << "Could not get backends: " << error->message;
        m_last_error = std::move(error);
        dispatch(ResolverEvent::FETCH_FAILED);
        return;
    }

    BEACON_LOG_INFO << "Discovered backends: " << join_endpoints(endpoints);

    // A result that cannot be reconciled counts as a failed fetch
    try {
        m_pending = discovery::reconcile(*m_backends, endpoints,
                                         m_config.port(), m_key_generator,
                                         m_retired_keys);
    } catch (const std::exception& e) {
        BEACON_LOG_ERROR << "Could not reconcile backends: " << e.what();
        m_last_error = discovery::ProviderError::now(e.what());
        dispatch(ResolverEvent::FETCH_FAILED);
        return;
    }

    m_discovered = std::move(endpoints);
    if (m_machine.is_in_state(ResolverState::FAILED)) {
        BEACON_LOG_INFO << "Successfully got backends, transitioning to "
                           "running";
    }
    dispatch(ResolverEvent::FETCH_SUCCEEDED);
}

void Resolver::apply_reconciliation() {
    if (!m_pending) {
        return;
    }
    auto result = std::move(*m_pending);
    m_pending.reset();

    if (result.duplicates > 0) {
        BEACON_LOG_WARN << "Collapsed " << result.duplicates
                        << " duplicate endpoint(s) in discovery result";
    }

    // Publish before emitting so listeners observe the new set
    auto next = std::make_shared<const discovery::BackendSet>(
        std::move(result.backends));
    if (result.changed()) {
        m_previous_backends = m_backends;
    }
    m_backends = next;
    for (const auto& key : result.removed) {
        m_retired_keys.retire(key);
    }
    m_last_added = result.added;
    m_last_removed = result.removed;

    for (const auto& key : result.added) {
        m_events.emit_added(key, next->at(key));
    }
    for (const auto& key : result.removed) {
        m_events.emit_removed(key);
    }

    if (result.changed()) {
        BEACON_LOG_INFO << "Backends modified: added "
                        << join_keys(result.added) << ", removed "
                        << join_keys(result.removed);
    } else {
        BEACON_LOG_DEBUG << "Backends unchanged (" << next->size() << ")";
    }
}

void Resolver::drain() {
    auto retracted = m_backends;
    std::vector<std::string> removed;
    removed.reserve(retracted->size());
    for (const auto& [key, backend] : *retracted) {
        removed.push_back(key);
        m_retired_keys.retire(key);
    }

    if (!removed.empty()) {
        m_previous_backends = retracted;
    }
    m_backends = std::make_shared<const discovery::BackendSet>();
    m_last_added.clear();
    m_last_removed = removed;

    for (const auto& key : removed) {
        m_events.emit_removed(key);
    }

    BEACON_LOG_INFO << "Retracted " << removed.size() << " backend(s)";
}

}  // namespace beacon::resolver

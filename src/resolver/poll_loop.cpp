// beacon/src/resolver/poll_loop.cpp
#include "beacon/resolver/poll_loop.hpp"

#include <stdexcept>

#include "beacon/log/logger.hpp"

namespace beacon::resolver {

PollLoop::PollLoop(boost::asio::io_context& io_context,
                   std::shared_ptr<discovery::IEndpointProvider> provider,
                   discovery::SelectionFilter filter,
                   std::chrono::milliseconds interval)
    : m_provider(std::move(provider)),
      m_filter(std::move(filter)),
      m_interval(interval),
      m_timer(io_context),
      m_alive(std::make_shared<PollLoop*>(this)) {
    if (!m_provider) {
        throw std::invalid_argument("PollLoop requires an endpoint provider");
    }
    if (m_interval.count() <= 0) {
        throw std::invalid_argument("PollLoop interval must be > 0");
    }
}

PollLoop::~PollLoop() {
    m_alive.reset();
    m_timer_active = false;
    m_timer.cancel();
}

bool PollLoop::fetch_now() {
    if (m_in_flight) {
        BEACON_LOG_DEBUG << "Fetch requested while another is outstanding";
        return false;
    }
    issue_fetch();
    return true;
}

void PollLoop::start() {
    ++m_timer_generation;
    m_timer_active = true;
    m_next_deadline = std::chrono::steady_clock::now() + m_interval;
    schedule_next();
}

void PollLoop::stop_timer() {
    if (!m_timer_active) {
        return;
    }
    m_timer_active = false;
    ++m_timer_generation;
    m_timer.cancel();
}

void PollLoop::cancel() {
    stop_timer();
    if (m_in_flight) {
        BEACON_LOG_DEBUG << "Orphaning outstanding fetch from "
                         << m_provider->describe();
    }
    ++m_fetch_generation;
    m_in_flight = false;
    m_last_poll_started.reset();
}

void PollLoop::schedule_next() {
    if (!m_timer_active) {
        return;
    }

    std::weak_ptr<PollLoop*> alive = m_alive;
    auto generation = m_timer_generation;
    m_timer.expires_at(m_next_deadline);
    m_timer.async_wait(
        [this, alive, generation](boost::system::error_code ec) {
            if (ec || alive.expired()) {
                return;
            }
            if (!m_timer_active || generation != m_timer_generation) {
                return;
            }
            on_tick();
        });
}

void PollLoop::on_tick() {
    ++m_ticks;

    // Fixed cadence; deadlines missed while the thread was busy are dropped
    auto now = std::chrono::steady_clock::now();
    m_next_deadline += m_interval;
    while (m_next_deadline <= now) {
        m_next_deadline += m_interval;
    }
    schedule_next();

    if (m_in_flight) {
        ++m_skipped_ticks;
        BEACON_LOG_DEBUG << "Previous fetch from " << m_provider->describe()
                         << " still outstanding, skipping tick";
        return;
    }
    issue_fetch();
}

void PollLoop::issue_fetch() {
    m_in_flight = true;
    m_last_poll_started = std::chrono::system_clock::now();

    std::weak_ptr<PollLoop*> alive = m_alive;
    auto generation = m_fetch_generation;
    auto delivered = std::make_shared<bool>(false);
    auto complete = [this, alive, generation, delivered](
                        std::optional<discovery::ProviderError> error,
                        std::vector<discovery::Endpoint> endpoints) {
        *delivered = true;
        if (alive.expired()) {
            return;
        }
        if (generation != m_fetch_generation) {
            BEACON_LOG_DEBUG << "Discarding result of a cancelled fetch";
            return;
        }
        m_in_flight = false;
        m_last_poll_started.reset();
        if (m_complete) {
            m_complete(std::move(error), std::move(endpoints));
        }
    };

    try {
        m_provider->fetch(m_filter, complete);
    } catch (const std::exception& e) {
        // Raised by the completion of an inline fetch, not by the provider
        if (*delivered) {
            throw;
        }
        BEACON_LOG_ERROR << "Endpoint provider " << m_provider->describe()
                         << " threw from fetch: " << e.what();
        if (generation == m_fetch_generation && m_in_flight) {
            complete(discovery::ProviderError::now(e.what()), {});
        }
    }
}

}  // namespace beacon::resolver

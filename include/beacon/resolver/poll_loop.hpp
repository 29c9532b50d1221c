// beacon/include/beacon/resolver/poll_loop.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "beacon/discovery/endpoint_provider.hpp"

namespace beacon::resolver {

/// @brief Fetches from a provider on a fixed interval.
///
/// At most one fetch is outstanding at a time: a tick that fires while a
/// fetch is still running is skipped, not queued. cancel() stops the timer
/// and orphans the outstanding fetch; its result is dropped when it
/// eventually arrives. Must be driven from the io_context's thread.
class PollLoop {
public:
    PollLoop(boost::asio::io_context& io_context,
             std::shared_ptr<discovery::IEndpointProvider> provider,
             discovery::SelectionFilter filter,
             std::chrono::milliseconds interval);
    ~PollLoop();

    PollLoop(const PollLoop&) = delete;
    PollLoop& operator=(const PollLoop&) = delete;

    /// @brief Receives every fetch result that was not orphaned.
    void on_complete(discovery::FetchHandler handler) {
        m_complete = std::move(handler);
    }

    /// @brief Issues one fetch now, outside the timer.
    /// @return false if a fetch is already outstanding.
    bool fetch_now();

    /// @brief Starts the recurring timer; the first tick is one interval out.
    void start();

    /// @brief Stops the timer. An outstanding fetch still completes.
    void stop_timer();

    /// @brief Stops the timer and orphans the outstanding fetch, if any.
    void cancel();

    bool timer_active() const { return m_timer_active; }
    bool in_flight() const { return m_in_flight; }
    std::chrono::milliseconds interval() const { return m_interval; }

    /// @brief Start time of the outstanding fetch.
    std::optional<std::chrono::system_clock::time_point> last_poll_started()
        const {
        return m_last_poll_started;
    }

    std::uint64_t ticks() const { return m_ticks; }
    std::uint64_t skipped_ticks() const { return m_skipped_ticks; }

private:
    void schedule_next();
    void on_tick();
    void issue_fetch();

    std::shared_ptr<discovery::IEndpointProvider> m_provider;
    discovery::SelectionFilter m_filter;
    std::chrono::milliseconds m_interval;
    boost::asio::steady_timer m_timer;
    std::chrono::steady_clock::time_point m_next_deadline;
    discovery::FetchHandler m_complete;

    // Handlers hold a weak_ptr to this to detect destruction of the loop
    std::shared_ptr<PollLoop*> m_alive;

    bool m_timer_active{false};
    bool m_in_flight{false};
    std::uint64_t m_timer_generation{0};
    std::uint64_t m_fetch_generation{0};
    std::optional<std::chrono::system_clock::time_point> m_last_poll_started;
    std::uint64_t m_ticks{0};
    std::uint64_t m_skipped_ticks{0};
};

}  // namespace beacon::resolver

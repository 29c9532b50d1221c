// beacon/include/beacon/resolver/event_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "beacon/discovery/backend.hpp"

namespace beacon::resolver {

/// @brief Subscription list for backend membership events.
/// Listeners run synchronously, in subscription order, on the emitting
/// thread. A listener that throws is logged and skipped; the remaining
/// listeners still receive the event.
class EventSource {
public:
    using AddedListener = std::function<void(const std::string& key,
                                             const discovery::Backend& backend)>;
    using RemovedListener = std::function<void(const std::string& key)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId on_added(AddedListener listener);
    SubscriptionId on_removed(RemovedListener listener);

    /// @brief Drops a listener. Safe to call from inside a listener.
    bool unsubscribe(SubscriptionId id);

    void emit_added(const std::string& key, const discovery::Backend& backend);
    void emit_removed(const std::string& key);

    /// @brief True while listeners are being invoked.
    bool dispatching() const { return _dispatch_depth > 0; }
    std::size_t listener_count() const {
        return _added.size() + _removed.size();
    }

private:
    template <typename Listener>
    struct Entry {
        SubscriptionId id;
        Listener listener;
    };

    class DispatchScope {
    public:
        explicit DispatchScope(int& depth) : _depth(depth) { ++_depth; }
        ~DispatchScope() { --_depth; }

    private:
        int& _depth;
    };

    std::vector<Entry<AddedListener>> _added;
    std::vector<Entry<RemovedListener>> _removed;
    SubscriptionId _next_id = 1;
    int _dispatch_depth = 0;
};

}  // namespace beacon::resolver

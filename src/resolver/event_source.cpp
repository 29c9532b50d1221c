// beacon/src/resolver/event_source.cpp
#include "beacon/resolver/event_source.hpp"

#include <algorithm>
#include <stdexcept>

#include "beacon/log/logger.hpp"

namespace beacon::resolver {

EventSource::SubscriptionId EventSource::on_added(AddedListener listener) {
    if (!listener) {
        throw std::invalid_argument("added listener must not be empty");
    }
    SubscriptionId id = _next_id++;
    _added.push_back({id, std::move(listener)});
    return id;
}

EventSource::SubscriptionId EventSource::on_removed(RemovedListener listener) {
    if (!listener) {
        throw std::invalid_argument("removed listener must not be empty");
    }
    SubscriptionId id = _next_id++;
    _removed.push_back({id, std::move(listener)});
    return id;
}

bool EventSource::unsubscribe(SubscriptionId id) {
    auto drop = [id](auto& entries) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [id](const auto& e) { return e.id == id; });
        if (it == entries.end()) {
            return false;
        }
        entries.erase(it);
        return true;
    };
    return drop(_added) || drop(_removed);
}

void EventSource::emit_added(const std::string& key,
                             const discovery::Backend& backend) {
    DispatchScope scope(_dispatch_depth);
    // Iterate over a copy so listeners may unsubscribe while dispatching
    auto listeners = _added;
    for (const auto& entry : listeners) {
        try {
            entry.listener(key, backend);
        } catch (const std::exception& e) {
            BEACON_LOG_ERROR << "Exception in 'added' listener " << entry.id
                             << " for backend " << key << ": " << e.what();
        }
    }
}

void EventSource::emit_removed(const std::string& key) {
    DispatchScope scope(_dispatch_depth);
    auto listeners = _removed;
    for (const auto& entry : listeners) {
        try {
            entry.listener(key);
        } catch (const std::exception& e) {
            BEACON_LOG_ERROR << "Exception in 'removed' listener " << entry.id
                             << " for backend " << key << ": " << e.what();
        }
    }
}

}  // namespace beacon::resolver

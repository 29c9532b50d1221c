// beacon/src/discovery/backend_diff.cpp
#include "beacon/discovery/backend_diff.hpp"

#include <map>
#include <stdexcept>

namespace beacon::discovery {

namespace {

constexpr int MAX_KEY_ATTEMPTS = 16;

std::string mint_key(const KeyGenerator& next_key, const BackendSet& previous,
                     const BackendSet& current,
                     const RetiredKeys& retired) {
    for (int attempt = 0; attempt < MAX_KEY_ATTEMPTS; ++attempt) {
        std::string key = next_key();
        if (key.empty() || previous.count(key) || current.count(key) ||
            retired.contains(key)) {
            continue;
        }
        return key;
    }
    throw std::runtime_error("unable to mint an unused backend key after " +
                             std::to_string(MAX_KEY_ATTEMPTS) + " attempts");
}

}  // namespace

RetiredKeys::RetiredKeys(std::size_t capacity) : _capacity(capacity) {}

void RetiredKeys::retire(const std::string& key) {
    if (_capacity == 0 || !_keys.insert(key).second) {
        return;
    }
    _order.push_back(key);
    if (_order.size() > _capacity) {
        _keys.erase(_order.front());
        _order.pop_front();
    }
}

ReconcileResult reconcile(const BackendSet& previous,
                          const std::vector<Endpoint>& discovered,
                          std::uint16_t port, const KeyGenerator& next_key,
                          const RetiredKeys& retired) {
    ReconcileResult result;
    result.discovered = discovered.size();

    // (name, address) -> key of the previously advertised backend
    std::map<Endpoint, std::string> known;
    for (const auto& [key, backend] : previous) {
        known.emplace(Endpoint{backend.name, backend.address}, key);
    }

    std::map<Endpoint, std::string> seen;
    for (const auto& endpoint : discovered) {
        if (seen.count(endpoint)) {
            ++result.duplicates;
            continue;
        }

        std::string key;
        auto it = known.find(endpoint);
        if (it != known.end()) {
            key = it->second;
        } else {
            key = mint_key(next_key, previous, result.backends, retired);
            result.added.push_back(key);
        }

        seen.emplace(endpoint, key);
        result.backends.emplace(
            key, Backend{key, endpoint.name, endpoint.address, port});
    }

    for (const auto& [key, backend] : previous) {
        if (result.backends.find(key) == result.backends.end()) {
            result.removed.push_back(key);
        }
    }

    return result;
}

ReconcileResult reconcile(const BackendSet& previous,
                          const std::vector<Endpoint>& discovered,
                          std::uint16_t port) {
    return reconcile(previous, discovered, port, generate_backend_key);
}

}  // namespace beacon::discovery

// beacon/include/beacon/discovery/backend.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace beacon::discovery {

/// @brief A raw endpoint as reported by the inventory for one fetch.
/// Endpoints carry no identity of their own and are matched by value.
struct Endpoint {
    /// @brief Logical name of the instance, e.g. the VM alias.
    std::string name;
    /// @brief Address of the selected connection point.
    std::string address;

    bool operator==(const Endpoint& other) const {
        return name == other.name && address == other.address;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
    bool operator<(const Endpoint& other) const {
        return name < other.name ||
               (name == other.name && address < other.address);
    }
};

/// @brief An endpoint currently advertised to subscribers.
struct Backend {
    /// @brief Opaque key, stable for as long as (name, address) is reported.
    std::string key;
    std::string name;
    std::string address;
    /// @brief Static port from the resolver configuration.
    std::uint16_t port = 0;

    bool operator==(const Backend& other) const {
        return key == other.key && name == other.name &&
               address == other.address && port == other.port;
    }
};

/// @brief key -> Backend. Replaced as a whole on every reconciliation.
using BackendSet = std::map<std::string, Backend>;

/// @brief A failed fetch, as reported by an endpoint provider.
struct ProviderError {
    std::string message;
    std::chrono::system_clock::time_point time;

    static ProviderError now(std::string message) {
        return ProviderError{std::move(message),
                             std::chrono::system_clock::now()};
    }
};

void to_json(nlohmann::json& j, const Endpoint& e);
void from_json(const nlohmann::json& j, Endpoint& e);
void to_json(nlohmann::json& j, const Backend& b);

}  // namespace beacon::discovery

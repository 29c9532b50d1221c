// beacon/src/discovery/backend.cpp
#include "beacon/discovery/backend.hpp"

namespace beacon::discovery {

void to_json(nlohmann::json& j, const Endpoint& e) {
    j = nlohmann::json{{"name", e.name}, {"address", e.address}};
}

void from_json(const nlohmann::json& j, Endpoint& e) {
    j.at("name").get_to(e.name);
    j.at("address").get_to(e.address);
}

void to_json(nlohmann::json& j, const Backend& b) {
    j = nlohmann::json{{"key", b.key},
                       {"name", b.name},
                       {"address", b.address},
                       {"port", b.port}};
}

}  // namespace beacon::discovery

#include "beacon/discovery/resolver_config.hpp"

#include <regex>
#include <stdexcept>

namespace beacon::discovery {

void ResolverConfig::from_ptree(const boost::property_tree::ptree& pt) {
    url = get_required_value<std::string>(pt, "url");
    tags.vm_tag_name = get_required_value<std::string>(pt, "tags.vm_tag_name");
    tags.vm_tag_value =
        get_required_value<std::string>(pt, "tags.vm_tag_value");
    tags.nic_tag = get_required_value<std::string>(pt, "tags.nic_tag");
    backend_port = get_required_value<int>(pt, "backend_port");
    poll_interval = get_required_value<int>(pt, "poll_interval");
}

void ResolverConfig::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("resolver.url must not be empty");
    }
    if (tags.vm_tag_name.empty()) {
        throw std::invalid_argument(
            "resolver.tags.vm_tag_name must not be empty");
    }
    if (tags.vm_tag_value.empty()) {
        throw std::invalid_argument(
            "resolver.tags.vm_tag_value must not be empty");
    }
    if (tags.nic_tag.empty()) {
        throw std::invalid_argument("resolver.tags.nic_tag must not be empty");
    }
    try {
        std::regex probe(tags.nic_tag);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("resolver.tags.nic_tag is not a valid "
                                    "regular expression: " +
                                    std::string(e.what()));
    }
    if (backend_port <= 0 || backend_port > 65535) {
        throw std::invalid_argument(
            "resolver.backend_port must be in 1..65535");
    }
    if (poll_interval <= 0) {
        throw std::invalid_argument("resolver.poll_interval must be > 0");
    }
}

}  // namespace beacon::discovery

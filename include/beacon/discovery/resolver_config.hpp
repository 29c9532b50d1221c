#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "beacon/config/config.hpp"

namespace beacon::discovery {

// The "resolver" section. Every key is required.
class ResolverConfig : public config::ConfigurationProperties {
public:
    struct Tags {
        std::string vm_tag_name;   // primary selector: tag.<name> ...
        std::string vm_tag_value;  // ... equals this value
        std::string nic_tag;       // regular expression over NIC tags
    };

    std::string url;  // inventory location
    Tags tags;
    int backend_port = 0;
    int poll_interval = 0;  // milliseconds

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "resolver"; }

    std::chrono::milliseconds poll_interval_duration() const {
        return std::chrono::milliseconds(poll_interval);
    }
    std::uint16_t port() const {
        return static_cast<std::uint16_t>(backend_port);
    }
};

}  // namespace beacon::discovery

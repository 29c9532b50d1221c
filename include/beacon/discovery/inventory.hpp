// beacon/include/beacon/discovery/inventory.hpp
#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

#include "beacon/discovery/backend.hpp"
#include "beacon/discovery/resolver_config.hpp"
#include "nlohmann/json.hpp"

namespace beacon::discovery {

/// @brief One network interface of an inventory record.
struct NicRecord {
    std::string nic_tag;
    std::string ip;
};

/// @brief One machine as listed by the inventory.
struct VmRecord {
    std::string alias;
    std::string state;
    std::map<std::string, std::string> tags;
    std::vector<NicRecord> nics;
};

/// @brief Selection criteria handed to an endpoint provider.
struct SelectionFilter {
    std::string tag_name;
    std::string tag_value;
    /// @brief Source text of nic_tag_regex.
    std::string nic_tag_pattern;
    std::regex nic_tag_regex;

    /// @throws std::invalid_argument if the NIC tag pattern does not compile.
    static SelectionFilter from_config(const ResolverConfig& config);

    /// @brief True for running machines whose tag.<tag_name> is tag_value.
    bool matches_vm(const VmRecord& vm) const;
    /// @brief True if the pattern is found anywhere in `nic_tag`.
    bool matches_nic(const std::string& nic_tag) const;

    /// @brief Human readable form for logs, e.g. "state=running,tag.role=db".
    std::string describe() const;
};

/// @brief Applies `filter` to an inventory listing: one Endpoint per
/// matching NIC of every matching machine, in inventory order.
std::vector<Endpoint> select_endpoints(const std::vector<VmRecord>& records,
                                       const SelectionFilter& filter);

void from_json(const nlohmann::json& j, NicRecord& nic);
void from_json(const nlohmann::json& j, VmRecord& vm);

}  // namespace beacon::discovery

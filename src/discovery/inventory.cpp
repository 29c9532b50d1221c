// beacon/src/discovery/inventory.cpp
#include "beacon/discovery/inventory.hpp"

#include <stdexcept>

namespace beacon::discovery {

namespace {

constexpr const char* RUNNING_STATE = "running";

}  // namespace

SelectionFilter SelectionFilter::from_config(const ResolverConfig& config) {
    SelectionFilter filter;
    filter.tag_name = config.tags.vm_tag_name;
    filter.tag_value = config.tags.vm_tag_value;
    filter.nic_tag_pattern = config.tags.nic_tag;
    try {
        filter.nic_tag_regex = std::regex(filter.nic_tag_pattern);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid NIC tag pattern '" +
                                    filter.nic_tag_pattern +
                                    "': " + e.what());
    }
    return filter;
}

bool SelectionFilter::matches_vm(const VmRecord& vm) const {
    if (vm.state != RUNNING_STATE) {
        return false;
    }
    auto it = vm.tags.find(tag_name);
    return it != vm.tags.end() && it->second == tag_value;
}

bool SelectionFilter::matches_nic(const std::string& nic_tag) const {
    return std::regex_search(nic_tag, nic_tag_regex);
}

std::string SelectionFilter::describe() const {
    return std::string("state=") + RUNNING_STATE + ",tag." + tag_name + "=" +
           tag_value + ",nic_tag~/" + nic_tag_pattern + "/";
}

std::vector<Endpoint> select_endpoints(const std::vector<VmRecord>& records,
                                       const SelectionFilter& filter) {
    std::vector<Endpoint> endpoints;
    for (const auto& vm : records) {
        if (!filter.matches_vm(vm)) {
            continue;
        }
        for (const auto& nic : vm.nics) {
            if (filter.matches_nic(nic.nic_tag)) {
                endpoints.push_back(Endpoint{vm.alias, nic.ip});
            }
        }
    }
    return endpoints;
}

void from_json(const nlohmann::json& j, NicRecord& nic) {
    nic.nic_tag = j.value("nic_tag", std::string());
    j.at("ip").get_to(nic.ip);
}

void from_json(const nlohmann::json& j, VmRecord& vm) {
    j.at("alias").get_to(vm.alias);
    j.at("state").get_to(vm.state);

    vm.tags.clear();
    if (j.contains("tags")) {
        for (const auto& [name, value] : j.at("tags").items()) {
            // Inventories may store booleans and numbers as tag values
            vm.tags[name] =
                value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    vm.nics.clear();
    if (j.contains("nics")) {
        vm.nics = j.at("nics").get<std::vector<NicRecord>>();
    }
}

}  // namespace beacon::discovery

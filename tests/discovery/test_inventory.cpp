// tests/discovery/test_inventory.cpp
#define BOOST_TEST_MODULE InventoryTest

#include "beacon/discovery/inventory.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace beacon::discovery;

namespace {

ResolverConfig make_config(const std::string &nic_tag) {
  ResolverConfig config;
  config.url = "file://inventory.json";
  config.tags.vm_tag_name = "manta_role";
  config.tags.vm_tag_value = "postgres";
  config.tags.nic_tag = nic_tag;
  config.backend_port = 5432;
  config.poll_interval = 1000;
  return config;
}

VmRecord make_vm(const std::string &alias, const std::string &state,
                 const std::string &role, std::vector<NicRecord> nics) {
  return VmRecord{alias, state, {{"manta_role", role}}, std::move(nics)};
}

} // namespace

BOOST_AUTO_TEST_SUITE(InventoryTestSuite)

BOOST_AUTO_TEST_CASE(test_selects_matching_nics_of_running_vms) {
  auto filter = SelectionFilter::from_config(make_config("^manta$"));
  std::vector<VmRecord> records = {
      make_vm("db1", "running", "postgres",
              {{"admin", "172.25.0.11"}, {"manta", "10.0.0.1"}}),
      make_vm("db2", "running", "postgres", {{"manta", "10.0.0.2"}}),
  };

  auto endpoints = select_endpoints(records, filter);

  BOOST_REQUIRE_EQUAL(endpoints.size(), 2);
  BOOST_CHECK(endpoints[0] == (Endpoint{"db1", "10.0.0.1"}));
  BOOST_CHECK(endpoints[1] == (Endpoint{"db2", "10.0.0.2"}));
}

BOOST_AUTO_TEST_CASE(test_non_running_vms_are_excluded) {
  auto filter = SelectionFilter::from_config(make_config("manta"));
  std::vector<VmRecord> records = {
      make_vm("db1", "stopped", "postgres", {{"manta", "10.0.0.1"}}),
      make_vm("db2", "provisioning", "postgres", {{"manta", "10.0.0.2"}}),
  };

  BOOST_CHECK(select_endpoints(records, filter).empty());
}

BOOST_AUTO_TEST_CASE(test_tag_value_must_match_exactly) {
  auto filter = SelectionFilter::from_config(make_config("manta"));
  VmRecord untagged{"db3", "running", {}, {{"manta", "10.0.0.3"}}};
  std::vector<VmRecord> records = {
      make_vm("web1", "running", "webapi", {{"manta", "10.0.1.1"}}),
      make_vm("db2", "running", "postgres2", {{"manta", "10.0.0.2"}}),
      untagged,
  };

  BOOST_CHECK(select_endpoints(records, filter).empty());
}

BOOST_AUTO_TEST_CASE(test_nic_pattern_is_a_search_not_a_full_match) {
  auto filter = SelectionFilter::from_config(make_config("manta"));
  BOOST_CHECK(filter.matches_nic("manta"));
  BOOST_CHECK(filter.matches_nic("manta_rack1"));
  BOOST_CHECK(filter.matches_nic("xmanta"));
  BOOST_CHECK(!filter.matches_nic("admin"));

  auto anchored = SelectionFilter::from_config(make_config("^manta$"));
  BOOST_CHECK(anchored.matches_nic("manta"));
  BOOST_CHECK(!anchored.matches_nic("manta_rack1"));
}

BOOST_AUTO_TEST_CASE(test_vm_with_several_matching_nics) {
  auto filter = SelectionFilter::from_config(make_config("manta"));
  std::vector<VmRecord> records = {make_vm(
      "db1", "running", "postgres",
      {{"manta", "10.0.0.1"}, {"manta_rack2", "10.0.2.1"}})};

  auto endpoints = select_endpoints(records, filter);
  BOOST_REQUIRE_EQUAL(endpoints.size(), 2);
  BOOST_CHECK_EQUAL(endpoints[0].name, "db1");
  BOOST_CHECK_EQUAL(endpoints[1].name, "db1");
  BOOST_CHECK_EQUAL(endpoints[1].address, "10.0.2.1");
}

BOOST_AUTO_TEST_CASE(test_invalid_pattern_is_rejected) {
  BOOST_CHECK_THROW(SelectionFilter::from_config(make_config("manta(")),
                    std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_describe) {
  auto filter = SelectionFilter::from_config(make_config("manta"));
  BOOST_CHECK_EQUAL(filter.describe(),
                    "state=running,tag.manta_role=postgres,nic_tag~/manta/");
}

BOOST_AUTO_TEST_CASE(test_parse_vm_record) {
  auto j = nlohmann::json::parse(R"({
    "alias": "db1",
    "state": "running",
    "tags": {"manta_role": "postgres", "shard": 3, "primary": true},
    "nics": [{"nic_tag": "manta", "ip": "10.0.0.1"}, {"ip": "10.9.9.9"}]
  })");

  auto vm = j.get<VmRecord>();
  BOOST_CHECK_EQUAL(vm.alias, "db1");
  BOOST_CHECK_EQUAL(vm.state, "running");
  BOOST_CHECK_EQUAL(vm.tags.at("manta_role"), "postgres");
  BOOST_CHECK_EQUAL(vm.tags.at("shard"), "3");
  BOOST_CHECK_EQUAL(vm.tags.at("primary"), "true");
  BOOST_REQUIRE_EQUAL(vm.nics.size(), 2);
  BOOST_CHECK_EQUAL(vm.nics[0].nic_tag, "manta");
  BOOST_CHECK(vm.nics[1].nic_tag.empty());
}

BOOST_AUTO_TEST_CASE(test_parse_vm_record_without_alias_throws) {
  auto j = nlohmann::json::parse(R"({"state": "running"})");
  BOOST_CHECK_THROW(j.get<VmRecord>(), nlohmann::json::exception);
}

BOOST_AUTO_TEST_SUITE_END()

// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>

#include "beacon/config/config.hpp"

namespace fs = boost::filesystem;

// Creates and cleans up temporary config files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("beacon_test_configs_%%%%");

    ConfigFixture() { fs::create_directories(temp_dir); }

    ~ConfigFixture() { fs::remove_all(temp_dir); }

    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

namespace {

// Minimal properties class with one required and one optional key
class SampleProperties : public beacon::config::ConfigurationProperties {
public:
    std::string name;
    int retries = 3;

    void from_ptree(const boost::property_tree::ptree& pt) override {
        name = get_required_value<std::string>(pt, "name");
        retries = get_value(pt, "retries", retries);
    }

    void validate() const override {
        if (retries < 0) {
            throw std::invalid_argument("sample.retries must be >= 0");
        }
    }

    std::string properties_name() const override { return "sample"; }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_config) {
    const std::string yaml_content = R"(
resolver:
  url: file://inventory.json
  tags:
    vm_tag_name: manta_role
  backend_port: 5432
)";

    fs::path config_path = create_temp_file("nested.yaml", yaml_content);

    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();

    BOOST_CHECK_NO_THROW(config_manager.load_config(
        config_path.string(), beacon::config::ConfigFormat::YAML));

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("resolver.url"),
                      "file://inventory.json");
    BOOST_CHECK_EQUAL(
        config_tree.get<std::string>("resolver.tags.vm_tag_name"),
        "manta_role");
    BOOST_CHECK_EQUAL(config_tree.get<int>("resolver.backend_port"), 5432);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();

    BOOST_CHECK_THROW(
        config_manager.load_config("non_existent_file.yaml",
                                   beacon::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_manager_singleton) {
    auto& config1 = beacon::config::ConfigManager::instance();
    auto& config2 = beacon::config::ConfigManager::instance();

    BOOST_CHECK_EQUAL(&config1, &config2);
}

BOOST_AUTO_TEST_CASE(test_registered_properties_are_populated) {
    fs::path config_path = create_temp_file("sample.yaml", R"(
sample:
  name: primary
)");

    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();
    auto sample = std::make_shared<SampleProperties>();
    config_manager.register_configuration_properties(sample);

    config_manager.load_config(config_path.string(),
                               beacon::config::ConfigFormat::YAML);

    auto loaded = config_manager.get_configuration_properties<SampleProperties>();
    BOOST_REQUIRE(loaded);
    BOOST_CHECK_EQUAL(loaded->name, "primary");
    BOOST_CHECK_EQUAL(loaded->retries, 3);
    BOOST_CHECK_EQUAL(config_manager.get_config_by_name("sample"), sample);
}

BOOST_AUTO_TEST_CASE(test_missing_required_key_fails_load) {
    fs::path config_path = create_temp_file("missing.yaml", R"(
sample:
  retries: 2
)");

    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();
    config_manager.register_configuration_properties(
        std::make_shared<SampleProperties>());

    BOOST_CHECK_THROW(
        config_manager.load_config(config_path.string(),
                                   beacon::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_validation_failure_fails_load) {
    fs::path config_path = create_temp_file("invalid.yaml", R"(
sample:
  name: primary
  retries: -1
)");

    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();
    config_manager.register_configuration_properties(
        std::make_shared<SampleProperties>());

    BOOST_CHECK_THROW(
        config_manager.load_config(config_path.string(),
                                   beacon::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_json_format) {
    fs::path config_path =
        create_temp_file("sample.json", R"({"sample": {"name": "json"}})");

    BOOST_CHECK(beacon::config::format_from_path(config_path.string()) ==
                beacon::config::ConfigFormat::JSON);

    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();
    auto sample = std::make_shared<SampleProperties>();
    config_manager.register_configuration_properties(sample);
    config_manager.load_config(config_path.string(),
                               beacon::config::ConfigFormat::JSON);

    BOOST_CHECK_EQUAL(sample->name, "json");
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    fs::path config_path = create_temp_file("reset_test.yaml", R"(
temp:
  data: should_be_reset
)");
    auto& config_manager = beacon::config::ConfigManager::instance();
    config_manager.reset();

    config_manager.load_config(config_path.string(),
                               beacon::config::ConfigFormat::YAML);
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        "should_be_reset");

    config_manager.reset();
    BOOST_CHECK_THROW(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        boost::property_tree::ptree_bad_path);
}

BOOST_AUTO_TEST_SUITE_END()

#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace beacon::config {

// Configuration file path constants
class ConfigPaths {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "config/beacon.yaml";
};

enum class ConfigFormat { YAML, JSON, INI };

ConfigFormat format_from_path(const std::string& path);

// A named section of the configuration tree, loaded and validated as a unit.
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(
        const boost::property_tree::ptree& pt) = 0;  // Load from property tree
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;  // Name of the section

protected:
    // Helper methods for parsing ptree
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }

    template <typename T>
    T get_required_value(const boost::property_tree::ptree& pt,
                         const std::string& path) {
        try {
            return pt.get<T>(path);
        } catch (const boost::property_tree::ptree_bad_path& e) {
            throw std::runtime_error("Missing required config value: " + path +
                                     ". Error: " + e.what());
        } catch (const boost::property_tree::ptree_bad_data& e) {
            throw std::runtime_error("Malformed config value: " + path +
                                     ". Error: " + e.what());
        }
    }
};

// Configuration manager
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    // Load configuration file and feed every registered section
    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    // Register configuration properties
    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(config_mutex_);
        const std::type_index type_id = std::type_index(typeid(T));
        configs_[type_id] = config;
        config_by_name_[config->properties_name()] = config;
    }

    // Get configuration properties
    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        const std::type_index type_id = std::type_index(typeid(T));
        auto it = configs_.find(type_id);
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    // Get configuration properties by name
    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const {
        auto it = config_by_name_.find(name);
        return (it != config_by_name_.end()) ? it->second : nullptr;
    }

    // Reset all configurations
    void reset() {
        std::lock_guard<std::mutex> lock(config_mutex_);
        configs_.clear();
        config_by_name_.clear();
        config_tree_ = boost::property_tree::ptree();
    }

    // Get raw property_tree node (for debugging)
    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

    // Helper to convert YAML::Node to boost::property_tree::ptree
    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

private:
    ConfigManager() = default;

    std::mutex config_mutex_;  // To protect configs_ and config_tree_
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;

    boost::property_tree::ptree read_tree(const std::string& config_file,
                                          ConfigFormat format);
    void load_component_configs();
};

}  // namespace beacon::config

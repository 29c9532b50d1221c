#include "beacon/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <fstream>

#include "beacon/log/logger.hpp"

namespace beacon::config {

ConfigFormat format_from_path(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child("",
                         yaml_to_ptree(*it));  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::read_tree(
    const std::string& config_file, ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML: {
            YAML::Node yaml_node = YAML::LoadFile(config_file);
            tree = yaml_to_ptree(yaml_node);
            break;
        }
        case ConfigFormat::JSON: {
            std::ifstream ifs(config_file);
            if (!ifs.is_open()) {
                throw std::runtime_error("cannot open " + config_file);
            }
            boost::property_tree::read_json(ifs, tree);
            break;
        }
        case ConfigFormat::INI: {
            std::ifstream ifs(config_file);
            if (!ifs.is_open()) {
                throw std::runtime_error("cannot open " + config_file);
            }
            boost::property_tree::read_ini(ifs, tree);
            break;
        }
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    BEACON_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = read_tree(config_file, format);
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_component_configs();
        BEACON_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        BEACON_LOG_ERROR << "Failed to load config file: " << config_file
                         << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_component_configs() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();

        try {
            // Pass the relevant subtree to the configuration properties
            config->from_ptree(config_tree_.get_child(properties_name));
            config->validate();
            BEACON_LOG_DEBUG << "Loaded configuration for properties: "
                             << properties_name;
        } catch (const boost::property_tree::ptree_bad_path& e) {
            BEACON_LOG_WARN
                << "No configuration found for properties: " << properties_name
                << ", using defaults. Error: " << e.what();
        } catch (const std::exception& e) {
            BEACON_LOG_ERROR << "Failed to load configuration for properties "
                             << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace beacon::config

#include "weave/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <sstream>

#include "weave/log/logger.hpp"

namespace weave::config {

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
            pt.push_back(std::make_pair("", yaml_to_ptree(*it)));
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::parse(std::istream& input,
                                                 ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML:
            tree = yaml_to_ptree(YAML::Load(input));
            break;
        case ConfigFormat::JSON:
            boost::property_tree::read_json(input, tree);
            break;
        case ConfigFormat::INI:
            boost::property_tree::read_ini(input, tree);
            break;
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    WEAVE_LOG_INFO << "Loading config file: " << config_file;

    try {
        std::ifstream ifs(config_file);
        if (!ifs) {
            throw std::runtime_error("cannot open file");
        }
        apply(parse(ifs, format));
        WEAVE_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        WEAVE_LOG_ERROR << "Failed to load config file: " << config_file
                        << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_config_from_string(const std::string& content,
                                            ConfigFormat format) {
    try {
        std::istringstream iss(content);
        apply(parse(iss, format));
    } catch (const std::exception& e) {
        WEAVE_LOG_ERROR << "Failed to parse inline config: " << e.what();
        throw std::runtime_error(std::string("Failed to parse config: ") +
                                 e.what());
    }
}

void ConfigManager::apply(boost::property_tree::ptree tree) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_tree_ = std::move(tree);
    load_component_configs();
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            WEAVE_LOG_WARN << "No configuration found for properties: "
                           << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            WEAVE_LOG_DEBUG << "Loaded configuration for properties: "
                            << properties_name;
        } catch (const std::exception& e) {
            WEAVE_LOG_ERROR << "Failed to load configuration for properties "
                            << properties_name << ": " << e.what();
            throw;
        }
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    configs_.clear();
    config_tree_ = boost::property_tree::ptree();
}

}  // namespace weave::config

// =================================================================
// src/Resub/ConfigParser.cpp
// =================================================================
// Implementation for the YAML defaults file reader.

#include "Resub/ConfigParser.hpp"
#include "Resub/Errors.hpp"
#include "Resub/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace Resub {

ConfigParser::ConfigParser(const std::string& config_path, bool required)
    : m_path(config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        if (required) {
            throw ConfigurationError("Configuration file not found: " + config_path);
        }
        // A missing default file is fine
        return;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse configuration file " + config_path + ": " + e.what());
    }

    if (root.IsNull()) {
        m_loaded = true;
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Configuration file " + config_path + " must contain a mapping");
    }

    for (YAML::const_iterator it = root.begin(); it != root.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;

        if (value.IsScalar()) {
            m_config_values[key] = value.as<std::string>();
        } else if (value.IsSequence()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.IsScalar()) {
                    throw ConfigurationError("Configuration key '" + key + "' must be a list of strings");
                }
                items.push_back(item.as<std::string>());
            }
            m_list_values[key] = items;
        } else if (value.IsNull()) {
            m_list_values[key] = {};
        } else {
            Logger::getInstance().warning("ConfigParser", "Ignoring nested configuration key: " + key, config_path);
        }
    }

    m_loaded = true;
    Logger::getInstance().info("ConfigParser", "Loaded configuration", config_path);
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

std::optional<bool> ConfigParser::getBoolValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it == m_config_values.end()) {
        return std::nullopt;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw ConfigurationError("Configuration key '" + key + "' expects a boolean, got '" + it->second + "'");
}

std::vector<std::string> ConfigParser::getListValue(const std::string& key) const {
    auto list_it = m_list_values.find(key);
    if (list_it != m_list_values.end()) {
        return list_it->second;
    }
    auto scalar_it = m_config_values.find(key);
    if (scalar_it != m_config_values.end()) {
        return {scalar_it->second};
    }
    return {};
}

bool ConfigParser::hasKey(const std::string& key) const {
    return m_config_values.count(key) > 0 || m_list_values.count(key) > 0;
}

} // namespace Resub

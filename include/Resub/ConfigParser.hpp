// =================================================================
// include/Resub/ConfigParser.hpp
// =================================================================
// Defines a reader for the optional YAML defaults file.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Resub {

class ConfigParser {
public:
    /**
     * @brief Constructs an empty configuration (no file).
     */
    ConfigParser() = default;

    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file.
     * @param required When false, a missing file yields an empty configuration.
     *        Throws ConfigurationError if a required file is missing, or if
     *        an existing file is not a valid YAML mapping.
     */
    explicit ConfigParser(const std::string& config_path, bool required = false);

    /**
     * @brief Retrieves a scalar value for a given key.
     * @param key The configuration key (e.g., "log").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a boolean value (true/false, yes/no, on/off, 1/0).
     * @return std::nullopt if the key is absent. Throws ConfigurationError
     *         if the value is not a boolean.
     */
    std::optional<bool> getBoolValue(const std::string& key) const;

    /**
     * @brief Retrieves a sequence of scalars; a single scalar becomes a one-element list.
     */
    std::vector<std::string> getListValue(const std::string& key) const;

    bool hasKey(const std::string& key) const;
    bool isLoaded() const { return m_loaded; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    bool m_loaded = false;
    std::map<std::string, std::string> m_config_values;
    std::map<std::string, std::vector<std::string>> m_list_values;
};

} // namespace Resub

/**
 * @file ConfigurationManager.hpp
 * @brief key=value run configuration files for the hexmosaic tool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include <string>
#include <map>
#include <optional>
#include <vector>

namespace hexmosaic {

/**
 * @brief Configuration file manager for loading and saving run settings
 *
 * Typed getters raise HexMosaicError INVALID_CONFIGURATION, with the key as
 * context, when a present value cannot be parsed.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false if the file cannot be opened
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to HexMosaicConfig, defaults for missing keys
     */
    HexMosaicConfig to_run_config() const;

    /**
     * @brief Load from HexMosaicConfig object
     */
    void from_run_config(const HexMosaicConfig& config);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

    /**
     * @brief Split a value on ';', trimming each item and dropping empty ones
     */
    std::vector<std::string> get_list(const std::string& key) const;

    const std::map<std::string, std::string>& values() const { return config_values_; }

    static HexOrientation parse_orientation(const std::string& text, const std::string& key = "orientation");
    static PersistenceMode parse_mode(const std::string& text, const std::string& key = "mode");
    static Point2D parse_point(const std::string& text, const std::string& key = "origin");

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace hexmosaic

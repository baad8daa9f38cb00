/**
 * @file ConfigurationManager.cpp
 * @brief key=value run configuration files for the hexmosaic tool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConfigurationManager.hpp"
#include "HexMosaicError.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace hexmosaic {

namespace {

std::string trim(std::string text) {
    text.erase(0, text.find_first_not_of(" \t\r"));
    text.erase(text.find_last_not_of(" \t\r") + 1);
    return text;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

[[noreturn]] void fail(const std::string& key, const std::string& message) {
    throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION, message, key);
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    Logger logger("ConfigurationManager");

    // Simple key=value parser
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            logger.warning(filename + ":" + std::to_string(line_number) + ": ignoring line without '='");
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        config_values_[key] = value;
    }

    logger.detailed("Loaded " + std::to_string(config_values_.size()) + " settings from " + filename);
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# HexMosaic run configuration" << std::endl;
    file << "# Feature sources: sources = LABEL=PATH[#LAYER]; LABEL=PATH[#LAYER]" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return static_cast<bool>(file);
}

int ConfigurationManager::get_int(const std::string& key, int default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            fail(key, "trailing characters in integer '" + it->second + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        fail(key, "expected an integer, got '" + it->second + "'");
    }
}

double ConfigurationManager::get_double(const std::string& key, double default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(it->second, &consumed);
        if (consumed != it->second.size()) {
            fail(key, "trailing characters in number '" + it->second + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        fail(key, "expected a number, got '" + it->second + "'");
    }
}

bool ConfigurationManager::get_bool(const std::string& key, bool default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    const std::string value = lowercase(it->second);
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    fail(key, "expected true or false, got '" + it->second + "'");
}

std::vector<std::string> ConfigurationManager::get_list(const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream iss(get_string(key));
    std::string item;
    while (std::getline(iss, item, ';')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

HexOrientation ConfigurationManager::parse_orientation(const std::string& text, const std::string& key) {
    const std::string value = lowercase(trim(text));
    if (value == "pointy" || value == "pointy_top" || value == "pointy-top") return HexOrientation::POINTY_TOP;
    if (value == "flat" || value == "flat_top" || value == "flat-top") return HexOrientation::FLAT_TOP;
    fail(key, "orientation must be 'pointy' or 'flat', got '" + text + "'");
}

PersistenceMode ConfigurationManager::parse_mode(const std::string& text, const std::string& key) {
    const std::string value = lowercase(trim(text));
    if (value == "preview") return PersistenceMode::PREVIEW;
    if (value == "apply") return PersistenceMode::APPLY;
    fail(key, "mode must be 'preview' or 'apply', got '" + text + "'");
}

Point2D ConfigurationManager::parse_point(const std::string& text, const std::string& key) {
    const size_t comma = text.find(',');
    if (comma == std::string::npos) {
        fail(key, "expected X,Y, got '" + text + "'");
    }
    try {
        size_t used_x = 0, used_y = 0;
        const std::string x_text = trim(text.substr(0, comma));
        const std::string y_text = trim(text.substr(comma + 1));
        double x = std::stod(x_text, &used_x);
        double y = std::stod(y_text, &used_y);
        if (used_x != x_text.size() || used_y != y_text.size()) {
            fail(key, "expected X,Y, got '" + text + "'");
        }
        return Point2D(x, y);
    } catch (const std::logic_error&) {
        fail(key, "expected X,Y, got '" + text + "'");
    }
}

HexMosaicConfig ConfigurationManager::to_run_config() const {
    HexMosaicConfig config;

    config.tessellation.hex_edge_length = get_double("hex_edge_length", config.tessellation.hex_edge_length);
    if (has_value("orientation")) {
        config.tessellation.orientation = parse_orientation(get_string("orientation"));
    }
    if (has_value("origin")) {
        config.tessellation.origin = parse_point(get_string("origin"));
    }
    config.tessellation.min_sliver_fraction = get_double("min_sliver_fraction",
                                                         config.tessellation.min_sliver_fraction);
    const int max_tiles = get_int("max_tiles", static_cast<int>(config.tessellation.max_tiles));
    if (max_tiles < 0) {
        fail("max_tiles", "tile cap cannot be negative");
    }
    config.tessellation.max_tiles = static_cast<size_t>(max_tiles);

    if (has_value("mode")) {
        config.mode = parse_mode(get_string("mode"));
    }
    config.num_threads = get_int("num_threads", config.num_threads);
    config.source_timeout = std::chrono::milliseconds(
        get_int("source_timeout_ms", static_cast<int>(config.source_timeout.count())));

    config.log_level = get_int("log_level", config.log_level);
    if (has_value("log_file") && !get_string("log_file").empty()) {
        config.log_file = get_string("log_file");
    }

    return config;
}

void ConfigurationManager::from_run_config(const HexMosaicConfig& config) {
    std::ostringstream edge;
    edge << config.tessellation.hex_edge_length;
    set_value("hex_edge_length", edge.str());
    set_value("orientation", config.tessellation.orientation == HexOrientation::FLAT_TOP ? "flat" : "pointy");

    std::ostringstream origin;
    origin << config.tessellation.origin.x() << "," << config.tessellation.origin.y();
    set_value("origin", origin.str());

    std::ostringstream sliver;
    sliver << config.tessellation.min_sliver_fraction;
    set_value("min_sliver_fraction", sliver.str());
    set_value("max_tiles", std::to_string(config.tessellation.max_tiles));

    set_value("mode", config.mode == PersistenceMode::APPLY ? "apply" : "preview");
    set_value("num_threads", std::to_string(config.num_threads));
    set_value("source_timeout_ms", std::to_string(config.source_timeout.count()));
    set_value("log_level", std::to_string(config.log_level));
    if (config.log_file) {
        set_value("log_file", *config.log_file);
    }
}

} // namespace hexmosaic

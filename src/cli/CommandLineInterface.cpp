/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "HexMosaicError.hpp"
#include "../core/Logger.hpp"
#include <iostream>

#ifndef HEXMOSAIC_VERSION
#define HEXMOSAIC_VERSION "0.0.0"
#endif

namespace hexmosaic {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("hexmosaic",
        "Tessellate an area of interest into hexes and classify each hex\n"
        "from elevation, land-cover polygons and line features.");

    // Inputs
    parser.add_option("profile", "p", "Class profile JSON");
    parser.add_option("boundary", "b", "Area of interest vector file");
    parser.add_option("boundary-layer", "", "Layer in the boundary file");
    parser.add_option("raster", "r", "Elevation raster");
    parser.add_repeatable_option("source", "s", "Feature source LABEL=PATH[#LAYER]");
    parser.add_option("config", "c", "Run configuration file");
    parser.add_option("create-config", "", "Write a default run configuration file");

    // Tessellation
    parser.add_option("hex-size", "e", "Hex edge length");
    parser.add_option("orientation", "", "pointy or flat");
    parser.add_option("origin", "", "Lattice origin X,Y");
    parser.add_option("max-tiles", "", "Tile count cap");
    parser.add_option("min-sliver", "", "Minimum clipped fraction of a full hex");

    // Run
    parser.add_option("mode", "m", "preview or apply");
    parser.add_flag("apply", "", "Apply results to the store");
    parser.add_option("store", "", "JSON attribute store");
    parser.add_option("threads", "j", "Worker threads");
    parser.add_option("source-timeout", "", "Milliseconds per source");
    parser.add_flag("dry-run", "", "Validate without processing");

    // Output
    parser.add_option("audit", "o", "Audit GeoJSON path");
    parser.add_option("summary", "", "Summary JSON path");
    parser.add_flag("include-edges", "", "Add edges to the audit GeoJSON");
    parser.add_option("lines", "", "Traced line paths GeoJSON path");

    // Logging
    parser.add_option("log-level", "", "Verbosity 1-6");
    parser.add_option("log-config", "", "Per-facility levels");
    parser.add_option("log-file", "", "Log file");
    parser.add_flag("version", "v", "Show version information");

    error_ = false;
    if (!parser.parse(argc, argv)) {
        error_ = !parser.help_requested();
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "hexmosaic " << HEXMOSAIC_VERSION << std::endl;
        return false;
    }

    if (auto path = parser.get("create-config")) {
        if (!create_default_config_file(*path)) {
            std::cerr << "Cannot write configuration file: " << *path << std::endl;
            error_ = true;
        } else {
            std::cout << "Wrote default configuration to " << *path << std::endl;
        }
        return false;
    }

    try {
        if (auto path = parser.get("config")) {
            apply_config_file(*path);
        }
        parse_all_options(parser);
    } catch (const HexMosaicError& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        error_ = true;
        return false;
    }

    if (request_.profile_path.empty() || request_.boundary_path.empty()) {
        std::cerr << "Both --profile and --boundary are required (or set profile/boundary in --config)"
                  << std::endl;
        error_ = true;
        return false;
    }

    return true;
}

SourceSpec CommandLineInterface::parse_source(const std::string& text) {
    const size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= text.size()) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION,
                             "feature source must look like LABEL=PATH[#LAYER], got '" + text + "'",
                             "source");
    }

    SourceSpec spec;
    spec.class_label = text.substr(0, eq);
    std::string location = text.substr(eq + 1);
    const size_t hash = location.rfind('#');
    if (hash != std::string::npos) {
        spec.layer = location.substr(hash + 1);
        location = location.substr(0, hash);
    }
    spec.path = location;

    if (spec.path.empty()) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION,
                             "feature source '" + spec.class_label + "' has no path", "source");
    }
    return spec;
}

void CommandLineInterface::apply_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION,
                             "cannot open configuration file", filename);
    }

    request_.config = manager.to_run_config();
    request_.profile_path = manager.get_string("profile", request_.profile_path);
    request_.boundary_path = manager.get_string("boundary", request_.boundary_path);
    request_.boundary_layer = manager.get_string("boundary_layer", request_.boundary_layer);
    if (manager.has_value("raster")) {
        request_.raster_path = manager.get_string("raster");
    }
    for (const auto& item : manager.get_list("sources")) {
        request_.sources.push_back(parse_source(item));
    }
    if (manager.has_value("store")) {
        request_.store_path = manager.get_string("store");
    }
    request_.audit_path = manager.get_string("audit", request_.audit_path);
    request_.summary_path = manager.get_string("summary", request_.summary_path);
    request_.include_edges = manager.get_bool("include_edges", request_.include_edges);
    if (manager.has_value("lines")) {
        request_.lines_path = manager.get_string("lines");
    }
    request_.log_config = manager.get_string("log_config", request_.log_config);
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Command-line values override the configuration file
    ConfigurationManager overrides;
    overrides.from_run_config(request_.config);

    auto copy = [&](const std::string& option, const std::string& key) {
        if (auto value = parser.get(option)) {
            overrides.set_value(key, *value);
        }
    };
    copy("hex-size", "hex_edge_length");
    copy("orientation", "orientation");
    copy("origin", "origin");
    copy("max-tiles", "max_tiles");
    copy("min-sliver", "min_sliver_fraction");
    copy("mode", "mode");
    copy("threads", "num_threads");
    copy("source-timeout", "source_timeout_ms");
    copy("log-level", "log_level");
    copy("log-file", "log_file");
    if (parser.get_flag("apply")) {
        overrides.set_value("mode", "apply");
    }
    request_.config = overrides.to_run_config();

    if (auto value = parser.get("profile")) request_.profile_path = *value;
    if (auto value = parser.get("boundary")) request_.boundary_path = *value;
    if (auto value = parser.get("boundary-layer")) request_.boundary_layer = *value;
    if (auto value = parser.get("raster")) request_.raster_path = *value;
    if (auto value = parser.get("store")) request_.store_path = *value;
    if (auto value = parser.get("audit")) request_.audit_path = *value;
    if (auto value = parser.get("summary")) request_.summary_path = *value;
    if (auto value = parser.get("lines")) request_.lines_path = *value;
    if (auto value = parser.get("log-config")) request_.log_config = *value;
    if (parser.get_flag("include-edges")) request_.include_edges = true;

    for (const auto& text : parser.get_all("source")) {
        request_.sources.push_back(parse_source(text));
    }

    dry_run_ = parser.get_flag("dry-run");
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) const {
    ConfigurationManager manager;
    manager.from_run_config(HexMosaicConfig());
    manager.set_value("profile", "profile.json");
    manager.set_value("boundary", "aoi.gpkg");
    manager.set_value("raster", "dem.tif");
    manager.set_value("sources", "Forest=landcover.gpkg#forest; Water=water.gpkg; River=rivers.gpkg");
    manager.set_value("audit", request_.audit_path);
    manager.set_value("summary", request_.summary_path);
    manager.set_value("include_edges", "false");
    return manager.save_to_file(filename);
}

void CommandLineInterface::print_config() const {
    const HexMosaicConfig& config = request_.config;
    if (config.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Profile: " << request_.profile_path << "\n";
    std::cout << "Boundary: " << request_.boundary_path;
    if (!request_.boundary_layer.empty()) std::cout << " (layer " << request_.boundary_layer << ")";
    std::cout << "\n";
    std::cout << "Raster: " << request_.raster_path.value_or("none") << "\n";
    for (const auto& source : request_.sources) {
        std::cout << "Source: " << source.class_label << " <- " << source.path;
        if (!source.layer.empty()) std::cout << "#" << source.layer;
        std::cout << "\n";
    }
    std::cout << "Hex edge length: " << config.tessellation.hex_edge_length << "\n";
    std::cout << "Orientation: "
              << (config.tessellation.orientation == HexOrientation::FLAT_TOP ? "flat" : "pointy") << "\n";
    std::cout << "Max tiles: " << config.tessellation.max_tiles << "\n";
    std::cout << "Mode: " << (config.mode == PersistenceMode::APPLY ? "apply" : "preview") << "\n";
    std::cout << "Store: " << request_.store_path.value_or("none") << "\n";
    std::cout << "Threads: " << (config.num_threads > 0 ? std::to_string(config.num_threads) : "auto") << "\n";
    std::cout << "Audit output: " << request_.audit_path << "\n";
    std::cout << "Summary output: " << request_.summary_path << "\n";
    std::cout << "Line paths output: " << request_.lines_path.value_or("none") << "\n";
    std::cout << "===================\n\n";
}

} // namespace hexmosaic

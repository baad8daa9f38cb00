/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the hexmosaic tool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief One feature source named on the command line or in the run file
 */
struct SourceSpec {
    std::string class_label;
    std::string path;
    std::string layer;       ///< Empty means the first layer
};

/**
 * @brief Everything the tool needs for one run
 */
struct RunRequest {
    HexMosaicConfig config;
    std::string profile_path;
    std::string boundary_path;
    std::string boundary_layer;
    std::optional<std::string> raster_path;
    std::vector<SourceSpec> sources;
    std::optional<std::string> store_path;
    std::string audit_path = "hexmosaic_audit.geojson";
    std::string summary_path = "hexmosaic_summary.json";
    bool include_edges = false;
    std::optional<std::string> lines_path;   ///< Traced line paths GeoJSON, written when set
    std::string log_config;
};

/**
 * @brief Command line interface for parsing arguments into a run request
 *
 * Values come from the optional --config file first; command-line options
 * override them.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a run should proceed; false after help, version,
     *         --create-config or a usage error
     */
    bool parse_arguments(int argc, char* argv[]);

    const RunRequest& get_request() const { return request_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief True when parsing stopped on an error rather than help or version
     */
    bool has_error() const { return error_; }

    void print_config() const;

    /**
     * @brief Parse LABEL=PATH[#LAYER]
     * @throws HexMosaicError INVALID_CONFIGURATION on malformed text
     */
    static SourceSpec parse_source(const std::string& text);

private:
    RunRequest request_;
    bool dry_run_ = false;
    bool error_ = false;

    void apply_config_file(const std::string& filename);
    void parse_all_options(const SimpleCommandLineParser& parser);
    bool create_default_config_file(const std::string& filename) const;
};

} // namespace hexmosaic

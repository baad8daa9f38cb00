/**
 * @file InputValidator.cpp
 * @brief Implementation of run configuration validation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "InputValidator.hpp"
#include "HexMosaicError.hpp"
#include <sstream>
#include <cmath>

namespace hexmosaic {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid run configuration:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

std::string ValidationResult::involved_keys() const {
    std::string keys;
    for (const auto& conflict : conflicts) {
        for (const auto& param : conflict.involved_params) {
            if (!keys.empty()) keys += ", ";
            keys += param;
        }
    }
    return keys;
}

ValidationResult InputValidator::validate(const HexMosaicConfig& config, bool has_store) const {
    ValidationResult result;
    result.is_valid = true;

    auto geometry_conflict = check_hex_geometry(config);
    if (geometry_conflict) {
        result.conflicts.push_back(*geometry_conflict);
        result.is_valid = false;
    }

    auto limits_conflict = check_tile_limits(config);
    if (limits_conflict) {
        result.conflicts.push_back(*limits_conflict);
        result.is_valid = false;
    }

    auto execution_conflict = check_execution(config);
    if (execution_conflict) {
        result.conflicts.push_back(*execution_conflict);
        result.is_valid = false;
    }

    auto store_conflict = check_mode_store(config, has_store);
    if (store_conflict) {
        result.conflicts.push_back(*store_conflict);
        result.is_valid = false;
    }

    return result;
}

void InputValidator::require_valid(const HexMosaicConfig& config, bool has_store) const {
    ValidationResult result = validate(config, has_store);
    if (result.has_errors()) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION,
                             result.format_error_message(), result.involved_keys());
    }
}

std::optional<ParameterConflict> InputValidator::check_hex_geometry(const HexMosaicConfig& config) const {
    const TessellationConfig& tess = config.tessellation;

    if (!std::isfinite(tess.hex_edge_length) || tess.hex_edge_length <= 0.0) {
        ParameterConflict conflict;
        std::ostringstream desc;
        desc << "Hex edge length must be a positive finite distance (got "
             << tess.hex_edge_length << ")";
        conflict.description = desc.str();
        conflict.involved_params = {"hex_edge_length = " + std::to_string(tess.hex_edge_length)};
        conflict.suggestions = {
            "Give the edge length in the boundary CRS units, e.g. 500 for 500 m hexes",
            "Use a projected CRS; geographic degrees give degenerate hexes"
        };
        return conflict;
    }

    if (!std::isfinite(tess.origin.x()) || !std::isfinite(tess.origin.y())) {
        ParameterConflict conflict;
        conflict.description = "Lattice origin must have finite coordinates";
        conflict.involved_params = {"origin"};
        conflict.suggestions = {"Omit the origin to anchor the lattice at (0, 0)"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_tile_limits(const HexMosaicConfig& config) const {
    const TessellationConfig& tess = config.tessellation;

    if (tess.max_tiles == 0) {
        ParameterConflict conflict;
        conflict.description = "Tile cap of zero rejects every tessellation";
        conflict.involved_params = {"max_tiles = 0"};
        conflict.suggestions = {"Raise max_tiles (default 250000)"};
        return conflict;
    }

    if (!(tess.min_sliver_fraction >= 0.0) || tess.min_sliver_fraction >= 1.0) {
        ParameterConflict conflict;
        std::ostringstream desc;
        desc << "Sliver fraction must lie in [0, 1) (got " << tess.min_sliver_fraction << ")";
        conflict.description = desc.str();
        conflict.involved_params = {"min_sliver_fraction = " + std::to_string(tess.min_sliver_fraction)};
        conflict.suggestions = {
            "Use a small value such as 1e-6 to drop only numerical slivers",
            "Use 0 to keep every clipped fragment"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_execution(const HexMosaicConfig& config) const {
    ParameterConflict conflict;

    if (config.num_threads < 0) {
        conflict.involved_params.push_back("num_threads = " + std::to_string(config.num_threads));
        conflict.suggestions.push_back("Use 0 to let TBB choose the thread count");
    }
    if (config.source_timeout.count() <= 0) {
        conflict.involved_params.push_back("source_timeout_ms = " + std::to_string(config.source_timeout.count()));
        conflict.suggestions.push_back("Use a positive timeout, e.g. 30000 ms");
    }
    if (config.log_level < 1 || config.log_level > 6) {
        conflict.involved_params.push_back("log_level = " + std::to_string(config.log_level));
        conflict.suggestions.push_back("Use a log level from 1 (errors) to 6 (trace)");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Execution parameters out of range";
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_mode_store(const HexMosaicConfig& config, bool has_store) const {
    if (config.mode != PersistenceMode::APPLY || has_store) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Apply mode requested without an attribute store";
    conflict.involved_params = {"mode = apply"};
    conflict.suggestions = {
        "Supply an attribute store to write to",
        "Use preview mode to produce only the audit artifact"
    };
    return conflict;
}

} // namespace hexmosaic

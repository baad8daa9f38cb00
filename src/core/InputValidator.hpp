/**
 * @file InputValidator.hpp
 * @brief Run configuration validation for contradictory or out-of-range parameters
 *
 * Validates a run configuration before any work starts and reports every
 * problem at once, with suggested fixes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include <string>
#include <vector>
#include <optional>

namespace hexmosaic {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;

    /**
     * @brief Comma-separated parameters of every conflict
     */
    std::string involved_keys() const;
};

/**
 * @brief Validates run configuration parameters
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @param has_store Whether an attribute store was supplied for the run
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const HexMosaicConfig& config, bool has_store = true) const;

    /**
     * @brief Validate and raise INVALID_CONFIGURATION listing every conflict
     * @throws HexMosaicError with the formatted conflicts and the involved keys as context
     */
    void require_valid(const HexMosaicConfig& config, bool has_store = true) const;

private:
    std::optional<ParameterConflict> check_hex_geometry(const HexMosaicConfig& config) const;

    std::optional<ParameterConflict> check_tile_limits(const HexMosaicConfig& config) const;

    std::optional<ParameterConflict> check_execution(const HexMosaicConfig& config) const;

    /**
     * @brief Apply mode needs somewhere to write
     */
    std::optional<ParameterConflict> check_mode_store(const HexMosaicConfig& config, bool has_store) const;
};

} // namespace hexmosaic

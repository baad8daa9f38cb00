#pragma once

/**
 * @file HexMosaicError.hpp
 * @brief Run-terminating error raised by the classification core
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hexmosaic.hpp"

#include <stdexcept>
#include <string>

namespace hexmosaic {

/**
 * @brief Error taxonomy
 *
 * Every kind is terminal for the run in which it occurs. Per-tile problems
 * never raise; they degrade confidence and are recorded in the rationale.
 */
enum class ErrorKind {
    INVALID_BOUNDARY,
    INVALID_CONFIGURATION,
    TESSELLATION_TOO_LARGE,
    COORDINATE_SYSTEM_MISMATCH,
    PERSISTENCE_FAILURE,
    CANCELLED,
    SOURCE_STALLED
};

const char* to_string(ErrorKind kind);

/**
 * @brief Exception carrying the error kind, the phase and reproduction context
 *
 * The context names what to look at: a configuration key, a tile id or a
 * feature id.
 */
class HexMosaicError : public std::runtime_error {
public:
    HexMosaicError(ErrorKind kind, Phase phase, const std::string& message,
                   const std::string& context = "")
        : std::runtime_error(std::string(to_string(kind)) + " during " + to_string(phase) +
                             ": " + message + (context.empty() ? "" : " [" + context + "]")),
          kind_(kind), phase_(phase), message_(message), context_(context) {}

    ErrorKind kind() const { return kind_; }
    Phase phase() const { return phase_; }
    const std::string& message() const { return message_; }
    const std::string& context() const { return context_; }

private:
    ErrorKind kind_;
    Phase phase_;
    std::string message_;
    std::string context_;
};

} // namespace hexmosaic

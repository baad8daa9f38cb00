/**
 * @file HexMosaicError.cpp
 * @brief Names for error kinds and pipeline phases
 */

#include "HexMosaicError.hpp"

namespace hexmosaic {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_BOUNDARY: return "InvalidBoundary";
        case ErrorKind::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case ErrorKind::TESSELLATION_TOO_LARGE: return "TessellationTooLarge";
        case ErrorKind::COORDINATE_SYSTEM_MISMATCH: return "CoordinateSystemMismatch";
        case ErrorKind::PERSISTENCE_FAILURE: return "PersistenceFailure";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::SOURCE_STALLED: return "SourceStalled";
    }
    return "Unknown";
}

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::VALIDATION: return "validation";
        case Phase::TESSELLATION: return "tessellation";
        case Phase::SAMPLING: return "sampling";
        case Phase::SCORING: return "scoring";
        case Phase::CLEANUP: return "cleanup";
        case Phase::PERSISTENCE: return "persistence";
    }
    return "unknown";
}

} // namespace hexmosaic

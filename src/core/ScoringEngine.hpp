/**
 * @file ScoringEngine.hpp
 * @brief Weighted scoring and tie-break classification of sampled tiles
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "ClassProfile.hpp"
#include "EvidenceSampler.hpp"
#include "Logger.hpp"
#include "ParallelExecutor.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief How a tile's label was decided
 *
 * A dominant class with low confidence stays distinguishable from Mixed.
 */
enum class Outcome {
    DOMINANT,
    DOMINANT_LOW_CONFIDENCE,
    WATER_OVERRIDE,
    MIXED,
    UNKNOWN,
    REASSIGNED
};

const char* to_string(Outcome outcome);

struct ClassScore {
    size_t class_index = 0;
    std::string label;
    double score = 0.0;
    EvidenceVector evidence;
};

/**
 * @brief Audit trail of one tile's classification
 */
struct Rationale {
    std::vector<ClassScore> scores;          ///< Every class with evidence, by class index
    std::string rule;                        ///< Decision rule that fired
    std::vector<std::string> notes;          ///< Missing elevation and similar degradations
    std::vector<std::string> cleanup_notes;  ///< Appended by CleanupPass

    double score_of(size_t class_index) const;
};

struct ClassificationResult {
    TileId tile = 0;
    std::optional<size_t> class_index;       ///< None for Mixed and Unknown
    std::string tile_type;
    Outcome outcome = Outcome::UNKNOWN;
    std::optional<double> elevation_tier;
    std::optional<double> elevation;         ///< Representative elevation
    double confidence = 0.0;
    Rationale rationale;
};

void to_json(nlohmann::json& j, const Rationale& rationale);
void to_json(nlohmann::json& j, const ClassificationResult& result);

/**
 * @brief Elevation tier floor(value / size) * size, snapped to an integer
 *        when within 1e-6 of one
 */
double elevation_tier(double value, double tier_size);

class ScoringEngine {
public:
    ScoringEngine(const ClassProfile& profile, const ParallelExecutor& executor);

    /**
     * @brief Combined weighted score of one evidence vector
     */
    double score(const EvidenceVector& evidence) const;

    /**
     * @brief Classify one tile; never throws for tile content
     *
     * Evidence of an area class whose area fraction is below the class's
     * area_threshold is dropped before scoring and noted in the rationale.
     */
    ClassificationResult classify(const TileEvidence& sampled) const;

    /**
     * @brief Classify every tile in parallel, results indexed by tile id
     */
    std::vector<ClassificationResult> classify_all(const std::vector<TileEvidence>& evidence,
                                                   const CancellationToken* cancel = nullptr,
                                                   const ProgressCallback& progress = nullptr) const;

private:
    const ClassProfile& profile_;
    const ParallelExecutor& executor_;
    Logger logger_;

    /**
     * @brief Water override check; returns the rule name when it fires
     */
    std::optional<std::string> water_override(const TileEvidence& evidence) const;

    std::optional<double> area_threshold(size_t class_index) const;
};

} // namespace hexmosaic

/**
 * @file PersistenceManager.hpp
 * @brief Transactional application and preview of classification results
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "AttributeStore.hpp"
#include "CleanupPass.hpp"
#include "EvidenceSampler.hpp"
#include "HexTessellator.hpp"
#include "Logger.hpp"
#include "ScoringEngine.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief Before/after record of one tile
 */
struct AuditRecord {
    TileId tile = 0;
    AxialCoord axial;
    std::optional<TileAttributes> before;  ///< Committed attributes when the run started
    TileAttributes after;
    Rationale rationale;
};

struct AuditArtifact {
    PersistenceMode mode = PersistenceMode::PREVIEW;
    bool applied = false;                 ///< True once the store committed
    std::vector<AuditRecord> records;     ///< Ascending tile id
};

void to_json(nlohmann::json& j, const AuditRecord& record);
void to_json(nlohmann::json& j, const AuditArtifact& artifact);

/**
 * @brief Aggregate report of one run
 */
struct RunSummary {
    PersistenceMode mode = PersistenceMode::PREVIEW;
    size_t tile_count = 0;
    std::map<std::string, size_t> class_counts;   ///< Includes Mixed and Unknown
    std::array<size_t, 10> confidence_histogram{};
    std::vector<Reassignment> reassignments;
    int cleanup_passes = 0;
    bool cleanup_converged = true;
    size_t tiles_without_elevation = 0;
    size_t mixed_tiles = 0;
    size_t unknown_tiles = 0;
    size_t line_paths = 0;                         ///< Line features traced onto the tiles
    std::vector<std::string> warnings;
    std::vector<IgnoredSource> ignored_sources;
    nlohmann::json phase_timings = nlohmann::json::object();
    double elapsed_seconds = 0.0;
};

void to_json(nlohmann::json& j, const RunSummary& summary);

const char* to_string(PersistenceMode mode);

/**
 * @brief Histogram bucket of a confidence value, min(9, floor(c * 10))
 */
size_t confidence_bucket(double confidence);

/**
 * @brief Attributes written for a classification result
 */
TileAttributes to_attributes(const ClassificationResult& result);

class PersistenceManager {
public:
    explicit PersistenceManager(AttributeStore& store);

    /**
     * @brief Build the audit artifact without touching the store
     *
     * @throws HexMosaicError CANCELLED when the token fires
     */
    AuditArtifact preview(const Tessellation& tessellation,
                          const std::vector<ClassificationResult>& results,
                          const CancellationToken* cancel = nullptr,
                          const ProgressCallback& progress = nullptr) const;

    /**
     * @brief Write all results in one transaction
     *
     * Writes happen in tile id order on the calling thread. Any write or
     * commit failure, or cancellation before commit, rolls the transaction
     * back so the store keeps its previous state.
     *
     * @throws HexMosaicError PERSISTENCE_FAILURE or CANCELLED
     */
    AuditArtifact apply(const Tessellation& tessellation,
                        const std::vector<ClassificationResult>& results,
                        const CancellationToken* cancel = nullptr,
                        const ProgressCallback& progress = nullptr);

    /**
     * @brief Aggregate counters over the final results
     */
    static RunSummary summarize(const std::vector<ClassificationResult>& results,
                                const CleanupReport& cleanup,
                                const std::vector<IgnoredSource>& ignored_sources);

private:
    AttributeStore& store_;
    Logger logger_;

    AuditRecord make_record(const Tessellation& tessellation, const ClassificationResult& result) const;
};

} // namespace hexmosaic

/**
 * @file HexMosaicEngine.hpp
 * @brief One classification run from boundary to persisted attributes
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "AttributeStore.hpp"
#include "ClassProfile.hpp"
#include "FeatureSource.hpp"
#include "HexTessellator.hpp"
#include "LineTracer.hpp"
#include "PersistenceManager.hpp"
#include "PhaseTracker.hpp"
#include "ScoringEngine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Resolved inputs of one run
 *
 * Sources are drained by the run. The store is required in apply mode and
 * read for the "before" side of the audit in both modes.
 */
struct RunInputs {
    PolygonData boundary;
    std::string crs;
    std::vector<std::unique_ptr<FeatureSource>> sources;
    std::optional<ElevationRaster> raster;
    AttributeStore* store = nullptr;
};

struct RunOutcome {
    std::unique_ptr<Tessellation> tessellation;
    std::vector<ClassificationResult> results;   ///< Indexed by tile id
    std::vector<TracedLine> line_paths;          ///< Line features traced onto the tiles
    AuditArtifact artifact;
    RunSummary summary;
};

/**
 * @brief Runs tessellation, sampling, scoring, cleanup and persistence in order
 *
 * The configuration and profile are fixed at construction. Each call to
 * run() is independent; any HexMosaicError aborts the run after it has been
 * logged with its kind, phase and context.
 */
class HexMosaicEngine {
public:
    HexMosaicEngine(const HexMosaicConfig& config, const ClassProfile& profile);
    ~HexMosaicEngine();

    HexMosaicEngine(const HexMosaicEngine&) = delete;
    HexMosaicEngine& operator=(const HexMosaicEngine&) = delete;

    RunOutcome run(RunInputs& inputs,
                   const CancellationToken* cancel = nullptr,
                   const ProgressCallback& progress = nullptr);

    const HexMosaicConfig& config() const;
    const ClassProfile& profile() const;

    /**
     * @brief Phase timings of the most recent run
     */
    const PhaseTracker& tracker() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hexmosaic

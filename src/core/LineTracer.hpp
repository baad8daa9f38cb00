/**
 * @file LineTracer.hpp
 * @brief Hex paths for line class features
 *
 * Walks each line feature in fixed steps, locates the lattice cell under
 * every sample and bridges skipped cells with a lattice line, so the tiles
 * crossed form a chain of neighbours. CENTERLINE classes become polylines
 * through the tile centroids; EDGE classes become the shared edges between
 * consecutive tiles.
 */

#pragma once

#include "hexmosaic.hpp"
#include "ClassProfile.hpp"
#include "EvidenceSampler.hpp"
#include "HexTessellator.hpp"
#include "Logger.hpp"
#include "ParallelExecutor.hpp"

#include <cstdint>
#include <vector>

namespace hexmosaic {

struct TracedLine {
    size_t class_index = 0;
    std::int64_t feature_id = 0;
    LineSnap snap = LineSnap::CENTERLINE;
    std::vector<TileId> tiles;     ///< Tiles crossed in travel order, no immediate repeats
    std::vector<EdgeId> edges;     ///< Shared edges in first-crossing order, EDGE snap only
    std::vector<LineData> paths;   ///< Centroid polylines, or one segment per shared edge

    bool empty() const { return paths.empty(); }
};

class LineTracer {
public:
    LineTracer(const ClassProfile& profile, const ParallelExecutor& executor);

    /**
     * @brief Trace every feature; features crossing fewer than two tiles are dropped
     */
    std::vector<TracedLine> trace_all(const Tessellation& tessellation,
                                      const std::vector<SampledLine>& lines,
                                      const CancellationToken* cancel = nullptr) const;

    TracedLine trace(const Tessellation& tessellation, const SampledLine& line) const;

    /**
     * @brief Sample spacing for a class: its trace_step, else a quarter edge
     *
     * Never below 1% of the edge length.
     */
    double step_length(const Tessellation& tessellation, size_t class_index) const;

private:
    const ClassProfile& profile_;
    const ParallelExecutor& executor_;
    Logger logger_;

    std::vector<AxialCoord> walk(const HexLayout& layout, const LineData& line, double step) const;
};

} // namespace hexmosaic

/**
 * @file CleanupPass.hpp
 * @brief Neighbour-majority smoothing of low-confidence tiles
 *
 * Each pass reads a frozen snapshot of the previous pass, computes all
 * reassignment decisions in parallel against it, then applies them to build
 * the next snapshot. Passes repeat until one changes nothing or the pass
 * limit is reached.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "ClassProfile.hpp"
#include "Logger.hpp"
#include "ParallelExecutor.hpp"
#include "ScoringEngine.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

struct Reassignment {
    TileId tile = 0;
    std::string from;
    std::string to;
    int pass = 0;
    double neighbor_fraction = 0.0;
    double confidence_before = 0.0;
    double confidence_after = 0.0;
};

void to_json(nlohmann::json& j, const Reassignment& reassignment);

struct CleanupReport {
    std::vector<Reassignment> reassignments;
    int passes = 0;          ///< Passes executed, including the final unchanged one
    bool converged = true;
};

class CleanupPass {
public:
    CleanupPass(const ClassProfile& profile, const ParallelExecutor& executor);

    /**
     * @brief Smooth results in place
     *
     * @param results Classification results indexed by tile id
     * @param adjacency Existing neighbour ids per tile id
     */
    CleanupReport run(std::vector<ClassificationResult>& results,
                      const std::vector<std::vector<TileId>>& adjacency,
                      const CancellationToken* cancel = nullptr,
                      const ProgressCallback& progress = nullptr) const;

private:
    struct Decision {
        bool reassign = false;
        size_t class_index = 0;
        double fraction = 0.0;
    };

    const ClassProfile& profile_;
    const ParallelExecutor& executor_;
    Logger logger_;

    Decision decide(TileId tile, const std::vector<ClassificationResult>& snapshot,
                    const std::vector<std::vector<TileId>>& adjacency) const;
};

} // namespace hexmosaic

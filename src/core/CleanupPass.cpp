/**
 * @file CleanupPass.cpp
 * @brief Neighbour-majority smoothing of low-confidence tiles
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CleanupPass.hpp"

#include <sstream>

namespace hexmosaic {

void to_json(nlohmann::json& j, const Reassignment& reassignment) {
    j = nlohmann::json{
        {"tile", reassignment.tile},
        {"from", reassignment.from},
        {"to", reassignment.to},
        {"pass", reassignment.pass},
        {"neighbor_fraction", reassignment.neighbor_fraction},
        {"confidence_before", reassignment.confidence_before},
        {"confidence_after", reassignment.confidence_after}
    };
}

CleanupPass::CleanupPass(const ClassProfile& profile, const ParallelExecutor& executor)
    : profile_(profile), executor_(executor), logger_("CleanupPass") {
}

CleanupPass::Decision CleanupPass::decide(TileId tile, const std::vector<ClassificationResult>& snapshot,
                                          const std::vector<std::vector<TileId>>& adjacency) const {
    Decision decision;
    const ClassificationResult& current = snapshot[tile];
    const CleanupParameters& params = profile_.cleanup();

    // High-confidence tiles are never reassigned
    if (current.confidence >= params.low_confidence_threshold) {
        return decision;
    }

    const std::vector<TileId>& neighbors = adjacency[tile];
    if (neighbors.empty()) {
        return decision;
    }

    std::vector<size_t> counts(profile_.class_count(), 0);
    for (TileId neighbor : neighbors) {
        if (snapshot[neighbor].class_index) {
            counts[*snapshot[neighbor].class_index]++;
        }
    }

    size_t best = 0;
    size_t best_count = 0;
    for (size_t index : profile_.priority_order()) {
        if (counts[index] > best_count) {
            best = index;
            best_count = counts[index];
        }
    }
    if (best_count == 0) {
        return decision;
    }

    const double fraction = static_cast<double>(best_count) / static_cast<double>(neighbors.size());
    if (fraction < params.neighbor_majority_threshold) {
        return decision;
    }
    if (current.class_index && *current.class_index == best) {
        return decision;
    }

    decision.reassign = true;
    decision.class_index = best;
    decision.fraction = fraction;
    return decision;
}

CleanupReport CleanupPass::run(std::vector<ClassificationResult>& results,
                               const std::vector<std::vector<TileId>>& adjacency,
                               const CancellationToken* cancel,
                               const ProgressCallback& progress) const {
    CleanupReport report;
    const CleanupParameters& params = profile_.cleanup();
    const size_t count = results.size();

    if (count == 0 || params.max_passes == 0) {
        logger_.detailed("Cleanup skipped (" + std::to_string(count) + " tiles, max_passes " +
                         std::to_string(params.max_passes) + ")");
        return report;
    }

    std::vector<ClassificationResult> snapshot = results;
    std::vector<Decision> decisions(count);

    for (int pass = 1; pass <= params.max_passes; ++pass) {
        ProgressReporter reporter(progress, Phase::CLEANUP, count);
        executor_.for_each(count, Phase::CLEANUP, cancel, &reporter, [&](size_t i) {
            decisions[i] = decide(static_cast<TileId>(i), snapshot, adjacency);
        });
        reporter.finish();

        std::vector<ClassificationResult> next = snapshot;
        size_t changed = 0;

        for (size_t i = 0; i < count; ++i) {
            const Decision& decision = decisions[i];
            if (!decision.reassign) continue;

            ClassificationResult& tile = next[i];
            const std::string& label = profile_.class_at(decision.class_index).label;
            const double own = tile.rationale.score_of(decision.class_index);
            const double blended = params.blend_weight * own + (1.0 - params.blend_weight) * decision.fraction;

            Reassignment entry;
            entry.tile = tile.tile;
            entry.from = tile.tile_type;
            entry.to = label;
            entry.pass = pass;
            entry.neighbor_fraction = decision.fraction;
            entry.confidence_before = tile.confidence;
            entry.confidence_after = blended;

            std::ostringstream note;
            note << "pass " << pass << ": " << tile.tile_type << " -> " << label
                 << ", neighbour share " << decision.fraction << " >= "
                 << params.neighbor_majority_threshold << ", confidence "
                 << tile.confidence << " -> " << blended;
            tile.rationale.cleanup_notes.push_back(note.str());

            tile.class_index = decision.class_index;
            tile.tile_type = label;
            tile.outcome = Outcome::REASSIGNED;
            tile.confidence = blended;

            report.reassignments.push_back(std::move(entry));
            changed++;
        }

        snapshot = std::move(next);
        report.passes = pass;
        logger_.debug("Pass " + std::to_string(pass) + ": " + std::to_string(changed) + " tiles reassigned");

        if (changed == 0) {
            report.converged = true;
            break;
        }
        if (pass == params.max_passes) {
            report.converged = false;
            logger_.warning("Cleanup stopped after " + std::to_string(pass) +
                            " passes without converging; keeping the partial result");
        }
    }

    results = std::move(snapshot);
    logger_.info("Cleanup reassigned " + std::to_string(report.reassignments.size()) + " tiles in " +
                 std::to_string(report.passes) + " passes");
    return report;
}

} // namespace hexmosaic

/**
 * @file PersistenceManager.cpp
 * @brief Transactional application and preview of classification results
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PersistenceManager.hpp"
#include "HexMosaicError.hpp"
#include "ParallelExecutor.hpp"

#include <algorithm>
#include <cmath>

namespace hexmosaic {

using json = nlohmann::json;

const char* to_string(PersistenceMode mode) {
    return mode == PersistenceMode::APPLY ? "apply" : "preview";
}

size_t confidence_bucket(double confidence) {
    if (!(confidence > 0.0)) {
        return 0;
    }
    return std::min<size_t>(9, static_cast<size_t>(std::floor(confidence * 10.0)));
}

TileAttributes to_attributes(const ClassificationResult& result) {
    TileAttributes attributes;
    attributes.tile_type = result.tile_type;
    attributes.elevation_tier = result.elevation_tier;
    attributes.elevation = result.elevation;
    attributes.confidence = result.confidence;
    attributes.outcome = to_string(result.outcome);
    return attributes;
}

void to_json(json& j, const AuditRecord& record) {
    j = json{
        {"tile", record.tile},
        {"q", record.axial.q},
        {"r", record.axial.r},
        {"after", record.after},
        {"rationale", record.rationale}
    };
    j["before"] = record.before ? json(*record.before) : json(nullptr);
}

void to_json(json& j, const AuditArtifact& artifact) {
    j = json{
        {"mode", to_string(artifact.mode)},
        {"applied", artifact.applied},
        {"records", artifact.records}
    };
}

void to_json(json& j, const RunSummary& summary) {
    json ignored = json::array();
    for (const auto& source : summary.ignored_sources) {
        ignored.push_back({
            {"source", source.source},
            {"class", source.class_label},
            {"reason", source.reason}
        });
    }

    j = json{
        {"mode", to_string(summary.mode)},
        {"tile_count", summary.tile_count},
        {"class_counts", summary.class_counts},
        {"confidence_histogram", summary.confidence_histogram},
        {"reassignments", summary.reassignments},
        {"cleanup", {
            {"passes", summary.cleanup_passes},
            {"converged", summary.cleanup_converged}
        }},
        {"issues", {
            {"tiles_without_elevation", summary.tiles_without_elevation},
            {"mixed", summary.mixed_tiles},
            {"unknown", summary.unknown_tiles}
        }},
        {"line_paths", summary.line_paths},
        {"warnings", summary.warnings},
        {"ignored_sources", ignored},
        {"phase_timings", summary.phase_timings},
        {"elapsed_seconds", summary.elapsed_seconds}
    };
}

PersistenceManager::PersistenceManager(AttributeStore& store)
    : store_(store), logger_("PersistenceManager") {
}

AuditRecord PersistenceManager::make_record(const Tessellation& tessellation,
                                            const ClassificationResult& result) const {
    AuditRecord record;
    record.tile = result.tile;
    record.axial = tessellation.tile(result.tile).axial;
    record.before = store_.read(result.tile);
    record.after = to_attributes(result);
    record.rationale = result.rationale;
    return record;
}

AuditArtifact PersistenceManager::preview(const Tessellation& tessellation,
                                          const std::vector<ClassificationResult>& results,
                                          const CancellationToken* cancel,
                                          const ProgressCallback& progress) const {
    AuditArtifact artifact;
    artifact.mode = PersistenceMode::PREVIEW;
    artifact.records.reserve(results.size());

    ProgressReporter reporter(progress, Phase::PERSISTENCE, results.size());
    for (const auto& result : results) {
        if (cancel && cancel->is_cancelled()) {
            throw HexMosaicError(ErrorKind::CANCELLED, Phase::PERSISTENCE, "preview cancelled",
                                 std::to_string(artifact.records.size()) + " of " +
                                 std::to_string(results.size()) + " tiles emitted");
        }
        artifact.records.push_back(make_record(tessellation, result));
        reporter.advance();
    }
    reporter.finish();

    logger_.info("Preview built for " + std::to_string(artifact.records.size()) + " tiles; store untouched");
    return artifact;
}

AuditArtifact PersistenceManager::apply(const Tessellation& tessellation,
                                        const std::vector<ClassificationResult>& results,
                                        const CancellationToken* cancel,
                                        const ProgressCallback& progress) {
    AuditArtifact artifact;
    artifact.mode = PersistenceMode::APPLY;
    artifact.records.reserve(results.size());

    if (!store_.begin()) {
        throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::PERSISTENCE,
                             "could not open transaction: " + store_.last_error());
    }

    ProgressReporter reporter(progress, Phase::PERSISTENCE, results.size());
    for (const auto& result : results) {
        if (cancel && cancel->is_cancelled()) {
            store_.rollback();
            logger_.warning("Apply cancelled after " + std::to_string(reporter.processed()) +
                            " tiles; transaction rolled back");
            throw HexMosaicError(ErrorKind::CANCELLED, Phase::PERSISTENCE, "apply cancelled",
                                 std::to_string(reporter.processed()) + " of " +
                                 std::to_string(results.size()) + " tiles written");
        }

        AuditRecord record = make_record(tessellation, result);
        if (!store_.write(result.tile, record.after)) {
            const std::string reason = store_.last_error();
            store_.rollback();
            logger_.error("Write failed for tile " + std::to_string(result.tile) + ": " + reason);
            throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::PERSISTENCE,
                                 "write rejected: " + reason, "tile " + std::to_string(result.tile));
        }
        artifact.records.push_back(std::move(record));
        reporter.advance();
    }

    if (cancel && cancel->is_cancelled()) {
        store_.rollback();
        throw HexMosaicError(ErrorKind::CANCELLED, Phase::PERSISTENCE, "apply cancelled before commit",
                             std::to_string(results.size()) + " of " +
                             std::to_string(results.size()) + " tiles written");
    }

    if (!store_.commit()) {
        const std::string reason = store_.last_error();
        store_.rollback();
        logger_.error("Commit failed: " + reason);
        throw HexMosaicError(ErrorKind::PERSISTENCE_FAILURE, Phase::PERSISTENCE,
                             "commit rejected: " + reason);
    }
    reporter.finish();

    artifact.applied = true;
    logger_.info("Applied attributes for " + std::to_string(artifact.records.size()) + " tiles");
    return artifact;
}

RunSummary PersistenceManager::summarize(const std::vector<ClassificationResult>& results,
                                         const CleanupReport& cleanup,
                                         const std::vector<IgnoredSource>& ignored_sources) {
    RunSummary summary;
    summary.tile_count = results.size();
    summary.reassignments = cleanup.reassignments;
    summary.cleanup_passes = cleanup.passes;
    summary.cleanup_converged = cleanup.converged;
    summary.ignored_sources = ignored_sources;

    for (const auto& result : results) {
        summary.class_counts[result.tile_type]++;
        summary.confidence_histogram[confidence_bucket(result.confidence)]++;
        if (!result.elevation) summary.tiles_without_elevation++;
        if (result.outcome == Outcome::MIXED) summary.mixed_tiles++;
        if (result.outcome == Outcome::UNKNOWN) summary.unknown_tiles++;
    }
    return summary;
}

} // namespace hexmosaic

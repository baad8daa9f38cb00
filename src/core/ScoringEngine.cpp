/**
 * @file ScoringEngine.cpp
 * @brief Weighted scoring and tie-break classification of sampled tiles
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ScoringEngine.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace hexmosaic {

using json = nlohmann::json;

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::DOMINANT: return "dominant";
        case Outcome::DOMINANT_LOW_CONFIDENCE: return "dominant_low_confidence";
        case Outcome::WATER_OVERRIDE: return "water_override";
        case Outcome::MIXED: return "mixed";
        case Outcome::UNKNOWN: return "unknown";
        case Outcome::REASSIGNED: return "reassigned";
    }
    return "unknown";
}

double Rationale::score_of(size_t class_index) const {
    for (const auto& entry : scores) {
        if (entry.class_index == class_index) {
            return entry.score;
        }
    }
    return 0.0;
}

void to_json(json& j, const Rationale& rationale) {
    json scores = json::array();
    for (const auto& entry : rationale.scores) {
        scores.push_back({
            {"class", entry.label},
            {"score", entry.score},
            {"area_fraction", entry.evidence.area_fraction},
            {"centroid_vote", entry.evidence.centroid_vote},
            {"probe_votes", entry.evidence.probe_votes},
            {"edge_presence", entry.evidence.edge_presence}
        });
    }
    j = json{
        {"rule", rationale.rule},
        {"scores", scores},
        {"notes", rationale.notes},
        {"cleanup", rationale.cleanup_notes}
    };
}

void to_json(json& j, const ClassificationResult& result) {
    j = json{
        {"tile", result.tile},
        {"tile_type", result.tile_type},
        {"outcome", to_string(result.outcome)},
        {"confidence", result.confidence},
        {"rationale", result.rationale}
    };
    j["elevation_tier"] = result.elevation_tier ? json(*result.elevation_tier) : json(nullptr);
    j["elevation"] = result.elevation ? json(*result.elevation) : json(nullptr);
}

double elevation_tier(double value, double tier_size) {
    double tier = std::floor(value / tier_size) * tier_size;
    const double rounded = std::round(tier);
    if (std::abs(tier - rounded) <= 1e-6) {
        tier = rounded;
    }
    return tier;
}

ScoringEngine::ScoringEngine(const ClassProfile& profile, const ParallelExecutor& executor)
    : profile_(profile), executor_(executor), logger_("ScoringEngine") {
}

double ScoringEngine::score(const EvidenceVector& evidence) const {
    const EvidenceWeights& w = profile_.weights();
    return w.area * evidence.area_fraction +
           w.centroid * evidence.centroid_vote +
           w.probe * evidence.probe_votes +
           w.edge * evidence.edge_presence;
}

std::optional<std::string> ScoringEngine::water_override(const TileEvidence& evidence) const {
    const auto& rule = profile_.water_override();
    if (!rule) {
        return std::nullopt;
    }

    for (const auto& vector : evidence.classes) {
        const ClassDefinition& definition = profile_.class_at(vector.class_index);
        if (const auto* area = std::get_if<AreaClass>(&definition.kind)) {
            const bool water = area->water_body || vector.class_index == rule->target_class;
            if (water && vector.area_fraction > rule->area_threshold) {
                return "water_override: " + definition.label + " covers " +
                       std::to_string(vector.area_fraction);
            }
        } else {
            const auto& line = std::get<LineClass>(definition.kind);
            if (line.major_water && vector.centroid_vote > 0.0) {
                return "water_override: major water line " + definition.label + " at centroid";
            }
        }
    }
    return std::nullopt;
}

std::optional<double> ScoringEngine::area_threshold(size_t class_index) const {
    const auto* area = std::get_if<AreaClass>(&profile_.class_at(class_index).kind);
    return area ? area->area_threshold : std::nullopt;
}

ClassificationResult ScoringEngine::classify(const TileEvidence& sampled) const {
    ClassificationResult result;
    result.tile = sampled.tile;

    // An area class counts for a tile only once its coverage reaches the class threshold
    TileEvidence evidence;
    evidence.tile = sampled.tile;
    evidence.elevation = sampled.elevation;
    evidence.probe_count = sampled.probe_count;
    for (const auto& vector : sampled.classes) {
        const auto minimum = area_threshold(vector.class_index);
        if (minimum && vector.area_fraction < *minimum) {
            std::ostringstream note;
            note << profile_.class_at(vector.class_index).label << " covers " << vector.area_fraction
                 << ", below its area threshold " << *minimum;
            result.rationale.notes.push_back(note.str());
            continue;
        }
        evidence.classes.push_back(vector);
    }

    for (const auto& vector : evidence.classes) {
        ClassScore entry;
        entry.class_index = vector.class_index;
        entry.label = profile_.class_at(vector.class_index).label;
        entry.score = score(vector);
        entry.evidence = vector;
        result.rationale.scores.push_back(entry);
    }

    const double threshold = profile_.dominance_threshold();

    if (auto rule = water_override(evidence)) {
        const size_t target = profile_.water_override()->target_class;
        result.class_index = target;
        result.tile_type = profile_.class_at(target).label;
        result.outcome = Outcome::WATER_OVERRIDE;
        result.confidence = std::max(result.rationale.score_of(target),
                                     profile_.water_override()->confidence_floor);
        result.rationale.rule = *rule;
    } else if (result.rationale.scores.empty()) {
        result.tile_type = ClassProfile::UNKNOWN_LABEL;
        result.outcome = Outcome::UNKNOWN;
        result.confidence = 0.0;
        result.rationale.rule = "no evidence";
    } else {
        double best = result.rationale.scores.front().score;
        for (const auto& entry : result.rationale.scores) {
            best = std::max(best, entry.score);
        }

        // Scores within epsilon of the best tie; first in priority order wins
        const ClassScore* winner = nullptr;
        size_t tied = 0;
        for (const auto& entry : result.rationale.scores) {
            if (entry.score < best - profile_.tie_epsilon()) continue;
            tied++;
            if (!winner || profile_.priority_rank(entry.class_index) < profile_.priority_rank(winner->class_index)) {
                winner = &entry;
            }
        }

        if (best < threshold) {
            result.tile_type = ClassProfile::MIXED_LABEL;
            result.outcome = Outcome::MIXED;
            result.confidence = std::max(0.0, std::min(best, threshold - profile_.mixed_confidence_margin()));
            std::ostringstream rule;
            rule << "best score " << best << " below dominance threshold " << threshold;
            result.rationale.rule = rule.str();
        } else {
            result.class_index = winner->class_index;
            result.tile_type = winner->label;
            result.outcome = Outcome::DOMINANT;
            result.confidence = winner->score;
            result.rationale.rule = tied > 1 ? "max score, tie broken by priority order" : "max score";
        }
    }

    if (evidence.elevation) {
        result.elevation_tier = elevation_tier(evidence.elevation->min, profile_.tier_size());
        result.elevation = evidence.elevation->representative;
    } else {
        result.confidence *= profile_.missing_elevation_factor();
        std::ostringstream note;
        note << "no elevation coverage, confidence x" << profile_.missing_elevation_factor();
        result.rationale.notes.push_back(note.str());
    }

    result.confidence = std::clamp(result.confidence, 0.0, 1.0);

    if (result.outcome == Outcome::DOMINANT &&
        result.confidence < profile_.cleanup().low_confidence_threshold) {
        result.outcome = Outcome::DOMINANT_LOW_CONFIDENCE;
    }
    return result;
}

std::vector<ClassificationResult> ScoringEngine::classify_all(const std::vector<TileEvidence>& evidence,
                                                              const CancellationToken* cancel,
                                                              const ProgressCallback& progress) const {
    std::vector<ClassificationResult> results(evidence.size());
    ProgressReporter reporter(progress, Phase::SCORING, evidence.size());

    executor_.for_each(evidence.size(), Phase::SCORING, cancel, &reporter, [&](size_t i) {
        results[i] = classify(evidence[i]);
    });
    reporter.finish();

    size_t dominant = 0, low = 0, water = 0, mixed = 0, unknown = 0;
    std::optional<double> tier_min, tier_max;
    for (const auto& result : results) {
        switch (result.outcome) {
            case Outcome::DOMINANT: dominant++; break;
            case Outcome::DOMINANT_LOW_CONFIDENCE: low++; break;
            case Outcome::WATER_OVERRIDE: water++; break;
            case Outcome::MIXED: mixed++; break;
            case Outcome::UNKNOWN: unknown++; break;
            case Outcome::REASSIGNED: break;
        }
        if (result.elevation_tier) {
            tier_min = tier_min ? std::min(*tier_min, *result.elevation_tier) : *result.elevation_tier;
            tier_max = tier_max ? std::max(*tier_max, *result.elevation_tier) : *result.elevation_tier;
        }
    }

    std::ostringstream msg;
    msg << "Classified " << results.size() << " tiles: " << dominant << " dominant, "
        << low << " low confidence, " << water << " water override, "
        << mixed << " mixed, " << unknown << " unknown";
    if (tier_min) {
        msg << "; tier " << *tier_min;
        if (*tier_max != *tier_min) {
            msg << " to " << *tier_max;
        }
    }
    logger_.info(msg.str());

    return results;
}

} // namespace hexmosaic

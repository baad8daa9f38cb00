#pragma once

/**
 * @file ClassProfile.hpp
 * @brief Immutable, validated classification profile
 *
 * The profile names the terrain classes, their tie-break priority, the
 * evidence weights and every threshold used by scoring and cleanup. It is
 * loaded from JSON once and passed by const reference into each component.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief Class backed by polygon features
 */
struct AreaClass {
    bool water_body = false;                 ///< Triggers the water override by area
    std::optional<double> area_threshold;    ///< Minimum area fraction for the class to count in a tile
};

/**
 * @brief How a line class relates to the tiles it crosses
 */
enum class LineSnap {
    CENTERLINE,  ///< Line runs through tiles (rivers, roads)
    EDGE         ///< Line follows tile borders (shorelines, boundaries)
};

/**
 * @brief Class backed by line features
 */
struct LineClass {
    LineSnap snap = LineSnap::CENTERLINE;
    bool major_water = false;                ///< Centroid hit triggers the water override
    std::optional<double> snap_tolerance;    ///< Falls back to the sampling default
    std::optional<double> trace_step;        ///< Spacing of trace samples along a line, CRS units
};

using ClassKind = std::variant<AreaClass, LineClass>;

struct ClassDefinition {
    std::string label;
    ClassKind kind;

    bool is_line() const { return std::holds_alternative<LineClass>(kind); }
};

struct EvidenceWeights {
    double area = 0.0;
    double centroid = 0.0;
    double probe = 0.0;
    double edge = 0.0;
};

struct WaterOverrideRule {
    size_t target_class = 0;        ///< Index into ClassProfile::classes()
    double area_threshold = 0.4;    ///< Strictly exceeded by a water-body area fraction
    double confidence_floor = 0.6;
};

struct CleanupParameters {
    double neighbor_majority_threshold = 0.0;
    int max_passes = 0;
    double low_confidence_threshold = 0.35;
    double blend_weight = 0.5;      ///< Weight of the tile's own score in the blended confidence
};

/**
 * @brief Representative elevation reported per tile
 *
 * The elevation tier always uses the minimum; this picks the value stored
 * alongside it.
 */
enum class ElevationMethod {
    MEAN,
    MEDIAN,
    MIN
};

struct SamplingParameters {
    double snap_tolerance = 10.0;          ///< Line proximity tolerance in CRS units
    int probe_ring_count = 6;              ///< Probe points on the ring around the centroid
    double probe_radius_fraction = 0.5;    ///< Ring radius as a fraction of the hex edge length
    double probe_angle_offset_deg = 0.0;
    ElevationMethod elevation_method = ElevationMethod::MEAN;
};

const char* to_string(ElevationMethod method);

/**
 * @brief Validated classification profile
 *
 * JSON layout:
 * @code
 * {
 *   "classes": [
 *     {"label": "Water",  "kind": "area", "water_body": true},
 *     {"label": "Forest", "kind": "area", "area_threshold": 0.25},
 *     {"label": "River",  "kind": "line", "snap": "centerline", "major_water": true,
 *      "trace_step": 100}
 *   ],
 *   "priority_order": ["Water", "River", "Forest"],
 *   "weights": {"area": 0.6, "centroid": 0.25, "probe": 0.1, "edge": 0.05},
 *   "dominance_threshold": 0.4,
 *   "tier_size": 50,
 *   "cleanup": {"neighbor_majority_threshold": 0.6, "max_passes": 5}
 * }
 * @endcode
 *
 * Optional sections ("water_override", "sampling") and scalars
 * ("tie_epsilon", "missing_elevation_factor", "mixed_confidence_margin")
 * take documented defaults. Every violation raises HexMosaicError with
 * ErrorKind::INVALID_CONFIGURATION and the offending key as context.
 */
class ClassProfile {
public:
    static constexpr const char* MIXED_LABEL = "Mixed";
    static constexpr const char* UNKNOWN_LABEL = "Unknown";

    static ClassProfile from_json(const nlohmann::json& document);
    static ClassProfile from_string(const std::string& text);
    static ClassProfile load_file(const std::string& path);

    nlohmann::json to_json() const;

    const std::vector<ClassDefinition>& classes() const { return classes_; }
    size_t class_count() const { return classes_.size(); }
    const ClassDefinition& class_at(size_t index) const { return classes_.at(index); }
    std::optional<size_t> find_class(const std::string& label) const;

    /**
     * @brief Class indices ordered by priority, first wins ties
     */
    const std::vector<size_t>& priority_order() const { return priority_order_; }

    /**
     * @brief Position of a class in the priority order (0 = highest)
     */
    size_t priority_rank(size_t class_index) const { return priority_rank_.at(class_index); }

    const EvidenceWeights& weights() const { return weights_; }
    double dominance_threshold() const { return dominance_threshold_; }
    double tie_epsilon() const { return tie_epsilon_; }
    double tier_size() const { return tier_size_; }
    double missing_elevation_factor() const { return missing_elevation_factor_; }
    double mixed_confidence_margin() const { return mixed_confidence_margin_; }
    const std::optional<WaterOverrideRule>& water_override() const { return water_override_; }
    const CleanupParameters& cleanup() const { return cleanup_; }
    const SamplingParameters& sampling() const { return sampling_; }

    /**
     * @brief Snap tolerance for a line class, or the sampling default
     */
    double snap_tolerance(size_t class_index) const;

private:
    ClassProfile() = default;

    std::vector<ClassDefinition> classes_;
    std::vector<size_t> priority_order_;
    std::vector<size_t> priority_rank_;
    EvidenceWeights weights_;
    double dominance_threshold_ = 0.0;
    double tie_epsilon_ = 1e-9;
    double tier_size_ = 0.0;
    double missing_elevation_factor_ = 0.5;
    double mixed_confidence_margin_ = 0.05;
    std::optional<WaterOverrideRule> water_override_;
    CleanupParameters cleanup_;
    SamplingParameters sampling_;
};

} // namespace hexmosaic

/**
 * @file ClassProfile.cpp
 * @brief JSON loading and validation of the classification profile
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ClassProfile.hpp"
#include "HexMosaicError.hpp"
#include "Logger.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <type_traits>
#include <utility>

namespace hexmosaic {

using json = nlohmann::json;

namespace {

[[noreturn]] void fail(const std::string& key, const std::string& message) {
    throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION, message, key);
}

const json& require(const json& object, const std::string& key, const std::string& path) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        fail(path, "missing required key '" + path + "'");
    }
    return *it;
}

double as_number(const json& value, const std::string& path) {
    if (!value.is_number()) {
        fail(path, "'" + path + "' must be a number");
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        fail(path, "'" + path + "' must be finite");
    }
    return number;
}

double require_number(const json& object, const std::string& key, const std::string& path) {
    return as_number(require(object, key, path), path);
}

double optional_number(const json& object, const std::string& key, const std::string& path,
                       double fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return as_number(*it, path);
}

bool optional_bool(const json& object, const std::string& key, const std::string& path,
                   bool fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        fail(path, "'" + path + "' must be true or false");
    }
    return it->get<bool>();
}

std::string require_string(const json& object, const std::string& key, const std::string& path) {
    const json& value = require(object, key, path);
    if (!value.is_string()) {
        fail(path, "'" + path + "' must be a string");
    }
    return value.get<std::string>();
}

void check_range(double value, double lo, double hi, const std::string& path) {
    if (value < lo || value > hi) {
        std::ostringstream oss;
        oss << "'" << path << "' = " << value << " is outside [" << lo << ", " << hi << "]";
        fail(path, oss.str());
    }
}

int as_integer(double value, const std::string& path) {
    if (value != std::floor(value)) {
        fail(path, "'" + path + "' must be an integer");
    }
    if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        fail(path, "'" + path + "' is out of integer range");
    }
    return static_cast<int>(value);
}

ClassDefinition parse_class(const json& entry, size_t position) {
    const std::string path = "classes[" + std::to_string(position) + "]";
    if (!entry.is_object()) {
        fail(path, "'" + path + "' must be an object");
    }

    ClassDefinition definition;
    definition.label = require_string(entry, "label", path + ".label");
    if (definition.label.empty()) {
        fail(path + ".label", "class label must not be empty");
    }
    if (definition.label == ClassProfile::MIXED_LABEL || definition.label == ClassProfile::UNKNOWN_LABEL) {
        fail(path + ".label", "'" + definition.label + "' is a reserved label");
    }

    const std::string kind = require_string(entry, "kind", path + ".kind");
    if (kind == "area" || kind == "polygon") {
        AreaClass area;
        area.water_body = optional_bool(entry, "water_body", path + ".water_body", false);
        if (entry.contains("area_threshold") && !entry["area_threshold"].is_null()) {
            double threshold = as_number(entry["area_threshold"], path + ".area_threshold");
            check_range(threshold, 0.0, 1.0, path + ".area_threshold");
            area.area_threshold = threshold;
        }
        definition.kind = area;
    } else if (kind == "line") {
        LineClass line;
        auto snap_it = entry.find("snap");
        if (snap_it != entry.end() && !snap_it->is_null()) {
            if (!snap_it->is_string()) {
                fail(path + ".snap", "'" + path + ".snap' must be \"centerline\" or \"edge\"");
            }
            const std::string snap = snap_it->get<std::string>();
            if (snap == "centerline" || snap == "center_to_edge") {
                line.snap = LineSnap::CENTERLINE;
            } else if (snap == "edge") {
                line.snap = LineSnap::EDGE;
            } else {
                fail(path + ".snap", "unknown snap mode '" + snap + "'");
            }
        }
        line.major_water = optional_bool(entry, "major_water", path + ".major_water", false);
        if (entry.contains("snap_tolerance") && !entry["snap_tolerance"].is_null()) {
            double tolerance = as_number(entry["snap_tolerance"], path + ".snap_tolerance");
            if (tolerance < 0.0) {
                fail(path + ".snap_tolerance", "snap tolerance must be >= 0");
            }
            line.snap_tolerance = tolerance;
        }
        if (entry.contains("trace_step") && !entry["trace_step"].is_null()) {
            double step = as_number(entry["trace_step"], path + ".trace_step");
            if (step <= 0.0) {
                fail(path + ".trace_step", "trace step must be > 0");
            }
            line.trace_step = step;
        }
        definition.kind = line;
    } else {
        fail(path + ".kind", "unknown class kind '" + kind + "' (expected area or line)");
    }
    return definition;
}

} // anonymous namespace

const char* to_string(ElevationMethod method) {
    switch (method) {
        case ElevationMethod::MEAN: return "mean";
        case ElevationMethod::MEDIAN: return "median";
        case ElevationMethod::MIN: return "min";
    }
    return "mean";
}

ClassProfile ClassProfile::from_json(const json& document) {
    if (!document.is_object()) {
        fail("<root>", "profile must be a JSON object");
    }

    ClassProfile profile;

    // Classes
    const json& classes = require(document, "classes", "classes");
    if (!classes.is_array() || classes.empty()) {
        fail("classes", "'classes' must be a non-empty array");
    }
    for (size_t i = 0; i < classes.size(); ++i) {
        ClassDefinition definition = parse_class(classes[i], i);
        if (profile.find_class(definition.label)) {
            fail("classes[" + std::to_string(i) + "].label",
                 "duplicate class label '" + definition.label + "'");
        }
        profile.classes_.push_back(std::move(definition));
    }

    // Priority order: every class exactly once
    const json& order = require(document, "priority_order", "priority_order");
    if (!order.is_array()) {
        fail("priority_order", "'priority_order' must be an array of class labels");
    }
    profile.priority_rank_.assign(profile.classes_.size(), 0);
    std::set<size_t> seen;
    for (const auto& entry : order) {
        if (!entry.is_string()) {
            fail("priority_order", "'priority_order' entries must be strings");
        }
        const std::string label = entry.get<std::string>();
        auto index = profile.find_class(label);
        if (!index) {
            fail("priority_order", "'priority_order' names unknown class '" + label + "'");
        }
        if (!seen.insert(*index).second) {
            fail("priority_order", "'priority_order' lists '" + label + "' twice");
        }
        profile.priority_rank_[*index] = profile.priority_order_.size();
        profile.priority_order_.push_back(*index);
    }
    if (profile.priority_order_.size() != profile.classes_.size()) {
        for (size_t i = 0; i < profile.classes_.size(); ++i) {
            if (!seen.count(i)) {
                fail("priority_order", "'priority_order' is missing class '" + profile.classes_[i].label + "'");
            }
        }
    }

    // Weights
    const json& weights = require(document, "weights", "weights");
    if (!weights.is_object()) {
        fail("weights", "'weights' must be an object");
    }
    profile.weights_.area = require_number(weights, "area", "weights.area");
    profile.weights_.centroid = require_number(weights, "centroid", "weights.centroid");
    profile.weights_.probe = require_number(weights, "probe", "weights.probe");
    profile.weights_.edge = require_number(weights, "edge", "weights.edge");
    for (const auto& [name, value] : {std::make_pair("weights.area", profile.weights_.area),
                                      std::make_pair("weights.centroid", profile.weights_.centroid),
                                      std::make_pair("weights.probe", profile.weights_.probe),
                                      std::make_pair("weights.edge", profile.weights_.edge)}) {
        if (value < 0.0) {
            fail(name, std::string("'") + name + "' must be >= 0");
        }
    }

    // Scalar thresholds
    profile.dominance_threshold_ = require_number(document, "dominance_threshold", "dominance_threshold");
    check_range(profile.dominance_threshold_, 0.0, 1.0, "dominance_threshold");

    profile.tie_epsilon_ = optional_number(document, "tie_epsilon", "tie_epsilon", 1e-9);
    if (profile.tie_epsilon_ < 0.0) {
        fail("tie_epsilon", "'tie_epsilon' must be >= 0");
    }

    profile.tier_size_ = require_number(document, "tier_size", "tier_size");
    if (profile.tier_size_ <= 0.0) {
        fail("tier_size", "'tier_size' must be > 0");
    }

    profile.missing_elevation_factor_ =
        optional_number(document, "missing_elevation_factor", "missing_elevation_factor", 0.5);
    check_range(profile.missing_elevation_factor_, 0.0, 1.0, "missing_elevation_factor");

    profile.mixed_confidence_margin_ =
        optional_number(document, "mixed_confidence_margin", "mixed_confidence_margin", 0.05);
    check_range(profile.mixed_confidence_margin_, 0.0, 1.0, "mixed_confidence_margin");

    // Water override, explicit or implied by a water-body class
    auto override_it = document.find("water_override");
    if (override_it != document.end() && !override_it->is_null()) {
        const json& section = *override_it;
        if (!section.is_object()) {
            fail("water_override", "'water_override' must be an object");
        }
        WaterOverrideRule rule;
        const std::string label = require_string(section, "class", "water_override.class");
        auto index = profile.find_class(label);
        if (!index) {
            fail("water_override.class", "'water_override.class' names unknown class '" + label + "'");
        }
        if (profile.classes_[*index].is_line()) {
            fail("water_override.class", "'water_override.class' must be an area class");
        }
        rule.target_class = *index;
        rule.area_threshold = optional_number(section, "area_threshold", "water_override.area_threshold", 0.4);
        check_range(rule.area_threshold, 0.0, 1.0, "water_override.area_threshold");
        rule.confidence_floor = optional_number(section, "confidence_floor", "water_override.confidence_floor", 0.6);
        check_range(rule.confidence_floor, 0.0, 1.0, "water_override.confidence_floor");
        profile.water_override_ = rule;
    } else {
        for (size_t index : profile.priority_order_) {
            const auto* area = std::get_if<AreaClass>(&profile.classes_[index].kind);
            if (area && area->water_body) {
                WaterOverrideRule rule;
                rule.target_class = index;
                profile.water_override_ = rule;
                break;
            }
        }
    }

    // Cleanup
    const json& cleanup = require(document, "cleanup", "cleanup");
    if (!cleanup.is_object()) {
        fail("cleanup", "'cleanup' must be an object");
    }
    profile.cleanup_.neighbor_majority_threshold =
        require_number(cleanup, "neighbor_majority_threshold", "cleanup.neighbor_majority_threshold");
    if (profile.cleanup_.neighbor_majority_threshold <= 0.0 ||
        profile.cleanup_.neighbor_majority_threshold > 1.0) {
        fail("cleanup.neighbor_majority_threshold", "'cleanup.neighbor_majority_threshold' must be in (0, 1]");
    }
    double passes = require_number(cleanup, "max_passes", "cleanup.max_passes");
    profile.cleanup_.max_passes = as_integer(passes, "cleanup.max_passes");
    if (profile.cleanup_.max_passes < 0) {
        fail("cleanup.max_passes", "'cleanup.max_passes' must be >= 0");
    }
    profile.cleanup_.low_confidence_threshold =
        optional_number(cleanup, "low_confidence_threshold", "cleanup.low_confidence_threshold", 0.35);
    check_range(profile.cleanup_.low_confidence_threshold, 0.0, 1.0, "cleanup.low_confidence_threshold");
    profile.cleanup_.blend_weight = optional_number(cleanup, "blend_weight", "cleanup.blend_weight", 0.5);
    check_range(profile.cleanup_.blend_weight, 0.0, 1.0, "cleanup.blend_weight");

    // Sampling
    auto sampling_it = document.find("sampling");
    if (sampling_it != document.end() && !sampling_it->is_null()) {
        const json& sampling = *sampling_it;
        if (!sampling.is_object()) {
            fail("sampling", "'sampling' must be an object");
        }
        SamplingParameters& params = profile.sampling_;
        params.snap_tolerance = optional_number(sampling, "snap_tolerance", "sampling.snap_tolerance", 10.0);
        if (params.snap_tolerance < 0.0) {
            fail("sampling.snap_tolerance", "'sampling.snap_tolerance' must be >= 0");
        }
        params.probe_ring_count = as_integer(
            optional_number(sampling, "probe_ring_count", "sampling.probe_ring_count", 6.0),
            "sampling.probe_ring_count");
        if (params.probe_ring_count < 0 || params.probe_ring_count > 64) {
            fail("sampling.probe_ring_count", "'sampling.probe_ring_count' must be in [0, 64]");
        }
        params.probe_radius_fraction =
            optional_number(sampling, "probe_radius_fraction", "sampling.probe_radius_fraction", 0.5);
        check_range(params.probe_radius_fraction, 0.0, 1.0, "sampling.probe_radius_fraction");
        params.probe_angle_offset_deg =
            optional_number(sampling, "probe_angle_offset_deg", "sampling.probe_angle_offset_deg", 0.0);

        if (sampling.contains("elevation_method") && !sampling["elevation_method"].is_null()) {
            const std::string method = require_string(sampling, "elevation_method", "sampling.elevation_method");
            if (method == "mean") {
                params.elevation_method = ElevationMethod::MEAN;
            } else if (method == "median") {
                params.elevation_method = ElevationMethod::MEDIAN;
            } else if (method == "min") {
                params.elevation_method = ElevationMethod::MIN;
            } else {
                fail("sampling.elevation_method", "unknown elevation method '" + method + "'");
            }
        }
    }

    Logger logger("ClassProfile");
    logger.detailed("Loaded profile with " + std::to_string(profile.classes_.size()) + " classes" +
                    (profile.water_override_ ? ", water override on '" +
                         profile.classes_[profile.water_override_->target_class].label + "'" : ""));
    return profile;
}

ClassProfile ClassProfile::from_string(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        fail("<root>", std::string("profile is not valid JSON: ") + e.what());
    }
    return from_json(document);
}

ClassProfile ClassProfile::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fail(path, "cannot open profile file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

json ClassProfile::to_json() const {
    json document;

    json classes = json::array();
    for (const auto& definition : classes_) {
        json entry;
        entry["label"] = definition.label;
        std::visit([&entry](const auto& kind) {
            using T = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<T, AreaClass>) {
                entry["kind"] = "area";
                entry["water_body"] = kind.water_body;
                if (kind.area_threshold) {
                    entry["area_threshold"] = *kind.area_threshold;
                }
            } else {
                entry["kind"] = "line";
                entry["snap"] = kind.snap == LineSnap::EDGE ? "edge" : "centerline";
                entry["major_water"] = kind.major_water;
                if (kind.snap_tolerance) {
                    entry["snap_tolerance"] = *kind.snap_tolerance;
                }
                if (kind.trace_step) {
                    entry["trace_step"] = *kind.trace_step;
                }
            }
        }, definition.kind);
        classes.push_back(entry);
    }
    document["classes"] = classes;

    json order = json::array();
    for (size_t index : priority_order_) {
        order.push_back(classes_[index].label);
    }
    document["priority_order"] = order;

    document["weights"] = {
        {"area", weights_.area}, {"centroid", weights_.centroid},
        {"probe", weights_.probe}, {"edge", weights_.edge}
    };
    document["dominance_threshold"] = dominance_threshold_;
    document["tie_epsilon"] = tie_epsilon_;
    document["tier_size"] = tier_size_;
    document["missing_elevation_factor"] = missing_elevation_factor_;
    document["mixed_confidence_margin"] = mixed_confidence_margin_;

    if (water_override_) {
        document["water_override"] = {
            {"class", classes_[water_override_->target_class].label},
            {"area_threshold", water_override_->area_threshold},
            {"confidence_floor", water_override_->confidence_floor}
        };
    }

    document["cleanup"] = {
        {"neighbor_majority_threshold", cleanup_.neighbor_majority_threshold},
        {"max_passes", cleanup_.max_passes},
        {"low_confidence_threshold", cleanup_.low_confidence_threshold},
        {"blend_weight", cleanup_.blend_weight}
    };
    document["sampling"] = {
        {"snap_tolerance", sampling_.snap_tolerance},
        {"probe_ring_count", sampling_.probe_ring_count},
        {"probe_radius_fraction", sampling_.probe_radius_fraction},
        {"probe_angle_offset_deg", sampling_.probe_angle_offset_deg},
        {"elevation_method", to_string(sampling_.elevation_method)}
    };
    return document;
}

std::optional<size_t> ClassProfile::find_class(const std::string& label) const {
    for (size_t i = 0; i < classes_.size(); ++i) {
        if (classes_[i].label == label) {
            return i;
        }
    }
    return std::nullopt;
}

double ClassProfile::snap_tolerance(size_t class_index) const {
    const auto* line = std::get_if<LineClass>(&classes_.at(class_index).kind);
    if (line && line->snap_tolerance) {
        return *line->snap_tolerance;
    }
    return sampling_.snap_tolerance;
}

} // namespace hexmosaic

/**
 * @file TestFixtures.cpp
 * @brief Shared profiles, boundaries, sources and rasters for the core tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TestFixtures.hpp"

namespace hexmosaic {
namespace gtest {

using json = nlohmann::json;

json scenario_profile_json() {
    return json::parse(R"({
        "classes": [
            {"label": "Water",  "kind": "area", "water_body": true},
            {"label": "Forest", "kind": "area"},
            {"label": "Field",  "kind": "area"},
            {"label": "Bare",   "kind": "area"},
            {"label": "River",  "kind": "line", "snap": "centerline", "major_water": true}
        ],
        "priority_order": ["Water", "River", "Forest", "Field", "Bare"],
        "weights": {"area": 0.6, "centroid": 0.25, "probe": 0.1, "edge": 0.05},
        "dominance_threshold": 0.4,
        "tier_size": 50,
        "cleanup": {"neighbor_majority_threshold": 0.6, "max_passes": 5}
    })");
}

ClassProfile scenario_profile() {
    return ClassProfile::from_json(scenario_profile_json());
}

PolygonData rectangle(double x0, double y0, double x1, double y1) {
    PolygonData polygon;
    polygon.rings.push_back({Point2D(x0, y0), Point2D(x1, y0), Point2D(x1, y1), Point2D(x0, y1), Point2D(x0, y0)});
    return polygon;
}

LineData line(std::initializer_list<Point2D> points) {
    LineData data;
    data.points.assign(points.begin(), points.end());
    return data;
}

std::unique_ptr<FeatureSource> polygon_source(const std::string& name, const std::string& label,
                                              const std::vector<PolygonData>& polygons,
                                              const std::string& crs) {
    std::vector<Feature> features;
    std::int64_t id = 1;
    for (const auto& polygon : polygons) {
        Feature feature;
        feature.id = id++;
        feature.polygons.push_back(polygon);
        features.push_back(std::move(feature));
    }
    return std::make_unique<VectorFeatureSource>(name, label, GeometryKind::POLYGON, std::move(features), crs);
}

std::unique_ptr<FeatureSource> line_source(const std::string& name, const std::string& label,
                                           const std::vector<LineData>& lines,
                                           const std::string& crs) {
    std::vector<Feature> features;
    std::int64_t id = 1;
    for (const auto& polyline : lines) {
        Feature feature;
        feature.id = id++;
        feature.lines.push_back(polyline);
        features.push_back(std::move(feature));
    }
    return std::make_unique<VectorFeatureSource>(name, label, GeometryKind::LINE, std::move(features), crs);
}

ElevationRaster constant_raster(float value) {
    ElevationRaster raster;
    raster.width = 50;
    raster.height = 50;
    raster.values.assign(50 * 50, value);
    raster.geotransform = {{0.0, 100.0, 0.0, 5000.0, 0.0, -100.0}};
    raster.nodata = -9999.0;
    return raster;
}

ElevationRaster gradient_raster() {
    ElevationRaster raster = constant_raster(0.0f);
    for (int row = 0; row < raster.height; ++row) {
        for (int col = 0; col < raster.width; ++col) {
            raster.values[static_cast<size_t>(row * raster.width + col)] = static_cast<float>(10 * col);
        }
    }
    return raster;
}

EvidenceVector area_evidence(size_t class_index, double area_fraction, double centroid,
                             double probes, double edge) {
    EvidenceVector evidence;
    evidence.class_index = class_index;
    evidence.area_fraction = area_fraction;
    evidence.centroid_vote = centroid;
    evidence.probe_votes = probes;
    evidence.edge_presence = edge;
    return evidence;
}

TileEvidence tile_evidence(TileId tile, std::vector<EvidenceVector> classes,
                           std::optional<double> elevation_min) {
    TileEvidence evidence;
    evidence.tile = tile;
    evidence.classes = std::move(classes);
    evidence.probe_count = 7;
    if (elevation_min) {
        ElevationStats stats;
        stats.min = *elevation_min;
        stats.mean = *elevation_min + 5.0;
        stats.median = stats.mean;
        stats.max = *elevation_min + 10.0;
        stats.pixel_count = 3;
        stats.representative = stats.mean;
        evidence.elevation = stats;
    }
    return evidence;
}

ClassificationResult make_result(TileId tile, std::optional<size_t> class_index, const std::string& label,
                                 double confidence, Outcome outcome,
                                 std::vector<std::pair<size_t, double>> scores) {
    ClassificationResult result;
    result.tile = tile;
    result.class_index = class_index;
    result.tile_type = label;
    result.confidence = confidence;
    result.outcome = outcome;
    result.elevation_tier = 100.0;
    result.elevation = 105.0;
    for (const auto& [index, score] : scores) {
        ClassScore entry;
        entry.class_index = index;
        entry.label = label;
        entry.score = score;
        result.rationale.scores.push_back(entry);
    }
    result.rationale.rule = "max score";
    return result;
}

LogCapture::LogCapture() : previous_(Logger::getSink()) {
    Logger::setSink([this](LogLevel level, const std::string& facility, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, facility, message});
    });
}

LogCapture::~LogCapture() {
    Logger::setSink(previous_);
}

std::vector<LogCapture::Entry> LogCapture::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t LogCapture::count(LogLevel level, const std::string& facility) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : entries_) {
        if (entry.level == level && entry.facility == facility) n++;
    }
    return n;
}

bool LogCapture::contains(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.message.find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace gtest
} // namespace hexmosaic

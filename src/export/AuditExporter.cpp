/**
 * @file AuditExporter.cpp
 * @brief Implementation of audit and summary export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "AuditExporter.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <cmath>

namespace hexmosaic {

using json = nlohmann::json;

AuditExporter::AuditExporter()
    : options_() {}

AuditExporter::AuditExporter(const Options& options)
    : options_(options) {}

bool AuditExporter::export_audit(const Tessellation& tessellation, const AuditArtifact& artifact,
                                 const std::string& filename) const {
    Logger logger("AuditExporter");

    if (artifact.records.empty()) {
        logger.warning("Audit artifact is empty; writing an empty FeatureCollection");
    }

    if (!write_document(to_geojson(tessellation, artifact), filename)) {
        logger.error("Failed to create GeoJSON file: " + filename);
        return false;
    }

    logger.info("Exported audit GeoJSON: " + filename + " (" +
                std::to_string(artifact.records.size()) + " tiles)");
    return true;
}

bool AuditExporter::export_summary(const RunSummary& summary, const std::string& filename) const {
    Logger logger("AuditExporter");

    if (!write_document(json(summary), filename)) {
        logger.error("Failed to create summary file: " + filename);
        return false;
    }

    logger.info("Exported run summary: " + filename);
    return true;
}

json AuditExporter::to_geojson(const Tessellation& tessellation, const AuditArtifact& artifact) const {
    json collection = {
        {"type", "FeatureCollection"},
        {"mode", to_string(artifact.mode)},
        {"applied", artifact.applied}
    };

    add_crs(collection, tessellation);

    json features = json::array();
    for (const auto& record : artifact.records) {
        const HexTile& tile = tessellation.tile(record.tile);

        json properties = {
            {"tile", record.tile},
            {"q", record.axial.q},
            {"r", record.axial.r},
            {"partial", tile.is_partial},
            {"area", format_coordinate(tile.area)},
            {"tile_type", record.after.tile_type},
            {"outcome", record.after.outcome},
            {"confidence", record.after.confidence}
        };
        properties["elevation_tier"] = record.after.elevation_tier ? json(*record.after.elevation_tier) : json(nullptr);
        properties["elevation"] = record.after.elevation ? json(*record.after.elevation) : json(nullptr);
        properties["before"] = record.before ? json(*record.before) : json(nullptr);
        properties["changed"] = !record.before || *record.before != record.after;
        if (options_.include_rationale) {
            properties["rationale"] = record.rationale;
        }

        features.push_back({
            {"type", "Feature"},
            {"id", record.tile},
            {"properties", properties},
            {"geometry", tile_geometry(tile)}
        });
    }

    if (options_.include_edges) {
        for (const auto& edge : tessellation.edges()) {
            features.push_back(edge_feature(tessellation, edge));
        }
    }

    collection["features"] = features;
    return collection;
}

bool AuditExporter::export_line_paths(const Tessellation& tessellation, const std::vector<TracedLine>& lines,
                                      const ClassProfile& profile, const std::string& filename) const {
    Logger logger("AuditExporter");

    if (!write_document(line_paths_to_geojson(tessellation, lines, profile), filename)) {
        logger.error("Failed to create line path file: " + filename);
        return false;
    }

    logger.info("Exported line paths: " + filename + " (" + std::to_string(lines.size()) + " features)");
    return true;
}

json AuditExporter::line_paths_to_geojson(const Tessellation& tessellation, const std::vector<TracedLine>& lines,
                                          const ClassProfile& profile) const {
    json collection = {{"type", "FeatureCollection"}};
    add_crs(collection, tessellation);

    json features = json::array();
    for (const auto& line : lines) {
        json properties = {
            {"class", profile.class_at(line.class_index).label},
            {"feature", line.feature_id},
            {"snap", line.snap == LineSnap::EDGE ? "edge" : "centerline"},
            {"tiles", line.tiles}
        };
        if (line.snap == LineSnap::EDGE) {
            properties["edges"] = line.edges;
        }

        json geometry;
        if (line.paths.size() == 1) {
            geometry = {{"type", "LineString"}, {"coordinates", line_to_json(line.paths.front())}};
        } else {
            json parts = json::array();
            for (const auto& path : line.paths) {
                parts.push_back(line_to_json(path));
            }
            geometry = {{"type", "MultiLineString"}, {"coordinates", parts}};
        }

        features.push_back({
            {"type", "Feature"},
            {"properties", properties},
            {"geometry", geometry}
        });
    }

    collection["features"] = features;
    return collection;
}

void AuditExporter::add_crs(json& collection, const Tessellation& tessellation) const {
    const std::string crs = options_.crs.empty() ? tessellation.crs() : options_.crs;
    if (options_.include_crs && !crs.empty()) {
        collection["crs"] = {
            {"type", "name"},
            {"properties", {{"name", crs}}}
        };
    }
}

json AuditExporter::tile_geometry(const HexTile& tile) const {
    auto polygon_coordinates = [this](const PolygonData& polygon) {
        json rings = json::array();
        for (const auto& ring : polygon.rings) {
            rings.push_back(ring_to_json(ring));
        }
        return rings;
    };

    if (tile.parts.size() == 1) {
        return {{"type", "Polygon"}, {"coordinates", polygon_coordinates(tile.parts.front())}};
    }

    json polygons = json::array();
    for (const auto& part : tile.parts) {
        polygons.push_back(polygon_coordinates(part));
    }
    return {{"type", "MultiPolygon"}, {"coordinates", polygons}};
}

json AuditExporter::ring_to_json(const Ring& ring) const {
    json coordinates = json::array();
    for (const auto& point : ring) {
        coordinates.push_back({format_coordinate(point.x()), format_coordinate(point.y())});
    }

    // Close the ring by repeating the first point (GeoJSON requirement)
    if (!ring.empty() && ring.front() != ring.back()) {
        coordinates.push_back({format_coordinate(ring.front().x()), format_coordinate(ring.front().y())});
    }
    return coordinates;
}

json AuditExporter::line_to_json(const LineData& line) const {
    json coordinates = json::array();
    for (const auto& point : line.points) {
        coordinates.push_back({format_coordinate(point.x()), format_coordinate(point.y())});
    }
    return coordinates;
}

json AuditExporter::edge_feature(const Tessellation& tessellation, const HexEdge& edge) const {
    const Point2D& from = tessellation.vertices()[edge.from].position;
    const Point2D& to = tessellation.vertices()[edge.to].position;

    json properties = {
        {"edge", edge.id},
        {"left", edge.left}
    };
    properties["right"] = edge.right ? json(*edge.right) : json(nullptr);

    return {
        {"type", "Feature"},
        {"properties", properties},
        {"geometry", {
            {"type", "LineString"},
            {"coordinates", {
                {format_coordinate(from.x()), format_coordinate(from.y())},
                {format_coordinate(to.x()), format_coordinate(to.y())}
            }}
        }}
    };
}

double AuditExporter::format_coordinate(double value) const {
    const double scale = std::pow(10.0, options_.precision);
    return std::round(value * scale) / scale;
}

bool AuditExporter::write_document(const json& document, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << document.dump(options_.pretty_print ? 2 : -1);
    if (options_.pretty_print) file << "\n";
    file.close();
    return !file.fail();
}

} // namespace hexmosaic

/**
 * @file AuditExporter.hpp
 * @brief GeoJSON and JSON export of the audit artifact and run summary
 *
 * Writes the per-tile audit as a GeoJSON FeatureCollection (clipped tile
 * footprint, before/after attributes, rationale) for inspection in GIS
 * software, the traced line paths as a second FeatureCollection, and the run
 * summary as a plain JSON document.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "ClassProfile.hpp"
#include "../core/HexTessellator.hpp"
#include "../core/LineTracer.hpp"
#include "../core/PersistenceManager.hpp"
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexmosaic {

/**
 * @brief Exports audit artifacts and run summaries
 */
class AuditExporter {
public:
    struct Options {
        bool pretty_print;
        int precision;
        bool include_rationale;
        bool include_edges;     ///< Append the lattice edge set as LineString features
        std::string crs;        ///< CRS name written to the "crs" member
        bool include_crs;

        Options()
            : pretty_print(true),
              precision(3),
              include_rationale(true),
              include_edges(false),
              crs(""),
              include_crs(true) {}
    };

    AuditExporter();
    explicit AuditExporter(const Options& options);

    /**
     * @brief Export the audit artifact as a GeoJSON FeatureCollection
     * @return true if export succeeded
     */
    bool export_audit(const Tessellation& tessellation, const AuditArtifact& artifact,
                      const std::string& filename) const;

    /**
     * @brief Export the run summary as JSON
     * @return true if export succeeded
     */
    bool export_summary(const RunSummary& summary, const std::string& filename) const;

    /**
     * @brief Export traced line paths, one LineString or MultiLineString per feature
     * @return true if export succeeded
     */
    bool export_line_paths(const Tessellation& tessellation, const std::vector<TracedLine>& lines,
                           const ClassProfile& profile, const std::string& filename) const;

    /**
     * @brief Build the FeatureCollection without writing it
     */
    nlohmann::json to_geojson(const Tessellation& tessellation, const AuditArtifact& artifact) const;

    nlohmann::json line_paths_to_geojson(const Tessellation& tessellation, const std::vector<TracedLine>& lines,
                                         const ClassProfile& profile) const;

private:
    Options options_;

    nlohmann::json tile_geometry(const HexTile& tile) const;
    nlohmann::json ring_to_json(const Ring& ring) const;
    nlohmann::json line_to_json(const LineData& line) const;
    void add_crs(nlohmann::json& collection, const Tessellation& tessellation) const;
    nlohmann::json edge_feature(const Tessellation& tessellation, const HexEdge& edge) const;
    double format_coordinate(double value) const;

    bool write_document(const nlohmann::json& document, const std::string& filename) const;
};

} // namespace hexmosaic

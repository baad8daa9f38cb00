/**
 * @file EvidenceSampler.hpp
 * @brief Per-tile, per-class evidence from vector sources and elevation
 *
 * For every tile the sampler measures, per class, the covered area fraction,
 * the centroid hit, the share of probe points hit and line presence, plus one
 * set of elevation statistics. Sampling is a pure function of the
 * tessellation, the drained sources, the raster and the profile; summation
 * order is fixed so repeated runs reproduce the same values bit for bit.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "ClassProfile.hpp"
#include "FeatureSource.hpp"
#include "GeometryUtils.hpp"
#include "HexTessellator.hpp"
#include "Logger.hpp"
#include "ParallelExecutor.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

/**
 * @brief Evidence for one (tile, class) pair
 */
struct EvidenceVector {
    size_t class_index = 0;
    double area_fraction = 0.0;   ///< [0,1], always 0 for line classes
    double centroid_vote = 0.0;   ///< 0 or 1
    double probe_votes = 0.0;     ///< Share of probes hit, [0,1]
    double edge_presence = 0.0;   ///< 0 or 1

    bool any() const {
        return area_fraction > 0.0 || centroid_vote > 0.0 || probe_votes > 0.0 || edge_presence > 0.0;
    }
};

struct ElevationStats {
    double min = 0.0;
    double mean = 0.0;
    double max = 0.0;
    double median = 0.0;
    size_t pixel_count = 0;
    double representative = 0.0;  ///< Chosen by SamplingParameters::elevation_method
};

/**
 * @brief All evidence of one tile
 *
 * `classes` holds only pairs with non-zero evidence, ascending by class index.
 */
struct TileEvidence {
    TileId tile = 0;
    std::vector<EvidenceVector> classes;
    std::optional<ElevationStats> elevation;
    size_t probe_count = 0;

    const EvidenceVector* find(size_t class_index) const;
};

struct IgnoredSource {
    std::string source;
    std::string class_label;
    std::string reason;
};

/**
 * @brief A drained line feature kept for tracing
 */
struct SampledLine {
    size_t class_index = 0;
    std::int64_t feature_id = 0;
    std::vector<LineData> lines;
};

struct SamplingResult {
    std::vector<TileEvidence> tiles;   ///< Indexed by tile id
    std::vector<SampledLine> lines;    ///< Line class features in source order, then id
    std::vector<IgnoredSource> ignored_sources;
    size_t features_used = 0;
    size_t features_skipped = 0;       ///< Empty or wrong-kind parts
    size_t tiles_with_elevation = 0;
};

class EvidenceSampler {
public:
    EvidenceSampler(const ClassProfile& profile, const ParallelExecutor& executor,
                    std::chrono::milliseconds source_timeout = std::chrono::milliseconds(30000));

    /**
     * @brief Sample every tile
     *
     * @throws HexMosaicError COORDINATE_SYSTEM_MISMATCH when the raster or a
     *         source CRS differs from the tessellation CRS, SOURCE_STALLED
     *         when a source misses its deadline, CANCELLED on request
     */
    SamplingResult sample(const Tessellation& tessellation,
                          const std::vector<std::unique_ptr<FeatureSource>>& sources,
                          const ElevationRaster* raster,
                          const CancellationToken* cancel = nullptr,
                          const ProgressCallback& progress = nullptr) const;

    /**
     * @brief Centroid followed by the ring probes that fall inside the tile
     */
    std::vector<Point2D> probe_points(const HexTile& tile, double edge_length) const;

    /**
     * @brief Elevation statistics of the valid pixels whose centres lie in the tile
     */
    std::optional<ElevationStats> sample_elevation(const HexTile& tile, const ElevationRaster& raster,
                                                   const std::array<double, 6>& inverse_transform) const;

    /**
     * @brief True when both CRS strings are unspecified or describe the same system
     */
    static bool same_crs(const std::string& a, const std::string& b);

private:
    struct LoadedFeature {
        size_t source_index = 0;
        std::int64_t id = 0;
        size_t class_index = 0;
        GeometryKind kind = GeometryKind::POLYGON;
        std::vector<PolygonData> polygons;
        std::vector<LineData> lines;
        OGRGeometryPtr geometry;
        BoundingBox bounds;
        double tolerance = 0.0;
        LineSnap snap = LineSnap::CENTERLINE;
    };

    const ClassProfile& profile_;
    const ParallelExecutor& executor_;
    std::chrono::milliseconds source_timeout_;
    Logger logger_;

    void check_crs(const Tessellation& tessellation,
                   const std::vector<std::unique_ptr<FeatureSource>>& sources,
                   const ElevationRaster* raster) const;

    std::vector<LoadedFeature> drain_sources(const std::vector<std::unique_ptr<FeatureSource>>& sources,
                                             SamplingResult& result) const;

    TileEvidence sample_tile(const Tessellation& tessellation, const HexTile& tile,
                             const std::vector<LoadedFeature>& features,
                             const std::vector<size_t>& candidates) const;
};

} // namespace hexmosaic

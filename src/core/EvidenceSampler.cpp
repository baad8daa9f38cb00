/**
 * @file EvidenceSampler.cpp
 * @brief Per-tile, per-class evidence from vector sources and elevation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "EvidenceSampler.hpp"
#include "HexMosaicError.hpp"

#include <gdal.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace hexmosaic {

namespace {

constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

bool valid_polygon(const PolygonData& polygon) {
    return !polygon.empty() && geometry::distinct_points(polygon.exterior()).size() >= 3;
}

} // anonymous namespace

const char* to_string(GeometryKind kind) {
    return kind == GeometryKind::LINE ? "line" : "polygon";
}

const EvidenceVector* TileEvidence::find(size_t class_index) const {
    for (const auto& evidence : classes) {
        if (evidence.class_index == class_index) {
            return &evidence;
        }
    }
    return nullptr;
}

EvidenceSampler::EvidenceSampler(const ClassProfile& profile, const ParallelExecutor& executor,
                                 std::chrono::milliseconds source_timeout)
    : profile_(profile), executor_(executor), source_timeout_(source_timeout),
      logger_("EvidenceSampler") {
}

bool EvidenceSampler::same_crs(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty() || a == b) {
        return true;
    }

    OGRSpatialReference srs_a;
    OGRSpatialReference srs_b;
    if (srs_a.SetFromUserInput(a.c_str()) != OGRERR_NONE ||
        srs_b.SetFromUserInput(b.c_str()) != OGRERR_NONE) {
        return false;
    }
    return srs_a.IsSame(&srs_b) != 0;
}

void EvidenceSampler::check_crs(const Tessellation& tessellation,
                                const std::vector<std::unique_ptr<FeatureSource>>& sources,
                                const ElevationRaster* raster) const {
    const std::string& boundary_crs = tessellation.crs();

    if (raster && !same_crs(boundary_crs, raster->crs)) {
        throw HexMosaicError(ErrorKind::COORDINATE_SYSTEM_MISMATCH, Phase::SAMPLING,
                             "elevation raster CRS differs from the boundary CRS; reproject before the run",
                             "elevation raster");
    }

    for (const auto& source : sources) {
        if (!same_crs(boundary_crs, source->crs())) {
            throw HexMosaicError(ErrorKind::COORDINATE_SYSTEM_MISMATCH, Phase::SAMPLING,
                                 "source CRS differs from the boundary CRS; reproject before the run",
                                 "source '" + source->name() + "'");
        }
    }
}

std::vector<EvidenceSampler::LoadedFeature>
EvidenceSampler::drain_sources(const std::vector<std::unique_ptr<FeatureSource>>& sources,
                               SamplingResult& result) const {
    std::vector<LoadedFeature> loaded;

    for (size_t s = 0; s < sources.size(); ++s) {
        FeatureSource& source = *sources[s];

        auto class_index = profile_.find_class(source.class_label());
        if (!class_index) {
            logger_.warning("Source '" + source.name() + "' has unknown class label '" +
                            source.class_label() + "', ignored");
            result.ignored_sources.push_back({source.name(), source.class_label(), "unknown class label"});
            continue;
        }

        const ClassDefinition& definition = profile_.class_at(*class_index);
        const GeometryKind expected = definition.is_line() ? GeometryKind::LINE : GeometryKind::POLYGON;
        if (source.kind() != expected) {
            logger_.warning("Source '" + source.name() + "' delivers " + to_string(source.kind()) +
                            " features but class '" + definition.label + "' expects " +
                            to_string(expected) + ", ignored");
            result.ignored_sources.push_back({source.name(), source.class_label(),
                                              std::string("geometry kind ") + to_string(source.kind()) +
                                              " does not match class kind " + to_string(expected)});
            continue;
        }

        const double tolerance = definition.is_line() ? profile_.snap_tolerance(*class_index) : 0.0;
        const LineSnap snap = definition.is_line() ? std::get<LineClass>(definition.kind).snap
                                                   : LineSnap::CENTERLINE;

        // The timeout bounds the wait for each feature, not the whole source
        auto deadline = std::chrono::steady_clock::now() + source_timeout_;
        std::vector<LoadedFeature> from_source;
        size_t received = 0;
        size_t skipped = 0;

        while (true) {
            Feature feature;
            FeatureSource::FetchStatus status = source.fetch(feature, deadline);
            if (status == FeatureSource::FetchStatus::END) {
                break;
            }
            if (status == FeatureSource::FetchStatus::TIMEOUT) {
                std::ostringstream oss;
                oss << "source delivered no data for " << source_timeout_.count() << " ms after "
                    << received << " features";
                throw HexMosaicError(ErrorKind::SOURCE_STALLED, Phase::SAMPLING, oss.str(),
                                     "source '" + source.name() + "'");
            }
            received++;
            deadline = std::chrono::steady_clock::now() + source_timeout_;

            LoadedFeature item;
            item.source_index = s;
            item.id = feature.id;
            item.class_index = *class_index;
            item.kind = expected;
            item.tolerance = tolerance;
            item.snap = snap;

            if (expected == GeometryKind::POLYGON) {
                skipped += feature.lines.size();
                for (auto& polygon : feature.polygons) {
                    if (valid_polygon(polygon)) {
                        item.polygons.push_back(std::move(polygon));
                    } else {
                        skipped++;
                    }
                }
                if (item.polygons.empty()) continue;
                item.geometry = geometry::to_ogr(item.polygons);
                item.bounds = geometry::envelope(*item.geometry);
            } else {
                skipped += feature.polygons.size();
                for (auto& line : feature.lines) {
                    if (!line.empty()) {
                        item.lines.push_back(std::move(line));
                    } else {
                        skipped++;
                    }
                }
                if (item.lines.empty()) continue;
                if (item.lines.size() == 1) {
                    item.geometry = geometry::to_ogr(item.lines.front());
                } else {
                    auto* multi = new OGRMultiLineString();
                    for (const auto& line : item.lines) {
                        multi->addGeometryDirectly(geometry::to_ogr(line).release());
                    }
                    item.geometry.reset(multi);
                }
                item.bounds = geometry::envelope(*item.geometry).expanded(tolerance);
            }
            from_source.push_back(std::move(item));
        }

        // Fixed summation order within a source
        std::stable_sort(from_source.begin(), from_source.end(),
                         [](const LoadedFeature& a, const LoadedFeature& b) { return a.id < b.id; });

        if (skipped > 0) {
            logger_.warning("Source '" + source.name() + "': skipped " + std::to_string(skipped) +
                            " empty or mismatched geometry parts");
        }
        logger_.detailed("Source '" + source.name() + "' -> class '" + definition.label + "': " +
                         std::to_string(from_source.size()) + " features");

        result.features_skipped += skipped;
        result.features_used += from_source.size();
        for (auto& item : from_source) {
            loaded.push_back(std::move(item));
        }
    }
    return loaded;
}

std::vector<Point2D> EvidenceSampler::probe_points(const HexTile& tile, double edge_length) const {
    const SamplingParameters& params = profile_.sampling();
    std::vector<Point2D> probes;
    probes.reserve(static_cast<size_t>(params.probe_ring_count) + 1);
    probes.push_back(tile.centroid);

    const double radius = params.probe_radius_fraction * edge_length;
    if (radius <= 0.0) {
        return probes;
    }

    for (int k = 0; k < params.probe_ring_count; ++k) {
        const double angle = (params.probe_angle_offset_deg +
                              k * 360.0 / params.probe_ring_count) * DEG_TO_RAD;
        Point2D probe(tile.centroid.x() + radius * std::cos(angle),
                      tile.centroid.y() + radius * std::sin(angle));
        if (geometry::point_in_any(probe, tile.parts)) {
            probes.push_back(probe);
        }
    }
    return probes;
}

std::optional<ElevationStats> EvidenceSampler::sample_elevation(
    const HexTile& tile, const ElevationRaster& raster,
    const std::array<double, 6>& inverse) const {

    // Pixel window covering the tile envelope
    const std::array<Point2D, 4> corners = {{
        Point2D(tile.envelope.min_x, tile.envelope.min_y), Point2D(tile.envelope.max_x, tile.envelope.min_y),
        Point2D(tile.envelope.max_x, tile.envelope.max_y), Point2D(tile.envelope.min_x, tile.envelope.max_y)
    }};
    double col_min = std::numeric_limits<double>::max(), col_max = std::numeric_limits<double>::lowest();
    double row_min = std::numeric_limits<double>::max(), row_max = std::numeric_limits<double>::lowest();
    for (const auto& corner : corners) {
        const double col = inverse[0] + corner.x() * inverse[1] + corner.y() * inverse[2];
        const double row = inverse[3] + corner.x() * inverse[4] + corner.y() * inverse[5];
        col_min = std::min(col_min, col);
        col_max = std::max(col_max, col);
        row_min = std::min(row_min, row);
        row_max = std::max(row_max, row);
    }

    const int c0 = std::max(0, static_cast<int>(std::floor(col_min)));
    const int c1 = std::min(raster.width - 1, static_cast<int>(std::floor(col_max)));
    const int r0 = std::max(0, static_cast<int>(std::floor(row_min)));
    const int r1 = std::min(raster.height - 1, static_cast<int>(std::floor(row_max)));
    if (c0 > c1 || r0 > r1) {
        return std::nullopt;
    }

    std::vector<double> values;
    for (int row = r0; row <= r1; ++row) {
        for (int col = c0; col <= c1; ++col) {
            const float value = raster.at(col, row);
            if (!raster.is_valid(value)) continue;
            if (!geometry::point_in_any(raster.pixel_center(col, row), tile.parts)) continue;
            values.push_back(static_cast<double>(value));
        }
    }
    if (values.empty()) {
        return std::nullopt;
    }

    ElevationStats stats;
    stats.pixel_count = values.size();
    stats.min = values.front();
    stats.max = values.front();
    double sum = 0.0;
    for (double value : values) {
        sum += value;
        stats.min = std::min(stats.min, value);
        stats.max = std::max(stats.max, value);
    }
    stats.mean = sum / static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    stats.median = sorted.size() % 2 == 1 ? sorted[mid] : (sorted[mid - 1] + sorted[mid]) / 2.0;

    switch (profile_.sampling().elevation_method) {
        case ElevationMethod::MEAN: stats.representative = stats.mean; break;
        case ElevationMethod::MEDIAN: stats.representative = stats.median; break;
        case ElevationMethod::MIN: stats.representative = stats.min; break;
    }
    return stats;
}

TileEvidence EvidenceSampler::sample_tile(const Tessellation& tessellation, const HexTile& tile,
                                          const std::vector<LoadedFeature>& features,
                                          const std::vector<size_t>& candidates) const {
    const size_t class_count = profile_.class_count();
    const std::vector<Point2D> probes = probe_points(tile, tessellation.layout().edge_length());

    TileEvidence evidence;
    evidence.tile = tile.id;
    evidence.probe_count = probes.size();

    std::vector<double> area(class_count, 0.0);
    std::vector<double> edge(class_count, 0.0);
    std::vector<bool> touched(class_count, false);
    std::vector<std::vector<char>> hits(class_count, std::vector<char>(probes.size(), 0));

    OGRGeometryPtr tile_boundary;

    for (size_t index : candidates) {
        const LoadedFeature& feature = features[index];
        const size_t c = feature.class_index;

        if (feature.kind == GeometryKind::POLYGON) {
            if (!tile.envelope.intersects(feature.bounds)) continue;

            OGRGeometryPtr overlap(tile.geometry->Intersection(feature.geometry.get()));
            if (overlap && !overlap->IsEmpty()) {
                area[c] += geometry::area(geometry::polygon_parts(*overlap));
                touched[c] = true;
            }
            for (size_t k = 0; k < probes.size(); ++k) {
                if (!hits[c][k] && geometry::point_in_any(probes[k], feature.polygons)) {
                    hits[c][k] = 1;
                    touched[c] = true;
                }
            }
        } else {
            double distance = -1.0;
            if (feature.snap == LineSnap::EDGE) {
                if (!tile_boundary) {
                    tile_boundary.reset(tile.geometry->Boundary());
                }
                if (tile_boundary) {
                    distance = tile_boundary->Distance(feature.geometry.get());
                }
            } else {
                distance = tile.geometry->Distance(feature.geometry.get());
            }
            if (distance >= 0.0 && distance <= feature.tolerance) {
                edge[c] = 1.0;
                touched[c] = true;
            }

            for (size_t k = 0; k < probes.size(); ++k) {
                if (hits[c][k]) continue;
                for (const auto& line : feature.lines) {
                    if (geometry::distance_to_line(probes[k], line) <= feature.tolerance) {
                        hits[c][k] = 1;
                        touched[c] = true;
                        break;
                    }
                }
            }
        }
    }

    for (size_t c = 0; c < class_count; ++c) {
        if (!touched[c]) continue;

        EvidenceVector vector;
        vector.class_index = c;
        vector.area_fraction = tile.area > 0.0 ? std::clamp(area[c] / tile.area, 0.0, 1.0) : 0.0;
        vector.centroid_vote = (!probes.empty() && hits[c][0]) ? 1.0 : 0.0;
        size_t hit_count = 0;
        for (char hit : hits[c]) {
            hit_count += hit ? 1 : 0;
        }
        vector.probe_votes = probes.empty() ? 0.0
                                            : static_cast<double>(hit_count) / static_cast<double>(probes.size());
        vector.edge_presence = edge[c];

        if (vector.any()) {
            evidence.classes.push_back(vector);
        }
    }
    return evidence;
}

SamplingResult EvidenceSampler::sample(const Tessellation& tessellation,
                                       const std::vector<std::unique_ptr<FeatureSource>>& sources,
                                       const ElevationRaster* raster,
                                       const CancellationToken* cancel,
                                       const ProgressCallback& progress) const {
    check_crs(tessellation, sources, raster);

    std::array<double, 6> inverse{};
    if (raster) {
        if (raster->width <= 0 || raster->height <= 0 ||
            raster->values.size() != static_cast<size_t>(raster->width) * static_cast<size_t>(raster->height)) {
            throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::SAMPLING,
                                 "elevation raster size does not match its value count", "elevation raster");
        }
        std::array<double, 6> forward = raster->geotransform;
        if (!GDALInvGeoTransform(forward.data(), inverse.data())) {
            throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::SAMPLING,
                                 "elevation raster geotransform is not invertible", "elevation raster");
        }
    }

    SamplingResult result;
    std::vector<LoadedFeature> features = drain_sources(sources, result);
    for (const auto& feature : features) {
        if (feature.kind == GeometryKind::LINE) {
            result.lines.push_back(SampledLine{feature.class_index, feature.id, feature.lines});
        }
    }

    // Candidate lists per tile, ascending feature index (source order, then id)
    std::vector<std::vector<size_t>> candidates(tessellation.size());
    for (size_t i = 0; i < features.size(); ++i) {
        for (TileId id : tessellation.query(features[i].bounds)) {
            candidates[id].push_back(i);
        }
    }

    result.tiles.resize(tessellation.size());
    ProgressReporter reporter(progress, Phase::SAMPLING, tessellation.size());

    executor_.for_each(tessellation.size(), Phase::SAMPLING, cancel, &reporter, [&](size_t i) {
        const HexTile& tile = tessellation.tile(static_cast<TileId>(i));
        TileEvidence evidence = sample_tile(tessellation, tile, features, candidates[i]);
        if (raster) {
            evidence.elevation = sample_elevation(tile, *raster, inverse);
        }
        result.tiles[i] = std::move(evidence);
    });
    reporter.finish();

    for (const auto& evidence : result.tiles) {
        if (evidence.elevation) {
            result.tiles_with_elevation++;
        } else if (raster) {
            logger_.debug("Tile " + std::to_string(evidence.tile) + " has no raster coverage");
        }
    }

    std::ostringstream msg;
    msg << "Sampled " << tessellation.size() << " tiles from " << result.features_used << " features";
    if (raster) {
        msg << ", " << result.tiles_with_elevation << "/" << tessellation.size() << " with elevation";
    }
    if (!result.ignored_sources.empty()) {
        msg << ", " << result.ignored_sources.size() << " sources ignored";
    }
    logger_.info(msg.str());

    return result;
}

} // namespace hexmosaic

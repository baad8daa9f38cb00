/**
 * @file HexTessellator.cpp
 * @brief Hex tessellation of a polygonal area of interest
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HexTessellator.hpp"
#include "HexMosaicError.hpp"
#include "ParallelExecutor.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

namespace hexmosaic {

using Kernel = CGAL::Exact_predicates_inexact_constructions_kernel;
using Polygon_2 = CGAL::Polygon_2<Kernel>;

namespace {

Polygon_2 to_cgal(const Ring& points) {
    Polygon_2 polygon;
    for (const auto& point : points) {
        polygon.push_back(Kernel::Point_2(point.x(), point.y()));
    }
    return polygon;
}

struct PreparedDeleter {
    void operator()(OGRPreparedGeometry* prepared) const {
        if (prepared) {
            OGRDestroyPreparedGeometry(prepared);
        }
    }
};

} // anonymous namespace

// ============================================================================
// Tessellation
// ============================================================================

Tessellation::Tessellation(HexLayout layout, TessellationConfig config)
    : layout_(std::move(layout)), config_(std::move(config)) {
}

std::optional<TileId> Tessellation::find(const AxialCoord& axial) const {
    auto it = axial_index_.find(axial);
    if (it == axial_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TileId> Tessellation::neighbor(TileId id, int direction) const {
    return find(HexLayout::neighbor(tiles_.at(id).axial, direction));
}

std::vector<TileId> Tessellation::query(const BoundingBox& area) const {
    std::vector<size_t> hits = spatial_index_.query(area);
    return std::vector<TileId>(hits.begin(), hits.end());
}

// ============================================================================
// HexTessellator
// ============================================================================

HexTessellator::HexTessellator(const TessellationConfig& config)
    : config_(config), logger_("HexTessellator") {
}

void HexTessellator::validate_config() const {
    if (!std::isfinite(config_.hex_edge_length) || config_.hex_edge_length <= 0.0) {
        std::ostringstream oss;
        oss << "hex edge length must be a positive finite number, got " << config_.hex_edge_length;
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::TESSELLATION,
                             oss.str(), "hex_edge_length");
    }
    if (config_.max_tiles == 0) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::TESSELLATION,
                             "tile cap must be at least 1", "max_tiles");
    }
    if (!std::isfinite(config_.min_sliver_fraction) || config_.min_sliver_fraction < 0.0 ||
        config_.min_sliver_fraction >= 1.0) {
        throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::TESSELLATION,
                             "sliver fraction must be in [0, 1)", "min_sliver_fraction");
    }
}

void HexTessellator::validate_boundary(const PolygonData& boundary, const OGRGeometry& shape) const {
    if (boundary.empty()) {
        throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                             "boundary polygon is empty", "ring 0");
    }

    for (size_t i = 0; i < boundary.rings.size(); ++i) {
        const std::string context = "ring " + std::to_string(i);
        Ring points = geometry::distinct_points(boundary.rings[i]);
        if (points.size() < 3) {
            throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                                 "ring has fewer than three distinct points", context);
        }
        for (const auto& point : points) {
            if (!std::isfinite(point.x()) || !std::isfinite(point.y())) {
                throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                                     "ring contains a non-finite coordinate", context);
            }
        }
        Polygon_2 polygon = to_cgal(points);
        if (!polygon.is_simple()) {
            throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                                 "ring is self-intersecting", context);
        }
        if (polygon.area() == 0.0) {
            throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                                 "ring has zero area", context);
        }
    }

    if (!shape.IsValid()) {
        throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::TESSELLATION,
                             "boundary polygon is invalid (holes outside the exterior or overlapping)",
                             "boundary");
    }
}

Tessellation HexTessellator::build(const PolygonData& boundary, const std::string& crs,
                                   const CancellationToken* cancel) const {
    validate_config();

    OGRGeometryPtr boundary_geometry = geometry::to_ogr(boundary);
    validate_boundary(boundary, *boundary_geometry);

    HexLayout layout(config_.orientation, config_.hex_edge_length, config_.origin);
    const double hex_area = layout.hex_area();

    // Fail before the scan when the area alone rules the run out
    const double estimated = geometry::area({boundary}) / hex_area;
    if (estimated > static_cast<double>(config_.max_tiles)) {
        std::ostringstream oss;
        oss << "boundary area needs at least " << static_cast<size_t>(estimated)
            << " tiles, cap is " << config_.max_tiles;
        throw HexMosaicError(ErrorKind::TESSELLATION_TOO_LARGE, Phase::TESSELLATION,
                             oss.str(), "max_tiles");
    }

    // Axial range covering the envelope, widened by one
    BoundingBox bounds = geometry::envelope(*boundary_geometry);
    const std::array<Point2D, 4> box_corners = {{
        Point2D(bounds.min_x, bounds.min_y), Point2D(bounds.max_x, bounds.min_y),
        Point2D(bounds.max_x, bounds.max_y), Point2D(bounds.min_x, bounds.max_y)
    }};
    double q_min = std::numeric_limits<double>::max(), q_max = std::numeric_limits<double>::lowest();
    double r_min = std::numeric_limits<double>::max(), r_max = std::numeric_limits<double>::lowest();
    for (const auto& corner : box_corners) {
        Eigen::Vector2d frac = layout.to_fractional(corner);
        q_min = std::min(q_min, frac.x());
        q_max = std::max(q_max, frac.x());
        r_min = std::min(r_min, frac.y());
        r_max = std::max(r_max, frac.y());
    }
    const int q_lo = static_cast<int>(std::floor(q_min)) - 1;
    const int q_hi = static_cast<int>(std::ceil(q_max)) + 1;
    const int r_lo = static_cast<int>(std::floor(r_min)) - 1;
    const int r_hi = static_cast<int>(std::ceil(r_max)) + 1;

    {
        std::ostringstream msg;
        msg << "Scanning axial range q=[" << q_lo << "," << q_hi << "] r=[" << r_lo << "," << r_hi
            << "], estimated " << static_cast<size_t>(std::ceil(estimated)) << " tiles";
        logger_.detailed(msg.str());
    }

    std::unique_ptr<OGRPreparedGeometry, PreparedDeleter> prepared(
        OGRCreatePreparedGeometry(boundary_geometry.get()));
    if (!prepared) {
        logger_.debug("Prepared geometry unavailable, using direct predicates");
    }

    Tessellation tessellation(layout, config_);
    tessellation.crs_ = crs;

    const double sliver_area = config_.min_sliver_fraction * hex_area;
    size_t partial_count = 0;
    size_t sliver_count = 0;

    const size_t candidates = static_cast<size_t>(q_hi - q_lo + 1) * static_cast<size_t>(r_hi - r_lo + 1);
    ProgressReporter reporter(progress, Phase::TESSELLATION, candidates);

    for (int r = r_lo; r <= r_hi; ++r) {
        for (int q = q_lo; q <= q_hi; ++q) {
            if (cancel && cancel->is_cancelled()) {
                throw HexMosaicError(ErrorKind::CANCELLED, Phase::TESSELLATION, "cancelled during tessellation",
                                     "hex (" + std::to_string(q) + "," + std::to_string(r) + ")");
            }
            reporter.advance();

            const AxialCoord axial(q, r);
            PolygonData hexagon;
            hexagon.rings.push_back(layout.hexagon_ring(axial));

            OGRGeometryPtr hex_geometry = geometry::to_ogr(hexagon);
            BoundingBox hex_bounds = geometry::envelope(*hex_geometry);
            if (!hex_bounds.intersects(bounds)) {
                continue;
            }

            const bool intersects = prepared
                ? OGRPreparedGeometryIntersects(prepared.get(), hex_geometry.get())
                : boundary_geometry->Intersects(hex_geometry.get());
            if (!intersects) {
                continue;
            }

            const bool contained = prepared
                ? OGRPreparedGeometryContains(prepared.get(), hex_geometry.get())
                : boundary_geometry->Contains(hex_geometry.get());

            HexTile tile;
            tile.axial = axial;
            tile.full_area = hex_area;

            if (contained) {
                tile.parts.push_back(std::move(hexagon));
                tile.geometry = std::move(hex_geometry);
                tile.area = hex_area;
                tile.centroid = layout.to_world(axial);
            } else {
                OGRGeometryPtr clipped(boundary_geometry->Intersection(hex_geometry.get()));
                if (!clipped) {
                    logger_.warning("Intersection failed for hex (" + std::to_string(q) + "," +
                                    std::to_string(r) + "), skipping");
                    continue;
                }
                tile.parts = geometry::polygon_parts(*clipped);
                tile.area = geometry::area(tile.parts);
                if (tile.parts.empty() || tile.area <= 0.0 || tile.area < sliver_area) {
                    sliver_count++;
                    continue;
                }
                tile.geometry = geometry::to_ogr(tile.parts);
                tile.is_partial = true;

                OGRPoint centroid;
                if (tile.geometry->Centroid(&centroid) == OGRERR_NONE && !centroid.IsEmpty()) {
                    tile.centroid = Point2D(centroid.getX(), centroid.getY());
                } else {
                    BoundingBox env = geometry::envelope(*tile.geometry);
                    tile.centroid = Point2D((env.min_x + env.max_x) / 2.0, (env.min_y + env.max_y) / 2.0);
                }
                partial_count++;
            }

            tile.envelope = geometry::envelope(*tile.geometry);
            tile.id = static_cast<TileId>(tessellation.tiles_.size());

            if (tessellation.tiles_.size() >= config_.max_tiles) {
                throw HexMosaicError(ErrorKind::TESSELLATION_TOO_LARGE, Phase::TESSELLATION,
                                     "tile count exceeds cap of " + std::to_string(config_.max_tiles),
                                     "max_tiles");
            }

            tessellation.axial_index_.emplace(axial, tile.id);
            tessellation.tiles_.push_back(std::move(tile));
        }
    }

    reporter.finish();

    tessellation.boundary_ = std::move(boundary_geometry);
    build_topology(tessellation);

    std::ostringstream msg;
    msg << "Tessellated boundary into " << tessellation.size() << " tiles ("
        << partial_count << " partial, " << sliver_count << " slivers dropped), "
        << tessellation.vertices_.size() << " vertices, " << tessellation.edges_.size() << " edges";
    logger_.info(msg.str());

    return tessellation;
}

void HexTessellator::build_topology(Tessellation& tessellation) const {
    const HexLayout& layout = tessellation.layout_;
    std::unordered_map<LatticeKey, VertexId, LatticeKeyHash> vertex_ids;
    std::map<std::pair<VertexId, VertexId>, EdgeId> edge_ids;

    auto vertex_for = [&](const LatticeKey& key) {
        auto it = vertex_ids.find(key);
        if (it != vertex_ids.end()) {
            return it->second;
        }
        HexVertex vertex;
        vertex.id = static_cast<VertexId>(tessellation.vertices_.size());
        vertex.key = key;
        vertex.position = layout.corner_position(key);
        vertex_ids.emplace(key, vertex.id);
        tessellation.vertices_.push_back(vertex);
        return vertex.id;
    };

    tessellation.adjacency_.assign(tessellation.tiles_.size(), {});
    std::vector<BoundingBox> envelopes;
    envelopes.reserve(tessellation.tiles_.size());

    for (auto& tile : tessellation.tiles_) {
        for (int corner = 0; corner < 6; ++corner) {
            tile.vertices[static_cast<size_t>(corner)] = vertex_for(HexLayout::corner_key(tile.axial, corner));
        }

        // Edge i faces neighbour i and joins corners i-1 and i
        for (int direction = 0; direction < 6; ++direction) {
            VertexId a = tile.vertices[static_cast<size_t>((direction + 5) % 6)];
            VertexId b = tile.vertices[static_cast<size_t>(direction)];
            auto key = std::make_pair(std::min(a, b), std::max(a, b));

            auto it = edge_ids.find(key);
            if (it == edge_ids.end()) {
                HexEdge edge;
                edge.id = static_cast<EdgeId>(tessellation.edges_.size());
                edge.from = a;
                edge.to = b;
                edge.left = tile.id;
                edge_ids.emplace(key, edge.id);
                tessellation.edges_.push_back(edge);
                tile.edges[static_cast<size_t>(direction)] = edge.id;
            } else {
                tessellation.edges_[it->second].right = tile.id;
                tile.edges[static_cast<size_t>(direction)] = it->second;
            }

            if (auto neighbor = tessellation.find(HexLayout::neighbor(tile.axial, direction))) {
                tessellation.adjacency_[tile.id].push_back(*neighbor);
            }
        }
        envelopes.push_back(tile.envelope);
    }

    tessellation.spatial_index_ = SpatialIndex(envelopes);
}

} // namespace hexmosaic

/**
 * @file HexTessellator.hpp
 * @brief Hex tessellation of a polygonal area of interest
 *
 * Produces the tile, vertex and edge sets for a boundary polygon together
 * with the axial adjacency map and a spatial index over tile envelopes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "GeometryUtils.hpp"
#include "HexLayout.hpp"
#include "Logger.hpp"
#include "SpatialIndex.hpp"

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hexmosaic {

struct HexVertex {
    VertexId id = 0;
    LatticeKey key;
    Point2D position;
};

/**
 * @brief Lattice edge between two vertices
 *
 * `left` is the tile that created the edge, `right` the neighbour across it
 * when that neighbour is part of the tessellation.
 */
struct HexEdge {
    EdgeId id = 0;
    VertexId from = 0;
    VertexId to = 0;
    TileId left = 0;
    std::optional<TileId> right;
};

/**
 * @brief One cell of the tessellation
 */
struct HexTile {
    TileId id = 0;
    AxialCoord axial;
    OGRGeometryPtr geometry;           ///< Hexagon clipped to the boundary
    std::vector<PolygonData> parts;    ///< Same footprint as coordinate rings
    BoundingBox envelope;
    Point2D centroid;
    double area = 0.0;
    double full_area = 0.0;
    bool is_partial = false;
    std::array<VertexId, 6> vertices{};
    std::array<EdgeId, 6> edges{};
};

/**
 * @brief Result of a tessellation, immutable once built
 *
 * Tiles live in a dense array indexed by id. Neighbour lookup goes through
 * the axial map; adjacency lists hold the ids of existing neighbours in
 * direction order.
 */
class Tessellation {
public:
    Tessellation(HexLayout layout, TessellationConfig config);

    Tessellation(Tessellation&&) = default;
    Tessellation& operator=(Tessellation&&) = default;

    const HexLayout& layout() const { return layout_; }
    const TessellationConfig& config() const { return config_; }
    const std::string& crs() const { return crs_; }
    const OGRGeometry& boundary() const { return *boundary_; }

    size_t size() const { return tiles_.size(); }
    bool empty() const { return tiles_.empty(); }
    const std::vector<HexTile>& tiles() const { return tiles_; }
    const HexTile& tile(TileId id) const { return tiles_.at(id); }

    const std::vector<HexVertex>& vertices() const { return vertices_; }
    const std::vector<HexEdge>& edges() const { return edges_; }

    std::optional<TileId> find(const AxialCoord& axial) const;

    /**
     * @brief Existing neighbour in one of the six directions
     */
    std::optional<TileId> neighbor(TileId id, int direction) const;

    const std::vector<TileId>& neighbors(TileId id) const { return adjacency_.at(id); }
    const std::vector<std::vector<TileId>>& adjacency() const { return adjacency_; }

    /**
     * @brief Tiles whose envelopes intersect the box, ascending by id
     */
    std::vector<TileId> query(const BoundingBox& area) const;

private:
    friend class HexTessellator;

    HexLayout layout_;
    TessellationConfig config_;
    std::string crs_;
    OGRGeometryPtr boundary_;
    std::vector<HexTile> tiles_;
    std::vector<HexVertex> vertices_;
    std::vector<HexEdge> edges_;
    std::unordered_map<AxialCoord, TileId, AxialCoordHash> axial_index_;
    std::vector<std::vector<TileId>> adjacency_;
    SpatialIndex spatial_index_;
};

class HexTessellator {
public:
    explicit HexTessellator(const TessellationConfig& config);

    /**
     * @brief Tessellate a boundary polygon
     *
     * @param boundary Exterior ring followed by holes, projected linear units
     * @param crs Boundary CRS as WKT or user string; empty means unspecified
     * @param cancel Optional token checked before each lattice candidate
     * @param progress Optional TESSELLATION events over the lattice candidates
     *        of the widened axial range
     * @throws HexMosaicError INVALID_CONFIGURATION, INVALID_BOUNDARY,
     *         TESSELLATION_TOO_LARGE or CANCELLED
     */
    Tessellation build(const PolygonData& boundary, const std::string& crs = "",
                       const CancellationToken* cancel = nullptr,
                       const ProgressCallback& progress = nullptr) const;

    /**
     * @brief Reject a non-positive or non-finite edge length and a zero tile cap
     */
    void validate_config() const;

    /**
     * @brief Reject empty, degenerate, self-intersecting or invalid boundaries
     */
    void validate_boundary(const PolygonData& boundary, const OGRGeometry& shape) const;

private:
    TessellationConfig config_;
    Logger logger_;

    void build_topology(Tessellation& tessellation) const;
};

} // namespace hexmosaic

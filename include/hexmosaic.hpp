#pragma once

/**
 * @file hexmosaic.hpp
 * @brief Main header for the HexMosaic tessellation and classification core
 *
 * Shared value types used by every stage of a run: planar geometry in the
 * projected CRS of the area of interest, axial hex coordinates, run
 * configuration, progress reporting and cooperative cancellation.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

// ============================================================================
// Planar geometry (projected, linear units)
// ============================================================================

/**
 * @brief 2D point with x, y coordinates
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
    bool operator!=(const Point2D& other) const { return !(*this == other); }
};

/**
 * @brief Axis-aligned bounding box for spatial queries
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    bool intersects(const BoundingBox& other) const {
        return min_x <= other.max_x && max_x >= other.min_x &&
               min_y <= other.max_y && max_y >= other.min_y;
    }

    BoundingBox expanded(double margin) const {
        return BoundingBox(min_x - margin, min_y - margin, max_x + margin, max_y + margin);
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

using Ring = std::vector<Point2D>;

/**
 * @brief Polygon as coordinate rings
 *
 * First ring is the exterior boundary, subsequent rings are holes. Rings may
 * be given open or closed; consumers close them when building geometries.
 */
struct PolygonData {
    std::vector<Ring> rings;

    bool empty() const { return rings.empty() || rings[0].empty(); }
    const Ring& exterior() const { return rings[0]; }
    size_t num_holes() const { return rings.empty() ? 0 : rings.size() - 1; }
};

/**
 * @brief Polyline as an ordered list of vertices
 */
struct LineData {
    std::vector<Point2D> points;

    bool empty() const { return points.size() < 2; }
};

// ============================================================================
// Hex addressing
// ============================================================================

/**
 * @brief Orientation of the hex lattice, fixed per tessellation
 */
enum class HexOrientation {
    FLAT_TOP,   ///< Two horizontal edges, columns of hexes
    POINTY_TOP  ///< Two vertical edges, rows of hexes
};

/**
 * @brief Axial hex coordinate (q, r)
 */
struct AxialCoord {
    int q = 0;
    int r = 0;

    AxialCoord() = default;
    AxialCoord(int q_, int r_) : q(q_), r(r_) {}

    AxialCoord operator+(const AxialCoord& other) const {
        return AxialCoord(q + other.q, r + other.r);
    }

    bool operator==(const AxialCoord& other) const { return q == other.q && r == other.r; }
    bool operator!=(const AxialCoord& other) const { return !(*this == other); }
    bool operator<(const AxialCoord& other) const {
        return r != other.r ? r < other.r : q < other.q;
    }
};

struct AxialCoordHash {
    size_t operator()(const AxialCoord& c) const {
        return std::hash<std::int64_t>()((static_cast<std::int64_t>(c.q) << 32) ^
                                         static_cast<std::uint32_t>(c.r));
    }
};

/**
 * @brief The six axial neighbour offsets, in counter-clockwise order
 */
constexpr std::array<std::array<int, 2>, 6> AXIAL_DIRECTIONS = {{
    {{+1, 0}}, {{+1, -1}}, {{0, -1}}, {{-1, 0}}, {{-1, +1}}, {{0, +1}}
}};

using TileId = std::uint32_t;
using VertexId = std::uint32_t;
using EdgeId = std::uint32_t;

// ============================================================================
// Run control
// ============================================================================

/**
 * @brief Pipeline phase, used for progress events and error context
 */
enum class Phase {
    VALIDATION,
    TESSELLATION,
    SAMPLING,
    SCORING,
    CLEANUP,
    PERSISTENCE
};

const char* to_string(Phase phase);

/**
 * @brief Progress event emitted while tiles are processed
 */
struct ProgressEvent {
    size_t tiles_processed = 0;
    size_t tiles_total = 0;
    Phase phase = Phase::VALIDATION;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Cooperative cancellation flag shared between caller and run
 *
 * Checked between tile units of work. Once requested it stays requested.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void request_cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_;
};

/**
 * @brief How the cleanup output is persisted
 */
enum class PersistenceMode {
    PREVIEW,  ///< Audit artifact only, stored attributes untouched
    APPLY     ///< Transactional write of all tile attributes
};

/**
 * @brief Configuration for hex lattice generation
 */
struct TessellationConfig {
    double hex_edge_length = 500.0;                        ///< Edge length in CRS units
    HexOrientation orientation = HexOrientation::POINTY_TOP;
    Point2D origin{0.0, 0.0};                              ///< World position of axial (0,0)
    double min_sliver_fraction = 1e-6;                     ///< Clipped area / full hex area below which a tile is dropped
    size_t max_tiles = 250000;                             ///< Hard cap on the tile count
};

/**
 * @brief Configuration for one classification run
 */
struct HexMosaicConfig {
    TessellationConfig tessellation;
    PersistenceMode mode = PersistenceMode::PREVIEW;

    // Processing options
    int num_threads = 0;  // 0 = let TBB decide
    std::chrono::milliseconds source_timeout{30000};  // Longest wait for one feature

    // Logging options
    int log_level = 3;  // 1=ERROR ... 6=TRACE
    std::optional<std::string> log_file;
};

} // namespace hexmosaic

/**
 * @file HexLayout.hpp
 * @brief Axial hex lattice geometry
 *
 * Maps axial coordinates to world positions through a 2x2 layout matrix and
 * names every lattice corner by an integer key, so that all tiles sharing a
 * corner derive the same world position from the same integers.
 */

#pragma once

#include "hexmosaic.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstdint>
#include <vector>

namespace hexmosaic {

/**
 * @brief Integer key of a lattice corner
 *
 * A corner of tile (q, r) between directions i and i+1 sits at
 * (3q + dq_i + dq_{i+1}, 3r + dr_i + dr_{i+1}) / 3 in axial space.
 */
struct LatticeKey {
    std::int64_t a = 0;
    std::int64_t b = 0;

    bool operator==(const LatticeKey& other) const { return a == other.a && b == other.b; }
    bool operator<(const LatticeKey& other) const {
        return b != other.b ? b < other.b : a < other.a;
    }
};

struct LatticeKeyHash {
    size_t operator()(const LatticeKey& key) const {
        return std::hash<std::int64_t>()(key.a * 0x9E3779B1LL ^ key.b);
    }
};

class HexLayout {
public:
    HexLayout(HexOrientation orientation, double edge_length, const Point2D& origin);

    HexOrientation orientation() const { return orientation_; }
    double edge_length() const { return edge_length_; }
    const Point2D& origin() const { return origin_; }

    /**
     * @brief Area of a full hexagon, 3*sqrt(3)/2 * s^2
     */
    double hex_area() const;

    Point2D to_world(const AxialCoord& axial) const;

    /**
     * @brief Fractional axial position of a world point
     */
    Eigen::Vector2d to_fractional(const Point2D& point) const;

    /**
     * @brief Axial coordinate of the hex containing a world point
     */
    AxialCoord locate(const Point2D& point) const;

    /**
     * @brief Nearest lattice cell to a fractional axial position (cube rounding)
     */
    static AxialCoord round(double q, double r);

    static AxialCoord neighbor(const AxialCoord& axial, int direction);

    /**
     * @brief Direction from a to its neighbour b, or -1 when not adjacent
     */
    static int direction_to(const AxialCoord& a, const AxialCoord& b);

    /**
     * @brief Number of steps between two cells
     */
    static int distance(const AxialCoord& a, const AxialCoord& b);

    /**
     * @brief Cells on the straight lattice line from a to b, both included
     *
     * Consecutive cells are adjacent.
     */
    static std::vector<AxialCoord> line_between(const AxialCoord& a, const AxialCoord& b);

    /**
     * @brief Key of corner i, shared by the tile and its neighbours i and i+1
     */
    static LatticeKey corner_key(const AxialCoord& axial, int corner);

    Point2D corner_position(const LatticeKey& key) const;

    /**
     * @brief The six corners in counter-clockwise world order
     */
    std::array<Point2D, 6> corners(const AxialCoord& axial) const;

    /**
     * @brief Closed counter-clockwise ring of the full hexagon
     */
    Ring hexagon_ring(const AxialCoord& axial) const;

private:
    HexOrientation orientation_;
    double edge_length_;
    Point2D origin_;
    Eigen::Matrix2d forward_;
    Eigen::Matrix2d inverse_;
};

} // namespace hexmosaic

/**
 * @file HexLayout.cpp
 * @brief Axial hex lattice geometry
 */

#include "HexLayout.hpp"

#include <cmath>
#include <cstdlib>

namespace hexmosaic {

namespace {
const double SQRT3 = std::sqrt(3.0);
}

HexLayout::HexLayout(HexOrientation orientation, double edge_length, const Point2D& origin)
    : orientation_(orientation), edge_length_(edge_length), origin_(origin) {
    if (orientation_ == HexOrientation::POINTY_TOP) {
        forward_ << SQRT3, SQRT3 / 2.0,
                    0.0,   1.5;
    } else {
        forward_ << 1.5,         0.0,
                    SQRT3 / 2.0, SQRT3;
    }
    forward_ *= edge_length_;
    inverse_ = forward_.inverse();
}

double HexLayout::hex_area() const {
    return 1.5 * SQRT3 * edge_length_ * edge_length_;
}

Point2D HexLayout::to_world(const AxialCoord& axial) const {
    Eigen::Vector2d world = forward_ * Eigen::Vector2d(axial.q, axial.r);
    return Point2D(origin_.x() + world.x(), origin_.y() + world.y());
}

Eigen::Vector2d HexLayout::to_fractional(const Point2D& point) const {
    return inverse_ * Eigen::Vector2d(point.x() - origin_.x(), point.y() - origin_.y());
}

AxialCoord HexLayout::locate(const Point2D& point) const {
    Eigen::Vector2d frac = to_fractional(point);
    return round(frac.x(), frac.y());
}

AxialCoord HexLayout::round(double q, double r) {
    double x = q;
    double z = r;
    double y = -x - z;

    double rx = std::round(x);
    double ry = std::round(y);
    double rz = std::round(z);

    double dx = std::abs(rx - x);
    double dy = std::abs(ry - y);
    double dz = std::abs(rz - z);

    if (dx > dy && dx > dz) {
        rx = -ry - rz;
    } else if (dy <= dz) {
        rz = -rx - ry;
    }
    return AxialCoord(static_cast<int>(rx), static_cast<int>(rz));
}

AxialCoord HexLayout::neighbor(const AxialCoord& axial, int direction) {
    const auto& d = AXIAL_DIRECTIONS[static_cast<size_t>(((direction % 6) + 6) % 6)];
    return AxialCoord(axial.q + d[0], axial.r + d[1]);
}

int HexLayout::direction_to(const AxialCoord& a, const AxialCoord& b) {
    for (int direction = 0; direction < 6; ++direction) {
        if (neighbor(a, direction) == b) {
            return direction;
        }
    }
    return -1;
}

int HexLayout::distance(const AxialCoord& a, const AxialCoord& b) {
    const int dq = a.q - b.q;
    const int dr = a.r - b.r;
    return (std::abs(dq) + std::abs(dr) + std::abs(dq + dr)) / 2;
}

std::vector<AxialCoord> HexLayout::line_between(const AxialCoord& a, const AxialCoord& b) {
    const int steps = distance(a, b);
    std::vector<AxialCoord> cells;
    cells.reserve(static_cast<size_t>(steps) + 1);
    cells.push_back(a);

    // Nudged off the cell boundaries so ties round the same way every time
    const double q0 = a.q + 1e-6, r0 = a.r + 1e-6;
    const double q1 = b.q + 1e-6, r1 = b.r + 1e-6;
    for (int i = 1; i < steps; ++i) {
        const double t = static_cast<double>(i) / steps;
        cells.push_back(round(q0 + (q1 - q0) * t, r0 + (r1 - r0) * t));
    }
    if (steps > 0) {
        cells.push_back(b);
    }
    return cells;
}

LatticeKey HexLayout::corner_key(const AxialCoord& axial, int corner) {
    const auto& d0 = AXIAL_DIRECTIONS[static_cast<size_t>(corner % 6)];
    const auto& d1 = AXIAL_DIRECTIONS[static_cast<size_t>((corner + 1) % 6)];
    LatticeKey key;
    key.a = 3 * static_cast<std::int64_t>(axial.q) + d0[0] + d1[0];
    key.b = 3 * static_cast<std::int64_t>(axial.r) + d0[1] + d1[1];
    return key;
}

Point2D HexLayout::corner_position(const LatticeKey& key) const {
    Eigen::Vector2d world = forward_ * Eigen::Vector2d(static_cast<double>(key.a) / 3.0,
                                                       static_cast<double>(key.b) / 3.0);
    return Point2D(origin_.x() + world.x(), origin_.y() + world.y());
}

std::array<Point2D, 6> HexLayout::corners(const AxialCoord& axial) const {
    // Corner indices run clockwise in a y-up world; walk them backwards
    std::array<Point2D, 6> result;
    for (int k = 0; k < 6; ++k) {
        result[static_cast<size_t>(k)] = corner_position(corner_key(axial, (6 - k) % 6));
    }
    return result;
}

Ring HexLayout::hexagon_ring(const AxialCoord& axial) const {
    auto points = corners(axial);
    Ring ring(points.begin(), points.end());
    ring.push_back(points[0]);
    return ring;
}

} // namespace hexmosaic

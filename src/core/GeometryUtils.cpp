/**
 * @file GeometryUtils.cpp
 * @brief Ring/OGR conversions and planar predicates
 */

#include "GeometryUtils.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace hexmosaic {
namespace geometry {

namespace {

using Kernel = CGAL::Exact_predicates_inexact_constructions_kernel;
using Polygon_2 = CGAL::Polygon_2<Kernel>;

OGRLinearRing* make_ring(const Ring& points) {
    OGRLinearRing* ring = new OGRLinearRing();
    for (const auto& point : points) {
        ring->addPoint(point.x(), point.y());
    }
    ring->closeRings();
    return ring;
}

PolygonData from_ogr_polygon(const OGRPolygon& polygon) {
    PolygonData data;
    const OGRLinearRing* exterior = polygon.getExteriorRing();
    if (!exterior) {
        return data;
    }

    auto read_ring = [](const OGRLinearRing& ring) {
        Ring points;
        points.reserve(static_cast<size_t>(ring.getNumPoints()));
        for (int i = 0; i < ring.getNumPoints(); ++i) {
            points.emplace_back(ring.getX(i), ring.getY(i));
        }
        return points;
    };

    data.rings.push_back(read_ring(*exterior));
    for (int i = 0; i < polygon.getNumInteriorRings(); ++i) {
        data.rings.push_back(read_ring(*polygon.getInteriorRing(i)));
    }
    return data;
}

void collect_parts(const OGRGeometry& geometry, std::vector<PolygonData>& parts) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbPolygon: {
            PolygonData data = from_ogr_polygon(*geometry.toPolygon());
            if (!data.empty()) {
                parts.push_back(std::move(data));
            }
            break;
        }
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const OGRGeometryCollection* collection = geometry.toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_parts(*collection->getGeometryRef(i), parts);
            }
            break;
        }
        default:
            break;
    }
}

void collect_lines(const OGRGeometry& geometry, std::vector<LineData>& lines) {
    switch (wkbFlatten(geometry.getGeometryType())) {
        case wkbLineString: {
            const OGRLineString* line = geometry.toLineString();
            LineData data;
            data.points.reserve(static_cast<size_t>(line->getNumPoints()));
            for (int i = 0; i < line->getNumPoints(); ++i) {
                data.points.emplace_back(line->getX(i), line->getY(i));
            }
            if (!data.empty()) {
                lines.push_back(std::move(data));
            }
            break;
        }
        case wkbMultiLineString:
        case wkbGeometryCollection: {
            const OGRGeometryCollection* collection = geometry.toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_lines(*collection->getGeometryRef(i), lines);
            }
            break;
        }
        default:
            break;
    }
}

} // anonymous namespace

OGRGeometryPtr to_ogr(const PolygonData& polygon) {
    if (polygon.empty()) {
        return OGRGeometryPtr(new OGRPolygon());
    }

    OGRPolygon* result = new OGRPolygon();
    for (const auto& ring : polygon.rings) {
        if (ring.empty()) continue;
        result->addRingDirectly(make_ring(ring));
    }
    return OGRGeometryPtr(result);
}

OGRGeometryPtr to_ogr(const std::vector<PolygonData>& parts) {
    if (parts.size() == 1) {
        return to_ogr(parts.front());
    }

    OGRMultiPolygon* result = new OGRMultiPolygon();
    for (const auto& part : parts) {
        OGRGeometryPtr polygon = to_ogr(part);
        result->addGeometryDirectly(polygon.release());
    }
    return OGRGeometryPtr(result);
}

OGRGeometryPtr to_ogr(const LineData& line) {
    OGRLineString* result = new OGRLineString();
    for (const auto& point : line.points) {
        result->addPoint(point.x(), point.y());
    }
    return OGRGeometryPtr(result);
}

std::vector<PolygonData> polygon_parts(const OGRGeometry& geometry) {
    std::vector<PolygonData> parts;
    collect_parts(geometry, parts);
    return parts;
}

std::vector<LineData> line_parts(const OGRGeometry& geometry) {
    std::vector<LineData> lines;
    collect_lines(geometry, lines);
    return lines;
}

BoundingBox envelope(const OGRGeometry& geometry) {
    OGREnvelope env;
    geometry.getEnvelope(&env);
    return BoundingBox(env.MinX, env.MinY, env.MaxX, env.MaxY);
}

double signed_area(const Ring& ring) {
    Ring points = distinct_points(ring);
    if (points.size() < 3) return 0.0;

    Polygon_2 polygon;
    for (const auto& point : points) {
        polygon.push_back(Kernel::Point_2(point.x(), point.y()));
    }
    return CGAL::to_double(polygon.area());
}

double area(const std::vector<PolygonData>& parts) {
    double total = 0.0;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        total += std::abs(signed_area(part.exterior()));
        for (size_t i = 1; i < part.rings.size(); ++i) {
            total -= std::abs(signed_area(part.rings[i]));
        }
    }
    return total;
}

bool point_in_ring(const Point2D& point, const Ring& ring) {
    bool inside = false;
    const size_t n = ring.size();
    if (n < 3) return false;

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& a = ring[i];
        const Point2D& b = ring[j];
        if ((a.y() > point.y()) != (b.y() > point.y())) {
            double x_cross = (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x();
            if (point.x() < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool point_in_polygon(const Point2D& point, const PolygonData& polygon) {
    if (polygon.empty() || !point_in_ring(point, polygon.exterior())) {
        return false;
    }
    for (size_t i = 1; i < polygon.rings.size(); ++i) {
        if (point_in_ring(point, polygon.rings[i])) {
            return false;
        }
    }
    return true;
}

bool point_in_any(const Point2D& point, const std::vector<PolygonData>& parts) {
    return std::any_of(parts.begin(), parts.end(), [&point](const PolygonData& part) {
        return point_in_polygon(point, part);
    });
}

double distance_to_segment(const Point2D& point, const Point2D& a, const Point2D& b) {
    const double dx = b.x() - a.x();
    const double dy = b.y() - a.y();
    const double length_sq = dx * dx + dy * dy;

    double t = 0.0;
    if (length_sq > 0.0) {
        t = ((point.x() - a.x()) * dx + (point.y() - a.y()) * dy) / length_sq;
        t = std::clamp(t, 0.0, 1.0);
    }
    const double px = a.x() + t * dx - point.x();
    const double py = a.y() + t * dy - point.y();
    return std::sqrt(px * px + py * py);
}

double distance_to_line(const Point2D& point, const LineData& line) {
    if (line.points.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (line.points.size() == 1) {
        return distance_to_segment(point, line.points[0], line.points[0]);
    }

    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < line.points.size(); ++i) {
        best = std::min(best, distance_to_segment(point, line.points[i - 1], line.points[i]));
    }
    return best;
}

Ring distinct_points(const Ring& ring) {
    Ring result;
    result.reserve(ring.size());
    for (const auto& point : ring) {
        if (result.empty() || result.back() != point) {
            result.push_back(point);
        }
    }
    while (result.size() > 1 && result.front() == result.back()) {
        result.pop_back();
    }
    return result;
}

} // namespace geometry
} // namespace hexmosaic

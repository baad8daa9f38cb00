/**
 * @file GeometryUtils.hpp
 * @brief Conversions between coordinate rings and OGR geometries, plus the
 *        planar predicates the sampler evaluates per probe point
 */

#pragma once

#include "hexmosaic.hpp"

#include <ogr_geometry.h>

#include <memory>
#include <vector>

namespace hexmosaic {

struct OGRGeometryDeleter {
    void operator()(OGRGeometry* geometry) const {
        if (geometry) {
            OGRGeometryFactory::destroyGeometry(geometry);
        }
    }
};

using OGRGeometryPtr = std::unique_ptr<OGRGeometry, OGRGeometryDeleter>;

namespace geometry {

/**
 * @brief Build a closed OGRPolygon from rings (exterior first)
 */
OGRGeometryPtr to_ogr(const PolygonData& polygon);

/**
 * @brief Build an OGRMultiPolygon, or a plain polygon for a single part
 */
OGRGeometryPtr to_ogr(const std::vector<PolygonData>& parts);

OGRGeometryPtr to_ogr(const LineData& line);

/**
 * @brief Extract polygon parts from a (multi)polygon or collection
 *
 * Non-areal members of a collection are skipped.
 */
std::vector<PolygonData> polygon_parts(const OGRGeometry& geometry);

/**
 * @brief Extract line strings from a (multi)line string or collection
 */
std::vector<LineData> line_parts(const OGRGeometry& geometry);

BoundingBox envelope(const OGRGeometry& geometry);

/**
 * @brief Signed area of a ring through CGAL::Polygon_2 (positive when
 *        counter-clockwise); open or closed rings give the same value
 */
double signed_area(const Ring& ring);

/**
 * @brief Area of polygon parts, holes subtracted
 */
double area(const std::vector<PolygonData>& parts);

/**
 * @brief Even-odd ray casting against one ring
 */
bool point_in_ring(const Point2D& point, const Ring& ring);

/**
 * @brief Inside the exterior and outside every hole
 */
bool point_in_polygon(const Point2D& point, const PolygonData& polygon);

bool point_in_any(const Point2D& point, const std::vector<PolygonData>& parts);

double distance_to_segment(const Point2D& point, const Point2D& a, const Point2D& b);

double distance_to_line(const Point2D& point, const LineData& line);

/**
 * @brief Ring without a repeated closing point and without consecutive duplicates
 */
Ring distinct_points(const Ring& ring);

} // namespace geometry
} // namespace hexmosaic

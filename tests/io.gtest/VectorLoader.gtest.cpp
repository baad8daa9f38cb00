#include "io/VectorLoader.hpp"
#include "HexMosaicError.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace hexmosaic {
namespace gtest {

namespace fs = std::filesystem;

namespace {

//! Write a GeoJSON document to a per-test temporary file.
std::string write_geojson(const std::string& name, const std::string& content) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() / (std::string("hexmosaic_vector_") + info->name());
    fs::create_directories(dir);
    const fs::path path = dir / name;
    std::ofstream(path) << content;
    return path.string();
}

const char* SQUARE_BOUNDARY = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]]]}}
  ]
})";

const char* ADJACENT_HALVES = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [5, 0], [5, 10], [0, 10], [0, 0]]]}},
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[5, 0], [10, 0], [10, 10], [5, 10], [5, 0]]]}}
  ]
})";

const char* DISJOINT_SQUARES = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]]}},
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[5, 5], [6, 5], [6, 6], [5, 6], [5, 5]]]}}
  ]
})";

const char* RIVERS = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {"name": "a"},
     "geometry": {"type": "LineString", "coordinates": [[0, 5], [10, 5]]}},
    {"type": "Feature", "properties": {"name": "b"},
     "geometry": {"type": "MultiLineString", "coordinates": [[[1, 1], [2, 2]], [[3, 3], [4, 4]]]}}
  ]
})";

double ring_area(const Ring& ring) {
    double sum = 0.0;
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        sum += ring[i].x() * ring[i + 1].y() - ring[i + 1].x() * ring[i].y();
    }
    return std::abs(sum) / 2.0;
}

} // namespace

TEST(VectorLoader, LoadsSinglePolygonBoundary) {
    VectorLoader loader;
    BoundaryInput input = loader.load_boundary(write_geojson("boundary.geojson", SQUARE_BOUNDARY));
    EXPECT_EQ(input.boundary.num_holes(), 0u);
    EXPECT_NEAR(ring_area(input.boundary.exterior()), 100.0, 1e-9);
}

TEST(VectorLoader, UnionsTouchingBoundaryFeatures) {
    VectorLoader loader;
    BoundaryInput input = loader.load_boundary(write_geojson("halves.geojson", ADJACENT_HALVES));
    EXPECT_NEAR(ring_area(input.boundary.exterior()), 100.0, 1e-9);
}

TEST(VectorLoader, RejectsDisjointBoundary) {
    VectorLoader loader;
    try {
        loader.load_boundary(write_geojson("disjoint.geojson", DISJOINT_SQUARES));
        FAIL() << "disjoint boundary accepted";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_BOUNDARY);
    }
}

TEST(VectorLoader, RejectsMissingFile) {
    VectorLoader loader;
    try {
        loader.load_boundary("/nonexistent/boundary.geojson");
        FAIL() << "missing file accepted";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION);
        EXPECT_EQ(e.context(), "/nonexistent/boundary.geojson");
    }
}

TEST(VectorLoader, StreamsLineFeatures) {
    VectorLoader loader;
    auto source = loader.open_source(write_geojson("rivers.geojson", RIVERS), "River");

    EXPECT_EQ(source->kind(), GeometryKind::LINE);
    EXPECT_EQ(source->name(), "rivers");
    EXPECT_EQ(source->class_label(), "River");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    Feature feature;
    size_t features = 0;
    size_t parts = 0;
    while (source->fetch(feature, deadline) == FeatureSource::FetchStatus::FEATURE) {
        features++;
        parts += feature.lines.size();
        EXPECT_TRUE(feature.polygons.empty());
    }
    EXPECT_EQ(features, 2u);
    EXPECT_EQ(parts, 3u);
}

TEST(VectorLoader, ExplicitKindOverridesLayerType) {
    VectorLoader loader;
    auto source = loader.open_source(write_geojson("boundary.geojson", SQUARE_BOUNDARY), "Forest",
                                     GeometryKind::POLYGON);
    EXPECT_EQ(source->kind(), GeometryKind::POLYGON);

    Feature feature;
    ASSERT_EQ(source->fetch(feature, std::chrono::steady_clock::now() + std::chrono::seconds(30)),
              FeatureSource::FetchStatus::FEATURE);
    ASSERT_EQ(feature.polygons.size(), 1u);
}

TEST(VectorLoader, ExpiredDeadlineTimesOut) {
    VectorLoader loader;
    auto source = loader.open_source(write_geojson("rivers.geojson", RIVERS), "River");
    Feature feature;
    EXPECT_EQ(source->fetch(feature, std::chrono::steady_clock::now() - std::chrono::seconds(1)),
              FeatureSource::FetchStatus::TIMEOUT);
}

} // namespace gtest
} // namespace hexmosaic

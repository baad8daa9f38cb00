/**
 * @file FeatureSource.hpp
 * @brief Inputs of the evidence sampler: vector feature sources and the
 *        elevation raster
 *
 * Both are produced by collaborators outside the core (file loaders, tests)
 * and handed in already resolved, in the CRS of the boundary.
 */

#pragma once

#include "hexmosaic.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hexmosaic {

enum class GeometryKind {
    POLYGON,
    LINE
};

const char* to_string(GeometryKind kind);

/**
 * @brief One feature of a source, possibly multi-part
 *
 * Polygon sources fill `polygons`, line sources fill `lines`.
 */
struct Feature {
    std::int64_t id = 0;
    std::vector<PolygonData> polygons;
    std::vector<LineData> lines;
};

/**
 * @brief Pull-based feature stream tagged with a class label
 */
class FeatureSource {
public:
    enum class FetchStatus {
        FEATURE,  ///< `out` holds the next feature
        END,      ///< Stream exhausted
        TIMEOUT   ///< Nothing arrived before the deadline
    };

    virtual ~FeatureSource() = default;

    virtual const std::string& name() const = 0;
    virtual const std::string& class_label() const = 0;
    virtual GeometryKind kind() const = 0;

    /**
     * @brief CRS as WKT or user string; empty means unspecified
     */
    virtual const std::string& crs() const = 0;

    /**
     * @brief Fetch the next feature, waiting no later than the deadline
     */
    virtual FetchStatus fetch(Feature& out, std::chrono::steady_clock::time_point deadline) = 0;
};

/**
 * @brief Source over features already held in memory
 */
class VectorFeatureSource : public FeatureSource {
public:
    VectorFeatureSource(std::string name, std::string class_label, GeometryKind kind,
                        std::vector<Feature> features, std::string crs = "")
        : name_(std::move(name)), class_label_(std::move(class_label)), kind_(kind),
          crs_(std::move(crs)), features_(std::move(features)) {}

    const std::string& name() const override { return name_; }
    const std::string& class_label() const override { return class_label_; }
    GeometryKind kind() const override { return kind_; }
    const std::string& crs() const override { return crs_; }

    FetchStatus fetch(Feature& out, std::chrono::steady_clock::time_point) override {
        if (position_ >= features_.size()) {
            return FetchStatus::END;
        }
        out = features_[position_++];
        return FetchStatus::FEATURE;
    }

private:
    std::string name_;
    std::string class_label_;
    GeometryKind kind_;
    std::string crs_;
    std::vector<Feature> features_;
    size_t position_ = 0;
};

/**
 * @brief Single-band elevation grid with a north-up or rotated geotransform
 *
 * Values are row-major, `width * height` long. Pixels equal to `nodata` and
 * non-finite pixels carry no elevation.
 */
struct ElevationRaster {
    int width = 0;
    int height = 0;
    std::vector<float> values;
    std::array<double, 6> geotransform{{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}};
    std::optional<double> nodata;
    std::string crs;

    float at(int col, int row) const {
        return values[static_cast<size_t>(row) * static_cast<size_t>(width) + static_cast<size_t>(col)];
    }

    bool is_valid(float value) const {
        return std::isfinite(value) && !(nodata && value == static_cast<float>(*nodata));
    }

    Point2D pixel_center(int col, int row) const {
        const double px = col + 0.5;
        const double py = row + 0.5;
        return Point2D(geotransform[0] + px * geotransform[1] + py * geotransform[2],
                       geotransform[3] + px * geotransform[4] + py * geotransform[5]);
    }
};

} // namespace hexmosaic

/**
 * @file VectorLoader.hpp
 * @brief OGR readers for the boundary polygon and the vector feature sources
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/Logger.hpp"
#include "GdalHandles.hpp"

#include <memory>
#include <optional>
#include <string>

class OGRLayer;

namespace hexmosaic {

struct BoundaryInput {
    PolygonData boundary;
    std::string crs;   ///< Layer CRS as WKT, empty when the layer has none
};

/**
 * @brief Feature source streaming from an OGR layer
 *
 * Geometries are reprojected to the target CRS when one was requested and
 * differs from the layer CRS.
 */
class OgrFeatureSource : public FeatureSource {
public:
    OgrFeatureSource(std::string name, std::string class_label, GeometryKind kind,
                     GDALDatasetPtr dataset, OGRLayer* layer, std::string crs,
                     CoordinateTransformationPtr transform);
    ~OgrFeatureSource() override;

    const std::string& name() const override { return name_; }
    const std::string& class_label() const override { return class_label_; }
    GeometryKind kind() const override { return kind_; }
    const std::string& crs() const override { return crs_; }

    FetchStatus fetch(Feature& out, std::chrono::steady_clock::time_point deadline) override;

private:
    std::string name_;
    std::string class_label_;
    GeometryKind kind_;
    GDALDatasetPtr dataset_;
    OGRLayer* layer_;
    std::string crs_;
    CoordinateTransformationPtr transform_;
};

class VectorLoader {
public:
    VectorLoader();

    /**
     * @brief Read the area of interest from a vector file
     *
     * All polygon features of the layer are unioned; the union must be a
     * single polygon.
     *
     * @throws HexMosaicError INVALID_CONFIGURATION when the file or layer
     *         cannot be read, INVALID_BOUNDARY when the union is empty or
     *         has more than one part
     */
    BoundaryInput load_boundary(const std::string& path, const std::string& layer_name = "") const;

    /**
     * @brief Open a layer as a feature source for one class
     *
     * @param kind Geometry kind, or nullopt to take it from the layer geometry type
     * @param target_crs CRS to reproject into; empty keeps the layer CRS
     */
    std::unique_ptr<FeatureSource> open_source(const std::string& path,
                                               const std::string& class_label,
                                               std::optional<GeometryKind> kind = std::nullopt,
                                               const std::string& layer_name = "",
                                               const std::string& target_crs = "") const;

private:
    Logger logger_;
};

} // namespace hexmosaic

/**
 * @file GdalHandles.hpp
 * @brief RAII ownership of GDAL datasets and OGR coordinate transformations
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <memory>

class GDALDataset;
class OGRCoordinateTransformation;

namespace hexmosaic {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const;
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* transform) const;
};

using CoordinateTransformationPtr = std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

} // namespace hexmosaic

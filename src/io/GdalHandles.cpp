/**
 * @file GdalHandles.cpp
 * @brief RAII ownership of GDAL datasets and OGR coordinate transformations
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GdalHandles.hpp"

#include <gdal_priv.h>
#include <ogr_spatialref.h>

namespace hexmosaic {

void GDALDatasetDeleter::operator()(GDALDataset* dataset) const {
    if (dataset) {
        GDALClose(dataset);
    }
}

void CoordinateTransformationDeleter::operator()(OGRCoordinateTransformation* transform) const {
    if (transform) {
        OGRCoordinateTransformation::DestroyCT(transform);
    }
}

} // namespace hexmosaic

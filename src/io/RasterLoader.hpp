/**
 * @file RasterLoader.hpp
 * @brief GDAL reader producing the elevation raster consumed by the sampler
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hexmosaic.hpp"
#include "../core/FeatureSource.hpp"
#include "../core/Logger.hpp"

#include <optional>
#include <string>

namespace hexmosaic {

class RasterLoader {
public:
    RasterLoader();

    /**
     * @brief Read one band of a GDAL raster
     *
     * @param path Any raster GDAL can open (GeoTIFF, HGT, VRT, ...)
     * @param window Optional area of interest; only the pixels covering it are read
     * @param band_number 1-based band number
     * @throws HexMosaicError INVALID_CONFIGURATION when the file, band or
     *         window cannot be read; the path is the context
     */
    ElevationRaster load(const std::string& path,
                         const std::optional<BoundingBox>& window = std::nullopt,
                         int band_number = 1) const;

private:
    Logger logger_;
};

} // namespace hexmosaic

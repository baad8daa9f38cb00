/**
 * @file RasterLoader.cpp
 * @brief GDAL reader producing the elevation raster consumed by the sampler
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterLoader.hpp"
#include "GdalHandles.hpp"
#include "HexMosaicError.hpp"

#include <gdal_priv.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

namespace hexmosaic {

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& message) {
    throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION, message, path);
}

} // namespace

RasterLoader::RasterLoader() : logger_("RasterLoader") {
    GDALAllRegister();
}

ElevationRaster RasterLoader::load(const std::string& path,
                                   const std::optional<BoundingBox>& window,
                                   int band_number) const {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        fail(path, "cannot open elevation raster: " + std::string(CPLGetLastErrorMsg()));
    }

    GDALRasterBand* band = dataset->GetRasterBand(band_number);
    if (!band) {
        fail(path, "raster has no band " + std::to_string(band_number));
    }

    std::array<double, 6> transform{};
    if (dataset->GetGeoTransform(transform.data()) != CE_None) {
        fail(path, "raster has no geotransform");
    }

    int x_off = 0;
    int y_off = 0;
    int x_size = dataset->GetRasterXSize();
    int y_size = dataset->GetRasterYSize();

    if (window) {
        // Pixel window covering the four corners of the area, one pixel of margin
        double inverse[6];
        if (!GDALInvGeoTransform(transform.data(), inverse)) {
            fail(path, "raster geotransform is not invertible");
        }
        double min_col = std::numeric_limits<double>::max(), min_row = min_col;
        double max_col = std::numeric_limits<double>::lowest(), max_row = max_col;
        const Point2D corners[4] = {
            {window->min_x, window->min_y}, {window->max_x, window->min_y},
            {window->max_x, window->max_y}, {window->min_x, window->max_y}
        };
        for (const auto& corner : corners) {
            double col, row;
            GDALApplyGeoTransform(inverse, corner.x(), corner.y(), &col, &row);
            min_col = std::min(min_col, col);
            max_col = std::max(max_col, col);
            min_row = std::min(min_row, row);
            max_row = std::max(max_row, row);
        }

        x_off = std::max(0, static_cast<int>(std::floor(min_col)) - 1);
        y_off = std::max(0, static_cast<int>(std::floor(min_row)) - 1);
        const int x_end = std::min(dataset->GetRasterXSize(), static_cast<int>(std::ceil(max_col)) + 1);
        const int y_end = std::min(dataset->GetRasterYSize(), static_cast<int>(std::ceil(max_row)) + 1);
        x_size = x_end - x_off;
        y_size = y_end - y_off;

        if (x_size <= 0 || y_size <= 0) {
            fail(path, "raster does not overlap the requested area");
        }
    }

    ElevationRaster raster;
    raster.width = x_size;
    raster.height = y_size;
    raster.values.resize(static_cast<size_t>(x_size) * static_cast<size_t>(y_size));

    int has_nodata = 0;
    const double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        raster.nodata = nodata;
    }

    CPLErr err = band->RasterIO(GF_Read, x_off, y_off, x_size, y_size,
                                raster.values.data(), x_size, y_size, GDT_Float32, 0, 0);
    if (err != CE_None) {
        fail(path, "failed to read elevation data: " + std::string(CPLGetLastErrorMsg()));
    }

    // Update geotransform for the extracted window
    raster.geotransform = transform;
    raster.geotransform[0] += x_off * transform[1] + y_off * transform[2];
    raster.geotransform[3] += x_off * transform[4] + y_off * transform[5];

    const char* projection = dataset->GetProjectionRef();
    raster.crs = projection ? projection : "";

    size_t valid = 0;
    for (float value : raster.values) {
        if (raster.is_valid(value)) valid++;
    }

    std::ostringstream msg;
    msg << "Loaded elevation raster " << path << ": " << x_size << "x" << y_size
        << " pixels, " << valid << " valid";
    logger_.info(msg.str());
    if (valid == 0) {
        logger_.warning("Elevation raster " + path + " has no valid pixels in the requested area");
    }

    return raster;
}

} // namespace hexmosaic

/**
 * @file VectorLoader.cpp
 * @brief OGR readers for the boundary polygon and the vector feature sources
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "VectorLoader.hpp"
#include "HexMosaicError.hpp"
#include "../core/GeometryUtils.hpp"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>

#include <filesystem>

namespace hexmosaic {

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& message) {
    throw HexMosaicError(ErrorKind::INVALID_CONFIGURATION, Phase::VALIDATION, message, path);
}

GDALDatasetPtr open_vector(const std::string& path) {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        fail(path, "cannot open vector file: " + std::string(CPLGetLastErrorMsg()));
    }
    return dataset;
}

OGRLayer* find_layer(GDALDataset& dataset, const std::string& path, const std::string& layer_name) {
    OGRLayer* layer = layer_name.empty() ? dataset.GetLayer(0)
                                         : dataset.GetLayerByName(layer_name.c_str());
    if (!layer) {
        fail(path, layer_name.empty() ? "file has no layers" : "no layer named '" + layer_name + "'");
    }
    return layer;
}

std::string layer_crs(OGRLayer& layer) {
    const OGRSpatialReference* srs = layer.GetSpatialRef();
    if (!srs) {
        return "";
    }
    char* wkt = nullptr;
    std::string result;
    if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

} // namespace

// ============================================================================
// OgrFeatureSource
// ============================================================================

OgrFeatureSource::OgrFeatureSource(std::string name, std::string class_label, GeometryKind kind,
                                   GDALDatasetPtr dataset, OGRLayer* layer, std::string crs,
                                   CoordinateTransformationPtr transform)
    : name_(std::move(name)), class_label_(std::move(class_label)), kind_(kind),
      dataset_(std::move(dataset)), layer_(layer), crs_(std::move(crs)),
      transform_(std::move(transform)) {
    layer_->ResetReading();
}

OgrFeatureSource::~OgrFeatureSource() = default;

FeatureSource::FetchStatus OgrFeatureSource::fetch(Feature& out, std::chrono::steady_clock::time_point deadline) {
    if (std::chrono::steady_clock::now() > deadline) {
        return FetchStatus::TIMEOUT;
    }

    OGRFeatureUniquePtr feature(layer_->GetNextFeature());
    if (!feature) {
        return FetchStatus::END;
    }

    out = Feature();
    out.id = feature->GetFID();

    const OGRGeometry* shape = feature->GetGeometryRef();
    if (!shape) {
        return FetchStatus::FEATURE;
    }

    OGRGeometryPtr projected;
    if (transform_) {
        projected.reset(shape->clone());
        if (projected->transform(transform_.get()) != OGRERR_NONE) {
            throw HexMosaicError(ErrorKind::COORDINATE_SYSTEM_MISMATCH, Phase::SAMPLING,
                                 "cannot reproject feature " + std::to_string(out.id),
                                 "source '" + name_ + "'");
        }
        shape = projected.get();
    }

    if (kind_ == GeometryKind::POLYGON) {
        out.polygons = geometry::polygon_parts(*shape);
    } else {
        out.lines = geometry::line_parts(*shape);
    }
    return FetchStatus::FEATURE;
}

// ============================================================================
// VectorLoader
// ============================================================================

VectorLoader::VectorLoader() : logger_("VectorLoader") {
    GDALAllRegister();
}

BoundaryInput VectorLoader::load_boundary(const std::string& path, const std::string& layer_name) const {
    GDALDatasetPtr dataset = open_vector(path);
    OGRLayer* layer = find_layer(*dataset, path, layer_name);

    OGRMultiPolygon collected;
    size_t features = 0;
    layer->ResetReading();
    for (OGRFeatureUniquePtr feature(layer->GetNextFeature()); feature; feature.reset(layer->GetNextFeature())) {
        const OGRGeometry* shape = feature->GetGeometryRef();
        if (!shape) continue;
        for (const auto& part : geometry::polygon_parts(*shape)) {
            collected.addGeometryDirectly(geometry::to_ogr(part).release());
        }
        features++;
    }

    if (collected.IsEmpty()) {
        throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::VALIDATION,
                             "boundary layer contains no polygons", path);
    }

    OGRGeometryPtr merged(collected.getNumGeometries() == 1 ? collected.getGeometryRef(0)->clone()
                                                           : collected.UnionCascaded());
    if (!merged) {
        throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::VALIDATION,
                             "cannot merge boundary polygons: " + std::string(CPLGetLastErrorMsg()), path);
    }

    std::vector<PolygonData> parts = geometry::polygon_parts(*merged);
    if (parts.size() != 1) {
        throw HexMosaicError(ErrorKind::INVALID_BOUNDARY, Phase::VALIDATION,
                             "boundary must be a single polygon, found " + std::to_string(parts.size()) +
                             " disjoint parts", path);
    }

    BoundaryInput input;
    input.boundary = std::move(parts.front());
    input.crs = layer_crs(*layer);

    logger_.info("Loaded boundary from " + path + " (" + std::to_string(features) + " features, " +
                 std::to_string(input.boundary.exterior().size()) + " exterior vertices, " +
                 std::to_string(input.boundary.num_holes()) + " holes)");
    if (input.crs.empty()) {
        logger_.warning("Boundary layer " + path + " has no coordinate system");
    }
    return input;
}

std::unique_ptr<FeatureSource> VectorLoader::open_source(const std::string& path,
                                                         const std::string& class_label,
                                                         std::optional<GeometryKind> kind,
                                                         const std::string& layer_name,
                                                         const std::string& target_crs) const {
    GDALDatasetPtr dataset = open_vector(path);
    OGRLayer* layer = find_layer(*dataset, path, layer_name);

    if (!kind) {
        switch (wkbFlatten(layer->GetGeomType())) {
            case wkbPolygon:
            case wkbMultiPolygon:
                kind = GeometryKind::POLYGON;
                break;
            case wkbLineString:
            case wkbMultiLineString:
                kind = GeometryKind::LINE;
                break;
            default:
                fail(path, std::string("cannot infer geometry kind from layer type ") +
                           OGRGeometryTypeToName(layer->GetGeomType()));
        }
    }

    std::string crs = layer_crs(*layer);
    CoordinateTransformationPtr transform;

    if (!target_crs.empty() && !crs.empty()) {
        OGRSpatialReference source_srs;
        OGRSpatialReference target_srs;
        source_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        target_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        if (source_srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE ||
            target_srs.SetFromUserInput(target_crs.c_str()) != OGRERR_NONE) {
            fail(path, "unreadable coordinate system");
        }
        if (!source_srs.IsSame(&target_srs)) {
            transform.reset(OGRCreateCoordinateTransformation(&source_srs, &target_srs));
            if (!transform) {
                throw HexMosaicError(ErrorKind::COORDINATE_SYSTEM_MISMATCH, Phase::VALIDATION,
                                     "no transformation from the layer CRS to the boundary CRS", path);
            }
            logger_.detailed("Reprojecting " + path + " into the boundary CRS");
        }
        crs = target_crs;
    }

    std::string name = std::filesystem::path(path).stem().string();
    if (!layer_name.empty()) {
        name += ":" + layer_name;
    }

    logger_.detailed("Opened " + std::string(to_string(*kind)) + " source '" + name + "' for class " +
                     class_label + " (" + std::to_string(layer->GetFeatureCount()) + " features)");

    return std::make_unique<OgrFeatureSource>(name, class_label, *kind, std::move(dataset), layer,
                                              crs, std::move(transform));
}

} // namespace hexmosaic

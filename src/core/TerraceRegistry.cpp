/**
 * @file TerraceRegistry.cpp
 * @brief OGR-based terrace registry loader
 */

#include "TerraceRegistry.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include <ogr_spatialref.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <unordered_set>

namespace shade {

namespace {

bool has_csv_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".csv";
}

bool is_valid_location(double lat, double lon) {
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

} // namespace

TerraceRegistry::TerraceRegistry()
    : options_() {}

TerraceRegistry::TerraceRegistry(const Options& options)
    : options_(options) {}

std::vector<Terrace> TerraceRegistry::load(const std::string& path) {
    Logger logger("TerraceRegistry");
    ensure_gdal_registered();
    report_ = LoadReport();

    if (!std::filesystem::exists(path)) {
        throw InputNotFoundError("terrace registry does not exist: " + path);
    }

    // Plain CSV registries carry coordinates in lat/lon columns
    const char* const csv_options[] = {
        "X_POSSIBLE_NAMES=lon,longitude,lng",
        "Y_POSSIBLE_NAMES=lat,latitude",
        "KEEP_GEOM_COLUMNS=NO",
        nullptr};

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr,
                   has_csv_extension(path) ? csv_options : nullptr, nullptr)));
    if (!dataset) {
        throw InputNotFoundError("cannot open terrace registry " + path + ": " + CPLGetLastErrorMsg());
    }
    if (dataset->GetLayerCount() < 1) {
        throw InputNotFoundError("terrace registry has no layer: " + path);
    }

    OGRLayer* layer = dataset->GetLayer(0);

    std::unique_ptr<OGRCoordinateTransformation> to_wgs84;
    if (const OGRSpatialReference* layer_srs = layer->GetSpatialRef()) {
        OGRSpatialReference source(*layer_srs);
        source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        OGRSpatialReference wgs84;
        wgs84.SetWellKnownGeogCS("WGS84");
        wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        if (!source.IsSame(&wgs84)) {
            to_wgs84.reset(OGRCreateCoordinateTransformation(&source, &wgs84));
            if (!to_wgs84) {
                throw InputNotFoundError("cannot transform terrace registry to WGS84: " + path);
            }
            logger.detailed("Transforming registry coordinates to WGS84");
        }
    }

    const int id_index = layer->GetLayerDefn()->GetFieldIndex(options_.id_field.c_str());
    if (id_index < 0) {
        logger.warning("Registry has no '" + options_.id_field + "' field, using feature ids");
    }

    std::vector<Terrace> terraces;
    std::unordered_set<std::string> seen_ids;

    layer->ResetReading();
    OGRFeaturePtr feature;
    while ((feature = OGRFeaturePtr(layer->GetNextFeature())) != nullptr) {
        report_.features_read++;

        std::string id;
        if (id_index >= 0 && feature->IsFieldSetAndNotNull(id_index)) {
            id = feature->GetFieldAsString(id_index);
        } else if (feature->GetFID() != OGRNullFID) {
            id = std::to_string(feature->GetFID());
        }

        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (id.empty() || !geometry || geometry->IsEmpty()) {
            report_.invalid_geometries++;
            logger.warning("Skipping registry feature " + std::to_string(report_.features_read) +
                           ": missing id or geometry");
            continue;
        }

        OGRPoint point;
        if (wkbFlatten(geometry->getGeometryType()) == wkbPoint) {
            const auto* source_point = static_cast<const OGRPoint*>(geometry);
            point.setX(source_point->getX());
            point.setY(source_point->getY());
        } else if (geometry->Centroid(&point) != OGRERR_NONE || point.IsEmpty()) {
            report_.invalid_geometries++;
            logger.warning("Skipping terrace " + id + ": cannot reduce geometry to a point");
            continue;
        }

        double x = point.getX();
        double y = point.getY();
        if (to_wgs84 && !to_wgs84->Transform(1, &x, &y)) {
            report_.invalid_geometries++;
            logger.warning("Skipping terrace " + id + ": coordinate transformation failed");
            continue;
        }
        if (!is_valid_location(y, x)) {
            report_.invalid_geometries++;
            logger.warning("Skipping terrace " + id + ": location out of range");
            continue;
        }

        if (!seen_ids.insert(id).second) {
            report_.duplicate_ids++;
            logger.warning("Duplicate terrace id " + id + ", keeping the first occurrence");
            continue;
        }

        Terrace terrace;
        terrace.id = id;
        terrace.location = GeoPoint(y, x);
        terraces.push_back(std::move(terrace));
    }

    logger.info("Loaded " + std::to_string(terraces.size()) + " terraces from " + path);
    if (report_.duplicate_ids > 0 || report_.invalid_geometries > 0) {
        logger.detailed("Registry issues: " + std::to_string(report_.duplicate_ids) + " duplicate ids, " +
                        std::to_string(report_.invalid_geometries) + " invalid geometries");
    }
    return terraces;
}

BoundingBox TerraceRegistry::bounds(const std::vector<Terrace>& terraces) {
    if (terraces.empty()) {
        return BoundingBox();
    }
    BoundingBox box(std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                    std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest());
    for (const auto& terrace : terraces) {
        box.min_x = std::min(box.min_x, terrace.location.lon);
        box.max_x = std::max(box.max_x, terrace.location.lon);
        box.min_y = std::min(box.min_y, terrace.location.lat);
        box.max_y = std::max(box.max_y, terrace.location.lat);
    }
    return box;
}

} // namespace shade

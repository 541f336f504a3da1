/**
 * @file DsmRaster.cpp
 * @brief GDAL-backed DSM loading and coordinate helpers
 */

#include "DsmRaster.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include <ogr_spatialref.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <sstream>

namespace shade {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMetersPerDegreeLat = 110574.0;
constexpr double kMetersPerDegreeLonEquator = 111320.0;

} // namespace

DsmRaster::DsmRaster()
    : width_(0), height_(0), geotransform_{0.0, 1.0, 0.0, 0.0, 0.0, -1.0},
      inv_geotransform_{0.0, 1.0, 0.0, 0.0, 0.0, -1.0},
      max_height_(std::numeric_limits<double>::lowest()),
      meters_per_unit_x_(1.0), meters_per_unit_y_(1.0), grid_north_offset_deg_(0.0), geographic_(false) {}

DsmRaster::~DsmRaster() = default;

std::unique_ptr<DsmRaster> DsmRaster::open(const std::string& path,
                                           const std::optional<BoundingBox>& area_of_interest,
                                           double margin_m) {
    Logger logger("DsmRaster");
    ensure_gdal_registered();

    if (!std::filesystem::exists(path)) {
        throw InputNotFoundError("DSM file does not exist: " + path);
    }

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw InputNotFoundError("cannot open DSM " + path + ": " + CPLGetLastErrorMsg());
    }

    std::unique_ptr<DsmRaster> raster(new DsmRaster());
    raster->width_ = dataset->GetRasterXSize();
    raster->height_ = dataset->GetRasterYSize();
    if (dataset->GetGeoTransform(raster->geotransform_.data()) != CE_None) {
        throw InputNotFoundError("DSM has no geotransform: " + path);
    }
    if (!GDALInvGeoTransform(raster->geotransform_.data(), raster->inv_geotransform_.data())) {
        throw InputNotFoundError("DSM geotransform is not invertible: " + path);
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw InputNotFoundError("DSM has no raster band: " + path);
    }

    const char* projection = dataset->GetProjectionRef();
    raster->setup_reference(projection ? projection : "");

    // Window covering the area of interest plus the ray margin
    int x_off = 0;
    int y_off = 0;
    int x_size = raster->width_;
    int y_size = raster->height_;

    if (area_of_interest.has_value()) {
        const BoundingBox& aoi = *area_of_interest;
        const double mid_lat = (aoi.min_y + aoi.max_y) / 2.0;
        const double dlat = margin_m / kMetersPerDegreeLat;
        const double dlon = margin_m / (kMetersPerDegreeLonEquator * std::max(0.01, std::cos(mid_lat * kPi / 180.0)));

        const GeoPoint corners[4] = {
            GeoPoint(aoi.min_y - dlat, aoi.min_x - dlon), GeoPoint(aoi.min_y - dlat, aoi.max_x + dlon),
            GeoPoint(aoi.max_y + dlat, aoi.min_x - dlon), GeoPoint(aoi.max_y + dlat, aoi.max_x + dlon)};

        double min_px = std::numeric_limits<double>::max(), max_px = std::numeric_limits<double>::lowest();
        double min_py = std::numeric_limits<double>::max(), max_py = std::numeric_limits<double>::lowest();
        bool all_mapped = true;
        for (const auto& corner : corners) {
            auto px = raster->to_raster(corner);
            if (!px) {
                all_mapped = false;
                break;
            }
            min_px = std::min(min_px, px->x);
            max_px = std::max(max_px, px->x);
            min_py = std::min(min_py, px->y);
            max_py = std::max(max_py, px->y);
        }

        if (all_mapped) {
            const int win_x0 = std::max(0, static_cast<int>(std::floor(min_px)));
            const int win_y0 = std::max(0, static_cast<int>(std::floor(min_py)));
            const int win_x1 = std::min(raster->width_, static_cast<int>(std::ceil(max_px)) + 1);
            const int win_y1 = std::min(raster->height_, static_cast<int>(std::ceil(max_py)) + 1);

            if (win_x1 > win_x0 && win_y1 > win_y0) {
                x_off = win_x0;
                y_off = win_y0;
                x_size = win_x1 - win_x0;
                y_size = win_y1 - win_y0;
            } else {
                logger.warning("Terrace area does not overlap the DSM, reading the full raster");
            }
        } else {
            logger.warning("Cannot map the terrace area into the DSM, reading the full raster");
        }
    }

    raster->heights_.resize(static_cast<size_t>(x_size) * static_cast<size_t>(y_size));
    CPLErr err = band->RasterIO(GF_Read, x_off, y_off, x_size, y_size,
                                raster->heights_.data(), x_size, y_size, GDT_Float32, 0, 0);
    if (err != CE_None) {
        throw InputNotFoundError("failed to read DSM heights from " + path + ": " + CPLGetLastErrorMsg());
    }

    int has_nodata = 0;
    const double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        raster->nodata_ = nodata;
    }

    auto& gt = raster->geotransform_;
    gt[0] += x_off * gt[1] + y_off * gt[2];
    gt[3] += x_off * gt[4] + y_off * gt[5];
    raster->width_ = x_size;
    raster->height_ = y_size;

    if (!GDALInvGeoTransform(gt.data(), raster->inv_geotransform_.data())) {
        throw InputNotFoundError("DSM geotransform is not invertible: " + path);
    }
    raster->compute_frame();
    raster->compute_max_height();

    std::ostringstream msg;
    msg << "Loaded DSM window " << x_size << "x" << y_size << " at offset (" << x_off << ", " << y_off
        << "), cell size " << raster->cell_size_m() << " m, max height " << raster->max_height_ << " m";
    logger.info(msg.str());
    if (!raster->is_georeferenced()) {
        logger.warning("DSM has no usable spatial reference, coordinates are read as grid units");
    }

    return raster;
}

std::unique_ptr<DsmRaster> DsmRaster::from_grid(int width, int height,
                                                const std::array<double, 6>& geotransform,
                                                std::vector<float> heights,
                                                std::optional<double> nodata,
                                                const std::string& wkt) {
    if (width <= 0 || height <= 0 ||
        heights.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
        throw InputNotFoundError("grid size does not match the height buffer");
    }

    std::unique_ptr<DsmRaster> raster(new DsmRaster());
    raster->width_ = width;
    raster->height_ = height;
    raster->geotransform_ = geotransform;
    raster->heights_ = std::move(heights);
    raster->nodata_ = nodata;

    if (!GDALInvGeoTransform(raster->geotransform_.data(), raster->inv_geotransform_.data())) {
        throw InputNotFoundError("grid geotransform is not invertible");
    }
    if (!wkt.empty()) {
        ensure_gdal_registered();
        raster->setup_reference(wkt);
    }
    raster->compute_frame();
    raster->compute_max_height();
    return raster;
}

void DsmRaster::setup_reference(const std::string& wkt) {
    if (wkt.empty()) {
        return;
    }

    Logger logger("DsmRaster");
    OGRSpatialReference raster_srs;
    if (raster_srs.importFromWkt(wkt.c_str()) != OGRERR_NONE) {
        logger.warning("Cannot parse DSM spatial reference");
        return;
    }
    raster_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    to_raster_.reset(OGRCreateCoordinateTransformation(&wgs84, &raster_srs));
    to_geo_.reset(OGRCreateCoordinateTransformation(&raster_srs, &wgs84));
    if (!to_raster_ || !to_geo_) {
        logger.warning("Cannot build a WGS84 transformation for the DSM");
        to_raster_.reset();
        to_geo_.reset();
        return;
    }

    geographic_ = raster_srs.IsGeographic();
    if (geographic_) {
        // x scale depends on latitude, resolved in compute_frame()
        meters_per_unit_y_ = kMetersPerDegreeLat;
    } else {
        meters_per_unit_x_ = raster_srs.GetLinearUnits();
        meters_per_unit_y_ = meters_per_unit_x_;
    }
}

void DsmRaster::compute_frame() {
    if (!GDALInvGeoTransform(geotransform_.data(), inv_geotransform_.data())) {
        return;
    }
    if (!is_georeferenced()) {
        return;
    }

    auto center = to_geo(RasterPoint(width_ / 2.0, height_ / 2.0));
    if (!center) {
        return;
    }

    if (geographic_) {
        // Degrees; true north is grid north
        meters_per_unit_x_ = kMetersPerDegreeLonEquator * std::cos(center->lat * kPi / 180.0);
        grid_north_offset_deg_ = 0.0;
        return;
    }

    // Projected raster: measure grid convergence at the center
    double cx = center->lon, cy = center->lat;
    double nx = center->lon, ny = center->lat + 0.001;
    if (!to_raster_->Transform(1, &cx, &cy) || !to_raster_->Transform(1, &nx, &ny)) {
        return;
    }
    grid_north_offset_deg_ = std::atan2(nx - cx, ny - cy) * 180.0 / kPi;
}

void DsmRaster::compute_max_height() {
    max_height_ = std::numeric_limits<double>::lowest();
    for (int row = 0; row < height_; ++row) {
        for (int col = 0; col < width_; ++col) {
            auto value = cell_value(col, row);
            if (value && *value > max_height_) {
                max_height_ = *value;
            }
        }
    }
}

double DsmRaster::cell_size_m() const {
    const double area_units = std::abs(geotransform_[1] * geotransform_[5] - geotransform_[2] * geotransform_[4]);
    return std::sqrt(area_units * meters_per_unit_x_ * meters_per_unit_y_);
}

bool DsmRaster::contains(const RasterPoint& point) const {
    return point.x >= 0.0 && point.y >= 0.0 &&
           point.x < static_cast<double>(width_) && point.y < static_cast<double>(height_);
}

std::optional<double> DsmRaster::cell_value(int col, int row) const {
    if (col < 0 || row < 0 || col >= width_ || row >= height_) {
        return std::nullopt;
    }
    const float value = heights_[static_cast<size_t>(row) * static_cast<size_t>(width_) + static_cast<size_t>(col)];
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    if (nodata_.has_value() && value == static_cast<float>(*nodata_)) {
        return std::nullopt;
    }
    return static_cast<double>(value);
}

std::optional<RasterPoint> DsmRaster::to_raster(const GeoPoint& location) const {
    double x = location.lon;
    double y = location.lat;
    if (to_raster_ && !to_raster_->Transform(1, &x, &y)) {
        return std::nullopt;
    }
    const auto& inv = inv_geotransform_;
    return RasterPoint(inv[0] + x * inv[1] + y * inv[2], inv[3] + x * inv[4] + y * inv[5]);
}

std::optional<GeoPoint> DsmRaster::to_geo(const RasterPoint& point) const {
    const auto& gt = geotransform_;
    double x = gt[0] + point.x * gt[1] + point.y * gt[2];
    double y = gt[3] + point.x * gt[4] + point.y * gt[5];
    if (to_geo_ && !to_geo_->Transform(1, &x, &y)) {
        return std::nullopt;
    }
    return GeoPoint(y, x);
}

RasterPoint DsmRaster::step_vector(double azimuth_deg, double step_m) const {
    const double bearing = (azimuth_deg + grid_north_offset_deg_) * kPi / 180.0;
    const double d_east = step_m * std::sin(bearing) / meters_per_unit_x_;
    const double d_north = step_m * std::cos(bearing) / meters_per_unit_y_;
    const auto& inv = inv_geotransform_;
    return RasterPoint(inv[1] * d_east + inv[2] * d_north, inv[4] * d_east + inv[5] * d_north);
}

double DsmRaster::ground_distance_m(const RasterPoint& a, const RasterPoint& b) const {
    const double dpx = b.x - a.x;
    const double dpy = b.y - a.y;
    const auto& gt = geotransform_;
    const double dx = (dpx * gt[1] + dpy * gt[2]) * meters_per_unit_x_;
    const double dy = (dpx * gt[4] + dpy * gt[5]) * meters_per_unit_y_;
    return std::hypot(dx, dy);
}

} // namespace shade

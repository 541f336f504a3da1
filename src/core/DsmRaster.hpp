#pragma once

/**
 * @file DsmRaster.hpp
 * @brief Read-only digital surface model loaded through GDAL
 */

#include "terrace_shade.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class OGRCoordinateTransformation;

namespace shade {

/**
 * @brief Height grid with georeferencing and metric stepping helpers
 *
 * The grid is loaded once (optionally as a window around an area of
 * interest) and then shared read-only by all workers. Positions are
 * expressed as fractional pixel coordinates (RasterPoint).
 */
class DsmRaster {
public:
    ~DsmRaster();

    DsmRaster(const DsmRaster&) = delete;
    DsmRaster& operator=(const DsmRaster&) = delete;

    /**
     * @brief Open a raster file and read the window covering an area of interest
     * @param path Any GDAL-readable raster (GeoTIFF, VRT...)
     * @param area_of_interest WGS84 bounds (x = lon, y = lat); whole raster if empty
     * @param margin_m Extra margin around the area of interest in meters
     * @throws InputNotFoundError if the file cannot be opened or read
     */
    static std::unique_ptr<DsmRaster> open(const std::string& path,
                                           const std::optional<BoundingBox>& area_of_interest = std::nullopt,
                                           double margin_m = 0.0);

    /**
     * @brief Build a raster from an in-memory grid
     * @param geotransform GDAL geotransform (origin, pixel size, rotation)
     * @param heights Row-major heights, width * height values
     * @param nodata Optional nodata marker
     * @param wkt Spatial reference; empty means a local metric grid without WGS84 mapping
     */
    static std::unique_ptr<DsmRaster> from_grid(int width, int height,
                                                const std::array<double, 6>& geotransform,
                                                std::vector<float> heights,
                                                std::optional<double> nodata = std::nullopt,
                                                const std::string& wkt = "");

    int width() const { return width_; }
    int height() const { return height_; }
    const std::array<double, 6>& geotransform() const { return geotransform_; }
    double max_height() const { return max_height_; }
    bool is_georeferenced() const { return to_raster_ != nullptr; }

    /// Mean ground size of a cell in meters
    double cell_size_m() const;

    bool contains(const RasterPoint& point) const;

    /// Height of a cell; nullopt outside the grid or on nodata
    std::optional<double> cell_value(int col, int row) const;

    /// Height of the cell containing a point
    std::optional<double> sample(const RasterPoint& point) const {
        return cell_value(point.col(), point.row());
    }

    /**
     * @brief Map a WGS84 location to raster coordinates
     *
     * Without a spatial reference, lon/lat are read as grid x/y directly.
     */
    std::optional<RasterPoint> to_raster(const GeoPoint& location) const;

    /// Inverse of to_raster
    std::optional<GeoPoint> to_geo(const RasterPoint& point) const;

    /**
     * @brief Pixel displacement for a ground step of step_m meters along a true azimuth
     */
    RasterPoint step_vector(double azimuth_deg, double step_m) const;

    /// Ground distance in meters between two raster positions
    double ground_distance_m(const RasterPoint& a, const RasterPoint& b) const;

private:
    DsmRaster();

    void setup_reference(const std::string& wkt);
    void compute_frame();
    void compute_max_height();

    int width_;
    int height_;
    std::array<double, 6> geotransform_;
    std::array<double, 6> inv_geotransform_;
    std::vector<float> heights_;
    std::optional<double> nodata_;
    double max_height_;

    // Ground meters per CRS unit along x and y
    double meters_per_unit_x_;
    double meters_per_unit_y_;
    // Grid bearing of true north at the raster center, degrees clockwise from grid north
    double grid_north_offset_deg_;
    bool geographic_;

    std::unique_ptr<OGRCoordinateTransformation> to_raster_;
    std::unique_ptr<OGRCoordinateTransformation> to_geo_;
};

} // namespace shade

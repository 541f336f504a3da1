#pragma once

/**
 * @file terrace_shade.hpp
 * @brief Main header for the TerraceShade sunlight engine
 *
 * Batch classification of outdoor terraces as sunlit or shaded for every
 * time slot of a target day, using solar geometry, raytracing against a
 * digital surface model and a cloud-cover filter.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shade {

class OutputTracker;

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief WGS84 location in decimal degrees
 */
struct GeoPoint {
    double lat, lon;

    GeoPoint() : lat(0.0), lon(0.0) {}
    GeoPoint(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    bool operator==(const GeoPoint& other) const {
        return lat == other.lat && lon == other.lon;
    }
};

/**
 * @brief Fractional pixel/line position inside a raster
 *
 * Cell (col, row) covers [col, col+1) x [row, row+1); its center is at
 * (col + 0.5, row + 0.5).
 */
struct RasterPoint {
    double x, y;

    RasterPoint() : x(0.0), y(0.0) {}
    RasterPoint(double px, double py) : x(px), y(py) {}

    int col() const { return static_cast<int>(std::floor(x)); }
    int row() const { return static_cast<int>(std::floor(y)); }
};

/**
 * @brief Bounding box for spatial queries
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool contains(double x, double y) const {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

// ============================================================================
// Time and Sun
// ============================================================================

/**
 * @brief Wall-clock time slot on the target date
 */
struct TimeSlot {
    int hour = 0;
    int minute = 0;

    TimeSlot() = default;
    TimeSlot(int h, int m) : hour(h), minute(m) {}

    int minutes_of_day() const { return hour * 60 + minute; }

    /// Property key used in the interchange format, e.g. "t0930"
    std::string key() const {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "t%02d%02d", hour, minute);
        return buffer;
    }

    /// Human readable form, e.g. "09:30"
    std::string label() const {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "%02d:%02d", hour, minute);
        return buffer;
    }

    bool operator==(const TimeSlot& other) const {
        return hour == other.hour && minute == other.minute;
    }
    bool operator<(const TimeSlot& other) const {
        return minutes_of_day() < other.minutes_of_day();
    }
};

/**
 * @brief Apparent position of the sun
 *
 * Azimuth in degrees clockwise from true north, altitude in degrees above
 * the horizon.
 */
struct SunPosition {
    double azimuth_deg = 0.0;
    double altitude_deg = 0.0;

    SunPosition() = default;
    SunPosition(double azimuth, double altitude) : azimuth_deg(azimuth), altitude_deg(altitude) {}

    bool is_up() const { return altitude_deg > 0.0; }
};

/**
 * @brief Sun and weather conditions shared by all terraces for one slot
 */
struct SlotConditions {
    TimeSlot slot;
    long long utc_seconds = 0;      ///< Slot instant, seconds since the Unix epoch
    SunPosition sun;
    double cloud_cover_pct = 0.0;
    bool weather_adjusted = false;  ///< False when no cloud sample was available
};

// ============================================================================
// Terraces and Classification
// ============================================================================

/**
 * @brief Outdoor terrace from the registry
 */
struct Terrace {
    std::string id;
    GeoPoint location;
    std::optional<double> resolved_height;  ///< Set once by the height resolver
    RasterPoint raster_position;            ///< Valid once resolved_height is set
};

/**
 * @brief First DSM cell found above the sun ray
 */
struct Obstruction {
    double distance_m = 0.0;
    double obstruction_height_m = 0.0;
    double ray_height_m = 0.0;
    RasterPoint position;              ///< Sample position in raster coordinates
    std::optional<GeoPoint> location;
};

/**
 * @brief Classification of one terrace for one time slot
 */
struct ClassificationRecord {
    size_t slot_index = 0;
    bool geometric_sunlit = false;   ///< Result of the raytracer alone
    bool is_sunlit = false;          ///< After the weather filter
    bool coverage_limited = false;   ///< Ray left the DSM or crossed nodata
    std::optional<Obstruction> obstruction;
};

/**
 * @brief All slot records for one resolved terrace
 */
struct TerraceResult {
    Terrace terrace;
    std::vector<ClassificationRecord> records;  ///< One per slot, in slot order
};

/**
 * @brief Why a terrace is missing from the output
 */
struct TerraceExclusion {
    std::string terrace_id;
    std::string reason;   ///< "out_of_coverage" or "processing_error"
    std::string message;
};

/**
 * @brief Counts reported at the end of a run
 */
struct RunSummary {
    size_t terraces_read = 0;
    size_t terraces_classified = 0;
    size_t out_of_coverage = 0;
    size_t processing_errors = 0;
    size_t duplicate_ids = 0;
    size_t invalid_geometries = 0;
    std::vector<std::string> weather_unadjusted_slots;
    std::vector<size_t> sunlit_per_slot;
    std::vector<TerraceExclusion> exclusions;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for a sunlight run
 */
struct ShadeConfig {
    // Inputs
    std::string dsm_path;
    std::string registry_path;
    std::string registry_id_field = "id";

    // Target day and time slots
    std::string date;                        ///< YYYY-MM-DD, empty for today
    std::string timezone = "Europe/Paris";   ///< "Europe/Paris", "UTC" or "+01:00"
    std::string slot_start = "09:00";
    std::string slot_end = "21:00";
    int slot_interval_minutes = 30;

    // Solar geometry (one reference point for the whole city)
    GeoPoint reference_location{48.8566, 2.3522};
    bool apply_refraction = true;

    // Raytracing
    double ray_step_m = 1.0;
    double max_ray_distance_m = 300.0;
    double height_buffer_radius_m = 2.0;

    // Weather
    enum class WeatherSource { OPEN_METEO, FILE, NONE };
    WeatherSource weather_source = WeatherSource::OPEN_METEO;
    std::string weather_file;
    std::string weather_url = "https://api.open-meteo.com/v1/forecast";
    int weather_timeout_seconds = 10;
    double cloud_cover_threshold_pct = 75.0;

    // Outputs
    std::string output_path = "sunlight_results.geojson";
    std::optional<std::string> records_csv_path;
    std::optional<std::string> report_path;
    bool diagnostics = false;
    bool pretty_print = false;
    int coordinate_precision = 7;

    // Processing
    bool parallel_processing = true;
    int num_threads = 0;   ///< 0 = let TBB decide

    // Logging
    int log_level = 3;
    std::optional<std::string> log_file;
};

/**
 * @brief Performance metrics for a run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds input_loading_time{0};
    std::chrono::milliseconds slot_table_time{0};
    std::chrono::milliseconds processing_time{0};
    std::chrono::milliseconds total_time{0};

    size_t rays_cast = 0;
    size_t ray_steps = 0;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * @brief Runs the full sunlight pipeline for one target day
 *
 * Loads the terrace registry and the DSM, precomputes the per-slot sun and
 * cloud tables, classifies every terrace in parallel and keeps the results
 * in registry order for the exporters.
 */
class ShadeEngine {
public:
    explicit ShadeEngine(const ShadeConfig& config);
    ~ShadeEngine();

    /**
     * @brief Run the pipeline
     * @return false if the configuration is invalid
     * @throws InputNotFoundError if the DSM or the registry cannot be read
     */
    bool compute();

    // Accessors
    const std::vector<TerraceResult>& get_results() const;
    const std::vector<SlotConditions>& get_slots() const;
    const RunSummary& get_summary() const;
    const PerformanceMetrics& get_metrics() const;
    const std::string& get_date() const;
    OutputTracker& get_output_tracker();
    const OutputTracker& get_output_tracker() const;

    const ShadeConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shade

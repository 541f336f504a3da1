/**
 * @file RecordTableExporter.hpp
 * @brief Flat CSV table with one row per (terrace, slot)
 */

#pragma once

#include "terrace_shade.hpp"
#include <string>
#include <vector>

namespace shade {

/**
 * @brief Writes classification records as CSV
 *
 * Columns: terrace_id, terrace_lat, terrace_lon, h_terrace, date,
 * time_slot, is_sunlit, geometric_sunlit, sun_altitude, sun_azimuth,
 * cloud_cover, weather_adjusted, coverage_limited, distance_to_obstacle,
 * obstruction_height, ray_height_at_obstacle, obstruction_lat,
 * obstruction_lon. Obstruction columns are empty for unobstructed rows.
 */
class RecordTableExporter {
public:
    struct Options {
        int precision;   // Decimal digits for coordinates

        Options() : precision(7) {}
    };

    RecordTableExporter();
    explicit RecordTableExporter(const Options& options);

    /**
     * @throws SerializationError if the file cannot be written
     */
    void export_csv(const std::vector<TerraceResult>& results,
                    const std::vector<SlotConditions>& slots,
                    const std::string& date,
                    const std::string& filename) const;

    std::string to_csv_string(const std::vector<TerraceResult>& results,
                              const std::vector<SlotConditions>& slots,
                              const std::string& date) const;

    static const char* header();

private:
    Options options_;

    static std::string escape_csv_field(const std::string& field);
};

} // namespace shade

/**
 * @file GeoJSONExporter.hpp
 * @brief GeoJSON interchange output for terrace sunlight results
 *
 * One Point feature per classified terrace with an "id" property and one
 * boolean per time slot key ("t0900", "t0930"...). The serving layer
 * reads this file directly.
 */

#pragma once

#include "terrace_shade.hpp"
#include <string>
#include <vector>

namespace shade {

/**
 * @brief Run-level information written as the collection's "metadata" member
 */
struct CollectionMetadata {
    std::string date;
    std::string timezone;
    double cloud_cover_threshold = 75.0;
    std::vector<std::string> weather_unadjusted_slots;
};

/**
 * @brief Serializes terrace results as a GeoJSON FeatureCollection
 *
 * Output depends only on its inputs (no timestamps), so identical runs
 * produce byte-identical files.
 */
class GeoJSONExporter {
public:
    struct Options {
        bool pretty_print;
        int precision;          // Decimal digits for coordinates
        bool diagnostics;       // Per-slot obstruction details and h_terrace
        bool include_metadata;

        Options()
            : pretty_print(false),
              precision(7),
              diagnostics(false),
              include_metadata(true) {}
    };

    GeoJSONExporter();
    explicit GeoJSONExporter(const Options& options);

    /**
     * @brief Write the collection atomically
     * @throws SerializationError if the file cannot be written
     */
    void export_geojson(const std::vector<TerraceResult>& results,
                        const std::vector<SlotConditions>& slots,
                        const CollectionMetadata& metadata,
                        const std::string& filename) const;

    /**
     * @brief Generate the GeoJSON text (without writing to file)
     */
    std::string to_geojson_string(const std::vector<TerraceResult>& results,
                                  const std::vector<SlotConditions>& slots,
                                  const CollectionMetadata& metadata) const;

private:
    Options options_;

    std::string terrace_to_geojson(const TerraceResult& result, const std::vector<SlotConditions>& slots) const;
    std::string create_properties(const TerraceResult& result, const std::vector<SlotConditions>& slots) const;
    std::string metadata_to_json(const CollectionMetadata& metadata, const std::vector<SlotConditions>& slots) const;

    // Formatting helpers
    std::string format_coordinate(double value) const;
    std::string format_meters(double value) const;
    std::string format_plain(double value) const;
    std::string escape_json_string(const std::string& str) const;
};

} // namespace shade

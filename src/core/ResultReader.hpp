/**
 * @file ResultReader.hpp
 * @brief Query interface over a produced sunlight GeoJSON file
 *
 * Answers the lookups the serving layer makes (slot list, viewport,
 * nearby search, single terrace) directly from the interchange file.
 */

#pragma once

#include "terrace_shade.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shade {

/**
 * @brief One terrace with its sunlit flag for a requested slot
 */
struct TerraceStatus {
    std::string id;
    GeoPoint location;
    bool is_sunlit = false;
    double distance_km = 0.0;   ///< Only set by nearby()
};

class ResultReader {
public:
    /**
     * @brief Load a results file
     * @throws InputNotFoundError if the file is missing or not a FeatureCollection
     */
    static ResultReader load(const std::string& path);

    /**
     * @throws InputNotFoundError if the text is not a FeatureCollection
     */
    static ResultReader parse(const std::string& json_text);

    /// Slot keys present in the file, sorted
    std::vector<std::string> time_slots() const;

    /**
     * @brief Terraces inside a box (edges included), in file order
     *
     * Terraces lacking the slot key are reported shaded.
     */
    std::vector<TerraceStatus> in_viewport(double sw_lng, double sw_lat, double ne_lng, double ne_lat,
                                           const std::string& time_key) const;

    /**
     * @brief Terraces within radius_km of a point, nearest first
     */
    std::vector<TerraceStatus> nearby(double lat, double lon, double radius_km,
                                      const std::string& time_key, bool only_sunny = false) const;

    std::optional<TerraceStatus> find(const std::string& id, const std::string& time_key) const;

    size_t size() const { return entries_.size(); }

    /// Great-circle distance on a 6371 km sphere
    static double haversine_km(const GeoPoint& a, const GeoPoint& b);

private:
    struct Entry {
        std::string id;
        GeoPoint location;
        std::map<std::string, bool> slots;
    };

    TerraceStatus status_of(const Entry& entry, const std::string& time_key) const;

    std::vector<Entry> entries_;
};

} // namespace shade

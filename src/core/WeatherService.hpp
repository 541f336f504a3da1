/**
 * @file WeatherService.hpp
 * @brief Hourly cloud cover lookup and the cloud-cover filter
 *
 * Cloud cover comes from the Open-Meteo hourly forecast API, or from a
 * JSON file in the same schema for offline runs.
 */

#pragma once

#include "terrace_shade.hpp"
#include "TimeSlots.hpp"
#include <map>
#include <optional>
#include <string>

namespace shade {

/**
 * @brief Cloud cover percentages keyed by UTC hour
 */
class CloudCoverTable {
public:
    /// Store a sample for the hour starting at hour_utc_seconds
    void set(long long hour_utc_seconds, double cloud_cover_pct);

    /// Sample of the hour nearest to an instant (half past rounds up)
    std::optional<double> lookup(long long utc_seconds) const;

    /**
     * @brief Like lookup()
     * @throws WeatherLookupError if no sample exists for that hour
     */
    double at(long long utc_seconds) const;

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    static long long nearest_hour(long long utc_seconds);

private:
    std::map<long long, double> samples_;
};

/**
 * @brief Downgrades a geometrically sunlit slot under heavy cloud
 *
 * Never turns a shaded slot sunlit.
 */
struct WeatherFilter {
    double threshold_pct;

    explicit WeatherFilter(double threshold = 75.0) : threshold_pct(threshold) {}

    bool apply(bool geometric_sunlit, double cloud_cover_pct) const {
        return geometric_sunlit && cloud_cover_pct <= threshold_pct;
    }
};

/**
 * @brief Fetches hourly cloud cover for one location and day
 */
class WeatherService {
public:
    struct Options {
        std::string api_url;
        std::string user_agent;
        int timeout_seconds;

        Options()
            : api_url("https://api.open-meteo.com/v1/forecast"),
              user_agent("TerraceShade/1.0"),
              timeout_seconds(10) {}
    };

    WeatherService();
    explicit WeatherService(const Options& options);

    /**
     * @brief Query the API for the day before, the day of and the day after a date
     * @throws WeatherLookupError on network, HTTP or payload errors
     */
    CloudCoverTable fetch(const GeoPoint& location, const CivilDate& date) const;

    /**
     * @brief Load a saved API response
     * @throws WeatherLookupError if the file is missing or malformed
     */
    static CloudCoverTable load_file(const std::string& path);

    /**
     * @brief Parse an Open-Meteo hourly payload
     *
     * Reads "utc_offset_seconds", "hourly.time" (local "YYYY-MM-DDTHH:MM")
     * and "hourly.cloud_cover"; null samples are skipped.
     *
     * @throws WeatherLookupError if required members are missing
     */
    static CloudCoverTable parse_response(const std::string& json_text);

    std::string build_url(const GeoPoint& location, const CivilDate& date) const;

private:
    std::string make_http_request(const std::string& url) const;

    Options options_;
};

} // namespace shade

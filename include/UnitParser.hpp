#pragma once

#include <string>
#include <stdexcept>
#include <utility>

namespace shade {

/**
 * @brief Exception thrown when a distance or coordinate cannot be parsed
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Ground distance units accepted on the command line and in config files
 */
enum class DistanceUnit {
    METERS,      // m
    KILOMETERS,  // km
    FEET,        // ft
    MILES        // mi
};

/**
 * @brief Result of parsing a distance
 */
struct ParsedDistance {
    double meters;
    DistanceUnit original_unit;
    bool had_explicit_unit;

    ParsedDistance(double m, DistanceUnit unit, bool explicit_unit)
        : meters(m), original_unit(unit), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses distances with optional unit suffixes and geographic coordinates
 *
 * Distances: "300", "300m", "0.3km", "6ft", "1 mi".
 * Coordinates: decimal degrees ("48.8566") or DMS ("48°51'24\"N", "2d21m7sE").
 */
class UnitParser {
public:
    UnitParser() = default;

    /**
     * @brief Parse a ground distance, returning meters
     * @param input String to parse
     * @param default_unit Unit assumed when no suffix is present
     * @throws UnitParseError on malformed input or unknown unit
     */
    ParsedDistance parse_distance(const std::string& input,
                                  DistanceUnit default_unit = DistanceUnit::METERS) const;

    /**
     * @brief Parse a latitude in decimal degrees or DMS
     * @throws UnitParseError if malformed or outside [-90, 90]
     */
    double parse_latitude(const std::string& input) const;

    /**
     * @brief Parse a longitude in decimal degrees or DMS
     * @throws UnitParseError if malformed or outside [-180, 180]
     */
    double parse_longitude(const std::string& input) const;

    /**
     * @brief Parse "lat,lon"
     */
    std::pair<double, double> parse_coordinate_pair(const std::string& input) const;

    static double to_meters_factor(DistanceUnit unit);
    static DistanceUnit parse_unit_string(const std::string& unit_str);
    static std::string unit_to_string(DistanceUnit unit);

private:
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;
    double parse_dms(const std::string& input, bool is_latitude) const;
    bool is_dms_format(const std::string& input) const;
};

} // namespace shade

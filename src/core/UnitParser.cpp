#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace shade {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return 1.0;
        case DistanceUnit::KILOMETERS: return 1000.0;
        case DistanceUnit::FEET:       return 0.3048;
        case DistanceUnit::MILES:      return 1609.344;
    }
    throw UnitParseError("Unknown distance unit");
}

DistanceUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    const std::string unit = to_lower(unit_str);

    if (unit == "m" || unit == "meter" || unit == "meters") return DistanceUnit::METERS;
    if (unit == "km" || unit == "kilometers") return DistanceUnit::KILOMETERS;
    if (unit == "ft" || unit == "feet") return DistanceUnit::FEET;
    if (unit == "mi" || unit == "miles") return DistanceUnit::MILES;

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. Supported units: m, km, ft, mi");
}

std::string UnitParser::unit_to_string(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return "m";
        case DistanceUnit::KILOMETERS: return "km";
        case DistanceUnit::FEET:       return "ft";
        case DistanceUnit::MILES:      return "mi";
    }
    return "unknown";
}

// ============================================================================
// DISTANCE PARSING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    const std::string trimmed = trim(input);
    if (trimmed.empty()) {
        throw UnitParseError("Empty input string");
    }

    size_t num_end = 0;
    bool found_digit = false;
    bool found_decimal = false;

    for (size_t i = 0; i < trimmed.size(); ++i) {
        const char c = trimmed[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
            num_end = i + 1;
        } else if ((c == '-' || c == '+') && i == 0) {
            num_end = i + 1;
        } else {
            break;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    return {trimmed.substr(0, num_end), trim(trimmed.substr(num_end))};
}

ParsedDistance UnitParser::parse_distance(const std::string& input, DistanceUnit default_unit) const {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }

    const bool explicit_unit = !unit_str.empty();
    const DistanceUnit unit = explicit_unit ? parse_unit_string(unit_str) : default_unit;

    return ParsedDistance(value * to_meters_factor(unit), unit, explicit_unit);
}

// ============================================================================
// COORDINATE PARSING
// ============================================================================

bool UnitParser::is_dms_format(const std::string& input) const {
    if (input.find("°") != std::string::npos) {
        return true;
    }
    for (char c : input) {
        switch (c) {
            case 'd': case '\'': case '"':
            case 'N': case 'S': case 'E': case 'W':
            case 'n': case 's': case 'w':
                return true;
            default:
                break;
        }
    }
    return false;
}

double UnitParser::parse_dms(const std::string& input, bool is_latitude) const {
    std::string work = trim(input);

    char hemisphere = '\0';
    if (!work.empty()) {
        const char last = static_cast<char>(std::toupper(static_cast<unsigned char>(work.back())));
        if (last == 'N' || last == 'S' || last == 'E' || last == 'W') {
            hemisphere = last;
            work.pop_back();
        }
    }

    size_t pos = 0;
    while ((pos = work.find("°", pos)) != std::string::npos) {
        work.replace(pos, std::string("°").size(), " ");
    }
    for (char& c : work) {
        if (c == 'd' || c == 'm' || c == 's' || c == '\'' || c == '"') {
            c = ' ';
        }
    }

    std::istringstream iss(work);
    double degrees = 0.0, minutes = 0.0, seconds = 0.0;
    if (!(iss >> degrees)) {
        throw UnitParseError("Invalid DMS format: '" + input + "'");
    }
    if (iss >> minutes) {
        iss >> seconds;
    }

    if (minutes < 0.0 || minutes >= 60.0) {
        throw UnitParseError("Invalid minutes value in '" + input + "'");
    }
    if (seconds < 0.0 || seconds >= 60.0) {
        throw UnitParseError("Invalid seconds value in '" + input + "'");
    }

    double decimal = std::abs(degrees) + minutes / 60.0 + seconds / 3600.0;
    bool negative = degrees < 0.0;
    if (hemisphere == 'S' || hemisphere == 'W') {
        negative = true;
    } else if (hemisphere == 'N' || hemisphere == 'E') {
        negative = false;
    }
    if (negative) {
        decimal = -decimal;
    }

    const double limit = is_latitude ? 90.0 : 180.0;
    if (decimal < -limit || decimal > limit) {
        throw UnitParseError(std::string(is_latitude ? "Latitude" : "Longitude") +
                             " out of range: '" + input + "'");
    }
    return decimal;
}

double UnitParser::parse_latitude(const std::string& input) const {
    if (is_dms_format(input)) {
        return parse_dms(input, true);
    }

    double lat;
    try {
        lat = std::stod(trim(input));
    } catch (const std::exception&) {
        throw UnitParseError("Invalid latitude format: '" + input + "'");
    }
    if (lat < -90.0 || lat > 90.0) {
        throw UnitParseError("Latitude out of range [-90, 90]: '" + input + "'");
    }
    return lat;
}

double UnitParser::parse_longitude(const std::string& input) const {
    if (is_dms_format(input)) {
        return parse_dms(input, false);
    }

    double lon;
    try {
        lon = std::stod(trim(input));
    } catch (const std::exception&) {
        throw UnitParseError("Invalid longitude format: '" + input + "'");
    }
    if (lon < -180.0 || lon > 180.0) {
        throw UnitParseError("Longitude out of range [-180, 180]: '" + input + "'");
    }
    return lon;
}

std::pair<double, double> UnitParser::parse_coordinate_pair(const std::string& input) const {
    const size_t comma_pos = input.find(',');
    if (comma_pos == std::string::npos) {
        throw UnitParseError("Coordinate pair must be 'lat,lon': '" + input + "'");
    }
    return {parse_latitude(input.substr(0, comma_pos)), parse_longitude(input.substr(comma_pos + 1))};
}

} // namespace shade

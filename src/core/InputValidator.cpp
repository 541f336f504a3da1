/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "ShadeErrors.hpp"
#include "TimeSlots.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace shade {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid configuration:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nRun aborted before loading any input.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const ShadeConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    const std::optional<ParameterConflict> checks[] = {
        check_input_paths(config),
        check_ray_parameters(config),
        check_height_buffer(config),
        check_schedule(config),
        check_weather(config),
        check_reference_location(config),
        check_output(config)};

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_input_paths(const ShadeConfig& config) const {
    if (!config.dsm_path.empty() && !config.registry_path.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Both a DSM raster and a terrace registry are required";
    conflict.involved_params = {
        "--dsm = '" + config.dsm_path + "'",
        "--terraces = '" + config.registry_path + "'"};
    conflict.suggestions = {
        "Pass the DSM GeoTIFF with --dsm",
        "Pass the terrace registry (GeoJSON, GeoPackage, Shapefile or CSV) with --terraces"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_ray_parameters(const ShadeConfig& config) const {
    const bool bad_step = !(config.ray_step_m > 0.0) || !std::isfinite(config.ray_step_m);
    const bool bad_distance = !(config.max_ray_distance_m >= config.ray_step_m) ||
                              !std::isfinite(config.max_ray_distance_m);
    if (!bad_step && !bad_distance) {
        return std::nullopt;
    }

    std::ostringstream step, distance;
    step << std::fixed << std::setprecision(2) << "ray_step = " << config.ray_step_m << " m";
    distance << std::fixed << std::setprecision(2) << "max_ray_distance = " << config.max_ray_distance_m << " m";

    ParameterConflict conflict;
    conflict.description = bad_step ? "Ray step must be a positive distance"
                                    : "Maximum ray distance is shorter than one ray step";
    conflict.involved_params = {step.str(), distance.str()};
    conflict.suggestions = {
        "Use a ray step close to the DSM cell size (e.g. --ray-step 1m)",
        "Use a maximum distance of a few hundred meters (e.g. --max-distance 300m)"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_height_buffer(const ShadeConfig& config) const {
    if (config.height_buffer_radius_m >= 0.0 && std::isfinite(config.height_buffer_radius_m)) {
        return std::nullopt;
    }

    std::ostringstream radius;
    radius << std::fixed << std::setprecision(2) << "height_buffer_radius = " << config.height_buffer_radius_m << " m";

    ParameterConflict conflict;
    conflict.description = "Height buffer radius must be zero or positive";
    conflict.involved_params = {radius.str()};
    conflict.suggestions = {
        "Use the default radius of 2 m (--height-buffer 2m)",
        "Use --height-buffer 0 to read only the cell under the terrace"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_schedule(const ShadeConfig& config) const {
    ParameterConflict conflict;
    conflict.involved_params = {
        "date = '" + config.date + "'",
        "timezone = '" + config.timezone + "'",
        "slots = " + config.slot_start + " to " + config.slot_end + " every " +
            std::to_string(config.slot_interval_minutes) + " min"};

    if (!config.date.empty() && !CivilDate::parse(config.date)) {
        conflict.description = "Target date is not a valid YYYY-MM-DD date";
        conflict.suggestions = {"Use an ISO date such as 2024-06-21, or omit --date for today"};
        return conflict;
    }

    try {
        UtcOffsetRule::parse(config.timezone);
        build_time_slots(config.slot_start, config.slot_end, config.slot_interval_minutes);
    } catch (const ConfigurationError& e) {
        conflict.description = e.what();
        conflict.suggestions = {
            "Use Europe/Paris, UTC or a fixed offset such as +01:00 for --timezone",
            "Give slots as HH:MM with --slot-start before --slot-end and a positive --slot-interval"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_weather(const ShadeConfig& config) const {
    ParameterConflict conflict;
    std::ostringstream threshold;
    threshold << "cloud_cover_threshold = " << config.cloud_cover_threshold_pct << "%";

    if (!(config.cloud_cover_threshold_pct >= 0.0 && config.cloud_cover_threshold_pct <= 100.0)) {
        conflict.description = "Cloud cover threshold must be a percentage between 0 and 100";
        conflict.involved_params = {threshold.str()};
        conflict.suggestions = {"Use the default threshold of 75 (--cloud-threshold 75)"};
        return conflict;
    }

    if (config.weather_source == ShadeConfig::WeatherSource::FILE && config.weather_file.empty()) {
        conflict.description = "Weather source 'file' needs a weather file";
        conflict.involved_params = {"--weather-source = file", "--weather-file = ''"};
        conflict.suggestions = {
            "Pass a saved Open-Meteo response with --weather-file",
            "Use --weather-source open-meteo or --weather-source none"};
        return conflict;
    }

    if (config.weather_source == ShadeConfig::WeatherSource::OPEN_METEO && config.weather_timeout_seconds <= 0) {
        conflict.description = "Weather request timeout must be positive";
        conflict.involved_params = {"weather_timeout = " + std::to_string(config.weather_timeout_seconds) + " s"};
        conflict.suggestions = {"Use a short timeout such as 10 seconds"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_reference_location(const ShadeConfig& config) const {
    const GeoPoint& ref = config.reference_location;
    if (ref.lat >= -90.0 && ref.lat <= 90.0 && ref.lon >= -180.0 && ref.lon <= 180.0) {
        return std::nullopt;
    }

    std::ostringstream location;
    location << std::fixed << std::setprecision(6) << "reference = " << ref.lat << ", " << ref.lon;

    ParameterConflict conflict;
    conflict.description = "Reference location is not a valid latitude/longitude";
    conflict.involved_params = {location.str()};
    conflict.suggestions = {"Use decimal degrees such as --reference 48.8566,2.3522"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output(const ShadeConfig& config) const {
    if (!config.output_path.empty() && config.coordinate_precision >= 1 && config.coordinate_precision <= 15) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = config.output_path.empty() ? "Output path is empty"
                                                      : "Coordinate precision must be between 1 and 15 digits";
    conflict.involved_params = {
        "--output = '" + config.output_path + "'",
        "precision = " + std::to_string(config.coordinate_precision)};
    conflict.suggestions = {"Write to sunlight_results.geojson with 7 decimal digits (about 1 cm)"};
    return conflict;
}

} // namespace shade

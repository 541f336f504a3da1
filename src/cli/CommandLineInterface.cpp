/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ShadeErrors.hpp"
#include "../core/Logger.hpp"
#include "../core/ResultReader.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace shade {

namespace {

// "2.33,48.85,2.37,48.87" -> {2.33, 48.85, 2.37, 48.87}
std::vector<double> parse_number_list(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        size_t used = 0;
        double value = std::stod(part, &used);
        while (used < part.size() && std::isspace(static_cast<unsigned char>(part[used]))) {
            ++used;
        }
        if (used != part.size()) {
            throw std::invalid_argument("not a number: '" + part + "'");
        }
        values.push_back(value);
    }
    return values;
}

json status_to_json(const TerraceStatus& status, bool with_distance) {
    json entry = {
        {"id", status.id},
        {"lat", status.location.lat},
        {"lon", status.location.lon},
        {"is_sunlit", status.is_sunlit}
    };
    if (with_distance) {
        entry["distance_km"] = status.distance_km;
    }
    return entry;
}

} // anonymous namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("terrace-shade",
        "Classify every outdoor terrace of a city as sunlit or shaded for each\n"
        "time slot of a day. The sun position comes from the NOAA solar equations,\n"
        "shadows from ray marching over a digital surface model, and cloud cover\n"
        "from the Open-Meteo hourly forecast.");

    // Inputs
    parser.add_option("config", "c", "Load configuration from JSON file");
    parser.add_option("create-config", "", "Create default configuration file");
    parser.add_option("dsm", "d", "Digital surface model raster");
    parser.add_option("terraces", "t", "Terrace registry");
    parser.add_option("id-field", "", "Registry attribute holding the terrace id");

    // Time
    parser.add_option("date", "", "Target day, YYYY-MM-DD");
    parser.add_option("timezone", "", "Civil time zone of the slots");
    parser.add_option("slot-start", "", "First slot, HH:MM");
    parser.add_option("slot-end", "", "Last slot, HH:MM");
    parser.add_option("slot-interval", "", "Minutes between slots");

    // Sun and shadow
    parser.add_option("reference", "", "Reference location for the sun, lat,lon");
    parser.add_flag("no-refraction", "", "Disable atmospheric refraction correction");
    parser.add_flag("refraction", "", "Enable atmospheric refraction correction");
    parser.add_option("ray-step", "", "Ray marching step");
    parser.add_option("max-distance", "", "Maximum ray distance");
    parser.add_option("height-buffer", "", "Ground height search radius");

    // Weather
    parser.add_option("weather-source", "", "open-meteo, file or none");
    parser.add_option("weather-file", "", "Saved hourly forecast response");
    parser.add_option("weather-url", "", "Forecast API endpoint");
    parser.add_option("weather-timeout", "", "Request timeout in seconds");
    parser.add_option("cloud-threshold", "", "Cloud cover threshold in percent");

    // Outputs
    parser.add_option("output", "o", "GeoJSON output file");
    parser.add_option("records-csv", "", "CSV record table output file");
    parser.add_option("report", "", "JSON run report output file");
    parser.add_flag("diagnostics", "", "Add obstruction details to the output");
    parser.add_flag("pretty", "", "Indent the GeoJSON output");
    parser.add_option("precision", "", "Coordinate decimal digits");

    // Query mode
    parser.add_option("results", "", "Existing results file to query");
    parser.add_option("query-time", "", "Slot key, e.g. t1330");
    parser.add_option("query-viewport", "", "swLng,swLat,neLng,neLat");
    parser.add_option("query-nearby", "", "lat,lon[,radius_km]");
    parser.add_option("query-id", "", "Terrace id");
    parser.add_flag("only-sunny", "", "Keep only sunlit terraces");

    // Processing and logging
    parser.add_option("threads", "", "Worker threads, 0 = automatic");
    parser.add_flag("no-parallel", "", "Disable parallel processing");
    parser.add_flag("silent", "s", "Suppress all output");
    parser.add_flag("verbose", "v", "Enable verbose logging");
    parser.add_option("log-level", "", "Logging level 1-6 or facility list");
    parser.add_option("log-file", "", "Log file (append)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        error_ = !parser.help_requested();
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "TerraceShade v" << SHADE_VERSION_STRING << std::endl;
        std::cout << "Terrace sunlight classification from solar geometry and surface models" << std::endl;
        std::cout << "Built with GDAL, TBB, libcurl, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Error: Could not write configuration file: " << config_path.value() << std::endl;
            error_ = true;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            error_ = true;
            return false;
        }
    }

    try {
        parse_logging_options(parser);

        if (parser.get("results")) {
            if (!parse_query_options(parser)) {
                error_ = true;
                return false;
            }
            return true;
        }

        if (!parse_all_options(parser)) {
            error_ = true;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        error_ = true;
        return false;
    }

    dry_run_ = parser.get_flag("dry-run");

    if (config_.dsm_path.empty() || config_.registry_path.empty()) {
        std::cerr << "Error: --dsm and --terraces are required (on the command line or in --config)" << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        error_ = true;
        return false;
    }

    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Inputs
    if (auto value = parser.get("dsm")) config_.dsm_path = value.value();
    if (auto value = parser.get("terraces")) config_.registry_path = value.value();
    if (auto value = parser.get("id-field")) config_.registry_id_field = value.value();

    // Time
    if (auto value = parser.get("date")) config_.date = value.value();
    if (auto value = parser.get("timezone")) config_.timezone = value.value();
    if (auto value = parser.get("slot-start")) config_.slot_start = value.value();
    if (auto value = parser.get("slot-end")) config_.slot_end = value.value();
    if (parser.get("slot-interval")) {
        auto minutes = parser.get_as<int>("slot-interval");
        if (!minutes) {
            std::cerr << "Error: --slot-interval expects a whole number of minutes" << std::endl;
            return false;
        }
        config_.slot_interval_minutes = minutes.value();
    }

    // Sun
    if (auto value = parser.get("reference")) {
        auto [lat, lon] = unit_parser_.parse_coordinate_pair(value.value());
        config_.reference_location = GeoPoint(lat, lon);
    }
    parse_boolean_option(parser, "refraction", "no-refraction", config_.apply_refraction);

    // Distances accept unit suffixes: "1m", "0.3km", "5ft"
    if (auto value = parser.get("ray-step")) {
        config_.ray_step_m = unit_parser_.parse_distance(value.value()).meters;
    }
    if (auto value = parser.get("max-distance")) {
        config_.max_ray_distance_m = unit_parser_.parse_distance(value.value()).meters;
    }
    if (auto value = parser.get("height-buffer")) {
        config_.height_buffer_radius_m = unit_parser_.parse_distance(value.value()).meters;
    }

    // Weather
    if (auto value = parser.get("weather-source")) {
        auto source = parse_weather_source(value.value());
        if (!source) {
            std::cerr << "Error: Unknown weather source '" << value.value()
                      << "' (expected open-meteo, file or none)" << std::endl;
            return false;
        }
        config_.weather_source = source.value();
    }
    if (auto value = parser.get("weather-file")) {
        config_.weather_file = value.value();
        // A file without an explicit source means the file is the source
        if (!parser.get("weather-source")) {
            config_.weather_source = ShadeConfig::WeatherSource::FILE;
        }
    }
    if (auto value = parser.get("weather-url")) config_.weather_url = value.value();
    if (parser.get("weather-timeout")) {
        auto seconds = parser.get_as<int>("weather-timeout");
        if (!seconds) {
            std::cerr << "Error: --weather-timeout expects a whole number of seconds" << std::endl;
            return false;
        }
        config_.weather_timeout_seconds = seconds.value();
    }
    if (parser.get("cloud-threshold")) {
        auto threshold = parser.get_as<double>("cloud-threshold");
        if (!threshold) {
            std::cerr << "Error: --cloud-threshold expects a percentage" << std::endl;
            return false;
        }
        config_.cloud_cover_threshold_pct = threshold.value();
    }

    // Outputs
    if (auto value = parser.get("output")) config_.output_path = value.value();
    if (auto value = parser.get("records-csv")) config_.records_csv_path = value.value();
    if (auto value = parser.get("report")) config_.report_path = value.value();
    if (parser.get_flag("diagnostics")) config_.diagnostics = true;
    if (parser.get_flag("pretty")) config_.pretty_print = true;
    if (parser.get("precision")) {
        auto precision = parser.get_as<int>("precision");
        if (!precision) {
            std::cerr << "Error: --precision expects a whole number" << std::endl;
            return false;
        }
        config_.coordinate_precision = precision.value();
    }

    // Processing
    if (parser.get("threads")) {
        auto threads = parser.get_as<int>("threads");
        if (!threads || threads.value() < 0) {
            std::cerr << "Error: --threads expects a non-negative number" << std::endl;
            return false;
        }
        config_.num_threads = threads.value();
    }
    if (parser.get_flag("no-parallel")) config_.parallel_processing = false;

    return true;
}

bool CommandLineInterface::parse_query_options(const SimpleCommandLineParser& parser) {
    QueryRequest request;
    request.results_path = parser.get("results").value();
    if (auto value = parser.get("query-time")) request.time_key = value.value();
    request.only_sunny = parser.get_flag("only-sunny");

    int selectors = 0;

    if (auto value = parser.get("query-viewport")) {
        auto numbers = parse_number_list(value.value());
        if (numbers.size() != 4) {
            std::cerr << "Error: --query-viewport expects swLng,swLat,neLng,neLat" << std::endl;
            return false;
        }
        request.viewport = BoundingBox(numbers[0], numbers[1], numbers[2], numbers[3]);
        ++selectors;
    }

    if (auto value = parser.get("query-nearby")) {
        auto numbers = parse_number_list(value.value());
        if (numbers.size() != 2 && numbers.size() != 3) {
            std::cerr << "Error: --query-nearby expects lat,lon or lat,lon,radius_km" << std::endl;
            return false;
        }
        QueryRequest::Nearby nearby;
        nearby.lat = numbers[0];
        nearby.lon = numbers[1];
        if (numbers.size() == 3) {
            if (numbers[2] <= 0.0) {
                std::cerr << "Error: --query-nearby radius must be positive" << std::endl;
                return false;
            }
            nearby.radius_km = numbers[2];
        }
        request.nearby = nearby;
        ++selectors;
    }

    if (auto value = parser.get("query-id")) {
        request.terrace_id = value.value();
        ++selectors;
    }

    if (selectors > 1) {
        std::cerr << "Error: use only one of --query-viewport, --query-nearby and --query-id" << std::endl;
        return false;
    }

    query_ = request;
    return true;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > config file > defaults
    // 1. Environment variable
    const char* env_log_level = std::getenv("SHADE_LOG_LEVEL");
    if (env_log_level) {
        std::string env_config(env_log_level);
        Logger::parseLogConfig(env_config);
        if (env_config.find('=') == std::string::npos) {
            config_.log_level = std::stoi(env_config);
        } else {
            config_.log_level = 3;
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        std::string log_config = value.value();
        Logger::parseLogConfig(log_config);
        if (log_config.find('=') == std::string::npos) {
            config_.log_level = std::stoi(log_config);
        } else {
            // "4,ShadowRaytracer=6": the leading bare number is the default
            size_t comma_pos = log_config.find(',');
            if (comma_pos != std::string::npos) {
                std::string first_part = log_config.substr(0, comma_pos);
                if (first_part.find('=') == std::string::npos) {
                    config_.log_level = std::stoi(first_part);
                }
            }
        }
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 0;
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
    }

    config_.log_level = std::clamp(config_.log_level, 0, 6);
    // ERROR level minimum
    Logger::setDefaultLevel(static_cast<LogLevel>(std::max(config_.log_level, 1)));

    // 4. Log file configuration
    const char* env_log_file = std::getenv("SHADE_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    }
    if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

std::optional<ShadeConfig::WeatherSource> CommandLineInterface::parse_weather_source(const std::string& source_str) {
    if (source_str == "open-meteo") return ShadeConfig::WeatherSource::OPEN_METEO;
    if (source_str == "file") return ShadeConfig::WeatherSource::FILE;
    if (source_str == "none") return ShadeConfig::WeatherSource::NONE;
    return std::nullopt;
}

std::string CommandLineInterface::weather_source_name(ShadeConfig::WeatherSource source) {
    switch (source) {
        case ShadeConfig::WeatherSource::OPEN_METEO: return "open-meteo";
        case ShadeConfig::WeatherSource::FILE: return "file";
        case ShadeConfig::WeatherSource::NONE: return "none";
    }
    return "none";
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    const std::string default_config = R"({
  "dsm": "paris_dsm.tif",
  "terraces": "terraces.geojson",
  "id_field": "id",
  "date": null,
  "timezone": "Europe/Paris",
  "slot_start": "09:00",
  "slot_end": "21:00",
  "slot_interval": 30,
  "reference": "48.8566,2.3522",
  "apply_refraction": true,
  "ray_step": "1m",
  "max_ray_distance": "300m",
  "height_buffer": "2m",
  "weather_source": "open-meteo",
  "weather_file": null,
  "weather_url": "https://api.open-meteo.com/v1/forecast",
  "weather_timeout": 10,
  "cloud_threshold": 75.0,
  "output": "sunlight_results.geojson",
  "records_csv": null,
  "report": null,
  "diagnostics": false,
  "pretty_print": false,
  "precision": 7,
  "parallel": true,
  "threads": 0,
  "log_level": 3,
  "log_file": null
}
)";

    try {
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        file << default_config;
        return static_cast<bool>(file);
    } catch (const std::exception&) {
        return false;
    }
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        // Numbers are meters, strings may carry a unit suffix
        auto parse_distance_value = [this](const json& j, const std::string& key, double& target) {
            if (!j.contains(key) || j[key].is_null()) return;

            if (j[key].is_string()) {
                std::string value_str = j[key].get<std::string>();
                try {
                    target = unit_parser_.parse_distance(value_str).meters;
                } catch (const UnitParseError& e) {
                    std::cerr << "Warning: " << e.what() << " for key '" << key << "', using default" << std::endl;
                }
            } else if (j[key].is_number()) {
                target = j[key].get<double>();
            }
        };

        auto get_string = [](const json& j, const std::string& key, std::string& target) {
            if (j.contains(key) && j[key].is_string()) target = j[key].get<std::string>();
        };

        auto get_optional_string = [](const json& j, const std::string& key, std::optional<std::string>& target) {
            if (j.contains(key) && j[key].is_string()) target = j[key].get<std::string>();
        };

        // Inputs
        get_string(config, "dsm", config_.dsm_path);
        get_string(config, "terraces", config_.registry_path);
        get_string(config, "id_field", config_.registry_id_field);

        // Time
        get_string(config, "date", config_.date);
        get_string(config, "timezone", config_.timezone);
        get_string(config, "slot_start", config_.slot_start);
        get_string(config, "slot_end", config_.slot_end);
        if (config.contains("slot_interval") && config["slot_interval"].is_number())
            config_.slot_interval_minutes = config["slot_interval"];

        // Reference location: "lat,lon" (decimal or DMS) or {"lat": .., "lon": ..}
        if (config.contains("reference")) {
            try {
                const auto& ref = config["reference"];
                if (ref.is_string()) {
                    auto [lat, lon] = unit_parser_.parse_coordinate_pair(ref.get<std::string>());
                    config_.reference_location = GeoPoint(lat, lon);
                } else if (ref.is_object() && ref.contains("lat") && ref.contains("lon")) {
                    config_.reference_location = GeoPoint(ref["lat"].get<double>(), ref["lon"].get<double>());
                }
            } catch (const std::exception& e) {
                std::cerr << "Warning: Error parsing reference location: " << e.what() << std::endl;
            }
        }
        if (config.contains("apply_refraction") && config["apply_refraction"].is_boolean())
            config_.apply_refraction = config["apply_refraction"];

        // Raytracing
        parse_distance_value(config, "ray_step", config_.ray_step_m);
        parse_distance_value(config, "max_ray_distance", config_.max_ray_distance_m);
        parse_distance_value(config, "height_buffer", config_.height_buffer_radius_m);

        // Weather
        if (config.contains("weather_source") && config["weather_source"].is_string()) {
            auto source = parse_weather_source(config["weather_source"].get<std::string>());
            if (source) {
                config_.weather_source = source.value();
            } else {
                std::cerr << "Warning: Unknown weather source '" << config["weather_source"].get<std::string>()
                          << "', using '" << weather_source_name(config_.weather_source) << "'" << std::endl;
            }
        }
        get_string(config, "weather_file", config_.weather_file);
        get_string(config, "weather_url", config_.weather_url);
        if (config.contains("weather_timeout") && config["weather_timeout"].is_number())
            config_.weather_timeout_seconds = config["weather_timeout"];
        if (config.contains("cloud_threshold") && config["cloud_threshold"].is_number())
            config_.cloud_cover_threshold_pct = config["cloud_threshold"];

        // Outputs
        get_string(config, "output", config_.output_path);
        get_optional_string(config, "records_csv", config_.records_csv_path);
        get_optional_string(config, "report", config_.report_path);
        if (config.contains("diagnostics") && config["diagnostics"].is_boolean())
            config_.diagnostics = config["diagnostics"];
        if (config.contains("pretty_print") && config["pretty_print"].is_boolean())
            config_.pretty_print = config["pretty_print"];
        if (config.contains("precision") && config["precision"].is_number())
            config_.coordinate_precision = config["precision"];

        // Processing and logging
        if (config.contains("parallel") && config["parallel"].is_boolean())
            config_.parallel_processing = config["parallel"];
        if (config.contains("threads") && config["threads"].is_number())
            config_.num_threads = config["threads"];
        if (config.contains("log_level") && config["log_level"].is_number())
            config_.log_level = config["log_level"];
        get_optional_string(config, "log_file", config_.log_file);

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing config file " << filename << ": " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error loading config file " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::run_query(std::ostream& out) const {
    if (!query_) {
        return;
    }
    const QueryRequest& request = query_.value();
    ResultReader reader = ResultReader::load(request.results_path);

    std::string time_key = request.time_key;
    if (time_key.empty()) {
        auto keys = reader.time_slots();
        if (!keys.empty()) {
            time_key = keys.front();
        }
    }

    json response;
    response["time_slot"] = time_key;
    json terraces = json::array();

    if (request.terrace_id) {
        if (auto status = reader.find(request.terrace_id.value(), time_key)) {
            terraces.push_back(status_to_json(status.value(), false));
        }
    } else if (request.nearby) {
        const auto& nearby = request.nearby.value();
        for (const auto& status : reader.nearby(nearby.lat, nearby.lon, nearby.radius_km,
                                                time_key, request.only_sunny)) {
            terraces.push_back(status_to_json(status, true));
        }
    } else if (request.viewport) {
        const auto& box = request.viewport.value();
        for (const auto& status : reader.in_viewport(box.min_x, box.min_y, box.max_x, box.max_y, time_key)) {
            terraces.push_back(status_to_json(status, false));
        }
    } else {
        // No selector: list the slots available in the file
        response["time_slots"] = reader.time_slots();
        response["terrace_count"] = reader.size();
        out << response.dump(2) << "\n";
        return;
    }

    response["count"] = terraces.size();
    response["terraces"] = terraces;
    out << response.dump(2) << "\n";
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;

    std::cout << "\n=== Configuration ===\n";
    std::cout << "DSM: " << config_.dsm_path << "\n";
    std::cout << "Terraces: " << config_.registry_path << " (id field: " << config_.registry_id_field << ")\n";
    std::cout << "Date: " << (config_.date.empty() ? std::string("today") : config_.date)
              << " (" << config_.timezone << ")\n";
    std::cout << "Slots: " << config_.slot_start << " to " << config_.slot_end
              << " every " << config_.slot_interval_minutes << " min\n";
    std::cout << "Reference: " << config_.reference_location.lat << "," << config_.reference_location.lon << "\n";
    std::cout << "Refraction: " << (config_.apply_refraction ? "yes" : "no") << "\n";
    std::cout << "Ray step: " << config_.ray_step_m << "m, max distance: " << config_.max_ray_distance_m << "m\n";
    std::cout << "Height buffer: " << config_.height_buffer_radius_m << "m\n";
    std::cout << "Weather: " << weather_source_name(config_.weather_source);
    if (config_.weather_source == ShadeConfig::WeatherSource::FILE) {
        std::cout << " (" << config_.weather_file << ")";
    }
    std::cout << ", threshold " << config_.cloud_cover_threshold_pct << "%\n";
    std::cout << "Output: " << config_.output_path << "\n";
    if (config_.records_csv_path) std::cout << "Records CSV: " << config_.records_csv_path.value() << "\n";
    if (config_.report_path) std::cout << "Report: " << config_.report_path.value() << "\n";
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "yes" : "no") << "\n";
    std::cout << "===================\n\n";
}

} // namespace shade

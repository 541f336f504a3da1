/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser with no external dependency
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace shade {

/**
 * @brief Simple command-line argument parser
 *
 * Supports "--name value", "--name=value", short aliases and boolean flags.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse arguments
     * @return false on error or when help was shown (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto short_it = short_to_long_.find(short_name);
                if (short_it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = short_it->second;
                if (options_[option_name].has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    /// True if the user passed the option (defaults do not count)
    bool was_given(const std::string& option_name) const {
        const std::string long_flag = "--" + option_name;
        for (const auto& arg : args_) {
            if (arg == long_flag || arg.starts_with(long_flag + "=")) {
                return true;
            }
        }
        auto it = options_.find(option_name);
        if (it != options_.end() && !it->second.short_name.empty()) {
            for (const auto& arg : args_) {
                if (arg == "-" + it->second.short_name) {
                    return true;
                }
            }
        }
        return false;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << "TERRACE SHADE - Sunlit or shaded, for every terrace and every time slot of a day\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --dsm DSM.tif --terraces TERRACES.geojson [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --results RESULTS.geojson --query-time t1300 [QUERY]\n\n";

        std::cout << description_ << "\n\n";

        std::cout << "INPUT OPTIONS:\n";
        print_help_section("config", "Load configuration from JSON file");
        print_help_section("create-config", "Write a default configuration file and exit");
        print_help_section("dsm", "Digital surface model raster (GeoTIFF or any GDAL raster)");
        print_help_section("terraces", "Terrace registry (GeoJSON, GeoPackage, Shapefile or CSV with lat/lon)");
        print_help_section("id-field", "Registry attribute holding the terrace id (default: id)");
        std::cout << "\n";

        std::cout << "TIME OPTIONS:\n";
        print_help_section("date", "Target day as YYYY-MM-DD (default: today)");
        print_help_section("timezone", "Europe/Paris (default), UTC or a fixed offset such as +01:00");
        print_help_section("slot-start", "First slot, HH:MM (default: 09:00)");
        print_help_section("slot-end", "Last slot, HH:MM (default: 21:00)");
        print_help_section("slot-interval", "Minutes between slots (default: 30)");
        std::cout << "\n";

        std::cout << "SUN & SHADOW OPTIONS:\n";
        print_help_section("reference", "Reference location for the sun, lat,lon (default: 48.8566,2.3522)");
        print_help_section("no-refraction", "Do not correct the sun altitude for atmospheric refraction");
        print_help_section("ray-step", "Ray marching step, e.g. 1m (default: 1m)");
        print_help_section("max-distance", "Maximum ray distance, e.g. 300m or 0.3km (default: 300m)");
        print_help_section("height-buffer", "Radius searched for the terrace ground height (default: 2m)");
        std::cout << "\n";

        std::cout << "WEATHER OPTIONS:\n";
        print_help_section("weather-source", "open-meteo (default), file or none");
        print_help_section("weather-file", "Saved Open-Meteo hourly response for --weather-source file");
        print_help_section("weather-url", "Forecast API endpoint");
        print_help_section("weather-timeout", "Request timeout in seconds (default: 10)");
        print_help_section("cloud-threshold", "Cloud cover above this percentage means shaded (default: 75)");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output", "GeoJSON output file (default: sunlight_results.geojson)");
        print_help_section("records-csv", "Also write one CSV row per terrace and slot");
        print_help_section("report", "Also write a JSON run report");
        print_help_section("diagnostics", "Add obstruction details to the GeoJSON properties");
        print_help_section("pretty", "Indent the GeoJSON output");
        print_help_section("precision", "Decimal digits for coordinates (default: 7)");
        std::cout << "\n";

        std::cout << "QUERY OPTIONS:\n";
        print_help_section("results", "Query an existing results file instead of computing");
        print_help_section("query-time", "Slot key to report, e.g. t1330 (default: first slot)");
        print_help_section("query-viewport", "Terraces in swLng,swLat,neLng,neLat");
        print_help_section("query-nearby", "Terraces within lat,lon,radius_km (radius default 0.5)");
        print_help_section("query-id", "Single terrace by id");
        print_help_section("only-sunny", "Keep only sunlit terraces in --query-nearby");
        std::cout << "\n";

        std::cout << "PROCESSING & LOGGING:\n";
        print_help_section("threads", "Worker threads, 0 = automatic (default: 0)");
        print_help_section("no-parallel", "Classify terraces on a single thread");
        print_help_section("silent", "Suppress all output (same as --log-level 0)");
        print_help_section("verbose", "Enable verbose logging (same as --log-level 6)");
        print_help_section("log-level", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        print_help_section("log-file", "Log to specified file (append if exists)");
        print_help_section("dry-run", "Parse arguments and validate without processing");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --dsm paris_dsm.tif --terraces terraces.geojson --date 2024-06-21\n";
        std::cout << "    " << program_name_ << " --config paris.json --weather-source none --diagnostics\n";
        std::cout << "    " << program_name_ << " --results sunlight_results.geojson --query-nearby 48.853,2.349,0.5 --query-time t1300 --only-sunny\n";
    }

private:
    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string label = "--" + option.long_name;
            if (!option.short_name.empty()) {
                label = "-" + option.short_name + ", " + label;
            }
            if (option.has_value) {
                label += " VALUE";
            }
            std::cout << "    " << label;
            if (label.size() < 32) {
                std::cout << std::string(32 - label.size(), ' ');
            } else {
                std::cout << "  ";
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace shade

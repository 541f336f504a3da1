/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the terrace sunlight engine
 */

#pragma once

#include "terrace_shade.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace shade {

/**
 * @brief Lookup against an existing results file
 */
struct QueryRequest {
    std::string results_path;
    std::string time_key;   ///< Empty selects the first slot in the file

    std::optional<BoundingBox> viewport;   ///< min_x/max_x are longitudes

    struct Nearby {
        double lat = 0.0;
        double lon = 0.0;
        double radius_km = 0.5;
    };
    std::optional<Nearby> nearby;
    bool only_sunny = false;

    std::optional<std::string> terrace_id;
};

/**
 * @brief Command line interface for parsing arguments and configuring the engine
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a run (or a query) should follow. On false check
     *         has_error() to tell help/version output from a bad command line.
     */
    bool parse_arguments(int argc, char* argv[]);

    const ShadeConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }
    bool has_error() const { return error_; }

    bool is_query_mode() const { return query_.has_value(); }
    const std::optional<QueryRequest>& get_query() const { return query_; }

    /**
     * @brief Answer the query and print the matching terraces as JSON
     * @throws InputNotFoundError if the results file cannot be read
     */
    void run_query(std::ostream& out) const;

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

    // Configuration file methods, public for --create-config and tests
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);

private:
    ShadeConfig config_;
    std::optional<QueryRequest> query_;
    bool dry_run_ = false;
    bool error_ = false;
    UnitParser unit_parser_;

    // Main parsing methods
    bool parse_all_options(const SimpleCommandLineParser& parser);
    bool parse_query_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    static std::optional<ShadeConfig::WeatherSource> parse_weather_source(const std::string& source_str);
    static std::string weather_source_name(ShadeConfig::WeatherSource source);
};

} // namespace shade

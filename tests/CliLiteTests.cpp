#include "LiteTest.hpp"

#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include "UnitParser.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace shade;
using json = nlohmann::json;

static bool Parse(CommandLineInterface& cli, std::vector<std::string> args)
{
  args.insert(args.begin(), "terrace-shade");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return cli.parse_arguments(static_cast<int>(argv.size()), argv.data());
}

static void TestRunOptions()
{
  CommandLineInterface cli;
  ASSERT_TRUE(Parse(cli, {"--dsm", "paris.tif", "-t", "terraces.geojson", "--date", "2024-06-21",
                          "--slot-interval", "15", "--ray-step", "0.5m", "--max-distance", "0.3km",
                          "--height-buffer=3m", "--reference", "48.85,2.35", "--no-refraction",
                          "--cloud-threshold", "60", "--threads", "4", "--no-parallel",
                          "--records-csv", "records.csv", "--diagnostics", "--log-level", "1"}));
  EXPECT_FALSE(cli.has_error());
  EXPECT_FALSE(cli.is_query_mode());
  EXPECT_FALSE(cli.is_dry_run());

  const ShadeConfig& config = cli.get_config();
  EXPECT_EQ(config.dsm_path, std::string("paris.tif"));
  EXPECT_EQ(config.registry_path, std::string("terraces.geojson"));
  EXPECT_EQ(config.date, std::string("2024-06-21"));
  EXPECT_EQ(config.slot_interval_minutes, 15);
  EXPECT_NEAR(config.ray_step_m, 0.5, 1e-9);
  EXPECT_NEAR(config.max_ray_distance_m, 300.0, 1e-9);
  EXPECT_NEAR(config.height_buffer_radius_m, 3.0, 1e-9);
  EXPECT_NEAR(config.reference_location.lat, 48.85, 1e-9);
  EXPECT_NEAR(config.reference_location.lon, 2.35, 1e-9);
  EXPECT_FALSE(config.apply_refraction);
  EXPECT_NEAR(config.cloud_cover_threshold_pct, 60.0, 1e-9);
  EXPECT_EQ(config.num_threads, 4);
  EXPECT_FALSE(config.parallel_processing);
  EXPECT_TRUE(config.diagnostics);
  ASSERT_TRUE(config.records_csv_path.has_value());
  EXPECT_EQ(config.records_csv_path.value(), std::string("records.csv"));
  EXPECT_EQ(config.log_level, 1);

  // Untouched defaults
  EXPECT_EQ(config.timezone, std::string("Europe/Paris"));
  EXPECT_EQ(config.slot_start, std::string("09:00"));
  EXPECT_EQ(config.output_path, std::string("sunlight_results.geojson"));
}

static void TestWeatherOptions()
{
  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--weather-source", "none",
                            "--log-level", "1"}));
    EXPECT_TRUE(cli.get_config().weather_source == ShadeConfig::WeatherSource::NONE);
  }
  {
    // A weather file alone selects the file source
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--weather-file", "clouds.json",
                            "--log-level", "1"}));
    EXPECT_TRUE(cli.get_config().weather_source == ShadeConfig::WeatherSource::FILE);
    EXPECT_EQ(cli.get_config().weather_file, std::string("clouds.json"));
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--weather-source", "radar",
                             "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
}

static void TestErrors()
{
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--terraces", "b.csv", "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--ray-step", "far",
                             "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--threads", "-2",
                             "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--bogus"}));
    EXPECT_TRUE(cli.has_error());
  }
  {
    // Help and version stop without an error
    CommandLineInterface help;
    EXPECT_FALSE(Parse(help, {"--help"}));
    EXPECT_FALSE(help.has_error());

    CommandLineInterface version;
    EXPECT_FALSE(Parse(version, {"--version"}));
    EXPECT_FALSE(version.has_error());
  }
  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--dsm", "a.tif", "--terraces", "b.csv", "--dry-run", "--log-level", "1"}));
    EXPECT_TRUE(cli.is_dry_run());
  }
}

static void TestQueryOptions()
{
  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", "out.geojson", "--query-time", "t1300",
                            "--query-viewport=2.30,48.84,2.36,48.87", "--log-level", "1"}));
    ASSERT_TRUE(cli.is_query_mode());
    const QueryRequest& query = cli.get_query().value();
    EXPECT_EQ(query.results_path, std::string("out.geojson"));
    EXPECT_EQ(query.time_key, std::string("t1300"));
    ASSERT_TRUE(query.viewport.has_value());
    EXPECT_NEAR(query.viewport->min_x, 2.30, 1e-9);
    EXPECT_NEAR(query.viewport->max_y, 48.87, 1e-9);
    EXPECT_FALSE(query.nearby.has_value());
  }
  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", "out.geojson", "--query-nearby", "48.853,2.349", "--only-sunny",
                            "--log-level", "1"}));
    const QueryRequest& query = cli.get_query().value();
    ASSERT_TRUE(query.nearby.has_value());
    EXPECT_NEAR(query.nearby->radius_km, 0.5, 1e-12);
    EXPECT_TRUE(query.only_sunny);
    EXPECT_TRUE(query.time_key.empty());
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--results", "out.geojson", "--query-viewport", "1,2,3", "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
  {
    CommandLineInterface cli;
    EXPECT_FALSE(Parse(cli, {"--results", "out.geojson", "--query-id", "T1", "--query-nearby", "48.8,2.3",
                             "--log-level", "1"}));
    EXPECT_TRUE(cli.has_error());
  }
}

static void TestConfigFile()
{
  const fs::path path = MakeTempPath("shade_cli_config").replace_extension(".json");
  std::error_code ec;

  {
    CommandLineInterface writer;
    ASSERT_TRUE(writer.create_default_config_file(path.string()));

    CommandLineInterface reader;
    ASSERT_TRUE(reader.load_config_file(path.string()));
    const ShadeConfig& config = reader.get_config();
    EXPECT_EQ(config.dsm_path, std::string("paris_dsm.tif"));
    EXPECT_EQ(config.registry_path, std::string("terraces.geojson"));
    EXPECT_TRUE(config.date.empty());
    EXPECT_NEAR(config.ray_step_m, 1.0, 1e-9);
    EXPECT_NEAR(config.max_ray_distance_m, 300.0, 1e-9);
    EXPECT_FALSE(config.records_csv_path.has_value());
  }

  {
    std::ofstream out(path);
    out << R"({"dsm": "dsm.tif", "terraces": "t.geojson", "height_buffer": 4,
               "max_ray_distance": "0.2km", "reference": {"lat": 48.86, "lon": 2.34},
               "weather_source": "none", "report": "report.json", "slot_interval": 60})";
  }

  {
    // Command line wins over the file
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--config", path.string(), "--slot-interval", "20", "--log-level", "1"}));
    const ShadeConfig& config = cli.get_config();
    EXPECT_EQ(config.dsm_path, std::string("dsm.tif"));
    EXPECT_NEAR(config.height_buffer_radius_m, 4.0, 1e-9);
    EXPECT_NEAR(config.max_ray_distance_m, 200.0, 1e-9);
    EXPECT_NEAR(config.reference_location.lat, 48.86, 1e-9);
    EXPECT_TRUE(config.weather_source == ShadeConfig::WeatherSource::NONE);
    EXPECT_EQ(config.report_path.value_or(""), std::string("report.json"));
    EXPECT_EQ(config.slot_interval_minutes, 20);
  }

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  CommandLineInterface broken;
  EXPECT_FALSE(broken.load_config_file(path.string()));

  CommandLineInterface missing;
  EXPECT_FALSE(missing.load_config_file((path.parent_path() / "shade_no_such_config.json").string()));

  fs::remove(path, ec);
}

static void TestRunQuery()
{
  const fs::path path = MakeTempPath("shade_cli_results").replace_extension(".geojson");
  std::error_code ec;
  {
    std::ofstream out(path);
    out << R"({"type": "FeatureCollection", "features": [
      {"type": "Feature", "geometry": {"type": "Point", "coordinates": [2.3500, 48.8500]},
       "properties": {"id": "near", "t1200": true, "t1230": false}},
      {"type": "Feature", "geometry": {"type": "Point", "coordinates": [2.3520, 48.8510]},
       "properties": {"id": "shaded", "t1200": false, "t1230": true}},
      {"type": "Feature", "geometry": {"type": "Point", "coordinates": [2.4000, 48.9000]},
       "properties": {"id": "far", "t1200": true, "t1230": true}}]})";
  }

  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", path.string(), "--query-nearby", "48.85,2.35", "--only-sunny",
                            "--log-level", "1"}));
    std::ostringstream out;
    cli.run_query(out);
    const json response = json::parse(out.str());
    EXPECT_EQ(response["time_slot"].get<std::string>(), std::string("t1200"));
    ASSERT_TRUE(response["count"].get<int>() == 1);
    EXPECT_EQ(response["terraces"][0]["id"].get<std::string>(), std::string("near"));
    EXPECT_TRUE(response["terraces"][0]["is_sunlit"].get<bool>());
    EXPECT_TRUE(response["terraces"][0].contains("distance_km"));
  }

  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", path.string(), "--query-time", "t1230",
                            "--query-viewport=2.34,48.84,2.36,48.86", "--log-level", "1"}));
    std::ostringstream out;
    cli.run_query(out);
    const json response = json::parse(out.str());
    ASSERT_TRUE(response["count"].get<int>() == 2);
    EXPECT_EQ(response["terraces"][0]["id"].get<std::string>(), std::string("near"));
    EXPECT_FALSE(response["terraces"][0]["is_sunlit"].get<bool>());
    EXPECT_TRUE(response["terraces"][1]["is_sunlit"].get<bool>());
  }

  {
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", path.string(), "--query-id", "far", "--query-time", "t1230",
                            "--log-level", "1"}));
    std::ostringstream out;
    cli.run_query(out);
    const json response = json::parse(out.str());
    ASSERT_TRUE(response["count"].get<int>() == 1);
    EXPECT_NEAR(response["terraces"][0]["lat"].get<double>(), 48.9, 1e-9);
  }

  {
    // No selector lists what the file holds
    CommandLineInterface cli;
    ASSERT_TRUE(Parse(cli, {"--results", path.string(), "--log-level", "1"}));
    std::ostringstream out;
    cli.run_query(out);
    const json response = json::parse(out.str());
    EXPECT_EQ(response["terrace_count"].get<int>(), 3);
    EXPECT_EQ(response["time_slots"].size(), static_cast<size_t>(2));
  }

  fs::remove(path, ec);
}

static void TestUnitParser()
{
  UnitParser parser;
  EXPECT_NEAR(parser.parse_distance("300").meters, 300.0, 1e-9);
  EXPECT_NEAR(parser.parse_distance("0.3km").meters, 300.0, 1e-9);
  EXPECT_NEAR(parser.parse_distance("10 ft").meters, 3.048, 1e-9);
  EXPECT_TRUE(parser.parse_distance("2m").had_explicit_unit);
  EXPECT_FALSE(parser.parse_distance("2").had_explicit_unit);
  EXPECT_EQ(UnitParser::unit_to_string(parser.parse_distance("1mi").original_unit), std::string("mi"));

  EXPECT_NEAR(parser.parse_latitude("48\u00b051'24\"N"), 48.856667, 1e-6);
  EXPECT_NEAR(parser.parse_longitude("2d21m7sE"), 2.351944, 1e-6);
  EXPECT_NEAR(parser.parse_longitude("0d10m0sW"), -0.166667, 1e-6);

  bool threw = false;
  try {
    (void)parser.parse_latitude("91");
  } catch (const UnitParseError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  threw = false;
  try {
    (void)parser.parse_distance("5 parsecs");
  } catch (const UnitParseError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestLogConfig()
{
  EXPECT_TRUE(Logger::parseLogConfig("2,ShadowRaytracer=6"));
  EXPECT_TRUE(Logger::getFacilityLevel("ShadowRaytracer") == LogLevel::TRACE);
  EXPECT_TRUE(Logger::getFacilityLevel("WeatherService") == LogLevel::WARNING);

  Logger raytracer("ShadowRaytracer");
  Logger weather("WeatherService");
  EXPECT_TRUE(raytracer.shouldOutput(LogLevel::TRACE));
  EXPECT_FALSE(weather.shouldOutput(LogLevel::INFO));

  Logger::setFacilityLevel("WeatherService", LogLevel::DEBUG);
  EXPECT_TRUE(weather.shouldOutput(LogLevel::DEBUG));

  EXPECT_FALSE(Logger::parseLogConfig("loud"));

  Logger::clearFacilityLevels();
  EXPECT_FALSE(raytracer.shouldOutput(LogLevel::TRACE));
  Logger::setDefaultLevel(LogLevel::ERROR);
}

int main()
{
  TestUnitParser();
  TestLogConfig();
  TestRunOptions();
  TestWeatherOptions();
  TestErrors();
  TestQueryOptions();
  TestConfigFile();
  TestRunQuery();

  return FinishTests("shade_cli_tests");
}

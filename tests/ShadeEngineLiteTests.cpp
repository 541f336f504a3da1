#include "LiteTest.hpp"

#include "ShadeErrors.hpp"
#include "terrace_shade.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "core/DsmRaster.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/OutputTracker.hpp"
#include "export/GeoJSONExporter.hpp"
#include "export/RunReportExporter.hpp"

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace shade;
using json = nlohmann::json;

// 200 x 200 one-meter Lambert-93 cells in central Paris, ground at 35 m.
// A 60 m block stands 3 m south of terrace SOUTH_WALL; terrace OPEN sits in
// a shallow dip in the open; terrace OUTSIDE lies 50 m west of the raster.
static const int kSize = 200;
static const double kOriginX = 651900.0;
static const double kOriginY = 6862100.0;

struct Fixture {
  fs::path dir;
  fs::path dsm;
  fs::path registry;
  GeoPoint south_wall;
  GeoPoint open;
  GeoPoint outside;
};

static Fixture g_fixture;

static GeoPoint LambertToWgs84(double x, double y)
{
  OGRSpatialReference lambert;
  lambert.importFromEPSG(2154);
  lambert.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  OGRSpatialReference wgs84;
  wgs84.SetWellKnownGeogCS("WGS84");
  wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

  std::unique_ptr<OGRCoordinateTransformation> transform(OGRCreateCoordinateTransformation(&lambert, &wgs84));
  if (!transform || !transform->Transform(1, &x, &y)) {
    return GeoPoint(0.0, 0.0);
  }
  return GeoPoint(y, x);
}

static GeoPoint PixelToWgs84(double px, double py)
{
  return LambertToWgs84(kOriginX + px, kOriginY - py);
}

static bool WriteDsm(const fs::path& path)
{
  std::vector<float> heights(static_cast<size_t>(kSize) * kSize, 35.0f);
  auto set = [&](int col, int row, float value) {
    heights[static_cast<size_t>(row) * kSize + static_cast<size_t>(col)] = value;
  };
  for (int row = 53; row <= 60; ++row) {
    for (int col = 40; col <= 60; ++col) {
      set(col, row, 60.0f);
    }
  }
  set(151, 150, 34.5f);

  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
  if (!driver) {
    return false;
  }
  GDALDataset* dataset = driver->Create(path.string().c_str(), kSize, kSize, 1, GDT_Float32, nullptr);
  if (!dataset) {
    return false;
  }

  double geotransform[6] = {kOriginX, 1.0, 0.0, kOriginY, 0.0, -1.0};
  dataset->SetGeoTransform(geotransform);

  OGRSpatialReference lambert;
  lambert.importFromEPSG(2154);
  char* wkt = nullptr;
  lambert.exportToWkt(&wkt);
  dataset->SetProjection(wkt);
  CPLFree(wkt);

  GDALRasterBand* band = dataset->GetRasterBand(1);
  band->SetNoDataValue(-9999.0);
  const CPLErr err = band->RasterIO(GF_Write, 0, 0, kSize, kSize, heights.data(), kSize, kSize, GDT_Float32, 0, 0);
  GDALClose(dataset);
  return err == CE_None;
}

static std::string PointFeature(const std::string& id, const GeoPoint& location)
{
  char buffer[256];
  std::snprintf(buffer, sizeof(buffer),
                "{\"type\": \"Feature\", \"properties\": {\"id\": \"%s\"}, "
                "\"geometry\": {\"type\": \"Point\", \"coordinates\": [%.10f, %.10f]}}",
                id.c_str(), location.lon, location.lat);
  return buffer;
}

static bool SetUpFixture()
{
  GDALAllRegister();

  g_fixture.dir = MakeTempPath("shade_engine");
  std::error_code ec;
  fs::create_directories(g_fixture.dir, ec);
  if (ec) {
    return false;
  }

  g_fixture.dsm = g_fixture.dir / "dsm.tif";
  if (!WriteDsm(g_fixture.dsm)) {
    return false;
  }

  g_fixture.south_wall = PixelToWgs84(50.5, 50.5);
  g_fixture.open = PixelToWgs84(150.5, 150.5);
  g_fixture.outside = PixelToWgs84(-50.0, 100.5);

  g_fixture.registry = g_fixture.dir / "terraces.geojson";
  std::ofstream out(g_fixture.registry);
  out << "{\"type\": \"FeatureCollection\", \"features\": [\n"
      << PointFeature("SOUTH_WALL", g_fixture.south_wall) << ",\n"
      << PointFeature("OUTSIDE", g_fixture.outside) << ",\n"
      << PointFeature("OPEN", g_fixture.open) << "\n]}\n";
  return static_cast<bool>(out);
}

static void WriteWeather(const fs::path& path, double cloud_at_noon)
{
  // Only 12:00 UTC is known, 22:00 UTC is missing
  std::ofstream out(path);
  out << "{\"utc_offset_seconds\": 0, \"hourly\": {\"time\": [\"2024-06-21T11:00\", \"2024-06-21T12:00\"], "
      << "\"cloud_cover\": [0, " << cloud_at_noon << "]}}";
}

// Slots at solar noon (13:52 CEST, 11:52 UTC) and in the middle of the night
static ShadeConfig BaseConfig()
{
  ShadeConfig config;
  config.dsm_path = g_fixture.dsm.string();
  config.registry_path = g_fixture.registry.string();
  config.date = "2024-06-21";
  config.timezone = "Europe/Paris";
  config.slot_start = "13:52";
  config.slot_end = "23:52";
  config.slot_interval_minutes = 600;
  config.weather_source = ShadeConfig::WeatherSource::NONE;
  config.output_path = (g_fixture.dir / "sunlight.geojson").string();
  config.log_level = 1;
  return config;
}

static const TerraceResult* FindResult(const ShadeEngine& engine, const std::string& id)
{
  for (const auto& result : engine.get_results()) {
    if (result.terrace.id == id) {
      return &result;
    }
  }
  return nullptr;
}

static void TestDsmGeoreferencing()
{
  auto dsm = DsmRaster::open(g_fixture.dsm.string());
  ASSERT_TRUE(dsm != nullptr);
  EXPECT_TRUE(dsm->is_georeferenced());
  EXPECT_EQ(dsm->width(), kSize);
  EXPECT_NEAR(dsm->cell_size_m(), 1.0, 1e-9);
  EXPECT_NEAR(dsm->max_height(), 60.0, 1e-9);

  auto pixel = dsm->to_raster(g_fixture.south_wall);
  ASSERT_TRUE(pixel.has_value());
  EXPECT_NEAR(pixel->x, 50.5, 1e-4);
  EXPECT_NEAR(pixel->y, 50.5, 1e-4);

  // Due south is close to +row in Lambert-93
  const RasterPoint south = dsm->step_vector(180.0, 1.0);
  EXPECT_NEAR(south.y, 1.0, 0.01);
  EXPECT_NEAR(south.x, 0.0, 0.02);

  // Window around one terrace
  const BoundingBox around(g_fixture.open.lon, g_fixture.open.lat, g_fixture.open.lon, g_fixture.open.lat);
  auto window = DsmRaster::open(g_fixture.dsm.string(), around, 10.0);
  ASSERT_TRUE(window != nullptr);
  EXPECT_TRUE(window->width() < kSize);
  auto in_window = window->to_raster(g_fixture.open);
  ASSERT_TRUE(in_window.has_value());
  EXPECT_TRUE(window->contains(*in_window));
  EXPECT_NEAR(window->sample(RasterPoint(in_window->x + 1.0, in_window->y)).value(), 34.5, 1e-9);
}

static void TestClassification()
{
  ShadeEngine engine(BaseConfig());
  ASSERT_TRUE(engine.compute());

  EXPECT_EQ(engine.get_date(), std::string("2024-06-21"));
  ASSERT_TRUE(engine.get_slots().size() == 2);
  EXPECT_EQ(engine.get_slots()[0].slot.key(), std::string("t1352"));
  EXPECT_NEAR(engine.get_slots()[0].sun.altitude_deg, 64.59, 0.3);
  EXPECT_FALSE(engine.get_slots()[1].sun.is_up());

  // Registry order, excluded terrace dropped
  ASSERT_TRUE(engine.get_results().size() == 2);
  EXPECT_EQ(engine.get_results()[0].terrace.id, std::string("SOUTH_WALL"));
  EXPECT_EQ(engine.get_results()[1].terrace.id, std::string("OPEN"));

  const TerraceResult* wall = FindResult(engine, "SOUTH_WALL");
  ASSERT_TRUE(wall != nullptr);
  ASSERT_TRUE(wall->records.size() == 2);
  EXPECT_NEAR(wall->terrace.resolved_height.value(), 35.0, 1e-9);
  EXPECT_FALSE(wall->records[0].geometric_sunlit);
  EXPECT_FALSE(wall->records[0].is_sunlit);
  ASSERT_TRUE(wall->records[0].obstruction.has_value());
  EXPECT_NEAR(wall->records[0].obstruction->distance_m, 3.0, 1e-9);
  EXPECT_NEAR(wall->records[0].obstruction->obstruction_height_m, 60.0, 1e-9);
  EXPECT_NEAR(wall->records[0].obstruction->position.y, 53.5, 0.05);
  // Located after the parallel phase
  ASSERT_TRUE(wall->records[0].obstruction->location.has_value());
  EXPECT_TRUE(wall->records[0].obstruction->location->lat < g_fixture.south_wall.lat);
  const GeoPoint expected = PixelToWgs84(wall->records[0].obstruction->position.x,
                                         wall->records[0].obstruction->position.y);
  EXPECT_NEAR(wall->records[0].obstruction->location->lat, expected.lat, 1e-7);
  EXPECT_NEAR(wall->records[0].obstruction->location->lon, expected.lon, 1e-7);

  const TerraceResult* open = FindResult(engine, "OPEN");
  ASSERT_TRUE(open != nullptr);
  // Minimum within the 2 m buffer picks the dip
  EXPECT_NEAR(open->terrace.resolved_height.value(), 34.5, 1e-9);
  EXPECT_TRUE(open->records[0].is_sunlit);
  EXPECT_FALSE(open->records[0].obstruction.has_value());
  EXPECT_FALSE(open->records[0].coverage_limited);

  // Night slot: shaded for everyone, no ray cast
  EXPECT_FALSE(wall->records[1].is_sunlit);
  EXPECT_FALSE(open->records[1].is_sunlit);
  EXPECT_FALSE(open->records[1].obstruction.has_value());
  EXPECT_EQ(engine.get_metrics().rays_cast, static_cast<size_t>(2));

  const RunSummary& summary = engine.get_summary();
  EXPECT_EQ(summary.terraces_read, static_cast<size_t>(3));
  EXPECT_EQ(summary.terraces_classified, static_cast<size_t>(2));
  EXPECT_EQ(summary.out_of_coverage, static_cast<size_t>(1));
  EXPECT_EQ(summary.processing_errors, static_cast<size_t>(0));
  ASSERT_TRUE(summary.exclusions.size() == 1);
  EXPECT_EQ(summary.exclusions[0].terrace_id, std::string("OUTSIDE"));
  EXPECT_EQ(summary.exclusions[0].reason, std::string("out_of_coverage"));
  ASSERT_TRUE(summary.sunlit_per_slot.size() == 2);
  EXPECT_EQ(summary.sunlit_per_slot[0], static_cast<size_t>(1));
  EXPECT_EQ(summary.sunlit_per_slot[1], static_cast<size_t>(0));

  // Weather disabled: every slot keeps its geometric result
  EXPECT_EQ(summary.weather_unadjusted_slots.size(), static_cast<size_t>(2));

  EXPECT_TRUE(engine.get_output_tracker().getStage("terrace_processing") != nullptr);
}

static void TestWeatherFile()
{
  const fs::path cloudy = g_fixture.dir / "cloudy.json";
  WriteWeather(cloudy, 90.0);

  ShadeConfig config = BaseConfig();
  config.weather_source = ShadeConfig::WeatherSource::FILE;
  config.weather_file = cloudy.string();
  config.cloud_cover_threshold_pct = 75.0;

  ShadeEngine engine(config);
  ASSERT_TRUE(engine.compute());

  // 11:52 UTC reads the 12:00 sample
  EXPECT_TRUE(engine.get_slots()[0].weather_adjusted);
  EXPECT_NEAR(engine.get_slots()[0].cloud_cover_pct, 90.0, 1e-9);

  const TerraceResult* open = FindResult(engine, "OPEN");
  ASSERT_TRUE(open != nullptr);
  EXPECT_TRUE(open->records[0].geometric_sunlit);
  EXPECT_FALSE(open->records[0].is_sunlit);

  const auto& missing = engine.get_summary().weather_unadjusted_slots;
  ASSERT_TRUE(missing.size() == 1);
  EXPECT_EQ(missing[0], std::string("t2352"));

  // Clear sky never lights a geometrically shaded terrace
  const fs::path clear = g_fixture.dir / "clear.json";
  WriteWeather(clear, 0.0);
  config.weather_file = clear.string();
  ShadeEngine clear_engine(config);
  ASSERT_TRUE(clear_engine.compute());
  EXPECT_FALSE(FindResult(clear_engine, "SOUTH_WALL")->records[0].is_sunlit);
  EXPECT_TRUE(FindResult(clear_engine, "OPEN")->records[0].is_sunlit);

  // Unreadable weather: computation goes on without adjustment
  config.weather_file = (g_fixture.dir / "no_such_weather.json").string();
  ShadeEngine fallback(config);
  ASSERT_TRUE(fallback.compute());
  EXPECT_EQ(fallback.get_summary().weather_unadjusted_slots.size(), static_cast<size_t>(2));
  EXPECT_TRUE(FindResult(fallback, "OPEN")->records[0].is_sunlit);
}

static void TestDeterministicOutput()
{
  CollectionMetadata metadata;
  metadata.date = "2024-06-21";
  GeoJSONExporter::Options options;
  options.diagnostics = true;
  GeoJSONExporter exporter(options);

  ShadeConfig sequential = BaseConfig();
  sequential.parallel_processing = false;
  ShadeConfig parallel = BaseConfig();
  parallel.parallel_processing = true;
  parallel.num_threads = 2;

  ShadeEngine first(sequential);
  ShadeEngine second(parallel);
  ShadeEngine third(parallel);
  ASSERT_TRUE(first.compute());
  ASSERT_TRUE(second.compute());
  ASSERT_TRUE(third.compute());

  const std::string a = exporter.to_geojson_string(first.get_results(), first.get_slots(), metadata);
  const std::string b = exporter.to_geojson_string(second.get_results(), second.get_slots(), metadata);
  const std::string c = exporter.to_geojson_string(third.get_results(), third.get_slots(), metadata);
  EXPECT_EQ(a, b);
  EXPECT_EQ(b, c);
}

static void TestTerraceJustPastTheEdge()
{
  // One meter west of the raster: its 2 m buffer still covers column 0
  const GeoPoint edge = PixelToWgs84(-1.0, 100.5);
  const fs::path registry = g_fixture.dir / "edge.geojson";
  {
    std::ofstream out(registry);
    out << "{\"type\": \"FeatureCollection\", \"features\": [\n"
        << PointFeature("EDGE", edge) << ",\n"
        << PointFeature("OUTSIDE", g_fixture.outside) << "\n]}\n";
  }

  ShadeConfig config = BaseConfig();
  config.registry_path = registry.string();
  ShadeEngine engine(config);
  ASSERT_TRUE(engine.compute());

  ASSERT_TRUE(engine.get_results().size() == 1);
  const TerraceResult& result = engine.get_results()[0];
  EXPECT_EQ(result.terrace.id, std::string("EDGE"));
  EXPECT_NEAR(result.terrace.resolved_height.value(), 35.0, 1e-9);
  EXPECT_NEAR(result.terrace.raster_position.x, -1.0, 1e-4);

  // The ray leaves the raster at once: sunlit, flagged
  EXPECT_TRUE(result.records[0].is_sunlit);
  EXPECT_TRUE(result.records[0].coverage_limited);
  EXPECT_EQ(engine.get_summary().out_of_coverage, static_cast<size_t>(1));

  // Zero radius reads only the cell under the point, which does not exist
  config.height_buffer_radius_m = 0.0;
  ShadeEngine own_cell(config);
  ASSERT_TRUE(own_cell.compute());
  EXPECT_EQ(own_cell.get_results().size(), static_cast<size_t>(0));
  EXPECT_EQ(own_cell.get_summary().out_of_coverage, static_cast<size_t>(2));
}

static void TestZeroBufferRadius()
{
  ShadeConfig config = BaseConfig();
  config.height_buffer_radius_m = 0.0;
  EXPECT_FALSE(InputValidator().validate(config).has_errors());

  ShadeEngine engine(config);
  ASSERT_TRUE(engine.compute());
  // The dip next to OPEN is no longer within reach
  EXPECT_NEAR(FindResult(engine, "OPEN")->terrace.resolved_height.value(), 35.0, 1e-9);
  EXPECT_NEAR(FindResult(engine, "SOUTH_WALL")->terrace.resolved_height.value(), 35.0, 1e-9);

  config.height_buffer_radius_m = -1.0;
  EXPECT_TRUE(InputValidator().validate(config).has_errors());
  ShadeEngine negative(config);
  EXPECT_FALSE(negative.compute());
}

static void TestFailures()
{
  ShadeConfig bad_step = BaseConfig();
  bad_step.ray_step_m = 0.0;
  ShadeEngine invalid(bad_step);
  EXPECT_FALSE(invalid.compute());

  ShadeConfig bad_date = BaseConfig();
  bad_date.date = "2024-02-30";
  ShadeEngine invalid_date(bad_date);
  EXPECT_FALSE(invalid_date.compute());

  ShadeConfig no_dsm = BaseConfig();
  no_dsm.dsm_path = (g_fixture.dir / "missing.tif").string();
  ShadeEngine missing(no_dsm);
  bool threw = false;
  try {
    (void)missing.compute();
  } catch (const InputNotFoundError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  ShadeConfig no_registry = BaseConfig();
  no_registry.registry_path = (g_fixture.dir / "missing.geojson").string();
  ShadeEngine missing_registry(no_registry);
  threw = false;
  try {
    (void)missing_registry.compute();
  } catch (const InputNotFoundError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestExportAll()
{
  ShadeConfig config = BaseConfig();
  config.output_path = (g_fixture.dir / "out.geojson").string();
  config.records_csv_path = (g_fixture.dir / "out.csv").string();
  config.report_path = (g_fixture.dir / "report.json").string();

  ShadeEngine engine(config);
  ASSERT_TRUE(engine.compute());

  ExportOrchestrator exporter(engine);
  exporter.export_all();

  EXPECT_TRUE(fs::exists(config.output_path));
  EXPECT_TRUE(fs::exists(config.records_csv_path.value()));
  EXPECT_TRUE(fs::exists(config.report_path.value()));
  EXPECT_EQ(engine.get_output_tracker().getTrackedFiles().size(), static_cast<size_t>(3));

  std::ifstream geojson_in(config.output_path);
  const json geojson = json::parse(geojson_in);
  ASSERT_TRUE(geojson["features"].size() == 2);
  EXPECT_EQ(geojson["features"][0]["properties"]["id"].get<std::string>(), std::string("SOUTH_WALL"));
  EXPECT_FALSE(geojson["features"][0]["properties"]["t1352"].get<bool>());
  EXPECT_TRUE(geojson["features"][1]["properties"]["t1352"].get<bool>());
  EXPECT_FALSE(geojson["features"][1]["properties"]["t2352"].get<bool>());

  std::ifstream report_in(config.report_path.value());
  const json report = json::parse(report_in);
  EXPECT_EQ(report["summary"]["out_of_coverage"].get<int>(), 1);
  EXPECT_EQ(report["slots"].size(), static_cast<size_t>(2));
  EXPECT_EQ(report["slots"][0]["sunlit_terraces"].get<int>(), 1);
  EXPECT_EQ(report["exclusions"][0]["id"].get<std::string>(), std::string("OUTSIDE"));
  EXPECT_TRUE(report["timings_ms"].contains("export"));

  // Unwritable destination
  ShadeConfig unwritable = BaseConfig();
  unwritable.output_path = (g_fixture.dir / "no_such_dir" / "out.geojson").string();
  ShadeEngine second(unwritable);
  ASSERT_TRUE(second.compute());
  ExportOrchestrator failing(second);
  bool threw = false;
  try {
    failing.export_all();
  } catch (const SerializationError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

int main()
{
  Logger::setDefaultLevel(LogLevel::ERROR);

  if (!SetUpFixture()) {
    std::cerr << "shade_engine_tests: cannot create the test DSM\n";
    return 1;
  }

  TestDsmGeoreferencing();
  TestClassification();
  TestWeatherFile();
  TestDeterministicOutput();
  TestTerraceJustPastTheEdge();
  TestZeroBufferRadius();
  TestFailures();
  TestExportAll();

  std::error_code ec;
  fs::remove_all(g_fixture.dir, ec);

  return FinishTests("shade_engine_tests");
}

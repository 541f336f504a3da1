#include "LiteTest.hpp"

#include "ShadeErrors.hpp"
#include "core/SlotTable.hpp"
#include "core/SolarGeometry.hpp"
#include "core/TimeSlots.hpp"
#include "core/WeatherService.hpp"

#include <fstream>
#include <string>
#include <vector>

using namespace shade;

// 2024-06-21 07:00 UTC
static const long long kSeven = 1718953200LL;

static const char* kPayload = R"({
  "latitude": 48.86,
  "longitude": 2.36,
  "utc_offset_seconds": 7200,
  "timezone": "Europe/Paris",
  "hourly_units": {"time": "iso8601", "cloud_cover": "%"},
  "hourly": {
    "time": ["2024-06-21T08:00", "2024-06-21T09:00", "2024-06-21T10:00", "2024-06-21T11:00", "bogus"],
    "cloud_cover": [5, 20, 95, null, 50]
  }
})";

static void TestNearestHour()
{
  EXPECT_EQ(CloudCoverTable::nearest_hour(kSeven), kSeven);
  EXPECT_EQ(CloudCoverTable::nearest_hour(kSeven + 1799), kSeven);
  // Half past rounds up
  EXPECT_EQ(CloudCoverTable::nearest_hour(kSeven + 1800), kSeven + 3600);
  EXPECT_EQ(CloudCoverTable::nearest_hour(kSeven - 1800), kSeven);
  EXPECT_EQ(CloudCoverTable::nearest_hour(-1801), -3600LL);
}

static void TestCloudTable()
{
  CloudCoverTable table;
  EXPECT_TRUE(table.empty());
  table.set(kSeven, 40.0);
  table.set(kSeven + 3600, 80.0);
  EXPECT_EQ(table.size(), static_cast<size_t>(2));

  EXPECT_NEAR(table.at(kSeven + 600), 40.0, 1e-9);
  EXPECT_NEAR(table.at(kSeven + 2400), 80.0, 1e-9);
  EXPECT_FALSE(table.lookup(kSeven + 3 * 3600).has_value());

  bool threw = false;
  try {
    (void)table.at(kSeven - 7200);
  } catch (const WeatherLookupError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestFilter()
{
  WeatherFilter filter(75.0);
  EXPECT_TRUE(filter.apply(true, 0.0));
  EXPECT_TRUE(filter.apply(true, 75.0));
  EXPECT_FALSE(filter.apply(true, 90.0));
  // Clear sky never turns a shaded terrace sunlit
  EXPECT_FALSE(filter.apply(false, 0.0));

  // Raising cloud cover can only switch sunlit to shaded
  bool previous = true;
  for (int cloud = 0; cloud <= 100; cloud += 5) {
    const bool now = filter.apply(true, cloud);
    EXPECT_FALSE(now && !previous);
    previous = now;
  }

  WeatherFilter strict(0.0);
  EXPECT_TRUE(strict.apply(true, 0.0));
  EXPECT_FALSE(strict.apply(true, 1.0));
}

static void TestParseResponse()
{
  const CloudCoverTable table = WeatherService::parse_response(kPayload);
  // Null sample and malformed time are skipped
  EXPECT_EQ(table.size(), static_cast<size_t>(3));

  // Local 09:00 at +02:00 is 07:00 UTC
  EXPECT_NEAR(table.at(kSeven), 20.0, 1e-9);
  EXPECT_NEAR(table.at(kSeven - 3600), 5.0, 1e-9);
  EXPECT_NEAR(table.at(kSeven + 3600), 95.0, 1e-9);
  EXPECT_FALSE(table.lookup(kSeven + 7200).has_value());

  auto rejects = [](const std::string& text) {
    try {
      (void)WeatherService::parse_response(text);
    } catch (const WeatherLookupError&) {
      return true;
    }
    return false;
  };
  EXPECT_TRUE(rejects("{not json"));
  EXPECT_TRUE(rejects(R"({"error": true, "reason": "Latitude must be in range"})"));
  EXPECT_TRUE(rejects(R"({"latitude": 48.8})"));
  EXPECT_TRUE(rejects(R"({"hourly": {"time": ["2024-06-21T09:00"], "cloud_cover": [null]}})"));
}

static void TestLoadFile()
{
  const fs::path path = MakeTempPath("shade_weather").replace_extension(".json");
  {
    std::ofstream out(path);
    out << kPayload;
  }
  const CloudCoverTable table = WeatherService::load_file(path.string());
  EXPECT_EQ(table.size(), static_cast<size_t>(3));

  std::error_code ec;
  fs::remove(path, ec);

  bool threw = false;
  try {
    (void)WeatherService::load_file(path.string());
  } catch (const WeatherLookupError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

static void TestBuildUrl()
{
  WeatherService::Options options;
  options.api_url = "http://localhost:8080/v1/forecast";
  WeatherService service(options);

  const std::string url = service.build_url(GeoPoint(48.8566, 2.3522), CivilDate(2024, 6, 21));
  EXPECT_EQ(url.rfind("http://localhost:8080/v1/forecast?", 0), static_cast<size_t>(0));
  EXPECT_NE(url.find("latitude=48.8566"), std::string::npos);
  EXPECT_NE(url.find("longitude=2.3522"), std::string::npos);
  EXPECT_NE(url.find("hourly=cloud_cover"), std::string::npos);
  EXPECT_NE(url.find("start_date=2024-06-20"), std::string::npos);
  EXPECT_NE(url.find("end_date=2024-06-22"), std::string::npos);
}

static void TestSlotTable()
{
  const CivilDate date(2024, 6, 21);
  const UtcOffsetRule paris = UtcOffsetRule::parse("Europe/Paris");
  const auto slots = build_time_slots("09:00", "10:00", 30);
  SolarGeometry solar;
  const GeoPoint reference(48.8566, 2.3522);

  CloudCoverTable clouds;
  clouds.set(kSeven, 20.0);

  const auto table = SlotTable::build(date, paris, slots, solar, reference, &clouds);
  ASSERT_TRUE(table.size() == 3);
  EXPECT_EQ(table[0].utc_seconds, kSeven);
  EXPECT_EQ(table[1].utc_seconds, kSeven + 1800);
  EXPECT_NEAR(table[0].sun.azimuth_deg, 86.0, 1.0);
  EXPECT_TRUE(table[0].weather_adjusted);
  EXPECT_NEAR(table[0].cloud_cover_pct, 20.0, 1e-9);

  // 07:30 UTC rounds to 08:00 which has no sample
  EXPECT_FALSE(table[1].weather_adjusted);
  EXPECT_NEAR(table[1].cloud_cover_pct, 0.0, 1e-9);

  const auto missing = SlotTable::weather_unadjusted_keys(table);
  ASSERT_TRUE(missing.size() == 2);
  EXPECT_EQ(missing[0], std::string("t0930"));
  EXPECT_EQ(missing[1], std::string("t1000"));

  // Without any weather source every slot is unadjusted
  const auto bare = SlotTable::build(date, paris, slots, solar, reference, nullptr);
  EXPECT_EQ(SlotTable::weather_unadjusted_keys(bare).size(), static_cast<size_t>(3));
}

int main()
{
  TestNearestHour();
  TestCloudTable();
  TestFilter();
  TestParseResponse();
  TestLoadFile();
  TestBuildUrl();
  TestSlotTable();

  return FinishTests("shade_weather_tests");
}

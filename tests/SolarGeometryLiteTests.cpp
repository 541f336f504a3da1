#include "LiteTest.hpp"

#include "core/SolarGeometry.hpp"

using namespace shade;

static const GeoPoint kParis(48.8566, 2.3522);

static void TestJulianDay()
{
  EXPECT_NEAR(SolarGeometry::julian_day(0), 2440587.5, 1e-9);
  // J2000.0 epoch, 2000-01-01 12:00 UTC
  EXPECT_NEAR(SolarGeometry::julian_day(946728000LL), 2451545.0, 1e-9);
  EXPECT_NEAR(SolarGeometry::julian_century(2451545.0), 0.0, 1e-12);
}

static void TestSolsticeNoon()
{
  SolarGeometry solar;
  const long long solar_noon = 1718970720LL;  // 2024-06-21 11:52 UTC

  const SunPosition sun = solar.compute(kParis, solar_noon);
  EXPECT_NEAR(sun.altitude_deg, 64.59, 0.3);
  EXPECT_NEAR(sun.azimuth_deg, 180.0, 1.5);
  EXPECT_TRUE(sun.is_up());

  const double t = SolarGeometry::julian_century(SolarGeometry::julian_day(solar_noon));
  EXPECT_NEAR(SolarGeometry::declination(t), 23.44, 0.05);
  EXPECT_NEAR(SolarGeometry::equation_of_time(t), -1.92, 0.2);
}

static void TestMorningAndEvening()
{
  SolarGeometry solar;

  // 09:00 CEST: sun low in the east
  const SunPosition morning = solar.compute(kParis, 1718953200LL);
  EXPECT_NEAR(morning.azimuth_deg, 86.0, 1.0);
  EXPECT_NEAR(morning.altitude_deg, 28.38, 0.3);

  // 19:00 CEST: sun in the west
  const SunPosition evening = solar.compute(kParis, 1718989200LL);
  EXPECT_NEAR(evening.azimuth_deg, 276.7, 1.0);
  EXPECT_NEAR(evening.altitude_deg, 25.93, 0.3);

  // Azimuth stays in [0, 360)
  for (long long t = 1718928000LL; t < 1718928000LL + 86400; t += 1800) {
    const SunPosition sun = solar.compute(kParis, t);
    EXPECT_TRUE(sun.azimuth_deg >= 0.0 && sun.azimuth_deg < 360.0);
    EXPECT_TRUE(sun.altitude_deg >= -90.0 && sun.altitude_deg <= 90.0);
  }
}

static void TestNightIsBelowHorizon()
{
  SolarGeometry solar;
  const SunPosition midnight = solar.compute(kParis, 1718928000LL);  // 02:00 CEST
  EXPECT_TRUE(midnight.altitude_deg < 0.0);
  EXPECT_FALSE(midnight.is_up());
}

static void TestSeasons()
{
  SolarGeometry solar;
  const SunPosition winter = solar.compute(kParis, 1734782400LL);   // 2024-12-21 12:00 UTC
  const SunPosition equinox = solar.compute(kParis, 1710936000LL);  // 2024-03-20 12:00 UTC
  EXPECT_NEAR(winter.altitude_deg, 17.71, 0.3);
  EXPECT_NEAR(equinox.altitude_deg, 41.31, 0.3);
  EXPECT_TRUE(winter.altitude_deg < equinox.altitude_deg);
}

static void TestRefraction()
{
  EXPECT_NEAR(SolarGeometry::refraction_correction(0.0), 0.482, 0.001);
  EXPECT_NEAR(SolarGeometry::refraction_correction(10.0), 0.0881, 0.001);
  EXPECT_NEAR(SolarGeometry::refraction_correction(89.0), 0.0, 1e-12);
  EXPECT_TRUE(SolarGeometry::refraction_correction(30.0) < SolarGeometry::refraction_correction(5.5));

  SolarGeometry::Options options;
  options.apply_refraction = false;
  SolarGeometry geometric(options);
  SolarGeometry apparent;

  const long long t = 1718953200LL;
  const double raw = geometric.compute(kParis, t).altitude_deg;
  const double corrected = apparent.compute(kParis, t).altitude_deg;
  EXPECT_NEAR(raw, 28.35, 0.3);
  EXPECT_TRUE(corrected > raw);
  EXPECT_NEAR(corrected - raw, 0.03, 0.01);
}

int main()
{
  TestJulianDay();
  TestSolsticeNoon();
  TestMorningAndEvening();
  TestNightIsBelowHorizon();
  TestSeasons();
  TestRefraction();

  return FinishTests("shade_solar_geometry_tests");
}

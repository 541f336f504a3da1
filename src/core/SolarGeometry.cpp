/**
 * @file SolarGeometry.cpp
 * @brief Implementation of the NOAA solar position equations
 */

#include "SolarGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace shade {

namespace {

constexpr double kPi = 3.14159265358979323846;

double rad(double deg) { return deg * kPi / 180.0; }
double deg(double r) { return r * 180.0 / kPi; }

double wrap_degrees(double value) {
    value = std::fmod(value, 360.0);
    return value < 0.0 ? value + 360.0 : value;
}

double geom_mean_longitude(double t) {
    return wrap_degrees(280.46646 + t * (36000.76983 + t * 0.0003032));
}

double geom_mean_anomaly(double t) {
    return 357.52911 + t * (35999.05029 - 0.0001537 * t);
}

double orbit_eccentricity(double t) {
    return 0.016708634 - t * (0.000042037 + 0.0000001267 * t);
}

double equation_of_center(double t) {
    const double m = rad(geom_mean_anomaly(t));
    return std::sin(m) * (1.914602 - t * (0.004817 + 0.000014 * t)) +
           std::sin(2.0 * m) * (0.019993 - 0.000101 * t) +
           std::sin(3.0 * m) * 0.000289;
}

double apparent_longitude(double t) {
    const double true_longitude = geom_mean_longitude(t) + equation_of_center(t);
    return true_longitude - 0.00569 - 0.00478 * std::sin(rad(125.04 - 1934.136 * t));
}

double obliquity_correction(double t) {
    const double mean_obliquity =
        23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
    return mean_obliquity + 0.00256 * std::cos(rad(125.04 - 1934.136 * t));
}

} // namespace

SolarGeometry::SolarGeometry()
    : options_() {}

SolarGeometry::SolarGeometry(const Options& options)
    : options_(options) {}

double SolarGeometry::julian_day(long long utc_seconds) {
    return static_cast<double>(utc_seconds) / 86400.0 + 2440587.5;
}

double SolarGeometry::julian_century(double jd) {
    return (jd - 2451545.0) / 36525.0;
}

double SolarGeometry::declination(double t) {
    const double sin_decl = std::sin(rad(obliquity_correction(t))) * std::sin(rad(apparent_longitude(t)));
    return deg(std::asin(sin_decl));
}

double SolarGeometry::equation_of_time(double t) {
    const double epsilon = obliquity_correction(t);
    const double l0 = rad(geom_mean_longitude(t));
    const double e = orbit_eccentricity(t);
    const double m = rad(geom_mean_anomaly(t));

    double y = std::tan(rad(epsilon / 2.0));
    y *= y;

    const double eq = y * std::sin(2.0 * l0) - 2.0 * e * std::sin(m) +
                      4.0 * e * y * std::sin(m) * std::cos(2.0 * l0) -
                      0.5 * y * y * std::sin(4.0 * l0) - 1.25 * e * e * std::sin(2.0 * m);
    return 4.0 * deg(eq);
}

double SolarGeometry::refraction_correction(double altitude_deg) {
    if (altitude_deg > 85.0) {
        return 0.0;
    }

    const double te = std::tan(rad(altitude_deg));
    double arcsec;
    if (altitude_deg > 5.0) {
        arcsec = 58.1 / te - 0.07 / (te * te * te) + 0.000086 / std::pow(te, 5);
    } else if (altitude_deg > -0.575) {
        arcsec = 1735.0 + altitude_deg * (-518.2 + altitude_deg * (103.4 + altitude_deg * (-12.79 + altitude_deg * 0.711)));
    } else {
        arcsec = -20.774 / te;
    }
    return arcsec / 3600.0;
}

SunPosition SolarGeometry::compute(const GeoPoint& location, long long utc_seconds) const {
    const double t = julian_century(julian_day(utc_seconds));
    const double decl = declination(t);
    const double eq_time = equation_of_time(t);

    long long second_of_day = utc_seconds % 86400;
    if (second_of_day < 0) {
        second_of_day += 86400;
    }
    const double minutes_utc = static_cast<double>(second_of_day) / 60.0;

    const double true_solar_time = std::fmod(minutes_utc + eq_time + 4.0 * location.lon + 1440.0, 1440.0);
    double hour_angle = true_solar_time / 4.0 - 180.0;
    if (hour_angle < -180.0) {
        hour_angle += 360.0;
    }

    const double lat_r = rad(location.lat);
    const double decl_r = rad(decl);
    const double cos_zenith = std::clamp(
        std::sin(lat_r) * std::sin(decl_r) + std::cos(lat_r) * std::cos(decl_r) * std::cos(rad(hour_angle)),
        -1.0, 1.0);
    const double zenith = deg(std::acos(cos_zenith));

    double azimuth;
    const double denom = std::cos(lat_r) * std::sin(rad(zenith));
    if (std::abs(denom) < 1e-12) {
        // Sun at zenith or observer at a pole
        azimuth = location.lat > 0.0 ? 180.0 : 0.0;
    } else {
        const double cos_az = std::clamp((std::sin(lat_r) * cos_zenith - std::sin(decl_r)) / denom, -1.0, 1.0);
        const double az = deg(std::acos(cos_az));
        azimuth = hour_angle > 0.0 ? wrap_degrees(az + 180.0) : wrap_degrees(540.0 - az);
    }

    double altitude = 90.0 - zenith;
    if (options_.apply_refraction) {
        altitude += refraction_correction(altitude);
    }

    return SunPosition(azimuth, altitude);
}

} // namespace shade

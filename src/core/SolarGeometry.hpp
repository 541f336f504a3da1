/**
 * @file SolarGeometry.hpp
 * @brief Sun azimuth and altitude from the NOAA solar position equations
 */

#pragma once

#include "terrace_shade.hpp"

namespace shade {

/**
 * @brief Pure solar position calculator
 *
 * Implements the NOAA formulation (Julian century, geometric mean longitude
 * and anomaly, equation of center, obliquity, declination, equation of time
 * and hour angle). Accuracy is well below the DSM cell angular size for
 * dates within a few centuries of J2000.
 */
class SolarGeometry {
public:
    struct Options {
        bool apply_refraction;   ///< Add standard atmospheric refraction to the altitude

        Options() : apply_refraction(true) {}
    };

    SolarGeometry();
    explicit SolarGeometry(const Options& options);

    /**
     * @brief Sun position seen from a location at a UTC instant
     * @param location Observer location
     * @param utc_seconds Seconds since the Unix epoch
     * @return Azimuth (clockwise from north, [0, 360)) and altitude in degrees
     */
    SunPosition compute(const GeoPoint& location, long long utc_seconds) const;

    static double julian_day(long long utc_seconds);
    static double julian_century(double julian_day);

    /// Solar declination in degrees
    static double declination(double julian_century);

    /// Equation of time in minutes
    static double equation_of_time(double julian_century);

    /// Refraction correction in degrees for a geometric altitude
    static double refraction_correction(double altitude_deg);

private:
    Options options_;
};

} // namespace shade

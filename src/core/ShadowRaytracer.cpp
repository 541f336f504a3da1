/**
 * @file ShadowRaytracer.cpp
 * @brief DSM ray marching
 */

#include "ShadowRaytracer.hpp"
#include "DsmRaster.hpp"
#include "Logger.hpp"
#include <cmath>
#include <sstream>

namespace shade {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

ShadowRaytracer::ShadowRaytracer(const DsmRaster& dsm)
    : ShadowRaytracer(dsm, Options()) {}

ShadowRaytracer::ShadowRaytracer(const DsmRaster& dsm, const Options& options)
    : dsm_(dsm), options_(options),
      tracing_(Logger("ShadowRaytracer").shouldOutput(LogLevel::TRACE)) {}

RayTraceResult ShadowRaytracer::trace(const RasterPoint& origin, double origin_height_m,
                                      const SunPosition& sun) const {
    RayTraceResult result;
    if (!sun.is_up()) {
        return result;
    }

    const double slope = std::tan(sun.altitude_deg * kPi / 180.0);
    const RasterPoint step = dsm_.step_vector(sun.azimuth_deg, options_.step_m);
    const long long max_steps = static_cast<long long>(std::floor(options_.max_distance_m / options_.step_m + 1e-9));
    const double max_height = dsm_.max_height();

    for (long long k = 1; k <= max_steps; ++k) {
        const double distance = static_cast<double>(k) * options_.step_m;
        const double ray_height = origin_height_m + distance * slope;

        // Nothing in the raster can reach the ray any more
        if (ray_height > max_height) {
            break;
        }

        const RasterPoint position(origin.x + static_cast<double>(k) * step.x,
                                   origin.y + static_cast<double>(k) * step.y);
        if (!dsm_.contains(position)) {
            result.coverage_limited = true;
            break;
        }

        result.steps++;
        auto surface = dsm_.sample(position);
        if (!surface) {
            result.coverage_limited = true;
            continue;
        }

        if (tracing_) {
            std::ostringstream msg;
            msg << "d=" << distance << " ray=" << ray_height << " dsm=" << *surface;
            Logger("ShadowRaytracer").trace(msg.str());
        }

        if (*surface >= ray_height) {
            Obstruction obstruction;
            obstruction.distance_m = distance;
            obstruction.obstruction_height_m = *surface;
            obstruction.ray_height_m = ray_height;
            obstruction.position = position;
            if (options_.locate_obstructions) {
                obstruction.location = dsm_.to_geo(position);
            }
            result.obstruction = obstruction;
            result.sunlit = false;
            return result;
        }
    }

    result.sunlit = true;
    return result;
}

RayTraceResult ShadowRaytracer::trace(const Terrace& terrace, const SunPosition& sun) const {
    if (!terrace.resolved_height) {
        return RayTraceResult();
    }
    return trace(terrace.raster_position, *terrace.resolved_height, sun);
}

} // namespace shade

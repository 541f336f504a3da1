/**
 * @file ShadowRaytracer.hpp
 * @brief Marches a sun ray across the DSM to detect obstructions
 */

#pragma once

#include "terrace_shade.hpp"
#include <optional>

namespace shade {

class DsmRaster;

/**
 * @brief Outcome of one ray march
 */
struct RayTraceResult {
    bool sunlit = false;
    bool coverage_limited = false;          ///< Ray left the DSM or crossed nodata
    std::optional<Obstruction> obstruction; ///< First blocking cell, if any
    size_t steps = 0;                       ///< Samples taken
};

/**
 * @brief Fixed-step shadow raytracer
 *
 * From the terrace, steps toward the sun azimuth and compares the DSM with
 * the height of the sun ray at each distance. The first sample whose height
 * reaches the ray (equality included) shades the terrace.
 *
 * With locate_obstructions off, trace() never uses the DSM coordinate
 * transformations and may run concurrently on a shared DSM.
 */
class ShadowRaytracer {
public:
    struct Options {
        double step_m;           ///< Horizontal step length
        double max_distance_m;   ///< March stops here when nothing blocks
        bool locate_obstructions; ///< Fill Obstruction::location through the DSM reference

        Options() : step_m(1.0), max_distance_m(300.0), locate_obstructions(true) {}
    };

    explicit ShadowRaytracer(const DsmRaster& dsm);
    ShadowRaytracer(const DsmRaster& dsm, const Options& options);

    /**
     * @brief Trace from a raster position at a given ground height
     *
     * A sun at or below the horizon returns shaded without marching.
     */
    RayTraceResult trace(const RasterPoint& origin, double origin_height_m, const SunPosition& sun) const;

    /// Trace from a resolved terrace; shaded without marching if unresolved
    RayTraceResult trace(const Terrace& terrace, const SunPosition& sun) const;

    const Options& options() const { return options_; }

private:
    const DsmRaster& dsm_;
    Options options_;
    bool tracing_;
};

} // namespace shade

/**
 * @file HeightResolver.hpp
 * @brief Ground height of a terrace from the DSM
 */

#pragma once

#include "terrace_shade.hpp"

namespace shade {

class DsmRaster;

/**
 * @brief Resolves a terrace height as the minimum DSM value around its point
 *
 * A point placed on an awning or a facade edge picks up the building height;
 * the lowest cell within a small buffer is the street surface instead.
 */
class HeightResolver {
public:
    struct Options {
        double buffer_radius_m;   ///< Cells whose centers lie within this distance are candidates

        Options() : buffer_radius_m(2.0) {}
    };

    explicit HeightResolver(const DsmRaster& dsm);
    HeightResolver(const DsmRaster& dsm, const Options& options);

    /**
     * @brief Minimum valid height within the buffer
     *
     * Falls back to the cell containing the point when no cell center lies
     * within the radius.
     *
     * The point itself may lie outside the grid as long as part of its
     * buffer is covered.
     *
     * @throws OutOfCoverageError if no valid cell lies within the buffer
     */
    double resolve(const RasterPoint& position) const;

    /**
     * @brief Locate and resolve a terrace, filling resolved_height and raster_position
     * @throws OutOfCoverageError as resolve()
     */
    void resolve(Terrace& terrace) const;

    /**
     * @brief Resolve a terrace already mapped to raster coordinates
     *
     * Does not touch the DSM coordinate transformations, so it is safe to
     * call from several threads at once.
     */
    void resolve(Terrace& terrace, const RasterPoint& position) const;

private:
    const DsmRaster& dsm_;
    Options options_;
    bool debug_;
};

} // namespace shade

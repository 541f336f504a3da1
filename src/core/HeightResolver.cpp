/**
 * @file HeightResolver.cpp
 * @brief Minimum-in-buffer terrace height
 */

#include "HeightResolver.hpp"
#include "DsmRaster.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>

namespace shade {

HeightResolver::HeightResolver(const DsmRaster& dsm)
    : HeightResolver(dsm, Options()) {}

HeightResolver::HeightResolver(const DsmRaster& dsm, const Options& options)
    : dsm_(dsm), options_(options),
      debug_(Logger("HeightResolver").shouldOutput(LogLevel::DEBUG)) {}

double HeightResolver::resolve(const RasterPoint& position) const {
    // Search window: enough cells to cover the radius on both axes, clamped to the grid.
    // A point just past the edge still resolves from the covered part of its buffer.
    const double cell_m = std::max(dsm_.cell_size_m(), 1e-6);
    const int reach = static_cast<int>(std::ceil(options_.buffer_radius_m / cell_m)) + 1;

    std::optional<double> minimum;
    const int row0 = std::max(0, position.row() - reach);
    const int row1 = std::min(dsm_.height() - 1, position.row() + reach);
    const int col0 = std::max(0, position.col() - reach);
    const int col1 = std::min(dsm_.width() - 1, position.col() + reach);
    for (int row = row0; row <= row1; ++row) {
        for (int col = col0; col <= col1; ++col) {
            const RasterPoint cell_center(col + 0.5, row + 0.5);
            if (dsm_.ground_distance_m(position, cell_center) > options_.buffer_radius_m) {
                continue;
            }
            auto value = dsm_.cell_value(col, row);
            if (value && (!minimum || *value < *minimum)) {
                minimum = value;
            }
        }
    }

    if (!minimum) {
        minimum = dsm_.sample(position);
    }
    if (!minimum) {
        std::ostringstream msg;
        msg << "no valid DSM height around (" << position.x << ", " << position.y << ")";
        throw OutOfCoverageError(msg.str());
    }
    return *minimum;
}

void HeightResolver::resolve(Terrace& terrace) const {
    auto position = dsm_.to_raster(terrace.location);
    if (!position) {
        throw OutOfCoverageError("terrace " + terrace.id + " cannot be mapped into the DSM");
    }
    resolve(terrace, *position);
}

void HeightResolver::resolve(Terrace& terrace, const RasterPoint& position) const {
    terrace.resolved_height = resolve(position);
    terrace.raster_position = position;

    if (debug_) {
        std::ostringstream msg;
        msg << "Terrace " << terrace.id << " height " << *terrace.resolved_height << " m";
        Logger("HeightResolver").debug(msg.str());
    }
}

} // namespace shade

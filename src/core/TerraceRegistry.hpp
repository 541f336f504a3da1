/**
 * @file TerraceRegistry.hpp
 * @brief Loads the terrace registry (GeoJSON, Shapefile, GeoPackage, CSV) through OGR
 */

#pragma once

#include "terrace_shade.hpp"
#include <string>
#include <vector>

namespace shade {

/**
 * @brief Reads terrace identifiers and WGS84 locations from a vector file
 *
 * Point features are used as-is, polygon footprints are reduced to their
 * centroid. Layers in another spatial reference are transformed to WGS84.
 * Duplicate identifiers keep the first feature.
 */
class TerraceRegistry {
public:
    struct Options {
        std::string id_field;   ///< Attribute holding the terrace id, FID when absent

        Options() : id_field("id") {}
    };

    struct LoadReport {
        size_t features_read = 0;
        size_t duplicate_ids = 0;
        size_t invalid_geometries = 0;
    };

    TerraceRegistry();
    explicit TerraceRegistry(const Options& options);

    /**
     * @brief Load every terrace of the first layer, in file order
     * @throws InputNotFoundError if the file is missing or not a readable vector dataset
     */
    std::vector<Terrace> load(const std::string& path);

    const LoadReport& report() const { return report_; }

    /// WGS84 bounds of a terrace set (x = lon, y = lat)
    static BoundingBox bounds(const std::vector<Terrace>& terraces);

private:
    Options options_;
    LoadReport report_;
};

} // namespace shade

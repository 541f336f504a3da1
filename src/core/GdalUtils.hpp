#pragma once

/**
 * @file GdalUtils.hpp
 * @brief RAII handles for GDAL/OGR objects
 */

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <memory>
#include <mutex>

namespace shade {

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

struct OGRFeatureDeleter {
    void operator()(OGRFeature* feature) const {
        OGRFeature::DestroyFeature(feature);
    }
};

using OGRFeaturePtr = std::unique_ptr<OGRFeature, OGRFeatureDeleter>;

/// Register GDAL drivers once per process
inline void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, [] { GDALAllRegister(); });
}

} // namespace shade

/**
 * @file RunReportExporter.hpp
 * @brief JSON run report: exclusion counts, per-slot conditions, timings
 */

#pragma once

#include "terrace_shade.hpp"
#include <string>

namespace shade {

/**
 * @brief Serializes the outcome of one engine run
 */
class RunReportExporter {
public:
    /**
     * @throws SerializationError if the file cannot be written
     */
    static void export_report(const ShadeEngine& engine, const std::string& filename);

    static std::string to_json_string(const ShadeEngine& engine);
};

} // namespace shade

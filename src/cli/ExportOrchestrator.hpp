/**
 * @file ExportOrchestrator.hpp
 * @brief Orchestrates writing the results of a sunlight run
 *
 * Keeps export decisions out of the engine: ShadeCore computes,
 * ShadeExport serializes, and this class decides which files to write.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "terrace_shade.hpp"
#include "../core/Logger.hpp"
#include <string>

namespace shade {

/**
 * @brief Writes the GeoJSON collection and the optional CSV and run report
 */
class ExportOrchestrator {
public:
    /**
     * @param engine Engine that has completed compute(); its output tracker
     *               records every written file
     */
    explicit ExportOrchestrator(ShadeEngine& engine);
    ~ExportOrchestrator();

    /**
     * @brief Write every configured output
     * @throws SerializationError on the first file that cannot be written
     */
    void export_all();

private:
    ShadeEngine& engine_;
    Logger logger_;

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
    ExportOrchestrator(ExportOrchestrator&&) = delete;
    ExportOrchestrator& operator=(ExportOrchestrator&&) = delete;
};

} // namespace shade

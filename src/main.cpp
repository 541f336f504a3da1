/**
 * @file main.cpp
 * @brief Main entry point for the terrace sunlight engine
 *
 * Computes, for one day, which terraces are sunlit at each time slot and
 * writes the result as a GeoJSON FeatureCollection. With --results it
 * answers viewport, nearby and id lookups against a produced file instead.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "terrace_shade.hpp"
#include "ShadeErrors.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/OutputTracker.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "version.h"
#include <chrono>
#include <iostream>
#include <memory>

using namespace shade;

namespace {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERIC = 1;
constexpr int EXIT_INPUT_NOT_FOUND = 2;
constexpr int EXIT_SERIALIZATION = 3;

/**
 * @brief Print configuration summary
 */
void print_configuration(const ShadeConfig& config) {
    std::cout << "\n=== Terrace Shade Configuration ===\n";
    std::cout << "DSM: " << config.dsm_path << "\n";
    std::cout << "Terraces: " << config.registry_path << "\n";
    std::cout << "Date: " << (config.date.empty() ? std::string("today") : config.date)
              << " (" << config.timezone << ")\n";
    std::cout << "Slots: " << config.slot_start << "-" << config.slot_end
              << " every " << config.slot_interval_minutes << " min\n";
    std::cout << "Ray step / max distance: " << config.ray_step_m << "m / "
              << config.max_ray_distance_m << "m\n";
    std::cout << "Cloud cover threshold: " << config.cloud_cover_threshold_pct << "%\n";
    std::cout << "Parallel processing: "
              << (config.parallel_processing ? "enabled" : "disabled") << "\n";
    if (config.parallel_processing && config.num_threads > 0) {
        std::cout << "Threads: " << config.num_threads << "\n";
    }
    std::cout << "Output: " << config.output_path << "\n";
    std::cout << "===================================\n\n";
}

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Input loading: " << metrics.input_loading_time.count() << "ms\n";
    std::cout << "Slot table: " << metrics.slot_table_time.count() << "ms\n";
    std::cout << "Terrace processing: " << metrics.processing_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Rays cast: " << metrics.rays_cast << "\n";
    std::cout << "Ray steps: " << metrics.ray_steps << "\n";
    std::cout << "============================\n";
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            // Help, version or create-config, unless the command line was bad
            return cli.has_error() ? EXIT_FAILURE_GENERIC : EXIT_OK;
        }

        const ShadeConfig& config = cli.get_config();

        if (config.log_file && !Logger::setGlobalLogFile(config.log_file)) {
            std::cerr << "Warning: Could not open log file " << config.log_file.value() << "\n";
        }

        if (cli.is_query_mode()) {
            cli.run_query(std::cout);
            return EXIT_OK;
        }

        // Print banner only if not silent
        if (config.log_level > 0) {
            std::cout << "TerraceShade v" << SHADE_VERSION_STRING << "\n";
        }

        if (config.log_level >= 4) {
            print_configuration(config);
        }

        if (cli.is_dry_run()) {
            InputValidator validator;
            auto validation = validator.validate(config);
            if (validation.has_errors()) {
                std::cerr << validation.format_error_message();
                return EXIT_FAILURE_GENERIC;
            }
            if (config.log_level > 0) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return EXIT_OK;
        }

        auto engine = std::make_unique<ShadeEngine>(config);
        if (!engine->compute()) {
            std::cerr << "Error: Sunlight computation failed\n";
            return EXIT_FAILURE_GENERIC;
        }

        ExportOrchestrator exporter(*engine);
        exporter.export_all();

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (config.log_level >= 4) {
            print_performance_summary(engine->get_metrics());
            engine->get_output_tracker().printDetailedReport();
        } else {
            engine->get_output_tracker().printSummary();
        }

        if (config.log_level > 0) {
            const auto& summary = engine->get_summary();
            std::cout << "\nClassified " << summary.terraces_classified << " of "
                      << summary.terraces_read << " terraces in "
                      << total_duration.count() << "ms\n";
        }

        return EXIT_OK;

    } catch (const InputNotFoundError& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_INPUT_NOT_FOUND;
    } catch (const SerializationError& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_SERIALIZATION;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_FAILURE_GENERIC;
    }
}

/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "ShadeErrors.hpp"
#include "../core/OutputTracker.hpp"
#include "../export/GeoJSONExporter.hpp"
#include "../export/RecordTableExporter.hpp"
#include "../export/RunReportExporter.hpp"

namespace shade {

ExportOrchestrator::ExportOrchestrator(ShadeEngine& engine)
    : engine_(engine)
    , logger_("ExportOrchestrator")
{
}

ExportOrchestrator::~ExportOrchestrator() = default;

void ExportOrchestrator::export_all() {
    const auto& config = engine_.get_config();
    auto& tracker = engine_.get_output_tracker();

    tracker.startStage("export");

    try {
        GeoJSONExporter::Options geojson_options;
        geojson_options.pretty_print = config.pretty_print;
        geojson_options.precision = config.coordinate_precision;
        geojson_options.diagnostics = config.diagnostics;

        CollectionMetadata metadata;
        metadata.date = engine_.get_date();
        metadata.timezone = config.timezone;
        metadata.cloud_cover_threshold = config.cloud_cover_threshold_pct;
        metadata.weather_unadjusted_slots = engine_.get_summary().weather_unadjusted_slots;

        GeoJSONExporter geojson(geojson_options);
        geojson.export_geojson(engine_.get_results(), engine_.get_slots(), metadata, config.output_path);
        tracker.trackGeneratedFile(config.output_path, "geojson");
        logger_.info("Wrote " + std::to_string(engine_.get_results().size()) + " terraces to " + config.output_path);

        if (config.records_csv_path) {
            RecordTableExporter::Options csv_options;
            csv_options.precision = config.coordinate_precision;
            RecordTableExporter csv(csv_options);
            csv.export_csv(engine_.get_results(), engine_.get_slots(), engine_.get_date(),
                           config.records_csv_path.value());
            tracker.trackGeneratedFile(config.records_csv_path.value(), "csv");
            logger_.info("Wrote record table to " + config.records_csv_path.value());
        }

        tracker.addStageData("export", "files", std::to_string(tracker.getTrackedFiles().size()));
        tracker.completeStage("export");
    } catch (const SerializationError& e) {
        tracker.completeStage("export", false, e.what());
        throw;
    }

    // Written last so its timings include the export stage
    if (config.report_path) {
        RunReportExporter::export_report(engine_, config.report_path.value());
        tracker.trackGeneratedFile(config.report_path.value(), "json");
        logger_.info("Wrote run report to " + config.report_path.value());
    }
}

} // namespace shade

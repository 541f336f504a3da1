/**
 * @file RunReportExporter.cpp
 * @brief Implementation of the JSON run report
 */

#include "RunReportExporter.hpp"
#include "AtomicFileWriter.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputTracker.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shade {

std::string RunReportExporter::to_json_string(const ShadeEngine& engine) {
    const ShadeConfig& config = engine.get_config();
    const RunSummary& summary = engine.get_summary();
    const PerformanceMetrics& metrics = engine.get_metrics();
    const auto& slots = engine.get_slots();

    json report;
    report["date"] = engine.get_date();
    report["timezone"] = config.timezone;
    report["cloud_cover_threshold"] = config.cloud_cover_threshold_pct;

    report["summary"] = {
        {"terraces_read", summary.terraces_read},
        {"terraces_classified", summary.terraces_classified},
        {"out_of_coverage", summary.out_of_coverage},
        {"processing_error", summary.processing_errors},
        {"duplicate_id", summary.duplicate_ids},
        {"invalid_geometry", summary.invalid_geometries},
        {"weather_unadjusted_slots", summary.weather_unadjusted_slots}};

    json slot_rows = json::array();
    for (size_t i = 0; i < slots.size(); ++i) {
        const SlotConditions& conditions = slots[i];
        json row = {
            {"key", conditions.slot.key()},
            {"time", conditions.slot.label()},
            {"utc_seconds", conditions.utc_seconds},
            {"sun_azimuth", conditions.sun.azimuth_deg},
            {"sun_altitude", conditions.sun.altitude_deg},
            {"cloud_cover", conditions.cloud_cover_pct},
            {"weather_adjusted", conditions.weather_adjusted}};
        row["sunlit_terraces"] = i < summary.sunlit_per_slot.size() ? summary.sunlit_per_slot[i] : 0;
        slot_rows.push_back(row);
    }
    report["slots"] = slot_rows;

    json exclusions = json::array();
    for (const auto& exclusion : summary.exclusions) {
        exclusions.push_back({
            {"id", exclusion.terrace_id},
            {"reason", exclusion.reason},
            {"message", exclusion.message}});
    }
    report["exclusions"] = exclusions;

    json timings = json::object();
    for (const auto& stage : engine.get_output_tracker().getStages()) {
        if (stage.completed) {
            timings[stage.stage_name] = stage.duration().count();
        }
    }
    timings["total"] = metrics.total_time.count();
    report["timings_ms"] = timings;

    report["rays_cast"] = metrics.rays_cast;
    report["ray_steps"] = metrics.ray_steps;

    return report.dump(2) + "\n";
}

void RunReportExporter::export_report(const ShadeEngine& engine, const std::string& filename) {
    Logger logger("RunReportExporter");
    AtomicFileWriter::write(filename, to_json_string(engine));
    logger.info("Exported run report: " + filename);
}

} // namespace shade

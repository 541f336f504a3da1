/**
 * @file RecordTableExporter.cpp
 * @brief Implementation of the CSV records table
 */

#include "RecordTableExporter.hpp"
#include "AtomicFileWriter.hpp"
#include "../core/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace shade {

RecordTableExporter::RecordTableExporter()
    : options_() {}

RecordTableExporter::RecordTableExporter(const Options& options)
    : options_(options) {}

const char* RecordTableExporter::header() {
    return "terrace_id,terrace_lat,terrace_lon,h_terrace,date,time_slot,is_sunlit,geometric_sunlit,"
           "sun_altitude,sun_azimuth,cloud_cover,weather_adjusted,coverage_limited,distance_to_obstacle,"
           "obstruction_height,ray_height_at_obstacle,obstruction_lat,obstruction_lon";
}

void RecordTableExporter::export_csv(const std::vector<TerraceResult>& results,
                                     const std::vector<SlotConditions>& slots,
                                     const std::string& date,
                                     const std::string& filename) const {
    Logger logger("RecordTableExporter");
    AtomicFileWriter::write(filename, to_csv_string(results, slots, date));
    logger.info("Exported records table: " + filename);
}

std::string RecordTableExporter::to_csv_string(const std::vector<TerraceResult>& results,
                                               const std::vector<SlotConditions>& slots,
                                               const std::string& date) const {
    std::ostringstream csv;
    csv << header() << "\n";

    for (const auto& result : results) {
        const Terrace& terrace = result.terrace;
        for (const auto& record : result.records) {
            if (record.slot_index >= slots.size()) {
                continue;
            }
            const SlotConditions& conditions = slots[record.slot_index];

            csv << escape_csv_field(terrace.id) << ",";
            csv << std::fixed << std::setprecision(options_.precision)
                << terrace.location.lat << "," << terrace.location.lon << ",";
            csv << std::setprecision(2);
            if (terrace.resolved_height) {
                csv << *terrace.resolved_height;
            }
            csv << "," << date << "," << conditions.slot.label() << ",";
            csv << (record.is_sunlit ? "true" : "false") << ",";
            csv << (record.geometric_sunlit ? "true" : "false") << ",";
            csv << std::setprecision(3) << conditions.sun.altitude_deg << "," << conditions.sun.azimuth_deg << ",";
            csv << std::setprecision(1) << conditions.cloud_cover_pct << ",";
            csv << (conditions.weather_adjusted ? "true" : "false") << ",";
            csv << (record.coverage_limited ? "true" : "false") << ",";

            if (record.obstruction) {
                const Obstruction& obstruction = *record.obstruction;
                csv << std::setprecision(2) << obstruction.distance_m << ","
                    << obstruction.obstruction_height_m << "," << obstruction.ray_height_m << ",";
                if (obstruction.location) {
                    csv << std::setprecision(options_.precision)
                        << obstruction.location->lat << "," << obstruction.location->lon;
                } else {
                    csv << ",";
                }
            } else {
                csv << ",,,,";
            }
            csv << "\n";
        }
    }

    return csv.str();
}

std::string RecordTableExporter::escape_csv_field(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped += c;
        }
    }
    escaped += "\"";
    return escaped;
}

} // namespace shade

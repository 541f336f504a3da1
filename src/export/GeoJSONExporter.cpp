/**
 * @file GeoJSONExporter.cpp
 * @brief Implementation of GeoJSON export
 */

#include "GeoJSONExporter.hpp"
#include "AtomicFileWriter.hpp"
#include "../core/Logger.hpp"
#include <sstream>
#include <iomanip>

namespace shade {

GeoJSONExporter::GeoJSONExporter()
    : options_() {}

GeoJSONExporter::GeoJSONExporter(const Options& options)
    : options_(options) {}

void GeoJSONExporter::export_geojson(const std::vector<TerraceResult>& results,
                                     const std::vector<SlotConditions>& slots,
                                     const CollectionMetadata& metadata,
                                     const std::string& filename) const {
    Logger logger("GeoJSONExporter");

    if (results.empty()) {
        logger.warning("No classified terraces, writing an empty collection");
    }

    AtomicFileWriter::write(filename, to_geojson_string(results, slots, metadata));
    logger.info("Exported GeoJSON: " + filename + " (" + std::to_string(results.size()) + " terraces)");
}

std::string GeoJSONExporter::to_geojson_string(const std::vector<TerraceResult>& results,
                                               const std::vector<SlotConditions>& slots,
                                               const CollectionMetadata& metadata) const {
    std::ostringstream json;

    json << "{";
    if (options_.pretty_print) json << "\n  ";

    json << "\"type\": \"FeatureCollection\",";
    if (options_.pretty_print) json << "\n  ";

    if (options_.include_metadata) {
        json << "\"metadata\": " << metadata_to_json(metadata, slots) << ",";
        if (options_.pretty_print) json << "\n  ";
    }

    json << "\"features\": [";

    bool first_feature = true;
    for (const auto& result : results) {
        if (!first_feature) {
            json << ",";
        }
        if (options_.pretty_print) json << "\n    ";

        json << terrace_to_geojson(result, slots);
        first_feature = false;
    }

    if (options_.pretty_print && !results.empty()) json << "\n  ";
    json << "]";

    if (options_.pretty_print) json << "\n";
    json << "}";
    if (options_.pretty_print) json << "\n";

    return json.str();
}

std::string GeoJSONExporter::terrace_to_geojson(const TerraceResult& result,
                                                const std::vector<SlotConditions>& slots) const {
    std::ostringstream json;

    json << "{";
    if (options_.pretty_print) json << "\n      ";

    json << "\"type\": \"Feature\",";
    if (options_.pretty_print) json << "\n      ";

    json << "\"geometry\": {\"type\": \"Point\", \"coordinates\": ["
         << format_coordinate(result.terrace.location.lon) << ", "
         << format_coordinate(result.terrace.location.lat) << "]},";
    if (options_.pretty_print) json << "\n      ";

    json << "\"properties\": " << create_properties(result, slots);

    if (options_.pretty_print) json << "\n    ";
    json << "}";

    return json.str();
}

std::string GeoJSONExporter::create_properties(const TerraceResult& result,
                                               const std::vector<SlotConditions>& slots) const {
    const char* separator = options_.pretty_print ? ",\n        " : ", ";
    std::ostringstream json;

    json << "{";
    if (options_.pretty_print) json << "\n        ";
    json << "\"id\": \"" << escape_json_string(result.terrace.id) << "\"";

    if (options_.diagnostics && result.terrace.resolved_height) {
        json << separator << "\"h_terrace\": " << format_meters(*result.terrace.resolved_height);
    }

    for (const auto& record : result.records) {
        if (record.slot_index >= slots.size()) {
            continue;
        }
        const std::string key = slots[record.slot_index].slot.key();
        json << separator << "\"" << key << "\": " << (record.is_sunlit ? "true" : "false");

        if (!options_.diagnostics) {
            continue;
        }

        if (record.obstruction) {
            const Obstruction& obstruction = *record.obstruction;
            json << separator << "\"" << key << "_distance_to_obstacle\": " << format_meters(obstruction.distance_m);
            json << separator << "\"" << key << "_obstruction_height\": "
                 << format_meters(obstruction.obstruction_height_m);
            json << separator << "\"" << key << "_ray_height_at_obstacle\": " << format_meters(obstruction.ray_height_m);
            if (obstruction.location) {
                json << separator << "\"" << key << "_obstruction_lat\": " << format_coordinate(obstruction.location->lat);
                json << separator << "\"" << key << "_obstruction_lon\": " << format_coordinate(obstruction.location->lon);
            }
        }
        if (record.coverage_limited) {
            json << separator << "\"" << key << "_coverage_limited\": true";
        }
    }

    if (options_.pretty_print) json << "\n      ";
    json << "}";
    return json.str();
}

std::string GeoJSONExporter::metadata_to_json(const CollectionMetadata& metadata,
                                              const std::vector<SlotConditions>& slots) const {
    std::ostringstream json;
    json << "{";
    json << "\"date\": \"" << escape_json_string(metadata.date) << "\", ";
    json << "\"timezone\": \"" << escape_json_string(metadata.timezone) << "\", ";

    json << "\"time_slots\": [";
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) json << ", ";
        json << "\"" << slots[i].slot.key() << "\"";
    }
    json << "], ";

    json << "\"cloud_cover_threshold\": " << format_plain(metadata.cloud_cover_threshold) << ", ";

    json << "\"weather_unadjusted_slots\": [";
    for (size_t i = 0; i < metadata.weather_unadjusted_slots.size(); ++i) {
        if (i > 0) json << ", ";
        json << "\"" << escape_json_string(metadata.weather_unadjusted_slots[i]) << "\"";
    }
    json << "]";

    json << "}";
    return json.str();
}

std::string GeoJSONExporter::format_coordinate(double value) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(options_.precision) << value;
    return ss.str();
}

std::string GeoJSONExporter::format_meters(double value) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string GeoJSONExporter::format_plain(double value) const {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string GeoJSONExporter::escape_json_string(const std::string& str) const {
    std::ostringstream escaped;
    for (char c : str) {
        switch (c) {
            case '"': escaped << "\\\""; break;
            case '\\': escaped << "\\\\"; break;
            case '\b': escaped << "\\b"; break;
            case '\f': escaped << "\\f"; break;
            case '\n': escaped << "\\n"; break;
            case '\r': escaped << "\\r"; break;
            case '\t': escaped << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                            << std::dec << std::setfill(' ');
                } else {
                    escaped << c;
                }
        }
    }
    return escaped.str();
}

} // namespace shade

/**
 * @file ResultReader.cpp
 * @brief nlohmann/json based reader for sunlight results
 */

#include "ResultReader.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace shade {

namespace {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

bool is_slot_key(const std::string& key) {
    return key.size() == 5 && key[0] == 't' &&
           std::all_of(key.begin() + 1, key.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ResultReader ResultReader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputNotFoundError("cannot open results file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

ResultReader ResultReader::parse(const std::string& json_text) {
    Logger logger("ResultReader");
    ResultReader reader;

    try {
        auto j = json::parse(json_text);
        if (j.value("type", std::string()) != "FeatureCollection" || !j.contains("features") ||
            !j["features"].is_array()) {
            throw InputNotFoundError("results are not a GeoJSON FeatureCollection");
        }

        for (const auto& feature : j["features"]) {
            if (!feature.contains("geometry") || !feature["geometry"].is_object() ||
                !feature.contains("properties") || !feature["properties"].is_object()) {
                logger.debug("Skipping feature without geometry or properties");
                continue;
            }
            const auto& coords = feature["geometry"].value("coordinates", json::array());
            if (!coords.is_array() || coords.size() < 2 || !coords[0].is_number() || !coords[1].is_number()) {
                logger.debug("Skipping feature without point coordinates");
                continue;
            }

            const auto& props = feature["properties"];
            Entry entry;
            if (props.contains("id") && props["id"].is_string()) {
                entry.id = props["id"].get<std::string>();
            } else if (props.contains("id") && props["id"].is_number()) {
                entry.id = props["id"].dump();
            }
            entry.location = GeoPoint(coords[1].get<double>(), coords[0].get<double>());

            for (auto it = props.begin(); it != props.end(); ++it) {
                if (is_slot_key(it.key()) && it.value().is_boolean()) {
                    entry.slots[it.key()] = it.value().get<bool>();
                }
            }
            reader.entries_.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        throw InputNotFoundError("malformed results file: " + std::string(e.what()));
    }

    logger.detailed("Read " + std::to_string(reader.entries_.size()) + " terraces from results");
    return reader;
}

std::vector<std::string> ResultReader::time_slots() const {
    std::set<std::string> keys;
    for (const auto& entry : entries_) {
        for (const auto& [key, value] : entry.slots) {
            keys.insert(key);
        }
    }
    return std::vector<std::string>(keys.begin(), keys.end());
}

TerraceStatus ResultReader::status_of(const Entry& entry, const std::string& time_key) const {
    TerraceStatus status;
    status.id = entry.id;
    status.location = entry.location;
    auto it = entry.slots.find(time_key);
    status.is_sunlit = it != entry.slots.end() && it->second;
    return status;
}

std::vector<TerraceStatus> ResultReader::in_viewport(double sw_lng, double sw_lat, double ne_lng, double ne_lat,
                                                     const std::string& time_key) const {
    const BoundingBox box(sw_lng, sw_lat, ne_lng, ne_lat);
    std::vector<TerraceStatus> matches;
    for (const auto& entry : entries_) {
        if (box.contains(entry.location.lon, entry.location.lat)) {
            matches.push_back(status_of(entry, time_key));
        }
    }
    return matches;
}

std::vector<TerraceStatus> ResultReader::nearby(double lat, double lon, double radius_km,
                                                const std::string& time_key, bool only_sunny) const {
    const GeoPoint center(lat, lon);
    std::vector<TerraceStatus> matches;
    for (const auto& entry : entries_) {
        TerraceStatus status = status_of(entry, time_key);
        if (only_sunny && !status.is_sunlit) {
            continue;
        }
        status.distance_km = haversine_km(center, entry.location);
        if (status.distance_km <= radius_km) {
            matches.push_back(std::move(status));
        }
    }
    std::stable_sort(matches.begin(), matches.end(), [](const TerraceStatus& a, const TerraceStatus& b) {
        return a.distance_km < b.distance_km;
    });
    return matches;
}

std::optional<TerraceStatus> ResultReader::find(const std::string& id, const std::string& time_key) const {
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            return status_of(entry, time_key);
        }
    }
    return std::nullopt;
}

double ResultReader::haversine_km(const GeoPoint& a, const GeoPoint& b) {
    const double dlat = (b.lat - a.lat) * kPi / 180.0;
    const double dlon = (b.lon - a.lon) * kPi / 180.0;
    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(a.lat * kPi / 180.0) * std::cos(b.lat * kPi / 180.0) *
                     std::sin(dlon / 2) * std::sin(dlon / 2);
    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

} // namespace shade

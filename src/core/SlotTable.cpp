/**
 * @file SlotTable.cpp
 * @brief Slot table construction
 */

#include "SlotTable.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include "SolarGeometry.hpp"
#include "WeatherService.hpp"
#include <iomanip>
#include <sstream>

namespace shade {

std::vector<SlotConditions> SlotTable::build(const CivilDate& date,
                                             const UtcOffsetRule& zone,
                                             const std::vector<TimeSlot>& slots,
                                             const SolarGeometry& solar,
                                             const GeoPoint& reference_location,
                                             const CloudCoverTable* clouds) {
    Logger logger("SlotTable");
    std::vector<SlotConditions> table;
    table.reserve(slots.size());

    for (const auto& slot : slots) {
        SlotConditions conditions;
        conditions.slot = slot;
        conditions.utc_seconds = zone.local_to_utc(date, slot.minutes_of_day());
        conditions.sun = solar.compute(reference_location, conditions.utc_seconds);

        if (clouds) {
            try {
                conditions.cloud_cover_pct = clouds->at(conditions.utc_seconds);
                conditions.weather_adjusted = true;
            } catch (const WeatherLookupError& e) {
                logger.warning("Slot " + slot.label() + ": " + e.what() + ", keeping the geometric result");
                conditions.cloud_cover_pct = 0.0;
                conditions.weather_adjusted = false;
            }
        }

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            std::ostringstream msg;
            msg << std::fixed << std::setprecision(2) << slot.label() << " sun az " << conditions.sun.azimuth_deg
                << " alt " << conditions.sun.altitude_deg << ", cloud " << conditions.cloud_cover_pct << "%"
                << (conditions.sun.is_up() ? "" : " (night)");
            logger.detailed(msg.str());
        }
        table.push_back(conditions);
    }

    return table;
}

std::vector<std::string> SlotTable::weather_unadjusted_keys(const std::vector<SlotConditions>& table) {
    std::vector<std::string> keys;
    for (const auto& conditions : table) {
        if (!conditions.weather_adjusted) {
            keys.push_back(conditions.slot.key());
        }
    }
    return keys;
}

} // namespace shade

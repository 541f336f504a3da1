/**
 * @file SlotTable.hpp
 * @brief Per-slot sun position and cloud cover, computed once per run
 */

#pragma once

#include "terrace_shade.hpp"
#include "TimeSlots.hpp"
#include <string>
#include <vector>

namespace shade {

class CloudCoverTable;
class SolarGeometry;

/**
 * @brief Builds the immutable slot table shared by every terrace worker
 */
class SlotTable {
public:
    /**
     * @brief Resolve every slot to a UTC instant, a sun position and a cloud cover
     * @param clouds Hourly cloud cover; nullptr leaves every slot weather-unadjusted
     */
    static std::vector<SlotConditions> build(const CivilDate& date,
                                             const UtcOffsetRule& zone,
                                             const std::vector<TimeSlot>& slots,
                                             const SolarGeometry& solar,
                                             const GeoPoint& reference_location,
                                             const CloudCoverTable* clouds);

    /// Keys of the slots without a cloud cover sample
    static std::vector<std::string> weather_unadjusted_keys(const std::vector<SlotConditions>& table);
};

} // namespace shade

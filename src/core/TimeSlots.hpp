/**
 * @file TimeSlots.hpp
 * @brief Civil dates, time slot schedules and local-to-UTC conversion
 */

#pragma once

#include "terrace_shade.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shade {

/**
 * @brief Proleptic Gregorian calendar date
 */
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    CivilDate() = default;
    CivilDate(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {}

    /// Parse "YYYY-MM-DD"; nullopt if malformed or not a real date
    static std::optional<CivilDate> parse(const std::string& text);

    /// Current date in the host's local time zone
    static CivilDate today();

    std::string to_string() const;
    CivilDate plus_days(int days) const;
    long long days_since_epoch() const;

    bool operator==(const CivilDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

long long days_from_civil(int y, unsigned m, unsigned d);
CivilDate civil_from_days(long long days);

/// 0 = Sunday ... 6 = Saturday
int weekday_from_days(long long days);

/**
 * @brief Maps local wall-clock times of one zone to UTC
 *
 * Supports the EU rule used by Europe/Paris (CET, CEST between the last
 * Sunday of March and the last Sunday of October, switching at 01:00 UTC),
 * plain UTC, and fixed offsets such as "+01:00".
 */
class UtcOffsetRule {
public:
    /**
     * @throws ConfigurationError for an unsupported zone
     */
    static UtcOffsetRule parse(const std::string& zone);

    /// Offset of local time from UTC at the given UTC instant, in minutes
    int offset_minutes_at(long long utc_seconds) const;

    /// UTC instant of a local wall-clock time on a date
    long long local_to_utc(const CivilDate& date, int minutes_of_day) const;

    const std::string& name() const { return name_; }

private:
    UtcOffsetRule(const std::string& name, int standard_offset_minutes, bool eu_summer_time)
        : name_(name), standard_offset_minutes_(standard_offset_minutes), eu_summer_time_(eu_summer_time) {}

    bool is_summer_time(long long utc_seconds) const;

    std::string name_;
    int standard_offset_minutes_;
    bool eu_summer_time_;
};

/**
 * @brief Parse "HH:MM"
 * @throws ConfigurationError if malformed
 */
TimeSlot parse_time_of_day(const std::string& text);

/**
 * @brief Ordered slots from start to end inclusive at a fixed interval
 * @throws ConfigurationError if the schedule is empty or malformed
 */
std::vector<TimeSlot> build_time_slots(const std::string& start, const std::string& end, int interval_minutes);

} // namespace shade

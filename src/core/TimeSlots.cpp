/**
 * @file TimeSlots.cpp
 * @brief Implementation of date arithmetic and time slot schedules
 */

#include "TimeSlots.hpp"
#include "ShadeErrors.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace shade {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned dim[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return dim[month - 1];
}

long long last_sunday_of(int year, unsigned month) {
    const long long last_day = days_from_civil(year, month, days_in_month(year, month));
    return last_day - weekday_from_days(last_day);
}

bool parse_fixed_offset(const std::string& zone, int& minutes) {
    // [+-]HH:MM or [+-]HHMM
    if (zone.size() < 3 || (zone[0] != '+' && zone[0] != '-')) {
        return false;
    }
    std::string digits;
    for (size_t i = 1; i < zone.size(); ++i) {
        if (zone[i] == ':') continue;
        if (!std::isdigit(static_cast<unsigned char>(zone[i]))) return false;
        digits += zone[i];
    }
    if (digits.size() != 2 && digits.size() != 4) {
        return false;
    }
    int hours = std::stoi(digits.substr(0, 2));
    int mins = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 14 || mins > 59) {
        return false;
    }
    minutes = (hours * 60 + mins) * (zone[0] == '-' ? -1 : 1);
    return true;
}

} // namespace

// ============================================================================
// Calendar arithmetic
// ============================================================================

long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

CivilDate civil_from_days(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2 ? 1 : 0);
    return CivilDate(y, m, d);
}

int weekday_from_days(long long days) {
    // 1970-01-01 was a Thursday
    return static_cast<int>(((days % 7) + 11) % 7);
}

std::optional<CivilDate> CivilDate::parse(const std::string& text) {
    int y = 0;
    unsigned m = 0, d = 0;
    char tail = '\0';
    if (text.size() != 10 || std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    return CivilDate(y, m, d);
}

CivilDate CivilDate::today() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return CivilDate(local_tm.tm_year + 1900, static_cast<unsigned>(local_tm.tm_mon + 1),
                     static_cast<unsigned>(local_tm.tm_mday));
}

std::string CivilDate::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
    return buffer;
}

CivilDate CivilDate::plus_days(int days) const {
    return civil_from_days(days_since_epoch() + days);
}

long long CivilDate::days_since_epoch() const {
    return days_from_civil(year, month, day);
}

// ============================================================================
// UtcOffsetRule
// ============================================================================

UtcOffsetRule UtcOffsetRule::parse(const std::string& zone) {
    if (zone == "Europe/Paris" || zone == "CET" || zone == "Europe/Brussels") {
        return UtcOffsetRule(zone, 60, true);
    }
    if (zone == "UTC" || zone == "GMT" || zone == "Z") {
        return UtcOffsetRule(zone, 0, false);
    }
    int minutes = 0;
    if (parse_fixed_offset(zone, minutes)) {
        return UtcOffsetRule(zone, minutes, false);
    }
    throw ConfigurationError("unsupported timezone '" + zone + "' (use Europe/Paris, UTC or +HH:MM)");
}

bool UtcOffsetRule::is_summer_time(long long utc_seconds) const {
    if (!eu_summer_time_) {
        return false;
    }
    long long days = utc_seconds / 86400;
    if (utc_seconds < 0 && utc_seconds % 86400 != 0) {
        --days;
    }
    const int year = civil_from_days(days).year;
    const long long start = last_sunday_of(year, 3) * 86400 + 3600;
    const long long end = last_sunday_of(year, 10) * 86400 + 3600;
    return utc_seconds >= start && utc_seconds < end;
}

int UtcOffsetRule::offset_minutes_at(long long utc_seconds) const {
    return standard_offset_minutes_ + (is_summer_time(utc_seconds) ? 60 : 0);
}

long long UtcOffsetRule::local_to_utc(const CivilDate& date, int minutes_of_day) const {
    const long long local_seconds = date.days_since_epoch() * 86400 + static_cast<long long>(minutes_of_day) * 60;

    if (eu_summer_time_) {
        // Ambiguous autumn times resolve to the first (summer) occurrence,
        // nonexistent spring times shift forward by one hour.
        const long long summer_candidate = local_seconds - (standard_offset_minutes_ + 60) * 60LL;
        if (is_summer_time(summer_candidate)) {
            return summer_candidate;
        }
    }
    return local_seconds - standard_offset_minutes_ * 60LL;
}

// ============================================================================
// Slot schedule
// ============================================================================

TimeSlot parse_time_of_day(const std::string& text) {
    int h = -1, m = -1;
    char tail = '\0';
    if (std::sscanf(text.c_str(), "%d:%d%c", &h, &m, &tail) != 2 || h < 0 || h > 23 || m < 0 || m > 59) {
        throw ConfigurationError("invalid time of day '" + text + "' (expected HH:MM)");
    }
    return TimeSlot(h, m);
}

std::vector<TimeSlot> build_time_slots(const std::string& start, const std::string& end, int interval_minutes) {
    if (interval_minutes <= 0) {
        throw ConfigurationError("slot interval must be positive");
    }
    const TimeSlot first = parse_time_of_day(start);
    const TimeSlot last = parse_time_of_day(end);
    if (last < first) {
        throw ConfigurationError("slot end " + end + " is before slot start " + start);
    }

    std::vector<TimeSlot> slots;
    for (int t = first.minutes_of_day(); t <= last.minutes_of_day(); t += interval_minutes) {
        slots.emplace_back(t / 60, t % 60);
    }
    return slots;
}

} // namespace shade

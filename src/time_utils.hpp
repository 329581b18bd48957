#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC epoch-second timestamps.
// A "day" is the number of whole UTC days since 1970-01-01.
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t SEC_PER_MIN  = 60;
constexpr int64_t SEC_PER_HOUR = 3600;
constexpr int64_t SEC_PER_DAY  = 86400;
constexpr int MIN_PER_DAY      = 1440;

inline int64_t day_of(int64_t ts) {
    int64_t day = ts / SEC_PER_DAY;
    if (ts < 0 && ts % SEC_PER_DAY != 0) day -= 1;
    return day;
}

inline int64_t day_start(int64_t day) {
    return day * SEC_PER_DAY;
}

inline int minute_of_day(int64_t ts) {
    return static_cast<int>((ts - day_start(day_of(ts))) / SEC_PER_MIN);
}

// Time-of-day slot: minute of day floored to the step granularity.
inline int slot_of(int64_t ts, int step_minutes) {
    int minute = minute_of_day(ts);
    return (minute / step_minutes) * step_minutes;
}

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

// days-since-epoch <-> proleptic Gregorian date (Hinnant's algorithms)
inline CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return {static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

inline int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int day_of_month(int64_t day) {
    return civil_from_days(day).day;
}

inline std::string format_day(int64_t day) {
    auto c = civil_from_days(day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buf;
}

inline std::string format_time(int64_t ts) {
    int64_t day = day_of(ts);
    int64_t secs = ts - day_start(day);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %02d:%02d:%02d", format_day(day).c_str(),
                  static_cast<int>(secs / SEC_PER_HOUR),
                  static_cast<int>((secs % SEC_PER_HOUR) / SEC_PER_MIN),
                  static_cast<int>(secs % SEC_PER_MIN));
    return buf;
}

// Parses "YYYY-MM-DD". Returns nullopt on malformed input.
inline std::optional<int64_t> parse_day(const std::string& s) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (std::sscanf(s.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
    return days_from_civil(y, m, d);
}

}  // namespace time_utils

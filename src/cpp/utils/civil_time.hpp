#pragma once
// Calendar <-> epoch conversion without touching the process time zone.
// Export timestamps carry no zone, they are interpreted as UTC.
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace chatingest {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline bool valid_civil(int y, int mo, int d, int h, int mi, int s) {
    static const int month_days[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y < 1970 || mo < 1 || mo > 12 || d < 1 || d > month_days[mo - 1]) return false;
    if (mo == 2 && d == 29) {
        bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        if (!leap) return false;
    }
    return h >= 0 && h < 24 && mi >= 0 && mi < 60 && s >= 0 && s < 60;
}

inline int64_t epoch_ms_from_civil(int y, int mo, int d, int h, int mi, int s) {
    int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return ((days * 24 + h) * 60 + mi) * 60000LL + s * 1000LL;
}

// Strict "YYYY-MM-DD HH:MM:SS"; anything else (including trailing text) is rejected
inline std::optional<int64_t> parse_sql_timestamp_ms(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;
    if (text.size() != 19) return std::nullopt;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &s, &consumed) != 6 || consumed != 19) {
        return std::nullopt;
    }
    if (!valid_civil(y, mo, d, h, mi, s)) return std::nullopt;
    return epoch_ms_from_civil(y, mo, d, h, mi, s);
}

} // namespace chatingest

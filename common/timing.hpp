#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <time.h>

#include <fmt/format.h>

namespace optick {

constexpr int64_t NS_PER_SEC = 1'000'000'000LL;
constexpr int64_t NS_PER_MIN = 60 * NS_PER_SEC;
constexpr int64_t SEC_PER_DAY = 86'400;

// Get nanosecond timestamp using CLOCK_MONOTONIC_RAW (latency measurement only)
inline uint64_t get_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
           static_cast<uint64_t>(ts.tv_nsec);
}

// Wall clock, ns since the Unix epoch. Used to stamp observations.
inline int64_t wall_clock_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

// Convert ns to microseconds
inline double ns_to_us(uint64_t ns) {
    return static_cast<double>(ns) / 1000.0;
}

struct Date {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
};

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
inline int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline Date civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int y = static_cast<int>(yoe + era * 400) + (m <= 2);
    return Date{y, m, d};
}

inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// "YYYY-MM-DD"
inline std::optional<Date> parse_date(std::string_view s) {
    int y = 0;
    unsigned m = 0, d = 0;
    int used = 0;
    const std::string buf(s);
    if (std::sscanf(buf.c_str(), "%4d-%2u-%2u%n", &y, &m, &d, &used) != 3 ||
        static_cast<size_t>(used) != buf.size()) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }
    const Date date{y, m, d};
    // reject 2024-02-31 and friends
    if (civil_from_days(days_from_civil(y, m, d)) != date) {
        return std::nullopt;
    }
    return date;
}

// "HH:MM" or "HH:MM:SS" -> seconds since midnight
inline std::optional<int> parse_time_of_day(std::string_view s) {
    int h = 0, m = 0, sec = 0;
    int used = 0;
    const std::string buf(s);
    if (std::sscanf(buf.c_str(), "%2d:%2d%n", &h, &m, &used) != 2) {
        return std::nullopt;
    }
    if (static_cast<size_t>(used) != buf.size()) {
        int more = 0;
        if (std::sscanf(buf.c_str() + used, ":%2d%n", &sec, &more) != 1 ||
            static_cast<size_t>(used + more) != buf.size()) {
            return std::nullopt;
        }
    }
    if (h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 59) {
        return std::nullopt;
    }
    return h * 3600 + m * 60 + sec;
}

// Exchange session calendar at a fixed UTC offset (NSE defaults: +05:30,
// close at 15:30 local).
class SessionCalendar {
public:
    SessionCalendar(int utc_offset_minutes = 330, int close_second_of_day = 15 * 3600 + 30 * 60)
        : offset_ns_(static_cast<int64_t>(utc_offset_minutes) * NS_PER_MIN),
          close_second_(close_second_of_day) {}

    int64_t local_to_ns(const Date& d, int second_of_day) const {
        const int64_t days = days_from_civil(d.year, d.month, d.day);
        return (days * SEC_PER_DAY + second_of_day) * NS_PER_SEC - offset_ns_;
    }

    Date local_date(int64_t ts_ns) const {
        return civil_from_days(floor_div(ts_ns + offset_ns_, SEC_PER_DAY * NS_PER_SEC));
    }

    int64_t day_start_ns(const Date& d) const { return local_to_ns(d, 0); }
    int64_t session_close_ns(const Date& d) const { return local_to_ns(d, close_second_); }

    // "YYYY-MM-DD HH:MM:SS.mmm" in exchange-local time
    std::string format_local(int64_t ts_ns) const {
        const int64_t local = ts_ns + offset_ns_;
        const int64_t day_ns = SEC_PER_DAY * NS_PER_SEC;
        const int64_t days = floor_div(local, day_ns);
        const int64_t in_day = local - days * day_ns;
        const Date d = civil_from_days(days);
        const int64_t secs = in_day / NS_PER_SEC;
        const int64_t millis = (in_day % NS_PER_SEC) / 1'000'000;
        return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                           d.year, d.month, d.day,
                           secs / 3600, (secs / 60) % 60, secs % 60, millis);
    }

private:
    int64_t offset_ns_;
    int close_second_;
};

} // namespace optick

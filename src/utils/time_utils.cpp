#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace updown {
namespace time_utils {

namespace {
    std::tm utc_tm(WallClock t) {
        auto time_t = std::chrono::system_clock::to_time_t(t);
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        return tm;
    }

    // UTC epoch seconds of the n-th Sunday of a month at the given UTC hour
    time_t nth_sunday_utc(int year, int month0, int n, int utc_hour) {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month0;
        tm.tm_mday = 1;
        tm.tm_hour = utc_hour;
        time_t first = timegm(&tm);

        std::tm first_tm{};
        gmtime_r(&first, &first_tm);
        int first_sunday = 1 + (7 - first_tm.tm_wday) % 7;

        tm.tm_mday = first_sunday + 7 * (n - 1);
        return timegm(&tm);
    }
}

std::string to_iso8601(WallClock t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;
    std::tm tm = utc_tm(t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    return to_iso8601(from_epoch_ms(epoch_ms));
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    bool has_time = s.find('T') != std::string::npos || s.find(' ') != std::string::npos;
    if (has_time) {
        ss >> std::get_time(&tm, s.find('T') != std::string::npos ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO 8601 timestamp: " + s);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    if (!has_time) return tp;

    size_t time_start = s.find_first_of("T ") + 1;
    size_t pos = time_start + 8;  // past HH:MM:SS

    if (pos < s.size() && s[pos] == '.') {
        size_t end = pos + 1;
        while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) ++end;
        std::string frac = s.substr(pos + 1, std::min<size_t>(3, end - pos - 1));
        while (frac.size() < 3) frac.push_back('0');
        tp += std::chrono::milliseconds(std::stoi(frac));
        pos = end;
    }

    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-') && pos + 3 <= s.size()) {
        int sign = s[pos] == '+' ? 1 : -1;
        int hh = std::stoi(s.substr(pos + 1, 2));
        int mm = s.size() >= pos + 6 ? std::stoi(s.substr(pos + 4, 2)) : 0;
        tp -= sign * (std::chrono::hours(hh) + std::chrono::minutes(mm));
    }

    return tp;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

int64_t epoch_ms() {
    return to_epoch_ms(std::chrono::system_clock::now());
}

int64_t to_epoch_ms(WallClock t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

WallClock from_epoch_ms(int64_t ms) {
    return WallClock(std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(ms)));
}

int minute_of_hour(WallClock t) {
    return utc_tm(t).tm_min;
}

bool is_us_eastern_dst(WallClock t) {
    std::tm tm = utc_tm(t);
    int year = tm.tm_year + 1900;
    time_t now = std::chrono::system_clock::to_time_t(t);

    // 2:00 EST = 07:00 UTC, 2:00 EDT = 06:00 UTC
    time_t start = nth_sunday_utc(year, 2, 2, 7);
    time_t end = nth_sunday_utc(year, 10, 1, 6);
    return now >= start && now < end;
}

int eastern_hour(WallClock t) {
    int offset = is_us_eastern_dst(t) ? 4 : 5;
    int hour = utc_tm(t).tm_hour - offset;
    return hour < 0 ? hour + 24 : hour;
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << ms / 1000.0 << "s";
        return ss.str();
    }
    int64_t minutes = ms / 60000;
    int64_t seconds = (ms % 60000) / 1000;
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
}

} // namespace time_utils
} // namespace updown

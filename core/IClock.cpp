#include "IClock.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace worktrack {

namespace {

bool toUtcTm(std::time_t time, std::tm& out) {
    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    return gmtime_s(&out, &time) == 0;
#else
    return gmtime_r(&time, &out) != nullptr;
#endif
}

std::time_t fromUtcTm(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

} // namespace

std::string IClock::iso8601() const {
    return formatIso8601(now());
}

std::string formatIso8601(Timestamp time) {
    auto millis = toEpochMillis(time);
    auto seconds = millis / 1000;
    auto ms = millis % 1000;
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }

    std::stringstream ss;
    std::tm tm_buf{};
    if (toUtcTm(static_cast<std::time_t>(seconds), tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
    
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::optional<Timestamp> parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t millis = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t seconds = fromUtcTm(tm_buf);

    return tryFromEpochMillis(static_cast<double>(seconds) * 1000.0 + static_cast<double>(millis));
}

std::string formatUtcDate(Timestamp time) {
    return formatIso8601(startOfUtcDay(time)).substr(0, 10);
}

Timestamp startOfUtcDay(Timestamp time) {
    constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;
    int64_t millis = toEpochMillis(time);
    int64_t day = millis / kMillisPerDay;
    if (millis % kMillisPerDay < 0) {
        --day;
    }
    return fromEpochMillis(day * kMillisPerDay);
}

Timestamp fromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::optional<Timestamp> tryFromEpochMillis(double millis) {
    static const double kLimit = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max()).count());
    if (!std::isfinite(millis) || std::fabs(millis) >= kLimit) {
        return std::nullopt;
    }
    return fromEpochMillis(static_cast<int64_t>(millis));
}

int64_t toEpochMillis(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

} // namespace worktrack

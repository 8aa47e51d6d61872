/// @file time_format.cpp
/// @brief ISO 8601 timestamp helpers.

#include "shelf/foundation/time_format.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace shelf::foundation {

namespace {

struct SplitTime {
    std::tm utc{};
    int64_t micros = 0;
};

SplitTime split(Timestamp tp) {
    using namespace std::chrono;
    auto epoch = tp.time_since_epoch();
    auto secs = floor<seconds>(epoch);
    auto micros = duration_cast<microseconds>(epoch - secs);

    std::time_t tt = static_cast<std::time_t>(secs.count());
    SplitTime out;
#if defined(_WIN32)
    gmtime_s(&out.utc, &tt);
#else
    gmtime_r(&tt, &out.utc);
#endif
    out.micros = micros.count();
    return out;
}

bool parseDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // namespace

std::string formatIsoTimestamp(Timestamp tp) {
    auto parts = split(tp);
    char buf[96];  // Oversized to satisfy GCC -Wformat-truncation
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
                  parts.utc.tm_year + 1900,
                  parts.utc.tm_mon + 1,
                  parts.utc.tm_mday,
                  parts.utc.tm_hour,
                  parts.utc.tm_min,
                  parts.utc.tm_sec,
                  static_cast<long long>(parts.micros));
    return buf;
}

std::string formatLogTimestamp(Timestamp tp) {
    auto parts = split(tp);
    char buf[96];
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  parts.utc.tm_year + 1900,
                  parts.utc.tm_mon + 1,
                  parts.utc.tm_mday,
                  parts.utc.tm_hour,
                  parts.utc.tm_min,
                  parts.utc.tm_sec,
                  static_cast<int>(parts.micros / 1000));
    return buf;
}

std::optional<Timestamp> parseIsoTimestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters.
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parseDigits(text, 0, 4, year) || !parseDigits(text, 5, 2, month) ||
        !parseDigits(text, 8, 2, day) || !parseDigits(text, 11, 2, hour) ||
        !parseDigits(text, 14, 2, minute) || !parseDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    using namespace std::chrono;
    auto date = year_month_day{std::chrono::year{year},
                               std::chrono::month{static_cast<unsigned>(month)},
                               std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return std::nullopt;
    }

    auto tp = sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
    return time_point_cast<system_clock::duration>(tp) +
           duration_cast<system_clock::duration>(std::chrono::nanoseconds{nanos});
}

Timestamp nowTimestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

} // namespace shelf::foundation

#include "libcore/reading.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <utility>

namespace heatlog::core {
namespace {

bool parse_fixed_digits(std::string_view text, std::size_t pos, std::size_t count, int &out) {
    if (pos + count > text.size()) {
        return false;
    }
    int v = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        v = v * 10 + (text[i] - '0');
    }
    out = v;
    return true;
}

} // namespace

const char *status_name(ReadingStatus status) {
    switch (status) {
    case ReadingStatus::Ok:
        return "ok";
    case ReadingStatus::Error:
        return "error";
    case ReadingStatus::Stale:
        return "stale";
    }
    return "error";
}

std::optional<ReadingStatus> parse_status(std::string_view text) {
    if (text == "ok") {
        return ReadingStatus::Ok;
    }
    if (text == "error") {
        return ReadingStatus::Error;
    }
    if (text == "stale") {
        return ReadingStatus::Stale;
    }
    return std::nullopt;
}

std::string format_value(double value, int decimals) {
    const int prec = std::clamp(decimals, 0, 6);
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf), "%.*f", prec, value);
    if (n <= 0) {
        return kMissingValueText;
    }
    std::string out(buf, static_cast<std::size_t>(std::min(n, static_cast<int>(sizeof(buf) - 1))));
    // "-0.0" reads badly on a display
    if (out.size() > 1 && out[0] == '-' && out.find_first_not_of("-0.") == std::string::npos) {
        out.erase(0, 1);
    }
    return out;
}

Reading make_ok_reading(double value, std::string unit, int decimals, Clock::time_point timestamp) {
    Reading r;
    r.value = value;
    r.unit = std::move(unit);
    r.timestamp = timestamp;
    r.status = ReadingStatus::Ok;
    r.formatted = format_value(value, decimals);
    return r;
}

Reading make_error_reading(std::string unit, std::string error, Clock::time_point timestamp) {
    Reading r;
    r.unit = std::move(unit);
    r.timestamp = timestamp;
    r.status = ReadingStatus::Error;
    r.formatted = kMissingValueText;
    r.error = std::move(error);
    return r;
}

std::string format_iso8601_utc(Clock::time_point timestamp) {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch()).count();
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }

    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm {};
    gmtime_r(&t, &tm);

    char date[32];
    if (std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm) == 0) {
        return {};
    }
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lldZ", date, frac);
    return out;
}

std::optional<Clock::time_point> parse_iso8601_utc(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS[.fraction]Z
    if (text.size() < 20) {
        return std::nullopt;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_fixed_digits(text, 0, 4, year) || text[4] != '-' || !parse_fixed_digits(text, 5, 2, month) ||
        text[7] != '-' || !parse_fixed_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !parse_fixed_digits(text, 11, 2, hour) || text[13] != ':' || !parse_fixed_digits(text, 14, 2, minute) ||
        text[16] != ':' || !parse_fixed_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return std::nullopt;
    }

    std::tm tm {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

} // namespace heatlog::core

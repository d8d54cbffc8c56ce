#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace heatlog::core {

using Clock = std::chrono::system_clock;

enum class ReadingStatus {
    Ok,
    Error,
    Stale,
};

// One timestamped measurement. Values are filled once by the producer and
// shared as `std::shared_ptr<const Reading>` afterwards.
struct Reading {
    std::optional<double> value;
    std::string unit;
    Clock::time_point timestamp;
    ReadingStatus status = ReadingStatus::Error;
    std::string formatted;
    std::string error;

    bool ok() const {
        return status == ReadingStatus::Ok && value.has_value();
    }
};

inline constexpr const char *kMissingValueText = "---";

const char *status_name(ReadingStatus status);
std::optional<ReadingStatus> parse_status(std::string_view text);

std::string format_value(double value, int decimals);

Reading make_ok_reading(double value, std::string unit, int decimals, Clock::time_point timestamp);
Reading make_error_reading(std::string unit, std::string error, Clock::time_point timestamp);

// ISO-8601 in UTC with microseconds, e.g. 2024-01-31T12:00:00.123456Z
std::string format_iso8601_utc(Clock::time_point timestamp);
std::optional<Clock::time_point> parse_iso8601_utc(std::string_view text);

} // namespace heatlog::core

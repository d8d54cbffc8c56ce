#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace heatlog::core {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view text);

// Writes one line to std::cerr; safe to call from any thread.
void log_line(LogLevel level, const std::string &component, const std::string &message);

inline void log_error(const std::string &component, const std::string &message) {
    log_line(LogLevel::Error, component, message);
}

inline void log_warn(const std::string &component, const std::string &message) {
    log_line(LogLevel::Warn, component, message);
}

inline void log_info(const std::string &component, const std::string &message) {
    log_line(LogLevel::Info, component, message);
}

inline void log_debug(const std::string &component, const std::string &message) {
    log_line(LogLevel::Debug, component, message);
}

// Lets `burst` messages through per window, then counts the rest and
// reports the suppressed total when the next window opens.
class RateLimitedLog {
public:
    RateLimitedLog(std::string component, std::size_t burst, std::chrono::seconds window);

    void log(LogLevel level, const std::string &message);
    std::uint64_t suppressed_total() const;

private:
    std::string component_;
    std::size_t burst_;
    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point window_start_{};
    bool started_ = false;
    std::size_t emitted_in_window_ = 0;
    std::uint64_t suppressed_in_window_ = 0;
    std::uint64_t suppressed_total_ = 0;
};

} // namespace heatlog::core

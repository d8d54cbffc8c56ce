#include "libcore/log.hpp"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iostream>
#include <utility>

namespace heatlog::core {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex &output_mutex() {
    static std::mutex m;
    return m;
}

const char *level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    }
    return "INFO";
}

std::string utc_now_text() {
    const std::time_t now = std::time(nullptr);
    std::tm tm {};
    gmtime_r(&now, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return "-";
    }
    return buf;
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= g_level.load();
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (const char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    return std::nullopt;
}

void log_line(LogLevel level, const std::string &component, const std::string &message) {
    if (!log_enabled(level)) {
        return;
    }
    const std::string stamp = utc_now_text();
    std::lock_guard<std::mutex> guard(output_mutex());
    std::cerr << stamp << ' ' << level_name(level) << " [" << component << "] " << message << '\n';
}

RateLimitedLog::RateLimitedLog(std::string component, std::size_t burst, std::chrono::seconds window)
    : component_(std::move(component)), burst_(burst == 0 ? 1 : burst), window_(window) {
    if (window_ < std::chrono::seconds(1)) {
        window_ = std::chrono::seconds(1);
    }
}

void RateLimitedLog::log(LogLevel level, const std::string &message) {
    std::uint64_t report_suppressed = 0;
    bool emit = false;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        const auto now = std::chrono::steady_clock::now();
        if (!started_ || now - window_start_ >= window_) {
            report_suppressed = suppressed_in_window_;
            started_ = true;
            window_start_ = now;
            emitted_in_window_ = 0;
            suppressed_in_window_ = 0;
        }
        if (emitted_in_window_ < burst_) {
            ++emitted_in_window_;
            emit = true;
        } else {
            ++suppressed_in_window_;
            ++suppressed_total_;
        }
    }

    if (report_suppressed > 0) {
        log_line(level, component_, std::to_string(report_suppressed) + " similar messages suppressed");
    }
    if (emit) {
        log_line(level, component_, message);
    }
}

std::uint64_t RateLimitedLog::suppressed_total() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return suppressed_total_;
}

} // namespace heatlog::core

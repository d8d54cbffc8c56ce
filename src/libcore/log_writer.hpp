#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "libcore/log.hpp"
#include "libcore/reading.hpp"
#include "libcore/reading_sink.hpp"

namespace heatlog::core {

struct LogWriterOptions {
    std::string directory;
    std::string basename = "heatlog";
    std::chrono::hours retention = std::chrono::hours(24 * 32);
    bool fsync = true;
};

struct LoadedHistory {
    std::map<std::string, std::vector<Reading>> readings;
    std::size_t records = 0;
    std::size_t malformed = 0;
};

struct SweepResult {
    std::size_t removed = 0;
    std::size_t failed = 0;
};

// Appends readings as JSON lines to daily UTC partitions
// `<directory>/<basename>-YYYY-MM-DD.jsonl`. Partitions whose whole day lies
// before the retention horizon are deleted wholesale.
class LogWriter : public IReadingSink {
public:
    explicit LogWriter(LogWriterOptions options);
    ~LogWriter() override;

    LogWriter(const LogWriter &) = delete;
    LogWriter &operator=(const LogWriter &) = delete;

    const std::string &name() const override;
    void consume(const std::vector<ReadingEvent> &events) override;

    bool append(const std::string &source_id, const Reading &reading, std::string &error);

    LoadedHistory load_recent(std::chrono::seconds window, Clock::time_point now = Clock::now()) const;
    SweepResult sweep_expired(Clock::time_point now = Clock::now());

    std::string partition_path(Clock::time_point timestamp) const;
    std::vector<std::string> list_partitions() const;

    std::uint64_t records_written() const;
    std::uint64_t write_failures() const;

private:
    bool write_batch_locked(const std::string &path, const std::string &data, std::string &error);
    bool open_partition_locked(const std::string &path, std::string &error);
    void close_partition_locked();
    void discard_partial_locked(off_t size);
    std::optional<Clock::time_point> partition_day(const std::string &file_name) const;

    LogWriterOptions options_;
    std::string name_ = "log";
    mutable std::mutex mutex_;
    int fd_ = -1;
    std::string open_path_;
    std::uint64_t records_written_ = 0;
    std::uint64_t write_failures_ = 0;
    mutable RateLimitedLog fault_log_;
};

// One JSON line without the trailing newline.
std::string encode_log_record(const std::string &source_id, const Reading &reading);
// false for malformed lines
bool decode_log_record(const std::string &line, std::string &source_id, Reading &reading);

} // namespace heatlog::core

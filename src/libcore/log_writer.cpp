#include "libcore/log_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace heatlog::core {
namespace fs = std::filesystem;
namespace {

constexpr const char *kPartitionSuffix = ".jsonl";
constexpr auto kDay = std::chrono::hours(24);

std::string utc_date_text(Clock::time_point ts) {
    const std::time_t t = Clock::to_time_t(ts);
    std::tm tm {};
    gmtime_r(&t, &tm);
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm) == 0) {
        return "0000-00-00";
    }
    return buf;
}

Clock::time_point utc_day_start(Clock::time_point ts) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    long long day = secs / 86400;
    if (secs < 0 && secs % 86400 != 0) {
        --day;
    }
    return Clock::time_point(std::chrono::seconds(day * 86400));
}

bool write_all(int fd, const std::string &data, std::string &error) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("write failed: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

std::string encode_log_record(const std::string &source_id, const Reading &reading) {
    nlohmann::json rec = {
        {"id", source_id},
        {"timestamp", format_iso8601_utc(reading.timestamp)},
        {"status", status_name(reading.status)},
        {"unit", reading.unit},
        {"formatted", reading.formatted},
    };
    if (reading.value) {
        rec["value"] = *reading.value;
    }
    if (!reading.error.empty()) {
        rec["error"] = reading.error;
    }
    return rec.dump();
}

bool decode_log_record(const std::string &line, std::string &source_id, Reading &reading) {
    const nlohmann::json rec = nlohmann::json::parse(line, nullptr, false);
    if (rec.is_discarded() || !rec.is_object()) {
        return false;
    }

    const auto id = rec.find("id");
    const auto ts = rec.find("timestamp");
    const auto status = rec.find("status");
    if (id == rec.end() || !id->is_string() || ts == rec.end() || !ts->is_string() || status == rec.end() ||
        !status->is_string()) {
        return false;
    }

    const auto when = parse_iso8601_utc(ts->get<std::string>());
    const auto st = parse_status(status->get<std::string>());
    if (!when || !st) {
        return false;
    }

    Reading r;
    r.timestamp = *when;
    r.status = *st;
    r.unit = rec.value("unit", std::string());
    r.formatted = rec.value("formatted", std::string(kMissingValueText));
    r.error = rec.value("error", std::string());

    const auto value = rec.find("value");
    if (value != rec.end()) {
        if (!value->is_number()) {
            return false;
        }
        r.value = value->get<double>();
    }
    if (r.status == ReadingStatus::Ok && !r.value) {
        return false;
    }

    source_id = id->get<std::string>();
    reading = std::move(r);
    return true;
}

LogWriter::LogWriter(LogWriterOptions options)
    : options_(std::move(options)), fault_log_("log-writer", 3, std::chrono::seconds(60)) {}

LogWriter::~LogWriter() {
    std::lock_guard<std::mutex> guard(mutex_);
    close_partition_locked();
}

const std::string &LogWriter::name() const {
    return name_;
}

std::string LogWriter::partition_path(Clock::time_point timestamp) const {
    return (fs::path(options_.directory) / (options_.basename + "-" + utc_date_text(timestamp) + kPartitionSuffix))
        .string();
}

std::optional<Clock::time_point> LogWriter::partition_day(const std::string &file_name) const {
    const std::string prefix = options_.basename + "-";
    const std::string suffix = kPartitionSuffix;
    if (file_name.size() != prefix.size() + 10 + suffix.size() || file_name.rfind(prefix, 0) != 0 ||
        file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    const std::string date = file_name.substr(prefix.size(), 10);
    return parse_iso8601_utc(date + "T00:00:00Z");
}

void LogWriter::close_partition_locked() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    open_path_.clear();
}

bool LogWriter::open_partition_locked(const std::string &path, std::string &error) {
    if (fd_ >= 0 && open_path_ == path) {
        return true;
    }
    close_partition_locked();

    std::error_code ec;
    fs::create_directories(options_.directory, ec);
    if (ec) {
        error = "cannot create " + options_.directory + ": " + ec.message();
        return false;
    }

    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    fd_ = fd;
    open_path_ = path;

    // a fragment left by an earlier crash must not swallow the next record
    struct stat st {};
    char last = '\n';
    if (::fstat(fd_, &st) == 0 && st.st_size > 0 && ::pread(fd_, &last, 1, st.st_size - 1) == 1 && last != '\n') {
        if (!write_all(fd_, "\n", error)) {
            close_partition_locked();
            return false;
        }
    }
    return true;
}

void LogWriter::discard_partial_locked(off_t size) {
    if (size >= 0 && ::ftruncate(fd_, size) != 0) {
        fault_log_.log(LogLevel::Warn, "cannot truncate " + open_path_ + ": " + std::strerror(errno));
    }
    close_partition_locked();
}

bool LogWriter::write_batch_locked(const std::string &path, const std::string &data, std::string &error) {
    const bool rotating = !open_path_.empty() && open_path_ != path;
    if (!open_partition_locked(path, error)) {
        return false;
    }
    if (rotating) {
        log_info("log-writer", "switched to " + path);
    }

    struct stat st {};
    const off_t old_size = ::fstat(fd_, &st) == 0 ? st.st_size : -1;

    if (!write_all(fd_, data, error)) {
        discard_partial_locked(old_size);
        return false;
    }
    if (options_.fsync && ::fsync(fd_) != 0) {
        error = std::string("fsync failed: ") + std::strerror(errno);
        discard_partial_locked(old_size);
        return false;
    }
    return true;
}

bool LogWriter::append(const std::string &source_id, const Reading &reading, std::string &error) {
    const std::string line = encode_log_record(source_id, reading) + "\n";
    const std::string path = partition_path(reading.timestamp);

    std::lock_guard<std::mutex> guard(mutex_);
    if (!write_batch_locked(path, line, error)) {
        ++write_failures_;
        return false;
    }
    ++records_written_;
    return true;
}

void LogWriter::consume(const std::vector<ReadingEvent> &events) {
    // one write and one fsync per partition touched by the batch
    std::vector<std::pair<std::string, std::string>> chunks;
    std::vector<std::size_t> counts;
    for (const auto &ev : events) {
        const std::string path = partition_path(ev.reading.timestamp);
        if (chunks.empty() || chunks.back().first != path) {
            chunks.emplace_back(path, std::string());
            counts.push_back(0);
        }
        chunks.back().second += encode_log_record(ev.source_id, ev.reading);
        chunks.back().second += '\n';
        ++counts.back();
    }

    bool rotated = false;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            const bool had_partition = !open_path_.empty();
            const bool changes = had_partition && open_path_ != chunks[i].first;
            std::string error;
            if (!write_batch_locked(chunks[i].first, chunks[i].second, error)) {
                write_failures_ += counts[i];
                fault_log_.log(LogLevel::Error,
                               error + " (" + std::to_string(counts[i]) + " records lost from the log)");
                continue;
            }
            records_written_ += counts[i];
            rotated = rotated || changes;
        }
    }

    if (rotated) {
        sweep_expired();
    }
}

std::vector<std::string> LogWriter::list_partitions() const {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(options_.directory, ec);
    if (ec) {
        return out;
    }
    for (const auto &entry : it) {
        const std::string file_name = entry.path().filename().string();
        if (partition_day(file_name)) {
            out.push_back(entry.path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

LoadedHistory LogWriter::load_recent(std::chrono::seconds window, Clock::time_point now) const {
    LoadedHistory out;

    const auto retention = std::chrono::duration_cast<std::chrono::seconds>(options_.retention);
    const Clock::time_point since = now - std::min(window, retention);

    for (const auto &path : list_partitions()) {
        const auto day = partition_day(fs::path(path).filename().string());
        if (!day || *day + kDay <= since) {
            continue;
        }

        std::ifstream in(path);
        if (!in) {
            fault_log_.log(LogLevel::Warn, "cannot read " + path);
            continue;
        }
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) {
                continue;
            }
            std::string id;
            Reading r;
            if (!decode_log_record(line, id, r)) {
                ++out.malformed;
                continue;
            }
            if (r.timestamp < since || r.timestamp > now) {
                continue;
            }
            out.readings[id].push_back(std::move(r));
            ++out.records;
        }
    }

    for (auto &item : out.readings) {
        std::stable_sort(item.second.begin(), item.second.end(), [](const Reading &a, const Reading &b) {
            return a.timestamp < b.timestamp;
        });
    }
    if (out.malformed > 0) {
        log_warn("log-writer", "skipped " + std::to_string(out.malformed) + " malformed log records");
    }
    return out;
}

SweepResult LogWriter::sweep_expired(Clock::time_point now) {
    SweepResult result;
    const Clock::time_point horizon = now - options_.retention;

    for (const auto &path : list_partitions()) {
        const auto day = partition_day(fs::path(path).filename().string());
        if (!day || utc_day_start(*day) + kDay > horizon) {
            continue;
        }

        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (open_path_ == path) {
                close_partition_locked();
            }
        }

        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++result.removed;
            log_info("log-writer", "removed expired partition " + path);
        } else if (ec) {
            ++result.failed;
            fault_log_.log(LogLevel::Warn, "cannot remove " + path + ": " + ec.message());
        }
    }
    return result;
}

std::uint64_t LogWriter::records_written() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return records_written_;
}

std::uint64_t LogWriter::write_failures() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return write_failures_;
}

} // namespace heatlog::core

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "libcore/log.hpp"
#include "libcore/reading.hpp"
#include "libcore/work_queue.hpp"

namespace heatlog::core {

struct ReadingEvent {
    std::string source_id;
    Reading reading;
};

class IReadingSink {
public:
    virtual ~IReadingSink() = default;
    virtual const std::string &name() const = 0;
    // Called from one background thread, batches keep per-source order.
    virtual void consume(const std::vector<ReadingEvent> &events) = 0;
};

struct SinkCounters {
    std::uint64_t submitted = 0;
    std::uint64_t delivered = 0;
    std::uint64_t dropped = 0;
    std::uint64_t failed_batches = 0;
    std::size_t queued = 0;
};

class AsyncSink {
public:
    AsyncSink(IReadingSink &sink, std::size_t capacity);
    ~AsyncSink();

    AsyncSink(const AsyncSink &) = delete;
    AsyncSink &operator=(const AsyncSink &) = delete;

    void start();
    bool submit(ReadingEvent event);
    // Waits up to `grace` for the queue to drain, then discards the rest.
    void stop(std::chrono::milliseconds grace);

    const std::string &name() const {
        return sink_.name();
    }
    SinkCounters counters() const;

private:
    void run();

    IReadingSink &sink_;
    BoundedQueue<ReadingEvent> queue_;
    std::thread worker_;
    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    bool worker_done_ = true;
    std::atomic<bool> running_{false};
    std::atomic<bool> abandon_{false};
    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> failed_batches_{0};
    std::atomic<std::uint64_t> discarded_{0};
    RateLimitedLog drop_log_;
    RateLimitedLog fail_log_;
};

} // namespace heatlog::core

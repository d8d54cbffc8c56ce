#include "libcore/reading_sink.hpp"

#include <exception>
#include <utility>

namespace heatlog::core {
namespace {
constexpr std::size_t kBatchSize = 64;
constexpr auto kPopTimeout = std::chrono::milliseconds(200);
} // namespace

AsyncSink::AsyncSink(IReadingSink &sink, std::size_t capacity)
    : sink_(sink),
      queue_(capacity),
      drop_log_("sink." + sink.name(), 1, std::chrono::seconds(60)),
      fail_log_("sink." + sink.name(), 3, std::chrono::seconds(60)) {}

AsyncSink::~AsyncSink() {
    stop(std::chrono::milliseconds(0));
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    queue_.reopen();
    abandon_.store(false);
    {
        std::lock_guard<std::mutex> guard(worker_mutex_);
        worker_done_ = false;
    }
    worker_ = std::thread([this]() {
        run();
    });
}

bool AsyncSink::submit(ReadingEvent event) {
    bool dropped_oldest = false;
    if (!queue_.push(std::move(event), dropped_oldest)) {
        return false;
    }
    ++submitted_;
    if (dropped_oldest) {
        drop_log_.log(LogLevel::Warn,
                      "queue full, dropped oldest reading (" + std::to_string(queue_.dropped()) + " dropped so far)");
    }
    return true;
}

void AsyncSink::run() {
    std::vector<ReadingEvent> batch;
    while (queue_.pop_batch(batch, kBatchSize, kPopTimeout)) {
        if (batch.empty()) {
            continue;
        }
        if (abandon_.load()) {
            discarded_ += batch.size();
            continue;
        }
        try {
            sink_.consume(batch);
            delivered_ += batch.size();
        } catch (const std::exception &e) {
            ++failed_batches_;
            fail_log_.log(LogLevel::Error, std::string("consume failed: ") + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> guard(worker_mutex_);
        worker_done_ = true;
    }
    worker_cv_.notify_all();
}

void AsyncSink::stop(std::chrono::milliseconds grace) {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();

    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(worker_mutex_);
        drained = worker_cv_.wait_for(lock, grace, [this]() {
            return worker_done_;
        });
    }
    if (drained) {
        if (worker_.joinable()) {
            worker_.join();
        }
        return;
    }

    abandon_.store(true);
    const std::size_t left = queue_.clear();
    discarded_ += left;
    log_warn("sink." + sink_.name(),
             "drain grace expired, discarded " + std::to_string(left) + " queued readings");
}

SinkCounters AsyncSink::counters() const {
    SinkCounters c;
    c.submitted = submitted_.load();
    c.delivered = delivered_.load();
    c.dropped = queue_.dropped() + discarded_.load();
    c.failed_batches = failed_batches_.load();
    c.queued = queue_.size();
    return c;
}

} // namespace heatlog::core

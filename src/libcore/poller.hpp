#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "libcore/measurement_store.hpp"
#include "libcore/reading_sink.hpp"
#include "libcore/signal_source.hpp"

namespace heatlog::core {

struct PollerOptions {
    std::chrono::milliseconds read_timeout = std::chrono::milliseconds(900);
    std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(2000);
};

struct SourceRuntime {
    std::unique_ptr<SignalSource> source;
    std::thread worker;
    std::atomic<std::uint64_t> cycles{0};
    std::atomic<std::uint64_t> failures{0};
};

class Poller {
public:
    Poller(MeasurementStore &store, PollerOptions options);
    ~Poller();

    Poller(const Poller &) = delete;
    Poller &operator=(const Poller &) = delete;

    void add(std::unique_ptr<SignalSource> source);
    void add_sink(AsyncSink &sink);

    void start();
    // Lets in-flight reads finish, then shuts the reader threads down.
    void stop();
    bool running() const;

    void poll_all_once();

    const std::vector<std::shared_ptr<SourceRuntime>> &runtimes() const;

private:
    void poll_source(SourceRuntime &rt);
    void run_source_loop(SourceRuntime &rt);

    MeasurementStore &store_;
    PollerOptions options_;
    std::vector<std::shared_ptr<SourceRuntime>> runtimes_;
    std::vector<AsyncSink *> sinks_;
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool running_ = false;
};

} // namespace heatlog::core

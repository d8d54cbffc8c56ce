#include "libcore/poller.hpp"

#include <exception>
#include <utility>

#include "libcore/log.hpp"

namespace heatlog::core {

Poller::Poller(MeasurementStore &store, PollerOptions options) : store_(store), options_(options) {}

Poller::~Poller() {
    stop();
}

void Poller::add(std::unique_ptr<SignalSource> source) {
    if (!source) {
        return;
    }
    store_.register_source(source->info());
    auto rt = std::make_shared<SourceRuntime>();
    rt->source = std::move(source);
    runtimes_.push_back(std::move(rt));
}

void Poller::add_sink(AsyncSink &sink) {
    sinks_.push_back(&sink);
}

void Poller::poll_source(SourceRuntime &rt) {
    Reading reading;
    try {
        reading = rt.source->poll(options_.read_timeout);
    } catch (const std::exception &e) {
        reading = make_error_reading(rt.source->info().unit, std::string("poll exception: ") + e.what(), Clock::now());
    }

    ++rt.cycles;
    if (!reading.ok()) {
        ++rt.failures;
    }

    store_.update(rt.source->id(), reading);

    if (log_enabled(LogLevel::Debug)) {
        if (reading.ok()) {
            log_debug("poller", "source[" + rt.source->id() + "]=" + reading.formatted + " " + reading.unit);
        } else {
            log_debug("poller", "source[" + rt.source->id() + "] error: " + reading.error);
        }
    }

    for (AsyncSink *sink : sinks_) {
        sink->submit(ReadingEvent{rt.source->id(), reading});
    }
}

void Poller::poll_all_once() {
    for (auto &rt : runtimes_) {
        if (rt && rt->source) {
            poll_source(*rt);
        }
    }
}

void Poller::start() {
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }

    try {
        for (auto &rt : runtimes_) {
            if (!rt || !rt->source) {
                continue;
            }
            rt->source->resume();
            rt->worker = std::thread([this, rt]() {
                run_source_loop(*rt);
            });
        }
    } catch (...) {
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            running_ = false;
        }
        state_cv_.notify_all();
        for (auto &rt : runtimes_) {
            if (rt && rt->worker.joinable()) {
                rt->worker.join();
            }
        }
        throw;
    }
    log_info("poller", "polling " + std::to_string(runtimes_.size()) + " sources");
}

void Poller::stop() {
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    state_cv_.notify_all();

    for (auto &rt : runtimes_) {
        if (rt && rt->worker.joinable()) {
            rt->worker.join();
        }
    }
    for (auto &rt : runtimes_) {
        if (rt && rt->source) {
            rt->source->shutdown(options_.shutdown_grace);
        }
    }
}

bool Poller::running() const {
    std::lock_guard<std::mutex> guard(state_mutex_);
    return running_;
}

void Poller::run_source_loop(SourceRuntime &rt) {
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(rt.source->poll_interval());
    auto next_deadline = std::chrono::steady_clock::now();

    while (true) {
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            if (!running_) {
                break;
            }
        }

        poll_source(rt);

        next_deadline += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_deadline <= now) {
            const auto lag = now - next_deadline;
            const auto missed = (lag / interval) + 1;
            next_deadline += interval * missed;
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        if (!running_) {
            break;
        }
        state_cv_.wait_until(lock, next_deadline, [this]() {
            return !running_;
        });
        if (!running_) {
            break;
        }
    }
}

const std::vector<std::shared_ptr<SourceRuntime>> &Poller::runtimes() const {
    return runtimes_;
}

} // namespace heatlog::core

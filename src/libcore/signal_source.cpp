#include "libcore/signal_source.hpp"

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <system_error>
#include <utility>

#include "libcore/log.hpp"

namespace heatlog::core {

struct SignalSource::ReadSlot {
    std::mutex mutex;
    std::condition_variable cv;
    std::unique_ptr<ISensorDriver> driver;
    std::uint64_t requested = 0;
    std::uint64_t completed = 0;
    std::chrono::milliseconds timeout{0};
    DriverSample result;
    bool stop = false;
    bool running = false;
};

SignalSource::SignalSource(SourceInfo info,
                           double offset,
                           std::chrono::seconds poll_interval,
                           std::unique_ptr<ISensorDriver> driver)
    : info_(std::move(info)), offset_(offset), poll_interval_(poll_interval), slot_(std::make_shared<ReadSlot>()) {
    if (poll_interval_ < std::chrono::seconds(1)) {
        poll_interval_ = std::chrono::seconds(1);
    }
    description_ = driver ? driver->describe() : std::string("no driver");
    slot_->driver = std::move(driver);
}

SignalSource::~SignalSource() {
    shutdown(std::chrono::seconds(1));
}

void SignalSource::reader_loop(std::shared_ptr<ReadSlot> slot) {
    std::unique_lock<std::mutex> lock(slot->mutex);
    while (true) {
        slot->cv.wait(lock, [&slot]() {
            return slot->stop || slot->requested > slot->completed;
        });
        if (slot->stop) {
            break;
        }

        const std::uint64_t ticket = slot->requested;
        const auto timeout = slot->timeout;
        lock.unlock();

        DriverSample sample;
        try {
            sample = slot->driver->read(timeout);
        } catch (const std::exception &e) {
            sample.ok = false;
            sample.error = std::string("driver exception: ") + e.what();
        } catch (...) {
            sample.ok = false;
            sample.error = "driver exception: unknown";
        }

        lock.lock();
        slot->result = std::move(sample);
        slot->completed = ticket;
        slot->cv.notify_all();
    }
    slot->running = false;
    slot->cv.notify_all();
}

void SignalSource::ensure_reader() {
    // an abandoned read that came back after resume() keeps serving the slot
    if (slot_->running) {
        return;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    auto slot = slot_;
    reader_ = std::thread([slot]() {
        reader_loop(slot);
    });
    slot_->running = true;
}

Reading SignalSource::poll(std::chrono::milliseconds timeout) {
    const auto fail = [this](const std::string &error) {
        return make_error_reading(info_.unit, error, Clock::now());
    };

    if (!slot_->driver) {
        return fail("no driver");
    }

    DriverSample sample;
    {
        std::unique_lock<std::mutex> lock(slot_->mutex);
        if (slot_->stop) {
            return fail("source is shut down");
        }
        if (slot_->requested != slot_->completed) {
            return fail("previous read still in progress");
        }
        try {
            ensure_reader();
        } catch (const std::system_error &e) {
            return fail(std::string("cannot start reader: ") + e.what());
        }

        const std::uint64_t ticket = ++slot_->requested;
        slot_->timeout = timeout;
        slot_->cv.notify_all();

        const bool done = slot_->cv.wait_for(lock, timeout, [this, ticket]() {
            return slot_->completed >= ticket || !slot_->running;
        });
        if (!done || slot_->completed < ticket) {
            return fail("read timed out after " + std::to_string(timeout.count()) + " ms");
        }
        sample = slot_->result;
    }

    if (!sample.ok) {
        return fail(sample.error.empty() ? std::string("read failed") : sample.error);
    }
    return make_ok_reading(sample.value + offset_, info_.unit, info_.decimals, Clock::now());
}

bool SignalSource::shutdown(std::chrono::milliseconds grace) {
    bool exited = true;
    {
        std::unique_lock<std::mutex> lock(slot_->mutex);
        if (slot_->stop && !reader_.joinable()) {
            return !slot_->running;
        }
        slot_->stop = true;
        slot_->cv.notify_all();
        exited = slot_->cv.wait_for(lock, grace, [this]() {
            return !slot_->running;
        });
    }

    if (exited) {
        if (reader_.joinable()) {
            reader_.join();
        }
        return true;
    }
    log_warn("source." + info_.id, "read still running after shutdown grace, abandoning it");
    if (reader_.joinable()) {
        reader_.detach();
    }
    return false;
}

void SignalSource::resume() {
    std::lock_guard<std::mutex> lock(slot_->mutex);
    slot_->stop = false;
}

} // namespace heatlog::core

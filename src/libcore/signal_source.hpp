#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "libcore/measurement_store.hpp"
#include "libcore/reading.hpp"
#include "libcore/sensor_driver.hpp"

namespace heatlog::core {

class SignalSource {
public:
    SignalSource(SourceInfo info,
                 double offset,
                 std::chrono::seconds poll_interval,
                 std::unique_ptr<ISensorDriver> driver);
    ~SignalSource();

    SignalSource(const SignalSource &) = delete;
    SignalSource &operator=(const SignalSource &) = delete;

    const SourceInfo &info() const {
        return info_;
    }
    const std::string &id() const {
        return info_.id;
    }
    std::chrono::seconds poll_interval() const {
        return poll_interval_;
    }
    const std::string &description() const {
        return description_;
    }

    Reading poll(std::chrono::milliseconds timeout);

    // Stops the reader thread. A read still stuck after `grace` is abandoned
    // (the thread is detached and finishes on its own); returns false then.
    bool shutdown(std::chrono::milliseconds grace);
    void resume();

private:
    struct ReadSlot;

    void ensure_reader();
    static void reader_loop(std::shared_ptr<ReadSlot> slot);

    SourceInfo info_;
    double offset_;
    std::chrono::seconds poll_interval_;
    std::string description_;
    std::shared_ptr<ReadSlot> slot_;
    std::thread reader_;
};

} // namespace heatlog::core

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "libcore/sensor_driver.hpp"

namespace heatlog::core {

struct TsicModel {
    int number;
    const char *name;
    int resolution_bits;
    double low_celsius;
    double high_celsius;
};

const TsicModel *tsic_model_from_number(int number);
double tsic_bytes_to_celsius(const TsicModel &model, std::uint8_t high_byte, std::uint8_t low_byte);

enum class ZacWireStatus {
    Ok,
    ParityError,
    BitCountError,
};

const char *zacwire_status_name(ZacWireStatus status);

struct ZacWirePacket {
    ZacWireStatus status = ZacWireStatus::Ok;
    std::vector<std::uint8_t> bytes;
};

class ZacWireDecoder {
public:
    // `high` is the line level after the edge.
    std::optional<ZacWirePacket> on_edge(bool high, std::uint64_t tick_us);
    std::optional<ZacWirePacket> on_idle();

    bool awaiting_idle() const {
        return idle_armed_;
    }

    void reset();

private:
    std::optional<ZacWirePacket> take_packet(ZacWireStatus status);
    void reset_packet();

    std::optional<std::vector<std::uint8_t>> bytes_;
    std::optional<std::uint64_t> strobe_us_;
    std::optional<std::uint64_t> last_low_tick_;
    std::optional<std::uint64_t> last_high_tick_;
    int bit_count_ = 0;
    int parity_ = 0;
    bool idle_armed_ = false;
};

class ChannelLease {
public:
    explicit ChannelLease(std::shared_ptr<std::timed_mutex> mutex) : mutex_(std::move(mutex)) {}

    ~ChannelLease() {
        if (mutex_) {
            mutex_->unlock();
        }
    }

    ChannelLease(ChannelLease &&other) noexcept : mutex_(std::move(other.mutex_)) {}
    ChannelLease &operator=(ChannelLease &&) = delete;
    ChannelLease(const ChannelLease &) = delete;
    ChannelLease &operator=(const ChannelLease &) = delete;

private:
    std::shared_ptr<std::timed_mutex> mutex_;
};

class ChannelLockRegistry {
public:
    std::optional<ChannelLease> acquire(const std::string &channel, std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::timed_mutex>> locks_;
};

struct GpioEdge {
    bool rising = false;
    std::uint64_t timestamp_us = 0;
};

class GpioEventLine {
public:
    enum class WaitResult {
        Event,
        Timeout,
        Failed,
    };

    GpioEventLine(const std::string &chip_path, int line, const std::string &consumer);
    ~GpioEventLine();

    GpioEventLine(const GpioEventLine &) = delete;
    GpioEventLine &operator=(const GpioEventLine &) = delete;

    WaitResult wait(std::chrono::microseconds timeout, GpioEdge &edge, std::string &error);

private:
    int chip_fd_ = -1;
    int event_fd_ = -1;
};

class TsicSensorDriver : public ISensorDriver {
public:
    TsicSensorDriver(std::shared_ptr<ChannelLockRegistry> channels,
                     std::string chip_path,
                     int gpio,
                     const TsicModel &model);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    std::shared_ptr<ChannelLockRegistry> channels_;
    std::string chip_path_;
    int gpio_;
    const TsicModel &model_;
    std::string channel_key_;
};

} // namespace heatlog::core

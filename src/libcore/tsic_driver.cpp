#include "libcore/tsic_driver.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <linux/gpio.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace heatlog::core {
namespace {

constexpr std::uint64_t kPacketStartHighUs = 1000;
constexpr std::uint64_t kByteStartHighUs = 150;
constexpr auto kIdleTimeout = std::chrono::microseconds(1000);

constexpr TsicModel kTsicModels[] = {
    {206, "TSic 206", 11, -50.0, 150.0},
    {306, "TSic 306", 11, -50.0, 150.0},
    {506, "TSic 506", 11, -10.0, 60.0},
    {716, "TSic 716", 14, -10.0, 60.0},
};

std::string errno_text(const std::string &what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

const TsicModel *tsic_model_from_number(int number) {
    for (const auto &m : kTsicModels) {
        if (m.number == number) {
            return &m;
        }
    }
    return nullptr;
}

double tsic_bytes_to_celsius(const TsicModel &model, std::uint8_t high_byte, std::uint8_t low_byte) {
    const double raw = static_cast<double>(high_byte) * 256.0 + static_cast<double>(low_byte);
    const double full_scale = static_cast<double>((1 << model.resolution_bits) - 1);
    return raw / full_scale * (model.high_celsius - model.low_celsius) + model.low_celsius;
}

const char *zacwire_status_name(ZacWireStatus status) {
    switch (status) {
    case ZacWireStatus::Ok:
        return "ok";
    case ZacWireStatus::ParityError:
        return "parity error";
    case ZacWireStatus::BitCountError:
        return "bit count error";
    }
    return "unknown";
}

void ZacWireDecoder::reset() {
    reset_packet();
    last_low_tick_.reset();
    last_high_tick_.reset();
}

void ZacWireDecoder::reset_packet() {
    bytes_.reset();
    strobe_us_.reset();
    bit_count_ = 0;
    parity_ = 0;
    idle_armed_ = false;
}

std::optional<ZacWirePacket> ZacWireDecoder::take_packet(ZacWireStatus status) {
    if (!bytes_) {
        return std::nullopt;
    }
    ZacWirePacket packet;
    packet.status = status;
    packet.bytes = std::move(*bytes_);
    bytes_.reset();
    return packet;
}

std::optional<ZacWirePacket> ZacWireDecoder::on_edge(bool high, std::uint64_t tick_us) {
    std::optional<ZacWirePacket> out;

    if (!high) {
        if (last_high_tick_) {
            const std::uint64_t high_us = tick_us - *last_high_tick_;
            if (high_us > kPacketStartHighUs) {
                out = take_packet(ZacWireStatus::Ok);
                bytes_ = std::vector<std::uint8_t>{0};
                strobe_us_.reset();
                bit_count_ = 0;
                parity_ = 0;
            } else if (bytes_ && high_us > kByteStartHighUs) {
                if (bit_count_ == 9) {
                    bytes_->push_back(0);
                    strobe_us_.reset();
                    bit_count_ = 0;
                    parity_ = 0;
                } else {
                    out = take_packet(ZacWireStatus::BitCountError);
                    reset_packet();
                }
            }
        }
        last_low_tick_ = tick_us;
        return out;
    }

    if (last_low_tick_ && bytes_) {
        const std::uint64_t low_us = tick_us - *last_low_tick_;
        if (!strobe_us_) {
            strobe_us_ = low_us;
        } else {
            // long low phase is a 0 bit
            const int bit = low_us > *strobe_us_ ? 0 : 1;
            if (bit_count_ < 8) {
                bytes_->back() = static_cast<std::uint8_t>((bytes_->back() << 1) | bit);
            }
            ++bit_count_;
            parity_ += bit;

            if (bit_count_ == 9) {
                if (parity_ % 2 != 0) {
                    out = take_packet(ZacWireStatus::ParityError);
                    reset_packet();
                } else {
                    idle_armed_ = true;
                }
            } else if (bit_count_ > 9) {
                out = take_packet(ZacWireStatus::BitCountError);
                reset_packet();
            }
        }
    }
    last_high_tick_ = tick_us;
    return out;
}

std::optional<ZacWirePacket> ZacWireDecoder::on_idle() {
    // silence in the middle of a byte leaves a truncated last byte
    auto out = take_packet(bit_count_ == 9 ? ZacWireStatus::Ok : ZacWireStatus::BitCountError);
    reset_packet();
    return out;
}

std::optional<ChannelLease> ChannelLockRegistry::acquire(const std::string &channel,
                                                         std::chrono::milliseconds timeout) {
    std::shared_ptr<std::timed_mutex> m;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto &slot = locks_[channel];
        if (!slot) {
            slot = std::make_shared<std::timed_mutex>();
        }
        m = slot;
    }

    if (!m->try_lock_for(timeout)) {
        return std::nullopt;
    }
    return std::optional<ChannelLease>(std::in_place, std::move(m));
}

GpioEventLine::GpioEventLine(const std::string &chip_path, int line, const std::string &consumer) {
    chip_fd_ = ::open(chip_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (chip_fd_ < 0) {
        throw std::runtime_error(errno_text("cannot open " + chip_path));
    }

    struct gpioevent_request req {};
    req.lineoffset = static_cast<__u32>(line);
    req.handleflags = GPIOHANDLE_REQUEST_INPUT;
    req.eventflags = GPIOEVENT_REQUEST_BOTH_EDGES;
    std::strncpy(req.consumer_label, consumer.c_str(), sizeof(req.consumer_label) - 1);

    if (::ioctl(chip_fd_, GPIO_GET_LINEEVENT_IOCTL, &req) < 0) {
        const std::string error = errno_text("cannot request events for line " + std::to_string(line));
        ::close(chip_fd_);
        chip_fd_ = -1;
        throw std::runtime_error(error);
    }
    event_fd_ = req.fd;
}

GpioEventLine::~GpioEventLine() {
    if (event_fd_ >= 0) {
        ::close(event_fd_);
    }
    if (chip_fd_ >= 0) {
        ::close(chip_fd_);
    }
}

GpioEventLine::WaitResult GpioEventLine::wait(std::chrono::microseconds timeout, GpioEdge &edge, std::string &error) {
    if (timeout.count() < 0) {
        timeout = std::chrono::microseconds(0);
    }

    struct pollfd pfd {};
    pfd.fd = event_fd_;
    pfd.events = POLLIN | POLLPRI;

    struct timespec ts {};
    ts.tv_sec = static_cast<time_t>(timeout.count() / 1000000);
    ts.tv_nsec = static_cast<long>((timeout.count() % 1000000) * 1000);

    const int rc = ::ppoll(&pfd, 1, &ts, nullptr);
    if (rc < 0) {
        if (errno == EINTR) {
            return WaitResult::Timeout;
        }
        error = errno_text("gpio poll failed");
        return WaitResult::Failed;
    }
    if (rc == 0) {
        return WaitResult::Timeout;
    }

    struct gpioevent_data data {};
    const ssize_t n = ::read(event_fd_, &data, sizeof(data));
    if (n != static_cast<ssize_t>(sizeof(data))) {
        error = n < 0 ? errno_text("gpio event read failed") : std::string("short gpio event read");
        return WaitResult::Failed;
    }

    edge.rising = data.id == GPIOEVENT_EVENT_RISING_EDGE;
    edge.timestamp_us = static_cast<std::uint64_t>(data.timestamp / 1000);
    return WaitResult::Event;
}

TsicSensorDriver::TsicSensorDriver(std::shared_ptr<ChannelLockRegistry> channels,
                                   std::string chip_path,
                                   int gpio,
                                   const TsicModel &model)
    : channels_(std::move(channels)), chip_path_(std::move(chip_path)), gpio_(gpio), model_(model) {
    channel_key_ = chip_path_ + ":" + std::to_string(gpio_);
}

DriverSample TsicSensorDriver::read(std::chrono::milliseconds timeout) {
    using SteadyClock = std::chrono::steady_clock;

    DriverSample s;
    const auto deadline = SteadyClock::now() + timeout;

    auto lease = channels_->acquire(channel_key_, timeout);
    if (!lease) {
        s.error = "gpio channel " + channel_key_ + " busy";
        return s;
    }

    try {
        GpioEventLine line(chip_path_, gpio_, "heatlog-tsic");
        ZacWireDecoder decoder;
        std::string last_problem = "no packet received";

        while (true) {
            const auto now = SteadyClock::now();
            if (now >= deadline) {
                break;
            }
            auto wait = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
            if (decoder.awaiting_idle() && wait > kIdleTimeout) {
                wait = kIdleTimeout;
            }

            GpioEdge edge;
            std::optional<ZacWirePacket> packet;
            switch (line.wait(wait, edge, s.error)) {
            case GpioEventLine::WaitResult::Failed:
                return s;
            case GpioEventLine::WaitResult::Timeout:
                if (decoder.awaiting_idle()) {
                    packet = decoder.on_idle();
                }
                break;
            case GpioEventLine::WaitResult::Event:
                packet = decoder.on_edge(edge.rising, edge.timestamp_us);
                break;
            }

            if (!packet) {
                continue;
            }
            if (packet->status == ZacWireStatus::Ok && packet->bytes.size() == 2) {
                s.ok = true;
                s.value = tsic_bytes_to_celsius(model_, packet->bytes[0], packet->bytes[1]);
                return s;
            }
            last_problem = std::string(zacwire_status_name(packet->status)) + " (" +
                           std::to_string(packet->bytes.size()) + " bytes)";
        }

        s.error = "no valid TSIC packet within timeout: " + last_problem;
    } catch (const std::runtime_error &e) {
        s.error = e.what();
    }
    return s;
}

std::string TsicSensorDriver::describe() const {
    return std::string(model_.name) + " on " + channel_key_;
}

} // namespace heatlog::core

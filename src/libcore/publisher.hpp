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
#include "libcore/reading_sink.hpp"

namespace heatlog::core {

class IBrokerSession {
public:
    virtual ~IBrokerSession() = default;
    virtual bool connect(std::string &error) = 0;
    virtual bool service(std::chrono::milliseconds timeout, std::string &error) = 0;
    virtual bool publish(const std::string &topic, const std::string &payload, bool retain, std::string &error) = 0;
    virtual void disconnect() = 0;
};

enum class PublisherState {
    Disabled,
    Disconnected,
    Connecting,
    Connected,
};

const char *publisher_state_name(PublisherState state);

struct PublisherOptions {
    std::string base_topic = "heatlog";
    bool retain = true;
    std::chrono::milliseconds reconnect_min = std::chrono::seconds(1);
    std::chrono::milliseconds reconnect_max = std::chrono::seconds(60);
    std::chrono::milliseconds service_slice = std::chrono::milliseconds(100);
};

struct PublisherCounters {
    std::uint64_t published = 0;
    std::uint64_t dropped = 0;
    std::uint64_t failed = 0;
    std::uint64_t connects = 0;
};

std::string build_publish_payload(const Reading &reading);

class Publisher : public IReadingSink {
public:
    // A null session disables the publisher.
    Publisher(PublisherOptions options, std::unique_ptr<IBrokerSession> session);
    ~Publisher() override;

    Publisher(const Publisher &) = delete;
    Publisher &operator=(const Publisher &) = delete;

    const std::string &name() const override;
    void consume(const std::vector<ReadingEvent> &events) override;

    bool publish(const std::string &source_id, const Reading &reading);

    void start();
    void stop();

    PublisherState state() const;
    bool wait_for_state(PublisherState wanted, std::chrono::milliseconds timeout) const;
    PublisherCounters counters() const;
    std::string topic_for(const std::string &source_id) const;

private:
    void run();
    void set_state(PublisherState state);
    bool sleep_for(std::chrono::milliseconds delay);

    PublisherOptions options_;
    std::unique_ptr<IBrokerSession> session_;
    std::string name_ = "mqtt";

    std::mutex session_mutex_;
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    PublisherState state_;
    bool running_ = false;
    bool link_lost_ = false;
    std::thread worker_;

    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> connects_{0};
    RateLimitedLog drop_log_;
    RateLimitedLog link_log_;
};

} // namespace heatlog::core

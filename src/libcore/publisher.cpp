#include "libcore/publisher.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

namespace heatlog::core {

const char *publisher_state_name(PublisherState state) {
    switch (state) {
    case PublisherState::Disabled:
        return "disabled";
    case PublisherState::Disconnected:
        return "disconnected";
    case PublisherState::Connecting:
        return "connecting";
    case PublisherState::Connected:
        return "connected";
    }
    return "disabled";
}

std::string build_publish_payload(const Reading &reading) {
    nlohmann::json payload = {
        {"status", reading.ok() ? "ok" : "error"},
        {"timestamp", format_iso8601_utc(reading.timestamp)},
        {"unit", reading.unit},
        {"formatted", reading.ok() ? reading.formatted : std::string(kMissingValueText)},
    };
    if (reading.ok()) {
        payload["value"] = *reading.value;
    }
    return payload.dump();
}

Publisher::Publisher(PublisherOptions options, std::unique_ptr<IBrokerSession> session)
    : options_(std::move(options)),
      session_(std::move(session)),
      state_(session_ ? PublisherState::Disconnected : PublisherState::Disabled),
      drop_log_("mqtt", 1, std::chrono::seconds(60)),
      link_log_("mqtt", 2, std::chrono::seconds(60)) {
    if (options_.reconnect_min.count() < 1) {
        options_.reconnect_min = std::chrono::milliseconds(1);
    }
    if (options_.reconnect_max < options_.reconnect_min) {
        options_.reconnect_max = options_.reconnect_min;
    }
    while (!options_.base_topic.empty() && options_.base_topic.back() == '/') {
        options_.base_topic.pop_back();
    }
}

Publisher::~Publisher() {
    stop();
}

const std::string &Publisher::name() const {
    return name_;
}

std::string Publisher::topic_for(const std::string &source_id) const {
    if (options_.base_topic.empty()) {
        return source_id;
    }
    return options_.base_topic + "/" + source_id;
}

void Publisher::set_state(PublisherState state) {
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        state_ = state;
    }
    state_cv_.notify_all();
}

PublisherState Publisher::state() const {
    std::lock_guard<std::mutex> guard(state_mutex_);
    return state_;
}

bool Publisher::wait_for_state(PublisherState wanted, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this, wanted]() {
        return state_ == wanted;
    });
}

PublisherCounters Publisher::counters() const {
    PublisherCounters c;
    c.published = published_.load();
    c.dropped = dropped_.load();
    c.failed = failed_.load();
    c.connects = connects_.load();
    return c;
}

bool Publisher::publish(const std::string &source_id, const Reading &reading) {
    if (!session_) {
        return false;
    }
    if (state() != PublisherState::Connected) {
        ++dropped_;
        drop_log_.log(LogLevel::Debug, "not connected, dropping reading of " + source_id);
        return false;
    }

    const std::string payload = build_publish_payload(reading);
    std::string error;
    bool ok = false;
    {
        std::lock_guard<std::mutex> guard(session_mutex_);
        ok = session_->publish(topic_for(source_id), payload, options_.retain, error);
    }
    if (!ok) {
        ++failed_;
        link_log_.log(LogLevel::Warn, "publish to " + topic_for(source_id) + " failed: " + error);
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            link_lost_ = true;
        }
        state_cv_.notify_all();
        return false;
    }
    ++published_;
    return true;
}

void Publisher::consume(const std::vector<ReadingEvent> &events) {
    for (const auto &ev : events) {
        publish(ev.source_id, ev.reading);
    }
}

void Publisher::start() {
    if (!session_) {
        log_info("mqtt", "no broker configured, publishing disabled");
        return;
    }
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        link_lost_ = false;
    }
    worker_ = std::thread([this]() {
        run();
    });
}

void Publisher::stop() {
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    state_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> guard(session_mutex_);
    session_->disconnect();
    set_state(PublisherState::Disconnected);
}

bool Publisher::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, delay, [this]() {
        return !running_;
    });
    return running_;
}

void Publisher::run() {
    auto delay = options_.reconnect_min;

    while (true) {
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            if (!running_) {
                break;
            }
        }

        if (state() != PublisherState::Connected) {
            set_state(PublisherState::Connecting);
            std::string error;
            bool ok = false;
            {
                std::lock_guard<std::mutex> guard(session_mutex_);
                ok = session_->connect(error);
            }
            if (ok) {
                {
                    std::lock_guard<std::mutex> guard(state_mutex_);
                    link_lost_ = false;
                }
                ++connects_;
                set_state(PublisherState::Connected);
                log_info("mqtt", "connected");
                delay = options_.reconnect_min;
                continue;
            }

            set_state(PublisherState::Disconnected);
            link_log_.log(LogLevel::Warn,
                          "connect failed: " + error + ", retry in " + std::to_string(delay.count()) + " ms");
            if (!sleep_for(delay)) {
                break;
            }
            delay = std::min(delay * 2, options_.reconnect_max);
            continue;
        }

        std::string error;
        bool alive = false;
        {
            std::lock_guard<std::mutex> guard(session_mutex_);
            alive = session_->service(options_.service_slice, error);
        }
        bool lost = false;
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            lost = link_lost_;
        }
        if (alive && !lost) {
            continue;
        }

        if (error.empty()) {
            error = "publish failed";
        }
        {
            std::lock_guard<std::mutex> guard(session_mutex_);
            session_->disconnect();
        }
        set_state(PublisherState::Disconnected);
        link_log_.log(LogLevel::Warn, "connection lost: " + error);
        if (!sleep_for(delay)) {
            break;
        }
    }
}

} // namespace heatlog::core

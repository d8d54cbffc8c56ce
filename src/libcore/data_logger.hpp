#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "libcore/daemon_config.hpp"
#include "libcore/log_writer.hpp"
#include "libcore/measurement_store.hpp"
#include "libcore/poller.hpp"
#include "libcore/publisher.hpp"
#include "libcore/reading_sink.hpp"
#include "libcore/sensor_driver.hpp"
#include "libcore/status_report.hpp"
#include "libcore/tsic_driver.hpp"

namespace heatlog::core {

HistoryPolicy history_policy_from(const DaemonConfig &cfg);
LogWriterOptions log_writer_options_from(const DaemonConfig &cfg);
PublisherOptions publisher_options_from(const MqttConfig &cfg);

// Throws ConfigError for unknown driver kinds.
std::unique_ptr<ISensorDriver> make_driver(const SourceConfig &src,
                                           const DaemonConfig &cfg,
                                           const MeasurementStore &store,
                                           const std::shared_ptr<ChannelLockRegistry> &channels);

// mosquitto-backed session, or nullptr when no broker host is configured.
std::unique_ptr<IBrokerSession> make_broker_session(const DaemonConfig &cfg);

class DataLogger {
public:
    DataLogger(const DaemonConfig &cfg, std::unique_ptr<IBrokerSession> session);
    ~DataLogger();

    DataLogger(const DataLogger &) = delete;
    DataLogger &operator=(const DataLogger &) = delete;

    // History is replayed on the first start only.
    void start();
    // Everything start() does except the polling threads.
    void start_sinks();
    void stop();

    void poll_once();

    const MeasurementStore &store() const {
        return store_;
    }
    std::vector<SourceInfo> list_sources() const;
    std::shared_ptr<const Reading> latest(const std::string &id) const;
    std::vector<Reading> history(const std::string &id,
                                 Clock::time_point since = Clock::time_point::min()) const;

    RuntimeStatus runtime_status() const;
    const Publisher &publisher() const {
        return publisher_;
    }
    const LogWriter *log_writer() const {
        return log_writer_.get();
    }

private:
    void replay_history();

    DaemonConfig cfg_;
    MeasurementStore store_;
    std::shared_ptr<ChannelLockRegistry> channels_;
    std::unique_ptr<LogWriter> log_writer_;
    Publisher publisher_;
    std::unique_ptr<AsyncSink> log_sink_;
    std::unique_ptr<AsyncSink> publish_sink_;
    Poller poller_;
    bool sinks_started_ = false;
    bool history_replayed_ = false;
};

} // namespace heatlog::core

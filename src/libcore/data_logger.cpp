#include "libcore/data_logger.hpp"

#include <algorithm>
#include <utility>

#include "libcore/errors.hpp"
#include "libcore/log.hpp"
#include "libcore/mosquitto_session.hpp"
#include "libcore/ubus_driver.hpp"

namespace heatlog::core {

HistoryPolicy history_policy_from(const DaemonConfig &cfg) {
    HistoryPolicy policy;
    policy.window = std::chrono::hours(cfg.history_hours);
    policy.min_spacing = std::chrono::seconds(cfg.history_spacing_sec);
    policy.max_samples = static_cast<std::size_t>(std::max(cfg.history_max_samples, 2));
    policy.stale_after = std::chrono::seconds(cfg.stale_after_sec);
    return policy;
}

LogWriterOptions log_writer_options_from(const DaemonConfig &cfg) {
    LogWriterOptions opts;
    opts.directory = cfg.log_dir;
    opts.basename = cfg.log_basename;
    opts.retention = std::chrono::hours(24 * cfg.retention_days);
    opts.fsync = cfg.log_fsync;
    return opts;
}

PublisherOptions publisher_options_from(const MqttConfig &cfg) {
    PublisherOptions opts;
    opts.base_topic = cfg.base_topic;
    opts.retain = cfg.retain;
    opts.reconnect_min = std::chrono::seconds(cfg.reconnect_min_sec);
    opts.reconnect_max = std::chrono::seconds(cfg.reconnect_max_sec);
    return opts;
}

std::unique_ptr<ISensorDriver> make_driver(const SourceConfig &src,
                                           const DaemonConfig &cfg,
                                           const MeasurementStore &store,
                                           const std::shared_ptr<ChannelLockRegistry> &channels) {
    if (src.type == "w1") {
        return std::make_unique<W1SensorDriver>(cfg.w1_devices_dir, src.address);
    }
    if (src.type == "tsic") {
        const TsicModel *model = tsic_model_from_number(src.tsic_model);
        if (!model) {
            throw ConfigError("unsupported TSIC model for " + src.id);
        }
        return std::make_unique<TsicSensorDriver>(channels, src.chip.empty() ? cfg.gpio_chip : src.chip, src.gpio,
                                                  *model);
    }
    if (src.type == "sysfs") {
        return std::make_unique<SysfsSensorDriver>(src.path, src.scale);
    }
    if (src.type == "ubus") {
        return std::make_unique<UbusSensorDriver>(src.object, src.method, src.key, src.args_json);
    }
    if (src.type == "simulated") {
        std::string error;
        auto steps = parse_simulated_script(src.script, error);
        if (!steps) {
            throw ConfigError("invalid script for " + src.id + ": " + error);
        }
        return std::make_unique<SimulatedSensorDriver>(std::move(*steps), src.repeat == "cycle", src.mean,
                                                       src.stddev, src.seed);
    }
    if (src.type == "delta") {
        return std::make_unique<DeltaSensorDriver>(store, src.input_a, src.input_b);
    }
    throw ConfigError("unsupported source type for " + src.id + ": " + src.type);
}

std::unique_ptr<IBrokerSession> make_broker_session(const DaemonConfig &cfg) {
    if (cfg.mqtt.host.empty()) {
        return nullptr;
    }
    std::string password;
    if (!cfg.mqtt.password_file.empty()) {
        password = read_secret_file(cfg.mqtt.password_file);
    }
    return std::make_unique<MosquittoSession>(cfg.mqtt, std::move(password));
}

DataLogger::DataLogger(const DaemonConfig &cfg, std::unique_ptr<IBrokerSession> session)
    : cfg_(cfg),
      store_(history_policy_from(cfg)),
      channels_(std::make_shared<ChannelLockRegistry>()),
      log_writer_(cfg.log_dir.empty() ? std::unique_ptr<LogWriter>()
                                      : std::make_unique<LogWriter>(log_writer_options_from(cfg))),
      publisher_(publisher_options_from(cfg.mqtt), std::move(session)),
      poller_(store_,
              PollerOptions{std::chrono::milliseconds(cfg.read_timeout_ms),
                            std::chrono::milliseconds(cfg.drain_grace_ms)}) {
    const std::size_t capacity = static_cast<std::size_t>(std::max(cfg.queue_capacity, 1));
    if (log_writer_) {
        log_sink_ = std::make_unique<AsyncSink>(*log_writer_, capacity);
        poller_.add_sink(*log_sink_);
    } else {
        log_warn("logger", "LOG_DIR is empty, readings are not persisted");
    }
    if (publisher_.state() != PublisherState::Disabled) {
        publish_sink_ = std::make_unique<AsyncSink>(publisher_, capacity);
        poller_.add_sink(*publish_sink_);
    }

    for (const auto &src : cfg_.sources) {
        SourceInfo info;
        info.id = src.id;
        info.label = src.label;
        info.group = src.group;
        info.color = src.color;
        info.unit = src.unit;
        info.decimals = src.decimals;
        info.with_graph = src.with_graph;

        auto driver = make_driver(src, cfg_, store_, channels_);
        auto source = std::make_unique<SignalSource>(std::move(info), src.offset, std::chrono::seconds(src.poll_sec),
                                                     std::move(driver));
        log_debug("logger", "source[" + src.id + "] " + source->description());
        poller_.add(std::move(source));
    }
}

DataLogger::~DataLogger() {
    stop();
}

void DataLogger::replay_history() {
    if (!log_writer_) {
        return;
    }

    const SweepResult sweep = log_writer_->sweep_expired();
    if (sweep.removed > 0 || sweep.failed > 0) {
        log_info("logger", "retention sweep removed " + std::to_string(sweep.removed) + " partitions, " +
                               std::to_string(sweep.failed) + " failed");
    }

    // a restart keeps the live history it already has
    if (history_replayed_) {
        return;
    }
    history_replayed_ = true;

    LoadedHistory loaded = log_writer_->load_recent(std::chrono::hours(cfg_.history_hours));
    std::size_t used = 0;
    for (auto &item : loaded.readings) {
        if (!store_.has_source(item.first)) {
            continue;
        }
        used += item.second.size();
        store_.preload_history(item.first, std::move(item.second));
    }
    log_info("logger", "replayed " + std::to_string(used) + " of " + std::to_string(loaded.records) +
                           " logged readings into history");
}

void DataLogger::start_sinks() {
    if (sinks_started_) {
        return;
    }
    replay_history();
    if (log_sink_) {
        log_sink_->start();
    }
    if (publish_sink_) {
        publish_sink_->start();
    }
    publisher_.start();
    sinks_started_ = true;
}

void DataLogger::start() {
    start_sinks();
    poller_.start();
}

void DataLogger::stop() {
    poller_.stop();
    if (!sinks_started_) {
        return;
    }

    const auto grace = std::chrono::milliseconds(cfg_.drain_grace_ms);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    const auto remaining = [&deadline]() {
        const auto left = deadline - std::chrono::steady_clock::now();
        return std::max(std::chrono::milliseconds(0), std::chrono::duration_cast<std::chrono::milliseconds>(left));
    };
    if (log_sink_) {
        log_sink_->stop(remaining());
    }
    if (publish_sink_) {
        publish_sink_->stop(remaining());
    }
    publisher_.stop();
    sinks_started_ = false;
}

void DataLogger::poll_once() {
    poller_.poll_all_once();
}

std::vector<SourceInfo> DataLogger::list_sources() const {
    return store_.list_sources();
}

std::shared_ptr<const Reading> DataLogger::latest(const std::string &id) const {
    return store_.latest(id);
}

std::vector<Reading> DataLogger::history(const std::string &id, Clock::time_point since) const {
    return store_.history(id, since);
}

RuntimeStatus DataLogger::runtime_status() const {
    RuntimeStatus status;
    status.generated_at = Clock::now();
    status.publisher_state = publisher_.state();
    status.publisher = publisher_.counters();
    if (log_writer_) {
        status.log_records = log_writer_->records_written();
        status.log_failures = log_writer_->write_failures();
    }
    if (log_sink_) {
        status.sinks.push_back(SinkStatus{log_sink_->name(), log_sink_->counters()});
    }
    if (publish_sink_) {
        status.sinks.push_back(SinkStatus{publish_sink_->name(), publish_sink_->counters()});
    }
    return status;
}

} // namespace heatlog::core

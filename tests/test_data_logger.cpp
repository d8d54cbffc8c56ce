#include <unity.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "libcore/daemon_config.hpp"
#include "libcore/data_logger.hpp"
#include "libcore/errors.hpp"
#include "libcore/status_report.hpp"
#include "test_support.hpp"

using namespace heatlog::core;
using heatlog::test::FakeBrokerSession;
using heatlog::test::TempDir;

namespace {

DaemonConfig tank_config(const TempDir &dir) {
    std::istringstream in("INTERVAL=1\n"
                          "READ_TIMEOUT_MS=500\n"
                          "LOG_DIR=" + dir.file("log") + "\n"
                          "LOG_FSYNC=no\n"
                          "MQTT_BASE_TOPIC=home/heating\n"
                          "SOURCE_tank-top=type=simulated,script=42.0;43.5;error,label=Tank top\n"
                          "SOURCE_tank-bottom=type=simulated,mean=30.0\n");
    DaemonConfig cfg = parse_daemon_config(in);
    validate_daemon_config(cfg);
    return cfg;
}

int count_records(const std::string &dir) {
    int n = 0;
    LogWriterOptions opts;
    opts.directory = dir;
    LogWriter reader(opts);
    for (const auto &path : reader.list_partitions()) {
        n += static_cast<int>(heatlog::test::read_lines(path).size());
    }
    return n;
}

} // namespace

void setUp(void) {}

void tearDown(void) {}

void test_three_cycles_reach_store_log_and_broker(void) {
    TempDir dir;
    auto shared = std::make_shared<FakeBrokerSession::Shared>();
    DataLogger logger(tank_config(dir), std::make_unique<FakeBrokerSession>(shared));

    logger.start_sinks();
    TEST_ASSERT_TRUE(logger.publisher().wait_for_state(PublisherState::Connected, std::chrono::milliseconds(3000)));

    for (int i = 0; i < 3; ++i) {
        logger.poll_once();
    }
    logger.stop();

    const auto top = logger.latest("tank-top");
    TEST_ASSERT_NOT_NULL(top.get());
    TEST_ASSERT_TRUE(top->status == ReadingStatus::Error);
    TEST_ASSERT_EQUAL_STRING("---", top->formatted.c_str());

    const auto bottom = logger.latest("tank-bottom");
    TEST_ASSERT_NOT_NULL(bottom.get());
    TEST_ASSERT_TRUE(bottom->ok());
    TEST_ASSERT_EQUAL_STRING("30.0", bottom->formatted.c_str());

    const auto history = logger.history("tank-top");
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(history.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 42.0, *history[0].value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 43.5, *history[1].value);
    TEST_ASSERT_TRUE(history[2].status == ReadingStatus::Error);

    TEST_ASSERT_EQUAL_INT(6, count_records(dir.file("log")));
    TEST_ASSERT_EQUAL_INT(6, static_cast<int>(logger.log_writer()->records_written()));

    const auto messages = shared->snapshot();
    TEST_ASSERT_EQUAL_INT(6, static_cast<int>(messages.size()));
    int ok = 0;
    for (const auto &m : messages) {
        TEST_ASSERT_TRUE(m.topic == "home/heating/tank-top" || m.topic == "home/heating/tank-bottom");
        if (nlohmann::json::parse(m.payload).at("status") == "ok") {
            ++ok;
        }
    }
    TEST_ASSERT_EQUAL_INT(5, ok);

    const auto sources = logger.list_sources();
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(sources.size()));
    TEST_ASSERT_EQUAL_STRING("Tank top", sources[0].label.c_str());
}

void test_restart_replays_logged_history(void) {
    TempDir dir;
    {
        DataLogger first(tank_config(dir), nullptr);
        first.start_sinks();
        first.poll_once();
        first.poll_once();
        first.stop();
    }

    DataLogger second(tank_config(dir), nullptr);
    second.start_sinks();
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(second.history("tank-top").size()));
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(second.history("tank-bottom").size()));
    // replay fills history only, the latest value comes from the next poll
    TEST_ASSERT_NULL(second.latest("tank-top").get());

    second.poll_once();
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(second.history("tank-top").size()));
    second.stop();
}

void test_start_after_stop_resumes_polling_and_sinks(void) {
    TempDir dir;
    auto shared = std::make_shared<FakeBrokerSession::Shared>();
    DataLogger logger(tank_config(dir), std::make_unique<FakeBrokerSession>(shared));

    logger.start();
    TEST_ASSERT_TRUE(heatlog::test::wait_until([&]() {
        return logger.log_writer()->records_written() >= 2 && shared->snapshot().size() >= 2;
    }, std::chrono::milliseconds(5000)));
    logger.stop();

    const auto written = logger.log_writer()->records_written();
    const auto published = shared->snapshot().size();
    const auto polled = logger.history("tank-bottom").size();
    const auto stopped_at = Clock::now();

    logger.start();
    TEST_ASSERT_TRUE(heatlog::test::wait_until([&]() {
        return logger.log_writer()->records_written() >= written + 2 && shared->snapshot().size() >= published + 2;
    }, std::chrono::milliseconds(5000)));
    logger.stop();

    const auto bottom = logger.latest("tank-bottom");
    TEST_ASSERT_NOT_NULL(bottom.get());
    TEST_ASSERT_TRUE(bottom->ok());
    TEST_ASSERT_TRUE(bottom->timestamp >= stopped_at);

    const auto history = logger.history("tank-bottom");
    TEST_ASSERT_TRUE(history.size() > polled);
    for (std::size_t i = 1; i < history.size(); ++i) {
        TEST_ASSERT_TRUE(history[i - 1].timestamp < history[i].timestamp);
    }
    TEST_ASSERT_EQUAL_INT(static_cast<int>(logger.log_writer()->records_written()), count_records(dir.file("log")));
}

void test_disabled_publisher_and_status_report(void) {
    TempDir dir;
    DataLogger logger(tank_config(dir), nullptr);
    TEST_ASSERT_TRUE(logger.publisher().state() == PublisherState::Disabled);
    logger.start_sinks();
    logger.poll_once();

    const RuntimeStatus status = logger.runtime_status();
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(status.sinks.size()));
    TEST_ASSERT_EQUAL_STRING("log", status.sinks[0].name.c_str());

    const auto doc = nlohmann::json::parse(build_runtime_status_json(logger.store(), status));
    TEST_ASSERT_EQUAL_STRING("disabled", doc.at("publisher").at("state").get<std::string>().c_str());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(doc.at("sources").size()));
    TEST_ASSERT_EQUAL_STRING("tank-top", doc.at("sources")[0].at("id").get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("42.0", doc.at("sources")[0].at("formatted").get<std::string>().c_str());

    std::string error;
    TEST_ASSERT_TRUE(write_runtime_status_file(dir.file("status.json"), doc.dump(), error));
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(heatlog::test::read_lines(dir.file("status.json")).size()));
    TEST_ASSERT_FALSE(write_runtime_status_file(dir.file("missing/status.json"), doc.dump(), error));
    TEST_ASSERT_FALSE(error.empty());
    logger.stop();
}

void test_log_dir_can_be_disabled(void) {
    TempDir dir;
    DaemonConfig cfg = tank_config(dir);
    cfg.log_dir.clear();
    DataLogger logger(cfg, nullptr);
    TEST_ASSERT_NULL(logger.log_writer());
    logger.start_sinks();
    logger.poll_once();
    TEST_ASSERT_NOT_NULL(logger.latest("tank-bottom").get());
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(logger.runtime_status().sinks.size()));
    logger.stop();
}

void test_driver_factory_follows_source_type(void) {
    std::istringstream in("SOURCE_t=type=tsic,gpio=4,model=506\n"
                          "SOURCE_w=type=w1,address=28-0001\n"
                          "SOURCE_s=type=sysfs,path=/sys/class/thermal/thermal_zone0/temp\n"
                          "SOURCE_u=type=ubus,object=system,method=info,key=temp_mc\n"
                          "SOURCE_d=type=delta,a=t,b=w\n");
    const DaemonConfig cfg = parse_daemon_config(in);
    MeasurementStore store;
    auto channels = std::make_shared<ChannelLockRegistry>();

    TEST_ASSERT_EQUAL_STRING("TSic 506 on /dev/gpiochip0:4",
                             make_driver(cfg.sources[0], cfg, store, channels)->describe().c_str());
    TEST_ASSERT_EQUAL_STRING("w1 address=28-0001", make_driver(cfg.sources[1], cfg, store, channels)->describe().c_str());
    TEST_ASSERT_EQUAL_STRING("sysfs path=/sys/class/thermal/thermal_zone0/temp",
                             make_driver(cfg.sources[2], cfg, store, channels)->describe().c_str());
    TEST_ASSERT_EQUAL_STRING("ubus system.info key=temp_mc",
                             make_driver(cfg.sources[3], cfg, store, channels)->describe().c_str());
    TEST_ASSERT_EQUAL_STRING("delta t - w", make_driver(cfg.sources[4], cfg, store, channels)->describe().c_str());

    SourceConfig bogus = cfg.sources[0];
    bogus.type = "thermocouple";
    bool threw = false;
    try {
        make_driver(bogus, cfg, store, channels);
    } catch (const ConfigError &) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    // no MQTT_HOST, no broker session
    TEST_ASSERT_NULL(make_broker_session(cfg).get());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_three_cycles_reach_store_log_and_broker);
    RUN_TEST(test_restart_replays_logged_history);
    RUN_TEST(test_start_after_stop_resumes_polling_and_sinks);
    RUN_TEST(test_disabled_publisher_and_status_report);
    RUN_TEST(test_log_dir_can_be_disabled);
    RUN_TEST(test_driver_factory_follows_source_type);
    return UNITY_END();
}

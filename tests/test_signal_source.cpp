#include <unity.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "libcore/measurement_store.hpp"
#include "libcore/poller.hpp"
#include "libcore/reading_sink.hpp"
#include "libcore/sensor_driver.hpp"
#include "libcore/signal_source.hpp"
#include "test_support.hpp"

using namespace heatlog::core;

namespace {

SourceInfo info_for(const std::string &id) {
    SourceInfo info;
    info.id = id;
    info.label = id;
    info.unit = "\xC2\xB0" "C";
    info.decimals = 1;
    return info;
}

std::unique_ptr<ISensorDriver> scripted(const std::string &script) {
    std::string error;
    auto steps = parse_simulated_script(script, error);
    if (!steps) {
        return nullptr;
    }
    return std::make_unique<SimulatedSensorDriver>(*steps, false, 0.0, 0.0, 1);
}

std::unique_ptr<SignalSource> make_source(const std::string &id, const std::string &script, double offset = 0.0) {
    return std::make_unique<SignalSource>(info_for(id), offset, std::chrono::seconds(1), scripted(script));
}

class CountingSink : public IReadingSink {
public:
    const std::string &name() const override {
        return name_;
    }
    void consume(const std::vector<ReadingEvent> &events) override {
        count += events.size();
    }
    std::atomic<std::size_t> count{0};

private:
    std::string name_ = "counting";
};

} // namespace

void setUp(void) {}

void tearDown(void) {}

void test_poll_applies_offset_and_decimals(void) {
    auto source = make_source("tank-top", "20.04", 1.5);
    const auto before = Clock::now();
    const Reading r = source->poll(std::chrono::milliseconds(500));
    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 21.54, *r.value);
    TEST_ASSERT_EQUAL_STRING("21.5", r.formatted.c_str());
    TEST_ASSERT_EQUAL_STRING("\xC2\xB0" "C", r.unit.c_str());
    TEST_ASSERT_TRUE(r.timestamp >= before);
}

void test_driver_fault_becomes_error_reading(void) {
    auto source = make_source("tank-top", "error");
    const Reading r = source->poll(std::chrono::milliseconds(500));
    TEST_ASSERT_TRUE(r.status == ReadingStatus::Error);
    TEST_ASSERT_FALSE(r.value.has_value());
    TEST_ASSERT_EQUAL_STRING("---", r.formatted.c_str());
    TEST_ASSERT_EQUAL_STRING("simulated sensor fault", r.error.c_str());
}

void test_hung_driver_times_out(void) {
    auto source = make_source("slow", "hang:400;21.0");

    const auto begin = std::chrono::steady_clock::now();
    const Reading r = source->poll(std::chrono::milliseconds(100));
    const auto spent = std::chrono::steady_clock::now() - begin;

    TEST_ASSERT_TRUE(r.status == ReadingStatus::Error);
    TEST_ASSERT_EQUAL_STRING("read timed out after 100 ms", r.error.c_str());
    TEST_ASSERT_TRUE(spent < std::chrono::milliseconds(350));

    // the hang is still running, a second request must not stack up behind it
    const Reading busy = source->poll(std::chrono::milliseconds(100));
    TEST_ASSERT_EQUAL_STRING("previous read still in progress", busy.error.c_str());

    std::this_thread::sleep_for(std::chrono::milliseconds(450));
    const Reading recovered = source->poll(std::chrono::milliseconds(200));
    TEST_ASSERT_TRUE(recovered.ok());
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 21.0, *recovered.value);
}

void test_source_without_driver(void) {
    SignalSource source(info_for("none"), 0.0, std::chrono::seconds(5), nullptr);
    TEST_ASSERT_EQUAL_STRING("no driver", source.poll(std::chrono::milliseconds(10)).error.c_str());
    TEST_ASSERT_EQUAL_STRING("no driver", source.description().c_str());
}

void test_poll_after_shutdown(void) {
    auto source = make_source("a", "1.0");
    TEST_ASSERT_TRUE(source->poll(std::chrono::milliseconds(200)).ok());
    TEST_ASSERT_TRUE(source->shutdown(std::chrono::milliseconds(200)));
    TEST_ASSERT_EQUAL_STRING("source is shut down", source->poll(std::chrono::milliseconds(10)).error.c_str());
}

void test_resume_after_shutdown_polls_again(void) {
    auto source = make_source("a", "1.0;2.0");
    TEST_ASSERT_TRUE(source->poll(std::chrono::milliseconds(200)).ok());
    TEST_ASSERT_TRUE(source->shutdown(std::chrono::milliseconds(200)));

    source->resume();
    const Reading r = source->poll(std::chrono::milliseconds(200));
    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 2.0, *r.value);
}

void test_resume_adopts_abandoned_read(void) {
    auto source = make_source("slow", "hang:300;4.0");
    TEST_ASSERT_TRUE(source->poll(std::chrono::milliseconds(50)).status == ReadingStatus::Error);
    TEST_ASSERT_FALSE(source->shutdown(std::chrono::milliseconds(20)));

    source->resume();
    TEST_ASSERT_EQUAL_STRING("previous read still in progress",
                             source->poll(std::chrono::milliseconds(10)).error.c_str());

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    const Reading r = source->poll(std::chrono::milliseconds(200));
    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 4.0, *r.value);
    TEST_ASSERT_TRUE(source->shutdown(std::chrono::milliseconds(200)));
}

void test_poller_restarts_after_stop(void) {
    MeasurementStore store;
    PollerOptions opts;
    opts.read_timeout = std::chrono::milliseconds(200);
    Poller poller(store, opts);
    poller.add(make_source("a", "1.0"));

    CountingSink counting;
    AsyncSink async(counting, 64);
    poller.add_sink(async);

    async.start();
    poller.start();
    TEST_ASSERT_TRUE(heatlog::test::wait_until([&]() {
        return store.history_size("a") >= 1;
    }, std::chrono::milliseconds(2000)));
    poller.stop();
    async.stop(std::chrono::milliseconds(1000));
    const std::size_t first_run = counting.count.load();

    async.start();
    poller.start();
    TEST_ASSERT_TRUE(heatlog::test::wait_until([&]() {
        const auto latest = store.latest("a");
        return counting.count.load() > first_run && latest && latest->ok();
    }, std::chrono::milliseconds(2000)));
    poller.stop();
    async.stop(std::chrono::milliseconds(1000));

    TEST_ASSERT_TRUE(store.latest("a")->ok());
    TEST_ASSERT_EQUAL_INT(static_cast<int>(store.history_size("a")), static_cast<int>(counting.count.load()));
}

void test_poll_interval_has_a_floor(void) {
    SignalSource source(info_for("a"), 0.0, std::chrono::seconds(0), scripted("1.0"));
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(source.poll_interval().count()));
}

void test_hung_source_does_not_delay_others(void) {
    MeasurementStore store;
    PollerOptions opts;
    opts.read_timeout = std::chrono::milliseconds(100);
    opts.shutdown_grace = std::chrono::milliseconds(50);
    Poller poller(store, opts);
    poller.add(make_source("stuck", "hang:1500"));
    poller.add(make_source("fine", "5.0"));

    const auto begin = std::chrono::steady_clock::now();
    poller.poll_all_once();
    const auto spent = std::chrono::steady_clock::now() - begin;
    TEST_ASSERT_TRUE(spent < std::chrono::milliseconds(800));

    const auto stuck = store.latest("stuck");
    const auto fine = store.latest("fine");
    TEST_ASSERT_NOT_NULL(stuck.get());
    TEST_ASSERT_NOT_NULL(fine.get());
    TEST_ASSERT_TRUE(stuck->status == ReadingStatus::Error);
    TEST_ASSERT_TRUE(fine->ok());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(poller.runtimes()[0]->failures.load()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(poller.runtimes()[1]->failures.load()));
}

void test_poller_threads_feed_store_and_sinks(void) {
    MeasurementStore store;
    PollerOptions opts;
    opts.read_timeout = std::chrono::milliseconds(200);
    Poller poller(store, opts);
    poller.add(make_source("a", "1.0;2.0;3.0"));
    poller.add(make_source("b", "7.0"));

    CountingSink counting;
    AsyncSink async(counting, 64);
    poller.add_sink(async);
    async.start();

    poller.start();
    TEST_ASSERT_TRUE(poller.running());
    TEST_ASSERT_TRUE(heatlog::test::wait_until([&]() {
        return store.history_size("a") >= 2 && store.history_size("b") >= 2;
    }, std::chrono::milliseconds(3500)));
    poller.stop();
    TEST_ASSERT_FALSE(poller.running());
    async.stop(std::chrono::milliseconds(1000));

    const auto sources = store.list_sources();
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(sources.size()));
    TEST_ASSERT_EQUAL_STRING("a", sources[0].id.c_str());
    TEST_ASSERT_EQUAL_INT(static_cast<int>(store.history_size("a") + store.history_size("b")),
                          static_cast<int>(counting.count.load()));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_poll_applies_offset_and_decimals);
    RUN_TEST(test_driver_fault_becomes_error_reading);
    RUN_TEST(test_hung_driver_times_out);
    RUN_TEST(test_source_without_driver);
    RUN_TEST(test_poll_after_shutdown);
    RUN_TEST(test_resume_after_shutdown_polls_again);
    RUN_TEST(test_resume_adopts_abandoned_read);
    RUN_TEST(test_poller_restarts_after_stop);
    RUN_TEST(test_poll_interval_has_a_floor);
    RUN_TEST(test_hung_source_does_not_delay_others);
    RUN_TEST(test_poller_threads_feed_store_and_sinks);
    return UNITY_END();
}

#include <unity.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "libcore/measurement_store.hpp"
#include "libcore/reading.hpp"
#include "test_support.hpp"

using namespace heatlog::core;
using heatlog::test::fixed_time;

namespace {

const std::string kDeg = "\xC2\xB0" "C";

SourceInfo make_info(const std::string &id) {
    SourceInfo info;
    info.id = id;
    info.label = id;
    info.unit = kDeg;
    return info;
}

Reading ok_at(double value, std::chrono::seconds offset) {
    return make_ok_reading(value, kDeg, 1, fixed_time(offset));
}

} // namespace

void setUp(void) {}

void tearDown(void) {}

void test_format_value_uses_decimals(void) {
    TEST_ASSERT_EQUAL_STRING("42.0", format_value(42.0, 1).c_str());
    TEST_ASSERT_EQUAL_STRING("43.25", format_value(43.249, 2).c_str());
    TEST_ASSERT_EQUAL_STRING("0.0", format_value(-0.01, 1).c_str());
    TEST_ASSERT_EQUAL_STRING("-3", format_value(-3.2, 0).c_str());
}

void test_iso8601_keeps_microseconds(void) {
    const auto ts = fixed_time() + std::chrono::microseconds(123456);
    const std::string text = format_iso8601_utc(ts);
    TEST_ASSERT_EQUAL_STRING("2024-03-10T12:00:00.123456Z", text.c_str());

    const auto parsed = parse_iso8601_utc(text);
    TEST_ASSERT_TRUE(parsed.has_value());
    TEST_ASSERT_TRUE(*parsed == ts);

    TEST_ASSERT_FALSE(parse_iso8601_utc("2024-03-10 12:00").has_value());
    TEST_ASSERT_FALSE(parse_iso8601_utc("2024-13-10T12:00:00Z").has_value());
}

void test_unknown_source_is_rejected(void) {
    MeasurementStore store;
    TEST_ASSERT_FALSE(store.update("nope", ok_at(1.0, std::chrono::seconds(0))));
    TEST_ASSERT_NULL(store.latest("nope").get());
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(store.history("nope").size()));
}

void test_latest_is_last_applied_reading(void) {
    MeasurementStore store;
    store.register_source(make_info("tank"));
    TEST_ASSERT_NULL(store.latest("tank").get());

    for (int i = 0; i < 10; ++i) {
        store.update("tank", ok_at(20.0 + i, std::chrono::seconds(i)));
    }
    store.update("tank", make_error_reading(kDeg, "bus fault", fixed_time(std::chrono::seconds(10))));

    const auto latest = store.latest_at("tank", fixed_time(std::chrono::seconds(10)));
    TEST_ASSERT_NOT_NULL(latest.get());
    TEST_ASSERT_TRUE(latest->status == ReadingStatus::Error);
    TEST_ASSERT_FALSE(latest->value.has_value());
    TEST_ASSERT_EQUAL_STRING("---", latest->formatted.c_str());

    const auto history = store.history("tank");
    TEST_ASSERT_EQUAL_INT(11, static_cast<int>(history.size()));
    for (std::size_t i = 1; i < history.size(); ++i) {
        TEST_ASSERT_TRUE(history[i - 1].timestamp <= history[i].timestamp);
    }
    TEST_ASSERT_FLOAT_WITHIN(0.001, 29.0, *history[9].value);
}

void test_history_is_bounded_by_window(void) {
    HistoryPolicy policy;
    policy.window = std::chrono::hours(1);
    MeasurementStore store(policy);
    store.register_source(make_info("tank"));

    for (int minute = 0; minute <= 120; ++minute) {
        store.update("tank", ok_at(minute, std::chrono::minutes(minute)));
    }

    const auto history = store.history("tank");
    TEST_ASSERT_EQUAL_INT(61, static_cast<int>(history.size()));
    TEST_ASSERT_TRUE(history.front().timestamp == fixed_time(std::chrono::minutes(60)));
    TEST_ASSERT_TRUE(history.back().timestamp == fixed_time(std::chrono::minutes(120)));
}

void test_history_respects_count_cap_and_spacing(void) {
    HistoryPolicy policy;
    policy.max_samples = 5;
    MeasurementStore capped(policy);
    capped.register_source(make_info("a"));
    for (int i = 0; i < 20; ++i) {
        capped.update("a", ok_at(i, std::chrono::seconds(i)));
    }
    const auto kept = capped.history("a");
    TEST_ASSERT_EQUAL_INT(5, static_cast<int>(kept.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 15.0, *kept.front().value);

    HistoryPolicy spaced_policy;
    spaced_policy.min_spacing = std::chrono::seconds(60);
    MeasurementStore spaced(spaced_policy);
    spaced.register_source(make_info("b"));
    for (int i = 0; i < 180; ++i) {
        spaced.update("b", ok_at(i, std::chrono::seconds(i)));
    }
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(spaced.history("b").size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 179.0, *spaced.latest_at("b", fixed_time(std::chrono::seconds(179)))->value);
}

void test_out_of_order_reading_updates_latest_only(void) {
    MeasurementStore store;
    store.register_source(make_info("tank"));
    store.update("tank", ok_at(1.0, std::chrono::seconds(10)));
    store.update("tank", ok_at(2.0, std::chrono::seconds(5)));

    TEST_ASSERT_FLOAT_WITHIN(0.001, 2.0, *store.latest_at("tank", fixed_time(std::chrono::seconds(10)))->value);
    const auto history = store.history("tank");
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(history.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 1.0, *history[0].value);
}

void test_old_ok_reading_is_reported_stale(void) {
    HistoryPolicy policy;
    policy.stale_after = std::chrono::seconds(3);
    MeasurementStore store(policy);
    store.register_source(make_info("tank"));
    store.update("tank", ok_at(30.0, std::chrono::seconds(0)));

    const auto fresh = store.latest_at("tank", fixed_time(std::chrono::seconds(2)));
    TEST_ASSERT_TRUE(fresh->status == ReadingStatus::Ok);

    const auto stale = store.latest_at("tank", fixed_time(std::chrono::seconds(10)));
    TEST_ASSERT_TRUE(stale->status == ReadingStatus::Stale);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 30.0, *stale->value);

    // the stored reading itself is untouched
    TEST_ASSERT_TRUE(store.history("tank").back().status == ReadingStatus::Ok);
}

void test_history_since_filters_and_can_be_repeated(void) {
    MeasurementStore store;
    store.register_source(make_info("tank"));
    for (int i = 0; i < 10; ++i) {
        store.update("tank", ok_at(i, std::chrono::seconds(i)));
    }
    const auto first = store.history("tank", fixed_time(std::chrono::seconds(7)));
    const auto again = store.history("tank", fixed_time(std::chrono::seconds(7)));
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(first.size()));
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(again.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 7.0, *first.front().value);
}

void test_preload_merges_in_order(void) {
    MeasurementStore store;
    store.register_source(make_info("tank"));
    store.update("tank", ok_at(100.0, std::chrono::seconds(100)));

    std::vector<Reading> replay;
    replay.push_back(ok_at(3.0, std::chrono::seconds(3)));
    replay.push_back(ok_at(1.0, std::chrono::seconds(1)));
    replay.push_back(ok_at(2.0, std::chrono::seconds(2)));
    store.preload_history("tank", replay);

    const auto history = store.history("tank");
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(history.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 1.0, *history[0].value);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 100.0, *history[3].value);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 100.0, *store.latest_at("tank", fixed_time(std::chrono::seconds(100)))->value);
}

void test_list_sources_keeps_registration_order(void) {
    MeasurementStore store;
    SourceInfo top = make_info("tank-top");
    top.group = "tank";
    top.color = "#ff0000";
    store.register_source(top);
    store.register_source(make_info("tank-bottom"));

    const auto sources = store.list_sources();
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(sources.size()));
    TEST_ASSERT_EQUAL_STRING("tank-top", sources[0].id.c_str());
    TEST_ASSERT_EQUAL_STRING("#ff0000", sources[0].color.c_str());
    TEST_ASSERT_EQUAL_STRING("tank-bottom", sources[1].id.c_str());
}

void test_concurrent_readers_see_whole_readings(void) {
    MeasurementStore store;
    store.register_source(make_info("tank"));
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                const auto latest = store.latest("tank");
                if (latest && latest->ok() && latest->formatted != format_value(*latest->value, 1)) {
                    ++torn;
                }
                (void)store.history("tank");
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        store.update("tank", make_ok_reading(i * 0.5, kDeg, 1, Clock::now()));
    }
    done = true;
    for (auto &t : readers) {
        t.join();
    }
    TEST_ASSERT_EQUAL_INT(0, torn.load());
    TEST_ASSERT_FLOAT_WITHIN(0.001, 999.5, *store.history("tank").back().value);
}

void test_history_snapshot_is_detached_from_updates(void) {
    MeasurementStore store;
    store.register_source(make_info("a"));
    for (int i = 0; i < 20000; ++i) {
        store.update("a", ok_at(i, std::chrono::seconds(i)));
    }

    std::atomic<bool> done{false};
    std::size_t snapshots = 0;
    bool ordered = true;
    std::thread reader([&]() {
        while (!done.load()) {
            const auto h = store.history("a");
            ordered = ordered && h.size() >= 20000 && h.front().timestamp <= h.back().timestamp;
            ++snapshots;
        }
    });

    const auto before = store.history("a");
    for (int i = 20000; i < 20500; ++i) {
        TEST_ASSERT_TRUE(store.update("a", ok_at(i, std::chrono::seconds(i))));
    }
    done.store(true);
    reader.join();

    TEST_ASSERT_TRUE(ordered);
    TEST_ASSERT_TRUE(snapshots > 0);
    TEST_ASSERT_EQUAL_INT(20000, static_cast<int>(before.size()));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 19999.0, *before.back().value);
    TEST_ASSERT_EQUAL_INT(20500, static_cast<int>(store.history_size("a")));
    TEST_ASSERT_FLOAT_WITHIN(0.001, 20499.0, *store.history("a").back().value);
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_format_value_uses_decimals);
    RUN_TEST(test_iso8601_keeps_microseconds);
    RUN_TEST(test_unknown_source_is_rejected);
    RUN_TEST(test_latest_is_last_applied_reading);
    RUN_TEST(test_history_is_bounded_by_window);
    RUN_TEST(test_history_respects_count_cap_and_spacing);
    RUN_TEST(test_out_of_order_reading_updates_latest_only);
    RUN_TEST(test_old_ok_reading_is_reported_stale);
    RUN_TEST(test_history_since_filters_and_can_be_repeated);
    RUN_TEST(test_preload_merges_in_order);
    RUN_TEST(test_list_sources_keeps_registration_order);
    RUN_TEST(test_concurrent_readers_see_whole_readings);
    RUN_TEST(test_history_snapshot_is_detached_from_updates);
    return UNITY_END();
}

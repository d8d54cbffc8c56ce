#include <unity.h>

#include <chrono>
#include <string>

#include "libcore/measurement_store.hpp"
#include "libcore/sensor_driver.hpp"
#include "test_support.hpp"

using namespace heatlog::core;
using heatlog::test::TempDir;
using heatlog::test::write_file;

namespace {

const std::chrono::milliseconds kTimeout(100);

const char *kW1Good = "72 01 4b 46 7f ff 0e 10 57 : crc=57 YES\n"
                      "72 01 4b 46 7f ff 0e 10 57 t=23125\n";

SimulatedSensorDriver driver_for(const std::string &script, bool cycle) {
    std::string error;
    auto steps = parse_simulated_script(script, error);
    return SimulatedSensorDriver(steps ? *steps : std::vector<SimulatedStep>{}, cycle, 0.0, 0.0, 7);
}

} // namespace

void setUp(void) {}

void tearDown(void) {}

void test_w1_text_parsing(void) {
    const DriverSample good = parse_w1_slave_text(kW1Good);
    TEST_ASSERT_TRUE(good.ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 23.125, good.value);

    const DriverSample negative = parse_w1_slave_text("ff ff : crc=aa YES\nff ff t=-1250\n");
    TEST_ASSERT_TRUE(negative.ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, -1.25, negative.value);

    const DriverSample bad_crc = parse_w1_slave_text("72 01 : crc=57 NO\n72 01 t=23125\n");
    TEST_ASSERT_FALSE(bad_crc.ok);
    TEST_ASSERT_EQUAL_STRING("w1 crc check failed", bad_crc.error.c_str());

    TEST_ASSERT_FALSE(parse_w1_slave_text("72 01 : crc=57 YES\n").ok);
    TEST_ASSERT_FALSE(parse_w1_slave_text("72 01 : crc=57 YES\n72 01 t=\n").ok);
    TEST_ASSERT_FALSE(parse_w1_slave_text("72 01 : crc=57 YES\n72 01 x=5\n").ok);
}

void test_w1_driver_reads_slave_file(void) {
    TempDir dir;
    write_file(dir.file("devices/28-000005e2fdc3/w1_slave"), kW1Good);

    W1SensorDriver driver(dir.file("devices/"), "28-000005e2fdc3");
    const DriverSample s = driver.read(kTimeout);
    TEST_ASSERT_TRUE(s.ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 23.125, s.value);
    TEST_ASSERT_EQUAL_STRING("w1 address=28-000005e2fdc3", driver.describe().c_str());

    W1SensorDriver missing(dir.file("devices"), "28-ffffffffffff");
    const DriverSample none = missing.read(kTimeout);
    TEST_ASSERT_FALSE(none.ok);
    TEST_ASSERT_TRUE(none.error.find("cannot open") == 0);
}

void test_sysfs_driver_scales_value(void) {
    TempDir dir;
    write_file(dir.file("temp1_input"), "48250\n");
    SysfsSensorDriver driver(dir.file("temp1_input"), 0.001);
    const DriverSample s = driver.read(kTimeout);
    TEST_ASSERT_TRUE(s.ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 48.25, s.value);

    write_file(dir.file("temp1_input"), "garbage\n");
    TEST_ASSERT_FALSE(driver.read(kTimeout).ok);

    SysfsSensorDriver missing(dir.file("nope"), 1.0);
    TEST_ASSERT_FALSE(missing.read(kTimeout).ok);
}

void test_script_parsing(void) {
    std::string error;
    auto steps = parse_simulated_script("42.0; 43.5;error;hang:250", error);
    TEST_ASSERT_TRUE(steps.has_value());
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(steps->size()));
    TEST_ASSERT_TRUE((*steps)[0].kind == SimulatedStep::Kind::Value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 43.5, (*steps)[1].value);
    TEST_ASSERT_TRUE((*steps)[2].kind == SimulatedStep::Kind::Error);
    TEST_ASSERT_TRUE((*steps)[3].kind == SimulatedStep::Kind::Hang);
    TEST_ASSERT_EQUAL_INT(250, static_cast<int>((*steps)[3].hang.count()));

    TEST_ASSERT_TRUE(parse_simulated_script("", error)->empty());
    TEST_ASSERT_FALSE(parse_simulated_script("1.0;;2.0", error).has_value());
    TEST_ASSERT_FALSE(parse_simulated_script("warm", error).has_value());
    TEST_ASSERT_EQUAL_STRING("bad script value: warm", error.c_str());
    TEST_ASSERT_FALSE(parse_simulated_script("hang:-5", error).has_value());
}

void test_simulated_script_sticks_on_last_step(void) {
    SimulatedSensorDriver driver = driver_for("42.0;43.5;error", false);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 42.0, driver.read(kTimeout).value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 43.5, driver.read(kTimeout).value);
    TEST_ASSERT_FALSE(driver.read(kTimeout).ok);
    TEST_ASSERT_FALSE(driver.read(kTimeout).ok);
}

void test_simulated_script_cycles(void) {
    SimulatedSensorDriver driver = driver_for("1;2", true);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.0, driver.read(kTimeout).value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 2.0, driver.read(kTimeout).value);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 1.0, driver.read(kTimeout).value);
}

void test_simulated_noise_is_seeded(void) {
    SimulatedSensorDriver a({}, false, 50.0, 2.0, 1234);
    SimulatedSensorDriver b({}, false, 50.0, 2.0, 1234);
    for (int i = 0; i < 5; ++i) {
        const DriverSample sa = a.read(kTimeout);
        const DriverSample sb = b.read(kTimeout);
        TEST_ASSERT_TRUE(sa.ok);
        TEST_ASSERT_FLOAT_WITHIN(1e-9, sa.value, sb.value);
        TEST_ASSERT_FLOAT_WITHIN(20.0, 50.0, sa.value);
    }

    SimulatedSensorDriver flat({}, false, 30.0, 0.0, 1);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 30.0, flat.read(kTimeout).value);
}

void test_delta_of_two_sources(void) {
    MeasurementStore store;
    SourceInfo top;
    top.id = "tank-top";
    SourceInfo bottom;
    bottom.id = "tank-bottom";
    store.register_source(top);
    store.register_source(bottom);

    DeltaSensorDriver delta(store, "tank-top", "tank-bottom");
    const DriverSample empty = delta.read(kTimeout);
    TEST_ASSERT_FALSE(empty.ok);
    TEST_ASSERT_EQUAL_STRING("input tank-top has no current value", empty.error.c_str());

    const auto now = Clock::now();
    store.update("tank-top", make_ok_reading(42.0, "C", 1, now));
    store.update("tank-bottom", make_ok_reading(30.0, "C", 1, now));
    const DriverSample d = delta.read(kTimeout);
    TEST_ASSERT_TRUE(d.ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 12.0, d.value);

    store.update("tank-bottom", make_error_reading("C", "crc", now));
    TEST_ASSERT_EQUAL_STRING("input tank-bottom has no current value", delta.read(kTimeout).error.c_str());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_w1_text_parsing);
    RUN_TEST(test_w1_driver_reads_slave_file);
    RUN_TEST(test_sysfs_driver_scales_value);
    RUN_TEST(test_script_parsing);
    RUN_TEST(test_simulated_script_sticks_on_last_step);
    RUN_TEST(test_simulated_script_cycles);
    RUN_TEST(test_simulated_noise_is_seeded);
    RUN_TEST(test_delta_of_two_sources);
    return UNITY_END();
}

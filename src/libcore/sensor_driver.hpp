#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace heatlog::core {

class MeasurementStore;

struct DriverSample {
    bool ok = false;
    double value = 0.0;
    std::string error;
};

class ISensorDriver {
public:
    virtual ~ISensorDriver() = default;
    virtual DriverSample read(std::chrono::milliseconds timeout) = 0;
    virtual std::string describe() const = 0;
};

class SysfsSensorDriver : public ISensorDriver {
public:
    SysfsSensorDriver(std::string path, double scale);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    std::string path_;
    double scale_;
};

// DS18x20 through the kernel w1 slave file:
//   72 01 4b 46 7f ff 0e 10 57 : crc=57 YES
//   72 01 4b 46 7f ff 0e 10 57 t=23125
class W1SensorDriver : public ISensorDriver {
public:
    W1SensorDriver(std::string devices_dir, std::string address);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    std::string slave_path_;
    std::string address_;
};

DriverSample parse_w1_slave_text(const std::string &text);

struct SimulatedStep {
    enum class Kind {
        Value,
        Error,
        Hang,
    };

    Kind kind = Kind::Value;
    double value = 0.0;
    std::chrono::milliseconds hang{0};
};

std::optional<std::vector<SimulatedStep>> parse_simulated_script(const std::string &text, std::string &error);

class SimulatedSensorDriver : public ISensorDriver {
public:
    SimulatedSensorDriver(std::vector<SimulatedStep> steps, bool cycle, double mean, double stddev, unsigned seed);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    std::vector<SimulatedStep> steps_;
    bool cycle_;
    std::size_t next_ = 0;
    double mean_;
    double stddev_;
    std::mt19937 rng_;
};

class DeltaSensorDriver : public ISensorDriver {
public:
    DeltaSensorDriver(const MeasurementStore &store, std::string input_a, std::string input_b);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    const MeasurementStore &store_;
    std::string input_a_;
    std::string input_b_;
};

} // namespace heatlog::core

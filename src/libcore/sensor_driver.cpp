#include "libcore/sensor_driver.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include "libcore/measurement_store.hpp"

namespace heatlog::core {
namespace {

std::optional<double> read_number_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    double value = 0.0;
    in >> value;
    if (in.fail() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string trim(const std::string &s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::optional<double> parse_double_text(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        const double v = std::stod(text, &idx);
        if (idx != text.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

DriverSample failure(std::string error) {
    DriverSample s;
    s.ok = false;
    s.error = std::move(error);
    return s;
}

DriverSample success(double value) {
    DriverSample s;
    s.ok = true;
    s.value = value;
    return s;
}

} // namespace

SysfsSensorDriver::SysfsSensorDriver(std::string path, double scale) : path_(std::move(path)), scale_(scale) {}

DriverSample SysfsSensorDriver::read(std::chrono::milliseconds /* timeout */) {
    const auto v = read_number_file(path_);
    if (!v) {
        return failure("cannot read " + path_);
    }
    return success(*v * scale_);
}

std::string SysfsSensorDriver::describe() const {
    return "sysfs path=" + path_;
}

DriverSample parse_w1_slave_text(const std::string &text) {
    std::istringstream in(text);
    std::string crc_line;
    std::string temp_line;
    if (!std::getline(in, crc_line) || !std::getline(in, temp_line)) {
        return failure("w1 slave output is truncated");
    }

    crc_line = trim(crc_line);
    if (crc_line.size() < 3 || crc_line.compare(crc_line.size() - 3, 3, "YES") != 0) {
        return failure("w1 crc check failed");
    }

    const std::size_t pos = temp_line.find("t=");
    if (pos == std::string::npos) {
        return failure("w1 temperature field missing");
    }
    const std::string raw = trim(temp_line.substr(pos + 2));
    try {
        std::size_t idx = 0;
        const long long milli = std::stoll(raw, &idx, 10);
        if (idx != raw.size()) {
            return failure("w1 temperature field is malformed: " + raw);
        }
        return success(static_cast<double>(milli) / 1000.0);
    } catch (const std::exception &) {
        return failure("w1 temperature field is malformed: " + raw);
    }
}

W1SensorDriver::W1SensorDriver(std::string devices_dir, std::string address) : address_(std::move(address)) {
    while (!devices_dir.empty() && devices_dir.back() == '/') {
        devices_dir.pop_back();
    }
    slave_path_ = devices_dir + "/" + address_ + "/w1_slave";
}

DriverSample W1SensorDriver::read(std::chrono::milliseconds /* timeout */) {
    std::ifstream in(slave_path_);
    if (!in) {
        return failure("cannot open " + slave_path_);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return failure("read failed for " + slave_path_);
    }
    return parse_w1_slave_text(buf.str());
}

std::string W1SensorDriver::describe() const {
    return "w1 address=" + address_;
}

std::optional<std::vector<SimulatedStep>> parse_simulated_script(const std::string &text, std::string &error) {
    std::vector<SimulatedStep> steps;
    if (trim(text).empty()) {
        return steps;
    }

    std::istringstream in(text);
    std::string token;
    while (std::getline(in, token, ';')) {
        token = trim(token);
        if (token.empty()) {
            error = "empty step in script";
            return std::nullopt;
        }

        SimulatedStep step;
        if (token == "error") {
            step.kind = SimulatedStep::Kind::Error;
        } else if (token.rfind("hang:", 0) == 0) {
            const auto ms = parse_double_text(token.substr(5));
            if (!ms || *ms < 0.0) {
                error = "bad hang duration: " + token;
                return std::nullopt;
            }
            step.kind = SimulatedStep::Kind::Hang;
            step.hang = std::chrono::milliseconds(static_cast<long long>(*ms));
        } else {
            const auto v = parse_double_text(token);
            if (!v) {
                error = "bad script value: " + token;
                return std::nullopt;
            }
            step.value = *v;
        }
        steps.push_back(step);
    }
    return steps;
}

SimulatedSensorDriver::SimulatedSensorDriver(std::vector<SimulatedStep> steps,
                                             bool cycle,
                                             double mean,
                                             double stddev,
                                             unsigned seed)
    : steps_(std::move(steps)), cycle_(cycle), mean_(mean), stddev_(stddev), rng_(seed) {}

DriverSample SimulatedSensorDriver::read(std::chrono::milliseconds /* timeout */) {
    if (steps_.empty()) {
        if (stddev_ <= 0.0) {
            return success(mean_);
        }
        std::normal_distribution<double> dist(mean_, stddev_);
        return success(dist(rng_));
    }

    const SimulatedStep &step = steps_[next_];
    if (next_ + 1 < steps_.size()) {
        ++next_;
    } else if (cycle_) {
        next_ = 0;
    }

    switch (step.kind) {
    case SimulatedStep::Kind::Value:
        return success(step.value);
    case SimulatedStep::Kind::Error:
        return failure("simulated sensor fault");
    case SimulatedStep::Kind::Hang:
        // ignores the timeout on purpose, the caller has to enforce it
        std::this_thread::sleep_for(step.hang);
        return failure("simulated sensor hang");
    }
    return failure("simulated sensor fault");
}

std::string SimulatedSensorDriver::describe() const {
    if (steps_.empty()) {
        std::ostringstream out;
        out << "simulated mean=" << mean_ << " stddev=" << stddev_;
        return out.str();
    }
    return "simulated steps=" + std::to_string(steps_.size()) + (cycle_ ? " cycle" : " last");
}

DeltaSensorDriver::DeltaSensorDriver(const MeasurementStore &store, std::string input_a, std::string input_b)
    : store_(store), input_a_(std::move(input_a)), input_b_(std::move(input_b)) {}

DriverSample DeltaSensorDriver::read(std::chrono::milliseconds /* timeout */) {
    const auto a = store_.latest(input_a_);
    if (!a || !a->ok()) {
        return failure("input " + input_a_ + " has no current value");
    }
    const auto b = store_.latest(input_b_);
    if (!b || !b->ok()) {
        return failure("input " + input_b_ + " has no current value");
    }
    return success(*a->value - *b->value);
}

std::string DeltaSensorDriver::describe() const {
    return "delta " + input_a_ + " - " + input_b_;
}

} // namespace heatlog::core

#pragma once

#include <chrono>
#include <string>

#include "libcore/sensor_driver.hpp"

namespace heatlog::core {

// Temperature exposed by another OpenWrt service over ubus. The reply key may
// carry millidegrees (temp_mC) or degrees, optionally as text with a unit.
class UbusSensorDriver : public ISensorDriver {
public:
    UbusSensorDriver(std::string object, std::string method, std::string key, std::string args_json);

    DriverSample read(std::chrono::milliseconds timeout) override;
    std::string describe() const override;

private:
    std::string object_;
    std::string method_;
    std::string key_;
    std::string args_json_;
};

} // namespace heatlog::core

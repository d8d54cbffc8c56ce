#pragma once

#include <stdexcept>
#include <string>

namespace heatlog::core {

// Inconsistent or unusable configuration; fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace heatlog::core

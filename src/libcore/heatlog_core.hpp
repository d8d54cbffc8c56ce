#pragma once

#include <string>
#include <vector>

namespace heatlog::core {

// Command line entry point; returns the process exit code.
int run(const std::vector<std::string> &args);

} // namespace heatlog::core

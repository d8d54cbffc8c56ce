#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "libcore/measurement_store.hpp"
#include "libcore/publisher.hpp"
#include "libcore/reading.hpp"
#include "libcore/reading_sink.hpp"

namespace heatlog::core {

struct SinkStatus {
    std::string name;
    SinkCounters counters;
};

struct RuntimeStatus {
    Clock::time_point generated_at;
    PublisherState publisher_state = PublisherState::Disabled;
    PublisherCounters publisher;
    std::uint64_t log_records = 0;
    std::uint64_t log_failures = 0;
    std::vector<SinkStatus> sinks;
};

// Latest reading of every source plus sink counters, for external displays.
std::string build_runtime_status_json(const MeasurementStore &store, const RuntimeStatus &status);

// Write-then-rename so readers never see a partial file.
bool write_runtime_status_file(const std::string &path, const std::string &payload, std::string &error);

} // namespace heatlog::core

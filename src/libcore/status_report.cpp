#include "libcore/status_report.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include <nlohmann/json.hpp>

namespace heatlog::core {

std::string build_runtime_status_json(const MeasurementStore &store, const RuntimeStatus &status) {
    nlohmann::json root = {
        {"ok", 1},
        {"timestamp", format_iso8601_utc(status.generated_at)},
        {"publisher",
         {
             {"state", publisher_state_name(status.publisher_state)},
             {"published", status.publisher.published},
             {"dropped", status.publisher.dropped},
             {"failed", status.publisher.failed},
             {"connects", status.publisher.connects},
         }},
        {"log",
         {
             {"records", status.log_records},
             {"failures", status.log_failures},
         }},
        {"sinks", nlohmann::json::array()},
        {"sources", nlohmann::json::array()},
    };

    for (const auto &s : status.sinks) {
        root["sinks"].push_back({
            {"name", s.name},
            {"submitted", s.counters.submitted},
            {"delivered", s.counters.delivered},
            {"dropped", s.counters.dropped},
            {"failed_batches", s.counters.failed_batches},
            {"queued", s.counters.queued},
        });
    }

    for (const auto &info : store.list_sources()) {
        nlohmann::json item = {
            {"id", info.id},
            {"label", info.label},
            {"group", info.group},
            {"color", info.color},
            {"unit", info.unit},
            {"graph", info.with_graph ? 1 : 0},
            {"history", store.history_size(info.id)},
        };

        const auto latest = store.latest_at(info.id, status.generated_at);
        if (latest) {
            item["status"] = status_name(latest->status);
            item["timestamp"] = format_iso8601_utc(latest->timestamp);
            item["formatted"] = latest->formatted;
            if (latest->value) {
                item["value"] = *latest->value;
            }
            if (!latest->error.empty()) {
                item["error"] = latest->error;
            }
        } else {
            item["status"] = "none";
            item["formatted"] = kMissingValueText;
        }
        root["sources"].push_back(std::move(item));
    }

    return root.dump();
}

bool write_runtime_status_file(const std::string &path, const std::string &payload, std::string &error) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out) {
            error = "cannot open " + tmp;
            return false;
        }
        out << payload << '\n';
        if (!out.good()) {
            error = "cannot write " + tmp;
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        error = "cannot rename " + tmp + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace heatlog::core

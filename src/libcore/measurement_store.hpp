#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "libcore/reading.hpp"

namespace heatlog::core {

struct SourceInfo {
    std::string id;
    std::string label;
    std::string group;
    std::string color;
    std::string unit;
    int decimals = 1;
    bool with_graph = true;
};

struct HistoryPolicy {
    std::chrono::seconds window = std::chrono::hours(24);
    std::chrono::seconds min_spacing{0};
    std::size_t max_samples = 86401;
    std::chrono::seconds stale_after{0}; // 0 disables stale marking
};

class MeasurementStore {
public:
    explicit MeasurementStore(HistoryPolicy policy = HistoryPolicy{});

    MeasurementStore(const MeasurementStore &) = delete;
    MeasurementStore &operator=(const MeasurementStore &) = delete;

    void register_source(const SourceInfo &info);
    std::vector<SourceInfo> list_sources() const;
    bool has_source(const std::string &id) const;

    bool update(const std::string &id, const Reading &reading);

    std::shared_ptr<const Reading> latest(const std::string &id) const;
    std::shared_ptr<const Reading> latest_at(const std::string &id, Clock::time_point now) const;

    std::vector<Reading> history(const std::string &id,
                                 Clock::time_point since = Clock::time_point::min()) const;

    void preload_history(const std::string &id, std::vector<Reading> readings);

    std::size_t history_size(const std::string &id) const;
    const HistoryPolicy &policy() const {
        return policy_;
    }

private:
    struct Entry {
        mutable std::mutex mutex;
        SourceInfo info;
        std::shared_ptr<const Reading> latest;
        std::deque<std::shared_ptr<const Reading>> history;
    };

    std::shared_ptr<Entry> find_entry(const std::string &id) const;
    void evict_locked(Entry &entry) const;

    HistoryPolicy policy_;
    mutable std::shared_mutex entries_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::vector<std::string> order_;
};

} // namespace heatlog::core

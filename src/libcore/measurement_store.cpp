#include "libcore/measurement_store.hpp"

#include <algorithm>
#include <utility>

namespace heatlog::core {

MeasurementStore::MeasurementStore(HistoryPolicy policy) : policy_(policy) {
    if (policy_.max_samples < 2) {
        policy_.max_samples = 2;
    }
}

void MeasurementStore::register_source(const SourceInfo &info) {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    auto &slot = entries_[info.id];
    if (!slot) {
        slot = std::make_shared<Entry>();
        order_.push_back(info.id);
    }
    std::lock_guard<std::mutex> guard(slot->mutex);
    slot->info = info;
}

std::vector<SourceInfo> MeasurementStore::list_sources() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    std::vector<SourceInfo> out;
    out.reserve(order_.size());
    for (const auto &id : order_) {
        const auto &entry = entries_.at(id);
        std::lock_guard<std::mutex> guard(entry->mutex);
        out.push_back(entry->info);
    }
    return out;
}

bool MeasurementStore::has_source(const std::string &id) const {
    return find_entry(id) != nullptr;
}

std::shared_ptr<MeasurementStore::Entry> MeasurementStore::find_entry(const std::string &id) const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

void MeasurementStore::evict_locked(Entry &entry) const {
    if (entry.history.empty()) {
        return;
    }
    const Clock::time_point horizon = entry.history.back()->timestamp - policy_.window;
    while (!entry.history.empty() && entry.history.front()->timestamp < horizon) {
        entry.history.pop_front();
    }
    while (entry.history.size() > policy_.max_samples) {
        entry.history.pop_front();
    }
}

bool MeasurementStore::update(const std::string &id, const Reading &reading) {
    const auto entry = find_entry(id);
    if (!entry) {
        return false;
    }

    auto shared = std::make_shared<const Reading>(reading);

    std::lock_guard<std::mutex> guard(entry->mutex);
    entry->latest = shared;

    if (!entry->history.empty()) {
        const Clock::time_point last = entry->history.back()->timestamp;
        // history stays ordered; a clock step backwards only updates latest
        if (reading.timestamp < last) {
            return true;
        }
        if (policy_.min_spacing.count() > 0 && reading.timestamp - last < policy_.min_spacing) {
            return true;
        }
    }

    entry->history.push_back(std::move(shared));
    evict_locked(*entry);
    return true;
}

std::shared_ptr<const Reading> MeasurementStore::latest(const std::string &id) const {
    return latest_at(id, Clock::now());
}

std::shared_ptr<const Reading> MeasurementStore::latest_at(const std::string &id, Clock::time_point now) const {
    const auto entry = find_entry(id);
    if (!entry) {
        return nullptr;
    }

    std::shared_ptr<const Reading> current;
    {
        std::lock_guard<std::mutex> guard(entry->mutex);
        current = entry->latest;
    }

    if (current && current->status == ReadingStatus::Ok && policy_.stale_after.count() > 0 &&
        now - current->timestamp > policy_.stale_after) {
        auto stale = std::make_shared<Reading>(*current);
        stale->status = ReadingStatus::Stale;
        return stale;
    }
    return current;
}

std::vector<Reading> MeasurementStore::history(const std::string &id, Clock::time_point since) const {
    const auto entry = find_entry(id);
    if (!entry) {
        return {};
    }

    // only the pointers are copied under the lock
    std::vector<std::shared_ptr<const Reading>> refs;
    {
        std::lock_guard<std::mutex> guard(entry->mutex);
        const auto first = std::lower_bound(entry->history.begin(),
                                            entry->history.end(),
                                            since,
                                            [](const std::shared_ptr<const Reading> &r, Clock::time_point t) {
                                                return r->timestamp < t;
                                            });
        refs.assign(first, entry->history.end());
    }

    std::vector<Reading> out;
    out.reserve(refs.size());
    for (const auto &r : refs) {
        out.push_back(*r);
    }
    return out;
}

void MeasurementStore::preload_history(const std::string &id, std::vector<Reading> readings) {
    const auto entry = find_entry(id);
    if (!entry || readings.empty()) {
        return;
    }

    std::stable_sort(readings.begin(), readings.end(), [](const Reading &a, const Reading &b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<std::shared_ptr<const Reading>> replayed;
    replayed.reserve(readings.size());
    for (auto &r : readings) {
        replayed.push_back(std::make_shared<const Reading>(std::move(r)));
    }

    std::lock_guard<std::mutex> guard(entry->mutex);
    std::deque<std::shared_ptr<const Reading>> merged;
    Clock::time_point last = Clock::time_point::min();
    bool have_last = false;

    auto take = [&](const std::shared_ptr<const Reading> &r) {
        if (have_last && policy_.min_spacing.count() > 0 && r->timestamp - last < policy_.min_spacing) {
            return;
        }
        merged.push_back(r);
        last = r->timestamp;
        have_last = true;
    };

    auto live = entry->history.begin();
    for (const auto &r : replayed) {
        while (live != entry->history.end() && (*live)->timestamp <= r->timestamp) {
            take(*live);
            ++live;
        }
        take(r);
    }
    for (; live != entry->history.end(); ++live) {
        take(*live);
    }

    entry->history = std::move(merged);
    evict_locked(*entry);
}

std::size_t MeasurementStore::history_size(const std::string &id) const {
    const auto entry = find_entry(id);
    if (!entry) {
        return 0;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    return entry->history.size();
}

} // namespace heatlog::core

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace heatlog::core {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue &) = delete;
    BoundedQueue &operator=(const BoundedQueue &) = delete;

    // false when the queue is closed; `dropped_oldest` tells whether room was made.
    bool push(T item, bool &dropped_oldest) {
        dropped_oldest = false;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return false;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                dropped_oldest = true;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Moves up to `max_items` into `out`. Returns false once the queue is
    // closed and empty; an empty `out` with true means the wait timed out.
    bool pop_batch(std::vector<T> &out, std::size_t max_items, std::chrono::milliseconds timeout) {
        out.clear();
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return closed_ || !items_.empty();
        });
        if (items_.empty()) {
            return !closed_;
        }
        while (!items_.empty() && out.size() < max_items) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> guard(mutex_);
        closed_ = false;
    }

    std::size_t clear() {
        std::lock_guard<std::mutex> guard(mutex_);
        const std::size_t n = items_.size();
        items_.clear();
        return n;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return items_.size();
    }

    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return dropped_;
    }

    std::size_t capacity() const {
        return capacity_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace heatlog::core

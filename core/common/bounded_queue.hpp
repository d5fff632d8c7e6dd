#pragma once

/**
 * @file bounded_queue.hpp
 * @brief Thread-safe bounded FIFO shared by the event bus and the install pipeline
 *
 * Two overflow policies:
 * - DROP_OLDEST: push always succeeds, the oldest element is evicted (event delivery)
 * - REJECT: push fails when full (install job intake, caller gets QUEUE_FULL)
 *
 * Consumers either poll (try_pop / pop_batch) or block in pop() until an element
 * arrives, the timeout expires or the queue is closed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "logging/logger.hpp"

namespace hearth {

enum class OverflowPolicy { DROP_OLDEST, REJECT };

template <typename T>
class BoundedQueue {
public:
    BoundedQueue(size_t max_size, OverflowPolicy policy, const std::string &name = "")
        : max_size_(max_size == 0 ? 1 : max_size), policy_(policy), name_(name) {}

    BoundedQueue(const BoundedQueue &) = delete;
    BoundedQueue &operator=(const BoundedQueue &) = delete;

    /**
     * @brief Push an element (producer side, never blocks)
     *
     * @return true if stored without loss. With DROP_OLDEST a full queue still
     *         stores the element but returns false; with REJECT nothing is stored.
     */
    bool push(T item) {
        bool should_log = false;
        size_t dropped_total = 0;
        bool lossless = true;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }

            if (items_.size() >= max_size_) {
                if (policy_ == OverflowPolicy::REJECT) {
                    return false;
                }
                items_.pop_front();
                dropped_count_++;
                dropped_total = dropped_count_;
                lossless = false;

                // First drop, then every 100 drops
                should_log = (dropped_count_ % 100 == 1);
            }

            items_.push_back(std::move(item));
        }

        cv_.notify_one();

        if (should_log) {
            LOG_WARN("[Queue] '" << name_ << "' overflow, dropped " << dropped_total << " items total");
        }
        return lossless;
    }

    /**
     * @brief Pop one element, waiting up to timeout_ms (0 = non-blocking, <0 = wait forever)
     *
     * Returns std::nullopt on timeout or when the queue is closed and drained.
     */
    std::optional<T> pop(int timeout_ms = 0) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (timeout_ms < 0) {
            cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        } else if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !items_.empty() || closed_; });
        }

        if (items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() { return pop(0); }

    // Take up to max_items in FIFO order without blocking
    std::vector<T> pop_batch(size_t max_items) {
        std::vector<T> batch;
        std::lock_guard<std::mutex> lock(mutex_);
        while (!items_.empty() && batch.size() < max_items) {
            batch.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return batch;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t dropped_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_count_;
    }

    size_t capacity() const { return max_size_; }

    // Close queue (unblocks waiting consumers, rejects further pushes)
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const size_t max_size_;
    const OverflowPolicy policy_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t dropped_count_ = 0;
    bool closed_ = false;
};

}  // namespace hearth

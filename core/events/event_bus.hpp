#pragma once

/**
 * @file event_bus.hpp
 * @brief Topic-based pub/sub with per-topic debounce, batched delivery and a bounded log
 *
 * Architecture:
 * - emit() records the event in a per-topic debounce slot. A second emission to
 *   the same topic inside the window replaces the payload and resets the timer
 *   (last payload wins).
 * - A dispatcher thread closes expired windows, assigns monotonic event ids,
 *   appends to the diagnostics log and fans out to per-subscriber bounded queues
 *   (oldest dropped on overflow).
 * - Each delivery cycle hands every subscriber at most batch_size events, in
 *   emission order. Handlers run without any bus lock held.
 * - A throwing handler is logged and counted; siblings still receive the event.
 *
 * Thread safety:
 * - emit/subscribe/unsubscribe may be called from any thread, including from
 *   inside a handler.
 * - unsubscribe() waits for an in-flight handler of that subscription unless it
 *   is called from the delivering thread itself, so a plugin can be torn down
 *   safely once unsubscribe returns.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "common/bounded_queue.hpp"
#include "common/status.hpp"
#include "event_types.hpp"

namespace hearth {
namespace events {

struct EventBusConfig {
    int debounce_ms = 100;                // PLUGIN_DEBOUNCE_MS
    size_t batch_size = 10;               // EVENT_BUS_BATCH_SIZE
    size_t max_log_size = 1000;           // EVENT_BUS_MAX_LOG_SIZE
    size_t subscriber_queue_size = 1000;  // Per-subscriber backlog before drop-oldest
};

struct EventBusStats {
    uint64_t emitted = 0;           // emit() calls accepted
    uint64_t coalesced = 0;         // emissions merged into an open window
    uint64_t dispatched = 0;        // events that left the debounce stage
    uint64_t delivered = 0;         // (event, subscriber) deliveries attempted
    uint64_t handler_failures = 0;  // HANDLER_FAILURE occurrences
    uint64_t dropped = 0;           // subscriber queue overflow drops
};

class EventBus {
public:
    explicit EventBus(const EventBusConfig &config = EventBusConfig());
    ~EventBus();

    EventBus(const EventBus &) = delete;
    EventBus &operator=(const EventBus &) = delete;

    // Start the dispatcher thread. Emissions before start() are held until then.
    void start();

    // Flush every open window, deliver, then join the dispatcher. Later emits fail.
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Subscribe a per-event handler
     *
     * @param pattern Topic pattern ("*" = one segment)
     * @param handler Called once per event on the delivery thread
     * @param id Receives the subscription id on success
     * @param name Debug name for logging
     * @return INVALID_ARGUMENT for malformed patterns or empty handlers
     */
    Status subscribe(const std::string &pattern, EventHandler handler, SubscriptionId &id,
                     const std::string &name = "");

    // Same contract, but the handler receives a whole delivery batch
    Status subscribe_batch(const std::string &pattern, BatchHandler handler, SubscriptionId &id,
                           const std::string &name = "");

    // Returns false if the id is unknown
    bool unsubscribe(SubscriptionId id);

    // Queue an event for delivery after the topic's debounce window
    Status emit(const std::string &topic, nlohmann::json payload, const std::string &source = "");

    // Close all windows now and run delivery cycles on the calling thread.
    // No-op when called from inside a handler.
    void flush_now();

    // Block until nothing is pending or being delivered. Returns false on timeout.
    bool wait_idle(int timeout_ms);

    // Diagnostics log, oldest first (limit 0 = everything retained)
    std::vector<Event> recent_events(size_t limit = 0) const;

    size_t subscriber_count() const;
    size_t pending_count() const;
    EventBusStats stats() const;
    const EventBusConfig &config() const { return config_; }

private:
    struct Subscriber {
        Subscriber(const std::string &sub_pattern, const std::string &sub_name, size_t queue_size)
            : pattern(sub_pattern), name(sub_name), queue(queue_size, OverflowPolicy::DROP_OLDEST, sub_name) {}

        SubscriptionId id = 0;  // assigned before the subscriber is published
        const std::string pattern;
        const std::string name;
        EventHandler event_handler;  // exactly one of the two handlers is set
        BatchHandler batch_handler;
        BoundedQueue<Event> queue;
        std::mutex delivery_mutex;  // held while a handler runs
        std::atomic<bool> active{true};
    };

    struct PendingEvent {
        Event event;
        uint64_t seq = 0;  // emission order of the most recent coalesced emit
        std::chrono::steady_clock::time_point due;
    };

    Status add_subscriber(std::shared_ptr<Subscriber> subscriber, SubscriptionId &id);
    void dispatcher_loop();

    // Caller holds mutex_. Removes due (or all) pending events, ordered by emission.
    std::vector<Event> take_pending_locked(bool all, std::chrono::steady_clock::time_point now);

    // Take due (or all) pending events, fan out and run delivery cycles
    void run_delivery(bool all);
    void invoke(const std::shared_ptr<Subscriber> &subscriber, const std::vector<Event> &batch);

    const EventBusConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;       // wakes the dispatcher
    std::condition_variable idle_cv_;  // wakes wait_idle()
    std::unordered_map<std::string, PendingEvent> pending_;
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> subscribers_;
    std::deque<Event> log_;
    EventBusStats stats_;
    SubscriptionId next_subscription_id_ = 1;
    uint64_t next_event_id_ = 1;
    uint64_t next_seq_ = 1;
    int active_deliveries_ = 0;
    bool stopping_ = false;
    bool stopped_ = false;

    std::mutex delivery_mutex_;  // one delivery pass at a time, preserves order
    std::atomic<std::thread::id> delivering_thread_{};

    std::thread dispatcher_;
    std::atomic<bool> running_{false};
};

}  // namespace events
}  // namespace hearth

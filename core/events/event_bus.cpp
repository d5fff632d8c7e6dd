#include "event_bus.hpp"

#include <algorithm>

#include "logging/logger.hpp"
#include "topic_matcher.hpp"

namespace hearth {
namespace events {

EventBus::EventBus(const EventBusConfig &config) : config_(config) {}

EventBus::~EventBus() { stop(); }

void EventBus::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load() || stopped_) {
        return;
    }
    running_ = true;
    dispatcher_ = std::thread(&EventBus::dispatcher_loop, this);
    LOG_INFO("[EventBus] Started (debounce=" << config_.debounce_ms << "ms, batch=" << config_.batch_size
                                             << ", log=" << config_.max_log_size << ")");
}

void EventBus::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    } else {
        // Never started: deliver whatever is still held
        flush_now();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    running_ = false;
    idle_cv_.notify_all();
    LOG_INFO("[EventBus] Stopped");
}

Status EventBus::subscribe(const std::string &pattern, EventHandler handler, SubscriptionId &id,
                           const std::string &name) {
    if (!handler) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Handler must not be empty");
    }
    if (!is_valid_pattern(pattern)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid topic pattern: '" + pattern + "'");
    }
    auto subscriber =
        std::make_shared<Subscriber>(pattern, name.empty() ? pattern : name, config_.subscriber_queue_size);
    subscriber->event_handler = std::move(handler);
    return add_subscriber(std::move(subscriber), id);
}

Status EventBus::subscribe_batch(const std::string &pattern, BatchHandler handler, SubscriptionId &id,
                                 const std::string &name) {
    if (!handler) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Handler must not be empty");
    }
    if (!is_valid_pattern(pattern)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid topic pattern: '" + pattern + "'");
    }
    auto subscriber =
        std::make_shared<Subscriber>(pattern, name.empty() ? pattern : name, config_.subscriber_queue_size);
    subscriber->batch_handler = std::move(handler);
    return add_subscriber(std::move(subscriber), id);
}

Status EventBus::add_subscriber(std::shared_ptr<Subscriber> subscriber, SubscriptionId &id) {
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return Status::error(ErrorCode::UNAVAILABLE, "Event bus is stopped");
        }
        id = next_subscription_id_++;
        subscriber->id = id;
        subscribers_[id] = subscriber;
        total = subscribers_.size();
    }

    LOG_DEBUG("[EventBus] Subscription " << id << " created for '" << subscriber->pattern
                                         << "', total subscribers: " << total);
    return Status::success();
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::shared_ptr<Subscriber> subscriber;
    size_t remaining = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return false;
        }
        subscriber = it->second;
        subscribers_.erase(it);
        remaining = subscribers_.size();
    }

    subscriber->active = false;
    subscriber->queue.close();

    // Wait out an in-flight handler, unless we are that handler's thread
    if (delivering_thread_.load() != std::this_thread::get_id()) {
        std::lock_guard<std::mutex> guard(subscriber->delivery_mutex);
    }

    LOG_DEBUG("[EventBus] Subscription " << id << " removed, remaining: " << remaining);
    return true;
}

Status EventBus::emit(const std::string &topic, nlohmann::json payload, const std::string &source) {
    if (!is_valid_topic(topic)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid topic: '" + topic + "'");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || stopped_) {
            return Status::error(ErrorCode::UNAVAILABLE, "Event bus is stopped");
        }

        const auto due = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.debounce_ms);
        auto it = pending_.find(topic);
        if (it != pending_.end()) {
            // Last payload wins, window restarts
            it->second.event.payload = std::move(payload);
            it->second.event.source = source;
            it->second.event.timestamp_ms = now_epoch_ms();
            it->second.seq = next_seq_++;
            it->second.due = due;
            stats_.coalesced++;
        } else {
            PendingEvent pending;
            pending.event = Event::create(topic, std::move(payload), source);
            pending.seq = next_seq_++;
            pending.due = due;
            pending_.emplace(topic, std::move(pending));
        }
        stats_.emitted++;
    }

    cv_.notify_all();
    return Status::success();
}

std::vector<Event> EventBus::take_pending_locked(bool all, std::chrono::steady_clock::time_point now) {
    std::vector<PendingEvent> due;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (all || it->second.due <= now) {
            due.push_back(std::move(it->second));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    std::sort(due.begin(), due.end(), [](const PendingEvent &a, const PendingEvent &b) { return a.seq < b.seq; });

    std::vector<Event> events;
    events.reserve(due.size());
    for (auto &pending : due) {
        events.push_back(std::move(pending.event));
    }
    if (!events.empty()) {
        active_deliveries_++;
    }
    return events;
}

void EventBus::dispatcher_loop() {
    LOG_DEBUG("[EventBus] Dispatcher thread running");

    while (true) {
        bool done = false;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            if (!stopping_) {
                if (pending_.empty()) {
                    cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                } else {
                    auto next_due = std::chrono::steady_clock::time_point::max();
                    for (const auto &[topic, pending] : pending_) {
                        static_cast<void>(topic);
                        next_due = std::min(next_due, pending.due);
                    }
                    // Wakes early on new emissions or stop; the loop recomputes
                    cv_.wait_until(lock, next_due);
                }
            }
            done = stopping_;
        }

        run_delivery(done);
        if (done) {
            break;
        }
    }

    LOG_DEBUG("[EventBus] Dispatcher thread exiting");
}

void EventBus::flush_now() {
    if (delivering_thread_.load() == std::this_thread::get_id()) {
        return;
    }
    run_delivery(true);
}

void EventBus::run_delivery(bool all) {
    std::lock_guard<std::mutex> delivery_guard(delivery_mutex_);

    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto events = take_pending_locked(all, std::chrono::steady_clock::now());
        if (events.empty()) {
            return;
        }

        for (auto &event : events) {
            event.event_id = next_event_id_++;
            stats_.dispatched++;

            log_.push_back(event);
            while (log_.size() > config_.max_log_size) {
                log_.pop_front();
            }

            for (auto &[sub_id, subscriber] : subscribers_) {
                static_cast<void>(sub_id);
                if (!topic_matches(subscriber->pattern, event.topic)) {
                    continue;
                }
                if (!subscriber->queue.push(event)) {
                    stats_.dropped++;
                }
                if (std::find(targets.begin(), targets.end(), subscriber) == targets.end()) {
                    targets.push_back(subscriber);
                }
            }
        }
    }

    delivering_thread_ = std::this_thread::get_id();

    // Delivery cycles: at most batch_size events per subscriber per cycle
    bool more = true;
    while (more) {
        more = false;
        for (const auto &subscriber : targets) {
            auto batch = subscriber->queue.pop_batch(config_.batch_size);
            if (batch.empty()) {
                continue;
            }
            invoke(subscriber, batch);
            if (!subscriber->queue.empty()) {
                more = true;
            }
        }
    }

    delivering_thread_ = std::thread::id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_deliveries_--;
    }
    idle_cv_.notify_all();
}

void EventBus::invoke(const std::shared_ptr<Subscriber> &subscriber, const std::vector<Event> &batch) {
    uint64_t failures = 0;

    {
        std::lock_guard<std::mutex> guard(subscriber->delivery_mutex);
        if (!subscriber->active.load()) {
            return;
        }

        if (subscriber->batch_handler) {
            try {
                subscriber->batch_handler(batch);
            } catch (const std::exception &e) {
                failures++;
                LOG_ERROR("[EventBus] Handler failure in subscription " << subscriber->id << " ('" << subscriber->name
                                                                        << "'), batch of " << batch.size() << ": "
                                                                        << e.what());
            } catch (...) {
                failures++;
                LOG_ERROR("[EventBus] Handler failure in subscription " << subscriber->id << " ('" << subscriber->name
                                                                        << "'), batch of " << batch.size()
                                                                        << ": unknown exception");
            }
        } else {
            for (const auto &event : batch) {
                try {
                    subscriber->event_handler(event);
                } catch (const std::exception &e) {
                    failures++;
                    LOG_ERROR("[EventBus] Handler failure in subscription " << subscriber->id << " ('"
                                                                            << subscriber->name << "') for '"
                                                                            << event.topic << "': " << e.what());
                } catch (...) {
                    failures++;
                    LOG_ERROR("[EventBus] Handler failure in subscription " << subscriber->id << " ('"
                                                                            << subscriber->name << "') for '"
                                                                            << event.topic << "': unknown exception");
                }
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.delivered += batch.size();
    stats_.handler_failures += failures;
}

bool EventBus::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return pending_.empty() && active_deliveries_ == 0; });
}

std::vector<Event> EventBus::recent_events(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t skip = 0;
    if (limit > 0 && log_.size() > limit) {
        skip = log_.size() - limit;
    }
    return std::vector<Event>(log_.begin() + static_cast<std::ptrdiff_t>(skip), log_.end());
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventBus::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

EventBusStats EventBus::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace events
}  // namespace hearth

/**
 * @file event_bus_test.cpp
 * @brief EventBus debounce, routing, batching and failure isolation
 *
 * Most tests leave the dispatcher stopped and drive delivery with
 * flush_now() on the test thread, which keeps them deterministic.
 */

#include "events/event_bus.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/logger.hpp"

using namespace hearth;
using namespace hearth::events;

namespace {

EventBusConfig make_config(int debounce_ms = 0, size_t batch_size = 10, size_t max_log_size = 1000) {
    EventBusConfig config;
    config.debounce_ms = debounce_ms;
    config.batch_size = batch_size;
    config.max_log_size = max_log_size;
    return config;
}

}  // namespace

TEST(EventBusTest, RejectsMalformedPatternsAndTopics) {
    EventBus bus(make_config());
    SubscriptionId id = 0;

    Status status = bus.subscribe("kitchen..power", [](const Event &) {}, id);
    EXPECT_EQ(status.code(), ErrorCode::INVALID_ARGUMENT);

    status = bus.subscribe("kitchen.*", EventHandler(), id);
    EXPECT_EQ(status.code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(bus.emit("", {}).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(bus.emit("kitchen.*.power", {}).code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(EventBusTest, RoutesByWildcardPattern) {
    EventBus bus(make_config());
    std::vector<std::string> seen;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("*.device.*", [&](const Event &e) { seen.push_back(e.topic); }, id).ok());

    ASSERT_TRUE(bus.emit("kitchen.device.power", {{"on", true}}, "test").ok());
    ASSERT_TRUE(bus.emit("kitchen.sensor.power", {{"on", true}}, "test").ok());
    ASSERT_TRUE(bus.emit("kitchen.device.power.level", {{"value", 3}}, "test").ok());
    bus.flush_now();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "kitchen.device.power");
}

TEST(EventBusTest, DebounceKeepsLastPayload) {
    EventBus bus(make_config(50));
    std::mutex mutex;
    std::vector<Event> received;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("hall.device.state",
                              [&](const Event &e) {
                                  std::lock_guard<std::mutex> lock(mutex);
                                  received.push_back(e);
                              },
                              id)
                    .ok());
    bus.start();

    for (int level = 1; level <= 3; ++level) {
        ASSERT_TRUE(bus.emit("hall.device.state", {{"level", level}}, "dimmer").ok());
    }
    ASSERT_TRUE(bus.wait_idle(2000));

    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].payload["level"], 3);
        EXPECT_EQ(received[0].source, "dimmer");
    }

    auto stats = bus.stats();
    EXPECT_EQ(stats.emitted, 3u);
    EXPECT_EQ(stats.coalesced, 2u);
    EXPECT_EQ(stats.dispatched, 1u);
    bus.stop();
}

TEST(EventBusTest, DistinctTopicsAreNotCoalesced) {
    EventBus bus(make_config(50));
    std::atomic<int> count{0};

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("*.device.state", [&](const Event &) { count++; }, id).ok());
    bus.start();

    ASSERT_TRUE(bus.emit("hall.device.state", {}).ok());
    ASSERT_TRUE(bus.emit("porch.device.state", {}).ok());
    ASSERT_TRUE(bus.wait_idle(2000));

    EXPECT_EQ(count.load(), 2);
    bus.stop();
}

TEST(EventBusTest, BatchHandlerReceivesAtMostBatchSizeInOrder) {
    EventBus bus(make_config(0, 2));
    std::vector<std::vector<std::string>> batches;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe_batch("room.*",
                                    [&](const std::vector<Event> &batch) {
                                        std::vector<std::string> topics;
                                        for (const auto &e : batch) {
                                            topics.push_back(e.topic);
                                        }
                                        batches.push_back(topics);
                                    },
                                    id)
                    .ok());

    for (const char *topic : {"room.a", "room.b", "room.c", "room.d", "room.e"}) {
        ASSERT_TRUE(bus.emit(topic, {}).ok());
    }
    bus.flush_now();

    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0], (std::vector<std::string>{"room.a", "room.b"}));
    EXPECT_EQ(batches[1], (std::vector<std::string>{"room.c", "room.d"}));
    EXPECT_EQ(batches[2], (std::vector<std::string>{"room.e"}));
}

TEST(EventBusTest, ThrowingHandlerDoesNotStarveSiblings) {
    EventBus bus(make_config());
    int sibling_calls = 0;

    std::vector<std::string> errors;
    logging::Logger::set_sink([&](logging::Level level, const std::string &message) {
        if (level == logging::Level::LVL_ERROR) {
            errors.push_back(message);
        }
    });

    SubscriptionId failing = 0;
    SubscriptionId healthy = 0;
    ASSERT_TRUE(bus.subscribe("alarm.*", [](const Event &) { throw std::runtime_error("boom"); }, failing).ok());
    ASSERT_TRUE(bus.subscribe("alarm.*", [&](const Event &) { sibling_calls++; }, healthy).ok());

    ASSERT_TRUE(bus.emit("alarm.triggered", {{"zone", 2}}).ok());
    ASSERT_TRUE(bus.emit("alarm.cleared", {{"zone", 2}}).ok());
    bus.flush_now();

    logging::Logger::set_sink(nullptr);

    EXPECT_EQ(sibling_calls, 2);
    EXPECT_EQ(bus.stats().handler_failures, 2u);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("boom"), std::string::npos);
}

TEST(EventBusTest, NonStandardThrowIsCountedAsFailure) {
    EventBus bus(make_config());
    std::vector<Event> received;

    SubscriptionId thrower = 0;
    SubscriptionId sibling = 0;
    ASSERT_TRUE(bus.subscribe("kitchen.device.power", [](const Event &) { throw 42; }, thrower).ok());
    ASSERT_TRUE(bus.subscribe("kitchen.device.power", [&](const Event &e) { received.push_back(e); }, sibling).ok());

    ASSERT_TRUE(bus.emit("kitchen.device.power", {{"on", true}}).ok());
    bus.flush_now();

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].payload["on"], true);
    EXPECT_EQ(bus.stats().handler_failures, 1u);
    EXPECT_EQ(bus.stats().delivered, 2u);
}

TEST(EventBusTest, BatchHandlerThrowingNonStandardValueIsIsolated) {
    EventBus bus(make_config());
    size_t sibling_events = 0;

    SubscriptionId thrower = 0;
    SubscriptionId sibling = 0;
    ASSERT_TRUE(bus.subscribe_batch("porch.*", [](const std::vector<Event> &) { throw std::string("bad"); },
                                    thrower)
                    .ok());
    ASSERT_TRUE(bus.subscribe("porch.*", [&](const Event &) { sibling_events++; }, sibling).ok());

    ASSERT_TRUE(bus.emit("porch.motion", {{"seen", true}}).ok());
    ASSERT_TRUE(bus.emit("porch.light", {{"on", true}}).ok());
    bus.flush_now();

    EXPECT_EQ(sibling_events, 2u);
    EXPECT_EQ(bus.stats().handler_failures, 1u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus(make_config());
    int calls = 0;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("door.*", [&](const Event &) { calls++; }, id).ok());
    ASSERT_TRUE(bus.emit("door.opened", {}).ok());
    bus.flush_now();

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));

    ASSERT_TRUE(bus.emit("door.closed", {}).ok());
    bus.flush_now();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST(EventBusTest, HandlerMayUnsubscribeItself) {
    EventBus bus(make_config());
    int calls = 0;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("once.*",
                              [&](const Event &) {
                                  calls++;
                                  bus.unsubscribe(id);
                              },
                              id)
                    .ok());

    ASSERT_TRUE(bus.emit("once.a", {}).ok());
    bus.flush_now();
    ASSERT_TRUE(bus.emit("once.b", {}).ok());
    bus.flush_now();

    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, LogIsBoundedAndIdsAreMonotonic) {
    EventBus bus(make_config(0, 10, 3));

    for (const char *topic : {"log.a", "log.b", "log.c", "log.d", "log.e"}) {
        ASSERT_TRUE(bus.emit(topic, {}).ok());
    }
    bus.flush_now();

    auto log = bus.recent_events();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0].topic, "log.c");
    EXPECT_EQ(log[2].topic, "log.e");
    EXPECT_LT(log[0].event_id, log[1].event_id);
    EXPECT_LT(log[1].event_id, log[2].event_id);

    auto last = bus.recent_events(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].topic, "log.e");
}

TEST(EventBusTest, StopFlushesPendingAndRejectsLaterEmits) {
    EventBus bus(make_config(10000));
    int calls = 0;

    SubscriptionId id = 0;
    ASSERT_TRUE(bus.subscribe("late.*", [&](const Event &) { calls++; }, id).ok());
    bus.start();

    ASSERT_TRUE(bus.emit("late.event", {}).ok());
    bus.stop();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.emit("late.event", {}).code(), ErrorCode::UNAVAILABLE);
}

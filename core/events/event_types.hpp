#pragma once

/**
 * @file event_types.hpp
 * @brief Event value type routed by the EventBus
 *
 * Topics are dot-delimited hierarchical names ("kitchen.device.power").
 * Payloads are free-form JSON owned by the emitter.
 * Events are immutable value types; the bus copies them per subscriber.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "common/clock.hpp"

namespace hearth {
namespace events {

struct Event {
    uint64_t event_id = 0;  // Monotonic, assigned when the debounce window closes
    std::string topic;
    nlohmann::json payload;
    std::string source;        // Emitter identity (plugin id, "orchestrator", ...)
    int64_t timestamp_ms = 0;  // Epoch ms of the (last coalesced) emission

    static Event create(const std::string &topic, nlohmann::json payload, const std::string &source) {
        Event event;
        event.topic = topic;
        event.payload = std::move(payload);
        event.source = source;
        event.timestamp_ms = now_epoch_ms();
        return event;
    }
};

using SubscriptionId = uint64_t;

// Per-event handler. Exceptions are caught and logged by the bus.
using EventHandler = std::function<void(const Event &event)>;

// Batch handler, receives up to batch_size events in emission order
using BatchHandler = std::function<void(const std::vector<Event> &batch)>;

inline nlohmann::json event_to_json(const Event &event) {
    return {{"event_id", event.event_id},
            {"topic", event.topic},
            {"payload", event.payload},
            {"source", event.source},
            {"timestamp_ms", event.timestamp_ms}};
}

}  // namespace events
}  // namespace hearth

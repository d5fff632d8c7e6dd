#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.hpp"
#include "device_types.hpp"

namespace hearth {

namespace events {
class EventBus;
}
namespace graph {
class DeviceLinkGraph;
}

namespace devices {

// Device Registry - Thread-safe device inventory
/**
 * Thread Safety:
 * - All read methods use shared_lock and return copies
 * - All write methods use unique_lock
 *
 * Every successful mutation emits "device.<id>.updated" on the bus (if
 * attached) with the device snapshot as payload. Removing a device also
 * drops its links from the link graph (if attached).
 *
 * Device ids are single topic segments: non-empty, no '.' and no '*'.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(events::EventBus *bus = nullptr, graph::DeviceLinkGraph *graph = nullptr);

    // Insert or replace. updated_at is stamped here.
    Status upsert(Device device);

    Status set_online(const std::string &device_id, bool online);
    Status set_power(const std::string &device_id, bool on);

    // Merge top-level keys of a state payload into the device state
    Status update_state(const std::string &device_id, const nlohmann::json &state);

    Status remove(const std::string &device_id);

    std::optional<Device> get(const std::string &device_id) const;
    std::vector<Device> list() const;  // insertion order
    size_t size() const;

    static bool is_valid_device_id(const std::string &device_id);

private:
    Status mutate(const std::string &device_id, const std::function<void(Device &device)> &fn);
    void publish(const Device &device);

    events::EventBus *bus_;
    graph::DeviceLinkGraph *graph_;

    mutable std::shared_mutex mutex_;
    std::vector<Device> devices_;
    std::unordered_map<std::string, size_t> index_;  // id -> position in devices_
};

}  // namespace devices
}  // namespace hearth

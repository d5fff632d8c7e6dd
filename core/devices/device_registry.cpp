#include "device_registry.hpp"

#include <functional>
#include <mutex>

#include "common/clock.hpp"
#include "events/event_bus.hpp"
#include "graph/device_link_graph.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace devices {

DeviceRegistry::DeviceRegistry(events::EventBus *bus, graph::DeviceLinkGraph *graph) : bus_(bus), graph_(graph) {}

bool DeviceRegistry::is_valid_device_id(const std::string &device_id) {
    return !device_id.empty() && device_id.find('.') == std::string::npos && device_id.find('*') == std::string::npos;
}

Status DeviceRegistry::upsert(Device device) {
    if (!is_valid_device_id(device.id)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
                             "Invalid device id '" + device.id + "': must be non-empty without '.' or '*'");
    }
    if (!device.state.is_object()) {
        device.state = nlohmann::json::object();
    }
    device.updated_at = now_epoch_ms();
    if (device.is_online && device.last_seen == 0) {
        device.last_seen = device.updated_at;
    }

    bool created = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(device.id);
        if (it == index_.end()) {
            index_[device.id] = devices_.size();
            devices_.push_back(device);
            created = true;
        } else {
            devices_[it->second] = device;
        }
    }

    if (created) {
        LOG_DEBUG("[Devices] Added device '" << device.id << "'");
    }
    publish(device);
    return Status::success();
}

Status DeviceRegistry::mutate(const std::string &device_id, const std::function<void(Device &device)> &fn) {
    Device snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(device_id);
        if (it == index_.end()) {
            return Status::error(ErrorCode::NOT_FOUND, "Device '" + device_id + "' not found");
        }
        Device &device = devices_[it->second];
        fn(device);
        device.updated_at = now_epoch_ms();
        snapshot = device;
    }
    publish(snapshot);
    return Status::success();
}

Status DeviceRegistry::set_online(const std::string &device_id, bool online) {
    return mutate(device_id, [online](Device &device) {
        device.is_online = online;
        if (online) {
            device.last_seen = now_epoch_ms();
        }
    });
}

Status DeviceRegistry::set_power(const std::string &device_id, bool on) {
    return mutate(device_id, [on](Device &device) { device.is_on = on; });
}

Status DeviceRegistry::update_state(const std::string &device_id, const nlohmann::json &state) {
    if (!state.is_object()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Device state must be an object");
    }
    return mutate(device_id, [&state](Device &device) {
        for (auto it = state.begin(); it != state.end(); ++it) {
            device.state[it.key()] = it.value();
        }
        device.last_seen = now_epoch_ms();
    });
}

Status DeviceRegistry::remove(const std::string &device_id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(device_id);
        if (it == index_.end()) {
            return Status::error(ErrorCode::NOT_FOUND, "Device '" + device_id + "' not found");
        }
        devices_.erase(devices_.begin() + static_cast<std::ptrdiff_t>(it->second));
        index_.clear();
        for (size_t i = 0; i < devices_.size(); ++i) {
            index_[devices_[i].id] = i;
        }
    }

    if (graph_) {
        size_t dropped = graph_->remove_device(device_id);
        if (dropped > 0) {
            LOG_INFO("[Devices] Removed " << dropped << " link(s) of device '" << device_id << "'");
        }
    }
    if (bus_) {
        Status status = bus_->emit("device." + device_id + ".removed", {{"id", device_id}}, "orchestrator");
        if (!status.ok()) {
            LOG_DEBUG("[Devices] Removal event not emitted: " << status.to_string());
        }
    }
    return Status::success();
}

std::optional<Device> DeviceRegistry::get(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(device_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

std::vector<Device> DeviceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::publish(const Device &device) {
    if (!bus_) {
        return;
    }
    Status status = bus_->emit("device." + device.id + ".updated", device_to_json(device), "orchestrator");
    if (!status.ok()) {
        LOG_DEBUG("[Devices] Update event not emitted: " << status.to_string());
    }
}

}  // namespace devices
}  // namespace hearth

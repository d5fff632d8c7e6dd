#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace hearth {
namespace devices {

/**
 * @brief Inventory entry for one physical or virtual device
 *
 * attributes are free-form strings matched by binding selectors
 * ("room" -> "kitchen", "kind" -> "lamp"). state is the last reported
 * payload and is opaque to the orchestrator.
 */
struct Device {
    std::string id;
    std::map<std::string, std::string> attributes;
    bool is_online = false;
    bool is_on = false;
    int64_t last_seen = 0;   // epoch ms of the last online report
    int64_t updated_at = 0;  // epoch ms of the last mutation
    nlohmann::json state = nlohmann::json::object();
};

inline nlohmann::json device_to_json(const Device &device) {
    return {{"id", device.id},
            {"attributes", device.attributes},
            {"is_online", device.is_online},
            {"is_on", device.is_on},
            {"last_seen", device.last_seen},
            {"updated_at", device.updated_at},
            {"state", device.state}};
}

// Throws nlohmann::json::exception on malformed input
inline Device device_from_json(const nlohmann::json &json) {
    Device device;
    device.id = json.at("id").get<std::string>();
    device.attributes = json.value("attributes", std::map<std::string, std::string>());
    device.is_online = json.value("is_online", false);
    device.is_on = json.value("is_on", false);
    device.last_seen = json.value("last_seen", int64_t{0});
    device.updated_at = json.value("updated_at", int64_t{0});
    if (json.contains("state") && !json.at("state").is_null()) {
        device.state = json.at("state");
    }
    return device;
}

}  // namespace devices
}  // namespace hearth

#include "ownership_resolver.hpp"

namespace hearth {
namespace devices {

std::optional<Ownership> OwnershipResolver::resolve_owner(const std::string &device_id) const {
    auto device = devices_.get(device_id);
    if (!device) {
        return std::nullopt;
    }

    auto direct = bindings_.matching(*device);
    if (!direct.empty()) {
        return Ownership{direct.front().plugin_id, direct.front().selector, "", 0};
    }

    for (const auto &related : graph_.related_devices(device_id)) {
        auto related_device = devices_.get(related.device_id);
        if (!related_device) {
            continue;  // linked but not in inventory
        }
        auto matches = bindings_.matching(*related_device);
        if (!matches.empty()) {
            return Ownership{matches.front().plugin_id, matches.front().selector, related.device_id, related.depth};
        }
    }
    return std::nullopt;
}

std::vector<std::string> OwnershipResolver::owned_devices(const std::string &plugin_id) const {
    std::vector<std::string> result;
    for (const auto &device : devices_.list()) {
        auto owner = resolve_owner(device.id);
        if (owner && owner->plugin_id == plugin_id) {
            result.push_back(device.id);
        }
    }
    return result;
}

}  // namespace devices
}  // namespace hearth

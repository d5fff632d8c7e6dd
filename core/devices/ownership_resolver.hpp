#pragma once

#include <optional>
#include <string>
#include <vector>

#include "binding_table.hpp"
#include "device_registry.hpp"
#include "graph/device_link_graph.hpp"

namespace hearth {
namespace devices {

struct Ownership {
    std::string plugin_id;
    std::string selector;
    std::string via_device;  // empty for a direct match
    int depth = 0;           // link hops to via_device
};

/**
 * @brief Computes which plugin is authoritative for a device
 *
 * Ownership is never stored. A direct selector match wins (first binding in
 * registration order). Otherwise the device's related set is walked in link
 * graph traversal order and the first related device with a matching binding
 * decides.
 */
class OwnershipResolver {
public:
    OwnershipResolver(const DeviceRegistry &devices, const BindingTable &bindings, const graph::DeviceLinkGraph &graph)
        : devices_(devices), bindings_(bindings), graph_(graph) {}

    std::optional<Ownership> resolve_owner(const std::string &device_id) const;

    // Every device a plugin currently owns, directly or through links
    std::vector<std::string> owned_devices(const std::string &plugin_id) const;

private:
    const DeviceRegistry &devices_;
    const BindingTable &bindings_;
    const graph::DeviceLinkGraph &graph_;
};

}  // namespace devices
}  // namespace hearth

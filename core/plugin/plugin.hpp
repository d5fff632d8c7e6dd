#pragma once

/**
 * @file plugin.hpp
 * @brief Contract between the orchestrator and a plugin implementation
 *
 * The same IPlugin class runs in every runtime mode. In-process and embedded
 * plugins receive a context backed by the orchestrator's bus, binding table
 * and link graph; out-of-process plugins receive a context inside
 * hearth-plugin-host whose effects travel back over the RPC channel.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "common/status.hpp"
#include "events/event_types.hpp"
#include "graph/device_link_graph.hpp"

namespace hearth {

namespace external {
class IKeyValueCache;
class ITokenService;
}  // namespace external

namespace plugin {

/**
 * @brief Capabilities handed to a plugin for the lifetime of one load
 *
 * Everything registered through the context (subscriptions, bindings) is
 * released by the orchestrator when the plugin unloads. After that the
 * context is revoked and every call fails with UNAVAILABLE.
 */
class PluginContext {
public:
    virtual ~PluginContext() = default;

    virtual const std::string &plugin_id() const = 0;

    virtual Status subscribe_event(const std::string &pattern, events::EventHandler handler,
                                   events::SubscriptionId &id) = 0;
    virtual Status unsubscribe_event(events::SubscriptionId id) = 0;
    virtual Status emit_event(const std::string &topic, const nlohmann::json &payload) = 0;

    // Claim the devices matching a selector ("room=kitchen,kind=lamp*")
    virtual Status bind_devices(const std::string &selector) = 0;
    virtual Status unbind_devices(const std::string &selector) = 0;

    virtual std::vector<graph::RelatedDevice> related_devices(const std::string &device_id) const = 0;

    // Current config (validated, defaults applied)
    virtual nlohmann::json config() const = 0;

    // nullptr where the collaborator is not reachable (out-of-process, embedded)
    virtual external::ITokenService *tokens() = 0;
    virtual external::IKeyValueCache *cache() = 0;
};

class IPlugin {
public:
    virtual ~IPlugin() = default;

    // Register subscriptions and bindings. Returning false fails the load.
    virtual bool on_load(PluginContext &context, std::string &error) = 0;

    // Release plugin-side resources; the context is still usable here
    virtual void on_unload() = 0;

    virtual bool health_check() { return true; }

    virtual void on_config_changed(const nlohmann::json &config) { static_cast<void>(config); }
};

}  // namespace plugin
}  // namespace hearth

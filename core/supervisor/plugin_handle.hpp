#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

#include "common/status.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {

namespace devices {
class BindingTable;
}
namespace events {
class EventBus;
}
namespace external {
class IKeyValueCache;
class ITokenService;
}  // namespace external
namespace graph {
class DeviceLinkGraph;
}

namespace supervisor {

// Orchestrator services reachable from plugin contexts. Non-owning.
struct PluginServices {
    events::EventBus *bus = nullptr;
    devices::BindingTable *bindings = nullptr;
    graph::DeviceLinkGraph *graph = nullptr;
    external::ITokenService *tokens = nullptr;
    external::IKeyValueCache *cache = nullptr;
};

/**
 * @brief One running instance of a plugin under one runtime mode
 *
 * The supervisor drives a handle through load -> (health checks) -> unload
 * while holding the plugin's KeyedMutex. Only cancel() may be called
 * concurrently with another method.
 */
class IPluginHandle {
public:
    virtual ~IPluginHandle() = default;

    virtual const std::string &plugin_id() const = 0;
    virtual plugin::RuntimeMode mode() const = 0;

    /**
     * @brief Start the plugin and wait for it to finish on_load
     *
     * On failure everything the attempt created (processes, subscriptions,
     * bindings) has been torn down before this returns.
     *
     * @return TIMEOUT past timeout_ms, UNAVAILABLE if cancelled,
     *         LOAD_FAILED for any other failure
     */
    virtual Status load(int timeout_ms) = 0;

    // Abort an in-flight load or health check. Thread-safe. Cleared by unload().
    virtual void cancel() = 0;

    // Stop the plugin and release its subscriptions and bindings
    virtual void unload() = 0;

    virtual bool health_check(std::string &error) = 0;

    virtual Status notify_config_changed(const nlohmann::json &config) = 0;

    virtual bool is_available() const = 0;
};

// Interface for handle creation, mocked in supervisor tests
class IPluginHandleFactory {
public:
    virtual ~IPluginHandleFactory() = default;

    // nullptr with error set when the mode cannot be served
    virtual std::unique_ptr<IPluginHandle> create(const plugin::PluginRecord &record, plugin::RuntimeMode mode,
                                                  std::string &error) = 0;
};

}  // namespace supervisor
}  // namespace hearth

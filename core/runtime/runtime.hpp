#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "common/keyed_mutex.hpp"
#include "config.hpp"
#include "devices/binding_table.hpp"
#include "devices/device_registry.hpp"
#include "devices/ownership_resolver.hpp"
#include "events/event_bus.hpp"
#include "external/kv_cache.hpp"
#include "external/token_service.hpp"
#include "graph/device_link_graph.hpp"
#include "jobs/install_pipeline.hpp"
#include "plugin/plugin_factory.hpp"
#include "registry/plugin_registry.hpp"
#include "state/state_store.hpp"
#include "supervisor/handle_factory.hpp"
#include "supervisor/plugin_supervisor.hpp"

namespace hearth {
namespace runtime {

/**
 * @brief Owns and wires every orchestrator component
 *
 * Construction order (and reverse teardown order) follows the dependency
 * order: collaborators, bus and link graph, device inventory, registry,
 * supervisor, install pipeline.
 *
 * Registry changes drive the supervisor: disabling a plugin unloads it,
 * enabling loads it, a config change is forwarded to the running instance.
 * Install job updates are published on the bus as "plugin.job.updated".
 */
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build components, restore state, apply config seeds
    bool initialize(std::string &error);

    // Start threads and load enabled plugins
    bool start(std::string &error);

    // Main loop (blocking): autosave, until stop() or a signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the pipeline, save state, unload plugins, stop the bus
    void shutdown();

    bool save_state(std::string &error);
    state::PersistedState snapshot_state() const;

    // Load enabled plugins, dependencies first. Returns the number loaded.
    size_t load_enabled_plugins();

    registry::PluginRegistry &registry() { return *registry_; }
    supervisor::PluginSupervisor &supervisor() { return *supervisor_; }
    jobs::InstallPipeline &pipeline() { return *pipeline_; }
    events::EventBus &bus() { return *bus_; }
    graph::DeviceLinkGraph &graph() { return *graph_; }
    devices::DeviceRegistry &devices() { return *devices_; }
    devices::BindingTable &bindings() { return *bindings_; }
    devices::OwnershipResolver &ownership() { return *ownership_; }
    plugin::PluginFactoryTable &factories() { return factories_; }
    const RuntimeConfig &config() const { return config_; }

private:
    // Staged initialization helpers
    bool init_core_services(std::string &error);
    bool init_state(std::string &error);
    bool apply_config_seeds(std::string &error);
    bool init_supervisor(std::string &error);
    bool init_pipeline(std::string &error);

    void on_registry_change(registry::RegistryChange change, const plugin::PluginRecord &record);

    RuntimeConfig config_;

    std::unique_ptr<external::InMemoryKvCache> cache_;
    std::unique_ptr<external::InMemoryTokenService> tokens_;
    std::unique_ptr<events::EventBus> bus_;
    std::unique_ptr<graph::DeviceLinkGraph> graph_;
    std::unique_ptr<devices::DeviceRegistry> devices_;
    std::unique_ptr<devices::BindingTable> bindings_;
    std::unique_ptr<devices::OwnershipResolver> ownership_;
    plugin::PluginFactoryTable factories_;
    std::unique_ptr<registry::PluginRegistry> registry_;
    KeyedMutex plugin_locks_;
    std::unique_ptr<supervisor::DefaultHandleFactory> handle_factory_;
    std::unique_ptr<supervisor::PluginSupervisor> supervisor_;
    std::unique_ptr<jobs::InstallPipeline> pipeline_;
    std::unique_ptr<state::StateStore> state_store_;
    std::vector<jobs::InstallJob> restored_jobs_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};

}  // namespace runtime
}  // namespace hearth

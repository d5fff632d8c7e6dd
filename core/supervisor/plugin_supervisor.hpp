#pragma once

/**
 * @file plugin_supervisor.hpp
 * @brief Runtime mode supervisor: one plugin instance per id, under one mode
 *
 * State machine per instance:
 *
 *   UNLOADED -> LOADING -> LOADED -> UNLOADING -> UNLOADED
 *                  |          |
 *                  +-> ERRORED <-+
 *
 * - LOADING -> ERRORED on a failed or timed-out load. The handle has torn
 *   everything down before the state changes and the registry keeps
 *   loaded=false. Loads are never retried automatically.
 * - LOADED -> ERRORED after health_failure_threshold consecutive failed
 *   health checks. The instance keeps running; unloading is left to the
 *   operator (registry enabled flag). A later passing check returns it to
 *   LOADED.
 *
 * Every operation on one plugin runs inside that plugin's KeyedMutex
 * critical section, shared with the install pipeline. unload() cancels an
 * in-flight load or health check before it waits for the section.
 */

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/keyed_mutex.hpp"
#include "common/status.hpp"
#include "health_tracker.hpp"
#include "plugin_handle.hpp"

namespace hearth {

namespace events {
class EventBus;
}
namespace registry {
class PluginRegistry;
}

namespace supervisor {

enum class InstanceState { UNLOADED, LOADING, LOADED, UNLOADING, ERRORED };

const char *instance_state_to_string(InstanceState state);

struct SupervisorConfig {
    int load_timeout_ms = 60000;    // PLUGIN_LOAD_TIMEOUT
    int health_interval_ms = 5000;  // 0 disables the health thread
    int health_failure_threshold = 3;
};

struct InstanceSnapshot {
    std::string plugin_id;
    InstanceState state = InstanceState::UNLOADED;
    std::optional<plugin::RuntimeMode> mode;  // set while a handle exists
    std::string last_error;
    int consecutive_health_failures = 0;
    bool available = false;
};

class PluginSupervisor {
public:
    PluginSupervisor(registry::PluginRegistry &registry, IPluginHandleFactory &factory, KeyedMutex &plugin_locks,
                     events::EventBus *bus, const SupervisorConfig &config = SupervisorConfig());
    ~PluginSupervisor();

    PluginSupervisor(const PluginSupervisor &) = delete;
    PluginSupervisor &operator=(const PluginSupervisor &) = delete;

    // Start the periodic health check thread
    void start();

    // Stop health checks, then unload every instance
    void stop();

    /**
     * @brief Load a plugin under its registry runtime_mode
     *
     * Idempotent for a plugin already LOADED under that mode.
     *
     * @return NOT_FOUND, FAILED_PRECONDITION (disabled, unmet dependency),
     *         LOAD_FAILED, TIMEOUT, or UNAVAILABLE when cancelled by unload()
     */
    Status load(const std::string &plugin_id);

    // Idempotent; NOT_FOUND only for a plugin the supervisor and registry never saw
    Status unload(const std::string &plugin_id);

    // Unload then load from the current registry record (picks up upgrades)
    Status reload(const std::string &plugin_id);

    /**
     * @brief Move a plugin to another runtime mode
     *
     * A loaded plugin is unloaded and loaded again under new_mode. If that
     * fails the plugin is loaded again under its previous mode and the call
     * returns SWITCH_FAILED; runtime_mode only changes on success.
     *
     * @return UNSUPPORTED_MODE unless mode_switch_supported and new_mode is supported
     */
    Status switch_mode(const std::string &plugin_id, plugin::RuntimeMode new_mode);

    // Pass the registry's current config to a loaded instance (no-op otherwise)
    Status notify_config_changed(const std::string &plugin_id);

    // One health check pass over LOADED and ERRORED instances. Busy plugins are skipped.
    void run_health_checks();

    InstanceState state(const std::string &plugin_id) const;
    bool is_loaded(const std::string &plugin_id) const;
    std::optional<InstanceSnapshot> get_snapshot(const std::string &plugin_id) const;
    std::vector<InstanceSnapshot> snapshots() const;

    const SupervisorConfig &config() const { return config_; }

private:
    struct Instance {
        InstanceState state = InstanceState::UNLOADED;
        std::shared_ptr<IPluginHandle> handle;
        plugin::RuntimeMode mode = plugin::RuntimeMode::IN_PROCESS;
        std::string last_error;
    };

    // Caller holds the plugin's KeyedMutex section. With update_registry false the
    // registry's loaded flag is left for the caller to settle once.
    Status load_locked(const std::string &plugin_id, std::optional<plugin::RuntimeMode> mode_override,
                       bool require_enabled, bool update_registry = true);
    bool unload_locked(const std::string &plugin_id, bool update_registry = true);
    void mark_loaded(const std::string &plugin_id, bool loaded);
    Status check_dependencies(const plugin::PluginRecord &record) const;

    void set_state(const std::string &plugin_id, InstanceState state, const std::string &error = "");
    InstanceSnapshot make_snapshot(const std::string &plugin_id, const Instance &instance) const;

    void emit(const std::string &topic, const nlohmann::json &payload);
    void health_loop();

    registry::PluginRegistry &registry_;
    IPluginHandleFactory &factory_;
    KeyedMutex &plugin_locks_;
    events::EventBus *bus_;
    const SupervisorConfig config_;

    HealthTracker health_;

    mutable std::mutex mutex_;  // Protects instances_
    std::map<std::string, Instance> instances_;

    std::thread health_thread_;
    std::atomic<bool> running_{false};
    std::mutex health_wait_mutex_;
    std::condition_variable health_cv_;
};

}  // namespace supervisor
}  // namespace hearth

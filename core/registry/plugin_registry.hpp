#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {

namespace external {
class IKeyValueCache;
}

namespace registry {

enum class RegistryChange { REGISTERED, UPDATED, ENABLED, CONFIG, MODE, LOADED, REMOVED };

const char *registry_change_to_string(RegistryChange change);

/**
 * @brief Source of truth for plugin identity, config, enablement and mode
 *
 * Records are held by value behind a std::shared_mutex:
 * - Readers (get/list) take shared access and receive copies, so a caller
 *   never observes a partially updated record
 * - Every mutation takes exclusive access and replaces fields in one step
 *
 * Multi-step operations on one plugin (install completion, mode switch) are
 * additionally serialized by the caller through a per-id KeyedMutex.
 *
 * Change listeners are invoked after the lock is released with a snapshot of
 * the record as it was after the change.
 *
 * When a cache is attached, "plugin:<id>" and "plugins:*" keys are
 * invalidated on every mutation.
 */
class PluginRegistry {
public:
    using ChangeCallback = std::function<void(RegistryChange change, const plugin::PluginRecord &record)>;

    explicit PluginRegistry(external::IKeyValueCache *cache = nullptr);

    PluginRegistry(const PluginRegistry &) = delete;
    PluginRegistry &operator=(const PluginRegistry &) = delete;

    /**
     * @brief Register a new plugin
     *
     * An empty id is derived from the name ("Kitchen Lights" -> "kitchen_lights").
     * Config defaults from the schema are applied before validation.
     *
     * @param record Plugin to register (loaded is forced to false)
     * @param plugin_id Receives the assigned id
     * @return DUPLICATE_NAME if the id or name is taken, INVALID_ARGUMENT for a
     *         missing name or a runtime_mode outside supported_modes,
     *         INVALID_CONFIG if config fails the schema
     */
    Status register_plugin(plugin::PluginRecord record, std::string &plugin_id);

    Status set_enabled(const std::string &plugin_id, bool enabled);

    // Validates against the plugin's declared schema; INVALID_CONFIG on failure
    Status set_config(const std::string &plugin_id, const nlohmann::json &config);

    // Supervisor-owned fields
    Status set_loaded(const std::string &plugin_id, bool loaded);
    Status set_runtime_mode(const std::string &plugin_id, plugin::RuntimeMode mode);

    /**
     * @brief Create or update a record from an installed manifest
     *
     * Updates keep operator and runtime state (enabled, loaded, created_at) and
     * keep the current config when it is still valid under the new schema.
     * A runtime_mode the new manifest no longer supports falls back to the
     * manifest's default mode.
     *
     * @param created Set to true when the plugin was not registered before
     */
    Status upsert_from_manifest(const plugin::PluginRecord &manifest, bool &created);

    // FAILED_PRECONDITION while loaded
    Status remove(const std::string &plugin_id);

    std::optional<plugin::PluginRecord> get(const std::string &plugin_id) const;
    std::vector<plugin::PluginRecord> list() const;  // ordered by id
    bool has(const std::string &plugin_id) const;
    size_t size() const;

    void on_change(const ChangeCallback &callback);

    // Derive an id from a display name
    static std::string slugify(const std::string &name);

private:
    // Caller holds mutex_ exclusively
    Status validate_locked(const plugin::PluginRecord &record, const std::string &exclude_id) const;

    void invalidate_cache(const std::string &plugin_id);
    void notify(RegistryChange change, const plugin::PluginRecord &record);

    // Apply a mutation to one record; snapshot is taken under the lock
    Status mutate(const std::string &plugin_id, RegistryChange change,
                  const std::function<Status(plugin::PluginRecord &record)> &fn);

    external::IKeyValueCache *cache_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, plugin::PluginRecord> plugins_;

    std::mutex callbacks_mutex_;
    std::vector<ChangeCallback> callbacks_;
};

}  // namespace registry
}  // namespace hearth

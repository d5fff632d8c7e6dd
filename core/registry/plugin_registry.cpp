#include "plugin_registry.hpp"

#include <cctype>

#include "common/clock.hpp"
#include "external/kv_cache.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace registry {

const char *registry_change_to_string(RegistryChange change) {
    switch (change) {
        case RegistryChange::REGISTERED:
            return "registered";
        case RegistryChange::UPDATED:
            return "updated";
        case RegistryChange::ENABLED:
            return "enabled";
        case RegistryChange::CONFIG:
            return "config";
        case RegistryChange::MODE:
            return "mode";
        case RegistryChange::LOADED:
            return "loaded";
        case RegistryChange::REMOVED:
            return "removed";
        default:
            return "unknown";
    }
}

PluginRegistry::PluginRegistry(external::IKeyValueCache *cache) : cache_(cache) {}

std::string PluginRegistry::slugify(const std::string &name) {
    std::string slug;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            slug += static_cast<char>(std::tolower(uc));
        } else if (c == '_' || c == '-') {
            slug += c;
        } else if (!slug.empty() && slug.back() != '_') {
            slug += '_';
        }
    }
    while (!slug.empty() && slug.back() == '_') {
        slug.pop_back();
    }
    return slug;
}

Status PluginRegistry::validate_locked(const plugin::PluginRecord &record, const std::string &exclude_id) const {
    if (record.name.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Plugin name must not be empty");
    }
    if (record.id.empty() || record.id.find('.') != std::string::npos || record.id.find('*') != std::string::npos) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
                             "Plugin id '" + record.id + "' must be non-empty and contain no '.' or '*'");
    }
    if (record.supported_modes.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Plugin '" + record.id + "' declares no supported modes");
    }
    if (!record.supports_mode(record.runtime_mode)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
                             "Plugin '" + record.id + "': runtime_mode " +
                                 plugin::runtime_mode_to_string(record.runtime_mode) + " not in supported_modes");
    }

    for (const auto &[id, existing] : plugins_) {
        if (id == exclude_id) {
            continue;
        }
        if (id == record.id) {
            return Status::error(ErrorCode::DUPLICATE_NAME, "Plugin id '" + record.id + "' already registered");
        }
        if (existing.name == record.name) {
            return Status::error(ErrorCode::DUPLICATE_NAME,
                                 "Plugin name '" + record.name + "' already used by '" + id + "'");
        }
    }

    std::string error;
    if (!record.config_schema.validate(record.config, error)) {
        return Status::error(ErrorCode::INVALID_CONFIG, "Plugin '" + record.id + "': " + error);
    }
    return Status::success();
}

Status PluginRegistry::register_plugin(plugin::PluginRecord record, std::string &plugin_id) {
    if (record.id.empty()) {
        record.id = slugify(record.name);
    }
    if (record.name.empty()) {
        record.name = record.id;
    }
    record.loaded = false;
    record.config = record.config_schema.apply_defaults(record.config);
    if (record.created_at == 0) {
        record.created_at = now_epoch_ms();
    }

    plugin::PluginRecord snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Status status = validate_locked(record, "");
        if (!status.ok()) {
            LOG_WARN("[Registry] Register rejected: " << status.to_string());
            return status;
        }
        plugin_id = record.id;
        plugins_[record.id] = record;
        snapshot = record;
    }

    LOG_INFO("[Registry] Registered plugin '" << snapshot.id << "' (" << snapshot.name << " "
                                              << snapshot.latest_version << ", mode "
                                              << plugin::runtime_mode_to_string(snapshot.runtime_mode) << ")");
    invalidate_cache(snapshot.id);
    notify(RegistryChange::REGISTERED, snapshot);
    return Status::success();
}

Status PluginRegistry::mutate(const std::string &plugin_id, RegistryChange change,
                              const std::function<Status(plugin::PluginRecord &record)> &fn) {
    plugin::PluginRecord snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = plugins_.find(plugin_id);
        if (it == plugins_.end()) {
            return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
        }

        // Work on a copy so a failed mutation leaves the record untouched
        plugin::PluginRecord updated = it->second;
        Status status = fn(updated);
        if (!status.ok()) {
            return status;
        }
        it->second = updated;
        snapshot = std::move(updated);
    }

    invalidate_cache(plugin_id);
    notify(change, snapshot);
    return Status::success();
}

Status PluginRegistry::set_enabled(const std::string &plugin_id, bool enabled) {
    Status status = mutate(plugin_id, RegistryChange::ENABLED, [enabled](plugin::PluginRecord &record) {
        record.enabled = enabled;
        return Status::success();
    });
    if (status.ok()) {
        LOG_INFO("[Registry] Plugin '" << plugin_id << "' " << (enabled ? "enabled" : "disabled"));
    }
    return status;
}

Status PluginRegistry::set_config(const std::string &plugin_id, const nlohmann::json &config) {
    return mutate(plugin_id, RegistryChange::CONFIG, [&](plugin::PluginRecord &record) {
        nlohmann::json candidate = record.config_schema.apply_defaults(config);
        std::string error;
        if (!record.config_schema.validate(candidate, error)) {
            LOG_WARN("[Registry] Config rejected for '" << plugin_id << "': " << error);
            return Status::error(ErrorCode::INVALID_CONFIG, error);
        }
        record.config = std::move(candidate);
        return Status::success();
    });
}

Status PluginRegistry::set_loaded(const std::string &plugin_id, bool loaded) {
    return mutate(plugin_id, RegistryChange::LOADED, [loaded](plugin::PluginRecord &record) {
        record.loaded = loaded;
        return Status::success();
    });
}

Status PluginRegistry::set_runtime_mode(const std::string &plugin_id, plugin::RuntimeMode mode) {
    return mutate(plugin_id, RegistryChange::MODE, [mode](plugin::PluginRecord &record) {
        if (!record.supports_mode(mode)) {
            return Status::error(ErrorCode::UNSUPPORTED_MODE, "Plugin '" + record.id + "' does not support mode " +
                                                                  plugin::runtime_mode_to_string(mode));
        }
        record.runtime_mode = mode;
        return Status::success();
    });
}

Status PluginRegistry::upsert_from_manifest(const plugin::PluginRecord &manifest, bool &created) {
    created = false;
    if (!has(manifest.id)) {
        plugin::PluginRecord record = manifest;
        record.enabled = true;
        std::string plugin_id;
        Status status = register_plugin(std::move(record), plugin_id);
        created = status.ok();
        return status;
    }

    Status status = mutate(manifest.id, RegistryChange::UPDATED, [&](plugin::PluginRecord &record) {
        plugin::PluginRecord updated = manifest;
        if (updated.name.empty()) {
            updated.name = record.name;
        }
        for (const auto &[other_id, other] : plugins_) {
            if (other_id != record.id && other.name == updated.name) {
                return Status::error(ErrorCode::DUPLICATE_NAME,
                                     "Plugin name '" + updated.name + "' already used by '" + other_id + "'");
            }
        }
        updated.enabled = record.enabled;
        updated.loaded = record.loaded;
        updated.created_at = record.created_at;

        if (updated.supported_modes.empty()) {
            return Status::error(ErrorCode::INVALID_ARGUMENT, "Manifest for '" + manifest.id +
                                                                  "' declares no supported modes");
        }
        if (updated.supports_mode(record.runtime_mode)) {
            updated.runtime_mode = record.runtime_mode;
        } else if (record.loaded) {
            // The running instance must be stopped before its mode goes away
            return Status::error(ErrorCode::FAILED_PRECONDITION,
                                 "Plugin '" + manifest.id + "' is loaded as " +
                                     plugin::runtime_mode_to_string(record.runtime_mode) +
                                     ", which the new manifest drops");
        } else {
            updated.runtime_mode = updated.supported_modes.front();
        }

        // Keep the operator's config when the new schema still accepts it
        nlohmann::json kept = updated.config_schema.apply_defaults(record.config);
        std::string error;
        if (updated.config_schema.validate(kept, error)) {
            updated.config = std::move(kept);
        } else {
            LOG_WARN("[Registry] Existing config of '" << manifest.id << "' invalid under new schema (" << error
                                                       << "), using manifest defaults");
            updated.config = updated.config_schema.apply_defaults(manifest.config);
            if (!updated.config_schema.validate(updated.config, error)) {
                return Status::error(ErrorCode::INVALID_CONFIG, "Manifest for '" + manifest.id + "': " + error);
            }
        }

        record = std::move(updated);
        return Status::success();
    });

    if (status.ok()) {
        LOG_INFO("[Registry] Updated plugin '" << manifest.id << "' to " << manifest.latest_version);
    }
    return status;
}

Status PluginRegistry::remove(const std::string &plugin_id) {
    plugin::PluginRecord snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = plugins_.find(plugin_id);
        if (it == plugins_.end()) {
            return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
        }
        if (it->second.loaded) {
            return Status::error(ErrorCode::FAILED_PRECONDITION,
                                 "Plugin '" + plugin_id + "' is loaded; unload before removing");
        }
        snapshot = it->second;
        plugins_.erase(it);
    }

    LOG_INFO("[Registry] Removed plugin '" << plugin_id << "'");
    invalidate_cache(plugin_id);
    notify(RegistryChange::REMOVED, snapshot);
    return Status::success();
}

std::optional<plugin::PluginRecord> PluginRegistry::get(const std::string &plugin_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = plugins_.find(plugin_id);
    if (it == plugins_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<plugin::PluginRecord> PluginRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<plugin::PluginRecord> result;
    result.reserve(plugins_.size());
    for (const auto &[id, record] : plugins_) {
        static_cast<void>(id);
        result.push_back(record);
    }
    return result;
}

bool PluginRegistry::has(const std::string &plugin_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_.find(plugin_id) != plugins_.end();
}

size_t PluginRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_.size();
}

void PluginRegistry::on_change(const ChangeCallback &callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(callback);
}

void PluginRegistry::invalidate_cache(const std::string &plugin_id) {
    if (!cache_) {
        return;
    }
    cache_->remove("plugin:" + plugin_id);
    cache_->remove_pattern("plugins:*");
}

void PluginRegistry::notify(RegistryChange change, const plugin::PluginRecord &record) {
    std::vector<ChangeCallback> callbacks_copy;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_copy = callbacks_;
    }

    for (const auto &callback : callbacks_copy) {
        try {
            callback(change, record);
        } catch (const std::exception &e) {
            LOG_ERROR("[Registry] Error in change callback: " << e.what());
        } catch (...) {
            LOG_ERROR("[Registry] Unknown error in change callback");
        }
    }
}

}  // namespace registry
}  // namespace hearth

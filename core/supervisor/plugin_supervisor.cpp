#include "plugin_supervisor.hpp"

#include <chrono>

#include "events/event_bus.hpp"
#include "logging/logger.hpp"
#include "plugin/version_spec.hpp"
#include "registry/plugin_registry.hpp"

namespace hearth {
namespace supervisor {

const char *instance_state_to_string(InstanceState state) {
    switch (state) {
        case InstanceState::UNLOADED:
            return "unloaded";
        case InstanceState::LOADING:
            return "loading";
        case InstanceState::LOADED:
            return "loaded";
        case InstanceState::UNLOADING:
            return "unloading";
        case InstanceState::ERRORED:
            return "errored";
        default:
            return "unknown";
    }
}

PluginSupervisor::PluginSupervisor(registry::PluginRegistry &registry, IPluginHandleFactory &factory,
                                   KeyedMutex &plugin_locks, events::EventBus *bus, const SupervisorConfig &config)
    : registry_(registry),
      factory_(factory),
      plugin_locks_(plugin_locks),
      bus_(bus),
      config_(config),
      health_(config.health_failure_threshold) {}

PluginSupervisor::~PluginSupervisor() { stop(); }

void PluginSupervisor::start() {
    if (running_.exchange(true)) {
        return;
    }
    if (config_.health_interval_ms > 0) {
        health_thread_ = std::thread(&PluginSupervisor::health_loop, this);
    }
    LOG_INFO("[Supervisor] Started (load timeout " << config_.load_timeout_ms << "ms, health interval "
                                                   << config_.health_interval_ms << "ms)");
}

void PluginSupervisor::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(health_wait_mutex_);
        }
        health_cv_.notify_all();
        if (health_thread_.joinable()) {
            health_thread_.join();
        }
    }

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, instance] : instances_) {
            if (instance.handle) {
                ids.push_back(id);
            }
        }
    }
    for (const auto &id : ids) {
        Status status = unload(id);
        if (!status.ok()) {
            LOG_WARN("[Supervisor] Unload of '" << id << "' during shutdown failed: " << status.to_string());
        }
    }
}

Status PluginSupervisor::load(const std::string &plugin_id) {
    auto lock = plugin_locks_.lock(plugin_id);
    return load_locked(plugin_id, std::nullopt, true);
}

Status PluginSupervisor::unload(const std::string &plugin_id) {
    // Abort an in-flight load or health check so the section frees up quickly
    std::shared_ptr<IPluginHandle> in_flight;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(plugin_id);
        if (it != instances_.end()) {
            known = true;
            in_flight = it->second.handle;
        }
    }
    if (in_flight) {
        in_flight->cancel();
    }

    auto lock = plugin_locks_.lock(plugin_id);
    if (!known && !registry_.has(plugin_id)) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
    }
    unload_locked(plugin_id);
    return Status::success();
}

Status PluginSupervisor::reload(const std::string &plugin_id) {
    auto lock = plugin_locks_.lock(plugin_id);
    LOG_INFO("[Supervisor] Reloading plugin '" << plugin_id << "'");
    const bool was_loaded = unload_locked(plugin_id, false);
    Status status = load_locked(plugin_id, std::nullopt, false, false);
    if (status.ok()) {
        if (!was_loaded) {
            mark_loaded(plugin_id, true);
        }
    } else if (was_loaded) {
        mark_loaded(plugin_id, false);
    }
    return status;
}

Status PluginSupervisor::switch_mode(const std::string &plugin_id, plugin::RuntimeMode new_mode) {
    auto lock = plugin_locks_.lock(plugin_id);

    auto record = registry_.get(plugin_id);
    if (!record) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
    }
    const char *new_mode_name = plugin::runtime_mode_to_string(new_mode);
    if (!record->mode_switch_supported) {
        return Status::error(ErrorCode::UNSUPPORTED_MODE,
                             "Plugin '" + plugin_id + "' does not support mode switching");
    }
    if (!record->supports_mode(new_mode)) {
        return Status::error(ErrorCode::UNSUPPORTED_MODE,
                             "Plugin '" + plugin_id + "' does not support mode " + new_mode_name);
    }

    const plugin::RuntimeMode old_mode = record->runtime_mode;
    const char *old_mode_name = plugin::runtime_mode_to_string(old_mode);

    bool was_loaded = false;
    {
        std::lock_guard<std::mutex> state_lock(mutex_);
        auto it = instances_.find(plugin_id);
        was_loaded = it != instances_.end() && it->second.handle != nullptr;
    }

    if (!was_loaded) {
        Status status = registry_.set_runtime_mode(plugin_id, new_mode);
        if (status.ok() && old_mode != new_mode) {
            LOG_INFO("[Supervisor] Plugin '" << plugin_id << "' mode set to " << new_mode_name << " (not loaded)");
            emit("plugin.mode.changed", {{"plugin_id", plugin_id}, {"from", old_mode_name}, {"to", new_mode_name},
                                          {"loaded", false}});
        }
        return status;
    }
    if (old_mode == new_mode) {
        return Status::success();
    }

    LOG_INFO("[Supervisor] Switching plugin '" << plugin_id << "' from " << old_mode_name << " to "
                                               << new_mode_name);
    // The registry keeps reporting the plugin loaded throughout; only the final outcome is written
    unload_locked(plugin_id, false);

    Status status = load_locked(plugin_id, new_mode, false, false);
    if (status.ok()) {
        Status mode_status = registry_.set_runtime_mode(plugin_id, new_mode);
        if (mode_status.ok()) {
            emit("plugin.mode.changed", {{"plugin_id", plugin_id}, {"from", old_mode_name}, {"to", new_mode_name},
                                          {"loaded", true}});
            return Status::success();
        }
        // Registry refused the mode; do not leave the plugin running under it
        LOG_ERROR("[Supervisor] Registry rejected mode " << new_mode_name << " for '" << plugin_id
                                                         << "': " << mode_status.to_string());
        unload_locked(plugin_id, false);
        status = mode_status;
    }

    LOG_WARN("[Supervisor] Switch of '" << plugin_id << "' to " << new_mode_name
                                        << " failed, rolling back to " << old_mode_name);
    Status rollback = load_locked(plugin_id, old_mode, false, false);
    if (!rollback.ok()) {
        mark_loaded(plugin_id, false);
        LOG_ERROR("[Supervisor] Rollback of '" << plugin_id << "' to " << old_mode_name
                                               << " failed: " << rollback.to_string());
        return Status::error(ErrorCode::SWITCH_FAILED, "Switch to " + std::string(new_mode_name) + " failed (" +
                                                           status.message() + "); rollback to " + old_mode_name +
                                                           " failed (" + rollback.message() + ")");
    }
    return Status::error(ErrorCode::SWITCH_FAILED, "Switch to " + std::string(new_mode_name) + " failed (" +
                                                       status.message() + "); still running as " + old_mode_name);
}

Status PluginSupervisor::notify_config_changed(const std::string &plugin_id) {
    auto lock = plugin_locks_.lock(plugin_id);

    auto record = registry_.get(plugin_id);
    if (!record) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
    }

    std::shared_ptr<IPluginHandle> handle;
    {
        std::lock_guard<std::mutex> state_lock(mutex_);
        auto it = instances_.find(plugin_id);
        if (it != instances_.end()) {
            handle = it->second.handle;
        }
    }
    if (!handle) {
        LOG_DEBUG("[Supervisor] Config of '" << plugin_id << "' changed while not loaded");
        return Status::success();
    }

    Status status = handle->notify_config_changed(record->config);
    if (!status.ok()) {
        LOG_WARN("[Supervisor] Plugin '" << plugin_id << "' rejected config change: " << status.to_string());
    }
    return status;
}

Status PluginSupervisor::load_locked(const std::string &plugin_id, std::optional<plugin::RuntimeMode> mode_override,
                                     bool require_enabled, bool update_registry) {
    auto record = registry_.get(plugin_id);
    if (!record) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' not found");
    }
    if (require_enabled && !record->enabled) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin '" + plugin_id + "' is disabled");
    }

    const plugin::RuntimeMode mode = mode_override.value_or(record->runtime_mode);
    const char *mode_name = plugin::runtime_mode_to_string(mode);

    bool replace = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(plugin_id);
        if (it != instances_.end() && it->second.handle) {
            if (it->second.state == InstanceState::LOADED && it->second.mode == mode) {
                LOG_DEBUG("[Supervisor] Plugin '" << plugin_id << "' already loaded as " << mode_name);
                return Status::success();
            }
            replace = true;  // errored instance or a different mode
        }
    }
    if (replace) {
        unload_locked(plugin_id, update_registry);
    }

    Status status = check_dependencies(*record);
    if (!status.ok()) {
        LOG_WARN("[Supervisor] Not loading '" << plugin_id << "': " << status.message());
        return status;
    }

    record->runtime_mode = mode;
    std::string error;
    std::unique_ptr<IPluginHandle> created = factory_.create(*record, mode, error);
    if (!created) {
        set_state(plugin_id, InstanceState::ERRORED, error);
        LOG_ERROR("[Supervisor] Cannot run '" << plugin_id << "' as " << mode_name << ": " << error);
        emit("plugin.load.failed", {{"plugin_id", plugin_id}, {"mode", mode_name}, {"error", error}});
        return Status::error(ErrorCode::LOAD_FAILED, error);
    }

    std::shared_ptr<IPluginHandle> handle(std::move(created));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &instance = instances_[plugin_id];
        instance.handle = handle;
        instance.mode = mode;
        instance.state = InstanceState::LOADING;
        instance.last_error.clear();
    }

    LOG_INFO("[Supervisor] Loading plugin '" << plugin_id << "' as " << mode_name);
    const auto start = std::chrono::steady_clock::now();
    status = handle->load(config_.load_timeout_ms);

    if (!status.ok()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &instance = instances_[plugin_id];
            instance.handle.reset();
            instance.state = InstanceState::ERRORED;
            instance.last_error = status.message();
        }
        handle.reset();  // Already torn down by the handle
        LOG_ERROR("[Supervisor] Plugin '" << plugin_id << "' failed to load: " << status.to_string());
        emit("plugin.load.failed", {{"plugin_id", plugin_id},
                                    {"mode", mode_name},
                                    {"error", status.message()},
                                    {"code", error_code_to_string(status.code())}});
        return status;
    }

    set_state(plugin_id, InstanceState::LOADED);
    health_.reset(plugin_id);
    if (update_registry) {
        mark_loaded(plugin_id, true);
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    LOG_INFO("[Supervisor] Plugin '" << plugin_id << "' loaded as " << mode_name << " in " << elapsed << "ms");
    emit("plugin.loaded", {{"plugin_id", plugin_id}, {"mode", mode_name}});
    return Status::success();
}

bool PluginSupervisor::unload_locked(const std::string &plugin_id, bool update_registry) {
    std::shared_ptr<IPluginHandle> handle;
    plugin::RuntimeMode mode = plugin::RuntimeMode::IN_PROCESS;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(plugin_id);
        if (it == instances_.end()) {
            return false;
        }
        if (!it->second.handle) {
            // Failed load: nothing is running, just clear the error
            it->second.state = InstanceState::UNLOADED;
            return false;
        }
        handle = it->second.handle;
        mode = it->second.mode;
        it->second.state = InstanceState::UNLOADING;
    }

    LOG_INFO("[Supervisor] Unloading plugin '" << plugin_id << "'");
    handle->unload();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &instance = instances_[plugin_id];
        instance.handle.reset();
        instance.state = InstanceState::UNLOADED;
        instance.last_error.clear();
    }
    handle.reset();
    health_.reset(plugin_id);

    if (update_registry) {
        mark_loaded(plugin_id, false);
    }
    emit("plugin.unloaded", {{"plugin_id", plugin_id}, {"mode", plugin::runtime_mode_to_string(mode)}});
    return true;
}

void PluginSupervisor::mark_loaded(const std::string &plugin_id, bool loaded) {
    if (!registry_.has(plugin_id)) {
        return;
    }
    Status status = registry_.set_loaded(plugin_id, loaded);
    if (!status.ok()) {
        LOG_WARN("[Supervisor] Could not mark '" << plugin_id << "' " << (loaded ? "loaded" : "unloaded") << ": "
                                                 << status.to_string());
    }
}

Status PluginSupervisor::check_dependencies(const plugin::PluginRecord &record) const {
    for (const auto &dep : record.dependencies) {
        auto dep_record = registry_.get(dep.plugin_id);
        const bool dep_loaded = dep_record && dep_record->loaded;
        if (!dep_loaded) {
            if (dep.optional) {
                continue;
            }
            return Status::error(ErrorCode::FAILED_PRECONDITION,
                                 "Dependency '" + dep.plugin_id + "' of '" + record.id + "' is not loaded");
        }

        std::string error;
        if (!plugin::version_satisfies(dep_record->latest_version, dep.version_spec, error)) {
            std::string message = "Dependency '" + dep.plugin_id + "' version " + dep_record->latest_version +
                                  " does not satisfy '" + dep.version_spec + "'";
            if (!error.empty()) {
                message += " (" + error + ")";
            }
            return Status::error(ErrorCode::FAILED_PRECONDITION, message);
        }
    }
    return Status::success();
}

void PluginSupervisor::run_health_checks() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, instance] : instances_) {
            if (instance.handle &&
                (instance.state == InstanceState::LOADED || instance.state == InstanceState::ERRORED)) {
                ids.push_back(id);
            }
        }
    }

    for (const auto &id : ids) {
        auto section = plugin_locks_.try_lock(id);
        if (!section.owns_lock()) {
            LOG_DEBUG("[Supervisor] Skipping health check of busy plugin '" << id << "'");
            continue;
        }

        std::shared_ptr<IPluginHandle> handle;
        InstanceState state = InstanceState::UNLOADED;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = instances_.find(id);
            if (it == instances_.end() || !it->second.handle) {
                continue;
            }
            handle = it->second.handle;
            state = it->second.state;
        }

        std::string error;
        const bool healthy = handle->health_check(error);

        if (healthy) {
            health_.record_success(id);
            if (state == InstanceState::ERRORED) {
                set_state(id, InstanceState::LOADED);
                LOG_INFO("[Supervisor] Plugin '" << id << "' recovered");
                emit("plugin.health.recovered", {{"plugin_id", id}});
            }
            continue;
        }

        if (health_.record_failure(id, error)) {
            set_state(id, InstanceState::ERRORED, error);
            LOG_ERROR("[Supervisor] Plugin '" << id << "' marked errored after " << health_.threshold()
                                              << " failed health checks: " << error);
            emit("plugin.health.failed",
                 {{"plugin_id", id}, {"error", error}, {"consecutive_failures", health_.consecutive_failures(id)}});
        }
    }
}

InstanceState PluginSupervisor::state(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(plugin_id);
    return it == instances_.end() ? InstanceState::UNLOADED : it->second.state;
}

bool PluginSupervisor::is_loaded(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(plugin_id);
    return it != instances_.end() && it->second.handle && it->second.state != InstanceState::LOADING &&
           it->second.state != InstanceState::UNLOADING;
}

std::optional<InstanceSnapshot> PluginSupervisor::get_snapshot(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(plugin_id);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    return make_snapshot(plugin_id, it->second);
}

std::vector<InstanceSnapshot> PluginSupervisor::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstanceSnapshot> result;
    result.reserve(instances_.size());
    for (const auto &[id, instance] : instances_) {
        result.push_back(make_snapshot(id, instance));
    }
    return result;
}

InstanceSnapshot PluginSupervisor::make_snapshot(const std::string &plugin_id, const Instance &instance) const {
    InstanceSnapshot snapshot;
    snapshot.plugin_id = plugin_id;
    snapshot.state = instance.state;
    if (instance.handle) {
        snapshot.mode = instance.mode;
        snapshot.available = instance.handle->is_available();
    }
    snapshot.last_error = instance.last_error;
    snapshot.consecutive_health_failures = health_.consecutive_failures(plugin_id);
    return snapshot;
}

void PluginSupervisor::set_state(const std::string &plugin_id, InstanceState state, const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &instance = instances_[plugin_id];
    instance.state = state;
    instance.last_error = error;
}

void PluginSupervisor::emit(const std::string &topic, const nlohmann::json &payload) {
    if (!bus_) {
        return;
    }
    Status status = bus_->emit(topic, payload, "orchestrator");
    if (!status.ok()) {
        LOG_DEBUG("[Supervisor] Event '" << topic << "' not emitted: " << status.to_string());
    }
}

void PluginSupervisor::health_loop() {
    LOG_DEBUG("[Supervisor] Health thread running");
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(health_wait_mutex_);
            health_cv_.wait_for(lock, std::chrono::milliseconds(config_.health_interval_ms),
                                [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        try {
            run_health_checks();
        } catch (const std::exception &e) {
            LOG_ERROR("[Supervisor] Health check pass failed: " << e.what());
        }
    }
}

}  // namespace supervisor
}  // namespace hearth

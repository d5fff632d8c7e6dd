#include "runtime.hpp"

#include <thread>

#include "jobs/git_installer.hpp"
#include "jobs/local_installer.hpp"
#include "jobs/url_installer.hpp"
#include "logging/logger.hpp"
#include "plugins/builtin_plugins.hpp"
#include "signal_handler.hpp"

namespace hearth {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Hearth orchestrator");

    if (!init_core_services(error)) {
        return false;
    }
    if (!init_state(error)) {
        return false;
    }
    if (!apply_config_seeds(error)) {
        return false;
    }
    if (!init_supervisor(error)) {
        return false;
    }
    if (!init_pipeline(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &error) {
    static_cast<void>(error);

    cache_ = std::make_unique<external::InMemoryKvCache>();
    tokens_ = std::make_unique<external::InMemoryTokenService>();

    bus_ = std::make_unique<events::EventBus>(config_.event_bus);
    LOG_INFO("[Runtime] Event bus created (debounce " << config_.event_bus.debounce_ms << "ms, batch "
                                                      << config_.event_bus.batch_size << ")");

    graph_ = std::make_unique<graph::DeviceLinkGraph>(config_.orchestrator.max_link_depth);
    devices_ = std::make_unique<devices::DeviceRegistry>(bus_.get(), graph_.get());
    bindings_ = std::make_unique<devices::BindingTable>();
    ownership_ = std::make_unique<devices::OwnershipResolver>(*devices_, *bindings_, *graph_);

    plugins::register_builtin_plugins(factories_);
    registry_ = std::make_unique<registry::PluginRegistry>(cache_.get());
    return true;
}

bool Runtime::init_state(std::string &error) {
    state_store_ = std::make_unique<state::StateStore>(config_.state.path);

    state::PersistedState persisted;
    if (!state_store_->load(persisted, error)) {
        return false;
    }

    for (auto &record : persisted.plugins) {
        std::string plugin_id;
        Status status = registry_->register_plugin(record, plugin_id);
        if (!status.ok()) {
            LOG_WARN("[Runtime] Skipping persisted plugin '" << record.id << "': " << status.to_string());
        }
    }
    for (auto &device : persisted.devices) {
        Status status = devices_->upsert(device);
        if (!status.ok()) {
            LOG_WARN("[Runtime] Skipping persisted device '" << device.id << "': " << status.to_string());
        }
    }
    for (const auto &link : persisted.links) {
        Status status = graph_->add_link(link.from, link.to, link.type, link.direction);
        if (!status.ok()) {
            LOG_WARN("[Runtime] Skipping persisted link " << link.from << " -> " << link.to << ": "
                                                          << status.to_string());
        }
    }
    if (!persisted.bindings.empty()) {
        LOG_DEBUG("[Runtime] " << persisted.bindings.size()
                               << " persisted bindings ignored; plugins bind again on load");
    }
    restored_jobs_ = std::move(persisted.jobs);
    return true;
}

bool Runtime::apply_config_seeds(std::string &error) {
    // Persisted state wins over config for anything already known
    for (const auto &record : config_.plugins) {
        if (registry_->has(record.id)) {
            LOG_DEBUG("[Runtime] Plugin '" << record.id << "' already in state, config entry ignored");
            continue;
        }
        std::string plugin_id;
        Status status = registry_->register_plugin(record, plugin_id);
        if (!status.ok()) {
            error = "Plugin '" + record.id + "' from config: " + status.to_string();
            return false;
        }
    }

    for (const auto &device : config_.devices) {
        if (devices_->get(device.id)) {
            continue;
        }
        Status status = devices_->upsert(device);
        if (!status.ok()) {
            error = "Device '" + device.id + "' from config: " + status.to_string();
            return false;
        }
    }

    for (const auto &link : config_.links) {
        Status status = graph_->add_link(link.from, link.to, link.type, link.direction);
        if (status.code() == ErrorCode::LINK_EXISTS) {
            continue;
        }
        if (!status.ok()) {
            error = "Link " + link.from + " -> " + link.to + " from config: " + status.to_string();
            return false;
        }
    }

    LOG_INFO("[Runtime] " << registry_->size() << " plugins, " << devices_->size() << " devices, "
                          << graph_->link_count() << " links");
    return true;
}

bool Runtime::init_supervisor(std::string &error) {
    static_cast<void>(error);

    supervisor::PluginServices services;
    services.bus = bus_.get();
    services.bindings = bindings_.get();
    services.graph = graph_.get();
    services.tokens = tokens_.get();
    services.cache = cache_.get();

    supervisor::MicroserviceOptions options;
    options.host_executable = config_.orchestrator.plugin_host;
    options.rpc_timeout_ms = config_.orchestrator.rpc_timeout_ms;
    options.hello_timeout_ms = config_.orchestrator.rpc_timeout_ms;
    options.shutdown_timeout_ms = config_.orchestrator.shutdown_timeout_ms;
    handle_factory_ = std::make_unique<supervisor::DefaultHandleFactory>(services, factories_, options);

    supervisor::SupervisorConfig supervisor_config;
    supervisor_config.load_timeout_ms = config_.orchestrator.load_timeout_ms;
    supervisor_config.health_interval_ms = config_.orchestrator.health_interval_ms;
    supervisor_config.health_failure_threshold = config_.orchestrator.health_failure_threshold;
    supervisor_ = std::make_unique<supervisor::PluginSupervisor>(*registry_, *handle_factory_, plugin_locks_,
                                                                 bus_.get(), supervisor_config);
    LOG_INFO("[Runtime] Plugin supervisor created");

    registry_->on_change([this](registry::RegistryChange change, const plugin::PluginRecord &record) {
        on_registry_change(change, record);
    });
    return true;
}

bool Runtime::init_pipeline(std::string &error) {
    static_cast<void>(error);

    jobs::InstallPipelineConfig pipeline_config;
    pipeline_config.workers = config_.orchestrator.install_workers;
    pipeline_config.queue_size = config_.orchestrator.install_queue_size;
    pipeline_config.install_timeout_ms = config_.orchestrator.install_timeout_ms;
    pipeline_ = std::make_unique<jobs::InstallPipeline>(*registry_, plugin_locks_, pipeline_config);

    pipeline_->register_backend(std::make_unique<jobs::LocalInstaller>());
    pipeline_->register_backend(std::make_unique<jobs::UrlInstaller>(config_.orchestrator.url_timeout_ms));
    pipeline_->register_backend(
        std::make_unique<jobs::GitInstaller>(config_.orchestrator.staging_dir, config_.orchestrator.git_command));

    pipeline_->set_reload_hook([this](const std::string &plugin_id) { return supervisor_->reload(plugin_id); });
    pipeline_->set_unload_hook([this](const std::string &plugin_id) { return supervisor_->unload(plugin_id); });
    pipeline_->set_binding_count_hook(
        [this](const std::string &plugin_id) { return bindings_->count_for(plugin_id); });

    pipeline_->on_job_update([this](const jobs::InstallJob &job) {
        Status status = bus_->emit("plugin.job.updated", jobs::install_job_to_json(job), "orchestrator");
        if (!status.ok()) {
            LOG_DEBUG("[Runtime] Job update for " << job.id << " not published: " << status.to_string());
        }
    });

    pipeline_->restore_jobs(restored_jobs_);
    restored_jobs_.clear();
    return true;
}

bool Runtime::start(std::string &error) {
    bus_->start();
    supervisor_->start();
    if (!pipeline_->start()) {
        error = "Install pipeline failed to start";
        return false;
    }

    const size_t loaded = load_enabled_plugins();
    LOG_INFO("[Runtime] " << loaded << " plugins loaded");
    return true;
}

size_t Runtime::load_enabled_plugins() {
    std::vector<std::string> pending;
    for (const auto &record : registry_->list()) {
        if (record.enabled && !supervisor_->is_loaded(record.id)) {
            pending.push_back(record.id);
        }
    }

    // Repeated passes until no plugin makes progress: dependencies load first
    size_t loaded = 0;
    bool progress = true;
    while (progress && !pending.empty()) {
        progress = false;
        std::vector<std::string> retry;
        for (const auto &id : pending) {
            Status status = supervisor_->load(id);
            if (status.ok()) {
                loaded++;
                progress = true;
            } else if (status.code() == ErrorCode::FAILED_PRECONDITION) {
                retry.push_back(id);
            } else {
                LOG_WARN("[Runtime] Plugin '" << id << "' not loaded: " << status.to_string());
            }
        }
        pending.swap(retry);
    }
    for (const auto &id : pending) {
        LOG_WARN("[Runtime] Plugin '" << id << "' not loaded: unmet dependencies");
    }
    return loaded;
}

void Runtime::on_registry_change(registry::RegistryChange change, const plugin::PluginRecord &record) {
    switch (change) {
        case registry::RegistryChange::ENABLED: {
            Status status = record.enabled ? supervisor_->load(record.id) : supervisor_->unload(record.id);
            if (!status.ok()) {
                LOG_WARN("[Runtime] Plugin '" << record.id << "' " << (record.enabled ? "load" : "unload")
                                              << " after enable change failed: " << status.to_string());
            }
            break;
        }
        case registry::RegistryChange::CONFIG: {
            Status status = supervisor_->notify_config_changed(record.id);
            if (!status.ok()) {
                LOG_WARN("[Runtime] Config change of '" << record.id << "' not applied: " << status.to_string());
            }
            break;
        }
        default:
            break;
    }
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    auto last_save = std::chrono::steady_clock::now();
    const auto autosave = std::chrono::milliseconds(config_.state.autosave_interval_ms);

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            const int signal = SignalHandler::last_signal();
            if (signal != 0) {
                LOG_INFO("[Runtime] Signal " << signal << " received, stopping...");
            } else {
                LOG_INFO("[Runtime] Shutdown requested, stopping...");
            }
            running_ = false;
            break;
        }

        if (autosave.count() > 0 && std::chrono::steady_clock::now() - last_save >= autosave) {
            std::string error;
            if (!save_state(error)) {
                LOG_ERROR("[Runtime] Autosave failed: " << error);
            }
            last_save = std::chrono::steady_clock::now();
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

state::PersistedState Runtime::snapshot_state() const {
    state::PersistedState state;
    if (registry_) {
        state.plugins = registry_->list();
    }
    if (pipeline_) {
        state.jobs = pipeline_->list_jobs();
    }
    if (devices_) {
        state.devices = devices_->list();
    }
    if (bindings_) {
        state.bindings = bindings_->list();
    }
    if (graph_) {
        state.links = graph_->links();
    }
    return state;
}

bool Runtime::save_state(std::string &error) {
    if (!state_store_) {
        error = "State store not initialized";
        return false;
    }
    return state_store_->save(snapshot_state(), error);
}

void Runtime::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    // Stop intake first so no job commits during the final save
    if (pipeline_) {
        LOG_INFO("[Runtime] Stopping install pipeline");
        pipeline_->stop();
    }

    if (state_store_) {
        std::string error;
        if (!save_state(error)) {
            LOG_ERROR("[Runtime] Saving state failed: " << error);
        }
    }

    if (supervisor_) {
        LOG_INFO("[Runtime] Unloading plugins");
        supervisor_->stop();
    }

    if (bus_) {
        LOG_INFO("[Runtime] Stopping event bus");
        bus_->stop();
    }

    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace hearth

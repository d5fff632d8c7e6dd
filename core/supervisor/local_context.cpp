#include "local_context.hpp"

#include "devices/binding_table.hpp"
#include "events/event_bus.hpp"
#include "graph/device_link_graph.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

LocalPluginContext::LocalPluginContext(const std::string &plugin_id, const nlohmann::json &config,
                                       const PluginServices &services)
    : plugin_id_(plugin_id), services_(services), config_(config) {}

LocalPluginContext::~LocalPluginContext() { revoke(); }

Status LocalPluginContext::unavailable() const {
    return Status::error(ErrorCode::UNAVAILABLE, "Context of plugin '" + plugin_id_ + "' has been revoked");
}

Status LocalPluginContext::subscribe_event(const std::string &pattern, events::EventHandler handler,
                                           events::SubscriptionId &id) {
    // Held across the bus call so revoke() cannot miss a subscription in flight
    std::lock_guard<std::mutex> lock(mutex_);
    if (revoked_) {
        return unavailable();
    }
    if (!services_.bus) {
        return Status::error(ErrorCode::UNAVAILABLE, "No event bus");
    }

    Status status = services_.bus->subscribe(pattern, std::move(handler), id, plugin_id_);
    if (status.ok()) {
        subscriptions_.insert(id);
    }
    return status;
}

Status LocalPluginContext::unsubscribe_event(events::SubscriptionId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revoked_) {
            return unavailable();
        }
        if (subscriptions_.erase(id) == 0) {
            return Status::error(ErrorCode::NOT_FOUND, "Unknown subscription " + std::to_string(id));
        }
    }
    services_.bus->unsubscribe(id);
    return Status::success();
}

Status LocalPluginContext::emit_event(const std::string &topic, const nlohmann::json &payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revoked_) {
            return unavailable();
        }
    }
    if (!services_.bus) {
        return Status::error(ErrorCode::UNAVAILABLE, "No event bus");
    }
    return services_.bus->emit(topic, payload, plugin_id_);
}

Status LocalPluginContext::bind_devices(const std::string &selector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (revoked_) {
        return unavailable();
    }
    if (!services_.bindings) {
        return Status::error(ErrorCode::UNAVAILABLE, "No binding table");
    }

    uint64_t binding_id = 0;
    Status status = services_.bindings->add(plugin_id_, selector, binding_id);
    if (status.ok()) {
        bindings_.insert(binding_id);
    }
    return status;
}

Status LocalPluginContext::unbind_devices(const std::string &selector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (revoked_) {
        return unavailable();
    }
    if (!services_.bindings) {
        return Status::error(ErrorCode::UNAVAILABLE, "No binding table");
    }

    for (const auto &binding : services_.bindings->for_plugin(plugin_id_)) {
        if (binding.selector == selector) {
            bindings_.erase(binding.binding_id);
        }
    }
    if (services_.bindings->remove_selector(plugin_id_, selector) == 0) {
        return Status::error(ErrorCode::NOT_FOUND, "No binding for selector '" + selector + "'");
    }
    return Status::success();
}

std::vector<graph::RelatedDevice> LocalPluginContext::related_devices(const std::string &device_id) const {
    if (revoked() || !services_.graph) {
        return {};
    }
    return services_.graph->related_devices(device_id);
}

nlohmann::json LocalPluginContext::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void LocalPluginContext::set_config(const nlohmann::json &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

external::ITokenService *LocalPluginContext::tokens() { return revoked() ? nullptr : services_.tokens; }

external::IKeyValueCache *LocalPluginContext::cache() { return revoked() ? nullptr : services_.cache; }

void LocalPluginContext::revoke() {
    std::set<events::SubscriptionId> subscriptions;
    size_t binding_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revoked_) {
            return;
        }
        revoked_ = true;
        subscriptions.swap(subscriptions_);
        binding_count = bindings_.size();
        bindings_.clear();
    }

    for (auto id : subscriptions) {
        services_.bus->unsubscribe(id);
    }
    if (services_.bindings) {
        services_.bindings->release_plugin(plugin_id_);
    }

    LOG_DEBUG("[" << plugin_id_ << "] Context revoked (" << subscriptions.size() << " subscriptions, " << binding_count
                  << " bindings released)");
}

bool LocalPluginContext::revoked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revoked_;
}

size_t LocalPluginContext::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

size_t LocalPluginContext::binding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

}  // namespace supervisor
}  // namespace hearth

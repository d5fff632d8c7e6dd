#pragma once

#include <mutex>
#include <set>
#include <string>

#include "plugin/plugin.hpp"
#include "plugin_handle.hpp"

namespace hearth {
namespace supervisor {

/**
 * @brief Context for plugins running inside the orchestrator process
 *
 * Tracks everything the plugin registers so revoke() can release it in
 * one step. After revoke() every call returns UNAVAILABLE without touching
 * orchestrator state, which keeps a plugin thread that outlived its load
 * deadline harmless.
 */
class LocalPluginContext : public plugin::PluginContext {
public:
    LocalPluginContext(const std::string &plugin_id, const nlohmann::json &config, const PluginServices &services);
    ~LocalPluginContext() override;

    const std::string &plugin_id() const override { return plugin_id_; }

    Status subscribe_event(const std::string &pattern, events::EventHandler handler,
                           events::SubscriptionId &id) override;
    Status unsubscribe_event(events::SubscriptionId id) override;
    Status emit_event(const std::string &topic, const nlohmann::json &payload) override;

    Status bind_devices(const std::string &selector) override;
    Status unbind_devices(const std::string &selector) override;

    std::vector<graph::RelatedDevice> related_devices(const std::string &device_id) const override;

    nlohmann::json config() const override;
    void set_config(const nlohmann::json &config);

    external::ITokenService *tokens() override;
    external::IKeyValueCache *cache() override;

    // Release subscriptions and bindings and reject further calls
    void revoke();
    bool revoked() const;

    size_t subscription_count() const;
    size_t binding_count() const;

private:
    Status unavailable() const;

    const std::string plugin_id_;
    const PluginServices services_;

    mutable std::mutex mutex_;
    nlohmann::json config_;
    std::set<events::SubscriptionId> subscriptions_;
    std::set<uint64_t> bindings_;
    bool revoked_ = false;
};

}  // namespace supervisor
}  // namespace hearth

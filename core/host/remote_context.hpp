#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "plugin/plugin.hpp"
#include "transport/protocol_codec.hpp"

namespace hearth {
namespace host {

/**
 * @brief Plugin context inside hearth-plugin-host
 *
 * Calls are validated locally and recorded as effects. The host returns the
 * recorded effects with the response to the request that caused them, and
 * the orchestrator applies them to its bus and binding table.
 *
 * related_devices() answers from the last link set the orchestrator sent.
 */
class RemotePluginContext : public plugin::PluginContext {
public:
    RemotePluginContext(const std::string &plugin_id, const nlohmann::json &config);

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

    // Not reachable from another process
    external::ITokenService *tokens() override { return nullptr; }
    external::IKeyValueCache *cache() override { return nullptr; }

    // Replace the local link graph with the orchestrator's snapshot
    void apply_links(const transport::v1::LinkSet &links);

    /**
     * @brief Run the handler of one subscription over a batch
     * @return Number of events whose handler threw
     */
    int dispatch(events::SubscriptionId id, const std::vector<events::Event> &batch);

    // Move the recorded effects into out and start a new record
    void take_effects(transport::v1::Effects *out);

    // Forget everything recorded since the last take_effects()
    void discard_effects();

    // Record unsubscribe/unbind effects for everything still registered
    void release_all();

    size_t subscription_count() const;

private:
    const std::string plugin_id_;

    mutable std::mutex mutex_;
    nlohmann::json config_;
    std::map<events::SubscriptionId, events::EventHandler> handlers_;
    std::set<std::string> selectors_;
    events::SubscriptionId next_subscription_id_ = 1;
    std::unique_ptr<graph::DeviceLinkGraph> graph_;
    transport::v1::Effects pending_;
};

}  // namespace host
}  // namespace hearth

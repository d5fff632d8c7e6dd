#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "local_context.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {
namespace supervisor {

/**
 * @brief Embedded-mode context: a LocalPluginContext behind a SandboxPolicy
 *
 * - Subscription and binding counts are capped
 * - Topics may only be emitted under the allowed prefixes
 *   (default "<plugin_id>.") and at most max_emits_per_second
 * - No access to the token service or the cache
 *
 * Violations fail with FAILED_PRECONDITION and are logged.
 */
class SandboxedContext : public plugin::PluginContext {
public:
    SandboxedContext(std::shared_ptr<LocalPluginContext> inner, const plugin::SandboxPolicy &policy);

    const std::string &plugin_id() const override { return inner_->plugin_id(); }

    Status subscribe_event(const std::string &pattern, events::EventHandler handler,
                           events::SubscriptionId &id) override;
    Status unsubscribe_event(events::SubscriptionId id) override { return inner_->unsubscribe_event(id); }
    Status emit_event(const std::string &topic, const nlohmann::json &payload) override;

    Status bind_devices(const std::string &selector) override;
    Status unbind_devices(const std::string &selector) override { return inner_->unbind_devices(selector); }

    std::vector<graph::RelatedDevice> related_devices(const std::string &device_id) const override {
        return inner_->related_devices(device_id);
    }

    nlohmann::json config() const override { return inner_->config(); }

    external::ITokenService *tokens() override { return nullptr; }
    external::IKeyValueCache *cache() override { return nullptr; }

private:
    bool emit_allowed(const std::string &topic) const;
    Status violation(const std::string &what) const;

    std::shared_ptr<LocalPluginContext> inner_;
    plugin::SandboxPolicy policy_;

    std::mutex rate_mutex_;
    std::deque<std::chrono::steady_clock::time_point> recent_emits_;
};

/**
 * @brief Context of the in-process half of a hybrid plugin
 *
 * Subscriptions whose pattern is one of local_topics are served here.
 * Every other subscription, and all bindings, belong to the microservice
 * half; the shim accepts those calls without registering anything.
 */
class HybridShimContext : public plugin::PluginContext {
public:
    HybridShimContext(std::shared_ptr<LocalPluginContext> inner, const std::vector<std::string> &local_topics);

    const std::string &plugin_id() const override { return inner_->plugin_id(); }

    Status subscribe_event(const std::string &pattern, events::EventHandler handler,
                           events::SubscriptionId &id) override;
    Status unsubscribe_event(events::SubscriptionId id) override;
    Status emit_event(const std::string &topic, const nlohmann::json &payload) override {
        return inner_->emit_event(topic, payload);
    }

    Status bind_devices(const std::string &selector) override;
    Status unbind_devices(const std::string &selector) override;

    std::vector<graph::RelatedDevice> related_devices(const std::string &device_id) const override {
        return inner_->related_devices(device_id);
    }

    nlohmann::json config() const override { return inner_->config(); }

    external::ITokenService *tokens() override { return inner_->tokens(); }
    external::IKeyValueCache *cache() override { return inner_->cache(); }

    bool is_local(const std::string &pattern) const;

private:
    std::shared_ptr<LocalPluginContext> inner_;
    std::vector<std::string> local_topics_;
};

}  // namespace supervisor
}  // namespace hearth

#include "scoped_contexts.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

SandboxedContext::SandboxedContext(std::shared_ptr<LocalPluginContext> inner, const plugin::SandboxPolicy &policy)
    : inner_(std::move(inner)), policy_(policy) {
    if (policy_.allowed_emit_prefixes.empty()) {
        policy_.allowed_emit_prefixes.push_back(inner_->plugin_id() + ".");
    }
}

Status SandboxedContext::violation(const std::string &what) const {
    LOG_WARN("[Sandbox] Plugin '" << inner_->plugin_id() << "': " << what);
    return Status::error(ErrorCode::FAILED_PRECONDITION, "Sandbox: " + what);
}

Status SandboxedContext::subscribe_event(const std::string &pattern, events::EventHandler handler,
                                         events::SubscriptionId &id) {
    if (inner_->subscription_count() >= policy_.max_subscriptions) {
        return violation("subscription limit " + std::to_string(policy_.max_subscriptions) + " reached");
    }
    return inner_->subscribe_event(pattern, std::move(handler), id);
}

Status SandboxedContext::bind_devices(const std::string &selector) {
    if (inner_->binding_count() >= policy_.max_bindings) {
        return violation("binding limit " + std::to_string(policy_.max_bindings) + " reached");
    }
    return inner_->bind_devices(selector);
}

bool SandboxedContext::emit_allowed(const std::string &topic) const {
    return std::any_of(policy_.allowed_emit_prefixes.begin(), policy_.allowed_emit_prefixes.end(),
                       [&topic](const std::string &prefix) { return topic.compare(0, prefix.size(), prefix) == 0; });
}

Status SandboxedContext::emit_event(const std::string &topic, const nlohmann::json &payload) {
    if (!emit_allowed(topic)) {
        return violation("emit to '" + topic + "' outside allowed prefixes");
    }

    if (policy_.max_emits_per_second > 0) {
        std::lock_guard<std::mutex> lock(rate_mutex_);
        const auto now = std::chrono::steady_clock::now();
        while (!recent_emits_.empty() && now - recent_emits_.front() >= std::chrono::seconds(1)) {
            recent_emits_.pop_front();
        }
        if (recent_emits_.size() >= static_cast<size_t>(policy_.max_emits_per_second)) {
            return violation("emit rate above " + std::to_string(policy_.max_emits_per_second) + "/s");
        }
        recent_emits_.push_back(now);
    }

    return inner_->emit_event(topic, payload);
}

HybridShimContext::HybridShimContext(std::shared_ptr<LocalPluginContext> inner,
                                     const std::vector<std::string> &local_topics)
    : inner_(std::move(inner)), local_topics_(local_topics) {}

bool HybridShimContext::is_local(const std::string &pattern) const {
    return std::find(local_topics_.begin(), local_topics_.end(), pattern) != local_topics_.end();
}

Status HybridShimContext::subscribe_event(const std::string &pattern, events::EventHandler handler,
                                          events::SubscriptionId &id) {
    if (!is_local(pattern)) {
        // Served by the microservice half
        LOG_DEBUG("[" << inner_->plugin_id() << "] Shim leaves '" << pattern << "' to the microservice");
        id = 0;
        return Status::success();
    }
    return inner_->subscribe_event(pattern, std::move(handler), id);
}

Status HybridShimContext::unsubscribe_event(events::SubscriptionId id) {
    if (id == 0) {
        return Status::success();
    }
    return inner_->unsubscribe_event(id);
}

Status HybridShimContext::bind_devices(const std::string &selector) {
    static_cast<void>(selector);
    return Status::success();
}

Status HybridShimContext::unbind_devices(const std::string &selector) {
    static_cast<void>(selector);
    return Status::success();
}

}  // namespace supervisor
}  // namespace hearth

#include "remote_context.hpp"

#include "devices/selector.hpp"
#include "events/topic_matcher.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace host {

RemotePluginContext::RemotePluginContext(const std::string &plugin_id, const nlohmann::json &config)
    : plugin_id_(plugin_id), config_(config), graph_(std::make_unique<graph::DeviceLinkGraph>()) {}

Status RemotePluginContext::subscribe_event(const std::string &pattern, events::EventHandler handler,
                                            events::SubscriptionId &id) {
    if (!events::is_valid_pattern(pattern)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid topic pattern '" + pattern + "'");
    }
    if (!handler) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Handler must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    id = next_subscription_id_++;
    handlers_[id] = std::move(handler);

    auto *subscription = pending_.add_subscribe();
    subscription->set_subscription_id(id);
    subscription->set_pattern(pattern);
    return Status::success();
}

Status RemotePluginContext::unsubscribe_event(events::SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.erase(id) == 0) {
        return Status::error(ErrorCode::NOT_FOUND, "Unknown subscription " + std::to_string(id));
    }
    pending_.add_unsubscribe(id);
    return Status::success();
}

Status RemotePluginContext::emit_event(const std::string &topic, const nlohmann::json &payload) {
    if (!events::is_valid_topic(topic) || topic.find('*') != std::string::npos) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid topic '" + topic + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto *emitted = pending_.add_emit();
    emitted->set_topic(topic);
    emitted->set_payload_json(payload.dump());
    return Status::success();
}

Status RemotePluginContext::bind_devices(const std::string &selector) {
    devices::Selector parsed;
    std::string error;
    if (!devices::Selector::parse(selector, parsed, error)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    selectors_.insert(selector);
    pending_.add_bind(selector);
    return Status::success();
}

Status RemotePluginContext::unbind_devices(const std::string &selector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (selectors_.erase(selector) == 0) {
        return Status::error(ErrorCode::NOT_FOUND, "No binding for '" + selector + "'");
    }
    pending_.add_unbind(selector);
    return Status::success();
}

std::vector<graph::RelatedDevice> RemotePluginContext::related_devices(const std::string &device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_->related_devices(device_id);
}

nlohmann::json RemotePluginContext::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void RemotePluginContext::set_config(const nlohmann::json &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void RemotePluginContext::apply_links(const transport::v1::LinkSet &links) {
    auto rebuilt = std::make_unique<graph::DeviceLinkGraph>();
    for (const auto &link : links.links()) {
        Status status = rebuilt->add_link(link.from(), link.to(), link.link_type(), link.direction());
        if (!status.ok()) {
            LOG_WARN("[PluginHost] Skipping link " << link.from() << " -> " << link.to() << ": "
                                                   << status.to_string());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    graph_ = std::move(rebuilt);
    LOG_DEBUG("[PluginHost] Link set revision " << links.revision() << " (" << links.links_size() << " links)");
}

int RemotePluginContext::dispatch(events::SubscriptionId id, const std::vector<events::Event> &batch) {
    int failures = 0;
    for (const auto &event : batch) {
        // Looked up per event: a handler may unsubscribe itself mid-batch
        events::EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(id);
            if (it == handlers_.end()) {
                break;
            }
            handler = it->second;
        }
        try {
            handler(event);
        } catch (const std::exception &e) {
            failures++;
            LOG_ERROR("[PluginHost] Handler for '" << event.topic << "' threw: " << e.what());
        } catch (...) {
            failures++;
            LOG_ERROR("[PluginHost] Handler for '" << event.topic << "' threw an unknown exception");
        }
    }
    return failures;
}

void RemotePluginContext::take_effects(transport::v1::Effects *out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out->Swap(&pending_);
    pending_.Clear();
}

void RemotePluginContext::discard_effects() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.Clear();
    handlers_.clear();
    selectors_.clear();
}

void RemotePluginContext::release_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, handler] : handlers_) {
        static_cast<void>(handler);
        pending_.add_unsubscribe(id);
    }
    for (const auto &selector : selectors_) {
        pending_.add_unbind(selector);
    }
    handlers_.clear();
    selectors_.clear();
}

size_t RemotePluginContext::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

}  // namespace host
}  // namespace hearth

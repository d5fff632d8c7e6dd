#include "link_mirror.hpp"

#include "logging/logger.hpp"

namespace hearth {
namespace plugins {

bool LinkMirrorPlugin::on_load(plugin::PluginContext &context, std::string &error) {
    const nlohmann::json config = context.config();
    const std::string topic = config.value("topic", std::string("*.device.state"));

    events::SubscriptionId id = 0;
    Status status = context.subscribe_event(topic, [this](const events::Event &event) { on_state(event); }, id);
    if (!status.ok()) {
        error = "subscribe '" + topic + "': " + status.message();
        return false;
    }

    const std::string selector = config.value("selector", std::string());
    if (!selector.empty()) {
        status = context.bind_devices(selector);
        if (!status.ok()) {
            error = "bind '" + selector + "': " + status.message();
            return false;
        }
    }

    context_.store(&context);
    LOG_INFO("[" << context.plugin_id() << "] Mirroring '" << topic << "'");
    return true;
}

void LinkMirrorPlugin::on_unload() { context_.store(nullptr); }

void LinkMirrorPlugin::on_state(const events::Event &event) {
    plugin::PluginContext *context = context_.load();
    if (!context || !event.payload.is_object()) {
        return;
    }
    const std::string device_id = event.payload.value("device_id", std::string());
    if (device_id.empty()) {
        return;
    }

    for (const auto &related : context->related_devices(device_id)) {
        if (related.link_type != graph::LinkType::MIRROR && related.link_type != graph::LinkType::SYNC) {
            continue;
        }

        nlohmann::json payload = event.payload;
        payload["device_id"] = related.device_id;
        payload["origin"] = device_id;
        payload["path"] = related.path;

        Status status = context->emit_event(context->plugin_id() + ".apply." + related.device_id, payload);
        if (!status.ok()) {
            LOG_WARN("[" << context->plugin_id() << "] Mirror to " << related.device_id
                         << " failed: " << status.to_string());
            continue;
        }
        mirrored_++;
    }
}

}  // namespace plugins
}  // namespace hearth

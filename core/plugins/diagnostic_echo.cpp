#include "diagnostic_echo.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "logging/logger.hpp"

namespace hearth {
namespace plugins {

bool DiagnosticEchoPlugin::on_load(plugin::PluginContext &context, std::string &error) {
    const nlohmann::json config = context.config();

    const int64_t delay_ms = config.value("load_delay_ms", int64_t{0});
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    if (config.value("fail_load", false)) {
        error = "fail_load is set";
        return false;
    }

    healthy_ = config.value("healthy", true);
    throw_on_ = config.value("throw_on", std::string());

    const std::string topic = config.value("topic", std::string("*.echo.request"));
    events::SubscriptionId id = 0;
    Status status = context.subscribe_event(topic, [this](const events::Event &event) { on_request(event); }, id);
    if (!status.ok()) {
        error = status.message();
        return false;
    }

    const std::string selector = config.value("bind", std::string());
    if (!selector.empty()) {
        status = context.bind_devices(selector);
        if (!status.ok()) {
            error = status.message();
            return false;
        }
    }

    context_.store(&context);
    return true;
}

void DiagnosticEchoPlugin::on_unload() { context_.store(nullptr); }

void DiagnosticEchoPlugin::on_config_changed(const nlohmann::json &config) {
    healthy_ = config.value("healthy", true);
    plugin::PluginContext *context = context_.load();
    if (context) {
        Status status = context->emit_event(context->plugin_id() + ".echo.config", config);
        if (!status.ok()) {
            LOG_WARN("[" << context->plugin_id() << "] " << status.to_string());
        }
    }
}

void DiagnosticEchoPlugin::on_request(const events::Event &event) {
    if (!throw_on_.empty() && event.topic == throw_on_) {
        throw std::runtime_error("requested failure on " + event.topic);
    }
    plugin::PluginContext *context = context_.load();
    if (!context) {
        return;
    }
    Status status = context->emit_event(context->plugin_id() + ".echo.reply",
                                        {{"topic", event.topic}, {"payload", event.payload}, {"source", event.source}});
    if (!status.ok()) {
        LOG_WARN("[" << context->plugin_id() << "] Reply failed: " << status.to_string());
    }
}

}  // namespace plugins
}  // namespace hearth

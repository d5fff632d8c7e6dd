#pragma once

#include <atomic>
#include <string>

#include "plugin/plugin.hpp"

namespace hearth {
namespace plugins {

// Test and diagnostics plugin. Replies to every event on its topic with
// "<plugin_id>.echo.reply" carrying the original topic and payload.
//
// Config: "topic" (default "*.echo.request"), "fail_load", "load_delay_ms",
// "healthy", "bind" (selector to claim), "throw_on" (topic whose handler throws).
class DiagnosticEchoPlugin : public plugin::IPlugin {
public:
    static constexpr const char *kImplementationId = "diagnostic_echo";

    bool on_load(plugin::PluginContext &context, std::string &error) override;
    void on_unload() override;
    bool health_check() override { return healthy_.load(); }
    void on_config_changed(const nlohmann::json &config) override;

private:
    void on_request(const events::Event &event);

    std::atomic<plugin::PluginContext *> context_{nullptr};
    std::string throw_on_;
    std::atomic<bool> healthy_{true};
};

}  // namespace plugins
}  // namespace hearth

#pragma once

#include <atomic>
#include <string>

#include "plugin/plugin.hpp"

namespace hearth {
namespace plugins {

/**
 * @brief Propagates device state along mirror and sync links
 *
 * Subscribes to "*.device.state". For every state event whose payload names
 * a device ("device_id"), each device related to it over a mirror or sync
 * link receives the state as "<plugin_id>.apply.<target_device>".
 *
 * Config:
 * - "selector" (string, optional): devices to claim while loaded
 * - "topic" (string, default "*.device.state"): pattern to follow
 */
class LinkMirrorPlugin : public plugin::IPlugin {
public:
    static constexpr const char *kImplementationId = "link_mirror";

    bool on_load(plugin::PluginContext &context, std::string &error) override;
    void on_unload() override;
    bool health_check() override { return context_.load() != nullptr; }

    uint64_t mirrored_count() const { return mirrored_.load(); }

private:
    void on_state(const events::Event &event);

    std::atomic<plugin::PluginContext *> context_{nullptr};
    std::atomic<uint64_t> mirrored_{0};
};

}  // namespace plugins
}  // namespace hearth

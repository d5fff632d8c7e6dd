#pragma once

#include <memory>

#include "in_process_handle.hpp"
#include "microservice_handle.hpp"

namespace hearth {
namespace supervisor {

// HybridHandle runs one plugin twice: a microservice for the bulk of its
// work and an in-process shim that serves the record's local_topics with
// low latency. Subscriptions to local_topics are never forwarded to the
// microservice half.
class HybridHandle : public IPluginHandle {
public:
    HybridHandle(const plugin::PluginRecord &record, const PluginServices &services,
                 const plugin::PluginFactoryTable &factories, const MicroserviceOptions &options);
    ~HybridHandle() override;

    const std::string &plugin_id() const override { return remote_.plugin_id(); }
    plugin::RuntimeMode mode() const override { return plugin::RuntimeMode::HYBRID; }

    // Remote half first; the shim gets what is left of the deadline
    Status load(int timeout_ms) override;
    void cancel() override;
    void unload() override;
    bool health_check(std::string &error) override;
    Status notify_config_changed(const nlohmann::json &config) override;
    bool is_available() const override { return remote_.is_available() && shim_.is_available(); }

    const MicroserviceHandle &remote() const { return remote_; }
    const InProcessHandle &shim() const { return shim_; }

private:
    MicroserviceHandle remote_;
    InProcessHandle shim_;
};

}  // namespace supervisor
}  // namespace hearth

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "local_context.hpp"
#include "plugin/plugin.hpp"
#include "plugin/plugin_factory.hpp"
#include "plugin_handle.hpp"

namespace hearth {
namespace supervisor {

/**
 * @brief Plugin object living in the orchestrator process
 *
 * Serves IN_PROCESS (direct context), EMBEDDED (sandboxed context) and the
 * local half of HYBRID (shim context).
 *
 * on_load runs on its own thread so the deadline can be enforced. When the
 * deadline passes, the context is revoked at once, which releases
 * everything registered so far and rejects late registrations. The thread
 * itself cannot be interrupted: it is detached and keeps the plugin object
 * alive until on_load returns, then calls on_unload if the load had
 * succeeded.
 */
class InProcessHandle : public IPluginHandle {
public:
    enum class Scope { DIRECT, SANDBOXED, HYBRID_SHIM };

    InProcessHandle(const plugin::PluginRecord &record, const PluginServices &services,
                    const plugin::PluginFactoryTable &factories, Scope scope = Scope::DIRECT);
    ~InProcessHandle() override;

    InProcessHandle(const InProcessHandle &) = delete;
    InProcessHandle &operator=(const InProcessHandle &) = delete;

    const std::string &plugin_id() const override { return record_.id; }
    plugin::RuntimeMode mode() const override;

    Status load(int timeout_ms) override;
    void cancel() override { cancelled_.store(true); }
    void unload() override;
    bool health_check(std::string &error) override;
    Status notify_config_changed(const nlohmann::json &config) override;
    bool is_available() const override { return loaded_.load(); }

    // nullptr unless loaded
    std::shared_ptr<LocalPluginContext> context() const { return context_; }

private:
    void teardown();

    const plugin::PluginRecord record_;
    const PluginServices services_;
    const plugin::PluginFactoryTable &factories_;
    const Scope scope_;

    std::shared_ptr<plugin::IPlugin> plugin_;
    std::shared_ptr<LocalPluginContext> context_;
    std::shared_ptr<plugin::PluginContext> scoped_context_;  // what the plugin sees

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> loaded_{false};
};

}  // namespace supervisor
}  // namespace hearth

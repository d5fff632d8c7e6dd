#pragma once

#include "microservice_handle.hpp"
#include "plugin/plugin_factory.hpp"
#include "plugin_handle.hpp"

namespace hearth {
namespace supervisor {

/**
 * @brief Maps a runtime mode to the handle that implements it
 *
 * - IN_PROCESS   -> InProcessHandle (direct context)
 * - EMBEDDED     -> InProcessHandle (sandboxed context)
 * - MICROSERVICE -> MicroserviceHandle
 * - HYBRID       -> HybridHandle
 *
 * Modes that run plugin code in the orchestrator need the implementation in
 * the factory table; asking for one that is missing fails here rather than
 * at load time.
 */
class DefaultHandleFactory : public IPluginHandleFactory {
public:
    DefaultHandleFactory(const PluginServices &services, const plugin::PluginFactoryTable &factories,
                         const MicroserviceOptions &options);

    std::unique_ptr<IPluginHandle> create(const plugin::PluginRecord &record, plugin::RuntimeMode mode,
                                          std::string &error) override;

private:
    const PluginServices services_;
    const plugin::PluginFactoryTable &factories_;
    const MicroserviceOptions options_;
};

}  // namespace supervisor
}  // namespace hearth

#include "handle_factory.hpp"

#include "hybrid_handle.hpp"
#include "in_process_handle.hpp"

namespace hearth {
namespace supervisor {

DefaultHandleFactory::DefaultHandleFactory(const PluginServices &services, const plugin::PluginFactoryTable &factories,
                                           const MicroserviceOptions &options)
    : services_(services), factories_(factories), options_(options) {}

std::unique_ptr<IPluginHandle> DefaultHandleFactory::create(const plugin::PluginRecord &record,
                                                            plugin::RuntimeMode mode, std::string &error) {
    if (mode != plugin::RuntimeMode::MICROSERVICE && !factories_.has(record.implementation_id())) {
        error = "No in-process implementation '" + record.implementation_id() + "' for mode " +
                plugin::runtime_mode_to_string(mode);
        return nullptr;
    }

    switch (mode) {
        case plugin::RuntimeMode::IN_PROCESS:
            return std::make_unique<InProcessHandle>(record, services_, factories_, InProcessHandle::Scope::DIRECT);
        case plugin::RuntimeMode::EMBEDDED:
            return std::make_unique<InProcessHandle>(record, services_, factories_,
                                                     InProcessHandle::Scope::SANDBOXED);
        case plugin::RuntimeMode::MICROSERVICE:
            return std::make_unique<MicroserviceHandle>(record, services_, options_);
        case plugin::RuntimeMode::HYBRID:
            return std::make_unique<HybridHandle>(record, services_, factories_, options_);
        default:
            error = "Unknown runtime mode";
            return nullptr;
    }
}

}  // namespace supervisor
}  // namespace hearth

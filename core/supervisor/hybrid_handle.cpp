#include "hybrid_handle.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

HybridHandle::HybridHandle(const plugin::PluginRecord &record, const PluginServices &services,
                           const plugin::PluginFactoryTable &factories, const MicroserviceOptions &options)
    : remote_(record, services, options, record.local_topics),
      shim_(record, services, factories, InProcessHandle::Scope::HYBRID_SHIM) {}

HybridHandle::~HybridHandle() { unload(); }

Status HybridHandle::load(int timeout_ms) {
    const auto start = std::chrono::steady_clock::now();

    Status status = remote_.load(timeout_ms);
    if (!status.ok()) {
        return status;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    const int remaining = timeout_ms > elapsed ? static_cast<int>(timeout_ms - elapsed) : 0;

    status = shim_.load(remaining);
    if (!status.ok()) {
        LOG_WARN("[" << plugin_id() << "] Hybrid shim failed to load, stopping microservice: " << status.to_string());
        remote_.unload();
        return status;
    }

    LOG_INFO("[" << plugin_id() << "] Hybrid instance up (" << shim_.context()->subscription_count()
                 << " local subscriptions, " << remote_.forwarded_subscription_count() << " forwarded)");
    return Status::success();
}

void HybridHandle::cancel() {
    remote_.cancel();
    shim_.cancel();
}

void HybridHandle::unload() {
    shim_.unload();
    remote_.unload();
}

bool HybridHandle::health_check(std::string &error) {
    if (!remote_.health_check(error)) {
        error = "microservice: " + error;
        return false;
    }
    if (!shim_.health_check(error)) {
        error = "shim: " + error;
        return false;
    }
    return true;
}

Status HybridHandle::notify_config_changed(const nlohmann::json &config) {
    Status status = remote_.notify_config_changed(config);
    if (!status.ok()) {
        return status;
    }
    return shim_.notify_config_changed(config);
}

}  // namespace supervisor
}  // namespace hearth

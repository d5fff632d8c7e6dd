#pragma once

#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <string>

#include "common/status.hpp"
#include "install_job.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {
namespace jobs {

// Deadline and cancellation visible to a running backend call
struct InstallControl {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    bool should_abort() const { return cancelled->load() || std::chrono::steady_clock::now() >= deadline; }

    // Milliseconds until the deadline, clamped to [0, INT_MAX]
    int remaining_ms() const {
        if (deadline == std::chrono::steady_clock::time_point::max()) {
            return std::numeric_limits<int>::max();
        }
        const auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (ms <= 0) {
            return 0;
        }
        return ms > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(ms);
    }
};

/**
 * @brief One way of obtaining a plugin (local directory, URL, source control)
 *
 * The pipeline calls dispatch() when a job is handed over (job becomes
 * SENT); an OK return is the backend's acknowledgment (job becomes RUNNING).
 * fetch_manifest() then does the actual work. Implementations must give up
 * once control.should_abort() is true.
 */
class IInstallerBackend {
public:
    virtual ~IInstallerBackend() = default;

    virtual InstallType type() const = 0;

    // Validate the payload and accept the job
    virtual Status dispatch(const InstallJob &job) = 0;

    // Install/upgrade: obtain and parse the plugin manifest
    virtual Status fetch_manifest(const InstallJob &job, const InstallControl &control,
                                  plugin::PluginRecord &manifest) = 0;

    // Uninstall: drop whatever the backend staged for this plugin
    virtual Status remove_artifacts(const InstallJob &job, const InstallControl &control) {
        static_cast<void>(job);
        static_cast<void>(control);
        return Status::success();
    }
};

}  // namespace jobs
}  // namespace hearth

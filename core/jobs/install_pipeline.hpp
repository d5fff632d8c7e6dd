#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/bounded_queue.hpp"
#include "common/keyed_mutex.hpp"
#include "common/status.hpp"
#include "install_job.hpp"
#include "installer_backend.hpp"

namespace hearth {

namespace registry {
class PluginRegistry;
}

namespace jobs {

struct InstallPipelineConfig {
    int workers = 2;
    size_t queue_size = 64;
    int install_timeout_ms = 300000;  // measured from enqueue
    int watchdog_interval_ms = 1000;
};

/**
 * @brief Asynchronous install/upgrade/uninstall of plugins
 *
 * A fixed pool of worker threads drains a bounded queue of job ids.
 * Each job moves PENDING -> SENT (handed to its backend) -> RUNNING
 * (backend acknowledged) -> SUCCESS | FAILED and never goes back.
 *
 * Concurrency:
 * - At most one non-terminal job per plugin id (CONFLICTING_JOB otherwise)
 * - Registry commits run inside the per-plugin KeyedMutex shared with the
 *   supervisor, so an install completing never interleaves with a mode
 *   switch or load of the same plugin
 * - A watchdog thread fails jobs whose deadline passed (TIMEOUT) and
 *   cancels their backend call; a backend result arriving afterwards is
 *   discarded. Uninstalls commit before unloading the plugin, so the
 *   watchdog never interrupts one halfway
 *
 * Failed jobs are never retried. Reload/unload of the affected plugin is
 * delegated to hooks installed by the runtime, keeping the pipeline free of
 * any dependency on the supervisor.
 */
class InstallPipeline {
public:
    using JobListener = std::function<void(const InstallJob &job)>;
    using PluginHook = std::function<Status(const std::string &plugin_id)>;
    using BindingCountHook = std::function<size_t(const std::string &plugin_id)>;

    InstallPipeline(registry::PluginRegistry &registry, KeyedMutex &plugin_locks,
                    const InstallPipelineConfig &config = InstallPipelineConfig());
    ~InstallPipeline();

    InstallPipeline(const InstallPipeline &) = delete;
    InstallPipeline &operator=(const InstallPipeline &) = delete;

    // Register before start(); one backend per InstallType
    void register_backend(std::unique_ptr<IInstallerBackend> backend);

    // Called after a successful install/upgrade of a plugin that was loaded
    void set_reload_hook(const PluginHook &hook) { reload_hook_ = hook; }
    // Called by uninstall for a loaded plugin
    void set_unload_hook(const PluginHook &hook) { unload_hook_ = hook; }
    // Uninstall refuses while this reports held bindings
    void set_binding_count_hook(const BindingCountHook &hook) { binding_count_hook_ = hook; }

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    /**
     * @brief Queue a job
     *
     * @param job_id Receives the new job id ("job-<n>")
     * @return INVALID_ARGUMENT for an empty plugin id or an install type with
     *         no backend, NOT_FOUND for upgrade/uninstall of an unknown plugin,
     *         CONFLICTING_JOB if the plugin already has a non-terminal job,
     *         QUEUE_FULL when the intake queue is at capacity,
     *         FAILED_PRECONDITION if the pipeline is not running
     */
    Status enqueue(const std::string &plugin_id, InstallType install_type, JobAction action,
                   const nlohmann::json &payload, std::string &job_id);

    // Shorthand for JobAction::INSTALL
    Status enqueue(const std::string &plugin_id, InstallType install_type, const nlohmann::json &payload,
                   std::string &job_id) {
        return enqueue(plugin_id, install_type, JobAction::INSTALL, payload, job_id);
    }

    std::optional<InstallJob> get_job(const std::string &job_id) const;
    std::vector<InstallJob> list_jobs() const;  // creation order

    /**
     * @brief Block until a job is terminal
     *
     * @return true if the job reached SUCCESS or FAILED within timeout_ms;
     *         job receives the latest snapshot either way (if the id exists)
     */
    bool wait_for_job(const std::string &job_id, int timeout_ms, InstallJob &job) const;

    // Listeners run on the thread that changed the job, outside internal locks
    void on_job_update(const JobListener &listener);

    /**
     * @brief Load jobs from persisted state (before start)
     *
     * Non-terminal jobs could not survive the restart and are recorded as
     * FAILED. Job numbering continues after the highest restored id.
     */
    void restore_jobs(const std::vector<InstallJob> &jobs);

    size_t queue_depth() const { return queue_.size(); }
    const InstallPipelineConfig &config() const { return config_; }

private:
    struct JobEntry {
        InstallJob job;
        InstallControl control;
        bool committing = false;  // registry commit in progress; watchdog waits
    };

    void worker_loop(int index);
    void watchdog_loop();
    void process_job(const std::string &job_id);
    void run_install(const InstallJob &job, IInstallerBackend &backend, const InstallControl &control);
    void run_uninstall(const InstallJob &job, IInstallerBackend &backend, const InstallControl &control);

    // Commit step under the plugin lock; false if the job already went terminal
    bool begin_commit(const std::string &job_id);

    bool transition(const std::string &job_id, JobStatus to, ErrorCode code = ErrorCode::OK,
                    const std::string &error = "", const std::string &installed_version = "");
    // Caller holds jobs_mutex_
    bool transition_locked(JobEntry &entry, JobStatus to, ErrorCode code, const std::string &error,
                           const std::string &installed_version);

    void fail(const std::string &job_id, const Status &status) {
        transition(job_id, JobStatus::FAILED, status.code(), status.message());
    }

    void notify(const InstallJob &job);

    registry::PluginRegistry &registry_;
    KeyedMutex &plugin_locks_;
    InstallPipelineConfig config_;

    std::map<InstallType, std::unique_ptr<IInstallerBackend>> backends_;
    PluginHook reload_hook_;
    PluginHook unload_hook_;
    BindingCountHook binding_count_hook_;

    BoundedQueue<std::string> queue_;

    mutable std::mutex jobs_mutex_;
    mutable std::condition_variable jobs_cv_;  // signalled on every terminal transition
    std::map<std::string, JobEntry> jobs_;
    std::vector<std::string> job_order_;
    std::map<std::string, std::string> active_by_plugin_;  // plugin_id -> job_id
    uint64_t next_job_number_ = 1;

    std::mutex listeners_mutex_;
    std::vector<JobListener> listeners_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::thread watchdog_;
    std::mutex watchdog_mutex_;
    std::condition_variable watchdog_cv_;
};

}  // namespace jobs
}  // namespace hearth

#include "install_pipeline.hpp"

#include "common/clock.hpp"
#include "logging/logger.hpp"
#include "registry/plugin_registry.hpp"

namespace hearth {
namespace jobs {

InstallPipeline::InstallPipeline(registry::PluginRegistry &registry, KeyedMutex &plugin_locks,
                                 const InstallPipelineConfig &config)
    : registry_(registry),
      plugin_locks_(plugin_locks),
      config_(config),
      queue_(config.queue_size, OverflowPolicy::REJECT, "install-jobs") {
    if (config_.workers < 1) {
        config_.workers = 1;
    }
    if (config_.watchdog_interval_ms < 10) {
        config_.watchdog_interval_ms = 10;
    }
}

InstallPipeline::~InstallPipeline() { stop(); }

void InstallPipeline::register_backend(std::unique_ptr<IInstallerBackend> backend) {
    if (!backend) {
        return;
    }
    const InstallType type = backend->type();
    if (running_) {
        LOG_WARN("[InstallPipeline] Backend '" << install_type_to_string(type) << "' registered after start, ignored");
        return;
    }
    backends_[type] = std::move(backend);
}

bool InstallPipeline::start() {
    if (running_) {
        LOG_WARN("[InstallPipeline] Already running");
        return false;
    }
    if (backends_.empty()) {
        LOG_WARN("[InstallPipeline] Starting without installer backends");
    }

    running_ = true;
    for (int i = 0; i < config_.workers; ++i) {
        workers_.emplace_back(&InstallPipeline::worker_loop, this, i);
    }
    watchdog_ = std::thread(&InstallPipeline::watchdog_loop, this);

    LOG_INFO("[InstallPipeline] Started with " << config_.workers << " workers, queue " << queue_.capacity()
                                               << ", timeout " << config_.install_timeout_ms << "ms");
    return true;
}

void InstallPipeline::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[InstallPipeline] Stopping...");
    queue_.close();
    {
        // Running backend calls give up once cancelled
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto &[job_id, entry] : jobs_) {
            static_cast<void>(job_id);
            if (!is_terminal(entry.job.status)) {
                entry.control.cancelled->store(true);
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(watchdog_mutex_);
    }
    watchdog_cv_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    std::vector<std::string> leftover;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (const auto &[plugin_id, job_id] : active_by_plugin_) {
            static_cast<void>(plugin_id);
            leftover.push_back(job_id);
        }
    }
    for (const auto &job_id : leftover) {
        transition(job_id, JobStatus::FAILED, ErrorCode::UNAVAILABLE, "Pipeline stopped");
    }

    LOG_INFO("[InstallPipeline] Stopped");
}

Status InstallPipeline::enqueue(const std::string &plugin_id, InstallType install_type, JobAction action,
                                const nlohmann::json &payload, std::string &job_id) {
    if (plugin_id.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Plugin id must not be empty");
    }
    if (backends_.find(install_type) == backends_.end()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
                             std::string("No installer backend for type '") + install_type_to_string(install_type) +
                                 "'");
    }
    if (!running_) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Install pipeline is not running");
    }
    if (action != JobAction::INSTALL && !registry_.has(plugin_id)) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin '" + plugin_id + "' is not installed");
    }

    InstallJob snapshot;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto active = active_by_plugin_.find(plugin_id);
        if (active != active_by_plugin_.end()) {
            return Status::error(ErrorCode::CONFLICTING_JOB,
                                 "Plugin '" + plugin_id + "' already has job " + active->second + " in progress");
        }

        JobEntry entry;
        entry.job.id = "job-" + std::to_string(next_job_number_++);
        entry.job.plugin_id = plugin_id;
        entry.job.install_type = install_type;
        entry.job.action = action;
        entry.job.payload = payload.is_null() ? nlohmann::json::object() : payload;
        entry.job.created_at = now_epoch_ms();
        entry.control.deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.install_timeout_ms);

        const std::string id = entry.job.id;
        if (!queue_.push(id)) {
            LOG_WARN("[InstallPipeline] Queue full, rejected " << job_action_to_string(action) << " of '" << plugin_id
                                                               << "'");
            return Status::error(ErrorCode::QUEUE_FULL, "Install queue is full");
        }

        snapshot = entry.job;
        jobs_.emplace(id, std::move(entry));
        job_order_.push_back(id);
        active_by_plugin_[plugin_id] = id;
    }

    job_id = snapshot.id;
    LOG_INFO("[InstallPipeline] Queued " << snapshot.id << ": " << job_action_to_string(action) << " '" << plugin_id
                                         << "' via " << install_type_to_string(install_type));
    notify(snapshot);
    return Status::success();
}

void InstallPipeline::worker_loop(int index) {
    LOG_DEBUG("[InstallPipeline] Worker " << index << " started");
    while (running_) {
        auto job_id = queue_.pop(-1);
        if (!job_id || !running_) {
            break;
        }
        try {
            process_job(*job_id);
        } catch (const std::exception &e) {
            LOG_ERROR("[InstallPipeline] Unexpected error in " << *job_id << ": " << e.what());
            transition(*job_id, JobStatus::FAILED, ErrorCode::INTERNAL, e.what());
        }
    }
    LOG_DEBUG("[InstallPipeline] Worker " << index << " exiting");
}

void InstallPipeline::process_job(const std::string &job_id) {
    InstallJob job;
    InstallControl control;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end() || is_terminal(it->second.job.status)) {
            return;
        }
        job = it->second.job;
        control = it->second.control;
    }

    IInstallerBackend &backend = *backends_.at(job.install_type);

    if (!transition(job_id, JobStatus::SENT)) {
        return;
    }

    Status status;
    try {
        status = backend.dispatch(job);
    } catch (const std::exception &e) {
        status = Status::error(ErrorCode::INTERNAL, std::string("Backend dispatch threw: ") + e.what());
    }
    if (!status.ok()) {
        LOG_WARN("[InstallPipeline] " << job_id << " rejected by backend: " << status.to_string());
        fail(job_id, status);
        return;
    }

    if (!transition(job_id, JobStatus::RUNNING)) {
        return;
    }

    if (job.action == JobAction::UNINSTALL) {
        run_uninstall(job, backend, control);
    } else {
        run_install(job, backend, control);
    }
}

void InstallPipeline::run_install(const InstallJob &job, IInstallerBackend &backend, const InstallControl &control) {
    plugin::PluginRecord manifest;
    Status status;
    try {
        status = backend.fetch_manifest(job, control, manifest);
    } catch (const std::exception &e) {
        status = Status::error(ErrorCode::INTERNAL, std::string("Backend threw: ") + e.what());
    }
    if (!status.ok()) {
        LOG_WARN("[InstallPipeline] " << job.id << " failed: " << status.to_string());
        fail(job.id, status);
        return;
    }

    if (manifest.id.empty()) {
        manifest.id = job.plugin_id;
    }
    if (manifest.id != job.plugin_id) {
        fail(job.id, Status::error(ErrorCode::INVALID_ARGUMENT, "Manifest declares plugin '" + manifest.id +
                                                                    "', job targets '" + job.plugin_id + "'"));
        return;
    }

    // A loaded plugin whose running mode the new manifest drops is stopped before the
    // commit and brought back by the reload below in one of the new modes
    bool restart = false;
    auto current = registry_.get(job.plugin_id);
    if (current && current->loaded && !manifest.supported_modes.empty() &&
        !manifest.supports_mode(current->runtime_mode)) {
        if (!begin_commit(job.id)) {
            LOG_WARN("[InstallPipeline] " << job.id << " finished after its deadline, result discarded");
            return;
        }
        const char *mode_name = plugin::runtime_mode_to_string(current->runtime_mode);
        if (!unload_hook_) {
            fail(job.id, Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin '" + job.plugin_id +
                                                                           "' is loaded as " + mode_name +
                                                                           " and cannot be unloaded here"));
            return;
        }
        LOG_INFO("[InstallPipeline] " << job.id << ": version " << manifest.latest_version << " drops mode "
                                      << mode_name << ", stopping '" << job.plugin_id << "' first");
        status = unload_hook_(job.plugin_id);
        if (!status.ok()) {
            fail(job.id, status);
            return;
        }
        restart = true;
    }

    bool was_loaded = false;
    {
        auto plugin_lock = plugin_locks_.lock(job.plugin_id);
        if (!begin_commit(job.id)) {
            LOG_WARN("[InstallPipeline] " << job.id << " finished after its deadline, result discarded");
            return;
        }

        auto existing = registry_.get(job.plugin_id);
        if (job.action == JobAction::UPGRADE && !existing) {
            fail(job.id, Status::error(ErrorCode::NOT_FOUND, "Plugin '" + job.plugin_id + "' was removed"));
            return;
        }
        was_loaded = restart || (existing && existing->loaded);

        bool created = false;
        status = registry_.upsert_from_manifest(manifest, created);
        if (!status.ok()) {
            LOG_WARN("[InstallPipeline] " << job.id << " registry update failed: " << status.to_string());
            fail(job.id, status);
            return;
        }
        transition(job.id, JobStatus::SUCCESS, ErrorCode::OK, "", manifest.latest_version);
        LOG_INFO("[InstallPipeline] " << job.id << " succeeded: '" << job.plugin_id << "' "
                                      << (created ? "installed" : "updated") << " at version "
                                      << manifest.latest_version);
    }

    if (was_loaded) {
        if (!reload_hook_) {
            LOG_WARN("[InstallPipeline] '" << job.plugin_id << "' updated while loaded but no reload hook is set");
            return;
        }
        Status reload_status = reload_hook_(job.plugin_id);
        if (!reload_status.ok()) {
            // The install itself succeeded; load failures surface through the supervisor
            LOG_ERROR("[InstallPipeline] Reload of '" << job.plugin_id << "' failed: " << reload_status.to_string());
        }
    }
}

void InstallPipeline::run_uninstall(const InstallJob &job, IInstallerBackend &backend,
                                    const InstallControl &control) {
    if (!registry_.has(job.plugin_id)) {
        fail(job.id, Status::error(ErrorCode::NOT_FOUND, "Plugin '" + job.plugin_id + "' is not installed"));
        return;
    }

    // Committed before the first destructive step: once the plugin is unloaded the
    // job runs to completion, deadline or not
    if (!begin_commit(job.id)) {
        LOG_WARN("[InstallPipeline] " << job.id << " expired before uninstalling '" << job.plugin_id << "'");
        return;
    }

    auto existing = registry_.get(job.plugin_id);
    if (existing && existing->loaded) {
        if (!unload_hook_) {
            fail(job.id, Status::error(ErrorCode::FAILED_PRECONDITION,
                                       "Plugin '" + job.plugin_id + "' is loaded and cannot be unloaded here"));
            return;
        }
        Status status = unload_hook_(job.plugin_id);
        if (!status.ok()) {
            fail(job.id, status);
            return;
        }
    }

    // Held until the record is gone so nothing loads the plugin again in between
    auto plugin_lock = plugin_locks_.lock(job.plugin_id);

    existing = registry_.get(job.plugin_id);
    if (!existing) {
        fail(job.id, Status::error(ErrorCode::NOT_FOUND, "Plugin '" + job.plugin_id + "' is not installed"));
        return;
    }
    if (existing->loaded) {
        fail(job.id, Status::error(ErrorCode::FAILED_PRECONDITION,
                                   "Plugin '" + job.plugin_id + "' was loaded again during uninstall"));
        return;
    }
    if (binding_count_hook_) {
        const size_t held = binding_count_hook_(job.plugin_id);
        if (held > 0) {
            fail(job.id, Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin '" + job.plugin_id + "' still holds " +
                                                                           std::to_string(held) + " bindings"));
            return;
        }
    }

    Status status;
    try {
        status = backend.remove_artifacts(job, control);
    } catch (const std::exception &e) {
        status = Status::error(ErrorCode::INTERNAL, std::string("Backend threw: ") + e.what());
    }
    if (!status.ok()) {
        fail(job.id, status);
        return;
    }

    status = registry_.remove(job.plugin_id);
    if (!status.ok()) {
        fail(job.id, status);
        return;
    }
    transition(job.id, JobStatus::SUCCESS);
    LOG_INFO("[InstallPipeline] " << job.id << " succeeded: '" << job.plugin_id << "' uninstalled");
}

bool InstallPipeline::begin_commit(const std::string &job_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || is_terminal(it->second.job.status)) {
        return false;
    }
    it->second.committing = true;
    return true;
}

void InstallPipeline::watchdog_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(watchdog_mutex_);
            watchdog_cv_.wait_for(lock, std::chrono::milliseconds(config_.watchdog_interval_ms),
                                  [this] { return !running_; });
        }
        if (!running_) {
            break;
        }

        std::vector<InstallJob> expired;
        const auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            std::vector<std::string> active_ids;
            for (const auto &[plugin_id, job_id] : active_by_plugin_) {
                static_cast<void>(plugin_id);
                active_ids.push_back(job_id);
            }

            for (const auto &job_id : active_ids) {
                auto &entry = jobs_.at(job_id);
                if (entry.committing || now < entry.control.deadline) {
                    continue;
                }
                entry.control.cancelled->store(true);
                if (transition_locked(entry, JobStatus::FAILED, ErrorCode::TIMEOUT,
                                      "Install exceeded " + std::to_string(config_.install_timeout_ms) + "ms", "")) {
                    expired.push_back(entry.job);
                }
            }
        }

        for (const auto &job : expired) {
            LOG_WARN("[InstallPipeline] " << job.id << " for '" << job.plugin_id << "' timed out");
            notify(job);
        }
    }
}

bool InstallPipeline::transition(const std::string &job_id, JobStatus to, ErrorCode code, const std::string &error,
                                 const std::string &installed_version) {
    InstallJob snapshot;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return false;
        }
        if (!transition_locked(it->second, to, code, error, installed_version)) {
            return false;
        }
        snapshot = it->second.job;
    }
    notify(snapshot);
    return true;
}

bool InstallPipeline::transition_locked(JobEntry &entry, JobStatus to, ErrorCode code, const std::string &error,
                                        const std::string &installed_version) {
    InstallJob &job = entry.job;
    if (!can_transition(job.status, to)) {
        LOG_DEBUG("[InstallPipeline] " << job.id << ": ignoring " << job_status_to_string(job.status) << " -> "
                                       << job_status_to_string(to));
        return false;
    }

    const int64_t now = now_epoch_ms();
    job.status = to;
    switch (to) {
        case JobStatus::SENT:
            job.sent_at = now;
            break;
        case JobStatus::RUNNING:
            job.running_at = now;
            break;
        case JobStatus::SUCCESS:
        case JobStatus::FAILED:
            job.finished_at = now;
            job.error_code = code;
            job.error = error;
            if (to == JobStatus::SUCCESS) {
                job.installed_version = installed_version;
            }
            break;
        default:
            break;
    }

    if (is_terminal(to)) {
        entry.committing = false;
        auto active = active_by_plugin_.find(job.plugin_id);
        if (active != active_by_plugin_.end() && active->second == job.id) {
            active_by_plugin_.erase(active);
        }
        jobs_cv_.notify_all();
    }
    return true;
}

std::optional<InstallJob> InstallPipeline::get_job(const std::string &job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.job;
}

std::vector<InstallJob> InstallPipeline::list_jobs() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    std::vector<InstallJob> result;
    result.reserve(job_order_.size());
    for (const auto &job_id : job_order_) {
        result.push_back(jobs_.at(job_id).job);
    }
    return result;
}

bool InstallPipeline::wait_for_job(const std::string &job_id, int timeout_ms, InstallJob &job) const {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    auto done = [&] {
        auto it = jobs_.find(job_id);
        return it == jobs_.end() || is_terminal(it->second.job.status);
    };
    jobs_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), done);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return false;
    }
    job = it->second.job;
    return is_terminal(job.status);
}

void InstallPipeline::on_job_update(const JobListener &listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(listener);
}

void InstallPipeline::restore_jobs(const std::vector<InstallJob> &jobs) {
    size_t interrupted = 0;
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const auto &restored : jobs) {
        if (restored.id.empty() || jobs_.count(restored.id) > 0) {
            continue;
        }

        JobEntry entry;
        entry.job = restored;
        if (!is_terminal(entry.job.status)) {
            entry.job.status = JobStatus::FAILED;
            entry.job.error_code = ErrorCode::UNAVAILABLE;
            entry.job.error = "Interrupted by restart";
            entry.job.finished_at = now_epoch_ms();
            interrupted++;
        }

        const std::string prefix = "job-";
        if (restored.id.compare(0, prefix.size(), prefix) == 0) {
            try {
                const uint64_t number = std::stoull(restored.id.substr(prefix.size()));
                if (number >= next_job_number_) {
                    next_job_number_ = number + 1;
                }
            } catch (const std::exception &e) {
                LOG_DEBUG("[InstallPipeline] Job id '" << restored.id << "' not numbered: " << e.what());
            }
        }

        job_order_.push_back(restored.id);
        jobs_.emplace(restored.id, std::move(entry));
    }

    LOG_INFO("[InstallPipeline] Restored " << jobs.size() << " jobs (" << interrupted << " interrupted)");
}

void InstallPipeline::notify(const InstallJob &job) {
    std::vector<JobListener> listeners_copy;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_copy = listeners_;
    }

    for (const auto &listener : listeners_copy) {
        try {
            listener(job);
        } catch (const std::exception &e) {
            LOG_ERROR("[InstallPipeline] Error in job listener: " << e.what());
        } catch (...) {
            LOG_ERROR("[InstallPipeline] Unknown error in job listener");
        }
    }
}

}  // namespace jobs
}  // namespace hearth

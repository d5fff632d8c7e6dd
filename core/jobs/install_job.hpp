#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include "common/status.hpp"

namespace hearth {
namespace jobs {

enum class InstallType { URL, SOURCE_CONTROL, LOCAL };

enum class JobAction { INSTALL, UPGRADE, UNINSTALL };

/**
 * Job status, ordered: PENDING < SENT < RUNNING < {SUCCESS, FAILED}.
 *
 * Transitions only move forward along that order and never leave a
 * terminal state. Skipping forward (PENDING -> FAILED) is allowed.
 */
enum class JobStatus { PENDING, SENT, RUNNING, SUCCESS, FAILED };

const char *install_type_to_string(InstallType type);  // "url", "source-control", "local"
std::optional<InstallType> string_to_install_type(const std::string &str);

const char *job_action_to_string(JobAction action);  // "install", "upgrade", "uninstall"
std::optional<JobAction> string_to_job_action(const std::string &str);

const char *job_status_to_string(JobStatus status);  // "pending", "sent", ...
std::optional<JobStatus> string_to_job_status(const std::string &str);

int job_status_rank(JobStatus status);
bool is_terminal(JobStatus status);
bool can_transition(JobStatus from, JobStatus to);

struct InstallJob {
    std::string id;
    std::string plugin_id;
    InstallType install_type = InstallType::LOCAL;
    JobAction action = JobAction::INSTALL;
    nlohmann::json payload = nlohmann::json::object();  // backend specific (path, url, repository, ...)

    JobStatus status = JobStatus::PENDING;
    ErrorCode error_code = ErrorCode::OK;
    std::string error;
    std::string installed_version;  // set on successful install/upgrade

    // Epoch ms per transition, 0 = not reached
    int64_t created_at = 0;
    int64_t sent_at = 0;
    int64_t running_at = 0;
    int64_t finished_at = 0;
};

nlohmann::json install_job_to_json(const InstallJob &job);
bool install_job_from_json(const nlohmann::json &json, InstallJob &job, std::string &error);

}  // namespace jobs
}  // namespace hearth

#include "install_job.hpp"

namespace hearth {
namespace jobs {

const char *install_type_to_string(InstallType type) {
    switch (type) {
        case InstallType::URL:
            return "url";
        case InstallType::SOURCE_CONTROL:
            return "source-control";
        case InstallType::LOCAL:
            return "local";
        default:
            return "unknown";
    }
}

std::optional<InstallType> string_to_install_type(const std::string &str) {
    if (str == "url") return InstallType::URL;
    if (str == "source-control" || str == "source_control" || str == "git") return InstallType::SOURCE_CONTROL;
    if (str == "local") return InstallType::LOCAL;
    return std::nullopt;
}

const char *job_action_to_string(JobAction action) {
    switch (action) {
        case JobAction::INSTALL:
            return "install";
        case JobAction::UPGRADE:
            return "upgrade";
        case JobAction::UNINSTALL:
            return "uninstall";
        default:
            return "unknown";
    }
}

std::optional<JobAction> string_to_job_action(const std::string &str) {
    if (str == "install") return JobAction::INSTALL;
    if (str == "upgrade") return JobAction::UPGRADE;
    if (str == "uninstall") return JobAction::UNINSTALL;
    return std::nullopt;
}

const char *job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:
            return "pending";
        case JobStatus::SENT:
            return "sent";
        case JobStatus::RUNNING:
            return "running";
        case JobStatus::SUCCESS:
            return "success";
        case JobStatus::FAILED:
            return "failed";
        default:
            return "unknown";
    }
}

std::optional<JobStatus> string_to_job_status(const std::string &str) {
    if (str == "pending") return JobStatus::PENDING;
    if (str == "sent") return JobStatus::SENT;
    if (str == "running") return JobStatus::RUNNING;
    if (str == "success") return JobStatus::SUCCESS;
    if (str == "failed") return JobStatus::FAILED;
    return std::nullopt;
}

int job_status_rank(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:
            return 0;
        case JobStatus::SENT:
            return 1;
        case JobStatus::RUNNING:
            return 2;
        case JobStatus::SUCCESS:
        case JobStatus::FAILED:
            return 3;
        default:
            return 0;
    }
}

bool is_terminal(JobStatus status) { return status == JobStatus::SUCCESS || status == JobStatus::FAILED; }

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    return job_status_rank(to) > job_status_rank(from);
}

nlohmann::json install_job_to_json(const InstallJob &job) {
    nlohmann::json json = {{"id", job.id},
                           {"plugin_id", job.plugin_id},
                           {"install_type", install_type_to_string(job.install_type)},
                           {"action", job_action_to_string(job.action)},
                           {"payload", job.payload},
                           {"status", job_status_to_string(job.status)},
                           {"created_at", job.created_at},
                           {"sent_at", job.sent_at},
                           {"running_at", job.running_at},
                           {"finished_at", job.finished_at}};
    if (job.error_code != ErrorCode::OK) {
        json["error_code"] = error_code_to_string(job.error_code);
        json["error"] = job.error;
    }
    if (!job.installed_version.empty()) {
        json["installed_version"] = job.installed_version;
    }
    return json;
}

bool install_job_from_json(const nlohmann::json &json, InstallJob &job, std::string &error) {
    try {
        job = InstallJob();
        job.id = json.at("id").get<std::string>();
        job.plugin_id = json.at("plugin_id").get<std::string>();

        auto type = string_to_install_type(json.value("install_type", std::string("local")));
        auto action = string_to_job_action(json.value("action", std::string("install")));
        auto status = string_to_job_status(json.value("status", std::string("pending")));
        if (!type || !action || !status) {
            error = "Job '" + job.id + "' has an unknown install_type, action or status";
            return false;
        }
        job.install_type = *type;
        job.action = *action;
        job.status = *status;

        if (json.contains("payload") && !json.at("payload").is_null()) {
            job.payload = json.at("payload");
        }
        job.error = json.value("error", std::string());
        job.error_code = job.error.empty() ? ErrorCode::OK : ErrorCode::INTERNAL;
        const auto code_name = json.value("error_code", std::string());
        for (int c = static_cast<int>(ErrorCode::OK); c <= static_cast<int>(ErrorCode::INTERNAL); ++c) {
            if (code_name == error_code_to_string(static_cast<ErrorCode>(c))) {
                job.error_code = static_cast<ErrorCode>(c);
            }
        }
        job.installed_version = json.value("installed_version", std::string());
        job.created_at = json.value("created_at", int64_t{0});
        job.sent_at = json.value("sent_at", int64_t{0});
        job.running_at = json.value("running_at", int64_t{0});
        job.finished_at = json.value("finished_at", int64_t{0});
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Malformed job record: ") + e.what();
        return false;
    }
    return true;
}

}  // namespace jobs
}  // namespace hearth

#include "git_installer.hpp"

#include <filesystem>

#include "command_runner.hpp"
#include "logging/logger.hpp"
#include "manifest.hpp"

namespace hearth {
namespace jobs {

std::string GitInstaller::checkout_dir(const std::string &plugin_id) const {
    return (std::filesystem::path(staging_dir_) / plugin_id).string();
}

Status GitInstaller::dispatch(const InstallJob &job) {
    if (job.payload.value("repository", std::string()).empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Source-control install needs payload.repository");
    }
    const auto subdir = job.payload.value("subdir", std::string());
    if (subdir.find("..") != std::string::npos) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "payload.subdir must stay inside the checkout");
    }
    return Status::success();
}

Status GitInstaller::fetch_manifest(const InstallJob &job, const InstallControl &control,
                                    plugin::PluginRecord &manifest) {
    const auto repository = job.payload.value("repository", std::string());
    const auto ref = job.payload.value("ref", std::string());
    const auto subdir = job.payload.value("subdir", std::string());
    const auto dest = checkout_dir(job.plugin_id);

    std::error_code ec;
    std::filesystem::create_directories(staging_dir_, ec);
    if (ec) {
        return Status::error(ErrorCode::INTERNAL, "Cannot create staging dir " + staging_dir_ + ": " + ec.message());
    }
    std::filesystem::remove_all(dest, ec);

    std::vector<std::string> argv{git_command_, "clone", "--depth", "1"};
    if (!ref.empty()) {
        argv.push_back("--branch");
        argv.push_back(ref);
    }
    argv.push_back(repository);
    argv.push_back(dest);

    LOG_INFO("[GitInstaller] Cloning " << repository << (ref.empty() ? "" : " @ " + ref) << " into " << dest);

    CommandResult result;
    std::string error;
    if (!run_command(argv, [&control] { return control.should_abort(); }, result, error)) {
        return Status::error(ErrorCode::UNAVAILABLE, "Cannot run git: " + error);
    }
    if (result.aborted) {
        std::filesystem::remove_all(dest, ec);
        return Status::error(ErrorCode::TIMEOUT, "git clone aborted");
    }
    if (result.exit_code != 0) {
        std::filesystem::remove_all(dest, ec);
        return Status::error(ErrorCode::UNAVAILABLE,
                             "git clone exited with " + std::to_string(result.exit_code) + ": " + result.output);
    }

    const auto manifest_dir = subdir.empty() ? dest : (std::filesystem::path(dest) / subdir).string();
    if (!load_manifest_from_directory(manifest_dir, manifest, error)) {
        return Status::error(ErrorCode::LOAD_FAILED, error);
    }
    return Status::success();
}

Status GitInstaller::remove_artifacts(const InstallJob &job, const InstallControl &control) {
    static_cast<void>(control);
    std::error_code ec;
    std::filesystem::remove_all(checkout_dir(job.plugin_id), ec);
    if (ec) {
        return Status::error(ErrorCode::INTERNAL, "Cannot remove checkout: " + ec.message());
    }
    return Status::success();
}

}  // namespace jobs
}  // namespace hearth

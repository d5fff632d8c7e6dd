#include "local_installer.hpp"

#include <filesystem>

#include "manifest.hpp"

namespace hearth {
namespace jobs {

Status LocalInstaller::dispatch(const InstallJob &job) {
    const auto path = job.payload.value("path", std::string());
    if (path.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Local install needs payload.path");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return Status::error(ErrorCode::NOT_FOUND, "Plugin directory not found: " + path);
    }
    return Status::success();
}

Status LocalInstaller::fetch_manifest(const InstallJob &job, const InstallControl &control,
                                      plugin::PluginRecord &manifest) {
    if (control.should_abort()) {
        return Status::error(ErrorCode::TIMEOUT, "Install aborted");
    }
    std::string error;
    if (!load_manifest_from_directory(job.payload.value("path", std::string()), manifest, error)) {
        return Status::error(ErrorCode::LOAD_FAILED, error);
    }
    return Status::success();
}

}  // namespace jobs
}  // namespace hearth

#pragma once

#include <string>

#include "installer_backend.hpp"

namespace hearth {
namespace jobs {

/**
 * @brief Shallow-clones a repository and reads its manifest
 *
 * Payload: {"repository": "https://...", "ref": "v1.2" (optional),
 *           "subdir": "plugin" (optional)}.
 * Checkouts live in <staging_dir>/<plugin_id> until uninstall.
 */
class GitInstaller : public IInstallerBackend {
public:
    explicit GitInstaller(const std::string &staging_dir, const std::string &git_command = "git")
        : staging_dir_(staging_dir), git_command_(git_command) {}

    InstallType type() const override { return InstallType::SOURCE_CONTROL; }

    Status dispatch(const InstallJob &job) override;
    Status fetch_manifest(const InstallJob &job, const InstallControl &control,
                          plugin::PluginRecord &manifest) override;
    Status remove_artifacts(const InstallJob &job, const InstallControl &control) override;

private:
    std::string checkout_dir(const std::string &plugin_id) const;

    std::string staging_dir_;
    std::string git_command_;
};

}  // namespace jobs
}  // namespace hearth

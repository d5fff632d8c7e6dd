#pragma once

#include "installer_backend.hpp"

namespace hearth {
namespace jobs {

// Installs from a directory on this machine. Payload: {"path": "/opt/plugins/lights"}
class LocalInstaller : public IInstallerBackend {
public:
    InstallType type() const override { return InstallType::LOCAL; }

    Status dispatch(const InstallJob &job) override;
    Status fetch_manifest(const InstallJob &job, const InstallControl &control,
                          plugin::PluginRecord &manifest) override;
};

}  // namespace jobs
}  // namespace hearth

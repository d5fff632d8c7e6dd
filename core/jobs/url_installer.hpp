#pragma once

#include "installer_backend.hpp"

namespace hearth {
namespace jobs {

/**
 * @brief Downloads a plugin manifest over HTTP(S)
 *
 * Payload: {"url": "http://repo.local/lights/hearth-plugin.json",
 *           "sha256": "<hex digest of the manifest>" (optional)}.
 * A download whose digest differs from payload.sha256 fails the job.
 * HTTPS needs cpp-httplib built with OpenSSL support.
 */
class UrlInstaller : public IInstallerBackend {
public:
    explicit UrlInstaller(int request_timeout_ms = 30000) : request_timeout_ms_(request_timeout_ms) {}

    InstallType type() const override { return InstallType::URL; }

    Status dispatch(const InstallJob &job) override;
    Status fetch_manifest(const InstallJob &job, const InstallControl &control,
                          plugin::PluginRecord &manifest) override;

    // "http://host:8080/a/b.json" -> {"http://host:8080", "/a/b.json"}
    static bool split_url(const std::string &url, std::string &scheme_host_port, std::string &path);

private:
    int request_timeout_ms_;
};

}  // namespace jobs
}  // namespace hearth

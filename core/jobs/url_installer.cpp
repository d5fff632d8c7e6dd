#include "url_installer.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

#include "common/sha256.hpp"
#include "logging/logger.hpp"
#include "manifest.hpp"

namespace hearth {
namespace jobs {

bool UrlInstaller::split_url(const std::string &url, std::string &scheme_host_port, std::string &path) {
    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    const std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    const size_t path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        scheme_host_port = url;
        path = "/";
    } else {
        scheme_host_port = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return scheme_host_port.size() > scheme_end + 3;
}

Status UrlInstaller::dispatch(const InstallJob &job) {
    const auto url = job.payload.value("url", std::string());
    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
                             "URL install needs an http(s) payload.url, got '" + url + "'");
    }
    if (job.payload.contains("sha256")) {
        const auto &digest = job.payload["sha256"];
        if (!digest.is_string() || !is_sha256_hex(digest.get<std::string>())) {
            return Status::error(ErrorCode::INVALID_ARGUMENT, "payload.sha256 must be 64 hex digits");
        }
    }
    return Status::success();
}

Status UrlInstaller::fetch_manifest(const InstallJob &job, const InstallControl &control,
                                    plugin::PluginRecord &manifest) {
    const auto url = job.payload.value("url", std::string());
    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Invalid URL '" + url + "'");
    }

    const int timeout_ms = std::min(request_timeout_ms_, control.remaining_ms());
    if (timeout_ms <= 0 || control.should_abort()) {
        return Status::error(ErrorCode::TIMEOUT, "Install deadline reached before download");
    }

    // httplib::Client auto-detects scheme and handles SSL when built with OpenSSL
    httplib::Client client(base);
    if (!client.is_valid()) {
        return Status::error(ErrorCode::UNAVAILABLE, "Cannot create HTTP client for " + base);
    }
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms));
    client.set_follow_location(true);

    LOG_INFO("[UrlInstaller] Fetching " << url);
    auto result = client.Get(path.c_str());
    if (!result) {
        return Status::error(ErrorCode::UNAVAILABLE,
                             "Download of " + url + " failed: " + httplib::to_string(result.error()));
    }
    if (result->status < 200 || result->status >= 300) {
        return Status::error(ErrorCode::UNAVAILABLE,
                             "Download of " + url + " returned HTTP " + std::to_string(result->status));
    }

    std::string expected = job.payload.value("sha256", std::string());
    if (!expected.empty()) {
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const std::string actual = sha256_hex(result->body);
        if (actual != expected) {
            LOG_WARN("[UrlInstaller] Digest mismatch for " << url << ": expected " << expected << ", got "
                                                          << actual);
            return Status::error(ErrorCode::INVALID_ARGUMENT, "Checksum mismatch for " + url);
        }
    }

    std::string error;
    if (!parse_manifest(result->body, manifest_format_for(path), manifest, error)) {
        return Status::error(ErrorCode::LOAD_FAILED, error);
    }
    return Status::success();
}

}  // namespace jobs
}  // namespace hearth

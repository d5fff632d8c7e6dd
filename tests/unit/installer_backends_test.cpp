/**
 * @file installer_backends_test.cpp
 * @brief URL and source-control installer backends against loopback sources
 */

#include <gtest/gtest.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "common/sha256.hpp"
#include "fakes/manifest_server.hpp"
#include "jobs/git_installer.hpp"
#include "jobs/install_pipeline.hpp"
#include "jobs/url_installer.hpp"
#include "registry/plugin_registry.hpp"

namespace fs = std::filesystem;

using namespace hearth;
using namespace hearth::jobs;
using hearth::tests::ManifestServer;

namespace {

const char *kLightsManifest = R"({
    "id": "lights",
    "name": "Lights",
    "version": "2.1.0",
    "supported_modes": ["in_process", "microservice"],
    "implementation": "diagnostic_echo"
})";

const char *kLightsYaml = "id: lights\nversion: 2.2.0\nsupported_modes: [in_process]\n";

InstallJob make_job(const std::string &plugin_id, InstallType type, const nlohmann::json &payload) {
    InstallJob job;
    job.id = "job-1";
    job.plugin_id = plugin_id;
    job.install_type = type;
    job.payload = payload;
    return job;
}

InstallControl control_with_deadline(int ms) {
    InstallControl control;
    control.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    return control;
}

bool run_shell(const std::string &command) { return std::system((command + " > /dev/null 2>&1").c_str()) == 0; }

}  // namespace

TEST(Sha256Test, KnownDigests) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_TRUE(is_sha256_hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(is_sha256_hex("ba7816bf"));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'g')));
}

class UrlInstallerTest : public ::testing::Test {
protected:
    UrlInstallerTest()
        : server({{"/lights/hearth-plugin.json", kLightsManifest}, {"/lights/hearth-plugin.yaml", kLightsYaml}}) {}

    void SetUp() override { ASSERT_TRUE(server.running()); }

    ManifestServer server;
    UrlInstaller installer{2000};
};

TEST_F(UrlInstallerTest, FetchesJsonAndYamlManifests) {
    InstallJob job = make_job("lights", InstallType::URL, {{"url", server.url("/lights/hearth-plugin.json")}});
    ASSERT_TRUE(installer.dispatch(job).ok());

    plugin::PluginRecord manifest;
    Status status = installer.fetch_manifest(job, control_with_deadline(5000), manifest);
    ASSERT_TRUE(status.ok()) << status.to_string();
    EXPECT_EQ(manifest.id, "lights");
    EXPECT_EQ(manifest.latest_version, "2.1.0");
    EXPECT_EQ(manifest.implementation_id(), "diagnostic_echo");

    job.payload["url"] = server.url("/lights/hearth-plugin.yaml");
    status = installer.fetch_manifest(job, control_with_deadline(5000), manifest);
    ASSERT_TRUE(status.ok()) << status.to_string();
    EXPECT_EQ(manifest.latest_version, "2.2.0");
}

TEST_F(UrlInstallerTest, RejectsBadPayloads) {
    EXPECT_EQ(installer.dispatch(make_job("lights", InstallType::URL, nlohmann::json::object())).code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(installer.dispatch(make_job("lights", InstallType::URL, {{"url", "ftp://repo/lights.json"}})).code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(installer
                  .dispatch(make_job("lights", InstallType::URL,
                                     {{"url", server.url("/lights/hearth-plugin.json")}, {"sha256", "abc"}}))
                  .code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(UrlInstallerTest, MissingDocumentIsUnavailable) {
    InstallJob job = make_job("lights", InstallType::URL, {{"url", server.url("/nothing/here.json")}});
    plugin::PluginRecord manifest;
    Status status = installer.fetch_manifest(job, control_with_deadline(5000), manifest);
    EXPECT_EQ(status.code(), ErrorCode::UNAVAILABLE);
    EXPECT_NE(status.message().find("404"), std::string::npos);
}

TEST_F(UrlInstallerTest, ChecksumMustMatchDownload) {
    const std::string url = server.url("/lights/hearth-plugin.json");
    plugin::PluginRecord manifest;

    std::string digest = sha256_hex(kLightsManifest);
    for (auto &c : digest) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    InstallJob job = make_job("lights", InstallType::URL, {{"url", url}, {"sha256", digest}});
    ASSERT_TRUE(installer.dispatch(job).ok());
    EXPECT_TRUE(installer.fetch_manifest(job, control_with_deadline(5000), manifest).ok());

    job.payload["sha256"] = sha256_hex("tampered");
    Status status = installer.fetch_manifest(job, control_with_deadline(5000), manifest);
    EXPECT_EQ(status.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(status.message().find("Checksum mismatch"), std::string::npos);
}

TEST_F(UrlInstallerTest, ChecksumMismatchFailsTheJob) {
    registry::PluginRegistry registry;
    KeyedMutex locks;
    InstallPipeline pipeline(registry, locks, InstallPipelineConfig());
    pipeline.register_backend(std::make_unique<UrlInstaller>(2000));
    ASSERT_TRUE(pipeline.start());

    std::string job_id;
    ASSERT_TRUE(pipeline
                    .enqueue("lights", InstallType::URL,
                             {{"url", server.url("/lights/hearth-plugin.json")}, {"sha256", sha256_hex("other")}},
                             job_id)
                    .ok());
    InstallJob job;
    ASSERT_TRUE(pipeline.wait_for_job(job_id, 5000, job));
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(job.error_code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(registry.has("lights"));
    pipeline.stop();
}

TEST_F(UrlInstallerTest, ExpiredDeadlineSkipsDownload) {
    InstallJob job = make_job("lights", InstallType::URL, {{"url", server.url("/lights/hearth-plugin.json")}});
    InstallControl control;
    control.cancelled->store(true);
    plugin::PluginRecord manifest;
    EXPECT_EQ(installer.fetch_manifest(job, control, manifest).code(), ErrorCode::TIMEOUT);
}

class GitInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!run_shell("git --version")) {
            GTEST_SKIP() << "git is not installed";
        }
        root = fs::temp_directory_path() / "hearth_git_installer_test";
        fs::remove_all(root);
        fs::create_directories(root / "work" / "plugin");
        std::ofstream(root / "work" / "plugin" / "hearth-plugin.json") << kLightsManifest;

        const std::string work = (root / "work").string();
        const std::string identity = "-c user.email=dev@hearth.local -c user.name=hearth ";
        ASSERT_TRUE(run_shell("git -C " + work + " init -q"));
        ASSERT_TRUE(run_shell("git -C " + work + " add ."));
        ASSERT_TRUE(run_shell("git -C " + work + " " + identity + "commit -q -m manifest"));
        ASSERT_TRUE(run_shell("git -C " + work + " tag v2.1"));
        ASSERT_TRUE(run_shell("git clone -q --bare " + work + " " + (root / "lights.git").string()));

        repository = "file://" + (root / "lights.git").string();
        staging = root / "staging";
    }

    void TearDown() override {
        if (!root.empty()) {
            fs::remove_all(root);
        }
    }

    fs::path root;
    fs::path staging;
    std::string repository;
};

TEST_F(GitInstallerTest, ClonesAndReadsManifestFromSubdir) {
    GitInstaller installer(staging.string());
    InstallJob job = make_job("lights", InstallType::SOURCE_CONTROL,
                              {{"repository", repository}, {"ref", "v2.1"}, {"subdir", "plugin"}});
    ASSERT_TRUE(installer.dispatch(job).ok());

    plugin::PluginRecord manifest;
    Status status = installer.fetch_manifest(job, control_with_deadline(20000), manifest);
    ASSERT_TRUE(status.ok()) << status.to_string();
    EXPECT_EQ(manifest.id, "lights");
    EXPECT_EQ(manifest.latest_version, "2.1.0");
    EXPECT_TRUE(fs::exists(staging / "lights" / "plugin" / "hearth-plugin.json"));

    ASSERT_TRUE(installer.remove_artifacts(job, InstallControl()).ok());
    EXPECT_FALSE(fs::exists(staging / "lights"));
}

TEST_F(GitInstallerTest, MissingManifestOrRepositoryFails) {
    GitInstaller installer(staging.string());
    plugin::PluginRecord manifest;

    // Manifest lives in plugin/, not at the root
    InstallJob job = make_job("lights", InstallType::SOURCE_CONTROL, {{"repository", repository}});
    EXPECT_EQ(installer.fetch_manifest(job, control_with_deadline(20000), manifest).code(), ErrorCode::LOAD_FAILED);

    job.payload["repository"] = "file://" + (root / "absent.git").string();
    Status status = installer.fetch_manifest(job, control_with_deadline(20000), manifest);
    EXPECT_EQ(status.code(), ErrorCode::UNAVAILABLE);
    EXPECT_FALSE(fs::exists(staging / "lights"));
}

TEST_F(GitInstallerTest, DispatchValidatesPayload) {
    GitInstaller installer(staging.string());
    EXPECT_EQ(installer.dispatch(make_job("lights", InstallType::SOURCE_CONTROL, nlohmann::json::object())).code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(installer
                  .dispatch(make_job("lights", InstallType::SOURCE_CONTROL,
                                     {{"repository", repository}, {"subdir", "../etc"}}))
                  .code(),
              ErrorCode::INVALID_ARGUMENT);
}

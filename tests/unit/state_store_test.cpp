#include "state/state_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace hearth;
using namespace hearth::state;

namespace fs = std::filesystem;

namespace {

PersistedState sample_state() {
    PersistedState state;

    plugin::PluginRecord record;
    record.id = "porch_lights";
    record.name = "Porch Lights";
    record.latest_version = "1.2.0";
    record.enabled = true;
    record.loaded = true;
    record.runtime_mode = plugin::RuntimeMode::MICROSERVICE;
    record.supported_modes = {plugin::RuntimeMode::IN_PROCESS, plugin::RuntimeMode::MICROSERVICE};
    record.config = {{"brightness", 70}};
    state.plugins.push_back(record);

    jobs::InstallJob job;
    job.id = "job-3";
    job.plugin_id = "porch_lights";
    job.status = jobs::JobStatus::SUCCESS;
    job.installed_version = "1.2.0";
    job.created_at = 100;
    job.finished_at = 200;
    state.jobs.push_back(job);

    devices::Device device;
    device.id = "porch_lamp";
    device.attributes["room"] = "porch";
    device.is_on = true;
    state.devices.push_back(device);

    devices::Binding binding;
    binding.binding_id = 4;
    binding.plugin_id = "porch_lights";
    binding.selector = "room=porch";
    state.bindings.push_back(binding);

    graph::DeviceLink link;
    link.from = "porch_lamp";
    link.to = "porch_switch";
    link.type = graph::LinkType::PROXY;
    link.direction = graph::LinkDirection::BIDIRECTIONAL;
    state.links.push_back(link);
    return state;
}

}  // namespace

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "hearth_state_store_test";
        fs::remove_all(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
};

TEST_F(StateStoreTest, MissingFileStartsEmpty) {
    StateStore store((dir / "state.json").string());
    PersistedState state = sample_state();
    std::string error;

    EXPECT_FALSE(store.exists());
    ASSERT_TRUE(store.load(state, error)) << error;
    EXPECT_TRUE(state.plugins.empty());
    EXPECT_TRUE(state.jobs.empty());
}

TEST_F(StateStoreTest, SaveCreatesDirectoriesAndLoadsBack) {
    StateStore store((dir / "nested" / "state.json").string());
    std::string error;

    ASSERT_TRUE(store.save(sample_state(), error)) << error;
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(fs::exists(dir / "nested" / "state.json.tmp"));

    PersistedState loaded;
    ASSERT_TRUE(store.load(loaded, error)) << error;
    EXPECT_GT(loaded.saved_at, 0);

    ASSERT_EQ(loaded.plugins.size(), 1u);
    const auto &record = loaded.plugins[0];
    EXPECT_EQ(record.id, "porch_lights");
    EXPECT_TRUE(record.enabled);
    EXPECT_FALSE(record.loaded);  // nothing runs before start-up
    EXPECT_EQ(record.runtime_mode, plugin::RuntimeMode::MICROSERVICE);
    EXPECT_EQ(record.config["brightness"], 70);

    ASSERT_EQ(loaded.jobs.size(), 1u);
    EXPECT_EQ(loaded.jobs[0].id, "job-3");
    EXPECT_EQ(loaded.jobs[0].status, jobs::JobStatus::SUCCESS);

    ASSERT_EQ(loaded.devices.size(), 1u);
    EXPECT_EQ(loaded.devices[0].attributes.at("room"), "porch");
    EXPECT_TRUE(loaded.devices[0].is_on);

    ASSERT_EQ(loaded.bindings.size(), 1u);
    EXPECT_EQ(loaded.bindings[0].selector, "room=porch");

    ASSERT_EQ(loaded.links.size(), 1u);
    EXPECT_EQ(loaded.links[0].type, graph::LinkType::PROXY);
    EXPECT_EQ(loaded.links[0].direction, graph::LinkDirection::BIDIRECTIONAL);
}

TEST_F(StateStoreTest, SaveReplacesPreviousState) {
    StateStore store((dir / "state.json").string());
    std::string error;
    ASSERT_TRUE(store.save(sample_state(), error)) << error;

    PersistedState smaller;
    smaller.saved_at = 42;
    ASSERT_TRUE(store.save(smaller, error)) << error;

    PersistedState loaded;
    ASSERT_TRUE(store.load(loaded, error)) << error;
    EXPECT_EQ(loaded.saved_at, 42);
    EXPECT_TRUE(loaded.plugins.empty());
    EXPECT_TRUE(loaded.links.empty());
}

TEST_F(StateStoreTest, CorruptFileIsAnError) {
    fs::create_directories(dir);
    const auto path = dir / "state.json";
    {
        std::ofstream file(path);
        file << "{ \"plugins\": [";
    }

    StateStore store(path.string());
    PersistedState state;
    std::string error;
    EXPECT_FALSE(store.load(state, error));
    EXPECT_NE(error.find("not valid JSON"), std::string::npos);
}

TEST(PersistedStateJsonTest, RejectsUnsupportedDocuments) {
    PersistedState state;
    std::string error;

    EXPECT_FALSE(persisted_state_from_json(nlohmann::json::array(), state, error));

    EXPECT_FALSE(persisted_state_from_json({{"version", 99}}, state, error));
    EXPECT_NE(error.find("version"), std::string::npos);

    nlohmann::json bad_link = {{"version", StateStore::kFormatVersion},
                               {"links", nlohmann::json::array({{{"from", "a"}, {"to", "b"}, {"type", "wormhole"}}})}};
    EXPECT_FALSE(persisted_state_from_json(bad_link, state, error));
    EXPECT_NE(error.find("wormhole"), std::string::npos);

    nlohmann::json bad_binding = {{"version", StateStore::kFormatVersion},
                                  {"bindings", nlohmann::json::array({{{"selector", "room=porch"}}})}};
    EXPECT_FALSE(persisted_state_from_json(bad_binding, state, error));
    EXPECT_NE(error.find("Malformed"), std::string::npos);
}

TEST(PersistedStateJsonTest, EmptyDocumentUsesDefaults) {
    PersistedState state = sample_state();
    std::string error;

    ASSERT_TRUE(persisted_state_from_json(nlohmann::json::object(), state, error)) << error;
    EXPECT_TRUE(state.plugins.empty());
    EXPECT_TRUE(state.devices.empty());
    EXPECT_EQ(state.saved_at, 0);

    auto json = persisted_state_to_json(sample_state());
    EXPECT_EQ(json["version"], StateStore::kFormatVersion);
    EXPECT_EQ(json["install_jobs"].size(), 1u);
    EXPECT_EQ(json["links"][0]["type"], "proxy");
}

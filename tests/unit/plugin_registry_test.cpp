#include "registry/plugin_registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "external/kv_cache.hpp"

using namespace hearth;
using namespace hearth::plugin;
using namespace hearth::registry;

namespace {

PluginRecord make_record(const std::string &name, std::vector<RuntimeMode> modes = {RuntimeMode::IN_PROCESS}) {
    PluginRecord record;
    record.name = name;
    record.latest_version = "1.0.0";
    record.supported_modes = modes;
    record.runtime_mode = modes.front();
    return record;
}

ConfigSchema brightness_schema() {
    ConfigSchema schema;
    ConfigField field;
    field.name = "brightness";
    field.type = FieldType::INT64;
    field.min = 0;
    field.max = 100;
    field.default_value = 80;
    schema.fields.push_back(field);
    return schema;
}

}  // namespace

TEST(PluginRegistryTest, RegisterDerivesIdFromName) {
    PluginRegistry registry;
    std::string id;

    ASSERT_TRUE(registry.register_plugin(make_record("Kitchen Lights"), id).ok());
    EXPECT_EQ(id, "kitchen_lights");

    auto record = registry.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "Kitchen Lights");
    EXPECT_FALSE(record->loaded);
    EXPECT_GT(record->created_at, 0);
}

TEST(PluginRegistryTest, DuplicateIdOrNameIsRejected) {
    PluginRegistry registry;
    std::string id;
    ASSERT_TRUE(registry.register_plugin(make_record("Lights"), id).ok());

    EXPECT_EQ(registry.register_plugin(make_record("Lights"), id).code(), ErrorCode::DUPLICATE_NAME);

    PluginRecord same_name = make_record("Lights");
    same_name.id = "lights_v2";
    EXPECT_EQ(registry.register_plugin(same_name, id).code(), ErrorCode::DUPLICATE_NAME);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(PluginRegistryTest, RuntimeModeMustBeSupported) {
    PluginRegistry registry;
    PluginRecord record = make_record("Thermostat", {RuntimeMode::IN_PROCESS});
    record.runtime_mode = RuntimeMode::MICROSERVICE;

    std::string id;
    EXPECT_EQ(registry.register_plugin(record, id).code(), ErrorCode::INVALID_ARGUMENT);

    record.runtime_mode = RuntimeMode::IN_PROCESS;
    ASSERT_TRUE(registry.register_plugin(record, id).ok());
    EXPECT_EQ(registry.set_runtime_mode(id, RuntimeMode::EMBEDDED).code(), ErrorCode::UNSUPPORTED_MODE);
    EXPECT_EQ(registry.get(id)->runtime_mode, RuntimeMode::IN_PROCESS);
}

TEST(PluginRegistryTest, ConfigIsValidatedAgainstSchema) {
    PluginRegistry registry;
    PluginRecord record = make_record("Dimmer");
    record.config_schema = brightness_schema();

    std::string id;
    ASSERT_TRUE(registry.register_plugin(record, id).ok());
    EXPECT_EQ(registry.get(id)->config["brightness"], 80);

    EXPECT_EQ(registry.set_config(id, {{"brightness", 150}}).code(), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(registry.get(id)->config["brightness"], 80);

    ASSERT_TRUE(registry.set_config(id, {{"brightness", 40}, {"label", "den"}}).ok());
    EXPECT_EQ(registry.get(id)->config["brightness"], 40);
    EXPECT_EQ(registry.get(id)->config["label"], "den");
}

TEST(PluginRegistryTest, ListenersSeeSnapshotAfterChange) {
    PluginRegistry registry;
    std::vector<RegistryChange> changes;
    bool enabled_seen = false;
    registry.on_change([&](RegistryChange change, const PluginRecord &record) {
        changes.push_back(change);
        if (change == RegistryChange::ENABLED) {
            enabled_seen = record.enabled;
        }
    });

    std::string id;
    ASSERT_TRUE(registry.register_plugin(make_record("Blinds"), id).ok());
    ASSERT_TRUE(registry.set_enabled(id, true).ok());
    ASSERT_TRUE(registry.remove(id).ok());

    EXPECT_EQ(changes, (std::vector<RegistryChange>{RegistryChange::REGISTERED, RegistryChange::ENABLED,
                                                   RegistryChange::REMOVED}));
    EXPECT_TRUE(enabled_seen);
}

TEST(PluginRegistryTest, LoadedPluginCannotBeRemoved) {
    PluginRegistry registry;
    std::string id;
    ASSERT_TRUE(registry.register_plugin(make_record("Sprinkler"), id).ok());
    ASSERT_TRUE(registry.set_loaded(id, true).ok());

    EXPECT_EQ(registry.remove(id).code(), ErrorCode::FAILED_PRECONDITION);
    ASSERT_TRUE(registry.set_loaded(id, false).ok());
    EXPECT_TRUE(registry.remove(id).ok());
    EXPECT_EQ(registry.remove(id).code(), ErrorCode::NOT_FOUND);
}

TEST(PluginRegistryTest, ManifestUpsertKeepsOperatorState) {
    PluginRegistry registry;

    PluginRecord manifest = make_record("Lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE});
    manifest.id = "lights";
    bool created = false;
    ASSERT_TRUE(registry.upsert_from_manifest(manifest, created).ok());
    EXPECT_TRUE(created);
    EXPECT_TRUE(registry.get("lights")->enabled);

    ASSERT_TRUE(registry.set_enabled("lights", false).ok());
    ASSERT_TRUE(registry.set_runtime_mode("lights", RuntimeMode::MICROSERVICE).ok());

    PluginRecord upgrade = manifest;
    upgrade.latest_version = "1.1.0";
    ASSERT_TRUE(registry.upsert_from_manifest(upgrade, created).ok());
    EXPECT_FALSE(created);

    auto record = registry.get("lights");
    EXPECT_EQ(record->latest_version, "1.1.0");
    EXPECT_FALSE(record->enabled);
    EXPECT_EQ(record->runtime_mode, RuntimeMode::MICROSERVICE);

    // Dropping support for the current mode falls back to the manifest default
    PluginRecord narrowed = upgrade;
    narrowed.supported_modes = {RuntimeMode::IN_PROCESS};
    narrowed.runtime_mode = RuntimeMode::IN_PROCESS;
    ASSERT_TRUE(registry.upsert_from_manifest(narrowed, created).ok());
    EXPECT_EQ(registry.get("lights")->runtime_mode, RuntimeMode::IN_PROCESS);
}

TEST(PluginRegistryTest, LoadedPluginKeepsItsModeThroughUpsert) {
    PluginRegistry registry;
    PluginRecord manifest = make_record("Lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE});
    manifest.id = "lights";
    bool created = false;
    ASSERT_TRUE(registry.upsert_from_manifest(manifest, created).ok());
    ASSERT_TRUE(registry.set_loaded("lights", true).ok());

    PluginRecord narrowed = manifest;
    narrowed.latest_version = "2.0.0";
    narrowed.supported_modes = {RuntimeMode::MICROSERVICE};
    narrowed.runtime_mode = RuntimeMode::MICROSERVICE;
    Status status = registry.upsert_from_manifest(narrowed, created);
    EXPECT_EQ(status.code(), ErrorCode::FAILED_PRECONDITION);

    auto record = registry.get("lights");
    EXPECT_EQ(record->runtime_mode, RuntimeMode::IN_PROCESS);
    EXPECT_EQ(record->latest_version, "1.0.0");
    EXPECT_TRUE(record->loaded);

    ASSERT_TRUE(registry.set_loaded("lights", false).ok());
    ASSERT_TRUE(registry.upsert_from_manifest(narrowed, created).ok());
    EXPECT_EQ(registry.get("lights")->runtime_mode, RuntimeMode::MICROSERVICE);
}

TEST(PluginRegistryTest, MutationsInvalidateCache) {
    external::InMemoryKvCache cache;
    cache.set("plugin:garage", "stale", std::chrono::seconds(0));
    cache.set("plugins:all", "stale", std::chrono::seconds(0));
    cache.set("device:garage_door", "kept", std::chrono::seconds(0));

    PluginRegistry registry(&cache);
    PluginRecord record = make_record("Garage");
    std::string id;
    ASSERT_TRUE(registry.register_plugin(record, id).ok());

    EXPECT_FALSE(cache.get("plugin:garage").has_value());
    EXPECT_FALSE(cache.get("plugins:all").has_value());
    EXPECT_TRUE(cache.get("device:garage_door").has_value());
}

TEST(PluginRegistryTest, ListIsOrderedById) {
    PluginRegistry registry;
    std::string id;
    ASSERT_TRUE(registry.register_plugin(make_record("Zigbee Bridge"), id).ok());
    ASSERT_TRUE(registry.register_plugin(make_record("Alarm"), id).ok());

    auto records = registry.list();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "alarm");
    EXPECT_EQ(records[1].id, "zigbee_bridge");
}

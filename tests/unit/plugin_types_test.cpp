#include "plugin/plugin_types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace hearth::plugin;

TEST(PluginTypesTest, RuntimeModeNames) {
    EXPECT_STREQ(runtime_mode_to_string(RuntimeMode::IN_PROCESS), "in_process");
    EXPECT_EQ(string_to_runtime_mode("in-process"), RuntimeMode::IN_PROCESS);
    EXPECT_EQ(string_to_runtime_mode("hybrid"), RuntimeMode::HYBRID);
    EXPECT_EQ(string_to_runtime_mode("embedded"), RuntimeMode::EMBEDDED);
    EXPECT_FALSE(string_to_runtime_mode("serverless").has_value());
}

TEST(PluginTypesTest, ParsesFullRecord) {
    const auto json = nlohmann::json::parse(R"({
        "id": "lights",
        "name": "Lights",
        "version": "1.2.0",
        "supported_modes": ["in_process", "microservice"],
        "mode_switch_supported": true,
        "config_schema": [{"name": "fade_ms", "type": "int64", "default": 250}],
        "entrypoint": {"command": "/opt/lights/bin/lights", "args": ["--quiet"]},
        "local_topics": ["*.device.state"],
        "sandbox": {"max_bindings": 2, "allowed_emit_prefixes": ["lights."]},
        "dependencies": [{"plugin_id": "zigbee", "version_spec": ">=2.0", "optional": true}]
    })");

    PluginRecord record;
    std::string error;
    ASSERT_TRUE(plugin_record_from_json(json, record, error)) << error;

    EXPECT_EQ(record.latest_version, "1.2.0");
    EXPECT_EQ(record.runtime_mode, RuntimeMode::IN_PROCESS);  // first supported mode
    EXPECT_TRUE(record.supports_mode(RuntimeMode::MICROSERVICE));
    EXPECT_FALSE(record.supports_mode(RuntimeMode::HYBRID));
    EXPECT_TRUE(record.mode_switch_supported);
    ASSERT_EQ(record.config_schema.fields.size(), 1u);
    EXPECT_EQ(record.entrypoint.command, "/opt/lights/bin/lights");
    EXPECT_EQ(record.entrypoint.args.size(), 1u);
    EXPECT_EQ(record.local_topics.size(), 1u);
    EXPECT_EQ(record.sandbox.max_bindings, 2u);
    EXPECT_EQ(record.sandbox.max_subscriptions, 32u);
    ASSERT_EQ(record.dependencies.size(), 1u);
    EXPECT_TRUE(record.dependencies[0].optional);
    EXPECT_EQ(record.implementation_id(), "lights");
}

TEST(PluginTypesTest, RoundTripKeepsOperatorState) {
    PluginRecord record;
    record.id = "blinds";
    record.name = "Blinds";
    record.enabled = true;
    record.implementation = "diagnostic_echo";
    record.supported_modes = {RuntimeMode::IN_PROCESS, RuntimeMode::HYBRID};
    record.runtime_mode = RuntimeMode::HYBRID;
    record.config = {{"topic", "blinds.request"}};

    PluginRecord parsed;
    std::string error;
    ASSERT_TRUE(plugin_record_from_json(plugin_record_to_json(record), parsed, error)) << error;
    EXPECT_TRUE(parsed.enabled);
    EXPECT_EQ(parsed.runtime_mode, RuntimeMode::HYBRID);
    EXPECT_EQ(parsed.implementation_id(), "diagnostic_echo");
    EXPECT_EQ(parsed.config["topic"], "blinds.request");
}

TEST(PluginTypesTest, RejectsMalformedRecords) {
    PluginRecord record;
    std::string error;
    EXPECT_FALSE(plugin_record_from_json(nlohmann::json::array(), record, error));
    EXPECT_FALSE(plugin_record_from_json({{"description", "no id"}}, record, error));
    EXPECT_FALSE(
        plugin_record_from_json({{"id", "x"}, {"supported_modes", nlohmann::json::array({"warp"})}}, record, error));
    EXPECT_FALSE(plugin_record_from_json({{"id", "x"}, {"dependencies", nlohmann::json::array({{{"optional", true}}})}},
                                         record, error));
}

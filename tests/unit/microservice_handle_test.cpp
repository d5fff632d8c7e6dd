/**
 * @file microservice_handle_test.cpp
 * @brief Out-of-process plugins driven through hearth-plugin-host
 */

#include "supervisor/microservice_handle.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "devices/binding_table.hpp"
#include "events/event_bus.hpp"
#include "graph/device_link_graph.hpp"

#ifndef HEARTH_PLUGIN_HOST_PATH
#error "HEARTH_PLUGIN_HOST_PATH must point at the hearth-plugin-host binary"
#endif

using namespace hearth;
using namespace hearth::supervisor;

namespace {

events::EventBusConfig immediate_bus() {
    events::EventBusConfig config;
    config.debounce_ms = 0;
    return config;
}

MicroserviceOptions host_options() {
    MicroserviceOptions options;
    options.host_executable = HEARTH_PLUGIN_HOST_PATH;
    options.rpc_timeout_ms = 2000;
    options.hello_timeout_ms = 2000;
    options.shutdown_timeout_ms = 1000;
    return options;
}

plugin::PluginRecord remote_record(const std::string &id, const std::string &implementation,
                                   const nlohmann::json &config = nlohmann::json::object()) {
    plugin::PluginRecord record;
    record.id = id;
    record.implementation = implementation;
    record.config = config;
    record.supported_modes = {plugin::RuntimeMode::MICROSERVICE};
    record.runtime_mode = plugin::RuntimeMode::MICROSERVICE;
    return record;
}

}  // namespace

class MicroserviceHandleTest : public ::testing::Test {
protected:
    MicroserviceHandleTest() : bus(immediate_bus()), graph(5) {
        services.bus = &bus;
        services.bindings = &bindings;
        services.graph = &graph;
    }

    // Forward pending events to the plugin, then deliver what it emitted
    void settle() {
        bus.flush_now();
        bus.flush_now();
    }

    void collect(const std::string &pattern) {
        events::SubscriptionId id = 0;
        EXPECT_TRUE(bus.subscribe(pattern, [this](const events::Event &e) { collected.push_back(e); }, id).ok());
    }

    events::EventBus bus;
    devices::BindingTable bindings;
    graph::DeviceLinkGraph graph;
    PluginServices services;
    std::vector<events::Event> collected;
};

TEST_F(MicroserviceHandleTest, EchoOverTheWire) {
    MicroserviceHandle handle(remote_record("echo", "diagnostic_echo", {{"bind", "room=lab"}}), services,
                              host_options());
    ASSERT_TRUE(handle.load(5000).ok());
    EXPECT_TRUE(handle.is_available());
    EXPECT_EQ(handle.forwarded_subscription_count(), 1u);
    EXPECT_EQ(bindings.count_for("echo"), 1u);

    collect("echo.echo.reply");
    collect("echo.echo.config");
    ASSERT_TRUE(bus.emit("echo.echo.request", {{"n", 7}}, "test").ok());
    settle();
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].topic, "echo.echo.reply");
    EXPECT_EQ(collected[0].source, "echo");
    EXPECT_EQ(collected[0].payload["payload"]["n"], 7);
    EXPECT_EQ(collected[0].payload["topic"], "echo.echo.request");

    std::string error;
    EXPECT_TRUE(handle.health_check(error)) << error;

    ASSERT_TRUE(handle.notify_config_changed({{"healthy", false}}).ok());
    bus.flush_now();
    ASSERT_EQ(collected.size(), 2u);
    EXPECT_EQ(collected[1].topic, "echo.echo.config");
    EXPECT_FALSE(handle.health_check(error));
    EXPECT_EQ(error, "Plugin reported unhealthy");

    handle.unload();
    EXPECT_FALSE(handle.is_available());
    EXPECT_EQ(handle.forwarded_subscription_count(), 0u);
    EXPECT_EQ(bindings.count_for("echo"), 0u);
    EXPECT_EQ(bus.subscriber_count(), 2u);
    EXPECT_FALSE(handle.health_check(error));
    EXPECT_EQ(handle.notify_config_changed({}).code(), ErrorCode::UNAVAILABLE);
}

TEST_F(MicroserviceHandleTest, FailedLoadTearsDown) {
    MicroserviceHandle handle(remote_record("echo", "diagnostic_echo", {{"fail_load", true}}), services,
                              host_options());
    Status status = handle.load(5000);
    EXPECT_EQ(status.code(), ErrorCode::LOAD_FAILED);
    EXPECT_NE(status.message().find("fail_load"), std::string::npos);
    EXPECT_FALSE(handle.is_available());
    EXPECT_EQ(bus.subscriber_count(), 0u);
    EXPECT_EQ(bindings.count_for("echo"), 0u);
}

TEST_F(MicroserviceHandleTest, SlowLoadTimesOut) {
    MicroserviceHandle handle(remote_record("slow", "diagnostic_echo", {{"load_delay_ms", 3000}}), services,
                              host_options());
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(handle.load(500).code(), ErrorCode::TIMEOUT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2500));
    EXPECT_FALSE(handle.is_available());
}

TEST_F(MicroserviceHandleTest, UnknownImplementationOrHost) {
    MicroserviceHandle unknown(remote_record("ghost", "no_such_plugin"), services, host_options());
    EXPECT_EQ(unknown.load(3000).code(), ErrorCode::LOAD_FAILED);

    MicroserviceOptions missing = host_options();
    missing.host_executable = "/nonexistent/hearth-plugin-host";
    MicroserviceHandle no_host(remote_record("echo", "diagnostic_echo"), services, missing);
    EXPECT_EQ(no_host.load(3000).code(), ErrorCode::LOAD_FAILED);

    MicroserviceOptions unset = host_options();
    unset.host_executable.clear();
    MicroserviceHandle no_entrypoint(remote_record("echo", "diagnostic_echo"), services, unset);
    Status status = no_entrypoint.load(3000);
    EXPECT_EQ(status.code(), ErrorCode::LOAD_FAILED);
    EXPECT_NE(status.message().find("no entrypoint"), std::string::npos);
}

TEST_F(MicroserviceHandleTest, LocalPatternsAreNotForwarded) {
    MicroserviceHandle handle(remote_record("climate", "diagnostic_echo"), services, host_options(),
                              {"*.echo.request"});
    ASSERT_TRUE(handle.load(5000).ok());
    EXPECT_EQ(handle.forwarded_subscription_count(), 0u);
    EXPECT_EQ(bus.subscriber_count(), 0u);
    handle.unload();
}

TEST_F(MicroserviceHandleTest, LinkChangesReachThePlugin) {
    ASSERT_TRUE(graph.add_link("lamp", "bulb", graph::LinkType::MIRROR, graph::LinkDirection::BIDIRECTIONAL).ok());

    MicroserviceHandle handle(remote_record("mirror", "link_mirror"), services, host_options());
    ASSERT_TRUE(handle.load(5000).ok());
    collect("mirror.apply.*");

    ASSERT_TRUE(bus.emit("hub.device.state", {{"device_id", "lamp"}, {"on", true}}, "test").ok());
    settle();
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].topic, "mirror.apply.bulb");
    EXPECT_EQ(collected[0].payload["origin"], "lamp");

    // A link added after load travels with the next delivery
    ASSERT_TRUE(graph.add_link("lamp", "strip", graph::LinkType::SYNC, graph::LinkDirection::UNIDIRECTIONAL).ok());
    collected.clear();
    ASSERT_TRUE(bus.emit("hub.device.state", {{"device_id", "lamp"}, {"on", false}}, "test").ok());
    settle();

    std::vector<std::string> topics;
    for (const auto &event : collected) {
        topics.push_back(event.topic);
    }
    std::sort(topics.begin(), topics.end());
    EXPECT_EQ(topics, (std::vector<std::string>{"mirror.apply.bulb", "mirror.apply.strip"}));
    handle.unload();
}

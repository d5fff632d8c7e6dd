/**
 * @file plugin_context_test.cpp
 * @brief Local, sandboxed, hybrid-shim and remote plugin contexts
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "devices/binding_table.hpp"
#include "events/event_bus.hpp"
#include "external/kv_cache.hpp"
#include "external/token_service.hpp"
#include "graph/device_link_graph.hpp"
#include "host/remote_context.hpp"
#include "supervisor/local_context.hpp"
#include "supervisor/scoped_contexts.hpp"

using namespace hearth;
using namespace hearth::supervisor;

namespace {

events::EventBusConfig immediate_bus() {
    events::EventBusConfig config;
    config.debounce_ms = 0;
    return config;
}

class ContextTest : public ::testing::Test {
protected:
    ContextTest() : bus(immediate_bus()), graph(5) {
        services.bus = &bus;
        services.bindings = &bindings;
        services.graph = &graph;
        services.tokens = &tokens;
        services.cache = &cache;
    }

    std::shared_ptr<LocalPluginContext> make_context(const std::string &plugin_id) {
        return std::make_shared<LocalPluginContext>(plugin_id, nlohmann::json{{"scene", "evening"}}, services);
    }

    events::EventBus bus;
    devices::BindingTable bindings;
    graph::DeviceLinkGraph graph;
    external::InMemoryTokenService tokens;
    external::InMemoryKvCache cache;
    PluginServices services;
};

}  // namespace

TEST_F(ContextTest, LocalContextTracksRegistrations) {
    auto context = make_context("lights");
    EXPECT_EQ(context->config()["scene"], "evening");
    EXPECT_EQ(context->tokens(), &tokens);

    std::vector<std::string> received;
    events::SubscriptionId id = 0;
    ASSERT_TRUE(context->subscribe_event("device.*.updated",
                                         [&](const events::Event &e) { received.push_back(e.topic); }, id)
                    .ok());
    ASSERT_TRUE(context->bind_devices("room=kitchen").ok());
    ASSERT_TRUE(context->bind_devices("room=hall").ok());
    EXPECT_EQ(context->subscription_count(), 1u);
    EXPECT_EQ(context->binding_count(), 2u);
    EXPECT_EQ(bindings.count_for("lights"), 2u);

    ASSERT_TRUE(context->emit_event("lights.status", {{"on", true}}).ok());
    ASSERT_TRUE(bus.emit("device.lamp.updated", {}).ok());
    bus.flush_now();
    EXPECT_EQ(received, std::vector<std::string>{"device.lamp.updated"});

    ASSERT_TRUE(context->unbind_devices("room=hall").ok());
    EXPECT_EQ(context->unbind_devices("room=hall").code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(context->binding_count(), 1u);
    EXPECT_EQ(context->unsubscribe_event(id + 100).code(), ErrorCode::NOT_FOUND);
}

TEST_F(ContextTest, RevokeReleasesEverythingAndRejectsCalls) {
    auto context = make_context("lights");
    events::SubscriptionId id = 0;
    ASSERT_TRUE(context->subscribe_event("lights.*", [](const events::Event &) {}, id).ok());
    ASSERT_TRUE(context->bind_devices("kind=lamp").ok());
    EXPECT_EQ(bus.subscriber_count(), 1u);

    context->revoke();
    EXPECT_TRUE(context->revoked());
    EXPECT_EQ(bus.subscriber_count(), 0u);
    EXPECT_EQ(bindings.count_for("lights"), 0u);

    EXPECT_EQ(context->subscribe_event("lights.*", [](const events::Event &) {}, id).code(),
              ErrorCode::UNAVAILABLE);
    EXPECT_EQ(context->emit_event("lights.status", {}).code(), ErrorCode::UNAVAILABLE);
    EXPECT_EQ(context->bind_devices("kind=lamp").code(), ErrorCode::UNAVAILABLE);
    EXPECT_EQ(context->tokens(), nullptr);
    EXPECT_EQ(context->cache(), nullptr);

    // Idempotent
    context->revoke();
}

TEST_F(ContextTest, SandboxEnforcesPolicy) {
    plugin::SandboxPolicy policy;
    policy.max_bindings = 1;
    policy.max_subscriptions = 1;
    policy.max_emits_per_second = 2;
    auto inner = make_context("widget");
    SandboxedContext sandbox(inner, policy);

    EXPECT_EQ(sandbox.tokens(), nullptr);
    EXPECT_EQ(sandbox.cache(), nullptr);

    events::SubscriptionId id = 0;
    ASSERT_TRUE(sandbox.subscribe_event("widget.*", [](const events::Event &) {}, id).ok());
    EXPECT_EQ(sandbox.subscribe_event("device.*.updated", [](const events::Event &) {}, id).code(),
              ErrorCode::FAILED_PRECONDITION);

    ASSERT_TRUE(sandbox.bind_devices("kind=widget").ok());
    EXPECT_EQ(sandbox.bind_devices("kind=lamp").code(), ErrorCode::FAILED_PRECONDITION);

    // Default prefix is the plugin's own namespace
    EXPECT_EQ(sandbox.emit_event("lights.on", {}).code(), ErrorCode::FAILED_PRECONDITION);
    EXPECT_TRUE(sandbox.emit_event("widget.tick", {}).ok());
    EXPECT_TRUE(sandbox.emit_event("widget.tick", {}).ok());
    EXPECT_EQ(sandbox.emit_event("widget.tick", {}).code(), ErrorCode::FAILED_PRECONDITION);
}

TEST_F(ContextTest, SandboxHonorsExplicitPrefixes) {
    plugin::SandboxPolicy policy;
    policy.allowed_emit_prefixes = {"scene."};
    policy.max_emits_per_second = 0;
    SandboxedContext sandbox(make_context("widget"), policy);

    EXPECT_TRUE(sandbox.emit_event("scene.activated", {}).ok());
    EXPECT_EQ(sandbox.emit_event("widget.tick", {}).code(), ErrorCode::FAILED_PRECONDITION);
}

TEST_F(ContextTest, HybridShimServesOnlyLocalTopics) {
    auto inner = make_context("climate");
    HybridShimContext shim(inner, {"device.*.updated"});

    EXPECT_TRUE(shim.is_local("device.*.updated"));
    EXPECT_FALSE(shim.is_local("climate.*"));

    events::SubscriptionId local_id = 0;
    events::SubscriptionId remote_id = 0;
    ASSERT_TRUE(shim.subscribe_event("device.*.updated", [](const events::Event &) {}, local_id).ok());
    ASSERT_TRUE(shim.subscribe_event("climate.*", [](const events::Event &) {}, remote_id).ok());
    EXPECT_NE(local_id, 0u);
    EXPECT_EQ(remote_id, 0u);
    EXPECT_EQ(inner->subscription_count(), 1u);

    // Bindings belong to the microservice half
    ASSERT_TRUE(shim.bind_devices("kind=thermostat").ok());
    EXPECT_EQ(bindings.count_for("climate"), 0u);

    EXPECT_TRUE(shim.unsubscribe_event(remote_id).ok());
    EXPECT_TRUE(shim.unsubscribe_event(local_id).ok());
    EXPECT_EQ(inner->subscription_count(), 0u);
}

TEST(RemotePluginContextTest, RecordsEffectsUntilTaken) {
    host::RemotePluginContext context("lights", {{"brightness", 40}});

    events::SubscriptionId id = 0;
    ASSERT_TRUE(context.subscribe_event("device.*.updated", [](const events::Event &) {}, id).ok());
    ASSERT_TRUE(context.bind_devices("room=kitchen").ok());
    ASSERT_TRUE(context.emit_event("lights.ready", {{"count", 2}}).ok());

    EXPECT_EQ(context.subscribe_event("device..bad", [](const events::Event &) {}, id).code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(context.emit_event("lights.*", {}).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(context.bind_devices("kitchen").code(), ErrorCode::INVALID_ARGUMENT);

    transport::v1::Effects effects;
    context.take_effects(&effects);
    ASSERT_EQ(effects.subscribe_size(), 1);
    EXPECT_EQ(effects.subscribe(0).pattern(), "device.*.updated");
    EXPECT_EQ(effects.subscribe(0).subscription_id(), id);
    ASSERT_EQ(effects.bind_size(), 1);
    ASSERT_EQ(effects.emit_size(), 1);
    EXPECT_EQ(nlohmann::json::parse(effects.emit(0).payload_json())["count"], 2);

    transport::v1::Effects empty;
    context.take_effects(&empty);
    EXPECT_EQ(empty.subscribe_size() + empty.bind_size() + empty.emit_size(), 0);

    context.release_all();
    transport::v1::Effects released;
    context.take_effects(&released);
    EXPECT_EQ(released.unsubscribe_size(), 1);
    EXPECT_EQ(released.unbind_size(), 1);
    EXPECT_EQ(context.subscription_count(), 0u);
}

TEST(RemotePluginContextTest, DispatchCountsHandlerFailures) {
    host::RemotePluginContext context("lights", nlohmann::json::object());

    std::vector<std::string> seen;
    events::SubscriptionId id = 0;
    ASSERT_TRUE(context
                    .subscribe_event("lights.*",
                                     [&](const events::Event &e) {
                                         if (e.topic == "lights.bad") {
                                             throw std::runtime_error("bad event");
                                         }
                                         seen.push_back(e.topic);
                                     },
                                     id)
                    .ok());

    std::vector<events::Event> batch = {events::Event::create("lights.on", {}, "test"),
                                        events::Event::create("lights.bad", {}, "test"),
                                        events::Event::create("lights.off", {}, "test")};
    EXPECT_EQ(context.dispatch(id, batch), 1);
    EXPECT_EQ(seen, (std::vector<std::string>{"lights.on", "lights.off"}));

    // Unknown subscription: nothing runs
    EXPECT_EQ(context.dispatch(id + 1, batch), 0);
}

TEST(RemotePluginContextTest, AnswersRelatedDevicesFromLinkSnapshot) {
    host::RemotePluginContext context("lights", nlohmann::json::object());
    EXPECT_TRUE(context.related_devices("switch").empty());

    transport::v1::LinkSet links;
    links.set_revision(3);
    auto *link = links.add_links();
    link->set_from("switch");
    link->set_to("lamp");
    link->set_link_type("bridge");
    link->set_direction("bidirectional");
    context.apply_links(links);

    auto related = context.related_devices("lamp");
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].device_id, "switch");
    EXPECT_EQ(related[0].depth, 1);
}

/**
 * @file plugin_supervisor_test.cpp
 * @brief PluginSupervisor state machine against scripted handles
 */

#include "supervisor/plugin_supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include "events/event_bus.hpp"
#include "mocks/mock_plugin_handle.hpp"
#include "registry/plugin_registry.hpp"

using namespace hearth;
using namespace hearth::supervisor;
using hearth::tests::MockPluginHandle;
using hearth::tests::ScriptedHandleFactory;
using plugin::RuntimeMode;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

events::EventBusConfig immediate_bus() {
    events::EventBusConfig config;
    config.debounce_ms = 0;
    return config;
}

SupervisorConfig test_config() {
    SupervisorConfig config;
    config.load_timeout_ms = 1000;
    config.health_interval_ms = 0;
    config.health_failure_threshold = 2;
    return config;
}

void loads_ok(MockPluginHandle &handle) {
    ON_CALL(handle, load(_)).WillByDefault(Return(Status::success()));
    ON_CALL(handle, health_check(_)).WillByDefault(Return(true));
    ON_CALL(handle, notify_config_changed(_)).WillByDefault(Return(Status::success()));
}

}  // namespace

class PluginSupervisorTest : public ::testing::Test {
protected:
    PluginSupervisorTest() : bus(immediate_bus()) {
        events::SubscriptionId id = 0;
        auto record_event = [this](const events::Event &e) { topics.push_back(e.topic); };
        EXPECT_TRUE(bus.subscribe("plugin.*", record_event, id).ok());
        EXPECT_TRUE(bus.subscribe("plugin.*.*", record_event, id).ok());
    }

    void SetUp() override {
        supervisor = std::make_unique<PluginSupervisor>(registry, factory, locks, &bus, test_config());
    }

    void TearDown() override { supervisor->stop(); }

    void add_plugin(const std::string &id, std::vector<RuntimeMode> modes = {RuntimeMode::IN_PROCESS},
                    bool switchable = false, bool enabled = true) {
        plugin::PluginRecord record;
        record.id = id;
        record.latest_version = "1.0.0";
        record.enabled = enabled;
        record.supported_modes = modes;
        record.runtime_mode = modes.front();
        record.mode_switch_supported = switchable;
        std::string registered;
        ASSERT_TRUE(registry.register_plugin(record, registered).ok());
    }

    // Records every registry change; the callback outlives the test body
    void watch_registry() {
        registry.on_change([this](registry::RegistryChange change, const plugin::PluginRecord &record) {
            registry_changes.emplace_back(change, record.loaded);
        });
    }

    std::vector<bool> loaded_writes() const {
        std::vector<bool> values;
        for (const auto &[change, loaded] : registry_changes) {
            if (change == registry::RegistryChange::LOADED) {
                values.push_back(loaded);
            }
        }
        return values;
    }

    std::vector<std::string> drain_topics() {
        bus.flush_now();
        auto result = topics;
        topics.clear();
        return result;
    }

    events::EventBus bus;
    registry::PluginRegistry registry;
    KeyedMutex locks;
    ScriptedHandleFactory factory;
    std::unique_ptr<PluginSupervisor> supervisor;
    std::vector<std::string> topics;
    std::vector<std::pair<registry::RegistryChange, bool>> registry_changes;
};

TEST_F(PluginSupervisorTest, LoadAndUnload) {
    add_plugin("lights");
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, load(1000)).Times(1);
        EXPECT_CALL(handle, unload()).Times(1);
    });

    ASSERT_TRUE(supervisor->load("lights").ok());
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
    EXPECT_TRUE(supervisor->is_loaded("lights"));
    EXPECT_TRUE(registry.get("lights")->loaded);
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.loaded"});

    // Already loaded under the same mode
    ASSERT_TRUE(supervisor->load("lights").ok());
    EXPECT_EQ(factory.created_modes.size(), 1u);

    auto snapshot = supervisor->get_snapshot("lights");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->mode, RuntimeMode::IN_PROCESS);
    EXPECT_TRUE(snapshot->available);

    ASSERT_TRUE(supervisor->unload("lights").ok());
    EXPECT_EQ(supervisor->state("lights"), InstanceState::UNLOADED);
    EXPECT_FALSE(registry.get("lights")->loaded);
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.unloaded"});

    EXPECT_TRUE(supervisor->unload("lights").ok());
    EXPECT_EQ(supervisor->unload("ghost").code(), ErrorCode::NOT_FOUND);
}

TEST_F(PluginSupervisorTest, LoadPreconditions) {
    add_plugin("lights", {RuntimeMode::IN_PROCESS}, false, false);
    factory.on_create(RuntimeMode::IN_PROCESS, loads_ok);

    EXPECT_EQ(supervisor->load("ghost").code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(supervisor->load("lights").code(), ErrorCode::FAILED_PRECONDITION);
    EXPECT_TRUE(factory.created_modes.empty());
}

TEST_F(PluginSupervisorTest, FailedLoadIsErroredAndNotRetried) {
    add_plugin("lights");
    auto attempts = std::make_shared<int>(0);
    factory.on_create(RuntimeMode::IN_PROCESS, [attempts](MockPluginHandle &handle) {
        loads_ok(handle);
        if ((*attempts)++ == 0) {
            EXPECT_CALL(handle, load(_)).WillOnce(Return(Status::error(ErrorCode::TIMEOUT, "on_load too slow")));
            EXPECT_CALL(handle, unload()).Times(0);
        }
    });

    EXPECT_EQ(supervisor->load("lights").code(), ErrorCode::TIMEOUT);
    EXPECT_EQ(supervisor->state("lights"), InstanceState::ERRORED);
    EXPECT_FALSE(supervisor->is_loaded("lights"));
    EXPECT_FALSE(registry.get("lights")->loaded);
    EXPECT_EQ(supervisor->get_snapshot("lights")->last_error, "on_load too slow");
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.load.failed"});
    EXPECT_EQ(*attempts, 1);

    // An explicit load replaces the errored instance
    ASSERT_TRUE(supervisor->load("lights").ok());
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
}

TEST_F(PluginSupervisorTest, UnservableModeFailsLoad) {
    add_plugin("widget", {RuntimeMode::EMBEDDED});

    Status status = supervisor->load("widget");
    EXPECT_EQ(status.code(), ErrorCode::LOAD_FAILED);
    EXPECT_NE(status.message().find("embedded"), std::string::npos);
    EXPECT_EQ(supervisor->state("widget"), InstanceState::ERRORED);
}

TEST_F(PluginSupervisorTest, SwitchModeMovesLoadedPlugin) {
    add_plugin("lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, true);
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, unload()).Times(1);
    });
    factory.on_create(RuntimeMode::MICROSERVICE, loads_ok);

    ASSERT_TRUE(supervisor->load("lights").ok());
    drain_topics();

    ASSERT_TRUE(supervisor->switch_mode("lights", RuntimeMode::MICROSERVICE).ok());
    EXPECT_EQ(factory.created_modes, (std::vector<RuntimeMode>{RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}));
    EXPECT_EQ(registry.get("lights")->runtime_mode, RuntimeMode::MICROSERVICE);
    EXPECT_EQ(supervisor->get_snapshot("lights")->mode, RuntimeMode::MICROSERVICE);
    EXPECT_TRUE(registry.get("lights")->loaded);

    auto seen = drain_topics();
    EXPECT_NE(std::find(seen.begin(), seen.end(), "plugin.mode.changed"), seen.end());

    // Same mode again is a no-op
    ASSERT_TRUE(supervisor->switch_mode("lights", RuntimeMode::MICROSERVICE).ok());
    EXPECT_EQ(factory.created_modes.size(), 2u);
}

TEST_F(PluginSupervisorTest, FailedSwitchRollsBack) {
    add_plugin("lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, true);
    factory.on_create(RuntimeMode::IN_PROCESS, loads_ok);
    factory.on_create(RuntimeMode::MICROSERVICE, [](MockPluginHandle &handle) {
        EXPECT_CALL(handle, load(_))
            .WillOnce(Return(Status::error(ErrorCode::LOAD_FAILED, "plugin host exited with code 3")));
    });

    ASSERT_TRUE(supervisor->load("lights").ok());

    Status status = supervisor->switch_mode("lights", RuntimeMode::MICROSERVICE);
    EXPECT_EQ(status.code(), ErrorCode::SWITCH_FAILED);
    EXPECT_NE(status.message().find("still running as in_process"), std::string::npos);

    EXPECT_EQ(factory.created_modes,
              (std::vector<RuntimeMode>{RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE, RuntimeMode::IN_PROCESS}));
    EXPECT_EQ(registry.get("lights")->runtime_mode, RuntimeMode::IN_PROCESS);
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
    EXPECT_TRUE(registry.get("lights")->loaded);
}

TEST_F(PluginSupervisorTest, RegistryKeepsLoadedFlagThroughSwitch) {
    add_plugin("lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, true);
    factory.on_create(RuntimeMode::IN_PROCESS, loads_ok);

    std::vector<bool> loaded_seen_mid_switch;
    factory.on_create(RuntimeMode::MICROSERVICE, [this, &loaded_seen_mid_switch](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, load(_)).WillOnce(Invoke([this, &loaded_seen_mid_switch](int) {
            loaded_seen_mid_switch.push_back(registry.get("lights")->loaded);
            return Status::success();
        }));
    });
    ASSERT_TRUE(supervisor->load("lights").ok());

    watch_registry();

    ASSERT_TRUE(supervisor->switch_mode("lights", RuntimeMode::MICROSERVICE).ok());
    EXPECT_EQ(loaded_seen_mid_switch, std::vector<bool>{true});
    ASSERT_EQ(registry_changes.size(), 1u);
    EXPECT_EQ(registry_changes[0].first, registry::RegistryChange::MODE);
    EXPECT_TRUE(registry_changes[0].second);
}

TEST_F(PluginSupervisorTest, FailedRollbackMarksPluginUnloaded) {
    add_plugin("lights", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, true);
    int in_process_loads = 0;
    factory.on_create(RuntimeMode::IN_PROCESS, [&in_process_loads](MockPluginHandle &handle) {
        loads_ok(handle);
        if (++in_process_loads > 1) {
            EXPECT_CALL(handle, load(_)).WillOnce(Return(Status::error(ErrorCode::LOAD_FAILED, "port in use")));
        }
    });
    factory.on_create(RuntimeMode::MICROSERVICE, [](MockPluginHandle &handle) {
        EXPECT_CALL(handle, load(_)).WillOnce(Return(Status::error(ErrorCode::LOAD_FAILED, "no host binary")));
    });
    ASSERT_TRUE(supervisor->load("lights").ok());

    watch_registry();

    Status status = supervisor->switch_mode("lights", RuntimeMode::MICROSERVICE);
    EXPECT_EQ(status.code(), ErrorCode::SWITCH_FAILED);
    EXPECT_NE(status.message().find("rollback to in_process failed"), std::string::npos);
    EXPECT_EQ(loaded_writes(), std::vector<bool>{false});
    EXPECT_FALSE(registry.get("lights")->loaded);
    EXPECT_FALSE(supervisor->is_loaded("lights"));
}

TEST_F(PluginSupervisorTest, SwitchModeValidation) {
    add_plugin("fixed", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, false);
    add_plugin("flexible", {RuntimeMode::IN_PROCESS, RuntimeMode::MICROSERVICE}, true);

    EXPECT_EQ(supervisor->switch_mode("ghost", RuntimeMode::MICROSERVICE).code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(supervisor->switch_mode("fixed", RuntimeMode::MICROSERVICE).code(), ErrorCode::UNSUPPORTED_MODE);
    EXPECT_EQ(supervisor->switch_mode("flexible", RuntimeMode::HYBRID).code(), ErrorCode::UNSUPPORTED_MODE);

    // Not loaded: only the registry changes
    ASSERT_TRUE(supervisor->switch_mode("flexible", RuntimeMode::MICROSERVICE).ok());
    EXPECT_EQ(registry.get("flexible")->runtime_mode, RuntimeMode::MICROSERVICE);
    EXPECT_TRUE(factory.created_modes.empty());
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.mode.changed"});
}

TEST_F(PluginSupervisorTest, DependenciesMustBeLoaded) {
    add_plugin("lights");
    plugin::PluginRecord scenes;
    scenes.id = "scenes";
    scenes.enabled = true;
    plugin::Dependency dep;
    dep.plugin_id = "lights";
    dep.version_spec = ">=1.0,<2.0";
    scenes.dependencies.push_back(dep);
    plugin::Dependency presence;
    presence.plugin_id = "presence";
    presence.optional = true;
    scenes.dependencies.push_back(presence);
    std::string id;
    ASSERT_TRUE(registry.register_plugin(scenes, id).ok());
    factory.on_create(RuntimeMode::IN_PROCESS, loads_ok);

    Status status = supervisor->load("scenes");
    EXPECT_EQ(status.code(), ErrorCode::FAILED_PRECONDITION);
    EXPECT_NE(status.message().find("'lights'"), std::string::npos);

    ASSERT_TRUE(supervisor->load("lights").ok());
    ASSERT_TRUE(supervisor->load("scenes").ok());
}

TEST_F(PluginSupervisorTest, DependencyVersionIsChecked) {
    add_plugin("lights");
    plugin::PluginRecord scenes;
    scenes.id = "scenes";
    scenes.enabled = true;
    plugin::Dependency dep;
    dep.plugin_id = "lights";
    dep.version_spec = ">=2.0";
    scenes.dependencies.push_back(dep);
    std::string id;
    ASSERT_TRUE(registry.register_plugin(scenes, id).ok());
    factory.on_create(RuntimeMode::IN_PROCESS, loads_ok);

    ASSERT_TRUE(supervisor->load("lights").ok());
    Status status = supervisor->load("scenes");
    EXPECT_EQ(status.code(), ErrorCode::FAILED_PRECONDITION);
    EXPECT_NE(status.message().find(">=2.0"), std::string::npos);
}

TEST_F(PluginSupervisorTest, HealthThresholdAndRecovery) {
    add_plugin("lights");
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, health_check(_))
            .WillOnce(DoAll(SetArgReferee<0>(std::string("bridge offline")), Return(false)))
            .WillOnce(DoAll(SetArgReferee<0>(std::string("bridge offline")), Return(false)))
            .WillOnce(Return(true));
    });
    ASSERT_TRUE(supervisor->load("lights").ok());
    drain_topics();

    supervisor->run_health_checks();
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
    EXPECT_EQ(supervisor->get_snapshot("lights")->consecutive_health_failures, 1);
    EXPECT_TRUE(drain_topics().empty());

    supervisor->run_health_checks();
    EXPECT_EQ(supervisor->state("lights"), InstanceState::ERRORED);
    EXPECT_EQ(supervisor->get_snapshot("lights")->last_error, "bridge offline");
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.health.failed"});

    // Still running while errored
    EXPECT_TRUE(supervisor->is_loaded("lights"));

    supervisor->run_health_checks();
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
    EXPECT_EQ(drain_topics(), std::vector<std::string>{"plugin.health.recovered"});
}

TEST_F(PluginSupervisorTest, ReloadCreatesFreshInstance) {
    add_plugin("lights");
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, unload()).Times(1);
    });
    ASSERT_TRUE(supervisor->load("lights").ok());

    watch_registry();

    ASSERT_TRUE(supervisor->reload("lights").ok());
    EXPECT_EQ(factory.created_modes.size(), 2u);
    EXPECT_EQ(supervisor->state("lights"), InstanceState::LOADED);
    EXPECT_TRUE(loaded_writes().empty());
    EXPECT_TRUE(registry.get("lights")->loaded);
}

TEST_F(PluginSupervisorTest, ConfigChangeReachesLoadedInstance) {
    add_plugin("lights");
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, notify_config_changed(nlohmann::json{{"brightness", 30}})).Times(1);
    });

    // Not loaded yet: accepted without a handle
    ASSERT_TRUE(supervisor->notify_config_changed("lights").ok());

    ASSERT_TRUE(supervisor->load("lights").ok());
    ASSERT_TRUE(registry.set_config("lights", {{"brightness", 30}}).ok());
    ASSERT_TRUE(supervisor->notify_config_changed("lights").ok());
    EXPECT_EQ(supervisor->notify_config_changed("ghost").code(), ErrorCode::NOT_FOUND);
}

TEST_F(PluginSupervisorTest, UnloadCancelsInFlightLoad) {
    add_plugin("lights");
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    factory.on_create(RuntimeMode::IN_PROCESS, [cancelled](MockPluginHandle &handle) {
        ON_CALL(handle, cancel()).WillByDefault(Invoke([cancelled] { cancelled->store(true); }));
        ON_CALL(handle, load(_)).WillByDefault(Invoke([cancelled](int timeout_ms) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            while (!cancelled->load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return cancelled->load() ? Status::error(ErrorCode::UNAVAILABLE, "cancelled")
                                     : Status::error(ErrorCode::TIMEOUT, "too slow");
        }));
    });

    Status load_status;
    std::thread loader([&] { load_status = supervisor->load("lights"); });
    while (supervisor->state("lights") != InstanceState::LOADING) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    ASSERT_TRUE(supervisor->unload("lights").ok());
    loader.join();

    EXPECT_EQ(load_status.code(), ErrorCode::UNAVAILABLE);
    EXPECT_EQ(supervisor->state("lights"), InstanceState::UNLOADED);
    EXPECT_FALSE(registry.get("lights")->loaded);
}

TEST_F(PluginSupervisorTest, StopUnloadsEverything) {
    add_plugin("lights");
    add_plugin("scenes");
    factory.on_create(RuntimeMode::IN_PROCESS, [](MockPluginHandle &handle) {
        loads_ok(handle);
        EXPECT_CALL(handle, unload()).Times(1);
    });
    ASSERT_TRUE(supervisor->load("lights").ok());
    ASSERT_TRUE(supervisor->load("scenes").ok());

    supervisor->stop();
    EXPECT_FALSE(registry.get("lights")->loaded);
    EXPECT_FALSE(registry.get("scenes")->loaded);
    EXPECT_EQ(supervisor->snapshots().size(), 2u);
}

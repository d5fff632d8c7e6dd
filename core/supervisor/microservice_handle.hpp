#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "events/event_types.hpp"
#include "plugin_handle.hpp"
#include "plugin_process.hpp"
#include "transport/protocol_codec.hpp"

namespace hearth {
namespace supervisor {

struct MicroserviceOptions {
    std::string host_executable;  // used for records without an entrypoint
    int rpc_timeout_ms = 5000;
    int hello_timeout_ms = 5000;
    int shutdown_timeout_ms = 2000;
};

// MicroserviceHandle drives a plugin running in a child process
// over the framed protobuf protocol (plugin_protocol.proto).
//
// Load: spawn -> Hello -> WaitReady (if advertised) -> Load, all inside the
// load deadline. Any failure shuts the process down (EOF, then SIGKILL)
// and releases whatever was registered before returning.
//
// Effects returned by the plugin are applied here: subscriptions become bus
// subscriptions whose batches are forwarded with DeliverEvents, bindings go
// to the binding table, emitted events go to the bus with the plugin id as
// source. The current link set travels with every request that follows a
// graph change.
class MicroserviceHandle : public IPluginHandle {
public:
    // local_patterns: subscriptions served by a hybrid shim, never forwarded
    MicroserviceHandle(const plugin::PluginRecord &record, const PluginServices &services,
                       const MicroserviceOptions &options, const std::vector<std::string> &local_patterns = {});
    ~MicroserviceHandle() override;

    MicroserviceHandle(const MicroserviceHandle &) = delete;
    MicroserviceHandle &operator=(const MicroserviceHandle &) = delete;

    const std::string &plugin_id() const override { return record_.id; }
    plugin::RuntimeMode mode() const override { return plugin::RuntimeMode::MICROSERVICE; }

    Status load(int timeout_ms) override;
    void cancel() override { cancelled_.store(true); }
    void unload() override;
    bool health_check(std::string &error) override;
    Status notify_config_changed(const nlohmann::json &config) override;
    bool is_available() const override;

    size_t forwarded_subscription_count() const;

private:
    Status fail_load(const std::string &error, std::chrono::steady_clock::time_point deadline);

    // Send request and wait for response (serialized by rpc_mutex_)
    bool send_request(transport::v1::Request &request, transport::v1::Response &response, int timeout_ms,
                      std::string &error);
    bool wait_for_response(transport::v1::Response &response, uint64_t expected_request_id, int timeout_ms,
                           std::string &error);

    // Fills the link set if the graph changed since it was last shipped
    bool attach_links(transport::v1::LinkSet *links, uint64_t &revision) const;
    void links_shipped(uint64_t revision) { shipped_revision_.store(revision); }

    void apply_effects(const transport::v1::Effects &effects);
    void deliver(uint64_t remote_subscription_id, const std::vector<events::Event> &batch);

    // Stop accepting effects and drop bus subscriptions. Waits for in-flight deliveries.
    void release_subscriptions();
    void release_bindings();

    static constexpr uint64_t kNothingShipped = ~uint64_t{0};

    const plugin::PluginRecord record_;
    const PluginServices services_;
    const MicroserviceOptions options_;
    const std::vector<std::string> local_patterns_;

    std::unique_ptr<PluginProcess> process_;

    std::mutex rpc_mutex_;
    std::atomic<uint64_t> next_request_id_{1};
    std::atomic<bool> session_healthy_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> shipped_revision_{kNothingShipped};

    mutable std::mutex state_mutex_;
    bool accepting_ = false;                                // effects and deliveries accepted
    std::map<uint64_t, events::SubscriptionId> forwarded_;  // remote id -> bus id
};

}  // namespace supervisor
}  // namespace hearth

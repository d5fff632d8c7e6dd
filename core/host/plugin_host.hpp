#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "plugin/plugin_factory.hpp"
#include "remote_context.hpp"
#include "transport/framed_channel.hpp"
#include "transport/protocol_codec.hpp"

namespace hearth {
namespace host {

/**
 * @brief Serves one plugin over the framed protobuf protocol
 *
 * Requests are handled strictly in order, one response per request, on the
 * calling thread. The plugin's effects (subscriptions, bindings, emitted
 * events) are returned with the response that caused them.
 *
 * run() returns when the orchestrator closes the channel; a loaded plugin is
 * unloaded first.
 */
class PluginHost {
public:
    PluginHost(const plugin::PluginFactoryTable &factories, const std::string &implementation_id,
               transport::FramedChannel &channel);

    // Exit code: 0 on clean EOF, 1 on a transport or protocol error
    int run();

    // Handle one request (exposed for tests)
    void handle(const transport::v1::Request &request, transport::v1::Response &response);

    bool loaded() const { return plugin_ != nullptr; }

private:
    Status handle_hello(const transport::v1::HelloRequest &request, transport::v1::HelloResponse *response);
    Status handle_load(const transport::v1::LoadRequest &request, transport::v1::LoadResponse *response);
    Status handle_unload(transport::v1::UnloadResponse *response);
    Status handle_deliver(const transport::v1::DeliverEventsRequest &request,
                          transport::v1::DeliverEventsResponse *response);
    Status handle_config_changed(const transport::v1::ConfigChangedRequest &request,
                                 transport::v1::ConfigChangedResponse *response);

    // Runs on_unload and records the release of everything still registered
    void unload_plugin(transport::v1::Effects *effects);

    const plugin::PluginFactoryTable &factories_;
    const std::string implementation_id_;
    transport::FramedChannel &channel_;
    const std::chrono::steady_clock::time_point started_;

    std::string plugin_id_;
    std::unique_ptr<plugin::IPlugin> plugin_;
    std::unique_ptr<RemotePluginContext> context_;
};

}  // namespace host
}  // namespace hearth

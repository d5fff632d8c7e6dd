#include "plugin_host.hpp"

#include "logging/logger.hpp"

namespace hearth {
namespace host {

namespace v1 = transport::v1;

namespace {

constexpr const char *kHostVersion = "0.1.0";

}  // namespace

PluginHost::PluginHost(const plugin::PluginFactoryTable &factories, const std::string &implementation_id,
                       transport::FramedChannel &channel)
    : factories_(factories),
      implementation_id_(implementation_id),
      channel_(channel),
      started_(std::chrono::steady_clock::now()) {}

int PluginHost::run() {
    LOG_INFO("[PluginHost] Serving '" << implementation_id_ << "'");

    int exit_code = 0;
    std::vector<uint8_t> frame;
    while (true) {
        if (!channel_.read_frame(frame)) {
            if (!channel_.last_error().empty()) {
                LOG_ERROR("[PluginHost] Read failed: " << channel_.last_error());
                exit_code = 1;
            }
            break;
        }

        v1::Request request;
        if (!request.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
            LOG_ERROR("[PluginHost] Malformed request frame (" << frame.size() << " bytes)");
            exit_code = 1;
            break;
        }

        v1::Response response;
        handle(request, response);

        std::string serialized;
        if (!response.SerializeToString(&serialized) || !channel_.write_frame(serialized)) {
            LOG_ERROR("[PluginHost] Write failed: " << channel_.last_error());
            exit_code = 1;
            break;
        }
    }

    v1::Effects discarded;
    unload_plugin(&discarded);
    LOG_INFO("[PluginHost] Exiting (" << exit_code << ")");
    return exit_code;
}

void PluginHost::handle(const v1::Request &request, v1::Response &response) {
    response.set_request_id(request.request_id());

    Status status;
    try {
        switch (request.kind_case()) {
            case v1::Request::kHello:
                status = handle_hello(request.hello(), response.mutable_hello());
                break;
            case v1::Request::kWaitReady: {
                auto *ready = response.mutable_wait_ready();
                const auto init_ms =
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_)
                        .count();
                (*ready->mutable_diagnostics())["init_time_ms"] = std::to_string(init_ms);
                (*ready->mutable_diagnostics())["implementation"] = implementation_id_;
                break;
            }
            case v1::Request::kLoad:
                status = handle_load(request.load(), response.mutable_load());
                break;
            case v1::Request::kUnload:
                status = handle_unload(response.mutable_unload());
                break;
            case v1::Request::kHealthCheck: {
                auto *health = response.mutable_health_check();
                if (!plugin_) {
                    health->set_healthy(false);
                    health->set_detail("Plugin not loaded");
                } else {
                    health->set_healthy(plugin_->health_check());
                }
                break;
            }
            case v1::Request::kDeliverEvents:
                status = handle_deliver(request.deliver_events(), response.mutable_deliver_events());
                break;
            case v1::Request::kConfigChanged:
                status = handle_config_changed(request.config_changed(), response.mutable_config_changed());
                break;
            default:
                status = Status::error(ErrorCode::INVALID_ARGUMENT, "Request has no kind");
                break;
        }
    } catch (const std::exception &e) {
        LOG_ERROR("[PluginHost] Plugin threw: " << e.what());
        status = Status::error(ErrorCode::INTERNAL, std::string("Plugin threw: ") + e.what());
    } catch (...) {
        LOG_ERROR("[PluginHost] Plugin threw an unknown exception");
        status = Status::error(ErrorCode::INTERNAL, "Plugin threw an unknown exception");
    }

    transport::set_status(response, status);
}

Status PluginHost::handle_hello(const v1::HelloRequest &request, v1::HelloResponse *response) {
    response->set_protocol_version(transport::kProtocolVersion);
    response->set_implementation(implementation_id_);
    response->set_host_version(kHostVersion);
    (*response->mutable_metadata())["supports_wait_ready"] = "true";

    if (request.protocol_version() != transport::kProtocolVersion) {
        return Status::error(ErrorCode::FAILED_PRECONDITION,
                             "Unsupported protocol version '" + request.protocol_version() + "'");
    }
    LOG_INFO("[PluginHost] Hello from " << request.client_name() << " " << request.client_version());
    return Status::success();
}

Status PluginHost::handle_load(const v1::LoadRequest &request, v1::LoadResponse *response) {
    if (plugin_) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin '" + plugin_id_ + "' already loaded");
    }

    nlohmann::json config;
    std::string error;
    if (!transport::parse_json_field(request.config_json(), config, error)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Bad config: " + error);
    }

    auto plugin = factories_.create(implementation_id_);
    if (!plugin) {
        return Status::error(ErrorCode::NOT_FOUND, "Unknown plugin implementation '" + implementation_id_ + "'");
    }

    plugin_id_ = request.plugin_id().empty() ? implementation_id_ : request.plugin_id();
    auto context = std::make_unique<RemotePluginContext>(plugin_id_, config);
    if (request.has_links()) {
        context->apply_links(request.links());
    }

    bool ok = false;
    try {
        ok = plugin->on_load(*context, error);
    } catch (const std::exception &e) {
        error = std::string("on_load threw: ") + e.what();
    } catch (...) {
        error = "on_load threw an unknown exception";
    }
    if (!ok) {
        // Nothing reaches the orchestrator from a failed load
        context->discard_effects();
        LOG_ERROR("[PluginHost] Load of '" << plugin_id_ << "' failed: " << error);
        return Status::error(ErrorCode::FAILED_PRECONDITION, error.empty() ? "on_load failed" : error);
    }

    context->take_effects(response->mutable_effects());
    plugin_ = std::move(plugin);
    context_ = std::move(context);
    LOG_INFO("[PluginHost] Loaded '" << plugin_id_ << "' (" << context_->subscription_count() << " subscriptions)");
    return Status::success();
}

Status PluginHost::handle_unload(v1::UnloadResponse *response) {
    unload_plugin(response->mutable_effects());
    return Status::success();
}

Status PluginHost::handle_deliver(const v1::DeliverEventsRequest &request, v1::DeliverEventsResponse *response) {
    if (!plugin_) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin not loaded");
    }
    if (request.has_links()) {
        context_->apply_links(request.links());
    }

    std::vector<events::Event> batch;
    batch.reserve(request.events_size());
    for (const auto &proto_event : request.events()) {
        events::Event event;
        std::string error;
        if (!transport::event_from_proto(proto_event, event, error)) {
            LOG_WARN("[PluginHost] Dropping event '" << proto_event.topic() << "': " << error);
            continue;
        }
        batch.push_back(std::move(event));
    }

    const int failures = context_->dispatch(request.subscription_id(), batch);
    response->set_handler_failures(static_cast<uint32_t>(failures));
    context_->take_effects(response->mutable_effects());
    return Status::success();
}

Status PluginHost::handle_config_changed(const v1::ConfigChangedRequest &request,
                                         v1::ConfigChangedResponse *response) {
    if (!plugin_) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin not loaded");
    }
    if (request.has_links()) {
        context_->apply_links(request.links());
    }

    nlohmann::json config;
    std::string error;
    if (!transport::parse_json_field(request.config_json(), config, error)) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Bad config: " + error);
    }
    context_->set_config(config);
    plugin_->on_config_changed(config);
    context_->take_effects(response->mutable_effects());
    return Status::success();
}

void PluginHost::unload_plugin(v1::Effects *effects) {
    if (!plugin_) {
        return;
    }
    try {
        plugin_->on_unload();
    } catch (const std::exception &e) {
        LOG_WARN("[PluginHost] on_unload threw: " << e.what());
    } catch (...) {
        LOG_WARN("[PluginHost] on_unload threw an unknown exception");
    }
    context_->release_all();
    context_->take_effects(effects);
    plugin_.reset();
    context_.reset();
    LOG_INFO("[PluginHost] Unloaded '" << plugin_id_ << "'");
}

}  // namespace host
}  // namespace hearth

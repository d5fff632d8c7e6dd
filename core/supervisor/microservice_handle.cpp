#include "microservice_handle.hpp"

#include <algorithm>
#include <thread>

#include "devices/binding_table.hpp"
#include "events/event_bus.hpp"
#include "graph/device_link_graph.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

namespace v1 = transport::v1;

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return ms > 0 ? static_cast<int>(ms) : 0;
}

}  // namespace

MicroserviceHandle::MicroserviceHandle(const plugin::PluginRecord &record, const PluginServices &services,
                                       const MicroserviceOptions &options,
                                       const std::vector<std::string> &local_patterns)
    : record_(record), services_(services), options_(options), local_patterns_(local_patterns) {}

MicroserviceHandle::~MicroserviceHandle() { unload(); }

bool MicroserviceHandle::is_available() const {
    return session_healthy_.load(std::memory_order_acquire) && process_ && process_->is_running();
}

Status MicroserviceHandle::load(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    std::string command = record_.entrypoint.command;
    std::vector<std::string> args = record_.entrypoint.args;
    if (command.empty()) {
        command = options_.host_executable;
        args = {"--plugin=" + record_.implementation_id()};
    }
    if (command.empty()) {
        return Status::error(ErrorCode::LOAD_FAILED,
                             "Plugin '" + record_.id + "' has no entrypoint and no plugin host is configured");
    }

    LOG_INFO("[" << record_.id << "] Starting microservice");
    process_ = std::make_unique<PluginProcess>(record_.id, command, args, options_.shutdown_timeout_ms);
    if (!process_->spawn()) {
        const std::string error = process_->last_error();
        process_.reset();
        return Status::error(ErrorCode::LOAD_FAILED, error);
    }
    session_healthy_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepting_ = true;
    }

    // Step 1: Hello handshake
    std::string error;
    v1::Request request;
    v1::Response response;
    auto *hello = request.mutable_hello();
    hello->set_protocol_version(transport::kProtocolVersion);
    hello->set_client_name("hearth-orchestrator");
    hello->set_client_version("0.1.0");
    if (!send_request(request, response, std::min(options_.hello_timeout_ms, remaining_ms(deadline)), error)) {
        return fail_load("Hello handshake failed: " + error, deadline);
    }
    if (!response.has_hello()) {
        return fail_load("Response missing hello field", deadline);
    }
    if (response.hello().protocol_version() != transport::kProtocolVersion) {
        return fail_load("Protocol version mismatch: " + response.hello().protocol_version(), deadline);
    }
    LOG_INFO("[" << record_.id << "] Hello succeeded: " << response.hello().implementation() << " (host "
                 << response.hello().host_version() << ")");

    // Step 2: readiness handshake, if the plugin advertises it
    const auto &metadata = response.hello().metadata();
    const bool supports_ready = metadata.count("supports_wait_ready") && metadata.at("supports_wait_ready") == "true";
    if (supports_ready) {
        request.Clear();
        response.Clear();
        request.mutable_wait_ready()->set_max_wait_ms_hint(static_cast<uint32_t>(remaining_ms(deadline)));
        if (!send_request(request, response, remaining_ms(deadline), error)) {
            return fail_load("WaitReady failed: " + error, deadline);
        }
        if (response.wait_ready().diagnostics().count("init_time_ms")) {
            LOG_INFO("[" << record_.id << "] Plugin ready in " << response.wait_ready().diagnostics().at("init_time_ms")
                         << "ms");
        }
    }

    // Step 3: Load
    request.Clear();
    response.Clear();
    auto *load = request.mutable_load();
    load->set_plugin_id(record_.id);
    load->set_config_json(record_.config.dump());
    uint64_t revision = 0;
    const bool shipping = attach_links(load->mutable_links(), revision);
    if (!send_request(request, response, remaining_ms(deadline), error)) {
        return fail_load("Load failed: " + error, deadline);
    }
    if (shipping) {
        links_shipped(revision);
    }
    apply_effects(response.load().effects());

    LOG_INFO("[" << record_.id << "] Loaded as microservice (PID=" << process_->pid() << ", "
                 << forwarded_subscription_count() << " forwarded subscriptions)");
    return Status::success();
}

Status MicroserviceHandle::fail_load(const std::string &error, std::chrono::steady_clock::time_point deadline) {
    ErrorCode code = ErrorCode::LOAD_FAILED;
    if (cancelled_) {
        code = ErrorCode::UNAVAILABLE;
    } else if (std::chrono::steady_clock::now() >= deadline) {
        code = ErrorCode::TIMEOUT;
    }
    LOG_ERROR("[" << record_.id << "] " << error);

    // Positive teardown: the process is reaped before the failure is reported
    release_subscriptions();
    session_healthy_.store(false, std::memory_order_release);
    if (process_) {
        process_->shutdown();
        process_.reset();
    }
    release_bindings();
    return Status::error(code, error);
}

void MicroserviceHandle::unload() {
    release_subscriptions();
    cancelled_ = false;

    if (process_) {
        if (is_available()) {
            v1::Request request;
            v1::Response response;
            request.mutable_unload();
            std::string error;
            if (!send_request(request, response, options_.rpc_timeout_ms, error)) {
                LOG_WARN("[" << record_.id << "] Unload request failed: " << error);
            }
        }
        session_healthy_.store(false, std::memory_order_release);
        process_->shutdown();
        process_.reset();
        LOG_INFO("[" << record_.id << "] Microservice stopped");
    }
    release_bindings();
    shipped_revision_.store(kNothingShipped);
}

bool MicroserviceHandle::health_check(std::string &error) {
    if (!process_ || !process_->is_running()) {
        session_healthy_.store(false, std::memory_order_release);
        error = "Plugin process not running";
        return false;
    }

    v1::Request request;
    v1::Response response;
    request.mutable_health_check();
    if (!send_request(request, response, options_.rpc_timeout_ms, error)) {
        return false;
    }
    if (!response.health_check().healthy()) {
        error = response.health_check().detail().empty() ? "Plugin reported unhealthy"
                                                         : response.health_check().detail();
        return false;
    }
    return true;
}

Status MicroserviceHandle::notify_config_changed(const nlohmann::json &config) {
    if (!is_available()) {
        return Status::error(ErrorCode::UNAVAILABLE, "Plugin '" + record_.id + "' is not running");
    }

    v1::Request request;
    v1::Response response;
    auto *changed = request.mutable_config_changed();
    changed->set_config_json(config.dump());
    uint64_t revision = 0;
    const bool shipping = attach_links(changed->mutable_links(), revision);

    std::string error;
    if (!send_request(request, response, options_.rpc_timeout_ms, error)) {
        return Status::error(ErrorCode::UNAVAILABLE, error);
    }
    if (shipping) {
        links_shipped(revision);
    }
    apply_effects(response.config_changed().effects());
    return Status::success();
}

size_t MicroserviceHandle::forwarded_subscription_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return forwarded_.size();
}

bool MicroserviceHandle::attach_links(v1::LinkSet *links, uint64_t &revision) const {
    if (!services_.graph) {
        return false;
    }
    revision = services_.graph->revision();
    if (shipped_revision_.load() == revision) {
        return false;
    }
    transport::links_to_proto(services_.graph->links(), revision, links);
    return true;
}

void MicroserviceHandle::apply_effects(const v1::Effects &effects) {
    std::vector<events::SubscriptionId> to_unsubscribe;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!accepting_) {
            LOG_DEBUG("[" << record_.id << "] Discarding effects after unload");
            return;
        }

        for (const auto &subscription : effects.subscribe()) {
            const std::string &pattern = subscription.pattern();
            if (std::find(local_patterns_.begin(), local_patterns_.end(), pattern) != local_patterns_.end()) {
                LOG_DEBUG("[" << record_.id << "] '" << pattern << "' served in-process, not forwarded");
                continue;
            }
            if (!services_.bus) {
                continue;
            }
            const uint64_t remote_id = subscription.subscription_id();
            events::SubscriptionId bus_id = 0;
            Status status = services_.bus->subscribe_batch(
                pattern, [this, remote_id](const std::vector<events::Event> &batch) { deliver(remote_id, batch); },
                bus_id, record_.id + "/remote");
            if (!status.ok()) {
                LOG_WARN("[" << record_.id << "] Subscription '" << pattern << "' rejected: " << status.to_string());
                continue;
            }
            forwarded_[remote_id] = bus_id;
        }

        for (uint64_t remote_id : effects.unsubscribe()) {
            auto it = forwarded_.find(remote_id);
            if (it != forwarded_.end()) {
                to_unsubscribe.push_back(it->second);
                forwarded_.erase(it);
            }
        }
    }

    // Outside state_mutex_: unsubscribe may wait for a delivery that needs it
    for (auto bus_id : to_unsubscribe) {
        services_.bus->unsubscribe(bus_id);
    }

    if (services_.bindings) {
        for (const auto &selector : effects.bind()) {
            uint64_t binding_id = 0;
            Status status = services_.bindings->add(record_.id, selector, binding_id);
            if (!status.ok()) {
                LOG_WARN("[" << record_.id << "] Binding '" << selector << "' rejected: " << status.to_string());
            }
        }
        for (const auto &selector : effects.unbind()) {
            services_.bindings->remove_selector(record_.id, selector);
        }
    }

    if (services_.bus) {
        for (const auto &emitted : effects.emit()) {
            nlohmann::json payload;
            std::string error;
            if (!transport::parse_json_field(emitted.payload_json(), payload, error)) {
                LOG_WARN("[" << record_.id << "] Dropping emit to '" << emitted.topic() << "': " << error);
                continue;
            }
            Status status = services_.bus->emit(emitted.topic(), std::move(payload), record_.id);
            if (!status.ok()) {
                LOG_WARN("[" << record_.id << "] Emit to '" << emitted.topic() << "' rejected: " << status.to_string());
            }
        }
    }
}

void MicroserviceHandle::deliver(uint64_t remote_subscription_id, const std::vector<events::Event> &batch) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!accepting_) {
            return;
        }
    }

    v1::Request request;
    v1::Response response;
    auto *deliver = request.mutable_deliver_events();
    deliver->set_subscription_id(remote_subscription_id);
    for (const auto &event : batch) {
        transport::event_to_proto(event, deliver->add_events());
    }
    uint64_t revision = 0;
    const bool shipping = attach_links(deliver->mutable_links(), revision);

    std::string error;
    if (!send_request(request, response, options_.rpc_timeout_ms, error)) {
        LOG_WARN("[" << record_.id << "] Event delivery failed: " << error);
        return;
    }
    if (shipping) {
        links_shipped(revision);
    }
    if (response.deliver_events().handler_failures() > 0) {
        LOG_WARN("[" << record_.id << "] " << response.deliver_events().handler_failures()
                     << " remote handler failures");
    }
    apply_effects(response.deliver_events().effects());
}

void MicroserviceHandle::release_subscriptions() {
    std::map<uint64_t, events::SubscriptionId> forwarded;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepting_ = false;
        forwarded.swap(forwarded_);
    }
    for (const auto &[remote_id, bus_id] : forwarded) {
        static_cast<void>(remote_id);
        services_.bus->unsubscribe(bus_id);
    }
}

void MicroserviceHandle::release_bindings() {
    if (services_.bindings) {
        services_.bindings->release_plugin(record_.id);
    }
}

bool MicroserviceHandle::send_request(v1::Request &request, v1::Response &response, int timeout_ms,
                                      std::string &error) {
    std::lock_guard<std::mutex> lock(rpc_mutex_);

    if (!session_healthy_.load(std::memory_order_acquire) || !process_) {
        error = "Plugin session not healthy";
        return false;
    }
    if (!process_->is_running()) {
        session_healthy_.store(false, std::memory_order_release);
        error = "Plugin process not running";
        return false;
    }

    const uint64_t request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    request.set_request_id(request_id);

    std::string serialized;
    if (!request.SerializeToString(&serialized)) {
        error = "Failed to serialize request";
        return false;
    }

    if (!process_->channel().write_frame(serialized, timeout_ms)) {
        session_healthy_.store(false, std::memory_order_release);
        error = "Failed to write request: " + process_->channel().last_error();
        return false;
    }

    if (!wait_for_response(response, request_id, timeout_ms, error)) {
        return false;
    }

    Status status = transport::status_from_response(response);
    if (!status.ok()) {
        error = "Plugin returned error: " + status.to_string();
        return false;
    }
    return true;
}

bool MicroserviceHandle::wait_for_response(v1::Response &response, uint64_t expected_request_id, int timeout_ms,
                                           std::string &error) {
    auto start = std::chrono::steady_clock::now();
    auto &channel = process_->channel();

    while (true) {
        auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        if (elapsed_ms >= timeout_ms) {
            // A late response would desynchronize the stream
            session_healthy_.store(false, std::memory_order_release);
            error = "Timeout waiting for response (" + std::to_string(timeout_ms) + "ms)";
            LOG_ERROR("[" << record_.id << "] " << error);
            return false;
        }
        if (cancelled_.load()) {
            session_healthy_.store(false, std::memory_order_release);
            error = "Request cancelled";
            return false;
        }

        int remaining = static_cast<int>(timeout_ms - elapsed_ms);
        // Poll in small chunks to notice cancellation and process death
        int poll_wait = (remaining > 50) ? 50 : remaining;

        if (channel.wait_for_data(poll_wait)) {
            elapsed_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
            int read_timeout = static_cast<int>(timeout_ms - elapsed_ms);
            if (read_timeout < 0) {
                read_timeout = 0;
            }

            std::vector<uint8_t> frame;
            if (!channel.read_frame(frame, read_timeout)) {
                session_healthy_.store(false, std::memory_order_release);
                error = channel.last_error().empty() ? "Plugin closed the channel"
                                                     : "Failed to read response: " + channel.last_error();
                return false;
            }
            if (!response.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
                session_healthy_.store(false, std::memory_order_release);
                error = "Failed to parse response protobuf";
                return false;
            }
            if (response.request_id() != expected_request_id) {
                session_healthy_.store(false, std::memory_order_release);
                error = "Response request_id mismatch (expected " + std::to_string(expected_request_id) + ", got " +
                        std::to_string(response.request_id()) + ")";
                LOG_ERROR("[" << record_.id << "] " << error);
                return false;
            }
            return true;
        } else if (!channel.last_error().empty()) {
            session_healthy_.store(false, std::memory_order_release);
            error = "Failed waiting for response: " + channel.last_error();
            return false;
        }

        if (!process_->is_running()) {
            session_healthy_.store(false, std::memory_order_release);
            error = "Plugin process died while waiting for response";
            return false;
        }
    }
}

}  // namespace supervisor
}  // namespace hearth

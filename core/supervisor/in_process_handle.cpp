#include "in_process_handle.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"
#include "scoped_contexts.hpp"

namespace hearth {
namespace supervisor {

namespace {

// Shared between the waiting supervisor thread and the on_load thread
struct LoadAttempt {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    bool abandoned = false;
    std::string error;
};

}  // namespace

InProcessHandle::InProcessHandle(const plugin::PluginRecord &record, const PluginServices &services,
                                 const plugin::PluginFactoryTable &factories, Scope scope)
    : record_(record), services_(services), factories_(factories), scope_(scope) {}

InProcessHandle::~InProcessHandle() { unload(); }

plugin::RuntimeMode InProcessHandle::mode() const {
    switch (scope_) {
        case Scope::SANDBOXED:
            return plugin::RuntimeMode::EMBEDDED;
        case Scope::HYBRID_SHIM:
            return plugin::RuntimeMode::HYBRID;
        default:
            return plugin::RuntimeMode::IN_PROCESS;
    }
}

Status InProcessHandle::load(int timeout_ms) {
    if (loaded_) {
        return Status::success();
    }

    std::unique_ptr<plugin::IPlugin> instance;
    try {
        instance = factories_.create(record_.implementation_id());
    } catch (const std::exception &e) {
        return Status::error(ErrorCode::LOAD_FAILED, std::string("Plugin factory threw: ") + e.what());
    } catch (...) {
        return Status::error(ErrorCode::LOAD_FAILED, "Plugin factory threw an unknown exception");
    }
    if (!instance) {
        return Status::error(ErrorCode::LOAD_FAILED,
                             "No in-process implementation '" + record_.implementation_id() + "'");
    }

    plugin_ = std::shared_ptr<plugin::IPlugin>(std::move(instance));
    context_ = std::make_shared<LocalPluginContext>(record_.id, record_.config, services_);
    switch (scope_) {
        case Scope::SANDBOXED:
            scoped_context_ = std::make_shared<SandboxedContext>(context_, record_.sandbox);
            break;
        case Scope::HYBRID_SHIM:
            scoped_context_ = std::make_shared<HybridShimContext>(context_, record_.local_topics);
            break;
        default:
            scoped_context_ = context_;
            break;
    }

    auto attempt = std::make_shared<LoadAttempt>();
    auto plugin = plugin_;
    auto context = scoped_context_;
    const std::string plugin_id = record_.id;

    std::thread worker([attempt, plugin, context, plugin_id] {
        bool ok = false;
        std::string error;
        try {
            ok = plugin->on_load(*context, error);
            if (!ok && error.empty()) {
                error = "on_load returned false";
            }
        } catch (const std::exception &e) {
            ok = false;
            error = std::string("on_load threw: ") + e.what();
        } catch (...) {
            ok = false;
            error = "on_load threw an unknown exception";
        }

        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(attempt->mutex);
            attempt->done = true;
            attempt->ok = ok;
            attempt->error = error;
            abandoned = attempt->abandoned;
        }
        attempt->cv.notify_all();

        if (abandoned && ok) {
            LOG_WARN("[" << plugin_id << "] on_load returned after its deadline, unloading");
            try {
                plugin->on_unload();
            } catch (const std::exception &e) {
                LOG_ERROR("[" << plugin_id << "] on_unload threw: " << e.what());
            } catch (...) {
                LOG_ERROR("[" << plugin_id << "] on_unload threw an unknown exception");
            }
        }
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::unique_lock<std::mutex> lock(attempt->mutex);
    while (!attempt->done && !cancelled_ && std::chrono::steady_clock::now() < deadline) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        attempt->cv.wait_for(lock, std::min(remaining, std::chrono::milliseconds(50)));
    }

    if (attempt->done) {
        const bool ok = attempt->ok;
        const std::string error = attempt->error;
        lock.unlock();
        worker.join();

        if (!ok) {
            LOG_WARN("[" << record_.id << "] Load failed: " << error);
            teardown();
            return Status::error(ErrorCode::LOAD_FAILED, error);
        }
        loaded_ = true;
        LOG_INFO("[" << record_.id << "] Loaded in-process (" << plugin::runtime_mode_to_string(mode()) << ")");
        return Status::success();
    }

    attempt->abandoned = true;
    lock.unlock();
    worker.detach();
    teardown();

    if (cancelled_) {
        LOG_WARN("[" << record_.id << "] Load cancelled");
        return Status::error(ErrorCode::UNAVAILABLE, "Load of '" + record_.id + "' cancelled");
    }
    LOG_ERROR("[" << record_.id << "] on_load exceeded " << timeout_ms << "ms");
    return Status::error(ErrorCode::TIMEOUT,
                         "Load of '" + record_.id + "' exceeded " + std::to_string(timeout_ms) + "ms");
}

void InProcessHandle::unload() {
    cancelled_ = false;
    if (loaded_.exchange(false)) {
        try {
            plugin_->on_unload();
        } catch (const std::exception &e) {
            LOG_ERROR("[" << record_.id << "] on_unload threw: " << e.what());
        } catch (...) {
            LOG_ERROR("[" << record_.id << "] on_unload threw an unknown exception");
        }
        LOG_INFO("[" << record_.id << "] Unloaded");
    }
    teardown();
}

void InProcessHandle::teardown() {
    if (context_) {
        context_->revoke();
    }
    scoped_context_.reset();
    context_.reset();
    plugin_.reset();
}

bool InProcessHandle::health_check(std::string &error) {
    if (!loaded_) {
        error = "Plugin not loaded";
        return false;
    }
    try {
        if (!plugin_->health_check()) {
            error = "health_check returned false";
            return false;
        }
    } catch (const std::exception &e) {
        error = std::string("health_check threw: ") + e.what();
        return false;
    } catch (...) {
        error = "health_check threw an unknown exception";
        return false;
    }
    return true;
}

Status InProcessHandle::notify_config_changed(const nlohmann::json &config) {
    if (!loaded_) {
        return Status::error(ErrorCode::FAILED_PRECONDITION, "Plugin '" + record_.id + "' is not loaded");
    }
    context_->set_config(config);
    try {
        plugin_->on_config_changed(config);
    } catch (const std::exception &e) {
        return Status::error(ErrorCode::HANDLER_FAILURE, std::string("on_config_changed threw: ") + e.what());
    } catch (...) {
        return Status::error(ErrorCode::HANDLER_FAILURE, "on_config_changed threw an unknown exception");
    }
    return Status::success();
}

}  // namespace supervisor
}  // namespace hearth

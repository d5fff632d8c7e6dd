#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "transport/framed_channel.hpp"

namespace hearth {
namespace supervisor {

// PluginProcess manages the lifecycle of one out-of-process plugin
// Responsibilities:
// - Spawn process with stdin/stdout connected to a FramedChannel
// - Monitor process liveness
// - Clean/forced shutdown
class PluginProcess {
public:
    PluginProcess(const std::string &plugin_id, const std::string &command, const std::vector<std::string> &args = {},
                  int shutdown_timeout_ms = 2000);
    ~PluginProcess();

    PluginProcess(const PluginProcess &) = delete;
    PluginProcess &operator=(const PluginProcess &) = delete;

    // Spawn the plugin process
    // Returns true on success, false on failure (sets last_error)
    bool spawn();

    bool is_running() const;

    // Shutdown sequence: EOF -> wait -> SIGKILL. Returns once the child is reaped.
    void shutdown();

    transport::FramedChannel &channel() { return channel_; }

    const std::string &plugin_id() const { return plugin_id_; }
    pid_t pid() const { return pid_; }
    const std::string &last_error() const { return error_; }

private:
    bool wait_for_exit(int timeout_ms);
    void force_terminate();
    void close_fds();

    std::string plugin_id_;
    std::string command_;
    std::vector<std::string> args_;
    int shutdown_timeout_ms_;
    std::string error_;

    transport::FramedChannel channel_;

    pid_t pid_;
    int stdin_write_fd_;
    int stdout_read_fd_;
};

}  // namespace supervisor
}  // namespace hearth

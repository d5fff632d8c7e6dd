#include "plugin_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

namespace {

// A dying plugin must surface as EPIPE on write, not kill the orchestrator
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

PluginProcess::PluginProcess(const std::string &plugin_id, const std::string &command,
                             const std::vector<std::string> &args, int shutdown_timeout_ms)
    : plugin_id_(plugin_id),
      command_(command),
      args_(args),
      shutdown_timeout_ms_(shutdown_timeout_ms),
      pid_(-1),
      stdin_write_fd_(-1),
      stdout_read_fd_(-1) {}

PluginProcess::~PluginProcess() { shutdown(); }

bool PluginProcess::spawn() {
    LOG_INFO("[" << plugin_id_ << "] Spawning: " << command_);

    // Bare names are looked up on PATH by execvp
    if (command_.find('/') != std::string::npos && !std::filesystem::exists(command_)) {
        error_ = "Executable not found: " + command_;
        LOG_ERROR("[" << plugin_id_ << "] " << error_);
        return false;
    }

    ignore_sigpipe_once();

    int stdin_pipe[2];
    int stdout_pipe[2];
    int exec_pipe[2];  // CLOEXEC: closes on successful exec, carries errno otherwise

    if (pipe(stdin_pipe) < 0) {
        error_ = "Failed to create stdin pipe";
        return false;
    }
    if (pipe(stdout_pipe) < 0) {
        error_ = "Failed to create stdout pipe";
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create exec status pipe";
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    // Parent ends must not leak into other children
    fcntl(stdin_pipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(stdout_pipe[0], F_SETFD, FD_CLOEXEC);

    std::string resolved = command_;
    if (command_.find('/') != std::string::npos) {
        resolved = std::filesystem::absolute(command_).string();
    }
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(resolved.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        pid_ = -1;
        return false;
    }

    if (pid_ == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(exec_pipe[0]);
        signal(SIGPIPE, SIG_DFL);

        // stderr stays connected to the orchestrator's stderr
        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        static_cast<void>(ignored);
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    stdin_write_fd_ = stdin_pipe[1];
    stdout_read_fd_ = stdout_pipe[0];
    channel_.set_fds(stdout_read_fd_, stdin_write_fd_);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        error_ = "exec failed for " + resolved + ": " + strerror(exec_errno);
        LOG_ERROR("[" << plugin_id_ << "] " << error_);
        wait_for_exit(500);
        close_fds();
        return false;
    }

    LOG_INFO("[" << plugin_id_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool PluginProcess::is_running() const {
    if (pid_ <= 0) return false;
    // kill(0) tests existence without reaping; a zombie still counts until shutdown() reaps it
    return kill(pid_, 0) == 0;
}

void PluginProcess::shutdown() {
    if (pid_ <= 0) {
        close_fds();
        return;
    }

    LOG_INFO("[" << plugin_id_ << "] Initiating shutdown");

    // 1. Send EOF
    channel_.close_write();
    stdin_write_fd_ = -1;

    // 2. Wait with timeout
    if (wait_for_exit(shutdown_timeout_ms_)) {
        LOG_INFO("[" << plugin_id_ << "] Clean shutdown");
    } else {
        // 3. Forced kill
        LOG_WARN("[" << plugin_id_ << "] Timeout - forcing termination");
        force_terminate();
        if (!wait_for_exit(2000)) {
            LOG_ERROR("[" << plugin_id_ << "] Process " << pid_ << " did not exit after SIGKILL");
        }
    }
    close_fds();
}

bool PluginProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
                LOG_DEBUG("[" << plugin_id_ << "] Exited with status " << WEXITSTATUS(status));
            }
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void PluginProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

void PluginProcess::close_fds() {
    channel_.close_write();
    channel_.close_read();
    stdin_write_fd_ = -1;
    stdout_read_fd_ = -1;
}

}  // namespace supervisor
}  // namespace hearth

#include "command_runner.hpp"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>

#include "logging/logger.hpp"

namespace hearth {
namespace jobs {

namespace {
constexpr size_t kMaxOutput = 64 * 1024;
}

bool run_command(const std::vector<std::string> &argv, const std::function<bool()> &should_abort,
                 CommandResult &result, std::string &error) {
    result = CommandResult();
    if (argv.empty()) {
        error = "Empty command";
        return false;
    }

    int out_pipe[2];
    if (pipe(out_pipe) < 0) {
        error = "Failed to create output pipe: " + std::string(strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = "Fork failed: " + std::string(strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child: stdout and stderr into the pipe, no stdin
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(STDIN_FILENO);

        std::vector<char *> args;
        for (const auto &arg : argv) {
            args.push_back(const_cast<char *>(arg.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127);
    }

    close(out_pipe[1]);
    const int read_fd = out_pipe[0];
    LOG_DEBUG("[Command] Started " << argv[0] << " (PID=" << pid << ")");

    bool eof = false;
    char buf[4096];
    while (!eof) {
        if (should_abort && should_abort()) {
            kill(pid, SIGKILL);
            result.aborted = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = read_fd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t r = read(read_fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (r == 0) {
            eof = true;
            break;
        }
        if (result.output.size() < kMaxOutput) {
            result.output.append(buf, static_cast<size_t>(r));
        }
    }
    close(read_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = "waitpid failed: " + std::string(strerror(errno));
            return false;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return true;
}

}  // namespace jobs
}  // namespace hearth

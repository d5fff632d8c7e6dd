#pragma once

#include <functional>
#include <string>
#include <vector>

namespace hearth {
namespace jobs {

struct CommandResult {
    int exit_code = -1;
    std::string output;  // combined stdout/stderr, truncated to 64 KiB
    bool aborted = false;
};

/**
 * @brief Run an external command to completion
 *
 * argv[0] is looked up on PATH. The child is killed (SIGKILL) as soon as
 * should_abort() returns true; it is polled every 100ms.
 *
 * @return false if the command could not be started (error set)
 */
bool run_command(const std::vector<std::string> &argv, const std::function<bool()> &should_abort,
                 CommandResult &result, std::string &error);

}  // namespace jobs
}  // namespace hearth

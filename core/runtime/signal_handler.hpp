#pragma once

#include <atomic>

namespace hearth {
namespace runtime {

/**
 * @brief Process-wide shutdown latch fed by SIGINT/SIGTERM
 *
 * The handler only stores the signal number; Runtime::run() polls it.
 * request_shutdown() trips the same latch without a signal.
 */
class SignalHandler {
public:
    // Returns false if a handler could not be installed
    static bool install();

    static bool is_shutdown_requested();
    static void request_shutdown();

    // Signal that tripped the latch, 0 if none or if it was requested directly
    static int last_signal();

    // Clears the latch (tests run several loops in one process)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<int> signal_;
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace hearth

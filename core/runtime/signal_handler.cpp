#include "signal_handler.hpp"

#include <signal.h>

namespace hearth {
namespace runtime {

std::atomic<int> SignalHandler::signal_{0};
std::atomic<bool> SignalHandler::shutdown_requested_{false};

bool SignalHandler::install() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::request_shutdown() { shutdown_requested_.store(true); }

int SignalHandler::last_signal() { return signal_.load(); }

void SignalHandler::reset() {
    signal_.store(0);
    shutdown_requested_.store(false);
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: atomics only
    signal_.store(signal);
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace hearth

#include "health_tracker.hpp"

#include "logging/logger.hpp"

namespace hearth {
namespace supervisor {

namespace {

std::optional<int64_t> ago_ms(std::chrono::steady_clock::time_point when) {
    if (when == std::chrono::steady_clock::time_point{}) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - when).count();
}

}  // namespace

HealthTracker::HealthTracker(int failure_threshold) : threshold_(failure_threshold > 0 ? failure_threshold : 1) {}

bool HealthTracker::record_success(const std::string &plugin_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &state = states_[plugin_id];
    const bool recovered = state.consecutive_failures > 0;
    if (recovered) {
        LOG_INFO("[Health] Plugin '" << plugin_id << "' healthy again (after " << state.consecutive_failures
                                     << " failed checks)");
    }
    state.consecutive_failures = 0;
    state.last_success_time = std::chrono::steady_clock::now();
    return recovered;
}

bool HealthTracker::record_failure(const std::string &plugin_id, const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &state = states_[plugin_id];
    state.consecutive_failures++;
    state.last_error = error;
    state.last_failure_time = std::chrono::steady_clock::now();

    LOG_WARN("[Health] Plugin '" << plugin_id << "' failed health check (" << state.consecutive_failures << "/"
                                 << threshold_ << "): " << error);
    return state.consecutive_failures == threshold_;
}

void HealthTracker::reset(const std::string &plugin_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(plugin_id);
}

int HealthTracker::consecutive_failures(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(plugin_id);
    return it == states_.end() ? 0 : it->second.consecutive_failures;
}

HealthTracker::HealthSnapshot HealthTracker::make_snapshot(const HealthState &state) const {
    HealthSnapshot snapshot;
    snapshot.consecutive_failures = state.consecutive_failures;
    snapshot.threshold = threshold_;
    snapshot.last_error = state.last_error;
    snapshot.last_success_ago_ms = ago_ms(state.last_success_time);
    snapshot.last_failure_ago_ms = ago_ms(state.last_failure_time);
    return snapshot;
}

std::optional<HealthTracker::HealthSnapshot> HealthTracker::get_snapshot(const std::string &plugin_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(plugin_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return make_snapshot(it->second);
}

std::unordered_map<std::string, HealthTracker::HealthSnapshot> HealthTracker::get_all_snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, HealthSnapshot> result;
    for (const auto &[id, state] : states_) {
        result.emplace(id, make_snapshot(state));
    }
    return result;
}

}  // namespace supervisor
}  // namespace hearth

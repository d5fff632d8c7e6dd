#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hearth {
namespace supervisor {

// HealthTracker counts consecutive health check failures per plugin and
// reports the transitions the supervisor acts on: reaching the failure
// threshold, and the first success after failures.
class HealthTracker {
public:
    // Immutable snapshot of the health state of one plugin.
    struct HealthSnapshot {
        int consecutive_failures = 0;
        int threshold = 0;
        std::string last_error;
        std::optional<int64_t> last_success_ago_ms;  // nullopt before the first passing check
        std::optional<int64_t> last_failure_ago_ms;
    };

    explicit HealthTracker(int failure_threshold = 3);

    // Returns true if the plugin had failed before (recovery)
    bool record_success(const std::string &plugin_id);

    // Returns true exactly when the failure count reaches the threshold
    bool record_failure(const std::string &plugin_id, const std::string &error);

    // Forget a plugin (unload)
    void reset(const std::string &plugin_id);

    int consecutive_failures(const std::string &plugin_id) const;
    int threshold() const { return threshold_; }

    // Returns std::nullopt if the plugin has no recorded checks.
    std::optional<HealthSnapshot> get_snapshot(const std::string &plugin_id) const;
    std::unordered_map<std::string, HealthSnapshot> get_all_snapshots() const;

private:
    struct HealthState {
        int consecutive_failures = 0;
        std::string last_error;
        std::chrono::steady_clock::time_point last_success_time;  // {} until the first success
        std::chrono::steady_clock::time_point last_failure_time;
    };

    HealthSnapshot make_snapshot(const HealthState &state) const;

    const int threshold_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, HealthState> states_;
};

}  // namespace supervisor
}  // namespace hearth

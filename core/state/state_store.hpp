#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "devices/binding_table.hpp"
#include "devices/device_types.hpp"
#include "graph/device_link_graph.hpp"
#include "jobs/install_job.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {
namespace state {

// Everything the orchestrator persists between runs
struct PersistedState {
    std::vector<plugin::PluginRecord> plugins;
    std::vector<jobs::InstallJob> jobs;
    std::vector<devices::Device> devices;
    std::vector<devices::Binding> bindings;  // informational; plugins re-bind in on_load
    std::vector<graph::DeviceLink> links;
    int64_t saved_at = 0;
};

nlohmann::json persisted_state_to_json(const PersistedState &state);
bool persisted_state_from_json(const nlohmann::json &json, PersistedState &state, std::string &error);

/**
 * @brief One JSON document on disk holding the orchestrator state
 *
 * Saves go to "<path>.tmp" first and are renamed over the previous file, so
 * a crash mid-write leaves the last good state in place.
 *
 * load() resets every plugin's loaded flag: nothing is running at start-up.
 */
class StateStore {
public:
    explicit StateStore(const std::string &path);

    // A missing file is not an error: state stays empty and exists() is false
    bool load(PersistedState &state, std::string &error) const;
    bool save(const PersistedState &state, std::string &error) const;

    bool exists() const;
    const std::string &path() const { return path_; }

    static constexpr int kFormatVersion = 1;

private:
    const std::string path_;
};

}  // namespace state
}  // namespace hearth

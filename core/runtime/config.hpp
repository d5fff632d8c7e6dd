#pragma once

#include <string>
#include <vector>

#include "devices/device_types.hpp"
#include "events/event_bus.hpp"
#include "plugin/plugin_types.hpp"

namespace hearth {
namespace runtime {

// orchestrator: section
struct OrchestratorConfig {
    int load_timeout_ms = 60000;      // PLUGIN_LOAD_TIMEOUT
    int install_timeout_ms = 300000;  // PLUGIN_INSTALL_TIMEOUT
    int health_interval_ms = 5000;
    int health_failure_threshold = 3;
    int max_link_depth = 5;  // MAX_DEVICE_LINK_DEPTH
    int install_workers = 2;
    size_t install_queue_size = 64;

    std::string plugin_host;  // hearth-plugin-host for plugins without an entrypoint
    int rpc_timeout_ms = 5000;
    int shutdown_timeout_ms = 2000;  // Plugin process graceful shutdown (500-30000ms)

    std::string staging_dir = "staging";  // source-control checkouts
    std::string git_command = "git";
    int url_timeout_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct StateConfig {
    std::string path = "hearth-state.json";
    int autosave_interval_ms = 30000;  // 0 = save on shutdown only
};

// Seed link; names are validated by the link graph at start-up
struct LinkConfig {
    std::string from;
    std::string to;
    std::string type = "bridge";
    std::string direction = "unidirectional";
};

struct RuntimeConfig {
    OrchestratorConfig orchestrator;
    events::EventBusConfig event_bus;
    LoggingConfig logging;
    StateConfig state;
    std::vector<plugin::PluginRecord> plugins;
    std::vector<devices::Device> devices;
    std::vector<LinkConfig> links;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Same, from YAML text (tests)
bool parse_config(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace hearth

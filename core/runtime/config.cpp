#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>

#include "common/yaml_json.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace runtime {

namespace {

bool parse_yaml(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"orchestrator", "event_bus", "logging", "state",
                                                 "plugins",      "devices",   "links"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    // Load orchestrator config
    if (yaml["orchestrator"]) {
        const auto &orch = yaml["orchestrator"];
        auto &out = config.orchestrator;
        if (orch["load_timeout_ms"]) {
            out.load_timeout_ms = orch["load_timeout_ms"].as<int>();
        }
        if (orch["install_timeout_ms"]) {
            out.install_timeout_ms = orch["install_timeout_ms"].as<int>();
        }
        if (orch["health_interval_ms"]) {
            out.health_interval_ms = orch["health_interval_ms"].as<int>();
        }
        if (orch["health_failure_threshold"]) {
            out.health_failure_threshold = orch["health_failure_threshold"].as<int>();
        }
        if (orch["max_link_depth"]) {
            out.max_link_depth = orch["max_link_depth"].as<int>();
        }
        if (orch["install_workers"]) {
            out.install_workers = orch["install_workers"].as<int>();
        }
        if (orch["install_queue_size"]) {
            out.install_queue_size = orch["install_queue_size"].as<size_t>();
        }
        if (orch["plugin_host"]) {
            out.plugin_host = orch["plugin_host"].as<std::string>();
        }
        if (orch["rpc_timeout_ms"]) {
            out.rpc_timeout_ms = orch["rpc_timeout_ms"].as<int>();
        }
        if (orch["shutdown_timeout_ms"]) {
            out.shutdown_timeout_ms = orch["shutdown_timeout_ms"].as<int>();
        }
        if (orch["staging_dir"]) {
            out.staging_dir = orch["staging_dir"].as<std::string>();
        }
        if (orch["git_command"]) {
            out.git_command = orch["git_command"].as<std::string>();
        }
        if (orch["url_timeout_ms"]) {
            out.url_timeout_ms = orch["url_timeout_ms"].as<int>();
        }
    }

    // Load event bus config
    if (yaml["event_bus"]) {
        const auto &bus = yaml["event_bus"];
        if (bus["debounce_ms"]) {
            config.event_bus.debounce_ms = bus["debounce_ms"].as<int>();
        }
        if (bus["batch_size"]) {
            config.event_bus.batch_size = bus["batch_size"].as<size_t>();
        }
        if (bus["max_log_size"]) {
            config.event_bus.max_log_size = bus["max_log_size"].as<size_t>();
        }
        if (bus["subscriber_queue_size"]) {
            config.event_bus.subscriber_queue_size = bus["subscriber_queue_size"].as<size_t>();
        }
    }

    // Load logging config
    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    // Load state config
    if (yaml["state"]) {
        if (yaml["state"]["path"]) {
            config.state.path = yaml["state"]["path"].as<std::string>();
        }
        if (yaml["state"]["autosave_interval_ms"]) {
            config.state.autosave_interval_ms = yaml["state"]["autosave_interval_ms"].as<int>();
        }
    }

    // Declarative plugins share the manifest format
    if (yaml["plugins"]) {
        config.plugins.clear();  // Ensure idempotent parsing
        for (const auto &plugin_node : yaml["plugins"]) {
            plugin::PluginRecord record;
            if (!plugin::plugin_record_from_json(yaml_to_json(plugin_node), record, error)) {
                error = "plugins: " + error;
                return false;
            }
            config.plugins.push_back(std::move(record));
        }
    }

    if (yaml["devices"]) {
        config.devices.clear();
        for (const auto &device_node : yaml["devices"]) {
            try {
                config.devices.push_back(devices::device_from_json(yaml_to_json(device_node)));
            } catch (const nlohmann::json::exception &e) {
                error = std::string("devices: ") + e.what();
                return false;
            }
        }
    }

    if (yaml["links"]) {
        config.links.clear();
        for (const auto &link_node : yaml["links"]) {
            LinkConfig link;
            if (link_node["from"]) {
                link.from = link_node["from"].as<std::string>();
            }
            if (link_node["to"]) {
                link.to = link_node["to"].as<std::string>();
            }
            if (link_node["type"]) {
                link.type = link_node["type"].as<std::string>();
            }
            if (link_node["direction"]) {
                link.direction = link_node["direction"].as<std::string>();
            }
            config.links.push_back(link);
        }
    }

    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    const auto &orch = config.orchestrator;

    // Validate timeouts
    if (orch.load_timeout_ms < 100) {
        error = "orchestrator.load_timeout_ms must be >= 100ms";
        return false;
    }
    if (orch.install_timeout_ms < 1000) {
        error = "orchestrator.install_timeout_ms must be >= 1000ms";
        return false;
    }
    if (orch.health_interval_ms < 0) {
        error = "orchestrator.health_interval_ms must be >= 0 (0 disables health checks)";
        return false;
    }
    if (orch.health_failure_threshold < 1) {
        error = "orchestrator.health_failure_threshold must be at least 1";
        return false;
    }
    if (orch.max_link_depth < 1) {
        error = "orchestrator.max_link_depth must be at least 1";
        return false;
    }
    if (orch.install_workers < 1) {
        error = "orchestrator.install_workers must be at least 1";
        return false;
    }
    if (orch.install_queue_size < 1) {
        error = "orchestrator.install_queue_size must be at least 1";
        return false;
    }
    if (orch.rpc_timeout_ms < 100) {
        error = "orchestrator.rpc_timeout_ms must be >= 100ms";
        return false;
    }
    if (orch.shutdown_timeout_ms < 500 || orch.shutdown_timeout_ms > 30000) {
        error = "orchestrator.shutdown_timeout_ms must be between 500 and 30000";
        return false;
    }

    // Validate event bus settings
    if (config.event_bus.debounce_ms < 0) {
        error = "event_bus.debounce_ms must be >= 0";
        return false;
    }
    if (config.event_bus.batch_size < 1 || config.event_bus.max_log_size < 1 ||
        config.event_bus.subscriber_queue_size < 1) {
        error = "event_bus sizes must be at least 1";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    if (config.state.path.empty()) {
        error = "state.path must not be empty";
        return false;
    }
    if (config.state.autosave_interval_ms < 0) {
        error = "state.autosave_interval_ms must be >= 0";
        return false;
    }

    std::set<std::string> plugin_ids;
    for (const auto &record : config.plugins) {
        if (!plugin_ids.insert(record.id).second) {
            error = "Duplicate plugin id '" + record.id + "'";
            return false;
        }
        if (!record.supports_mode(record.runtime_mode)) {
            error = "Plugin '" + record.id + "' runtime_mode " + plugin::runtime_mode_to_string(record.runtime_mode) +
                    " is not in supported_modes";
            return false;
        }
    }

    std::set<std::string> device_ids;
    for (const auto &device : config.devices) {
        if (device.id.empty()) {
            error = "Device missing 'id' field";
            return false;
        }
        if (!device_ids.insert(device.id).second) {
            error = "Duplicate device id '" + device.id + "'";
            return false;
        }
    }

    for (const auto &link : config.links) {
        if (link.from.empty() || link.to.empty()) {
            error = "Link missing 'from' or 'to' field";
            return false;
        }
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!parse_yaml(yaml, config, error)) {
            return false;
        }
    } catch (const YAML::Exception &e) {
        error = "Failed to load config " + config_path + ": " + e.what();
        return false;
    }
    LOG_INFO("[Config] Loaded " << config_path);
    return validate_config(config, error);
}

bool parse_config(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        if (!parse_yaml(yaml, config, error)) {
            return false;
        }
    } catch (const YAML::Exception &e) {
        error = std::string("Invalid config: ") + e.what();
        return false;
    }
    return validate_config(config, error);
}

}  // namespace runtime
}  // namespace hearth

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config_schema.hpp"

namespace hearth {
namespace plugin {

/**
 * Execution topologies a plugin instance can run under.
 *
 * - IN_PROCESS:   plugin object invoked directly in the orchestrator
 * - MICROSERVICE: separate process reached over the framed RPC channel
 * - HYBRID:       in-process shim for local_topics, microservice for the rest
 * - EMBEDDED:     in-process call contract behind a sandboxed context
 */
enum class RuntimeMode { IN_PROCESS, MICROSERVICE, HYBRID, EMBEDDED };

// "in_process", "microservice", "hybrid", "embedded"
const char *runtime_mode_to_string(RuntimeMode mode);

// Accepts the names above and "in-process". Returns std::nullopt otherwise.
std::optional<RuntimeMode> string_to_runtime_mode(const std::string &str);

struct Entrypoint {
    std::string command;  // empty = orchestrator.plugin_host
    std::vector<std::string> args;
};

// Limits applied to an embedded-mode plugin's context
struct SandboxPolicy {
    size_t max_bindings = 16;
    size_t max_subscriptions = 32;
    std::vector<std::string> allowed_emit_prefixes;  // empty = "<plugin_id>." only
    int max_emits_per_second = 50;
};

struct Dependency {
    std::string plugin_id;
    std::string version_spec;  // ">=1.0,<2.0"; empty = any
    bool optional = false;     // optional: version checked only when loaded
};

/**
 * @brief Registry record for one plugin
 *
 * Invariant (enforced by PluginRegistry): runtime_mode is a member of
 * supported_modes.
 */
struct PluginRecord {
    std::string id;
    std::string name;
    std::string description;
    std::string publisher;
    std::string latest_version;

    bool enabled = false;  // operator intent
    bool loaded = false;   // actual runtime state

    RuntimeMode runtime_mode = RuntimeMode::IN_PROCESS;
    std::vector<RuntimeMode> supported_modes{RuntimeMode::IN_PROCESS};  // ordered, no duplicates
    bool mode_switch_supported = false;

    nlohmann::json config = nlohmann::json::object();
    int64_t created_at = 0;  // epoch ms

    // Name of the implementation in the plugin factory table (empty = id)
    std::string implementation;

    ConfigSchema config_schema;
    Entrypoint entrypoint;
    std::vector<std::string> local_topics;
    SandboxPolicy sandbox;
    std::vector<Dependency> dependencies;

    bool supports_mode(RuntimeMode mode) const;
    const std::string &implementation_id() const { return implementation.empty() ? id : implementation; }
};

nlohmann::json plugin_record_to_json(const PluginRecord &record);

/**
 * @brief Parse a plugin record (state file, config entry or install manifest)
 *
 * Only id or name is mandatory; everything else has a default.
 * A missing runtime_mode defaults to the first supported mode.
 *
 * @return false with error set on malformed input
 */
bool plugin_record_from_json(const nlohmann::json &json, PluginRecord &record, std::string &error);

}  // namespace plugin
}  // namespace hearth

#include "plugin_types.hpp"

#include <algorithm>

namespace hearth {
namespace plugin {

const char *runtime_mode_to_string(RuntimeMode mode) {
    switch (mode) {
        case RuntimeMode::IN_PROCESS:
            return "in_process";
        case RuntimeMode::MICROSERVICE:
            return "microservice";
        case RuntimeMode::HYBRID:
            return "hybrid";
        case RuntimeMode::EMBEDDED:
            return "embedded";
        default:
            return "unknown";
    }
}

std::optional<RuntimeMode> string_to_runtime_mode(const std::string &str) {
    if (str == "in_process" || str == "in-process") {
        return RuntimeMode::IN_PROCESS;
    }
    if (str == "microservice") {
        return RuntimeMode::MICROSERVICE;
    }
    if (str == "hybrid") {
        return RuntimeMode::HYBRID;
    }
    if (str == "embedded") {
        return RuntimeMode::EMBEDDED;
    }
    return std::nullopt;
}

bool PluginRecord::supports_mode(RuntimeMode mode) const {
    return std::find(supported_modes.begin(), supported_modes.end(), mode) != supported_modes.end();
}

nlohmann::json plugin_record_to_json(const PluginRecord &record) {
    nlohmann::json modes = nlohmann::json::array();
    for (auto mode : record.supported_modes) {
        modes.push_back(runtime_mode_to_string(mode));
    }

    nlohmann::json dependencies = nlohmann::json::array();
    for (const auto &dep : record.dependencies) {
        nlohmann::json entry = {{"plugin_id", dep.plugin_id}, {"version_spec", dep.version_spec}};
        if (dep.optional) entry["optional"] = true;
        dependencies.push_back(std::move(entry));
    }

    nlohmann::json json = {
        {"id", record.id},
        {"name", record.name},
        {"description", record.description},
        {"publisher", record.publisher},
        {"latest_version", record.latest_version},
        {"enabled", record.enabled},
        {"loaded", record.loaded},
        {"runtime_mode", runtime_mode_to_string(record.runtime_mode)},
        {"supported_modes", modes},
        {"mode_switch_supported", record.mode_switch_supported},
        {"config", record.config},
        {"created_at", record.created_at},
        {"config_schema", config_schema_to_json(record.config_schema)},
        {"entrypoint", {{"command", record.entrypoint.command}, {"args", record.entrypoint.args}}},
        {"local_topics", record.local_topics},
        {"sandbox",
         {{"max_bindings", record.sandbox.max_bindings},
          {"max_subscriptions", record.sandbox.max_subscriptions},
          {"allowed_emit_prefixes", record.sandbox.allowed_emit_prefixes},
          {"max_emits_per_second", record.sandbox.max_emits_per_second}}},
        {"dependencies", dependencies},
    };
    if (!record.implementation.empty()) {
        json["implementation"] = record.implementation;
    }
    return json;
}

bool plugin_record_from_json(const nlohmann::json &json, PluginRecord &record, std::string &error) {
    if (!json.is_object()) {
        error = "Plugin entry must be an object";
        return false;
    }

    try {
        record = PluginRecord();
        record.id = json.value("id", std::string());
        record.name = json.value("name", record.id);
        if (record.id.empty()) {
            record.id = record.name;
        }
        if (record.id.empty()) {
            error = "Plugin entry needs an id or a name";
            return false;
        }

        record.description = json.value("description", std::string());
        record.publisher = json.value("publisher", std::string());
        const char *version_key = json.contains("latest_version") ? "latest_version" : "version";
        if (json.contains(version_key)) {
            // YAML manifests may type "1.2" as a number
            const auto &version = json.at(version_key);
            record.latest_version = version.is_string() ? version.get<std::string>() : version.dump();
        }
        record.enabled = json.value("enabled", false);
        record.loaded = json.value("loaded", false);
        record.mode_switch_supported = json.value("mode_switch_supported", false);
        record.created_at = json.value("created_at", int64_t{0});
        record.implementation = json.value("implementation", std::string());

        if (json.contains("supported_modes")) {
            record.supported_modes.clear();
            for (const auto &mode_json : json.at("supported_modes")) {
                const auto name = mode_json.get<std::string>();
                auto mode = string_to_runtime_mode(name);
                if (!mode) {
                    error = "Plugin '" + record.id + "': unknown runtime mode '" + name + "'";
                    return false;
                }
                if (!record.supports_mode(*mode)) {
                    record.supported_modes.push_back(*mode);
                }
            }
        }

        if (json.contains("runtime_mode")) {
            const auto name = json.at("runtime_mode").get<std::string>();
            auto mode = string_to_runtime_mode(name);
            if (!mode) {
                error = "Plugin '" + record.id + "': unknown runtime mode '" + name + "'";
                return false;
            }
            record.runtime_mode = *mode;
        } else if (!record.supported_modes.empty()) {
            record.runtime_mode = record.supported_modes.front();
        }

        if (json.contains("config") && !json.at("config").is_null()) {
            record.config = json.at("config");
        }

        if (json.contains("config_schema")) {
            if (!config_schema_from_json(json.at("config_schema"), record.config_schema, error)) {
                error = "Plugin '" + record.id + "': " + error;
                return false;
            }
        }

        if (json.contains("entrypoint")) {
            const auto &ep = json.at("entrypoint");
            record.entrypoint.command = ep.value("command", std::string());
            record.entrypoint.args = ep.value("args", std::vector<std::string>());
        }

        record.local_topics = json.value("local_topics", std::vector<std::string>());

        if (json.contains("sandbox")) {
            const auto &sb = json.at("sandbox");
            record.sandbox.max_bindings = sb.value("max_bindings", record.sandbox.max_bindings);
            record.sandbox.max_subscriptions = sb.value("max_subscriptions", record.sandbox.max_subscriptions);
            record.sandbox.allowed_emit_prefixes = sb.value("allowed_emit_prefixes", std::vector<std::string>());
            record.sandbox.max_emits_per_second = sb.value("max_emits_per_second", record.sandbox.max_emits_per_second);
        }

        if (json.contains("dependencies")) {
            for (const auto &dep_json : json.at("dependencies")) {
                Dependency dep;
                if (dep_json.is_string()) {
                    dep.plugin_id = dep_json.get<std::string>();
                } else {
                    dep.plugin_id = dep_json.at("plugin_id").get<std::string>();
                    dep.version_spec = dep_json.value("version_spec", std::string());
                    dep.optional = dep_json.value("optional", false);
                }
                record.dependencies.push_back(std::move(dep));
            }
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Malformed plugin entry: ") + e.what();
        return false;
    }

    return true;
}

}  // namespace plugin
}  // namespace hearth

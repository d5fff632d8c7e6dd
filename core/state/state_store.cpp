#include "state_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/clock.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace state {

namespace {

nlohmann::json binding_to_json(const devices::Binding &binding) {
    return {{"binding_id", binding.binding_id},
            {"plugin_id", binding.plugin_id},
            {"selector", binding.selector},
            {"created_at", binding.created_at}};
}

nlohmann::json link_to_json(const graph::DeviceLink &link) {
    return {{"from", link.from},
            {"to", link.to},
            {"type", graph::link_type_to_string(link.type)},
            {"direction", graph::link_direction_to_string(link.direction)}};
}

bool link_from_json(const nlohmann::json &json, graph::DeviceLink &link, std::string &error) {
    link.from = json.at("from").get<std::string>();
    link.to = json.at("to").get<std::string>();

    const auto type_name = json.value("type", std::string("bridge"));
    auto type = graph::string_to_link_type(type_name);
    if (!type) {
        error = "Link " + link.from + " -> " + link.to + ": unknown type '" + type_name + "'";
        return false;
    }
    const auto direction_name = json.value("direction", std::string("unidirectional"));
    auto direction = graph::string_to_link_direction(direction_name);
    if (!direction) {
        error = "Link " + link.from + " -> " + link.to + ": unknown direction '" + direction_name + "'";
        return false;
    }
    link.type = *type;
    link.direction = *direction;
    return true;
}

}  // namespace

nlohmann::json persisted_state_to_json(const PersistedState &state) {
    nlohmann::json plugins = nlohmann::json::array();
    for (const auto &record : state.plugins) {
        plugins.push_back(plugin::plugin_record_to_json(record));
    }
    nlohmann::json jobs = nlohmann::json::array();
    for (const auto &job : state.jobs) {
        jobs.push_back(jobs::install_job_to_json(job));
    }
    nlohmann::json devices = nlohmann::json::array();
    for (const auto &device : state.devices) {
        devices.push_back(devices::device_to_json(device));
    }
    nlohmann::json bindings = nlohmann::json::array();
    for (const auto &binding : state.bindings) {
        bindings.push_back(binding_to_json(binding));
    }
    nlohmann::json links = nlohmann::json::array();
    for (const auto &link : state.links) {
        links.push_back(link_to_json(link));
    }

    return {{"version", StateStore::kFormatVersion},
            {"saved_at", state.saved_at},
            {"plugins", plugins},
            {"install_jobs", jobs},
            {"devices", devices},
            {"bindings", bindings},
            {"links", links}};
}

bool persisted_state_from_json(const nlohmann::json &json, PersistedState &state, std::string &error) {
    if (!json.is_object()) {
        error = "State document must be an object";
        return false;
    }

    state = PersistedState();
    try {
        const int version = json.value("version", StateStore::kFormatVersion);
        if (version != StateStore::kFormatVersion) {
            error = "Unsupported state format version " + std::to_string(version);
            return false;
        }
        state.saved_at = json.value("saved_at", int64_t{0});

        for (const auto &entry : json.value("plugins", nlohmann::json::array())) {
            plugin::PluginRecord record;
            if (!plugin::plugin_record_from_json(entry, record, error)) {
                return false;
            }
            state.plugins.push_back(std::move(record));
        }

        for (const auto &entry : json.value("install_jobs", nlohmann::json::array())) {
            jobs::InstallJob job;
            if (!jobs::install_job_from_json(entry, job, error)) {
                return false;
            }
            state.jobs.push_back(std::move(job));
        }

        for (const auto &entry : json.value("devices", nlohmann::json::array())) {
            state.devices.push_back(devices::device_from_json(entry));
        }

        for (const auto &entry : json.value("bindings", nlohmann::json::array())) {
            devices::Binding binding;
            binding.binding_id = entry.value("binding_id", uint64_t{0});
            binding.plugin_id = entry.at("plugin_id").get<std::string>();
            binding.selector = entry.at("selector").get<std::string>();
            binding.created_at = entry.value("created_at", int64_t{0});
            state.bindings.push_back(std::move(binding));
        }

        for (const auto &entry : json.value("links", nlohmann::json::array())) {
            graph::DeviceLink link;
            if (!link_from_json(entry, link, error)) {
                return false;
            }
            state.links.push_back(std::move(link));
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Malformed state document: ") + e.what();
        return false;
    }
    return true;
}

StateStore::StateStore(const std::string &path) : path_(path) {}

bool StateStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

bool StateStore::load(PersistedState &state, std::string &error) const {
    state = PersistedState();
    if (!exists()) {
        LOG_INFO("[StateStore] No state file at " << path_ << ", starting empty");
        return true;
    }

    std::ifstream file(path_);
    if (!file) {
        error = "Cannot open state file: " + path_;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception &e) {
        error = "State file " + path_ + " is not valid JSON: " + e.what();
        return false;
    }

    if (!persisted_state_from_json(json, state, error)) {
        error = path_ + ": " + error;
        return false;
    }

    // Nothing is running yet, whatever the file says
    for (auto &record : state.plugins) {
        record.loaded = false;
    }

    LOG_INFO("[StateStore] Loaded " << state.plugins.size() << " plugins, " << state.jobs.size() << " jobs, "
                                    << state.devices.size() << " devices and " << state.links.size()
                                    << " links from " << path_);
    return true;
}

bool StateStore::save(const PersistedState &state, std::string &error) const {
    PersistedState stamped = state;
    if (stamped.saved_at == 0) {
        stamped.saved_at = now_epoch_ms();
    }

    std::error_code ec;
    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            error = "Cannot write state file: " + tmp_path;
            return false;
        }
        file << persisted_state_to_json(stamped).dump(2) << "\n";
        if (!file) {
            error = "Write to " + tmp_path + " failed";
            return false;
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        error = "Cannot replace " + path_ + ": " + ec.message();
        return false;
    }

    LOG_DEBUG("[StateStore] Saved state to " << path_);
    return true;
}

}  // namespace state
}  // namespace hearth

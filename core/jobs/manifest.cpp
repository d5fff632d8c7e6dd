#include "manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/yaml_json.hpp"

namespace hearth {
namespace jobs {

const char *const kManifestFileNames[3] = {"hearth-plugin.json", "hearth-plugin.yaml", "hearth-plugin.yml"};

ManifestFormat manifest_format_for(const std::string &path) {
    auto ends_with = [&path](const std::string &suffix) {
        return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return (ends_with(".yaml") || ends_with(".yml")) ? ManifestFormat::YAML : ManifestFormat::JSON;
}

bool parse_manifest(const std::string &text, ManifestFormat format, plugin::PluginRecord &manifest,
                    std::string &error) {
    nlohmann::json json;
    try {
        if (format == ManifestFormat::YAML) {
            json = yaml_to_json(YAML::Load(text));
        } else {
            json = nlohmann::json::parse(text);
        }
    } catch (const YAML::Exception &e) {
        error = std::string("Manifest YAML parse error: ") + e.what();
        return false;
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Manifest JSON parse error: ") + e.what();
        return false;
    }

    if (!plugin_record_from_json(json, manifest, error)) {
        return false;
    }
    manifest.enabled = false;
    manifest.loaded = false;
    manifest.created_at = 0;
    return true;
}

bool load_manifest_from_directory(const std::string &directory, plugin::PluginRecord &manifest, std::string &error) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        error = "Not a directory: " + directory;
        return false;
    }

    for (const char *name : kManifestFileNames) {
        const auto path = std::filesystem::path(directory) / name;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }

        std::ifstream file(path);
        if (!file) {
            error = "Cannot read manifest: " + path.string();
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse_manifest(buffer.str(), manifest_format_for(name), manifest, error);
    }

    error = "No hearth-plugin.json or hearth-plugin.yaml in " + directory;
    return false;
}

}  // namespace jobs
}  // namespace hearth

#pragma once

#include <string>

#include "plugin/plugin_types.hpp"

namespace hearth {
namespace jobs {

// File names searched, in order, in a plugin directory
extern const char *const kManifestFileNames[3];

enum class ManifestFormat { JSON, YAML };

/**
 * @brief Parse manifest text into a plugin record
 *
 * Manifests carry the plugin record fields (id, name, version,
 * supported_modes, config_schema, entrypoint, ...). Operator state
 * (enabled, loaded) in a manifest is ignored.
 */
bool parse_manifest(const std::string &text, ManifestFormat format, plugin::PluginRecord &manifest,
                    std::string &error);

// Find and parse the manifest in a directory
bool load_manifest_from_directory(const std::string &directory, plugin::PluginRecord &manifest, std::string &error);

// Guess the format from a file name or URL path (".yaml"/".yml" -> YAML)
ManifestFormat manifest_format_for(const std::string &path);

}  // namespace jobs
}  // namespace hearth

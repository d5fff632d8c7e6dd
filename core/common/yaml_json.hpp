#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace hearth {

/**
 * @brief Convert a YAML node tree into JSON
 *
 * Scalars are typed by content: true/false become booleans, integral text
 * becomes int64, other numeric text becomes double, everything else stays
 * a string. Quoted scalars are always strings.
 */
nlohmann::json yaml_to_json(const YAML::Node &node);

}  // namespace hearth

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hearth {
namespace plugin {

/**
 * @brief Field types a plugin may declare in its config schema
 */
enum class FieldType { DOUBLE, INT64, BOOL, STRING };

inline const char *field_type_to_string(FieldType type) {
    switch (type) {
        case FieldType::DOUBLE:
            return "double";
        case FieldType::INT64:
            return "int64";
        case FieldType::BOOL:
            return "bool";
        case FieldType::STRING:
            return "string";
        default:
            return "unknown";
    }
}

inline std::optional<FieldType> field_type_from_string(const std::string_view type_name) {
    if (type_name == "double") {
        return FieldType::DOUBLE;
    }
    if (type_name == "int64") {
        return FieldType::INT64;
    }
    if (type_name == "bool") {
        return FieldType::BOOL;
    }
    if (type_name == "string") {
        return FieldType::STRING;
    }
    return std::nullopt;
}

/**
 * @brief One declared config key with validation constraints
 */
struct ConfigField {
    std::string name;
    FieldType type = FieldType::STRING;
    bool required = false;

    // Validation constraints
    std::optional<double> min;                               // For numeric types
    std::optional<double> max;                               // For numeric types
    std::optional<std::vector<std::string>> allowed_values;  // For string enums

    nlohmann::json default_value;  // null = no default

    /**
     * @brief Validate a value against type and constraints
     *
     * @param value Value to validate
     * @param error Output error message if validation fails
     * @return true if valid, false otherwise
     */
    bool validate(const nlohmann::json &value, std::string &error) const;
};

/**
 * @brief Declared shape of a plugin's opaque config blob
 *
 * An empty schema accepts any JSON object. Keys not named by the schema are
 * accepted and passed through untouched; the plugin owns their meaning.
 */
struct ConfigSchema {
    std::vector<ConfigField> fields;

    bool empty() const { return fields.empty(); }

    // Config must be an object; every declared key present must validate,
    // required keys must be present (after defaults are applied)
    bool validate(const nlohmann::json &config, std::string &error) const;

    // Copy of config with defaults filled in for absent keys
    nlohmann::json apply_defaults(const nlohmann::json &config) const;
};

nlohmann::json config_schema_to_json(const ConfigSchema &schema);
bool config_schema_from_json(const nlohmann::json &json, ConfigSchema &schema, std::string &error);

}  // namespace plugin
}  // namespace hearth

#include "config_schema.hpp"

#include <algorithm>

namespace hearth {
namespace plugin {

namespace {

const char *json_type_name(const nlohmann::json &value) {
    if (value.is_boolean()) return "bool";
    if (value.is_number_integer()) return "int64";
    if (value.is_number_float()) return "double";
    if (value.is_string()) return "string";
    if (value.is_null()) return "null";
    if (value.is_array()) return "array";
    return "object";
}

bool type_matches(FieldType type, const nlohmann::json &value) {
    switch (type) {
        case FieldType::DOUBLE:
            // Integers are acceptable wherever a double is declared
            return value.is_number();
        case FieldType::INT64:
            return value.is_number_integer();
        case FieldType::BOOL:
            return value.is_boolean();
        case FieldType::STRING:
            return value.is_string();
        default:
            return false;
    }
}

}  // namespace

bool ConfigField::validate(const nlohmann::json &value, std::string &error) const {
    if (!type_matches(type, value)) {
        error = "Field '" + name + "': type mismatch, expected " + field_type_to_string(type) + ", got " +
                json_type_name(value);
        return false;
    }

    // Numeric range validation
    if (type == FieldType::DOUBLE || type == FieldType::INT64) {
        const double numeric_value = value.get<double>();

        if (min.has_value() && numeric_value < min.value()) {
            error = "Field '" + name + "': value " + value.dump() + " is below minimum " + std::to_string(min.value());
            return false;
        }

        if (max.has_value() && numeric_value > max.value()) {
            error = "Field '" + name + "': value " + value.dump() + " exceeds maximum " + std::to_string(max.value());
            return false;
        }
    }

    // String enum validation
    if (type == FieldType::STRING && allowed_values.has_value()) {
        const auto str_value = value.get<std::string>();
        const auto &allowed = allowed_values.value();

        if (std::find(allowed.begin(), allowed.end(), str_value) == allowed.end()) {
            error = "Field '" + name + "': value '" + str_value + "' not in allowed values: [";
            for (size_t i = 0; i < allowed.size(); ++i) {
                error += allowed[i];
                if (i < allowed.size() - 1) error += ", ";
            }
            error += "]";
            return false;
        }
    }

    return true;
}

bool ConfigSchema::validate(const nlohmann::json &config, std::string &error) const {
    if (!config.is_object()) {
        error = "Config must be an object";
        return false;
    }

    for (const auto &field : fields) {
        auto it = config.find(field.name);
        if (it == config.end()) {
            if (field.required && field.default_value.is_null()) {
                error = "Field '" + field.name + "' is required";
                return false;
            }
            continue;
        }
        if (!field.validate(*it, error)) {
            return false;
        }
    }
    return true;
}

nlohmann::json ConfigSchema::apply_defaults(const nlohmann::json &config) const {
    nlohmann::json result = config.is_object() ? config : nlohmann::json::object();
    for (const auto &field : fields) {
        if (!field.default_value.is_null() && !result.contains(field.name)) {
            result[field.name] = field.default_value;
        }
    }
    return result;
}

nlohmann::json config_schema_to_json(const ConfigSchema &schema) {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto &field : schema.fields) {
        nlohmann::json entry = {{"name", field.name}, {"type", field_type_to_string(field.type)}};
        if (field.required) entry["required"] = true;
        if (field.min) entry["min"] = *field.min;
        if (field.max) entry["max"] = *field.max;
        if (field.allowed_values) entry["allowed_values"] = *field.allowed_values;
        if (!field.default_value.is_null()) entry["default"] = field.default_value;
        fields.push_back(std::move(entry));
    }
    return fields;
}

bool config_schema_from_json(const nlohmann::json &json, ConfigSchema &schema, std::string &error) {
    schema.fields.clear();
    if (json.is_null()) {
        return true;
    }
    if (!json.is_array()) {
        error = "config_schema must be a list of fields";
        return false;
    }

    try {
        for (const auto &entry : json) {
            ConfigField field;
            field.name = entry.at("name").get<std::string>();
            if (field.name.empty()) {
                error = "config_schema field name must not be empty";
                return false;
            }

            const auto type_name = entry.value("type", std::string("string"));
            auto type = field_type_from_string(type_name);
            if (!type) {
                error = "config_schema field '" + field.name + "' has invalid type '" + type_name +
                        "' (must be double, int64, bool or string)";
                return false;
            }
            field.type = *type;
            field.required = entry.value("required", false);

            if (entry.contains("min")) field.min = entry.at("min").get<double>();
            if (entry.contains("max")) field.max = entry.at("max").get<double>();
            if (entry.contains("allowed_values")) {
                field.allowed_values = entry.at("allowed_values").get<std::vector<std::string>>();
            }
            if (entry.contains("default")) {
                field.default_value = entry.at("default");
                std::string default_error;
                if (!field.validate(field.default_value, default_error)) {
                    error = "config_schema default invalid: " + default_error;
                    return false;
                }
            }
            schema.fields.push_back(std::move(field));
        }
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Malformed config_schema: ") + e.what();
        return false;
    }
    return true;
}

}  // namespace plugin
}  // namespace hearth

#include "yaml_json.hpp"

#include <cstdint>
#include <string>

namespace hearth {

namespace {

nlohmann::json scalar_to_json(const YAML::Node &node) {
    const std::string &text = node.Scalar();

    // Quoted in the source document
    if (node.Tag() == "!") {
        return text;
    }

    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;
    if (text == "~" || text == "null") return nullptr;

    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(node, int_value)) {
        return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(node, double_value)) {
        return double_value;
    }
    return text;
}

}  // namespace

nlohmann::json yaml_to_json(const YAML::Node &node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
        default:
            return nullptr;
    }
}

}  // namespace hearth

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "common/status.hpp"
#include "events/event_types.hpp"
#include "graph/device_link_graph.hpp"
#include "plugin_protocol.pb.h"

namespace hearth {
namespace transport {

namespace v1 = hearth::plugin::v1;

// Protocol version spoken by both ends
constexpr const char *kProtocolVersion = "v1";

v1::Status_Code to_proto_code(ErrorCode code);
ErrorCode from_proto_code(v1::Status_Code code);

void set_status(v1::Response &response, const Status &status);
Status status_from_response(const v1::Response &response);

void event_to_proto(const events::Event &event, v1::Event *out);
bool event_from_proto(const v1::Event &in, events::Event &event, std::string &error);

void links_to_proto(const std::vector<graph::DeviceLink> &links, uint64_t revision, v1::LinkSet *out);

// Parse a JSON document carried as a string field; "" decodes as an empty object
bool parse_json_field(const std::string &text, nlohmann::json &value, std::string &error);

}  // namespace transport
}  // namespace hearth

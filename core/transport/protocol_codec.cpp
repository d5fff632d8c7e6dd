#include "protocol_codec.hpp"

namespace hearth {
namespace transport {

v1::Status_Code to_proto_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return v1::Status_Code_CODE_OK;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_CONFIG:
            return v1::Status_Code_CODE_INVALID_ARGUMENT;
        case ErrorCode::NOT_FOUND:
            return v1::Status_Code_CODE_NOT_FOUND;
        case ErrorCode::FAILED_PRECONDITION:
        case ErrorCode::LOAD_FAILED:
            return v1::Status_Code_CODE_FAILED_PRECONDITION;
        case ErrorCode::UNAVAILABLE:
        case ErrorCode::TIMEOUT:
            return v1::Status_Code_CODE_UNAVAILABLE;
        default:
            return v1::Status_Code_CODE_INTERNAL;
    }
}

ErrorCode from_proto_code(v1::Status_Code code) {
    switch (code) {
        case v1::Status_Code_CODE_OK:
            return ErrorCode::OK;
        case v1::Status_Code_CODE_INVALID_ARGUMENT:
            return ErrorCode::INVALID_ARGUMENT;
        case v1::Status_Code_CODE_NOT_FOUND:
            return ErrorCode::NOT_FOUND;
        case v1::Status_Code_CODE_FAILED_PRECONDITION:
            return ErrorCode::FAILED_PRECONDITION;
        case v1::Status_Code_CODE_UNAVAILABLE:
            return ErrorCode::UNAVAILABLE;
        default:
            return ErrorCode::INTERNAL;
    }
}

void set_status(v1::Response &response, const Status &status) {
    auto *proto_status = response.mutable_status();
    proto_status->set_code(to_proto_code(status.code()));
    proto_status->set_message(status.message());
}

Status status_from_response(const v1::Response &response) {
    if (!response.has_status() || response.status().code() == v1::Status_Code_CODE_OK) {
        return Status::success();
    }
    return Status::error(from_proto_code(response.status().code()), response.status().message());
}

void event_to_proto(const events::Event &event, v1::Event *out) {
    out->set_event_id(event.event_id);
    out->set_topic(event.topic);
    out->set_payload_json(event.payload.dump());
    out->set_source(event.source);
    out->set_timestamp_ms(event.timestamp_ms);
}

bool event_from_proto(const v1::Event &in, events::Event &event, std::string &error) {
    event.event_id = in.event_id();
    event.topic = in.topic();
    event.source = in.source();
    event.timestamp_ms = in.timestamp_ms();
    return parse_json_field(in.payload_json(), event.payload, error);
}

void links_to_proto(const std::vector<graph::DeviceLink> &links, uint64_t revision, v1::LinkSet *out) {
    out->set_revision(revision);
    out->clear_links();
    for (const auto &link : links) {
        auto *proto_link = out->add_links();
        proto_link->set_from(link.from);
        proto_link->set_to(link.to);
        proto_link->set_link_type(graph::link_type_to_string(link.type));
        proto_link->set_direction(graph::link_direction_to_string(link.direction));
    }
}

bool parse_json_field(const std::string &text, nlohmann::json &value, std::string &error) {
    if (text.empty()) {
        value = nlohmann::json::object();
        return true;
    }
    try {
        value = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON payload: ") + e.what();
        return false;
    }
    return true;
}

}  // namespace transport
}  // namespace hearth

#pragma once

#include <string>

namespace hearth {

/**
 * @brief Error taxonomy shared by every orchestrator component
 *
 * Components never throw across their public API. Fallible operations
 * return a Status carrying one of these codes plus a human-readable message.
 */
enum class ErrorCode {
    OK,
    NOT_FOUND,
    INVALID_ARGUMENT,
    FAILED_PRECONDITION,
    CONFLICTING_JOB,
    QUEUE_FULL,
    TIMEOUT,
    INVALID_CONFIG,
    DUPLICATE_NAME,
    UNSUPPORTED_MODE,
    SWITCH_FAILED,
    LOAD_FAILED,
    CYCLE_REJECTED,
    INVALID_LINK_TYPE,
    INVALID_DIRECTION,
    LINK_EXISTS,
    HANDLER_FAILURE,
    UNAVAILABLE,
    INTERNAL
};

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::FAILED_PRECONDITION:
            return "FAILED_PRECONDITION";
        case ErrorCode::CONFLICTING_JOB:
            return "CONFLICTING_JOB";
        case ErrorCode::QUEUE_FULL:
            return "QUEUE_FULL";
        case ErrorCode::TIMEOUT:
            return "TIMEOUT";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ErrorCode::DUPLICATE_NAME:
            return "DUPLICATE_NAME";
        case ErrorCode::UNSUPPORTED_MODE:
            return "UNSUPPORTED_MODE";
        case ErrorCode::SWITCH_FAILED:
            return "SWITCH_FAILED";
        case ErrorCode::LOAD_FAILED:
            return "LOAD_FAILED";
        case ErrorCode::CYCLE_REJECTED:
            return "CYCLE_REJECTED";
        case ErrorCode::INVALID_LINK_TYPE:
            return "INVALID_LINK_TYPE";
        case ErrorCode::INVALID_DIRECTION:
            return "INVALID_DIRECTION";
        case ErrorCode::LINK_EXISTS:
            return "LINK_EXISTS";
        case ErrorCode::HANDLER_FAILURE:
            return "HANDLER_FAILURE";
        case ErrorCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case ErrorCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Result of a fallible operation
 *
 * Default-constructed Status is OK. Use Status::error() to build failures.
 */
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status success() { return Status(); }
    static Status error(ErrorCode code, const std::string &message) { return Status(code, message); }

    bool ok() const { return code_ == ErrorCode::OK; }
    ErrorCode code() const { return code_; }
    const std::string &message() const { return message_; }

    // "CODE: message" (or just "OK")
    std::string to_string() const {
        if (ok()) {
            return "OK";
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_ = ErrorCode::OK;
    std::string message_;
};

}  // namespace hearth

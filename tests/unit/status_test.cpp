#include "common/status.hpp"

#include <gtest/gtest.h>

using namespace hearth;

TEST(StatusTest, DefaultIsOk) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::OK);
    EXPECT_EQ(status.to_string(), "OK");
}

TEST(StatusTest, ErrorCarriesCodeAndMessage) {
    Status status = Status::error(ErrorCode::CYCLE_REJECTED, "a -> b closes a loop");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::CYCLE_REJECTED);
    EXPECT_EQ(status.message(), "a -> b closes a loop");
    EXPECT_EQ(status.to_string(), "CYCLE_REJECTED: a -> b closes a loop");
}

TEST(StatusTest, EveryCodeHasAName) {
    const ErrorCode codes[] = {ErrorCode::NOT_FOUND,        ErrorCode::INVALID_ARGUMENT, ErrorCode::FAILED_PRECONDITION,
                               ErrorCode::CONFLICTING_JOB,  ErrorCode::QUEUE_FULL,       ErrorCode::TIMEOUT,
                               ErrorCode::INVALID_CONFIG,   ErrorCode::DUPLICATE_NAME,   ErrorCode::UNSUPPORTED_MODE,
                               ErrorCode::SWITCH_FAILED,    ErrorCode::LOAD_FAILED,      ErrorCode::CYCLE_REJECTED,
                               ErrorCode::INVALID_LINK_TYPE, ErrorCode::INVALID_DIRECTION, ErrorCode::LINK_EXISTS,
                               ErrorCode::HANDLER_FAILURE,  ErrorCode::UNAVAILABLE,      ErrorCode::INTERNAL};
    for (ErrorCode code : codes) {
        EXPECT_STRNE(error_code_to_string(code), "OK");
    }
    EXPECT_STREQ(error_code_to_string(ErrorCode::QUEUE_FULL), "QUEUE_FULL");
}

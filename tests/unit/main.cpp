#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicit init so --gtest_list_tests and filters work during CTest discovery
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Component logs are noisy under test; HEARTH_TEST_LOG_LEVEL=debug brings them back
    const char *level = std::getenv("HEARTH_TEST_LOG_LEVEL");
    hearth::logging::Logger::init(hearth::logging::string_to_level(level ? level : "warn"));

    return RUN_ALL_TESTS();
}

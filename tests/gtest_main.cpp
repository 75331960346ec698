#include <gtest/gtest.h>

#include "../common/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; failures still show WARN/ERROR lines
    Logger::get().set_level(LogLevel::WARN);

    return RUN_ALL_TESTS();
}

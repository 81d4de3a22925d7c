#include <gtest/gtest.h>

#include "utils/Logger.hpp"

using namespace Memopair;

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; warnings about skipped records are expected in several tests
    auto& logger = Utils::Logger::instance();
    logger.set_log_level(LogLevel::LOG_ERROR);
    logger.set_color(false);

    return RUN_ALL_TESTS();
}

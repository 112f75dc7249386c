#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    // MESHRTC_LOG_LEVEL=verbose to trace the rooms under test.
    auto level = meshrtc::logging::Level::WARNING;
    if (const char* env_level = std::getenv("MESHRTC_LOG_LEVEL")) {
        level = meshrtc::logging::LevelFromString(env_level).value_or(level);
    }
    meshrtc::logging::InitLogger(level);
    // Suites disabled with the FILTERED_ prefix in unittest_defines.hpp
    testing::GTEST_FLAG(filter) = "-FILTERED_*";
    return RUN_ALL_TESTS();
}

#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(LoggerTest, ForwardToCallback) {
    std::vector<std::pair<logging::Level, std::string>> records;
    logging::InitLogger(logging::Level::INFO, [&records](logging::Level level, std::string message) {
        records.emplace_back(level, std::move(message));
        return true;
    });

    PLOG_WARNING << "Room closed";
    PLOG_DEBUG << "Filtered out";

    // Back to the default of the test runner.
    logging::InitLogger(logging::Level::WARNING);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].first, logging::Level::WARNING);
    EXPECT_NE(records[0].second.find("Room closed"), std::string::npos);
}

MY_TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(logging::LevelFromString("verbose"), logging::Level::VERBOSE);
    EXPECT_EQ(logging::LevelFromString("warning"), logging::Level::WARNING);
    EXPECT_EQ(logging::LevelFromString("none"), logging::Level::NONE);
    EXPECT_FALSE(logging::LevelFromString("WARNING").has_value());
    EXPECT_FALSE(logging::LevelFromString("").has_value());

    EXPECT_EQ(logging::ToString(logging::Level::ERROR), "error");
    EXPECT_EQ(logging::ToString(logging::Level::DEBUG), "debug");
}

} // namespace test
} // namespace meshrtc

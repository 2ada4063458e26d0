#include "logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace sonora;
using namespace sonora::test;

TEST(LoggerTest, DeliversToEverySink) {
    auto first = std::make_shared<CapturingLogSink::Records>();
    auto second = std::make_shared<CapturingLogSink::Records>();
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<CapturingLogSink>(first));
    Logger::add_sink(std::make_unique<CapturingLogSink>(second));
    Logger::add_sink(nullptr);

    Logger::log(LogLevel::Info, "hello", "test");

    EXPECT_TRUE(first->contains(LogLevel::Info, "hello"));
    EXPECT_TRUE(second->contains(LogLevel::Info, "hello"));
    ASSERT_EQ(first->entries.size(), 1u);
    EXPECT_EQ(first->entries.front().tag, "test");

    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "dropped");
    EXPECT_EQ(first->entries.size(), 1u);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
}

TEST(LoggerTest, DropsMessagesBelowLevel) {
    ScopedLogCapture capture;
    Logger::set_level(LogLevel::Warning);

    Logger::log(LogLevel::Info, "too quiet");
    Logger::log(LogLevel::Error, "loud enough");
    Logger::set_level(LogLevel::Debug);

    EXPECT_FALSE(capture.contains(LogLevel::Info, "too quiet"));
    EXPECT_TRUE(capture.contains(LogLevel::Error, "loud enough"));
}

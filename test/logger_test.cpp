#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <main/utils/logger.hpp>

namespace {
    struct Captured {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    void capture(void* context, LogLevel level, const char* tag, const char* message) {
        static_cast<std::vector<Captured>*>(context)->push_back(Captured{level, tag, message});
    }

    class LoggerSinkTest : public ::testing::Test {
    protected:
        void SetUp() override {
            saved_level = Logger::getLevel();
            Logger::setLevel(LogLevel::INFO);
            Logger::setSink(&capture, &lines);
        }
        void TearDown() override {
            Logger::clearSink();
            Logger::setLevel(saved_level);
        }
        LogLevel saved_level = LogLevel::INFO;
        std::vector<Captured> lines;
    };
}

TEST_F(LoggerSinkTest, SinkSeesFormattedLines) {
    LOG_INFO("Pump", "ON for %.1fs", 12.26);
    LOG_ERROR("Net", "%s", "down");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].level, LogLevel::INFO);
    EXPECT_EQ(lines[0].tag, "Pump");
    EXPECT_EQ(lines[0].message, "ON for 12.3s");
    EXPECT_EQ(lines[1].level, LogLevel::ERROR);
}

TEST_F(LoggerSinkTest, FilteredLinesNeverReachSink) {
    LOG_DEBUG("Pump", "%s", "noise");
    EXPECT_TRUE(lines.empty());
    Logger::setLevel(LogLevel::WARN);
    LOG_INFO("Pump", "%s", "quiet");
    LOG_WARN("Pump", "%s", "loud");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].message, "loud");
}

TEST_F(LoggerSinkTest, ClearedSinkStopsForwarding) {
    Logger::clearSink();
    LOG_ERROR("Pump", "%s", "after clear");
    EXPECT_TRUE(lines.empty());
}

TEST(Logger, LevelNames) {
    EXPECT_STREQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(Logger::levelName(LogLevel::WARN), "WARNING");
    EXPECT_STREQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_STREQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
}

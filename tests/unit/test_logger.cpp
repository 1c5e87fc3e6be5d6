#include <gigmap/logger.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace gigmap;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.clear_sinks();
        logger.add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
        logger.set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    GIGMAP_LOG_INFO("axis", "Axis '{}' has {} members", std::string("genome"), 5);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "axis");
    EXPECT_EQ(entries_[0].message, "Axis 'genome' has 5 members");
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    GIGMAP_LOG_WARN("builder", "{} and {}", "one");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "one and {}");
}

TEST_F(LoggerTest, MessageWithoutArgumentsIsUnchanged)
{
    EXPECT_EQ(Logger::format_message("plain {} text"), "plain {} text");
    GIGMAP_LOG_INFO("app", "Wrote {}");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Wrote {}");
}

TEST_F(LoggerTest, PlaceholderInsideArgumentStaysLiteral)
{
    EXPECT_EQ(Logger::format_message("{} then {}", std::string("a{}b"), 2), "a{}b then 2");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    GIGMAP_LOG_DEBUG("x", "hidden");
    GIGMAP_LOG_INFO("x", "hidden");
    GIGMAP_LOG_ERROR("x", "shown");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggerTest, StreamSinkWritesFormattedLine)
{
    std::ostringstream out;
    Logger::instance().add_sink(sinks::stream_sink(out));
    GIGMAP_LOG_CRITICAL("app", "boom");
    EXPECT_NE(out.str().find("CRITICAL"), std::string::npos);
    EXPECT_NE(out.str().find("[app] boom"), std::string::npos);
}

TEST(LogLevel, ParsesNames)
{
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(*parse_log_level("Critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

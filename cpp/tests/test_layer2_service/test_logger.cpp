// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger utility.
 *
 * The Logger is started once by the test entry point. Each test redirects it to its
 * own log file and restores the console sink and the WARNING level afterwards.
 */
#include "lgtv_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <thread>

using namespace lgtv::tests::helper;
using lgtv::utils::Logger;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test
{
  protected:
    TempDir dir_{"logger"};

    void SetUp() override { ASSERT_TRUE(Logger::lifecycle_initialized()); }

    void TearDown() override
    {
        Logger::instance().set_level(Logger::Level::L_WARNING);
        Logger::instance().set_console();
    }

    fs::path RedirectTo(const std::string &name)
    {
        auto path = dir_ / name;
        EXPECT_TRUE(Logger::instance().set_logfile(path.string()));
        return path;
    }
};

TEST_F(LoggerTest, WritesComponentMessagesToFile)
{
    auto path = RedirectTo("basic.log");
    Logger::instance().set_level(Logger::Level::L_INFO);
    LOGGER_INFO("Session: connected to {}:{}", "192.168.1.20", 3000);
    Logger::instance().flush();

    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_THAT(contents, HasSubstr("Session: connected to 192.168.1.20:3000"));
    EXPECT_THAT(contents, HasSubstr("INFO"));
}

TEST_F(LoggerTest, MessagesBelowLevelAreFiltered)
{
    auto path = RedirectTo("filtered.log");
    Logger::instance().set_level(Logger::Level::L_WARNING);
    LOGGER_DEBUG("Transport: should not appear");
    LOGGER_INFO("Transport: should not appear either");
    LOGGER_WARN("Transport: visible warning");
    Logger::instance().flush();

    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_THAT(contents, HasSubstr("visible warning"));
    EXPECT_THAT(contents, Not(HasSubstr("should not appear")));
}

TEST_F(LoggerTest, ConcurrentWritersLoseNothingBelowQueueLimit)
{
    auto path = RedirectTo("threads.log");
    Logger::instance().set_level(Logger::Level::L_INFO);
    ThreadRacer racer(4);
    ASSERT_TRUE(racer.race(
        [](int id)
        {
            for (int i = 0; i < 50; ++i)
                LOGGER_INFO("Worker: thread {} line {}", id, i);
        }));
    Logger::instance().flush();

    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    size_t lines = 0;
    for (size_t pos = 0; (pos = contents.find("Worker: thread", pos)) != std::string::npos; ++pos)
        ++lines;
    EXPECT_EQ(lines, 200u);
}

TEST_F(LoggerTest, UnwritableLogFileIsRejectedAndExplained)
{
    auto path = RedirectTo("still_active.log");
    // A regular file where the parent directory should be.
    write_file_contents(dir_ / "blocker", "x");
    EXPECT_FALSE(Logger::instance().set_logfile((dir_ / "blocker" / "x.log").string()));
    LOGGER_WARN("Cli: still logging here");
    Logger::instance().flush();

    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_THAT(contents, HasSubstr("cannot log to"));
    EXPECT_THAT(contents, HasSubstr("Cli: still logging here"));
}

TEST_F(LoggerTest, SinkSwitchIsRecordedInBothSinks)
{
    auto first = RedirectTo("first.log");
    auto second = RedirectTo("second.log");
    Logger::instance().flush();

    std::string old_contents, new_contents;
    ASSERT_TRUE(read_file_contents(first.string(), old_contents));
    ASSERT_TRUE(read_file_contents(second.string(), new_contents));
    EXPECT_THAT(old_contents, HasSubstr("Switching log sink to"));
    EXPECT_THAT(new_contents, HasSubstr("Log sink switched from"));
}

TEST(LoggerLevelTest, ParseLevelNames)
{
    Logger::Level level = Logger::Level::L_ERROR;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, Logger::Level::L_DEBUG);
    EXPECT_TRUE(Logger::parse_level("WARN", level));
    EXPECT_EQ(level, Logger::Level::L_WARNING);
    EXPECT_FALSE(Logger::parse_level("verbose", level));
    EXPECT_EQ(level, Logger::Level::L_WARNING);
}

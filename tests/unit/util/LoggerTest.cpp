/**
 * @file LoggerTest.cpp
 * @brief Unit tests for util::Logger
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::HasSubstr;
using testing::Not;

class LoggerTest : public TempDirFixture {
protected:
    void TearDown() override {
        util::Logger::instance().close();
        util::Logger::instance().mirror_to_stderr(false);
        util::Logger::instance().set_min_level(util::LogLevel::INFO);
        TempDirFixture::TearDown();
    }

    auto Settings() const -> util::LogSettings {
        return util::LogSettings{.directory = temp_dir, .app_name = "audit"};
    }

    auto LogContents() const -> std::string { return ReadFile(temp_dir / "audit.log"); }
};

TEST_F(LoggerTest, ParseLogLevel_KnownNames_CaseInsensitive) {
    EXPECT_EQ(util::parse_log_level("debug"), util::LogLevel::DEBUG);
    EXPECT_EQ(util::parse_log_level("INFO"), util::LogLevel::INFO);
    EXPECT_EQ(util::parse_log_level("Warning"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("warn"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("error"), util::LogLevel::ERROR);
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
}

TEST_F(LoggerTest, LevelTag_FixedWidth) {
    EXPECT_EQ(util::level_tag(util::LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(util::level_tag(util::LogLevel::WARNING), "WARN ");
    EXPECT_EQ(util::level_tag(util::LogLevel::ERROR).size(), 5U);
}

TEST_F(LoggerTest, Open_CreatesLogFile) {
    auto& logger = util::Logger::instance();

    ASSERT_TRUE(logger.open(Settings()));

    EXPECT_TRUE(logger.is_open());
    EXPECT_EQ(logger.active_path(), temp_dir / "audit.log");
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "audit.log"));
}

TEST_F(LoggerTest, Log_LineHasLevelComponentAndMessage) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.open(Settings()));

    LOG_WARNING("SanitizationDispatcher", "falling back to overwrite");

    const auto contents = LogContents();
    EXPECT_THAT(contents, HasSubstr("[WARN ] [SanitizationDispatcher] falling back to overwrite"));
    EXPECT_EQ(contents.back(), '\n');
}

TEST_F(LoggerTest, Log_BelowMinLevel_Dropped) {
    auto& logger = util::Logger::instance();
    auto settings = Settings();
    settings.min_level = util::LogLevel::WARNING;
    ASSERT_TRUE(logger.open(settings));

    LOG_INFO("Test", "routine detail");
    LOG_ERROR("Test", "device failed");

    const auto contents = LogContents();
    EXPECT_THAT(contents, Not(HasSubstr("routine detail")));
    EXPECT_THAT(contents, HasSubstr("device failed"));
}

TEST_F(LoggerTest, Log_ExceedsMaxSize_Rotates) {
    auto& logger = util::Logger::instance();
    auto settings = Settings();
    settings.rotate_at_bytes = 256;
    settings.keep_rotated = 2;
    ASSERT_TRUE(logger.open(settings));

    for (int i = 0; i < 20; ++i) {
        LOG_INFO("Test", std::format("line number {} with some padding text", i));
    }

    EXPECT_TRUE(std::filesystem::exists(temp_dir / "audit.1.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "audit.2.log"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "audit.3.log"));
    EXPECT_THAT(LogContents(), HasSubstr("line number 19"));
}

TEST_F(LoggerTest, Close_LaterMessagesNotWritten) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.open(Settings()));
    logger.close();

    LOG_ERROR("Test", "after shutdown");

    EXPECT_FALSE(logger.is_open());
    EXPECT_TRUE(logger.active_path().empty());
    EXPECT_THAT(LogContents(), HasSubstr("Audit log closed"));
    EXPECT_THAT(LogContents(), Not(HasSubstr("after shutdown")));
}

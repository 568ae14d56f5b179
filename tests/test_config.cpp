/**
 * @file test_config.cpp
 * @brief Settings file loading and log level parsing
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <string>
#include "config.hpp"
#include "scratch_dir.hpp"

class ConfigTest : public ::testing::Test {
protected:
    std::string writeSettings(const std::string &name, const std::string &content) {
        auto path = scratch.missing(name);
        std::ofstream(path) << content;
        return path;
    }

    ScratchDir scratch;
    ToolConfig config;
};

TEST_F(ConfigTest, LoadsAllKeys) {
    auto path = writeSettings("settings.json",
        R"({"log_level": "debug", "tolerance": 0.001, "stop_on_failure": true, "pretty": true})");
    ASSERT_TRUE(loadConfig(path, config));
    EXPECT_EQ(config.logLevel, spdlog::level::debug);
    EXPECT_DOUBLE_EQ(config.tolerance, 0.001);
    EXPECT_TRUE(config.stopOnFailure);
    EXPECT_TRUE(config.pretty);
}

TEST_F(ConfigTest, AbsentKeysKeepDefaults) {
    auto path = writeSettings("settings.json", "{}");
    ASSERT_TRUE(loadConfig(path, config));
    EXPECT_EQ(config.logLevel, spdlog::level::warn);
    EXPECT_EQ(config.tolerance, 0.0);
    EXPECT_FALSE(config.stopOnFailure);
    EXPECT_FALSE(config.pretty);
}

TEST_F(ConfigTest, RejectsBadFilesWithoutTouchingConfig) {
    EXPECT_FALSE(loadConfig(scratch.missing("absent.json"), config));
    EXPECT_FALSE(loadConfig(writeSettings("broken.json", "{\"tolerance\": "), config));
    EXPECT_FALSE(loadConfig(writeSettings("array.json", "[1, 2]"), config));
    EXPECT_FALSE(loadConfig(writeSettings("level.json", R"({"log_level": "loud"})"), config));
    EXPECT_FALSE(loadConfig(writeSettings("negative.json", R"({"pretty": true, "tolerance": -0.5})"), config));
    EXPECT_FALSE(loadConfig(writeSettings("types.json", R"({"stop_on_failure": "yes"})"), config));

    EXPECT_FALSE(config.pretty);
    EXPECT_EQ(config.tolerance, 0.0);
}

TEST_F(ConfigTest, UnqueryablePathIsRejected) {
    auto path = scratch.missing(std::string(300, 'a') + ".json");
    bool loaded = true;
    EXPECT_NO_THROW(loaded = loadConfig(path, config));
    EXPECT_FALSE(loaded);
    EXPECT_FALSE(loadConfig(scratch.dir("settings.d"), config));
}

TEST(LogLevelTest, ParsesKnownNames) {
    spdlog::level::level_enum level = spdlog::level::info;
    EXPECT_TRUE(parseLogLevel("trace", level));
    EXPECT_EQ(level, spdlog::level::trace);
    EXPECT_TRUE(parseLogLevel("off", level));
    EXPECT_EQ(level, spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, spdlog::level::off);
}

// =============================================================================
// Config and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geocell/config.hpp"
#include "geocell/logging.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace geocell;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_output(log_);
        set_log_level(LogLevel::INFO);
        Config::getInstance().clear();
    }

    void TearDown() override {
        Config::getInstance().clear();
        set_log_output(std::clog);
        set_log_level(LogLevel::INFO);
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    std::string write_file(const std::string& name, const std::string& content) {
        path_ = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path_);
        out << content;
        return path_.string();
    }

    std::stringstream log_;
    std::filesystem::path path_;
};

TEST_F(ConfigTest, TypedValues) {
    Config& config = Config::getInstance();
    config.set("geo.radius", "6378137");
    config.set("sample.count", "42");
    config.set("geo.wrap", "Yes");
    config.set("geo.adjust", "0");

    EXPECT_DOUBLE_EQ(config.get<double>("geo.radius"), 6378137.0);
    EXPECT_EQ(config.get<int>("sample.count"), 42);
    EXPECT_TRUE(config.get<bool>("geo.wrap"));
    EXPECT_FALSE(config.get<bool>("geo.adjust", true));
    EXPECT_EQ(config.get<std::string>("geo.radius"), "6378137");
}

TEST_F(ConfigTest, MissingAndMalformed) {
    Config& config = Config::getInstance();
    EXPECT_EQ(config.get<int>("missing", 7), 7);
    EXPECT_EQ(config.get<std::string>("missing", "fallback"), "fallback");

    config.set("sample.count", "many");
    EXPECT_EQ(config.get<int>("sample.count", 3), 3);
    EXPECT_NE(log_.str().find("Failed to parse config value"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::string file = write_file("geocell_config_test.env",
        "# distance settings\n"
        "; alternate comment\n"
        "\n"
        "geo.radius = 6371.0087714\n"
        "geo.wrap=true\n"
        "log.level = warn\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(file));
    EXPECT_DOUBLE_EQ(config.get<double>("geo.radius"), 6371.0087714);
    EXPECT_TRUE(config.get<bool>("geo.wrap"));
    EXPECT_EQ(config.get<std::string>("log.level"), "warn");
}

TEST_F(ConfigTest, RejectsBadRadius) {
    std::string file = write_file("geocell_bad_radius.env", "geo.radius=-5\n");
    EXPECT_FALSE(Config::getInstance().load(file));
    EXPECT_NE(log_.str().find("Invalid earth radius"), std::string::npos);
}

TEST_F(ConfigTest, UnknownLogLevelFallsBack) {
    std::string file = write_file("geocell_bad_level.env", "log.level=chatty\n");
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(file));
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, ClearDropsValues) {
    Config& config = Config::getInstance();
    config.set("geo.radius", "1");
    config.clear();
    EXPECT_DOUBLE_EQ(config.get<double>("geo.radius", 2.0), 2.0);
}

TEST_F(ConfigTest, DumpListsSortedValues) {
    Config& config = Config::getInstance();
    config.set("geo.wrap", "true");
    config.set("geo.adjust", "false");

    std::ostringstream out;
    config.dump(out);
    EXPECT_EQ(out.str(), "geo.adjust = false\ngeo.wrap = true\n");
}

// =============================================================================
// Logger
// =============================================================================

class LoggerTest : public ConfigTest {};

TEST_F(LoggerTest, LevelFilters) {
    set_log_level(LogLevel::INFO);
    LOG_DEBUG("hidden ", 1);
    EXPECT_TRUE(log_.str().empty());

    LOG_INFO("visible ", 2);
    std::string line = log_.str();
    EXPECT_NE(line.find("INFO"), std::string::npos);
    EXPECT_NE(line.find("visible 2"), std::string::npos);
    EXPECT_NE(line.find("test_config.cpp"), std::string::npos);
}

TEST_F(LoggerTest, DebugWhenEnabled) {
    set_log_level(LogLevel::DEBUG);
    LOG_DEBUG("cell ", "u120fxw");
    EXPECT_NE(log_.str().find("DEBG"), std::string::npos);
    EXPECT_NE(log_.str().find("cell u120fxw"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("loud"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("loud", LogLevel::WARN), LogLevel::WARN);
}

#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/logging.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace matchcore;

class ConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path;

    void SetUp() override {
        temp_config_path = "test_config_temp.json";
        clear_env();
    }

    void TearDown() override {
        // Clean up temp file and overrides
        std::remove(temp_config_path.c_str());
        clear_env();
    }

    void write_config(const std::string& content) {
        std::ofstream file(temp_config_path);
        file << content;
    }

    static void clear_env() {
        unsetenv("MATCHCORE_PRICE_TOLERANCE");
        unsetenv("MATCHCORE_LOG_LEVEL");
        unsetenv("MATCHCORE_LOG_ASYNC");
        unsetenv("MATCHCORE_LOG_QUEUE_SIZE");
    }
};

TEST_F(ConfigTest, DefaultsAreReasonable) {
    auto config = Config::defaults();

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.05);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_FALSE(config.logging.async);
    EXPECT_EQ(config.demo.product_id, 1);
    EXPECT_FALSE(config.demo.orders_file.has_value());
    EXPECT_FALSE(config.demo.update_price.has_value());
}

TEST_F(ConfigTest, LoadFromFileSuccess) {
    write_config(R"({
        "engine": { "price_tolerance": 0.25 },
        "logging": { "level": "debug" }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok()) << result.error();
    auto config = result.value();

    // Changed values
    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.25);
    EXPECT_EQ(config.logging.level, "debug");

    // Defaults preserved
    EXPECT_FALSE(config.logging.async);
    EXPECT_EQ(config.demo.product_id, 1);
}

TEST_F(ConfigTest, LoadFromFileAllFields) {
    write_config(R"({
        "engine": { "price_tolerance": 1.5 },
        "logging": { "level": "warn", "async": true, "queue_size": 1024 },
        "demo": { "orders_file": "book.json", "product_id": 7, "update_price": 9.8 }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok()) << result.error();
    auto config = result.value();

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 1.5);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_TRUE(config.logging.async);
    EXPECT_EQ(config.logging.queue_size, 1024u);
    ASSERT_TRUE(config.demo.orders_file.has_value());
    EXPECT_EQ(*config.demo.orders_file, "book.json");
    EXPECT_EQ(config.demo.product_id, 7);
    ASSERT_TRUE(config.demo.update_price.has_value());
    EXPECT_DOUBLE_EQ(*config.demo.update_price, 9.8);
}

TEST_F(ConfigTest, LoadFromFileNotFound) {
    auto result = Config::load_from_file("nonexistent_file.json");

    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("Failed to open") != std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileInvalidJson) {
    write_config("{ invalid json }");

    auto result = Config::load_from_file(temp_config_path);

    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("parse") != std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileWrongType) {
    write_config(R"({ "engine": { "price_tolerance": "wide" } })");

    auto result = Config::load_from_file(temp_config_path);

    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, NegativeToleranceRejected) {
    write_config(R"({ "engine": { "price_tolerance": -0.1 } })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("price_tolerance") != std::string::npos);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    write_config(R"({ "logging": { "level": "chatty" } })");

    EXPECT_TRUE(Config::load_from_file(temp_config_path).is_err());
}

TEST_F(ConfigTest, QueueSizeOutOfRangeRejected) {
    write_config(R"({ "logging": { "queue_size": -1 } })");
    auto negative = Config::load_from_file(temp_config_path);
    ASSERT_TRUE(negative.is_err());
    EXPECT_TRUE(negative.error().find("queue_size") != std::string::npos);

    write_config(R"({ "logging": { "queue_size": 0 } })");
    EXPECT_TRUE(Config::load_from_file(temp_config_path).is_err());

    write_config(R"({ "logging": { "queue_size": 2097152 } })");
    EXPECT_TRUE(Config::load_from_file(temp_config_path).is_err());

    write_config(R"({ "logging": { "queue_size": 64.5 } })");
    EXPECT_TRUE(Config::load_from_file(temp_config_path).is_err());
}

TEST_F(ConfigTest, QueueSizeAtUpperBoundAccepted) {
    write_config(R"({ "logging": { "queue_size": 1048576 } })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().logging.queue_size, 1048576u);
}

TEST_F(ConfigTest, LoadWithoutPathReturnsDefaults) {
    auto config = Config::load(std::nullopt);

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.05);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, LoadWithBadPathFallsBackToDefaults) {
    auto config = Config::load(std::string("nonexistent_file.json"));

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.05);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config(R"({ "engine": { "price_tolerance": 0.25 } })");
    setenv("MATCHCORE_PRICE_TOLERANCE", "0.75", 1);
    setenv("MATCHCORE_LOG_ASYNC", "true", 1);
    setenv("MATCHCORE_LOG_QUEUE_SIZE", "2048", 1);

    auto config = Config::load(temp_config_path);

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.75);
    EXPECT_TRUE(config.logging.async);
    EXPECT_EQ(config.logging.queue_size, 2048u);
}

TEST_F(ConfigTest, InvalidEnvironmentValuesIgnored) {
    setenv("MATCHCORE_PRICE_TOLERANCE", "-3", 1);
    setenv("MATCHCORE_LOG_LEVEL", "loud", 1);
    setenv("MATCHCORE_LOG_ASYNC", "maybe", 1);
    setenv("MATCHCORE_LOG_QUEUE_SIZE", "lots", 1);

    auto config = Config::load(std::nullopt);

    EXPECT_DOUBLE_EQ(config.engine.price_tolerance, 0.05);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_FALSE(config.logging.async);
    EXPECT_EQ(config.logging.queue_size, 8192u);
}

TEST(LoggingSetupTest, InstallsDefaultLoggerAtConfiguredLevel) {
    Config::Logging logging;
    logging.level = "debug";

    logging::setup(logging);

    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "matchcore");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

    // Setting up twice replaces the logger instead of failing on the name
    logging.level = "warn";
    logging::setup(logging);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

    spdlog::set_level(spdlog::level::info);
}

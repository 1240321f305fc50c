#include <gtest/gtest.h>

#include "pod_device/config.hpp"

#include <cstdio>
#include <fstream>

using namespace pod_device;

TEST(ConfigTest, SessionDefaults) {
    auto config = Config::parseSessionConfig(nlohmann::json::object());

    EXPECT_EQ(std::chrono::milliseconds(1000), config.readTimeout);
    EXPECT_EQ(std::chrono::milliseconds(100), config.pollTimeout);
    EXPECT_EQ(10u, config.retryCount);
    EXPECT_EQ(std::chrono::milliseconds(10), config.retryDelay);
    EXPECT_EQ(64u, config.packetSize);
}

TEST(ConfigTest, ParseSessionConfig) {
    auto json = nlohmann::json::parse(R"({
        "session": {"readTimeoutMs": 2500, "pollTimeoutMs": 50, "retryCount": 3, "retryDelayMs": 0},
        "device": {"packetSize": 65}
    })");

    auto config = Config::parseSessionConfig(json);
    EXPECT_EQ(std::chrono::milliseconds(2500), config.readTimeout);
    EXPECT_EQ(std::chrono::milliseconds(50), config.pollTimeout);
    EXPECT_EQ(3u, config.retryCount);
    EXPECT_EQ(std::chrono::milliseconds(0), config.retryDelay);
    EXPECT_EQ(65u, config.packetSize);
}

TEST(ConfigTest, ParseDeviceConfig) {
    auto json = nlohmann::json::parse(R"({"device": {"path": "/dev/hidraw2"}})");

    auto config = Config::parseDeviceConfig(json);
    EXPECT_EQ("/dev/hidraw2", config.path);
    EXPECT_EQ(64u, config.packetSize);
    EXPECT_EQ(USB_VENDOR_ID, config.vendorId);
    EXPECT_EQ(USB_PRODUCT_ID, config.productId);
}

TEST(ConfigTest, ParseLoggingLevel) {
    EXPECT_EQ(spdlog::level::info, Config::parseLoggingLevel(nlohmann::json::object()));
    EXPECT_EQ(spdlog::level::debug, Config::parseLoggingLevel(nlohmann::json::parse(R"({"logging": {"level": "debug"}})")));
    EXPECT_EQ(spdlog::level::off, Config::parseLoggingLevel(nlohmann::json::parse(R"({"logging": {"level": "off"}})")));
    EXPECT_THROW(Config::parseLoggingLevel(nlohmann::json::parse(R"({"logging": {"level": "chatty"}})")),
                 std::runtime_error);
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "gpspod_config_test.json";
    std::ofstream(path) << R"({"session": {"retryCount": 5}, "logging": {"level": "warning"}})";

    EXPECT_EQ(5u, Config::loadSessionConfig(path).retryCount);
    EXPECT_EQ(spdlog::level::warn, Config::loadLoggingLevel(path));
    EXPECT_TRUE(Config::loadDeviceConfig(path).path.empty());
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadErrors) {
    const std::string missing = ::testing::TempDir() + "gpspod_missing.json";
    try {
        Config::loadSessionConfig(missing);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ("Failed to open configuration file: " + missing, e.what());
    }

    const std::string broken = ::testing::TempDir() + "gpspod_broken.json";
    std::ofstream(broken) << "{ not json";
    EXPECT_THROW(Config::loadDeviceConfig(broken), std::runtime_error);
    std::remove(broken.c_str());
}

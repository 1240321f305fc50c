/**
 * @file config.hpp
 * @brief Configuration utilities for the pod tools
 *
 * This file provides utilities for loading configuration from JSON files.
 */

#pragma once

#include "pod_device/hidraw_channel.hpp"
#include "pod_device/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <string>

namespace pod_device {

/**
 * @brief Configuration utilities
 *
 * Example file:
 * @code
 * {
 *   "session": {"readTimeoutMs": 1000, "pollTimeoutMs": 100, "retryCount": 10, "retryDelayMs": 10},
 *   "device": {"path": "/dev/hidraw3", "packetSize": 64},
 *   "logging": {"level": "info"}
 * }
 * @endcode
 */
class Config {
public:
    /**
     * @brief Load session configuration from JSON file
     * @param filepath Path to JSON configuration file
     * @return Session configuration
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static Session::Config loadSessionConfig(const std::string& filepath);

    /**
     * @brief Load device channel configuration from JSON file
     * @param filepath Path to JSON configuration file
     * @return Channel configuration
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static HidrawChannel::Config loadDeviceConfig(const std::string& filepath);

    /**
     * @brief Load the logging level from JSON file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static spdlog::level::level_enum loadLoggingLevel(const std::string& filepath);

    static Session::Config parseSessionConfig(const nlohmann::json& json);
    static HidrawChannel::Config parseDeviceConfig(const nlohmann::json& json);

    /**
     * @brief Parse the logging level, info when absent
     * @throws std::runtime_error for an unknown level name
     */
    static spdlog::level::level_enum parseLoggingLevel(const nlohmann::json& json);

private:
    /**
     * @brief Load JSON from file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace pod_device

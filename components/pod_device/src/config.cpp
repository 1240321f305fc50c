/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "pod_device/config.hpp"

#include <fstream>
#include <stdexcept>

namespace pod_device {

Session::Config Config::loadSessionConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseSessionConfig(json);
}

HidrawChannel::Config Config::loadDeviceConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseDeviceConfig(json);
}

spdlog::level::level_enum Config::loadLoggingLevel(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseLoggingLevel(json);
}

Session::Config Config::parseSessionConfig(const nlohmann::json& json) {
    Session::Config config;

    if (json.contains("session")) {
        const auto& sessionJson = json["session"];

        if (sessionJson.contains("readTimeoutMs")) {
            config.readTimeout = std::chrono::milliseconds(sessionJson["readTimeoutMs"].get<int64_t>());
        }

        if (sessionJson.contains("pollTimeoutMs")) {
            config.pollTimeout = std::chrono::milliseconds(sessionJson["pollTimeoutMs"].get<int64_t>());
        }

        if (sessionJson.contains("retryCount")) {
            config.retryCount = sessionJson["retryCount"].get<size_t>();
        }

        if (sessionJson.contains("retryDelayMs")) {
            config.retryDelay = std::chrono::milliseconds(sessionJson["retryDelayMs"].get<int64_t>());
        }
    }

    if (json.contains("device") && json["device"].contains("packetSize")) {
        config.packetSize = json["device"]["packetSize"].get<size_t>();
    }

    return config;
}

HidrawChannel::Config Config::parseDeviceConfig(const nlohmann::json& json) {
    HidrawChannel::Config config;

    if (json.contains("device")) {
        const auto& deviceJson = json["device"];

        if (deviceJson.contains("path")) {
            config.path = deviceJson["path"].get<std::string>();
        }

        if (deviceJson.contains("packetSize")) {
            config.packetSize = deviceJson["packetSize"].get<size_t>();
        }
    }

    return config;
}

spdlog::level::level_enum Config::parseLoggingLevel(const nlohmann::json& json) {
    if (!json.contains("logging") || !json["logging"].contains("level")) {
        return spdlog::level::info;
    }

    const auto name = json["logging"]["level"].get<std::string>();
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("Unknown logging level: " + name);
    }
    return level;
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace pod_device

/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration for the proximity service

**************************************************/

#ifndef GEOFLEET_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define GEOFLEET_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace geofleet::config {

/**
 * @brief Extra sink declared in the logging section
 */
struct LogSinkConfig {
    std::string name;     ///< Sink identifier
    std::string type;     ///< "console", "file", "rotating_file", "daily_file"
    std::string level;    ///< Log level for this sink
    std::string pattern;  ///< Log pattern (uses the section pattern if empty)

    std::string filePath;                  ///< File path (for file sinks)
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size for rotation
    size_t maxFiles{5};                    ///< Max number of rotated files

    int rotationHour{0};    ///< Hour for daily rotation
    int rotationMinute{0};  ///< Minute for daily rotation

    [[nodiscard]] json toJson() const {
        return {{"name", name},
                {"type", type},
                {"level", level},
                {"pattern", pattern},
                {"filePath", filePath},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"rotationHour", rotationHour},
                {"rotationMinute", rotationMinute}};
    }

    [[nodiscard]] static LogSinkConfig fromJson(const json& j) {
        LogSinkConfig cfg;
        cfg.name = j.value("name", "");
        cfg.type = j.value("type", "console");
        cfg.level = j.value("level", "info");
        cfg.pattern = j.value("pattern", "");
        cfg.filePath = j.value("filePath", "");
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.rotationHour = j.value("rotationHour", 0);
        cfg.rotationMinute = j.value("rotationMinute", 0);
        return cfg;
    }
};

/**
 * @brief Logging configuration
 *
 * Console and file output with separate levels, size or daily rotation,
 * optional async logging and extra sinks.
 *
 * @example
 * ```json
 * {
 *   "geofleet": {
 *     "logging": {
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "maxFiles": 5,
 *       "asyncMode": true
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/geofleet/logging";

    /// Name of the default logger
    std::string loggerName{"geofleet"};

    // Console
    bool enableConsole{true};
    std::string consoleLevel{"info"};
    bool consoleColor{true};

    // File
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"geofleet"};
    std::string fileLevel{"debug"};

    // Rotation
    size_t maxFileSize{10 * 1024 * 1024};  ///< Bytes before rotation (10 MB)
    size_t maxFiles{5};
    bool useDailyRotation{false};  ///< Daily instead of size-based rotation
    int rotationHour{0};
    int rotationMinute{0};

    /// Placeholders: %Y %m %d %H %M %S %e, %l level, %n logger, %t thread,
    /// %v message
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    // Async
    bool asyncMode{false};
    size_t asyncQueueSize{8192};
    size_t asyncThreadCount{1};
    std::string overflowPolicy{"block"};  ///< "block" or "discard"

    std::vector<LogSinkConfig> additionalSinks;

    [[nodiscard]] json serialize() const {
        json sinksArray = json::array();
        for (const auto& sink : additionalSinks) {
            sinksArray.push_back(sink.toJson());
        }

        return {{"loggerName", loggerName},
                {"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"useDailyRotation", useDailyRotation},
                {"rotationHour", rotationHour},
                {"rotationMinute", rotationMinute},
                {"pattern", pattern},
                {"asyncMode", asyncMode},
                {"asyncQueueSize", asyncQueueSize},
                {"asyncThreadCount", asyncThreadCount},
                {"overflowPolicy", overflowPolicy},
                {"additionalSinks", sinksArray}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.loggerName = j.value("loggerName", cfg.loggerName);

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);

        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.useDailyRotation = j.value("useDailyRotation", cfg.useDailyRotation);
        cfg.rotationHour = j.value("rotationHour", cfg.rotationHour);
        cfg.rotationMinute = j.value("rotationMinute", cfg.rotationMinute);

        cfg.pattern = j.value("pattern", cfg.pattern);

        cfg.asyncMode = j.value("asyncMode", cfg.asyncMode);
        cfg.asyncQueueSize = j.value("asyncQueueSize", cfg.asyncQueueSize);
        cfg.asyncThreadCount = j.value("asyncThreadCount", cfg.asyncThreadCount);
        cfg.overflowPolicy = j.value("overflowPolicy", cfg.overflowPolicy);

        if (j.contains("additionalSinks") && j["additionalSinks"].is_array()) {
            for (const auto& sinkJson : j["additionalSinks"]) {
                cfg.additionalSinks.push_back(LogSinkConfig::fromJson(sinkJson));
            }
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const json levels = {"trace", "debug", "info",  "warn",
                             "error", "critical", "off"};
        return {
            {"type", "object"},
            {"properties",
             {{"loggerName", {{"type", "string"}, {"default", "geofleet"}}},
              {"enableConsole", {{"type", "boolean"}, {"default", true}}},
              {"consoleLevel",
               {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
              {"consoleColor", {{"type", "boolean"}, {"default", true}}},
              {"enableFile", {{"type", "boolean"}, {"default", false}}},
              {"logDir", {{"type", "string"}, {"default", "logs"}}},
              {"logFilename", {{"type", "string"}, {"default", "geofleet"}}},
              {"fileLevel",
               {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
              {"maxFileSize",
               {{"type", "integer"},
                {"minimum", 1024},
                {"maximum", 1073741824},
                {"default", 10485760}}},
              {"maxFiles",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", 100},
                {"default", 5}}},
              {"useDailyRotation", {{"type", "boolean"}, {"default", false}}},
              {"rotationHour",
               {{"type", "integer"},
                {"minimum", 0},
                {"maximum", 23},
                {"default", 0}}},
              {"rotationMinute",
               {{"type", "integer"},
                {"minimum", 0},
                {"maximum", 59},
                {"default", 0}}},
              {"pattern", {{"type", "string"}}},
              {"asyncMode", {{"type", "boolean"}, {"default", false}}},
              {"asyncQueueSize",
               {{"type", "integer"},
                {"minimum", 128},
                {"maximum", 1048576},
                {"default", 8192}}},
              {"asyncThreadCount",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", 16},
                {"default", 1}}},
              {"overflowPolicy",
               {{"type", "string"},
                {"enum", json::array({"block", "discard"})},
                {"default", "block"}}},
              {"additionalSinks", {{"type", "array"}}}}}};
    }

    /**
     * @brief Range and enum checks from the schema
     */
    [[nodiscard]] ConfigValidationResult validate() const {
        return validateSchema();
    }
};

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>
#include <format>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace geofleet::logging {

auto SinkFactory::createSink(const SinkConfig& config)
    -> std::expected<spdlog::sink_ptr, std::string> {
    if (config.isFileSink() && config.file_path.empty()) {
        return std::unexpected(
            std::format("Sink '{}' needs a file path", config.name));
    }

    try {
        switch (config.type) {
            case SinkType::Console:
                return createConsoleSink(config.level, config.pattern,
                                         config.color);
            case SinkType::BasicFile:
                return createFileSink(config.file_path, config.level,
                                      config.pattern, config.truncate);
            case SinkType::RotatingFile:
                return createRotatingFileSink(
                    config.file_path, config.max_file_size, config.max_files,
                    config.level, config.pattern);
            case SinkType::DailyFile:
                return createDailyFileSink(
                    config.file_path, config.rotation_hour,
                    config.rotation_minute, config.level, config.pattern);
        }
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create sink '{}': {}",
                                           config.name, e.what()));
    }
    return std::unexpected(std::format("Unknown sink type for '{}'",
                                       config.name));
}

auto SinkFactory::describeSinks(const config::LoggingConfig& config)
    -> std::vector<SinkConfig> {
    std::vector<SinkConfig> sinks;

    if (config.enableConsole) {
        SinkConfig console;
        console.name = "console";
        console.type = SinkType::Console;
        console.level = levelFromString(config.consoleLevel);
        console.pattern = config.pattern;
        console.color = config.consoleColor;
        sinks.push_back(std::move(console));
    }

    if (config.enableFile) {
        SinkConfig file;
        file.name = "file";
        file.level = levelFromString(config.fileLevel);
        file.pattern = config.pattern;
        file.file_path =
            (std::filesystem::path(config.logDir) / (config.logFilename + ".log"))
                .string();
        if (config.useDailyRotation) {
            file.type = SinkType::DailyFile;
            file.rotation_hour = config.rotationHour;
            file.rotation_minute = config.rotationMinute;
        } else {
            file.type = SinkType::RotatingFile;
            file.max_file_size = config.maxFileSize;
            file.max_files = config.maxFiles;
        }
        sinks.push_back(std::move(file));
    }

    for (const auto& extra : config.additionalSinks) {
        SinkConfig sink;
        sink.name = extra.name;
        sink.type = sinkTypeFromString(extra.type).value_or(SinkType::Console);
        sink.level = levelFromString(extra.level);
        sink.pattern = extra.pattern.empty() ? config.pattern : extra.pattern;
        sink.file_path = extra.filePath;
        sink.max_file_size = extra.maxFileSize;
        sink.max_files = extra.maxFiles;
        sink.rotation_hour = extra.rotationHour;
        sink.rotation_minute = extra.rotationMinute;
        sinks.push_back(std::move(sink));
    }

    return sinks;
}

void SinkFactory::configure(const spdlog::sink_ptr& sink,
                            spdlog::level::level_enum level,
                            const std::string& pattern) {
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern, bool color)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    configure(sink, level, pattern);
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern, bool truncate)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path,
                                                                    truncate);
    configure(sink, level, pattern);
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    configure(sink, level, pattern);
    return sink;
}

auto SinkFactory::createDailyFileSink(const std::string& file_path,
                                      int rotation_hour, int rotation_minute,
                                      spdlog::level::level_enum level,
                                      const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        file_path, rotation_hour, rotation_minute);
    configure(sink, level, pattern);
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace geofleet::logging

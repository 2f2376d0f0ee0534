/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

namespace geofleet::logging {

auto sinkTypeFromString(std::string_view name) -> std::optional<SinkType> {
    if (name == "console" || name == "stdout") {
        return SinkType::Console;
    }
    if (name == "file" || name == "basic_file") {
        return SinkType::BasicFile;
    }
    if (name == "rotating_file") {
        return SinkType::RotatingFile;
    }
    if (name == "daily_file") {
        return SinkType::DailyFile;
    }
    return std::nullopt;
}

auto sinkTypeToString(SinkType type) -> std::string {
    switch (type) {
        case SinkType::Console:
            return "console";
        case SinkType::BasicFile:
            return "file";
        case SinkType::RotatingFile:
            return "rotating_file";
        case SinkType::DailyFile:
            return "daily_file";
    }
    return "console";
}

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", sinkTypeToString(type)},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};

    if (type == SinkType::Console) {
        j["color"] = color;
    } else {
        j["file_path"] = file_path;
    }
    if (type == SinkType::BasicFile) {
        j["truncate"] = truncate;
    }
    if (type == SinkType::RotatingFile) {
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
    }
    if (type == SinkType::DailyFile) {
        j["rotation_hour"] = rotation_hour;
        j["rotation_minute"] = rotation_minute;
    }

    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = sinkTypeFromString(j.value("type", "console"))
                      .value_or(SinkType::Console);
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.color = j.value("color", true);
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    config.truncate = j.value("truncate", false);
    config.rotation_hour = j.value("rotation_hour", 0);
    config.rotation_minute = j.value("rotation_minute", 0);
    return config;
}

// ============================================================================
// Level Conversion Functions
// ============================================================================

auto levelFromString(std::string_view level) -> spdlog::level::level_enum {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off" || level == "none")
        return spdlog::level::off;
    return spdlog::level::info;  // Default
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

}  // namespace geofleet::logging

/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef GEOFLEET_LOGGING_TYPES_HPP
#define GEOFLEET_LOGGING_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace geofleet::logging {

/**
 * @brief Kinds of sink the factory can build
 */
enum class SinkType { Console, BasicFile, RotatingFile, DailyFile };

/**
 * @brief Parse "console"/"stdout", "file"/"basic_file", "rotating_file" or
 *        "daily_file"
 */
[[nodiscard]] auto sinkTypeFromString(std::string_view name)
    -> std::optional<SinkType>;

[[nodiscard]] auto sinkTypeToString(SinkType type) -> std::string;

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    SinkType type{SinkType::Console};
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;
    bool color{true};

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};
    bool truncate{false};

    // Daily file options
    int rotation_hour{0};
    int rotation_minute{0};

    [[nodiscard]] auto isFileSink() const noexcept -> bool {
        return type != SinkType::Console;
    }

    /**
     * @brief Convert sink config to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Create sink config from JSON
     *
     * Unknown sink types fall back to console.
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Convert level string to spdlog enum
 *
 * Accepts the spdlog names plus "warning", "fatal" and "none"; anything
 * else maps to info.
 */
[[nodiscard]] auto levelFromString(std::string_view level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace geofleet::logging

#endif  // GEOFLEET_LOGGING_TYPES_HPP

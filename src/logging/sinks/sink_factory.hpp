/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef GEOFLEET_LOGGING_SINKS_SINK_FACTORY_HPP
#define GEOFLEET_LOGGING_SINKS_SINK_FACTORY_HPP

#include <expected>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "../types.hpp"
#include "config/sections/logging_config.hpp"

namespace geofleet::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Supports console (stdout with colors), basic file, rotating file and
 * daily file sinks. File sinks create their parent directory.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @param config Sink configuration
     * @return Sink, or a description of why it could not be created
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> std::expected<spdlog::sink_ptr, std::string>;

    /**
     * @brief Sink configurations described by a logging section
     *
     * Console and main file sink (rotating or daily) first, then the
     * additional sinks in declaration order.
     */
    [[nodiscard]] static auto describeSinks(const config::LoggingConfig& config)
        -> std::vector<SinkConfig>;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool color = true)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createFileSink(
        const std::string& file_path,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool truncate = false)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size, size_t max_files,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto createDailyFileSink(
        const std::string& file_path, int rotation_hour, int rotation_minute,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);

    static void configure(const spdlog::sink_ptr& sink,
                          spdlog::level::level_enum level,
                          const std::string& pattern);
};

}  // namespace geofleet::logging

#endif  // GEOFLEET_LOGGING_SINKS_SINK_FACTORY_HPP

/*
 * logging_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Default logger installation from the logging section

**************************************************/

#ifndef GEOFLEET_LOGGING_LOGGING_SETUP_HPP
#define GEOFLEET_LOGGING_LOGGING_SETUP_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace geofleet::logging {

/**
 * @brief Build the named logger and make it spdlog's default
 *
 * Sinks come from SinkFactory::describeSinks. A sink that cannot be created
 * is reported and skipped. With asyncMode the logger runs on spdlog's
 * shared thread pool.
 *
 * @return The installed logger
 */
auto initLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flush and drop every logger
 */
void shutdownLogging();

}  // namespace geofleet::logging

#endif  // GEOFLEET_LOGGING_LOGGING_SETUP_HPP

/**
 * @file logging.hpp
 * @brief Main aggregated header for the GeoFleet logging library.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * geofleet::config::LoggingConfig cfg;
 * cfg.consoleLevel = "debug";
 * auto logger = geofleet::logging::initLogging(cfg);
 * spdlog::info("Hello, logging!");
 * @endcode
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef GEOFLEET_LOGGING_LOGGING_HPP
#define GEOFLEET_LOGGING_LOGGING_HPP

#include "types.hpp"

#include "sinks/sink_factory.hpp"

#include "logging_setup.hpp"

#endif  // GEOFLEET_LOGGING_LOGGING_HPP

/**
 * @file config.hpp
 * @brief Main aggregated header for the GeoFleet config library.
 *
 * @par Usage Example:
 * @code
 * #include "config/config.hpp"
 *
 * using namespace geofleet::config;
 *
 * auto loader = ConfigLoader::fromFile("geofleet.json");
 * auto proximity = loader.section<ProximityConfig>();
 * proximity.applyEnvironment();
 * proximity.requireValid();
 * @endcode
 *
 * @date 2024-6-4
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef GEOFLEET_CONFIG_HPP
#define GEOFLEET_CONFIG_HPP

#include "core/config_section.hpp"
#include "core/exception.hpp"
#include "core/validation.hpp"

#include "sections/logging_config.hpp"
#include "sections/proximity_config.hpp"

#include "config_loader.hpp"

#endif  // GEOFLEET_CONFIG_HPP

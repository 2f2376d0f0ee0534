/*
 * proximity_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "proximity_config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

#include "../core/exception.hpp"

namespace geofleet::config {

namespace {

template <typename T>
auto parseNumber(std::string_view text, T& out) -> bool {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

auto knownStrategy(std::string_view name) -> bool {
    return name == "flatScan" || name == "hierarchical";
}

}  // namespace

ConfigValidationResult ProximityConfig::validate() const {
    auto result = validateSchema();
    auto base = std::string(PATH);

    if (syntheticPrefix.empty()) {
        result.addError(base + "/syntheticPrefix", "must not be empty",
                        "minLength");
    }
    if (storeKey.empty()) {
        result.addError(base + "/storeKey", "must not be empty", "minLength");
    }
    if (strategy == "hierarchical" && !buildCellIndexOnStart) {
        spdlog::warn("Hierarchical strategy configured without "
                     "buildCellIndexOnStart; queries fail until a cell layer "
                     "is built");
    }
    return result;
}

void ProximityConfig::requireValid() const {
    if (auto result = validate(); !result) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid proximity configuration: {}",
                                       result.summary());
    }
}

void ProximityConfig::applyEnvironment() {
    if (const char* value = std::getenv(ENV_STRATEGY)) {
        if (!knownStrategy(value)) {
            THROW_INVALID_CONFIG_EXCEPTION("{}='{}' is not a known strategy",
                                           ENV_STRATEGY, value);
        }
        strategy = value;
        spdlog::info("Proximity strategy '{}' from {}", strategy,
                     ENV_STRATEGY);
    }
    if (const char* value = std::getenv(ENV_CEILING)) {
        size_t ceiling = 0;
        if (!parseNumber(value, ceiling) || ceiling == 0) {
            THROW_INVALID_CONFIG_EXCEPTION("{}='{}' is not a positive integer",
                                           ENV_CEILING, value);
        }
        candidateCeiling = ceiling;
    }
    if (const char* value = std::getenv(ENV_RESOLUTION)) {
        int resolution = 0;
        if (!parseNumber(value, resolution) || resolution < 0 ||
            resolution > 15) {
            THROW_INVALID_CONFIG_EXCEPTION("{}='{}' is not in [0, 15]",
                                           ENV_RESOLUTION, value);
        }
        cellResolution = resolution;
    }
}

}  // namespace geofleet::config

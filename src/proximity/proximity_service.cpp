// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#include "proximity_service.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "config/core/exception.hpp"
#include "store/geo_store_point_store.hpp"
#include "store/memory_point_store.hpp"

namespace geofleet::proximity {

namespace {

auto checked(const config::ProximityConfig& config)
    -> const config::ProximityConfig& {
    config.requireValid();
    return config;
}

auto orMemoryStore(std::shared_ptr<store::IPointStore> store)
    -> std::shared_ptr<store::IPointStore> {
    if (store) {
        return store;
    }
    return std::make_shared<store::MemoryPointStore>();
}

auto engineOptionsFor(const config::ProximityConfig& config)
    -> search::EngineOptions {
    search::EngineOptions options;
    options.candidateCeiling = config.candidateCeiling;
    options.cellResolution = config.cellResolution;
    options.defaultStrategy = model::strategyFromString(config.strategy)
                                  .value_or(model::SearchStrategy::FlatScan);
    options.syntheticPrefix = config.syntheticPrefix;
    return options;
}

}  // namespace

ProximityService::ProximityService(const config::ProximityConfig& config,
                                   std::shared_ptr<store::IPointStore> store)
    : config_(checked(config)),
      locations_(std::make_shared<LocationIndex>(orMemoryStore(std::move(store)))),
      gateway_(locations_),
      engine_(locations_, engineOptionsFor(config_)) {
    if (config_.buildCellIndexOnStart) {
        if (auto built = gateway_.buildCellIndex(config_.cellResolution);
            !built) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "Cannot build cell layer {} on start: {}",
                config_.cellResolution, built.error().toString());
        }
    }
    spdlog::info("ProximityService ready (strategy={}, ceiling={}, "
                 "resolution={}, cells built={})",
                 config_.strategy, config_.candidateCeiling,
                 config_.cellResolution,
                 locations_->cells().isBuilt(config_.cellResolution));
}

auto ProximityService::withGeoStore(
    const config::ProximityConfig& config,
    std::shared_ptr<store::IGeoStoreClient> client)
    -> std::unique_ptr<ProximityService> {
    auto store = std::make_shared<store::GeoStorePointStore>(std::move(client),
                                                             config.storeKey);
    return std::make_unique<ProximityService>(config, std::move(store));
}

auto ProximityService::searchNearby(
    double longitude, double latitude, double radiusKm, int count,
    std::optional<model::SearchStrategy> strategy,
    std::optional<bool> preferPrimary) const
    -> model::Result<std::vector<model::NearbyDriver>> {
    return engine_.searchNearby(longitude, latitude, radiusKm, count, strategy,
                                preferPrimary.value_or(config_.preferPrimary));
}

auto ProximityService::getStats() const -> json {
    json stats;
    stats["engine"] = engine_.getStats();
    stats["cells"] = locations_->cells().stats();

    auto lock = locations_->readLock();
    if (auto size = locations_->store().size()) {
        stats["points"] = *size;
    } else {
        stats["points"] = nullptr;
        stats["storeError"] = size.error().toString();
    }
    return stats;
}

}  // namespace geofleet::proximity

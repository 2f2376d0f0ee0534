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

#ifndef GEOFLEET_PROXIMITY_PROXIMITY_SERVICE_HPP
#define GEOFLEET_PROXIMITY_PROXIMITY_SERVICE_HPP

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/sections/proximity_config.hpp"
#include "location_index.hpp"
#include "search/proximity_search_engine.hpp"
#include "store/geo_store_client.hpp"
#include "update/location_update_gateway.hpp"

namespace geofleet::proximity {

using json = nlohmann::json;

/**
 * @brief The proximity stack assembled from configuration
 *
 * Owns one LocationIndex, the update gateway writing to it and the search
 * engine reading from it. Nothing is global: two services built from two
 * configs are fully independent.
 *
 * @example
 * ```cpp
 * config::ProximityConfig cfg;
 * cfg.strategy = "hierarchical";
 * cfg.buildCellIndexOnStart = true;
 * ProximityService service(cfg);
 * (void)service.reportLocation("real:1", 106.700, 10.770);
 * auto nearby = service.searchNearby(106.700, 10.770, 5.0, 3);
 * ```
 */
class ProximityService {
public:
    /**
     * @brief Build the stack over a point store
     *
     * @param config Validated with requireValid()
     * @param store Point store; an in-memory store when null
     * @throws config::InvalidConfigException for an invalid config or when
     *         the start-up cell layer cannot be built
     */
    explicit ProximityService(const config::ProximityConfig& config,
                              std::shared_ptr<store::IPointStore> store = nullptr);

    /**
     * @brief Build the stack over an external geo store
     *
     * The geo set key comes from config.storeKey.
     */
    [[nodiscard]] static auto withGeoStore(
        const config::ProximityConfig& config,
        std::shared_ptr<store::IGeoStoreClient> client)
        -> std::unique_ptr<ProximityService>;

    ProximityService(const ProximityService&) = delete;
    ProximityService& operator=(const ProximityService&) = delete;

    // ==================== Writes ====================

    [[nodiscard]] auto reportLocation(const std::string& driverId,
                                      double longitude, double latitude)
        -> model::VoidResult {
        return gateway_.reportLocation(driverId, longitude, latitude);
    }

    [[nodiscard]] auto deregister(const std::string& driverId)
        -> model::VoidResult {
        return gateway_.deregister(driverId);
    }

    [[nodiscard]] auto reportBatch(std::span<const model::Point> points)
        -> model::Result<size_t> {
        return gateway_.reportBatch(points);
    }

    [[nodiscard]] auto updateAvailability(
        const std::string& driverId, update::Availability availability,
        std::optional<model::GeoPoint> location = std::nullopt)
        -> model::VoidResult {
        return gateway_.updateAvailability(driverId, availability, location);
    }

    [[nodiscard]] auto buildCellIndex(int resolution) -> model::VoidResult {
        return gateway_.buildCellIndex(resolution);
    }

    // ==================== Reads ====================

    [[nodiscard]] auto position(const std::string& driverId) const
        -> model::Result<std::optional<model::GeoPoint>> {
        return gateway_.position(driverId);
    }

    /**
     * @brief Nearby drivers with formatted distances
     *
     * @param strategy Configured strategy when empty
     * @param preferPrimary Configured preference when empty
     */
    [[nodiscard]] auto searchNearby(
        double longitude, double latitude, double radiusKm, int count,
        std::optional<model::SearchStrategy> strategy = std::nullopt,
        std::optional<bool> preferPrimary = std::nullopt) const
        -> model::Result<std::vector<model::NearbyDriver>>;

    [[nodiscard]] auto search(const model::SearchQuery& query) const
        -> model::Result<model::SearchResult> {
        return engine_.search(query);
    }

    /**
     * @brief Engine counters, cell layer statistics and store size
     */
    [[nodiscard]] auto getStats() const -> json;

    [[nodiscard]] auto config() const -> const config::ProximityConfig& {
        return config_;
    }

    [[nodiscard]] auto locations() const -> const std::shared_ptr<LocationIndex>& {
        return locations_;
    }

    [[nodiscard]] auto engine() const -> const search::ProximitySearchEngine& {
        return engine_;
    }

    [[nodiscard]] auto gateway() -> update::LocationUpdateGateway& {
        return gateway_;
    }

private:
    config::ProximityConfig config_;
    std::shared_ptr<LocationIndex> locations_;
    update::LocationUpdateGateway gateway_;
    search::ProximitySearchEngine engine_;
};

}  // namespace geofleet::proximity

#endif  // GEOFLEET_PROXIMITY_PROXIMITY_SERVICE_HPP

// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_STORE_GEO_STORE_POINT_STORE_HPP
#define GEOFLEET_PROXIMITY_STORE_GEO_STORE_POINT_STORE_HPP

#include <memory>
#include <string>

#include "geo_store_client.hpp"
#include "point_store_interface.hpp"

namespace geofleet::proximity::store {

/**
 * @brief Point store backed by an external geo store
 *
 * Adapts IGeoStoreClient to IPointStore. All points live in one geo set
 * (the key, "drivers" by default). Client exceptions of type GeoStoreError
 * surface as StoreUnavailable; nothing is retried here.
 *
 * The remote store measures distance on its own sphere. Its distances are
 * rescaled to EARTH_RADIUS_KM so results rank and compare exactly like the
 * in-memory store.
 */
class GeoStorePointStore : public IPointStore {
public:
    /// Earth radius used by the common sorted-set geo implementation
    static constexpr double DEFAULT_STORE_EARTH_RADIUS_KM = 6372.7976;

    /**
     * @brief Construct the adapter
     *
     * @param client Store client (must not be null)
     * @param key Geo set key
     * @param storeEarthRadiusKm Sphere radius the store computes distances on
     * @throws std::invalid_argument if client is null or the radius is not
     *         positive
     */
    explicit GeoStorePointStore(
        std::shared_ptr<IGeoStoreClient> client, std::string key = "drivers",
        double storeEarthRadiusKm = DEFAULT_STORE_EARTH_RADIUS_KM);

    ~GeoStorePointStore() override = default;

    [[nodiscard]] auto upsert(const std::string& id, double longitude,
                              double latitude) -> VoidResult override;

    [[nodiscard]] auto remove(const std::string& id) -> VoidResult override;

    [[nodiscard]] auto position(const std::string& id)
        -> Result<std::optional<GeoPoint>> override;

    [[nodiscard]] auto positions(std::span<const std::string> ids)
        -> Result<std::vector<std::pair<std::string, GeoPoint>>> override;

    [[nodiscard]] auto scanRadius(const GeoPoint& center, double radiusKm,
                                  size_t limit, std::stop_token stopToken = {})
        -> Result<SearchResult> override;

    [[nodiscard]] auto snapshot() -> Result<std::vector<Point>> override;

    [[nodiscard]] auto size() -> Result<size_t> override;

    [[nodiscard]] auto key() const -> const std::string& { return key_; }

private:
    /// One GEOPOS round trip for all ids; the reply must align with ids
    [[nodiscard]] auto fetchPositions(std::span<const std::string> ids)
        -> Result<std::vector<std::optional<GeoMember>>>;

    std::shared_ptr<IGeoStoreClient> client_;
    std::string key_;
    double storeEarthRadiusKm_;
};

}  // namespace geofleet::proximity::store

#endif  // GEOFLEET_PROXIMITY_STORE_GEO_STORE_POINT_STORE_HPP

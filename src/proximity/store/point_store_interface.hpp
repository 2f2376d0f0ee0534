// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_STORE_POINT_STORE_INTERFACE_HPP
#define GEOFLEET_PROXIMITY_STORE_POINT_STORE_INTERFACE_HPP

#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "../model/error.hpp"
#include "../model/geo_point.hpp"
#include "../model/search_result.hpp"

namespace geofleet::proximity::store {

using model::GeoPoint;
using model::Point;
using model::Result;
using model::SearchResult;
using model::VoidResult;

/**
 * @brief Abstract keyed store of point locations
 *
 * Maps an opaque entity id to one (longitude, latitude) pair and answers
 * the primitive "everything within radius, nearest first" scan. This is the
 * leaf of the proximity stack; the in-memory and remote geo-store backed
 * implementations both satisfy it. Implementations must be thread-safe.
 *
 * Error Handling:
 * - Returns std::expected<T, ProximityError> for fallible operations
 * - InvalidCoordinate / InvalidId are detected before the store is touched
 * - Remote implementations report connectivity loss as StoreUnavailable
 */
class IPointStore {
public:
    IPointStore() = default;
    virtual ~IPointStore() = default;

    // Prevent copying
    IPointStore(const IPointStore&) = delete;
    IPointStore& operator=(const IPointStore&) = delete;

    /**
     * @brief Insert or replace the location of an entity
     * @param id Entity identifier (non-empty)
     * @param longitude Degrees, [-180, 180]
     * @param latitude Degrees, [-90, 90]
     * @return Success, InvalidId, InvalidCoordinate or StoreUnavailable
     */
    [[nodiscard]] virtual auto upsert(const std::string& id, double longitude,
                                      double latitude) -> VoidResult = 0;

    /**
     * @brief Remove an entity; removing an unknown id succeeds
     * @return Success or StoreUnavailable
     */
    [[nodiscard]] virtual auto remove(const std::string& id) -> VoidResult = 0;

    /**
     * @brief Look up the stored location of an entity
     * @return Location if present, nullopt if absent, or StoreUnavailable
     */
    [[nodiscard]] virtual auto position(const std::string& id)
        -> Result<std::optional<GeoPoint>> = 0;

    /**
     * @brief Look up many locations at once
     *
     * Unknown ids are silently skipped; the output order follows the input.
     */
    [[nodiscard]] virtual auto positions(std::span<const std::string> ids)
        -> Result<std::vector<std::pair<std::string, GeoPoint>>> = 0;

    /**
     * @brief All points within radiusKm of center, nearest first
     *
     * Cost is proportional to the number of stored points. Equal distances
     * are ordered by id.
     *
     * @param center Query center (must be a valid coordinate)
     * @param radiusKm Radius in kilometres (must be positive)
     * @param limit Maximum number of entries to return
     * @param stopToken Lets the caller interrupt a long scan
     * @return Ranked hits, or InvalidCoordinate / InvalidRadius /
     *         StoreUnavailable / Cancelled
     */
    [[nodiscard]] virtual auto scanRadius(const GeoPoint& center,
                                          double radiusKm, size_t limit,
                                          std::stop_token stopToken = {})
        -> Result<SearchResult> = 0;

    /**
     * @brief Copy of every stored point, used to build cell layers
     */
    [[nodiscard]] virtual auto snapshot() -> Result<std::vector<Point>> = 0;

    /**
     * @brief Number of stored points
     */
    [[nodiscard]] virtual auto size() -> Result<size_t> = 0;
};

}  // namespace geofleet::proximity::store

#endif  // GEOFLEET_PROXIMITY_STORE_POINT_STORE_INTERFACE_HPP

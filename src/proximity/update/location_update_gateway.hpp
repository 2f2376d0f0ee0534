// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_UPDATE_LOCATION_UPDATE_GATEWAY_HPP
#define GEOFLEET_PROXIMITY_UPDATE_LOCATION_UPDATE_GATEWAY_HPP

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../location_index.hpp"
#include "../model/error.hpp"
#include "../model/geo_point.hpp"

namespace geofleet::proximity::update {

/**
 * @brief Driver availability as reported by the driver app
 */
enum class Availability {
    Online = 0,
    Busy,
    Offline,
};

[[nodiscard]] auto availabilityToString(Availability availability)
    -> std::string_view;

/**
 * @brief Parse "ONLINE", "BUSY" or "OFFLINE" (any case)
 */
[[nodiscard]] auto availabilityFromString(std::string_view name)
    -> std::optional<Availability>;

/**
 * @brief Single entry point for location writes
 *
 * Every write takes the LocationIndex write lock and applies the store
 * mutation and the cell membership update together, so the store and every
 * built cell layer always agree.
 */
class LocationUpdateGateway {
public:
    /**
     * @throws std::invalid_argument if locations is null
     */
    explicit LocationUpdateGateway(std::shared_ptr<LocationIndex> locations);

    /**
     * @brief Record the latest position of an entity
     *
     * Replaces any previous position. Reporting the same coordinates twice
     * leaves the index unchanged.
     *
     * @return Success, InvalidId, InvalidCoordinate or StoreUnavailable
     */
    [[nodiscard]] auto reportLocation(const std::string& id, double longitude,
                                      double latitude) -> model::VoidResult;

    /**
     * @brief Remove an entity from the store and every cell layer
     *
     * Idempotent: unknown ids succeed.
     */
    [[nodiscard]] auto deregister(const std::string& id) -> model::VoidResult;

    /**
     * @brief Report many positions at once
     *
     * Every point is validated before anything is written; the first
     * invalid point rejects the whole batch. A store failure part way
     * through leaves the points before it applied.
     *
     * @return Number of points written
     */
    [[nodiscard]] auto reportBatch(std::span<const model::Point> points)
        -> model::Result<size_t>;

    /**
     * @brief Apply an availability change
     *
     * Online or Busy with a location reports it; without one the current
     * entry is kept, so a busy driver stays searchable. Offline takes the
     * driver out of the index.
     */
    [[nodiscard]] auto updateAvailability(
        const std::string& id, Availability availability,
        std::optional<model::GeoPoint> location = std::nullopt)
        -> model::VoidResult;

    [[nodiscard]] auto position(const std::string& id) const
        -> model::Result<std::optional<model::GeoPoint>>;

    /**
     * @brief Build a cell layer while no writer can run
     */
    [[nodiscard]] auto buildCellIndex(int resolution) -> model::VoidResult;

    void dropCellIndex(int resolution);

private:
    [[nodiscard]] auto applyLocked(const std::string& id,
                                   const model::GeoPoint& location)
        -> model::VoidResult;

    std::shared_ptr<LocationIndex> locations_;
};

}  // namespace geofleet::proximity::update

#endif  // GEOFLEET_PROXIMITY_UPDATE_LOCATION_UPDATE_GATEWAY_HPP

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

#ifndef GEOFLEET_PROXIMITY_MODEL_GEO_POINT_HPP
#define GEOFLEET_PROXIMITY_MODEL_GEO_POINT_HPP

#include <string>

#include <nlohmann/json.hpp>

namespace geofleet::proximity::model {

using json = nlohmann::json;

/// Mean Earth radius used by every distance computation in the index
inline constexpr double EARTH_RADIUS_KM = 6371.0;

inline constexpr double MIN_LONGITUDE = -180.0;
inline constexpr double MAX_LONGITUDE = 180.0;
inline constexpr double MIN_LATITUDE = -90.0;
inline constexpr double MAX_LATITUDE = 90.0;

/**
 * @brief A location on the earth's surface in degrees
 */
struct GeoPoint {
    double longitude = 0.0;  ///< Degrees east, [-180, 180]
    double latitude = 0.0;   ///< Degrees north, [-90, 90]

    [[nodiscard]] auto operator==(const GeoPoint&) const -> bool = default;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief A tracked entity location keyed by its opaque identifier
 */
struct Point {
    std::string id;
    GeoPoint location;

    [[nodiscard]] auto operator==(const Point&) const -> bool = default;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Validate longitude/latitude ranges
 *
 * NaN and infinities are rejected.
 *
 * @param longitude Degrees, must be in [-180, 180]
 * @param latitude Degrees, must be in [-90, 90]
 * @return true if both values are in range
 */
[[nodiscard]] auto isValidCoordinate(double longitude, double latitude) noexcept
    -> bool;

[[nodiscard]] inline auto isValidCoordinate(const GeoPoint& point) noexcept
    -> bool {
    return isValidCoordinate(point.longitude, point.latitude);
}

/**
 * @brief Great-circle distance between two points
 *
 * Haversine formula on a sphere of radius EARTH_RADIUS_KM. Every store and
 * index ranks with this function so the strategies agree bit for bit.
 *
 * @return Distance in kilometres
 */
[[nodiscard]] auto haversineKm(const GeoPoint& a, const GeoPoint& b) noexcept
    -> double;

[[nodiscard]] constexpr auto degreesToRadians(double degrees) noexcept
    -> double {
    return degrees * 3.14159265358979323846 / 180.0;
}

[[nodiscard]] constexpr auto radiansToDegrees(double radians) noexcept
    -> double {
    return radians * 180.0 / 3.14159265358979323846;
}

}  // namespace geofleet::proximity::model

#endif  // GEOFLEET_PROXIMITY_MODEL_GEO_POINT_HPP

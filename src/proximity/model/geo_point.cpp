// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "geo_point.hpp"

#include <algorithm>
#include <cmath>

namespace geofleet::proximity::model {

auto GeoPoint::toJson() const -> json {
    return {{"longitude", longitude}, {"latitude", latitude}};
}

auto Point::toJson() const -> json {
    return {{"id", id},
            {"longitude", location.longitude},
            {"latitude", location.latitude}};
}

auto isValidCoordinate(double longitude, double latitude) noexcept -> bool {
    if (!std::isfinite(longitude) || !std::isfinite(latitude)) {
        return false;
    }
    return longitude >= MIN_LONGITUDE && longitude <= MAX_LONGITUDE &&
           latitude >= MIN_LATITUDE && latitude <= MAX_LATITUDE;
}

auto haversineKm(const GeoPoint& a, const GeoPoint& b) noexcept -> double {
    double lat1 = degreesToRadians(a.latitude);
    double lat2 = degreesToRadians(b.latitude);
    double dLat = lat2 - lat1;
    double dLng = degreesToRadians(b.longitude - a.longitude);

    double h = std::sin(dLat / 2.0) * std::sin(dLat / 2.0) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dLng / 2.0) *
                   std::sin(dLng / 2.0);

    // Rounding can push h a hair above 1 for antipodal points
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

}  // namespace geofleet::proximity::model

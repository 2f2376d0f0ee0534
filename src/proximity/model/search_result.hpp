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

#ifndef GEOFLEET_PROXIMITY_MODEL_SEARCH_RESULT_HPP
#define GEOFLEET_PROXIMITY_MODEL_SEARCH_RESULT_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geofleet::proximity::model {

using json = nlohmann::json;

/**
 * @brief One ranked entry of a proximity search
 */
struct SearchHit {
    /// Opaque entity identifier
    std::string id;

    /// Great-circle distance from the query center in kilometres
    double distanceKm = 0.0;

    [[nodiscard]] auto operator==(const SearchHit&) const -> bool = default;

    [[nodiscard]] auto toJson() const -> json {
        return {{"id", id}, {"distanceKm", distanceKm}};
    }
};

/**
 * @brief Ordered search output
 *
 * Non-decreasing in distanceKm, free of duplicate ids, never longer than the
 * count that was asked for.
 */
using SearchResult = std::vector<SearchHit>;

/**
 * @brief Transport-facing nearby entry
 *
 * Existing clients receive the distance as a decimal string of kilometres.
 */
struct NearbyDriver {
    std::string driverId;
    std::string distance;

    [[nodiscard]] auto operator==(const NearbyDriver&) const -> bool = default;

    [[nodiscard]] auto toJson() const -> json {
        return {{"driverId", driverId}, {"distance", distance}};
    }
};

/**
 * @brief Format a distance the way the geo store reports it
 *
 * Four fractional digits with trailing zeros removed, e.g. 1.25 -> "1.25",
 * 0.0 -> "0", 3.14159 -> "3.1416".
 *
 * @param distanceKm Distance in kilometres
 * @return Decimal string
 */
[[nodiscard]] auto formatDistance(double distanceKm) -> std::string;

/**
 * @brief Convert ranked hits to the transport representation
 */
[[nodiscard]] auto toNearbyDrivers(const SearchResult& result)
    -> std::vector<NearbyDriver>;

/**
 * @brief Sort hits nearest first and keep at most limit of them
 *
 * Equal distances are ordered by id so every store ranks identically.
 */
void rankAndTruncate(SearchResult& hits, size_t limit);

/**
 * @brief Check the ordering/uniqueness invariants of a result
 *
 * @return true if distances are non-decreasing and ids are unique
 */
[[nodiscard]] auto isWellFormed(const SearchResult& result) -> bool;

}  // namespace geofleet::proximity::model

#endif  // GEOFLEET_PROXIMITY_MODEL_SEARCH_RESULT_HPP

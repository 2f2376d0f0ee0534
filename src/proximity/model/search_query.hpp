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

#ifndef GEOFLEET_PROXIMITY_MODEL_SEARCH_QUERY_HPP
#define GEOFLEET_PROXIMITY_MODEL_SEARCH_QUERY_HPP

#include <optional>
#include <string>
#include <string_view>

#include "geo_point.hpp"

namespace geofleet::proximity::model {

/**
 * @brief How a radius query finds its candidates
 */
enum class SearchStrategy {
    /// Brute-force scan of every stored point
    FlatScan = 0,

    /// Bounded lookup in the query's home cell and its neighbour rings
    Hierarchical = 1
};

[[nodiscard]] inline auto strategyToString(SearchStrategy strategy)
    -> std::string {
    switch (strategy) {
        case SearchStrategy::FlatScan:
            return "flatScan";
        case SearchStrategy::Hierarchical:
            return "hierarchical";
    }
    return "flatScan";
}

/**
 * @brief Parse a strategy flag
 *
 * Accepts "flatScan"/"flat"/"flat_scan" and "hierarchical"/"h3"/"cells"
 * (case-sensitive).
 *
 * @return Strategy, or nullopt for unknown names
 */
[[nodiscard]] inline auto strategyFromString(std::string_view name)
    -> std::optional<SearchStrategy> {
    if (name == "flatScan" || name == "flat" || name == "flat_scan") {
        return SearchStrategy::FlatScan;
    }
    if (name == "hierarchical" || name == "h3" || name == "cells") {
        return SearchStrategy::Hierarchical;
    }
    return std::nullopt;
}

/**
 * @brief Parameters of one proximity search
 */
struct SearchQuery {
    /// Query center
    GeoPoint center;

    /// Search radius in kilometres, must be positive
    double radiusKm = 5.0;

    /// Number of results wanted; zero or less yields an empty result
    int desiredCount = 10;

    /// Candidate discovery strategy
    SearchStrategy strategy = SearchStrategy::FlatScan;

    /// Fill slots with primary entities before synthetic ones
    bool preferPrimary = true;
};

}  // namespace geofleet::proximity::model

#endif  // GEOFLEET_PROXIMITY_MODEL_SEARCH_QUERY_HPP

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

#ifndef GEOFLEET_PROXIMITY_SEARCH_PROXIMITY_SEARCH_ENGINE_HPP
#define GEOFLEET_PROXIMITY_SEARCH_PROXIMITY_SEARCH_ENGINE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../location_index.hpp"
#include "../model/error.hpp"
#include "../model/search_query.hpp"
#include "../model/search_result.hpp"
#include "../overlay/overlay_classifier.hpp"

namespace geofleet::proximity::search {

using json = nlohmann::json;

/**
 * @brief Search engine configuration
 */
struct EngineOptions {
    /// Internal result limit before overlay filling (raised to desiredCount
    /// when a caller asks for more)
    size_t candidateCeiling = 1000;

    /// Cell layer used by the hierarchical strategy
    int cellResolution = index::CellIndex::DEFAULT_RESOLUTION;

    /// Strategy used by searchNearby when the caller does not pick one
    model::SearchStrategy defaultStrategy = model::SearchStrategy::FlatScan;

    /// Id prefix marking synthetic entries
    std::string syntheticPrefix =
        std::string(overlay::DEFAULT_SYNTHETIC_PREFIX);
};

/**
 * @brief Ranked "who is near this point" queries
 *
 * Dispatches a SearchQuery to the flat radius scan of the point store or to
 * the cell index, then applies the overlay policy so Primary entries get
 * precedence over synthetic ones. Queries are read-only and hold the
 * LocationIndex read lock for their whole duration.
 *
 * The hierarchical strategy never falls back to a flat scan: with no layer
 * built at the configured resolution it fails with IndexUnavailable.
 *
 * Uses PIMPL pattern for implementation hiding.
 *
 * @thread_safe All public methods are thread-safe.
 */
class ProximitySearchEngine {
public:
    /**
     * @brief Construct an engine over a shared location index
     *
     * @param locations Store and cell index to query (must not be null)
     * @param options Engine configuration
     * @throws std::invalid_argument if locations is null, the candidate
     *         ceiling is zero or the synthetic prefix is empty
     */
    explicit ProximitySearchEngine(std::shared_ptr<LocationIndex> locations,
                                   EngineOptions options = {});

    ~ProximitySearchEngine();

    // Non-copyable
    ProximitySearchEngine(const ProximitySearchEngine&) = delete;
    ProximitySearchEngine& operator=(const ProximitySearchEngine&) = delete;

    // Movable
    ProximitySearchEngine(ProximitySearchEngine&&) noexcept;
    ProximitySearchEngine& operator=(ProximitySearchEngine&&) noexcept;

    /**
     * @brief Run one proximity query
     *
     * @param query Center, radius, count, strategy and overlay preference
     * @param stopToken Interrupts a long flat scan (Cancelled)
     * @return At most desiredCount hits in non-decreasing distance order,
     *         or InvalidCoordinate, InvalidRadius, IndexUnavailable,
     *         StoreUnavailable or Cancelled
     */
    [[nodiscard]] auto search(const model::SearchQuery& query,
                              std::stop_token stopToken = {}) const
        -> model::Result<model::SearchResult>;

    /**
     * @brief Transport-facing search returning formatted distances
     *
     * @param longitude Center longitude
     * @param latitude Center latitude
     * @param radiusKm Radius in kilometres
     * @param count Number of drivers wanted; negative fails with InvalidCount
     * @param strategy Strategy flag, defaultStrategy when empty
     * @param preferPrimary Give real drivers precedence
     * @return Nearby drivers with distance as a decimal string of km
     */
    [[nodiscard]] auto searchNearby(
        double longitude, double latitude, double radiusKm, int count,
        std::optional<model::SearchStrategy> strategy = std::nullopt,
        bool preferPrimary = true) const
        -> model::Result<std::vector<model::NearbyDriver>>;

    [[nodiscard]] auto options() const -> const EngineOptions&;

    [[nodiscard]] auto classifier() const -> const overlay::OverlayClassifier&;

    /**
     * @brief Per-strategy query counters and latencies
     *
     * @return JSON object keyed by strategy name
     */
    [[nodiscard]] auto getStats() const -> json;

    /**
     * @brief Reset all counters to zero
     */
    void resetStats();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace geofleet::proximity::search

#endif  // GEOFLEET_PROXIMITY_SEARCH_PROXIMITY_SEARCH_ENGINE_HPP

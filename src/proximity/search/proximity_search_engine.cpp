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

#include "proximity_search_engine.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::search {

using model::ErrorCode;
using model::makeError;
using model::SearchStrategy;

namespace {

/**
 * @brief Lock-free counters for one strategy
 */
struct StrategyStats {
    std::atomic<uint64_t> queries{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> candidates{0};
    std::atomic<uint64_t> totalLatencyUs{0};
    std::atomic<uint64_t> lastLatencyUs{0};

    void reset() noexcept {
        queries = 0;
        failures = 0;
        candidates = 0;
        totalLatencyUs = 0;
        lastLatencyUs = 0;
    }

    [[nodiscard]] auto toJson() const -> json {
        uint64_t count = queries.load();
        uint64_t total = totalLatencyUs.load();
        return {{"queries", count},
                {"failures", failures.load()},
                {"candidatesExamined", candidates.load()},
                {"totalLatencyUs", total},
                {"lastLatencyUs", lastLatencyUs.load()},
                {"avgLatencyUs",
                 count == 0 ? 0.0
                            : static_cast<double>(total) /
                                  static_cast<double>(count)}};
    }
};

constexpr size_t STRATEGY_COUNT = 2;

}  // namespace

/**
 * @brief Implementation class using PIMPL pattern
 */
class ProximitySearchEngine::Impl {
public:
    Impl(std::shared_ptr<LocationIndex> locations, EngineOptions options)
        : locations_(std::move(locations)),
          options_(std::move(options)),
          classifier_(options_.syntheticPrefix) {
        if (!locations_) {
            throw std::invalid_argument(
                "ProximitySearchEngine requires a location index");
        }
        if (options_.candidateCeiling == 0) {
            throw std::invalid_argument("Candidate ceiling must be positive");
        }
        spdlog::debug("ProximitySearchEngine::Impl constructed (ceiling={}, "
                      "resolution={})",
                      options_.candidateCeiling, options_.cellResolution);
    }

    auto search(const model::SearchQuery& query,
                std::stop_token stopToken) const
        -> model::Result<model::SearchResult> {
        auto& stats = statsFor(query.strategy);
        auto start = std::chrono::steady_clock::now();

        auto result = run(query, std::move(stopToken));

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
        stats.queries.fetch_add(1, std::memory_order_relaxed);
        stats.totalLatencyUs.fetch_add(static_cast<uint64_t>(elapsed),
                                       std::memory_order_relaxed);
        stats.lastLatencyUs.store(static_cast<uint64_t>(elapsed),
                                  std::memory_order_relaxed);
        if (!result) {
            stats.failures.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("{} search failed: {}",
                          model::strategyToString(query.strategy),
                          result.error().toString());
        }
        return result;
    }

    auto searchNearby(double longitude, double latitude, double radiusKm,
                      int count, std::optional<SearchStrategy> strategy,
                      bool preferPrimary) const
        -> model::Result<std::vector<model::NearbyDriver>> {
        if (count < 0) {
            return makeError(ErrorCode::InvalidCount,
                             std::format("Invalid result count: {}", count));
        }

        model::SearchQuery query;
        query.center = {longitude, latitude};
        query.radiusKm = radiusKm;
        query.desiredCount = count;
        query.strategy = strategy.value_or(options_.defaultStrategy);
        query.preferPrimary = preferPrimary;

        auto hits = search(query, {});
        if (!hits) {
            return std::unexpected(hits.error());
        }
        return model::toNearbyDrivers(*hits);
    }

    [[nodiscard]] auto options() const -> const EngineOptions& {
        return options_;
    }

    [[nodiscard]] auto classifier() const -> const overlay::OverlayClassifier& {
        return classifier_;
    }

    [[nodiscard]] auto getStats() const -> json {
        json stats;
        stats[model::strategyToString(SearchStrategy::FlatScan)] =
            statsFor(SearchStrategy::FlatScan).toJson();
        stats[model::strategyToString(SearchStrategy::Hierarchical)] =
            statsFor(SearchStrategy::Hierarchical).toJson();
        stats["candidateCeiling"] = options_.candidateCeiling;
        stats["cellResolution"] = options_.cellResolution;
        return stats;
    }

    void resetStats() {
        for (auto& stats : stats_) {
            stats.reset();
        }
    }

private:
    auto statsFor(SearchStrategy strategy) const -> StrategyStats& {
        return stats_[static_cast<size_t>(strategy) % STRATEGY_COUNT];
    }

    auto run(const model::SearchQuery& query, std::stop_token stopToken) const
        -> model::Result<model::SearchResult> {
        if (!model::isValidCoordinate(query.center)) {
            return makeError(
                ErrorCode::InvalidCoordinate,
                std::format("Invalid search center: lon={}, lat={}",
                            query.center.longitude, query.center.latitude));
        }
        if (!std::isfinite(query.radiusKm) || query.radiusKm <= 0.0) {
            return makeError(
                ErrorCode::InvalidRadius,
                std::format("Invalid search radius: {}", query.radiusKm));
        }
        if (query.desiredCount <= 0) {
            return model::SearchResult{};
        }

        const size_t limit =
            std::max(options_.candidateCeiling,
                     static_cast<size_t>(query.desiredCount));

        model::Result<model::SearchResult> candidates;
        size_t examined = 0;
        {
            auto lock = locations_->readLock();
            switch (query.strategy) {
                case SearchStrategy::Hierarchical: {
                    index::CellQueryTrace trace;
                    candidates = locations_->cells().query(
                        query.center, query.radiusKm, limit,
                        options_.cellResolution, &trace);
                    examined = trace.candidates;
                    break;
                }
                case SearchStrategy::FlatScan:
                default:
                    candidates = locations_->store().scanRadius(
                        query.center, query.radiusKm, limit,
                        std::move(stopToken));
                    examined = candidates ? candidates->size() : 0;
                    break;
            }
        }

        if (!candidates) {
            return std::unexpected(candidates.error());
        }
        statsFor(query.strategy)
            .candidates.fetch_add(examined, std::memory_order_relaxed);

        auto result = classifier_.partitionAndFill(
            *candidates, query.desiredCount, query.preferPrimary);

        SPDLOG_DEBUG("{} search at ({}, {}) r={}km: {} candidates, {} results",
                     model::strategyToString(query.strategy),
                     query.center.longitude, query.center.latitude,
                     query.radiusKm, candidates->size(), result.size());
        return result;
    }

    std::shared_ptr<LocationIndex> locations_;
    EngineOptions options_;
    overlay::OverlayClassifier classifier_;

    mutable std::array<StrategyStats, STRATEGY_COUNT> stats_;
};

// ============================================================================
// ProximitySearchEngine Public Implementation
// ============================================================================

ProximitySearchEngine::ProximitySearchEngine(
    std::shared_ptr<LocationIndex> locations, EngineOptions options)
    : pImpl_(std::make_unique<Impl>(std::move(locations), std::move(options))) {
    spdlog::debug("ProximitySearchEngine created");
}

ProximitySearchEngine::~ProximitySearchEngine() = default;

ProximitySearchEngine::ProximitySearchEngine(
    ProximitySearchEngine&&) noexcept = default;

ProximitySearchEngine& ProximitySearchEngine::operator=(
    ProximitySearchEngine&&) noexcept = default;

auto ProximitySearchEngine::search(const model::SearchQuery& query,
                                   std::stop_token stopToken) const
    -> model::Result<model::SearchResult> {
    return pImpl_->search(query, std::move(stopToken));
}

auto ProximitySearchEngine::searchNearby(
    double longitude, double latitude, double radiusKm, int count,
    std::optional<SearchStrategy> strategy, bool preferPrimary) const
    -> model::Result<std::vector<model::NearbyDriver>> {
    return pImpl_->searchNearby(longitude, latitude, radiusKm, count, strategy,
                                preferPrimary);
}

auto ProximitySearchEngine::options() const -> const EngineOptions& {
    return pImpl_->options();
}

auto ProximitySearchEngine::classifier() const
    -> const overlay::OverlayClassifier& {
    return pImpl_->classifier();
}

auto ProximitySearchEngine::getStats() const -> json {
    return pImpl_->getStats();
}

void ProximitySearchEngine::resetStats() { pImpl_->resetStats(); }

}  // namespace geofleet::proximity::search

// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "memory_point_store.hpp"

#include <cmath>
#include <format>
#include <mutex>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::store {

using model::ErrorCode;
using model::makeError;

auto MemoryPointStore::upsert(const std::string& id, double longitude,
                              double latitude) -> VoidResult {
    if (id.empty()) {
        return makeError(ErrorCode::InvalidId, "Entity id must not be empty");
    }
    if (!model::isValidCoordinate(longitude, latitude)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid coordinate for '{}': lon={}, "
                                     "lat={}",
                                     id, longitude, latitude));
    }

    std::unique_lock lock(mutex_);
    points_.insert_or_assign(id, GeoPoint{longitude, latitude});

    SPDLOG_DEBUG("Point upserted: {} ({}, {})", id, longitude, latitude);
    return {};
}

auto MemoryPointStore::remove(const std::string& id) -> VoidResult {
    std::unique_lock lock(mutex_);
    if (points_.erase(id) > 0) {
        SPDLOG_DEBUG("Point removed: {}", id);
    }
    return {};
}

auto MemoryPointStore::position(const std::string& id)
    -> Result<std::optional<GeoPoint>> {
    std::shared_lock lock(mutex_);

    auto it = points_.find(id);
    if (it == points_.end()) {
        return std::optional<GeoPoint>{};
    }
    return std::optional<GeoPoint>{it->second};
}

auto MemoryPointStore::positions(std::span<const std::string> ids)
    -> Result<std::vector<std::pair<std::string, GeoPoint>>> {
    std::shared_lock lock(mutex_);

    std::vector<std::pair<std::string, GeoPoint>> found;
    found.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto it = points_.find(id); it != points_.end()) {
            found.emplace_back(id, it->second);
        }
    }
    return found;
}

auto MemoryPointStore::scanRadius(const GeoPoint& center, double radiusKm,
                                  size_t limit, std::stop_token stopToken)
    -> Result<SearchResult> {
    if (!model::isValidCoordinate(center)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid scan center: lon={}, lat={}",
                                     center.longitude, center.latitude));
    }
    if (!std::isfinite(radiusKm) || radiusKm <= 0.0) {
        return makeError(ErrorCode::InvalidRadius,
                         std::format("Invalid scan radius: {}", radiusKm));
    }

    std::shared_lock lock(mutex_);

    SearchResult hits;
    size_t visited = 0;

    for (const auto& [id, location] : points_) {
        if (++visited % SCAN_STRIDE == 0 && stopToken.stop_requested()) {
            spdlog::warn("Flat scan cancelled after {} of {} points", visited,
                         points_.size());
            return makeError(ErrorCode::Cancelled, "Radius scan cancelled");
        }

        double distance = model::haversineKm(center, location);
        if (distance <= radiusKm) {
            hits.push_back({id, distance});
        }
    }

    model::rankAndTruncate(hits, limit);

    SPDLOG_DEBUG("Flat scan visited {} points, returned {}", visited,
                 hits.size());
    return hits;
}

auto MemoryPointStore::snapshot() -> Result<std::vector<Point>> {
    std::shared_lock lock(mutex_);

    std::vector<Point> points;
    points.reserve(points_.size());
    for (const auto& [id, location] : points_) {
        points.push_back({id, location});
    }
    return points;
}

auto MemoryPointStore::size() -> Result<size_t> {
    std::shared_lock lock(mutex_);
    return points_.size();
}

void MemoryPointStore::clear() {
    std::unique_lock lock(mutex_);
    points_.clear();
    spdlog::info("MemoryPointStore cleared");
}

}  // namespace geofleet::proximity::store

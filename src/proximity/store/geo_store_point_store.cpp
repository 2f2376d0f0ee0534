// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "geo_store_point_store.hpp"

#include <cmath>
#include <format>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::store {

using model::ErrorCode;
using model::makeError;

namespace {

auto storeUnavailable(const std::string& operation, const GeoStoreError& e)
    -> std::unexpected<model::ProximityError> {
    spdlog::warn("Geo store {} failed: {}", operation, e.what());
    return makeError(ErrorCode::StoreUnavailable,
                     std::format("Geo store {} failed: {}", operation,
                                 e.what()));
}

}  // namespace

GeoStorePointStore::GeoStorePointStore(std::shared_ptr<IGeoStoreClient> client,
                                       std::string key,
                                       double storeEarthRadiusKm)
    : client_(std::move(client)),
      key_(std::move(key)),
      storeEarthRadiusKm_(storeEarthRadiusKm) {
    if (!client_) {
        throw std::invalid_argument("GeoStorePointStore requires a client");
    }
    if (!(storeEarthRadiusKm_ > 0.0)) {
        throw std::invalid_argument("Store earth radius must be positive");
    }
    spdlog::info("GeoStorePointStore attached to key '{}'", key_);
}

auto GeoStorePointStore::upsert(const std::string& id, double longitude,
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

    try {
        client_->geoAdd(key_, longitude, latitude, id);
    } catch (const GeoStoreError& e) {
        return storeUnavailable("geoAdd", e);
    }
    return {};
}

auto GeoStorePointStore::remove(const std::string& id) -> VoidResult {
    try {
        client_->geoRemove(key_, id);
    } catch (const GeoStoreError& e) {
        return storeUnavailable("geoRemove", e);
    }
    return {};
}

auto GeoStorePointStore::fetchPositions(std::span<const std::string> ids)
    -> Result<std::vector<std::optional<GeoMember>>> {
    std::vector<std::optional<GeoMember>> members;
    try {
        members = client_->geoPos(key_, ids);
    } catch (const GeoStoreError& e) {
        return storeUnavailable("geoPos", e);
    }
    if (members.size() != ids.size()) {
        spdlog::warn("Geo store geoPos answered {} entries for {} members",
                     members.size(), ids.size());
        return makeError(ErrorCode::StoreUnavailable,
                         std::format("Geo store geoPos answered {} entries for "
                                     "{} members",
                                     members.size(), ids.size()));
    }
    return members;
}

auto GeoStorePointStore::position(const std::string& id)
    -> Result<std::optional<GeoPoint>> {
    auto members = fetchPositions(std::span<const std::string>(&id, 1));
    if (!members) {
        return std::unexpected(members.error());
    }
    const auto& member = members->front();
    if (!member) {
        return std::optional<GeoPoint>{};
    }
    return std::optional<GeoPoint>{GeoPoint{member->longitude, member->latitude}};
}

auto GeoStorePointStore::positions(std::span<const std::string> ids)
    -> Result<std::vector<std::pair<std::string, GeoPoint>>> {
    std::vector<std::pair<std::string, GeoPoint>> found;
    if (ids.empty()) {
        return found;
    }

    auto members = fetchPositions(ids);
    if (!members) {
        return std::unexpected(members.error());
    }

    found.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        if (const auto& member = (*members)[i]) {
            found.emplace_back(ids[i],
                               GeoPoint{member->longitude, member->latitude});
        }
    }
    return found;
}

auto GeoStorePointStore::scanRadius(const GeoPoint& center, double radiusKm,
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
    if (stopToken.stop_requested()) {
        return makeError(ErrorCode::Cancelled, "Radius scan cancelled");
    }

    // The store and the index disagree on the sphere only by a constant
    // factor, so ranking is preserved and distances can be rescaled.
    const double scale = model::EARTH_RADIUS_KM / storeEarthRadiusKm_;
    const double storeRadiusKm = radiusKm / scale;

    std::vector<GeoSearchEntry> entries;
    try {
        entries = client_->geoSearch(key_, center.longitude, center.latitude,
                                     storeRadiusKm, limit, true);
    } catch (const GeoStoreError& e) {
        return storeUnavailable("geoSearch", e);
    }

    SearchResult hits;
    hits.reserve(entries.size());
    std::unordered_set<std::string> seen;
    for (auto& entry : entries) {
        double distance = entry.distanceKm * scale;
        if (distance <= radiusKm && seen.insert(entry.member).second) {
            hits.push_back({std::move(entry.member), distance});
        }
    }

    model::rankAndTruncate(hits, limit);

    SPDLOG_DEBUG("Geo store scan on '{}' returned {} of {} entries", key_,
                 hits.size(), entries.size());
    return hits;
}

auto GeoStorePointStore::snapshot() -> Result<std::vector<Point>> {
    try {
        auto members = client_->geoMembers(key_);

        std::vector<Point> points;
        points.reserve(members.size());
        for (auto& member : members) {
            points.push_back({std::move(member.member),
                              GeoPoint{member.longitude, member.latitude}});
        }
        return points;
    } catch (const GeoStoreError& e) {
        return storeUnavailable("geoMembers", e);
    }
}

auto GeoStorePointStore::size() -> Result<size_t> {
    try {
        return client_->cardinality(key_);
    } catch (const GeoStoreError& e) {
        return storeUnavailable("cardinality", e);
    }
}

}  // namespace geofleet::proximity::store

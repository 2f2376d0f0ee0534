// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "location_update_gateway.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::update {

using model::ErrorCode;
using model::makeError;

namespace {

auto validate(const std::string& id, double longitude, double latitude)
    -> model::VoidResult {
    if (id.empty()) {
        return makeError(ErrorCode::InvalidId, "Entity id must not be empty");
    }
    if (!model::isValidCoordinate(longitude, latitude)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid coordinate for '{}': lon={}, "
                                     "lat={}",
                                     id, longitude, latitude));
    }
    return {};
}

}  // namespace

auto availabilityToString(Availability availability) -> std::string_view {
    switch (availability) {
        case Availability::Online:
            return "ONLINE";
        case Availability::Busy:
            return "BUSY";
        case Availability::Offline:
            return "OFFLINE";
    }
    return "OFFLINE";
}

auto availabilityFromString(std::string_view name)
    -> std::optional<Availability> {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "ONLINE") {
        return Availability::Online;
    }
    if (upper == "BUSY") {
        return Availability::Busy;
    }
    if (upper == "OFFLINE") {
        return Availability::Offline;
    }
    return std::nullopt;
}

LocationUpdateGateway::LocationUpdateGateway(
    std::shared_ptr<LocationIndex> locations)
    : locations_(std::move(locations)) {
    if (!locations_) {
        throw std::invalid_argument(
            "LocationUpdateGateway requires a location index");
    }
}

auto LocationUpdateGateway::applyLocked(const std::string& id,
                                        const model::GeoPoint& location)
    -> model::VoidResult {
    if (auto stored = locations_->store().upsert(id, location.longitude,
                                                 location.latitude);
        !stored) {
        return stored;
    }
    return locations_->cells().insert(id, location);
}

auto LocationUpdateGateway::reportLocation(const std::string& id,
                                           double longitude, double latitude)
    -> model::VoidResult {
    if (auto valid = validate(id, longitude, latitude); !valid) {
        spdlog::warn("Rejected location report: {}", valid.error().message);
        return valid;
    }

    auto lock = locations_->writeLock();
    auto result = applyLocked(id, {longitude, latitude});
    if (result) {
        SPDLOG_DEBUG("Location of '{}' set to ({}, {})", id, longitude,
                     latitude);
    }
    return result;
}

auto LocationUpdateGateway::deregister(const std::string& id)
    -> model::VoidResult {
    auto lock = locations_->writeLock();
    if (auto removed = locations_->store().remove(id); !removed) {
        return removed;
    }
    locations_->cells().remove(id);
    SPDLOG_DEBUG("Deregistered '{}'", id);
    return {};
}

auto LocationUpdateGateway::reportBatch(std::span<const model::Point> points)
    -> model::Result<size_t> {
    for (const auto& point : points) {
        if (auto valid = validate(point.id, point.location.longitude,
                                  point.location.latitude);
            !valid) {
            spdlog::warn("Rejected batch of {} points: {}", points.size(),
                         valid.error().message);
            return std::unexpected(valid.error());
        }
    }

    auto lock = locations_->writeLock();
    size_t written = 0;
    for (const auto& point : points) {
        if (auto applied = applyLocked(point.id, point.location); !applied) {
            spdlog::error("Batch stopped after {} of {} points: {}", written,
                          points.size(), applied.error().toString());
            return std::unexpected(applied.error());
        }
        ++written;
    }

    spdlog::info("Batch of {} locations applied", written);
    return written;
}

auto LocationUpdateGateway::updateAvailability(
    const std::string& id, Availability availability,
    std::optional<model::GeoPoint> location) -> model::VoidResult {
    switch (availability) {
        case Availability::Online:
        case Availability::Busy:
            if (location) {
                return reportLocation(id, location->longitude,
                                      location->latitude);
            }
            if (id.empty()) {
                return makeError(ErrorCode::InvalidId,
                                 "Entity id must not be empty");
            }
            return {};
        case Availability::Offline:
            spdlog::debug("'{}' is OFFLINE, removing from the index", id);
            return deregister(id);
    }
    return {};
}

auto LocationUpdateGateway::position(const std::string& id) const
    -> model::Result<std::optional<model::GeoPoint>> {
    auto lock = locations_->readLock();
    return locations_->store().position(id);
}

auto LocationUpdateGateway::buildCellIndex(int resolution)
    -> model::VoidResult {
    auto lock = locations_->writeLock();
    return locations_->cells().build(resolution);
}

void LocationUpdateGateway::dropCellIndex(int resolution) {
    auto lock = locations_->writeLock();
    locations_->cells().drop(resolution);
}

}  // namespace geofleet::proximity::update

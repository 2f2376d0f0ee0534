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

#ifndef GEOFLEET_PROXIMITY_STORE_GEO_STORE_CLIENT_HPP
#define GEOFLEET_PROXIMITY_STORE_GEO_STORE_CLIENT_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace geofleet::proximity::store {

/**
 * @brief Connectivity or timeout failure raised by a geo store client
 *
 * Clients throw this (or a subclass) when the remote store cannot be
 * reached or does not answer in time. Retry policy, if any, belongs to the
 * client; the proximity core never retries.
 */
class GeoStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One member returned by a geo radius search
 */
struct GeoSearchEntry {
    std::string member;
    double distanceKm = 0.0;
};

/**
 * @brief One member with its stored position
 */
struct GeoMember {
    std::string member;
    double longitude = 0.0;
    double latitude = 0.0;
};

/**
 * @brief Client of an external key/value store with geo commands
 *
 * Models the minimal command set of a sorted-set geo store
 * (GEOADD / ZREM / GEOPOS / GEOSEARCH ... WITHDIST / ZRANGE + GEOPOS /
 * ZCARD).
 * Concrete network clients live outside the proximity core.
 */
class IGeoStoreClient {
public:
    virtual ~IGeoStoreClient() = default;

    /**
     * @brief Add or move a member of the geo set at key
     * @throws GeoStoreError on connectivity failure
     */
    virtual void geoAdd(const std::string& key, double longitude,
                        double latitude, const std::string& member) = 0;

    /**
     * @brief Remove a member; unknown members are ignored
     * @throws GeoStoreError on connectivity failure
     */
    virtual void geoRemove(const std::string& key,
                           const std::string& member) = 0;

    /**
     * @brief Stored positions of several members in one round trip
     *
     * @return One entry per requested member, in request order; nullopt
     *         for members that are absent
     * @throws GeoStoreError on connectivity failure
     */
    [[nodiscard]] virtual auto geoPos(const std::string& key,
                                      std::span<const std::string> members)
        -> std::vector<std::optional<GeoMember>> = 0;

    /**
     * @brief Members within radiusKm of (longitude, latitude)
     *
     * @param count Maximum entries; 0 means unbounded
     * @param sortAscending Nearest first when true
     * @throws GeoStoreError on connectivity failure
     */
    [[nodiscard]] virtual auto geoSearch(const std::string& key,
                                         double longitude, double latitude,
                                         double radiusKm, size_t count,
                                         bool sortAscending)
        -> std::vector<GeoSearchEntry> = 0;

    /**
     * @brief Every member of the geo set with its position
     * @throws GeoStoreError on connectivity failure
     */
    [[nodiscard]] virtual auto geoMembers(const std::string& key)
        -> std::vector<GeoMember> = 0;

    /**
     * @brief Number of members in the geo set
     * @throws GeoStoreError on connectivity failure
     */
    [[nodiscard]] virtual auto cardinality(const std::string& key)
        -> size_t = 0;
};

}  // namespace geofleet::proximity::store

#endif  // GEOFLEET_PROXIMITY_STORE_GEO_STORE_CLIENT_HPP

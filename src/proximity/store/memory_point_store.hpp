// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_STORE_MEMORY_POINT_STORE_HPP
#define GEOFLEET_PROXIMITY_STORE_MEMORY_POINT_STORE_HPP

#include <shared_mutex>
#include <unordered_map>

#include "point_store_interface.hpp"

namespace geofleet::proximity::store {

/**
 * @brief In-memory implementation of the point store
 *
 * Hash map from id to location guarded by a shared_mutex. scanRadius visits
 * every entry, which makes this the flat-scan baseline the cell index is
 * measured against.
 *
 * Features:
 * - O(1) upsert, remove and position lookups
 * - Thread-safe concurrent readers and writers
 * - Interruptible radius scan (stop token checked every SCAN_STRIDE entries)
 *
 * @note All data is lost when the process terminates
 */
class MemoryPointStore : public IPointStore {
public:
    /// Entries visited between two stop-token checks during a scan
    static constexpr size_t SCAN_STRIDE = 4096;

    MemoryPointStore() = default;

    ~MemoryPointStore() override = default;

    [[nodiscard]] auto upsert(const std::string& id, double longitude,
                              double latitude) -> VoidResult override;

    [[nodiscard]] auto remove(const std::string& id) -> VoidResult override;

    [[nodiscard]] auto position(const std::string& id)
        -> Result<std::optional<GeoPoint>> override;

    [[nodiscard]] auto positions(std::span<const std::string> ids)
        -> Result<std::vector<std::pair<std::string, GeoPoint>>> override;

    [[nodiscard]] auto scanRadius(const GeoPoint& center, double radiusKm,
                                  size_t limit, std::stop_token stopToken = {})
        -> Result<SearchResult> override;

    [[nodiscard]] auto snapshot() -> Result<std::vector<Point>> override;

    [[nodiscard]] auto size() -> Result<size_t> override;

    /**
     * @brief Remove every stored point
     */
    void clear();

private:
    std::unordered_map<std::string, GeoPoint> points_;
    mutable std::shared_mutex mutex_;
};

}  // namespace geofleet::proximity::store

#endif  // GEOFLEET_PROXIMITY_STORE_MEMORY_POINT_STORE_HPP

// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_LOCATION_INDEX_HPP
#define GEOFLEET_PROXIMITY_LOCATION_INDEX_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>

#include "index/cell_index.hpp"
#include "store/point_store_interface.hpp"

namespace geofleet::proximity {

/**
 * @brief One point store paired with the cell index built over it
 *
 * The pair is guarded by a reader/writer lock. Writers hold it exclusively
 * across the store mutation and the cell membership update; readers hold it
 * shared for a whole query, so no reader sees a point in one structure and
 * not the other.
 *
 * The gateway and the search engine share one LocationIndex through a
 * shared_ptr.
 */
class LocationIndex {
public:
    /**
     * @throws std::invalid_argument if store is null
     */
    explicit LocationIndex(std::shared_ptr<store::IPointStore> store);

    LocationIndex(const LocationIndex&) = delete;
    LocationIndex& operator=(const LocationIndex&) = delete;

    [[nodiscard]] auto store() const -> store::IPointStore& { return *store_; }

    [[nodiscard]] auto cells() const -> index::CellIndex& { return *cells_; }

    [[nodiscard]] auto readLock() const -> std::shared_lock<std::shared_mutex> {
        return std::shared_lock(mutex_);
    }

    [[nodiscard]] auto writeLock() const -> std::unique_lock<std::shared_mutex> {
        return std::unique_lock(mutex_);
    }

private:
    std::shared_ptr<store::IPointStore> store_;
    std::unique_ptr<index::CellIndex> cells_;
    mutable std::shared_mutex mutex_;
};

}  // namespace geofleet::proximity

#endif  // GEOFLEET_PROXIMITY_LOCATION_INDEX_HPP

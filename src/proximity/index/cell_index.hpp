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

#ifndef GEOFLEET_PROXIMITY_INDEX_CELL_INDEX_HPP
#define GEOFLEET_PROXIMITY_INDEX_CELL_INDEX_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "../model/error.hpp"
#include "../model/geo_point.hpp"
#include "../model/search_result.hpp"
#include "../store/point_store_interface.hpp"
#include "hex_grid.hpp"

namespace geofleet::proximity::index {

using json = nlohmann::json;

/**
 * @brief Counters describing the work done by one cell query
 */
struct CellQueryTrace {
    size_t cellsVisited = 0;   ///< Cells whose membership was read
    size_t candidates = 0;     ///< Ids fetched from the point store
    bool usedOccupiedScan = false;  ///< Fell back to scanning occupied cells
};

/**
 * @brief Hierarchical hex-cell index over a point store
 *
 * Keeps, for every built resolution, the membership sets
 * (cellId -> ids) and the reverse map (id -> cellId). A radius query reads
 * only the home cell of the center and the neighbour rings needed to cover
 * the radius, fetches coordinates from the point store for that reduced
 * candidate set and filters by exact haversine distance. Cost is bounded by
 * candidate-set size instead of total store size.
 *
 * Several resolutions can be built side by side; insert() and remove()
 * maintain all of them. A query at a resolution that has not been built
 * fails with IndexUnavailable; it never falls back to a flat scan.
 *
 * @thread_safe All public methods are thread-safe. Keeping the index and
 *              the point store mutually consistent is the job of
 *              LocationIndex, which serialises writers across both.
 *
 * @example
 * ```cpp
 * auto store = std::make_shared<store::MemoryPointStore>();
 * CellIndex cells(store);
 * (void)store->upsert("real:1", 106.700, 10.770);
 * (void)cells.build(7);
 * auto hits = cells.query({106.700, 10.770}, 5.0, 10, 7);
 * ```
 */
class CellIndex {
public:
    /// Resolution used when nothing else is configured (~1.2 km edges)
    static constexpr int DEFAULT_RESOLUTION = 7;

    /**
     * @brief Construct an index reading coordinates from the given store
     *
     * @param store Point store (must not be null)
     * @throws std::invalid_argument if store is null
     */
    explicit CellIndex(std::shared_ptr<store::IPointStore> store);

    ~CellIndex() = default;

    // Non-copyable
    CellIndex(const CellIndex&) = delete;
    CellIndex& operator=(const CellIndex&) = delete;

    /**
     * @brief Build (or rebuild) the layer for a resolution
     *
     * Reads a snapshot of the point store and assigns every point to its
     * cell. An existing layer for the resolution is replaced.
     *
     * @param resolution Cell resolution in [0, 15]
     * @return Success, IndexUnavailable for a resolution outside [0, 15],
     *         or the store's error (StoreUnavailable)
     */
    [[nodiscard]] auto build(int resolution) -> model::VoidResult;

    /**
     * @brief Discard the layer for a resolution (no-op if absent)
     */
    void drop(int resolution);

    /**
     * @brief Discard every layer
     */
    void clear();

    [[nodiscard]] auto isBuilt(int resolution) const -> bool;

    [[nodiscard]] auto builtResolutions() const -> std::vector<int>;

    /**
     * @brief Assign a point to its cell in every built layer
     *
     * Moves the id out of its previous cell when the cell changed.
     * Re-inserting the same coordinates leaves the layers unchanged.
     *
     * @return Success, InvalidId or InvalidCoordinate
     */
    [[nodiscard]] auto insert(const std::string& id,
                              const model::GeoPoint& location)
        -> model::VoidResult;

    /**
     * @brief Remove an id from every built layer (no-op if absent)
     */
    void remove(const std::string& id);

    /**
     * @brief Cell of a coordinate at a resolution
     *
     * Deterministic and pure: identical inputs always give the same id.
     *
     * @return Cell id, InvalidCoordinate for out-of-range input or
     *         IndexUnavailable for a resolution outside [0, 15]
     */
    [[nodiscard]] static auto cellFor(double longitude, double latitude,
                                      int resolution)
        -> model::Result<CellId>;

    /**
     * @brief Cells that may contain points within radiusKm of the cell
     *
     * Center cell plus as many rings as the radius needs. When the rings
     * would outnumber the occupied cells of the layer (polar caps, huge
     * radii), the occupied cells in the latitude band are returned instead.
     * Always a superset of the cells holding true matches.
     *
     * @return Sorted cell ids, InvalidRadius, or IndexUnavailable if the
     *         cell's resolution has no built layer
     */
    [[nodiscard]] auto neighborCells(CellId cell, double radiusKm) const
        -> model::Result<std::vector<CellId>>;

    /**
     * @brief Radius query bounded to neighbour cells
     *
     * @param center Query center
     * @param radiusKm Radius in kilometres (positive)
     * @param limit Maximum number of hits
     * @param resolution Layer to use
     * @param trace Optional work counters
     * @return Hits nearest first; IndexUnavailable when the layer is not
     *         built; InvalidCoordinate / InvalidRadius; StoreUnavailable
     */
    [[nodiscard]] auto query(const model::GeoPoint& center, double radiusKm,
                             size_t limit, int resolution,
                             CellQueryTrace* trace = nullptr) const
        -> model::Result<model::SearchResult>;

    /**
     * @brief Cell an id is assigned to in a layer
     */
    [[nodiscard]] auto cellOf(const std::string& id, int resolution) const
        -> std::optional<CellId>;

    /**
     * @brief Ids assigned to a cell, sorted
     */
    [[nodiscard]] auto members(CellId cell) const -> std::vector<std::string>;

    /**
     * @brief Number of cell membership sets of a layer that hold the id
     *
     * 1 for an indexed id and 0 otherwise; anything else means the layer is
     * corrupt.
     */
    [[nodiscard]] auto membershipCount(const std::string& id,
                                       int resolution) const -> size_t;

    /**
     * @brief Number of ids indexed in a layer
     */
    [[nodiscard]] auto indexedCount(int resolution) const -> size_t;

    /**
     * @brief Per-layer statistics
     */
    [[nodiscard]] auto stats() const -> json;

private:
    /**
     * @brief Membership of one resolution
     */
    struct Layer {
        explicit Layer(int resolution) : grid(resolution) {}

        HexGrid grid;
        std::unordered_map<CellId, std::unordered_set<std::string>> cells;
        std::unordered_map<std::string, CellId> cellById;

        void assign(const std::string& id, CellId cell);
        void unassign(const std::string& id);
    };

    [[nodiscard]] auto coverCells(const Layer& layer, CellId cell,
                                  double radiusKm, bool* usedOccupied) const
        -> std::vector<CellId>;

    std::shared_ptr<store::IPointStore> store_;
    std::map<int, std::unique_ptr<Layer>> layers_;
    mutable std::shared_mutex mutex_;
};

}  // namespace geofleet::proximity::index

#endif  // GEOFLEET_PROXIMITY_INDEX_CELL_INDEX_HPP

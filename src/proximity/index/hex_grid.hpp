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

#ifndef GEOFLEET_PROXIMITY_INDEX_HEX_GRID_HPP
#define GEOFLEET_PROXIMITY_INDEX_HEX_GRID_HPP

#include <cstdint>
#include <vector>

#include "../model/geo_point.hpp"

namespace geofleet::proximity::index {

using CellId = uint64_t;

/**
 * @brief Axial coordinate of a hexagon (q column, r row)
 */
struct HexCoord {
    int64_t q = 0;
    int64_t r = 0;

    [[nodiscard]] auto operator==(const HexCoord&) const -> bool = default;
};

/**
 * @brief Which cells a radius query around one cell has to visit
 *
 * Produced by HexGrid::planCover. The cover is the hex disk of `rings`
 * rings around every origin. When `polar` is set the footprint reaches a
 * pole and wraps every meridian, so callers should visit every occupied
 * cell whose center lies in [minLatitude, maxLatitude] instead.
 */
struct CoverPlan {
    /// Hex rings to expand around each origin
    int rings = 0;

    /// Center cell plus antimeridian-wrapped copies of it
    std::vector<CellId> origins;

    /// Latitude band (degrees) that every candidate cell center lies in
    double minLatitude = model::MIN_LATITUDE;
    double maxLatitude = model::MAX_LATITUDE;

    /// Footprint covers all longitudes
    bool polar = false;

    /// Number of cells the ring expansion would produce
    [[nodiscard]] auto ringCellCount() const -> uint64_t;
};

/**
 * @brief Multi-resolution hexagonal partition of the earth's surface
 *
 * Pointy-top hexagons are laid over the equirectangular plane
 * (x = longitude, y = latitude, both in degrees). Resolution r uses a
 * circumradius of BASE_CELL_SIZE_DEG / sqrt(7)^r, so each finer level has
 * roughly one seventh of the area of the previous one. Every (longitude,
 * latitude) pair maps to exactly one cell at each resolution.
 *
 * Cell ids pack the resolution into the top 4 bits followed by the
 * offset-encoded q and r axial coordinates (30 bits each).
 *
 * The grid is a pure value type: it holds no membership and is safe to
 * share between threads.
 *
 * @example
 * ```cpp
 * HexGrid grid(7);
 * CellId home = grid.cellFor(106.700, 10.770);
 * auto plan = grid.planCover(home, 5.0);
 * auto cells = grid.disk(home, plan.rings);
 * ```
 */
class HexGrid {
public:
    static constexpr int MIN_RESOLUTION = 0;
    static constexpr int MAX_RESOLUTION = 15;

    /// Circumradius of a resolution 0 cell in degrees
    static constexpr double BASE_CELL_SIZE_DEG = 10.0;

    /**
     * @brief Create a grid at the given resolution
     * @throws std::invalid_argument if resolution is outside [0, 15]
     */
    explicit HexGrid(int resolution);

    [[nodiscard]] auto resolution() const noexcept -> int {
        return resolution_;
    }

    /**
     * @brief Circumradius of one cell in degrees
     */
    [[nodiscard]] auto cellSizeDegrees() const noexcept -> double {
        return size_;
    }

    /**
     * @brief Approximate edge length of one cell at the equator in km
     */
    [[nodiscard]] auto edgeLengthKm() const noexcept -> double;

    /**
     * @brief Cell containing a point of the plane
     *
     * Pure and deterministic. Callers validate coordinates; x values beyond
     * +/-180 are accepted so that wrapped copies can be located.
     */
    [[nodiscard]] auto cellFor(double longitude, double latitude) const
        -> CellId;

    [[nodiscard]] auto cellFor(const model::GeoPoint& point) const -> CellId {
        return cellFor(point.longitude, point.latitude);
    }

    /**
     * @brief Planar center of a cell (x may lie outside [-180, 180])
     */
    [[nodiscard]] auto cellCenter(CellId cell) const -> model::GeoPoint;

    /**
     * @brief Every cell within k hex steps of the given cell
     *
     * Returns 3k(k+1)+1 cells, center first.
     */
    [[nodiscard]] auto disk(CellId center, int k) const -> std::vector<CellId>;

    /**
     * @brief Cells at exactly k hex steps (6k cells, 1 for k == 0)
     */
    [[nodiscard]] auto ring(CellId center, int k) const
        -> std::vector<CellId>;

    /**
     * @brief Work out which cells can hold points within radiusKm of any
     *        point of the given cell
     *
     * The plan over-approximates: it accounts for the longitude stretch at
     * high latitude, the antimeridian seam and polar caps.
     */
    [[nodiscard]] auto planCover(CellId center, double radiusKm) const
        -> CoverPlan;

    // ==================== Id encoding ====================

    [[nodiscard]] static auto encode(int resolution, HexCoord coord)
        -> CellId;

    [[nodiscard]] static auto decode(CellId cell) -> HexCoord;

    [[nodiscard]] static auto resolutionOf(CellId cell) noexcept -> int;

    /**
     * @brief Number of hex steps between two cells of one resolution
     */
    [[nodiscard]] static auto hexDistance(HexCoord a, HexCoord b) noexcept
        -> int64_t;

    /**
     * @brief Circumradius in degrees for a resolution
     */
    [[nodiscard]] static auto cellSizeFor(int resolution) -> double;

private:
    [[nodiscard]] auto toAxial(double x, double y) const -> HexCoord;

    int resolution_;
    double size_;
};

}  // namespace geofleet::proximity::index

#endif  // GEOFLEET_PROXIMITY_INDEX_HEX_GRID_HPP

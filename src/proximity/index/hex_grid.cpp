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

#include "hex_grid.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <stdexcept>

namespace geofleet::proximity::index {

namespace {

constexpr double SQRT3 = 1.7320508075688772;

constexpr int COORD_BITS = 30;
constexpr int64_t COORD_OFFSET = int64_t{1} << (COORD_BITS - 1);
constexpr uint64_t COORD_MASK = (uint64_t{1} << COORD_BITS) - 1;
constexpr int RESOLUTION_SHIFT = 2 * COORD_BITS;

// Axial neighbour directions, counter-clockwise starting east
constexpr std::array<HexCoord, 6> DIRECTIONS = {{
    {1, 0},
    {1, -1},
    {0, -1},
    {-1, 0},
    {-1, 1},
    {0, 1},
}};

}  // namespace

auto CoverPlan::ringCellCount() const -> uint64_t {
    auto k = static_cast<uint64_t>(std::max(rings, 0));
    return (3 * k * (k + 1) + 1) * origins.size();
}

HexGrid::HexGrid(int resolution)
    : resolution_(resolution), size_(cellSizeFor(resolution)) {}

auto HexGrid::cellSizeFor(int resolution) -> double {
    if (resolution < MIN_RESOLUTION || resolution > MAX_RESOLUTION) {
        throw std::invalid_argument(
            std::format("Cell resolution {} outside [{}, {}]", resolution,
                        MIN_RESOLUTION, MAX_RESOLUTION));
    }
    return BASE_CELL_SIZE_DEG / std::pow(std::sqrt(7.0), resolution);
}

auto HexGrid::edgeLengthKm() const noexcept -> double {
    return model::degreesToRadians(size_) * model::EARTH_RADIUS_KM;
}

auto HexGrid::toAxial(double x, double y) const -> HexCoord {
    double fq = (SQRT3 / 3.0 * x - y / 3.0) / size_;
    double fr = (2.0 / 3.0 * y) / size_;
    double fs = -fq - fr;

    double rq = std::round(fq);
    double rr = std::round(fr);
    double rs = std::round(fs);

    double dq = std::abs(rq - fq);
    double dr = std::abs(rr - fr);
    double ds = std::abs(rs - fs);

    // Cube rounding: fix the component with the largest rounding error
    if (dq > dr && dq > ds) {
        rq = -rr - rs;
    } else if (dr > ds) {
        rr = -rq - rs;
    }

    return {std::llround(rq), std::llround(rr)};
}

auto HexGrid::cellFor(double longitude, double latitude) const -> CellId {
    return encode(resolution_, toAxial(longitude, latitude));
}

auto HexGrid::cellCenter(CellId cell) const -> model::GeoPoint {
    auto [q, r] = decode(cell);
    double x = size_ * (SQRT3 * static_cast<double>(q) +
                        SQRT3 / 2.0 * static_cast<double>(r));
    double y = size_ * 1.5 * static_cast<double>(r);
    return {x, y};
}

auto HexGrid::ring(CellId center, int k) const -> std::vector<CellId> {
    if (k <= 0) {
        return {center};
    }

    auto origin = decode(center);
    std::vector<CellId> cells;
    cells.reserve(static_cast<size_t>(6) * k);

    HexCoord hex{origin.q + DIRECTIONS[4].q * k, origin.r + DIRECTIONS[4].r * k};
    for (const auto& dir : DIRECTIONS) {
        for (int step = 0; step < k; ++step) {
            cells.push_back(encode(resolution_, hex));
            hex.q += dir.q;
            hex.r += dir.r;
        }
    }
    return cells;
}

auto HexGrid::disk(CellId center, int k) const -> std::vector<CellId> {
    std::vector<CellId> cells;
    auto n = static_cast<size_t>(std::max(k, 0));
    cells.reserve(3 * n * (n + 1) + 1);

    for (int i = 0; i <= k; ++i) {
        auto layer = ring(center, i);
        cells.insert(cells.end(), layer.begin(), layer.end());
    }
    return cells;
}

auto HexGrid::planCover(CellId center, double radiusKm) const -> CoverPlan {
    CoverPlan plan;
    plan.origins.push_back(center);

    const double s = size_;
    const auto c = cellCenter(center);
    const double angular = radiusKm / model::EARTH_RADIUS_KM;
    const double dLat = model::radiansToDegrees(angular);

    // Any query point in the cell is within s of its center, and the cell
    // of any match has its center within s of the match.
    plan.minLatitude = c.latitude - 2.0 * s - dLat;
    plan.maxLatitude = c.latitude + 2.0 * s + dLat;

    const double latBound = std::min(std::abs(c.latitude) + s, 90.0);
    if (latBound + dLat >= 90.0 || dLat >= 90.0) {
        plan.polar = true;
        return plan;
    }

    double ratio =
        std::sin(angular) / std::cos(model::degreesToRadians(latBound));
    double dLon = model::radiansToDegrees(std::asin(std::min(ratio, 1.0)));

    double reach = std::hypot(dLon, dLat);
    plan.rings = static_cast<int>(std::ceil((reach + 2.0 * s) / (1.5 * s)));

    bool wrapsWest = c.longitude - s - dLon < model::MIN_LONGITUDE;
    bool wrapsEast = c.longitude + s + dLon > model::MAX_LONGITUDE;
    if (wrapsWest) {
        plan.origins.push_back(cellFor(c.longitude + 360.0, c.latitude));
    }
    if (wrapsEast) {
        plan.origins.push_back(cellFor(c.longitude - 360.0, c.latitude));
    }
    if (wrapsWest || wrapsEast) {
        // Wrapped origins sit up to 2s from the shifted query point
        plan.rings += 1;
    }

    return plan;
}

auto HexGrid::encode(int resolution, HexCoord coord) -> CellId {
    if (coord.q < -COORD_OFFSET || coord.q >= COORD_OFFSET ||
        coord.r < -COORD_OFFSET || coord.r >= COORD_OFFSET) {
        throw std::out_of_range(std::format(
            "Hex coordinate ({}, {}) does not fit a cell id", coord.q,
            coord.r));
    }

    auto q = static_cast<uint64_t>(coord.q + COORD_OFFSET) & COORD_MASK;
    auto r = static_cast<uint64_t>(coord.r + COORD_OFFSET) & COORD_MASK;
    return (static_cast<uint64_t>(resolution) << RESOLUTION_SHIFT) |
           (q << COORD_BITS) | r;
}

auto HexGrid::decode(CellId cell) -> HexCoord {
    auto q = static_cast<int64_t>((cell >> COORD_BITS) & COORD_MASK);
    auto r = static_cast<int64_t>(cell & COORD_MASK);
    return {q - COORD_OFFSET, r - COORD_OFFSET};
}

auto HexGrid::resolutionOf(CellId cell) noexcept -> int {
    return static_cast<int>(cell >> RESOLUTION_SHIFT);
}

auto HexGrid::hexDistance(HexCoord a, HexCoord b) noexcept -> int64_t {
    int64_t dq = a.q - b.q;
    int64_t dr = a.r - b.r;
    return (std::abs(dq) + std::abs(dr) + std::abs(dq + dr)) / 2;
}

}  // namespace geofleet::proximity::index

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

#include "cell_index.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::index {

using model::ErrorCode;
using model::makeError;

namespace {

auto resolutionInRange(int resolution) -> bool {
    return resolution >= HexGrid::MIN_RESOLUTION &&
           resolution <= HexGrid::MAX_RESOLUTION;
}

auto layerMissing(int resolution) -> std::unexpected<model::ProximityError> {
    return makeError(
        ErrorCode::IndexUnavailable,
        std::format("Cell index not built at resolution {}", resolution));
}

}  // namespace

void CellIndex::Layer::assign(const std::string& id, CellId cell) {
    auto [it, inserted] = cellById.try_emplace(id, cell);
    if (!inserted) {
        if (it->second == cell) {
            return;
        }
        auto old = cells.find(it->second);
        if (old != cells.end()) {
            old->second.erase(id);
            if (old->second.empty()) {
                cells.erase(old);
            }
        }
        it->second = cell;
    }
    cells[cell].insert(id);
}

void CellIndex::Layer::unassign(const std::string& id) {
    auto it = cellById.find(id);
    if (it == cellById.end()) {
        return;
    }
    auto cell = cells.find(it->second);
    if (cell != cells.end()) {
        cell->second.erase(id);
        if (cell->second.empty()) {
            cells.erase(cell);
        }
    }
    cellById.erase(it);
}

CellIndex::CellIndex(std::shared_ptr<store::IPointStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("CellIndex requires a point store");
    }
}

auto CellIndex::build(int resolution) -> model::VoidResult {
    if (!resolutionInRange(resolution)) {
        return makeError(ErrorCode::IndexUnavailable,
                         std::format("Cell resolution {} outside [{}, {}]",
                                     resolution, HexGrid::MIN_RESOLUTION,
                                     HexGrid::MAX_RESOLUTION));
    }

    auto points = store_->snapshot();
    if (!points) {
        spdlog::error("Cell index build at resolution {} failed: {}",
                      resolution, points.error().toString());
        return std::unexpected(points.error());
    }

    auto layer = std::make_unique<Layer>(resolution);
    layer->cellById.reserve(points->size());
    for (const auto& point : *points) {
        layer->assign(point.id, layer->grid.cellFor(point.location));
    }

    size_t indexed = layer->cellById.size();
    size_t occupied = layer->cells.size();
    {
        std::unique_lock lock(mutex_);
        layers_.insert_or_assign(resolution, std::move(layer));
    }

    spdlog::info(
        "Cell index built at resolution {}: {} points in {} cells",
        resolution, indexed, occupied);
    return {};
}

void CellIndex::drop(int resolution) {
    std::unique_lock lock(mutex_);
    if (layers_.erase(resolution) > 0) {
        spdlog::info("Cell index layer {} dropped", resolution);
    }
}

void CellIndex::clear() {
    std::unique_lock lock(mutex_);
    layers_.clear();
}

auto CellIndex::isBuilt(int resolution) const -> bool {
    std::shared_lock lock(mutex_);
    return layers_.contains(resolution);
}

auto CellIndex::builtResolutions() const -> std::vector<int> {
    std::shared_lock lock(mutex_);
    std::vector<int> resolutions;
    resolutions.reserve(layers_.size());
    for (const auto& [resolution, layer] : layers_) {
        resolutions.push_back(resolution);
    }
    return resolutions;
}

auto CellIndex::insert(const std::string& id, const model::GeoPoint& location)
    -> model::VoidResult {
    if (id.empty()) {
        return makeError(ErrorCode::InvalidId, "Entity id must not be empty");
    }
    if (!model::isValidCoordinate(location)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid coordinate for '{}': lon={}, "
                                     "lat={}",
                                     id, location.longitude,
                                     location.latitude));
    }

    std::unique_lock lock(mutex_);
    for (auto& [resolution, layer] : layers_) {
        layer->assign(id, layer->grid.cellFor(location));
    }
    return {};
}

void CellIndex::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    for (auto& [resolution, layer] : layers_) {
        layer->unassign(id);
    }
}

auto CellIndex::cellFor(double longitude, double latitude, int resolution)
    -> model::Result<CellId> {
    if (!resolutionInRange(resolution)) {
        return makeError(ErrorCode::IndexUnavailable,
                         std::format("Cell resolution {} outside [{}, {}]",
                                     resolution, HexGrid::MIN_RESOLUTION,
                                     HexGrid::MAX_RESOLUTION));
    }
    if (!model::isValidCoordinate(longitude, latitude)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid coordinate: lon={}, lat={}",
                                     longitude, latitude));
    }
    return HexGrid(resolution).cellFor(longitude, latitude);
}

auto CellIndex::coverCells(const Layer& layer, CellId cell, double radiusKm,
                           bool* usedOccupied) const -> std::vector<CellId> {
    auto plan = layer.grid.planCover(cell, radiusKm);

    std::vector<CellId> cells;
    if (plan.polar || plan.ringCellCount() > layer.cells.size()) {
        // Fewer occupied cells than ring cells: filter the occupied ones
        for (const auto& [occupied, ids] : layer.cells) {
            double latitude = layer.grid.cellCenter(occupied).latitude;
            if (latitude >= plan.minLatitude && latitude <= plan.maxLatitude) {
                cells.push_back(occupied);
            }
        }
        if (usedOccupied != nullptr) {
            *usedOccupied = true;
        }
    } else {
        cells.reserve(static_cast<size_t>(plan.ringCellCount()));
        for (auto origin : plan.origins) {
            auto disk = layer.grid.disk(origin, plan.rings);
            cells.insert(cells.end(), disk.begin(), disk.end());
        }
    }

    std::sort(cells.begin(), cells.end());
    cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
    return cells;
}

auto CellIndex::neighborCells(CellId cell, double radiusKm) const
    -> model::Result<std::vector<CellId>> {
    if (!std::isfinite(radiusKm) || radiusKm <= 0.0) {
        return makeError(ErrorCode::InvalidRadius,
                         std::format("Invalid radius: {}", radiusKm));
    }

    int resolution = HexGrid::resolutionOf(cell);
    std::shared_lock lock(mutex_);
    auto it = layers_.find(resolution);
    if (it == layers_.end()) {
        return layerMissing(resolution);
    }
    return coverCells(*it->second, cell, radiusKm, nullptr);
}

auto CellIndex::query(const model::GeoPoint& center, double radiusKm,
                      size_t limit, int resolution,
                      CellQueryTrace* trace) const
    -> model::Result<model::SearchResult> {
    if (!model::isValidCoordinate(center)) {
        return makeError(ErrorCode::InvalidCoordinate,
                         std::format("Invalid query center: lon={}, lat={}",
                                     center.longitude, center.latitude));
    }
    if (!std::isfinite(radiusKm) || radiusKm <= 0.0) {
        return makeError(ErrorCode::InvalidRadius,
                         std::format("Invalid radius: {}", radiusKm));
    }

    std::vector<std::string> candidates;
    size_t cellsVisited = 0;
    bool usedOccupied = false;
    {
        std::shared_lock lock(mutex_);
        auto it = layers_.find(resolution);
        if (it == layers_.end()) {
            return layerMissing(resolution);
        }

        const auto& layer = *it->second;
        auto home = layer.grid.cellFor(center);
        for (auto cell : coverCells(layer, home, radiusKm, &usedOccupied)) {
            auto members = layer.cells.find(cell);
            if (members == layer.cells.end()) {
                continue;
            }
            ++cellsVisited;
            candidates.insert(candidates.end(), members->second.begin(),
                              members->second.end());
        }
    }

    if (trace != nullptr) {
        trace->cellsVisited = cellsVisited;
        trace->candidates = candidates.size();
        trace->usedOccupiedScan = usedOccupied;
    }

    model::SearchResult hits;
    if (candidates.empty()) {
        return hits;
    }

    auto located = store_->positions(candidates);
    if (!located) {
        return std::unexpected(located.error());
    }

    for (auto& [id, location] : *located) {
        double distance = model::haversineKm(center, location);
        if (distance <= radiusKm) {
            hits.push_back({std::move(id), distance});
        }
    }

    model::rankAndTruncate(hits, limit);

    SPDLOG_DEBUG(
        "Cell query at resolution {} read {} cells, {} candidates, {} hits",
        resolution, cellsVisited, candidates.size(), hits.size());
    return hits;
}

auto CellIndex::cellOf(const std::string& id, int resolution) const
    -> std::optional<CellId> {
    std::shared_lock lock(mutex_);
    auto it = layers_.find(resolution);
    if (it == layers_.end()) {
        return std::nullopt;
    }
    auto cell = it->second->cellById.find(id);
    if (cell == it->second->cellById.end()) {
        return std::nullopt;
    }
    return cell->second;
}

auto CellIndex::members(CellId cell) const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    auto it = layers_.find(HexGrid::resolutionOf(cell));
    if (it == layers_.end()) {
        return {};
    }
    auto ids = it->second->cells.find(cell);
    if (ids == it->second->cells.end()) {
        return {};
    }
    std::vector<std::string> result(ids->second.begin(), ids->second.end());
    std::sort(result.begin(), result.end());
    return result;
}

auto CellIndex::membershipCount(const std::string& id, int resolution) const
    -> size_t {
    std::shared_lock lock(mutex_);
    auto it = layers_.find(resolution);
    if (it == layers_.end()) {
        return 0;
    }
    size_t count = 0;
    for (const auto& [cell, ids] : it->second->cells) {
        count += ids.count(id);
    }
    return count;
}

auto CellIndex::indexedCount(int resolution) const -> size_t {
    std::shared_lock lock(mutex_);
    auto it = layers_.find(resolution);
    return it == layers_.end() ? 0 : it->second->cellById.size();
}

auto CellIndex::stats() const -> json {
    std::shared_lock lock(mutex_);
    json layers = json::array();
    for (const auto& [resolution, layer] : layers_) {
        size_t largest = 0;
        for (const auto& [cell, ids] : layer->cells) {
            largest = std::max(largest, ids.size());
        }
        layers.push_back({{"resolution", resolution},
                          {"points", layer->cellById.size()},
                          {"occupiedCells", layer->cells.size()},
                          {"largestCell", largest},
                          {"edgeLengthKm", layer->grid.edgeLengthKm()}});
    }
    return {{"layers", layers}};
}

}  // namespace geofleet::proximity::index

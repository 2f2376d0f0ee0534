// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "location_index.hpp"

#include <stdexcept>
#include <utility>

namespace geofleet::proximity {

LocationIndex::LocationIndex(std::shared_ptr<store::IPointStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("LocationIndex requires a point store");
    }
    cells_ = std::make_unique<index::CellIndex>(store_);
}

}  // namespace geofleet::proximity

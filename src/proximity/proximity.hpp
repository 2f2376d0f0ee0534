// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#pragma once

// Aggregate header for the proximity module

#include "model/model.hpp"

#include "store/geo_store_client.hpp"
#include "store/geo_store_point_store.hpp"
#include "store/memory_point_store.hpp"
#include "store/point_store_interface.hpp"

#include "index/cell_index.hpp"
#include "index/hex_grid.hpp"

#include "overlay/overlay_classifier.hpp"

#include "location_index.hpp"
#include "search/proximity_search_engine.hpp"
#include "update/location_update_gateway.hpp"

#include "proximity_service.hpp"

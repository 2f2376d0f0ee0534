// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file model.hpp
 * @brief Aggregated header for proximity model types.
 *
 * @copyright Copyright (C) 2024 Max Qian
 */

#pragma once

#include "error.hpp"
#include "geo_point.hpp"
#include "search_query.hpp"
#include "search_result.hpp"

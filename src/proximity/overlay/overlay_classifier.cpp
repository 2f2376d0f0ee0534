// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "overlay_classifier.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace geofleet::proximity::overlay {

OverlayClassifier::OverlayClassifier(std::string syntheticPrefix)
    : prefix_(std::move(syntheticPrefix)) {
    if (prefix_.empty()) {
        throw std::invalid_argument("Synthetic id prefix must not be empty");
    }
}

auto OverlayClassifier::classify(std::string_view id) const noexcept
    -> EntityClass {
    return id.starts_with(prefix_) ? EntityClass::Secondary
                                   : EntityClass::Primary;
}

auto OverlayClassifier::partitionAndFill(const model::SearchResult& results,
                                         int desiredCount,
                                         bool preferPrimary) const
    -> model::SearchResult {
    if (desiredCount <= 0 || results.empty()) {
        return {};
    }

    auto wanted = static_cast<size_t>(desiredCount);
    if (!preferPrimary) {
        auto n = std::min(wanted, results.size());
        return {results.begin(), results.begin() + static_cast<long>(n)};
    }

    model::SearchResult chosen;
    chosen.reserve(std::min(wanted, results.size()));

    for (const auto& hit : results) {
        if (chosen.size() == wanted) {
            break;
        }
        if (classify(hit.id) == EntityClass::Primary) {
            chosen.push_back(hit);
        }
    }
    size_t primaries = chosen.size();

    for (const auto& hit : results) {
        if (chosen.size() == wanted) {
            break;
        }
        if (classify(hit.id) == EntityClass::Secondary) {
            chosen.push_back(hit);
        }
    }

    // Both halves are already ordered; merge them back by distance
    std::inplace_merge(chosen.begin(),
                       chosen.begin() + static_cast<long>(primaries),
                       chosen.end(),
                       [](const model::SearchHit& a, const model::SearchHit& b) {
                           if (a.distanceKm != b.distanceKm) {
                               return a.distanceKm < b.distanceKm;
                           }
                           return a.id < b.id;
                       });

    SPDLOG_DEBUG("Overlay kept {} primary and {} secondary of {} hits",
                 primaries, chosen.size() - primaries, results.size());
    return chosen;
}

}  // namespace geofleet::proximity::overlay

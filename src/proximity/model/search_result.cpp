// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#include "search_result.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace geofleet::proximity::model {

auto formatDistance(double distanceKm) -> std::string {
    std::string text = std::format("{:.4f}", distanceKm);

    auto dot = text.find('.');
    if (dot != std::string::npos) {
        auto last = text.find_last_not_of('0');
        text.erase(last == dot ? dot : last + 1);
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

auto toNearbyDrivers(const SearchResult& result) -> std::vector<NearbyDriver> {
    std::vector<NearbyDriver> drivers;
    drivers.reserve(result.size());
    for (const auto& hit : result) {
        drivers.push_back({hit.id, formatDistance(hit.distanceKm)});
    }
    return drivers;
}

void rankAndTruncate(SearchResult& hits, size_t limit) {
    auto nearer = [](const SearchHit& a, const SearchHit& b) {
        if (a.distanceKm != b.distanceKm) {
            return a.distanceKm < b.distanceKm;
        }
        return a.id < b.id;
    };

    if (hits.size() > limit) {
        std::partial_sort(hits.begin(), hits.begin() + limit, hits.end(),
                          nearer);
        hits.resize(limit);
    } else {
        std::sort(hits.begin(), hits.end(), nearer);
    }
}

auto isWellFormed(const SearchResult& result) -> bool {
    std::unordered_set<std::string> seen;
    seen.reserve(result.size());

    for (size_t i = 0; i < result.size(); ++i) {
        if (result[i].distanceKm < 0.0) {
            return false;
        }
        if (i > 0 && result[i].distanceKm < result[i - 1].distanceKm) {
            return false;
        }
        if (!seen.insert(result[i].id).second) {
            return false;
        }
    }
    return true;
}

}  // namespace geofleet::proximity::model

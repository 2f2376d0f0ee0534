// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 */

#ifndef GEOFLEET_PROXIMITY_OVERLAY_OVERLAY_CLASSIFIER_HPP
#define GEOFLEET_PROXIMITY_OVERLAY_OVERLAY_CLASSIFIER_HPP

#include <string>
#include <string_view>

#include "../model/search_result.hpp"

namespace geofleet::proximity::overlay {

/**
 * @brief Class of an entity derived from its id
 */
enum class EntityClass {
    Primary = 0,  ///< Real driver
    Secondary,    ///< Synthetic entry used to simulate load
};

[[nodiscard]] constexpr auto entityClassToString(EntityClass cls) noexcept
    -> std::string_view {
    return cls == EntityClass::Primary ? "primary" : "secondary";
}

/// Id prefix reserved for synthetic entries
inline constexpr std::string_view DEFAULT_SYNTHETIC_PREFIX = "ghost:";

/**
 * @brief Primary/Secondary split and slot filling for ranked results
 *
 * Classification is a pure prefix test on the id and is never stored.
 * Filling gives Primary entries precedence over Secondary ones so that a
 * handful of real drivers is not crowded out by a dense synthetic fleet.
 */
class OverlayClassifier {
public:
    /**
     * @brief Construct with the synthetic id prefix
     * @throws std::invalid_argument if the prefix is empty
     */
    explicit OverlayClassifier(
        std::string syntheticPrefix = std::string(DEFAULT_SYNTHETIC_PREFIX));

    [[nodiscard]] auto classify(std::string_view id) const noexcept
        -> EntityClass;

    [[nodiscard]] auto isSecondary(std::string_view id) const noexcept
        -> bool {
        return classify(id) == EntityClass::Secondary;
    }

    [[nodiscard]] auto syntheticPrefix() const noexcept
        -> const std::string& {
        return prefix_;
    }

    /**
     * @brief Choose desiredCount entries from a distance-ordered list
     *
     * With preferPrimary, Primary entries are taken first (nearest first,
     * at most desiredCount of them) and the remaining slots are filled with
     * the nearest Secondary entries. The chosen entries are then put back in
     * distance order. Without preferPrimary the first desiredCount entries
     * are returned unchanged.
     *
     * @param results Hits ordered by distance
     * @param desiredCount Number of slots; <= 0 yields an empty list
     * @param preferPrimary Give Primary entries precedence
     */
    [[nodiscard]] auto partitionAndFill(const model::SearchResult& results,
                                        int desiredCount,
                                        bool preferPrimary) const
        -> model::SearchResult;

private:
    std::string prefix_;
};

}  // namespace geofleet::proximity::overlay

#endif  // GEOFLEET_PROXIMITY_OVERLAY_OVERLAY_CLASSIFIER_HPP

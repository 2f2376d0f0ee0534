/*
 * proximity_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Driver proximity index configuration

**************************************************/

#ifndef GEOFLEET_CONFIG_SECTIONS_PROXIMITY_CONFIG_HPP
#define GEOFLEET_CONFIG_SECTIONS_PROXIMITY_CONFIG_HPP

#include <cstddef>
#include <string>

#include "../core/config_section.hpp"

namespace geofleet::config {

/**
 * @brief Proximity index configuration
 *
 * @example
 * ```json
 * {
 *   "geofleet": {
 *     "proximity": {
 *       "strategy": "hierarchical",
 *       "candidateCeiling": 1000,
 *       "cellResolution": 7,
 *       "buildCellIndexOnStart": true,
 *       "syntheticPrefix": "ghost:",
 *       "preferPrimary": true,
 *       "storeKey": "drivers"
 *     }
 *   }
 * }
 * ```
 */
struct ProximityConfig : ConfigSection<ProximityConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/geofleet/proximity";

    /// Environment overrides read by applyEnvironment()
    static constexpr const char* ENV_STRATEGY = "GEOFLEET_PROXIMITY_STRATEGY";
    static constexpr const char* ENV_CEILING = "GEOFLEET_PROXIMITY_CEILING";
    static constexpr const char* ENV_RESOLUTION =
        "GEOFLEET_PROXIMITY_RESOLUTION";

    /// Query strategy: "flatScan" or "hierarchical"
    std::string strategy{"flatScan"};

    /// Internal result limit before overlay filling
    size_t candidateCeiling{1000};

    /// Cell layer used by hierarchical queries (0-15)
    int cellResolution{7};

    /// Build the cell layer when the service starts
    bool buildCellIndexOnStart{false};

    /// Id prefix marking synthetic entries
    std::string syntheticPrefix{"ghost:"};

    /// Default overlay preference for searchNearby
    bool preferPrimary{true};

    /// Geo set key in the external store
    std::string storeKey{"drivers"};

    [[nodiscard]] json serialize() const {
        return {{"strategy", strategy},
                {"candidateCeiling", candidateCeiling},
                {"cellResolution", cellResolution},
                {"buildCellIndexOnStart", buildCellIndexOnStart},
                {"syntheticPrefix", syntheticPrefix},
                {"preferPrimary", preferPrimary},
                {"storeKey", storeKey}};
    }

    [[nodiscard]] static ProximityConfig deserialize(const json& j) {
        ProximityConfig cfg;
        cfg.strategy = j.value("strategy", cfg.strategy);
        cfg.candidateCeiling = j.value("candidateCeiling", cfg.candidateCeiling);
        cfg.cellResolution = j.value("cellResolution", cfg.cellResolution);
        cfg.buildCellIndexOnStart =
            j.value("buildCellIndexOnStart", cfg.buildCellIndexOnStart);
        cfg.syntheticPrefix = j.value("syntheticPrefix", cfg.syntheticPrefix);
        cfg.preferPrimary = j.value("preferPrimary", cfg.preferPrimary);
        cfg.storeKey = j.value("storeKey", cfg.storeKey);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "strategy", "string",
                          std::string("flatScan"),
                          "Candidate discovery strategy");
        addEnum(schema, "strategy", "flatScan", "hierarchical");
        addSchemaProperty(schema, "candidateCeiling", "integer", size_t{1000},
                          "Internal result limit before overlay filling");
        addRange(schema, "candidateCeiling", 1, 100000);
        addSchemaProperty(schema, "cellResolution", "integer", 7,
                          "Hex cell resolution for hierarchical queries");
        addRange(schema, "cellResolution", 0, 15);
        addSchemaProperty(schema, "buildCellIndexOnStart", "boolean", false);
        addSchemaProperty(schema, "syntheticPrefix", "string",
                          std::string("ghost:"),
                          "Id prefix of synthetic entries");
        addSchemaProperty(schema, "preferPrimary", "boolean", true);
        addSchemaProperty(schema, "storeKey", "string",
                          std::string("drivers"));
        return schema;
    }

    /**
     * @brief Schema checks plus the rules the schema cannot express
     */
    [[nodiscard]] ConfigValidationResult validate() const;

    /**
     * @brief Throw InvalidConfigException when validate() fails
     */
    void requireValid() const;

    /**
     * @brief Override fields from GEOFLEET_PROXIMITY_* variables
     *
     * Unset variables leave the field alone.
     *
     * @throws InvalidConfigException for unparsable values
     */
    void applyEnvironment();
};

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_SECTIONS_PROXIMITY_CONFIG_HPP

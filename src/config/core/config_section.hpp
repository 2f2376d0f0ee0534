/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef GEOFLEET_CONFIG_CORE_CONFIG_SECTION_HPP
#define GEOFLEET_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "validation.hpp"

namespace geofleet::config {

using json = nlohmann::json;

/**
 * @brief Value types accepted as schema defaults
 */
template <typename T>
concept JsonSerializable = requires(T value, json j) {
    { j = value } -> std::convertible_to<json>;
    { j.get<T>() } -> std::convertible_to<T>;
};

/**
 * @brief Shape every section type must have to be loaded by ConfigLoader
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base of the typed configuration sections
 *
 * A section declares its JSON pointer in PATH and provides serialize(),
 * static deserialize() and static generateSchema(). The base derives JSON
 * conversion, schema range/enum checks, merging and equality from those.
 *
 * @example
 * ```cpp
 * struct CacheConfig : ConfigSection<CacheConfig> {
 *     static constexpr std::string_view PATH = "/geofleet/cache";
 *
 *     size_t capacity = 1024;
 *
 *     [[nodiscard]] json serialize() const { return {{"capacity", capacity}}; }
 *
 *     [[nodiscard]] static CacheConfig deserialize(const json& j) {
 *         CacheConfig config;
 *         config.capacity = j.value("capacity", config.capacity);
 *         return config;
 *     }
 *
 *     [[nodiscard]] static json generateSchema() {
 *         json schema = {{"type", "object"}};
 *         addSchemaProperty(schema, "capacity", "integer", size_t{1024});
 *         addRange(schema, "capacity", 1);
 *         return schema;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @throws json::exception when a value has the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief fromJson() that reports type errors as nullopt
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) noexcept {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Check the section against the minimum, maximum and enum
     *        keywords of its own schema
     *
     * Error paths are PATH + "/" + field. Sections layer their cross-field
     * rules on top in validate().
     */
    [[nodiscard]] ConfigValidationResult validateSchema() const {
        ConfigValidationResult result;
        json data = toJson();
        json schemaJson = Derived::generateSchema();
        if (!schemaJson.contains("properties")) {
            return result;
        }

        for (auto& [name, prop] : schemaJson["properties"].items()) {
            if (!data.contains(name)) {
                continue;
            }
            const auto& value = data[name];
            auto where = std::string(Derived::PATH) + "/" + name;

            if (value.is_number()) {
                auto number = value.template get<double>();
                if (prop.contains("minimum") &&
                    number < prop["minimum"].template get<double>()) {
                    result.addError(where, "value below minimum", "minimum");
                }
                if (prop.contains("maximum") &&
                    number > prop["maximum"].template get<double>()) {
                    result.addError(where, "value above maximum", "maximum");
                }
            }
            if (prop.contains("enum")) {
                bool listed = false;
                for (const auto& allowed : prop["enum"]) {
                    listed = listed || allowed == value;
                }
                if (!listed) {
                    result.addError(where, "value not in enum", "enum");
                }
            }
        }
        return result;
    }

    /**
     * @brief Overlay the non-null fields of other onto this section
     */
    void merge(const Derived& other) {
        auto merged = toJson();
        overlay(merged, other.toJson());
        *static_cast<Derived*>(this) = Derived::deserialize(merged);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Declare a property with its JSON type and default
     */
    template <JsonSerializable T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type, const T& defaultValue,
                                  const std::string& description = "") {
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Restrict a declared property to the listed values
     */
    template <typename... Args>
    static void addEnum(json& schema, const std::string& name, Args&&... values) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            schema["properties"][name]["enum"] = json::array({std::forward<Args>(values)...});
        }
    }

    /**
     * @brief Bound a declared numeric property; either side may be open
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (!schema.contains("properties") || !schema["properties"].contains(name)) {
            return;
        }
        auto& prop = schema["properties"][name];
        if (minimum) {
            prop["minimum"] = *minimum;
        }
        if (maximum) {
            prop["maximum"] = *maximum;
        }
    }

private:
    static void overlay(json& target, const json& source) {
        if (!source.is_object()) {
            return;
        }
        for (const auto& [key, value] : source.items()) {
            if (value.is_object() && target.contains(key) &&
                target[key].is_object()) {
                overlay(target[key], value);
            } else if (!value.is_null()) {
                target[key] = value;
            }
        }
    }
};

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_CORE_CONFIG_SECTION_HPP

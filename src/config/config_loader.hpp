/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: JSON configuration file loader with typed section access

**************************************************/

#ifndef GEOFLEET_CONFIG_CONFIG_LOADER_HPP
#define GEOFLEET_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include <spdlog/spdlog.h>

#include "core/config_section.hpp"
#include "core/exception.hpp"

namespace geofleet::config {

namespace fs = std::filesystem;

/**
 * @brief Holds one JSON configuration document
 *
 * Sections are addressed by their PATH, a JSON pointer such as
 * "/geofleet/proximity". A missing section yields its defaults.
 *
 * @example
 * ```cpp
 * auto loader = ConfigLoader::fromFile("geofleet.json");
 * auto proximity = loader.section<ProximityConfig>();
 * ```
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    explicit ConfigLoader(json document);

    /**
     * @brief Parse a JSON file
     * @throws ConfigIOException if the file cannot be read or parsed
     */
    [[nodiscard]] static ConfigLoader fromFile(const fs::path& path);

    /**
     * @brief Parse JSON text
     * @throws ConfigIOException on a parse error
     */
    [[nodiscard]] static ConfigLoader fromString(std::string_view text);

    [[nodiscard]] const json& document() const noexcept { return document_; }

    /**
     * @brief JSON at a pointer path, or nullptr when absent
     */
    [[nodiscard]] const json* find(std::string_view path) const;

    /**
     * @brief Whether the document holds a value at the path
     */
    [[nodiscard]] bool contains(std::string_view path) const {
        return find(path) != nullptr;
    }

    /**
     * @brief Deserialize a typed section
     *
     * @throws InvalidConfigException if a value has the wrong type
     */
    template <ConfigSectionDerived Section>
    [[nodiscard]] Section section() const {
        const json* node = find(Section::PATH);
        if (node == nullptr) {
            spdlog::debug("Config section {} absent, using defaults",
                          Section::PATH);
            return Section::defaults();
        }
        try {
            return Section::deserialize(*node);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIG_EXCEPTION("Config section {} is malformed: {}",
                                           Section::PATH, e.what());
        }
    }

    /**
     * @brief Store a section back into the document
     */
    template <ConfigSectionDerived Section>
    void setSection(const Section& value) {
        document_[json::json_pointer(std::string(Section::PATH))] =
            value.serialize();
    }

private:
    json document_ = json::object();
};

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_CONFIG_LOADER_HPP

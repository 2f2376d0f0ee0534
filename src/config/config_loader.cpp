/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <fstream>
#include <string>
#include <utility>

namespace geofleet::config {

ConfigLoader::ConfigLoader(json document) : document_(std::move(document)) {
    if (!document_.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "Configuration root must be a JSON object, got {}",
            document_.type_name());
    }
}

ConfigLoader ConfigLoader::fromFile(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open config file: {}",
                                  path.string());
    }

    try {
        json document = json::parse(ifs);
        spdlog::info("Config loaded from file: {}", path.string());
        return ConfigLoader(std::move(document));
    } catch (const json::exception& e) {
        THROW_CONFIG_IO_EXCEPTION("Failed to parse config file {}: {}",
                                  path.string(), e.what());
    }
}

ConfigLoader ConfigLoader::fromString(std::string_view text) {
    try {
        return ConfigLoader(json::parse(text));
    } catch (const json::exception& e) {
        THROW_CONFIG_IO_EXCEPTION("Failed to parse config text: {}", e.what());
    }
}

const json* ConfigLoader::find(std::string_view path) const {
    try {
        json::json_pointer pointer{std::string(path)};
        if (!document_.contains(pointer)) {
            return nullptr;
        }
        return &document_.at(pointer);
    } catch (const json::exception& e) {
        spdlog::warn("Invalid config path '{}': {}", path, e.what());
        return nullptr;
    }
}

}  // namespace geofleet::config

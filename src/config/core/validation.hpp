/*
 * validation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Configuration validation result types

**************************************************/

#ifndef GEOFLEET_CONFIG_CORE_VALIDATION_HPP
#define GEOFLEET_CONFIG_CORE_VALIDATION_HPP

#include <string>
#include <vector>

namespace geofleet::config {

/**
 * @brief Single validation failure
 */
struct ConfigValidationError {
    std::string path;     ///< JSON path of the offending value
    std::string message;  ///< Human readable description
    std::string keyword;  ///< Schema keyword that failed (e.g. "minimum")
};

/**
 * @brief Outcome of validating a configuration section
 */
struct ConfigValidationResult {
    bool valid{true};                           ///< Whether validation passed
    std::vector<ConfigValidationError> errors;  ///< List of validation errors

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message,
                  std::string keyword = "") {
        valid = false;
        errors.push_back(
            {std::move(path), std::move(message), std::move(keyword)});
    }

    /**
     * @brief All error messages joined with "; "
     */
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& error : errors) {
            if (!text.empty()) {
                text += "; ";
            }
            text += error.path + ": " + error.message;
        }
        return text;
    }
};

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_CORE_VALIDATION_HPP

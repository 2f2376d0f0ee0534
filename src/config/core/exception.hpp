/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef GEOFLEET_CONFIG_CORE_EXCEPTION_HPP
#define GEOFLEET_CONFIG_CORE_EXCEPTION_HPP

#include <format>
#include <source_location>
#include <stdexcept>
#include <string>

namespace geofleet::config {

/**
 * @brief Base exception for configuration errors
 *
 * Records where it was thrown; what() carries "file:line: message".
 */
class BadConfigException : public std::runtime_error {
public:
    explicit BadConfigException(
        const std::string& message,
        std::source_location location = std::source_location::current())
        : std::runtime_error(std::format("{}:{}: {}", location.file_name(),
                                         location.line(), message)),
          message_(message),
          location_(location) {}

    /**
     * @brief Message without the location prefix
     */
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }

    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }

private:
    std::string message_;
    std::source_location location_;
};

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...) \
    throw geofleet::config::InvalidConfigException(std::format(__VA_ARGS__))

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...) \
    throw geofleet::config::ConfigIOException(std::format(__VA_ARGS__))

}  // namespace geofleet::config

#endif  // GEOFLEET_CONFIG_CORE_EXCEPTION_HPP

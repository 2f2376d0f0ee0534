// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * GeoFleet - driver proximity index
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#ifndef GEOFLEET_PROXIMITY_MODEL_ERROR_HPP
#define GEOFLEET_PROXIMITY_MODEL_ERROR_HPP

#include <expected>
#include <string>
#include <string_view>

namespace geofleet::proximity::model {

/**
 * @brief Failure categories reported by the proximity core
 *
 * Every fallible operation in the core reports exactly one of these codes
 * to its immediate caller. None of them is retried internally.
 */
enum class ErrorCode {
    /// Longitude/latitude outside [-180,180] x [-90,90] or not finite
    InvalidCoordinate = 0,

    /// Non-positive or non-finite search radius
    InvalidRadius = 1,

    /// Negative result count on the transport-facing call
    InvalidCount = 2,

    /// Empty entity identifier
    InvalidId = 3,

    /// Hierarchical strategy requested without a built cell layer
    IndexUnavailable = 4,

    /// Backing store connectivity or timeout failure
    StoreUnavailable = 5,

    /// Scan interrupted through its stop token
    Cancelled = 6
};

/**
 * @brief Converts ErrorCode to string
 *
 * @param code Code to convert
 * @return String representation
 */
[[nodiscard]] inline auto errorCodeToString(ErrorCode code) -> std::string {
    switch (code) {
        case ErrorCode::InvalidCoordinate:
            return "InvalidCoordinate";
        case ErrorCode::InvalidRadius:
            return "InvalidRadius";
        case ErrorCode::InvalidCount:
            return "InvalidCount";
        case ErrorCode::InvalidId:
            return "InvalidId";
        case ErrorCode::IndexUnavailable:
            return "IndexUnavailable";
        case ErrorCode::StoreUnavailable:
            return "StoreUnavailable";
        case ErrorCode::Cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

/**
 * @brief Error value carried by every failed proximity operation
 */
struct ProximityError {
    ErrorCode code = ErrorCode::InvalidCoordinate;
    std::string message;

    [[nodiscard]] auto toString() const -> std::string {
        return errorCodeToString(code) + ": " + message;
    }
};

template <typename T>
using Result = std::expected<T, ProximityError>;

using VoidResult = std::expected<void, ProximityError>;

/**
 * @brief Build an unexpected value with the given code and message
 */
[[nodiscard]] inline auto makeError(ErrorCode code, std::string_view message)
    -> std::unexpected<ProximityError> {
    return std::unexpected(ProximityError{code, std::string(message)});
}

}  // namespace geofleet::proximity::model

#endif  // GEOFLEET_PROXIMITY_MODEL_ERROR_HPP

// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for GeoPoint validation and haversine distance
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

#include "proximity/model/geo_point.hpp"

using namespace geofleet::proximity::model;

TEST(GeoPointTest, AcceptsBoundaryCoordinates) {
    EXPECT_TRUE(isValidCoordinate(180.0, 90.0));
    EXPECT_TRUE(isValidCoordinate(-180.0, -90.0));
    EXPECT_TRUE(isValidCoordinate(0.0, 0.0));
}

TEST(GeoPointTest, RejectsOutOfRangeCoordinates) {
    EXPECT_FALSE(isValidCoordinate(200.0, 10.0));
    EXPECT_FALSE(isValidCoordinate(-180.5, 10.0));
    EXPECT_FALSE(isValidCoordinate(10.0, 90.01));
    EXPECT_FALSE(isValidCoordinate(10.0, -91.0));
}

TEST(GeoPointTest, RejectsNonFiniteCoordinates) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    constexpr double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(isValidCoordinate(nan, 0.0));
    EXPECT_FALSE(isValidCoordinate(0.0, nan));
    EXPECT_FALSE(isValidCoordinate(inf, 0.0));
    EXPECT_FALSE(isValidCoordinate(GeoPoint{0.0, -inf}));
}

TEST(GeoPointTest, HaversineZeroForSamePoint) {
    GeoPoint p{106.700, 10.770};
    EXPECT_DOUBLE_EQ(haversineKm(p, p), 0.0);
}

TEST(GeoPointTest, HaversineOneDegreeOfLatitude) {
    // 1 degree of arc on a 6371 km sphere
    double expected = EARTH_RADIUS_KM * std::numbers::pi / 180.0;
    EXPECT_NEAR(haversineKm({0.0, 0.0}, {0.0, 1.0}), expected, 1e-9);
}

TEST(GeoPointTest, HaversineIsSymmetric) {
    GeoPoint a{106.70, 10.77};
    GeoPoint b{-73.98, 40.75};
    EXPECT_DOUBLE_EQ(haversineKm(a, b), haversineKm(b, a));
}

TEST(GeoPointTest, HaversineAcrossAntimeridian) {
    // 0.2 degrees of longitude at the equator, not 359.8
    double d = haversineKm({179.9, 0.0}, {-179.9, 0.0});
    EXPECT_NEAR(d, 0.2 * EARTH_RADIUS_KM * std::numbers::pi / 180.0, 1e-6);
}

TEST(GeoPointTest, HaversineAntipodes) {
    double d = haversineKm({0.0, 0.0}, {180.0, 0.0});
    EXPECT_NEAR(d, EARTH_RADIUS_KM * std::numbers::pi, 1e-6);
}

TEST(GeoPointTest, PointToJson) {
    Point point{"real:1", {106.7, 10.77}};
    auto j = point.toJson();
    EXPECT_EQ(j["id"], "real:1");
    EXPECT_DOUBLE_EQ(j["longitude"].get<double>(), 106.7);
    EXPECT_DOUBLE_EQ(j["latitude"].get<double>(), 10.77);
}

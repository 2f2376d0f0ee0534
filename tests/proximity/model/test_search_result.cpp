// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for result ranking and distance formatting
 */

#include <gtest/gtest.h>

#include "proximity/model/search_query.hpp"
#include "proximity/model/search_result.hpp"

using namespace geofleet::proximity::model;

TEST(FormatDistanceTest, TrimsTrailingZeros) {
    EXPECT_EQ(formatDistance(1.5), "1.5");
    EXPECT_EQ(formatDistance(2.0), "2");
    EXPECT_EQ(formatDistance(0.1234), "0.1234");
}

TEST(FormatDistanceTest, RoundsToFourDecimals) {
    EXPECT_EQ(formatDistance(1.23456), "1.2346");
    EXPECT_EQ(formatDistance(0.00004), "0");
}

TEST(FormatDistanceTest, NeverNegativeZero) {
    EXPECT_EQ(formatDistance(-0.0), "0");
    EXPECT_EQ(formatDistance(0.0), "0");
}

TEST(RankAndTruncateTest, SortsByDistanceThenId) {
    SearchResult hits = {{"b", 2.0}, {"c", 1.0}, {"a", 2.0}};
    rankAndTruncate(hits, 10);

    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, "c");
    EXPECT_EQ(hits[1].id, "a");
    EXPECT_EQ(hits[2].id, "b");
}

TEST(RankAndTruncateTest, KeepsNearestWhenTruncating) {
    SearchResult hits;
    for (int i = 9; i >= 0; --i) {
        hits.push_back({"id" + std::to_string(i), static_cast<double>(i)});
    }
    rankAndTruncate(hits, 3);

    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, "id0");
    EXPECT_EQ(hits[2].id, "id2");
}

TEST(RankAndTruncateTest, ZeroLimitEmpties) {
    SearchResult hits = {{"a", 1.0}};
    rankAndTruncate(hits, 0);
    EXPECT_TRUE(hits.empty());
}

TEST(IsWellFormedTest, DetectsViolations) {
    EXPECT_TRUE(isWellFormed({}));
    EXPECT_TRUE(isWellFormed({{"a", 0.0}, {"b", 0.0}, {"c", 1.0}}));
    EXPECT_FALSE(isWellFormed({{"a", 2.0}, {"b", 1.0}}));
    EXPECT_FALSE(isWellFormed({{"a", 1.0}, {"a", 2.0}}));
    EXPECT_FALSE(isWellFormed({{"a", -1.0}}));
}

TEST(NearbyDriverTest, ConvertsHits) {
    auto drivers = toNearbyDrivers({{"real:1", 0.25}, {"ghost:1", 1.0}});

    ASSERT_EQ(drivers.size(), 2u);
    EXPECT_EQ(drivers[0], (NearbyDriver{"real:1", "0.25"}));
    EXPECT_EQ(drivers[1], (NearbyDriver{"ghost:1", "1"}));
    EXPECT_EQ(drivers[0].toJson()["driverId"], "real:1");
}

TEST(SearchStrategyTest, ParsesFlags) {
    EXPECT_EQ(strategyFromString("flatScan"), SearchStrategy::FlatScan);
    EXPECT_EQ(strategyFromString("flat"), SearchStrategy::FlatScan);
    EXPECT_EQ(strategyFromString("hierarchical"),
              SearchStrategy::Hierarchical);
    EXPECT_EQ(strategyFromString("h3"), SearchStrategy::Hierarchical);
    EXPECT_FALSE(strategyFromString("quadtree").has_value());
    EXPECT_EQ(strategyToString(SearchStrategy::Hierarchical), "hierarchical");
}

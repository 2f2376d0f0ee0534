// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for MemoryPointStore
 */

#include <gtest/gtest.h>

#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "proximity/store/memory_point_store.hpp"

using namespace geofleet::proximity::store;
using geofleet::proximity::model::ErrorCode;
using geofleet::proximity::model::isWellFormed;

class MemoryPointStoreTest : public ::testing::Test {
protected:
    MemoryPointStore store_;
};

TEST_F(MemoryPointStoreTest, UpsertAndPosition) {
    ASSERT_TRUE(store_.upsert("real:1", 106.700, 10.770));

    auto pos = store_.position("real:1");
    ASSERT_TRUE(pos.has_value());
    ASSERT_TRUE(pos->has_value());
    EXPECT_DOUBLE_EQ((*pos)->longitude, 106.700);
    EXPECT_DOUBLE_EQ((*pos)->latitude, 10.770);
}

TEST_F(MemoryPointStoreTest, UpsertReplacesPreviousPosition) {
    ASSERT_TRUE(store_.upsert("d1", 10.0, 10.0));
    ASSERT_TRUE(store_.upsert("d1", 11.0, 12.0));

    EXPECT_EQ(store_.size().value(), 1u);
    auto pos = store_.position("d1").value();
    ASSERT_TRUE(pos.has_value());
    EXPECT_DOUBLE_EQ(pos->longitude, 11.0);
}

TEST_F(MemoryPointStoreTest, UpsertRejectsInvalidCoordinate) {
    auto result = store_.upsert("d1", 200.0, 10.0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidCoordinate);
    EXPECT_EQ(store_.size().value(), 0u);
}

TEST_F(MemoryPointStoreTest, UpsertRejectsEmptyId) {
    auto result = store_.upsert("", 10.0, 10.0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidId);
}

TEST_F(MemoryPointStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(store_.upsert("d1", 10.0, 10.0));
    EXPECT_TRUE(store_.remove("d1"));
    EXPECT_TRUE(store_.remove("d1"));
    EXPECT_TRUE(store_.remove("never-seen"));
    EXPECT_FALSE(store_.position("d1").value().has_value());
}

TEST_F(MemoryPointStoreTest, PositionsSkipsUnknownIds) {
    ASSERT_TRUE(store_.upsert("a", 1.0, 1.0));
    ASSERT_TRUE(store_.upsert("b", 2.0, 2.0));

    std::vector<std::string> ids = {"a", "missing", "b"};
    auto found = store_.positions(ids);
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->size(), 2u);
    EXPECT_EQ((*found)[0].first, "a");
    EXPECT_EQ((*found)[1].first, "b");
}

TEST_F(MemoryPointStoreTest, ScanRadiusFiltersSortsAndCaps) {
    ASSERT_TRUE(store_.upsert("near", 106.701, 10.770));
    ASSERT_TRUE(store_.upsert("nearer", 106.7001, 10.770));
    ASSERT_TRUE(store_.upsert("mid", 106.720, 10.770));
    ASSERT_TRUE(store_.upsert("far", 107.500, 10.770));

    auto hits = store_.scanRadius({106.700, 10.770}, 5.0, 10);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 3u);
    EXPECT_EQ((*hits)[0].id, "nearer");
    EXPECT_EQ((*hits)[1].id, "near");
    EXPECT_EQ((*hits)[2].id, "mid");
    EXPECT_TRUE(isWellFormed(*hits));

    auto capped = store_.scanRadius({106.700, 10.770}, 5.0, 2);
    ASSERT_TRUE(capped.has_value());
    EXPECT_EQ(capped->size(), 2u);
}

TEST_F(MemoryPointStoreTest, ScanRadiusOnEmptyStore) {
    auto hits = store_.scanRadius({0.0, 0.0}, 10.0, 10);
    ASSERT_TRUE(hits.has_value());
    EXPECT_TRUE(hits->empty());
}

TEST_F(MemoryPointStoreTest, ScanRadiusRejectsBadInput) {
    auto badRadius = store_.scanRadius({0.0, 0.0}, 0.0, 10);
    ASSERT_FALSE(badRadius.has_value());
    EXPECT_EQ(badRadius.error().code, ErrorCode::InvalidRadius);

    auto negative = store_.scanRadius({0.0, 0.0}, -1.0, 10);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ErrorCode::InvalidRadius);

    auto badCenter = store_.scanRadius({0.0, 95.0}, 1.0, 10);
    ASSERT_FALSE(badCenter.has_value());
    EXPECT_EQ(badCenter.error().code, ErrorCode::InvalidCoordinate);
}

TEST_F(MemoryPointStoreTest, ScanRadiusHonoursStopRequest) {
    for (size_t i = 0; i < MemoryPointStore::SCAN_STRIDE * 2; ++i) {
        ASSERT_TRUE(store_.upsert("ghost:" + std::to_string(i), 0.0, 0.0));
    }

    std::stop_source source;
    source.request_stop();
    auto hits = store_.scanRadius({0.0, 0.0}, 1.0, 10, source.get_token());
    ASSERT_FALSE(hits.has_value());
    EXPECT_EQ(hits.error().code, ErrorCode::Cancelled);
}

TEST_F(MemoryPointStoreTest, SnapshotListsEveryPoint) {
    ASSERT_TRUE(store_.upsert("a", 1.0, 1.0));
    ASSERT_TRUE(store_.upsert("b", 2.0, 2.0));

    auto points = store_.snapshot();
    ASSERT_TRUE(points.has_value());
    EXPECT_EQ(points->size(), 2u);
}

TEST_F(MemoryPointStoreTest, ConcurrentUpsertsOfDistinctIds) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = std::to_string(t) + ":" + std::to_string(i);
                (void)store_.upsert(id, i * 0.001, t * 0.001);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store_.size().value(), static_cast<size_t>(kThreads * kPerThread));
}

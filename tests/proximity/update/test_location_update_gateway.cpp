// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for LocationUpdateGateway
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "proximity/location_index.hpp"
#include "proximity/store/memory_point_store.hpp"
#include "proximity/update/location_update_gateway.hpp"

using namespace geofleet::proximity;
using namespace geofleet::proximity::update;
using model::ErrorCode;
using model::Point;

class LocationUpdateGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<store::MemoryPointStore>();
        locations_ = std::make_shared<LocationIndex>(store_);
        gateway_ = std::make_unique<LocationUpdateGateway>(locations_);
        ASSERT_TRUE(gateway_->buildCellIndex(7));
    }

    // Present in the store iff in exactly one cell of the layer
    void expectConsistent(const std::string& id) {
        bool stored = store_->position(id).value().has_value();
        EXPECT_EQ(locations_->cells().membershipCount(id, 7), stored ? 1u : 0u)
            << id;
    }

    std::shared_ptr<store::MemoryPointStore> store_;
    std::shared_ptr<LocationIndex> locations_;
    std::unique_ptr<LocationUpdateGateway> gateway_;
};

TEST_F(LocationUpdateGatewayTest, ReportLocationUpdatesStoreAndCells) {
    ASSERT_TRUE(gateway_->reportLocation("d1", 106.7, 10.77));

    auto pos = gateway_->position("d1");
    ASSERT_TRUE(pos.has_value());
    ASSERT_TRUE(pos->has_value());
    EXPECT_DOUBLE_EQ((*pos)->longitude, 106.7);
    expectConsistent("d1");
}

TEST_F(LocationUpdateGatewayTest, ReportLocationRejectsOutOfRange) {
    auto result = gateway_->reportLocation("d1", 200.0, 10.0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidCoordinate);
    EXPECT_FALSE(gateway_->position("d1").value().has_value());
    expectConsistent("d1");
}

TEST_F(LocationUpdateGatewayTest, ReportLocationRejectsEmptyId) {
    auto result = gateway_->reportLocation("", 10.0, 10.0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidId);
}

TEST_F(LocationUpdateGatewayTest, RepeatedReportIsIdempotent) {
    ASSERT_TRUE(gateway_->reportLocation("d1", 10.0, 10.0));
    auto cellsBefore = locations_->cells().stats();
    ASSERT_TRUE(gateway_->reportLocation("d1", 10.0, 10.0));

    EXPECT_EQ(store_->size().value(), 1u);
    EXPECT_EQ(locations_->cells().stats(), cellsBefore);
    expectConsistent("d1");
}

TEST_F(LocationUpdateGatewayTest, DeregisterIsIdempotent) {
    ASSERT_TRUE(gateway_->reportLocation("d1", 10.0, 10.0));
    EXPECT_TRUE(gateway_->deregister("d1"));
    EXPECT_TRUE(gateway_->deregister("d1"));
    expectConsistent("d1");
    EXPECT_EQ(locations_->cells().indexedCount(7), 0u);
}

TEST_F(LocationUpdateGatewayTest, BatchIsRejectedAsAWhole) {
    std::vector<Point> batch = {{"ghost:1", {1.0, 1.0}},
                                {"ghost:2", {1.0, 95.0}},
                                {"ghost:3", {2.0, 2.0}}};

    auto result = gateway_->reportBatch(batch);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidCoordinate);
    EXPECT_EQ(store_->size().value(), 0u);
}

TEST_F(LocationUpdateGatewayTest, BatchWritesEveryPoint) {
    std::vector<Point> batch;
    for (int i = 0; i < 100; ++i) {
        batch.push_back({"ghost:" + std::to_string(i), {106.7 + i * 0.001, 10.77}});
    }

    auto result = gateway_->reportBatch(batch);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 100u);
    EXPECT_EQ(locations_->cells().indexedCount(7), 100u);
}

TEST_F(LocationUpdateGatewayTest, BusyStaysIndexed) {
    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Online,
                                             model::GeoPoint{10.0, 10.0}));

    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Busy));
    auto kept = gateway_->position("d1").value();
    ASSERT_TRUE(kept.has_value());
    EXPECT_DOUBLE_EQ(kept->longitude, 10.0);
    expectConsistent("d1");

    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Busy,
                                             model::GeoPoint{10.5, 10.5}));
    EXPECT_DOUBLE_EQ(gateway_->position("d1").value()->longitude, 10.5);
    expectConsistent("d1");
}

TEST_F(LocationUpdateGatewayTest, OfflineLeavesTheIndex) {
    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Online,
                                             model::GeoPoint{11.0, 11.0}));
    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Offline));
    EXPECT_FALSE(gateway_->position("d1").value().has_value());
    expectConsistent("d1");

    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Offline));
}

TEST_F(LocationUpdateGatewayTest, OnlineWithoutLocationKeepsEntry) {
    ASSERT_TRUE(gateway_->reportLocation("d1", 10.0, 10.0));
    ASSERT_TRUE(gateway_->updateAvailability("d1", Availability::Online));
    EXPECT_TRUE(gateway_->position("d1").value().has_value());
}

TEST_F(LocationUpdateGatewayTest, AvailabilityNames) {
    EXPECT_EQ(availabilityFromString("BUSY"), Availability::Busy);
    EXPECT_EQ(availabilityFromString("online"), Availability::Online);
    EXPECT_FALSE(availabilityFromString("away").has_value());
    EXPECT_EQ(availabilityToString(Availability::Offline), "OFFLINE");
}

TEST_F(LocationUpdateGatewayTest, LateBuildIncludesExistingPoints) {
    ASSERT_TRUE(gateway_->reportLocation("d1", 10.0, 10.0));
    ASSERT_TRUE(gateway_->buildCellIndex(9));
    EXPECT_EQ(locations_->cells().membershipCount("d1", 9), 1u);

    gateway_->dropCellIndex(9);
    EXPECT_FALSE(locations_->cells().isBuilt(9));
}

TEST_F(LocationUpdateGatewayTest, ConcurrentWritersStayConsistent) {
    constexpr int kThreads = 4;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 300; ++i) {
                auto id = "ghost:" + std::to_string(i % 25);
                if ((i + t) % 7 == 0) {
                    (void)gateway_->deregister(id);
                } else {
                    (void)gateway_->reportLocation(id, 106.7 + t * 0.01,
                                                   10.77 + i * 0.0001);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < 25; ++i) {
        expectConsistent("ghost:" + std::to_string(i));
    }
    EXPECT_EQ(locations_->cells().indexedCount(7), store_->size().value());
}

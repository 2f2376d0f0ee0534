// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for ProximitySearchEngine
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "../store/mock_geo_store_client.hpp"
#include "proximity/location_index.hpp"
#include "proximity/search/proximity_search_engine.hpp"
#include "proximity/store/geo_store_point_store.hpp"
#include "proximity/store/memory_point_store.hpp"
#include "proximity/update/location_update_gateway.hpp"

using namespace geofleet::proximity;
using namespace geofleet::proximity::search;
using model::ErrorCode;
using model::SearchQuery;
using model::SearchStrategy;

class ProximitySearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        locations_ = std::make_shared<LocationIndex>(
            std::make_shared<store::MemoryPointStore>());
        gateway_ = std::make_unique<update::LocationUpdateGateway>(locations_);
        engine_ = std::make_unique<ProximitySearchEngine>(locations_);
    }

    void seedScenario() {
        ASSERT_TRUE(gateway_->reportLocation("real:1", 106.700, 10.770));
        ASSERT_TRUE(gateway_->reportLocation("ghost:1", 106.701, 10.770));
        ASSERT_TRUE(gateway_->reportLocation("ghost:2", 106.700, 10.772));
        ASSERT_TRUE(gateway_->reportLocation("ghost:3", 106.703, 10.771));
        ASSERT_TRUE(gateway_->reportLocation("ghost:4", 106.705, 10.775));
        ASSERT_TRUE(gateway_->reportLocation("ghost:5", 106.708, 10.778));
    }

    static auto query(SearchStrategy strategy, int count = 3) -> SearchQuery {
        SearchQuery q;
        q.center = {106.700, 10.770};
        q.radiusKm = 5.0;
        q.desiredCount = count;
        q.strategy = strategy;
        q.preferPrimary = true;
        return q;
    }

    std::shared_ptr<LocationIndex> locations_;
    std::unique_ptr<update::LocationUpdateGateway> gateway_;
    std::unique_ptr<ProximitySearchEngine> engine_;
};

TEST(ProximitySearchEngineConstruction, RejectsBadArguments) {
    EXPECT_THROW({ ProximitySearchEngine engine(nullptr); },
                 std::invalid_argument);

    auto locations = std::make_shared<LocationIndex>(
        std::make_shared<store::MemoryPointStore>());
    EngineOptions zeroCeiling;
    zeroCeiling.candidateCeiling = 0;
    EXPECT_THROW({ ProximitySearchEngine engine(locations, zeroCeiling); },
                 std::invalid_argument);
}

TEST_F(ProximitySearchEngineTest, RealDriverComesFirstAmongGhosts) {
    seedScenario();

    auto hits = engine_->search(query(SearchStrategy::FlatScan));
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 3u);
    EXPECT_EQ((*hits)[0].id, "real:1");
    EXPECT_NEAR((*hits)[0].distanceKm, 0.0, 1e-9);
    EXPECT_EQ((*hits)[1].id, "ghost:1");
    EXPECT_EQ((*hits)[2].id, "ghost:2");
}

TEST_F(ProximitySearchEngineTest, StrategiesAgreeOnScenario) {
    seedScenario();
    ASSERT_TRUE(gateway_->buildCellIndex(7));

    auto flat = engine_->search(query(SearchStrategy::FlatScan, 10));
    auto cells = engine_->search(query(SearchStrategy::Hierarchical, 10));
    ASSERT_TRUE(flat.has_value());
    ASSERT_TRUE(cells.has_value());
    EXPECT_EQ(*flat, *cells);
}

TEST_F(ProximitySearchEngineTest, HierarchicalBeforeBuildFails) {
    seedScenario();

    auto hits = engine_->search(query(SearchStrategy::Hierarchical));
    ASSERT_FALSE(hits.has_value());
    EXPECT_EQ(hits.error().code, ErrorCode::IndexUnavailable);
}

TEST_F(ProximitySearchEngineTest, PrimaryOutsideNearestStillSelected) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(gateway_->reportLocation("ghost:" + std::to_string(i),
                                             106.700 + i * 0.0001, 10.770));
    }
    ASSERT_TRUE(gateway_->reportLocation("real:far", 106.730, 10.770));

    auto hits = engine_->search(query(SearchStrategy::FlatScan, 5));
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 5u);
    EXPECT_EQ(hits->back().id, "real:far");
    EXPECT_TRUE(model::isWellFormed(*hits));
}

TEST_F(ProximitySearchEngineTest, CandidateCeilingBoundsPrimaryRescue) {
    EngineOptions options;
    options.candidateCeiling = 5;
    ProximitySearchEngine tight(locations_, options);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(gateway_->reportLocation("ghost:" + std::to_string(i),
                                             106.700 + i * 0.0001, 10.770));
    }
    ASSERT_TRUE(gateway_->reportLocation("real:far", 106.730, 10.770));

    auto hits = tight.search(query(SearchStrategy::FlatScan, 3));
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 3u);
    for (const auto& hit : *hits) {
        EXPECT_NE(hit.id, "real:far");
    }
}

TEST_F(ProximitySearchEngineTest, EmptyStoreIsEmptySuccess) {
    auto hits = engine_->search(query(SearchStrategy::FlatScan));
    ASSERT_TRUE(hits.has_value());
    EXPECT_TRUE(hits->empty());
}

TEST_F(ProximitySearchEngineTest, NonPositiveCountIsEmpty) {
    seedScenario();
    auto hits = engine_->search(query(SearchStrategy::FlatScan, 0));
    ASSERT_TRUE(hits.has_value());
    EXPECT_TRUE(hits->empty());
}

TEST_F(ProximitySearchEngineTest, RejectsInvalidQueries) {
    auto q = query(SearchStrategy::FlatScan);
    q.radiusKm = 0.0;
    auto zero = engine_->search(q);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidRadius);

    q = query(SearchStrategy::FlatScan);
    q.center = {106.7, -91.0};
    auto center = engine_->search(q);
    ASSERT_FALSE(center.has_value());
    EXPECT_EQ(center.error().code, ErrorCode::InvalidCoordinate);
}

TEST_F(ProximitySearchEngineTest, SearchNearbyFormatsDistances) {
    seedScenario();

    auto drivers = engine_->searchNearby(106.700, 10.770, 5.0, 2);
    ASSERT_TRUE(drivers.has_value());
    ASSERT_EQ(drivers->size(), 2u);
    EXPECT_EQ((*drivers)[0].driverId, "real:1");
    EXPECT_EQ((*drivers)[0].distance, "0");
    EXPECT_EQ((*drivers)[1].driverId, "ghost:1");
    EXPECT_EQ((*drivers)[1].distance,
              model::formatDistance(
                  model::haversineKm({106.700, 10.770}, {106.701, 10.770})));
}

TEST_F(ProximitySearchEngineTest, SearchNearbyRejectsNegativeCount) {
    auto drivers = engine_->searchNearby(106.700, 10.770, 5.0, -1);
    ASSERT_FALSE(drivers.has_value());
    EXPECT_EQ(drivers.error().code, ErrorCode::InvalidCount);
}

TEST_F(ProximitySearchEngineTest, SearchNearbyUsesDefaultStrategy) {
    EngineOptions options;
    options.defaultStrategy = SearchStrategy::Hierarchical;
    ProximitySearchEngine cellsFirst(locations_, options);

    auto unbuilt = cellsFirst.searchNearby(106.700, 10.770, 5.0, 3);
    ASSERT_FALSE(unbuilt.has_value());
    EXPECT_EQ(unbuilt.error().code, ErrorCode::IndexUnavailable);

    auto flat = cellsFirst.searchNearby(106.700, 10.770, 5.0, 3,
                                        SearchStrategy::FlatScan);
    EXPECT_TRUE(flat.has_value());
}

TEST_F(ProximitySearchEngineTest, StatsCountQueriesPerStrategy) {
    seedScenario();
    (void)engine_->search(query(SearchStrategy::FlatScan));
    (void)engine_->search(query(SearchStrategy::FlatScan));
    (void)engine_->search(query(SearchStrategy::Hierarchical));

    auto stats = engine_->getStats();
    EXPECT_EQ(stats["flatScan"]["queries"], 2);
    EXPECT_EQ(stats["flatScan"]["failures"], 0);
    EXPECT_EQ(stats["hierarchical"]["queries"], 1);
    EXPECT_EQ(stats["hierarchical"]["failures"], 1);
    EXPECT_EQ(stats["candidateCeiling"], 1000);

    engine_->resetStats();
    EXPECT_EQ(engine_->getStats()["flatScan"]["queries"], 0);
}

// Readers must never see a point in the store but missing from its cell
TEST_F(ProximitySearchEngineTest, ConcurrentUpdatesKeepStrategiesConsistent) {
    ASSERT_TRUE(gateway_->buildCellIndex(7));
    std::atomic<bool> stop{false};
    std::atomic<int> mismatches{0};

    std::thread writer([&] {
        for (int round = 0; round < 200; ++round) {
            for (int i = 0; i < 20; ++i) {
                double lon = 106.70 + ((round + i) % 10) * 0.002;
                (void)gateway_->reportLocation("ghost:" + std::to_string(i),
                                               lon, 10.77);
            }
            (void)gateway_->deregister("ghost:" + std::to_string(round % 20));
        }
        stop = true;
    });

    std::thread reader([&] {
        while (!stop) {
            auto lock = locations_->readLock();
            auto flat = locations_->store().scanRadius({106.70, 10.77}, 3.0,
                                                       1000);
            auto cells =
                locations_->cells().query({106.70, 10.77}, 3.0, 1000, 7);
            if (!flat || !cells || *flat != *cells) {
                ++mismatches;
            }
            lock.unlock();
            std::this_thread::yield();
        }
    });

    writer.join();
    reader.join();
    EXPECT_EQ(mismatches.load(), 0);
}

class GeoStoreBackedSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<::testing::StrictMock<store::test::MockGeoStoreClient>>();
        locations_ = std::make_shared<LocationIndex>(
            std::make_shared<store::GeoStorePointStore>(client_));
        gateway_ = std::make_unique<update::LocationUpdateGateway>(locations_);
        engine_ = std::make_unique<ProximitySearchEngine>(locations_);

        std::vector<store::GeoMember> fleet;
        for (int i = 0; i < 40; ++i) {
            fleet.push_back({"ghost:" + std::to_string(i), 106.700 + i * 0.0002,
                             10.770});
        }
        fleet.push_back({"real:1", 106.706, 10.770});
        EXPECT_CALL(*client_, geoMembers("drivers"))
            .WillOnce(::testing::Return(fleet));
        ASSERT_TRUE(gateway_->buildCellIndex(7));

        for (auto& member : fleet) {
            positions_[member.member] = member;
        }
    }

    static auto hierarchicalQuery() -> SearchQuery {
        SearchQuery q;
        q.center = {106.700, 10.770};
        q.radiusKm = 2.0;
        q.desiredCount = 3;
        q.strategy = SearchStrategy::Hierarchical;
        return q;
    }

    std::shared_ptr<::testing::StrictMock<store::test::MockGeoStoreClient>> client_;
    std::shared_ptr<LocationIndex> locations_;
    std::unique_ptr<update::LocationUpdateGateway> gateway_;
    std::unique_ptr<ProximitySearchEngine> engine_;
    std::map<std::string, store::GeoMember> positions_;
};

TEST_F(GeoStoreBackedSearchTest, CandidatesAreFetchedInOneRoundTrip) {
    size_t requested = 0;
    EXPECT_CALL(*client_, geoPos("drivers", ::testing::_))
        .Times(1)
        .WillOnce(::testing::Invoke(
            [this, &requested](const std::string&,
                               std::span<const std::string> members) {
                requested = members.size();
                std::vector<std::optional<store::GeoMember>> reply;
                for (const auto& member : members) {
                    reply.push_back(positions_.at(member));
                }
                return reply;
            }));

    auto result = engine_->search(hierarchicalQuery());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(requested, 41u);
    ASSERT_EQ(result->size(), 3u);
    EXPECT_EQ((*result)[0].id, "ghost:0");
    EXPECT_EQ((*result)[1].id, "ghost:1");
    EXPECT_EQ((*result)[2].id, "real:1");
}

TEST_F(GeoStoreBackedSearchTest, FetchFailureIsStoreUnavailable) {
    EXPECT_CALL(*client_, geoPos(::testing::_, ::testing::_))
        .Times(2)
        .WillRepeatedly(
            ::testing::Throw(store::GeoStoreError("connection reset")));

    auto direct = locations_->cells().query({106.700, 10.770}, 2.0, 10, 7);
    ASSERT_FALSE(direct.has_value());
    EXPECT_EQ(direct.error().code, ErrorCode::StoreUnavailable);

    auto result = engine_->search(hierarchicalQuery());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StoreUnavailable);
    EXPECT_EQ(engine_->getStats()["hierarchical"]["failures"], 1);
}

#include <gtest/gtest.h>
#include <memory>
#include <variant>
#include "bucket_aggregator.hpp"
#include "query_engine.hpp"
#include "test_doubles.hpp"

using namespace energy_rollup;
using namespace energy_rollup::test_support;

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        use_utc();
    }

    std::unique_ptr<EnergyQueryEngine> make_engine(QueryCache* cache = nullptr,
                                                   int64_t bucket_threshold = SECONDS_PER_HOUR) {
        EnergyQueryEngine::Options options;
        options.bucket_threshold_seconds = bucket_threshold;
        return std::make_unique<EnergyQueryEngine>(source_, store_, cache, options);
    }

    // Two hours of constant home load, buckets and rollups built
    void build_two_hours_of_buckets() {
        source_.fill(BASE, BASE + 7200, 10, 1200.0, 0.0, 0.0, 0.0);
        BucketAggregator aggregator(source_, store_, nullptr);
        ASSERT_TRUE(aggregator.backfill(BASE, BASE + 7199).has_value());
    }

    static const AggregatedResponse& single(const AggregatedResult& result) {
        return std::get<AggregatedResponse>(result);
    }

    InMemoryReadingSource source_;
    InMemoryBucketStore store_{source_};
};

TEST_F(QueryEngineTest, NarrowRangeIntegratesRawReadings) {
    source_.insert(EnergyReading(BASE, 1000.0, 0.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 600, 2000.0, 0.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 1200, 1500.0, 0.0, 0.0, 0.0));
    auto engine = make_engine();

    auto result = engine->get_aggregated_energy_data(BASE, BASE + 1200, Granularity::HOUR, ChannelType::HOME);

    ASSERT_TRUE(std::holds_alternative<AggregatedResponse>(result));
    const auto& response = single(result);
    ASSERT_EQ(response.data.size(), 1u);
    EXPECT_NEAR(response.total, 0.5417, 1e-4);
    EXPECT_DOUBLE_EQ(response.data[0].kwh, response.total);
    EXPECT_EQ(response.data[0].label, "22:00");
    EXPECT_EQ(store_.range_buckets_calls, 0);
    EXPECT_EQ(engine->get_statistics().raw_path_queries, 1u);
}

TEST_F(QueryEngineTest, GridIsSplitIntoConsumptionAndFeedIn) {
    source_.insert(EnergyReading(BASE, 0.0, -500.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 600, 0.0, -600.0, 0.0, 0.0));
    auto engine = make_engine();

    auto result = engine->get_aggregated_energy_data(BASE, BASE + 600, Granularity::HOUR, ChannelType::GRID);

    ASSERT_TRUE(std::holds_alternative<GridAggregatedResponse>(result));
    const auto& grid = std::get<GridAggregatedResponse>(result);
    EXPECT_NEAR(grid.feed_in.total, 0.0917, 1e-4);
    ASSERT_EQ(grid.feed_in.data.size(), 1u);
    EXPECT_DOUBLE_EQ(grid.consumption.total, 0.0);
    EXPECT_TRUE(grid.consumption.data.empty());
}

TEST_F(QueryEngineTest, SingleReadingGivesZero) {
    source_.insert(EnergyReading(BASE + 100, 900.0, 0.0, 0.0, 0.0));
    auto engine = make_engine();

    auto result = engine->get_aggregated_energy_data(BASE, BASE + 600, Granularity::HOUR, ChannelType::HOME);

    EXPECT_DOUBLE_EQ(single(result).total, 0.0);
    EXPECT_TRUE(single(result).data.empty());
}

TEST_F(QueryEngineTest, EmptyRangeGivesEmptyResponse) {
    auto engine = make_engine();

    auto result = engine->get_aggregated_energy_data(BASE, BASE + 600, Granularity::DAY, ChannelType::SOLAR);

    EXPECT_DOUBLE_EQ(single(result).total, 0.0);
    EXPECT_TRUE(single(result).data.empty());
}

TEST_F(QueryEngineTest, RepeatedQueryIsServedFromCache) {
    source_.fill(BASE, BASE + 1200, 60, 1000.0, 0.0, 0.0, 0.0);
    RecordingQueryCache cache;
    auto engine = make_engine(&cache);

    auto first = engine->get_aggregated_energy_data(BASE, BASE + 1200, Granularity::HOUR, ChannelType::HOME);
    const int reads_after_first = source_.range_query_calls;
    auto second = engine->get_aggregated_energy_data(BASE, BASE + 1200, Granularity::HOUR, ChannelType::HOME);

    EXPECT_EQ(source_.range_query_calls, reads_after_first);
    EXPECT_EQ(store_.range_buckets_calls, 0);
    EXPECT_DOUBLE_EQ(single(second).total, single(first).total);
    ASSERT_EQ(single(second).data.size(), single(first).data.size());
    EXPECT_EQ(single(second).data[0].label, single(first).data[0].label);

    ASSERT_EQ(cache.entries.size(), 1u);
    EXPECT_EQ(cache.entries.begin()->first,
              EnergyQueryEngine::cache_key(BASE, BASE + 1200, Granularity::HOUR, ChannelType::HOME));
    ASSERT_TRUE(cache.last_ttl.has_value());
    EXPECT_EQ(cache.last_ttl->count(), 300);

    auto stats = engine->get_statistics();
    EXPECT_EQ(stats.queries_served, 2u);
    EXPECT_EQ(stats.cache_hits, 1u);
}

TEST_F(QueryEngineTest, CachedGridResultKeepsBothSeries) {
    source_.insert(EnergyReading(BASE, 0.0, 400.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 600, 0.0, 400.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 1200, 0.0, -400.0, 0.0, 0.0));
    source_.insert(EnergyReading(BASE + 1800, 0.0, -400.0, 0.0, 0.0));
    RecordingQueryCache cache;
    auto engine = make_engine(&cache);

    engine->get_aggregated_energy_data(BASE, BASE + 1800, Granularity::HOUR, ChannelType::GRID);
    auto cached = engine->get_aggregated_energy_data(BASE, BASE + 1800, Granularity::HOUR, ChannelType::GRID);

    ASSERT_TRUE(std::holds_alternative<GridAggregatedResponse>(cached));
    const auto& grid = std::get<GridAggregatedResponse>(cached);
    EXPECT_NEAR(grid.consumption.total, 0.4 * 600 / 3600.0, 1e-12);
    EXPECT_NEAR(grid.feed_in.total, 0.4 * 600 / 3600.0, 1e-12);
    EXPECT_EQ(engine->get_statistics().cache_hits, 1u);
}

TEST_F(QueryEngineTest, CacheFailuresAreTreatedAsMisses) {
    source_.fill(BASE, BASE + 600, 60, 1000.0, 0.0, 0.0, 0.0);
    RecordingQueryCache cache;
    cache.fail = true;
    auto engine = make_engine(&cache);

    auto result = engine->get_aggregated_energy_data(BASE, BASE + 600, Granularity::HOUR, ChannelType::HOME);

    EXPECT_NEAR(single(result).total, 1.0 * 600 / 3600.0, 1e-12);
    EXPECT_EQ(engine->get_statistics().cache_errors, 2u);
    EXPECT_EQ(engine->get_statistics().cache_hits, 0u);
}

TEST_F(QueryEngineTest, StorageFailurePropagates) {
    source_.fail_range_from = BASE;
    auto engine = make_engine();

    EXPECT_THROW(engine->get_aggregated_energy_data(BASE, BASE + 600, Granularity::HOUR, ChannelType::HOME),
                 StorageError);
    EXPECT_EQ(engine->get_performance_metrics().failed_queries, 1u);
}

TEST_F(QueryEngineTest, AlignedBucketPathMatchesRawPath) {
    build_two_hours_of_buckets();
    auto bucket_engine = make_engine();
    auto raw_engine = make_engine(nullptr, SECONDS_PER_DAY);

    auto from_buckets = bucket_engine->get_aggregated_energy_data(BASE, BASE + 7200, Granularity::HOUR, ChannelType::HOME);
    auto from_raw = raw_engine->get_aggregated_energy_data(BASE, BASE + 7200, Granularity::HOUR, ChannelType::HOME);

    EXPECT_EQ(bucket_engine->get_statistics().bucket_path_queries, 1u);
    EXPECT_EQ(raw_engine->get_statistics().raw_path_queries, 1u);
    EXPECT_GT(store_.range_buckets_calls, 0);

    EXPECT_NEAR(single(from_buckets).total, 2.4, 1e-9);
    EXPECT_NEAR(single(from_raw).total, 2.4, 1e-9);

    const auto& bucket_points = single(from_buckets).data;
    const auto& raw_points = single(from_raw).data;
    ASSERT_EQ(bucket_points.size(), 2u);
    ASSERT_EQ(raw_points.size(), 2u);
    for (size_t i = 0; i < bucket_points.size(); ++i) {
        EXPECT_EQ(bucket_points[i].timestamp, raw_points[i].timestamp);
        EXPECT_NEAR(bucket_points[i].kwh, raw_points[i].kwh, 1e-9);
    }

    // Aligned edges need no anchors
    EXPECT_EQ(store_.anchor_calls, 0);
}

TEST_F(QueryEngineTest, UnalignedBucketPathUsesEdgeReadingsAndAnchors) {
    build_two_hours_of_buckets();
    auto engine = make_engine();

    auto result = engine->get_aggregated_energy_data(BASE + 30, BASE + 3630, Granularity::HOUR, ChannelType::HOME);

    // Anchors at BASE+20 and BASE+3640 extend the integrated span to 3620 s
    EXPECT_NEAR(single(result).total, 1.2 * 3620 / 3600.0, 1e-9);
    EXPECT_EQ(store_.anchor_calls, 2);
    EXPECT_EQ(engine->get_statistics().bucket_path_queries, 1u);
}

TEST_F(QueryEngineTest, BucketPathWithinOneMinuteFallsBackToRawReadings) {
    build_two_hours_of_buckets();
    auto engine = make_engine(nullptr, 30);

    auto result = engine->get_aggregated_energy_data(BASE + 5, BASE + 45, Granularity::HOUR, ChannelType::HOME);

    EXPECT_EQ(store_.range_buckets_calls, 0);
    // Raw readings 10..40 plus anchors at BASE and BASE+50
    EXPECT_NEAR(single(result).total, 1.2 * 50 / 3600.0, 1e-12);
}

TEST_F(QueryEngineTest, RollupEnergyIsEmptyUntilRollupsExist) {
    auto engine = make_engine();

    auto response = engine->get_rollup_energy(BASE, BASE + 7200, Granularity::HOUR, ChannelType::HOME);

    EXPECT_TRUE(response.data.empty());
    EXPECT_DOUBLE_EQ(response.total, 0.0);
}

TEST_F(QueryEngineTest, RollupEnergyReadsHourlyWindows) {
    build_two_hours_of_buckets();
    auto engine = make_engine();

    auto response = engine->get_rollup_energy(BASE, BASE + 7200, Granularity::HOUR, ChannelType::HOME);

    // Each minute bucket covers 50 s between its first and last sample
    ASSERT_EQ(response.data.size(), 2u);
    EXPECT_EQ(response.data[0].label, "22:00");
    EXPECT_EQ(response.data[1].label, "23:00");
    EXPECT_NEAR(response.data[0].kwh, 1.0, 1e-9);
    EXPECT_NEAR(response.total, 2.0, 1e-9);
}

TEST_F(QueryEngineTest, CacheKeyNamesChannelGranularityAndRange) {
    EXPECT_EQ(EnergyQueryEngine::cache_key(1, 2, Granularity::HOUR, ChannelType::GRID),
              "energy:aggregated:grid:hour:1:2");
    EXPECT_EQ(EnergyQueryEngine::cache_key(BASE, BASE + 86400, Granularity::DAY, ChannelType::SOLAR),
              "energy:aggregated:solar:day:1699999200:1700085600");
}

TEST_F(QueryEngineTest, AggregateReadingsMatchesQueryPath) {
    source_.fill(BASE, BASE + 900, 30, 0.0, 0.0, 7000.0, 0.0);
    auto engine = make_engine();

    auto queried = engine->get_aggregated_energy_data(BASE, BASE + 900, Granularity::HOUR, ChannelType::CAR);
    auto direct = EnergyQueryEngine::aggregate_readings(source_.range_query(BASE, BASE + 900),
                                                        Granularity::HOUR, ChannelType::CAR);

    EXPECT_NEAR(single(queried).total, 7.0 * 900 / 3600.0, 1e-12);
    EXPECT_DOUBLE_EQ(single(direct).total, single(queried).total);
}

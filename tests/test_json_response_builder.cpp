#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "json_response_builder.hpp"
#include "test_doubles.hpp"

using namespace energy_rollup;
using energy_rollup::test_support::BASE;

class JsonResponseBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_support::use_utc();

        PricingSchedule tariff;
        tariff.producing_price = 0.08;
        tariff.consuming_periods = {ConsumingPeriod{1320, 360, 0.21}, ConsumingPeriod{360, 1320, 0.34}};
        schedule_ = tariff;

        series_.data = {AggregatedDataPoint{"22:00", 1.0, BASE}};
        series_.total = 1.0;
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::optional<PricingSchedule> schedule_;
    AggregatedResponse series_;
};

TEST_F(JsonResponseBuilderTest, NumbersDropTrailingZeros) {
    EXPECT_EQ(JsonResponseBuilder::format_json_number(1.5), "1.5");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(2.0), "2");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(0.123456789), "0.123457");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(0.21, 4), "0.21");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(0.00004, 4), "0");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(-0.0000001), "0");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(-2.25), "-2.25");
}

TEST_F(JsonResponseBuilderTest, NonFiniteNumbersBecomeNull) {
    EXPECT_EQ(JsonResponseBuilder::format_json_number(std::nan("")), "null");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(JsonResponseBuilder::format_json_number(-std::numeric_limits<double>::infinity()), "null");
}

TEST_F(JsonResponseBuilderTest, StringsAreEscaped) {
    EXPECT_EQ(JsonResponseBuilder::escape_json_string("plain"), "plain");
    EXPECT_EQ(JsonResponseBuilder::escape_json_string("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(JsonResponseBuilder::escape_json_string("line\nbreak\ttab"), "line\\nbreak\\ttab");
    EXPECT_EQ(JsonResponseBuilder::escape_json_string(std::string("\x01", 1)), "\\u0001");
}

TEST_F(JsonResponseBuilderTest, TimestampsAreUtcIso8601) {
    EXPECT_EQ(JsonResponseBuilder::timestamp_to_iso8601(BASE), "2023-11-14T22:00:00Z");
    EXPECT_EQ(JsonResponseBuilder::timestamp_to_iso8601(0), "1970-01-01T00:00:00Z");
}

TEST_F(JsonResponseBuilderTest, SeriesListsPointsAndTotal) {
    std::string json = JsonResponseBuilder::series_to_json(series_);

    EXPECT_TRUE(contains(json, "{\"label\": \"22:00\", \"kwh\": 1, \"timestamp\": 1699999200}"));
    EXPECT_TRUE(contains(json, "\"total\": 1"));

    std::string empty = JsonResponseBuilder::series_to_json(AggregatedResponse{});
    EXPECT_TRUE(contains(empty, "\"data\": [],"));
    EXPECT_TRUE(contains(empty, "\"total\": 0"));
}

TEST_F(JsonResponseBuilderTest, SingleChannelQueryWithoutPricing) {
    std::string json = JsonResponseBuilder::create_query_response(
        series_, BASE, BASE + 3600, Granularity::HOUR, ChannelType::HOME, std::nullopt);

    EXPECT_TRUE(contains(json, "\"channel\": \"home\""));
    EXPECT_TRUE(contains(json, "\"granularity\": \"hour\""));
    EXPECT_TRUE(contains(json, "\"from\": \"2023-11-14T22:00:00Z\""));
    EXPECT_TRUE(contains(json, "\"to\": \"2023-11-14T23:00:00Z\""));
    EXPECT_TRUE(contains(json, "\"result\": {"));
    EXPECT_FALSE(contains(json, "cost"));
}

TEST_F(JsonResponseBuilderTest, SingleChannelQueryIsPricedByChannel) {
    std::string home = JsonResponseBuilder::create_query_response(
        series_, BASE, BASE + 3600, Granularity::HOUR, ChannelType::HOME, schedule_);
    EXPECT_TRUE(contains(home, "\"cost\": 0.21"));
    EXPECT_TRUE(contains(home, "\"total_cost\": 0.21"));

    std::string solar = JsonResponseBuilder::create_query_response(
        series_, BASE, BASE + 3600, Granularity::HOUR, ChannelType::SOLAR, schedule_);
    EXPECT_TRUE(contains(solar, "\"total_cost\": 0.08"));
}

TEST_F(JsonResponseBuilderTest, GridQueryHasConsumptionAndFeedIn) {
    GridAggregatedResponse grid;
    grid.consumption = series_;
    grid.feed_in.data = {AggregatedDataPoint{"22:00", 2.0, BASE}};
    grid.feed_in.total = 2.0;

    std::string plain = JsonResponseBuilder::create_query_response(
        grid, BASE, BASE + 3600, Granularity::HOUR, ChannelType::GRID, std::nullopt);
    EXPECT_TRUE(contains(plain, "\"consumption\": {"));
    EXPECT_TRUE(contains(plain, "\"feed_in\": {"));
    EXPECT_FALSE(contains(plain, "\"result\""));
    EXPECT_FALSE(contains(plain, "total_cost"));

    std::string priced = JsonResponseBuilder::create_query_response(
        grid, BASE, BASE + 3600, Granularity::HOUR, ChannelType::GRID, schedule_);
    EXPECT_TRUE(contains(priced, "\"total_cost\": 0.21"));
    EXPECT_TRUE(contains(priced, "\"total_cost\": 0.16"));
}

TEST_F(JsonResponseBuilderTest, RollupsResponseWrapsSeries) {
    std::string json = JsonResponseBuilder::create_rollups_response(
        series_, BASE, BASE + 86400, Granularity::DAY, ChannelType::CAR);

    EXPECT_TRUE(contains(json, "\"channel\": \"car\""));
    EXPECT_TRUE(contains(json, "\"granularity\": \"day\""));
    EXPECT_TRUE(contains(json, "\"rollups\": {"));
}

TEST_F(JsonResponseBuilderTest, StatusBeforeFirstRun) {
    TimeSeriesStorage::DatabaseInfo info;
    info.database_path = "/var/lib/energy-rollup";
    info.is_healthy = true;

    std::string json = JsonResponseBuilder::create_status_response(std::nullopt, info);

    EXPECT_TRUE(contains(json, "\"checkpoint\": null"));
    EXPECT_TRUE(contains(json, "\"path\": \"/var/lib/energy-rollup\""));
    EXPECT_TRUE(contains(json, "\"earliest_reading\": null"));
    EXPECT_TRUE(contains(json, "\"latest_bucket\": null"));
    EXPECT_TRUE(contains(json, "\"healthy\": true"));
}

TEST_F(JsonResponseBuilderTest, StatusWithCheckpoint) {
    AggregationCheckpoint checkpoint;
    checkpoint.last_processed_timestamp = BASE;
    checkpoint.last_run_at = BASE + 75;
    checkpoint.status = JobStatus::COMPLETED;
    checkpoint.generation = 3;

    TimeSeriesStorage::DatabaseInfo info;
    info.estimated_readings = 42;
    info.earliest_reading = BASE - 60;
    info.latest_bucket = BASE;

    std::string json = JsonResponseBuilder::create_status_response(checkpoint, info);

    EXPECT_TRUE(contains(json, "\"last_processed_timestamp\": 1699999200"));
    EXPECT_TRUE(contains(json, "\"last_processed\": \"2023-11-14T22:00:00Z\""));
    EXPECT_TRUE(contains(json, "\"last_run_at\": \"2023-11-14T22:01:15Z\""));
    EXPECT_TRUE(contains(json, "\"status\": \"completed\""));
    EXPECT_TRUE(contains(json, "\"generation\": 3,"));
    EXPECT_TRUE(contains(json, "\"rollups_dirty_from\": null"));
    EXPECT_TRUE(contains(json, "\"estimated_readings\": 42"));
    EXPECT_TRUE(contains(json, "\"earliest_reading\": \"2023-11-14T21:59:00Z\""));
    EXPECT_TRUE(contains(json, "\"healthy\": false"));
}

TEST_F(JsonResponseBuilderTest, BackfillSummary) {
    EXPECT_TRUE(contains(JsonResponseBuilder::create_backfill_response(std::nullopt), "\"status\": \"skipped\""));

    BucketAggregator::BackfillOutcome outcome;
    outcome.first_bucket = BASE;
    outcome.last_bucket = BASE + 240;
    outcome.minutes_processed = 5;
    outcome.buckets_written = 5;

    std::string clean = JsonResponseBuilder::create_backfill_response(outcome);
    EXPECT_TRUE(contains(clean, "\"status\": \"completed\""));
    EXPECT_TRUE(contains(clean, "\"last_bucket\": \"2023-11-14T22:04:00Z\""));
    EXPECT_TRUE(contains(clean, "\"minutes_processed\": 5"));

    EXPECT_TRUE(contains(clean, "\"rollups_rebuilt\": true"));

    outcome.rollups_rebuilt = false;
    std::string stale = JsonResponseBuilder::create_backfill_response(outcome);
    EXPECT_TRUE(contains(stale, "\"status\": \"completed_with_errors\""));
    EXPECT_TRUE(contains(stale, "\"rollups_rebuilt\": false"));

    outcome.rollups_rebuilt = true;
    outcome.failed_minutes = 1;
    EXPECT_TRUE(contains(JsonResponseBuilder::create_backfill_response(outcome),
                         "\"status\": \"completed_with_errors\""));
}

TEST_F(JsonResponseBuilderTest, ErrorResponseCarriesDetails) {
    std::string json = JsonResponseBuilder::create_error_response("Bad \"range\"", "from after to");

    EXPECT_TRUE(contains(json, "\"error\": \"Bad \\\"range\\\"\""));
    EXPECT_TRUE(contains(json, "\"details\": \"from after to\""));
    EXPECT_TRUE(contains(json, "\"timestamp\": \""));

    EXPECT_FALSE(contains(JsonResponseBuilder::create_error_response("plain"), "details"));
}

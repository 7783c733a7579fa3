#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <rocksdb/db.h>
#include "time_series_storage.hpp"
#include "test_doubles.hpp"

using namespace energy_rollup;
using energy_rollup::test_support::BASE;

class TimeSeriesStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_support::use_utc();

        // Create temporary directory for test database
        test_db_path_ = std::filesystem::temp_directory_path() / "energy_rollup_test_db";
        std::filesystem::remove_all(test_db_path_);
        std::filesystem::create_directories(test_db_path_);
    }

    void TearDown() override {
        test_support::use_utc();
        std::filesystem::remove_all(test_db_path_);
    }

    static EnergyBucket make_bucket(int64_t start, double home_kwh) {
        EnergyBucket bucket;
        bucket.bucket_start = start;
        bucket.bucket_end = start + SECONDS_PER_MINUTE;
        bucket.home_kwh = home_kwh;
        bucket.readings_count = 6;
        bucket.first_timestamp = start;
        bucket.last_timestamp = start + 50;
        bucket.first_home = 100.0;
        bucket.last_home = 200.0;
        return bucket;
    }

    // Overwrite one record behind the storage's back, with the database closed
    void write_raw_record(const std::string& family, int64_t timestamp, const std::string& value) {
        rocksdb::Options options;
        std::vector<std::string> names;
        ASSERT_TRUE(rocksdb::DB::ListColumnFamilies(options, test_db_path_.string(), &names).ok());

        std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
        for (const auto& name : names) {
            descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions());
        }

        std::vector<rocksdb::ColumnFamilyHandle*> handles;
        rocksdb::DB* raw_db = nullptr;
        ASSERT_TRUE(rocksdb::DB::Open(options, test_db_path_.string(), descriptors, &handles, &raw_db).ok());
        std::unique_ptr<rocksdb::DB> db(raw_db);

        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == family) {
                EXPECT_TRUE(db->Put(rocksdb::WriteOptions(), handles[i],
                                    TimeSeriesStorage::timestamp_to_key(timestamp), value).ok());
            }
        }
        for (auto* handle : handles) {
            EXPECT_TRUE(db->DestroyColumnFamilyHandle(handle).ok());
        }
    }

    const std::string garbage_{"\x0a\x05" "ab", 4};
    std::filesystem::path test_db_path_;
};

TEST_F(TimeSeriesStorageTest, InitializationSuccess) {
    TimeSeriesStorage storage;

    EXPECT_TRUE(storage.initialize(test_db_path_.string()));
    EXPECT_TRUE(storage.is_healthy());
}

TEST_F(TimeSeriesStorageTest, UninitializedStorageIsUnhealthy) {
    TimeSeriesStorage storage;

    EXPECT_FALSE(storage.is_healthy());
    EXPECT_FALSE(storage.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0)));
    EXPECT_THROW(storage.range_query(BASE, BASE + 60), StorageError);
    EXPECT_THROW(storage.load_checkpoint(), StorageError);
}

TEST_F(TimeSeriesStorageTest, RangeQueryIsInclusiveAndOrdered) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    for (int64_t ts : {BASE + 30, BASE, BASE + 20, BASE + 10}) {
        ASSERT_TRUE(storage.insert(EnergyReading(ts, static_cast<double>(ts - BASE), 0.0, 0.0, 0.0)));
    }

    auto readings = storage.range_query(BASE + 10, BASE + 30);

    ASSERT_EQ(readings.size(), 3u);
    EXPECT_EQ(readings[0].timestamp, BASE + 10);
    EXPECT_EQ(readings[1].timestamp, BASE + 20);
    EXPECT_EQ(readings[2].timestamp, BASE + 30);
    EXPECT_DOUBLE_EQ(readings[2].home, 30.0);

    EXPECT_TRUE(storage.range_query(BASE + 30, BASE + 10).empty());
}

TEST_F(TimeSeriesStorageTest, InsertReplacesReadingWithSameTimestamp) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    ASSERT_TRUE(storage.insert(EnergyReading(BASE, 100.0, -50.0, 0.0, 0.0)));
    ASSERT_TRUE(storage.insert(EnergyReading(BASE, 300.0, -75.0, 11000.0, 4200.0)));

    auto readings = storage.range_query(BASE, BASE);
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_DOUBLE_EQ(readings[0].home, 300.0);
    EXPECT_DOUBLE_EQ(readings[0].grid, -75.0);
    EXPECT_DOUBLE_EQ(readings[0].car, 11000.0);
    EXPECT_DOUBLE_EQ(readings[0].solar, 4200.0);
}

TEST_F(TimeSeriesStorageTest, NeighbourLookupsAreStrict) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    storage.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(BASE + 10, 2.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(BASE + 20, 3.0, 0.0, 0.0, 0.0));

    auto before = storage.before(BASE + 10);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->timestamp, BASE);

    auto between = storage.before(BASE + 15);
    ASSERT_TRUE(between.has_value());
    EXPECT_EQ(between->timestamp, BASE + 10);

    auto after = storage.after(BASE + 10);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->timestamp, BASE + 20);

    EXPECT_FALSE(storage.before(BASE).has_value());
    EXPECT_FALSE(storage.after(BASE + 20).has_value());
    EXPECT_EQ(storage.first_reading_before(BASE + 20)->timestamp, BASE + 10);
    EXPECT_EQ(storage.first_reading_after(BASE + 5)->timestamp, BASE + 10);
}

TEST_F(TimeSeriesStorageTest, EarliestAndLatestReadings) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    EXPECT_FALSE(storage.earliest().has_value());
    EXPECT_FALSE(storage.latest().has_value());

    storage.insert(EnergyReading(BASE + 500, 1.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(BASE - 500, 1.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0));

    EXPECT_EQ(storage.earliest()->timestamp, BASE - 500);
    EXPECT_EQ(storage.latest()->timestamp, BASE + 500);
}

TEST_F(TimeSeriesStorageTest, KeysSortInTimeOrderAcrossZero) {
    EXPECT_LT(TimeSeriesStorage::timestamp_to_key(-60), TimeSeriesStorage::timestamp_to_key(-1));
    EXPECT_LT(TimeSeriesStorage::timestamp_to_key(-1), TimeSeriesStorage::timestamp_to_key(0));
    EXPECT_LT(TimeSeriesStorage::timestamp_to_key(0), TimeSeriesStorage::timestamp_to_key(BASE));
    EXPECT_EQ(TimeSeriesStorage::timestamp_to_key(BASE).size(), 8u);

    const std::string key = TimeSeriesStorage::timestamp_to_key(-3600);
    EXPECT_EQ(TimeSeriesStorage::key_to_timestamp(rocksdb::Slice(key)), -3600);
    EXPECT_FALSE(TimeSeriesStorage::key_to_timestamp(rocksdb::Slice("short")).has_value());

    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));
    storage.insert(EnergyReading(30, 1.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(-30, 1.0, 0.0, 0.0, 0.0));

    auto readings = storage.range_query(-60, 60);
    ASSERT_EQ(readings.size(), 2u);
    EXPECT_EQ(readings[0].timestamp, -30);
    EXPECT_EQ(readings[1].timestamp, 30);
}

TEST_F(TimeSeriesStorageTest, UpsertBucketReplacesAndRangeIsHalfOpen) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    storage.upsert_bucket(make_bucket(BASE, 0.5));
    storage.upsert_bucket(make_bucket(BASE + 60, 0.25));
    storage.upsert_bucket(make_bucket(BASE + 120, 0.125));
    storage.upsert_bucket(make_bucket(BASE, 0.75));

    auto buckets = storage.range_buckets(BASE, BASE + 120);

    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[0].bucket_start, BASE);
    EXPECT_DOUBLE_EQ(buckets[0].home_kwh, 0.75);
    EXPECT_EQ(buckets[0].readings_count, 6u);
    EXPECT_EQ(buckets[0].last_reading().timestamp, BASE + 50);
    EXPECT_DOUBLE_EQ(buckets[0].last_reading().home, 200.0);
    EXPECT_EQ(buckets[1].bucket_start, BASE + 60);

    EXPECT_EQ(storage.latest_bucket_timestamp(), BASE + 120);
    EXPECT_TRUE(storage.range_buckets(BASE + 60, BASE + 60).empty());
}

TEST_F(TimeSeriesStorageTest, RollupsSumMinuteBucketsPerWindow) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    EXPECT_TRUE(storage.hourly_rollup(BASE, BASE + SECONDS_PER_HOUR).empty());

    storage.upsert_bucket(make_bucket(BASE, 0.5));
    storage.upsert_bucket(make_bucket(BASE + 60, 0.25));
    storage.upsert_bucket(make_bucket(BASE + SECONDS_PER_HOUR, 1.0));
    storage.rebuild_rollups(BASE, BASE + 2 * SECONDS_PER_HOUR);

    auto hourly = storage.hourly_rollup(BASE, BASE + 2 * SECONDS_PER_HOUR);
    ASSERT_EQ(hourly.size(), 2u);
    EXPECT_EQ(hourly[0].bucket_start, BASE);
    EXPECT_EQ(hourly[0].bucket_end, BASE + SECONDS_PER_HOUR);
    EXPECT_DOUBLE_EQ(hourly[0].home_kwh, 0.75);
    EXPECT_EQ(hourly[0].readings_count, 12u);
    EXPECT_EQ(hourly[0].first_timestamp, BASE);
    EXPECT_EQ(hourly[0].last_timestamp, BASE + 110);
    EXPECT_DOUBLE_EQ(hourly[1].home_kwh, 1.0);

    // BASE is 22:00, both hours belong to Nov 14
    auto daily = storage.daily_rollup(BASE, BASE + 2 * SECONDS_PER_HOUR);
    ASSERT_EQ(daily.size(), 1u);
    EXPECT_EQ(daily[0].bucket_start, BASE - 22 * SECONDS_PER_HOUR);
    EXPECT_DOUBLE_EQ(daily[0].home_kwh, 1.75);

    // A window whose overlapping query starts mid-hour is still returned
    EXPECT_EQ(storage.hourly_rollup(BASE + 1800, BASE + 1801).size(), 1u);
}

TEST_F(TimeSeriesStorageTest, DailyRollupsAreKeyedByLocalMidnight) {
    test_support::use_time_zone("America/New_York");
    const int64_t short_day = 1710046800;  // 2024-03-10 00:00 EST, 23 hours long
    const int64_t next_day = 1710129600;   // 2024-03-11 00:00 EDT

    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    storage.upsert_bucket(make_bucket(short_day, 0.5));
    storage.upsert_bucket(make_bucket(next_day - SECONDS_PER_MINUTE, 0.25));
    storage.upsert_bucket(make_bucket(next_day, 1.0));
    storage.rebuild_rollups(short_day, next_day + SECONDS_PER_HOUR);

    auto daily = storage.daily_rollup(short_day, next_day + SECONDS_PER_HOUR);
    ASSERT_EQ(daily.size(), 2u);
    EXPECT_EQ(daily[0].bucket_start, short_day);
    EXPECT_EQ(daily[0].bucket_end, next_day);
    EXPECT_DOUBLE_EQ(daily[0].home_kwh, 0.75);
    EXPECT_EQ(daily[1].bucket_start, next_day);
    EXPECT_DOUBLE_EQ(daily[1].home_kwh, 1.0);

    // Hourly rollups stay on whole UTC hours
    auto hourly = storage.hourly_rollup(next_day - SECONDS_PER_HOUR, next_day + SECONDS_PER_HOUR);
    ASSERT_EQ(hourly.size(), 2u);
    EXPECT_EQ(hourly[0].bucket_start, next_day - SECONDS_PER_HOUR);
}

TEST_F(TimeSeriesStorageTest, RebuildWritesOnlyWindowsWithBuckets) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    storage.upsert_bucket(make_bucket(BASE + SECONDS_PER_HOUR, 1.0));
    storage.rebuild_rollups(BASE, BASE + 2 * SECONDS_PER_HOUR);

    auto hourly = storage.hourly_rollup(BASE, BASE + 2 * SECONDS_PER_HOUR);
    ASSERT_EQ(hourly.size(), 1u);
    EXPECT_EQ(hourly[0].bucket_start, BASE + SECONDS_PER_HOUR);

    // Rebuilding an overlapping range later picks up new buckets
    storage.upsert_bucket(make_bucket(BASE, 0.5));
    storage.rebuild_rollups(BASE, BASE + SECONDS_PER_HOUR);

    hourly = storage.hourly_rollup(BASE, BASE + 2 * SECONDS_PER_HOUR);
    ASSERT_EQ(hourly.size(), 2u);
    EXPECT_DOUBLE_EQ(hourly[0].home_kwh, 0.5);
    EXPECT_DOUBLE_EQ(hourly[1].home_kwh, 1.0);

    // An empty range is a no-op
    EXPECT_NO_THROW(storage.rebuild_rollups(BASE, BASE));
}

TEST_F(TimeSeriesStorageTest, CheckpointCompareAndSet) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    EXPECT_FALSE(storage.load_checkpoint().has_value());

    AggregationCheckpoint checkpoint;
    checkpoint.last_processed_timestamp = BASE;
    checkpoint.last_run_at = BASE + 5;
    checkpoint.status = JobStatus::RUNNING;

    ASSERT_TRUE(storage.compare_and_set_checkpoint(std::nullopt, checkpoint));
    auto stored = storage.load_checkpoint();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->generation, 1u);
    EXPECT_EQ(stored->last_processed_timestamp, BASE);
    EXPECT_EQ(stored->last_run_at, BASE + 5);
    EXPECT_EQ(stored->status, JobStatus::RUNNING);

    // Creating again or writing with a stale generation is refused
    EXPECT_FALSE(storage.compare_and_set_checkpoint(std::nullopt, checkpoint));
    EXPECT_FALSE(storage.compare_and_set_checkpoint(uint64_t{7}, checkpoint));

    checkpoint.last_processed_timestamp = BASE + 60;
    checkpoint.status = JobStatus::COMPLETED;
    ASSERT_TRUE(storage.compare_and_set_checkpoint(uint64_t{1}, checkpoint));

    stored = storage.load_checkpoint();
    EXPECT_EQ(stored->generation, 2u);
    EXPECT_EQ(stored->last_processed_timestamp, BASE + 60);
    EXPECT_EQ(stored->status, JobStatus::COMPLETED);
}

TEST_F(TimeSeriesStorageTest, DatabaseInfoSummarizesContents) {
    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    auto empty = storage.get_database_info();
    EXPECT_EQ(empty.database_path, test_db_path_.string());
    EXPECT_TRUE(empty.is_healthy);
    EXPECT_FALSE(empty.earliest_reading.has_value());
    EXPECT_FALSE(empty.latest_bucket.has_value());

    storage.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0));
    storage.insert(EnergyReading(BASE + 90, 1.0, 0.0, 0.0, 0.0));
    storage.upsert_bucket(make_bucket(BASE, 0.5));

    auto info = storage.get_database_info();
    EXPECT_EQ(info.earliest_reading, BASE);
    EXPECT_EQ(info.latest_reading, BASE + 90);
    EXPECT_EQ(info.latest_bucket, BASE);
}

TEST_F(TimeSeriesStorageTest, ReadOnlyOpenReadsButRefusesWrites) {
    {
        TimeSeriesStorage writer;
        ASSERT_TRUE(writer.initialize(test_db_path_.string()));
        writer.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0));
        writer.insert(EnergyReading(BASE + 10, 2.0, 0.0, 0.0, 0.0));
    }

    TimeSeriesStorage reader;
    ASSERT_TRUE(reader.initialize(test_db_path_.string(), true, 8, true));

    EXPECT_EQ(reader.range_query(BASE, BASE + 10).size(), 2u);
    EXPECT_FALSE(reader.insert(EnergyReading(BASE + 20, 3.0, 0.0, 0.0, 0.0)));
    EXPECT_THROW(reader.upsert_bucket(make_bucket(BASE, 0.5)), StorageError);
}

TEST_F(TimeSeriesStorageTest, ReadOnlyOpenOfMissingDatabaseFails) {
    TimeSeriesStorage storage;

    EXPECT_FALSE(storage.initialize((test_db_path_ / "missing").string(), true, 8, true));
    EXPECT_FALSE(storage.is_healthy());
}

TEST_F(TimeSeriesStorageTest, CorruptReadingIsReportedNotSkipped) {
    {
        TimeSeriesStorage writer;
        ASSERT_TRUE(writer.initialize(test_db_path_.string()));
        writer.insert(EnergyReading(BASE, 1.0, 0.0, 0.0, 0.0));
        writer.insert(EnergyReading(BASE + 20, 3.0, 0.0, 0.0, 0.0));
    }
    write_raw_record("default", BASE + 10, garbage_);

    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    EXPECT_THROW(storage.range_query(BASE, BASE + 20), StorageError);
    EXPECT_THROW(storage.before(BASE + 20), StorageError);
    EXPECT_THROW(storage.after(BASE), StorageError);

    // Readings on either side of the damaged one still decode
    EXPECT_EQ(storage.range_query(BASE + 20, BASE + 20).size(), 1u);
    ASSERT_TRUE(storage.before(BASE + 10).has_value());
    EXPECT_EQ(storage.before(BASE + 10)->timestamp, BASE);
}

TEST_F(TimeSeriesStorageTest, CorruptBucketAndRollupAreReported) {
    {
        TimeSeriesStorage writer;
        ASSERT_TRUE(writer.initialize(test_db_path_.string()));
        writer.upsert_bucket(make_bucket(BASE, 0.5));
        writer.rebuild_rollups(BASE, BASE + SECONDS_PER_HOUR);
    }
    write_raw_record("buckets", BASE + 60, garbage_);
    write_raw_record("hourly_rollups", BASE, garbage_);

    TimeSeriesStorage storage;
    ASSERT_TRUE(storage.initialize(test_db_path_.string()));

    EXPECT_THROW(storage.range_buckets(BASE, BASE + 120), StorageError);
    EXPECT_EQ(storage.range_buckets(BASE, BASE + 60).size(), 1u);
    EXPECT_THROW(storage.hourly_rollup(BASE, BASE + SECONDS_PER_HOUR), StorageError);
    EXPECT_EQ(storage.daily_rollup(BASE, BASE + SECONDS_PER_HOUR).size(), 1u);
}

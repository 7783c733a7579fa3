#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include "energy_store.hpp"
#include "performance_cache.hpp"

namespace energy_rollup {

/**
 * Time-series storage engine using RocksDB backend.
 * Raw readings, minute buckets, rollups and the job checkpoint share one
 * database, one column family each, all keyed by timestamp.
 */
class TimeSeriesStorage : public ReadingSource, public BucketStore {
public:
    /**
     * Database summary for the status command
     */
    struct DatabaseInfo {
        std::string database_path;
        uint64_t estimated_readings = 0;
        uint64_t estimated_buckets = 0;
        uint64_t database_size_bytes = 0;
        std::optional<int64_t> earliest_reading;
        std::optional<int64_t> latest_reading;
        std::optional<int64_t> latest_bucket;
        bool is_healthy = false;
    };

    TimeSeriesStorage() = default;

    /**
     * Destructor - releases column family handles before closing the database
     */
    ~TimeSeriesStorage() override;

    TimeSeriesStorage(const TimeSeriesStorage&) = delete;
    TimeSeriesStorage& operator=(const TimeSeriesStorage&) = delete;

    /**
     * Open (or create) the database in the specified directory
     * @param data_directory Path to directory where database files will be stored
     * @param compression_enabled Compress SST files with Snappy
     * @param block_cache_mb Size of the shared block cache
     * @param read_only Open an existing database without taking the write lock,
     *        so it can be inspected while the daemon is running
     * @return true if initialization successful, false otherwise
     */
    bool initialize(const std::string& data_directory,
                    bool compression_enabled = true,
                    size_t block_cache_mb = 8,
                    bool read_only = false);

    // ReadingSource
    bool insert(const EnergyReading& reading) override;
    std::vector<EnergyReading> range_query(int64_t from, int64_t to) const override;
    std::optional<EnergyReading> before(int64_t timestamp) const override;
    std::optional<EnergyReading> after(int64_t timestamp) const override;
    std::optional<EnergyReading> earliest() const override;
    std::optional<EnergyReading> latest() const override;

    // BucketStore
    std::vector<EnergyBucket> range_buckets(int64_t from, int64_t to) const override;
    std::optional<EnergyReading> first_reading_before(int64_t timestamp) const override;
    std::optional<EnergyReading> first_reading_after(int64_t timestamp) const override;
    std::optional<int64_t> latest_bucket_timestamp() const override;
    std::vector<EnergyBucket> hourly_rollup(int64_t from, int64_t to) const override;
    std::vector<EnergyBucket> daily_rollup(int64_t from, int64_t to) const override;
    void upsert_bucket(const EnergyBucket& bucket) override;
    void rebuild_rollups(int64_t from, int64_t to) override;
    std::optional<AggregationCheckpoint> load_checkpoint() const override;
    bool compare_and_set_checkpoint(std::optional<uint64_t> expected_generation,
                                    const AggregationCheckpoint& checkpoint) override;

    /**
     * Check if the storage engine is healthy and operational
     * @return true if healthy, false if there are issues
     */
    bool is_healthy() const;

    /**
     * Get the current database size in bytes
     * @return Database size in bytes, or 0 if unable to determine
     */
    uint64_t get_database_size() const;

    /**
     * Get RocksDB internal statistics
     */
    std::string get_statistics() const;

    DatabaseInfo get_database_info() const;

    QueryPerformanceMonitor::QueryMetrics get_performance_metrics() const;

    /**
     * Encode a timestamp as an 8-byte key that sorts in time order,
     * negative timestamps included
     */
    static std::string timestamp_to_key(int64_t timestamp);
    static std::optional<int64_t> key_to_timestamp(const rocksdb::Slice& key);

private:
    enum ColumnFamily : size_t {
        READINGS = 0,
        BUCKETS,
        HOURLY_ROLLUPS,
        DAILY_ROLLUPS,
        JOB_STATE,
        COLUMN_FAMILY_COUNT
    };

    std::unique_ptr<rocksdb::DB> db_;
    std::vector<rocksdb::ColumnFamilyHandle*> handles_;
    std::string data_directory_;
    mutable QueryPerformanceMonitor performance_monitor_;
    std::mutex checkpoint_mutex_;

    static const char* const CHECKPOINT_KEY;
    static constexpr uint64_t MIN_FREE_SPACE_BYTES = 100 * 1024 * 1024;

    rocksdb::Options get_db_options(bool compression_enabled, size_t block_cache_mb) const;

    std::vector<rocksdb::ColumnFamilyDescriptor> get_column_families(
        const rocksdb::Options& options) const;

    rocksdb::ColumnFamilyHandle* handle(ColumnFamily family) const;

    std::unique_ptr<rocksdb::Iterator> create_iterator(ColumnFamily family) const;

    /**
     * Scan keys in [from_key, to_key) or [from_key, to_key] of one column family
     * @throws StorageError if the iterator reports an error
     */
    std::vector<std::string> scan_values(ColumnFamily family, int64_t from, int64_t to,
                                         bool inclusive_end, const std::string& operation) const;

    /**
     * Read the first or last value of a column family
     */
    std::optional<std::string> edge_value(ColumnFamily family, bool last,
                                          std::optional<int64_t>* timestamp,
                                          const std::string& operation) const;

    std::vector<EnergyBucket> rollup_range(ColumnFamily family, Granularity granularity,
                                           int64_t from, int64_t to) const;

    std::optional<AggregationCheckpoint> read_checkpoint() const;

    /**
     * Decode a stored record
     * @throws StorageError if the bytes do not parse
     */
    EnergyReading decode_reading(const std::string& value, const std::string& operation) const;
    EnergyBucket decode_bucket(const std::string& value, const std::string& operation) const;

    bool check_disk_space() const;

    void log_storage_error(const std::string& operation, const rocksdb::Status& status) const;

    [[noreturn]] void throw_storage_error(const std::string& operation,
                                          const rocksdb::Status& status) const;
};

} // namespace energy_rollup

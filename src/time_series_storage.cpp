#include "time_series_storage.hpp"
#include <filesystem>
#include <cstring>
#include <endian.h>
#include <sys/statvfs.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/cache.h>
#include <rocksdb/write_batch.h>
#include "energy_integrator.hpp"
#include "logging_system.hpp"

namespace energy_rollup {

namespace {

// Flips the sign bit so negative timestamps sort before positive ones
constexpr uint64_t KEY_SIGN_OFFSET = 0x8000000000000000ULL;

const char* const COLUMN_FAMILY_NAMES[] = {
    "default",
    "buckets",
    "hourly_rollups",
    "daily_rollups",
    "job_state"
};

} // namespace

const char* const TimeSeriesStorage::CHECKPOINT_KEY = "checkpoint";

TimeSeriesStorage::~TimeSeriesStorage() {
    if (!db_) {
        return;
    }

    for (auto* column_family : handles_) {
        rocksdb::Status status = db_->DestroyColumnFamilyHandle(column_family);
        if (!status.ok()) {
            log_storage_error("releasing column family handle", status);
        }
    }
    handles_.clear();
    db_.reset();
}

bool TimeSeriesStorage::initialize(const std::string& data_directory,
                                   bool compression_enabled,
                                   size_t block_cache_mb,
                                   bool read_only) {
    data_directory_ = data_directory;

    if (!read_only) {
        try {
            std::filesystem::create_directories(data_directory);
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_ERROR("Failed to create data directory", {
                {"path", data_directory},
                {"error", e.what()}
            });
            return false;
        }

        if (!check_disk_space()) {
            LOG_ERROR("Insufficient disk space", {{"path", data_directory}});
            return false;
        }
    }

    rocksdb::Options options = get_db_options(compression_enabled, block_cache_mb);
    auto descriptors = get_column_families(options);

    rocksdb::DB* db_ptr = nullptr;
    std::vector<rocksdb::ColumnFamilyHandle*> handles;

    rocksdb::Status status;
    if (read_only) {
        status = rocksdb::DB::OpenForReadOnly(
            rocksdb::DBOptions(options), data_directory, descriptors, &handles, &db_ptr);
    } else {
        status = rocksdb::DB::Open(
            rocksdb::DBOptions(options), data_directory, descriptors, &handles, &db_ptr);
    }

    if (!status.ok()) {
        log_storage_error("database initialization", status);
        return false;
    }

    db_.reset(db_ptr);
    handles_ = std::move(handles);

    LOG_INFO("TimeSeriesStorage initialized", {
        {"path", data_directory},
        {"column_families", std::to_string(handles_.size())},
        {"compression", compression_enabled ? "true" : "false"},
        {"read_only", read_only ? "true" : "false"},
        {"block_cache_mb", std::to_string(block_cache_mb)}
    });

    return true;
}

bool TimeSeriesStorage::insert(const EnergyReading& reading) {
    if (!db_) {
        LOG_ERROR("Storage engine not initialized");
        return false;
    }

    if (!check_disk_space()) {
        LOG_ERROR("Insufficient disk space for storing reading", {{"path", data_directory_}});
        return false;
    }

    std::string value = EnergyDataConverter::serialize(reading);
    if (value.empty()) {
        LOG_ERROR("Failed to serialize reading", {{"timestamp", std::to_string(reading.timestamp)}});
        return false;
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = false;
    write_options.disableWAL = false;

    rocksdb::Status status = db_->Put(write_options, handle(READINGS),
                                      timestamp_to_key(reading.timestamp), value);
    if (!status.ok()) {
        log_storage_error("storing reading", status);
        return false;
    }

    return true;
}

std::vector<EnergyReading> TimeSeriesStorage::range_query(int64_t from, int64_t to) const {
    if (from > to) {
        return {};
    }

    auto values = scan_values(READINGS, from, to, true, "range_query");

    std::vector<EnergyReading> readings;
    readings.reserve(values.size());
    for (const auto& value : values) {
        readings.push_back(decode_reading(value, "range_query"));
    }

    return readings;
}

std::optional<EnergyReading> TimeSeriesStorage::before(int64_t timestamp) const {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    auto timer = performance_monitor_.start_query("before");
    auto iterator = create_iterator(READINGS);
    const std::string key = timestamp_to_key(timestamp);

    iterator->SeekForPrev(key);
    if (iterator->Valid() && iterator->key().compare(key) == 0) {
        iterator->Prev();
    }

    if (!iterator->status().ok()) {
        timer.mark_failed();
        throw_storage_error("before", iterator->status());
    }

    if (!iterator->Valid()) {
        return std::nullopt;
    }

    return decode_reading(iterator->value().ToString(), "before");
}

std::optional<EnergyReading> TimeSeriesStorage::after(int64_t timestamp) const {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    auto timer = performance_monitor_.start_query("after");
    auto iterator = create_iterator(READINGS);
    const std::string key = timestamp_to_key(timestamp);

    iterator->Seek(key);
    if (iterator->Valid() && iterator->key().compare(key) == 0) {
        iterator->Next();
    }

    if (!iterator->status().ok()) {
        timer.mark_failed();
        throw_storage_error("after", iterator->status());
    }

    if (!iterator->Valid()) {
        return std::nullopt;
    }

    return decode_reading(iterator->value().ToString(), "after");
}

std::optional<EnergyReading> TimeSeriesStorage::earliest() const {
    auto value = edge_value(READINGS, false, nullptr, "earliest");
    if (!value.has_value()) {
        return std::nullopt;
    }
    return decode_reading(value.value(), "earliest");
}

std::optional<EnergyReading> TimeSeriesStorage::latest() const {
    auto value = edge_value(READINGS, true, nullptr, "latest");
    if (!value.has_value()) {
        return std::nullopt;
    }
    return decode_reading(value.value(), "latest");
}

std::vector<EnergyBucket> TimeSeriesStorage::range_buckets(int64_t from, int64_t to) const {
    if (from >= to) {
        return {};
    }

    auto values = scan_values(BUCKETS, from, to, false, "range_buckets");

    std::vector<EnergyBucket> buckets;
    buckets.reserve(values.size());
    for (const auto& value : values) {
        buckets.push_back(decode_bucket(value, "range_buckets"));
    }

    return buckets;
}

std::optional<EnergyReading> TimeSeriesStorage::first_reading_before(int64_t timestamp) const {
    return before(timestamp);
}

std::optional<EnergyReading> TimeSeriesStorage::first_reading_after(int64_t timestamp) const {
    return after(timestamp);
}

std::optional<int64_t> TimeSeriesStorage::latest_bucket_timestamp() const {
    std::optional<int64_t> timestamp;
    edge_value(BUCKETS, true, &timestamp, "latest_bucket_timestamp");
    return timestamp;
}

std::vector<EnergyBucket> TimeSeriesStorage::hourly_rollup(int64_t from, int64_t to) const {
    return rollup_range(HOURLY_ROLLUPS, Granularity::HOUR, from, to);
}

std::vector<EnergyBucket> TimeSeriesStorage::daily_rollup(int64_t from, int64_t to) const {
    return rollup_range(DAILY_ROLLUPS, Granularity::DAY, from, to);
}

void TimeSeriesStorage::upsert_bucket(const EnergyBucket& bucket) {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    std::string value = EnergyDataConverter::serialize(bucket);
    if (value.empty()) {
        throw StorageError("Failed to serialize bucket " + std::to_string(bucket.bucket_start));
    }

    // A single Put is an atomic insert-or-replace
    rocksdb::Status status = db_->Put(rocksdb::WriteOptions(), handle(BUCKETS),
                                      timestamp_to_key(bucket.bucket_start), value);
    if (!status.ok()) {
        throw_storage_error("upserting bucket", status);
    }

    LoggingSystem::log_bucket_write(bucket.bucket_start, bucket.readings_count);
}

void TimeSeriesStorage::rebuild_rollups(int64_t from, int64_t to) {
    if (from >= to) {
        return;
    }
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    auto timer = performance_monitor_.start_query("rebuild_rollups");

    rocksdb::WriteBatch batch;
    size_t windows_written = 0;
    size_t windows_cleared = 0;

    const std::pair<Granularity, ColumnFamily> targets[] = {
        {Granularity::HOUR, HOURLY_ROLLUPS},
        {Granularity::DAY, DAILY_ROLLUPS}
    };

    for (const auto& [granularity, family] : targets) {
        int64_t window = EnergyIntegrator::window_start(from, granularity);
        while (window < to) {
            int64_t next = EnergyIntegrator::next_window_start(window, granularity);
            auto buckets = range_buckets(window, next);
            std::string key = timestamp_to_key(window);

            rocksdb::Status status;
            if (buckets.empty()) {
                status = batch.Delete(handle(family), key);
                ++windows_cleared;
            } else {
                status = batch.Put(handle(family), key,
                                   EnergyDataConverter::serialize(merge_buckets(window, next, buckets)));
                ++windows_written;
            }
            if (!status.ok()) {
                timer.mark_failed();
                throw_storage_error("building rollup batch", status);
            }

            window = next;
        }
    }

    rocksdb::Status status = db_->Write(rocksdb::WriteOptions(), &batch);
    if (!status.ok()) {
        timer.mark_failed();
        throw_storage_error("writing rollups", status);
    }

    LOG_DEBUG("Rollups rebuilt", {
        {"from", std::to_string(from)},
        {"to", std::to_string(to)},
        {"windows_written", std::to_string(windows_written)},
        {"windows_cleared", std::to_string(windows_cleared)}
    });
}

std::optional<AggregationCheckpoint> TimeSeriesStorage::load_checkpoint() const {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }
    return read_checkpoint();
}

bool TimeSeriesStorage::compare_and_set_checkpoint(std::optional<uint64_t> expected_generation,
                                                   const AggregationCheckpoint& checkpoint) {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    std::lock_guard<std::mutex> lock(checkpoint_mutex_);

    auto current = read_checkpoint();
    std::optional<uint64_t> current_generation;
    if (current.has_value()) {
        current_generation = current->generation;
    }

    if (current_generation != expected_generation) {
        LOG_WARN("Checkpoint generation mismatch", {
            {"expected", expected_generation ? std::to_string(*expected_generation) : "none"},
            {"stored", current_generation ? std::to_string(*current_generation) : "none"}
        });
        return false;
    }

    AggregationCheckpoint stored = checkpoint;
    stored.generation = expected_generation ? *expected_generation + 1 : 1;

    std::string value = EnergyDataConverter::serialize(stored);
    if (value.empty()) {
        throw StorageError("Failed to serialize checkpoint");
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = true;

    rocksdb::Status status = db_->Put(write_options, handle(JOB_STATE), CHECKPOINT_KEY, value);
    if (!status.ok()) {
        throw_storage_error("writing checkpoint", status);
    }

    return true;
}

bool TimeSeriesStorage::is_healthy() const {
    if (!db_) {
        return false;
    }

    // A missing key still proves the database answers reads
    std::string value;
    rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), handle(JOB_STATE), "health_check", &value);
    return status.ok() || status.IsNotFound();
}

uint64_t TimeSeriesStorage::get_database_size() const {
    if (!db_) {
        return 0;
    }

    try {
        uint64_t total_size = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(data_directory_)) {
            if (entry.is_regular_file()) {
                total_size += entry.file_size();
            }
        }
        return total_size;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_WARN("Unable to compute database size", {{"error", e.what()}});
        return 0;
    }
}

std::string TimeSeriesStorage::get_statistics() const {
    if (!db_) {
        return "Database not initialized";
    }

    std::string stats;
    if (!db_->GetProperty("rocksdb.stats", &stats)) {
        return "Unable to retrieve statistics";
    }

    return stats;
}

TimeSeriesStorage::DatabaseInfo TimeSeriesStorage::get_database_info() const {
    DatabaseInfo info;
    info.database_path = data_directory_;
    info.is_healthy = is_healthy();
    info.database_size_bytes = get_database_size();

    if (!db_) {
        return info;
    }

    std::string count_str;
    if (db_->GetProperty(handle(READINGS), "rocksdb.estimate-num-keys", &count_str)) {
        info.estimated_readings = std::stoull(count_str);
    }
    if (db_->GetProperty(handle(BUCKETS), "rocksdb.estimate-num-keys", &count_str)) {
        info.estimated_buckets = std::stoull(count_str);
    }

    try {
        edge_value(READINGS, false, &info.earliest_reading, "database_info");
        edge_value(READINGS, true, &info.latest_reading, "database_info");
        edge_value(BUCKETS, true, &info.latest_bucket, "database_info");
    } catch (const StorageError& e) {
        LOG_WARN("Incomplete database info", {{"error", e.what()}});
        info.is_healthy = false;
    }

    return info;
}

QueryPerformanceMonitor::QueryMetrics TimeSeriesStorage::get_performance_metrics() const {
    return performance_monitor_.get_overall_metrics();
}

std::string TimeSeriesStorage::timestamp_to_key(int64_t timestamp) {
    uint64_t ordered = static_cast<uint64_t>(timestamp) ^ KEY_SIGN_OFFSET;

    // Big-endian for lexicographic ordering
    uint64_t big_endian = htobe64(ordered);

    std::string key(8, '\0');
    std::memcpy(key.data(), &big_endian, 8);
    return key;
}

std::optional<int64_t> TimeSeriesStorage::key_to_timestamp(const rocksdb::Slice& key) {
    if (key.size() != 8) {
        return std::nullopt;
    }

    uint64_t big_endian;
    std::memcpy(&big_endian, key.data(), 8);

    return static_cast<int64_t>(be64toh(big_endian) ^ KEY_SIGN_OFFSET);
}

rocksdb::Options TimeSeriesStorage::get_db_options(bool compression_enabled, size_t block_cache_mb) const {
    rocksdb::Options options;

    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.error_if_exists = false;

    // Memory management - keep it lightweight
    options.write_buffer_size = 4 * 1024 * 1024;
    options.max_write_buffer_number = 2;
    options.target_file_size_base = 8 * 1024 * 1024;

    options.compression = compression_enabled ? rocksdb::kSnappyCompression
                                              : rocksdb::kNoCompression;

    // Mostly sequential appends
    options.level0_file_num_compaction_trigger = 4;
    options.level0_slowdown_writes_trigger = 8;
    options.level0_stop_writes_trigger = 12;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_size = 4 * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.pin_l0_filter_and_index_blocks_in_cache = true;
    table_options.block_cache = rocksdb::NewLRUCache(block_cache_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));

    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    options.info_log_level = rocksdb::WARN_LEVEL;

    return options;
}

std::vector<rocksdb::ColumnFamilyDescriptor> TimeSeriesStorage::get_column_families(
    const rocksdb::Options& options) const {

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(COLUMN_FAMILY_COUNT);
    for (size_t i = 0; i < COLUMN_FAMILY_COUNT; ++i) {
        descriptors.emplace_back(COLUMN_FAMILY_NAMES[i], rocksdb::ColumnFamilyOptions(options));
    }
    return descriptors;
}

rocksdb::ColumnFamilyHandle* TimeSeriesStorage::handle(ColumnFamily family) const {
    return handles_.at(family);
}

std::unique_ptr<rocksdb::Iterator> TimeSeriesStorage::create_iterator(ColumnFamily family) const {
    rocksdb::ReadOptions read_options;
    read_options.total_order_seek = true;
    read_options.fill_cache = true;

    return std::unique_ptr<rocksdb::Iterator>(db_->NewIterator(read_options, handle(family)));
}

std::vector<std::string> TimeSeriesStorage::scan_values(ColumnFamily family, int64_t from, int64_t to,
                                                        bool inclusive_end,
                                                        const std::string& operation) const {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    auto timer = performance_monitor_.start_query(operation);
    auto iterator = create_iterator(family);

    const std::string end_key = timestamp_to_key(to);
    std::vector<std::string> values;

    for (iterator->Seek(timestamp_to_key(from)); iterator->Valid(); iterator->Next()) {
        int cmp = iterator->key().compare(end_key);
        if (cmp > 0 || (cmp == 0 && !inclusive_end)) {
            break;
        }
        values.push_back(iterator->value().ToString());
    }

    if (!iterator->status().ok()) {
        timer.mark_failed();
        throw_storage_error(operation, iterator->status());
    }

    return values;
}

std::optional<std::string> TimeSeriesStorage::edge_value(ColumnFamily family, bool last,
                                                         std::optional<int64_t>* timestamp,
                                                         const std::string& operation) const {
    if (!db_) {
        throw StorageError("Storage engine not initialized");
    }

    auto iterator = create_iterator(family);
    if (last) {
        iterator->SeekToLast();
    } else {
        iterator->SeekToFirst();
    }

    if (!iterator->status().ok()) {
        throw_storage_error(operation, iterator->status());
    }

    if (!iterator->Valid()) {
        return std::nullopt;
    }

    if (timestamp != nullptr) {
        *timestamp = key_to_timestamp(iterator->key());
    }
    return iterator->value().ToString();
}

std::vector<EnergyBucket> TimeSeriesStorage::rollup_range(ColumnFamily family, Granularity granularity,
                                                          int64_t from, int64_t to) const {
    if (from >= to) {
        return {};
    }

    // Start at the window containing `from` so partially overlapping windows are included
    int64_t first_window = EnergyIntegrator::window_start(from, granularity);
    const std::string operation = granularity == Granularity::HOUR ? "hourly_rollup" : "daily_rollup";
    auto values = scan_values(family, first_window, to, false, operation);

    std::vector<EnergyBucket> rollups;
    rollups.reserve(values.size());
    for (const auto& value : values) {
        rollups.push_back(decode_bucket(value, operation));
    }
    return rollups;
}

std::optional<AggregationCheckpoint> TimeSeriesStorage::read_checkpoint() const {
    std::string value;
    rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), handle(JOB_STATE), CHECKPOINT_KEY, &value);

    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw_storage_error("reading checkpoint", status);
    }

    auto checkpoint = EnergyDataConverter::deserialize_checkpoint(value);
    if (!checkpoint.has_value()) {
        throw_storage_error("reading checkpoint", rocksdb::Status::Corruption("undecodable checkpoint record"));
    }
    return checkpoint;
}

EnergyReading TimeSeriesStorage::decode_reading(const std::string& value,
                                                const std::string& operation) const {
    auto reading = EnergyDataConverter::deserialize_reading(value);
    if (!reading.has_value()) {
        throw_storage_error(operation, rocksdb::Status::Corruption("undecodable reading record"));
    }
    return std::move(reading.value());
}

EnergyBucket TimeSeriesStorage::decode_bucket(const std::string& value,
                                              const std::string& operation) const {
    auto bucket = EnergyDataConverter::deserialize_bucket(value);
    if (!bucket.has_value()) {
        throw_storage_error(operation, rocksdb::Status::Corruption("undecodable bucket record"));
    }
    return std::move(bucket.value());
}

bool TimeSeriesStorage::check_disk_space() const {
    struct statvfs stat;

    if (statvfs(data_directory_.c_str(), &stat) != 0) {
        return true;  // Assume OK if we can't check
    }

    uint64_t available_bytes = static_cast<uint64_t>(stat.f_bavail) * stat.f_frsize;
    return available_bytes > MIN_FREE_SPACE_BYTES;
}

void TimeSeriesStorage::log_storage_error(const std::string& operation,
                                          const rocksdb::Status& status) const {
    ErrorContext context("storage", operation);
    context.add_data("status", status.ToString());

    if (status.IsIOError()) {
        context.add_data("hint", "disk space or permission issue");
    } else if (status.IsCorruption()) {
        context.add_data("hint", "database corruption detected, may need recovery");
    } else if (status.IsNotSupported()) {
        context.add_data("hint", "operation not supported by current RocksDB configuration");
    }

    LoggingSystem::log_storage_error("Storage error during " + operation, context);
}

void TimeSeriesStorage::throw_storage_error(const std::string& operation,
                                            const rocksdb::Status& status) const {
    log_storage_error(operation, status);
    throw StorageError("Storage error during " + operation + ": " + status.ToString());
}

} // namespace energy_rollup

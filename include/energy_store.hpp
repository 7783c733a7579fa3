#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "energy_data.hpp"

namespace energy_rollup {

/**
 * Exception thrown when the storage engine fails to read or write
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Exception thrown when the aggregation checkpoint was changed by another run
 */
class CheckpointConflictError : public std::runtime_error {
public:
    explicit CheckpointConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Append-only store of raw power readings
 */
class ReadingSource {
public:
    virtual ~ReadingSource() = default;

    /**
     * Store a reading. A reading with an existing timestamp replaces it.
     * @return true if the write succeeded (ingestion is best-effort)
     */
    virtual bool insert(const EnergyReading& reading) = 0;

    /**
     * Readings with from <= timestamp <= to, ascending
     * @throws StorageError on read failure
     */
    virtual std::vector<EnergyReading> range_query(int64_t from, int64_t to) const = 0;

    /**
     * Latest reading strictly before the timestamp
     */
    virtual std::optional<EnergyReading> before(int64_t timestamp) const = 0;

    /**
     * Earliest reading strictly after the timestamp
     */
    virtual std::optional<EnergyReading> after(int64_t timestamp) const = 0;

    virtual std::optional<EnergyReading> earliest() const = 0;
    virtual std::optional<EnergyReading> latest() const = 0;
};

/**
 * Persisted one-minute buckets, their hourly/daily rollups and the job checkpoint
 */
class BucketStore {
public:
    virtual ~BucketStore() = default;

    /**
     * Buckets with from <= bucket_start < to, ascending
     * @throws StorageError on read failure
     */
    virtual std::vector<EnergyBucket> range_buckets(int64_t from, int64_t to) const = 0;

    /**
     * Boundary anchors for partial-minute integration
     */
    virtual std::optional<EnergyReading> first_reading_before(int64_t timestamp) const = 0;
    virtual std::optional<EnergyReading> first_reading_after(int64_t timestamp) const = 0;

    virtual std::optional<int64_t> latest_bucket_timestamp() const = 0;

    /**
     * Derived rollups overlapping [from, to). Empty when not built yet.
     */
    virtual std::vector<EnergyBucket> hourly_rollup(int64_t from, int64_t to) const = 0;
    virtual std::vector<EnergyBucket> daily_rollup(int64_t from, int64_t to) const = 0;

    /**
     * Insert or replace the bucket keyed by bucket_start, atomically
     * @throws StorageError on write failure
     */
    virtual void upsert_bucket(const EnergyBucket& bucket) = 0;

    /**
     * Recompute every hourly and daily rollup window overlapping [from, to)
     * @throws StorageError on write failure
     */
    virtual void rebuild_rollups(int64_t from, int64_t to) = 0;

    virtual std::optional<AggregationCheckpoint> load_checkpoint() const = 0;

    /**
     * Write the checkpoint only if the stored generation still matches.
     * The stored record gets generation = expected + 1 (or 1 when created).
     * @param expected_generation Generation read by the caller, nullopt if none existed
     * @param checkpoint New checkpoint contents
     * @return false if another writer got there first
     * @throws StorageError on write failure
     */
    virtual bool compare_and_set_checkpoint(std::optional<uint64_t> expected_generation,
                                            const AggregationCheckpoint& checkpoint) = 0;
};

} // namespace energy_rollup

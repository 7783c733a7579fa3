#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include "energy_data.hpp"
#include "energy_store.hpp"
#include "performance_cache.hpp"

namespace energy_rollup {

// Job tuning for BucketAggregator, defined at namespace scope so it can be
// used as a default argument inside the class
struct BucketAggregatorOptions {
    // Persist progress after this many minutes
    uint32_t checkpoint_every_buckets = 10;
    // Seed distance when no reading exists yet
    int64_t bootstrap_lookback_seconds = SECONDS_PER_DAY;
    // Log backfill progress after this many minutes
    uint32_t backfill_progress_every = 100;
};

/**
 * Incremental minute-bucket rollup job.
 *
 * Each run rolls every complete minute after the checkpoint into a bucket,
 * advances the checkpoint through compare-and-set writes, invalidates cached
 * query results and rebuilds the hourly and daily rollups of the range.
 * A failed rollup rebuild is remembered in the checkpoint (rollups_dirty_from)
 * and retried by every following run until it succeeds.
 */
class BucketAggregator {
public:
    using Clock = std::function<int64_t()>;

    using Options = BucketAggregatorOptions;

    enum class RunStatus {
        COMPLETED,
        SKIPPED
    };

    struct RunOutcome {
        RunStatus status = RunStatus::COMPLETED;
        uint64_t minutes_processed = 0;
        uint64_t buckets_written = 0;
        int64_t checkpoint = 0;
    };

    struct BackfillOutcome {
        int64_t first_bucket = 0;
        int64_t last_bucket = 0;
        uint64_t minutes_processed = 0;
        uint64_t buckets_written = 0;
        uint64_t failed_minutes = 0;
        bool rollups_rebuilt = true;
    };

    struct Statistics {
        uint64_t runs_completed = 0;
        uint64_t runs_failed = 0;
        uint64_t runs_skipped = 0;
        uint64_t buckets_written = 0;
        uint64_t sparse_minutes = 0;
    };

    /**
     * @param readings Raw reading source
     * @param buckets Bucket store holding buckets, rollups and the checkpoint
     * @param cache Query cache to invalidate after a run, may be null
     * @param options Job tuning
     * @param clock Current Unix time in seconds
     */
    BucketAggregator(ReadingSource& readings,
                     BucketStore& buckets,
                     QueryCache* cache,
                     Options options = Options{},
                     Clock clock = &BucketAggregator::system_now);

    BucketAggregator(const BucketAggregator&) = delete;
    BucketAggregator& operator=(const BucketAggregator&) = delete;

    /**
     * Roll the readings of [bucket_start, bucket_start + 60) into one bucket.
     * Minutes with fewer than two readings are skipped. Recomputing an
     * unchanged minute rewrites an identical row.
     * @param bucket_start Minute start, floored if not aligned
     * @return true if a bucket was written
     * @throws StorageError if reading or writing fails
     */
    bool aggregate_minute_bucket(int64_t bucket_start);

    /**
     * Process every complete minute since the checkpoint.
     * Overlapping calls return RunStatus::SKIPPED without touching storage.
     * @throws CheckpointConflictError if another writer moved the checkpoint
     * @throws StorageError on storage failure, after marking the job as errored
     */
    RunOutcome process_latest();

    /**
     * Recompute every minute in [from, to] regardless of the checkpoint.
     * Defaults span the earliest to the latest reading. Failed minutes are
     * logged and skipped.
     * @return nullopt if there is nothing to backfill
     */
    std::optional<BackfillOutcome> backfill(std::optional<int64_t> from = std::nullopt,
                                            std::optional<int64_t> to = std::nullopt);

    Statistics get_statistics() const;

    static int64_t system_now();

    static constexpr const char* CACHE_INVALIDATION_PATTERN = "energy:aggregated:*";

private:
    ReadingSource& readings_;
    BucketStore& buckets_;
    QueryCache* cache_;
    Options options_;
    Clock clock_;

    std::mutex run_mutex_;

    std::atomic<uint64_t> runs_completed_{0};
    std::atomic<uint64_t> runs_failed_{0};
    std::atomic<uint64_t> runs_skipped_{0};
    std::atomic<uint64_t> buckets_written_{0};
    std::atomic<uint64_t> sparse_minutes_{0};

    RunOutcome run_locked(int64_t now);

    AggregationCheckpoint seed_checkpoint(int64_t now, int64_t now_bucket) const;

    /**
     * Compare-and-set the checkpoint and advance the tracked generation
     * @throws CheckpointConflictError on generation mismatch
     */
    void persist_checkpoint(const AggregationCheckpoint& checkpoint,
                            std::optional<uint64_t>& generation);

    void mark_error(AggregationCheckpoint checkpoint, std::optional<uint64_t> generation, int64_t now);

    void invalidate_cache();

    /**
     * Rebuild hourly and daily rollups over [from, to)
     * @return false if the store failed; the failure is logged
     */
    bool refresh_rollups(int64_t from, int64_t to);

    /**
     * Persist a change of rollups_dirty_from after the run completed.
     * A failed write is logged and the run still counts as completed.
     */
    void record_rollup_state(const AggregationCheckpoint& checkpoint,
                             std::optional<uint64_t>& generation);
};

} // namespace energy_rollup

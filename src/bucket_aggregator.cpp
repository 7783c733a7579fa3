#include "bucket_aggregator.hpp"
#include <algorithm>
#include <chrono>
#include "energy_integrator.hpp"
#include "logging_system.hpp"

namespace energy_rollup {

BucketAggregator::BucketAggregator(ReadingSource& readings,
                                   BucketStore& buckets,
                                   QueryCache* cache,
                                   Options options,
                                   Clock clock)
    : readings_(readings),
      buckets_(buckets),
      cache_(cache),
      options_(options),
      clock_(std::move(clock)) {
    if (options_.checkpoint_every_buckets == 0) {
        options_.checkpoint_every_buckets = 1;
    }
    if (options_.backfill_progress_every == 0) {
        options_.backfill_progress_every = 100;
    }
}

int64_t BucketAggregator::system_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool BucketAggregator::aggregate_minute_bucket(int64_t bucket_start) {
    bucket_start = floor_to_minute(bucket_start);
    const int64_t bucket_end = bucket_start + SECONDS_PER_MINUTE;

    // Integer timestamps: [start, end) is [start, end - 1]
    auto readings = readings_.range_query(bucket_start, bucket_end - 1);

    if (readings.size() < 2) {
        sparse_minutes_.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE("Minute skipped, not enough readings", {
            {"bucket_start", std::to_string(bucket_start)},
            {"readings", std::to_string(readings.size())}
        });
        return false;
    }

    std::stable_sort(readings.begin(), readings.end(),
                     [](const EnergyReading& a, const EnergyReading& b) {
                         return a.timestamp < b.timestamp;
                     });

    EnergyBucket bucket;
    bucket.bucket_start = bucket_start;
    bucket.bucket_end = bucket_end;
    bucket.home_kwh = EnergyIntegrator::total_energy(readings, EnergyIntegrator::extractor_for(ChannelType::HOME));
    bucket.grid_kwh = EnergyIntegrator::total_energy(readings, EnergyIntegrator::extractor_for(ChannelType::GRID));
    bucket.car_kwh = EnergyIntegrator::total_energy(readings, EnergyIntegrator::extractor_for(ChannelType::CAR));
    bucket.solar_kwh = EnergyIntegrator::total_energy(readings, EnergyIntegrator::extractor_for(ChannelType::SOLAR));
    bucket.readings_count = static_cast<uint32_t>(readings.size());

    const auto& first = readings.front();
    bucket.first_timestamp = first.timestamp;
    bucket.first_home = first.home;
    bucket.first_grid = first.grid;
    bucket.first_car = first.car;
    bucket.first_solar = first.solar;

    const auto& last = readings.back();
    bucket.last_timestamp = last.timestamp;
    bucket.last_home = last.home;
    bucket.last_grid = last.grid;
    bucket.last_car = last.car;
    bucket.last_solar = last.solar;

    buckets_.upsert_bucket(bucket);
    buckets_written_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

BucketAggregator::RunOutcome BucketAggregator::process_latest() {
    std::unique_lock<std::mutex> lock(run_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        runs_skipped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Aggregation run skipped, previous run still in progress");

        RunOutcome outcome;
        outcome.status = RunStatus::SKIPPED;
        return outcome;
    }

    try {
        RunOutcome outcome = run_locked(clock_());
        runs_completed_.fetch_add(1, std::memory_order_relaxed);
        return outcome;
    } catch (const std::exception&) {
        runs_failed_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

BucketAggregator::RunOutcome BucketAggregator::run_locked(int64_t now) {
    const int64_t now_bucket = floor_to_minute(now);

    std::optional<uint64_t> generation;
    AggregationCheckpoint checkpoint;

    auto stored = buckets_.load_checkpoint();
    if (stored.has_value()) {
        checkpoint = stored.value();
        generation = checkpoint.generation;
    } else {
        checkpoint = seed_checkpoint(now, now_bucket);
        persist_checkpoint(checkpoint, generation);
        LOG_INFO("Aggregation checkpoint seeded", {
            {"last_processed_timestamp", std::to_string(checkpoint.last_processed_timestamp)}
        });
    }

    checkpoint.status = JobStatus::RUNNING;
    checkpoint.last_run_at = now;
    persist_checkpoint(checkpoint, generation);

    // Last state known to be on disk, restored with status=error on failure
    AggregationCheckpoint persisted = checkpoint;

    const int64_t first_bucket = checkpoint.last_processed_timestamp + SECONDS_PER_MINUTE;
    int64_t current = first_bucket;

    RunOutcome outcome;
    LoggingSystem::log_job_started(first_bucket, now_bucket);

    try {
        while (current < now_bucket) {
            if (aggregate_minute_bucket(current)) {
                outcome.buckets_written++;
            }
            current += SECONDS_PER_MINUTE;
            outcome.minutes_processed++;

            if (outcome.minutes_processed % options_.checkpoint_every_buckets == 0) {
                checkpoint.last_processed_timestamp = current - SECONDS_PER_MINUTE;
                persist_checkpoint(checkpoint, generation);
                persisted = checkpoint;
            }
        }

        // With nothing to do the checkpoint stays where it was
        checkpoint.last_processed_timestamp = std::max(checkpoint.last_processed_timestamp,
                                                       current - SECONDS_PER_MINUTE);
        checkpoint.status = JobStatus::COMPLETED;
        checkpoint.last_run_at = now;
        persist_checkpoint(checkpoint, generation);
        persisted = checkpoint;

    } catch (const CheckpointConflictError& e) {
        LoggingSystem::log_job_error(e.what(), ErrorContext("aggregator", "process_latest", "CHECKPOINT_CONFLICT")
            .add_data("last_persisted", std::to_string(persisted.last_processed_timestamp)));
        throw;
    } catch (const std::exception& e) {
        LoggingSystem::log_job_error(e.what(), ErrorContext("aggregator", "process_latest")
            .add_data("failed_bucket", std::to_string(current))
            .add_data("last_persisted", std::to_string(persisted.last_processed_timestamp)));
        if (persisted.last_processed_timestamp >= first_bucket) {
            // Persisted minutes of this run never reach the rollup rebuild below
            persisted.rollups_dirty_from = std::min(persisted.rollups_dirty_from.value_or(first_bucket),
                                                    first_bucket);
        }
        mark_error(persisted, generation, now);
        throw;
    }

    invalidate_cache();

    std::optional<int64_t> rebuild_from = checkpoint.rollups_dirty_from;
    if (outcome.minutes_processed > 0) {
        rebuild_from = std::min(rebuild_from.value_or(first_bucket), first_bucket);
    }

    if (rebuild_from.has_value()) {
        const bool rebuilt = refresh_rollups(*rebuild_from, current);
        if (!rebuilt) {
            checkpoint.rollups_dirty_from = rebuild_from;
            record_rollup_state(checkpoint, generation);
        } else if (checkpoint.rollups_dirty_from.has_value()) {
            checkpoint.rollups_dirty_from.reset();
            record_rollup_state(checkpoint, generation);
        }
    }

    outcome.checkpoint = checkpoint.last_processed_timestamp;
    LoggingSystem::log_job_completed(outcome.minutes_processed, outcome.buckets_written, outcome.checkpoint);
    return outcome;
}

std::optional<BucketAggregator::BackfillOutcome> BucketAggregator::backfill(std::optional<int64_t> from,
                                                                           std::optional<int64_t> to) {
    if (!from.has_value()) {
        auto earliest = readings_.earliest();
        if (!earliest.has_value()) {
            LOG_INFO("No readings found, nothing to backfill");
            return std::nullopt;
        }
        from = earliest->timestamp;
    }

    if (!to.has_value()) {
        auto latest = readings_.latest();
        if (!latest.has_value()) {
            LOG_INFO("No readings found, nothing to backfill");
            return std::nullopt;
        }
        to = latest->timestamp;
    }

    BackfillOutcome outcome;
    outcome.first_bucket = floor_to_minute(from.value());
    outcome.last_bucket = floor_to_minute(to.value());

    if (outcome.last_bucket < outcome.first_bucket) {
        LOG_WARN("Backfill range is empty", {
            {"from", std::to_string(from.value())},
            {"to", std::to_string(to.value())}
        });
        return std::nullopt;
    }

    const uint64_t total = static_cast<uint64_t>(
        (outcome.last_bucket - outcome.first_bucket) / SECONDS_PER_MINUTE + 1);

    LOG_INFO("Backfill started", {
        {"first_bucket", std::to_string(outcome.first_bucket)},
        {"last_bucket", std::to_string(outcome.last_bucket)},
        {"total_minutes", std::to_string(total)}
    });

    for (int64_t bucket = outcome.first_bucket; bucket <= outcome.last_bucket; bucket += SECONDS_PER_MINUTE) {
        try {
            if (aggregate_minute_bucket(bucket)) {
                outcome.buckets_written++;
            }
            outcome.minutes_processed++;

            if (outcome.minutes_processed % options_.backfill_progress_every == 0) {
                LOG_INFO("Backfill progress", {
                    {"processed", std::to_string(outcome.minutes_processed)},
                    {"total", std::to_string(total)},
                    {"percent", fmt::format("{:.1f}", 100.0 * outcome.minutes_processed / total)}
                });
            }
        } catch (const std::exception& e) {
            outcome.failed_minutes++;
            LOG_ERROR("Backfill minute failed, continuing", {
                {"bucket_start", std::to_string(bucket)},
                {"error", e.what()}
            });
        }
    }

    invalidate_cache();
    outcome.rollups_rebuilt = refresh_rollups(outcome.first_bucket, outcome.last_bucket + SECONDS_PER_MINUTE);

    LOG_INFO("Backfill complete", {
        {"processed", std::to_string(outcome.minutes_processed)},
        {"buckets_written", std::to_string(outcome.buckets_written)},
        {"failed", std::to_string(outcome.failed_minutes)}
    });

    return outcome;
}

BucketAggregator::Statistics BucketAggregator::get_statistics() const {
    Statistics stats;
    stats.runs_completed = runs_completed_.load(std::memory_order_relaxed);
    stats.runs_failed = runs_failed_.load(std::memory_order_relaxed);
    stats.runs_skipped = runs_skipped_.load(std::memory_order_relaxed);
    stats.buckets_written = buckets_written_.load(std::memory_order_relaxed);
    stats.sparse_minutes = sparse_minutes_.load(std::memory_order_relaxed);
    return stats;
}

AggregationCheckpoint BucketAggregator::seed_checkpoint(int64_t now, int64_t now_bucket) const {
    AggregationCheckpoint seed;
    seed.last_run_at = now;
    seed.status = JobStatus::RUNNING;

    auto earliest = readings_.earliest();
    if (earliest.has_value()) {
        seed.last_processed_timestamp = floor_to_minute(earliest->timestamp);
    } else {
        seed.last_processed_timestamp = now_bucket - options_.bootstrap_lookback_seconds;
    }

    // Never claim the current, still open minute
    seed.last_processed_timestamp = std::min(seed.last_processed_timestamp,
                                             now_bucket - SECONDS_PER_MINUTE);
    return seed;
}

void BucketAggregator::persist_checkpoint(const AggregationCheckpoint& checkpoint,
                                          std::optional<uint64_t>& generation) {
    if (!buckets_.compare_and_set_checkpoint(generation, checkpoint)) {
        throw CheckpointConflictError(
            "Aggregation checkpoint was modified by another run (expected generation " +
            (generation ? std::to_string(*generation) : std::string("none")) + ")");
    }
    generation = generation ? *generation + 1 : 1;
}

void BucketAggregator::mark_error(AggregationCheckpoint checkpoint,
                                  std::optional<uint64_t> generation,
                                  int64_t now) {
    checkpoint.status = JobStatus::ERROR;
    checkpoint.last_run_at = now;

    try {
        persist_checkpoint(checkpoint, generation);
    } catch (const std::exception& e) {
        LoggingSystem::log_job_error("Could not record error status",
            ErrorContext("aggregator", "mark_error").add_data("error", e.what()));
    }
}

void BucketAggregator::invalidate_cache() {
    if (cache_ == nullptr) {
        return;
    }

    try {
        cache_->invalidate_pattern(CACHE_INVALIDATION_PATTERN);
    } catch (const std::exception& e) {
        LOG_WARN("Query cache invalidation failed", {
            {"pattern", CACHE_INVALIDATION_PATTERN},
            {"error", e.what()}
        });
    }
}

bool BucketAggregator::refresh_rollups(int64_t from, int64_t to) {
    try {
        buckets_.rebuild_rollups(from, to);
        return true;
    } catch (const StorageError& e) {
        LOG_WARN("Rollup rebuild failed", {
            {"from", std::to_string(from)},
            {"to", std::to_string(to)},
            {"error", e.what()}
        });
        return false;
    }
}

void BucketAggregator::record_rollup_state(const AggregationCheckpoint& checkpoint,
                                           std::optional<uint64_t>& generation) {
    try {
        persist_checkpoint(checkpoint, generation);
    } catch (const std::exception& e) {
        LOG_WARN("Could not record rollup state in checkpoint", {
            {"rollups_dirty_from", checkpoint.rollups_dirty_from
                ? std::to_string(*checkpoint.rollups_dirty_from) : std::string("none")},
            {"error", e.what()}
        });
    }
}

} // namespace energy_rollup

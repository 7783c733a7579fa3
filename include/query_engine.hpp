#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "energy_data.hpp"
#include "energy_integrator.hpp"
#include "energy_store.hpp"
#include "performance_cache.hpp"

namespace energy_rollup {

// Tuning for EnergyQueryEngine, defined at namespace scope so it can be
// used as a default argument inside the class
struct EnergyQueryEngineOptions {
    // Ranges at least this wide use minute buckets
    int64_t bucket_threshold_seconds = SECONDS_PER_HOUR;
    std::chrono::seconds cache_ttl{300};
};

/**
 * Answers "how much energy flowed between from and to" for one channel.
 *
 * Narrow ranges integrate raw readings. Wide ranges stitch stored minute
 * buckets with raw readings at unaligned edges. Results are cached under
 * energy:aggregated:{channel}:{granularity}:{from}:{to}.
 */
class EnergyQueryEngine {
public:
    using Options = EnergyQueryEngineOptions;

    struct Statistics {
        uint64_t queries_served = 0;
        uint64_t cache_hits = 0;
        uint64_t cache_errors = 0;
        uint64_t raw_path_queries = 0;
        uint64_t bucket_path_queries = 0;
    };

    EnergyQueryEngine(ReadingSource& readings,
                      BucketStore& buckets,
                      QueryCache* cache,
                      Options options = Options{});

    EnergyQueryEngine(const EnergyQueryEngine&) = delete;
    EnergyQueryEngine& operator=(const EnergyQueryEngine&) = delete;

    /**
     * Aggregate one channel over [from, to]
     * @param from Range start, Unix seconds
     * @param to Range end, Unix seconds
     * @param granularity Grouping of the returned points
     * @param channel GRID yields a consumption/feed-in split, other channels one series
     * @return AggregatedResponse or GridAggregatedResponse
     * @throws StorageError if the stores fail; cache failures never propagate
     */
    AggregatedResult get_aggregated_energy_data(int64_t from, int64_t to,
                                                Granularity granularity,
                                                ChannelType channel);

    /**
     * Net per-window energy straight from the hourly or daily rollups.
     * Rollups not built yet give an empty response.
     */
    AggregatedResponse get_rollup_energy(int64_t from, int64_t to,
                                         Granularity granularity,
                                         ChannelType channel) const;

    /**
     * Aggregate readings that are already in memory, the way the raw path does
     */
    static AggregatedResult aggregate_readings(const std::vector<EnergyReading>& readings,
                                               Granularity granularity,
                                               ChannelType channel);

    static std::string cache_key(int64_t from, int64_t to, Granularity granularity, ChannelType channel);

    Statistics get_statistics() const;

    QueryPerformanceMonitor::QueryMetrics get_performance_metrics() const;

private:
    ReadingSource& readings_;
    BucketStore& buckets_;
    QueryCache* cache_;
    Options options_;
    QueryPerformanceMonitor performance_monitor_;

    std::atomic<uint64_t> queries_served_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_errors_{0};
    std::atomic<uint64_t> raw_path_queries_{0};
    std::atomic<uint64_t> bucket_path_queries_{0};

    std::optional<AggregatedResult> read_cache(const std::string& key);
    void write_cache(const std::string& key, const AggregatedResult& result);

    std::vector<EnergyReading> build_bucket_series(int64_t from, int64_t to) const;

    static AggregatedResponse aggregate_series(const std::vector<EnergyReading>& readings,
                                               Granularity granularity,
                                               const ValueExtractor& extractor,
                                               const ValueFilter& filter);
};

} // namespace energy_rollup

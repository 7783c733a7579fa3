#include "query_engine.hpp"
#include <algorithm>
#include "logging_system.hpp"

namespace energy_rollup {

EnergyQueryEngine::EnergyQueryEngine(ReadingSource& readings,
                                     BucketStore& buckets,
                                     QueryCache* cache,
                                     Options options)
    : readings_(readings),
      buckets_(buckets),
      cache_(cache),
      options_(options) {
}

std::string EnergyQueryEngine::cache_key(int64_t from, int64_t to,
                                         Granularity granularity, ChannelType channel) {
    return "energy:aggregated:" + channel_to_string(channel) + ":" +
           granularity_to_string(granularity) + ":" +
           std::to_string(from) + ":" + std::to_string(to);
}

AggregatedResult EnergyQueryEngine::get_aggregated_energy_data(int64_t from, int64_t to,
                                                              Granularity granularity,
                                                              ChannelType channel) {
    auto timer = performance_monitor_.start_query("aggregated_energy");
    queries_served_.fetch_add(1, std::memory_order_relaxed);

    const std::string key = cache_key(from, to, granularity, channel);

    auto cached = read_cache(key);
    if (cached.has_value()) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        timer.mark_cached();
        LOG_DEBUG("Aggregated query served from cache", {{"key", key}});
        return std::move(cached.value());
    }

    std::vector<EnergyReading> series;
    try {
        if (to - from >= options_.bucket_threshold_seconds) {
            bucket_path_queries_.fetch_add(1, std::memory_order_relaxed);
            series = build_bucket_series(from, to);
        } else {
            raw_path_queries_.fetch_add(1, std::memory_order_relaxed);
            series = readings_.range_query(from, to);
        }
    } catch (const StorageError&) {
        timer.mark_failed();
        throw;
    }

    AggregatedResult result = aggregate_readings(series, granularity, channel);

    write_cache(key, result);

    return result;
}

AggregatedResponse EnergyQueryEngine::get_rollup_energy(int64_t from, int64_t to,
                                                        Granularity granularity,
                                                        ChannelType channel) const {
    auto rollups = granularity == Granularity::HOUR ? buckets_.hourly_rollup(from, to)
                                                    : buckets_.daily_rollup(from, to);

    AggregatedResponse response;
    response.data.reserve(rollups.size());

    for (const auto& rollup : rollups) {
        AggregatedDataPoint point;
        point.label = EnergyIntegrator::window_label(rollup.bucket_start, granularity);
        point.kwh = rollup.kwh(channel);
        point.timestamp = rollup.bucket_start;
        response.total += point.kwh;
        response.data.push_back(std::move(point));
    }

    return response;
}

AggregatedResult EnergyQueryEngine::aggregate_readings(const std::vector<EnergyReading>& readings,
                                                       Granularity granularity,
                                                       ChannelType channel) {
    auto extractor = EnergyIntegrator::extractor_for(channel);

    if (channel == ChannelType::GRID) {
        GridAggregatedResponse grid;
        grid.consumption = aggregate_series(readings, granularity, extractor, SampleFilters::non_negative());
        grid.feed_in = aggregate_series(readings, granularity, extractor, SampleFilters::negative_flipped());
        return grid;
    }

    return aggregate_series(readings, granularity, extractor, SampleFilters::positive());
}

EnergyQueryEngine::Statistics EnergyQueryEngine::get_statistics() const {
    Statistics stats;
    stats.queries_served = queries_served_.load(std::memory_order_relaxed);
    stats.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    stats.cache_errors = cache_errors_.load(std::memory_order_relaxed);
    stats.raw_path_queries = raw_path_queries_.load(std::memory_order_relaxed);
    stats.bucket_path_queries = bucket_path_queries_.load(std::memory_order_relaxed);
    return stats;
}

QueryPerformanceMonitor::QueryMetrics EnergyQueryEngine::get_performance_metrics() const {
    return performance_monitor_.get_overall_metrics();
}

std::optional<AggregatedResult> EnergyQueryEngine::read_cache(const std::string& key) {
    if (cache_ == nullptr) {
        return std::nullopt;
    }

    try {
        auto payload = cache_->get(key);
        if (!payload.has_value()) {
            return std::nullopt;
        }

        auto result = EnergyDataConverter::deserialize_result(payload.value());
        if (!result.has_value()) {
            LOG_WARN("Discarding undecodable cache entry", {{"key", key}});
        }
        return result;

    } catch (const std::exception& e) {
        cache_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Query cache read failed, treating as miss", {
            {"key", key},
            {"error", e.what()}
        });
        return std::nullopt;
    }
}

void EnergyQueryEngine::write_cache(const std::string& key, const AggregatedResult& result) {
    if (cache_ == nullptr) {
        return;
    }

    std::string payload = EnergyDataConverter::serialize(result);
    if (payload.empty()) {
        LOG_WARN("Failed to serialize aggregated result for cache", {{"key", key}});
        return;
    }

    try {
        cache_->set(key, payload, options_.cache_ttl);
    } catch (const std::exception& e) {
        cache_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Query cache write failed", {
            {"key", key},
            {"error", e.what()}
        });
    }
}

std::vector<EnergyReading> EnergyQueryEngine::build_bucket_series(int64_t from, int64_t to) const {
    // The result is rebuilt as one synthetic reading series and handed to the
    // same integrator as the raw path: each full bucket contributes its first
    // and last raw sample, unaligned edge minutes contribute every raw reading
    // plus one anchor reading outside each edge. Energy between the first and
    // last sample of a bucket is approximated by a single trapezoid.
    const int64_t full_start = from % SECONDS_PER_MINUTE == 0 ? from : floor_to_minute(from) + SECONDS_PER_MINUTE;
    const int64_t full_end = floor_to_minute(to);

    std::vector<EnergyReading> series;

    if (full_start >= full_end) {
        series = readings_.range_query(from, to);
    } else {
        if (full_start > from) {
            auto head = readings_.range_query(from, full_start - 1);
            series.insert(series.end(), head.begin(), head.end());
        }

        for (const auto& bucket : buckets_.range_buckets(full_start, full_end)) {
            series.push_back(bucket.first_reading());
            series.push_back(bucket.last_reading());
        }

        auto tail = readings_.range_query(full_end, to);
        series.insert(series.end(), tail.begin(), tail.end());
    }

    if (from % SECONDS_PER_MINUTE != 0) {
        auto anchor = buckets_.first_reading_before(from);
        if (anchor.has_value()) {
            series.push_back(anchor.value());
        }
    }

    if (to % SECONDS_PER_MINUTE != 0) {
        auto anchor = buckets_.first_reading_after(to);
        if (anchor.has_value()) {
            series.push_back(anchor.value());
        }
    }

    std::stable_sort(series.begin(), series.end(),
                     [](const EnergyReading& a, const EnergyReading& b) {
                         return a.timestamp < b.timestamp;
                     });

    return series;
}

AggregatedResponse EnergyQueryEngine::aggregate_series(const std::vector<EnergyReading>& readings,
                                                       Granularity granularity,
                                                       const ValueExtractor& extractor,
                                                       const ValueFilter& filter) {
    AggregatedResponse response;
    if (readings.empty()) {
        return response;
    }

    response.data = EnergyIntegrator::group_by_fixed_window(readings, granularity, extractor, filter);
    response.total = EnergyIntegrator::total_energy(readings, extractor, filter);
    return response;
}

} // namespace energy_rollup

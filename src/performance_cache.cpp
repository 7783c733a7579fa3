#include "performance_cache.hpp"
#include "logging_system.hpp"
#include <algorithm>
#include <fnmatch.h>

namespace energy_rollup {

InMemoryQueryCache::InMemoryQueryCache(size_t max_entries, std::chrono::seconds default_ttl)
    : cache_(max_entries, default_ttl), default_ttl_(default_ttl) {
}

std::optional<std::string> InMemoryQueryCache::get(const std::string& key) {
    return cache_.get(key);
}

void InMemoryQueryCache::set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::seconds> ttl) {
    auto effective_ttl = ttl.value_or(default_ttl_);
    if (effective_ttl.count() <= 0) {
        return;
    }

    std::string copy = value;
    cache_.put(key, std::move(copy), effective_ttl);
}

size_t InMemoryQueryCache::invalidate_pattern(const std::string& pattern) {
    size_t removed = cache_.erase_if([&pattern](const std::string& key) {
        return fnmatch(pattern.c_str(), key.c_str(), 0) == 0;
    });

    LOG_DEBUG("Query cache invalidated", {
        {"pattern", pattern},
        {"removed", std::to_string(removed)}
    });

    return removed;
}

void InMemoryQueryCache::cleanup_expired() {
    cache_.cleanup_expired();
}

CacheStats InMemoryQueryCache::get_metrics() const {
    return cache_.get_metrics();
}

QueryPerformanceMonitor::QueryTimer::~QueryTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time_).count();

    monitor_.record_query(query_type_, static_cast<uint64_t>(duration), cached_, failed_);
}

void QueryPerformanceMonitor::record_query(const std::string& query_type, uint64_t duration_ms, bool cached, bool failed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& metrics = metrics_[query_type];
        metrics.total_queries++;
        metrics.total_duration_ms += duration_ms;

        if (duration_ms > SLOW_QUERY_THRESHOLD_MS) {
            metrics.slow_queries++;
        }

        if (cached) {
            metrics.cached_queries++;
        }

        if (failed) {
            metrics.failed_queries++;
        }
    }

    if (duration_ms > SLOW_QUERY_THRESHOLD_MS) {
        LOG_WARN("Slow query detected", {
            {"query_type", query_type},
            {"duration_ms", std::to_string(duration_ms)},
            {"cached", cached ? "true" : "false"},
            {"failed", failed ? "true" : "false"}
        });
    }
}

} // namespace energy_rollup

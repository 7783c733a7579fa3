#pragma once

#include <memory>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <optional>
#include <atomic>
#include <string>
#include <functional>

namespace energy_rollup {

/**
 * Cache entry for storing frequently requested data
 */
template<typename T>
struct CacheEntry {
    T data;
    std::chrono::steady_clock::time_point created;
    std::chrono::steady_clock::time_point last_access;
    std::chrono::seconds max_age;

    CacheEntry(T&& d, std::chrono::seconds age)
        : data(std::move(d)),
          created(std::chrono::steady_clock::now()),
          last_access(created),
          max_age(age) {}

    bool is_expired(std::chrono::steady_clock::time_point now) const {
        return (now - created) >= max_age;
    }

    void touch(std::chrono::steady_clock::time_point now) {
        last_access = now;
    }
};

/**
 * Point-in-time copy of cache counters
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t invalidations = 0;
    uint64_t total_requests = 0;
    size_t entries = 0;
};

/**
 * Performance metrics for cache operations
 */
struct CacheMetrics {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> invalidations{0};
    std::atomic<uint64_t> total_requests{0};

    void record_hit() {
        hits.fetch_add(1, std::memory_order_relaxed);
        total_requests.fetch_add(1, std::memory_order_relaxed);
    }

    void record_miss() {
        misses.fetch_add(1, std::memory_order_relaxed);
        total_requests.fetch_add(1, std::memory_order_relaxed);
    }

    void record_eviction() {
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    void record_invalidations(uint64_t count) {
        invalidations.fetch_add(count, std::memory_order_relaxed);
    }

    CacheStats snapshot() const {
        CacheStats stats;
        stats.hits = hits.load(std::memory_order_relaxed);
        stats.misses = misses.load(std::memory_order_relaxed);
        stats.evictions = evictions.load(std::memory_order_relaxed);
        stats.invalidations = invalidations.load(std::memory_order_relaxed);
        stats.total_requests = total_requests.load(std::memory_order_relaxed);
        return stats;
    }
};

/**
 * LRU cache with per-entry TTL
 */
template<typename Key, typename Value>
class LRUCache {
public:
    /**
     * Constructor
     * @param max_size Maximum number of entries to cache
     * @param max_age Default age limit of cached entries
     */
    LRUCache(size_t max_size, std::chrono::seconds max_age = std::chrono::seconds(60))
        : max_size_(max_size == 0 ? 1 : max_size), max_age_(max_age) {}

    /**
     * Get value from cache
     * @param key Cache key
     * @return Cached value if found and not expired
     */
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();

        auto it = cache_.find(key);
        if (it == cache_.end()) {
            metrics_.record_miss();
            return std::nullopt;
        }

        auto& entry = it->second;
        if (entry.is_expired(now)) {
            cache_.erase(it);
            metrics_.record_miss();
            return std::nullopt;
        }

        entry.touch(now);
        metrics_.record_hit();
        return entry.data;
    }

    /**
     * Put value in cache
     * @param key Cache key
     * @param value Value to cache
     * @param max_age Age limit for this entry, the cache default if not given
     */
    void put(const Key& key, Value&& value, std::optional<std::chrono::seconds> max_age = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);

        cache_.erase(key);

        while (cache_.size() >= max_size_) {
            evict_lru();
        }

        cache_.emplace(key, CacheEntry<Value>(std::move(value), max_age.value_or(max_age_)));
    }

    /**
     * Remove every entry whose key satisfies the predicate
     * @return Number of entries removed
     */
    size_t erase_if(const std::function<bool(const Key&)>& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t removed = 0;
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (predicate(it->first)) {
                it = cache_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        metrics_.record_invalidations(removed);
        return removed;
    }

    CacheStats get_metrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats stats = metrics_.snapshot();
        stats.entries = cache_.size();
        return stats;
    }

    /**
     * Clean up expired entries
     */
    void cleanup_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();

        auto it = cache_.begin();
        while (it != cache_.end()) {
            if (it->second.is_expired(now)) {
                it = cache_.erase(it);
                metrics_.record_eviction();
            } else {
                ++it;
            }
        }
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, CacheEntry<Value>> cache_;
    size_t max_size_;
    std::chrono::seconds max_age_;
    CacheMetrics metrics_;

    /**
     * Evict least recently used entry
     */
    void evict_lru() {
        if (cache_.empty()) return;

        auto oldest_it = cache_.begin();
        for (auto it = cache_.begin(); it != cache_.end(); ++it) {
            if (it->second.last_access < oldest_it->second.last_access) {
                oldest_it = it;
            }
        }

        cache_.erase(oldest_it);
        metrics_.record_eviction();
    }
};

/**
 * Cache contract used by the query engine and the aggregator.
 * Implementations may fail by throwing; callers treat that as a miss.
 */
class QueryCache {
public:
    virtual ~QueryCache() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Store a value
     * @param ttl Time to live, the cache default if not given
     */
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

    /**
     * Drop every key matching a glob pattern ("*" and "?")
     * @return Number of keys removed
     */
    virtual size_t invalidate_pattern(const std::string& pattern) = 0;
};

/**
 * In-process query cache backed by LRUCache
 */
class InMemoryQueryCache : public QueryCache {
public:
    /**
     * @param max_entries Capacity before LRU eviction
     * @param default_ttl TTL applied when set() gets none. Zero disables caching.
     */
    explicit InMemoryQueryCache(size_t max_entries = 1024,
                                std::chrono::seconds default_ttl = std::chrono::seconds(300));

    std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) override;

    size_t invalidate_pattern(const std::string& pattern) override;

    void cleanup_expired();

    CacheStats get_metrics() const;

private:
    LRUCache<std::string, std::string> cache_;
    std::chrono::seconds default_ttl_;
};

/**
 * Performance monitoring for storage and query operations
 */
class QueryPerformanceMonitor {
public:
    /**
     * Query performance metrics
     */
    struct QueryMetrics {
        uint64_t total_queries = 0;
        uint64_t total_duration_ms = 0;
        uint64_t slow_queries = 0;  // Queries > 100ms
        uint64_t failed_queries = 0;
        uint64_t cached_queries = 0;

        double get_average_duration_ms() const {
            if (total_queries == 0) return 0.0;
            return static_cast<double>(total_duration_ms) / total_queries;
        }
    };

    /**
     * RAII timer for measuring query performance
     */
    class QueryTimer {
    public:
        QueryTimer(QueryPerformanceMonitor& monitor, const std::string& query_type)
            : monitor_(monitor), query_type_(query_type),
              start_time_(std::chrono::steady_clock::now()) {}

        ~QueryTimer();

        QueryTimer(const QueryTimer&) = delete;
        QueryTimer& operator=(const QueryTimer&) = delete;

        void mark_cached() {
            cached_ = true;
        }

        void mark_failed() {
            failed_ = true;
        }

    private:
        QueryPerformanceMonitor& monitor_;
        std::string query_type_;
        std::chrono::steady_clock::time_point start_time_;
        bool cached_ = false;
        bool failed_ = false;
    };

    /**
     * Create a query timer
     * @param query_type Type of query being performed
     * @return RAII timer object
     */
    QueryTimer start_query(const std::string& query_type) {
        return QueryTimer(*this, query_type);
    }

    /**
     * Get overall metrics across all query types
     */
    QueryMetrics get_overall_metrics() const {
        std::lock_guard<std::mutex> lock(mutex_);

        QueryMetrics overall;
        for (const auto& [type, metrics] : metrics_) {
            overall.total_queries += metrics.total_queries;
            overall.total_duration_ms += metrics.total_duration_ms;
            overall.slow_queries += metrics.slow_queries;
            overall.failed_queries += metrics.failed_queries;
            overall.cached_queries += metrics.cached_queries;
        }

        return overall;
    }

    static constexpr uint64_t SLOW_QUERY_THRESHOLD_MS = 100;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, QueryMetrics> metrics_;

    /**
     * Record query performance
     * @param query_type Type of query
     * @param duration_ms Query duration in milliseconds
     * @param cached Whether query was served from cache
     * @param failed Whether query failed
     */
    void record_query(const std::string& query_type, uint64_t duration_ms, bool cached, bool failed);
};

} // namespace energy_rollup

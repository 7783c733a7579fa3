#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "energy_data.hpp"
#include "price_calculator.hpp"
#include "bucket_aggregator.hpp"
#include "query_engine.hpp"
#include "time_series_storage.hpp"

namespace energy_rollup {

/**
 * JSON documents printed by energy-ctl and served by the daemon's HTTP endpoint
 */
class JsonResponseBuilder {
public:
    /**
     * Create JSON document for an aggregated query
     * @param result Query engine result (single or grid split series)
     * @param from Range start, Unix seconds
     * @param to Range end, Unix seconds
     * @param granularity Grouping used by the query
     * @param channel Queried channel
     * @param schedule Pricing schedule; costs are omitted when absent
     * @return JSON object string
     */
    static std::string create_query_response(const AggregatedResult& result,
                                             int64_t from, int64_t to,
                                             Granularity granularity,
                                             ChannelType channel,
                                             const std::optional<PricingSchedule>& schedule);

    /**
     * Create JSON document for rollup lookups
     */
    static std::string create_rollups_response(const AggregatedResponse& response,
                                               int64_t from, int64_t to,
                                               Granularity granularity,
                                               ChannelType channel);

    /**
     * Create JSON document describing the job checkpoint and the database
     * @param checkpoint Stored checkpoint, absent before the first run
     * @param info Database information structure
     */
    static std::string create_status_response(const std::optional<AggregationCheckpoint>& checkpoint,
                                              const TimeSeriesStorage::DatabaseInfo& info);

    /**
     * Create JSON document summarizing a backfill; nothing to do yields "skipped"
     */
    static std::string create_backfill_response(const std::optional<BucketAggregator::BackfillOutcome>& outcome);

    static std::string create_error_response(const std::string& error_msg,
                                             const std::string& details = "");

    /**
     * Create JSON document for GET /health
     * @param storage_healthy Storage health as reported by the storage engine
     * @param stats Query engine counters
     * @param storage_metrics Timings of storage operations
     */
    static std::string create_health_response(bool storage_healthy,
                                              const EnergyQueryEngine::Statistics& stats,
                                              const QueryPerformanceMonitor::QueryMetrics& storage_metrics);

    /**
     * Wrap a JSON body in a complete HTTP response
     */
    static std::string create_http_response(int status_code, const std::string& json_body);

    /**
     * Complete HTTP response carrying an error document
     */
    static std::string create_http_error_response(int status_code,
                                                  const std::string& error_msg,
                                                  const std::string& details = "");

    /**
     * Create HTTP response header
     * @param status_code HTTP status code
     * @param content_length Length of response body, omitted when 0
     * @return HTTP header string
     */
    static std::string create_http_header(int status_code, size_t content_length = 0);

    static std::string get_status_text(int status_code);

    /**
     * Convert a series to a JSON object with "data" and "total"
     */
    static std::string series_to_json(const AggregatedResponse& response, int indent = 2);

    /**
     * Convert a priced series to a JSON object with "data", "total" and "total_cost"
     */
    static std::string cost_series_to_json(const CostSeries& series, int indent = 2);

    /**
     * Convert Unix seconds to an ISO 8601 UTC string
     */
    static std::string timestamp_to_iso8601(int64_t timestamp);

    static std::string escape_json_string(const std::string& str);

    /**
     * Format double value for JSON (handles NaN, infinity)
     * @param value Double value to format
     * @param precision Number of decimal places
     * @return JSON-formatted number string
     */
    static std::string format_json_number(double value, int precision = 6);

private:
    static std::string optional_timestamp(const std::optional<int64_t>& timestamp);
};

/**
 * HTTP status codes used by the endpoint
 */
namespace HttpStatus {
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int NOT_FOUND = 404;
    constexpr int METHOD_NOT_ALLOWED = 405;
    constexpr int INTERNAL_SERVER_ERROR = 500;
    constexpr int SERVICE_UNAVAILABLE = 503;
}

} // namespace energy_rollup

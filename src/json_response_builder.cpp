#include "json_response_builder.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <ctime>

namespace energy_rollup {

namespace {

std::string pad(int indent) {
    return std::string(static_cast<size_t>(indent), ' ');
}

} // namespace

std::string JsonResponseBuilder::create_query_response(const AggregatedResult& result,
                                                       int64_t from, int64_t to,
                                                       Granularity granularity,
                                                       ChannelType channel,
                                                       const std::optional<PricingSchedule>& schedule) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"channel\": \"" << channel_to_string(channel) << "\",\n";
    json << "  \"granularity\": \"" << granularity_to_string(granularity) << "\",\n";
    json << "  \"from\": \"" << timestamp_to_iso8601(from) << "\",\n";
    json << "  \"to\": \"" << timestamp_to_iso8601(to) << "\",\n";

    if (const auto* grid = std::get_if<GridAggregatedResponse>(&result)) {
        if (schedule.has_value()) {
            auto consumption = PriceCalculator::price_series(grid->consumption, schedule, PricingMethod::CONSUMPTION);
            auto feed_in = PriceCalculator::price_series(grid->feed_in, schedule, PricingMethod::FEED_IN);
            json << "  \"consumption\": " << cost_series_to_json(consumption, 2) << ",\n";
            json << "  \"feed_in\": " << cost_series_to_json(feed_in, 2) << "\n";
        } else {
            json << "  \"consumption\": " << series_to_json(grid->consumption, 2) << ",\n";
            json << "  \"feed_in\": " << series_to_json(grid->feed_in, 2) << "\n";
        }
    } else {
        const auto& series = std::get<AggregatedResponse>(result);
        if (schedule.has_value()) {
            auto priced = PriceCalculator::price_series(series, schedule, PriceCalculator::method_for(channel));
            json << "  \"result\": " << cost_series_to_json(priced, 2) << "\n";
        } else {
            json << "  \"result\": " << series_to_json(series, 2) << "\n";
        }
    }

    json << "}\n";
    return json.str();
}

std::string JsonResponseBuilder::create_rollups_response(const AggregatedResponse& response,
                                                         int64_t from, int64_t to,
                                                         Granularity granularity,
                                                         ChannelType channel) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"channel\": \"" << channel_to_string(channel) << "\",\n";
    json << "  \"granularity\": \"" << granularity_to_string(granularity) << "\",\n";
    json << "  \"from\": \"" << timestamp_to_iso8601(from) << "\",\n";
    json << "  \"to\": \"" << timestamp_to_iso8601(to) << "\",\n";
    json << "  \"rollups\": " << series_to_json(response, 2) << "\n";
    json << "}\n";

    return json.str();
}

std::string JsonResponseBuilder::create_status_response(const std::optional<AggregationCheckpoint>& checkpoint,
                                                        const TimeSeriesStorage::DatabaseInfo& info) {
    std::ostringstream json;

    json << "{\n";
    if (checkpoint.has_value()) {
        json << "  \"checkpoint\": {\n";
        json << "    \"last_processed_timestamp\": " << checkpoint->last_processed_timestamp << ",\n";
        json << "    \"last_processed\": \"" << timestamp_to_iso8601(checkpoint->last_processed_timestamp) << "\",\n";
        json << "    \"last_run_at\": \"" << timestamp_to_iso8601(checkpoint->last_run_at) << "\",\n";
        json << "    \"status\": \"" << job_status_to_string(checkpoint->status) << "\",\n";
        json << "    \"generation\": " << checkpoint->generation << ",\n";
        json << "    \"rollups_dirty_from\": " << optional_timestamp(checkpoint->rollups_dirty_from) << "\n";
        json << "  },\n";
    } else {
        json << "  \"checkpoint\": null,\n";
    }

    json << "  \"database\": {\n";
    json << "    \"path\": \"" << escape_json_string(info.database_path) << "\",\n";
    json << "    \"estimated_readings\": " << info.estimated_readings << ",\n";
    json << "    \"estimated_buckets\": " << info.estimated_buckets << ",\n";
    json << "    \"size_bytes\": " << info.database_size_bytes << ",\n";
    json << "    \"earliest_reading\": " << optional_timestamp(info.earliest_reading) << ",\n";
    json << "    \"latest_reading\": " << optional_timestamp(info.latest_reading) << ",\n";
    json << "    \"latest_bucket\": " << optional_timestamp(info.latest_bucket) << ",\n";
    json << "    \"healthy\": " << (info.is_healthy ? "true" : "false") << "\n";
    json << "  }\n";
    json << "}\n";

    return json.str();
}

std::string JsonResponseBuilder::create_backfill_response(const std::optional<BucketAggregator::BackfillOutcome>& outcome) {
    std::ostringstream json;

    json << "{\n";
    if (!outcome.has_value()) {
        json << "  \"status\": \"skipped\",\n";
        json << "  \"reason\": \"no readings in range\"\n";
    } else {
        const bool clean = outcome->failed_minutes == 0 && outcome->rollups_rebuilt;
        json << "  \"status\": \"" << (clean ? "completed" : "completed_with_errors") << "\",\n";
        json << "  \"first_bucket\": \"" << timestamp_to_iso8601(outcome->first_bucket) << "\",\n";
        json << "  \"last_bucket\": \"" << timestamp_to_iso8601(outcome->last_bucket) << "\",\n";
        json << "  \"minutes_processed\": " << outcome->minutes_processed << ",\n";
        json << "  \"buckets_written\": " << outcome->buckets_written << ",\n";
        json << "  \"failed_minutes\": " << outcome->failed_minutes << ",\n";
        json << "  \"rollups_rebuilt\": " << (outcome->rollups_rebuilt ? "true" : "false") << "\n";
    }
    json << "}\n";

    return json.str();
}

std::string JsonResponseBuilder::create_error_response(const std::string& error_msg,
                                                       const std::string& details) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"error\": \"" << escape_json_string(error_msg) << "\",\n";

    if (!details.empty()) {
        json << "  \"details\": \"" << escape_json_string(details) << "\",\n";
    }

    json << "  \"timestamp\": \"" << timestamp_to_iso8601(static_cast<int64_t>(std::time(nullptr))) << "\"\n";
    json << "}\n";

    return json.str();
}

std::string JsonResponseBuilder::create_health_response(bool storage_healthy,
                                                        const EnergyQueryEngine::Statistics& stats,
                                                        const QueryPerformanceMonitor::QueryMetrics& storage_metrics) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"status\": \"" << (storage_healthy ? "ok" : "degraded") << "\",\n";
    json << "  \"storage_healthy\": " << (storage_healthy ? "true" : "false") << ",\n";
    json << "  \"queries_served\": " << stats.queries_served << ",\n";
    json << "  \"cache_hits\": " << stats.cache_hits << ",\n";
    json << "  \"cache_errors\": " << stats.cache_errors << ",\n";
    json << "  \"raw_path_queries\": " << stats.raw_path_queries << ",\n";
    json << "  \"bucket_path_queries\": " << stats.bucket_path_queries << ",\n";
    json << "  \"storage_operations\": " << storage_metrics.total_queries << ",\n";
    json << "  \"storage_failed_operations\": " << storage_metrics.failed_queries << ",\n";
    json << "  \"storage_slow_operations\": " << storage_metrics.slow_queries << ",\n";
    json << "  \"storage_average_ms\": " << format_json_number(storage_metrics.get_average_duration_ms(), 2) << ",\n";
    json << "  \"timestamp\": \"" << timestamp_to_iso8601(static_cast<int64_t>(std::time(nullptr))) << "\"\n";
    json << "}\n";

    return json.str();
}

std::string JsonResponseBuilder::create_http_response(int status_code, const std::string& json_body) {
    return create_http_header(status_code, json_body.length()) + json_body;
}

std::string JsonResponseBuilder::create_http_error_response(int status_code,
                                                            const std::string& error_msg,
                                                            const std::string& details) {
    return create_http_response(status_code, create_error_response(error_msg, details));
}

std::string JsonResponseBuilder::create_http_header(int status_code, size_t content_length) {
    std::ostringstream header;

    header << "HTTP/1.1 " << status_code << " " << get_status_text(status_code) << "\r\n";
    header << "Content-Type: application/json\r\n";
    header << "Connection: close\r\n";
    header << "Access-Control-Allow-Origin: *\r\n";
    header << "Cache-Control: no-cache\r\n";

    if (content_length > 0) {
        header << "Content-Length: " << content_length << "\r\n";
    }

    header << "\r\n";

    return header.str();
}

std::string JsonResponseBuilder::get_status_text(int status_code) {
    switch (status_code) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string JsonResponseBuilder::series_to_json(const AggregatedResponse& response, int indent) {
    std::ostringstream json;
    const std::string outer = pad(indent);
    const std::string inner = pad(indent + 2);

    json << "{\n";
    json << inner << "\"data\": [";
    for (size_t i = 0; i < response.data.size(); ++i) {
        const auto& point = response.data[i];
        json << (i > 0 ? ",\n" : "\n") << inner << "  {"
             << "\"label\": \"" << escape_json_string(point.label) << "\", "
             << "\"kwh\": " << format_json_number(point.kwh) << ", "
             << "\"timestamp\": " << point.timestamp << "}";
    }
    json << (response.data.empty() ? "],\n" : "\n" + inner + "],\n");
    json << inner << "\"total\": " << format_json_number(response.total) << "\n";
    json << outer << "}";

    return json.str();
}

std::string JsonResponseBuilder::cost_series_to_json(const CostSeries& series, int indent) {
    std::ostringstream json;
    const std::string outer = pad(indent);
    const std::string inner = pad(indent + 2);

    json << "{\n";
    json << inner << "\"data\": [";
    for (size_t i = 0; i < series.data.size(); ++i) {
        const auto& point = series.data[i];
        json << (i > 0 ? ",\n" : "\n") << inner << "  {"
             << "\"label\": \"" << escape_json_string(point.label) << "\", "
             << "\"kwh\": " << format_json_number(point.kwh) << ", "
             << "\"cost\": " << format_json_number(point.cost, 4) << ", "
             << "\"timestamp\": " << point.timestamp << "}";
    }
    json << (series.data.empty() ? "],\n" : "\n" + inner + "],\n");
    json << inner << "\"total\": " << format_json_number(series.total_kwh) << ",\n";
    json << inner << "\"total_cost\": " << format_json_number(series.total_cost, 4) << "\n";
    json << outer << "}";

    return json.str();
}

std::string JsonResponseBuilder::timestamp_to_iso8601(int64_t timestamp) {
    std::time_t time_value = static_cast<std::time_t>(timestamp);
    std::tm tm_value{};
    gmtime_r(&time_value, &tm_value);

    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string JsonResponseBuilder::escape_json_string(const std::string& str) {
    std::ostringstream escaped;

    for (char c : str) {
        switch (c) {
            case '"':
                escaped << "\\\"";
                break;
            case '\\':
                escaped << "\\\\";
                break;
            case '\b':
                escaped << "\\b";
                break;
            case '\f':
                escaped << "\\f";
                break;
            case '\n':
                escaped << "\\n";
                break;
            case '\r':
                escaped << "\\r";
                break;
            case '\t':
                escaped << "\\t";
                break;
            default:
                if (c >= 0 && c < 32) {
                    // Control characters
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    escaped << c;
                }
                break;
        }
    }

    return escaped.str();
}

std::string JsonResponseBuilder::format_json_number(double value, int precision) {
    // JSON has no NaN or infinity
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;

    std::string result = oss.str();

    // Remove trailing zeros after decimal point
    if (result.find('.') != std::string::npos) {
        result = result.substr(0, result.find_last_not_of('0') + 1);
        if (result.back() == '.') {
            result.pop_back();
        }
    }

    if (result == "-0") {
        result = "0";
    }

    return result;
}

std::string JsonResponseBuilder::optional_timestamp(const std::optional<int64_t>& timestamp) {
    if (!timestamp.has_value()) {
        return "null";
    }
    return "\"" + timestamp_to_iso8601(*timestamp) + "\"";
}

} // namespace energy_rollup

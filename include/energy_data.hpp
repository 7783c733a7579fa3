#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "energy_data.pb.h"

namespace energy_rollup {

/**
 * Measurement channels carried by every reading
 */
enum class ChannelType {
    HOME,
    GRID,
    CAR,
    SOLAR
};

/**
 * Window size used when grouping query results
 */
enum class Granularity {
    HOUR,
    DAY
};

/**
 * Raw power sample as delivered by the ingestion side.
 * Values are instantaneous watts; grid is negative while exporting.
 */
struct EnergyReading {
    int64_t timestamp = 0;
    double home = 0.0;
    double grid = 0.0;
    double car = 0.0;
    double solar = 0.0;

    EnergyReading() = default;

    EnergyReading(int64_t ts, double home_w, double grid_w, double car_w, double solar_w)
        : timestamp(ts), home(home_w), grid(grid_w), car(car_w), solar(solar_w) {}

    double value(ChannelType channel) const;
};

/**
 * One-minute energy rollup. Also used as the row shape of hourly and daily rollups.
 */
struct EnergyBucket {
    int64_t bucket_start = 0;
    int64_t bucket_end = 0;
    double home_kwh = 0.0;
    double grid_kwh = 0.0;
    double car_kwh = 0.0;
    double solar_kwh = 0.0;
    uint32_t readings_count = 0;
    int64_t first_timestamp = 0;
    int64_t last_timestamp = 0;
    double first_home = 0.0;
    double first_grid = 0.0;
    double first_car = 0.0;
    double first_solar = 0.0;
    double last_home = 0.0;
    double last_grid = 0.0;
    double last_car = 0.0;
    double last_solar = 0.0;

    double kwh(ChannelType channel) const;

    // First and last raw samples of the window, rebuilt as readings
    EnergyReading first_reading() const;
    EnergyReading last_reading() const;
};

enum class JobStatus {
    RUNNING,
    COMPLETED,
    ERROR
};

/**
 * High-water mark of the bucket aggregation job (singleton record)
 */
struct AggregationCheckpoint {
    int64_t last_processed_timestamp = 0;
    int64_t last_run_at = 0;
    JobStatus status = JobStatus::RUNNING;
    // Bumped on every persisted write, used for compare-and-set
    uint64_t generation = 0;
    // Earliest minute whose hourly/daily rollups still wait for a rebuild
    std::optional<int64_t> rollups_dirty_from;
};

struct AggregatedDataPoint {
    std::string label;
    double kwh = 0.0;
    int64_t timestamp = 0;
};

struct AggregatedResponse {
    std::vector<AggregatedDataPoint> data;
    double total = 0.0;
};

struct GridAggregatedResponse {
    AggregatedResponse consumption;
    AggregatedResponse feed_in;
};

/**
 * Query engine result: a single series for home/car/solar, a split series for grid
 */
using AggregatedResult = std::variant<AggregatedResponse, GridAggregatedResponse>;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

inline int64_t floor_to_minute(int64_t timestamp) {
    int64_t rem = timestamp % SECONDS_PER_MINUTE;
    return rem < 0 ? timestamp - rem - SECONDS_PER_MINUTE : timestamp - rem;
}

std::string channel_to_string(ChannelType channel);
std::optional<ChannelType> parse_channel(const std::string& name);

std::string granularity_to_string(Granularity granularity);
std::optional<Granularity> parse_granularity(const std::string& name);

/**
 * Parse whole Unix seconds; signs are allowed, anything else is rejected
 */
std::optional<int64_t> parse_unix_seconds(const std::string& value);

std::string job_status_to_string(JobStatus status);

/**
 * Collapse consecutive buckets into one rollup row for [window_start, window_end).
 * Buckets must be sorted by bucket_start; first_* come from the earliest and
 * last_* from the latest.
 */
EnergyBucket merge_buckets(int64_t window_start, int64_t window_end,
                           const std::vector<EnergyBucket>& buckets);

/**
 * Conversion between the internal structs and their protobuf messages
 */
class EnergyDataConverter {
public:
    static proto::Reading to_protobuf(const EnergyReading& reading);
    static EnergyReading from_protobuf(const proto::Reading& proto_reading);

    static proto::Bucket to_protobuf(const EnergyBucket& bucket);
    static EnergyBucket from_protobuf(const proto::Bucket& proto_bucket);

    static proto::AggregationCheckpoint to_protobuf(const AggregationCheckpoint& checkpoint);
    static AggregationCheckpoint from_protobuf(const proto::AggregationCheckpoint& proto_checkpoint);

    static proto::AggregatedResult to_protobuf(const AggregatedResult& result);
    static AggregatedResult from_protobuf(const proto::AggregatedResult& proto_result);

    /**
     * Serialize to binary string
     * @return Serialized bytes, or empty string on failure
     */
    static std::string serialize(const EnergyReading& reading);
    static std::string serialize(const EnergyBucket& bucket);
    static std::string serialize(const AggregationCheckpoint& checkpoint);
    static std::string serialize(const AggregatedResult& result);

    /**
     * Deserialize binary string
     * @return Parsed value, or nullopt if the bytes are not a valid message
     */
    static std::optional<EnergyReading> deserialize_reading(const std::string& data);
    static std::optional<EnergyBucket> deserialize_bucket(const std::string& data);
    static std::optional<AggregationCheckpoint> deserialize_checkpoint(const std::string& data);
    static std::optional<AggregatedResult> deserialize_result(const std::string& data);
};

} // namespace energy_rollup

#include "energy_data.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace energy_rollup {

double EnergyReading::value(ChannelType channel) const {
    switch (channel) {
        case ChannelType::HOME: return home;
        case ChannelType::GRID: return grid;
        case ChannelType::CAR: return car;
        case ChannelType::SOLAR: return solar;
    }
    return 0.0;
}

double EnergyBucket::kwh(ChannelType channel) const {
    switch (channel) {
        case ChannelType::HOME: return home_kwh;
        case ChannelType::GRID: return grid_kwh;
        case ChannelType::CAR: return car_kwh;
        case ChannelType::SOLAR: return solar_kwh;
    }
    return 0.0;
}

EnergyReading EnergyBucket::first_reading() const {
    return EnergyReading(first_timestamp, first_home, first_grid, first_car, first_solar);
}

EnergyReading EnergyBucket::last_reading() const {
    return EnergyReading(last_timestamp, last_home, last_grid, last_car, last_solar);
}

std::string channel_to_string(ChannelType channel) {
    switch (channel) {
        case ChannelType::HOME: return "home";
        case ChannelType::GRID: return "grid";
        case ChannelType::CAR: return "car";
        case ChannelType::SOLAR: return "solar";
    }
    return "unknown";
}

std::optional<ChannelType> parse_channel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "home") return ChannelType::HOME;
    if (lower == "grid") return ChannelType::GRID;
    if (lower == "car") return ChannelType::CAR;
    if (lower == "solar") return ChannelType::SOLAR;
    return std::nullopt;
}

std::string granularity_to_string(Granularity granularity) {
    return granularity == Granularity::HOUR ? "hour" : "day";
}

std::optional<Granularity> parse_granularity(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "hour" || lower == "hourly" || lower == "1h") return Granularity::HOUR;
    if (lower == "day" || lower == "daily" || lower == "1d") return Granularity::DAY;
    return std::nullopt;
}

std::optional<int64_t> parse_unix_seconds(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::ERROR: return "error";
    }
    return "unknown";
}

EnergyBucket merge_buckets(int64_t window_start, int64_t window_end,
                           const std::vector<EnergyBucket>& buckets) {
    EnergyBucket rollup;
    rollup.bucket_start = window_start;
    rollup.bucket_end = window_end;

    if (buckets.empty()) {
        return rollup;
    }

    for (const auto& bucket : buckets) {
        rollup.home_kwh += bucket.home_kwh;
        rollup.grid_kwh += bucket.grid_kwh;
        rollup.car_kwh += bucket.car_kwh;
        rollup.solar_kwh += bucket.solar_kwh;
        rollup.readings_count += bucket.readings_count;
    }

    const auto& first = buckets.front();
    rollup.first_timestamp = first.first_timestamp;
    rollup.first_home = first.first_home;
    rollup.first_grid = first.first_grid;
    rollup.first_car = first.first_car;
    rollup.first_solar = first.first_solar;

    const auto& last = buckets.back();
    rollup.last_timestamp = last.last_timestamp;
    rollup.last_home = last.last_home;
    rollup.last_grid = last.last_grid;
    rollup.last_car = last.last_car;
    rollup.last_solar = last.last_solar;

    return rollup;
}

proto::Reading EnergyDataConverter::to_protobuf(const EnergyReading& reading) {
    proto::Reading proto_reading;
    proto_reading.set_timestamp(reading.timestamp);
    proto_reading.set_home(reading.home);
    proto_reading.set_grid(reading.grid);
    proto_reading.set_car(reading.car);
    proto_reading.set_solar(reading.solar);
    return proto_reading;
}

EnergyReading EnergyDataConverter::from_protobuf(const proto::Reading& proto_reading) {
    return EnergyReading(proto_reading.timestamp(),
                         proto_reading.home(),
                         proto_reading.grid(),
                         proto_reading.car(),
                         proto_reading.solar());
}

proto::Bucket EnergyDataConverter::to_protobuf(const EnergyBucket& bucket) {
    proto::Bucket proto_bucket;
    proto_bucket.set_bucket_start(bucket.bucket_start);
    proto_bucket.set_bucket_end(bucket.bucket_end);
    proto_bucket.set_home_kwh(bucket.home_kwh);
    proto_bucket.set_grid_kwh(bucket.grid_kwh);
    proto_bucket.set_car_kwh(bucket.car_kwh);
    proto_bucket.set_solar_kwh(bucket.solar_kwh);
    proto_bucket.set_readings_count(bucket.readings_count);
    proto_bucket.set_first_timestamp(bucket.first_timestamp);
    proto_bucket.set_last_timestamp(bucket.last_timestamp);
    proto_bucket.set_first_home(bucket.first_home);
    proto_bucket.set_first_grid(bucket.first_grid);
    proto_bucket.set_first_car(bucket.first_car);
    proto_bucket.set_first_solar(bucket.first_solar);
    proto_bucket.set_last_home(bucket.last_home);
    proto_bucket.set_last_grid(bucket.last_grid);
    proto_bucket.set_last_car(bucket.last_car);
    proto_bucket.set_last_solar(bucket.last_solar);
    return proto_bucket;
}

EnergyBucket EnergyDataConverter::from_protobuf(const proto::Bucket& proto_bucket) {
    EnergyBucket bucket;
    bucket.bucket_start = proto_bucket.bucket_start();
    bucket.bucket_end = proto_bucket.bucket_end();
    bucket.home_kwh = proto_bucket.home_kwh();
    bucket.grid_kwh = proto_bucket.grid_kwh();
    bucket.car_kwh = proto_bucket.car_kwh();
    bucket.solar_kwh = proto_bucket.solar_kwh();
    bucket.readings_count = proto_bucket.readings_count();
    bucket.first_timestamp = proto_bucket.first_timestamp();
    bucket.last_timestamp = proto_bucket.last_timestamp();
    bucket.first_home = proto_bucket.first_home();
    bucket.first_grid = proto_bucket.first_grid();
    bucket.first_car = proto_bucket.first_car();
    bucket.first_solar = proto_bucket.first_solar();
    bucket.last_home = proto_bucket.last_home();
    bucket.last_grid = proto_bucket.last_grid();
    bucket.last_car = proto_bucket.last_car();
    bucket.last_solar = proto_bucket.last_solar();
    return bucket;
}

proto::AggregationCheckpoint EnergyDataConverter::to_protobuf(const AggregationCheckpoint& checkpoint) {
    proto::AggregationCheckpoint proto_checkpoint;
    proto_checkpoint.set_last_processed_timestamp(checkpoint.last_processed_timestamp);
    proto_checkpoint.set_last_run_at(checkpoint.last_run_at);
    proto_checkpoint.set_generation(checkpoint.generation);
    if (checkpoint.rollups_dirty_from.has_value()) {
        proto_checkpoint.set_rollups_dirty_from(*checkpoint.rollups_dirty_from);
    }

    switch (checkpoint.status) {
        case JobStatus::RUNNING:
            proto_checkpoint.set_status(proto::AggregationCheckpoint::RUNNING);
            break;
        case JobStatus::COMPLETED:
            proto_checkpoint.set_status(proto::AggregationCheckpoint::COMPLETED);
            break;
        case JobStatus::ERROR:
            proto_checkpoint.set_status(proto::AggregationCheckpoint::ERROR);
            break;
    }

    return proto_checkpoint;
}

AggregationCheckpoint EnergyDataConverter::from_protobuf(const proto::AggregationCheckpoint& proto_checkpoint) {
    AggregationCheckpoint checkpoint;
    checkpoint.last_processed_timestamp = proto_checkpoint.last_processed_timestamp();
    checkpoint.last_run_at = proto_checkpoint.last_run_at();
    checkpoint.generation = proto_checkpoint.generation();
    if (proto_checkpoint.has_rollups_dirty_from()) {
        checkpoint.rollups_dirty_from = proto_checkpoint.rollups_dirty_from();
    }

    switch (proto_checkpoint.status()) {
        case proto::AggregationCheckpoint::COMPLETED:
            checkpoint.status = JobStatus::COMPLETED;
            break;
        case proto::AggregationCheckpoint::ERROR:
            checkpoint.status = JobStatus::ERROR;
            break;
        default:
            checkpoint.status = JobStatus::RUNNING;
            break;
    }

    return checkpoint;
}

namespace {

void fill_response(const AggregatedResponse& response, proto::AggregatedResponse* proto_response) {
    proto_response->set_total(response.total);
    for (const auto& point : response.data) {
        auto* proto_point = proto_response->add_data();
        proto_point->set_label(point.label);
        proto_point->set_kwh(point.kwh);
        proto_point->set_timestamp(point.timestamp);
    }
}

AggregatedResponse read_response(const proto::AggregatedResponse& proto_response) {
    AggregatedResponse response;
    response.total = proto_response.total();
    response.data.reserve(proto_response.data_size());
    for (const auto& proto_point : proto_response.data()) {
        response.data.push_back({proto_point.label(), proto_point.kwh(), proto_point.timestamp()});
    }
    return response;
}

} // namespace

proto::AggregatedResult EnergyDataConverter::to_protobuf(const AggregatedResult& result) {
    proto::AggregatedResult proto_result;

    if (const auto* grid = std::get_if<GridAggregatedResponse>(&result)) {
        proto_result.set_is_grid(true);
        fill_response(grid->consumption, proto_result.mutable_series());
        fill_response(grid->feed_in, proto_result.mutable_feed_in());
    } else {
        proto_result.set_is_grid(false);
        fill_response(std::get<AggregatedResponse>(result), proto_result.mutable_series());
    }

    return proto_result;
}

AggregatedResult EnergyDataConverter::from_protobuf(const proto::AggregatedResult& proto_result) {
    if (proto_result.is_grid()) {
        GridAggregatedResponse grid;
        grid.consumption = read_response(proto_result.series());
        grid.feed_in = read_response(proto_result.feed_in());
        return grid;
    }
    return read_response(proto_result.series());
}

template <typename Message>
static std::string serialize_message(const Message& message) {
    std::string serialized_data;
    if (!message.SerializeToString(&serialized_data)) {
        return "";
    }
    return serialized_data;
}

std::string EnergyDataConverter::serialize(const EnergyReading& reading) {
    return serialize_message(to_protobuf(reading));
}

std::string EnergyDataConverter::serialize(const EnergyBucket& bucket) {
    return serialize_message(to_protobuf(bucket));
}

std::string EnergyDataConverter::serialize(const AggregationCheckpoint& checkpoint) {
    return serialize_message(to_protobuf(checkpoint));
}

std::string EnergyDataConverter::serialize(const AggregatedResult& result) {
    return serialize_message(to_protobuf(result));
}

std::optional<EnergyReading> EnergyDataConverter::deserialize_reading(const std::string& data) {
    proto::Reading proto_reading;
    if (!proto_reading.ParseFromString(data)) {
        return std::nullopt;
    }
    return from_protobuf(proto_reading);
}

std::optional<EnergyBucket> EnergyDataConverter::deserialize_bucket(const std::string& data) {
    proto::Bucket proto_bucket;
    if (!proto_bucket.ParseFromString(data)) {
        return std::nullopt;
    }
    return from_protobuf(proto_bucket);
}

std::optional<AggregationCheckpoint> EnergyDataConverter::deserialize_checkpoint(const std::string& data) {
    proto::AggregationCheckpoint proto_checkpoint;
    if (!proto_checkpoint.ParseFromString(data)) {
        return std::nullopt;
    }
    return from_protobuf(proto_checkpoint);
}

std::optional<AggregatedResult> EnergyDataConverter::deserialize_result(const std::string& data) {
    proto::AggregatedResult proto_result;
    if (!proto_result.ParseFromString(data)) {
        return std::nullopt;
    }
    return from_protobuf(proto_result);
}

} // namespace energy_rollup

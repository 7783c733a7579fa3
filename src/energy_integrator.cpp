#include "energy_integrator.hpp"
#include <algorithm>
#include <map>
#include <ctime>
#include <cstdio>

namespace energy_rollup {

ValueFilter SampleFilters::non_negative() {
    return [](double value) -> std::optional<double> {
        if (value >= 0.0) return value;
        return std::nullopt;
    };
}

ValueFilter SampleFilters::positive() {
    return [](double value) -> std::optional<double> {
        if (value > 0.0) return value;
        return std::nullopt;
    };
}

ValueFilter SampleFilters::negative_flipped() {
    return [](double value) -> std::optional<double> {
        if (value < 0.0) return -value;
        return std::nullopt;
    };
}

double EnergyIntegrator::integrate(const std::vector<PowerSample>& samples) {
    if (samples.size() < 2) {
        return 0.0;
    }

    // Watt-seconds
    double energy_ws = 0.0;
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
        const auto& a = samples[i];
        const auto& b = samples[i + 1];
        double dt = static_cast<double>(b.timestamp - a.timestamp);
        energy_ws += ((a.value + b.value) / 2.0) * dt;
    }

    return energy_ws / 3600.0 / 1000.0;
}

std::vector<AggregatedDataPoint> EnergyIntegrator::group_by_fixed_window(
    const std::vector<EnergyReading>& readings,
    Granularity granularity,
    const ValueExtractor& extractor,
    const ValueFilter& filter) {

    auto samples = extract_samples(readings, extractor, filter);
    if (samples.empty()) {
        return {};
    }

    // Samples are sorted, so each window keeps its own order
    std::map<int64_t, std::vector<PowerSample>> windows;
    for (const auto& sample : samples) {
        windows[window_start(sample.timestamp, granularity)].push_back(sample);
    }

    std::vector<AggregatedDataPoint> points;
    points.reserve(windows.size());

    for (const auto& [start, window_samples] : windows) {
        if (window_samples.size() < 2) {
            continue;
        }

        AggregatedDataPoint point;
        point.label = window_label(start, granularity);
        point.kwh = integrate(window_samples);
        point.timestamp = start;
        points.push_back(std::move(point));
    }

    return points;
}

double EnergyIntegrator::total_energy(
    const std::vector<EnergyReading>& readings,
    const ValueExtractor& extractor,
    const ValueFilter& filter) {

    return integrate(extract_samples(readings, extractor, filter));
}

int64_t EnergyIntegrator::window_start(int64_t timestamp, Granularity granularity) {
    if (granularity == Granularity::DAY) {
        return local_day_start(timestamp);
    }

    int64_t rem = timestamp % SECONDS_PER_HOUR;
    return rem < 0 ? timestamp - rem - SECONDS_PER_HOUR : timestamp - rem;
}

int64_t EnergyIntegrator::next_window_start(int64_t window_start, Granularity granularity) {
    if (granularity == Granularity::HOUR) {
        return window_start + SECONDS_PER_HOUR;
    }
    // 26h lands inside the next local day whether today has 23, 24 or 25 hours
    return local_day_start(window_start + 26 * SECONDS_PER_HOUR);
}

int64_t EnergyIntegrator::local_day_start(int64_t timestamp) {
    std::time_t time_value = static_cast<std::time_t>(timestamp);
    std::tm tm_value{};
    localtime_r(&time_value, &tm_value);

    tm_value.tm_hour = 0;
    tm_value.tm_min = 0;
    tm_value.tm_sec = 0;
    tm_value.tm_isdst = -1;

    return static_cast<int64_t>(std::mktime(&tm_value));
}

std::string EnergyIntegrator::window_label(int64_t window_start, Granularity granularity) {
    std::time_t time_value = static_cast<std::time_t>(window_start);
    std::tm tm_value{};
    localtime_r(&time_value, &tm_value);

    char buffer[32];
    if (granularity == Granularity::HOUR) {
        std::snprintf(buffer, sizeof(buffer), "%02d:00", tm_value.tm_hour);
        return buffer;
    }

    char month[8];
    std::strftime(month, sizeof(month), "%b", &tm_value);
    std::snprintf(buffer, sizeof(buffer), "%s %d", month, tm_value.tm_mday);
    return buffer;
}

ValueExtractor EnergyIntegrator::extractor_for(ChannelType channel) {
    return [channel](const EnergyReading& reading) {
        return reading.value(channel);
    };
}

std::vector<PowerSample> EnergyIntegrator::extract_samples(
    const std::vector<EnergyReading>& readings,
    const ValueExtractor& extractor,
    const ValueFilter& filter) {

    std::vector<PowerSample> samples;
    samples.reserve(readings.size());

    for (const auto& reading : readings) {
        double value = extractor(reading);
        if (filter) {
            auto kept = filter(value);
            if (!kept.has_value()) {
                continue;
            }
            value = kept.value();
        }
        samples.push_back({reading.timestamp, value});
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const PowerSample& a, const PowerSample& b) {
                         return a.timestamp < b.timestamp;
                     });

    return samples;
}

// TimeframeParser implementation
std::optional<TimeframeBounds> TimeframeParser::resolve(const std::string& timeframe, int64_t now) {
    if (!is_valid(timeframe)) {
        return std::nullopt;
    }

    std::time_t now_value = static_cast<std::time_t>(now);
    std::tm tm_value{};
    localtime_r(&now_value, &tm_value);
    tm_value.tm_hour = 0;
    tm_value.tm_min = 0;
    tm_value.tm_sec = 0;
    tm_value.tm_isdst = -1;

    TimeframeBounds bounds;
    bounds.end = now;

    if (timeframe == "day") {
        bounds.start = static_cast<int64_t>(std::mktime(&tm_value));
        bounds.granularity = Granularity::HOUR;
    } else if (timeframe == "yesterday") {
        std::tm today = tm_value;
        bounds.end = static_cast<int64_t>(std::mktime(&today));
        tm_value.tm_mday -= 1;
        bounds.start = static_cast<int64_t>(std::mktime(&tm_value));
        bounds.granularity = Granularity::HOUR;
    } else if (timeframe == "week") {
        tm_value.tm_mday -= 7;
        bounds.start = static_cast<int64_t>(std::mktime(&tm_value));
        bounds.granularity = Granularity::DAY;
    } else {
        tm_value.tm_mday = 1;
        bounds.start = static_cast<int64_t>(std::mktime(&tm_value));
        bounds.granularity = Granularity::DAY;
    }

    return bounds;
}

bool TimeframeParser::is_valid(const std::string& timeframe) {
    const auto supported = get_supported_timeframes();
    return std::find(supported.begin(), supported.end(), timeframe) != supported.end();
}

std::vector<std::string> TimeframeParser::get_supported_timeframes() {
    return {"day", "yesterday", "week", "month"};
}

} // namespace energy_rollup

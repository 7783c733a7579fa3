#pragma once

#include <vector>
#include <string>
#include <optional>
#include <functional>
#include "energy_data.hpp"

namespace energy_rollup {

/**
 * A single (timestamp, watts) point fed to trapezoidal integration
 */
struct PowerSample {
    int64_t timestamp = 0;
    double value = 0.0;
};

/**
 * Pulls one channel's watts out of a reading
 */
using ValueExtractor = std::function<double(const EnergyReading&)>;

/**
 * Decides whether a sample survives and what value it carries.
 * Returning nullopt drops the sample; returning a value keeps it (possibly transformed).
 */
using ValueFilter = std::function<std::optional<double>(double)>;

/**
 * Common filters used by the query engine
 */
class SampleFilters {
public:
    // Keeps value >= 0 (grid consumption)
    static ValueFilter non_negative();

    // Keeps value > 0 (home, car, solar)
    static ValueFilter positive();

    // Keeps value < 0 and flips its sign (grid feed-in)
    static ValueFilter negative_flipped();
};

/**
 * Trapezoidal energy integration and fixed-window grouping.
 * All functions are pure; the query engine and the bucket aggregator share them.
 */
class EnergyIntegrator {
public:
    /**
     * Integrate power samples into energy
     * @param samples Samples sorted by timestamp ascending
     * @return Energy in kWh, 0 if fewer than two samples
     */
    static double integrate(const std::vector<PowerSample>& samples);

    /**
     * Integrate readings grouped into hour or local-day windows
     * @param readings Readings in any order
     * @param granularity Window size
     * @param extractor Channel extractor
     * @param filter Optional sample filter applied before windowing
     * @return One point per window with at least two surviving samples, ascending
     */
    static std::vector<AggregatedDataPoint> group_by_fixed_window(
        const std::vector<EnergyReading>& readings,
        Granularity granularity,
        const ValueExtractor& extractor,
        const ValueFilter& filter = {});

    /**
     * Integrate all filtered readings as one continuous run
     * @return Energy in kWh, 0 if fewer than two samples survive
     */
    static double total_energy(
        const std::vector<EnergyReading>& readings,
        const ValueExtractor& extractor,
        const ValueFilter& filter = {});

    /**
     * Start of the window containing the timestamp.
     * Hours are floor(ts / 3600) * 3600, days start at local midnight.
     */
    static int64_t window_start(int64_t timestamp, Granularity granularity);

    /**
     * Start of the window following the one starting at window_start.
     * Day windows follow local midnights, so they may span 23 or 25 hours.
     */
    static int64_t next_window_start(int64_t window_start, Granularity granularity);

    /**
     * Local midnight of the calendar day containing the timestamp
     */
    static int64_t local_day_start(int64_t timestamp);

    /**
     * Display label for a window: "HH:00" for hours, "Mon D" for days
     */
    static std::string window_label(int64_t window_start, Granularity granularity);

    static ValueExtractor extractor_for(ChannelType channel);

private:
    /**
     * Apply extractor and filter, then sort by timestamp
     */
    static std::vector<PowerSample> extract_samples(
        const std::vector<EnergyReading>& readings,
        const ValueExtractor& extractor,
        const ValueFilter& filter);
};

/**
 * Resolved time range for a named dashboard timeframe
 */
struct TimeframeBounds {
    int64_t start = 0;
    int64_t end = 0;
    Granularity granularity = Granularity::HOUR;
};

/**
 * Timeframe parsing utilities ("day", "yesterday", "week", "month")
 */
class TimeframeParser {
public:
    /**
     * Resolve a named timeframe relative to now, in local time
     * @param timeframe Timeframe name
     * @param now Current Unix time in seconds
     * @return Bounds and grouping granularity, or nullopt for an unknown name
     */
    static std::optional<TimeframeBounds> resolve(const std::string& timeframe, int64_t now);

    static bool is_valid(const std::string& timeframe);

    static std::vector<std::string> get_supported_timeframes();
};

} // namespace energy_rollup

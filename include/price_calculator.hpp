#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "energy_data.hpp"

namespace energy_rollup {

/**
 * Tariff window in minutes of the local day [0, 1439].
 * start_minute > end_minute wraps past midnight.
 */
struct ConsumingPeriod {
    int start_minute = 0;
    int end_minute = 0;
    double price = 0.0;

    bool contains(int minute_of_day) const;
};

/**
 * Consumption tariffs plus a flat feed-in compensation
 */
struct PricingSchedule {
    double producing_price = 0.0;
    std::vector<ConsumingPeriod> consuming_periods;
};

enum class PricingMethod {
    CONSUMPTION,
    FEED_IN
};

struct CostDataPoint {
    std::string label;
    double kwh = 0.0;
    double cost = 0.0;
    int64_t timestamp = 0;
};

struct CostSeries {
    std::vector<CostDataPoint> data;
    double total_kwh = 0.0;
    double total_cost = 0.0;
};

/**
 * Stateless conversion of energy into money
 */
class PriceCalculator {
public:
    /**
     * Cost of consumed energy at the tariff in force at the timestamp.
     * The first period containing the local minute of day wins. A minute
     * outside every period falls back to the first period's price.
     * @return 0 if kwh <= 0, no schedule, or no periods
     */
    static double consumption_cost(double kwh, int64_t timestamp,
                                   const std::optional<PricingSchedule>& schedule);

    /**
     * Compensation for energy fed into the grid
     * @return 0 if kwh <= 0 or no schedule
     */
    static double feed_in_cost(double kwh, const std::optional<PricingSchedule>& schedule);

    /**
     * Price every point of a query result.
     * total_kwh is the response total, total_cost the sum of point costs.
     */
    static CostSeries price_series(const AggregatedResponse& response,
                                   const std::optional<PricingSchedule>& schedule,
                                   PricingMethod method);

    /**
     * Pricing method for a channel: consumption for home and car, feed-in for solar.
     * Grid consumption and grid feed-in are priced by the caller per series.
     */
    static PricingMethod method_for(ChannelType channel);

    /**
     * Minute of the local day, 0..1439
     */
    static int local_minute_of_day(int64_t timestamp);
};

} // namespace energy_rollup

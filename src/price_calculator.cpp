#include "price_calculator.hpp"
#include <ctime>

namespace energy_rollup {

bool ConsumingPeriod::contains(int minute_of_day) const {
    if (start_minute <= minute_of_day && minute_of_day < end_minute) {
        return true;
    }
    // Wraps past midnight, e.g. 22:00 to 06:00
    if (start_minute > end_minute) {
        return minute_of_day >= start_minute || minute_of_day < end_minute;
    }
    return false;
}

double PriceCalculator::consumption_cost(double kwh, int64_t timestamp,
                                         const std::optional<PricingSchedule>& schedule) {
    if (!schedule.has_value() || kwh <= 0.0) {
        return 0.0;
    }

    const auto& periods = schedule->consuming_periods;
    if (periods.empty()) {
        return 0.0;
    }

    const int minute = local_minute_of_day(timestamp);
    for (const auto& period : periods) {
        if (period.contains(minute)) {
            return kwh * period.price;
        }
    }

    // Gap in the schedule
    return kwh * periods.front().price;
}

double PriceCalculator::feed_in_cost(double kwh, const std::optional<PricingSchedule>& schedule) {
    if (!schedule.has_value() || kwh <= 0.0) {
        return 0.0;
    }
    return kwh * schedule->producing_price;
}

CostSeries PriceCalculator::price_series(const AggregatedResponse& response,
                                         const std::optional<PricingSchedule>& schedule,
                                         PricingMethod method) {
    CostSeries series;
    series.total_kwh = response.total;
    series.data.reserve(response.data.size());

    for (const auto& point : response.data) {
        CostDataPoint priced;
        priced.label = point.label;
        priced.kwh = point.kwh;
        priced.timestamp = point.timestamp;
        priced.cost = method == PricingMethod::CONSUMPTION
            ? consumption_cost(point.kwh, point.timestamp, schedule)
            : feed_in_cost(point.kwh, schedule);

        series.total_cost += priced.cost;
        series.data.push_back(std::move(priced));
    }

    return series;
}

PricingMethod PriceCalculator::method_for(ChannelType channel) {
    return channel == ChannelType::SOLAR ? PricingMethod::FEED_IN : PricingMethod::CONSUMPTION;
}

int PriceCalculator::local_minute_of_day(int64_t timestamp) {
    std::time_t time_value = static_cast<std::time_t>(timestamp);
    std::tm tm_value{};
    localtime_r(&time_value, &tm_value);
    return tm_value.tm_hour * 60 + tm_value.tm_min;
}

} // namespace energy_rollup

#include <gtest/gtest.h>
#include "price_calculator.hpp"
#include "test_doubles.hpp"

using namespace energy_rollup;
using energy_rollup::test_support::BASE;

class PriceCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_support::use_utc();

        PricingSchedule tariff;
        tariff.producing_price = 0.08;
        tariff.consuming_periods = {
            ConsumingPeriod{1320, 360, 0.21},
            ConsumingPeriod{360, 1320, 0.34}
        };
        schedule_ = tariff;
    }

    std::optional<PricingSchedule> schedule_;
};

TEST_F(PriceCalculatorTest, PeriodWrapsPastMidnight) {
    ConsumingPeriod night{1320, 360, 0.21};

    EXPECT_TRUE(night.contains(60));
    EXPECT_TRUE(night.contains(1380));
    EXPECT_TRUE(night.contains(1320));
    EXPECT_FALSE(night.contains(360));
    EXPECT_FALSE(night.contains(700));
}

TEST_F(PriceCalculatorTest, PlainPeriodIsHalfOpen) {
    ConsumingPeriod day{360, 1320, 0.34};

    EXPECT_TRUE(day.contains(360));
    EXPECT_TRUE(day.contains(1319));
    EXPECT_FALSE(day.contains(1320));
    EXPECT_FALSE(day.contains(0));
}

TEST_F(PriceCalculatorTest, ConsumptionUsesTariffInForce) {
    // BASE is 22:00, ten hours later is 08:00
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE, schedule_), 2.0 * 0.21);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE + 10 * SECONDS_PER_HOUR, schedule_), 2.0 * 0.34);
}

TEST_F(PriceCalculatorTest, FirstMatchingPeriodWins) {
    schedule_->consuming_periods = {
        ConsumingPeriod{0, 1440, 0.10},
        ConsumingPeriod{1320, 1380, 0.50}
    };

    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(1.0, BASE, schedule_), 0.10);
}

TEST_F(PriceCalculatorTest, UncoveredMinuteFallsBackToFirstPeriod) {
    schedule_->consuming_periods = {
        ConsumingPeriod{360, 720, 0.25},
        ConsumingPeriod{720, 1080, 0.30}
    };

    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(4.0, BASE, schedule_), 4.0 * 0.25);
}

TEST_F(PriceCalculatorTest, NothingToPriceGivesZero) {
    PricingSchedule no_periods;
    no_periods.producing_price = 0.08;

    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(3.0, BASE, no_periods), 0.0);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(3.0, BASE, std::nullopt), 0.0);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(0.0, BASE, schedule_), 0.0);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(-1.0, BASE, schedule_), 0.0);
    EXPECT_DOUBLE_EQ(PriceCalculator::feed_in_cost(-1.0, schedule_), 0.0);
    EXPECT_DOUBLE_EQ(PriceCalculator::feed_in_cost(1.0, std::nullopt), 0.0);
}

TEST_F(PriceCalculatorTest, FeedInUsesFlatProducingPrice) {
    EXPECT_DOUBLE_EQ(PriceCalculator::feed_in_cost(2.0, schedule_), 2.0 * 0.08);
}

TEST_F(PriceCalculatorTest, SeriesIsPricedPerPoint) {
    AggregatedResponse response;
    response.data = {
        AggregatedDataPoint{"22:00", 1.0, BASE},
        AggregatedDataPoint{"08:00", 2.0, BASE + 10 * SECONDS_PER_HOUR}
    };
    response.total = 3.0;

    auto priced = PriceCalculator::price_series(response, schedule_, PricingMethod::CONSUMPTION);

    ASSERT_EQ(priced.data.size(), 2u);
    EXPECT_EQ(priced.data[0].label, "22:00");
    EXPECT_DOUBLE_EQ(priced.data[0].cost, 0.21);
    EXPECT_DOUBLE_EQ(priced.data[1].cost, 0.68);
    EXPECT_DOUBLE_EQ(priced.total_kwh, 3.0);
    EXPECT_DOUBLE_EQ(priced.total_cost, 0.21 + 0.68);

    auto compensated = PriceCalculator::price_series(response, schedule_, PricingMethod::FEED_IN);
    EXPECT_DOUBLE_EQ(compensated.total_cost, 1.0 * 0.08 + 2.0 * 0.08);
}

TEST_F(PriceCalculatorTest, SolarIsCompensatedOtherChannelsAreCharged) {
    EXPECT_EQ(PriceCalculator::method_for(ChannelType::SOLAR), PricingMethod::FEED_IN);
    EXPECT_EQ(PriceCalculator::method_for(ChannelType::HOME), PricingMethod::CONSUMPTION);
    EXPECT_EQ(PriceCalculator::method_for(ChannelType::CAR), PricingMethod::CONSUMPTION);
}

TEST_F(PriceCalculatorTest, MinuteOfDayFollowsLocalTime) {
    EXPECT_EQ(PriceCalculator::local_minute_of_day(BASE), 1320);
    EXPECT_EQ(PriceCalculator::local_minute_of_day(BASE + 2 * SECONDS_PER_HOUR + 90), 1);
}

class LocalTimePricingTest : public PriceCalculatorTest {
protected:
    void TearDown() override {
        test_support::use_utc();
    }
};

TEST_F(LocalTimePricingTest, MinuteOfDaySkipsTheSpringForwardHour) {
    test_support::use_time_zone("America/New_York");

    // 2024-03-10 03:00 EDT, one second earlier was 01:59:59 EST
    EXPECT_EQ(PriceCalculator::local_minute_of_day(1710054000), 180);
    EXPECT_EQ(PriceCalculator::local_minute_of_day(1710053999), 119);
}

TEST_F(LocalTimePricingTest, NightTariffWrapsAtLocalMidnight) {
    test_support::use_time_zone("America/New_York");

    // BASE is 17:00 EST, five hours later is 22:00 EST
    EXPECT_EQ(PriceCalculator::local_minute_of_day(BASE), 1020);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE, schedule_), 2.0 * 0.34);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE + 5 * SECONDS_PER_HOUR, schedule_), 2.0 * 0.21);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE + 14 * SECONDS_PER_HOUR, schedule_), 2.0 * 0.34);

    test_support::use_time_zone("Europe/Berlin");

    // BASE is 23:00 CET
    EXPECT_EQ(PriceCalculator::local_minute_of_day(BASE), 1380);
    EXPECT_DOUBLE_EQ(PriceCalculator::consumption_cost(2.0, BASE, schedule_), 2.0 * 0.21);
}

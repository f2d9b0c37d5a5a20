#include <gtest/gtest.h>
#include "bar_catalog/catalog/timeframe.hpp"
#include "bar_catalog/core/time_utils.hpp"

using namespace bar_catalog;

class TimeframeTest : public ::testing::Test {};

TEST_F(TimeframeTest, ParseValidSpecs) {
    auto minute = TimeframeSpec::parse("1-MINUTE-LAST");
    ASSERT_TRUE(minute.is_ok());
    EXPECT_EQ(minute.value().step, 1u);
    EXPECT_EQ(minute.value().aggregation, BarAggregation::MINUTE);
    EXPECT_EQ(minute.value().price_type, PriceType::LAST);
    EXPECT_FALSE(minute.value().is_day_level());
    EXPECT_EQ(minute.value().interval(), std::chrono::minutes(1));

    auto five_mid = TimeframeSpec::parse("5-MINUTE-MID");
    ASSERT_TRUE(five_mid.is_ok());
    EXPECT_EQ(five_mid.value().interval(), std::chrono::minutes(5));
    EXPECT_EQ(five_mid.value().to_string(), "5-MINUTE-MID");

    auto week = TimeframeSpec::parse("1-WEEK-BID");
    ASSERT_TRUE(week.is_ok());
    EXPECT_TRUE(week.value().is_day_level());
}

TEST_F(TimeframeTest, ParseRejectsMalformed) {
    for (const char* text : {"", "MINUTE", "1-MINUTE", "0-MINUTE-LAST", "x-MINUTE-LAST",
                             "1-FORTNIGHT-LAST", "1-MINUTE-CLOSE", "1-MINUTE-LAST-EXTERNAL",
                             "1-minute-last"}) {
        auto parsed = TimeframeSpec::parse(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::INVALID_ARGUMENT);
    }
}

class TimeframeResolverTest : public ::testing::Test {
protected:
    TimeframeResolver resolver_;
};

TEST_F(TimeframeResolverTest, DateOnlyStartMeansDailyBars) {
    auto spec = resolver_.resolve(std::nullopt, core::make_utc(2024, 1, 19),
                                  core::make_utc(2024, 2, 28));
    ASSERT_TRUE(spec.is_ok());
    EXPECT_EQ(spec.value(), "1-DAY-LAST");
}

TEST_F(TimeframeResolverTest, IntradayStartMeansMinuteBars) {
    auto spec = resolver_.resolve(std::nullopt, core::make_utc(2024, 1, 2, 9, 30),
                                  core::make_utc(2024, 1, 2, 10, 30));
    ASSERT_TRUE(spec.is_ok());
    EXPECT_EQ(spec.value(), "1-MINUTE-LAST");
}

TEST_F(TimeframeResolverTest, ExplicitSpecWins) {
    auto spec = resolver_.resolve(std::string("01-HOUR-LAST"), core::make_utc(2024, 1, 2),
                                  core::make_utc(2024, 1, 3));
    ASSERT_TRUE(spec.is_ok());
    EXPECT_EQ(spec.value(), "1-HOUR-LAST");

    auto invalid = resolver_.resolve(std::string("hourly"), core::make_utc(2024, 1, 2),
                                     core::make_utc(2024, 1, 3));
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(TimeframeResolverTest, EmptyExplicitSpecFallsBackToDetection) {
    auto spec = resolver_.resolve(std::string(""), core::make_utc(2024, 1, 2),
                                  core::make_utc(2024, 1, 3));
    ASSERT_TRUE(spec.is_ok());
    EXPECT_EQ(spec.value(), "1-DAY-LAST");
}

TEST_F(TimeframeResolverTest, EndBeforeStartRejected) {
    auto spec = resolver_.resolve(std::nullopt, core::make_utc(2024, 1, 3),
                                  core::make_utc(2024, 1, 2));
    ASSERT_TRUE(spec.is_error());
    EXPECT_EQ(spec.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(TimeframeResolverTest, ConfigurableDefaults) {
    TimeframeResolver resolver("1-WEEK-LAST", "5-SECOND-MID");
    EXPECT_EQ(resolver.resolve(std::nullopt, core::make_utc(2024, 1, 1),
                               core::make_utc(2024, 3, 1))
                  .value(),
              "1-WEEK-LAST");
    EXPECT_EQ(resolver.resolve(std::nullopt, core::make_utc(2024, 1, 1, 0, 0, 1),
                               core::make_utc(2024, 1, 1, 0, 5))
                  .value(),
              "5-SECOND-MID");
}

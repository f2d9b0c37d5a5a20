//===== timeframe.hpp =====
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief Bar aggregation unit
 */
enum class BarAggregation { SECOND, MINUTE, HOUR, DAY, WEEK, MONTH };

/**
 * @brief Price a bar is built from
 */
enum class PriceType { BID, ASK, MID, LAST };

std::string bar_aggregation_to_string(BarAggregation aggregation);
std::optional<BarAggregation> bar_aggregation_from_string(const std::string& text);
std::string price_type_to_string(PriceType price_type);
std::optional<PriceType> price_type_from_string(const std::string& text);

/**
 * @brief Parsed form of a "STEP-AGGREGATION-PRICE_TYPE" string such as "1-MINUTE-LAST"
 */
struct TimeframeSpec {
    uint32_t step{1};
    BarAggregation aggregation{BarAggregation::MINUTE};
    PriceType price_type{PriceType::LAST};

    static Result<TimeframeSpec> parse(const std::string& text);

    std::string to_string() const;

    /**
     * @brief True for DAY, WEEK and MONTH bars
     * Coverage for these compares calendar dates rather than timestamps
     */
    bool is_day_level() const {
        return aggregation == BarAggregation::DAY || aggregation == BarAggregation::WEEK ||
               aggregation == BarAggregation::MONTH;
    }

    /**
     * @brief Nominal bar interval (a month counts as 30 days)
     */
    std::chrono::nanoseconds interval() const;
};

/**
 * @brief Picks the timeframe of a request
 *
 * An explicit timeframe is validated and used as given. Otherwise the request
 * start decides: a start on UTC midnight means the caller passed bare dates
 * and gets day bars, anything else gets minute bars.
 */
class TimeframeResolver {
public:
    TimeframeResolver(std::string day_timeframe = "1-DAY-LAST",
                      std::string intraday_timeframe = "1-MINUTE-LAST");

    Result<std::string> resolve(const std::optional<std::string>& explicit_timeframe,
                                const Timestamp& start, const Timestamp& end) const;

    const std::string& day_timeframe() const {
        return day_timeframe_;
    }
    const std::string& intraday_timeframe() const {
        return intraday_timeframe_;
    }

private:
    std::string day_timeframe_;
    std::string intraday_timeframe_;
};

}  // namespace bar_catalog

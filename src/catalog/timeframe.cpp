//===== timeframe.cpp =====

#include "bar_catalog/catalog/timeframe.hpp"
#include <cctype>
#include "bar_catalog/core/logger.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

std::string bar_aggregation_to_string(BarAggregation aggregation) {
    switch (aggregation) {
        case BarAggregation::SECOND:
            return "SECOND";
        case BarAggregation::MINUTE:
            return "MINUTE";
        case BarAggregation::HOUR:
            return "HOUR";
        case BarAggregation::DAY:
            return "DAY";
        case BarAggregation::WEEK:
            return "WEEK";
        case BarAggregation::MONTH:
            return "MONTH";
        default:
            return "UNKNOWN";
    }
}

std::optional<BarAggregation> bar_aggregation_from_string(const std::string& text) {
    if (text == "SECOND")
        return BarAggregation::SECOND;
    if (text == "MINUTE")
        return BarAggregation::MINUTE;
    if (text == "HOUR")
        return BarAggregation::HOUR;
    if (text == "DAY")
        return BarAggregation::DAY;
    if (text == "WEEK")
        return BarAggregation::WEEK;
    if (text == "MONTH")
        return BarAggregation::MONTH;
    return std::nullopt;
}

std::string price_type_to_string(PriceType price_type) {
    switch (price_type) {
        case PriceType::BID:
            return "BID";
        case PriceType::ASK:
            return "ASK";
        case PriceType::MID:
            return "MID";
        case PriceType::LAST:
            return "LAST";
        default:
            return "UNKNOWN";
    }
}

std::optional<PriceType> price_type_from_string(const std::string& text) {
    if (text == "BID")
        return PriceType::BID;
    if (text == "ASK")
        return PriceType::ASK;
    if (text == "MID")
        return PriceType::MID;
    if (text == "LAST")
        return PriceType::LAST;
    return std::nullopt;
}

Result<TimeframeSpec> TimeframeSpec::parse(const std::string& text) {
    const auto first_dash = text.find('-');
    const auto second_dash =
        first_dash == std::string::npos ? std::string::npos : text.find('-', first_dash + 1);
    if (first_dash == std::string::npos || second_dash == std::string::npos ||
        text.find('-', second_dash + 1) != std::string::npos) {
        return make_error<TimeframeSpec>(
            ErrorCode::INVALID_ARGUMENT,
            "Timeframe must look like STEP-AGGREGATION-PRICE_TYPE (e.g. 1-MINUTE-LAST): " + text,
            "TimeframeSpec");
    }

    const std::string step_text = text.substr(0, first_dash);
    if (step_text.empty() || step_text.size() > 6) {
        return make_error<TimeframeSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Invalid timeframe step: " + text, "TimeframeSpec");
    }
    uint32_t step = 0;
    for (char c : step_text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return make_error<TimeframeSpec>(ErrorCode::INVALID_ARGUMENT,
                                             "Invalid timeframe step: " + text, "TimeframeSpec");
        }
        step = step * 10 + static_cast<uint32_t>(c - '0');
    }
    if (step == 0) {
        return make_error<TimeframeSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Timeframe step must be positive: " + text,
                                         "TimeframeSpec");
    }

    auto aggregation =
        bar_aggregation_from_string(text.substr(first_dash + 1, second_dash - first_dash - 1));
    if (!aggregation) {
        return make_error<TimeframeSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown bar aggregation in timeframe: " + text,
                                         "TimeframeSpec");
    }

    auto price_type = price_type_from_string(text.substr(second_dash + 1));
    if (!price_type) {
        return make_error<TimeframeSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown price type in timeframe: " + text,
                                         "TimeframeSpec");
    }

    TimeframeSpec spec;
    spec.step = step;
    spec.aggregation = *aggregation;
    spec.price_type = *price_type;
    return Result<TimeframeSpec>(spec);
}

std::string TimeframeSpec::to_string() const {
    return std::to_string(step) + "-" + bar_aggregation_to_string(aggregation) + "-" +
           price_type_to_string(price_type);
}

std::chrono::nanoseconds TimeframeSpec::interval() const {
    using std::chrono::hours;
    using std::chrono::minutes;
    using std::chrono::seconds;

    std::chrono::nanoseconds unit;
    switch (aggregation) {
        case BarAggregation::SECOND:
            unit = seconds(1);
            break;
        case BarAggregation::MINUTE:
            unit = minutes(1);
            break;
        case BarAggregation::HOUR:
            unit = hours(1);
            break;
        case BarAggregation::DAY:
            unit = hours(24);
            break;
        case BarAggregation::WEEK:
            unit = hours(24 * 7);
            break;
        case BarAggregation::MONTH:
        default:
            unit = hours(24 * 30);
            break;
    }
    return unit * step;
}

TimeframeResolver::TimeframeResolver(std::string day_timeframe, std::string intraday_timeframe)
    : day_timeframe_(std::move(day_timeframe)),
      intraday_timeframe_(std::move(intraday_timeframe)) {}

Result<std::string> TimeframeResolver::resolve(
    const std::optional<std::string>& explicit_timeframe, const Timestamp& start,
    const Timestamp& end) const {
    if (end < start) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Request start " + core::format_iso8601(start) +
                                           " is after end " + core::format_iso8601(end),
                                       "TimeframeResolver");
    }

    if (explicit_timeframe && !explicit_timeframe->empty()) {
        auto parsed = TimeframeSpec::parse(*explicit_timeframe);
        if (parsed.is_error()) {
            return forward_error<std::string>(*parsed.error());
        }
        // Canonical form, so "01-MINUTE-LAST" resolves to "1-MINUTE-LAST"
        return Result<std::string>(parsed.value().to_string());
    }

    const std::string& resolved =
        core::is_midnight_utc(start) ? day_timeframe_ : intraday_timeframe_;
    DEBUG("Auto-detected timeframe " << resolved << " for start " << core::format_iso8601(start));
    return Result<std::string>(resolved);
}

}  // namespace bar_catalog

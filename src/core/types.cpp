//===== types.cpp =====

#include "bar_catalog/core/types.hpp"
#include <cctype>
#include <cmath>
#include <sstream>

namespace bar_catalog {

namespace {

int64_t pow10(uint8_t exponent) {
    int64_t value = 1;
    for (uint8_t i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

}  // namespace

Price Price::from_double(double value, uint8_t precision) {
    if (precision > MAX_PRECISION) {
        precision = MAX_PRECISION;
    }
    // Round to the requested precision first, then scale up
    const int64_t step = pow10(precision);
    const auto rounded = static_cast<int64_t>(std::llround(value * static_cast<double>(step)));
    return Price(rounded * (SCALE / step), precision);
}

Result<Price> Price::from_string(const std::string& text) {
    if (text.empty()) {
        return make_error<Price>(ErrorCode::CONVERSION_ERROR, "Empty price string", "Price");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t integer_part = 0;
    int64_t fraction_part = 0;
    uint8_t precision = 0;
    bool seen_digit = false;
    bool seen_dot = false;

    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '.') {
            if (seen_dot) {
                return make_error<Price>(ErrorCode::CONVERSION_ERROR,
                                         "Malformed price: " + text, "Price");
            }
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return make_error<Price>(ErrorCode::CONVERSION_ERROR, "Malformed price: " + text,
                                     "Price");
        }
        seen_digit = true;
        if (seen_dot) {
            if (precision >= MAX_PRECISION) {
                continue;  // digits beyond nanounits are truncated
            }
            fraction_part = fraction_part * 10 + (c - '0');
            ++precision;
        } else {
            if (integer_part > (INT64_MAX / SCALE) / 10) {
                return make_error<Price>(ErrorCode::CONVERSION_ERROR,
                                         "Price out of range: " + text, "Price");
            }
            integer_part = integer_part * 10 + (c - '0');
        }
    }

    if (!seen_digit) {
        return make_error<Price>(ErrorCode::CONVERSION_ERROR, "Malformed price: " + text,
                                 "Price");
    }

    int64_t raw = integer_part * SCALE + fraction_part * (SCALE / pow10(precision));
    if (negative) {
        raw = -raw;
    }
    return Result<Price>(Price(raw, precision));
}

std::string Price::to_string() const {
    std::ostringstream ss;
    int64_t abs_raw = raw < 0 ? -raw : raw;
    if (raw < 0) {
        ss << "-";
    }
    ss << abs_raw / SCALE;
    if (precision > 0) {
        const int64_t fraction = (abs_raw % SCALE) / (SCALE / pow10(precision));
        std::string digits = std::to_string(fraction);
        ss << "." << std::string(precision - digits.size(), '0') << digits;
    }
    return ss.str();
}

std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::EQUITY:
            return "EQUITY";
        case AssetClass::FUTURE:
            return "FUTURE";
        case AssetClass::OPTION:
            return "OPTION";
        case AssetClass::FOREX:
            return "FOREX";
        case AssetClass::CRYPTO:
            return "CRYPTO";
        case AssetClass::INDEX:
            return "INDEX";
        default:
            return "UNKNOWN";
    }
}

AssetClass asset_class_from_string(const std::string& text) {
    if (text == "EQUITY")
        return AssetClass::EQUITY;
    if (text == "FUTURE")
        return AssetClass::FUTURE;
    if (text == "OPTION")
        return AssetClass::OPTION;
    if (text == "FOREX")
        return AssetClass::FOREX;
    if (text == "CRYPTO")
        return AssetClass::CRYPTO;
    if (text == "INDEX")
        return AssetClass::INDEX;
    return AssetClass::UNKNOWN;
}

std::string aggregation_source_to_string(AggregationSource source) {
    return source == AggregationSource::INTERNAL ? "INTERNAL" : "EXTERNAL";
}

std::optional<AggregationSource> aggregation_source_from_string(const std::string& text) {
    if (text == "EXTERNAL")
        return AggregationSource::EXTERNAL;
    if (text == "INTERNAL")
        return AggregationSource::INTERNAL;
    return std::nullopt;
}

std::optional<InstrumentId> InstrumentId::parse(const std::string& instrument_id) {
    const auto dot = instrument_id.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= instrument_id.size()) {
        return std::nullopt;
    }
    InstrumentId id;
    id.symbol = instrument_id.substr(0, dot);
    id.venue = instrument_id.substr(dot + 1);
    return id;
}

}  // namespace bar_catalog

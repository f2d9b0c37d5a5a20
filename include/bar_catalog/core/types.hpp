//===== types.hpp =====

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "bar_catalog/core/error.hpp"

namespace bar_catalog {

/**
 * @brief Timestamp type for consistent time representation
 * Always UTC, nanosecond resolution
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/**
 * @brief Volume type, whole units only
 */
using Volume = uint64_t;

/**
 * @brief Fixed-precision decimal price
 * Stored as a raw integer at a fixed scale of 10^9 so that prices
 * survive the round trip through the column store without drift
 */
struct Price {
    static constexpr int64_t SCALE = 1000000000LL;
    static constexpr uint8_t MAX_PRECISION = 9;

    int64_t raw{0};
    uint8_t precision{0};

    Price() = default;
    Price(int64_t raw_value, uint8_t prec) : raw(raw_value), precision(prec) {}

    /**
     * @brief Build a price from a double, rounded to the given precision
     */
    static Price from_double(double value, uint8_t precision);

    /**
     * @brief Parse a decimal string such as "185.6400"
     * @return Price whose precision equals the number of fractional digits
     */
    static Result<Price> from_string(const std::string& text);

    double as_double() const {
        return static_cast<double>(raw) / static_cast<double>(SCALE);
    }

    std::string to_string() const;

    bool operator==(const Price& other) const {
        return raw == other.raw;
    }
    bool operator!=(const Price& other) const {
        return raw != other.raw;
    }
    bool operator<(const Price& other) const {
        return raw < other.raw;
    }
    bool operator<=(const Price& other) const {
        return raw <= other.raw;
    }
    bool operator>(const Price& other) const {
        return raw > other.raw;
    }
    bool operator>=(const Price& other) const {
        return raw >= other.raw;
    }
};

/**
 * @brief Asset class enumeration
 */
enum class AssetClass { EQUITY, FUTURE, OPTION, FOREX, CRYPTO, INDEX, UNKNOWN };

std::string asset_class_to_string(AssetClass asset_class);
AssetClass asset_class_from_string(const std::string& text);

/**
 * @brief Where bars of a partition came from
 * EXTERNAL bars were fetched or imported, INTERNAL bars were aggregated locally
 */
enum class AggregationSource { EXTERNAL, INTERNAL };

std::string aggregation_source_to_string(AggregationSource source);
std::optional<AggregationSource> aggregation_source_from_string(const std::string& text);

/**
 * @brief Market data bar structure
 * One OHLCV observation for an instrument over a fixed interval
 */
struct Bar {
    std::string instrument_id;   // SYMBOL.VENUE
    std::string timeframe_spec;  // e.g. 1-MINUTE-LAST
    Price open;
    Price high;
    Price low;
    Price close;
    Volume volume{0};
    Timestamp event_time;
    Timestamp ingest_time;

    Bar() = default;
    Bar(std::string id, std::string spec, Price o, Price h, Price l, Price c, Volume v,
        Timestamp ts_event, Timestamp ts_init)
        : instrument_id(std::move(id)),
          timeframe_spec(std::move(spec)),
          open(o),
          high(h),
          low(l),
          close(c),
          volume(v),
          event_time(ts_event),
          ingest_time(ts_init) {}

    /**
     * @brief Check the OHLC relationship low <= open,close <= high
     */
    bool is_consistent() const {
        return low <= open && low <= close && open <= high && close <= high && low <= high;
    }
};

/**
 * @brief Static identity and metadata of a tradable instrument
 */
struct InstrumentDescriptor {
    std::string instrument_id;
    std::string symbol;
    std::string venue;
    AssetClass asset_class{AssetClass::EQUITY};
    std::string currency{"USD"};
    uint8_t price_precision{2};
    Price tick_size{Price::SCALE / 100, 2};
    double multiplier{1.0};
    double lot_size{1.0};

    bool operator==(const InstrumentDescriptor& other) const {
        return instrument_id == other.instrument_id && symbol == other.symbol &&
               venue == other.venue && asset_class == other.asset_class &&
               currency == other.currency && price_precision == other.price_precision &&
               tick_size == other.tick_size && multiplier == other.multiplier &&
               lot_size == other.lot_size;
    }
};

/**
 * @brief Split "SYMBOL.VENUE" into its parts
 * The venue is everything after the last dot
 */
struct InstrumentId {
    std::string symbol;
    std::string venue;

    static std::optional<InstrumentId> parse(const std::string& instrument_id);

    std::string to_string() const {
        return symbol + "." + venue;
    }
};

}  // namespace bar_catalog

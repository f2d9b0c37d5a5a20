//===== conversion_utils.cpp =====

#include "bar_catalog/data/conversion_utils.hpp"
#include <algorithm>
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

std::shared_ptr<arrow::Schema> DataConversionUtils::bar_schema() {
    return arrow::schema({
        arrow::field("instrument_id", arrow::utf8(), false),
        arrow::field("timeframe_spec", arrow::utf8(), false),
        arrow::field("open", arrow::int64(), false),
        arrow::field("high", arrow::int64(), false),
        arrow::field("low", arrow::int64(), false),
        arrow::field("close", arrow::int64(), false),
        arrow::field("price_precision", arrow::int32(), false),
        arrow::field("volume", arrow::uint64(), false),
        arrow::field("ts_event", arrow::int64(), false),
        arrow::field("ts_init", arrow::int64(), false),
    });
}

std::shared_ptr<arrow::Schema> DataConversionUtils::descriptor_schema() {
    return arrow::schema({
        arrow::field("instrument_id", arrow::utf8(), false),
        arrow::field("symbol", arrow::utf8(), false),
        arrow::field("venue", arrow::utf8(), false),
        arrow::field("asset_class", arrow::utf8(), false),
        arrow::field("currency", arrow::utf8(), false),
        arrow::field("price_precision", arrow::int32(), false),
        arrow::field("tick_size", arrow::int64(), false),
        arrow::field("tick_precision", arrow::int32(), false),
        arrow::field("multiplier", arrow::float64(), false),
        arrow::field("lot_size", arrow::float64(), false),
    });
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::bars_to_arrow_table(
    const std::vector<Bar>& bars) {
    arrow::StringBuilder instrument_builder;
    arrow::StringBuilder timeframe_builder;
    arrow::Int64Builder open_builder;
    arrow::Int64Builder high_builder;
    arrow::Int64Builder low_builder;
    arrow::Int64Builder close_builder;
    arrow::Int32Builder precision_builder;
    arrow::UInt64Builder volume_builder;
    arrow::Int64Builder ts_event_builder;
    arrow::Int64Builder ts_init_builder;

    const auto rows = static_cast<int64_t>(bars.size());
    if (open_builder.Reserve(rows) != arrow::Status::OK() ||
        high_builder.Reserve(rows) != arrow::Status::OK() ||
        low_builder.Reserve(rows) != arrow::Status::OK() ||
        close_builder.Reserve(rows) != arrow::Status::OK() ||
        precision_builder.Reserve(rows) != arrow::Status::OK() ||
        volume_builder.Reserve(rows) != arrow::Status::OK() ||
        ts_event_builder.Reserve(rows) != arrow::Status::OK() ||
        ts_init_builder.Reserve(rows) != arrow::Status::OK()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Failed to reserve Arrow builders for " +
                                             std::to_string(rows) + " bars",
            "DataConversionUtils");
    }

    for (const auto& bar : bars) {
        // One precision per row, the widest of the four prices
        const uint8_t precision = std::max(std::max(bar.open.precision, bar.high.precision),
                                           std::max(bar.low.precision, bar.close.precision));

        if (instrument_builder.Append(bar.instrument_id) != arrow::Status::OK() ||
            timeframe_builder.Append(bar.timeframe_spec) != arrow::Status::OK() ||
            open_builder.Append(bar.open.raw) != arrow::Status::OK() ||
            high_builder.Append(bar.high.raw) != arrow::Status::OK() ||
            low_builder.Append(bar.low.raw) != arrow::Status::OK() ||
            close_builder.Append(bar.close.raw) != arrow::Status::OK() ||
            precision_builder.Append(precision) != arrow::Status::OK() ||
            volume_builder.Append(bar.volume) != arrow::Status::OK() ||
            ts_event_builder.Append(core::to_unix_nanos(bar.event_time)) != arrow::Status::OK() ||
            ts_init_builder.Append(core::to_unix_nanos(bar.ingest_time)) != arrow::Status::OK()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to append bar at " + core::format_iso8601(bar.event_time),
                "DataConversionUtils");
        }
    }

    std::shared_ptr<arrow::Array> instrument_array, timeframe_array, open_array, high_array,
        low_array, close_array, precision_array, volume_array, ts_event_array, ts_init_array;
    if (instrument_builder.Finish(&instrument_array) != arrow::Status::OK() ||
        timeframe_builder.Finish(&timeframe_array) != arrow::Status::OK() ||
        open_builder.Finish(&open_array) != arrow::Status::OK() ||
        high_builder.Finish(&high_array) != arrow::Status::OK() ||
        low_builder.Finish(&low_array) != arrow::Status::OK() ||
        close_builder.Finish(&close_array) != arrow::Status::OK() ||
        precision_builder.Finish(&precision_array) != arrow::Status::OK() ||
        volume_builder.Finish(&volume_array) != arrow::Status::OK() ||
        ts_event_builder.Finish(&ts_event_array) != arrow::Status::OK() ||
        ts_init_builder.Finish(&ts_init_array) != arrow::Status::OK()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Failed to finish Arrow bar arrays",
            "DataConversionUtils");
    }

    return Result<std::shared_ptr<arrow::Table>>(arrow::Table::Make(
        bar_schema(), {instrument_array, timeframe_array, open_array, high_array, low_array,
                       close_array, precision_array, volume_array, ts_event_array,
                       ts_init_array}));
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }

    auto instrument_col = column_array(table, "instrument_id", arrow::Type::STRING);
    auto timeframe_col = column_array(table, "timeframe_spec", arrow::Type::STRING);
    auto open_col = column_array(table, "open", arrow::Type::INT64);
    auto high_col = column_array(table, "high", arrow::Type::INT64);
    auto low_col = column_array(table, "low", arrow::Type::INT64);
    auto close_col = column_array(table, "close", arrow::Type::INT64);
    auto precision_col = column_array(table, "price_precision", arrow::Type::INT32);
    auto volume_col = column_array(table, "volume", arrow::Type::UINT64);
    auto ts_event_col = column_array(table, "ts_event", arrow::Type::INT64);
    auto ts_init_col = column_array(table, "ts_init", arrow::Type::INT64);

    for (const auto* col : {&instrument_col, &timeframe_col, &open_col, &high_col, &low_col,
                            &close_col, &precision_col, &volume_col, &ts_event_col,
                            &ts_init_col}) {
        if (col->is_error()) {
            return forward_error<std::vector<Bar>>(*col->error());
        }
    }

    auto precision_array =
        std::static_pointer_cast<arrow::Int32Array>(precision_col.value());

    bars.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto instrument = extract_string(instrument_col.value(), i);
        auto timeframe = extract_string(timeframe_col.value(), i);
        auto open = extract_int64(open_col.value(), i);
        auto high = extract_int64(high_col.value(), i);
        auto low = extract_int64(low_col.value(), i);
        auto close = extract_int64(close_col.value(), i);
        auto volume = extract_uint64(volume_col.value(), i);
        auto ts_event = extract_int64(ts_event_col.value(), i);
        auto ts_init = extract_int64(ts_init_col.value(), i);

        if (instrument.is_error() || timeframe.is_error() || open.is_error() ||
            high.is_error() || low.is_error() || close.is_error() || volume.is_error() ||
            ts_event.is_error() || ts_init.is_error() || precision_array->IsNull(i)) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting bar values at row " + std::to_string(i),
                "DataConversionUtils");
        }

        const auto precision = static_cast<uint8_t>(precision_array->Value(i));
        bars.emplace_back(instrument.value(), timeframe.value(), Price(open.value(), precision),
                          Price(high.value(), precision), Price(low.value(), precision),
                          Price(close.value(), precision), volume.value(),
                          core::from_unix_nanos(ts_event.value()),
                          core::from_unix_nanos(ts_init.value()));
    }

    return Result<std::vector<Bar>>(std::move(bars));
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::descriptors_to_arrow_table(
    const std::vector<InstrumentDescriptor>& descriptors) {
    arrow::StringBuilder instrument_builder;
    arrow::StringBuilder symbol_builder;
    arrow::StringBuilder venue_builder;
    arrow::StringBuilder asset_class_builder;
    arrow::StringBuilder currency_builder;
    arrow::Int32Builder precision_builder;
    arrow::Int64Builder tick_size_builder;
    arrow::Int32Builder tick_precision_builder;
    arrow::DoubleBuilder multiplier_builder;
    arrow::DoubleBuilder lot_size_builder;

    for (const auto& d : descriptors) {
        if (instrument_builder.Append(d.instrument_id) != arrow::Status::OK() ||
            symbol_builder.Append(d.symbol) != arrow::Status::OK() ||
            venue_builder.Append(d.venue) != arrow::Status::OK() ||
            asset_class_builder.Append(asset_class_to_string(d.asset_class)) !=
                arrow::Status::OK() ||
            currency_builder.Append(d.currency) != arrow::Status::OK() ||
            precision_builder.Append(d.price_precision) != arrow::Status::OK() ||
            tick_size_builder.Append(d.tick_size.raw) != arrow::Status::OK() ||
            tick_precision_builder.Append(d.tick_size.precision) != arrow::Status::OK() ||
            multiplier_builder.Append(d.multiplier) != arrow::Status::OK() ||
            lot_size_builder.Append(d.lot_size) != arrow::Status::OK()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to append descriptor " + d.instrument_id,
                "DataConversionUtils");
        }
    }

    std::shared_ptr<arrow::Array> instrument_array, symbol_array, venue_array, asset_class_array,
        currency_array, precision_array, tick_size_array, tick_precision_array, multiplier_array,
        lot_size_array;
    if (instrument_builder.Finish(&instrument_array) != arrow::Status::OK() ||
        symbol_builder.Finish(&symbol_array) != arrow::Status::OK() ||
        venue_builder.Finish(&venue_array) != arrow::Status::OK() ||
        asset_class_builder.Finish(&asset_class_array) != arrow::Status::OK() ||
        currency_builder.Finish(&currency_array) != arrow::Status::OK() ||
        precision_builder.Finish(&precision_array) != arrow::Status::OK() ||
        tick_size_builder.Finish(&tick_size_array) != arrow::Status::OK() ||
        tick_precision_builder.Finish(&tick_precision_array) != arrow::Status::OK() ||
        multiplier_builder.Finish(&multiplier_array) != arrow::Status::OK() ||
        lot_size_builder.Finish(&lot_size_array) != arrow::Status::OK()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Failed to finish Arrow descriptor arrays",
            "DataConversionUtils");
    }

    return Result<std::shared_ptr<arrow::Table>>(arrow::Table::Make(
        descriptor_schema(),
        {instrument_array, symbol_array, venue_array, asset_class_array, currency_array,
         precision_array, tick_size_array, tick_precision_array, multiplier_array,
         lot_size_array}));
}

Result<std::vector<InstrumentDescriptor>> DataConversionUtils::arrow_table_to_descriptors(
    const std::shared_ptr<arrow::Table>& table) {
    using Descriptors = std::vector<InstrumentDescriptor>;
    if (!table) {
        return make_error<Descriptors>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                       "DataConversionUtils");
    }

    Descriptors descriptors;
    if (table->num_rows() == 0) {
        return Result<Descriptors>(std::move(descriptors));
    }

    auto instrument_col = column_array(table, "instrument_id", arrow::Type::STRING);
    auto symbol_col = column_array(table, "symbol", arrow::Type::STRING);
    auto venue_col = column_array(table, "venue", arrow::Type::STRING);
    auto asset_class_col = column_array(table, "asset_class", arrow::Type::STRING);
    auto currency_col = column_array(table, "currency", arrow::Type::STRING);
    auto precision_col = column_array(table, "price_precision", arrow::Type::INT32);
    auto tick_size_col = column_array(table, "tick_size", arrow::Type::INT64);
    auto tick_precision_col = column_array(table, "tick_precision", arrow::Type::INT32);
    auto multiplier_col = column_array(table, "multiplier", arrow::Type::DOUBLE);
    auto lot_size_col = column_array(table, "lot_size", arrow::Type::DOUBLE);

    for (const auto* col : {&instrument_col, &symbol_col, &venue_col, &asset_class_col,
                            &currency_col, &precision_col, &tick_size_col, &tick_precision_col,
                            &multiplier_col, &lot_size_col}) {
        if (col->is_error()) {
            return forward_error<Descriptors>(*col->error());
        }
    }

    auto precision_array = std::static_pointer_cast<arrow::Int32Array>(precision_col.value());
    auto tick_precision_array =
        std::static_pointer_cast<arrow::Int32Array>(tick_precision_col.value());

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto instrument = extract_string(instrument_col.value(), i);
        auto symbol = extract_string(symbol_col.value(), i);
        auto venue = extract_string(venue_col.value(), i);
        auto asset_class = extract_string(asset_class_col.value(), i);
        auto currency = extract_string(currency_col.value(), i);
        auto tick_size = extract_int64(tick_size_col.value(), i);
        auto multiplier = extract_double(multiplier_col.value(), i);
        auto lot_size = extract_double(lot_size_col.value(), i);

        if (instrument.is_error() || symbol.is_error() || venue.is_error() ||
            asset_class.is_error() || currency.is_error() || tick_size.is_error() ||
            multiplier.is_error() || lot_size.is_error() || precision_array->IsNull(i) ||
            tick_precision_array->IsNull(i)) {
            return make_error<Descriptors>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting descriptor values at row " + std::to_string(i),
                "DataConversionUtils");
        }

        InstrumentDescriptor d;
        d.instrument_id = instrument.value();
        d.symbol = symbol.value();
        d.venue = venue.value();
        d.asset_class = asset_class_from_string(asset_class.value());
        d.currency = currency.value();
        d.price_precision = static_cast<uint8_t>(precision_array->Value(i));
        d.tick_size = Price(tick_size.value(), static_cast<uint8_t>(tick_precision_array->Value(i)));
        d.multiplier = multiplier.value();
        d.lot_size = lot_size.value();
        descriptors.push_back(std::move(d));
    }

    return Result<Descriptors>(std::move(descriptors));
}

Result<std::shared_ptr<arrow::Array>> DataConversionUtils::column_array(
    const std::shared_ptr<arrow::Table>& table, const std::string& name,
    arrow::Type::type type) {
    auto column = table->GetColumnByName(name);
    if (column == nullptr) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR, "Missing required column: " + name,
            "DataConversionUtils");
    }
    if (column->type()->id() != type) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Column " + name + " has unexpected type " + column->type()->ToString(),
            "DataConversionUtils");
    }

    if (column->num_chunks() == 1) {
        return Result<std::shared_ptr<arrow::Array>>(column->chunk(0));
    }

    // Parquet readers split large files into several chunks
    auto combined = arrow::Concatenate(column->chunks(), arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks of column " + name + ": " + combined.status().ToString(),
            "DataConversionUtils");
    }
    return Result<std::shared_ptr<arrow::Array>>(combined.ValueOrDie());
}

Result<int64_t> DataConversionUtils::extract_int64(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<int64_t>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                   "DataConversionUtils");
    }
    auto typed = std::static_pointer_cast<arrow::Int64Array>(array);
    if (typed->IsNull(index)) {
        return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                   "Null int64 value at index " + std::to_string(index),
                                   "DataConversionUtils");
    }
    return Result<int64_t>(typed->Value(index));
}

Result<uint64_t> DataConversionUtils::extract_uint64(const std::shared_ptr<arrow::Array>& array,
                                                     int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<uint64_t>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                    "DataConversionUtils");
    }
    auto typed = std::static_pointer_cast<arrow::UInt64Array>(array);
    if (typed->IsNull(index)) {
        return make_error<uint64_t>(ErrorCode::CONVERSION_ERROR,
                                    "Null uint64 value at index " + std::to_string(index),
                                    "DataConversionUtils");
    }
    return Result<uint64_t>(typed->Value(index));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    auto typed = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (typed->IsNull(index)) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }
    return Result<double>(typed->Value(index));
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }
    auto typed = std::static_pointer_cast<arrow::StringArray>(array);
    if (typed->IsNull(index)) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }
    return Result<std::string>(typed->GetString(index));
}

}  // namespace bar_catalog

//===== bar_importer.cpp =====

#include "bar_catalog/catalog/bar_importer.hpp"
#include <arrow/array/concatenate.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include "bar_catalog/catalog/timeframe.hpp"
#include "bar_catalog/core/logger.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string format_minute(const Timestamp& ts) {
    std::string iso = core::format_iso8601(ts);  // 2024-01-02T09:30:00.000000000Z
    iso[10] = ' ';
    return iso.substr(0, 16);
}

Result<Volume> parse_volume(const std::string& text, size_t row_number) {
    const std::string prefix = "Row " + std::to_string(row_number) + ": ";
    if (!text.empty() && text.front() == '-') {
        return make_error<Volume>(ErrorCode::VALIDATION_ERROR,
                                  prefix + "volume must be >= 0, got " + text, "BarImporter");
    }

    const bool all_digits =
        !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    if (!all_digits) {
        return make_error<Volume>(ErrorCode::VALIDATION_ERROR,
                                  prefix + "volume must be a whole number, got '" + text + "'",
                                  "BarImporter");
    }

    Volume value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    const auto parsed = std::from_chars(first, last, value);
    if (parsed.ec == std::errc::result_out_of_range) {
        return make_error<Volume>(ErrorCode::VALIDATION_ERROR,
                                  prefix + "volume out of range: " + text, "BarImporter");
    }
    if (parsed.ec != std::errc() || parsed.ptr != last) {
        return make_error<Volume>(ErrorCode::VALIDATION_ERROR,
                                  prefix + "invalid volume '" + text + "'", "BarImporter");
    }
    return Result<Volume>(value);
}

// Refreshes one index key when the import leaves scope, on success or failure
class IndexRefresh {
public:
    IndexRefresh(AvailabilityIndex& index, const ColumnStore& store, AvailabilityKey key)
        : index_(index), store_(store), key_(std::move(key)) {}

    ~IndexRefresh() {
        index_.refresh(store_, key_);
    }

    IndexRefresh(const IndexRefresh&) = delete;
    IndexRefresh& operator=(const IndexRefresh&) = delete;

private:
    AvailabilityIndex& index_;
    const ColumnStore& store_;
    AvailabilityKey key_;
};

}  // namespace

std::string conflict_policy_to_string(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::SKIP:
            return "skip";
        case ConflictPolicy::OVERWRITE:
            return "overwrite";
        case ConflictPolicy::MERGE:
            return "merge";
        default:
            return "unknown";
    }
}

std::optional<ConflictPolicy> conflict_policy_from_string(const std::string& text) {
    if (text == "skip")
        return ConflictPolicy::SKIP;
    if (text == "overwrite")
        return ConflictPolicy::OVERWRITE;
    if (text == "merge")
        return ConflictPolicy::MERGE;
    return std::nullopt;
}

std::string ImportResult::date_range_string() const {
    if (!date_range) {
        return "N/A";
    }
    return format_minute(date_range->first) + " to " + format_minute(date_range->second);
}

nlohmann::json ImportResult::to_json() const {
    nlohmann::json j;
    j["instrument_id"] = instrument_id;
    j["timeframe_spec"] = timeframe_spec;
    j["rows_processed"] = rows_processed;
    j["bars_written"] = bars_written;
    j["conflicts_skipped"] = conflicts_skipped;
    j["date_range"] = date_range_string();

    nlohmann::json errors_json = nlohmann::json::array();
    for (const auto& error : errors) {
        errors_json.push_back({{"row", error.row_number}, {"message", error.message}});
    }
    j["validation_errors"] = errors_json;
    return j;
}

BarImporter::BarImporter(std::shared_ptr<ColumnStore> store,
                         std::shared_ptr<AvailabilityIndex> index, ConflictPolicy policy)
    : store_(std::move(store)), index_(std::move(index)), policy_(policy) {
    Logger::register_component("BarImporter");
}

Result<ImportResult> BarImporter::import_csv(const std::filesystem::path& path,
                                             const std::string& symbol, const std::string& venue,
                                             const std::string& timeframe_spec) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error<ImportResult>(ErrorCode::FILE_NOT_FOUND,
                                        "CSV file not found: " + path.string(), "BarImporter");
    }

    INFO("Importing " << path.string() << " as " << symbol << "." << venue << " "
                      << timeframe_spec);

    auto input = arrow::io::ReadableFile::Open(path.string());
    if (!input.ok()) {
        return make_error<ImportResult>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open " + path.string() + ": " +
                                            input.status().ToString(),
                                        "BarImporter");
    }

    // Every column is read as text so each row can be validated on its own
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const char* column : REQUIRED_COLUMNS) {
        convert_options.column_types[column] = arrow::utf8();
    }

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(),
                                                input.ValueOrDie(), read_options, parse_options,
                                                convert_options);
    if (!reader.ok()) {
        return make_error<ImportResult>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to create CSV reader for " + path.string() +
                                            ": " + reader.status().ToString(),
                                        "BarImporter");
    }

    auto table_result = reader.ValueOrDie()->Read();
    if (!table_result.ok()) {
        return make_error<ImportResult>(ErrorCode::VALIDATION_ERROR,
                                        "Malformed CSV " + path.string() + ": " +
                                            table_result.status().ToString(),
                                        "BarImporter");
    }
    auto table = table_result.ValueOrDie();

    std::vector<std::string> missing;
    std::vector<std::shared_ptr<arrow::StringArray>> columns;
    for (const char* column : REQUIRED_COLUMNS) {
        auto chunked = table->GetColumnByName(column);
        if (!chunked) {
            missing.push_back(column);
            continue;
        }
        if (chunked->type()->id() != arrow::Type::STRING) {
            return make_error<ImportResult>(ErrorCode::VALIDATION_ERROR,
                                            std::string("Column ") + column +
                                                " could not be read as text",
                                            "BarImporter");
        }
        if (chunked->num_chunks() == 0) {
            columns.push_back(nullptr);  // header-only file
            continue;
        }
        auto combined = arrow::Concatenate(chunked->chunks());
        if (!combined.ok()) {
            return make_error<ImportResult>(ErrorCode::CONVERSION_ERROR,
                                            std::string("Failed to combine column ") + column +
                                                ": " + combined.status().ToString(),
                                            "BarImporter");
        }
        columns.push_back(std::static_pointer_cast<arrow::StringArray>(combined.ValueOrDie()));
    }

    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += (names.empty() ? "" : ", ") + name;
        }
        return make_error<ImportResult>(ErrorCode::VALIDATION_ERROR,
                                        "Row 0: missing required columns: " + names,
                                        "BarImporter");
    }

    auto field = [&](size_t column, int64_t row) -> std::string {
        return columns[column]->IsNull(row) ? std::string() : columns[column]->GetString(row);
    };

    std::vector<CsvBarRow> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        rows.push_back(CsvBarRow{field(0, i), field(1, i), field(2, i), field(3, i), field(4, i),
                                 field(5, i)});
    }

    return import_rows(rows, symbol, venue, timeframe_spec);
}

Result<ImportResult> BarImporter::import_rows(const std::vector<CsvBarRow>& rows,
                                              const std::string& symbol, const std::string& venue,
                                              const std::string& timeframe_spec) {
    if (symbol.empty() || venue.empty()) {
        return make_error<ImportResult>(ErrorCode::INVALID_ARGUMENT,
                                        "Symbol and venue are required", "BarImporter");
    }
    if (timeframe_spec.empty()) {
        return make_error<ImportResult>(ErrorCode::INVALID_ARGUMENT,
                                        "Timeframe spec is required", "BarImporter");
    }

    // Stored under the canonical spec so lookups and directory scans find it
    auto timeframe = TimeframeSpec::parse(timeframe_spec);
    if (timeframe.is_error()) {
        return forward_error<ImportResult>(*timeframe.error());
    }
    const std::string canonical_spec = timeframe.value().to_string();

    ImportResult result;
    result.instrument_id = symbol + "." + venue;
    result.timeframe_spec = canonical_spec;
    result.rows_processed = rows.size();

    const Timestamp ingest_time = core::now_utc();
    std::vector<Bar> bars;
    bars.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const size_t row_number = i + 2;
        auto bar = parse_row(rows[i], row_number, result.instrument_id, canonical_spec,
                             ingest_time);
        if (bar.is_error()) {
            DEBUG("Row " << row_number << " rejected: " << bar.error()->what());
            result.errors.push_back(RowError{row_number, bar.error()->what()});
            continue;
        }
        bars.push_back(bar.take_value());
    }

    if (bars.empty()) {
        WARN("No valid rows to import for " << result.instrument_id << " ("
                                            << result.errors.size() << " rejected)");
        return Result<ImportResult>(std::move(result));
    }

    sort_and_deduplicate(bars);
    const TimeBounds range{bars.front().event_time, bars.back().event_time};
    result.date_range = range;

    // From here on files may change, so the index is recomputed however this returns
    IndexRefresh refresh(*index_, *store_, AvailabilityKey{result.instrument_id, canonical_spec});

    auto to_write = resolve_conflicts(std::move(bars), result.instrument_id, canonical_spec,
                                      result.conflicts_skipped);
    if (to_write.is_error()) {
        return forward_error<ImportResult>(*to_write.error());
    }

    const std::string correlation_id = "csv-import-" + symbol;
    if (policy_ == ConflictPolicy::SKIP) {
        if (!to_write.value().empty()) {
            auto written = store_->write_bars(to_write.value(), correlation_id);
            if (written.is_error()) {
                return forward_error<ImportResult>(*written.error());
            }
        }
    } else {
        auto replaced = store_->replace_range(to_write.value(), correlation_id, range);
        if (replaced.is_error()) {
            return forward_error<ImportResult>(*replaced.error());
        }
    }
    result.bars_written = to_write.value().size();

    INFO("Imported " << result.instrument_id << " " << canonical_spec << ": "
                     << result.bars_written << " written, " << result.conflicts_skipped
                     << " skipped as conflicts, " << result.errors.size() << " rejected");
    return Result<ImportResult>(std::move(result));
}

Result<Bar> BarImporter::parse_row(const CsvBarRow& row, size_t row_number,
                                   const std::string& instrument_id,
                                   const std::string& timeframe_spec,
                                   const Timestamp& ingest_time) const {
    const std::string prefix = "Row " + std::to_string(row_number) + ": ";

    const std::string timestamp_text = trim(row.timestamp);
    auto event_time = core::parse_datetime(timestamp_text);
    if (!event_time) {
        return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                               prefix + "invalid timestamp format: '" + timestamp_text + "'",
                               "BarImporter");
    }

    const std::pair<const char*, const std::string*> fields[] = {
        {"open", &row.open}, {"high", &row.high}, {"low", &row.low}, {"close", &row.close}};
    Price prices[4];
    uint8_t precision = 0;
    for (size_t i = 0; i < 4; ++i) {
        const std::string text = trim(*fields[i].second);
        auto price = Price::from_string(text);
        if (price.is_error()) {
            return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                                   prefix + "invalid " + fields[i].first + " '" + text + "'",
                                   "BarImporter");
        }
        if (price.value().raw <= 0) {
            return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                                   prefix + fields[i].first + " must be > 0, got " + text,
                                   "BarImporter");
        }
        prices[i] = price.value();
        precision = std::max(precision, prices[i].precision);
    }
    for (auto& price : prices) {
        price.precision = precision;
    }

    const Price& open = prices[0];
    const Price& high = prices[1];
    const Price& low = prices[2];
    const Price& close = prices[3];
    if (high < low) {
        return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                               prefix + "high (" + high.to_string() + ") must be >= low (" +
                                   low.to_string() + ")",
                               "BarImporter");
    }
    if (high < open || high < close) {
        return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                               prefix + "high (" + high.to_string() +
                                   ") must be >= open and close",
                               "BarImporter");
    }
    if (low > open || low > close) {
        return make_error<Bar>(ErrorCode::VALIDATION_ERROR,
                               prefix + "low (" + low.to_string() + ") must be <= open and close",
                               "BarImporter");
    }

    auto volume = parse_volume(trim(row.volume), row_number);
    if (volume.is_error()) {
        return forward_error<Bar>(*volume.error());
    }

    return Result<Bar>(Bar(instrument_id, timeframe_spec, open, high, low, close, volume.value(),
                           *event_time, ingest_time));
}

Result<std::vector<Bar>> BarImporter::resolve_conflicts(std::vector<Bar> bars,
                                                        const std::string& instrument_id,
                                                        const std::string& timeframe_spec,
                                                        size_t& conflicts_skipped) {
    const Timestamp first = bars.front().event_time;
    const Timestamp last = bars.back().event_time;

    switch (policy_) {
        case ConflictPolicy::SKIP: {
            const auto partitions = store_->scan_partitions(instrument_id, timeframe_spec);
            std::vector<Bar> kept;
            kept.reserve(bars.size());
            for (auto& bar : bars) {
                const bool cached =
                    std::any_of(partitions.begin(), partitions.end(), [&](const PartitionMeta& p) {
                        return bar.event_time >= p.start && bar.event_time <= p.end;
                    });
                if (cached) {
                    ++conflicts_skipped;
                } else {
                    kept.push_back(std::move(bar));
                }
            }
            if (conflicts_skipped > 0) {
                INFO("Skipping " << conflicts_skipped << " bars of " << instrument_id
                                 << " already inside cached ranges");
            }
            return Result<std::vector<Bar>>(std::move(kept));
        }

        case ConflictPolicy::OVERWRITE:
            INFO("Overwriting cached bars of " << instrument_id << " between "
                                               << core::format_iso8601(first) << " and "
                                               << core::format_iso8601(last));
            return Result<std::vector<Bar>>(std::move(bars));

        case ConflictPolicy::MERGE: {
            auto existing = store_->query(instrument_id, timeframe_spec, first, last);
            if (existing.is_error()) {
                return forward_error<std::vector<Bar>>(*existing.error());
            }
            const size_t cached = existing.value().size();

            std::map<int64_t, Bar> merged;
            for (auto& bar : existing.take_value()) {
                merged[core::to_unix_nanos(bar.event_time)] = std::move(bar);
            }
            for (auto& bar : bars) {
                merged[core::to_unix_nanos(bar.event_time)] = std::move(bar);
            }

            std::vector<Bar> result;
            result.reserve(merged.size());
            for (auto& entry : merged) {
                result.push_back(std::move(entry.second));
            }
            DEBUG("Merged " << result.size() << " bars of " << instrument_id << " (" << cached
                            << " previously cached)");
            return Result<std::vector<Bar>>(std::move(result));
        }
    }

    return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Unknown conflict policy",
                                        "BarImporter");
}

}  // namespace bar_catalog

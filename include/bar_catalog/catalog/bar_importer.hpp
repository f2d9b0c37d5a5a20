//===== bar_importer.hpp =====
#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "bar_catalog/catalog/availability_index.hpp"
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"
#include "bar_catalog/data/column_store.hpp"

namespace bar_catalog {

/**
 * @brief What to do with imported bars that fall inside already cached ranges
 */
enum class ConflictPolicy {
    SKIP,       // Drop incoming bars inside existing partition ranges
    OVERWRITE,  // Replace the cached bars of the imported range
    MERGE       // Replace the range with its union of cached and incoming bars, incoming win
};

std::string conflict_policy_to_string(ConflictPolicy policy);
std::optional<ConflictPolicy> conflict_policy_from_string(const std::string& text);

/**
 * @brief One CSV data row before validation, all fields as text
 */
struct CsvBarRow {
    std::string timestamp;
    std::string open;
    std::string high;
    std::string low;
    std::string close;
    std::string volume;
};

struct RowError {
    size_t row_number;  // 1-based file line, the header is line 1
    std::string message;
};

struct ImportResult {
    std::string instrument_id;
    std::string timeframe_spec;
    size_t rows_processed{0};
    size_t bars_written{0};
    size_t conflicts_skipped{0};
    std::vector<RowError> errors;
    std::optional<TimeBounds> date_range;

    /**
     * @brief "2024-01-02 09:30 to 2024-01-02 16:00", or "N/A" without valid rows
     */
    std::string date_range_string() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Bulk import of OHLCV bars from CSV into the column store
 *
 * Required columns: timestamp, open, high, low, close, volume. Rows that fail
 * validation are reported with their line number and do not stop the import.
 * The timeframe spec is stored in canonical form. Imported bars go to EXTERNAL
 * partitions and the availability index is refreshed afterwards, also when a
 * write fails part way.
 */
class BarImporter {
public:
    static constexpr const char* REQUIRED_COLUMNS[] = {"timestamp", "open", "high",
                                                       "low",       "close", "volume"};

    BarImporter(std::shared_ptr<ColumnStore> store, std::shared_ptr<AvailabilityIndex> index,
                ConflictPolicy policy = ConflictPolicy::SKIP);

    /**
     * @brief Import a CSV file
     * @return FILE_NOT_FOUND for a missing file, VALIDATION_ERROR when a
     *         required column is missing; row errors are part of the result
     */
    Result<ImportResult> import_csv(const std::filesystem::path& path, const std::string& symbol,
                                    const std::string& venue,
                                    const std::string& timeframe_spec);

    /**
     * @brief Import rows already split into fields
     * Row i of the vector is reported as file line i + 2.
     */
    Result<ImportResult> import_rows(const std::vector<CsvBarRow>& rows, const std::string& symbol,
                                     const std::string& venue,
                                     const std::string& timeframe_spec);

    ConflictPolicy policy() const {
        return policy_;
    }

private:
    Result<Bar> parse_row(const CsvBarRow& row, size_t row_number,
                          const std::string& instrument_id, const std::string& timeframe_spec,
                          const Timestamp& ingest_time) const;

    Result<std::vector<Bar>> resolve_conflicts(std::vector<Bar> bars,
                                               const std::string& instrument_id,
                                               const std::string& timeframe_spec,
                                               size_t& conflicts_skipped);

    std::shared_ptr<ColumnStore> store_;
    std::shared_ptr<AvailabilityIndex> index_;
    ConflictPolicy policy_;
};

}  // namespace bar_catalog

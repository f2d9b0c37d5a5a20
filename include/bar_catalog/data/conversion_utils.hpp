//===== conversion_utils.hpp =====
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief Conversions between catalog records and Arrow tables
 *
 * Bar columns: instrument_id, timeframe_spec, open, high, low, close (raw
 * fixed-point int64), price_precision, volume, ts_event, ts_init (int64 ns
 * since epoch, UTC).
 */
class DataConversionUtils {
public:
    static std::shared_ptr<arrow::Schema> bar_schema();
    static std::shared_ptr<arrow::Schema> descriptor_schema();

    /**
     * @brief Convert bars to an Arrow table in bar_schema()
     * @param bars Bars in the order they should be written
     * @return Result containing the table
     */
    static Result<std::shared_ptr<arrow::Table>> bars_to_arrow_table(const std::vector<Bar>& bars);

    /**
     * @brief Convert an Arrow table in bar_schema() back to bars
     * @param table Arrow table read from a partition file
     * @return Result containing vector of Bars
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    static Result<std::shared_ptr<arrow::Table>> descriptors_to_arrow_table(
        const std::vector<InstrumentDescriptor>& descriptors);

    static Result<std::vector<InstrumentDescriptor>> arrow_table_to_descriptors(
        const std::shared_ptr<arrow::Table>& table);

private:
    /**
     * @brief Look up a column and check its type
     * @return The column as one contiguous array
     */
    static Result<std::shared_ptr<arrow::Array>> column_array(
        const std::shared_ptr<arrow::Table>& table, const std::string& name, arrow::Type::type type);

    static Result<int64_t> extract_int64(const std::shared_ptr<arrow::Array>& array, int64_t index);

    static Result<uint64_t> extract_uint64(const std::shared_ptr<arrow::Array>& array,
                                           int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array, int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace bar_catalog

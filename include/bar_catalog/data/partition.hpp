//===== partition.hpp =====
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief Inclusive [start, end] time range
 */
using TimeBounds = std::pair<Timestamp, Timestamp>;

/**
 * @brief Identifies one partition directory
 * Directory name: {instrument_id}-{timeframe_spec}-{EXTERNAL|INTERNAL}
 */
struct PartitionKey {
    std::string instrument_id;
    std::string timeframe_spec;
    AggregationSource source{AggregationSource::EXTERNAL};

    std::string directory_name() const;

    /**
     * @brief Parse a directory name from the right
     * The instrument id may itself contain dashes (e.g. "BRK-B.NYSE")
     */
    static Result<PartitionKey> parse(const std::string& directory_name);

    bool operator==(const PartitionKey& other) const {
        return instrument_id == other.instrument_id && timeframe_spec == other.timeframe_spec &&
               source == other.source;
    }
};

/**
 * @brief One bar file on disk, as found by a scan
 */
struct PartitionMeta {
    PartitionKey key;
    std::filesystem::path path;
    Timestamp start;
    Timestamp end;
    uint64_t file_size{0};
    int64_t row_count{0};
};

/**
 * @brief "{start}_{end}.parquet" with fixed-width, colon-free timestamps
 */
std::string partition_file_name(const Timestamp& start, const Timestamp& end);

/**
 * @brief Recover [start, end] from a partition file name
 * @return CATALOG_CORRUPTION if the name does not follow the format or start > end
 */
Result<TimeBounds> parse_partition_file_name(const std::string& file_name);

constexpr const char* PARTITION_FILE_EXTENSION = ".parquet";

}  // namespace bar_catalog

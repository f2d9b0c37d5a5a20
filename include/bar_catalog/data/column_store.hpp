//===== column_store.hpp =====
#pragma once

#include <arrow/api.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"
#include "bar_catalog/data/partition.hpp"

namespace bar_catalog {

/**
 * @brief Sort bars by event_time and drop duplicate event_times
 * For equal event_times the bar with the latest ingest_time is kept, and
 * among equal ingest_times the one appearing last in the input.
 */
void sort_and_deduplicate(std::vector<Bar>& bars);

/**
 * @brief Parquet-backed store of bar partitions and instrument descriptors
 *
 * Layout under the catalog root:
 *   data/bar/{instrument_id}-{timeframe_spec}-{EXTERNAL|INTERNAL}/{start}_{end}.parquet
 *   data/instrument/{instrument_id}.parquet
 *
 * Every write lands in a new file that is written under a temporary name and
 * renamed into place, so readers never see a partial file. Files of one
 * partition may overlap in time; reads merge them.
 */
class ColumnStore {
public:
    explicit ColumnStore(std::filesystem::path root);

    /**
     * @brief Create the directory layout if it does not exist
     * @return Result indicating success or failure
     */
    Result<void> initialize();

    /**
     * @brief Persist one batch of bars as a new partition file
     *
     * @param bars Bars of a single instrument and timeframe, any order
     * @param correlation_id Tag carried into the logs of this write
     * @param bounds Requested range of the batch; the file name embeds
     *               [min(bounds.start, first bar), max(bounds.end, last bar)]
     * @param source Aggregation source of the partition
     * @return Metadata of the written file
     */
    Result<PartitionMeta> write_bars(const std::vector<Bar>& bars,
                                     const std::string& correlation_id,
                                     const std::optional<TimeBounds>& bounds = std::nullopt,
                                     AggregationSource source = AggregationSource::EXTERNAL);

    /**
     * @brief Make the given bars the only cached bars of bounds
     *
     * The replacement file is written first. Only then are the files it
     * supersedes deleted, or rewritten without their rows inside bounds.
     * A failed write leaves the previous files untouched.
     *
     * @param bars Bars of a single instrument and timeframe inside bounds
     * @return Metadata of the replacement file
     */
    Result<PartitionMeta> replace_range(const std::vector<Bar>& bars,
                                        const std::string& correlation_id,
                                        const TimeBounds& bounds,
                                        AggregationSource source = AggregationSource::EXTERNAL);

    /**
     * @brief Persist a descriptor, replacing any previous one with the same id
     */
    Result<void> write_descriptor(const InstrumentDescriptor& descriptor);

    /**
     * @brief Bars of [start, end] merged across every intersecting file
     * Sorted by event_time with duplicates removed. Unreadable files are
     * logged and skipped.
     */
    Result<std::vector<Bar>> query(const std::string& instrument_id,
                                   const std::string& timeframe_spec, const Timestamp& start,
                                   const Timestamp& end) const;

    /**
     * @brief Load the descriptor stored under exactly this id
     * @return DATA_NOT_FOUND when no descriptor exists
     */
    Result<InstrumentDescriptor> load_descriptor(const std::string& instrument_id) const;

    bool has_descriptor(const std::string& instrument_id) const;

    /**
     * @brief All readable partition files
     * Unparsable directory or file names and unreadable footers are logged
     * and skipped.
     */
    std::vector<PartitionMeta> scan_partitions() const;

    std::vector<PartitionMeta> scan_partitions(const std::string& instrument_id,
                                               const std::string& timeframe_spec) const;

    /**
     * @brief Remove the bars of [start, end] for one instrument and timeframe
     *
     * Files entirely inside the range are deleted. Files that straddle it are
     * rewritten so rows outside the range survive.
     *
     * @return Number of bars removed
     */
    Result<size_t> delete_range(const std::string& instrument_id,
                                const std::string& timeframe_spec, const Timestamp& start,
                                const Timestamp& end);

    const std::filesystem::path& root() const {
        return root_;
    }

    std::filesystem::path bar_directory() const {
        return root_ / "data" / "bar";
    }

    std::filesystem::path descriptor_directory() const {
        return root_ / "data" / "instrument";
    }

private:
    std::filesystem::path descriptor_path(const std::string& instrument_id) const;

    std::optional<PartitionMeta> read_partition_meta(const PartitionKey& key,
                                                     const std::filesystem::path& path) const;

    std::vector<PartitionMeta> scan_directory(const PartitionKey& key,
                                              const std::filesystem::path& directory) const;

    Result<void> validate_batch(const std::vector<Bar>& bars) const;

    // Drop the rows of [start, end] from one file; returns rows removed
    Result<size_t> remove_range_unlocked(const PartitionMeta& meta, const Timestamp& start,
                                         const Timestamp& end);

    Result<std::vector<Bar>> read_bars(const std::filesystem::path& path) const;

    Result<std::shared_ptr<arrow::Table>> read_table(const std::filesystem::path& path) const;

    Result<void> write_table(const std::shared_ptr<arrow::Table>& table,
                             const std::filesystem::path& target) const;

    // Caller holds write_mutex_; bars are sorted and deduplicated
    Result<PartitionMeta> write_partition_unlocked(const PartitionKey& key,
                                                   const std::vector<Bar>& bars,
                                                   const TimeBounds& bounds);

    std::filesystem::path root_;
    std::mutex write_mutex_;
};

}  // namespace bar_catalog

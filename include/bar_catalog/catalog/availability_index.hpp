//===== availability_index.hpp =====
#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"
#include "bar_catalog/data/column_store.hpp"

namespace bar_catalog {

/**
 * @brief (instrument, timeframe) pair the index is keyed by
 */
struct AvailabilityKey {
    std::string instrument_id;
    std::string timeframe_spec;

    bool operator<(const AvailabilityKey& other) const {
        return instrument_id < other.instrument_id ||
               (instrument_id == other.instrument_id && timeframe_spec < other.timeframe_spec);
    }
    bool operator==(const AvailabilityKey& other) const {
        return instrument_id == other.instrument_id && timeframe_spec == other.timeframe_spec;
    }

    std::string to_string() const {
        return instrument_id + " " + timeframe_spec;
    }
};

/**
 * @brief Cached claim that bars of one key exist between start and end
 */
struct TimeRangeAvailability {
    std::string instrument_id;
    std::string timeframe_spec;
    Timestamp start;
    Timestamp end;
    size_t file_count{0};
    int64_t estimated_row_count{0};
    Timestamp last_updated;

    /**
     * @brief Whether [start, end] lies inside this availability
     * Day-level timeframes compare UTC calendar dates only, sub-day
     * timeframes compare full timestamps.
     */
    bool covers_range(const Timestamp& req_start, const Timestamp& req_end) const;

    bool overlaps_range(const Timestamp& req_start, const Timestamp& req_end) const {
        return !(end < req_start || start > req_end);
    }
};

/**
 * @brief Day-level timeframes (DAY, WEEK, MONTH) are matched by calendar date
 */
bool is_day_level_timeframe(const std::string& timeframe_spec);

/**
 * @brief In-memory index of cached ranges per (instrument, timeframe)
 *
 * Derived entirely from the column store and rebuildable at any time. All
 * operations are thread-safe. Entries are replaced wholesale, never edited.
 */
class AvailabilityIndex {
public:
    using EntryMap = std::map<AvailabilityKey, TimeRangeAvailability>;

    AvailabilityIndex() = default;

    AvailabilityIndex(const AvailabilityIndex&) = delete;
    AvailabilityIndex& operator=(const AvailabilityIndex&) = delete;

    /**
     * @brief Replace the whole index with one built from a partition scan
     *
     * Per key: start = min of file starts, end = max of file ends,
     * file_count = number of files, row counts summed.
     */
    EntryMap rebuild(const ColumnStore& store);

    bool covers_range(const AvailabilityKey& key, const Timestamp& start,
                      const Timestamp& end) const;

    bool overlaps_range(const AvailabilityKey& key, const Timestamp& start,
                        const Timestamp& end) const;

    /**
     * @brief Replace the entry of a key
     * @return INVALID_ARGUMENT if the availability is inconsistent with the key or itself
     */
    Result<void> put(const AvailabilityKey& key, TimeRangeAvailability availability);

    std::optional<TimeRangeAvailability> get(const AvailabilityKey& key) const;

    /**
     * @brief Recompute one key from the store's current files
     * The entry is removed when no readable file is left.
     */
    void refresh(const ColumnStore& store, const AvailabilityKey& key);

    std::vector<TimeRangeAvailability> entries() const;

    size_t size() const;

    static std::optional<TimeRangeAvailability> merge(const std::vector<PartitionMeta>& partitions);

private:
    mutable std::mutex mutex_;
    EntryMap entries_;
};

}  // namespace bar_catalog

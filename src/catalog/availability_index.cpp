//===== availability_index.cpp =====

#include "bar_catalog/catalog/availability_index.hpp"
#include <algorithm>
#include "bar_catalog/catalog/timeframe.hpp"
#include "bar_catalog/core/logger.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

bool is_day_level_timeframe(const std::string& timeframe_spec) {
    auto parsed = TimeframeSpec::parse(timeframe_spec);
    if (parsed.is_ok()) {
        return parsed.value().is_day_level();
    }
    // Unknown formats fall back to a keyword match
    return timeframe_spec.find("DAY") != std::string::npos ||
           timeframe_spec.find("WEEK") != std::string::npos ||
           timeframe_spec.find("MONTH") != std::string::npos;
}

bool TimeRangeAvailability::covers_range(const Timestamp& req_start,
                                         const Timestamp& req_end) const {
    if (is_day_level_timeframe(timeframe_spec)) {
        // Date-only input parses to midnight, which would never reach an
        // end-of-day boundary if compared as a timestamp
        return core::utc_day_number(start) <= core::utc_day_number(req_start) &&
               core::utc_day_number(end) >= core::utc_day_number(req_end);
    }
    return start <= req_start && end >= req_end;
}

std::optional<TimeRangeAvailability> AvailabilityIndex::merge(
    const std::vector<PartitionMeta>& partitions) {
    if (partitions.empty()) {
        return std::nullopt;
    }

    TimeRangeAvailability merged;
    merged.instrument_id = partitions.front().key.instrument_id;
    merged.timeframe_spec = partitions.front().key.timeframe_spec;
    merged.start = partitions.front().start;
    merged.end = partitions.front().end;
    for (const auto& partition : partitions) {
        merged.start = std::min(merged.start, partition.start);
        merged.end = std::max(merged.end, partition.end);
        merged.estimated_row_count += partition.row_count;
        ++merged.file_count;
    }
    merged.last_updated = core::now_utc();
    return merged;
}

AvailabilityIndex::EntryMap AvailabilityIndex::rebuild(const ColumnStore& store) {
    std::map<AvailabilityKey, std::vector<PartitionMeta>> grouped;
    for (auto& partition : store.scan_partitions()) {
        AvailabilityKey key{partition.key.instrument_id, partition.key.timeframe_spec};
        grouped[key].push_back(std::move(partition));
    }

    EntryMap rebuilt;
    for (const auto& [key, partitions] : grouped) {
        if (auto merged = merge(partitions)) {
            rebuilt.emplace(key, std::move(*merged));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = rebuilt;
    }

    INFO("Availability index rebuilt: " << rebuilt.size() << " series from "
                                        << store.root().string());
    return rebuilt;
}

bool AvailabilityIndex::covers_range(const AvailabilityKey& key, const Timestamp& start,
                                     const Timestamp& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.covers_range(start, end);
}

bool AvailabilityIndex::overlaps_range(const AvailabilityKey& key, const Timestamp& start,
                                       const Timestamp& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.overlaps_range(start, end);
}

Result<void> AvailabilityIndex::put(const AvailabilityKey& key,
                                    TimeRangeAvailability availability) {
    if (availability.instrument_id != key.instrument_id ||
        availability.timeframe_spec != key.timeframe_spec) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Availability for " + availability.instrument_id + " " +
                                    availability.timeframe_spec + " stored under " +
                                    key.to_string(),
                                "AvailabilityIndex");
    }
    if (availability.end < availability.start) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Availability of " + key.to_string() + " ends before it starts",
                                "AvailabilityIndex");
    }
    if (availability.file_count == 0 || availability.estimated_row_count < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Availability of " + key.to_string() +
                                    " needs at least one file and a non-negative row count",
                                "AvailabilityIndex");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(availability);
    return Result<void>();
}

std::optional<TimeRangeAvailability> AvailabilityIndex::get(const AvailabilityKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AvailabilityIndex::refresh(const ColumnStore& store, const AvailabilityKey& key) {
    auto merged = merge(store.scan_partitions(key.instrument_id, key.timeframe_spec));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!merged) {
        entries_.erase(key);
        DEBUG("Availability of " << key.to_string() << " removed, no files left");
        return;
    }
    DEBUG("Availability of " << key.to_string() << " now "
                             << core::format_iso8601(merged->start) << " to "
                             << core::format_iso8601(merged->end) << " in "
                             << merged->file_count << " files");
    entries_[key] = std::move(*merged);
}

std::vector<TimeRangeAvailability> AvailabilityIndex::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TimeRangeAvailability> result;
    result.reserve(entries_.size());
    for (const auto& [key, availability] : entries_) {
        result.push_back(availability);
    }
    return result;
}

size_t AvailabilityIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace bar_catalog

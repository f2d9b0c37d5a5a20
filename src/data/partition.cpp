//===== partition.cpp =====

#include "bar_catalog/data/partition.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

std::string PartitionKey::directory_name() const {
    return instrument_id + "-" + timeframe_spec + "-" + aggregation_source_to_string(source);
}

Result<PartitionKey> PartitionKey::parse(const std::string& directory_name) {
    // Four dashes from the right: source, price type, aggregation, step
    size_t dashes[4];
    size_t search_end = directory_name.size();
    for (int i = 0; i < 4; ++i) {
        if (search_end == 0) {
            return make_error<PartitionKey>(ErrorCode::CATALOG_CORRUPTION,
                                            "Unparsable partition directory: " + directory_name,
                                            "PartitionKey");
        }
        const auto pos = directory_name.rfind('-', search_end - 1);
        if (pos == std::string::npos || pos == 0) {
            return make_error<PartitionKey>(ErrorCode::CATALOG_CORRUPTION,
                                            "Unparsable partition directory: " + directory_name,
                                            "PartitionKey");
        }
        dashes[i] = pos;
        search_end = pos;
    }

    auto source = aggregation_source_from_string(directory_name.substr(dashes[0] + 1));
    if (!source) {
        return make_error<PartitionKey>(
            ErrorCode::CATALOG_CORRUPTION,
            "Unknown aggregation source in partition directory: " + directory_name,
            "PartitionKey");
    }

    PartitionKey key;
    key.instrument_id = directory_name.substr(0, dashes[3]);
    key.timeframe_spec = directory_name.substr(dashes[3] + 1, dashes[0] - dashes[3] - 1);
    key.source = *source;

    if (!InstrumentId::parse(key.instrument_id)) {
        return make_error<PartitionKey>(
            ErrorCode::CATALOG_CORRUPTION,
            "Partition directory has no SYMBOL.VENUE instrument id: " + directory_name,
            "PartitionKey");
    }
    return Result<PartitionKey>(std::move(key));
}

std::string partition_file_name(const Timestamp& start, const Timestamp& end) {
    return core::format_file_timestamp(start) + "_" + core::format_file_timestamp(end) +
           PARTITION_FILE_EXTENSION;
}

Result<TimeBounds> parse_partition_file_name(const std::string& file_name) {
    const std::string extension = PARTITION_FILE_EXTENSION;

    if (file_name.size() <= extension.size() ||
        file_name.compare(file_name.size() - extension.size(), extension.size(), extension) !=
            0) {
        return make_error<TimeBounds>(ErrorCode::CATALOG_CORRUPTION,
                                      "Not a partition file: " + file_name, "PartitionKey");
    }

    const std::string stem = file_name.substr(0, file_name.size() - extension.size());
    const auto underscore = stem.find('_');
    if (underscore == std::string::npos) {
        return make_error<TimeBounds>(ErrorCode::CATALOG_CORRUPTION,
                                      "Partition file name has no '_' separator: " + file_name,
                                      "PartitionKey");
    }

    auto start = core::parse_file_timestamp(stem.substr(0, underscore));
    auto end = core::parse_file_timestamp(stem.substr(underscore + 1));
    if (!start || !end) {
        return make_error<TimeBounds>(ErrorCode::CATALOG_CORRUPTION,
                                      "Unparsable timestamps in partition file name: " + file_name,
                                      "PartitionKey");
    }
    if (*end < *start) {
        return make_error<TimeBounds>(ErrorCode::CATALOG_CORRUPTION,
                                      "Partition file ends before it starts: " + file_name,
                                      "PartitionKey");
    }
    return Result<TimeBounds>(TimeBounds{*start, *end});
}

}  // namespace bar_catalog

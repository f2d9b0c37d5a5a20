//===== column_store.cpp =====

#include "bar_catalog/data/column_store.hpp"
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <algorithm>
#include "bar_catalog/core/logger.hpp"
#include "bar_catalog/core/time_utils.hpp"
#include "bar_catalog/data/conversion_utils.hpp"

namespace bar_catalog {

namespace fs = std::filesystem;

namespace {

constexpr int64_t ROW_GROUP_SIZE = 64 * 1024;

bool intersects(const PartitionMeta& meta, const Timestamp& start, const Timestamp& end) {
    return !(meta.end < start || meta.start > end);
}

}  // namespace

void sort_and_deduplicate(std::vector<Bar>& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.event_time < b.event_time;
    });

    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (auto& bar : bars) {
        if (!unique.empty() && unique.back().event_time == bar.event_time) {
            if (bar.ingest_time >= unique.back().ingest_time) {
                unique.back() = std::move(bar);
            }
            continue;
        }
        unique.push_back(std::move(bar));
    }
    bars = std::move(unique);
}

ColumnStore::ColumnStore(fs::path root) : root_(std::move(root)) {
    Logger::register_component("ColumnStore");
}

Result<void> ColumnStore::initialize() {
    std::error_code ec;
    fs::create_directories(bar_directory(), ec);
    if (!ec) {
        fs::create_directories(descriptor_directory(), ec);
    }
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create catalog layout under " + root_.string() + ": " +
                                    ec.message(),
                                "ColumnStore");
    }
    INFO("Column store ready at " << root_.string());
    return Result<void>();
}

Result<void> ColumnStore::validate_batch(const std::vector<Bar>& bars) const {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No bars to write", "ColumnStore");
    }

    const std::string& instrument_id = bars.front().instrument_id;
    const std::string& timeframe_spec = bars.front().timeframe_spec;
    if (!InstrumentId::parse(instrument_id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Instrument id must be SYMBOL.VENUE: " + instrument_id,
                                "ColumnStore");
    }
    if (timeframe_spec.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Bars have no timeframe spec",
                                "ColumnStore");
    }

    for (const auto& bar : bars) {
        if (bar.instrument_id != instrument_id || bar.timeframe_spec != timeframe_spec) {
            return make_error<void>(
                ErrorCode::INVALID_ARGUMENT,
                "A batch must hold one instrument and timeframe, got " + bar.instrument_id + " " +
                    bar.timeframe_spec + " alongside " + instrument_id + " " + timeframe_spec,
                "ColumnStore");
        }
        if (!bar.is_consistent()) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                    "Bar at " + core::format_iso8601(bar.event_time) +
                                        " violates low <= open, close <= high",
                                    "ColumnStore");
        }
    }
    return Result<void>();
}

Result<PartitionMeta> ColumnStore::write_bars(const std::vector<Bar>& bars,
                                              const std::string& correlation_id,
                                              const std::optional<TimeBounds>& bounds,
                                              AggregationSource source) {
    CorrelationScope scope(correlation_id);

    auto valid = validate_batch(bars);
    if (valid.is_error()) {
        return forward_error<PartitionMeta>(*valid.error());
    }
    if (bounds && bounds->second < bounds->first) {
        return make_error<PartitionMeta>(ErrorCode::INVALID_ARGUMENT,
                                         "Write bounds end before they start", "ColumnStore");
    }

    std::vector<Bar> sorted = bars;
    sort_and_deduplicate(sorted);

    TimeBounds file_bounds{sorted.front().event_time, sorted.back().event_time};
    if (bounds) {
        file_bounds.first = std::min(file_bounds.first, bounds->first);
        file_bounds.second = std::max(file_bounds.second, bounds->second);
    }

    PartitionKey key{sorted.front().instrument_id, sorted.front().timeframe_spec, source};

    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_partition_unlocked(key, sorted, file_bounds);
}

Result<PartitionMeta> ColumnStore::replace_range(const std::vector<Bar>& bars,
                                                 const std::string& correlation_id,
                                                 const TimeBounds& bounds,
                                                 AggregationSource source) {
    CorrelationScope scope(correlation_id);

    auto valid = validate_batch(bars);
    if (valid.is_error()) {
        return forward_error<PartitionMeta>(*valid.error());
    }
    if (bounds.second < bounds.first) {
        return make_error<PartitionMeta>(ErrorCode::INVALID_ARGUMENT,
                                         "Replace bounds end before they start", "ColumnStore");
    }

    std::vector<Bar> sorted = bars;
    sort_and_deduplicate(sorted);
    if (sorted.front().event_time < bounds.first || sorted.back().event_time > bounds.second) {
        return make_error<PartitionMeta>(ErrorCode::INVALID_ARGUMENT,
                                         "Replacement bars fall outside the replaced range",
                                         "ColumnStore");
    }

    const std::string& instrument_id = sorted.front().instrument_id;
    const std::string& timeframe_spec = sorted.front().timeframe_spec;

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::vector<PartitionMeta> superseded;
    for (auto& meta : scan_partitions(instrument_id, timeframe_spec)) {
        if (intersects(meta, bounds.first, bounds.second)) {
            superseded.push_back(std::move(meta));
        }
    }

    // The replacement is in place before anything it supersedes is touched
    auto written = write_partition_unlocked({instrument_id, timeframe_spec, source}, sorted, bounds);
    if (written.is_error()) {
        return written;
    }

    size_t removed = 0;
    for (const auto& meta : superseded) {
        if (meta.path == written.value().path) {
            continue;
        }
        auto trimmed = remove_range_unlocked(meta, bounds.first, bounds.second);
        if (trimmed.is_error()) {
            return forward_error<PartitionMeta>(*trimmed.error());
        }
        removed += trimmed.value();
    }

    INFO("Replaced " << removed << " cached bars of " << instrument_id << " " << timeframe_spec
                     << " with " << sorted.size() << " between "
                     << core::format_iso8601(bounds.first) << " and "
                     << core::format_iso8601(bounds.second));
    return written;
}

Result<PartitionMeta> ColumnStore::write_partition_unlocked(const PartitionKey& key,
                                                            const std::vector<Bar>& bars,
                                                            const TimeBounds& bounds) {
    const fs::path directory = bar_directory() / key.directory_name();
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return make_error<PartitionMeta>(ErrorCode::FILE_IO_ERROR,
                                         "Failed to create partition directory " +
                                             directory.string() + ": " + ec.message(),
                                         "ColumnStore");
    }

    auto table_result = DataConversionUtils::bars_to_arrow_table(bars);
    if (table_result.is_error()) {
        return forward_error<PartitionMeta>(*table_result.error());
    }

    const fs::path target = directory / partition_file_name(bounds.first, bounds.second);
    auto write_result = write_table(table_result.value(), target);
    if (write_result.is_error()) {
        return forward_error<PartitionMeta>(*write_result.error());
    }

    PartitionMeta meta;
    meta.key = key;
    meta.path = target;
    meta.start = bounds.first;
    meta.end = bounds.second;
    meta.row_count = static_cast<int64_t>(bars.size());
    meta.file_size = fs::file_size(target, ec);
    if (ec) {
        meta.file_size = 0;
    }

    INFO("Wrote " << bars.size() << " bars to " << key.directory_name() << "/"
                  << target.filename().string());
    return Result<PartitionMeta>(std::move(meta));
}

Result<void> ColumnStore::write_descriptor(const InstrumentDescriptor& descriptor) {
    if (!InstrumentId::parse(descriptor.instrument_id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Descriptor instrument id must be SYMBOL.VENUE: " +
                                    descriptor.instrument_id,
                                "ColumnStore");
    }

    auto table_result = DataConversionUtils::descriptors_to_arrow_table({descriptor});
    if (table_result.is_error()) {
        return forward_error<void>(*table_result.error());
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::error_code ec;
    fs::create_directories(descriptor_directory(), ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create descriptor directory: " + ec.message(),
                                "ColumnStore");
    }

    auto write_result = write_table(table_result.value(), descriptor_path(descriptor.instrument_id));
    if (write_result.is_error()) {
        return write_result;
    }

    INFO("Persisted instrument descriptor " << descriptor.instrument_id << " (venue "
                                            << descriptor.venue << ")");
    return Result<void>();
}

Result<std::vector<Bar>> ColumnStore::query(const std::string& instrument_id,
                                            const std::string& timeframe_spec,
                                            const Timestamp& start, const Timestamp& end) const {
    if (end < start) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT,
                                            "Query start is after end", "ColumnStore");
    }

    std::vector<Bar> merged;
    for (const auto& meta : scan_partitions(instrument_id, timeframe_spec)) {
        if (!intersects(meta, start, end)) {
            continue;
        }

        auto bars_result = read_bars(meta.path);
        if (bars_result.is_error()) {
            WARN("Skipping unreadable partition " << meta.path.string() << ": "
                                                  << bars_result.error()->what());
            continue;
        }

        for (auto& bar : bars_result.take_value()) {
            if (bar.event_time < start || bar.event_time > end) {
                continue;
            }
            merged.push_back(std::move(bar));
        }
    }

    sort_and_deduplicate(merged);
    DEBUG("Query " << instrument_id << " " << timeframe_spec << " returned " << merged.size()
                   << " bars");
    return Result<std::vector<Bar>>(std::move(merged));
}

Result<InstrumentDescriptor> ColumnStore::load_descriptor(const std::string& instrument_id) const {
    const fs::path path = descriptor_path(instrument_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return make_error<InstrumentDescriptor>(
            ErrorCode::DATA_NOT_FOUND, "No instrument descriptor stored for " + instrument_id,
            "ColumnStore");
    }

    auto table_result = read_table(path);
    if (table_result.is_error()) {
        return forward_error<InstrumentDescriptor>(*table_result.error());
    }

    auto descriptors = DataConversionUtils::arrow_table_to_descriptors(table_result.value());
    if (descriptors.is_error()) {
        return make_error<InstrumentDescriptor>(ErrorCode::CATALOG_CORRUPTION,
                                                "Unreadable descriptor file " + path.string() +
                                                    ": " + descriptors.error()->what(),
                                                "ColumnStore");
    }

    for (const auto& descriptor : descriptors.value()) {
        if (descriptor.instrument_id == instrument_id) {
            return Result<InstrumentDescriptor>(descriptor);
        }
    }
    return make_error<InstrumentDescriptor>(
        ErrorCode::DATA_NOT_FOUND, "No instrument descriptor stored for " + instrument_id,
        "ColumnStore");
}

bool ColumnStore::has_descriptor(const std::string& instrument_id) const {
    return load_descriptor(instrument_id).is_ok();
}

std::vector<PartitionMeta> ColumnStore::scan_partitions() const {
    std::vector<PartitionMeta> partitions;
    std::error_code ec;
    if (!fs::exists(bar_directory(), ec)) {
        return partitions;
    }

    for (const auto& entry : fs::directory_iterator(bar_directory(), ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        auto key = PartitionKey::parse(name);
        if (key.is_error()) {
            WARN("Skipping partition directory: " << key.error()->what());
            continue;
        }
        auto found = scan_directory(key.value(), entry.path());
        partitions.insert(partitions.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
    if (ec) {
        WARN("Error listing " << bar_directory().string() << ": " << ec.message());
    }
    return partitions;
}

std::vector<PartitionMeta> ColumnStore::scan_partitions(const std::string& instrument_id,
                                                        const std::string& timeframe_spec) const {
    std::vector<PartitionMeta> partitions;
    for (auto source : {AggregationSource::EXTERNAL, AggregationSource::INTERNAL}) {
        PartitionKey key{instrument_id, timeframe_spec, source};
        const fs::path directory = bar_directory() / key.directory_name();
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            continue;
        }
        auto found = scan_directory(key, directory);
        partitions.insert(partitions.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
    return partitions;
}

std::vector<PartitionMeta> ColumnStore::scan_directory(const PartitionKey& key,
                                                       const fs::path& directory) const {
    std::vector<PartitionMeta> partitions;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != PARTITION_FILE_EXTENSION) {
            continue;
        }
        auto meta = read_partition_meta(key, entry.path());
        if (meta) {
            partitions.push_back(std::move(*meta));
        }
    }

    std::sort(partitions.begin(), partitions.end(),
              [](const PartitionMeta& a, const PartitionMeta& b) {
                  return a.start < b.start || (a.start == b.start && a.end < b.end);
              });
    return partitions;
}

std::optional<PartitionMeta> ColumnStore::read_partition_meta(const PartitionKey& key,
                                                              const fs::path& path) const {
    auto bounds = parse_partition_file_name(path.filename().string());
    if (bounds.is_error()) {
        WARN("Skipping " << key.directory_name() << ": " << bounds.error()->what());
        return std::nullopt;
    }

    PartitionMeta meta;
    meta.key = key;
    meta.path = path;
    meta.start = bounds.value().first;
    meta.end = bounds.value().second;

    std::error_code ec;
    meta.file_size = fs::file_size(path, ec);
    if (ec) {
        WARN("Skipping " << path.string() << ": " << ec.message());
        return std::nullopt;
    }

    auto infile = arrow::io::ReadableFile::Open(path.string());
    if (!infile.ok()) {
        WARN("Skipping " << path.string() << ": " << infile.status().ToString());
        return std::nullopt;
    }

    try {
        auto reader = parquet::ParquetFileReader::Open(infile.ValueOrDie());
        meta.row_count = reader->metadata()->num_rows();
    } catch (const parquet::ParquetException& e) {
        WARN("Skipping partition with unreadable footer " << path.string() << ": " << e.what());
        return std::nullopt;
    }

    return meta;
}

Result<size_t> ColumnStore::delete_range(const std::string& instrument_id,
                                         const std::string& timeframe_spec,
                                         const Timestamp& start, const Timestamp& end) {
    if (end < start) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT, "Delete start is after end",
                                  "ColumnStore");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    size_t removed = 0;

    for (const auto& meta : scan_partitions(instrument_id, timeframe_spec)) {
        if (!intersects(meta, start, end)) {
            continue;
        }
        auto trimmed = remove_range_unlocked(meta, start, end);
        if (trimmed.is_error()) {
            return trimmed;
        }
        removed += trimmed.value();
    }

    INFO("Deleted " << removed << " bars of " << instrument_id << " " << timeframe_spec
                    << " between " << core::format_iso8601(start) << " and "
                    << core::format_iso8601(end));
    return Result<size_t>(removed);
}

Result<size_t> ColumnStore::remove_range_unlocked(const PartitionMeta& meta,
                                                  const Timestamp& start, const Timestamp& end) {
    std::error_code ec;
    if (meta.start >= start && meta.end <= end) {
        fs::remove(meta.path, ec);
        if (ec) {
            return make_error<size_t>(ErrorCode::FILE_IO_ERROR,
                                      "Failed to remove " + meta.path.string() + ": " +
                                          ec.message(),
                                      "ColumnStore");
        }
        DEBUG("Removed partition " << meta.path.filename().string());
        return Result<size_t>(static_cast<size_t>(meta.row_count));
    }

    auto bars_result = read_bars(meta.path);
    if (bars_result.is_error()) {
        return forward_error<size_t>(*bars_result.error());
    }

    std::vector<Bar> before;
    std::vector<Bar> after;
    size_t in_range = 0;
    for (auto& bar : bars_result.take_value()) {
        if (bar.event_time < start) {
            before.push_back(std::move(bar));
        } else if (bar.event_time > end) {
            after.push_back(std::move(bar));
        } else {
            ++in_range;
        }
    }
    if (in_range == 0) {
        return Result<size_t>(0);
    }

    // New files go in before the old one is removed
    if (!before.empty()) {
        auto written =
            write_partition_unlocked(meta.key, before, {meta.start, before.back().event_time});
        if (written.is_error()) {
            return forward_error<size_t>(*written.error());
        }
    }
    if (!after.empty()) {
        auto written =
            write_partition_unlocked(meta.key, after, {after.front().event_time, meta.end});
        if (written.is_error()) {
            return forward_error<size_t>(*written.error());
        }
    }

    fs::remove(meta.path, ec);
    if (ec) {
        return make_error<size_t>(ErrorCode::FILE_IO_ERROR,
                                  "Failed to remove " + meta.path.string() + ": " + ec.message(),
                                  "ColumnStore");
    }
    return Result<size_t>(in_range);
}

fs::path ColumnStore::descriptor_path(const std::string& instrument_id) const {
    std::string file_name = instrument_id;
    std::replace(file_name.begin(), file_name.end(), '/', '-');
    std::replace(file_name.begin(), file_name.end(), '\\', '-');
    return descriptor_directory() / (file_name + PARTITION_FILE_EXTENSION);
}

Result<std::vector<Bar>> ColumnStore::read_bars(const fs::path& path) const {
    auto table_result = read_table(path);
    if (table_result.is_error()) {
        return forward_error<std::vector<Bar>>(*table_result.error());
    }
    return DataConversionUtils::arrow_table_to_bars(table_result.value());
}

Result<std::shared_ptr<arrow::Table>> ColumnStore::read_table(const fs::path& path) const {
    using TablePtr = std::shared_ptr<arrow::Table>;

    auto infile = arrow::io::ReadableFile::Open(path.string());
    if (!infile.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + path.string() + ": " +
                                        infile.status().ToString(),
                                    "ColumnStore");
    }

    try {
        auto reader_result = parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(), parquet::ParquetFileReader::Open(infile.ValueOrDie()));
        if (!reader_result.ok()) {
            return make_error<TablePtr>(ErrorCode::CATALOG_CORRUPTION,
                                        "Failed to read Parquet file " + path.string() + ": " +
                                            reader_result.status().ToString(),
                                        "ColumnStore");
        }
        std::unique_ptr<parquet::arrow::FileReader> reader =
            std::move(reader_result).ValueOrDie();

        TablePtr table;
        auto status = reader->ReadTable(&table);
        if (!status.ok()) {
            return make_error<TablePtr>(ErrorCode::CATALOG_CORRUPTION,
                                        "Failed to read Parquet file " + path.string() + ": " +
                                            status.ToString(),
                                        "ColumnStore");
        }
        return Result<TablePtr>(table);
    } catch (const parquet::ParquetException& e) {
        return make_error<TablePtr>(ErrorCode::CATALOG_CORRUPTION,
                                    "Corrupt Parquet file " + path.string() + ": " + e.what(),
                                    "ColumnStore");
    }
}

Result<void> ColumnStore::write_table(const std::shared_ptr<arrow::Table>& table,
                                      const fs::path& target) const {
    const fs::path tmp_path = target.string() + ".tmp";
    std::error_code ec;
    fs::remove(tmp_path, ec);

    auto output_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!output_result.ok()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + tmp_path.string() + ": " +
                                    output_result.status().ToString(),
                                "ColumnStore");
    }
    std::shared_ptr<arrow::io::FileOutputStream> output = output_result.ValueOrDie();

    auto write_status = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), output,
                                                   ROW_GROUP_SIZE);
    auto close_status = output->Close();
    if (!write_status.ok() || !close_status.ok()) {
        fs::remove(tmp_path, ec);
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to write " + target.string() + ": " +
                                    (write_status.ok() ? close_status : write_status).ToString(),
                                "ColumnStore");
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to move " + tmp_path.string() + " into place: " + reason,
                                "ColumnStore");
    }
    return Result<void>();
}

}  // namespace bar_catalog

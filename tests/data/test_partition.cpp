#include <gtest/gtest.h>
#include "bar_catalog/core/time_utils.hpp"
#include "bar_catalog/data/partition.hpp"

using namespace bar_catalog;

class PartitionTest : public ::testing::Test {};

TEST_F(PartitionTest, DirectoryName) {
    PartitionKey key{"AAPL.NASDAQ", "1-MINUTE-LAST", AggregationSource::EXTERNAL};
    EXPECT_EQ(key.directory_name(), "AAPL.NASDAQ-1-MINUTE-LAST-EXTERNAL");
}

TEST_F(PartitionTest, ParseDirectoryName) {
    auto key = PartitionKey::parse("AAPL.NASDAQ-1-DAY-LAST-INTERNAL");
    ASSERT_TRUE(key.is_ok()) << key.error()->what();
    EXPECT_EQ(key.value().instrument_id, "AAPL.NASDAQ");
    EXPECT_EQ(key.value().timeframe_spec, "1-DAY-LAST");
    EXPECT_EQ(key.value().source, AggregationSource::INTERNAL);
}

TEST_F(PartitionTest, ParseKeepsDashesInInstrumentId) {
    auto key = PartitionKey::parse("BRK-B.NYSE-5-MINUTE-MID-EXTERNAL");
    ASSERT_TRUE(key.is_ok()) << key.error()->what();
    EXPECT_EQ(key.value().instrument_id, "BRK-B.NYSE");
    EXPECT_EQ(key.value().timeframe_spec, "5-MINUTE-MID");
}

TEST_F(PartitionTest, ParseRejectsMalformedNames) {
    EXPECT_EQ(PartitionKey::parse("garbage").error()->code(), ErrorCode::CATALOG_CORRUPTION);
    EXPECT_TRUE(PartitionKey::parse("AAPL.NASDAQ-1-MINUTE-LAST-SOMEWHERE").is_error());
    EXPECT_TRUE(PartitionKey::parse("AAPL-1-MINUTE-LAST-EXTERNAL").is_error());
    EXPECT_TRUE(PartitionKey::parse("").is_error());
}

TEST_F(PartitionTest, FileNameRoundTrip) {
    const Timestamp start = core::make_utc(2024, 1, 2, 9, 30);
    const Timestamp end = core::make_utc(2024, 1, 2, 10, 30, 0, 42);
    const std::string name = partition_file_name(start, end);
    EXPECT_EQ(name, "2024-01-02T09-30-00-000000000Z_2024-01-02T10-30-00-000000042Z.parquet");

    auto bounds = parse_partition_file_name(name);
    ASSERT_TRUE(bounds.is_ok());
    EXPECT_EQ(bounds.value().first, start);
    EXPECT_EQ(bounds.value().second, end);
}

TEST_F(PartitionTest, FileNameRejections) {
    EXPECT_TRUE(parse_partition_file_name("notes.txt").is_error());
    EXPECT_TRUE(parse_partition_file_name("2024-01-02T09-30-00-000000000Z.parquet").is_error());
    EXPECT_TRUE(
        parse_partition_file_name("2024-01-02_2024-01-03.parquet").is_error());

    // Impossible calendar dates
    EXPECT_TRUE(parse_partition_file_name(
                    "2024-02-30T00-00-00-000000000Z_2024-03-01T00-00-00-000000000Z.parquet")
                    .is_error());
    auto impossible_end = parse_partition_file_name(
        "2024-06-01T00-00-00-000000000Z_2024-06-31T00-00-00-000000000Z.parquet");
    ASSERT_TRUE(impossible_end.is_error());
    EXPECT_EQ(impossible_end.error()->code(), ErrorCode::CATALOG_CORRUPTION);

    // End before start
    auto reversed = parse_partition_file_name(
        "2024-01-03T00-00-00-000000000Z_2024-01-02T00-00-00-000000000Z.parquet");
    ASSERT_TRUE(reversed.is_error());
    EXPECT_EQ(reversed.error()->code(), ErrorCode::CATALOG_CORRUPTION);
}

#include <gtest/gtest.h>
#include <memory>
#include "../data/test_bar_utils.hpp"
#include "bar_catalog/catalog/availability_index.hpp"
#include "bar_catalog/data/column_store.hpp"

using namespace bar_catalog;
using namespace bar_catalog::testing;

namespace {

TimeRangeAvailability make_availability(const std::string& instrument_id,
                                        const std::string& timeframe_spec,
                                        const Timestamp& start, const Timestamp& end) {
    TimeRangeAvailability availability;
    availability.instrument_id = instrument_id;
    availability.timeframe_spec = timeframe_spec;
    availability.start = start;
    availability.end = end;
    availability.file_count = 1;
    availability.estimated_row_count = 10;
    availability.last_updated = core::now_utc();
    return availability;
}

}  // namespace

class AvailabilityIndexTest : public CatalogTestBase {
protected:
    void SetUp() override {
        CatalogTestBase::SetUp();
        store_ = std::make_shared<ColumnStore>(catalog_dir_);
        ASSERT_TRUE(store_->initialize().is_ok());
    }

    std::shared_ptr<ColumnStore> store_;
    AvailabilityIndex index_;
};

TEST_F(AvailabilityIndexTest, DayLevelCoverageComparesDates) {
    // A daily file whose last bar sits at midnight of the end date
    auto daily = make_availability("AAPL.NASDAQ", "1-DAY-LAST", core::make_utc(2024, 1, 19),
                                   core::make_utc(2024, 2, 28));

    EXPECT_TRUE(daily.covers_range(core::make_utc(2024, 1, 19), core::make_utc(2024, 2, 28)));
    EXPECT_TRUE(daily.covers_range(core::make_utc(2024, 1, 19, 14, 30),
                                   core::make_utc(2024, 2, 28, 23, 59, 59)));
    EXPECT_TRUE(daily.covers_range(core::make_utc(2024, 2, 1), core::make_utc(2024, 2, 10)));
    EXPECT_FALSE(daily.covers_range(core::make_utc(2024, 1, 18), core::make_utc(2024, 2, 28)));
    EXPECT_FALSE(daily.covers_range(core::make_utc(2024, 1, 19), core::make_utc(2024, 2, 29)));
}

TEST_F(AvailabilityIndexTest, IntradayCoverageComparesTimestamps) {
    auto minute = make_availability("AAPL.NASDAQ", "1-MINUTE-LAST",
                                    core::make_utc(2024, 1, 2, 9, 30),
                                    core::make_utc(2024, 1, 2, 10, 30));

    EXPECT_TRUE(minute.covers_range(core::make_utc(2024, 1, 2, 9, 30),
                                    core::make_utc(2024, 1, 2, 10, 30)));
    EXPECT_TRUE(minute.covers_range(core::make_utc(2024, 1, 2, 9, 45),
                                    core::make_utc(2024, 1, 2, 10, 0)));
    EXPECT_FALSE(minute.covers_range(core::make_utc(2024, 1, 2, 9, 30),
                                     core::make_utc(2024, 1, 2, 10, 31)));
    EXPECT_FALSE(minute.covers_range(core::make_utc(2024, 1, 2, 9, 29),
                                     core::make_utc(2024, 1, 2, 10, 0)));

    EXPECT_TRUE(minute.overlaps_range(core::make_utc(2024, 1, 2, 10, 0),
                                      core::make_utc(2024, 1, 2, 11, 0)));
    EXPECT_FALSE(minute.overlaps_range(core::make_utc(2024, 1, 2, 10, 31),
                                       core::make_utc(2024, 1, 2, 11, 0)));
}

TEST_F(AvailabilityIndexTest, DayLevelDetection) {
    EXPECT_TRUE(is_day_level_timeframe("1-DAY-LAST"));
    EXPECT_TRUE(is_day_level_timeframe("1-WEEK-MID"));
    EXPECT_TRUE(is_day_level_timeframe("1-MONTH-LAST"));
    EXPECT_FALSE(is_day_level_timeframe("1-MINUTE-LAST"));
    EXPECT_FALSE(is_day_level_timeframe("4-HOUR-LAST"));
}

TEST_F(AvailabilityIndexTest, RebuildMergesFilesPerKey) {
    const auto morning = core::make_utc(2024, 1, 2, 9, 30);
    const auto afternoon = core::make_utc(2024, 1, 2, 13, 0);
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("AAPL.NASDAQ", "1-MINUTE-LAST", morning,
                                           std::chrono::minutes(1), 30),
                                 "test")
                    .is_ok());
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("AAPL.NASDAQ", "1-MINUTE-LAST", afternoon,
                                           std::chrono::minutes(1), 20),
                                 "test")
                    .is_ok());
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("MSFT.NASDAQ", "1-DAY-LAST", core::make_utc(2024, 1, 2),
                                           std::chrono::hours(24), 5),
                                 "test")
                    .is_ok());

    auto rebuilt = index_.rebuild(*store_);
    EXPECT_EQ(rebuilt.size(), 2u);
    EXPECT_EQ(index_.size(), 2u);

    auto aapl = index_.get({"AAPL.NASDAQ", "1-MINUTE-LAST"});
    ASSERT_TRUE(aapl.has_value());
    EXPECT_EQ(aapl->start, morning);
    EXPECT_EQ(aapl->end, afternoon + std::chrono::minutes(19));
    EXPECT_EQ(aapl->file_count, 2u);
    EXPECT_EQ(aapl->estimated_row_count, 50);

    auto msft = index_.get({"MSFT.NASDAQ", "1-DAY-LAST"});
    ASSERT_TRUE(msft.has_value());
    EXPECT_TRUE(index_.covers_range({"MSFT.NASDAQ", "1-DAY-LAST"}, core::make_utc(2024, 1, 2),
                                    core::make_utc(2024, 1, 6)));
    EXPECT_FALSE(index_.covers_range({"MSFT.NASDAQ", "1-MINUTE-LAST"},
                                     core::make_utc(2024, 1, 2), core::make_utc(2024, 1, 6)));
}

TEST_F(AvailabilityIndexTest, RebuildOfEmptyStore) {
    ASSERT_TRUE(index_.put({"AAPL.NASDAQ", "1-MINUTE-LAST"},
                           make_availability("AAPL.NASDAQ", "1-MINUTE-LAST",
                                             core::make_utc(2024, 1, 2),
                                             core::make_utc(2024, 1, 3)))
                    .is_ok());
    EXPECT_EQ(index_.size(), 1u);

    auto rebuilt = index_.rebuild(*store_);
    EXPECT_TRUE(rebuilt.empty());
    EXPECT_EQ(index_.size(), 0u);
}

TEST_F(AvailabilityIndexTest, PutRejectsInconsistentEntries) {
    const AvailabilityKey key{"AAPL.NASDAQ", "1-MINUTE-LAST"};
    const auto start = core::make_utc(2024, 1, 2, 9, 30);
    const auto end = core::make_utc(2024, 1, 2, 10, 30);

    auto wrong_key = index_.put(key, make_availability("MSFT.NASDAQ", "1-MINUTE-LAST", start, end));
    ASSERT_TRUE(wrong_key.is_error());
    EXPECT_EQ(wrong_key.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto reversed = index_.put(key, make_availability("AAPL.NASDAQ", "1-MINUTE-LAST", end, start));
    ASSERT_TRUE(reversed.is_error());
    EXPECT_EQ(reversed.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto no_files = make_availability("AAPL.NASDAQ", "1-MINUTE-LAST", start, end);
    no_files.file_count = 0;
    EXPECT_TRUE(index_.put(key, no_files).is_error());

    auto negative_rows = make_availability("AAPL.NASDAQ", "1-MINUTE-LAST", start, end);
    negative_rows.estimated_row_count = -1;
    EXPECT_TRUE(index_.put(key, negative_rows).is_error());

    EXPECT_EQ(index_.size(), 0u);
    EXPECT_TRUE(index_.put(key, make_availability("AAPL.NASDAQ", "1-MINUTE-LAST", start, end))
                    .is_ok());
    EXPECT_TRUE(index_.covers_range(key, start, end));
}

TEST_F(AvailabilityIndexTest, RefreshTracksWritesAndDeletes) {
    const AvailabilityKey key{"AAPL.NASDAQ", "1-MINUTE-LAST"};
    const auto start = core::make_utc(2024, 1, 2, 9, 30);

    index_.refresh(*store_, key);
    EXPECT_FALSE(index_.get(key).has_value());

    ASSERT_TRUE(store_->write_bars(make_bars(key.instrument_id, key.timeframe_spec, start,
                                             std::chrono::minutes(1), 10),
                                   "test")
                    .is_ok());
    index_.refresh(*store_, key);
    auto entry = index_.get(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->estimated_row_count, 10);

    auto removed = store_->delete_range(key.instrument_id, key.timeframe_spec, start,
                                        start + std::chrono::hours(1));
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 10u);

    index_.refresh(*store_, key);
    EXPECT_FALSE(index_.get(key).has_value());
    EXPECT_FALSE(index_.overlaps_range(key, start, start + std::chrono::hours(1)));
}

TEST_F(AvailabilityIndexTest, MergeOfNothingIsEmpty) {
    EXPECT_FALSE(AvailabilityIndex::merge({}).has_value());
}

TEST_F(AvailabilityIndexTest, EntriesListsEveryKey) {
    const auto start = core::make_utc(2024, 1, 2);
    const auto end = core::make_utc(2024, 1, 5);
    ASSERT_TRUE(index_.put({"AAPL.NASDAQ", "1-DAY-LAST"},
                           make_availability("AAPL.NASDAQ", "1-DAY-LAST", start, end))
                    .is_ok());
    ASSERT_TRUE(index_.put({"ES.CME", "1-DAY-LAST"},
                           make_availability("ES.CME", "1-DAY-LAST", start, end))
                    .is_ok());

    auto entries = index_.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].instrument_id, "AAPL.NASDAQ");
    EXPECT_EQ(entries[1].instrument_id, "ES.CME");
}

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "bar_catalog/catalog/fetch_orchestrator.hpp"
#include "mock_remote_data_client.hpp"

using namespace bar_catalog;
using namespace bar_catalog::testing;

class FetchOrchestratorTest : public CatalogTestBase {
protected:
    void SetUp() override {
        CatalogTestBase::SetUp();

        config_.catalog_path = catalog_dir_.string();
        config_.max_attempts = 3;
        config_.base_delay_ms = 1;
        config_.max_delay_ms = 5;

        store_ = std::make_shared<ColumnStore>(catalog_dir_);
        index_ = std::make_shared<AvailabilityIndex>();
        rate_limiter_ = std::make_shared<RateLimiter>(1000, std::chrono::seconds(1), 1.0);
        client_ = std::make_shared<MockRemoteDataClient>();
    }

    std::unique_ptr<FetchOrchestrator> make_orchestrator(
        std::shared_ptr<RemoteDataClient> client, VenueResolver venues = VenueResolver()) {
        auto orchestrator = std::make_unique<FetchOrchestrator>(
            config_, store_, index_, rate_limiter_, std::move(client), std::move(venues));
        auto init = orchestrator->initialize();
        EXPECT_TRUE(init.is_ok());
        return orchestrator;
    }

    std::unique_ptr<FetchOrchestrator> make_orchestrator() {
        return make_orchestrator(client_);
    }

    const Timestamp open_ = core::make_utc(2024, 1, 2, 9, 30);
    const Timestamp hour_later_ = core::make_utc(2024, 1, 2, 10, 30);
    const std::string minute_ = "1-MINUTE-LAST";

    CatalogConfig config_;
    std::shared_ptr<ColumnStore> store_;
    std::shared_ptr<AvailabilityIndex> index_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<MockRemoteDataClient> client_;
};

TEST_F(FetchOrchestratorTest, MissFetchesOnceThenServesFromCatalog) {
    client_->fetch_delay = std::chrono::milliseconds(200);
    auto orchestrator = make_orchestrator();

    auto first = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(first.is_ok()) << first.error()->what();
    EXPECT_THAT(first.value(), LoadedFrom(SeriesSource::REMOTE));
    EXPECT_THAT(first.value(), HasBarCount(60));
    EXPECT_EQ(first.value().bars.front().event_time, open_);
    EXPECT_EQ(first.value().bars.back().event_time, core::make_utc(2024, 1, 2, 10, 29));
    EXPECT_EQ(first.value().descriptor.instrument_id, "AAPL.NASDAQ");
    EXPECT_EQ(client_->connect_calls.load(), 1);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
    EXPECT_EQ(rate_limiter_->in_window(), 1u);

    // Persisted: the bars, the descriptor and coverage of exactly the requested range
    auto persisted = store_->query("AAPL.NASDAQ", minute_, open_, hour_later_);
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().size(), 60u);
    EXPECT_TRUE(store_->has_descriptor("AAPL.NASDAQ"));
    EXPECT_TRUE(index_->covers_range({"AAPL.NASDAQ", minute_}, open_, hour_later_));
    auto entry = index_->get({"AAPL.NASDAQ", minute_});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->start, open_);
    EXPECT_EQ(entry->end, hour_later_);

    const auto read_started = std::chrono::steady_clock::now();
    auto second = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    const auto read_time = std::chrono::steady_clock::now() - read_started;
    ASSERT_TRUE(second.is_ok()) << second.error()->what();
    EXPECT_THAT(second.value(), LoadedFrom(SeriesSource::CATALOG));
    EXPECT_THAT(second.value(), HasBarCount(60));

    // No remote work of any kind, and faster than the provider alone
    EXPECT_EQ(client_->connect_calls.load(), 1);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 0);
    EXPECT_EQ(rate_limiter_->in_window(), 1u);
    EXPECT_LT(read_time, client_->fetch_delay);

    for (size_t i = 0; i < 60; ++i) {
        EXPECT_EQ(second.value().bars[i].event_time, first.value().bars[i].event_time);
        EXPECT_EQ(second.value().bars[i].close, first.value().bars[i].close);
    }

    // Any sub-range is covered as well
    auto inner = orchestrator->fetch_or_load("AAPL.NASDAQ", core::make_utc(2024, 1, 2, 9, 45),
                                             core::make_utc(2024, 1, 2, 10, 0), minute_);
    ASSERT_TRUE(inner.is_ok());
    EXPECT_THAT(inner.value(), LoadedFrom(SeriesSource::CATALOG));
    EXPECT_THAT(inner.value(), HasBarCount(16));
    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
}

TEST_F(FetchOrchestratorTest, CatalogSurvivesRestart) {
    {
        auto orchestrator = make_orchestrator();
        ASSERT_TRUE(orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_)
                        .is_ok());
    }

    // Fresh index and no provider: the rebuilt index must serve the range
    index_ = std::make_shared<AvailabilityIndex>();
    auto offline = make_orchestrator(nullptr);
    auto loaded = offline->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();
    EXPECT_THAT(loaded.value(), LoadedFrom(SeriesSource::CATALOG));
    EXPECT_THAT(loaded.value(), HasBarCount(60));
}

TEST_F(FetchOrchestratorTest, MissWithoutProviderIsDataNotFound) {
    auto orchestrator = make_orchestrator(nullptr);

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_NE(std::string(result.error()->what()).find("Resolution"), std::string::npos);
    EXPECT_TRUE(store_->scan_partitions().empty());
}

TEST_F(FetchOrchestratorTest, UnreachableProviderIsDataNotFound) {
    client_->fail_connect = true;
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 0);
}

TEST_F(FetchOrchestratorTest, ExhaustedRetriesLeaveCatalogUntouched) {
    for (int i = 0; i < 3; ++i) {
        client_->queue_error(ErrorCode::TIMEOUT_ERROR, "Request timed out");
    }
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::PROVIDER_UNAVAILABLE);
    EXPECT_NE(std::string(result.error()->what()).find("Request timed out"), std::string::npos);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 3);

    EXPECT_TRUE(store_->scan_partitions().empty());
    EXPECT_FALSE(store_->has_descriptor("AAPL.NASDAQ"));
    EXPECT_EQ(index_->size(), 0u);

    auto history = orchestrator->fetch_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status(), FetchStatus::FAILED);
    EXPECT_EQ(history[0].retry_count(), 3u);
}

TEST_F(FetchOrchestratorTest, RateLimitedUntilExhausted) {
    for (int i = 0; i < 3; ++i) {
        client_->queue_error(ErrorCode::RATE_LIMIT_EXCEEDED, "Pacing violation");
    }
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RATE_LIMIT_EXCEEDED);
}

TEST_F(FetchOrchestratorTest, TransientFailureIsRetried) {
    client_->queue_error(ErrorCode::CONNECTION_ERROR, "Connection reset");
    client_->queue([]() -> Result<RemoteBars> { throw std::runtime_error("Socket closed"); });
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_THAT(result.value(), HasBarCount(60));
    EXPECT_EQ(client_->fetch_bars_calls.load(), 3);

    auto history = orchestrator->fetch_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status(), FetchStatus::COMPLETED);
    EXPECT_EQ(history[0].retry_count(), 2u);
}

TEST_F(FetchOrchestratorTest, FatalErrorSurfacesWithoutRetry) {
    client_->queue_error(ErrorCode::INVALID_REQUEST, "No security definition found");
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("XYZ.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
    EXPECT_TRUE(store_->scan_partitions().empty());
}

TEST_F(FetchOrchestratorTest, EmptyProviderResultIsDataNotFound) {
    client_->queue_bars({});
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_TRUE(store_->scan_partitions().empty());
    EXPECT_EQ(orchestrator->fetch_history().back().status(), FetchStatus::FAILED);
}

TEST_F(FetchOrchestratorTest, ForeignBarsAreRejected) {
    client_->queue_bars(make_bars("MSFT.NASDAQ", minute_, open_, std::chrono::minutes(1), 5));
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_REQUEST);
    EXPECT_TRUE(store_->scan_partitions().empty());
}

TEST_F(FetchOrchestratorTest, PartialCoverageRefetchesFullRange) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(orchestrator
                    ->fetch_or_load("AAPL.NASDAQ", open_, core::make_utc(2024, 1, 2, 10, 0),
                                    minute_)
                    .is_ok());

    auto wider = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(wider.is_ok());
    EXPECT_THAT(wider.value(), LoadedFrom(SeriesSource::REMOTE));
    EXPECT_THAT(wider.value(), HasBarCount(60));
    EXPECT_EQ(client_->fetch_bars_calls.load(), 2);

    auto entry = index_->get({"AAPL.NASDAQ", minute_});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->file_count, 2u);
    EXPECT_EQ(entry->end, hour_later_);
}

TEST_F(FetchOrchestratorTest, BackfillsMissingDescriptorOnCatalogHit) {
    ASSERT_TRUE(store_->initialize().is_ok());
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("AAPL.NASDAQ", minute_, open_,
                                           std::chrono::minutes(1), 60),
                                 "seed", TimeBounds{open_, hour_later_})
                    .is_ok());
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_THAT(result.value(), LoadedFrom(SeriesSource::CATALOG));
    EXPECT_TRUE(result.value().descriptor_backfilled);
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 0);
    EXPECT_TRUE(store_->has_descriptor("AAPL.NASDAQ"));

    // The persisted descriptor is reused afterwards
    auto again = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().descriptor_backfilled);
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
}

TEST_F(FetchOrchestratorTest, RemoteBarsWithoutDescriptorTriggerBackfill) {
    client_->include_descriptor = false;
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_TRUE(result.value().descriptor_backfilled);
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
    EXPECT_TRUE(store_->has_descriptor("AAPL.NASDAQ"));
}

TEST_F(FetchOrchestratorTest, FailedBackfillIsDataNotFound) {
    ASSERT_TRUE(store_->initialize().is_ok());
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("AAPL.NASDAQ", minute_, open_,
                                           std::chrono::minutes(1), 60),
                                 "seed", TimeBounds{open_, hour_later_})
                    .is_ok());
    client_->fail_descriptor = true;
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
}

TEST_F(FetchOrchestratorTest, SynthesizedDescriptorIsNotPersisted) {
    config_.synthesize_missing_descriptor = true;
    ASSERT_TRUE(store_->initialize().is_ok());
    ASSERT_TRUE(store_
                    ->write_bars(make_bars("AAPL.NASDAQ", minute_, open_,
                                           std::chrono::minutes(1), 60),
                                 "seed", TimeBounds{open_, hour_later_})
                    .is_ok());
    auto orchestrator = make_orchestrator(nullptr);

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().descriptor.symbol, "AAPL");
    EXPECT_EQ(result.value().descriptor.venue, "NASDAQ");
    EXPECT_FALSE(result.value().descriptor_backfilled);
    EXPECT_FALSE(store_->has_descriptor("AAPL.NASDAQ"));
}

TEST_F(FetchOrchestratorTest, EnsureDescriptorFetchesOnlyDescriptor) {
    auto orchestrator = make_orchestrator();

    auto descriptor = orchestrator->ensure_descriptor("ES.CME");
    ASSERT_TRUE(descriptor.is_ok());
    EXPECT_EQ(descriptor.value().symbol, "ES");
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
    EXPECT_EQ(client_->fetch_bars_calls.load(), 0);

    ASSERT_TRUE(orchestrator->ensure_descriptor("ES.CME").is_ok());
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 1);
}

TEST_F(FetchOrchestratorTest, BackfillsOfDifferentInstrumentsRunConcurrently) {
    client_->descriptor_delay = std::chrono::milliseconds(300);
    auto orchestrator = make_orchestrator();

    const std::vector<std::string> ids = {"ES.CME", "NQ.CME", "ES.CME"};
    std::vector<int> ok(ids.size(), 0);
    std::vector<std::thread> threads;
    const auto started = std::chrono::steady_clock::now();
    for (size_t i = 0; i < ids.size(); ++i) {
        threads.emplace_back([&, i] {
            ok[i] = orchestrator->ensure_descriptor(ids[i]).is_ok() ? 1 : 0;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(std::count(ok.begin(), ok.end(), 1), 3);
    // ES is fetched once, NQ does not wait behind it
    EXPECT_EQ(client_->fetch_descriptor_calls.load(), 2);
    EXPECT_LT(elapsed, 2 * client_->descriptor_delay);
    EXPECT_TRUE(store_->has_descriptor("ES.CME"));
    EXPECT_TRUE(store_->has_descriptor("NQ.CME"));
}

TEST_F(FetchOrchestratorTest, ConcurrentIdenticalRequestsFetchOnce) {
    client_->fetch_delay = std::chrono::milliseconds(100);
    auto orchestrator = make_orchestrator();

    constexpr int kThreads = 4;
    std::vector<SeriesSource> sources(kThreads, SeriesSource::CATALOG);
    std::vector<size_t> counts(kThreads, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
            if (result.is_ok()) {
                sources[i] = result.value().source;
                counts[i] = result.value().bars.size();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
    EXPECT_EQ(std::count(sources.begin(), sources.end(), SeriesSource::REMOTE), 1);
    for (size_t count : counts) {
        EXPECT_EQ(count, 60u);
    }
    EXPECT_EQ(store_->scan_partitions().size(), 1u);
}

TEST_F(FetchOrchestratorTest, DateOnlyRangeUsesDailyBars) {
    auto orchestrator = make_orchestrator();

    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", core::make_utc(2024, 1, 19),
                                              core::make_utc(2024, 2, 28));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().timeframe_spec, "1-DAY-LAST");
    EXPECT_THAT(result.value(), HasBarCount(40));

    // Day-level coverage ignores the time of day of the request
    auto again = orchestrator->fetch_or_load("AAPL.NASDAQ", core::make_utc(2024, 1, 19),
                                             core::make_utc(2024, 2, 28, 23, 59, 59),
                                             std::string("1-DAY-LAST"));
    ASSERT_TRUE(again.is_ok());
    EXPECT_THAT(again.value(), LoadedFrom(SeriesSource::CATALOG));
    EXPECT_EQ(client_->fetch_bars_calls.load(), 1);
}

TEST_F(FetchOrchestratorTest, VenueResolution) {
    auto orchestrator = make_orchestrator();
    auto result = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().venue, "NASDAQ");
    EXPECT_EQ(result.value().venue_resolver, "descriptor");

    VenueResolver backtest;
    backtest.add("override", VenueResolver::fixed("BACKTEST"));
    auto overridden = make_orchestrator(client_, std::move(backtest));
    auto loaded = overridden->fetch_or_load("AAPL.NASDAQ", open_, hour_later_, minute_);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().venue, "BACKTEST");
    EXPECT_EQ(loaded.value().venue_resolver, "override");
}

TEST_F(FetchOrchestratorTest, RejectsMalformedRequests) {
    auto orchestrator = make_orchestrator();

    auto bad_id = orchestrator->fetch_or_load("AAPL", open_, hour_later_, minute_);
    ASSERT_TRUE(bad_id.is_error());
    EXPECT_EQ(bad_id.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto reversed = orchestrator->fetch_or_load("AAPL.NASDAQ", hour_later_, open_, minute_);
    ASSERT_TRUE(reversed.is_error());
    EXPECT_EQ(reversed.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto bad_spec = orchestrator->fetch_or_load("AAPL.NASDAQ", open_, hour_later_,
                                                std::string("minutely"));
    ASSERT_TRUE(bad_spec.is_error());
    EXPECT_EQ(bad_spec.error()->code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(client_->fetch_bars_calls.load(), 0);
}

TEST_F(FetchOrchestratorTest, RequiresCollaborators) {
    EXPECT_THROW(FetchOrchestrator(config_, nullptr, index_, rate_limiter_, client_),
                 std::invalid_argument);
    EXPECT_THROW(FetchOrchestrator(config_, store_, index_, nullptr, client_),
                 std::invalid_argument);
}

//===== fetch_orchestrator.hpp =====
#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "bar_catalog/catalog/availability_index.hpp"
#include "bar_catalog/catalog/catalog_config.hpp"
#include "bar_catalog/catalog/fetch_request.hpp"
#include "bar_catalog/catalog/rate_limiter.hpp"
#include "bar_catalog/catalog/retry_policy.hpp"
#include "bar_catalog/catalog/timeframe.hpp"
#include "bar_catalog/catalog/venue_resolver.hpp"
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"
#include "bar_catalog/data/column_store.hpp"
#include "bar_catalog/data/remote_data_client.hpp"

namespace bar_catalog {

enum class SeriesSource { CATALOG, REMOTE };

std::string series_source_to_string(SeriesSource source);

/**
 * @brief Result of fetch_or_load
 */
struct LoadedSeries {
    std::vector<Bar> bars;
    InstrumentDescriptor descriptor;
    std::string timeframe_spec;
    std::string venue;
    std::string venue_resolver;
    SeriesSource source{SeriesSource::CATALOG};
    bool descriptor_backfilled{false};
};

/**
 * @brief Serves bar requests from the local catalog and fills misses remotely
 *
 * A covered request is read from the column store. A miss connects the remote
 * client on first use, takes a rate-limit slot per attempt, fetches under the
 * retry policy and persists the descriptor, then the bars, then refreshes the
 * index before returning. A failed fetch leaves the catalog untouched.
 *
 * At most one remote fetch per (instrument, timeframe, range) runs at a time.
 * Identical concurrent requests wait for it and then read the catalog.
 */
class FetchOrchestrator {
public:
    /**
     * @param config Catalog settings
     * @param store Column store shared with importers and listing tools
     * @param index Availability index, constructed once per process
     * @param rate_limiter Throttle shared by every fetch of the process
     * @param client Remote provider, may be null when working offline
     * @param venues Venue resolver chain; empty means the default chain
     */
    FetchOrchestrator(CatalogConfig config, std::shared_ptr<ColumnStore> store,
                      std::shared_ptr<AvailabilityIndex> index,
                      std::shared_ptr<RateLimiter> rate_limiter,
                      std::shared_ptr<RemoteDataClient> client,
                      VenueResolver venues = VenueResolver());

    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    /**
     * @brief Create the catalog layout and rebuild the availability index
     * @return Result indicating success or failure
     */
    Result<void> initialize();

    /**
     * @brief Bars of [start, end] with a usable descriptor
     *
     * @param instrument_id SYMBOL.VENUE
     * @param timeframe_spec Explicit timeframe, or nullopt to detect it from start
     * @return DATA_NOT_FOUND when the range is not cached and no provider is
     *         reachable, PROVIDER_UNAVAILABLE or RATE_LIMIT_EXCEEDED when
     *         retries ran out, the provider's error when it was fatal
     */
    Result<LoadedSeries> fetch_or_load(const std::string& instrument_id, const Timestamp& start,
                                       const Timestamp& end,
                                       const std::optional<std::string>& timeframe_spec =
                                           std::nullopt);

    /**
     * @brief The stored descriptor, backfilled once from the provider if missing
     * Only the descriptor is fetched, never bars.
     */
    Result<InstrumentDescriptor> ensure_descriptor(const std::string& instrument_id);

    /**
     * @brief Remote fetches tracked so far, oldest first
     */
    std::vector<FetchRequest> fetch_history() const;

    const CatalogConfig& config() const {
        return config_;
    }

    const RetryPolicy& retry_policy() const {
        return retry_policy_;
    }

private:
    Result<LoadedSeries> load_from_catalog(const std::string& instrument_id,
                                           const std::string& timeframe_spec,
                                           const Timestamp& start, const Timestamp& end);

    Result<LoadedSeries> fetch_from_remote(const std::string& instrument_id,
                                           const std::string& timeframe_spec,
                                           const Timestamp& start, const Timestamp& end,
                                           const std::string& request_id);

    Result<InstrumentDescriptor> ensure_descriptor_impl(const std::string& instrument_id,
                                                        bool& backfilled);

    Result<InstrumentDescriptor> fallback_descriptor(const std::string& instrument_id,
                                                     const CatalogError& cause) const;

    Result<void> ensure_connected();

    Result<RemoteBars> fetch_with_retry(FetchRequest& request);

    void record(const FetchRequest& request);

    static std::string inflight_key(const AvailabilityKey& key, const Timestamp& start,
                                    const Timestamp& end);

    CatalogConfig config_;
    std::shared_ptr<ColumnStore> store_;
    std::shared_ptr<AvailabilityIndex> index_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<RemoteDataClient> client_;
    VenueResolver venues_;
    TimeframeResolver timeframe_resolver_;
    RetryPolicy retry_policy_;

    std::mutex connect_mutex_;

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    std::set<std::string> inflight_;

    mutable std::mutex history_mutex_;
    std::deque<FetchRequest> history_;
};

}  // namespace bar_catalog

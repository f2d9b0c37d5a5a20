//===== fetch_orchestrator.cpp =====

#include "bar_catalog/catalog/fetch_orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include "bar_catalog/core/logger.hpp"
#include "bar_catalog/core/request_id_generator.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

namespace {

constexpr size_t MAX_HISTORY = 1000;

const char* const NO_PROVIDER_STEPS =
    " Resolution: start the market-data provider and retry, check its connection in the logs, "
    "or import the bars from CSV.";

const char* const EXHAUSTED_STEPS =
    " Resolution: wait for the provider to recover and retry, reduce the request rate, or "
    "import the bars from CSV.";

// Removes the in-flight marker of a fetch when it goes out of scope
class InflightGuard {
public:
    InflightGuard(std::mutex& mutex, std::condition_variable& cv, std::set<std::string>& inflight,
                  std::string key)
        : mutex_(mutex), cv_(cv), inflight_(inflight), key_(std::move(key)) {}

    ~InflightGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_.erase(key_);
        }
        cv_.notify_all();
    }

    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::set<std::string>& inflight_;
    std::string key_;
};

}  // namespace

std::string series_source_to_string(SeriesSource source) {
    return source == SeriesSource::REMOTE ? "REMOTE" : "CATALOG";
}

FetchOrchestrator::FetchOrchestrator(CatalogConfig config, std::shared_ptr<ColumnStore> store,
                                     std::shared_ptr<AvailabilityIndex> index,
                                     std::shared_ptr<RateLimiter> rate_limiter,
                                     std::shared_ptr<RemoteDataClient> client,
                                     VenueResolver venues)
    : config_(std::move(config)),
      store_(std::move(store)),
      index_(std::move(index)),
      rate_limiter_(std::move(rate_limiter)),
      client_(std::move(client)),
      venues_(std::move(venues)),
      timeframe_resolver_(config_.day_timeframe, config_.intraday_timeframe) {
    Logger::register_component("FetchOrchestrator");

    if (!store_ || !index_ || !rate_limiter_) {
        throw std::invalid_argument(
            "FetchOrchestrator needs a column store, an availability index and a rate limiter");
    }
    if (venues_.size() == 0) {
        venues_ = VenueResolver::default_chain(config_.default_venue);
    }

    retry_policy_.max_attempts = config_.max_attempts;
    retry_policy_.base_delay = config_.base_delay();
    retry_policy_.multiplier = config_.backoff_multiplier;
    retry_policy_.max_delay = config_.max_delay();
}

Result<void> FetchOrchestrator::initialize() {
    auto store_result = store_->initialize();
    if (store_result.is_error()) {
        return store_result;
    }
    index_->rebuild(*store_);
    return Result<void>();
}

Result<LoadedSeries> FetchOrchestrator::fetch_or_load(
    const std::string& instrument_id, const Timestamp& start, const Timestamp& end,
    const std::optional<std::string>& timeframe_spec) {
    if (!InstrumentId::parse(instrument_id)) {
        return make_error<LoadedSeries>(ErrorCode::INVALID_ARGUMENT,
                                        "Instrument id must be SYMBOL.VENUE, got '" +
                                            instrument_id + "'",
                                        "FetchOrchestrator");
    }

    auto resolved = timeframe_resolver_.resolve(timeframe_spec, start, end);
    if (resolved.is_error()) {
        return forward_error<LoadedSeries>(*resolved.error());
    }
    const std::string spec = resolved.value();

    const std::string request_id = RequestIdGenerator::next("FETCH");
    CorrelationScope scope(request_id);

    const AvailabilityKey key{instrument_id, spec};
    if (index_->covers_range(key, start, end)) {
        DEBUG("Cache hit for " << key.to_string());
        return load_from_catalog(instrument_id, spec, start, end);
    }

    const std::string flight = inflight_key(key, start, end);
    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        inflight_cv_.wait(lock, [&] { return inflight_.count(flight) == 0; });

        // An identical fetch may have completed while this one waited
        if (index_->covers_range(key, start, end)) {
            lock.unlock();
            DEBUG("Cache filled by a concurrent fetch for " << key.to_string());
            return load_from_catalog(instrument_id, spec, start, end);
        }
        inflight_.insert(flight);
    }
    InflightGuard guard(inflight_mutex_, inflight_cv_, inflight_, flight);

    if (index_->overlaps_range(key, start, end)) {
        INFO("Partial coverage for " << key.to_string() << ", fetching the full range "
                                     << core::format_iso8601(start) << " to "
                                     << core::format_iso8601(end));
    } else {
        INFO("Cache miss for " << key.to_string() << " " << core::format_iso8601(start) << " to "
                               << core::format_iso8601(end));
    }

    return fetch_from_remote(instrument_id, spec, start, end, request_id);
}

Result<LoadedSeries> FetchOrchestrator::load_from_catalog(const std::string& instrument_id,
                                                          const std::string& timeframe_spec,
                                                          const Timestamp& start,
                                                          const Timestamp& end) {
    auto bars = store_->query(instrument_id, timeframe_spec, start, end);
    if (bars.is_error()) {
        return forward_error<LoadedSeries>(*bars.error());
    }

    LoadedSeries series;
    series.bars = bars.take_value();
    series.timeframe_spec = timeframe_spec;
    series.source = SeriesSource::CATALOG;

    auto descriptor = ensure_descriptor_impl(instrument_id, series.descriptor_backfilled);
    if (descriptor.is_error()) {
        return forward_error<LoadedSeries>(*descriptor.error());
    }
    series.descriptor = descriptor.take_value();

    auto venue = venues_.resolve(VenueContext{instrument_id, &series.descriptor, &series.bars});
    if (venue.is_error()) {
        return forward_error<LoadedSeries>(*venue.error());
    }
    series.venue = venue.value().venue;
    series.venue_resolver = venue.value().resolver;

    INFO("Loaded " << series.bars.size() << " bars of " << instrument_id << " "
                   << timeframe_spec << " from catalog");
    return Result<LoadedSeries>(std::move(series));
}

Result<LoadedSeries> FetchOrchestrator::fetch_from_remote(const std::string& instrument_id,
                                                          const std::string& timeframe_spec,
                                                          const Timestamp& start,
                                                          const Timestamp& end,
                                                          const std::string& request_id) {
    auto connected = ensure_connected();
    if (connected.is_error()) {
        return make_error<LoadedSeries>(
            ErrorCode::DATA_NOT_FOUND,
            "No cached bars for " + instrument_id + " " + timeframe_spec + " between " +
                core::format_iso8601(start) + " and " + core::format_iso8601(end) +
                " and the provider is unavailable (" + connected.error()->what() + ")." +
                NO_PROVIDER_STEPS,
            "FetchOrchestrator");
    }

    FetchRequest request(request_id, instrument_id, timeframe_spec, start, end,
                         std::max<size_t>(1, retry_policy_.max_attempts));
    const auto started = std::chrono::steady_clock::now();

    auto fetched = fetch_with_retry(request);
    if (fetched.is_error()) {
        record(request);
        const auto* error = fetched.error();
        if (!RetryPolicy::is_retryable(error->code())) {
            ERROR("Fetch of " << instrument_id << " failed: " << error->what());
            return forward_error<LoadedSeries>(*error);
        }

        const ErrorCode code = error->code() == ErrorCode::RATE_LIMIT_EXCEEDED
                                   ? ErrorCode::RATE_LIMIT_EXCEEDED
                                   : ErrorCode::PROVIDER_UNAVAILABLE;
        ERROR("Fetch of " << instrument_id << " failed after " << request.retry_count()
                          << " attempts: " << error->what());
        return make_error<LoadedSeries>(
            code,
            "Fetching " + instrument_id + " " + timeframe_spec + " failed after " +
                std::to_string(request.retry_count()) + " attempts, last error: " +
                error->what() + "." + EXHAUSTED_STEPS,
            "FetchOrchestrator");
    }

    RemoteBars remote = fetched.take_value();

    // Normalize the batch before anything touches the catalog
    for (auto& bar : remote.bars) {
        if (bar.instrument_id.empty()) {
            bar.instrument_id = instrument_id;
        }
        if (bar.timeframe_spec.empty()) {
            bar.timeframe_spec = timeframe_spec;
        }
        if (bar.instrument_id != instrument_id || bar.timeframe_spec != timeframe_spec) {
            auto failed = request.mark_failed("Provider returned bars of " + bar.instrument_id +
                                              " " + bar.timeframe_spec);
            record(request);
            if (failed.is_error()) {
                return forward_error<LoadedSeries>(*failed.error());
            }
            return make_error<LoadedSeries>(
                ErrorCode::INVALID_REQUEST,
                "Provider returned bars of " + bar.instrument_id + " " + bar.timeframe_spec +
                    " for a request of " + instrument_id + " " + timeframe_spec,
                "FetchOrchestrator");
        }
    }

    if (remote.bars.empty()) {
        auto failed = request.mark_failed("Provider returned no bars");
        record(request);
        if (failed.is_error()) {
            return forward_error<LoadedSeries>(*failed.error());
        }
        WARN("Provider returned no bars for " << instrument_id << " " << timeframe_spec);
        return make_error<LoadedSeries>(
            ErrorCode::DATA_NOT_FOUND,
            "The provider has no " + timeframe_spec + " bars for " + instrument_id + " between " +
                core::format_iso8601(start) + " and " + core::format_iso8601(end) +
                ". Check the symbol, its venue and the date range.",
            "FetchOrchestrator");
    }

    sort_and_deduplicate(remote.bars);

    // Descriptor first: bars must never be visible without one
    InstrumentDescriptor descriptor;
    bool descriptor_backfilled = false;
    if (remote.descriptor) {
        descriptor = *remote.descriptor;
        if (descriptor.instrument_id.empty()) {
            descriptor.instrument_id = instrument_id;
        }
        auto written = store_->write_descriptor(descriptor);
        if (written.is_error()) {
            auto failed = request.mark_failed(written.error()->what());
            record(request);
            if (failed.is_error()) {
                return forward_error<LoadedSeries>(*failed.error());
            }
            return forward_error<LoadedSeries>(*written.error());
        }
    } else {
        auto ensured = ensure_descriptor_impl(instrument_id, descriptor_backfilled);
        if (ensured.is_error()) {
            auto failed = request.mark_failed(ensured.error()->what());
            record(request);
            if (failed.is_error()) {
                return forward_error<LoadedSeries>(*failed.error());
            }
            return forward_error<LoadedSeries>(*ensured.error());
        }
        descriptor = ensured.take_value();
    }

    auto written = store_->write_bars(remote.bars, request_id, TimeBounds{start, end});
    if (written.is_error()) {
        auto failed = request.mark_failed(written.error()->what());
        record(request);
        if (failed.is_error()) {
            return forward_error<LoadedSeries>(*failed.error());
        }
        return forward_error<LoadedSeries>(*written.error());
    }

    index_->refresh(*store_, AvailabilityKey{instrument_id, timeframe_spec});

    auto completed = request.mark_completed();
    record(request);
    if (completed.is_error()) {
        return forward_error<LoadedSeries>(*completed.error());
    }

    LoadedSeries series;
    series.timeframe_spec = timeframe_spec;
    series.source = SeriesSource::REMOTE;
    series.descriptor = std::move(descriptor);
    series.descriptor_backfilled = descriptor_backfilled;
    for (auto& bar : remote.bars) {
        if (bar.event_time >= start && bar.event_time <= end) {
            series.bars.push_back(std::move(bar));
        }
    }

    auto venue = venues_.resolve(VenueContext{instrument_id, &series.descriptor, &series.bars});
    if (venue.is_error()) {
        return forward_error<LoadedSeries>(*venue.error());
    }
    series.venue = venue.value().venue;
    series.venue_resolver = venue.value().resolver;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    INFO("Fetched and persisted " << written.value().row_count << " bars of " << instrument_id
                                  << " " << timeframe_spec << " in " << elapsed.count()
                                  << "ms");
    return Result<LoadedSeries>(std::move(series));
}

Result<RemoteBars> FetchOrchestrator::fetch_with_retry(FetchRequest& request) {
    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.fetch_timeout());

    return retry_policy_.execute([&](size_t attempt) -> Result<RemoteBars> {
        if (attempt > 1) {
            auto reset = request.reset_for_retry();
            if (reset.is_error()) {
                return forward_error<RemoteBars>(*reset.error());
            }
        }
        auto started = request.mark_in_progress();
        if (started.is_error()) {
            return forward_error<RemoteBars>(*started.error());
        }

        rate_limiter_->acquire();
        DEBUG("Requesting " << request.instrument_id() << " " << request.timeframe_spec()
                            << ", attempt " << attempt);

        Result<RemoteBars> result = [&]() -> Result<RemoteBars> {
            try {
                return client_->fetch_bars(request.instrument_id(), request.start(),
                                           request.end(), request.timeframe_spec(), timeout);
            } catch (const std::exception& e) {
                return make_error<RemoteBars>(ErrorCode::CONNECTION_ERROR,
                                              std::string("Remote fetch threw: ") + e.what(),
                                              "FetchOrchestrator");
            }
        }();

        if (result.is_error()) {
            auto failed = request.mark_failed(result.error()->what());
            if (failed.is_error()) {
                return forward_error<RemoteBars>(*failed.error());
            }
        }
        return result;
    });
}

Result<InstrumentDescriptor> FetchOrchestrator::ensure_descriptor(
    const std::string& instrument_id) {
    bool backfilled = false;
    return ensure_descriptor_impl(instrument_id, backfilled);
}

Result<InstrumentDescriptor> FetchOrchestrator::ensure_descriptor_impl(
    const std::string& instrument_id, bool& backfilled) {
    backfilled = false;

    auto stored = store_->load_descriptor(instrument_id);
    if (stored.is_ok()) {
        return stored;
    }
    if (stored.error()->code() != ErrorCode::DATA_NOT_FOUND) {
        WARN("Stored descriptor of " << instrument_id << " is unreadable, backfilling: "
                                     << stored.error()->what());
    }

    // One backfill per instrument at a time; a concurrent caller may already have written it
    const std::string flight = "descriptor:" + instrument_id;
    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        inflight_cv_.wait(lock, [&] { return inflight_.count(flight) == 0; });
        inflight_.insert(flight);
    }
    InflightGuard guard(inflight_mutex_, inflight_cv_, inflight_, flight);

    auto rechecked = store_->load_descriptor(instrument_id);
    if (rechecked.is_ok()) {
        return rechecked;
    }

    INFO("Descriptor of " << instrument_id << " missing, backfilling from provider");

    auto connected = ensure_connected();
    if (connected.is_error()) {
        return fallback_descriptor(instrument_id, *connected.error());
    }

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.fetch_timeout());
    auto fetched = retry_policy_.execute([&](size_t) -> Result<InstrumentDescriptor> {
        rate_limiter_->acquire();
        try {
            return client_->fetch_descriptor(instrument_id, timeout);
        } catch (const std::exception& e) {
            return make_error<InstrumentDescriptor>(
                ErrorCode::CONNECTION_ERROR, std::string("Descriptor fetch threw: ") + e.what(),
                "FetchOrchestrator");
        }
    });
    if (fetched.is_error()) {
        return fallback_descriptor(instrument_id, *fetched.error());
    }

    InstrumentDescriptor descriptor = fetched.take_value();
    if (descriptor.instrument_id.empty()) {
        descriptor.instrument_id = instrument_id;
    }
    auto written = store_->write_descriptor(descriptor);
    if (written.is_error()) {
        return forward_error<InstrumentDescriptor>(*written.error());
    }

    backfilled = true;
    INFO("Backfilled descriptor of " << instrument_id);
    return Result<InstrumentDescriptor>(std::move(descriptor));
}

Result<InstrumentDescriptor> FetchOrchestrator::fallback_descriptor(
    const std::string& instrument_id, const CatalogError& cause) const {
    if (!config_.synthesize_missing_descriptor) {
        return make_error<InstrumentDescriptor>(
            ErrorCode::DATA_NOT_FOUND,
            "No descriptor for " + instrument_id + " and backfill failed (" + cause.what() +
                ")." + NO_PROVIDER_STEPS,
            "FetchOrchestrator");
    }

    auto id = InstrumentId::parse(instrument_id);
    if (!id) {
        return make_error<InstrumentDescriptor>(
            ErrorCode::INVALID_ARGUMENT, "Cannot synthesize a descriptor for " + instrument_id,
            "FetchOrchestrator");
    }

    WARN("Backfill of " << instrument_id << " failed (" << cause.what()
                        << "), using a synthesized descriptor that is not persisted");
    InstrumentDescriptor descriptor;
    descriptor.instrument_id = instrument_id;
    descriptor.symbol = id->symbol;
    descriptor.venue = id->venue;
    return Result<InstrumentDescriptor>(std::move(descriptor));
}

Result<void> FetchOrchestrator::ensure_connected() {
    if (!client_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No remote data client configured",
                                "FetchOrchestrator");
    }

    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (client_->is_connected()) {
        return Result<void>();
    }

    INFO("Connecting to remote data provider");
    auto connected = client_->connect(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.connect_timeout()));
    if (connected.is_error()) {
        WARN("Remote data provider unavailable: " << connected.error()->what());
        return connected;
    }
    return Result<void>();
}

void FetchOrchestrator::record(const FetchRequest& request) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(request);
    while (history_.size() > MAX_HISTORY) {
        history_.pop_front();
    }
}

std::vector<FetchRequest> FetchOrchestrator::fetch_history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return std::vector<FetchRequest>(history_.begin(), history_.end());
}

std::string FetchOrchestrator::inflight_key(const AvailabilityKey& key, const Timestamp& start,
                                            const Timestamp& end) {
    return key.instrument_id + "|" + key.timeframe_spec + "|" +
           std::to_string(core::to_unix_nanos(start)) + "|" +
           std::to_string(core::to_unix_nanos(end));
}

}  // namespace bar_catalog

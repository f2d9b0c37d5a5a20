//===== remote_data_client.hpp =====
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief One response of the remote provider
 */
struct RemoteBars {
    std::vector<Bar> bars;
    std::optional<InstrumentDescriptor> descriptor;
};

/**
 * @brief Abstract interface for the remote market-data provider
 *
 * Connection settings and the wire protocol belong to the implementation.
 * Implementations report provider quota rejections as RATE_LIMIT_EXCEEDED,
 * timeouts as TIMEOUT_ERROR and dropped connections as CONNECTION_ERROR;
 * those are retried. Any other error code is treated as fatal.
 */
class RemoteDataClient {
public:
    virtual ~RemoteDataClient() = default;

    /**
     * @brief Connect to the provider
     * @param timeout Maximum time to wait for the connection
     * @return Result indicating success or failure
     */
    virtual Result<void> connect(std::chrono::milliseconds timeout) = 0;

    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief Fetch the bars of [start, end]
     * @param instrument_id SYMBOL.VENUE
     * @param timeframe_spec e.g. "1-MINUTE-LAST"
     * @param timeout Limit for this single attempt
     * @return Bars plus the instrument descriptor when the provider has one
     */
    virtual Result<RemoteBars> fetch_bars(const std::string& instrument_id,
                                          const Timestamp& start, const Timestamp& end,
                                          const std::string& timeframe_spec,
                                          std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Fetch only the descriptor of an instrument
     */
    virtual Result<InstrumentDescriptor> fetch_descriptor(const std::string& instrument_id,
                                                          std::chrono::milliseconds timeout) = 0;
};

}  // namespace bar_catalog

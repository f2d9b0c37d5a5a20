//===== catalog_config.hpp =====
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "bar_catalog/core/config_base.hpp"

namespace bar_catalog {

/**
 * @brief Settings for the catalog, the remote provider throttle and retries
 */
struct CatalogConfig : public ConfigBase {
    std::string catalog_path{"./catalog"};

    // Provider throttle
    size_t requests_per_second{50};
    double rate_limit_safety_fraction{0.9};

    // Retry policy
    size_t max_attempts{3};
    int64_t base_delay_ms{2000};
    double backoff_multiplier{2.0};
    int64_t max_delay_ms{60000};

    // Remote client
    int64_t fetch_timeout_seconds{120};
    int64_t connect_timeout_seconds{30};

    std::string default_venue{"SIM"};
    std::string day_timeframe{"1-DAY-LAST"};
    std::string intraday_timeframe{"1-MINUTE-LAST"};

    // Build an unpersisted descriptor from the instrument id when backfill fails
    bool synthesize_missing_descriptor{false};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Override catalog_path from BAR_CATALOG_PATH when it is set
     * @return true if the environment variable was applied
     */
    bool apply_environment();

    /**
     * @brief Check ranges and timeframe strings
     */
    Result<void> validate() const;

    std::chrono::milliseconds base_delay() const {
        return std::chrono::milliseconds(base_delay_ms);
    }
    std::chrono::milliseconds max_delay() const {
        return std::chrono::milliseconds(max_delay_ms);
    }
    std::chrono::seconds fetch_timeout() const {
        return std::chrono::seconds(fetch_timeout_seconds);
    }
    std::chrono::seconds connect_timeout() const {
        return std::chrono::seconds(connect_timeout_seconds);
    }
};

}  // namespace bar_catalog

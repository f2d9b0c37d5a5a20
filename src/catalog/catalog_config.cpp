//===== catalog_config.cpp =====

#include "bar_catalog/catalog/catalog_config.hpp"
#include <cstdlib>
#include "bar_catalog/catalog/timeframe.hpp"

namespace bar_catalog {

nlohmann::json CatalogConfig::to_json() const {
    nlohmann::json j;
    j["catalog_path"] = catalog_path;
    j["requests_per_second"] = requests_per_second;
    j["rate_limit_safety_fraction"] = rate_limit_safety_fraction;
    j["max_attempts"] = max_attempts;
    j["base_delay_ms"] = base_delay_ms;
    j["backoff_multiplier"] = backoff_multiplier;
    j["max_delay_ms"] = max_delay_ms;
    j["fetch_timeout_seconds"] = fetch_timeout_seconds;
    j["connect_timeout_seconds"] = connect_timeout_seconds;
    j["default_venue"] = default_venue;
    j["day_timeframe"] = day_timeframe;
    j["intraday_timeframe"] = intraday_timeframe;
    j["synthesize_missing_descriptor"] = synthesize_missing_descriptor;
    return j;
}

void CatalogConfig::from_json(const nlohmann::json& j) {
    if (j.contains("catalog_path"))
        catalog_path = j.at("catalog_path").get<std::string>();
    if (j.contains("requests_per_second"))
        requests_per_second = j.at("requests_per_second").get<size_t>();
    if (j.contains("rate_limit_safety_fraction"))
        rate_limit_safety_fraction = j.at("rate_limit_safety_fraction").get<double>();
    if (j.contains("max_attempts"))
        max_attempts = j.at("max_attempts").get<size_t>();
    if (j.contains("base_delay_ms"))
        base_delay_ms = j.at("base_delay_ms").get<int64_t>();
    if (j.contains("backoff_multiplier"))
        backoff_multiplier = j.at("backoff_multiplier").get<double>();
    if (j.contains("max_delay_ms"))
        max_delay_ms = j.at("max_delay_ms").get<int64_t>();
    if (j.contains("fetch_timeout_seconds"))
        fetch_timeout_seconds = j.at("fetch_timeout_seconds").get<int64_t>();
    if (j.contains("connect_timeout_seconds"))
        connect_timeout_seconds = j.at("connect_timeout_seconds").get<int64_t>();
    if (j.contains("default_venue"))
        default_venue = j.at("default_venue").get<std::string>();
    if (j.contains("day_timeframe"))
        day_timeframe = j.at("day_timeframe").get<std::string>();
    if (j.contains("intraday_timeframe"))
        intraday_timeframe = j.at("intraday_timeframe").get<std::string>();
    if (j.contains("synthesize_missing_descriptor"))
        synthesize_missing_descriptor = j.at("synthesize_missing_descriptor").get<bool>();
}

bool CatalogConfig::apply_environment() {
    const char* env_path = std::getenv("BAR_CATALOG_PATH");
    if (env_path == nullptr || env_path[0] == '\0') {
        return false;
    }
    catalog_path = env_path;
    return true;
}

Result<void> CatalogConfig::validate() const {
    if (catalog_path.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "catalog_path must not be empty",
                                "CatalogConfig");
    }
    if (requests_per_second == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "requests_per_second must be positive", "CatalogConfig");
    }
    if (rate_limit_safety_fraction <= 0.0 || rate_limit_safety_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "rate_limit_safety_fraction must be in (0, 1]", "CatalogConfig");
    }
    if (max_attempts == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_attempts must be at least 1",
                                "CatalogConfig");
    }
    if (base_delay_ms < 0 || max_delay_ms < 0 || backoff_multiplier < 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Retry delays must be non-negative and the multiplier >= 1",
                                "CatalogConfig");
    }
    if (fetch_timeout_seconds <= 0 || connect_timeout_seconds <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Timeouts must be positive",
                                "CatalogConfig");
    }
    if (default_venue.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "default_venue must not be empty",
                                "CatalogConfig");
    }
    for (const auto& spec : {day_timeframe, intraday_timeframe}) {
        auto parsed = TimeframeSpec::parse(spec);
        if (parsed.is_error()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid timeframe in config: " + spec, "CatalogConfig");
        }
    }
    return Result<void>();
}

}  // namespace bar_catalog

//===== request_id_generator.hpp =====
// Ids for tracked fetch requests and log correlation
#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief Generates process-unique request ids
 *
 * Format: "{PREFIX}_{YYYYMMDD_HHMMSS_MMM}_{SEQUENCE}", e.g.
 * "FETCH_20240102_093000_125_000007". The sequence is shared by all
 * prefixes and strictly increases within the process.
 */
class RequestIdGenerator {
public:
    static std::string next(const std::string& prefix);

    static std::string generate(const std::string& prefix, const Timestamp& timestamp,
                                uint64_t sequence);

    /**
     * @brief "YYYYMMDD_HHMMSS_MMM" in UTC
     */
    static std::string generate_timestamp_string(const Timestamp& timestamp);

private:
    static std::atomic<uint64_t> sequence_;
};

}  // namespace bar_catalog

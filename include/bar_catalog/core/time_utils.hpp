//===== time_utils.hpp =====
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Current wall-clock time as a nanosecond UTC timestamp
 */
inline Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/**
 * @brief Nanoseconds since the Unix epoch
 */
inline int64_t to_unix_nanos(const Timestamp& ts) {
    return ts.time_since_epoch().count();
}

inline Timestamp from_unix_nanos(int64_t nanos) {
    return Timestamp(std::chrono::nanoseconds(nanos));
}

/**
 * @brief Build a UTC timestamp from calendar fields
 */
Timestamp make_utc(int year, unsigned month, unsigned day, unsigned hour = 0,
                   unsigned minute = 0, unsigned second = 0, uint32_t nanos = 0);

/**
 * @brief Days since 1970-01-01 of the UTC calendar date containing ts
 */
int64_t utc_day_number(const Timestamp& ts);

/**
 * @brief True when ts falls exactly on UTC midnight
 */
bool is_midnight_utc(const Timestamp& ts);

/**
 * @brief Format as "2024-01-02T09:30:00.000000000Z"
 */
std::string format_iso8601(const Timestamp& ts);

/**
 * @brief Fixed-width, colon-free form used in partition file names
 * e.g. "2024-01-02T09-30-00-000000000Z"
 */
std::string format_file_timestamp(const Timestamp& ts);

/**
 * @brief Parse the partition file form produced by format_file_timestamp
 * Any nine-digit nanosecond suffix is accepted
 */
std::optional<Timestamp> parse_file_timestamp(const std::string& text);

/**
 * @brief Parse user or CSV input as UTC
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" and the ISO form with a 'T'
 * separator, an optional fraction of up to nine digits and an optional 'Z'
 * or numeric offset (+HH:MM / -HH:MM) that is converted to UTC.
 */
std::optional<Timestamp> parse_datetime(const std::string& text);

}  // namespace core
}  // namespace bar_catalog

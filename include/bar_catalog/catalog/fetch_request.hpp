//===== fetch_request.hpp =====
#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/types.hpp"

namespace bar_catalog {

/**
 * @brief Lifecycle of one tracked remote fetch
 */
enum class FetchStatus {
    PENDING,      // Created or reset for another attempt
    IN_PROGRESS,  // Remote call running
    COMPLETED,    // Data received and persisted
    FAILED        // Last attempt failed
};

std::string fetch_status_to_string(FetchStatus status);

/**
 * @brief State machine of a remote fetch
 *
 * PENDING -> IN_PROGRESS -> COMPLETED
 * IN_PROGRESS -> FAILED
 * FAILED -> PENDING while retry_count < max_retries
 *
 * Any other transition is rejected with INVALID_STATE_TRANSITION.
 */
class FetchRequest {
public:
    FetchRequest(std::string request_id, std::string instrument_id, std::string timeframe_spec,
                 Timestamp start, Timestamp end, size_t max_retries = 5);

    Result<void> mark_in_progress();

    Result<void> mark_completed();

    /**
     * @brief Record a failed attempt
     * Increments retry_count and stores the error message
     */
    Result<void> mark_failed(const std::string& error);

    /**
     * @brief Move a failed request back to PENDING for another attempt
     */
    Result<void> reset_for_retry();

    bool can_retry() const {
        return status_ == FetchStatus::FAILED && retry_count_ < max_retries_;
    }

    /**
     * @brief COMPLETED, or FAILED with no retries left
     */
    bool is_terminal() const {
        return status_ == FetchStatus::COMPLETED ||
               (status_ == FetchStatus::FAILED && retry_count_ >= max_retries_);
    }

    const std::string& request_id() const {
        return request_id_;
    }
    const std::string& instrument_id() const {
        return instrument_id_;
    }
    const std::string& timeframe_spec() const {
        return timeframe_spec_;
    }
    const Timestamp& start() const {
        return start_;
    }
    const Timestamp& end() const {
        return end_;
    }
    FetchStatus status() const {
        return status_;
    }
    size_t retry_count() const {
        return retry_count_;
    }
    size_t max_retries() const {
        return max_retries_;
    }
    const std::string& error() const {
        return error_;
    }
    const Timestamp& created_at() const {
        return created_at_;
    }
    const std::optional<Timestamp>& completed_at() const {
        return completed_at_;
    }

    nlohmann::json to_json() const;

private:
    Result<void> transition(FetchStatus from, FetchStatus to);

    std::string request_id_;
    std::string instrument_id_;
    std::string timeframe_spec_;
    Timestamp start_;
    Timestamp end_;
    FetchStatus status_{FetchStatus::PENDING};
    size_t retry_count_{0};
    size_t max_retries_;
    std::string error_;
    Timestamp created_at_;
    std::optional<Timestamp> completed_at_;
};

}  // namespace bar_catalog

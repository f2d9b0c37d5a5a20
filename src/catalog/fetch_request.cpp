//===== fetch_request.cpp =====

#include "bar_catalog/catalog/fetch_request.hpp"
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

std::string fetch_status_to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::PENDING:
            return "PENDING";
        case FetchStatus::IN_PROGRESS:
            return "IN_PROGRESS";
        case FetchStatus::COMPLETED:
            return "COMPLETED";
        case FetchStatus::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

FetchRequest::FetchRequest(std::string request_id, std::string instrument_id,
                           std::string timeframe_spec, Timestamp start, Timestamp end,
                           size_t max_retries)
    : request_id_(std::move(request_id)),
      instrument_id_(std::move(instrument_id)),
      timeframe_spec_(std::move(timeframe_spec)),
      start_(start),
      end_(end),
      max_retries_(max_retries),
      created_at_(core::now_utc()) {}

Result<void> FetchRequest::transition(FetchStatus from, FetchStatus to) {
    if (status_ != from) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Request " + request_id_ + " cannot move from " +
                                    fetch_status_to_string(status_) + " to " +
                                    fetch_status_to_string(to),
                                "FetchRequest");
    }
    status_ = to;
    return Result<void>();
}

Result<void> FetchRequest::mark_in_progress() {
    return transition(FetchStatus::PENDING, FetchStatus::IN_PROGRESS);
}

Result<void> FetchRequest::mark_completed() {
    auto result = transition(FetchStatus::IN_PROGRESS, FetchStatus::COMPLETED);
    if (result.is_ok()) {
        completed_at_ = core::now_utc();
        error_.clear();
    }
    return result;
}

Result<void> FetchRequest::mark_failed(const std::string& error) {
    auto result = transition(FetchStatus::IN_PROGRESS, FetchStatus::FAILED);
    if (result.is_ok()) {
        ++retry_count_;
        error_ = error;
        completed_at_ = core::now_utc();
    }
    return result;
}

Result<void> FetchRequest::reset_for_retry() {
    if (status_ == FetchStatus::FAILED && retry_count_ >= max_retries_) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Request " + request_id_ + " exhausted its " +
                                    std::to_string(max_retries_) + " retries",
                                "FetchRequest");
    }
    auto result = transition(FetchStatus::FAILED, FetchStatus::PENDING);
    if (result.is_ok()) {
        completed_at_.reset();
    }
    return result;
}

nlohmann::json FetchRequest::to_json() const {
    nlohmann::json j;
    j["request_id"] = request_id_;
    j["instrument_id"] = instrument_id_;
    j["timeframe_spec"] = timeframe_spec_;
    j["start"] = core::format_iso8601(start_);
    j["end"] = core::format_iso8601(end_);
    j["status"] = fetch_status_to_string(status_);
    j["retry_count"] = retry_count_;
    j["max_retries"] = max_retries_;
    j["error"] = error_;
    j["created_at"] = core::format_iso8601(created_at_);
    if (completed_at_) {
        j["completed_at"] = core::format_iso8601(*completed_at_);
    } else {
        j["completed_at"] = nullptr;
    }
    return j;
}

}  // namespace bar_catalog

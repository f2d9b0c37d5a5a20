//===== request_id_generator.cpp =====

#include "bar_catalog/core/request_id_generator.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include "bar_catalog/core/time_utils.hpp"

namespace bar_catalog {

std::atomic<uint64_t> RequestIdGenerator::sequence_{0};

std::string RequestIdGenerator::next(const std::string& prefix) {
    return generate(prefix, core::now_utc(), ++sequence_);
}

std::string RequestIdGenerator::generate(const std::string& prefix, const Timestamp& timestamp,
                                         uint64_t sequence) {
    std::stringstream ss;
    ss << prefix << "_" << generate_timestamp_string(timestamp) << "_" << std::setfill('0')
       << std::setw(6) << sequence;
    return ss.str();
}

std::string RequestIdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        timestamp);
    const std::time_t time_t = std::chrono::system_clock::to_time_t(system_time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  timestamp.time_since_epoch())
                  .count() %
              1000;
    if (ms < 0) {
        ms += 1000;
    }

    std::tm time_info;
    core::safe_gmtime(&time_t, &time_info);

    std::stringstream ss;
    ss << std::put_time(&time_info, "%Y%m%d_%H%M%S");
    ss << "_" << std::setfill('0') << std::setw(3) << ms;
    return ss.str();
}

}  // namespace bar_catalog

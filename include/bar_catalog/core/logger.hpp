//===== logger.hpp =====
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "bar_catalog/core/config_base.hpp"

namespace bar_catalog {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop system
    FATAL     // Critical errors that require system shutdown
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& text);
std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& text);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"bar_catalog"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging class
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag every message logged from this thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    /**
     * @brief Tag messages from this thread with a correlation id (empty clears it)
     */
    static void set_correlation_id(const std::string& correlation_id) {
        current_correlation_id_ = correlation_id;
    }

    static const std::string& correlation_id() {
        return current_correlation_id_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file();
    void enforce_retention(const std::filesystem::path& log_dir);
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;
    static thread_local std::string current_correlation_id_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Scoped correlation id, restored on destruction
 */
class CorrelationScope {
public:
    explicit CorrelationScope(const std::string& correlation_id)
        : previous_(Logger::correlation_id()) {
        Logger::set_correlation_id(correlation_id);
    }
    ~CorrelationScope() {
        Logger::set_correlation_id(previous_);
    }

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

private:
    std::string previous_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::bar_catalog::Logger::instance().get_min_level()) {      \
            std::ostringstream os;                                             \
            os << message;                                                     \
            ::bar_catalog::Logger::instance().log(level, os.str());            \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::bar_catalog::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::bar_catalog::LogLevel::DEBUG, message)
#define INFO(message) LOG(::bar_catalog::LogLevel::INFO, message)
#define WARN(message) LOG(::bar_catalog::LogLevel::WARNING, message)
#define ERROR(message) LOG(::bar_catalog::LogLevel::ERR, message)
#define FATAL(message) LOG(::bar_catalog::LogLevel::FATAL, message)

}  // namespace bar_catalog

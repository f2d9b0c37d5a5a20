//===== error.hpp =====

#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace bar_catalog {

/**
 * @brief Error codes for catalog, fetch and import operations
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Catalog errors
    DATA_NOT_FOUND = 4,
    CATALOG_CORRUPTION = 5,
    CONVERSION_ERROR = 6,
    VALIDATION_ERROR = 7,

    // Remote provider errors
    CONNECTION_ERROR = 8,
    TIMEOUT_ERROR = 9,
    RATE_LIMIT_EXCEEDED = 10,
    PROVIDER_UNAVAILABLE = 11,
    INVALID_REQUEST = 12,

    // File and I/O errors
    FILE_NOT_FOUND = 13,
    FILE_IO_ERROR = 14,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 15,

    // State machine errors
    INVALID_STATE_TRANSITION = 16,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::CATALOG_CORRUPTION:
            return "CATALOG_CORRUPTION";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::RATE_LIMIT_EXCEEDED:
            return "RATE_LIMIT_EXCEEDED";
        case ErrorCode::PROVIDER_UNAVAILABLE:
            return "PROVIDER_UNAVAILABLE";
        case ErrorCode::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::INVALID_STATE_TRANSITION:
            return "INVALID_STATE_TRANSITION";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class CatalogError : public std::runtime_error {
public:
    /**
     * @brief Constructor for CatalogError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    CatalogError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

    /**
     * @brief Minimum wait requested by the provider before the next attempt
     */
    const std::optional<std::chrono::milliseconds>& retry_after() const noexcept {
        return retry_after_;
    }

    void set_retry_after(std::chrono::milliseconds delay) {
        retry_after_ = delay;
    }

private:
    ErrorCode code_;
    std::string component_;
    std::optional<std::chrono::milliseconds> retry_after_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<CatalogError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws CatalogError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws CatalogError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const CatalogError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<CatalogError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<CatalogError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const CatalogError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<CatalogError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<CatalogError>(code, message, component));
}

/**
 * @brief Rate-limit rejection carrying the provider's retry-after hint
 */
template <typename T>
Result<T> make_rate_limit_error(const std::string& message, std::chrono::milliseconds retry_after,
                                const std::string& component = "") {
    auto error = std::make_unique<CatalogError>(ErrorCode::RATE_LIMIT_EXCEEDED, message, component);
    error->set_retry_after(retry_after);
    return Result<T>(std::move(error));
}

/**
 * @brief Re-wrap an existing error into a result of another type
 */
template <typename T>
Result<T> forward_error(const CatalogError& error) {
    return Result<T>(std::make_unique<CatalogError>(error));
}

}  // namespace bar_catalog

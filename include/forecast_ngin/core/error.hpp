// include/forecast_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace forecast_ngin {

/**
 * @brief Error codes for the forecasting engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    MARKET_DATA_ERROR = 6,

    // Volatility model errors
    INVALID_OBSERVATION = 7,  // Bad return fed to the EWMA, state unchanged
    INVALID_SCALING = 8,      // Non-positive scaled volatility, request fails

    // Simulation errors
    PATH_GENERATION_ERROR = 9,  // Non-finite or non-positive price produced

    // Evaluation errors
    MISSING_REALIZED_DATA = 10,  // Grid point cannot be scored

    // Governance errors
    GOVERNANCE_REJECTED = 11,

    // Persistence errors
    CORRUPT_PERSISTED_STATE = 12,
    FILE_NOT_FOUND = 13,
    FILE_IO_ERROR = 14,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 15,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Error type carried by failed results
 */
class ForecastError : public std::runtime_error {
public:
    /**
     * @brief Constructor for ForecastError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    ForecastError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
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
    Result(std::unique_ptr<ForecastError> error) : error_(std::move(error)) {}

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

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws ForecastError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Take ownership of the success value
     * @throws ForecastError if result represents an error
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
    const ForecastError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<ForecastError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<ForecastError> error) : error_(std::move(error)) {}

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

    const ForecastError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<ForecastError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<ForecastError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as an error of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    return make_error<T>(failed.error()->code(), failed.error()->what(), component);
}

}  // namespace forecast_ngin

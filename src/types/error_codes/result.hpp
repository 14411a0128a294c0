// src/types/error_codes/result.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "radio_error_codes.hpp"

namespace radiohal {

/**
 * @brief Class representing the result of a radio operation
 *
 * Either a success or exactly one error kind. Device errors additionally
 * carry the driver's own numeric code. The message is informational and
 * defaults to the category message of the code.
 */
class Result {
   public:
    /**
    * @brief Construct a new successful Result
    */
    Result() : code_(RadioErrorCode::kSuccess) {}

    /**
    * @brief Construct a new Result with a single error
    *
    * @param code The error code
    */
    explicit Result(RadioErrorCode code)
        : code_(code),
          message_(RadioErrorCategory::GetInstance().message(
              static_cast<int>(code))) {}

    /**
    * @brief Construct a new Result with an error and custom message
    *
    * @param code The error code
    * @param message Custom error message
    */
    Result(RadioErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /**
    * @brief Check if the operation was successful
    */
    bool IsSuccess() const { return code_ == RadioErrorCode::kSuccess; }

    /**
    * @brief Get the error kind, kSuccess when the operation succeeded
    */
    RadioErrorCode getErrorCode() const { return code_; }

    /**
    * @brief Get the driver-defined code of a kDeviceError, 0 otherwise
    */
    int32_t getDeviceCode() const { return device_code_; }

    /**
    * @brief Get a human-readable error message
    *
    * @return std::string "Success" or the error description
    */
    std::string GetErrorMessage() const {
        if (IsSuccess()) {
            return "Success";
        }
        if (code_ == RadioErrorCode::kDeviceError) {
            return message_ + " (device code " + std::to_string(device_code_) +
                   ")";
        }
        return message_;
    }

    /**
    * @brief Convert to std::error_code for standard error handling
    */
    std::error_code AsErrorCode() const {
        return {static_cast<int>(code_), RadioErrorCategory::GetInstance()};
    }

    /**
    * @brief Implicit conversion to bool for easy checking
    *
    * @return bool True if operation succeeded
    */
    operator bool() const { return IsSuccess(); }

    bool operator==(const Result& other) const {
        return code_ == other.code_ && device_code_ == other.device_code_;
    }

    bool operator!=(const Result& other) const { return !(*this == other); }

    static inline Result Success() { return Result(); }

    static inline Result Error(RadioErrorCode code) { return Result(code); }

    static inline Result Error(RadioErrorCode code, std::string message) {
        return Result(code, std::move(message));
    }

    /**
    * @brief Create a driver-specific error
    *
    * @param device_code Implementation-defined code (register value, errno...)
    * @param message Optional description of the cause
    * @return Result A kDeviceError result carrying the code
    */
    static inline Result DeviceError(int32_t device_code,
                                     std::string message = "") {
        Result result(RadioErrorCode::kDeviceError);
        if (!message.empty()) {
            result.message_ = std::move(message);
        }
        result.device_code_ = device_code;
        return result;
    }

   private:
    RadioErrorCode code_;
    std::string message_;
    int32_t device_code_ = 0;
};

/**
 * @brief Result of an operation that produces a value on success
 *
 * @tparam T Type of the produced value
 */
template <typename T>
class ValueResult {
   public:
    /**
     * @brief Create a successful result holding a value
     */
    static ValueResult Ok(T value) {
        ValueResult result;
        result.value_ = std::move(value);
        return result;
    }

    static ValueResult Error(RadioErrorCode code) {
        return FromStatus(Result::Error(code));
    }

    static ValueResult Error(RadioErrorCode code, std::string message) {
        return FromStatus(Result::Error(code, std::move(message)));
    }

    /**
     * @brief Propagate a failed status unchanged
     *
     * Keeps the code, message and device code of the original failure.
     * A successful status without a value is reported as kInvalidState.
     */
    static ValueResult FromStatus(Result status) {
        ValueResult result;
        if (status.IsSuccess()) {
            result.status_ = Result::Error(RadioErrorCode::kInvalidState,
                                           "Success reported without a value");
        } else {
            result.status_ = std::move(status);
        }
        return result;
    }

    bool IsSuccess() const { return status_.IsSuccess(); }

    operator bool() const { return IsSuccess(); }

    RadioErrorCode getErrorCode() const { return status_.getErrorCode(); }

    const Result& getStatus() const { return status_; }

    /**
     * @brief Access the value
     * @throw std::bad_optional_access if the result is an error
     */
    const T& getValue() const { return value_.value(); }

    T& getValue() { return value_.value(); }

    /**
     * @brief Move the value out of the result
     * @throw std::bad_optional_access if the result is an error
     */
    T TakeValue() { return std::move(value_.value()); }

   private:
    ValueResult() = default;

    Result status_;
    std::optional<T> value_;
};

}  // namespace radiohal

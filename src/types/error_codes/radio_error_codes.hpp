// src/types/error_codes/radio_error_codes.hpp
#pragma once

#include <string>
#include <system_error>

namespace radiohal {

/**
 * @brief Error kinds a radio capability operation can fail with
 *
 * The set is closed. Driver-specific causes that fit none of the other
 * kinds are reported as kDeviceError together with a device code.
 */
enum class RadioErrorCode {
    kSuccess = 0,         ///< Operation completed successfully
    kConfigurationError,  ///< Configuration rejected or failed to apply
    kTransmissionError,   ///< Failed to transmit data
    kReceptionError,      ///< Failed to receive data
    kTimeout,             ///< Operation timed out
    kInvalidState,        ///< Radio in invalid state for operation
    kIoError,             ///< Input/output failure (capture sink, bus)
    kDeviceError          ///< Driver-specific failure, see device code
};

/**
 * @brief Custom error category for radio operations
 *
 * Provides string representations so results convert to std::error_code.
 */
class RadioErrorCategory : public std::error_category {
   public:
    /**
     * @brief Get the singleton instance of the error category
     *
     * @return const RadioErrorCategory& Reference to the singleton instance
     */
    static const RadioErrorCategory& GetInstance() {
        static RadioErrorCategory instance;
        return instance;
    }

    const char* name() const noexcept override { return "radio_error"; }

    /**
     * @brief Get a human-readable error message for a given error code
     *
     * @param condition The error code to get the message for
     * @return std::string Human-readable error message
     */
    std::string message(int condition) const override {
        switch (static_cast<RadioErrorCode>(condition)) {
            case RadioErrorCode::kSuccess:
                return "Success";
            case RadioErrorCode::kConfigurationError:
                return "Failed to configure radio parameters";
            case RadioErrorCode::kTransmissionError:
                return "Failed to transmit data";
            case RadioErrorCode::kReceptionError:
                return "Failed to receive data";
            case RadioErrorCode::kTimeout:
                return "Operation timed out";
            case RadioErrorCode::kInvalidState:
                return "Radio in invalid state for operation";
            case RadioErrorCode::kIoError:
                return "Input/output error";
            case RadioErrorCode::kDeviceError:
                return "Device-specific error";
            default:
                return "Unknown error";
        }
    }

   private:
    RadioErrorCategory() = default;  // Private constructor for singleton
};

}  // namespace radiohal

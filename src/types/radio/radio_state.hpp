// src/types/radio/radio_state.hpp
#pragma once

namespace radiohal {

/**
 * @brief Enumeration of possible radio states
 *
 * Exactly one state holds at any instant. Only capability operations move
 * a radio between states, except a hardware fault or interrupt timeout
 * which moves it to kError.
 */
enum class RadioState {
    kIdle,         ///< Ready, the only state an operation may start from
    kConfiguring,  ///< Applying a channel configuration
    kTransmitting, ///< A transmit operation is in flight
    kReceiving,    ///< A receive operation is in flight
    kSleeping,     ///< Low-power mode, requires Wake()
    kError         ///< Faulted, requires Configure() or Reset()
};

/**
 * @brief Printable name of a radio state
 */
inline const char* RadioStateToString(RadioState state) {
    switch (state) {
        case RadioState::kIdle:
            return "Idle";
        case RadioState::kConfiguring:
            return "Configuring";
        case RadioState::kTransmitting:
            return "Transmitting";
        case RadioState::kReceiving:
            return "Receiving";
        case RadioState::kSleeping:
            return "Sleeping";
        case RadioState::kError:
            return "Error";
        default:
            return "Unknown";
    }
}

}  // namespace radiohal

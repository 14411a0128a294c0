// src/types/radio/radio.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <vector>

#include "packet_info.hpp"
#include "radio_state.hpp"
#include "types/configurations/channel_configuration.hpp"
#include "types/error_codes/result.hpp"

namespace radiohal {

/*
 * Radio capabilities
 *
 * Each interface below is one independently implementable fragment of a
 * packet radio. A driver derives only from the capabilities its silicon
 * supports, and generic code states the capabilities it needs through the
 * Has* traits at the bottom of this file.
 *
 * State machine shared by every capability:
 *  - kIdle is the only state a transmit, receive or sleep may start from.
 *  - kError is left only through Configure() or Reset().
 *  - A call made in a state that does not allow it fails with
 *    kInvalidState and has no hardware side effect.
 */

/**
 * @brief Query the current radio state
 */
class IStateCapability {
   public:
    virtual ~IStateCapability() = default;

    /**
     * @brief Get the current radio state
     *
     * Never blocks and has no side effect.
     *
     * @return RadioState Current state of the radio
     */
    virtual RadioState getState() = 0;
};

/**
 * @brief Apply a channel configuration
 */
class IConfigureCapability {
   public:
    virtual ~IConfigureCapability() = default;

    /**
     * @brief Configure the radio
     *
     * Moves kIdle to kConfiguring and back to kIdle. Also accepted from
     * kError, returning the radio to kIdle.
     *
     * @param config Channel parameters to apply
     * @return Result kConfigurationError if the radio rejects the
     * configuration (state returns to kIdle), kInvalidState while
     * transmitting, receiving or sleeping
     */
    virtual Result Configure(const ChannelConfig& config) = 0;
};

/**
 * @brief Two-phase, non-blocking transmission
 */
class ITransmitCapability {
   public:
    virtual ~ITransmitCapability() = default;

    /**
     * @brief Start transmitting a packet
     *
     * Moves kIdle to kTransmitting.
     *
     * @param data Payload to transmit
     * @param len Payload length in bytes
     * @return Result kInvalidState if the radio is not idle or not configured
     */
    virtual Result StartTransmit(const uint8_t* data, size_t len) = 0;

    /**
     * @brief Poll the in-flight transmission without blocking
     *
     * @return ValueResult<bool> false while in flight, true once finished
     * (the radio is back in kIdle)
     */
    virtual ValueResult<bool> CheckTransmit() = 0;

    Result StartTransmit(const std::vector<uint8_t>& payload) {
        return StartTransmit(payload.data(), payload.size());
    }
};

/**
 * @brief Two-phase, non-blocking reception
 */
class IReceiveCapability {
   public:
    virtual ~IReceiveCapability() = default;

    /**
     * @brief Enter receive mode
     *
     * Moves kIdle to kReceiving.
     *
     * @return Result kInvalidState if the radio is not idle or not configured
     */
    virtual Result StartReceive() = 0;

    /**
     * @brief Poll for a received packet without blocking
     *
     * @return Empty while nothing has arrived, the packet once one has (the
     * radio is back in kIdle). kTimeout when the driver enforces a receive
     * window and it expired.
     */
    virtual ValueResult<std::optional<ReceivedPacket>> CheckReceive() = 0;
};

/**
 * @brief Instantaneous signal strength
 */
class ISignalQualityCapability {
   public:
    virtual ~ISignalQualityCapability() = default;

    /**
     * @brief Read the current RSSI
     *
     * @return ValueResult<int32_t> RSSI in device-native units, kInvalidState
     * unless receiving or directly after a reception
     */
    virtual ValueResult<int32_t> ReadRssi() = 0;
};

/**
 * @brief Low-power mode
 */
class ISleepCapability {
   public:
    virtual ~ISleepCapability() = default;

    /**
     * @brief Enter sleep, allowed from kIdle only
     */
    virtual Result Sleep() = 0;

    /**
     * @brief Leave sleep, kSleeping to kIdle
     */
    virtual Result Wake() = 0;
};

/**
 * @brief Output power control
 */
class IPowerCapability {
   public:
    virtual ~IPowerCapability() = default;

    /**
     * @brief Set the transmission power
     *
     * @param power Output power in dBm
     * @return Result kConfigurationError if the radio cannot use this power,
     * kInvalidState unless idle
     */
    virtual Result setPower(int8_t power) = 0;
};

/**
 * @brief Abandon any operation and return to kIdle
 *
 * This is the cancellation path: an in-flight transmit or receive that the
 * caller stopped polling stays in flight until Reset() or Configure().
 */
class IResetCapability {
   public:
    virtual ~IResetCapability() = default;

    virtual Result Reset() = 0;
};

/**
 * @brief Progress of a two-phase operation
 */
enum class OperationPhase {
    kNotStarted,  ///< No operation requested
    kInProgress,  ///< Started, completion not yet observed
    kDone         ///< Completion observed by a check call
};

template <typename T>
struct HasState : std::is_base_of<IStateCapability, T> {};

template <typename T>
struct HasConfigure : std::is_base_of<IConfigureCapability, T> {};

template <typename T>
struct HasTransmit : std::is_base_of<ITransmitCapability, T> {};

template <typename T>
struct HasReceive : std::is_base_of<IReceiveCapability, T> {};

template <typename T>
struct HasSignalQuality : std::is_base_of<ISignalQualityCapability, T> {};

template <typename T>
struct HasSleep : std::is_base_of<ISleepCapability, T> {};

template <typename T>
struct HasPower : std::is_base_of<IPowerCapability, T> {};

template <typename T>
struct HasReset : std::is_base_of<IResetCapability, T> {};

}  // namespace radiohal

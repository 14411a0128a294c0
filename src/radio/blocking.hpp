// src/radio/blocking.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "hal/hal.hpp"
#include "hal/native/native_hal.hpp"
#include "types/radio/radio.hpp"

namespace radiohal {

/**
 * @brief Polling behaviour of the blocking operations
 *
 * There is no timeout here: a blocking call returns when the radio reports
 * completion or an error (including a driver kTimeout). Callers needing an
 * overall deadline layer it on top.
 */
struct BlockingOptions {
    /// Delay between two completion checks, zero busy-polls
    std::chrono::microseconds poll_interval{1000};

    bool operator==(const BlockingOptions& other) const {
        return poll_interval == other.poll_interval;
    }
};

namespace detail {

inline void PollDelay(const BlockingOptions& options, hal::IDelay& delay) {
    if (options.poll_interval.count() > 0) {
        delay.DelayUs(static_cast<uint32_t>(options.poll_interval.count()));
    }
}

}  // namespace detail

/**
 * @brief Transmit a packet and wait for completion
 *
 * Calls StartTransmit() then CheckTransmit() until it reports completion.
 * Errors are returned exactly as the radio reported them.
 *
 * @param radio Radio with the transmit capability
 * @param data Payload to transmit
 * @param len Payload length in bytes
 * @param options Polling options
 * @param delay Delay used between polls
 * @return Result Success once the radio reports the packet sent
 */
template <typename Radio>
Result BlockingTransmit(Radio& radio, const uint8_t* data, size_t len,
                        const BlockingOptions& options = BlockingOptions{},
                        hal::IDelay& delay = hal::GetNativeHal()) {
    static_assert(HasTransmit<Radio>::value,
                  "BlockingTransmit requires the transmit capability");

    ITransmitCapability& transmitter = radio;
    Result status = transmitter.StartTransmit(data, len);
    if (!status) {
        return status;
    }

    while (true) {
        ValueResult<bool> done = transmitter.CheckTransmit();
        if (!done) {
            return done.getStatus();
        }
        if (done.getValue()) {
            return Result::Success();
        }
        detail::PollDelay(options, delay);
    }
}

template <typename Radio>
Result BlockingTransmit(Radio& radio, const std::vector<uint8_t>& payload,
                        const BlockingOptions& options = BlockingOptions{},
                        hal::IDelay& delay = hal::GetNativeHal()) {
    return BlockingTransmit(radio, payload.data(), payload.size(), options,
                            delay);
}

/**
 * @brief Receive one packet, waiting until it arrives
 *
 * Calls StartReceive() then CheckReceive() until a packet is returned.
 * A receive window enforced by the driver surfaces as kTimeout.
 *
 * @param radio Radio with the receive capability
 * @param options Polling options
 * @param delay Delay used between polls
 * @return ValueResult<ReceivedPacket> The packet, or the radio's error
 */
template <typename Radio>
ValueResult<ReceivedPacket> BlockingReceive(
    Radio& radio, const BlockingOptions& options = BlockingOptions{},
    hal::IDelay& delay = hal::GetNativeHal()) {
    static_assert(HasReceive<Radio>::value,
                  "BlockingReceive requires the receive capability");

    IReceiveCapability& receiver = radio;
    Result status = receiver.StartReceive();
    if (!status) {
        return ValueResult<ReceivedPacket>::FromStatus(status);
    }

    while (true) {
        ValueResult<std::optional<ReceivedPacket>> polled =
            receiver.CheckReceive();
        if (!polled) {
            return ValueResult<ReceivedPacket>::FromStatus(
                polled.getStatus());
        }
        if (polled.getValue().has_value()) {
            return ValueResult<ReceivedPacket>::Ok(
                std::move(*polled.getValue()));
        }
        detail::PollDelay(options, delay);
    }
}

}  // namespace radiohal

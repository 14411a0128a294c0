// src/helpers/operations.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "capture/capture_radio.hpp"
#include "capture/pcap_writer.hpp"
#include "capture/rolling_stats.hpp"
#include "hal/hal.hpp"
#include "radio/blocking.hpp"
#include "types/radio/radio.hpp"
#include "utils/byte_operations.h"
#include "utils/logger.hpp"

namespace radiohal {
namespace helpers {

/**
 * @brief Render a payload for logs
 *
 * Printable ASCII payloads are shown as quoted text, anything else as
 * space separated hex bytes.
 */
std::string FormatPayload(const std::vector<uint8_t>& payload);

/**
 * @brief Transmit a packet, optionally repeatedly
 */
struct TransmitOptions {
    /// Data to be transmitted
    std::vector<uint8_t> data;
    /// Output power in dBm, unchanged when empty
    std::optional<int8_t> power;
    /// Period of repeated transmission, a single transmission when empty
    std::optional<std::chrono::microseconds> period;
    /// Transmissions when periodic, 0 repeats until an error occurs
    uint32_t count = 0;
    BlockingOptions blocking;
};

/**
 * @brief Receive packets
 */
struct ReceiveOptions {
    /// Keep receiving after the first packet
    bool continuous = false;
    /// Packets to receive when continuous, 0 receives until an error occurs
    uint32_t max_packets = 0;
    /// Capture output for received packets
    PcapOptions pcap;
    BlockingOptions blocking;
};

/**
 * @brief Poll the channel RSSI
 */
struct RssiOptions {
    /// Delay between samples
    std::chrono::microseconds period{std::chrono::seconds(1)};
    /// Keep sampling after the first sample
    bool continuous = false;
    /// Samples when continuous, 0 samples until an error occurs
    uint32_t samples = 0;
};

/**
 * @brief Echo received packets back (the far end of a link test)
 */
struct EchoOptions {
    /// Keep echoing after the first packet
    bool continuous = false;
    /// Packets to echo when continuous, 0 echoes until an error occurs
    uint32_t max_packets = 0;
    /// Output power in dBm, unchanged when empty
    std::optional<int8_t> power;
    /// Turnaround delay before the response
    std::chrono::microseconds delay{std::chrono::milliseconds(100)};
    /// Append the local RSSI (int16, big endian) to the echoed packet
    bool append_info = false;
    BlockingOptions blocking;
};

/**
 * @brief Link test: send numbered packets and await their echo
 */
struct PingPongOptions {
    /// Rounds of transmit and receive
    uint32_t rounds = 100;
    /// Output power in dBm, unchanged when empty
    std::optional<int8_t> power;
    /// Delay between rounds
    std::chrono::microseconds delay{std::chrono::milliseconds(100)};
    /// Parse the remote RSSI appended by an echo with append_info
    bool parse_info = false;
    BlockingOptions blocking;
};

/**
 * @brief Outcome of a link test
 */
struct LinkTestInfo {
    uint32_t sent = 0;
    uint32_t received = 0;
    RollingStats local_rssi;   ///< RSSI of echoes measured here
    RollingStats remote_rssi;  ///< RSSI reported by the echo side
};

using Operation = std::variant<TransmitOptions, ReceiveOptions, RssiOptions,
                               EchoOptions, PingPongOptions>;

/**
 * @brief Printable name of an operation ("tx", "rx", "rssi", "echo",
 * "ping-pong")
 */
const char* OperationName(const Operation& operation);

namespace detail {

inline bool KeepGoing(bool continuous, uint32_t done, uint32_t limit) {
    return continuous && (limit == 0 || done < limit);
}

template <typename Radio>
Result ApplyPower(Radio& radio, const std::optional<int8_t>& power,
                  Logger& logger) {
    if (!power) {
        return Result::Success();
    }
    IPowerCapability& power_control = radio;
    Result status = power_control.setPower(*power);
    if (!status) {
        logger.Error("Unable to set power %d dBm: %s", *power,
                     status.GetErrorMessage().c_str());
    }
    return status;
}

template <typename Radio>
ValueResult<ReceivedPacket> ReceiveLoop(Radio& radio,
                                        const ReceiveOptions& options,
                                        hal::IDelay& delay, Logger& logger) {
    uint32_t received = 0;
    while (true) {
        ValueResult<ReceivedPacket> packet =
            BlockingReceive(radio, options.blocking, delay);
        if (!packet) {
            return packet;
        }
        received++;

        const ReceivedPacket& value = packet.getValue();
        logger.Info("Received: %s rssi: %d lqi: %u",
                    FormatPayload(value.payload).c_str(),
                    value.info.getRssi(),
                    static_cast<unsigned>(value.info.getLqi()));

        if (!KeepGoing(options.continuous, received, options.max_packets)) {
            return packet;
        }
    }
}

}  // namespace detail

/**
 * @brief Transmit the configured data, once or periodically
 */
template <typename Radio>
Result DoTransmit(Radio& radio, const TransmitOptions& options,
                  hal::IDelay& delay, Logger& logger = LOG) {
    static_assert(HasTransmit<Radio>::value && HasPower<Radio>::value,
                  "DoTransmit requires transmit and power capabilities");

    Result status = detail::ApplyPower(radio, options.power, logger);
    if (!status) {
        return status;
    }

    uint32_t sent = 0;
    while (true) {
        status = BlockingTransmit(radio, options.data, options.blocking, delay);
        if (!status) {
            logger.Error("Transmit failed: %s",
                         status.GetErrorMessage().c_str());
            return status;
        }
        sent++;
        logger.Debug("Sent %zu bytes", options.data.size());

        if (!options.period ||
            (options.count != 0 && sent >= options.count)) {
            return Result::Success();
        }
        delay.DelayUs(static_cast<uint32_t>(options.period->count()));
    }
}

/**
 * @brief Receive packets, recording them to the given sink
 *
 * @return The last packet received, or the first error
 */
template <typename Radio>
ValueResult<ReceivedPacket> DoReceive(Radio& radio,
                                      const ReceiveOptions& options,
                                      ICaptureSink& sink, hal::IHal& hal,
                                      Logger& logger = LOG) {
    static_assert(HasReceive<Radio>::value,
                  "DoReceive requires the receive capability");

    CaptureRecorder recorder(sink, hal, logger);
    CaptureReceiver<Radio> capture(radio, recorder);
    ValueResult<ReceivedPacket> result =
        detail::ReceiveLoop(capture, options, hal, logger);
    if (recorder.getReceivedCount() > 0) {
        logger.Info("Received %zu packets, rssi %s",
                    recorder.getReceivedCount(),
                    recorder.getRssiStats().ToString().c_str());
    }
    return result;
}

/**
 * @brief Receive packets, recording them to the pcap output of the options
 *
 * @return The last packet received, or the first error
 */
template <typename Radio>
ValueResult<ReceivedPacket> DoReceive(Radio& radio,
                                      const ReceiveOptions& options,
                                      hal::IHal& hal, Logger& logger = LOG) {
    static_assert(HasReceive<Radio>::value,
                  "DoReceive requires the receive capability");

    ValueResult<std::unique_ptr<PcapWriter>> writer =
        OpenPcapWriter(options.pcap, logger);
    if (!writer) {
        return ValueResult<ReceivedPacket>::FromStatus(writer.getStatus());
    }
    if (writer.getValue()) {
        return DoReceive(radio, options, *writer.getValue(), hal, logger);
    }
    return detail::ReceiveLoop(radio, options, hal, logger);
}

/**
 * @brief Enter receive mode and sample the RSSI
 *
 * A packet arriving while sampling is discarded and receive mode is
 * re-entered. The radio is left in receive mode.
 *
 * @return Statistics of the samples taken
 */
template <typename Radio>
ValueResult<RollingStats> DoRssi(Radio& radio, const RssiOptions& options,
                                 hal::IDelay& delay, Logger& logger = LOG) {
    static_assert(HasReceive<Radio>::value && HasSignalQuality<Radio>::value,
                  "DoRssi requires receive and signal quality capabilities");

    IReceiveCapability& receiver = radio;
    ISignalQualityCapability& signal = radio;

    Result status = receiver.StartReceive();
    if (!status) {
        return ValueResult<RollingStats>::FromStatus(status);
    }

    RollingStats stats;
    while (true) {
        ValueResult<int32_t> rssi = signal.ReadRssi();
        if (!rssi) {
            return ValueResult<RollingStats>::FromStatus(rssi.getStatus());
        }
        stats.Update(rssi.getValue());
        logger.Info("rssi: %d", rssi.getValue());

        ValueResult<std::optional<ReceivedPacket>> polled =
            receiver.CheckReceive();
        if (!polled) {
            return ValueResult<RollingStats>::FromStatus(polled.getStatus());
        }
        if (polled.getValue().has_value()) {
            status = receiver.StartReceive();
            if (!status) {
                return ValueResult<RollingStats>::FromStatus(status);
            }
        }

        if (!detail::KeepGoing(options.continuous,
                               static_cast<uint32_t>(stats.getCount()),
                               options.samples)) {
            return ValueResult<RollingStats>::Ok(stats);
        }
        delay.DelayUs(static_cast<uint32_t>(options.period.count()));
    }
}

/**
 * @brief Retransmit every received packet after a turnaround delay
 *
 * When continuous, a receive timeout reported by the radio restarts
 * reception instead of ending the echo.
 *
 * @return Length of the last echoed packet
 */
template <typename Radio>
ValueResult<size_t> DoEcho(Radio& radio, const EchoOptions& options,
                           hal::IDelay& delay, Logger& logger = LOG) {
    static_assert(HasTransmit<Radio>::value && HasReceive<Radio>::value &&
                      HasPower<Radio>::value,
                  "DoEcho requires transmit, receive and power capabilities");

    Result status = detail::ApplyPower(radio, options.power, logger);
    if (!status) {
        return ValueResult<size_t>::FromStatus(status);
    }

    uint32_t echoed = 0;
    while (true) {
        ValueResult<ReceivedPacket> packet =
            BlockingReceive(radio, options.blocking, delay);
        if (!packet) {
            if (packet.getErrorCode() == RadioErrorCode::kTimeout &&
                options.continuous) {
                continue;
            }
            return ValueResult<size_t>::FromStatus(packet.getStatus());
        }

        ReceivedPacket& received = packet.getValue();
        logger.Info("Received: %s rssi: %d",
                    FormatPayload(received.payload).c_str(),
                    received.info.getRssi());

        std::vector<uint8_t> response = std::move(received.payload);
        if (options.append_info) {
            utils::ByteSerializer serializer(response);
            serializer.WriteInt16BE(received.info.getRssi());
        }

        delay.DelayUs(static_cast<uint32_t>(options.delay.count()));

        status = BlockingTransmit(radio, response, options.blocking, delay);
        if (!status) {
            return ValueResult<size_t>::FromStatus(status);
        }
        echoed++;

        if (!detail::KeepGoing(options.continuous, echoed,
                               options.max_packets)) {
            return ValueResult<size_t>::Ok(response.size());
        }
    }
}

/**
 * @brief Run a link test against a radio running DoEcho
 *
 * Each round sends the round index as a big-endian u32 and waits for it
 * to come back. A receive timeout counts as a lost round, a response with
 * another index is ignored.
 */
template <typename Radio>
ValueResult<LinkTestInfo> DoPingPong(Radio& radio,
                                     const PingPongOptions& options,
                                     hal::IDelay& delay, Logger& logger = LOG) {
    static_assert(
        HasTransmit<Radio>::value && HasReceive<Radio>::value &&
            HasPower<Radio>::value,
        "DoPingPong requires transmit, receive and power capabilities");

    LinkTestInfo link_info;
    link_info.sent = options.rounds;

    Result status = detail::ApplyPower(radio, options.power, logger);
    if (!status) {
        return ValueResult<LinkTestInfo>::FromStatus(status);
    }

    for (uint32_t round = 0; round < options.rounds; ++round) {
        std::vector<uint8_t> request;
        utils::ByteSerializer serializer(request);
        serializer.WriteUint32BE(round);

        logger.Debug("Sending message %u", round);
        status = BlockingTransmit(radio, request, options.blocking, delay);
        if (!status) {
            return ValueResult<LinkTestInfo>::FromStatus(status);
        }

        ValueResult<ReceivedPacket> response =
            BlockingReceive(radio, options.blocking, delay);
        if (!response) {
            if (response.getErrorCode() == RadioErrorCode::kTimeout) {
                logger.Debug("Timeout awaiting response %u", round);
                continue;
            }
            return ValueResult<LinkTestInfo>::FromStatus(
                response.getStatus());
        }

        const ReceivedPacket& packet = response.getValue();
        utils::ByteDeserializer deserializer(packet.payload);
        std::optional<uint32_t> index = deserializer.ReadUint32BE();
        if (!index || *index != round) {
            logger.Debug("Invalid receive index");
            continue;
        }

        std::optional<int16_t> remote_rssi;
        if (options.parse_info) {
            remote_rssi = deserializer.ReadInt16BE();
        }

        logger.Debug("Received response %u with local rssi: %d", round,
                     packet.info.getRssi());

        link_info.received++;
        link_info.local_rssi.Update(packet.info.getRssi());
        if (remote_rssi) {
            link_info.remote_rssi.Update(*remote_rssi);
        }

        delay.DelayUs(static_cast<uint32_t>(options.delay.count()));
    }

    logger.Info("Link test: %u/%u received, local rssi %s", link_info.received,
                link_info.sent, link_info.local_rssi.ToString().c_str());
    return ValueResult<LinkTestInfo>::Ok(link_info);
}

/**
 * @brief Run one operation
 */
template <typename Radio>
Result DoOperation(Radio& radio, const Operation& operation, hal::IHal& hal,
                   Logger& logger = LOG) {
    logger.Info("Running %s", OperationName(operation));

    if (const auto* transmit = std::get_if<TransmitOptions>(&operation)) {
        return DoTransmit(radio, *transmit, hal, logger);
    }
    if (const auto* receive = std::get_if<ReceiveOptions>(&operation)) {
        return DoReceive(radio, *receive, hal, logger).getStatus();
    }
    if (const auto* rssi = std::get_if<RssiOptions>(&operation)) {
        return DoRssi(radio, *rssi, hal, logger).getStatus();
    }
    if (const auto* echo = std::get_if<EchoOptions>(&operation)) {
        return DoEcho(radio, *echo, hal, logger).getStatus();
    }
    const auto& ping_pong = std::get<PingPongOptions>(operation);
    return DoPingPong(radio, ping_pong, hal, logger).getStatus();
}

}  // namespace helpers
}  // namespace radiohal

// src/capture/capture_recorder.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "capture_record.hpp"
#include "capture_sink.hpp"
#include "hal/hal.hpp"
#include "hal/native/native_hal.hpp"
#include "rolling_stats.hpp"
#include "types/radio/packet_info.hpp"
#include "utils/logger.hpp"

namespace radiohal {

/**
 * @brief Turns completed packets into capture records and statistics
 *
 * Shared by the transmit and receive halves of the capture wrapper so a
 * radio wrapped in both directions keeps one set of counters. Counters and
 * statistics are updated for every completed packet, also when the sink
 * refuses the record.
 */
class CaptureRecorder {
   public:
    /**
     * @brief Construct a new Capture Recorder
     *
     * @param sink Destination of capture records
     * @param clock Clock stamping transmitted and unstamped packets
     * @param logger Logger for sink failures
     */
    explicit CaptureRecorder(ICaptureSink& sink,
                             hal::IClock& clock = hal::GetNativeHal(),
                             Logger& logger = LOG);

    /**
     * @brief Record a packet the radio finished transmitting
     *
     * @return Result kIoError if the sink refused the record
     */
    Result RecordSent(std::vector<uint8_t> payload);

    /**
     * @brief Record a packet the radio delivered
     *
     * A packet without a timestamp is stamped with the current clock.
     *
     * @return Result kIoError if the sink refused the record
     */
    Result RecordReceived(const ReceivedPacket& packet);

    /**
     * @brief RSSI of every received packet
     */
    const RollingStats& getRssiStats() const { return rssi_stats_; }

    /**
     * @brief Payload length of every sent and received packet
     */
    const RollingStats& getLengthStats() const { return length_stats_; }

    size_t getSentCount() const { return sent_count_; }

    size_t getReceivedCount() const { return received_count_; }

    /**
     * @brief Records the sink refused
     */
    size_t getCaptureFailures() const { return capture_failures_; }

   private:
    std::chrono::microseconds Now();
    Result Append(const CaptureRecord& record);

    ICaptureSink& sink_;
    hal::IClock& clock_;
    Logger& logger_;

    RollingStats rssi_stats_;
    RollingStats length_stats_;
    size_t sent_count_ = 0;
    size_t received_count_ = 0;
    size_t capture_failures_ = 0;
};

}  // namespace radiohal

// src/radio/loopback_radio.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "hal/hal.hpp"
#include "types/radio/radio.hpp"
#include "utils/logger.hpp"

namespace radiohal {

/**
 * @brief Shared in-memory air interface for LoopbackRadio instances
 *
 * Every frame transmitted by one attached radio is queued for all other
 * attached radios tuned to the same frequency. Each radio buffers up to
 * inbox_capacity frames; further frames are dropped and counted.
 *
 * @thread_safety Thread-safe
 */
class LoopbackMedium {
   public:
    /**
     * @brief Construct a new Loopback Medium
     *
     * @param link_rssi RSSI reported for every delivered frame
     * @param link_lqi LQI reported for every delivered frame
     * @param inbox_capacity Frames buffered per radio
     */
    explicit LoopbackMedium(int16_t link_rssi = -60, uint16_t link_lqi = 200,
                            size_t inbox_capacity = 16);

    /**
     * @brief Change the link quality reported for subsequent frames
     */
    void setLink(int16_t link_rssi, uint16_t link_lqi);

    int16_t getLinkRssi() const;

    uint16_t getLinkLqi() const;

    /**
     * @brief Number of frames dropped because an inbox was full
     */
    size_t getDroppedFrames() const;

    // Used by LoopbackRadio
    uint32_t Attach();
    void Detach(uint32_t id);
    void Tune(uint32_t id, float frequency);
    size_t Broadcast(uint32_t sender, const std::vector<uint8_t>& frame);
    std::optional<std::vector<uint8_t>> Pop(uint32_t id);

   private:
    struct Endpoint {
        std::optional<float> frequency;
        std::deque<std::vector<uint8_t>> inbox;
    };

    mutable std::mutex mutex_;
    std::map<uint32_t, Endpoint> endpoints_;
    uint32_t next_id_ = 1;
    int16_t link_rssi_;
    uint16_t link_lqi_;
    size_t inbox_capacity_;
    size_t dropped_frames_ = 0;
};

/**
 * @brief Timing of a LoopbackRadio, counted in completion checks
 */
struct LoopbackTiming {
    /// CheckTransmit() calls reporting "in flight" before completion
    uint32_t transmit_polls = 1;

    /// Empty CheckReceive() calls before kTimeout, 0 disables the window
    uint32_t receive_window_polls = 0;
};

/**
 * @brief Software transceiver implementing every radio capability
 *
 * Follows the radio state machine exactly and exchanges frames through a
 * LoopbackMedium. Used as a reference driver and for tests without
 * hardware.
 */
class LoopbackRadio : public IStateCapability,
                      public IConfigureCapability,
                      public ITransmitCapability,
                      public IReceiveCapability,
                      public ISignalQualityCapability,
                      public ISleepCapability,
                      public IPowerCapability,
                      public IResetCapability {
   public:
    /// Largest payload a single frame may carry
    static constexpr size_t kMaxPayloadLength = 255;

    /**
     * @brief Construct a new Loopback Radio
     *
     * @param medium Shared medium, kept alive by the radio
     * @param clock Clock used to stamp received packets
     * @param timing Completion timing
     * @param logger Logger for state transitions and errors
     */
    LoopbackRadio(std::shared_ptr<LoopbackMedium> medium, hal::IClock& clock,
                  LoopbackTiming timing = LoopbackTiming{},
                  Logger& logger = LOG);

    ~LoopbackRadio() override;

    LoopbackRadio(const LoopbackRadio&) = delete;
    LoopbackRadio& operator=(const LoopbackRadio&) = delete;

    using ITransmitCapability::StartTransmit;

    RadioState getState() override;
    Result Configure(const ChannelConfig& config) override;
    Result StartTransmit(const uint8_t* data, size_t len) override;
    ValueResult<bool> CheckTransmit() override;
    Result StartReceive() override;
    ValueResult<std::optional<ReceivedPacket>> CheckReceive() override;
    ValueResult<int32_t> ReadRssi() override;
    Result Sleep() override;
    Result Wake() override;
    Result setPower(int8_t power) override;
    Result Reset() override;

    /**
     * @brief Simulate a hardware fault during the current operation
     *
     * The next completion check returns the given error and moves the
     * radio to kError.
     *
     * @param error Error reported by the next check
     */
    void InjectFault(Result error);

    /**
     * @brief Configuration accepted last, if any
     */
    const std::optional<ChannelConfig>& getConfig() const { return config_; }

    uint32_t getId() const { return id_; }

    void setTiming(LoopbackTiming timing) { timing_ = timing; }

   private:
    void SetState(RadioState state);
    Result Reject(const char* operation);
    std::optional<Result> TakeFault();

    std::shared_ptr<LoopbackMedium> medium_;
    hal::IClock& clock_;
    LoopbackTiming timing_;
    Logger& logger_;
    uint32_t id_;

    RadioState state_ = RadioState::kIdle;
    std::optional<ChannelConfig> config_;
    std::optional<Result> fault_;

    std::vector<uint8_t> pending_frame_;
    uint32_t transmit_polls_left_ = 0;
    uint32_t empty_receive_polls_ = 0;
    std::optional<int16_t> last_packet_rssi_;
};

}  // namespace radiohal

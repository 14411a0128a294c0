// src/capture/capture_radio.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "capture_recorder.hpp"
#include "capture_sink.hpp"
#include "hal/hal.hpp"
#include "hal/native/native_hal.hpp"
#include "types/radio/radio.hpp"
#include "utils/logger.hpp"

namespace radiohal {

/**
 * @brief Transmit half of the capture wrapper
 *
 * Forwards the transmit capability of the wrapped radio unchanged and
 * records a packet once CheckTransmit() confirms it sent. Nothing is
 * recorded for failed or in-flight transmissions. If the radio succeeded
 * but the sink failed, the sink's kIoError is returned.
 *
 * Borrows the radio and the recorder and must not outlive either.
 *
 * @tparam Radio Radio type providing the transmit capability
 */
template <typename Radio>
class CaptureTransmitter : public ITransmitCapability {
    static_assert(HasTransmit<Radio>::value,
                  "CaptureTransmitter requires the transmit capability");

   public:
    CaptureTransmitter(Radio& radio, CaptureRecorder& recorder)
        : radio_(radio), recorder_(recorder) {}

    using ITransmitCapability::StartTransmit;

    Result StartTransmit(const uint8_t* data, size_t len) override {
        Result status = Transmitter().StartTransmit(data, len);
        if (status) {
            pending_tx_.assign(data, data + len);
            transmit_phase_ = OperationPhase::kInProgress;
        }
        return status;
    }

    ValueResult<bool> CheckTransmit() override {
        ValueResult<bool> done = Transmitter().CheckTransmit();
        if (!done || !done.getValue() ||
            transmit_phase_ != OperationPhase::kInProgress) {
            return done;
        }
        transmit_phase_ = OperationPhase::kDone;

        Result captured = recorder_.RecordSent(std::move(pending_tx_));
        pending_tx_.clear();
        if (!captured) {
            return ValueResult<bool>::FromStatus(captured);
        }
        return done;
    }

    Radio& getRadio() { return radio_; }

   private:
    ITransmitCapability& Transmitter() { return radio_; }

    Radio& radio_;
    CaptureRecorder& recorder_;

    std::vector<uint8_t> pending_tx_;
    OperationPhase transmit_phase_ = OperationPhase::kNotStarted;
};

/**
 * @brief Receive half of the capture wrapper
 *
 * Forwards the receive capability of the wrapped radio unchanged and
 * records every packet CheckReceive() delivers. Radio errors pass through
 * unrecorded. Works with receive-only radios.
 *
 * @tparam Radio Radio type providing the receive capability
 */
template <typename Radio>
class CaptureReceiver : public IReceiveCapability {
    static_assert(HasReceive<Radio>::value,
                  "CaptureReceiver requires the receive capability");

   public:
    CaptureReceiver(Radio& radio, CaptureRecorder& recorder)
        : radio_(radio), recorder_(recorder) {}

    Result StartReceive() override { return Receiver().StartReceive(); }

    ValueResult<std::optional<ReceivedPacket>> CheckReceive() override {
        ValueResult<std::optional<ReceivedPacket>> polled =
            Receiver().CheckReceive();
        if (!polled || !polled.getValue().has_value()) {
            return polled;
        }

        Result captured = recorder_.RecordReceived(*polled.getValue());
        if (!captured) {
            return ValueResult<std::optional<ReceivedPacket>>::FromStatus(
                captured);
        }
        return polled;
    }

    Radio& getRadio() { return radio_; }

   private:
    IReceiveCapability& Receiver() { return radio_; }

    Radio& radio_;
    CaptureRecorder& recorder_;
};

/**
 * @brief Transparent wrapper recording every completed packet
 *
 * Composes both capture halves over one recorder, so sent and received
 * packets share the sink, the counters and the length statistics.
 *
 * The wrapper borrows both the radio and the sink and must not outlive
 * either. It is not thread-safe.
 *
 * @tparam Radio Radio type providing the transmit and receive capabilities
 */
template <typename Radio>
class CaptureRadio : public CaptureRecorder,
                     public CaptureTransmitter<Radio>,
                     public CaptureReceiver<Radio> {
   public:
    /**
     * @brief Construct a new Capture Radio
     *
     * @param radio Radio to wrap
     * @param sink Destination of capture records
     * @param clock Clock stamping transmitted packets
     * @param logger Logger for sink failures
     */
    CaptureRadio(Radio& radio, ICaptureSink& sink,
                 hal::IClock& clock = hal::GetNativeHal(),
                 Logger& logger = LOG)
        : CaptureRecorder(sink, clock, logger),
          CaptureTransmitter<Radio>(radio,
                                    static_cast<CaptureRecorder&>(*this)),
          CaptureReceiver<Radio>(radio, static_cast<CaptureRecorder&>(*this)),
          radio_(radio) {}

    Radio& getRadio() { return radio_; }

   private:
    Radio& radio_;
};

}  // namespace radiohal

// test/utils/mock_capabilities.hpp
#pragma once

#include <gmock/gmock.h>

#include "capture/capture_sink.hpp"
#include "types/radio/radio.hpp"

namespace radiohal {
namespace test {

/**
 * @brief gmock radio exposing the state, transmit and receive capabilities
 */
class MockTransceiver : public IStateCapability,
                        public ITransmitCapability,
                        public IReceiveCapability {
   public:
    using ITransmitCapability::StartTransmit;

    MOCK_METHOD(RadioState, getState, (), (override));
    MOCK_METHOD(Result, StartTransmit, (const uint8_t* data, size_t len),
                (override));
    MOCK_METHOD(ValueResult<bool>, CheckTransmit, (), (override));
    MOCK_METHOD(Result, StartReceive, (), (override));
    MOCK_METHOD(ValueResult<std::optional<ReceivedPacket>>, CheckReceive, (),
                (override));
};

/**
 * @brief gmock radio that can only receive
 */
class MockReceiver : public IReceiveCapability {
   public:
    MOCK_METHOD(Result, StartReceive, (), (override));
    MOCK_METHOD(ValueResult<std::optional<ReceivedPacket>>, CheckReceive, (),
                (override));
};

/**
 * @brief gmock radio with every capability the operation helpers use
 */
class MockFullRadio : public MockTransceiver,
                      public ISignalQualityCapability,
                      public IPowerCapability {
   public:
    MOCK_METHOD(ValueResult<int32_t>, ReadRssi, (), (override));
    MOCK_METHOD(Result, setPower, (int8_t power), (override));
};

class MockCaptureSink : public ICaptureSink {
   public:
    MOCK_METHOD(Result, Append, (const CaptureRecord& record), (override));
};

inline ValueResult<std::optional<ReceivedPacket>> NothingYet() {
    return ValueResult<std::optional<ReceivedPacket>>::Ok(std::nullopt);
}

inline ValueResult<std::optional<ReceivedPacket>> Delivered(
    const ReceivedPacket& packet) {
    return ValueResult<std::optional<ReceivedPacket>>::Ok(packet);
}

inline ReceivedPacket MakePacket(std::vector<uint8_t> payload, int16_t rssi,
                                 uint16_t lqi = 100,
                                 int64_t timestamp_us = 1000) {
    ReceivedPacket packet;
    packet.info = PacketInfo(rssi, lqi, std::chrono::microseconds(timestamp_us),
                             payload.size());
    packet.payload = std::move(payload);
    return packet;
}

}  // namespace test
}  // namespace radiohal

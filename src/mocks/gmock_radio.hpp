// src/mocks/gmock_radio.hpp
#pragma once

#include <gmock/gmock.h>

#include "types/radio/radio.hpp"

namespace radiohal {
namespace mocks {

/**
 * @brief GoogleMock radio implementing every capability
 *
 * Backs MockRadio. Tests reach it through GetMockForTesting() to add
 * expectations the script API does not cover.
 */
class GmockRadio : public IStateCapability,
                   public IConfigureCapability,
                   public ITransmitCapability,
                   public IReceiveCapability,
                   public ISignalQualityCapability,
                   public ISleepCapability,
                   public IPowerCapability,
                   public IResetCapability {
   public:
    using ITransmitCapability::StartTransmit;

    MOCK_METHOD(RadioState, getState, (), (override));
    MOCK_METHOD(Result, Configure, (const ChannelConfig& config), (override));
    MOCK_METHOD(Result, StartTransmit, (const uint8_t* data, size_t len),
                (override));
    MOCK_METHOD(ValueResult<bool>, CheckTransmit, (), (override));
    MOCK_METHOD(Result, StartReceive, (), (override));
    MOCK_METHOD(ValueResult<std::optional<ReceivedPacket>>, CheckReceive, (),
                (override));
    MOCK_METHOD(ValueResult<int32_t>, ReadRssi, (), (override));
    MOCK_METHOD(Result, Sleep, (), (override));
    MOCK_METHOD(Result, Wake, (), (override));
    MOCK_METHOD(Result, setPower, (int8_t power), (override));
    MOCK_METHOD(Result, Reset, (), (override));
};

}  // namespace mocks
}  // namespace radiohal

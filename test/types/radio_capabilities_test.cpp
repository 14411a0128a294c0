// test/types/radio_capabilities_test.cpp
#include <gtest/gtest.h>

#include <limits>
#include <type_traits>
#include <utility>

#include "capture/capture_radio.hpp"
#include "mocks/mock_radio.hpp"
#include "radio/loopback_radio.hpp"
#include "types/radio/radio.hpp"
#include "utils/mock_capabilities.hpp"

namespace radiohal {
namespace test {

TEST(RadioCapabilitiesTest, FullRadiosHaveEveryCapability) {
    EXPECT_TRUE(HasState<LoopbackRadio>::value);
    EXPECT_TRUE(HasConfigure<LoopbackRadio>::value);
    EXPECT_TRUE(HasTransmit<LoopbackRadio>::value);
    EXPECT_TRUE(HasReceive<LoopbackRadio>::value);
    EXPECT_TRUE(HasSignalQuality<LoopbackRadio>::value);
    EXPECT_TRUE(HasSleep<LoopbackRadio>::value);
    EXPECT_TRUE(HasPower<LoopbackRadio>::value);
    EXPECT_TRUE(HasReset<LoopbackRadio>::value);

    EXPECT_TRUE(HasReset<mocks::MockRadio>::value);
    EXPECT_TRUE(HasSignalQuality<mocks::MockRadio>::value);
}

TEST(RadioCapabilitiesTest, PartialRadiosExposeOnlyTheirCapabilities) {
    EXPECT_TRUE(HasTransmit<MockTransceiver>::value);
    EXPECT_TRUE(HasReceive<MockTransceiver>::value);
    EXPECT_FALSE(HasConfigure<MockTransceiver>::value);
    EXPECT_FALSE(HasSleep<MockTransceiver>::value);
    EXPECT_FALSE(HasSignalQuality<MockTransceiver>::value);

    using Captured = CaptureRadio<LoopbackRadio>;
    EXPECT_TRUE(HasTransmit<Captured>::value);
    EXPECT_TRUE(HasReceive<Captured>::value);
    EXPECT_FALSE(HasState<Captured>::value);

    EXPECT_TRUE(HasReceive<MockReceiver>::value);
    EXPECT_FALSE(HasTransmit<MockReceiver>::value);

    using ReceiveCapture = CaptureReceiver<MockReceiver>;
    EXPECT_TRUE(HasReceive<ReceiveCapture>::value);
    EXPECT_FALSE(HasTransmit<ReceiveCapture>::value);
}

TEST(RadioCapabilitiesTest, RssiIsReadAsInt32) {
    EXPECT_TRUE((std::is_same<decltype(std::declval<ISignalQualityCapability&>()
                                           .ReadRssi()),
                              ValueResult<int32_t>>::value));

    mocks::MockRadio radio({mocks::Expectation::ReadRssi(
        ValueResult<int32_t>::Ok(std::numeric_limits<int32_t>::min()))});
    EXPECT_EQ(radio.ReadRssi().getValue(), std::numeric_limits<int32_t>::min());
    EXPECT_TRUE(radio.Done());
}

TEST(RadioStateTest, StateNames) {
    EXPECT_STREQ(RadioStateToString(RadioState::kIdle), "Idle");
    EXPECT_STREQ(RadioStateToString(RadioState::kReceiving), "Receiving");
    EXPECT_STREQ(RadioStateToString(RadioState::kError), "Error");
}

TEST(PacketInfoTest, StoresMetadata) {
    PacketInfo info(-42, 180, std::chrono::microseconds(1500), 12);
    EXPECT_EQ(info.getRssi(), -42);
    EXPECT_EQ(info.getLqi(), 180);
    EXPECT_EQ(info.getTimestamp().count(), 1500);
    EXPECT_EQ(info.getLength(), 12u);
    EXPECT_EQ(info, PacketInfo(-42, 180, std::chrono::microseconds(1500), 12));
}

}  // namespace test
}  // namespace radiohal

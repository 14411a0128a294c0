// test/types/channel_configuration_test.cpp
#include <gtest/gtest.h>

#include <limits>

#include "types/configurations/channel_configuration.hpp"

namespace radiohal {
namespace test {

class ChannelConfigTest : public ::testing::Test {
   protected:
    ChannelConfig config_;
};

TEST_F(ChannelConfigTest, DefaultValues) {
    EXPECT_FLOAT_EQ(config_.getFrequency(), 869.9F);
    EXPECT_FLOAT_EQ(config_.getBandwidth(), 125.0F);
    EXPECT_EQ(config_.getPower(), 14);
    EXPECT_EQ(config_.getChannel(), 0);
    EXPECT_TRUE(config_.IsValid());
    EXPECT_EQ(config_.Validate(), "");
    EXPECT_EQ(config_, ChannelConfig::CreateDefaultEu868());
}

TEST_F(ChannelConfigTest, Us915Preset) {
    ChannelConfig us = ChannelConfig::CreateDefaultUs915();
    EXPECT_FLOAT_EQ(us.getFrequency(), 915.0F);
    EXPECT_FLOAT_EQ(us.getBandwidth(), 125.0F);
    EXPECT_EQ(us.getPower(), 20);
    EXPECT_TRUE(us.IsValid());
    EXPECT_NE(us, config_);
}

TEST_F(ChannelConfigTest, ConstructorStoresInvalidValues) {
    ChannelConfig config(2400.0F, 0.0F, 30);
    EXPECT_FLOAT_EQ(config.getFrequency(), 2400.0F);
    EXPECT_FALSE(config.IsValid());
    EXPECT_EQ(config.Validate(),
              "Frequency out of range. Invalid bandwidth. Power out of range. ");
}

TEST_F(ChannelConfigTest, NotANumberIsOutOfRange) {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    ChannelConfig config(nan, nan, 14);
    EXPECT_FALSE(config.IsValid());
    EXPECT_EQ(config.Validate(), "Frequency out of range. Invalid bandwidth. ");

    EXPECT_FALSE(config_.setFrequency(nan));
    EXPECT_FALSE(config_.setBandwidth(nan));
    EXPECT_TRUE(config_.IsValid());
}

TEST_F(ChannelConfigTest, SetFrequencyValidatesRange) {
    EXPECT_TRUE(config_.setFrequency(433.0F));
    EXPECT_FLOAT_EQ(config_.getFrequency(), 433.0F);

    Result result = config_.setFrequency(100.0F);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kConfigurationError);
    EXPECT_FLOAT_EQ(config_.getFrequency(), 433.0F);

    EXPECT_FALSE(config_.setFrequency(1021.0F));
    EXPECT_TRUE(config_.setFrequency(ChannelConfig::kMinFrequency));
    EXPECT_TRUE(config_.setFrequency(ChannelConfig::kMaxFrequency));
}

TEST_F(ChannelConfigTest, SetBandwidthValidatesRange) {
    EXPECT_TRUE(config_.setBandwidth(500.0F));
    EXPECT_FALSE(config_.setBandwidth(0.0F));
    EXPECT_FALSE(config_.setBandwidth(-125.0F));
    EXPECT_FALSE(config_.setBandwidth(1700.0F));
    EXPECT_FLOAT_EQ(config_.getBandwidth(), 500.0F);
}

TEST_F(ChannelConfigTest, SetPowerValidatesRange) {
    EXPECT_TRUE(config_.setPower(-18));
    EXPECT_TRUE(config_.setPower(22));
    EXPECT_FALSE(config_.setPower(23));
    EXPECT_FALSE(config_.setPower(-19));
    EXPECT_EQ(config_.getPower(), 22);
}

TEST_F(ChannelConfigTest, ChannelIsFree) {
    config_.setChannel(63);
    EXPECT_EQ(config_.getChannel(), 63);
    EXPECT_TRUE(config_.IsValid());
}

TEST_F(ChannelConfigTest, ToStringDescribesChannel) {
    ChannelConfig config(915.0F, 125.0F, 20, 3);
    EXPECT_EQ(config.ToString(), "915.000MHz bw=125.0kHz power=20dBm ch=3");
}

}  // namespace test
}  // namespace radiohal

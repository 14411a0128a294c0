// test/types/radio_error_test.cpp
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

#include "types/error_codes/result.hpp"

namespace radiohal {
namespace test {

class RadioErrorTest : public ::testing::Test {
   protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RadioErrorTest, SuccessResultTest) {
    Result result = Result::Success();
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(result);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kSuccess);
    EXPECT_EQ(result.GetErrorMessage(), "Success");
    EXPECT_EQ(result.getDeviceCode(), 0);
}

TEST_F(RadioErrorTest, ErrorResultTest) {
    Result result = Result::Error(RadioErrorCode::kConfigurationError);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kConfigurationError);
    EXPECT_EQ(result.GetErrorMessage(), "Failed to configure radio parameters");
}

TEST_F(RadioErrorTest, ErrorWithCustomMessage) {
    Result result =
        Result::Error(RadioErrorCode::kIoError, "Capture storage full");
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kIoError);
    EXPECT_EQ(result.GetErrorMessage(), "Capture storage full");
}

TEST_F(RadioErrorTest, ErrorCategoryTest) {
    const auto& category = RadioErrorCategory::GetInstance();
    EXPECT_EQ(category.name(), std::string("radio_error"));

    EXPECT_EQ(category.message(static_cast<int>(RadioErrorCode::kTimeout)),
              "Operation timed out");
    EXPECT_EQ(
        category.message(static_cast<int>(RadioErrorCode::kTransmissionError)),
        "Failed to transmit data");
    EXPECT_EQ(
        category.message(static_cast<int>(RadioErrorCode::kReceptionError)),
        "Failed to receive data");
    EXPECT_EQ(category.message(static_cast<int>(RadioErrorCode::kInvalidState)),
              "Radio in invalid state for operation");
    EXPECT_EQ(category.message(static_cast<int>(RadioErrorCode::kIoError)),
              "Input/output error");
}

TEST_F(RadioErrorTest, ErrorCodeConversionTest) {
    Result result = Result::Error(RadioErrorCode::kReceptionError);
    std::error_code error_code = result.AsErrorCode();

    EXPECT_EQ(error_code.value(),
              static_cast<int>(RadioErrorCode::kReceptionError));
    EXPECT_EQ(error_code.category().name(), std::string("radio_error"));
    EXPECT_EQ(error_code.message(), "Failed to receive data");
}

TEST_F(RadioErrorTest, DeviceErrorCarriesCode) {
    Result result = Result::DeviceError(-707, "SPI command failed");
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kDeviceError);
    EXPECT_EQ(result.getDeviceCode(), -707);
    EXPECT_EQ(result.GetErrorMessage(),
              "SPI command failed (device code -707)");

    Result bare = Result::DeviceError(12);
    EXPECT_EQ(bare.GetErrorMessage(), "Device-specific error (device code 12)");
}

TEST_F(RadioErrorTest, EqualityComparesCodeAndDeviceCode) {
    EXPECT_EQ(Result::Error(RadioErrorCode::kTimeout),
              Result::Error(RadioErrorCode::kTimeout, "other text"));
    EXPECT_NE(Result::Error(RadioErrorCode::kTimeout),
              Result::Error(RadioErrorCode::kIoError));
    EXPECT_NE(Result::DeviceError(1), Result::DeviceError(2));
    EXPECT_EQ(Result::DeviceError(3), Result::DeviceError(3));
}

TEST_F(RadioErrorTest, ValueResultHoldsValue) {
    auto result = ValueResult<int16_t>::Ok(-87);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.getValue(), -87);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kSuccess);
}

TEST_F(RadioErrorTest, ValueResultErrorHasNoValue) {
    auto result = ValueResult<int16_t>::Error(RadioErrorCode::kInvalidState);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kInvalidState);
    EXPECT_THROW(result.getValue(), std::bad_optional_access);
}

TEST_F(RadioErrorTest, FromStatusPropagatesUnchanged) {
    Result device = Result::DeviceError(-2, "Busy line stuck");
    auto result = ValueResult<bool>::FromStatus(device);
    EXPECT_EQ(result.getStatus(), device);
    EXPECT_EQ(result.getStatus().GetErrorMessage(),
              device.GetErrorMessage());
}

TEST_F(RadioErrorTest, FromStatusRejectsSuccessWithoutValue) {
    auto result = ValueResult<bool>::FromStatus(Result::Success());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kInvalidState);
}

TEST_F(RadioErrorTest, TakeValueMovesOut) {
    auto result = ValueResult<std::vector<uint8_t>>::Ok({1, 2, 3});
    std::vector<uint8_t> value = result.TakeValue();
    EXPECT_EQ(value, (std::vector<uint8_t>{1, 2, 3}));
}

}  // namespace test
}  // namespace radiohal

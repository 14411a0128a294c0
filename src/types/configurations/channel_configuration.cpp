#include "channel_configuration.hpp"

#include <cstdio>
#include <ostream>
#include <sstream>

namespace radiohal {

namespace {

// Every comparison with NaN is false, so NaN is out of range
bool FrequencyInRange(float frequency) {
    return frequency >= ChannelConfig::kMinFrequency &&
           frequency <= ChannelConfig::kMaxFrequency;
}

bool BandwidthInRange(float bandwidth) {
    return bandwidth > 0 && bandwidth <= ChannelConfig::kMaxBandwidth;
}

}  // namespace

ChannelConfig::ChannelConfig(float frequency, float bandwidth, int8_t power,
                             uint16_t channel)
    : frequency_(frequency),
      bandwidth_(bandwidth),
      power_(power),
      channel_(channel) {}

ChannelConfig ChannelConfig::CreateDefaultEu868() {
    return ChannelConfig{};
}

ChannelConfig ChannelConfig::CreateDefaultUs915() {
    return ChannelConfig{915.0F, 125.0F, 20, 0};
}

Result ChannelConfig::setFrequency(float frequency) {
    if (!FrequencyInRange(frequency)) {
        return Result::Error(RadioErrorCode::kConfigurationError,
                             "Frequency out of valid range");
    }
    frequency_ = frequency;
    return Result::Success();
}

Result ChannelConfig::setBandwidth(float bandwidth) {
    if (!BandwidthInRange(bandwidth)) {
        return Result::Error(RadioErrorCode::kConfigurationError,
                             "Bandwidth must be positive and at most 1625kHz");
    }
    bandwidth_ = bandwidth;
    return Result::Success();
}

Result ChannelConfig::setPower(int8_t power) {
    if (power < kMinPower || power > kMaxPower) {
        return Result::Error(RadioErrorCode::kConfigurationError,
                             "Power outside allowed range");
    }
    power_ = power;
    return Result::Success();
}

bool ChannelConfig::IsValid() const {
    return FrequencyInRange(frequency_) && BandwidthInRange(bandwidth_) &&
           power_ >= kMinPower && power_ <= kMaxPower;
}

std::string ChannelConfig::Validate() const {
    std::stringstream errors;
    if (!FrequencyInRange(frequency_)) {
        errors << "Frequency out of range. ";
    }
    if (!BandwidthInRange(bandwidth_)) {
        errors << "Invalid bandwidth. ";
    }
    if (power_ < kMinPower || power_ > kMaxPower) {
        errors << "Power out of range. ";
    }

    return errors.str();
}

std::string ChannelConfig::ToString() const {
    char buffer[96];
    snprintf(buffer, sizeof(buffer), "%.3fMHz bw=%.1fkHz power=%ddBm ch=%u",
             static_cast<double>(frequency_), static_cast<double>(bandwidth_),
             static_cast<int>(power_), static_cast<unsigned>(channel_));
    return buffer;
}

bool ChannelConfig::operator==(const ChannelConfig& other) const {
    return frequency_ == other.frequency_ && bandwidth_ == other.bandwidth_ &&
           power_ == other.power_ && channel_ == other.channel_;
}

std::ostream& operator<<(std::ostream& os, const ChannelConfig& config) {
    return os << config.ToString();
}

}  // namespace radiohal

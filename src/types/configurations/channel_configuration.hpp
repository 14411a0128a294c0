// src/types/configurations/channel_configuration.hpp
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "types/error_codes/result.hpp"

namespace radiohal {

/**
 * @brief Tunable channel parameters of a packet radio
 *
 * Holds the operating frequency, bandwidth, transmit power and an
 * implementation-defined channel index. Range checks here only reject
 * values no sub-GHz transceiver supports; a driver accepts or rejects the
 * configuration as a whole through its Configure operation.
 */
class ChannelConfig {
   public:
    /**
     * @brief Construct a new Channel Config object
     *
     * The values are stored as given. Use IsValid() or Validate() to check
     * them.
     *
     * @param frequency Operating frequency in MHz (default: 869.900MHz)
     * @param bandwidth Signal bandwidth in kHz (default: 125kHz)
     * @param power Transmission power in dBm (default: 14dBm)
     * @param channel Implementation-defined channel index (default: 0)
     */
    explicit ChannelConfig(float frequency = 869.900F,
                           float bandwidth = 125.0F, int8_t power = 14,
                           uint16_t channel = 0);

    /**
     * @brief Default configuration for the EU 868MHz band
     */
    static ChannelConfig CreateDefaultEu868();

    /**
     * @brief Default configuration for the US 915MHz band
     */
    static ChannelConfig CreateDefaultUs915();

    float getFrequency() const { return frequency_; }

    float getBandwidth() const { return bandwidth_; }

    int8_t getPower() const { return power_; }

    uint16_t getChannel() const { return channel_; }

    /**
     * @brief Set the operating frequency
     *
     * @param frequency New frequency in MHz
     * @return Result kConfigurationError if outside the valid range
     */
    Result setFrequency(float frequency);

    /**
     * @brief Set the signal bandwidth
     *
     * @param bandwidth New bandwidth in kHz
     * @return Result kConfigurationError if not positive or too wide
     */
    Result setBandwidth(float bandwidth);

    /**
     * @brief Set the transmission power
     *
     * @param power New power value in dBm
     * @return Result kConfigurationError if outside the valid range
     */
    Result setPower(int8_t power);

    /**
     * @brief Set the channel index
     *
     * Any index is accepted, its meaning belongs to the driver.
     */
    void setChannel(uint16_t channel) { channel_ = channel; }

    /**
     * @brief Check if all parameters are within valid ranges
     */
    bool IsValid() const;

    /**
     * @brief Get detailed validation messages
     * @return std::string Description of all violations, empty when valid
     */
    std::string Validate() const;

    /**
     * @brief One-line description for logs
     */
    std::string ToString() const;

    bool operator==(const ChannelConfig& other) const;

    bool operator!=(const ChannelConfig& other) const {
        return !(*this == other);
    }

    static constexpr float kMinFrequency = 137.0F;   ///< MHz
    static constexpr float kMaxFrequency = 1020.0F;  ///< MHz
    static constexpr float kMaxBandwidth = 1625.0F;  ///< kHz
    static constexpr int8_t kMinPower = -18;         ///< dBm
    static constexpr int8_t kMaxPower = 22;          ///< dBm

   private:
    float frequency_;   ///< Operating frequency in MHz
    float bandwidth_;   ///< Signal bandwidth in kHz
    int8_t power_;      ///< Transmission power in dBm
    uint16_t channel_;  ///< Implementation-defined channel index
};

std::ostream& operator<<(std::ostream& os, const ChannelConfig& config);

}  // namespace radiohal

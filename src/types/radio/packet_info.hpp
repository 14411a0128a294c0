// src/types/radio/packet_info.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace radiohal {

/**
 * @brief Telemetry attached to one received packet
 *
 * Immutable once created. The timestamp epoch is chosen by the driver
 * (wall-clock or monotonic), units are microseconds.
 */
class PacketInfo {
   public:
    PacketInfo() = default;

    /**
     * @brief Construct a new Packet Info object
     *
     * @param rssi Received signal strength in device-native units (usually dBm)
     * @param lqi Link quality indicator
     * @param timestamp Reception time
     * @param length Number of payload bytes received
     */
    PacketInfo(int16_t rssi, uint16_t lqi, std::chrono::microseconds timestamp,
               size_t length)
        : rssi_(rssi), lqi_(lqi), timestamp_(timestamp), length_(length) {}

    int16_t getRssi() const { return rssi_; }

    uint16_t getLqi() const { return lqi_; }

    std::chrono::microseconds getTimestamp() const { return timestamp_; }

    size_t getLength() const { return length_; }

    bool operator==(const PacketInfo& other) const {
        return rssi_ == other.rssi_ && lqi_ == other.lqi_ &&
               timestamp_ == other.timestamp_ && length_ == other.length_;
    }

    bool operator!=(const PacketInfo& other) const {
        return !(*this == other);
    }

   private:
    int16_t rssi_ = 0;
    uint16_t lqi_ = 0;
    std::chrono::microseconds timestamp_{0};
    size_t length_ = 0;
};

/**
 * @brief A received frame together with its telemetry
 */
struct ReceivedPacket {
    std::vector<uint8_t> payload;
    PacketInfo info;

    bool operator==(const ReceivedPacket& other) const {
        return payload == other.payload && info == other.info;
    }

    bool operator!=(const ReceivedPacket& other) const {
        return !(*this == other);
    }
};

}  // namespace radiohal

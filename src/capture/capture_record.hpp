// src/capture/capture_record.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "types/radio/packet_info.hpp"

namespace radiohal {

/**
 * @brief Direction of a captured packet
 */
enum class CaptureDirection : uint8_t {
    kSent = 0,     ///< Transmitted by the local radio
    kReceived = 1  ///< Received by the local radio
};

/**
 * @brief Copy of one transmitted or received packet
 */
struct CaptureRecord {
    CaptureDirection direction = CaptureDirection::kSent;
    std::vector<uint8_t> payload;
    std::optional<PacketInfo> info;  ///< Present for received packets
    std::chrono::microseconds timestamp{0};
};

}  // namespace radiohal

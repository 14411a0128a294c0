// src/capture/pcap_writer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "capture_sink.hpp"
#include "utils/logger.hpp"

namespace radiohal {

/**
 * @brief Link-layer header type written in the pcap global header
 */
enum class PcapLinkType : uint32_t {
    /// LINKTYPE_USER0, every frame prefixed with the radio pseudo-header
    kUser0 = 147,
    /// LINKTYPE_IEEE802_15_4_WITHFCS, raw frame bytes only
    kIeee802154 = 195
};

/**
 * @brief Layout of the radio pseudo-header used with PcapLinkType::kUser0
 *
 * Eight bytes, multi-byte fields in network byte order:
 *   version, direction (0 sent, 1 received), flags, reserved,
 *   RSSI (int16), LQI (uint16)
 */
struct PcapRadioHeader {
    static constexpr uint8_t kVersion = 1;
    static constexpr size_t kLength = 8;
    static constexpr uint8_t kFlagInfoValid = 0x01;  ///< RSSI/LQI present
};

/**
 * @brief Capture sink writing the classic libpcap file format
 *
 * The global header is written by WriteHeader() or lazily before the
 * first record. Stream failures are reported as kIoError.
 */
class PcapWriter : public ICaptureSink {
   public:
    static constexpr uint32_t kMagic = 0xA1B2C3D4;
    static constexpr uint16_t kVersionMajor = 2;
    static constexpr uint16_t kVersionMinor = 4;
    static constexpr uint32_t kSnapLength = 0xFFFF;

    /**
     * @brief Write to a stream owned by the caller
     */
    explicit PcapWriter(std::ostream& out,
                        PcapLinkType link_type = PcapLinkType::kUser0);

    /**
     * @brief Write to a stream owned by the writer
     */
    explicit PcapWriter(std::unique_ptr<std::ostream> out,
                        PcapLinkType link_type = PcapLinkType::kUser0);

    /**
     * @brief Write the global header if not written yet
     */
    Result WriteHeader();

    /**
     * @brief Append one packet record
     *
     * Frames longer than the snap length are truncated, the original
     * length is kept in the record header.
     */
    Result Append(const CaptureRecord& record) override;

    PcapLinkType getLinkType() const { return link_type_; }

    size_t getRecordCount() const { return record_count_; }

   private:
    Result WriteBuffer(const std::vector<uint8_t>& buffer);

    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    PcapLinkType link_type_;
    bool header_written_ = false;
    size_t record_count_ = 0;
};

/**
 * @brief Where capture output goes
 *
 * At most one of file and pipe may be set.
 */
struct PcapOptions {
    /// Create and write capture output to a pcap file
    std::optional<std::string> file;
    /// Create a named pipe for live capture (e.g. with Wireshark)
    std::optional<std::string> pipe;
    PcapLinkType link_type = PcapLinkType::kUser0;
};

/**
 * @brief Open the capture output described by the options
 *
 * Opening a pipe blocks until a reader connects.
 *
 * @return The writer with its header written, nullptr when no output is
 * configured, kConfigurationError when both outputs are set, kIoError when
 * the output cannot be created
 */
ValueResult<std::unique_ptr<PcapWriter>> OpenPcapWriter(
    const PcapOptions& options, Logger& logger = LOG);

}  // namespace radiohal

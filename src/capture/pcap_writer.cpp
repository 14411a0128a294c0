#include "pcap_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "utils/byte_operations.h"

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>
#include <sys/types.h>
#define RADIOHAL_HAS_MKFIFO
#endif

namespace radiohal {

PcapWriter::PcapWriter(std::ostream& out, PcapLinkType link_type)
    : out_(out), link_type_(link_type) {}

PcapWriter::PcapWriter(std::unique_ptr<std::ostream> out,
                       PcapLinkType link_type)
    : owned_(std::move(out)), out_(*owned_), link_type_(link_type) {}

Result PcapWriter::WriteHeader() {
    if (header_written_) {
        return Result::Success();
    }

    std::vector<uint8_t> header;
    utils::ByteSerializer serializer(header);
    serializer.WriteUint32(kMagic);
    serializer.WriteUint16(kVersionMajor);
    serializer.WriteUint16(kVersionMinor);
    serializer.WriteUint32(0);  // thiszone
    serializer.WriteUint32(0);  // sigfigs
    serializer.WriteUint32(kSnapLength);
    serializer.WriteUint32(static_cast<uint32_t>(link_type_));

    Result status = WriteBuffer(header);
    if (status) {
        header_written_ = true;
    }
    return status;
}

Result PcapWriter::Append(const CaptureRecord& record) {
    Result status = WriteHeader();
    if (!status) {
        return status;
    }

    std::vector<uint8_t> frame;
    utils::ByteSerializer frame_writer(frame);
    if (link_type_ == PcapLinkType::kUser0) {
        uint8_t flags = record.info ? PcapRadioHeader::kFlagInfoValid : 0;
        frame_writer.WriteUint8(PcapRadioHeader::kVersion);
        frame_writer.WriteUint8(static_cast<uint8_t>(record.direction));
        frame_writer.WriteUint8(flags);
        frame_writer.WriteUint8(0);
        frame_writer.WriteInt16BE(record.info ? record.info->getRssi() : 0);
        frame_writer.WriteUint16BE(record.info ? record.info->getLqi() : 0);
    }
    frame_writer.WriteBytes(record.payload.data(), record.payload.size());

    const uint32_t original_length = static_cast<uint32_t>(frame.size());
    if (frame.size() > kSnapLength) {
        frame.resize(kSnapLength);
    }

    // Timestamps before the epoch are written as zero
    const int64_t micros = std::max<int64_t>(record.timestamp.count(), 0);
    std::vector<uint8_t> buffer;
    utils::ByteSerializer serializer(buffer);
    serializer.WriteUint32(static_cast<uint32_t>(micros / 1000000));
    serializer.WriteUint32(static_cast<uint32_t>(micros % 1000000));
    serializer.WriteUint32(static_cast<uint32_t>(frame.size()));
    serializer.WriteUint32(original_length);
    serializer.WriteBytes(frame.data(), frame.size());

    status = WriteBuffer(buffer);
    if (status) {
        record_count_++;
    }
    return status;
}

Result PcapWriter::WriteBuffer(const std::vector<uint8_t>& buffer) {
    out_.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    out_.flush();
    if (!out_) {
        return Result::Error(RadioErrorCode::kIoError,
                             "Failed to write pcap output");
    }
    return Result::Success();
}

ValueResult<std::unique_ptr<PcapWriter>> OpenPcapWriter(
    const PcapOptions& options, Logger& logger) {
    using OpenResult = ValueResult<std::unique_ptr<PcapWriter>>;

    if (options.file && options.pipe) {
        return OpenResult::Error(RadioErrorCode::kConfigurationError,
                                 "Both pcap file and pcap pipe given");
    }
    if (!options.file && !options.pipe) {
        return OpenResult::Ok(nullptr);
    }

    std::string path;
    if (options.file) {
        path = *options.file;
    } else {
#ifdef RADIOHAL_HAS_MKFIFO
        path = *options.pipe;
        std::remove(path.c_str());
        if (mkfifo(path.c_str(), 0644) != 0) {
            std::string message = "Error creating fifo " + path + ": " +
                                  std::strerror(errno);
            logger.Error("%s", message.c_str());
            return OpenResult::Error(RadioErrorCode::kIoError, message);
        }
        logger.Info("pcap pipe %s open, awaiting connection", path.c_str());
#else
        return OpenResult::Error(RadioErrorCode::kConfigurationError,
                                 "Named pipes are not supported here");
#endif
    }

    auto stream = std::make_unique<std::ofstream>(
        path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
        logger.Error("Unable to open pcap output %s", path.c_str());
        return OpenResult::Error(RadioErrorCode::kIoError,
                                 "Unable to open " + path);
    }

    auto writer =
        std::make_unique<PcapWriter>(std::move(stream), options.link_type);
    Result status = writer->WriteHeader();
    if (!status) {
        return OpenResult::FromStatus(status);
    }

    logger.Info("Writing capture to %s", path.c_str());
    return OpenResult::Ok(std::move(writer));
}

}  // namespace radiohal

#include "capture_recorder.hpp"

#include <utility>

namespace radiohal {

CaptureRecorder::CaptureRecorder(ICaptureSink& sink, hal::IClock& clock,
                                 Logger& logger)
    : sink_(sink), clock_(clock), logger_(logger) {}

Result CaptureRecorder::RecordSent(std::vector<uint8_t> payload) {
    CaptureRecord record;
    record.direction = CaptureDirection::kSent;
    record.payload = std::move(payload);
    record.timestamp = Now();

    length_stats_.Update(static_cast<double>(record.payload.size()));
    sent_count_++;

    return Append(record);
}

Result CaptureRecorder::RecordReceived(const ReceivedPacket& packet) {
    CaptureRecord record;
    record.direction = CaptureDirection::kReceived;
    record.payload = packet.payload;
    record.info = packet.info;
    record.timestamp = packet.info.getTimestamp().count() != 0
                           ? packet.info.getTimestamp()
                           : Now();

    rssi_stats_.Update(static_cast<double>(packet.info.getRssi()));
    length_stats_.Update(static_cast<double>(packet.payload.size()));
    received_count_++;

    return Append(record);
}

std::chrono::microseconds CaptureRecorder::Now() {
    return std::chrono::microseconds(static_cast<int64_t>(clock_.Micros()));
}

Result CaptureRecorder::Append(const CaptureRecord& record) {
    Result status = sink_.Append(record);
    if (status) {
        return status;
    }

    capture_failures_++;
    logger_.Error("Capture of %zu byte %s packet failed: %s",
                  record.payload.size(),
                  record.direction == CaptureDirection::kSent ? "sent"
                                                              : "received",
                  status.GetErrorMessage().c_str());
    if (status.getErrorCode() != RadioErrorCode::kIoError) {
        return Result::Error(RadioErrorCode::kIoError,
                             status.GetErrorMessage());
    }
    return status;
}

}  // namespace radiohal

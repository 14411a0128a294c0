#include "loopback_radio.hpp"

#include <cmath>

namespace radiohal {

namespace {

constexpr float kFrequencyTolerance = 0.001F;  // MHz

bool SameFrequency(float a, float b) {
    return std::fabs(a - b) < kFrequencyTolerance;
}

}  // namespace

// LoopbackMedium Implementation
LoopbackMedium::LoopbackMedium(int16_t link_rssi, uint16_t link_lqi,
                               size_t inbox_capacity)
    : link_rssi_(link_rssi),
      link_lqi_(link_lqi),
      inbox_capacity_(inbox_capacity) {}

void LoopbackMedium::setLink(int16_t link_rssi, uint16_t link_lqi) {
    std::lock_guard<std::mutex> lock(mutex_);
    link_rssi_ = link_rssi;
    link_lqi_ = link_lqi;
}

int16_t LoopbackMedium::getLinkRssi() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_rssi_;
}

uint16_t LoopbackMedium::getLinkLqi() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_lqi_;
}

size_t LoopbackMedium::getDroppedFrames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_frames_;
}

uint32_t LoopbackMedium::Attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t id = next_id_++;
    endpoints_[id] = Endpoint{};
    return id;
}

void LoopbackMedium::Detach(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(id);
}

void LoopbackMedium::Tune(uint32_t id, float frequency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(id);
    if (it == endpoints_.end()) {
        return;
    }
    if (!it->second.frequency ||
        !SameFrequency(*it->second.frequency, frequency)) {
        // Frames queued on the previous frequency are lost
        it->second.inbox.clear();
    }
    it->second.frequency = frequency;
}

size_t LoopbackMedium::Broadcast(uint32_t sender,
                                 const std::vector<uint8_t>& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto source = endpoints_.find(sender);
    if (source == endpoints_.end() || !source->second.frequency) {
        return 0;
    }

    size_t delivered = 0;
    for (auto& entry : endpoints_) {
        Endpoint& endpoint = entry.second;
        if (entry.first == sender || !endpoint.frequency ||
            !SameFrequency(*endpoint.frequency, *source->second.frequency)) {
            continue;
        }
        if (endpoint.inbox.size() >= inbox_capacity_) {
            dropped_frames_++;
            continue;
        }
        endpoint.inbox.push_back(frame);
        delivered++;
    }
    return delivered;
}

std::optional<std::vector<uint8_t>> LoopbackMedium::Pop(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = endpoints_.find(id);
    if (it == endpoints_.end() || it->second.inbox.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> frame = std::move(it->second.inbox.front());
    it->second.inbox.pop_front();
    return frame;
}

// LoopbackRadio Implementation
LoopbackRadio::LoopbackRadio(std::shared_ptr<LoopbackMedium> medium,
                             hal::IClock& clock, LoopbackTiming timing,
                             Logger& logger)
    : medium_(std::move(medium)),
      clock_(clock),
      timing_(timing),
      logger_(logger),
      id_(medium_->Attach()) {}

LoopbackRadio::~LoopbackRadio() {
    medium_->Detach(id_);
}

RadioState LoopbackRadio::getState() {
    return state_;
}

Result LoopbackRadio::Configure(const ChannelConfig& config) {
    if (state_ == RadioState::kTransmitting ||
        state_ == RadioState::kReceiving || state_ == RadioState::kSleeping) {
        return Reject("Configure");
    }

    RadioState previous = state_;
    SetState(RadioState::kConfiguring);

    if (!config.IsValid()) {
        logger_.Warning("Radio %u: configuration rejected: %s", id_,
                        config.Validate().c_str());
        SetState(previous);
        return Result::Error(RadioErrorCode::kConfigurationError,
                             config.Validate());
    }

    config_ = config;
    fault_.reset();
    medium_->Tune(id_, config.getFrequency());
    logger_.Info("Radio %u: configured %s", id_, config.ToString().c_str());

    SetState(RadioState::kIdle);
    return Result::Success();
}

Result LoopbackRadio::StartTransmit(const uint8_t* data, size_t len) {
    if (state_ != RadioState::kIdle || !config_) {
        return Reject("StartTransmit");
    }
    if (len > kMaxPayloadLength) {
        logger_.Warning("Radio %u: payload of %zu bytes exceeds %zu", id_, len,
                        kMaxPayloadLength);
        return Result::Error(RadioErrorCode::kTransmissionError,
                             "Payload too long");
    }

    pending_frame_.assign(data, data + len);
    transmit_polls_left_ = timing_.transmit_polls;
    last_packet_rssi_.reset();

    SetState(RadioState::kTransmitting);
    return Result::Success();
}

ValueResult<bool> LoopbackRadio::CheckTransmit() {
    if (state_ != RadioState::kTransmitting) {
        return ValueResult<bool>::FromStatus(Reject("CheckTransmit"));
    }

    std::optional<Result> fault = TakeFault();
    if (fault) {
        return ValueResult<bool>::FromStatus(*fault);
    }

    if (transmit_polls_left_ > 0) {
        transmit_polls_left_--;
        return ValueResult<bool>::Ok(false);
    }

    size_t delivered = medium_->Broadcast(id_, pending_frame_);
    logger_.Debug("Radio %u: sent %zu bytes to %zu receivers", id_,
                  pending_frame_.size(), delivered);
    pending_frame_.clear();

    SetState(RadioState::kIdle);
    return ValueResult<bool>::Ok(true);
}

Result LoopbackRadio::StartReceive() {
    if (state_ != RadioState::kIdle || !config_) {
        return Reject("StartReceive");
    }

    empty_receive_polls_ = 0;
    last_packet_rssi_.reset();

    SetState(RadioState::kReceiving);
    return Result::Success();
}

ValueResult<std::optional<ReceivedPacket>> LoopbackRadio::CheckReceive() {
    using CheckResult = ValueResult<std::optional<ReceivedPacket>>;

    if (state_ != RadioState::kReceiving) {
        return CheckResult::FromStatus(Reject("CheckReceive"));
    }

    std::optional<Result> fault = TakeFault();
    if (fault) {
        return CheckResult::FromStatus(*fault);
    }

    std::optional<std::vector<uint8_t>> frame = medium_->Pop(id_);
    if (!frame) {
        empty_receive_polls_++;
        if (timing_.receive_window_polls > 0 &&
            empty_receive_polls_ >= timing_.receive_window_polls) {
            logger_.Debug("Radio %u: receive window expired", id_);
            SetState(RadioState::kIdle);
            return CheckResult::Error(RadioErrorCode::kTimeout);
        }
        return CheckResult::Ok(std::nullopt);
    }

    ReceivedPacket packet;
    packet.info = PacketInfo(
        medium_->getLinkRssi(), medium_->getLinkLqi(),
        std::chrono::microseconds(static_cast<int64_t>(clock_.Micros())),
        frame->size());
    packet.payload = std::move(*frame);
    last_packet_rssi_ = packet.info.getRssi();

    logger_.Debug("Radio %u: received %zu bytes rssi %d", id_,
                  packet.payload.size(), packet.info.getRssi());

    SetState(RadioState::kIdle);
    return CheckResult::Ok(std::move(packet));
}

ValueResult<int32_t> LoopbackRadio::ReadRssi() {
    if (state_ == RadioState::kReceiving) {
        return ValueResult<int32_t>::Ok(medium_->getLinkRssi());
    }
    if (state_ == RadioState::kIdle && last_packet_rssi_) {
        return ValueResult<int32_t>::Ok(*last_packet_rssi_);
    }
    return ValueResult<int32_t>::FromStatus(Reject("ReadRssi"));
}

Result LoopbackRadio::Sleep() {
    if (state_ != RadioState::kIdle) {
        return Reject("Sleep");
    }
    last_packet_rssi_.reset();
    SetState(RadioState::kSleeping);
    return Result::Success();
}

Result LoopbackRadio::Wake() {
    if (state_ != RadioState::kSleeping) {
        return Reject("Wake");
    }
    SetState(RadioState::kIdle);
    return Result::Success();
}

Result LoopbackRadio::setPower(int8_t power) {
    if (state_ != RadioState::kIdle || !config_) {
        return Reject("setPower");
    }
    Result status = config_->setPower(power);
    if (!status) {
        logger_.Warning("Radio %u: power %d dBm rejected", id_, power);
        return status;
    }
    logger_.Debug("Radio %u: power set to %d dBm", id_, power);
    return Result::Success();
}

Result LoopbackRadio::Reset() {
    if (state_ == RadioState::kTransmitting) {
        logger_.Info("Radio %u: abandoning transmission of %zu bytes", id_,
                     pending_frame_.size());
    }
    pending_frame_.clear();
    transmit_polls_left_ = 0;
    empty_receive_polls_ = 0;
    last_packet_rssi_.reset();
    fault_.reset();

    SetState(RadioState::kIdle);
    return Result::Success();
}

void LoopbackRadio::InjectFault(Result error) {
    fault_ = std::move(error);
}

void LoopbackRadio::SetState(RadioState state) {
    if (state == state_) {
        return;
    }
    logger_.Debug("Radio %u: %s -> %s", id_, RadioStateToString(state_),
                  RadioStateToString(state));
    state_ = state;
}

Result LoopbackRadio::Reject(const char* operation) {
    logger_.Warning("Radio %u: %s not allowed in state %s%s", id_, operation,
                    RadioStateToString(state_),
                    config_ ? "" : " (unconfigured)");
    return Result::Error(RadioErrorCode::kInvalidState);
}

std::optional<Result> LoopbackRadio::TakeFault() {
    if (!fault_) {
        return std::nullopt;
    }
    Result fault = std::move(*fault_);
    fault_.reset();
    pending_frame_.clear();
    logger_.Error("Radio %u: hardware fault: %s", id_,
                  fault.GetErrorMessage().c_str());
    SetState(RadioState::kError);
    return fault;
}

}  // namespace radiohal

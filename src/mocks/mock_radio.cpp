#include "mocks/mock_radio.hpp"

#include <gmock/gmock.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

#include "mocks/gmock_radio.hpp"

namespace radiohal {
namespace mocks {

using ::testing::_;
using ::testing::Args;
using ::testing::ElementsAreArray;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::InvokeWithoutArgs;

namespace {

std::string FormatBytes(const uint8_t* data, size_t len) {
    std::string out = "[";
    char byte[8];
    for (size_t i = 0; i < len; ++i) {
        snprintf(byte, sizeof(byte), i == 0 ? "%02x" : " %02x", data[i]);
        out += byte;
    }
    out += "]";
    return out;
}

std::string FormatBytes(const std::vector<uint8_t>& data) {
    return FormatBytes(data.data(), data.size());
}

// Returns the canned response and counts the expectation as consumed
template <typename T>
auto Consume(size_t* consumed, T response) {
    return InvokeWithoutArgs([consumed, response]() {
        ++*consumed;
        return response;
    });
}

}  // namespace

const char* MockCallToString(MockCall call) {
    switch (call) {
        case MockCall::kGetState:
            return "getState";
        case MockCall::kConfigure:
            return "Configure";
        case MockCall::kStartTransmit:
            return "StartTransmit";
        case MockCall::kCheckTransmit:
            return "CheckTransmit";
        case MockCall::kStartReceive:
            return "StartReceive";
        case MockCall::kCheckReceive:
            return "CheckReceive";
        case MockCall::kReadRssi:
            return "ReadRssi";
        case MockCall::kSleep:
            return "Sleep";
        case MockCall::kWake:
            return "Wake";
        case MockCall::kSetPower:
            return "setPower";
        case MockCall::kReset:
            return "Reset";
        default:
            return "Unknown";
    }
}

// Expectation factories
Expectation Expectation::GetState(RadioState state) {
    Expectation expectation(MockCall::kGetState);
    expectation.state_ = state;
    return expectation;
}

Expectation Expectation::Configure(const ChannelConfig& config,
                                   Result result) {
    Expectation expectation(MockCall::kConfigure);
    expectation.config_ = config;
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::StartTransmit(std::vector<uint8_t> payload,
                                       Result result) {
    Expectation expectation(MockCall::kStartTransmit);
    expectation.payload_ = std::move(payload);
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::CheckTransmit(ValueResult<bool> result) {
    Expectation expectation(MockCall::kCheckTransmit);
    expectation.transmit_done_ = std::move(result);
    return expectation;
}

Expectation Expectation::StartReceive(Result result) {
    Expectation expectation(MockCall::kStartReceive);
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::CheckReceive(
    ValueResult<std::optional<ReceivedPacket>> result) {
    Expectation expectation(MockCall::kCheckReceive);
    expectation.received_ = std::move(result);
    return expectation;
}

Expectation Expectation::ReadRssi(ValueResult<int32_t> result) {
    Expectation expectation(MockCall::kReadRssi);
    expectation.rssi_ = std::move(result);
    return expectation;
}

Expectation Expectation::Sleep(Result result) {
    Expectation expectation(MockCall::kSleep);
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::Wake(Result result) {
    Expectation expectation(MockCall::kWake);
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::SetPower(int8_t power, Result result) {
    Expectation expectation(MockCall::kSetPower);
    expectation.power_ = power;
    expectation.status_ = std::move(result);
    return expectation;
}

Expectation Expectation::Reset(Result result) {
    Expectation expectation(MockCall::kReset);
    expectation.status_ = std::move(result);
    return expectation;
}

std::string Expectation::Describe() const {
    std::string description = MockCallToString(call_);
    switch (call_) {
        case MockCall::kConfigure:
            description += "(" + config_->ToString() + ")";
            break;
        case MockCall::kStartTransmit:
            description += "(" + FormatBytes(payload_) + ")";
            break;
        case MockCall::kSetPower:
            description += "(" + std::to_string(power_) + ")";
            break;
        default:
            description += "()";
            break;
    }
    return description;
}

// Implementation class using the PIMPL idiom to hide the GoogleMock radio
class MockRadio::Impl {
   public:
    ::testing::StrictMock<GmockRadio> mock;
    ::testing::Sequence sequence;
    std::vector<Expectation> script;
    size_t consumed = 0;
};

MockRadio::MockRadio(Logger& logger)
    : pimpl_(std::make_unique<Impl>()), logger_(logger) {
    InstallDefaults();
}

MockRadio::MockRadio(std::vector<Expectation> expectations, Logger& logger)
    : MockRadio(logger) {
    Expect(std::move(expectations));
}

// Destructor needs to be defined here where Impl is complete
MockRadio::~MockRadio() = default;

void MockRadio::Expect(std::vector<Expectation> expectations) {
    for (const auto& expectation : expectations) {
        Schedule(expectation);
    }
}

bool MockRadio::Done() {
    const size_t remaining = Remaining();
    if (remaining > 0) {
        std::stringstream message;
        message << remaining << " expectation(s) not consumed:";
        for (size_t i = pimpl_->consumed; i < pimpl_->script.size(); ++i) {
            message << " " << pimpl_->script[i].Describe();
        }
        logger_.Error("MockRadio: %s", message.str().c_str());
    }

    const bool verified =
        ::testing::Mock::VerifyAndClearExpectations(&pimpl_->mock);

    pimpl_->script.clear();
    pimpl_->consumed = 0;
    pimpl_->sequence = ::testing::Sequence();
    return verified && remaining == 0;
}

size_t MockRadio::Remaining() const {
    return pimpl_->script.size() - pimpl_->consumed;
}

void MockRadio::Schedule(const Expectation& expectation) {
    auto& mock = pimpl_->mock;
    auto& sequence = pimpl_->sequence;
    size_t* consumed = &pimpl_->consumed;

    switch (expectation.call_) {
        case MockCall::kGetState:
            EXPECT_CALL(mock, getState())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.state_));
            break;
        case MockCall::kConfigure:
            EXPECT_CALL(mock, Configure(Eq(*expectation.config_)))
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kStartTransmit:
            EXPECT_CALL(mock, StartTransmit(_, expectation.payload_.size()))
                .With(Args<0, 1>(ElementsAreArray(expectation.payload_)))
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kCheckTransmit:
            EXPECT_CALL(mock, CheckTransmit())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, *expectation.transmit_done_));
            break;
        case MockCall::kStartReceive:
            EXPECT_CALL(mock, StartReceive())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kCheckReceive:
            EXPECT_CALL(mock, CheckReceive())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, *expectation.received_));
            break;
        case MockCall::kReadRssi:
            EXPECT_CALL(mock, ReadRssi())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, *expectation.rssi_));
            break;
        case MockCall::kSleep:
            EXPECT_CALL(mock, Sleep())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kWake:
            EXPECT_CALL(mock, Wake())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kSetPower:
            EXPECT_CALL(mock, setPower(Eq(expectation.power_)))
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
        case MockCall::kReset:
            EXPECT_CALL(mock, Reset())
                .InSequence(sequence)
                .WillOnce(Consume(consumed, expectation.status_));
            break;
    }
    pimpl_->script.push_back(expectation);
}

void MockRadio::InstallDefaults() {
    auto& mock = pimpl_->mock;

    // Taken for calls no expectation matches, after GoogleMock reports them
    ON_CALL(mock, getState()).WillByDefault(InvokeWithoutArgs([this]() {
        LogUnexpected("getState()");
        return RadioState::kError;
    }));
    ON_CALL(mock, Configure(_))
        .WillByDefault(Invoke([this](const ChannelConfig& config) {
            return Unexpected("Configure(" + config.ToString() + ")");
        }));
    ON_CALL(mock, StartTransmit(_, _))
        .WillByDefault(Invoke([this](const uint8_t* data, size_t len) {
            return Unexpected("StartTransmit(" + FormatBytes(data, len) + ")");
        }));
    ON_CALL(mock, CheckTransmit()).WillByDefault(InvokeWithoutArgs([this]() {
        return ValueResult<bool>::FromStatus(Unexpected("CheckTransmit()"));
    }));
    ON_CALL(mock, StartReceive()).WillByDefault(InvokeWithoutArgs([this]() {
        return Unexpected("StartReceive()");
    }));
    ON_CALL(mock, CheckReceive()).WillByDefault(InvokeWithoutArgs([this]() {
        return ValueResult<std::optional<ReceivedPacket>>::FromStatus(
            Unexpected("CheckReceive()"));
    }));
    ON_CALL(mock, ReadRssi()).WillByDefault(InvokeWithoutArgs([this]() {
        return ValueResult<int32_t>::FromStatus(Unexpected("ReadRssi()"));
    }));
    ON_CALL(mock, Sleep()).WillByDefault(
        InvokeWithoutArgs([this]() { return Unexpected("Sleep()"); }));
    ON_CALL(mock, Wake()).WillByDefault(
        InvokeWithoutArgs([this]() { return Unexpected("Wake()"); }));
    ON_CALL(mock, setPower(_)).WillByDefault(Invoke([this](int8_t power) {
        return Unexpected("setPower(" + std::to_string(power) + ")");
    }));
    ON_CALL(mock, Reset()).WillByDefault(
        InvokeWithoutArgs([this]() { return Unexpected("Reset()"); }));
}

Result MockRadio::Unexpected(const std::string& actual) {
    LogUnexpected(actual);
    return Result::Error(RadioErrorCode::kInvalidState,
                         "Unexpected call " + actual);
}

void MockRadio::LogUnexpected(const std::string& actual) {
    const std::string expected =
        pimpl_->consumed < pimpl_->script.size()
            ? pimpl_->script[pimpl_->consumed].Describe()
            : std::string("nothing");
    logger_.Error("MockRadio: unexpected call %s, expected %s", actual.c_str(),
                  expected.c_str());
}

// Forward every capability to the GoogleMock radio
RadioState MockRadio::getState() {
    return pimpl_->mock.getState();
}

Result MockRadio::Configure(const ChannelConfig& config) {
    return pimpl_->mock.Configure(config);
}

Result MockRadio::StartTransmit(const uint8_t* data, size_t len) {
    return pimpl_->mock.StartTransmit(data, len);
}

ValueResult<bool> MockRadio::CheckTransmit() {
    return pimpl_->mock.CheckTransmit();
}

Result MockRadio::StartReceive() {
    return pimpl_->mock.StartReceive();
}

ValueResult<std::optional<ReceivedPacket>> MockRadio::CheckReceive() {
    return pimpl_->mock.CheckReceive();
}

ValueResult<int32_t> MockRadio::ReadRssi() {
    return pimpl_->mock.ReadRssi();
}

Result MockRadio::Sleep() {
    return pimpl_->mock.Sleep();
}

Result MockRadio::Wake() {
    return pimpl_->mock.Wake();
}

Result MockRadio::setPower(int8_t power) {
    return pimpl_->mock.setPower(power);
}

Result MockRadio::Reset() {
    return pimpl_->mock.Reset();
}

GmockRadio& GetMockForTesting(MockRadio& radio) {
    return radio.pimpl_->mock;
}

}  // namespace mocks
}  // namespace radiohal

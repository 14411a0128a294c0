#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types/radio/radio.hpp"
#include "utils/logger.hpp"

namespace radiohal {
namespace mocks {

class GmockRadio;

/**
 * @brief Capability call a MockRadio can expect
 */
enum class MockCall {
    kGetState,
    kConfigure,
    kStartTransmit,
    kCheckTransmit,
    kStartReceive,
    kCheckReceive,
    kReadRssi,
    kSleep,
    kWake,
    kSetPower,
    kReset
};

/**
 * @brief Printable name of a mock call
 */
const char* MockCallToString(MockCall call);

/**
 * @brief One scripted call: expected method and arguments, canned result
 *
 * Built through the static factories, one per capability method.
 */
class Expectation {
   public:
    static Expectation GetState(RadioState state);
    static Expectation Configure(const ChannelConfig& config,
                                 Result result = Result::Success());
    static Expectation StartTransmit(std::vector<uint8_t> payload,
                                     Result result = Result::Success());
    static Expectation CheckTransmit(ValueResult<bool> result);
    static Expectation StartReceive(Result result = Result::Success());
    static Expectation CheckReceive(
        ValueResult<std::optional<ReceivedPacket>> result);
    static Expectation ReadRssi(ValueResult<int32_t> result);
    static Expectation Sleep(Result result = Result::Success());
    static Expectation Wake(Result result = Result::Success());
    static Expectation SetPower(int8_t power,
                                Result result = Result::Success());
    static Expectation Reset(Result result = Result::Success());

    MockCall getCall() const { return call_; }

    /**
     * @brief Describe the call and its arguments for failure messages
     */
    std::string Describe() const;

   private:
    friend class MockRadio;

    explicit Expectation(MockCall call) : call_(call) {}

    MockCall call_;

    // Expected arguments
    std::optional<ChannelConfig> config_;
    std::vector<uint8_t> payload_;
    int8_t power_ = 0;

    // Canned responses, only the one matching call_ is used
    Result status_;
    RadioState state_ = RadioState::kIdle;
    std::optional<ValueResult<bool>> transmit_done_;
    std::optional<ValueResult<std::optional<ReceivedPacket>>> received_;
    std::optional<ValueResult<int32_t>> rssi_;
};

/**
 * @brief Scriptable radio double backed by GoogleMock
 *
 * Each expectation becomes a strict, single-shot GoogleMock expectation in
 * one sequence, so the script is consumed in order. A call that does not
 * match the next expectation, by method or by arguments, is reported as a
 * GoogleTest failure and logged, and returns kInvalidState (getState()
 * returns kError). Expectations left unconsumed fail Done(), or the test
 * when the mock is destroyed.
 *
 * The mock keeps no state machine of its own: getState() is scripted like
 * any other call.
 */
class MockRadio : public IStateCapability,
                  public IConfigureCapability,
                  public ITransmitCapability,
                  public IReceiveCapability,
                  public ISignalQualityCapability,
                  public ISleepCapability,
                  public IPowerCapability,
                  public IResetCapability {
   public:
    explicit MockRadio(Logger& logger = LOG);

    explicit MockRadio(std::vector<Expectation> expectations,
                       Logger& logger = LOG);

    ~MockRadio() override;

    /**
     * @brief Append expectations after those already queued
     */
    void Expect(std::vector<Expectation> expectations);

    /**
     * @brief Verify every expectation was consumed and clear the script
     *
     * Unconsumed expectations are reported as GoogleTest failures and
     * logged. The mock can be scripted again afterwards.
     *
     * @return true if the whole script was consumed
     */
    bool Done();

    /**
     * @brief Number of expectations not yet consumed
     */
    size_t Remaining() const;

    using ITransmitCapability::StartTransmit;

    RadioState getState() override;
    Result Configure(const ChannelConfig& config) override;
    Result StartTransmit(const uint8_t* data, size_t len) override;
    ValueResult<bool> CheckTransmit() override;
    Result StartReceive() override;
    ValueResult<std::optional<ReceivedPacket>> CheckReceive() override;
    ValueResult<int32_t> ReadRssi() override;
    Result Sleep() override;
    Result Wake() override;
    Result setPower(int8_t power) override;
    Result Reset() override;

    friend GmockRadio& GetMockForTesting(MockRadio& radio);

   private:
    class Impl;

    void InstallDefaults();
    void Schedule(const Expectation& expectation);
    Result Unexpected(const std::string& actual);
    void LogUnexpected(const std::string& actual);

    std::unique_ptr<Impl> pimpl_;
    Logger& logger_;
};

/**
 * @brief Access the GoogleMock object behind a MockRadio
 */
GmockRadio& GetMockForTesting(MockRadio& radio);

}  // namespace mocks
}  // namespace radiohal

// test/utils/fake_hal.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "hal/hal.hpp"

namespace radiohal {
namespace test {

/**
 * @brief HAL with a virtual clock advanced only by delays
 */
class FakeHal : public hal::IHal {
   public:
    explicit FakeHal(uint64_t start_us = 1700000000000000ULL)
        : now_us_(start_us) {}

    void DelayUs(uint32_t us) override {
        delays_.push_back(us);
        now_us_ += us;
    }

    uint64_t Micros() override { return now_us_; }

    void Advance(uint64_t us) { now_us_ += us; }

    const std::vector<uint32_t>& getDelays() const { return delays_; }

   private:
    uint64_t now_us_;
    std::vector<uint32_t> delays_;
};

}  // namespace test
}  // namespace radiohal

// src/hal/native/native_hal.hpp
#pragma once

#include <chrono>
#include <thread>

#include "../hal.hpp"

namespace radiohal {
namespace hal {

/**
 * @brief Hardware abstraction layer implementation for native platform.
 *
 * Micros() reports wall-clock time since the Unix epoch so that stamps
 * taken from it can be written to capture files directly.
 */
class NativeHal : public IHal {
   public:
    NativeHal() = default;

    /**
     * @brief Delay using std::this_thread::sleep_for.
     */
    void DelayUs(uint32_t us) override {
        std::this_thread::sleep_for(std::chrono::microseconds(us));
    }

    uint64_t Micros() override {
        auto now = std::chrono::system_clock::now();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                now.time_since_epoch())
                .count());
    }
};

/**
 * @brief Process-wide native HAL used when no HAL is injected.
 */
inline NativeHal& GetNativeHal() {
    static NativeHal instance;
    return instance;
}

}  // namespace hal
}  // namespace radiohal

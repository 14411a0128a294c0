// src/hal/hal.hpp
#pragma once

#include <cstdint>

namespace radiohal {
namespace hal {

/**
 * @brief Delay provider used between polls of a two-phase operation.
 */
class IDelay {
   public:
    virtual ~IDelay() = default;

    /**
     * @brief Delay execution for a number of microseconds.
     *
     * @param us Number of microseconds to delay.
     */
    virtual void DelayUs(uint32_t us) = 0;

    /**
     * @brief Delay execution for a number of milliseconds.
     *
     * @param ms Number of milliseconds to delay.
     */
    void DelayMs(uint32_t ms) { DelayUs(ms * 1000U); }
};

/**
 * @brief Time source used to stamp packets and captures.
 */
class IClock {
   public:
    virtual ~IClock() = default;

    /**
     * @brief Get the current time in microseconds.
     *
     * @return Microseconds since the clock's epoch.
     */
    virtual uint64_t Micros() = 0;
};

/**
 * @brief Combined timing hardware abstraction.
 */
class IHal : public IDelay, public IClock {};

}  // namespace hal
}  // namespace radiohal

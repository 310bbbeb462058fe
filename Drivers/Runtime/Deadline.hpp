#pragma once

#include <cstdint>
#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace Runtime {

    /**
     * @brief Timer wait on the 1 ms HAL tick.
     *
     * A task arms it, returns from poll(), and checks expired() on its next
     * poll. Comparison is on the elapsed time so the 32-bit tick wrap is
     * harmless.
     */
    class Deadline {
    public:
        Deadline() = default;

        void start(uint32_t duration_ms) {
            _start = HAL_GetTick();
            _duration = duration_ms;
            _armed = true;
        }
        void cancel() { _armed = false; }

        bool armed() const { return _armed; }

        // A deadline that was never started counts as expired.
        bool expired() const {
            return !_armed || elapsed() >= _duration;
        }

        uint32_t elapsed() const {
            return (uint32_t)(HAL_GetTick() - _start); // wrap-safe
        }

    private:
        uint32_t _start = 0;
        uint32_t _duration = 0;
        bool _armed = false;
    };

} // namespace Runtime
} // namespace Drivers

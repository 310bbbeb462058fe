#pragma once

#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace Runtime {

    // Masks interrupts for its scope and restores the previous mask on exit.
    class CriticalSection {
    public:
        CriticalSection() : _primask(__get_PRIMASK()) { __disable_irq(); }
        ~CriticalSection() { __set_PRIMASK(_primask); }

        CriticalSection(const CriticalSection&) = delete;
        CriticalSection& operator=(const CriticalSection&) = delete;

    private:
        uint32_t _primask;
    };

} // namespace Runtime
} // namespace Drivers

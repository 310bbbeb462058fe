#pragma once

#include <cstdint>
#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace Exti {

    static constexpr uint8_t kLineCount = 16;

    struct ExtiClaims {
        GPIO_TypeDef* port;
        uint16_t pin;                              // single GPIO_PIN_x mask
        GPIO_PinState active_state = GPIO_PIN_RESET;
    };

    /**
     * @brief Bridge from an EXTI interrupt to a polling task.
     *
     * The ISR latches the edge; the owning task consumes it with
     * triggered() at its next poll. One owner per line: EXTI multiplexes
     * every port onto the line with the same pin number, so PA3 and PE3
     * can't both be owned.
     */
    class ExtiLine {
    public:
        explicit ExtiLine(const ExtiClaims& claims);
        ~ExtiLine();

        ExtiLine(const ExtiLine&) = delete;
        ExtiLine& operator=(const ExtiLine&) = delete;

        // True if an edge was latched since the last call, or the line is
        // still held at its active level. Consumes the latched edge.
        bool triggered();

        bool pending() const { return _pending; }
        bool levelAsserted() const;
        void clear();

        uint32_t interruptCount() const { return _interrupt_count; }
        uint8_t line() const { return _line; }

        // --- ISR side ---
        void onInterrupt();

        // Called from HAL_GPIO_EXTI_Callback
        static void dispatch(uint16_t GPIO_Pin);

        // Line number of a GPIO_PIN_x mask, or -1 if the mask is not a single pin
        static int lineOf(uint16_t GPIO_Pin);

    private:
        ExtiClaims _hw;
        uint8_t _line;

        volatile bool _pending = false;
        volatile uint32_t _interrupt_count = 0;

        static ExtiLine* s_owners[kLineCount];
    };

} // namespace Exti
} // namespace Drivers

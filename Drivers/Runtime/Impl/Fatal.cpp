#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

#ifdef UNIT_TEST_ENV
#include <stdexcept>
#else
#include "main.h"
#endif

namespace Drivers {
namespace Runtime {

void fatal(const char* message) {
    NUSENSE_LOG_ERROR("FATAL: %s", message);
#ifdef UNIT_TEST_ENV
    throw std::runtime_error(message);
#else
    __disable_irq();
    Error_Handler();
    while (true) {}
#endif
}

} // namespace Runtime
} // namespace Drivers

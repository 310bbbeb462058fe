
#ifndef STM32_HAL_MOCK_H
#define STM32_HAL_MOCK_H

#ifndef UNIT_TEST_ENV
#include "stm32h7xx_hal.h"
#else

/*
 * Host build: the drivers see the same HAL calls and types,
 *  served by the simulators below.
 */

/* General Purpose Definitions */
#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"
/* System tick (HAL_GetTick, HAL_Delay) */
#include "Drivers/STM32HAL/Simulations/stm32sim_tick.hpp"
/* General Purpose Input / Output + EXTI */
#include "Drivers/STM32HAL/Simulations/stm32sim_gpio.hpp"
/* Serial Peripheral Interface + DMA */
#include "Drivers/STM32HAL/Simulations/stm32sim_spi.hpp"
/* CRC calculation unit */
#include "Drivers/STM32HAL/Simulations/stm32sim_crc.hpp"

namespace SIMULATOR_NAMESPACE {
    /** Put every simulator back to its power-on state */
    void SIM_ResetAll ();
};

#endif

#endif

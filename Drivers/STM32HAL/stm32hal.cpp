/*
 * stm32hal.cpp
 *
 *  Host side glue of the HAL simulation.
 */

#include "Drivers/STM32HAL/stm32hal.h"

#ifdef UNIT_TEST_ENV
#include "Drivers/STM32HAL/stm32usbd.h"

void SIMULATOR_NAMESPACE::SIM_ResetAll () {
    spi ::SIM_Reset();
    gpio::SIM_Reset();
    crc ::SIM_Reset();
    usbd::SIM_Reset();
    tick::SIM_SetTime(0);
}

#endif

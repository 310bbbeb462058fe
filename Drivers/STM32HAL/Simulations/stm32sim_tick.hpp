
#ifndef STM32_SIM_TICK_H
#define STM32_SIM_TICK_H

#include <cstdint>

#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"

/** HAL Functions that are in the simulation */

uint32_t HAL_GetTick(void);
void HAL_Delay(uint32_t Delay);

/** Internal Interface to drive the simulated 1 ms tick */
namespace SIMULATOR_NAMESPACE::tick {
    void SIM_SetTime (uint32_t ms);
    void SIM_AdvanceTime (uint32_t ms);
};

#endif /* STM32_SIM_TICK_H */

#include "Drivers/STM32HAL/Simulations/stm32sim_tick.hpp"

USING_SIMULATOR_NAMESPACE;

namespace SIMULATOR_NAMESPACE::tick::extdata {
    uint32_t mockTime = 0;
};
using namespace SIMULATOR_NAMESPACE::tick::extdata;

void tick::SIM_SetTime (uint32_t ms) {
    mockTime = ms;
}
void tick::SIM_AdvanceTime (uint32_t ms) {
    mockTime += ms;
}

uint32_t HAL_GetTick(void) {
    return mockTime;
}

void HAL_Delay(uint32_t Delay) {
    mockTime += Delay;
}


#ifndef STM32_USBD_MOCK_H
#define STM32_USBD_MOCK_H

#ifndef UNIT_TEST_ENV
#include "usbd_core.h"
#include "usbd_cdc.h"
#else

/* USB Device core and CDC class */
#include "Drivers/STM32HAL/Simulations/stm32sim_usbd.hpp"

#endif

#endif


#ifndef STM32_SIM_DEF
#define STM32_SIM_DEF

#include <cstdint>

#define SIMULATOR_NAMESPACE simulator_nusense
#define USING_SIMULATOR_NAMESPACE using namespace simulator_nusense

typedef enum
{
    HAL_OK       = 0x00,
    HAL_ERROR    = 0x01,
    HAL_BUSY     = 0x02,
    HAL_TIMEOUT  = 0x03
} HAL_StatusTypeDef;

#define HAL_MAX_DELAY 0xFFFFFFFFU

/* Core intrinsics: the host has no interrupts to mask */
inline void __disable_irq(void) {}
inline void __enable_irq(void) {}
inline uint32_t __get_PRIMASK(void) { return 0U; }
inline void __set_PRIMASK(uint32_t priMask) { (void) priMask; }
inline void __DMB(void) {}

/* Cortex-M7 cache maintenance has no meaning on the host */
inline void SCB_InvalidateDCache_by_Addr(uint32_t *addr, int32_t dsize) {
    (void) addr;
    (void) dsize;
}

namespace SIMULATOR_NAMESPACE {
    enum SimStatus {
        SIM_OK,
        SIM_ERROR
    };
};

#endif /* STM32_SIM_DEF */

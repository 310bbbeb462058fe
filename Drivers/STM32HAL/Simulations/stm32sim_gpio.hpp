
#ifndef STM32_SIM_GPIO_H
#define STM32_SIM_GPIO_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"

typedef enum
{
    GPIO_PIN_RESET = 0U,
    GPIO_PIN_SET
} GPIO_PinState;

#define GPIO_PIN_0   ((uint16_t)0x0001)
#define GPIO_PIN_1   ((uint16_t)0x0002)
#define GPIO_PIN_2   ((uint16_t)0x0004)
#define GPIO_PIN_3   ((uint16_t)0x0008)
#define GPIO_PIN_4   ((uint16_t)0x0010)
#define GPIO_PIN_5   ((uint16_t)0x0020)
#define GPIO_PIN_6   ((uint16_t)0x0040)
#define GPIO_PIN_7   ((uint16_t)0x0080)
#define GPIO_PIN_8   ((uint16_t)0x0100)
#define GPIO_PIN_9   ((uint16_t)0x0200)
#define GPIO_PIN_10  ((uint16_t)0x0400)
#define GPIO_PIN_11  ((uint16_t)0x0800)
#define GPIO_PIN_12  ((uint16_t)0x1000)
#define GPIO_PIN_13  ((uint16_t)0x2000)
#define GPIO_PIN_14  ((uint16_t)0x4000)
#define GPIO_PIN_15  ((uint16_t)0x8000)

/**
 * A GPIO port of the board (GPIOA, GPIOB...). The index only has to be
 * unique among the ports of a test, the name shows up in error messages.
 */
typedef struct {
    uint16_t index;
    std::string name;
} GPIO_TypeDef;

GPIO_PinState HAL_GPIO_ReadPin(const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin);
void HAL_GPIO_WritePin(GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin, GPIO_PinState PinState);
void HAL_GPIO_TogglePin(GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin);

void HAL_GPIO_EXTI_Callback(uint16_t GPIO_Pin);

/**
 * Pins have to be registered before the HAL can touch them, the same way
 * CubeMX has to configure them on the board. Using a pin that was never
 * registered throws.
 */
namespace SIMULATOR_NAMESPACE::gpio {
    void SIM_RegisterGPIO (
        const GPIO_TypeDef *GPIOx,
        uint16_t GPIO_Pin,
        GPIO_PinState initial = GPIO_PIN_RESET);
    void SIM_UnregisterGPIO (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin);
    bool SIM_IsRegistered (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin);

    /** Number of HAL writes and toggles seen by the pin since it was registered */
    uint32_t SIM_WriteCount (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin);

    /**
     * Drive an input pin from the outside world.
     *
     * A transition to `edgeState` raises the EXTI line of the pin, which
     * calls HAL_GPIO_EXTI_Callback the same way HAL_GPIO_EXTI_IRQHandler
     * does on the target.
     */
    void SIM_DrivePin (
        GPIO_TypeDef *GPIOx,
        uint16_t GPIO_Pin,
        GPIO_PinState PinState,
        GPIO_PinState edgeState = GPIO_PIN_RESET);

    /** Forget every registered GPIO */
    void SIM_Reset ();
};

#endif /* STM32_SIM_GPIO_H */

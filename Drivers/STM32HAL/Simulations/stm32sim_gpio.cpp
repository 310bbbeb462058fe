#include "Drivers/STM32HAL/Simulations/stm32sim_gpio.hpp"

#include <map>
#include <stdexcept>
#include <utility>

USING_SIMULATOR_NAMESPACE;

namespace SIMULATOR_NAMESPACE::gpio::extdata {
    struct Pin {
        GPIO_PinState level;
        uint32_t writes;
    };

    typedef std::pair<uint16_t, uint16_t> PinKey;
    std::map<PinKey, Pin> pins;
};
using namespace SIMULATOR_NAMESPACE::gpio::extdata;

static PinKey keyOf (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    return { GPIOx->index, GPIO_Pin };
}

static std::string describe (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    return std::string("(port=") + GPIOx->name + ", pin=" + std::to_string(GPIO_Pin) + ")";
}

static Pin &lookup (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin, const char *action) {
    auto it = pins.find(keyOf(GPIOx, GPIO_Pin));
    if (it == pins.end()) {
        throw std::runtime_error(
            std::string("GPIO ") + action + " on a pin that was never registered "
          + describe(GPIOx, GPIO_Pin));
    }
    return (*it).second;
}

void gpio::SIM_RegisterGPIO (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin, GPIO_PinState initial) {
    auto inserted = pins.insert({ keyOf(GPIOx, GPIO_Pin), Pin{ initial, 0 } });
    if (!inserted.second) {
        throw std::runtime_error(
            std::string("GPIO registered twice ") + describe(GPIOx, GPIO_Pin));
    }
}
void gpio::SIM_UnregisterGPIO (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    pins.erase(keyOf(GPIOx, GPIO_Pin));
}
bool gpio::SIM_IsRegistered (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    return pins.count(keyOf(GPIOx, GPIO_Pin)) != 0;
}
uint32_t gpio::SIM_WriteCount (const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    return lookup(GPIOx, GPIO_Pin, "write count").writes;
}

GPIO_PinState HAL_GPIO_ReadPin(const GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    return lookup(GPIOx, GPIO_Pin, "read").level;
}
void HAL_GPIO_WritePin(GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin, GPIO_PinState PinState) {
    Pin &pin = lookup(GPIOx, GPIO_Pin, "write");
    pin.level = PinState;
    pin.writes ++;
}
void HAL_GPIO_TogglePin(GPIO_TypeDef *GPIOx, uint16_t GPIO_Pin) {
    Pin &pin = lookup(GPIOx, GPIO_Pin, "toggle");
    pin.level = (pin.level == GPIO_PIN_SET) ? GPIO_PIN_RESET : GPIO_PIN_SET;
    pin.writes ++;
}

void gpio::SIM_DrivePin (
        GPIO_TypeDef *GPIOx,
        uint16_t GPIO_Pin,
        GPIO_PinState PinState,
        GPIO_PinState edgeState) {
    // Driven from outside the MCU: not counted as a HAL write
    Pin &pin = lookup(GPIOx, GPIO_Pin, "drive");
    const bool edge = pin.level != PinState && PinState == edgeState;
    pin.level = PinState;

    if (edge) HAL_GPIO_EXTI_Callback(GPIO_Pin);
}

void gpio::SIM_Reset () {
    pins.clear();
}

__attribute__((weak)) void HAL_GPIO_EXTI_Callback(uint16_t GPIO_Pin) {
    (void) GPIO_Pin;
}

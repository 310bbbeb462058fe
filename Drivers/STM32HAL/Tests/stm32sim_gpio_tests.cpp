#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "Drivers/STM32HAL/Simulations/stm32sim_gpio.hpp"

USING_SIMULATOR_NAMESPACE::gpio;

std::vector<uint16_t> extiLines;
void HAL_GPIO_EXTI_Callback(uint16_t GPIO_Pin) {
    extiLines.push_back(GPIO_Pin);
}

static GPIO_TypeDef portA = { 0, "GPIOA" };
static GPIO_TypeDef portE = { 4, "GPIOE" };

static std::string errorOf (void (*action)()) {
    try {
        action();
    } catch (const std::runtime_error &error) {
        return error.what();
    }
    return "";
}

class SimulatorGPIOTests : public ::testing::Test {
protected:
    void SetUp() override {
        SIM_Reset();
        extiLines.clear();
    }
};

TEST_F(SimulatorGPIOTests, RegisteredPinStartsAtItsInitialLevel) {
    SIM_RegisterGPIO(&portE, GPIO_PIN_11, GPIO_PIN_SET);
    SIM_RegisterGPIO(&portE, GPIO_PIN_10);

    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_11), GPIO_PIN_SET);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_10), GPIO_PIN_RESET);
    EXPECT_TRUE(SIM_IsRegistered(&portE, GPIO_PIN_11));
    EXPECT_FALSE(SIM_IsRegistered(&portA, GPIO_PIN_11));
}

TEST_F(SimulatorGPIOTests, SamePinOnAnotherPortIsDistinct) {
    SIM_RegisterGPIO(&portA, GPIO_PIN_3, GPIO_PIN_SET);
    SIM_RegisterGPIO(&portE, GPIO_PIN_3);

    HAL_GPIO_WritePin(&portE, GPIO_PIN_3, GPIO_PIN_SET);
    HAL_GPIO_WritePin(&portA, GPIO_PIN_3, GPIO_PIN_RESET);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_3), GPIO_PIN_SET);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portA, GPIO_PIN_3), GPIO_PIN_RESET);
}

TEST_F(SimulatorGPIOTests, DoubleRegistrationThrows) {
    SIM_RegisterGPIO(&portE, GPIO_PIN_11);

    EXPECT_EQ(
        errorOf([] { SIM_RegisterGPIO(&portE, GPIO_PIN_11); }),
        "GPIO registered twice (port=GPIOE, pin=2048)");
}

TEST_F(SimulatorGPIOTests, UnregisterFreesThePin) {
    SIM_UnregisterGPIO(&portA, GPIO_PIN_0);

    SIM_RegisterGPIO(&portA, GPIO_PIN_0);
    SIM_UnregisterGPIO(&portA, GPIO_PIN_0);
    EXPECT_FALSE(SIM_IsRegistered(&portA, GPIO_PIN_0));
    EXPECT_NO_THROW(SIM_RegisterGPIO(&portA, GPIO_PIN_0));
}

TEST_F(SimulatorGPIOTests, UnregisteredPinThrowsOnEveryAccess) {
    EXPECT_EQ(
        errorOf([] { HAL_GPIO_ReadPin(&portA, GPIO_PIN_5); }),
        "GPIO read on a pin that was never registered (port=GPIOA, pin=32)");
    EXPECT_EQ(
        errorOf([] { HAL_GPIO_WritePin(&portA, GPIO_PIN_5, GPIO_PIN_SET); }),
        "GPIO write on a pin that was never registered (port=GPIOA, pin=32)");
    EXPECT_EQ(
        errorOf([] { HAL_GPIO_TogglePin(&portA, GPIO_PIN_5); }),
        "GPIO toggle on a pin that was never registered (port=GPIOA, pin=32)");
    EXPECT_THROW(SIM_DrivePin(&portA, GPIO_PIN_5, GPIO_PIN_RESET), std::runtime_error);
    EXPECT_TRUE(extiLines.empty());
}

TEST_F(SimulatorGPIOTests, ToggleAndWriteAreCounted) {
    SIM_RegisterGPIO(&portE, GPIO_PIN_11, GPIO_PIN_SET);

    HAL_GPIO_TogglePin(&portE, GPIO_PIN_11);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_11), GPIO_PIN_RESET);
    HAL_GPIO_WritePin(&portE, GPIO_PIN_11, GPIO_PIN_SET);
    HAL_GPIO_WritePin(&portE, GPIO_PIN_11, GPIO_PIN_SET);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_11), GPIO_PIN_SET);

    EXPECT_EQ(SIM_WriteCount(&portE, GPIO_PIN_11), 3u);
}

TEST_F(SimulatorGPIOTests, FallingEdgeRaisesExti) {
    SIM_RegisterGPIO(&portE, GPIO_PIN_10, GPIO_PIN_SET);

    SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_RESET);
    EXPECT_EQ(HAL_GPIO_ReadPin(&portE, GPIO_PIN_10), GPIO_PIN_RESET);
    ASSERT_EQ(extiLines.size(), 1u);
    EXPECT_EQ(extiLines[0], GPIO_PIN_10);

    // Holding the level is not an edge, neither is the way back up
    SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_RESET);
    SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_SET);
    EXPECT_EQ(extiLines.size(), 1u);

    // External drive is not a HAL write
    EXPECT_EQ(SIM_WriteCount(&portE, GPIO_PIN_10), 0u);
}

TEST_F(SimulatorGPIOTests, RisingEdgeTrigger) {
    SIM_RegisterGPIO(&portA, GPIO_PIN_9);

    SIM_DrivePin(&portA, GPIO_PIN_9, GPIO_PIN_SET, GPIO_PIN_SET);
    SIM_DrivePin(&portA, GPIO_PIN_9, GPIO_PIN_RESET, GPIO_PIN_SET);
    SIM_DrivePin(&portA, GPIO_PIN_9, GPIO_PIN_SET, GPIO_PIN_SET);

    EXPECT_EQ(extiLines, std::vector<uint16_t>({ GPIO_PIN_9, GPIO_PIN_9 }));
}

TEST_F(SimulatorGPIOTests, ResetForgetsEveryPin) {
    SIM_RegisterGPIO(&portA, GPIO_PIN_1);
    SIM_RegisterGPIO(&portE, GPIO_PIN_2);
    SIM_Reset();

    EXPECT_FALSE(SIM_IsRegistered(&portA, GPIO_PIN_1));
    EXPECT_FALSE(SIM_IsRegistered(&portE, GPIO_PIN_2));
}

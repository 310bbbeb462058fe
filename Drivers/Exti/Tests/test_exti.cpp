#include <gtest/gtest.h>

#include "Drivers/Exti/ExtiLine.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

using namespace Drivers::Exti;
USING_SIMULATOR_NAMESPACE;

static GPIO_TypeDef portE = { 5, "GPIOE" };
static GPIO_TypeDef portA = { 1, "GPIOA" };

class ExtiLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        SIM_ResetAll();
        Drivers::Runtime::resetClaims();

        gpio::SIM_RegisterGPIO(&portE, GPIO_PIN_10);
        HAL_GPIO_WritePin(&portE, GPIO_PIN_10, GPIO_PIN_SET);
    }
};

TEST_F(ExtiLineTest, LineOfPinMask) {
    EXPECT_EQ(ExtiLine::lineOf(GPIO_PIN_0), 0);
    EXPECT_EQ(ExtiLine::lineOf(GPIO_PIN_10), 10);
    EXPECT_EQ(ExtiLine::lineOf(GPIO_PIN_15), 15);
    EXPECT_EQ(ExtiLine::lineOf(0), -1);
    EXPECT_EQ(ExtiLine::lineOf(GPIO_PIN_1 | GPIO_PIN_2), -1);
}

TEST_F(ExtiLineTest, EdgeIsLatchedUntilConsumed) {
    ExtiLine line({ &portE, GPIO_PIN_10 });
    EXPECT_EQ(line.line(), 10);
    EXPECT_FALSE(line.triggered());

    gpio::SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_RESET);
    gpio::SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_SET);

    EXPECT_TRUE(line.pending());
    EXPECT_TRUE(line.triggered());
    EXPECT_FALSE(line.pending());
    EXPECT_FALSE(line.triggered());
    EXPECT_EQ(line.interruptCount(), 1u);
}

TEST_F(ExtiLineTest, HeldLevelCountsAsTriggered) {
    ExtiLine line({ &portE, GPIO_PIN_10 });

    gpio::SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_RESET);
    EXPECT_TRUE(line.triggered());
    // Edge consumed, but the line is still low
    EXPECT_TRUE(line.triggered());

    gpio::SIM_DrivePin(&portE, GPIO_PIN_10, GPIO_PIN_SET);
    EXPECT_FALSE(line.triggered());
}

TEST_F(ExtiLineTest, OtherLinesAreIgnored) {
    ExtiLine line({ &portE, GPIO_PIN_10 });

    HAL_GPIO_EXTI_Callback(GPIO_PIN_3);
    EXPECT_FALSE(line.pending());

    HAL_GPIO_EXTI_Callback(GPIO_PIN_10);
    EXPECT_TRUE(line.pending());
    line.clear();
    EXPECT_FALSE(line.pending());
}

TEST_F(ExtiLineTest, SingleOwnerPerLine) {
    ExtiLine line({ &portE, GPIO_PIN_10 });

    // Same pin number on another port shares the EXTI line
    EXPECT_THROW(ExtiLine({ &portA, GPIO_PIN_10 }), std::runtime_error);
    EXPECT_THROW(ExtiLine({ &portE, GPIO_PIN_10 }), std::runtime_error);
}

TEST_F(ExtiLineTest, RejectsMultiPinMask) {
    EXPECT_THROW(ExtiLine({ &portE, GPIO_PIN_10 | GPIO_PIN_11 }), std::runtime_error);
}

TEST_F(ExtiLineTest, ReleasedLineStopsDispatch) {
    {
        ExtiLine line({ &portE, GPIO_PIN_10 });
    }
    // No owner left: the callback must be harmless
    HAL_GPIO_EXTI_Callback(GPIO_PIN_10);
}

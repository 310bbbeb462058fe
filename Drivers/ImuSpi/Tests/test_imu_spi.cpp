#include <vector>
#include <gtest/gtest.h>

#include "Drivers/ImuSpi/ImuSpi.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

using namespace Drivers::ImuSpi;
USING_SIMULATOR_NAMESPACE;

static GPIO_TypeDef portE = { 5, "GPIOE" };
static SPI_HandleTypeDef spi4 = { 4, "SPI4" };

#define IMU_CS &portE, GPIO_PIN_11

namespace {
    // Byte-level record of what reached the device
    class Wire : public spi::SIM_SPIPeripheral {
    public:
        std::vector<std::vector<uint8_t>> transmitted;
        std::vector<uint16_t> receivedSizes;
        uint8_t fill = 0x5A;

        void onTransmit (const uint8_t *data, uint16_t size) override {
            transmitted.push_back(std::vector<uint8_t>(data, data + size));
        }
        void onReceive (uint8_t *data, uint16_t size) override {
            receivedSizes.push_back(size);
            for (uint16_t i = 0; i < size; i ++) data[i] = (uint8_t)(fill + i);
        }
    };
}

class ImuSpiTest : public ::testing::Test {
protected:
    void SetUp() override {
        SIM_ResetAll();
        Drivers::Runtime::resetClaims();

        gpio::SIM_RegisterGPIO(IMU_CS, GPIO_PIN_SET);
        spi::SIM_Attach(&spi4, IMU_CS, &wire);
    }

    Wire wire;

    bool csHigh() { return HAL_GPIO_ReadPin(IMU_CS) == GPIO_PIN_SET; }

    alignas(32) uint8_t buffer[64];
};

TEST_F(ImuSpiTest, ReadRegisterSendsReadBitAndDummy) {
    ImuSpi transport({ &spi4, IMU_CS });

    uint8_t value = 0;
    EXPECT_EQ(transport.readRegister(0x75, value), SpiStatus::OK);

    ASSERT_EQ(wire.transmitted.size(), 1u);
    EXPECT_EQ(wire.transmitted[0], std::vector<uint8_t>({ 0xF5, 0x00 }));
    // Second byte clocked in carries the register
    EXPECT_EQ(value, 0x5B);
    EXPECT_TRUE(csHigh());
}

TEST_F(ImuSpiTest, WriteRegisterClearsReadBit) {
    ImuSpi transport({ &spi4, IMU_CS });

    EXPECT_EQ(transport.writeRegister(0xEB, 0x80), SpiStatus::OK);

    ASSERT_EQ(wire.transmitted.size(), 1u);
    EXPECT_EQ(wire.transmitted[0], std::vector<uint8_t>({ 0x6B, 0x80 }));
    EXPECT_TRUE(wire.receivedSizes.empty());
    EXPECT_TRUE(csHigh());
}

TEST_F(ImuSpiTest, BurstReadIsAddressThenData) {
    ImuSpi transport({ &spi4, IMU_CS });

    EXPECT_EQ(transport.readRegisterBurst(0x72, buffer, 2), SpiStatus::OK);

    ASSERT_EQ(wire.transmitted.size(), 1u);
    EXPECT_EQ(wire.transmitted[0], std::vector<uint8_t>({ 0xF2 }));
    ASSERT_EQ(wire.receivedSizes.size(), 1u);
    EXPECT_EQ(wire.receivedSizes[0], 2);
    EXPECT_EQ(buffer[0], 0x5A);
    EXPECT_EQ(buffer[1], 0x5B);
    EXPECT_TRUE(csHigh());
}

TEST_F(ImuSpiTest, ChipSelectReleasedOnError) {
    ImuSpi transport({ &spi4, IMU_CS });
    uint8_t value = 0;

    spi::SIM_InjectError(&spi4, 1);
    EXPECT_EQ(transport.readRegister(0x75, value), SpiStatus::ERROR_TRANSFER);
    EXPECT_TRUE(csHigh());

    spi::SIM_InjectError(&spi4, 1);
    EXPECT_EQ(transport.writeRegister(0x6B, 0x01), SpiStatus::ERROR_TRANSFER);
    EXPECT_TRUE(csHigh());

    // Fails on the address byte
    spi::SIM_InjectError(&spi4, 1);
    EXPECT_EQ(transport.readRegisterBurst(0x72, buffer, 2), SpiStatus::ERROR_TRANSFER);
    EXPECT_TRUE(csHigh());

    EXPECT_EQ(transport.errorCount(), 3u);
    EXPECT_TRUE(wire.transmitted.empty());

    // Transport stays usable
    EXPECT_EQ(transport.readRegister(0x75, value), SpiStatus::OK);
}

TEST_F(ImuSpiTest, DmaBurstHoldsChipSelectUntilComplete) {
    ImuSpi transport({ &spi4, IMU_CS });

    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 28), SpiStatus::OK);
    EXPECT_EQ(transport.dmaState(), DmaState::IN_FLIGHT);
    EXPECT_FALSE(csHigh());
    EXPECT_EQ(wire.transmitted[0], std::vector<uint8_t>({ 0xF4 }));
    EXPECT_EQ(wire.receivedSizes[0], 28);

    EXPECT_TRUE(spi::SIM_CompleteDMA(&spi4));
    EXPECT_EQ(transport.dmaState(), DmaState::DONE);
    EXPECT_TRUE(csHigh());

    transport.acknowledgeDma();
    EXPECT_EQ(transport.dmaState(), DmaState::IDLE);
}

TEST_F(ImuSpiTest, DmaErrorReleasesChipSelect) {
    ImuSpi transport({ &spi4, IMU_CS });

    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 14), SpiStatus::OK);
    EXPECT_TRUE(spi::SIM_FailDMA(&spi4));

    EXPECT_EQ(transport.dmaState(), DmaState::FAILED);
    EXPECT_TRUE(csHigh());
    EXPECT_EQ(transport.errorCount(), 1u);

    transport.acknowledgeDma();
    EXPECT_EQ(transport.dmaState(), DmaState::IDLE);
}

TEST_F(ImuSpiTest, BusyWhileDmaInFlight) {
    ImuSpi transport({ &spi4, IMU_CS });
    uint8_t value = 0;

    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 14), SpiStatus::OK);
    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 14), SpiStatus::ERROR_BUSY);
    EXPECT_EQ(transport.readRegister(0x75, value), SpiStatus::ERROR_BUSY);
    EXPECT_EQ(transport.writeRegister(0x6B, 0x00), SpiStatus::ERROR_BUSY);
    EXPECT_EQ(wire.transmitted.size(), 1u);

    spi::SIM_CompleteDMA(&spi4);
    // Result not yet acknowledged
    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 14), SpiStatus::ERROR_BUSY);
}

TEST_F(ImuSpiTest, DmaStartFailureLeavesTransportIdle) {
    ImuSpi transport({ &spi4, IMU_CS });

    spi::SIM_InjectError(&spi4, 1);
    EXPECT_EQ(transport.startReadRegisterBurstDma(0x74, buffer, 14), SpiStatus::ERROR_TRANSFER);
    EXPECT_EQ(transport.dmaState(), DmaState::IDLE);
    EXPECT_TRUE(csHigh());
    EXPECT_FALSE(spi::SIM_IsDMAPending(&spi4));
}

TEST_F(ImuSpiTest, DestructionReleasesChipSelect) {
    {
        ImuSpi transport({ &spi4, IMU_CS });
        transport.startReadRegisterBurstDma(0x74, buffer, 14);
        EXPECT_FALSE(csHigh());
    }
    EXPECT_TRUE(csHigh());

    // Late completion with no owner is ignored
    EXPECT_TRUE(spi::SIM_CompleteDMA(&spi4));
}

TEST_F(ImuSpiTest, BusClaimedOnce) {
    ImuSpi transport({ &spi4, IMU_CS });
    EXPECT_THROW(ImuSpi({ &spi4, IMU_CS }), std::runtime_error);
}

#include <memory>
#include <gtest/gtest.h>

#include "Drivers/Icm20689/Icm20689.hpp"
#include "Drivers/Icm20689/Simulations/icm20689_sim.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/Tests/LogCapture.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

using namespace Drivers::Icm20689;
using Drivers::Runtime::LogCapture;
USING_SIMULATOR_NAMESPACE;

static GPIO_TypeDef portE = { 5, "GPIOE" };
static SPI_HandleTypeDef spi4 = { 4, "SPI4" };

#define IMU_CS  &portE, GPIO_PIN_11
#define IMU_INT &portE, GPIO_PIN_10

class Icm20689DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        SIM_ResetAll();
        Drivers::Runtime::resetClaims();
        tick::SIM_SetTime(1000);

        chip = std::make_unique<icm20689::Icm20689Device>(&spi4, IMU_CS, IMU_INT);
        imu  = std::make_unique<Icm20689_STM32>(
            Drivers::ImuSpi::SpiClaims{ &spi4, IMU_CS },
            Drivers::Exti::ExtiClaims{ IMU_INT });
    }
    void TearDown() override {
        imu.reset();
        chip.reset();
    }

    void initialize() {
        imu->tick();
        tick::SIM_AdvanceTime(100);
        imu->tick();
        tick::SIM_AdvanceTime(10);
        imu->tick();
        tick::SIM_AdvanceTime(1);
        imu->tick();
    }

    // One interrupt-driven FIFO cycle, DMA completed by the "hardware"
    void serviceCycle() {
        imu->tick();
        spi::SIM_CompleteDMA(&spi4);
        imu->tick();
    }

    std::unique_ptr<icm20689::Icm20689Device> chip;
    std::unique_ptr<Icm20689_STM32> imu;
};

TEST_F(Icm20689DriverTest, InitSequence) {
    LogCapture logs;
    EXPECT_EQ(imu->state(), DriverState::UNINITIALIZED);

    imu->tick();
    EXPECT_EQ(imu->state(), DriverState::INITIALIZING);
    EXPECT_EQ(chip->resets(), 1u);

    // Reset wait is 100 ms
    tick::SIM_AdvanceTime(99);
    imu->tick();
    EXPECT_EQ(chip->writes().size(), 1u);

    tick::SIM_AdvanceTime(1);
    imu->tick();
    EXPECT_EQ(chip->writes().size(), 3u);

    tick::SIM_AdvanceTime(9);
    imu->tick();
    EXPECT_EQ(chip->writes().size(), 3u);
    tick::SIM_AdvanceTime(1);
    imu->tick();
    EXPECT_EQ(chip->writes().size(), 10u);

    tick::SIM_AdvanceTime(1);
    imu->tick();
    EXPECT_EQ(imu->state(), DriverState::STREAMING);
    EXPECT_EQ(imu->lastError(), ImuStatus::OK);

    const std::vector<std::pair<uint8_t, uint8_t>> expected = {
        { 0x6B, 0x80 },
        { 0x6A, 0x10 }, { 0x6B, 0x01 },
        { 0x6C, 0x00 }, { 0x1A, 0x01 }, { 0x19, 0x00 }, { 0x1C, 0x08 },
        { 0x1D, 0x01 }, { 0x1B, 0x08 }, { 0x6A, 0x14 },
        { 0x23, 0xF8 }, { 0x6A, 0x50 }, { 0x37, 0x98 }, { 0x38, 0x01 },
    };
    EXPECT_EQ(chip->writes(), expected);
    EXPECT_TRUE(chip->fifoEnabled());
    EXPECT_TRUE(logs.contains("IMU: ICM-20689 initialized"));
}

TEST_F(Icm20689DriverTest, ConfiguredRangesReachTheChip) {
    imu.reset();
    Drivers::Runtime::resetClaims();
    imu = std::make_unique<Icm20689_STM32>(
        Drivers::ImuSpi::SpiClaims{ &spi4, IMU_CS },
        Drivers::Exti::ExtiClaims{ IMU_INT },
        ImuConfig{ AccelRange::_16G, GyroRange::_2000DPS });

    initialize();
    EXPECT_EQ(chip->reg(0x1C), 0x18);
    EXPECT_EQ(chip->reg(0x1B), 0x18);
}

TEST_F(Icm20689DriverTest, WrongChipFaults) {
    LogCapture logs;
    chip->setWhoAmI(0x20);

    initialize();
    EXPECT_EQ(imu->state(), DriverState::FAULTED);
    EXPECT_EQ(imu->lastError(), ImuStatus::ERROR_DEVICE_NOT_FOUND);
    EXPECT_TRUE(logs.contains("wrong chip ID: expected 0x98, got 0x20"));

    // Faulted drivers stay quiet on the bus
    const size_t writes = chip->writes().size();
    tick::SIM_AdvanceTime(50);
    imu->tick();
    EXPECT_EQ(chip->writes().size(), writes);
}

TEST_F(Icm20689DriverTest, SpiFailureDuringInitFaults) {
    spi::SIM_InjectError(&spi4, 1);

    imu->tick();
    EXPECT_EQ(imu->state(), DriverState::FAULTED);
    EXPECT_EQ(imu->lastError(), ImuStatus::ERROR_SPI);
}

TEST_F(Icm20689DriverTest, RestartAfterFault) {
    chip->setWhoAmI(0x00);
    initialize();
    ASSERT_EQ(imu->state(), DriverState::FAULTED);

    chip->setWhoAmI(0x98);
    imu->restart();
    EXPECT_EQ(imu->state(), DriverState::UNINITIALIZED);
    EXPECT_EQ(imu->lastError(), ImuStatus::OK);
    EXPECT_EQ(imu->stats().restarts, 1u);

    initialize();
    EXPECT_EQ(imu->state(), DriverState::STREAMING);
}

TEST_F(Icm20689DriverTest, ReadsOneSampleThroughDma) {
    initialize();

    ImuData data;
    EXPECT_FALSE(imu->getLatest(data));

    chip->produceSample({ 8192, 0, -8192, 0, 655, 0, 0 });
    EXPECT_TRUE(chip->interruptAsserted());

    imu->tick();
    EXPECT_TRUE(spi::SIM_IsDMAPending(&spi4));
    EXPECT_FALSE(chip->interruptAsserted());
    EXPECT_EQ(chip->fifoLevel(), 0u);

    // Nothing happens until the transfer completes
    imu->tick();
    EXPECT_FALSE(imu->getLatest(data));

    ASSERT_TRUE(spi::SIM_CompleteDMA(&spi4));
    imu->tick();

    ASSERT_TRUE(imu->getLatest(data));
    EXPECT_NEAR(data.accel[0],  9.80665f, 1e-4);
    EXPECT_NEAR(data.accel[2], -9.80665f, 1e-4);
    EXPECT_NEAR(data.gyro[0], 0.174533f, 1e-4);
    EXPECT_FLOAT_EQ(data.temperature, 21.0f);
    EXPECT_EQ(imu->stats().packets, 1u);
    EXPECT_EQ(chip->fifoBurstReads(), 1u);
}

TEST_F(Icm20689DriverTest, StreamsAtOneKilohertz) {
    LogCapture logs;
    initialize();
    logs.clear();

    for (int i = 0; i < 1000; i++) {
        tick::SIM_AdvanceTime(1);
        chip->produceSample({ 0, 0, 8192, 333, 0, 0, 0 });
        serviceCycle();
    }

    EXPECT_EQ(imu->stats().packets, 1000u);
    EXPECT_EQ(imu->stats().last_rate, 1000u);
    EXPECT_EQ(imu->stats().spi_errors, 0u);
    EXPECT_EQ(logs.count("IMU Stats: 1000 samples/sec"), 1u);
    EXPECT_TRUE(logs.contains("Accel (m/s2): [0.000, 0.000, 9.807]"));
    EXPECT_TRUE(logs.contains("Temp: 22.00 C"));
}

TEST_F(Icm20689DriverTest, BatchIsCappedAtTwentyPackets) {
    initialize();

    for (int i = 0; i < 25; i++) chip->produceSample({ 1, 2, 3, 0, 4, 5, 6 });
    serviceCycle();
    EXPECT_EQ(imu->stats().packets, 20u);
    EXPECT_EQ(chip->fifoLevel(), 5u * kPacketSize);

    chip->produceSample({ 1, 2, 3, 0, 4, 5, 6 });
    serviceCycle();
    EXPECT_EQ(imu->stats().packets, 26u);
    EXPECT_EQ(chip->fifoLevel(), 0u);
}

TEST_F(Icm20689DriverTest, PartialPacketBytesAreCounted) {
    initialize();

    std::vector<uint8_t> bytes(kPacketSize + 6, 0x00);
    chip->pushRawFifo(bytes);
    chip->raiseDataReady();
    serviceCycle();

    EXPECT_EQ(imu->stats().packets, 1u);
    EXPECT_EQ(imu->stats().discarded_bytes, 6u);
}

TEST_F(Icm20689DriverTest, EmptyFifoIsNotAnError) {
    initialize();

    chip->raiseDataReady();
    imu->tick();
    EXPECT_FALSE(spi::SIM_IsDMAPending(&spi4));
    EXPECT_EQ(imu->stats().empty_cycles, 1u);
    EXPECT_EQ(imu->state(), DriverState::STREAMING);
}

TEST_F(Icm20689DriverTest, SpiErrorWhileStreamingSkipsOneCycle) {
    LogCapture logs;
    initialize();

    chip->produceSample({ 0, 0, 0, 0, 0, 0, 0 });
    spi::SIM_InjectError(&spi4, 1);
    imu->tick();
    EXPECT_EQ(imu->state(), DriverState::STREAMING);
    EXPECT_EQ(imu->stats().spi_errors, 1u);
    EXPECT_TRUE(logs.contains("FIFO count read failed"));

    // The interrupt line is still held low, so the next poll retries
    serviceCycle();
    EXPECT_EQ(imu->stats().packets, 1u);
}

TEST_F(Icm20689DriverTest, DmaFailureSkipsOneCycle) {
    initialize();

    chip->produceSample({ 0, 0, 0, 0, 0, 0, 0 });
    imu->tick();
    ASSERT_TRUE(spi::SIM_FailDMA(&spi4));
    imu->tick();

    EXPECT_EQ(imu->state(), DriverState::STREAMING);
    EXPECT_EQ(imu->stats().spi_errors, 1u);
    EXPECT_EQ(imu->stats().packets, 0u);

    chip->produceSample({ 0, 0, 0, 0, 0, 0, 0 });
    serviceCycle();
    EXPECT_EQ(imu->stats().packets, 1u);
}

TEST_F(Icm20689DriverTest, RestartWithTransferInFlightIsFatal) {
    initialize();
    chip->produceSample({ 0, 0, 0, 0, 0, 0, 0 });
    imu->tick();
    ASSERT_TRUE(spi::SIM_IsDMAPending(&spi4));

    EXPECT_THROW(imu->restart(), std::runtime_error);
}

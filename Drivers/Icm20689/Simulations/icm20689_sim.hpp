
#ifndef ICM20689_SIM_H
#define ICM20689_SIM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

#include "Drivers/STM32HAL/stm32hal.h"

/**
 * Register-level model of an ICM-20689 on the simulated SPI bus.
 *
 * Registers the chip-select and interrupt GPIOs (both idle high) and the
 * SPI device. Reads auto-increment except on FIFO_R_W, which pops the FIFO.
 * Writes to PWR_MGMT_1 bit 7 and USER_CTRL bit 2 behave as on the chip.
 * The interrupt line is latched low on data ready and released by any read.
 */
namespace SIMULATOR_NAMESPACE::icm20689 {

    static constexpr size_t kFifoCapacity = 4096;

    class Icm20689Device : public spi::SIM_SPIPeripheral {
    public:
        Icm20689Device(
            SPI_HandleTypeDef* hspi,
            GPIO_TypeDef* csPort, uint16_t csPin,
            GPIO_TypeDef* intPort, uint16_t intPin);
        ~Icm20689Device() override;

        Icm20689Device(const Icm20689Device&) = delete;
        Icm20689Device& operator=(const Icm20689Device&) = delete;

        void setWhoAmI (uint8_t value) { _whoAmI = value; _regs[0x75] = value; }

        uint8_t reg (uint8_t addr) const { return _regs[addr & 0x7F]; }
        const std::vector<std::pair<uint8_t, uint8_t>>& writes () const { return _writes; }
        void clearWrites () { _writes.clear(); }
        uint32_t resets () const { return _resets; }
        uint32_t fifoBurstReads () const { return _fifoBurstReads; }

        bool fifoEnabled () const;
        size_t fifoLevel () const { return _fifo.size(); }

        /**
         * Push one sample {ax, ay, az, temp, gx, gy, gz} into the FIFO as 14
         * big-endian bytes (if the FIFO is enabled) and raise data ready.
         */
        void produceSample (const std::array<int16_t, 7>& words);
        /** Push raw bytes, bypassing the FIFO_EN checks, without an interrupt */
        void pushRawFifo (const std::vector<uint8_t>& bytes);
        /** Pull the interrupt line low if data ready is enabled */
        void raiseDataReady ();

        bool interruptAsserted () const;

        void onTransmit (const uint8_t* data, uint16_t size) override;
        void onReceive (uint8_t* data, uint16_t size) override;
        void onTransfer (const uint8_t* tx, uint8_t* rx, uint16_t size) override;

    private:
        static uint8_t nextAddress (uint8_t start, uint16_t offset);

        void powerOnReset ();
        void writeRegister (uint8_t addr, uint8_t value);
        uint8_t readRegister (uint8_t addr);
        void releaseInterrupt ();

        GPIO_TypeDef* _csPort;
        uint16_t _csPin;
        GPIO_TypeDef* _intPort;
        uint16_t _intPin;

        uint8_t _regs[128];
        uint8_t _whoAmI = 0x98;
        std::deque<uint8_t> _fifo;

        // Address latched by a one-byte read command, for the data phase
        int _readAddr = -1;

        std::vector<std::pair<uint8_t, uint8_t>> _writes;
        uint32_t _resets = 0;
        uint32_t _fifoBurstReads = 0;
    };
};

#endif /* ICM20689_SIM_H */

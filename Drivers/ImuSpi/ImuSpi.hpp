#pragma once

#include <cstdint>
#include <optional>

#include "Drivers/STM32HAL/stm32hal.h"

namespace Drivers {
namespace ImuSpi {

    enum class SpiStatus {
        OK = 0,
        ERROR_TRANSFER,
        ERROR_BUSY,
    };

    enum class DmaState : uint8_t {
        IDLE = 0,
        IN_FLIGHT,
        DONE,
        FAILED,
    };

    // Bus and chip-select handed over at startup. The pins themselves are
    // configured by CubeMX; the transport only drives CS.
    struct SpiClaims {
        SPI_HandleTypeDef* hspi;
        GPIO_TypeDef* cs_port;
        uint16_t cs_pin;
    };

    static constexpr uint8_t kReadBit   = 0x80;
    static constexpr uint8_t kWriteMask = 0x7F;

    /**
     * @brief Holds chip-select low for its lifetime.
     */
    class ChipSelectGuard {
    public:
        ChipSelectGuard(GPIO_TypeDef* port, uint16_t pin) : _port(port), _pin(pin) {
            HAL_GPIO_WritePin(_port, _pin, GPIO_PIN_RESET);
        }
        ~ChipSelectGuard() { release(); }

        ChipSelectGuard(const ChipSelectGuard&) = delete;
        ChipSelectGuard& operator=(const ChipSelectGuard&) = delete;

        void release() {
            if (!_active) return;
            HAL_GPIO_WritePin(_port, _pin, GPIO_PIN_SET);
            _active = false;
        }

    private:
        GPIO_TypeDef* _port;
        uint16_t _pin;
        bool _active = true;
    };

    /**
     * @brief Register access for a single SPI device with a software CS.
     *
     * Address MSB selects read (1) or write (0). Blocking calls never time
     * out (HAL_MAX_DELAY). The DMA burst keeps CS low until the HAL reports
     * completion or error; the owning task polls dmaState().
     */
    class ImuSpi {
    public:
        explicit ImuSpi(const SpiClaims& claims);
        ~ImuSpi();

        ImuSpi(const ImuSpi&) = delete;
        ImuSpi& operator=(const ImuSpi&) = delete;

        SpiStatus readRegister(uint8_t reg, uint8_t& value);
        SpiStatus writeRegister(uint8_t reg, uint8_t value);
        SpiStatus readRegisterBurst(uint8_t reg, uint8_t* buffer, uint16_t len);

        // Buffer must stay valid, 32-byte aligned and padded to a multiple of
        // 32 bytes until the transfer leaves IN_FLIGHT (D-cache maintenance).
        SpiStatus startReadRegisterBurstDma(uint8_t reg, uint8_t* buffer, uint16_t len);

        DmaState dmaState() const { return _dma_state; }
        // DONE / FAILED back to IDLE once the task has looked at the result
        void acknowledgeDma();

        uint32_t errorCount() const { return _error_count; }

        // --- ISR side (HAL_SPI_RxCpltCallback / HAL_SPI_ErrorCallback) ---
        void onDmaComplete();
        void onDmaError();

        static void dispatchRxComplete(SPI_HandleTypeDef* hspi);
        static void dispatchError(SPI_HandleTypeDef* hspi);

    private:
        SpiStatus fail();

        SpiClaims _hw;

        std::optional<ChipSelectGuard> _dma_cs;
        uint8_t* _dma_buffer = nullptr;
        uint16_t _dma_len = 0;
        volatile DmaState _dma_state = DmaState::IDLE;

        volatile uint32_t _error_count = 0;

        static constexpr uint8_t kMaxBuses = 6;
        static ImuSpi* s_owners[kMaxBuses];
    };

} // namespace ImuSpi
} // namespace Drivers

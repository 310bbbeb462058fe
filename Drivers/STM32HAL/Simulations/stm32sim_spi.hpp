
#ifndef STM32_SIM_SPI_H
#define STM32_SIM_SPI_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "Drivers/STM32HAL/Simulations/stm32sim_def.hpp"
#include "Drivers/STM32HAL/Simulations/stm32sim_gpio.hpp"

/** Handle for SPI bus, the index has to be unique among the buses of a test */
typedef struct {
    uint8_t index;
    std::string name;
} SPI_HandleTypeDef;

HAL_StatusTypeDef HAL_SPI_Transmit(
    SPI_HandleTypeDef *hspi, const uint8_t *pData, uint16_t Size, uint32_t Timeout);
HAL_StatusTypeDef HAL_SPI_Receive(
    SPI_HandleTypeDef *hspi, uint8_t *pData, uint16_t Size, uint32_t Timeout);
HAL_StatusTypeDef HAL_SPI_TransmitReceive(
    SPI_HandleTypeDef *hspi, const uint8_t *pTxData, uint8_t *pRxData, uint16_t Size, uint32_t Timeout);

HAL_StatusTypeDef HAL_SPI_Receive_DMA(
    SPI_HandleTypeDef *hspi, uint8_t *pData, uint16_t Size);
HAL_StatusTypeDef HAL_SPI_TransmitReceive_DMA(
    SPI_HandleTypeDef *hspi, const uint8_t *pTxData, uint8_t *pRxData, uint16_t Size);

void HAL_SPI_RxCpltCallback(SPI_HandleTypeDef *hspi);
void HAL_SPI_TxRxCpltCallback(SPI_HandleTypeDef *hspi);
void HAL_SPI_ErrorCallback(SPI_HandleTypeDef *hspi);

namespace SIMULATOR_NAMESPACE::spi {
    /**
     * A chip wired to a simulated bus. It sees every transfer made while
     * its chip-select sits at the active level.
     */
    class SIM_SPIPeripheral {
    public:
        virtual ~SIM_SPIPeripheral() = default;

        /** Bytes clocked out by the MCU */
        virtual void onTransmit (const uint8_t *data, uint16_t size) = 0;
        /** Bytes clocked in by the MCU, filled by the peripheral */
        virtual void onReceive (uint8_t *data, uint16_t size) = 0;
        /** Full duplex, by default a write followed by a read of the same length */
        virtual void onTransfer (const uint8_t *tx, uint8_t *rx, uint16_t size) {
            onTransmit(tx, size);
            onReceive(rx, size);
        }
    };

    /**
     * Wire a peripheral to the bus behind the given chip-select. The GPIO
     * itself is registered by whoever owns it. Throws if the chip-select is
     * already taken on that bus.
     */
    void SIM_Attach (
        SPI_HandleTypeDef *hspi,
        GPIO_TypeDef *csPort,
        uint16_t csPin,
        SIM_SPIPeripheral *peripheral,
        GPIO_PinState activeState = GPIO_PIN_RESET);
    void SIM_Detach (SIM_SPIPeripheral *peripheral);

    /**
     * The peripheral a transfer would reach right now. Throws when no
     * chip-select is active, or when more than one is.
     */
    SIM_SPIPeripheral *SIM_Selected (SPI_HandleTypeDef *hspi);

    /** Transfers that reached a peripheral since the last reset */
    size_t SIM_TransferCount (SPI_HandleTypeDef *hspi);

    /**
     * Make the next `count` transfers on the bus fail with HAL_ERROR
     * before any byte reaches a peripheral.
     */
    void SIM_InjectError (SPI_HandleTypeDef *hspi, uint16_t count);

    /**
     * DMA transfers move their bytes when they are started, but their
     * completion interrupt only fires when the test asks for it. Until then
     * the bus answers HAL_BUSY.
     *
     * @return false if no DMA transfer was in flight on the bus
     */
    bool SIM_CompleteDMA (SPI_HandleTypeDef *hspi);
    /** Abort the DMA transfer in flight and raise HAL_SPI_ErrorCallback */
    bool SIM_FailDMA (SPI_HandleTypeDef *hspi);
    bool SIM_IsDMAPending (SPI_HandleTypeDef *hspi);

    /** Forget every bus, attached peripheral, pending DMA and injected error */
    void SIM_Reset ();
};

#endif /* STM32_SIM_SPI_H */

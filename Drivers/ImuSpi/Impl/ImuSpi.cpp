#include "Drivers/ImuSpi/ImuSpi.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/Fatal.hpp"

namespace Drivers {
namespace ImuSpi {

ImuSpi* ImuSpi::s_owners[kMaxBuses] = {};

ImuSpi::ImuSpi(const SpiClaims& claims) : _hw(claims) {
    Runtime::claimResource(claims.hspi, 0, "SPI bus");
    Runtime::claimResource(claims.cs_port, claims.cs_pin, "SPI chip select");

    HAL_GPIO_WritePin(_hw.cs_port, _hw.cs_pin, GPIO_PIN_SET);

    for (ImuSpi*& owner : s_owners) {
        if (owner == nullptr) {
            owner = this;
            return;
        }
    }
    Runtime::fatal("SPI: too many transports");
}

ImuSpi::~ImuSpi() {
    for (ImuSpi*& owner : s_owners) {
        if (owner == this) owner = nullptr;
    }
}

SpiStatus ImuSpi::fail() {
    _error_count++;
    return SpiStatus::ERROR_TRANSFER;
}

SpiStatus ImuSpi::readRegister(uint8_t reg, uint8_t& value) {
    if (_dma_state == DmaState::IN_FLIGHT) return SpiStatus::ERROR_BUSY;

    uint8_t tx[2] = { (uint8_t)(reg | kReadBit), 0x00 };
    uint8_t rx[2] = { 0, 0 };

    ChipSelectGuard cs(_hw.cs_port, _hw.cs_pin);
    if (HAL_SPI_TransmitReceive(_hw.hspi, tx, rx, 2, HAL_MAX_DELAY) != HAL_OK) return fail();

    value = rx[1];
    return SpiStatus::OK;
}

SpiStatus ImuSpi::writeRegister(uint8_t reg, uint8_t value) {
    if (_dma_state == DmaState::IN_FLIGHT) return SpiStatus::ERROR_BUSY;

    uint8_t tx[2] = { (uint8_t)(reg & kWriteMask), value };

    ChipSelectGuard cs(_hw.cs_port, _hw.cs_pin);
    if (HAL_SPI_Transmit(_hw.hspi, tx, 2, HAL_MAX_DELAY) != HAL_OK) return fail();
    return SpiStatus::OK;
}

SpiStatus ImuSpi::readRegisterBurst(uint8_t reg, uint8_t* buffer, uint16_t len) {
    if (_dma_state == DmaState::IN_FLIGHT) return SpiStatus::ERROR_BUSY;

    uint8_t cmd = reg | kReadBit;

    ChipSelectGuard cs(_hw.cs_port, _hw.cs_pin);
    if (HAL_SPI_Transmit(_hw.hspi, &cmd, 1, HAL_MAX_DELAY) != HAL_OK) return fail();
    if (len == 0) return SpiStatus::OK;
    if (HAL_SPI_Receive(_hw.hspi, buffer, len, HAL_MAX_DELAY) != HAL_OK) return fail();
    return SpiStatus::OK;
}

SpiStatus ImuSpi::startReadRegisterBurstDma(uint8_t reg, uint8_t* buffer, uint16_t len) {
    if (_dma_state != DmaState::IDLE) return SpiStatus::ERROR_BUSY;
    if (len == 0) Runtime::fatal("SPI: empty DMA transfer");

    uint8_t cmd = reg | kReadBit;

    _dma_cs.emplace(_hw.cs_port, _hw.cs_pin);
    if (HAL_SPI_Transmit(_hw.hspi, &cmd, 1, HAL_MAX_DELAY) != HAL_OK) {
        _dma_cs.reset();
        return fail();
    }

    _dma_buffer = buffer;
    _dma_len = len;
    _dma_state = DmaState::IN_FLIGHT;

    if (HAL_SPI_Receive_DMA(_hw.hspi, buffer, len) != HAL_OK) {
        _dma_state = DmaState::IDLE;
        _dma_cs.reset();
        return fail();
    }
    return SpiStatus::OK;
}

void ImuSpi::acknowledgeDma() {
    if (_dma_state == DmaState::DONE || _dma_state == DmaState::FAILED) {
        _dma_state = DmaState::IDLE;
    }
}

void ImuSpi::onDmaComplete() {
    if (_dma_state != DmaState::IN_FLIGHT) return;
    _dma_cs.reset();

    // DMA wrote behind the D-cache
    const int32_t invalidate = (int32_t)(((uint32_t)_dma_len + 31u) & ~31u);
    SCB_InvalidateDCache_by_Addr((uint32_t*)_dma_buffer, invalidate);

    _dma_state = DmaState::DONE;
}

void ImuSpi::onDmaError() {
    if (_dma_state != DmaState::IN_FLIGHT) return;
    _dma_cs.reset();
    _error_count++;
    _dma_state = DmaState::FAILED;
}

void ImuSpi::dispatchRxComplete(SPI_HandleTypeDef* hspi) {
    for (ImuSpi* owner : s_owners) {
        if (owner != nullptr && owner->_hw.hspi == hspi) owner->onDmaComplete();
    }
}

void ImuSpi::dispatchError(SPI_HandleTypeDef* hspi) {
    for (ImuSpi* owner : s_owners) {
        if (owner != nullptr && owner->_hw.hspi == hspi) owner->onDmaError();
    }
}

} // namespace ImuSpi
} // namespace Drivers

void HAL_SPI_RxCpltCallback(SPI_HandleTypeDef* hspi) {
    Drivers::ImuSpi::ImuSpi::dispatchRxComplete(hspi);
}

void HAL_SPI_ErrorCallback(SPI_HandleTypeDef* hspi) {
    Drivers::ImuSpi::ImuSpi::dispatchError(hspi);
}

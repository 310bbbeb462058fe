#include "Drivers/STM32HAL/Simulations/stm32sim_spi.hpp"

#include <map>
#include <stdexcept>
#include <vector>

USING_SIMULATOR_NAMESPACE;
using spi::SIM_SPIPeripheral;

namespace SIMULATOR_NAMESPACE::spi::extdata {
    struct ChipSelect {
        GPIO_TypeDef *port;
        uint16_t pin;
        GPIO_PinState active;
        SIM_SPIPeripheral *peripheral;
    };

    enum class DmaKind { NONE, RECEIVE, TRANSFER };

    struct Bus {
        SPI_HandleTypeDef *handle = nullptr;
        std::vector<ChipSelect> chipSelects;

        uint16_t failuresLeft = 0;
        size_t transfers = 0;
        DmaKind dma = DmaKind::NONE;
    };

    std::map<uint8_t, Bus> buses;
};
using namespace SIMULATOR_NAMESPACE::spi::extdata;

static Bus &busOf (SPI_HandleTypeDef *hspi) {
    Bus &bus = buses[hspi->index];
    bus.handle = hspi;
    return bus;
}

static std::string label (const SPI_HandleTypeDef *hspi) {
    return std::string("SPI bus ") + hspi->name;
}

static SIM_SPIPeripheral &selectedOn (SPI_HandleTypeDef *hspi, const Bus &bus) {
    SIM_SPIPeripheral *selected = nullptr;

    for (const ChipSelect &cs : bus.chipSelects) {
        if (HAL_GPIO_ReadPin(cs.port, cs.pin) != cs.active) continue;
        if (selected != nullptr) {
            throw std::runtime_error(label(hspi) + ": more than one chip-select active");
        }
        selected = cs.peripheral;
    }

    if (selected == nullptr) {
        throw std::runtime_error(label(hspi) + ": transfer with no chip-select active");
    }
    return *selected;
}

/* Common path of every transfer: bus state checks, then the bytes move */
template <typename Clock>
static HAL_StatusTypeDef transfer (SPI_HandleTypeDef *hspi, DmaKind dma, Clock clock) {
    Bus &bus = busOf(hspi);
    if (bus.dma != DmaKind::NONE) return HAL_BUSY;
    if (bus.failuresLeft > 0) {
        bus.failuresLeft --;
        return HAL_ERROR;
    }

    clock(selectedOn(hspi, bus));
    bus.transfers ++;
    bus.dma = dma;
    return HAL_OK;
}

HAL_StatusTypeDef HAL_SPI_Transmit(
    SPI_HandleTypeDef *hspi, const uint8_t *pData, uint16_t Size, uint32_t Timeout) {
    (void) Timeout;
    return transfer(hspi, DmaKind::NONE, [&](SIM_SPIPeripheral &p) { p.onTransmit(pData, Size); });
}
HAL_StatusTypeDef HAL_SPI_Receive(
    SPI_HandleTypeDef *hspi, uint8_t *pData, uint16_t Size, uint32_t Timeout) {
    (void) Timeout;
    return transfer(hspi, DmaKind::NONE, [&](SIM_SPIPeripheral &p) { p.onReceive(pData, Size); });
}
HAL_StatusTypeDef HAL_SPI_TransmitReceive(
    SPI_HandleTypeDef *hspi, const uint8_t *pTxData, uint8_t *pRxData, uint16_t Size, uint32_t Timeout) {
    (void) Timeout;
    return transfer(hspi, DmaKind::NONE, [&](SIM_SPIPeripheral &p) { p.onTransfer(pTxData, pRxData, Size); });
}

HAL_StatusTypeDef HAL_SPI_Receive_DMA(
    SPI_HandleTypeDef *hspi, uint8_t *pData, uint16_t Size) {
    return transfer(hspi, DmaKind::RECEIVE, [&](SIM_SPIPeripheral &p) { p.onReceive(pData, Size); });
}
HAL_StatusTypeDef HAL_SPI_TransmitReceive_DMA(
    SPI_HandleTypeDef *hspi, const uint8_t *pTxData, uint8_t *pRxData, uint16_t Size) {
    return transfer(hspi, DmaKind::TRANSFER, [&](SIM_SPIPeripheral &p) { p.onTransfer(pTxData, pRxData, Size); });
}

__attribute__((weak)) void HAL_SPI_RxCpltCallback(SPI_HandleTypeDef *hspi) {
    (void) hspi;
}
__attribute__((weak)) void HAL_SPI_TxRxCpltCallback(SPI_HandleTypeDef *hspi) {
    (void) hspi;
}
__attribute__((weak)) void HAL_SPI_ErrorCallback(SPI_HandleTypeDef *hspi) {
    (void) hspi;
}

void spi::SIM_Attach (
        SPI_HandleTypeDef *hspi,
        GPIO_TypeDef *csPort,
        uint16_t csPin,
        SIM_SPIPeripheral *peripheral,
        GPIO_PinState activeState) {
    Bus &bus = busOf(hspi);

    for (const ChipSelect &cs : bus.chipSelects) {
        if (cs.port->index == csPort->index && cs.pin == csPin) {
            throw std::runtime_error(
                label(hspi) + ": chip-select (port=" + csPort->name
              + ", pin=" + std::to_string(csPin) + ") already wired");
        }
    }

    bus.chipSelects.push_back({ csPort, csPin, activeState, peripheral });
}
void spi::SIM_Detach (SIM_SPIPeripheral *peripheral) {
    for (auto &entry : buses) {
        std::vector<ChipSelect> &list = entry.second.chipSelects;
        for (auto it = list.begin(); it != list.end(); ) {
            if (it->peripheral == peripheral) it = list.erase(it);
            else                              ++ it;
        }
    }
}

SIM_SPIPeripheral *spi::SIM_Selected (SPI_HandleTypeDef *hspi) {
    return &selectedOn(hspi, busOf(hspi));
}
size_t spi::SIM_TransferCount (SPI_HandleTypeDef *hspi) {
    return busOf(hspi).transfers;
}

void spi::SIM_InjectError (SPI_HandleTypeDef *hspi, uint16_t count) {
    busOf(hspi).failuresLeft = count;
}

bool spi::SIM_CompleteDMA (SPI_HandleTypeDef *hspi) {
    Bus &bus = busOf(hspi);
    const DmaKind kind = bus.dma;
    if (kind == DmaKind::NONE) return false;

    bus.dma = DmaKind::NONE;
    if (kind == DmaKind::RECEIVE) HAL_SPI_RxCpltCallback(hspi);
    else                          HAL_SPI_TxRxCpltCallback(hspi);
    return true;
}
bool spi::SIM_FailDMA (SPI_HandleTypeDef *hspi) {
    Bus &bus = busOf(hspi);
    if (bus.dma == DmaKind::NONE) return false;

    bus.dma = DmaKind::NONE;
    HAL_SPI_ErrorCallback(hspi);
    return true;
}
bool spi::SIM_IsDMAPending (SPI_HandleTypeDef *hspi) {
    return busOf(hspi).dma != DmaKind::NONE;
}

void spi::SIM_Reset () {
    buses.clear();
}

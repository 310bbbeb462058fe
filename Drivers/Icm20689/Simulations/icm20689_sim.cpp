#include "Drivers/Icm20689/Simulations/icm20689_sim.hpp"

#include <cstring>

USING_SIMULATOR_NAMESPACE;
using namespace SIMULATOR_NAMESPACE::icm20689;

static constexpr uint8_t REG_USER_CTRL   = 0x6A;
static constexpr uint8_t REG_PWR_MGMT_1  = 0x6B;
static constexpr uint8_t REG_FIFO_EN     = 0x23;
static constexpr uint8_t REG_INT_PIN_CFG = 0x37;
static constexpr uint8_t REG_INT_ENABLE  = 0x38;
static constexpr uint8_t REG_FIFO_COUNTH = 0x72;
static constexpr uint8_t REG_FIFO_COUNTL = 0x73;
static constexpr uint8_t REG_FIFO_R_W    = 0x74;
static constexpr uint8_t REG_WHO_AM_I    = 0x75;

Icm20689Device::Icm20689Device(
        SPI_HandleTypeDef* hspi,
        GPIO_TypeDef* csPort, uint16_t csPin,
        GPIO_TypeDef* intPort, uint16_t intPin)
    : _csPort(csPort), _csPin(csPin), _intPort(intPort), _intPin(intPin) {
    gpio::SIM_RegisterGPIO(csPort, csPin, GPIO_PIN_SET);
    gpio::SIM_RegisterGPIO(intPort, intPin, GPIO_PIN_SET);
    spi::SIM_Attach(hspi, csPort, csPin, this);

    powerOnReset();
}

Icm20689Device::~Icm20689Device() {
    spi::SIM_Detach(this);
    gpio::SIM_UnregisterGPIO(_csPort, _csPin);
    gpio::SIM_UnregisterGPIO(_intPort, _intPin);
}

void Icm20689Device::powerOnReset() {
    std::memset(_regs, 0, sizeof(_regs));
    _regs[REG_PWR_MGMT_1] = 0x40; // sleep
    _regs[REG_WHO_AM_I]   = _whoAmI;
    _fifo.clear();
    _readAddr = -1;
}

bool Icm20689Device::fifoEnabled() const {
    return (_regs[REG_USER_CTRL] & 0x40) != 0 && _regs[REG_FIFO_EN] == 0xF8;
}

bool Icm20689Device::interruptAsserted() const {
    return HAL_GPIO_ReadPin(_intPort, _intPin) == GPIO_PIN_RESET;
}

void Icm20689Device::writeRegister(uint8_t addr, uint8_t value) {
    _writes.push_back({ addr, value });

    switch (addr) {
        case REG_PWR_MGMT_1:
            if (value & 0x80) {
                _resets++;
                powerOnReset();
                return;
            }
            break;
        case REG_USER_CTRL:
            if (value & 0x04) {
                _fifo.clear();
                value &= (uint8_t) ~0x04;
            }
            break;
        case REG_FIFO_R_W:
            return;
        case REG_WHO_AM_I:
        case REG_FIFO_COUNTH:
        case REG_FIFO_COUNTL:
            return; // read-only
        default:
            break;
    }
    _regs[addr] = value;
}

uint8_t Icm20689Device::readRegister(uint8_t addr) {
    switch (addr) {
        case REG_FIFO_COUNTH: return (uint8_t) (_fifo.size() >> 8);
        case REG_FIFO_COUNTL: return (uint8_t) (_fifo.size() & 0xFF);
        case REG_FIFO_R_W: {
            if (_fifo.empty()) return 0xFF;
            uint8_t byte = _fifo.front();
            _fifo.pop_front();
            return byte;
        }
        default:
            return _regs[addr & 0x7F];
    }
}

void Icm20689Device::releaseInterrupt() {
    // INT_ANYRD_2CLEAR: any read clears the latched interrupt
    if ((_regs[REG_INT_PIN_CFG] & 0x10) && interruptAsserted()) {
        gpio::SIM_DrivePin(_intPort, _intPin, GPIO_PIN_SET);
    }
}

// Register pointer after `offset` bytes; FIFO_R_W does not advance
uint8_t Icm20689Device::nextAddress(uint8_t start, uint16_t offset) {
    if (start == REG_FIFO_R_W) return start;
    return (uint8_t) ((start + offset) & 0x7F);
}

void Icm20689Device::onTransmit(const uint8_t* data, uint16_t size) {
    if (size == 0) return;

    const uint8_t addr = data[0] & 0x7F;
    if (data[0] & 0x80) {
        // Read command: data phase follows in a receive
        _readAddr = addr;
        return;
    }

    _readAddr = -1;
    for (uint16_t i = 1; i < size; i ++) {
        writeRegister(nextAddress(addr, i - 1), data[i]);
    }
}

void Icm20689Device::onReceive(uint8_t* data, uint16_t size) {
    if (_readAddr < 0) {
        std::memset(data, 0xFF, size);
        return;
    }

    const uint8_t addr = (uint8_t) _readAddr;
    if (addr == REG_FIFO_R_W) _fifoBurstReads ++;

    for (uint16_t i = 0; i < size; i ++) {
        data[i] = readRegister(nextAddress(addr, i));
    }
    _readAddr = -1;
    releaseInterrupt();
}

void Icm20689Device::onTransfer(const uint8_t* tx, uint8_t* rx, uint16_t size) {
    if (size == 0) return;

    const uint8_t addr = tx[0] & 0x7F;
    const bool read = (tx[0] & 0x80) != 0;
    std::memset(rx, 0x00, size);

    for (uint16_t i = 1; i < size; i ++) {
        if (read) rx[i] = readRegister(nextAddress(addr, i - 1));
        else      writeRegister(nextAddress(addr, i - 1), tx[i]);
    }
    if (read) releaseInterrupt();
    _readAddr = -1;
}

void Icm20689Device::produceSample(const std::array<int16_t, 7>& words) {
    if (fifoEnabled()) {
        for (int16_t word : words) {
            if (_fifo.size() + 2 > kFifoCapacity) break;
            _fifo.push_back((uint8_t) (((uint16_t) word) >> 8));
            _fifo.push_back((uint8_t) (((uint16_t) word) & 0xFF));
        }
    }
    raiseDataReady();
}

void Icm20689Device::pushRawFifo(const std::vector<uint8_t>& bytes) {
    for (uint8_t byte : bytes) _fifo.push_back(byte);
}

void Icm20689Device::raiseDataReady() {
    if ((_regs[REG_INT_ENABLE] & 0x01) == 0) return;
    gpio::SIM_DrivePin(_intPort, _intPin, GPIO_PIN_RESET);
}

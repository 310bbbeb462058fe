#include <cstring>

#include "Drivers/Usb/AcmConnection.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Usb {

AcmConnection* AcmConnection::s_instance = nullptr;

USBD_CDC_ItfTypeDef AcmConnection::s_fops = {
    &AcmConnection::cdcInit,
    &AcmConnection::cdcDeInit,
    &AcmConnection::cdcControl,
    &AcmConnection::cdcReceive,
    &AcmConnection::cdcTransmitComplete,
};

const char* statusName(AcmStatus status) {
    switch (status) {
        case AcmStatus::OK:                 return "OK";
        case AcmStatus::PENDING:            return "pending";
        case AcmStatus::BUSY:               return "busy";
        case AcmStatus::ERROR_DISCONNECTED: return "disconnected";
    }
    return "?";
}

AcmConnection::AcmConnection(UsbSystem::Builder& builder) : _device(builder.device()) {
    if (s_instance != nullptr) Runtime::fatal("ACM: only one connection per device");

    builder.registerCdc(&s_fops);
    s_instance = this;
    NUSENSE_LOG_INFO("CDC ACM connection initialized");
}

AcmConnection::~AcmConnection() {
    if (s_instance == this) s_instance = nullptr;
}

bool AcmConnection::connected() const {
    return _device->dev_state == USBD_STATE_CONFIGURED && _dtr;
}

bool AcmConnection::waitConnection() {
    if (!connected()) {
        _announced = false;
        return false;
    }
    if (!_announced) {
        NUSENSE_LOG_INFO("CDC ACM connection established");
        _announced = true;
    }
    return true;
}

AcmStatus AcmConnection::sendPacket(const uint8_t* data, size_t len) {
    if (len > kMaxPacketSize) Runtime::fatal("ACM: packet larger than the endpoint");
    if (!connected()) return AcmStatus::ERROR_DISCONNECTED;
    if (_tx_busy) return AcmStatus::BUSY;

    if (len > 0) std::memcpy(_tx_packet, data, len);
    if (USBD_CDC_SetTxBuffer(_device, _tx_packet, (uint32_t)len) != USBD_OK) {
        return AcmStatus::ERROR_DISCONNECTED;
    }

    _tx_busy = true;
    const uint8_t result = USBD_CDC_TransmitPacket(_device);
    if (result == USBD_OK) return AcmStatus::OK;

    _tx_busy = false;
    return (result == USBD_BUSY) ? AcmStatus::BUSY : AcmStatus::ERROR_DISCONNECTED;
}

AcmStatus AcmConnection::receivePacket(uint8_t* buffer, size_t capacity, size_t& received) {
    if (capacity < kMaxPacketSize) Runtime::fatal("ACM: receive buffer smaller than a packet");
    received = 0;
    if (!connected()) return AcmStatus::ERROR_DISCONNECTED;
    if (!_rx_ready) return AcmStatus::PENDING;

    const uint32_t len = _rx_len;
    std::memcpy(buffer, _rx_packet, len);
    received = len;

    _rx_ready = false;
    if (!armReceive()) return AcmStatus::ERROR_DISCONNECTED;
    return AcmStatus::OK;
}

uint32_t AcmConnection::baudRate() const {
    return (uint32_t)_line_coding[0]
         | ((uint32_t)_line_coding[1] << 8)
         | ((uint32_t)_line_coding[2] << 16)
         | ((uint32_t)_line_coding[3] << 24);
}

bool AcmConnection::armReceive() {
    if (USBD_CDC_SetRxBuffer(_device, _rx_packet) != USBD_OK) return false;
    return USBD_CDC_ReceivePacket(_device) == USBD_OK;
}

// ======================================================================
// Middleware callbacks, interrupt context
// ======================================================================

int8_t AcmConnection::cdcInit() {
    AcmConnection* self = s_instance;
    if (self == nullptr) return (int8_t)USBD_FAIL;

    self->_rx_ready = false;
    self->_tx_busy = false;

    // The class arms the OUT endpoint with this buffer once Init returns
    if (USBD_CDC_SetTxBuffer(self->_device, self->_tx_packet, 0) != USBD_OK) return (int8_t)USBD_FAIL;
    if (USBD_CDC_SetRxBuffer(self->_device, self->_rx_packet) != USBD_OK) return (int8_t)USBD_FAIL;
    return (int8_t)USBD_OK;
}

int8_t AcmConnection::cdcDeInit() {
    AcmConnection* self = s_instance;
    if (self == nullptr) return (int8_t)USBD_OK;

    self->_dtr = false;
    self->_announced = false;
    self->_rx_ready = false;
    self->_tx_busy = false;
    return (int8_t)USBD_OK;
}

int8_t AcmConnection::cdcControl(uint8_t cmd, uint8_t* pbuf, uint16_t length) {
    AcmConnection* self = s_instance;
    if (self == nullptr) return (int8_t)USBD_FAIL;
    (void)length;

    switch (cmd) {
        case CDC_SET_LINE_CODING:
            std::memcpy(self->_line_coding, pbuf, sizeof(self->_line_coding));
            break;
        case CDC_GET_LINE_CODING:
            std::memcpy(pbuf, self->_line_coding, sizeof(self->_line_coding));
            break;
        case CDC_SET_CONTROL_LINE_STATE: {
            const USBD_SetupReqTypedef* req = reinterpret_cast<const USBD_SetupReqTypedef*>(pbuf);
            self->_dtr = (req->wValue & 0x0001u) != 0;
            if (!self->_dtr) self->_announced = false;
            break;
        }
        default:
            break;
    }
    return (int8_t)USBD_OK;
}

int8_t AcmConnection::cdcReceive(uint8_t* buf, uint32_t* len) {
    AcmConnection* self = s_instance;
    if (self == nullptr) return (int8_t)USBD_FAIL;
    (void)buf;

    self->_rx_len = (*len > kMaxPacketSize) ? (uint32_t)kMaxPacketSize : *len;
    self->_rx_ready = true;
    return (int8_t)USBD_OK;
}

int8_t AcmConnection::cdcTransmitComplete(uint8_t* buf, uint32_t* len, uint8_t epnum) {
    (void)buf;
    (void)len;
    (void)epnum;
    if (s_instance != nullptr) s_instance->_tx_busy = false;
    return (int8_t)USBD_OK;
}

} // namespace Usb
} // namespace Drivers

#include "Drivers/Usb/UsbSystem.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/Runtime/Fatal.hpp"
#include "Drivers/Runtime/Log.hpp"

namespace Drivers {
namespace Usb {

const char* statusName(UsbStatus status) {
    switch (status) {
        case UsbStatus::OK:               return "OK";
        case UsbStatus::ERROR_MIDDLEWARE: return "middleware error";
    }
    return "?";
}

void UsbSystem::Builder::registerCdc(USBD_CDC_ItfTypeDef* fops) {
    if (fops == nullptr) Runtime::fatal("USB: null CDC interface");
    if (_cdc != nullptr) Runtime::fatal("USB: a CDC interface is already registered");
    _cdc = fops;
}

UsbSystem::UsbSystem(const UsbClaims& claims)
    : _device(claims.device), _builder(claims.device) {
    if (_device == nullptr) Runtime::fatal("USB: no device handle in claim");
    Runtime::claimResource(_device, 0, "USB device");

    NUSENSE_LOG_INFO("USB: initializing USB system...");
    if (USBD_Init(_device, claims.descriptors, claims.core_id) != USBD_OK) {
        Runtime::fatal("USB: USBD_Init failed");
    }
}

UsbSystem::Builder& UsbSystem::builder() {
    if (_started) Runtime::fatal("USB: builder used after the device was started");
    return _builder;
}

UsbStatus UsbSystem::start() {
    if (_started) Runtime::fatal("USB: device started twice");
    if (!_builder.hasClass()) Runtime::fatal("USB: no class registered before start");
    _started = true;

    NUSENSE_LOG_INFO("USB: building USB device...");
    if (USBD_RegisterClass(_device, &USBD_CDC) != USBD_OK) {
        NUSENSE_LOG_ERROR("USB: USBD_RegisterClass failed");
        return UsbStatus::ERROR_MIDDLEWARE;
    }
    if (USBD_CDC_RegisterInterface(_device, _builder._cdc) != USBD_OK) {
        NUSENSE_LOG_ERROR("USB: USBD_CDC_RegisterInterface failed");
        return UsbStatus::ERROR_MIDDLEWARE;
    }
    if (USBD_Start(_device) != USBD_OK) {
        NUSENSE_LOG_ERROR("USB: USBD_Start failed");
        return UsbStatus::ERROR_MIDDLEWARE;
    }

    NUSENSE_LOG_INFO("USB: device started");
    return UsbStatus::OK;
}

bool UsbSystem::configured() const {
    return _started && _device->dev_state == USBD_STATE_CONFIGURED;
}

void UsbTask::poll() {
    if (!_usb.started()) {
        const UsbStatus status = _usb.start();
        if (status != UsbStatus::OK) {
            NUSENSE_LOG_ERROR("USB: start failed (%s)", statusName(status));
            Runtime::fatal("USB device did not start");
        }
        _last_state = _usb.device()->dev_state;
        return;
    }

    const uint8_t state = _usb.device()->dev_state;
    if (state == _last_state) return;

    switch (state) {
        case USBD_STATE_CONFIGURED:
            NUSENSE_LOG_INFO("USB: configured by host");
            break;
        case USBD_STATE_SUSPENDED:
            NUSENSE_LOG_INFO("USB: suspended");
            break;
        default:
            if (_last_state == USBD_STATE_CONFIGURED) NUSENSE_LOG_WARN("USB: host gone");
            break;
    }
    _last_state = state;
}

} // namespace Usb
} // namespace Drivers

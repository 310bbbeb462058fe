#pragma once

#include <cstddef>
#include <cstdint>

#include "Drivers/Runtime/Task.hpp"
#include "Drivers/STM32HAL/stm32usbd.h"

namespace Drivers {
namespace Usb {

    // High-speed bulk endpoint (ULPI PHY)
    static constexpr size_t kMaxPacketSize = 512;

    enum class UsbStatus {
        OK = 0,
        ERROR_MIDDLEWARE,   // a USBD_* call refused the request
    };

    const char* statusName(UsbStatus status);

    struct UsbClaims {
        USBD_HandleTypeDef* device;          // hUsbDeviceHS from the CubeMX project
        USBD_DescriptorsTypeDef* descriptors;
        uint8_t core_id;                     // DEVICE_HS
    };

    /**
     * @brief The USB device, in two phases.
     *
     * Configuration phase: builder() is where the device class registers
     * its interface. start() consumes the builder and hands the device to
     * the middleware, which from then on runs from the OTG interrupt.
     * Touching the builder after start(), or starting twice, is fatal.
     */
    class UsbSystem {
    public:
        class Builder {
        public:
            // Exactly one CDC interface per device
            void registerCdc(USBD_CDC_ItfTypeDef* fops);

            bool hasClass() const { return _cdc != nullptr; }
            USBD_HandleTypeDef* device() const { return _device; }

        private:
            friend class UsbSystem;
            explicit Builder(USBD_HandleTypeDef* device) : _device(device) {}

            USBD_HandleTypeDef* _device;
            USBD_CDC_ItfTypeDef* _cdc = nullptr;
        };

        explicit UsbSystem(const UsbClaims& claims);

        UsbSystem(const UsbSystem&) = delete;
        UsbSystem& operator=(const UsbSystem&) = delete;

        Builder& builder();
        UsbStatus start();

        bool started() const { return _started; }
        bool configured() const;

        USBD_HandleTypeDef* device() const { return _device; }

    private:
        USBD_HandleTypeDef* _device;
        Builder _builder;
        bool _started = false;
    };

    /**
     * @brief Scheduler task owning the device.
     *
     * Starts the device on its first poll, then reports bus state changes.
     */
    class UsbTask : public Runtime::Task {
    public:
        explicit UsbTask(UsbSystem& usb) : _usb(usb) {}

        const char* name() const override { return "usb"; }
        void poll() override;

    private:
        UsbSystem& _usb;
        uint8_t _last_state = 0;
    };

} // namespace Usb
} // namespace Drivers

#pragma once

#include <cstddef>
#include <cstdint>

#include "Drivers/Usb/UsbSystem.hpp"

namespace Drivers {
namespace Usb {

    enum class AcmStatus {
        OK = 0,
        PENDING,              // nothing yet, poll again
        BUSY,                 // previous IN packet still on the bus
        ERROR_DISCONNECTED,
    };

    const char* statusName(AcmStatus status);

    /**
     * @brief CDC ACM virtual serial port, packet oriented.
     *
     * Every call returns immediately; a task retries on its next poll while
     * the result is PENDING or BUSY. Packets are whole USB packets of up to
     * kMaxPacketSize bytes. A lost host shows up as ERROR_DISCONNECTED,
     * never as an empty packet.
     *
     * The middleware calls back without a context pointer, so there is a
     * single connection per firmware.
     */
    class AcmConnection {
    public:
        explicit AcmConnection(UsbSystem::Builder& builder);
        ~AcmConnection();

        AcmConnection(const AcmConnection&) = delete;
        AcmConnection& operator=(const AcmConnection&) = delete;

        // Configured by the host and the port opened (DTR set)
        bool connected() const;

        // True once the host has opened the port; logs the transition
        bool waitConnection();

        AcmStatus sendPacket(const uint8_t* data, size_t len);
        bool sendComplete() const { return !_tx_busy; }

        // `capacity` below kMaxPacketSize is a configuration error
        AcmStatus receivePacket(uint8_t* buffer, size_t capacity, size_t& received);

        uint32_t baudRate() const;

    private:
        static int8_t cdcInit();
        static int8_t cdcDeInit();
        static int8_t cdcControl(uint8_t cmd, uint8_t* pbuf, uint16_t length);
        static int8_t cdcReceive(uint8_t* buf, uint32_t* len);
        static int8_t cdcTransmitComplete(uint8_t* buf, uint32_t* len, uint8_t epnum);

        static AcmConnection* s_instance;
        static USBD_CDC_ItfTypeDef s_fops;

        bool armReceive();

        USBD_HandleTypeDef* _device = nullptr;

        volatile bool _dtr = false;
        volatile bool _rx_ready = false;
        volatile uint32_t _rx_len = 0;
        volatile bool _tx_busy = false;
        volatile bool _announced = false;

        // 115200 8N1 until the host says otherwise
        uint8_t _line_coding[7] = { 0x00, 0xC2, 0x01, 0x00, 0x00, 0x00, 0x08 };

        alignas(32) uint8_t _rx_packet[kMaxPacketSize];
        alignas(32) uint8_t _tx_packet[kMaxPacketSize];
    };

} // namespace Usb
} // namespace Drivers
